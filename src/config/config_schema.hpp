#pragma once

#include <string>

namespace agentbench::config {

struct AgentBackendConfig {
    // opencode | claude
    std::string type = "opencode";
    // Existing opencode server; a per-task server is launched when empty.
    std::string opencode_url;
    std::string opencode_command = "opencode";
    std::string hostname = "127.0.0.1";
    int port = 0;
    int startup_timeout_s = 10;
    int request_timeout_s = 30;

    std::string claude_command = "claude";
    int claude_max_iterations = 1;
    int claude_timeout_s = 1800;
};

struct VerifierConfig {
    int kill_grace_s = 2;
};

struct BenchConfig {
    std::string tasks_dir = "tasks";
    std::string results_dir = "results";
    std::string workspace_dir = "/tmp/agent-bench";
    std::string default_model = "anthropic/claude-sonnet-4-5";
    AgentBackendConfig agent;
    VerifierConfig verifier;
    bool debug = false;
};

}  // namespace agentbench::config
