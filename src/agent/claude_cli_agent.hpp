#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include "agent/agent.hpp"
#include "sandbox/sandbox_executor.hpp"
#include "utils/logging.hpp"

namespace agentbench::agent {

struct ClaudeCliOptions {
    std::string command = "claude";
    // 1 runs a single `--print` turn; more turns resume with `--continue`
    // until the output contains kDoneMarker.
    int max_iterations = 1;
    std::chrono::seconds timeout{1800};
    std::chrono::seconds kill_grace{2};
    std::chrono::seconds turn_delay{2};
};

inline constexpr const char* kDoneMarker = "DONE";
inline constexpr const char* kContinuePrompt =
    "Please continue with the task. Check if verification passes. "
    "If there are errors, fix them and retry.";

// Runs the Claude Code CLI as a child process in the workspace. There is no
// event stream, so token and cost metrics stay at zero.
class ClaudeCliAgent : public Agent {
public:
    ClaudeCliAgent(ClaudeCliOptions options,
                   std::optional<ModelConfig> model,
                   agentbench::utils::Logger& logger);

    std::string Name() const override;
    std::string Version() const override;
    std::string ModelName() const override;
    AgentResult Execute(const agentbench::task::Task& task,
                        const std::filesystem::path& workspace) override;

    // argv for one turn; turn 0 carries the task prompt.
    std::vector<std::string> BuildArgs(const agentbench::task::Task& task, int turn) const;

private:
    ClaudeCliOptions options_;
    std::optional<ModelConfig> model_;
    agentbench::utils::Logger& logger_;
    agentbench::sandbox::SandboxExecutor executor_;
};

// stdout, followed by a STDERR block when the CLI wrote to stderr.
std::string CombineCliOutput(const agentbench::sandbox::ExecResult& exec);

}  // namespace agentbench::agent
