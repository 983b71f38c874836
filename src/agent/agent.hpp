#pragma once

#include <filesystem>
#include <string>

#include "task/task_types.hpp"

namespace agentbench::agent {

struct ModelConfig {
    std::string provider_id;
    std::string model_id;

    std::string ToString() const { return provider_id + "/" + model_id; }
};

inline const ModelConfig kDefaultModel{"anthropic", "claude-sonnet-4-5"};

// Parses "provider/model"; throws std::invalid_argument otherwise.
ModelConfig ParseModel(const std::string& value);

struct AgentResult {
    // The agent finished its turn; says nothing about task correctness.
    bool success = false;
    std::string output;
    int iterations = 0;
    long long input_tokens = 0;
    long long output_tokens = 0;
    double cost = 0.0;
    double duration_secs = 0.0;
    std::string agent_version;
    std::string model_name;

    long long TokensUsed() const { return input_tokens + output_tokens; }
};

class Agent {
public:
    virtual ~Agent() = default;
    virtual std::string Name() const = 0;
    virtual std::string Version() const = 0;
    // "provider/model"
    virtual std::string ModelName() const = 0;
    // Throws AgentError when the capability is unreachable, the prompt
    // cannot be delivered or the session reports an error.
    virtual AgentResult Execute(const agentbench::task::Task& task,
                                const std::filesystem::path& workspace) = 0;
};

}  // namespace agentbench::agent
