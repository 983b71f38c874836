#pragma once

#include <memory>
#include <string>

#include "agent/agent.hpp"
#include "agent/claude_cli_agent.hpp"
#include "agent/opencode_backend.hpp"
#include "config/config_schema.hpp"
#include "utils/logging.hpp"

namespace agentbench::agent {

enum class AgentType {
    Opencode,
    Claude
};

// Case-insensitive; throws std::invalid_argument for unknown names.
AgentType ParseAgentType(const std::string& name);
std::string ToString(AgentType type);

OpencodeOptions ResolveOpencodeOptions(const agentbench::config::BenchConfig& config);

ClaudeCliOptions ResolveClaudeOptions(const agentbench::config::BenchConfig& config);

// Resolves `model` ("provider/model"), falling back to the default model
// with a warning when it is malformed.
ModelConfig ResolveModel(const std::string& model, agentbench::utils::Logger& logger);

// Builds the backend named by config.agent.type.
std::unique_ptr<Agent> CreateAgent(const agentbench::config::BenchConfig& config,
                                   const std::string& model,
                                   agentbench::utils::Logger& logger);

}  // namespace agentbench::agent
