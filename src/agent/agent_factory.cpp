#include "agent/agent_factory.hpp"

#include <chrono>
#include <optional>
#include <stdexcept>
#include <utility>

#include "agent/session_agent.hpp"
#include "utils/common.hpp"

namespace agentbench::agent {

ModelConfig ParseModel(const std::string& value) {
    const auto slash = value.find('/');
    if (slash == std::string::npos || slash == 0 || slash + 1 == value.size()) {
        throw std::invalid_argument("model must look like provider/model: " + value);
    }
    return ModelConfig{value.substr(0, slash), value.substr(slash + 1)};
}

AgentType ParseAgentType(const std::string& name) {
    const auto lowered = utils::ToLower(name);
    if (lowered == "opencode") {
        return AgentType::Opencode;
    }
    if (lowered == "claude") {
        return AgentType::Claude;
    }
    throw std::invalid_argument("Unknown agent type: " + name);
}

std::string ToString(AgentType type) {
    switch (type) {
    case AgentType::Opencode:
        return "opencode";
    case AgentType::Claude:
        return "claude";
    }
    return "unknown";
}

OpencodeOptions ResolveOpencodeOptions(const agentbench::config::BenchConfig& config) {
    OpencodeOptions options{};
    options.url = config.agent.opencode_url;
    options.server.command = config.agent.opencode_command;
    options.server.hostname = config.agent.hostname;
    options.server.port = config.agent.port;
    options.server.startup_timeout = std::chrono::seconds(config.agent.startup_timeout_s);
    options.server.kill_grace = std::chrono::seconds(config.verifier.kill_grace_s);
    options.request_timeout = std::chrono::seconds(config.agent.request_timeout_s);
    return options;
}

ClaudeCliOptions ResolveClaudeOptions(const agentbench::config::BenchConfig& config) {
    ClaudeCliOptions options{};
    options.command = config.agent.claude_command;
    options.max_iterations = config.agent.claude_max_iterations;
    options.timeout = std::chrono::seconds(config.agent.claude_timeout_s);
    options.kill_grace = std::chrono::seconds(config.verifier.kill_grace_s);
    return options;
}

ModelConfig ResolveModel(const std::string& model, agentbench::utils::Logger& logger) {
    if (model.empty()) {
        return kDefaultModel;
    }
    try {
        return ParseModel(model);
    } catch (const std::invalid_argument& ex) {
        logger.Warn("agent", std::string(ex.what()) + ", using " + kDefaultModel.ToString());
        return kDefaultModel;
    }
}

std::unique_ptr<Agent> CreateAgent(const agentbench::config::BenchConfig& config,
                                   const std::string& model,
                                   agentbench::utils::Logger& logger) {
    const auto type = ParseAgentType(config.agent.type);
    const auto resolved = ResolveModel(model, logger);
    if (type == AgentType::Claude) {
        // The CLI only talks to Anthropic; other providers fall back to its default model.
        std::optional<ModelConfig> cli_model;
        if (resolved.provider_id == "anthropic") {
            cli_model = resolved;
        } else {
            logger.Warn("agent", "claude CLI cannot run " + resolved.ToString() + ", using its default model");
        }
        return std::make_unique<ClaudeCliAgent>(ResolveClaudeOptions(config), std::move(cli_model), logger);
    }
    auto backend = std::make_unique<OpencodeBackend>(ResolveOpencodeOptions(config), logger);
    return std::make_unique<SessionAgent>(std::move(backend), resolved, logger);
}

}  // namespace agentbench::agent
