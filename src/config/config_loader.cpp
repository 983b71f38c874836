#include "config/config_loader.hpp"

#include <cstdlib>
#include <fstream>
#include <system_error>

#include "errors/bench_error.hpp"
#include "utils/common.hpp"

namespace agentbench::config {
namespace {

std::string GetEnv(const char* name) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : std::string();
}

std::filesystem::path GetHomePath() {
    const char* home = std::getenv("HOME");
    return std::filesystem::path(home ? home : ".");
}

bool ParseBool(const std::string& value) {
    const auto lowered = utils::ToLower(value);
    return lowered == "1" || lowered == "true" || lowered == "yes" || lowered == "on";
}

void ReadString(const nlohmann::json& source, const char* key, std::string& target) {
    if (source.contains(key) && source[key].is_string()) {
        target = source[key].get<std::string>();
    }
}

void ReadInt(const nlohmann::json& source, const char* key, int& target) {
    if (source.contains(key) && source[key].is_number_integer()) {
        target = source[key].get<int>();
    }
}

}  // namespace

std::filesystem::path DefaultConfigPath() {
    return GetHomePath() / ".agentbench" / "config.json";
}

void ApplyConfigFromJson(BenchConfig& config, const nlohmann::json& data) {
    if (!data.is_object()) {
        return;
    }

    ReadString(data, "tasksDir", config.tasks_dir);
    ReadString(data, "resultsDir", config.results_dir);
    ReadString(data, "workspaceDir", config.workspace_dir);
    ReadString(data, "defaultModel", config.default_model);
    if (data.contains("debug") && data["debug"].is_boolean()) {
        config.debug = data["debug"].get<bool>();
    }

    if (data.contains("agent") && data["agent"].is_object()) {
        const auto& agent = data["agent"];
        ReadString(agent, "type", config.agent.type);
        ReadString(agent, "opencodeUrl", config.agent.opencode_url);
        ReadString(agent, "opencodeCommand", config.agent.opencode_command);
        ReadString(agent, "hostname", config.agent.hostname);
        ReadInt(agent, "port", config.agent.port);
        ReadInt(agent, "startupTimeoutS", config.agent.startup_timeout_s);
        ReadInt(agent, "requestTimeoutS", config.agent.request_timeout_s);
        ReadString(agent, "claudeCommand", config.agent.claude_command);
        ReadInt(agent, "claudeMaxIterations", config.agent.claude_max_iterations);
        ReadInt(agent, "claudeTimeoutS", config.agent.claude_timeout_s);
    }

    if (data.contains("verifier") && data["verifier"].is_object()) {
        ReadInt(data["verifier"], "killGraceS", config.verifier.kill_grace_s);
    }
}

void ApplyEnvironment(BenchConfig& config) {
    const auto tasks_dir = GetEnv("AGENTBENCH_TASKS_DIR");
    if (!tasks_dir.empty()) {
        config.tasks_dir = tasks_dir;
    }

    const auto results_dir = GetEnv("AGENTBENCH_RESULTS_DIR");
    if (!results_dir.empty()) {
        config.results_dir = results_dir;
    }

    const auto workspace_dir = GetEnv("AGENTBENCH_WORKSPACE_DIR");
    if (!workspace_dir.empty()) {
        config.workspace_dir = workspace_dir;
    }

    const auto model = GetEnv("AGENTBENCH_MODEL");
    if (!model.empty()) {
        config.default_model = model;
    }

    const auto agent_type = GetEnv("AGENTBENCH_AGENT");
    if (!agent_type.empty()) {
        config.agent.type = agent_type;
    }

    const auto opencode_url = GetEnv("AGENTBENCH_OPENCODE_URL");
    if (!opencode_url.empty()) {
        config.agent.opencode_url = opencode_url;
    }

    const auto debug = GetEnv("AGENTBENCH_DEBUG");
    if (!debug.empty()) {
        config.debug = ParseBool(debug);
    }
}

bool ApplyConfigFile(BenchConfig& config, const std::filesystem::path& path, agentbench::utils::Logger& logger) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return false;
    }
    std::ifstream input(path);
    const auto data = nlohmann::json::parse(input, nullptr, false);
    if (data.is_discarded()) {
        logger.Warn("config", "ignoring malformed config file " + path.string());
        return false;
    }
    ApplyConfigFromJson(config, data);
    logger.Debug("config", "loaded " + path.string());
    return true;
}

BenchConfig LoadConfig(const std::filesystem::path& path, agentbench::utils::Logger& logger) {
    BenchConfig config{};
    ApplyConfigFile(config, path, logger);
    ApplyEnvironment(config);
    return config;
}

BenchConfig LoadConfig(agentbench::utils::Logger& logger) {
    return LoadConfig(DefaultConfigPath(), logger);
}

nlohmann::json ConfigToJson(const BenchConfig& config) {
    nlohmann::json agent = {
        {"type", config.agent.type},
        {"opencodeCommand", config.agent.opencode_command},
        {"hostname", config.agent.hostname},
        {"port", config.agent.port},
        {"startupTimeoutS", config.agent.startup_timeout_s},
        {"requestTimeoutS", config.agent.request_timeout_s},
        {"claudeCommand", config.agent.claude_command},
        {"claudeMaxIterations", config.agent.claude_max_iterations},
        {"claudeTimeoutS", config.agent.claude_timeout_s}
    };
    if (!config.agent.opencode_url.empty()) {
        agent["opencodeUrl"] = config.agent.opencode_url;
    }
    return nlohmann::json{
        {"tasksDir", config.tasks_dir},
        {"resultsDir", config.results_dir},
        {"workspaceDir", config.workspace_dir},
        {"defaultModel", config.default_model},
        {"agent", agent},
        {"verifier", {{"killGraceS", config.verifier.kill_grace_s}}}
    };
}

void SaveConfig(const BenchConfig& config, const std::filesystem::path& path) {
    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            throw errors::BenchError("Failed to create " + path.parent_path().string() + ": " + ec.message());
        }
    }
    std::ofstream output(path);
    if (!output.is_open()) {
        throw errors::BenchError("Failed to write config file " + path.string());
    }
    output << ConfigToJson(config).dump(2) << "\n";
}

}  // namespace agentbench::config
