#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <unistd.h>
#include "config/config_loader.hpp"
#include "errors/bench_error.hpp"
#include "utils/logging.hpp"

namespace {

using agentbench::config::ApplyConfigFile;
using agentbench::config::ApplyConfigFromJson;
using agentbench::config::BenchConfig;
using agentbench::config::ConfigToJson;
using agentbench::config::LoadConfig;
using agentbench::config::SaveConfig;
using agentbench::utils::Logger;
using nlohmann::json;

constexpr const char* kEnvNames[] = {
    "AGENTBENCH_TASKS_DIR",
    "AGENTBENCH_RESULTS_DIR",
    "AGENTBENCH_WORKSPACE_DIR",
    "AGENTBENCH_MODEL",
    "AGENTBENCH_OPENCODE_URL",
    "AGENTBENCH_DEBUG",
    "AGENTBENCH_AGENT",
};

class ConfigLoaderTest : public ::testing::Test {
protected:
    ConfigLoaderTest()
        : logger_({}, sink_) {
        root_ = std::filesystem::temp_directory_path() /
                ("agentbench_config_" + std::to_string(::getpid()));
        std::filesystem::create_directories(root_);
        ClearEnvironment();
    }

    ~ConfigLoaderTest() override {
        ClearEnvironment();
        std::error_code ec;
        std::filesystem::remove_all(root_, ec);
    }

    static void ClearEnvironment() {
        for (const auto* name : kEnvNames) {
            ::unsetenv(name);
        }
    }

    std::filesystem::path Write(const std::string& name, const std::string& content) {
        const auto path = root_ / name;
        std::ofstream out(path);
        out << content;
        return path;
    }

    std::ostringstream sink_;
    Logger logger_;
    std::filesystem::path root_;
};

TEST_F(ConfigLoaderTest, DefaultsWithoutFileOrEnvironment) {
    const auto config = LoadConfig(root_ / "missing.json", logger_);
    EXPECT_EQ(config.tasks_dir, "tasks");
    EXPECT_EQ(config.results_dir, "results");
    EXPECT_EQ(config.workspace_dir, "/tmp/agent-bench");
    EXPECT_EQ(config.default_model, "anthropic/claude-sonnet-4-5");
    EXPECT_TRUE(config.agent.opencode_url.empty());
    EXPECT_EQ(config.agent.opencode_command, "opencode");
    EXPECT_EQ(config.agent.type, "opencode");
    EXPECT_EQ(config.agent.claude_command, "claude");
    EXPECT_EQ(config.agent.claude_max_iterations, 1);
    EXPECT_EQ(config.verifier.kill_grace_s, 2);
    EXPECT_FALSE(config.debug);
}

TEST_F(ConfigLoaderTest, FileValuesOverrideDefaults) {
    const auto path = Write("config.json", R"({
        "tasksDir": "/srv/tasks",
        "defaultModel": "openai/gpt-5",
        "agent": {"opencodeUrl": "http://127.0.0.1:4096", "startupTimeoutS": 30},
        "verifier": {"killGraceS": 5}
    })");

    const auto config = LoadConfig(path, logger_);
    EXPECT_EQ(config.tasks_dir, "/srv/tasks");
    EXPECT_EQ(config.results_dir, "results");
    EXPECT_EQ(config.default_model, "openai/gpt-5");
    EXPECT_EQ(config.agent.opencode_url, "http://127.0.0.1:4096");
    EXPECT_EQ(config.agent.startup_timeout_s, 30);
    EXPECT_EQ(config.agent.request_timeout_s, 30);
    EXPECT_EQ(config.verifier.kill_grace_s, 5);
}

TEST_F(ConfigLoaderTest, EnvironmentOverridesFile) {
    const auto path = Write("config.json", R"({"tasksDir": "/srv/tasks", "resultsDir": "/srv/results"})");
    ::setenv("AGENTBENCH_TASKS_DIR", "/env/tasks", 1);
    ::setenv("AGENTBENCH_MODEL", "google/gemini-2.5-pro", 1);
    ::setenv("AGENTBENCH_DEBUG", "TRUE", 1);

    const auto config = LoadConfig(path, logger_);
    EXPECT_EQ(config.tasks_dir, "/env/tasks");
    EXPECT_EQ(config.results_dir, "/srv/results");
    EXPECT_EQ(config.default_model, "google/gemini-2.5-pro");
    EXPECT_TRUE(config.debug);
}

TEST_F(ConfigLoaderTest, AgentSelectionFromFileAndEnvironment) {
    const auto path = Write("config.json", R"({
        "agent": {"type": "opencode", "claudeCommand": "/usr/local/bin/claude", "claudeMaxIterations": 3}
    })");
    ::setenv("AGENTBENCH_AGENT", "claude", 1);

    const auto config = LoadConfig(path, logger_);
    EXPECT_EQ(config.agent.type, "claude");
    EXPECT_EQ(config.agent.claude_command, "/usr/local/bin/claude");
    EXPECT_EQ(config.agent.claude_max_iterations, 3);
    EXPECT_EQ(config.agent.claude_timeout_s, 1800);
}

TEST_F(ConfigLoaderTest, MalformedFileIsIgnoredWithWarning) {
    const auto path = Write("config.json", "{ tasksDir: ");
    BenchConfig config;
    EXPECT_FALSE(ApplyConfigFile(config, path, logger_));
    EXPECT_EQ(config.tasks_dir, "tasks");
    EXPECT_NE(sink_.str().find("malformed config file"), std::string::npos);
}

TEST_F(ConfigLoaderTest, MistypedValuesAreSkipped) {
    BenchConfig config;
    ApplyConfigFromJson(config, json{{"tasksDir", 7}, {"agent", {{"port", "4096"}}}, {"debug", "yes"}});
    EXPECT_EQ(config.tasks_dir, "tasks");
    EXPECT_EQ(config.agent.port, 0);
    EXPECT_FALSE(config.debug);
}

TEST_F(ConfigLoaderTest, SavedConfigLoadsBack) {
    BenchConfig config;
    config.tasks_dir = "/data/tasks";
    config.agent.opencode_url = "http://10.0.0.2:4096";
    config.verifier.kill_grace_s = 9;
    config.agent.type = "claude";
    config.agent.claude_timeout_s = 600;
    const auto path = root_ / "nested" / "config.json";

    SaveConfig(config, path);
    const auto loaded = LoadConfig(path, logger_);
    EXPECT_EQ(loaded.tasks_dir, "/data/tasks");
    EXPECT_EQ(loaded.agent.opencode_url, "http://10.0.0.2:4096");
    EXPECT_EQ(loaded.verifier.kill_grace_s, 9);
    EXPECT_EQ(loaded.agent.type, "claude");
    EXPECT_EQ(loaded.agent.claude_timeout_s, 600);
}

TEST_F(ConfigLoaderTest, EmptyOpencodeUrlIsNotSerialized) {
    const auto data = ConfigToJson(BenchConfig{});
    EXPECT_FALSE(data["agent"].contains("opencodeUrl"));
    EXPECT_EQ(data["defaultModel"], "anthropic/claude-sonnet-4-5");
}

}  // namespace
