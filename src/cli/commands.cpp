#include <chrono>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "agent/agent_factory.hpp"
#include "cli/cli_options.hpp"
#include "collectors/csv_collector.hpp"
#include "config/config_loader.hpp"
#include "errors/bench_error.hpp"
#include "evaluator/result_sink.hpp"
#include "evaluator/verifier.hpp"
#include "runner/task_runner.hpp"
#include "task/task_loader.hpp"
#include "workspace/workspace_manager.hpp"

namespace {

using agentbench::cli::CliOptions;
using agentbench::config::BenchConfig;
using agentbench::utils::Logger;

void ApplyCliOverrides(BenchConfig& config, const CliOptions& options) {
    if (options.tasks_dir) {
        config.tasks_dir = *options.tasks_dir;
    }
    if (options.results_dir) {
        config.results_dir = *options.results_dir;
    }
    if (options.workspace_dir) {
        config.workspace_dir = *options.workspace_dir;
    }
    if (options.debug) {
        config.debug = true;
    }
}

int RunList(const BenchConfig& config, Logger& logger) {
    agentbench::task::DirectoryTaskLoader loader(config.tasks_dir, logger);
    const auto tasks = loader.LoadAll();
    if (tasks.empty()) {
        std::cout << "No tasks found in " << config.tasks_dir << std::endl;
        return 0;
    }
    std::cout << "Available tasks (" << tasks.size() << "):" << std::endl;
    for (const auto& task : tasks) {
        std::cout << "  " << std::left << std::setw(16) << task.id
                  << std::setw(8) << agentbench::task::ToString(task.difficulty)
                  << std::setw(14) << task.category
                  << task.title << std::endl;
    }
    return 0;
}

int RunBenchmark(BenchConfig config, const CliOptions& options, Logger& logger) {
    if (options.agent) {
        config.agent.type = *options.agent;
    }
    const auto model = options.model.value_or(config.default_model);
    const bool skip_verify = options.no_verify;

    auto agent = agentbench::agent::CreateAgent(config, model, logger);
    agentbench::task::DirectoryTaskLoader loader(config.tasks_dir, logger);
    agentbench::workspace::GitWorkspaceManager workspaces(config.workspace_dir, logger);
    agentbench::evaluator::Verifier verifier(logger, std::chrono::seconds(config.verifier.kill_grace_s));
    agentbench::evaluator::JsonResultSink sink(config.results_dir, logger);
    agentbench::runner::TaskRunner runner(loader, workspaces, verifier, sink, logger);

    logger.Info("run", "using agent " + agent->Name() + " with model " + agent->ModelName());
    logger.Info("run", std::string("skip verification: ") + (skip_verify ? "true" : "false"));

    if (options.task_id) {
        logger.Info("run", "running task " + *options.task_id);
        const auto result = runner.RunTask(*options.task_id, *agent, skip_verify);
        return result.success ? 0 : 1;
    }

    if (*options.suite == "all") {
        logger.Info("run", "running all tasks");
        runner.RunAll(*agent, skip_verify);
    } else {
        logger.Info("run", "running category " + *options.suite);
        runner.RunCategory(*options.suite, *agent, skip_verify);
    }
    return 0;
}

int RunVerify(const BenchConfig& config, const CliOptions& options, Logger& logger) {
    agentbench::task::DirectoryTaskLoader loader(config.tasks_dir, logger);
    const auto task = loader.LoadById(*options.task_id);
    agentbench::evaluator::Verifier verifier(logger, std::chrono::seconds(config.verifier.kill_grace_s));

    logger.Info("verify", "verifying task " + task.id + " in " + *options.workspace);
    const auto result = verifier.Verify(task, *options.workspace);
    logger.TaskResult(result.passed, result.passed ? 100 : 0, 0, result.duration_secs, 0);
    std::cout << "\n" << agentbench::evaluator::FormatVerificationOutput(result) << std::endl;
    return result.passed ? 0 : 1;
}

int RunCollect(const BenchConfig& config, const CliOptions& options, Logger& logger) {
    const auto output = options.output
        ? std::filesystem::path(*options.output)
        : std::filesystem::path(config.results_dir) / "summary.csv";
    const auto rows = agentbench::collectors::CollectToCsv(config.results_dir, output, logger);
    if (rows > 0) {
        std::cout << "Results summary available at: " << output.string() << std::endl;
    }
    return 0;
}

int RunInit(const CliOptions& options, Logger& logger) {
    const auto path = agentbench::config::DefaultConfigPath();
    BenchConfig config{};
    agentbench::config::ApplyConfigFile(config, path, logger);

    if (options.opencode_url) {
        config.agent.opencode_url = *options.opencode_url;
    }
    if (options.default_model) {
        config.default_model = *options.default_model;
    }
    if (options.tasks_dir) {
        config.tasks_dir = *options.tasks_dir;
    }
    if (options.results_dir) {
        config.results_dir = *options.results_dir;
    }
    if (options.workspace_dir) {
        config.workspace_dir = *options.workspace_dir;
    }

    agentbench::config::SaveConfig(config, path);
    std::cout << "Configuration saved to: " << path.string() << "\n\n"
              << agentbench::config::ConfigToJson(config).dump(2) << std::endl;
    return 0;
}

}  // namespace

int main(int argc, char** argv) {
    CliOptions options{};
    try {
        options = agentbench::cli::ParseArgs(std::vector<std::string>(argv + 1, argv + argc));
    } catch (const std::invalid_argument& ex) {
        std::cerr << "Error: " << ex.what() << "\n\n" << agentbench::cli::Usage();
        return 1;
    }
    if (options.command == "help") {
        std::cout << agentbench::cli::Usage();
        return 0;
    }

    agentbench::utils::LogConfig log_config{};
    if (options.debug) {
        log_config.min_level = agentbench::utils::LogLevel::kDebug;
    }
    Logger logger(log_config);
    auto config = agentbench::config::LoadConfig(logger);
    ApplyCliOverrides(config, options);
    if (config.debug) {
        logger.SetMinLevel(agentbench::utils::LogLevel::kDebug);
    }

    try {
        if (options.command == "list") {
            return RunList(config, logger);
        }
        if (options.command == "run") {
            return RunBenchmark(config, options, logger);
        }
        if (options.command == "verify") {
            return RunVerify(config, options, logger);
        }
        if (options.command == "collect") {
            return RunCollect(config, options, logger);
        }
        if (options.command == "init") {
            return RunInit(options, logger);
        }
    } catch (const agentbench::errors::BenchError& ex) {
        logger.Error("cli", options.command + " failed: " + ex.what());
        return 1;
    } catch (const std::exception& ex) {
        logger.Error("cli", options.command + " aborted: " + ex.what());
        return 1;
    }

    std::cerr << agentbench::cli::Usage();
    return 1;
}
