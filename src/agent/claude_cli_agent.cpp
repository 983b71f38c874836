#include "agent/claude_cli_agent.hpp"

#include <algorithm>
#include <thread>
#include <utility>

#include "errors/bench_error.hpp"
#include "utils/common.hpp"

namespace agentbench::agent {

using agentbench::errors::AgentError;

ClaudeCliAgent::ClaudeCliAgent(ClaudeCliOptions options,
                               std::optional<ModelConfig> model,
                               agentbench::utils::Logger& logger)
    : options_(std::move(options))
    , model_(std::move(model))
    , logger_(logger)
    , executor_(logger) {}

std::string ClaudeCliAgent::Name() const {
    return "claude";
}

std::string ClaudeCliAgent::Version() const {
    return "claude-cli";
}

std::string ClaudeCliAgent::ModelName() const {
    return model_ ? model_->ToString() : "anthropic/default";
}

std::vector<std::string> ClaudeCliAgent::BuildArgs(const agentbench::task::Task& task, int turn) const {
    std::vector<std::string> argv{options_.command, "--print"};
    if (model_) {
        argv.push_back("--model");
        argv.push_back(model_->model_id);
    }
    if (turn == 0) {
        argv.push_back(task.prompt);
    } else {
        argv.push_back("--continue");
        argv.push_back(kContinuePrompt);
    }
    return argv;
}

AgentResult ClaudeCliAgent::Execute(const agentbench::task::Task& task,
                                    const std::filesystem::path& workspace) {
    const auto start = std::chrono::steady_clock::now();
    const int turns = std::max(1, options_.max_iterations);

    AgentResult result{};
    result.agent_version = Version();
    result.model_name = ModelName();

    for (int turn = 0; turn < turns; ++turn) {
        agentbench::sandbox::ExecRequest request{};
        request.argv = BuildArgs(task, turn);
        request.working_dir = workspace;
        request.timeout = options_.timeout;
        request.kill_grace = options_.kill_grace;

        logger_.Info("claude", "turn " + std::to_string(turn + 1) + "/" + std::to_string(turns) +
                                   " in " + workspace.string());
        const auto exec = executor_.Run(request);
        if (exec.spawn_error) {
            throw AgentError("Failed to execute claude CLI: " + *exec.spawn_error);
        }
        if (exec.timed_out) {
            throw AgentError("claude CLI timed out after " +
                             std::to_string(options_.timeout.count()) + " seconds");
        }

        ++result.iterations;
        result.output = CombineCliOutput(exec);
        const bool exited_cleanly = exec.exit_code.has_value() && *exec.exit_code == 0;

        if (turns == 1) {
            result.success = exited_cleanly;
            break;
        }
        if (exited_cleanly && result.output.find(kDoneMarker) != std::string::npos) {
            result.success = true;
            break;
        }
        if (turn + 1 < turns) {
            std::this_thread::sleep_for(options_.turn_delay);
        }
    }

    if (!result.success) {
        logger_.Warn("claude", "finished without success after " + std::to_string(result.iterations) + " turn(s)");
    }
    result.duration_secs = utils::SecondsSince(start);
    return result;
}

std::string CombineCliOutput(const agentbench::sandbox::ExecResult& exec) {
    if (exec.error.empty()) {
        return exec.output;
    }
    return exec.output + "\n\nSTDERR:\n" + exec.error;
}

}  // namespace agentbench::agent
