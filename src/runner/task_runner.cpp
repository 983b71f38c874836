#include "runner/task_runner.hpp"

#include <chrono>
#include <exception>
#include <optional>
#include <utility>

#include "errors/bench_error.hpp"
#include "utils/common.hpp"

namespace agentbench::runner {

using agentbench::errors::AgentError;
using agentbench::errors::OrchestrationFault;
using agentbench::errors::VerificationError;
using agentbench::evaluator::BenchmarkResult;
using agentbench::evaluator::SuiteSummary;

namespace {

BenchmarkResult StartResult(const agentbench::task::Task& task, const agentbench::agent::Agent& agent) {
    auto result = StartResult(task, agent);
    return result;
}

}  // namespace

TaskRunner::TaskRunner(agentbench::task::TaskLoader& loader,
                       agentbench::workspace::WorkspaceProvisioner& workspaces,
                       const agentbench::evaluator::Verifier& verifier,
                       agentbench::evaluator::ResultSink& sink,
                       agentbench::utils::Logger& logger)
    : loader_(loader)
    , workspaces_(workspaces)
    , verifier_(verifier)
    , sink_(sink)
    , logger_(logger) {}

BenchmarkResult TaskRunner::RunTask(const std::string& task_id,
                                    agentbench::agent::Agent& agent,
                                    bool skip_verify) {
    const auto task = loader_.LoadById(task_id);
    return Execute(task, agent, skip_verify);
}

SuiteSummary TaskRunner::RunAll(agentbench::agent::Agent& agent, bool skip_verify) {
    return RunTasks(loader_.LoadAll(), agent, skip_verify);
}

SuiteSummary TaskRunner::RunCategory(const std::string& category,
                                     agentbench::agent::Agent& agent,
                                     bool skip_verify) {
    const auto tasks = loader_.LoadByCategory(category);
    if (tasks.empty()) {
        logger_.Warn("runner", "no tasks in category " + category);
    }
    return RunTasks(tasks, agent, skip_verify);
}

SuiteSummary TaskRunner::RunTasks(const std::vector<agentbench::task::Task>& tasks,
                                  agentbench::agent::Agent& agent,
                                  bool skip_verify) {
    std::vector<BenchmarkResult> results;
    results.reserve(tasks.size());
    for (const auto& task : tasks) {
        try {
            results.push_back(Execute(task, agent, skip_verify));
        } catch (const OrchestrationFault& ex) {
            logger_.Error("runner", "skipping " + task.id + ": " + ex.what());
        } catch (const std::exception& ex) {
            logger_.Error("runner", task.id + " aborted: " + ex.what());
            auto result = StartResult(task, agent);
            result.error = std::string("Task execution failed: ") + ex.what();
            Persist(result);
            results.push_back(std::move(result));
        }
    }

    auto summary = SuiteSummary::FromResults(agent.Name(), std::move(results));
    logger_.SuiteSummary(summary.total, summary.passed, summary.failed,
                         summary.pass_rate, summary.total_duration_secs);
    try {
        sink_.PersistSuite(summary);
    } catch (const std::exception& ex) {
        logger_.Error("runner", std::string("failed to save suite results: ") + ex.what());
    }
    return summary;
}

BenchmarkResult TaskRunner::Execute(const agentbench::task::Task& task,
                                    agentbench::agent::Agent& agent,
                                    bool skip_verify) {
    logger_.TaskHeader(task.id, task.title);
    const auto start = std::chrono::steady_clock::now();
    const auto workspace = workspaces_.Provision(task);

    auto result = StartResult(task, agent);

    std::optional<agentbench::agent::AgentResult> agent_result;
    try {
        agent_result = agent.Execute(task, workspace);
    } catch (const AgentError& ex) {
        logger_.Error("runner", std::string("agent failed: ") + ex.what());
        result.error = std::string("Agent execution failed: ") + ex.what();
    } catch (const std::exception& ex) {
        logger_.Error("runner", std::string("agent crashed: ") + ex.what());
        result.error = std::string("Agent execution failed: ") + ex.what();
    }

    if (agent_result) {
        result.iterations = agent_result->iterations;
        result.tokens_used = agent_result->TokensUsed();
        result.cost = agent_result->cost;
        result.agent_output = agent_result->output;
        result.agent_version = agent_result->agent_version;
        result.model_name = agent_result->model_name;

        if (skip_verify) {
            result.success = agent_result->success;
        } else {
            try {
                const auto verification = verifier_.Verify(task, workspace);
                result.success = verification.passed;
                result.verification_output = agentbench::evaluator::FormatVerificationOutput(verification);
                if (!verification.passed) {
                    result.error = "Verification tests failed";
                }
            } catch (const VerificationError& ex) {
                logger_.Error("runner", std::string("verification failed: ") + ex.what());
                result.error = std::string("Verification failed: ") + ex.what();
            } catch (const std::exception& ex) {
                logger_.Error("runner", std::string("verifier crashed: ") + ex.what());
                result.error = std::string("Verification failed: ") + ex.what();
            }
        }
    }

    result.score = result.success ? 100 : 0;
    result.duration_secs = utils::SecondsSince(start);

    logger_.TaskResult(result.success, result.score, result.iterations,
                       result.duration_secs, result.tokens_used.value_or(0));
    Persist(result);
    return result;
}

void TaskRunner::Persist(const BenchmarkResult& result) {
    try {
        sink_.Persist(result);
    } catch (const std::exception& ex) {
        logger_.Error("runner", std::string("failed to save result for ") + result.task_id + ": " + ex.what());
    }
}

}  // namespace agentbench::runner
