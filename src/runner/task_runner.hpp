#pragma once

#include <string>
#include <vector>

#include "agent/agent.hpp"
#include "evaluator/benchmark_result.hpp"
#include "evaluator/result_sink.hpp"
#include "evaluator/verifier.hpp"
#include "task/task_loader.hpp"
#include "utils/logging.hpp"
#include "workspace/workspace_manager.hpp"

namespace agentbench::runner {

// Drives tasks through workspace, agent and verification and persists one
// result per execution.
class TaskRunner {
public:
    TaskRunner(agentbench::task::TaskLoader& loader,
               agentbench::workspace::WorkspaceProvisioner& workspaces,
               const agentbench::evaluator::Verifier& verifier,
               agentbench::evaluator::ResultSink& sink,
               agentbench::utils::Logger& logger);

    // Agent and verification failures become failed results. Throws
    // OrchestrationFault when the task or its workspace cannot be resolved.
    agentbench::evaluator::BenchmarkResult RunTask(const std::string& task_id,
                                                   agentbench::agent::Agent& agent,
                                                   bool skip_verify);

    // Suites never stop on a single task; orchestration faults are logged
    // and the task is left out of the summary. Any other exception becomes a
    // failed result.
    agentbench::evaluator::SuiteSummary RunAll(agentbench::agent::Agent& agent, bool skip_verify);
    agentbench::evaluator::SuiteSummary RunCategory(const std::string& category,
                                                    agentbench::agent::Agent& agent,
                                                    bool skip_verify);
    agentbench::evaluator::SuiteSummary RunTasks(const std::vector<agentbench::task::Task>& tasks,
                                                 agentbench::agent::Agent& agent,
                                                 bool skip_verify);

private:
    agentbench::evaluator::BenchmarkResult Execute(const agentbench::task::Task& task,
                                                   agentbench::agent::Agent& agent,
                                                   bool skip_verify);
    void Persist(const agentbench::evaluator::BenchmarkResult& result);

    agentbench::task::TaskLoader& loader_;
    agentbench::workspace::WorkspaceProvisioner& workspaces_;
    const agentbench::evaluator::Verifier& verifier_;
    agentbench::evaluator::ResultSink& sink_;
    agentbench::utils::Logger& logger_;
};

}  // namespace agentbench::runner
