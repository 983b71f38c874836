#pragma once

#include <stdexcept>
#include <string>

namespace agentbench::errors {

class BenchError : public std::runtime_error {
public:
    explicit BenchError(const std::string& message)
        : std::runtime_error(message) {}
};

// Faults that make producing any result for a task impossible.
class OrchestrationFault : public BenchError {
public:
    using BenchError::BenchError;
};

class TaskNotFoundError : public OrchestrationFault {
public:
    explicit TaskNotFoundError(const std::string& task_id)
        : OrchestrationFault("Task not found: " + task_id)
        , task_id_(task_id) {}

    const std::string& TaskId() const { return task_id_; }

private:
    std::string task_id_;
};

class InvalidTaskFormatError : public OrchestrationFault {
public:
    explicit InvalidTaskFormatError(const std::string& message)
        : OrchestrationFault("Invalid task format: " + message) {}
};

class TaskLoadError : public OrchestrationFault {
public:
    explicit TaskLoadError(const std::string& message)
        : OrchestrationFault("Task loading failed: " + message) {}
};

class WorkspaceError : public OrchestrationFault {
public:
    explicit WorkspaceError(const std::string& message)
        : OrchestrationFault("Workspace provisioning failed: " + message) {}
};

class AgentError : public BenchError {
public:
    using BenchError::BenchError;
};

class VerificationError : public BenchError {
public:
    using BenchError::BenchError;
};

}  // namespace agentbench::errors
