#pragma once

#include <memory>
#include <string>

#include "agent/agent.hpp"
#include "agent/agent_session.hpp"
#include "utils/logging.hpp"

namespace agentbench::agent {

// Drives one backend session per task: submits the prompt, folds the
// progress events into Metrics and closes the session on every path.
class SessionAgent : public Agent {
public:
    SessionAgent(std::unique_ptr<AgentBackend> backend,
                 ModelConfig model,
                 agentbench::utils::Logger& logger);

    std::string Name() const override;
    std::string Version() const override;
    std::string ModelName() const override;
    AgentResult Execute(const agentbench::task::Task& task,
                        const std::filesystem::path& workspace) override;

    const ModelConfig& Model() const { return model_; }

private:
    std::unique_ptr<AgentBackend> backend_;
    ModelConfig model_;
    agentbench::utils::Logger& logger_;
};

// "plan" when the task grants neither write nor shell access, else "build".
std::string SelectMode(const agentbench::task::PermissionsConfig& permissions);

}  // namespace agentbench::agent
