#pragma once

#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

#include "sandbox/sandbox_executor.hpp"
#include "task/task_types.hpp"
#include "utils/logging.hpp"

namespace agentbench::workspace {

class WorkspaceProvisioner {
public:
    virtual ~WorkspaceProvisioner() = default;
    // Returns an exclusive, freshly prepared directory for the task.
    // Throws WorkspaceError.
    virtual std::filesystem::path Provision(const agentbench::task::Task& task) = 0;
};

class GitWorkspaceManager : public WorkspaceProvisioner {
public:
    GitWorkspaceManager(std::filesystem::path workspace_root,
                        agentbench::utils::Logger& logger,
                        std::chrono::seconds git_timeout = std::chrono::seconds(300));

    std::filesystem::path Provision(const agentbench::task::Task& task) override;

private:
    void RunGit(const std::vector<std::string>& args, const std::filesystem::path& cwd) const;

    std::filesystem::path workspace_root_;
    agentbench::utils::Logger& logger_;
    agentbench::sandbox::SandboxExecutor executor_;
    std::chrono::seconds git_timeout_;
};

// True for refs that the fresh clone already has checked out.
bool IsDefaultRef(const std::string& commit);

}  // namespace agentbench::workspace
