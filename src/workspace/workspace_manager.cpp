#include "workspace/workspace_manager.hpp"

#include <system_error>
#include <utility>

#include "errors/bench_error.hpp"
#include "utils/common.hpp"

namespace agentbench::workspace {

using agentbench::errors::WorkspaceError;

bool IsDefaultRef(const std::string& commit) {
    return commit.empty() || commit == "main" || commit == "master" || commit == "HEAD";
}

GitWorkspaceManager::GitWorkspaceManager(std::filesystem::path workspace_root,
                                         agentbench::utils::Logger& logger,
                                         std::chrono::seconds git_timeout)
    : workspace_root_(std::move(workspace_root))
    , logger_(logger)
    , executor_(logger)
    , git_timeout_(git_timeout) {}

std::filesystem::path GitWorkspaceManager::Provision(const agentbench::task::Task& task) {
    if (task.id.empty() || task.id.find('/') != std::string::npos || task.id == "." || task.id == "..") {
        throw WorkspaceError("invalid task id for a workspace directory: '" + task.id + "'");
    }
    const auto dir = workspace_root_ / task.id;

    std::error_code ec;
    std::filesystem::remove_all(dir, ec);
    if (ec) {
        throw WorkspaceError("failed to clean " + dir.string() + ": " + ec.message());
    }
    std::filesystem::create_directories(workspace_root_, ec);
    if (ec) {
        throw WorkspaceError("failed to create " + workspace_root_.string() + ": " + ec.message());
    }

    const auto& repository = task.source.repository;
    if (repository.empty() || utils::ToLower(repository) == "none") {
        std::filesystem::create_directories(dir, ec);
        if (ec) {
            throw WorkspaceError("failed to create " + dir.string() + ": " + ec.message());
        }
        logger_.Info("workspace", "empty workspace at " + dir.string());
        return dir;
    }

    logger_.Info("workspace", "cloning " + repository + " into " + dir.string());
    RunGit({"clone", repository, dir.string()}, workspace_root_);
    if (!IsDefaultRef(task.source.commit)) {
        logger_.Info("workspace", "checking out " + task.source.commit);
        RunGit({"checkout", "--detach", task.source.commit}, dir);
    }
    return dir;
}

void GitWorkspaceManager::RunGit(const std::vector<std::string>& args, const std::filesystem::path& cwd) const {
    agentbench::sandbox::ExecRequest request{};
    request.argv.push_back("git");
    request.argv.insert(request.argv.end(), args.begin(), args.end());
    request.working_dir = cwd;
    request.timeout = git_timeout_;

    const auto command = utils::Join(request.argv, " ");
    const auto exec = executor_.Run(request);
    if (exec.spawn_error) {
        throw WorkspaceError(command + ": " + *exec.spawn_error);
    }
    if (exec.timed_out) {
        throw WorkspaceError(command + ": timed out after " + std::to_string(git_timeout_.count()) + " seconds");
    }
    if (!exec.exit_code || *exec.exit_code != 0) {
        const auto details = utils::Trim(exec.error);
        throw WorkspaceError(command + " failed" + (details.empty() ? std::string() : ": " + details));
    }
}

}  // namespace agentbench::workspace
