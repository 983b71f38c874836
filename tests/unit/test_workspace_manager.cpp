#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <gtest/gtest.h>
#include <unistd.h>
#include "errors/bench_error.hpp"
#include "task/task_types.hpp"
#include "utils/logging.hpp"
#include "workspace/workspace_manager.hpp"

namespace {

using agentbench::errors::WorkspaceError;
using agentbench::task::Task;
using agentbench::utils::Logger;
using agentbench::workspace::GitWorkspaceManager;
using agentbench::workspace::IsDefaultRef;

class TempWorkspace {
public:
    TempWorkspace() {
        static int counter = 0;
        root_ = std::filesystem::temp_directory_path() /
                ("agentbench_workspaces_" + std::to_string(::getpid()) + "_" + std::to_string(counter++));
    }

    ~TempWorkspace() {
        std::error_code ec;
        std::filesystem::remove_all(root_, ec);
    }

    const std::filesystem::path& root() const { return root_; }

private:
    std::filesystem::path root_;
};

Task MakeTask(const std::string& id, const std::string& repository) {
    Task task;
    task.id = id;
    task.source.repository = repository;
    task.source.commit = "main";
    return task;
}

TEST(WorkspaceManagerTest, NoneRepositoryGivesEmptyDirectory) {
    TempWorkspace workspace;
    std::ostringstream sink;
    Logger logger({}, sink);
    GitWorkspaceManager manager(workspace.root(), logger);

    const auto dir = manager.Provision(MakeTask("scratch", "none"));
    EXPECT_EQ(dir.string(), (workspace.root() / "scratch").string());
    EXPECT_TRUE(std::filesystem::is_directory(dir));
    EXPECT_TRUE(std::filesystem::is_empty(dir));
}

TEST(WorkspaceManagerTest, StaleContentIsRemoved) {
    TempWorkspace workspace;
    std::filesystem::create_directories(workspace.root() / "scratch" / "old");
    std::ofstream(workspace.root() / "scratch" / "old" / "leftover.txt") << "stale";

    std::ostringstream sink;
    Logger logger({}, sink);
    GitWorkspaceManager manager(workspace.root(), logger);

    const auto dir = manager.Provision(MakeTask("scratch", "NONE"));
    EXPECT_TRUE(std::filesystem::is_empty(dir));
}

TEST(WorkspaceManagerTest, RejectsIdsThatEscapeTheRoot) {
    TempWorkspace workspace;
    std::ostringstream sink;
    Logger logger({}, sink);
    GitWorkspaceManager manager(workspace.root(), logger);

    EXPECT_THROW(manager.Provision(MakeTask("../escape", "none")), WorkspaceError);
    EXPECT_THROW(manager.Provision(MakeTask("..", "none")), WorkspaceError);
    EXPECT_THROW(manager.Provision(MakeTask("", "none")), WorkspaceError);
}

TEST(WorkspaceManagerTest, FailedCloneRaisesWorkspaceError) {
    TempWorkspace workspace;
    std::ostringstream sink;
    Logger logger({}, sink);
    GitWorkspaceManager manager(workspace.root(), logger, std::chrono::seconds(30));

    try {
        manager.Provision(MakeTask("clone", (workspace.root() / "no-such-repo").string()));
        FAIL() << "expected WorkspaceError";
    } catch (const WorkspaceError& ex) {
        EXPECT_NE(std::string(ex.what()).find("git clone"), std::string::npos);
    }
}

TEST(WorkspaceManagerTest, DefaultRefsSkipCheckout) {
    EXPECT_TRUE(IsDefaultRef(""));
    EXPECT_TRUE(IsDefaultRef("main"));
    EXPECT_TRUE(IsDefaultRef("master"));
    EXPECT_TRUE(IsDefaultRef("HEAD"));
    EXPECT_FALSE(IsDefaultRef("v1.2.0"));
    EXPECT_FALSE(IsDefaultRef("3f2a9c1"));
}

}  // namespace
