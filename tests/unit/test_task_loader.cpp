#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <unistd.h>
#include "errors/bench_error.hpp"
#include "task/task_loader.hpp"
#include "utils/logging.hpp"

namespace {

using agentbench::errors::TaskNotFoundError;
using agentbench::task::DirectoryTaskLoader;
using agentbench::utils::Logger;
using nlohmann::json;

class TempWorkspace {
public:
    TempWorkspace() {
        static int counter = 0;
        root_ = std::filesystem::temp_directory_path() /
                ("agentbench_tasks_" + std::to_string(::getpid()) + "_" + std::to_string(counter++));
        std::filesystem::create_directories(root_);
    }

    ~TempWorkspace() {
        std::error_code ec;
        std::filesystem::remove_all(root_, ec);
    }

    const std::filesystem::path& root() const { return root_; }

private:
    std::filesystem::path root_;
};

void WriteTask(const std::filesystem::path& path, const std::string& id, const std::string& category) {
    std::filesystem::create_directories(path.parent_path());
    const json data = {
        {"id", id},
        {"title", "Task " + id},
        {"category", category},
        {"difficulty", "easy"},
        {"source", {{"repository", "none"}, {"commit", "main"}}},
        {"prompt", "Do " + id},
        {"verification", {{"type", "command"}, {"command", "true"}}}
    };
    std::ofstream out(path);
    out << data.dump(2);
}

TEST(TaskLoaderTest, LoadsJsonFilesRecursivelyInPathOrder) {
    TempWorkspace workspace;
    WriteTask(workspace.root() / "b" / "task.json", "beta", "refactor");
    WriteTask(workspace.root() / "a.json", "alpha", "bugfix");
    WriteTask(workspace.root() / "c" / "deep" / "gamma.json", "gamma", "bugfix");
    std::ofstream(workspace.root() / "notes.md") << "# not a task";

    std::ostringstream sink;
    Logger logger({}, sink);
    DirectoryTaskLoader loader(workspace.root(), logger);

    const auto ids = loader.ListIds();
    ASSERT_EQ(ids.size(), 3u);
    EXPECT_EQ(ids[0], "alpha");
    EXPECT_EQ(ids[1], "beta");
    EXPECT_EQ(ids[2], "gamma");
}

TEST(TaskLoaderTest, SkipsInvalidFilesWithWarning) {
    TempWorkspace workspace;
    WriteTask(workspace.root() / "good.json", "good", "bugfix");
    std::ofstream(workspace.root() / "bad.json") << R"({"id": "bad"})";

    std::ostringstream sink;
    Logger logger({}, sink);
    DirectoryTaskLoader loader(workspace.root(), logger);

    const auto tasks = loader.LoadAll();
    ASSERT_EQ(tasks.size(), 1u);
    EXPECT_EQ(tasks[0].id, "good");
    EXPECT_NE(sink.str().find("bad.json"), std::string::npos);
}

TEST(TaskLoaderTest, LoadByIdAndCategory) {
    TempWorkspace workspace;
    WriteTask(workspace.root() / "one.json", "one", "bugfix");
    WriteTask(workspace.root() / "two.json", "two", "feature");
    WriteTask(workspace.root() / "three.json", "three", "bugfix");

    std::ostringstream sink;
    Logger logger({}, sink);
    DirectoryTaskLoader loader(workspace.root(), logger);

    EXPECT_EQ(loader.LoadById("two").category, "feature");

    const auto bugfixes = loader.LoadByCategory("bugfix");
    ASSERT_EQ(bugfixes.size(), 2u);
    EXPECT_EQ(bugfixes[0].id, "one");
    EXPECT_EQ(bugfixes[1].id, "three");
    EXPECT_TRUE(loader.LoadByCategory("docs").empty());
}

TEST(TaskLoaderTest, UnknownIdThrowsTaskNotFound) {
    TempWorkspace workspace;
    WriteTask(workspace.root() / "one.json", "one", "bugfix");

    std::ostringstream sink;
    Logger logger({}, sink);
    DirectoryTaskLoader loader(workspace.root(), logger);

    try {
        loader.LoadById("missing");
        FAIL() << "expected TaskNotFoundError";
    } catch (const TaskNotFoundError& ex) {
        EXPECT_EQ(ex.TaskId(), "missing");
        EXPECT_EQ(std::string(ex.what()), "Task not found: missing");
    }
}

TEST(TaskLoaderTest, MissingDirectoryYieldsNoTasks) {
    std::ostringstream sink;
    Logger logger({}, sink);
    DirectoryTaskLoader loader("/nonexistent/agentbench/tasks", logger);
    EXPECT_TRUE(loader.LoadAll().empty());
    EXPECT_NE(sink.str().find("tasks directory not found"), std::string::npos);
}

}  // namespace
