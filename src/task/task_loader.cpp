#include "task/task_loader.hpp"

#include <algorithm>
#include <system_error>
#include <utility>

#include "errors/bench_error.hpp"
#include "task/task_parser.hpp"

namespace agentbench::task {

DirectoryTaskLoader::DirectoryTaskLoader(std::filesystem::path tasks_dir,
                                         agentbench::utils::Logger& logger)
    : tasks_dir_(std::move(tasks_dir))
    , logger_(logger) {}

std::vector<Task> DirectoryTaskLoader::LoadAll() {
    std::vector<Task> tasks;
    std::error_code ec;
    if (!std::filesystem::is_directory(tasks_dir_, ec)) {
        logger_.Warn("tasks", "tasks directory not found: " + tasks_dir_.string());
        return tasks;
    }

    std::vector<std::filesystem::path> files;
    std::filesystem::recursive_directory_iterator it(tasks_dir_, ec);
    if (ec) {
        throw agentbench::errors::TaskLoadError(
            "failed to scan " + tasks_dir_.string() + ": " + ec.message());
    }
    for (const auto& entry : it) {
        if (entry.is_regular_file() && entry.path().extension() == ".json") {
            files.push_back(entry.path());
        }
    }
    std::sort(files.begin(), files.end());

    for (const auto& path : files) {
        try {
            tasks.push_back(ParseTaskFile(path));
        } catch (const agentbench::errors::BenchError& ex) {
            logger_.Warn("tasks", "skipping " + path.string() + ": " + ex.what());
        }
    }
    return tasks;
}

Task DirectoryTaskLoader::LoadById(const std::string& id) {
    auto tasks = LoadAll();
    auto it = std::find_if(tasks.begin(), tasks.end(), [&](const Task& task) {
        return task.id == id;
    });
    if (it == tasks.end()) {
        throw agentbench::errors::TaskNotFoundError(id);
    }
    return *it;
}

std::vector<Task> DirectoryTaskLoader::LoadByCategory(const std::string& category) {
    auto tasks = LoadAll();
    tasks.erase(std::remove_if(tasks.begin(), tasks.end(), [&](const Task& task) {
        return task.category != category;
    }), tasks.end());
    return tasks;
}

std::vector<std::string> DirectoryTaskLoader::ListIds() {
    std::vector<std::string> ids;
    for (const auto& task : LoadAll()) {
        ids.push_back(task.id);
    }
    return ids;
}

}  // namespace agentbench::task
