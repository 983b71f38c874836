#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "task/task_types.hpp"
#include "utils/logging.hpp"

namespace agentbench::task {

class TaskLoader {
public:
    virtual ~TaskLoader() = default;
    virtual Task LoadById(const std::string& id) = 0;
    virtual std::vector<Task> LoadAll() = 0;
    virtual std::vector<Task> LoadByCategory(const std::string& category) = 0;
};

// Loads *.json task definitions below a directory, in sorted path order.
class DirectoryTaskLoader : public TaskLoader {
public:
    DirectoryTaskLoader(std::filesystem::path tasks_dir, agentbench::utils::Logger& logger);

    Task LoadById(const std::string& id) override;
    std::vector<Task> LoadAll() override;
    std::vector<Task> LoadByCategory(const std::string& category) override;

    std::vector<std::string> ListIds();

private:
    std::filesystem::path tasks_dir_;
    agentbench::utils::Logger& logger_;
};

}  // namespace agentbench::task
