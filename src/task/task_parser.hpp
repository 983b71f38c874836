#pragma once

#include <filesystem>
#include <string>

#include "nlohmann/json.hpp"
#include "task/task_types.hpp"

namespace agentbench::task {

// Throws InvalidTaskFormatError on a missing or malformed field.
Task ParseTask(const nlohmann::json& data);
Task ParseTaskFile(const std::filesystem::path& path);

void ValidateTask(const Task& task);

}  // namespace agentbench::task
