#include "task/task_parser.hpp"

#include <fstream>
#include <sstream>

#include "errors/bench_error.hpp"

namespace agentbench::task {
namespace {

using agentbench::errors::InvalidTaskFormatError;
using agentbench::errors::TaskLoadError;

std::string GetString(const nlohmann::json& data, const char* key) {
    if (!data.contains(key)) {
        return {};
    }
    if (!data[key].is_string()) {
        throw InvalidTaskFormatError(std::string("field '") + key + "' must be a string");
    }
    return data[key].get<std::string>();
}

bool GetBool(const nlohmann::json& data, const char* key, bool fallback) {
    if (!data.contains(key)) {
        return fallback;
    }
    if (!data[key].is_boolean()) {
        throw InvalidTaskFormatError(std::string("field '") + key + "' must be a boolean");
    }
    return data[key].get<bool>();
}

const nlohmann::json& GetObject(const nlohmann::json& data, const char* key) {
    static const nlohmann::json kEmpty = nlohmann::json::object();
    if (!data.contains(key) || data[key].is_null()) {
        return kEmpty;
    }
    if (!data[key].is_object()) {
        throw InvalidTaskFormatError(std::string("field '") + key + "' must be an object");
    }
    return data[key];
}

Difficulty ParseDifficulty(const std::string& value) {
    if (value == "easy") {
        return Difficulty::Easy;
    }
    if (value == "medium") {
        return Difficulty::Medium;
    }
    if (value == "hard") {
        return Difficulty::Hard;
    }
    throw InvalidTaskFormatError("unknown difficulty '" + value + "'");
}

PermissionMode ParsePermissionMode(const std::string& value) {
    if (value.empty() || value == "default") {
        return PermissionMode::AskEachTime;
    }
    if (value == "dontAsk" || value == "acceptEdits") {
        return PermissionMode::AutoApprove;
    }
    if (value == "bypassPermissions") {
        return PermissionMode::BypassChecks;
    }
    throw InvalidTaskFormatError("unknown permission mode '" + value + "'");
}

}  // namespace

Task ParseTask(const nlohmann::json& data) {
    if (!data.is_object()) {
        throw InvalidTaskFormatError("task definition must be an object");
    }

    Task task{};
    task.id = GetString(data, "id");
    task.title = GetString(data, "title");
    task.category = GetString(data, "category");
    task.difficulty = ParseDifficulty(GetString(data, "difficulty"));
    task.prompt = GetString(data, "prompt");

    const auto& source = GetObject(data, "source");
    task.source.repository = GetString(source, "repository");
    task.source.commit = GetString(source, "commit");

    const auto& verification = GetObject(data, "verification");
    task.verification.type = GetString(verification, "type");
    task.verification.command = GetString(verification, "command");
    if (verification.contains("timeout")) {
        if (!verification["timeout"].is_number_integer() || verification["timeout"].get<int>() <= 0) {
            throw InvalidTaskFormatError("verification timeout must be a positive integer");
        }
        task.verification.timeout_s = verification["timeout"].get<int>();
    }

    const auto& permissions = GetObject(data, "permissions");
    task.permissions.mode = ParsePermissionMode(GetString(permissions, "mode"));
    task.permissions.read = GetBool(permissions, "read", true);
    task.permissions.write = GetBool(permissions, "write", false);
    task.permissions.bash = GetBool(permissions, "bash", false);
    task.permissions.web_fetch = GetBool(permissions, "web_fetch", false);

    if (data.contains("max_iterations") && !data["max_iterations"].is_null()) {
        if (!data["max_iterations"].is_number_integer()) {
            throw InvalidTaskFormatError("max_iterations must be an integer");
        }
        task.max_iterations = data["max_iterations"].get<int>();
    }

    const auto& metadata = GetObject(data, "metadata");
    if (metadata.contains("tags") && metadata["tags"].is_array()) {
        for (const auto& tag : metadata["tags"]) {
            if (tag.is_string()) {
                task.tags.insert(tag.get<std::string>());
            }
        }
    }

    ValidateTask(task);
    return task;
}

Task ParseTaskFile(const std::filesystem::path& path) {
    std::ifstream input(path);
    if (!input.is_open()) {
        throw TaskLoadError("failed to read " + path.string());
    }
    std::stringstream buffer;
    buffer << input.rdbuf();

    auto data = nlohmann::json::parse(buffer.str(), nullptr, false);
    if (data.is_discarded()) {
        throw InvalidTaskFormatError(path.string() + " is not valid JSON");
    }
    return ParseTask(data);
}

void ValidateTask(const Task& task) {
    if (task.id.empty()) {
        throw InvalidTaskFormatError("Task ID cannot be empty");
    }
    if (task.title.empty()) {
        throw InvalidTaskFormatError("Task title cannot be empty");
    }
    if (task.prompt.empty()) {
        throw InvalidTaskFormatError("Task prompt cannot be empty");
    }
    if (task.source.repository.empty()) {
        throw InvalidTaskFormatError("Source repository cannot be empty");
    }
    if (task.source.commit.empty()) {
        throw InvalidTaskFormatError("Source commit cannot be empty");
    }
    if (task.verification.command.empty()) {
        throw InvalidTaskFormatError("Verification command cannot be empty");
    }
}

}  // namespace agentbench::task
