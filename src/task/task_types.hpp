#pragma once

#include <optional>
#include <set>
#include <string>

namespace agentbench::task {

enum class Difficulty {
    Easy,
    Medium,
    Hard
};

enum class PermissionMode {
    AskEachTime,
    AutoApprove,
    BypassChecks
};

struct SourceConfig {
    std::string repository;
    std::string commit;
};

struct VerificationConfig {
    std::string type;
    std::string command;
    int timeout_s = 60;
};

// Advisory configuration for the agent; not enforced by the runner.
struct PermissionsConfig {
    PermissionMode mode = PermissionMode::AskEachTime;
    bool read = true;
    bool write = false;
    bool bash = false;
    bool web_fetch = false;
};

struct Task {
    std::string id;
    std::string title;
    std::string category;
    Difficulty difficulty = Difficulty::Easy;
    SourceConfig source;
    std::string prompt;
    VerificationConfig verification;
    PermissionsConfig permissions;
    std::optional<int> max_iterations;
    std::set<std::string> tags;

    int MaxIterations() const { return max_iterations.value_or(20); }
};

inline const char* ToString(Difficulty difficulty) {
    switch (difficulty) {
        case Difficulty::Easy: return "easy";
        case Difficulty::Medium: return "medium";
        case Difficulty::Hard: return "hard";
    }
    return "easy";
}

inline const char* ToString(PermissionMode mode) {
    switch (mode) {
        case PermissionMode::AskEachTime: return "default";
        case PermissionMode::AutoApprove: return "dontAsk";
        case PermissionMode::BypassChecks: return "bypassPermissions";
    }
    return "default";
}

}  // namespace agentbench::task
