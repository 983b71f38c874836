#pragma once

#include <optional>
#include <string>
#include <vector>

namespace agentbench::cli {

struct CliOptions {
    // list | run | verify | collect | init | help
    std::string command;
    bool debug = false;
    std::optional<std::string> tasks_dir;
    std::optional<std::string> results_dir;
    std::optional<std::string> workspace_dir;

    std::optional<std::string> task_id;
    std::optional<std::string> suite;
    std::optional<std::string> model;
    std::optional<std::string> agent;
    bool no_verify = false;
    std::optional<std::string> workspace;
    std::optional<std::string> output;
    std::optional<std::string> opencode_url;
    std::optional<std::string> default_model;
};

// Parses everything after argv[0]. Global options may appear before or
// after the command. Throws std::invalid_argument on bad usage.
CliOptions ParseArgs(const std::vector<std::string>& args);

std::string Usage();

}  // namespace agentbench::cli
