#include "cli/cli_options.hpp"

#include <set>
#include <stdexcept>
#include <utility>

namespace agentbench::cli {
namespace {

const std::set<std::string> kCommands = {"list", "run", "verify", "collect", "init", "help"};

// Options each command accepts, besides the global ones.
const std::set<std::string>& AllowedOptions(const std::string& command) {
    static const std::set<std::string> kNone;
    static const std::set<std::string> kRun = {"--task", "--suite", "--model", "--agent", "--no-verify"};
    static const std::set<std::string> kVerify = {"--task", "--workspace"};
    static const std::set<std::string> kCollect = {"--output"};
    static const std::set<std::string> kInit = {"--opencode-url", "--default-model"};
    if (command == "run") {
        return kRun;
    }
    if (command == "verify") {
        return kVerify;
    }
    if (command == "collect") {
        return kCollect;
    }
    if (command == "init") {
        return kInit;
    }
    return kNone;
}

std::string Canonical(const std::string& flag) {
    if (flag == "-t") {
        return "--task";
    }
    if (flag == "-s") {
        return "--suite";
    }
    if (flag == "-m") {
        return "--model";
    }
    if (flag == "-a") {
        return "--agent";
    }
    if (flag == "-w") {
        return "--workspace";
    }
    if (flag == "-o") {
        return "--output";
    }
    return flag;
}

}  // namespace

CliOptions ParseArgs(const std::vector<std::string>& args) {
    CliOptions options{};
    std::vector<std::pair<std::string, std::string>> command_flags;

    for (std::size_t i = 0; i < args.size(); ++i) {
        const auto& arg = args[i];
        if (arg == "-h" || arg == "--help") {
            options.command = "help";
            return options;
        }
        if (arg.empty() || arg.front() != '-') {
            if (!options.command.empty()) {
                throw std::invalid_argument("unexpected argument: " + arg);
            }
            if (kCommands.count(arg) == 0) {
                throw std::invalid_argument("unknown command: " + arg);
            }
            options.command = arg;
            continue;
        }

        std::string flag = arg;
        std::optional<std::string> inline_value;
        const auto eq = arg.find('=');
        if (arg.rfind("--", 0) == 0 && eq != std::string::npos) {
            flag = arg.substr(0, eq);
            inline_value = arg.substr(eq + 1);
        }
        flag = Canonical(flag);

        if (flag == "--debug") {
            options.debug = true;
            continue;
        }
        if (flag == "--no-verify") {
            command_flags.emplace_back(flag, "");
            continue;
        }

        std::string value;
        if (inline_value) {
            value = *inline_value;
        } else {
            if (i + 1 >= args.size()) {
                throw std::invalid_argument("missing value for " + flag);
            }
            value = args[++i];
        }

        if (flag == "--tasks-dir") {
            options.tasks_dir = value;
        } else if (flag == "--results-dir") {
            options.results_dir = value;
        } else if (flag == "--workspace-dir") {
            options.workspace_dir = value;
        } else {
            command_flags.emplace_back(flag, value);
        }
    }

    if (options.command.empty()) {
        throw std::invalid_argument("missing command");
    }

    const auto& allowed = AllowedOptions(options.command);
    for (const auto& [flag, value] : command_flags) {
        if (allowed.count(flag) == 0) {
            throw std::invalid_argument("unknown option for " + options.command + ": " + flag);
        }
        if (flag == "--task") {
            options.task_id = value;
        } else if (flag == "--suite") {
            options.suite = value;
        } else if (flag == "--model") {
            options.model = value;
        } else if (flag == "--agent") {
            options.agent = value;
        } else if (flag == "--no-verify") {
            options.no_verify = true;
        } else if (flag == "--workspace") {
            options.workspace = value;
        } else if (flag == "--output") {
            options.output = value;
        } else if (flag == "--opencode-url") {
            options.opencode_url = value;
        } else if (flag == "--default-model") {
            options.default_model = value;
        }
    }

    if (options.command == "run" && options.task_id.has_value() == options.suite.has_value()) {
        throw std::invalid_argument("run needs exactly one of --task or --suite");
    }
    if (options.command == "verify" && (!options.task_id || !options.workspace)) {
        throw std::invalid_argument("verify needs --task and --workspace");
    }
    return options;
}

std::string Usage() {
    return "Usage: agentbench [--debug] [--tasks-dir P] [--results-dir P] [--workspace-dir P] <command>\n"
           "\n"
           "Commands:\n"
           "  list                                   List available tasks\n"
           "  run (--task ID | --suite all|CATEGORY) [--model PROVIDER/MODEL]\n"
           "      [--agent opencode|claude] [--no-verify]\n"
           "  verify --task ID --workspace PATH      Run a task's verification in a workspace\n"
           "  collect [-o PATH]                      Export results to CSV\n"
           "  init [--opencode-url URL] [--default-model M] [--tasks-dir P] [--results-dir P] [--workspace-dir P]\n";
}

}  // namespace agentbench::cli
