#pragma once

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "utils/logging.hpp"

namespace agentbench::sandbox {

struct ExecRequest {
    std::vector<std::string> argv;
    std::filesystem::path working_dir;
    std::chrono::seconds timeout{60};
    // Time between SIGTERM and SIGKILL once the deadline has passed.
    std::chrono::seconds kill_grace{2};
};

struct ExecResult {
    // Empty when the process was killed instead of exiting.
    std::optional<int> exit_code;
    int term_signal = 0;
    bool timed_out = false;
    std::optional<std::string> spawn_error;
    std::string output;
    std::string error;
    double duration_secs = 0.0;
};

class SandboxExecutor {
public:
    explicit SandboxExecutor(agentbench::utils::Logger& logger);

    // Spawns argv[0] (searched on PATH when it has no slash) in its own
    // process group and drives it on a private io_context until it is reaped.
    ExecResult Run(const ExecRequest& request) const;

private:
    agentbench::utils::Logger& logger_;
};

}  // namespace agentbench::sandbox
