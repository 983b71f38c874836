#pragma once

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>

#include "sandbox/sandbox_executor.hpp"
#include "task/task_types.hpp"
#include "utils/logging.hpp"

namespace agentbench::evaluator {

struct VerificationResult {
    bool passed = false;
    // Empty when the process was killed before exiting.
    std::optional<int> exit_code;
    std::string stdout_text;
    std::string stderr_text;
    double duration_secs = 0.0;
};

class Verifier {
public:
    Verifier(agentbench::utils::Logger& logger,
             std::chrono::seconds kill_grace = std::chrono::seconds(2));

    // Throws VerificationError for an empty command, a spawn failure or an
    // elapsed deadline.
    VerificationResult Verify(const agentbench::task::Task& task,
                              const std::filesystem::path& workspace) const;

private:
    agentbench::utils::Logger& logger_;
    agentbench::sandbox::SandboxExecutor executor_;
    std::chrono::seconds kill_grace_;
};

std::string FormatVerificationOutput(const VerificationResult& result);

}  // namespace agentbench::evaluator
