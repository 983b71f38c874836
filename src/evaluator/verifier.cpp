#include "evaluator/verifier.hpp"

#include "errors/bench_error.hpp"
#include "sandbox/command_line.hpp"

namespace agentbench::evaluator {

using agentbench::errors::VerificationError;

Verifier::Verifier(agentbench::utils::Logger& logger, std::chrono::seconds kill_grace)
    : logger_(logger)
    , executor_(logger)
    , kill_grace_(kill_grace) {}

VerificationResult Verifier::Verify(const agentbench::task::Task& task,
                                    const std::filesystem::path& workspace) const {
    auto argv = agentbench::sandbox::SplitCommandLine(task.verification.command);
    if (argv.empty()) {
        throw VerificationError("Empty verification command");
    }

    logger_.Info("verify", "running '" + task.verification.command + "' in " + workspace.string());

    agentbench::sandbox::ExecRequest request{};
    request.argv = std::move(argv);
    request.working_dir = workspace;
    request.timeout = std::chrono::seconds(task.verification.timeout_s);
    request.kill_grace = kill_grace_;

    const auto exec = executor_.Run(request);
    if (exec.spawn_error) {
        throw VerificationError("Failed to execute verification command: " + *exec.spawn_error);
    }
    if (exec.timed_out) {
        throw VerificationError("Verification command timed out after " +
                                std::to_string(task.verification.timeout_s) + " seconds");
    }

    VerificationResult result{};
    result.exit_code = exec.exit_code;
    result.passed = exec.exit_code.has_value() && *exec.exit_code == 0;
    result.stdout_text = exec.output;
    result.stderr_text = exec.error;
    result.duration_secs = exec.duration_secs;

    if (!exec.exit_code) {
        logger_.Warn("verify", "command killed by signal " + std::to_string(exec.term_signal));
    } else {
        logger_.Info("verify", std::string(result.passed ? "passed" : "failed") +
                                   " exit=" + std::to_string(*exec.exit_code));
    }
    return result;
}

std::string FormatVerificationOutput(const VerificationResult& result) {
    return "Exit code: " +
           (result.exit_code ? std::to_string(*result.exit_code) : std::string("null")) +
           "\n\nSTDOUT:\n" + result.stdout_text +
           "\n\nSTDERR:\n" + result.stderr_text;
}

}  // namespace agentbench::evaluator
