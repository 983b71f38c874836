#include "utils/logging.hpp"

#include <iomanip>
#include <sstream>

namespace agentbench::utils {

Logger::Logger(LogConfig config, std::ostream& out)
    : config_(config)
    , out_(out) {}

void Logger::Log(const LogMessage& message) {
    if (!Enabled(message.level)) {
        return;
    }
    std::ostringstream line;
    if (message.level != LogLevel::kInfo) {
        line << ToString(message.level) << ' ';
    }
    line << '[' << message.tag << "] " << message.message;
    for (const auto& [key, value] : message.fields) {
        line << ' ' << key << '=' << value;
    }
    Write(line.str());
}

void Logger::Debug(const std::string& tag, const std::string& message) {
    Log(LogMessage{LogLevel::kDebug, tag, message, {}});
}

void Logger::Info(const std::string& tag, const std::string& message) {
    Log(LogMessage{LogLevel::kInfo, tag, message, {}});
}

void Logger::Warn(const std::string& tag, const std::string& message) {
    Log(LogMessage{LogLevel::kWarn, tag, message, {}});
}

void Logger::Error(const std::string& tag, const std::string& message) {
    Log(LogMessage{LogLevel::kError, tag, message, {}});
}

void Logger::SetMinLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_.min_level = level;
}

bool Logger::Enabled(LogLevel level) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<int>(level) >= static_cast<int>(config_.min_level);
}

void Logger::TaskHeader(const std::string& task_id, const std::string& title) {
    Write("\n┌─ Task: " + task_id + "\n└─ " + title + "\n");
}

void Logger::TaskResult(bool passed,
                        int score,
                        int iterations,
                        double duration_secs,
                        long long tokens) {
    std::ostringstream block;
    block << '\n' << (passed ? "PASS" : "FAIL") << '\n'
          << "  Score: " << score << "/100\n"
          << "  Iterations: " << iterations << '\n'
          << "  Duration: " << std::fixed << std::setprecision(2) << duration_secs << "s";
    if (tokens > 0) {
        block << "\n  Tokens: " << tokens;
    }
    Write(block.str());
}

void Logger::SuiteSummary(std::size_t total,
                          std::size_t passed,
                          std::size_t failed,
                          double pass_rate,
                          double duration_secs) {
    const std::string rule = "═══════════════════════════════════════";
    std::ostringstream block;
    block << '\n' << rule << '\n'
          << "  Suite Summary\n"
          << rule << '\n'
          << "  Total Tasks: " << total << '\n'
          << "  Passed: " << passed << '\n'
          << "  Failed: " << failed << '\n'
          << "  Pass Rate: " << std::fixed << std::setprecision(1) << pass_rate * 100.0 << "%\n"
          << "  Total Duration: " << std::setprecision(2) << duration_secs << "s\n"
          << rule << '\n';
    Write(block.str());
}

void Logger::Write(const std::string& text) {
    std::lock_guard<std::mutex> lock(mutex_);
    out_ << text << std::endl;
}

}  // namespace agentbench::utils
