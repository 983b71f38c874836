#pragma once

#include <iostream>
#include <map>
#include <mutex>
#include <ostream>
#include <string>

namespace agentbench::utils {

enum class LogLevel {
    kDebug,
    kInfo,
    kWarn,
    kError
};

inline const char* ToString(LogLevel level) {
    switch (level) {
        case LogLevel::kDebug: return "DEBUG";
        case LogLevel::kInfo: return "INFO";
        case LogLevel::kWarn: return "WARN";
        case LogLevel::kError: return "ERROR";
    }
    return "UNKNOWN";
}

struct LogMessage {
    LogLevel level;
    std::string tag;
    std::string message;
    std::map<std::string, std::string> fields;
};

struct LogConfig {
    LogLevel min_level = LogLevel::kInfo;
};

// Process-wide log sink. Owned by main() and handed down by reference.
class Logger {
public:
    explicit Logger(LogConfig config = {}, std::ostream& out = std::cerr);

    void Log(const LogMessage& message);
    void Debug(const std::string& tag, const std::string& message);
    void Info(const std::string& tag, const std::string& message);
    void Warn(const std::string& tag, const std::string& message);
    void Error(const std::string& tag, const std::string& message);

    void SetMinLevel(LogLevel level);
    bool Enabled(LogLevel level) const;

    // Console report blocks.
    void TaskHeader(const std::string& task_id, const std::string& title);
    void TaskResult(bool passed,
                    int score,
                    int iterations,
                    double duration_secs,
                    long long tokens);
    void SuiteSummary(std::size_t total,
                      std::size_t passed,
                      std::size_t failed,
                      double pass_rate,
                      double duration_secs);

private:
    void Write(const std::string& text);

    LogConfig config_;
    std::ostream& out_;
    mutable std::mutex mutex_;
};

}  // namespace agentbench::utils
