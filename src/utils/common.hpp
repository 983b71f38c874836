#pragma once

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>
#include <vector>

namespace agentbench::utils {

inline std::string Join(const std::vector<std::string>& items, const std::string& delimiter) {
    std::ostringstream oss;
    for (std::size_t i = 0; i < items.size(); ++i) {
        if (i > 0) {
            oss << delimiter;
        }
        oss << items[i];
    }
    return oss.str();
}

inline std::chrono::system_clock::time_point Now() {
    return std::chrono::system_clock::now();
}

inline std::string ToLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return value;
}

inline std::string Trim(const std::string& value) {
    const auto first = value.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return {};
    }
    const auto last = value.find_last_not_of(" \t\r\n");
    return value.substr(first, last - first + 1);
}

// Formats in UTC with the given strftime pattern.
inline std::string FormatUtc(std::chrono::system_clock::time_point time_point, const char* pattern) {
    const auto time = std::chrono::system_clock::to_time_t(time_point);
    std::tm utc_time{};
    gmtime_r(&time, &utc_time);
    std::ostringstream oss;
    oss << std::put_time(&utc_time, pattern);
    return oss.str();
}

inline std::string FormatIso8601(std::chrono::system_clock::time_point time_point) {
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        time_point.time_since_epoch()).count() % 1000;
    std::ostringstream oss;
    oss << FormatUtc(time_point, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setw(3) << std::setfill('0') << millis << 'Z';
    return oss.str();
}

inline double SecondsSince(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
}

}  // namespace agentbench::utils
