#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include "nlohmann/json.hpp"

namespace agentbench::evaluator {

// Persisted outcome of one task execution.
struct BenchmarkResult {
    std::string task_id;
    std::string agent;
    std::string agent_version;
    std::string model_name;
    std::chrono::system_clock::time_point timestamp;
    bool success = false;
    int score = 0;
    int iterations = 0;
    double duration_secs = 0.0;
    std::optional<long long> tokens_used;
    std::optional<double> cost;
    std::optional<std::string> error;
    std::optional<std::string> agent_output;
    std::optional<std::string> verification_output;
};

struct SuiteSummary {
    std::string agent;
    std::chrono::system_clock::time_point timestamp;
    std::size_t total = 0;
    std::size_t passed = 0;
    std::size_t failed = 0;
    // 0.0 - 1.0
    double pass_rate = 0.0;
    double total_duration_secs = 0.0;
    std::vector<BenchmarkResult> results;

    static SuiteSummary FromResults(std::string agent, std::vector<BenchmarkResult> results);
};

nlohmann::json ToJson(const BenchmarkResult& result);
// Throws BenchError on a missing or mistyped required field.
BenchmarkResult BenchmarkResultFromJson(const nlohmann::json& data);
nlohmann::json ToJson(const SuiteSummary& summary);

// "2026-01-02T03:04:05.678Z" back to a time point.
std::optional<std::chrono::system_clock::time_point> ParseIso8601(const std::string& text);

}  // namespace agentbench::evaluator
