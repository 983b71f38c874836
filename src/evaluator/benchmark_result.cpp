#include "evaluator/benchmark_result.hpp"

#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <utility>

#include "errors/bench_error.hpp"
#include "utils/common.hpp"

namespace agentbench::evaluator {
namespace {

template <typename T>
nlohmann::json Nullable(const std::optional<T>& value) {
    if (!value) {
        return nullptr;
    }
    return *value;
}

const nlohmann::json& Required(const nlohmann::json& data, const char* key) {
    if (!data.contains(key) || data[key].is_null()) {
        throw errors::BenchError(std::string("Invalid result record: missing ") + key);
    }
    return data[key];
}

template <typename T>
std::optional<T> Optional(const nlohmann::json& data, const char* key) {
    if (!data.contains(key) || data[key].is_null()) {
        return std::nullopt;
    }
    return data[key].get<T>();
}

}  // namespace

SuiteSummary SuiteSummary::FromResults(std::string agent, std::vector<BenchmarkResult> results) {
    SuiteSummary summary{};
    summary.agent = std::move(agent);
    summary.timestamp = utils::Now();
    summary.total = results.size();
    for (const auto& result : results) {
        if (result.success) {
            ++summary.passed;
        }
        summary.total_duration_secs += result.duration_secs;
    }
    summary.failed = summary.total - summary.passed;
    summary.pass_rate = summary.total > 0
        ? static_cast<double>(summary.passed) / static_cast<double>(summary.total)
        : 0.0;
    summary.results = std::move(results);
    return summary;
}

nlohmann::json ToJson(const BenchmarkResult& result) {
    return nlohmann::json{
        {"task_id", result.task_id},
        {"agent", result.agent},
        {"agent_version", result.agent_version},
        {"model_name", result.model_name},
        {"timestamp", utils::FormatIso8601(result.timestamp)},
        {"success", result.success},
        {"score", result.score},
        {"iterations", result.iterations},
        {"duration_secs", result.duration_secs},
        {"tokens_used", Nullable(result.tokens_used)},
        {"cost", Nullable(result.cost)},
        {"error", Nullable(result.error)},
        {"agent_output", Nullable(result.agent_output)},
        {"verification_output", Nullable(result.verification_output)}
    };
}

BenchmarkResult BenchmarkResultFromJson(const nlohmann::json& data) {
    if (!data.is_object()) {
        throw errors::BenchError("Invalid result record: not an object");
    }
    try {
        BenchmarkResult result{};
        result.task_id = Required(data, "task_id").get<std::string>();
        result.agent = Required(data, "agent").get<std::string>();
        result.agent_version = Optional<std::string>(data, "agent_version").value_or("");
        result.model_name = Optional<std::string>(data, "model_name").value_or("");
        const auto timestamp = ParseIso8601(Required(data, "timestamp").get<std::string>());
        if (!timestamp) {
            throw errors::BenchError("Invalid result record: bad timestamp");
        }
        result.timestamp = *timestamp;
        result.success = Required(data, "success").get<bool>();
        result.score = Required(data, "score").get<int>();
        result.iterations = Optional<int>(data, "iterations").value_or(0);
        result.duration_secs = Optional<double>(data, "duration_secs").value_or(0.0);
        result.tokens_used = Optional<long long>(data, "tokens_used");
        result.cost = Optional<double>(data, "cost");
        result.error = Optional<std::string>(data, "error");
        result.agent_output = Optional<std::string>(data, "agent_output");
        result.verification_output = Optional<std::string>(data, "verification_output");
        return result;
    } catch (const nlohmann::json::type_error& ex) {
        throw errors::BenchError(std::string("Invalid result record: ") + ex.what());
    }
}

nlohmann::json ToJson(const SuiteSummary& summary) {
    nlohmann::json results = nlohmann::json::array();
    for (const auto& result : summary.results) {
        results.push_back(ToJson(result));
    }
    return nlohmann::json{
        {"agent", summary.agent},
        {"timestamp", utils::FormatIso8601(summary.timestamp)},
        {"total_tasks", summary.total},
        {"passed", summary.passed},
        {"failed", summary.failed},
        {"pass_rate", summary.pass_rate},
        {"total_duration_secs", summary.total_duration_secs},
        {"results", results}
    };
}

std::optional<std::chrono::system_clock::time_point> ParseIso8601(const std::string& text) {
    std::tm utc_time{};
    std::istringstream input(text);
    input >> std::get_time(&utc_time, "%Y-%m-%dT%H:%M:%S");
    if (input.fail()) {
        return std::nullopt;
    }
    auto time_point = std::chrono::system_clock::from_time_t(timegm(&utc_time));

    if (input.peek() == '.') {
        input.get();
        std::string digits;
        while (std::isdigit(input.peek())) {
            digits.push_back(static_cast<char>(input.get()));
        }
        digits = digits.substr(0, 3);
        while (digits.size() < 3) {
            digits.push_back('0');
        }
        time_point += std::chrono::milliseconds(std::stoi(digits));
    }
    return time_point;
}

}  // namespace agentbench::evaluator
