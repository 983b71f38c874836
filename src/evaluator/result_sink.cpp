#include "evaluator/result_sink.hpp"

#include <fstream>
#include <system_error>
#include <utility>

#include "errors/bench_error.hpp"
#include "utils/common.hpp"

namespace agentbench::evaluator {

std::string ResultFileName(const BenchmarkResult& result) {
    return result.task_id + "_" + result.agent + "_" +
           utils::FormatUtc(result.timestamp, "%Y%m%d_%H%M%S") + "_" +
           (result.success ? "pass" : "fail") + ".json";
}

std::string SuiteFileName(const SuiteSummary& summary) {
    return "suite_" + summary.agent + "_" + utils::FormatUtc(summary.timestamp, "%Y%m%d_%H%M%S") + ".json";
}

JsonResultSink::JsonResultSink(std::filesystem::path results_dir, agentbench::utils::Logger& logger)
    : results_dir_(std::move(results_dir))
    , logger_(logger) {}

void JsonResultSink::Persist(const BenchmarkResult& result) {
    const auto path = results_dir_ / ResultFileName(result);
    WriteJson(path, ToJson(result));
    logger_.Info("results", "saved " + path.string());
}

void JsonResultSink::PersistSuite(const SuiteSummary& summary) {
    const auto path = results_dir_ / SuiteFileName(summary);
    WriteJson(path, ToJson(summary));
    logger_.Info("results", "suite results saved to " + path.string());
}

void JsonResultSink::WriteJson(const std::filesystem::path& path, const nlohmann::json& data) const {
    std::error_code ec;
    std::filesystem::create_directories(results_dir_, ec);
    if (ec) {
        throw errors::BenchError("Failed to create results directory " + results_dir_.string() + ": " + ec.message());
    }
    std::ofstream output(path);
    if (!output.is_open()) {
        throw errors::BenchError("Failed to write result file " + path.string());
    }
    output << data.dump(2) << "\n";
}

}  // namespace agentbench::evaluator
