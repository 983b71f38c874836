#pragma once

#include <filesystem>

#include "evaluator/benchmark_result.hpp"
#include "utils/logging.hpp"

namespace agentbench::evaluator {

// Append-only store: one record per task execution.
class ResultSink {
public:
    virtual ~ResultSink() = default;
    virtual void Persist(const BenchmarkResult& result) = 0;
    virtual void PersistSuite(const SuiteSummary& summary) = 0;
};

class JsonResultSink : public ResultSink {
public:
    JsonResultSink(std::filesystem::path results_dir, agentbench::utils::Logger& logger);

    // Throws BenchError when the file cannot be written.
    void Persist(const BenchmarkResult& result) override;
    void PersistSuite(const SuiteSummary& summary) override;

private:
    void WriteJson(const std::filesystem::path& path, const nlohmann::json& data) const;

    std::filesystem::path results_dir_;
    agentbench::utils::Logger& logger_;
};

// <task>_<agent>_<YYYYmmdd_HHMMSS>_<pass|fail>.json
std::string ResultFileName(const BenchmarkResult& result);
// suite_<agent>_<YYYYmmdd_HHMMSS>.json
std::string SuiteFileName(const SuiteSummary& summary);

}  // namespace agentbench::evaluator
