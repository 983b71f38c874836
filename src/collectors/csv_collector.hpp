#pragma once

#include <filesystem>
#include <ostream>
#include <vector>

#include "evaluator/benchmark_result.hpp"
#include "utils/logging.hpp"

namespace agentbench::collectors {

// Loads every per-task record in `results_dir` (suite files excluded),
// oldest first. Unreadable files are logged and skipped.
std::vector<agentbench::evaluator::BenchmarkResult> CollectResults(
    const std::filesystem::path& results_dir,
    agentbench::utils::Logger& logger);

void WriteCsv(const std::vector<agentbench::evaluator::BenchmarkResult>& results, std::ostream& out);

// Returns the number of rows written. Throws BenchError when the output
// file cannot be opened.
std::size_t CollectToCsv(const std::filesystem::path& results_dir,
                         const std::filesystem::path& output_path,
                         agentbench::utils::Logger& logger);

std::string CsvEscape(const std::string& field);

}  // namespace agentbench::collectors
