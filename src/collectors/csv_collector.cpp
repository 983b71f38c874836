#include "collectors/csv_collector.hpp"

#include <algorithm>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <system_error>

#include "errors/bench_error.hpp"
#include "utils/common.hpp"

namespace agentbench::collectors {
namespace {

constexpr std::size_t kMaxErrorLength = 100;

std::string FormatDuration(double seconds) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << seconds;
    return oss.str();
}

}  // namespace

std::string CsvEscape(const std::string& field) {
    if (field.find_first_of(",\"\r\n") == std::string::npos) {
        return field;
    }
    std::string escaped = "\"";
    for (char c : field) {
        if (c == '"') {
            escaped.push_back('"');
        }
        escaped.push_back(c);
    }
    escaped.push_back('"');
    return escaped;
}

std::vector<agentbench::evaluator::BenchmarkResult> CollectResults(
    const std::filesystem::path& results_dir,
    agentbench::utils::Logger& logger) {
    std::vector<agentbench::evaluator::BenchmarkResult> results;
    std::error_code ec;
    if (!std::filesystem::is_directory(results_dir, ec)) {
        logger.Warn("collect", "results directory not found: " + results_dir.string());
        return results;
    }

    std::vector<std::filesystem::path> files;
    for (const auto& entry : std::filesystem::directory_iterator(results_dir, ec)) {
        const auto name = entry.path().filename().string();
        if (entry.is_regular_file() && entry.path().extension() == ".json" && name.rfind("suite_", 0) != 0) {
            files.push_back(entry.path());
        }
    }
    std::sort(files.begin(), files.end());

    for (const auto& file : files) {
        std::ifstream input(file);
        const auto data = nlohmann::json::parse(input, nullptr, false);
        if (data.is_discarded()) {
            logger.Warn("collect", "failed to load " + file.filename().string() + ": malformed JSON");
            continue;
        }
        try {
            results.push_back(agentbench::evaluator::BenchmarkResultFromJson(data));
        } catch (const agentbench::errors::BenchError& ex) {
            logger.Warn("collect", "failed to load " + file.filename().string() + ": " + ex.what());
        }
    }

    std::stable_sort(results.begin(), results.end(), [](const auto& lhs, const auto& rhs) {
        return lhs.timestamp < rhs.timestamp;
    });
    return results;
}

void WriteCsv(const std::vector<agentbench::evaluator::BenchmarkResult>& results, std::ostream& out) {
    out << "task_id,agent,agent_version,model_name,timestamp,success,score,iterations,duration_secs,tokens_used,error\n";
    for (const auto& result : results) {
        const auto error = result.error ? result.error->substr(0, kMaxErrorLength) : std::string();
        out << CsvEscape(result.task_id) << ','
            << CsvEscape(result.agent) << ','
            << CsvEscape(result.agent_version) << ','
            << CsvEscape(result.model_name) << ','
            << utils::FormatIso8601(result.timestamp) << ','
            << (result.success ? "true" : "false") << ','
            << result.score << ','
            << result.iterations << ','
            << FormatDuration(result.duration_secs) << ','
            << (result.tokens_used ? std::to_string(*result.tokens_used) : std::string()) << ','
            << CsvEscape(error) << '\n';
    }
}

std::size_t CollectToCsv(const std::filesystem::path& results_dir,
                         const std::filesystem::path& output_path,
                         agentbench::utils::Logger& logger) {
    logger.Info("collect", "collecting results from " + results_dir.string());
    const auto results = CollectResults(results_dir, logger);
    logger.Info("collect", "found " + std::to_string(results.size()) + " result files");
    if (results.empty()) {
        logger.Warn("collect", "no results to write");
        return 0;
    }

    std::ofstream output(output_path);
    if (!output.is_open()) {
        throw agentbench::errors::BenchError("Failed to open " + output_path.string() + " for writing");
    }
    WriteCsv(results, output);
    logger.Info("collect", "wrote " + std::to_string(results.size()) + " results to " + output_path.string());
    return results.size();
}

}  // namespace agentbench::collectors
