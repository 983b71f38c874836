#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <unistd.h>
#include "evaluator/benchmark_result.hpp"
#include "evaluator/result_sink.hpp"
#include "utils/logging.hpp"

namespace {

using agentbench::evaluator::BenchmarkResult;
using agentbench::evaluator::JsonResultSink;
using agentbench::evaluator::ParseIso8601;
using agentbench::evaluator::ResultFileName;
using agentbench::evaluator::SuiteFileName;
using agentbench::evaluator::SuiteSummary;
using agentbench::utils::Logger;
using nlohmann::json;

class TempWorkspace {
public:
    TempWorkspace() {
        static int counter = 0;
        root_ = std::filesystem::temp_directory_path() /
                ("agentbench_results_" + std::to_string(::getpid()) + "_" + std::to_string(counter++));
    }

    ~TempWorkspace() {
        std::error_code ec;
        std::filesystem::remove_all(root_, ec);
    }

    const std::filesystem::path& root() const { return root_; }

private:
    std::filesystem::path root_;
};

BenchmarkResult MakeResult(bool success) {
    BenchmarkResult result;
    result.task_id = "fix-parser";
    result.agent = "opencode";
    result.timestamp = *ParseIso8601("2026-05-06T07:08:09.000Z");
    result.success = success;
    result.score = success ? 100 : 0;
    return result;
}

json ReadJson(const std::filesystem::path& path) {
    std::ifstream in(path);
    return json::parse(in);
}

TEST(ResultSinkTest, FileNamesEncodeTaskAgentTimeAndOutcome) {
    EXPECT_EQ(ResultFileName(MakeResult(true)), "fix-parser_opencode_20260506_070809_pass.json");
    EXPECT_EQ(ResultFileName(MakeResult(false)), "fix-parser_opencode_20260506_070809_fail.json");

    SuiteSummary summary;
    summary.agent = "opencode";
    summary.timestamp = *ParseIso8601("2026-05-06T07:08:09.000Z");
    EXPECT_EQ(SuiteFileName(summary), "suite_opencode_20260506_070809.json");
}

TEST(ResultSinkTest, PersistCreatesDirectoryAndWritesRecord) {
    TempWorkspace workspace;
    std::ostringstream sink;
    Logger logger({}, sink);
    JsonResultSink results(workspace.root() / "nested", logger);

    results.Persist(MakeResult(true));
    const auto path = workspace.root() / "nested" / "fix-parser_opencode_20260506_070809_pass.json";
    ASSERT_TRUE(std::filesystem::exists(path));
    const auto data = ReadJson(path);
    EXPECT_EQ(data["task_id"], "fix-parser");
    EXPECT_EQ(data["success"], true);
    EXPECT_EQ(data["timestamp"], "2026-05-06T07:08:09.000Z");
}

TEST(ResultSinkTest, PassAndFailRecordsCoexist) {
    TempWorkspace workspace;
    std::ostringstream sink;
    Logger logger({}, sink);
    JsonResultSink results(workspace.root(), logger);

    results.Persist(MakeResult(true));
    results.Persist(MakeResult(false));
    std::size_t files = 0;
    for (const auto& entry : std::filesystem::directory_iterator(workspace.root())) {
        (void)entry;
        ++files;
    }
    EXPECT_EQ(files, 2u);
}

TEST(ResultSinkTest, PersistSuiteWritesAggregate) {
    TempWorkspace workspace;
    std::ostringstream sink;
    Logger logger({}, sink);
    JsonResultSink results(workspace.root(), logger);

    auto summary = SuiteSummary::FromResults("opencode", {MakeResult(true), MakeResult(false)});
    summary.timestamp = *ParseIso8601("2026-05-06T07:08:09.000Z");
    results.PersistSuite(summary);

    const auto data = ReadJson(workspace.root() / "suite_opencode_20260506_070809.json");
    EXPECT_EQ(data["total_tasks"], 2);
    EXPECT_EQ(data["passed"], 1);
    EXPECT_EQ(data["failed"], 1);
    EXPECT_DOUBLE_EQ(data["pass_rate"].get<double>(), 0.5);
    EXPECT_EQ(data["results"].size(), 2u);
}

}  // namespace
