#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <unistd.h>
#include "collectors/csv_collector.hpp"
#include "errors/bench_error.hpp"
#include "evaluator/benchmark_result.hpp"
#include "utils/logging.hpp"

namespace {

using agentbench::collectors::CollectResults;
using agentbench::collectors::CollectToCsv;
using agentbench::collectors::CsvEscape;
using agentbench::collectors::WriteCsv;
using agentbench::errors::BenchError;
using agentbench::evaluator::BenchmarkResult;
using agentbench::evaluator::ParseIso8601;
using agentbench::evaluator::ToJson;
using agentbench::utils::Logger;

class TempWorkspace {
public:
    TempWorkspace() {
        static int counter = 0;
        root_ = std::filesystem::temp_directory_path() /
                ("agentbench_collect_" + std::to_string(::getpid()) + "_" + std::to_string(counter++));
        std::filesystem::create_directories(root_);
    }

    ~TempWorkspace() {
        std::error_code ec;
        std::filesystem::remove_all(root_, ec);
    }

    const std::filesystem::path& root() const { return root_; }

private:
    std::filesystem::path root_;
};

BenchmarkResult MakeResult(const std::string& id, const std::string& timestamp) {
    BenchmarkResult result;
    result.task_id = id;
    result.agent = "opencode";
    result.agent_version = "opencode-http/1";
    result.model_name = "anthropic/claude-sonnet-4-5";
    result.timestamp = *ParseIso8601(timestamp);
    result.success = true;
    result.score = 100;
    result.iterations = 3;
    result.duration_secs = 12.5;
    result.tokens_used = 900;
    return result;
}

void WriteRecord(const std::filesystem::path& path, const BenchmarkResult& result) {
    std::ofstream out(path);
    out << ToJson(result).dump(2);
}

std::vector<std::string> Lines(const std::string& text) {
    std::vector<std::string> lines;
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) {
        lines.push_back(line);
    }
    return lines;
}

TEST(CsvCollectorTest, EscapesOnlyWhenNeeded) {
    EXPECT_EQ(CsvEscape("plain"), "plain");
    EXPECT_EQ(CsvEscape("a,b"), "\"a,b\"");
    EXPECT_EQ(CsvEscape("say \"hi\""), "\"say \"\"hi\"\"\"");
    EXPECT_EQ(CsvEscape("two\nlines"), "\"two\nlines\"");
}

TEST(CsvCollectorTest, WritesHeaderAndRows) {
    auto failed = MakeResult("b", "2026-01-01T00:00:00.000Z");
    failed.success = false;
    failed.score = 0;
    failed.tokens_used.reset();
    failed.error = std::string(150, 'x');

    std::ostringstream out;
    WriteCsv({MakeResult("a", "2026-01-01T00:00:00.000Z"), failed}, out);
    const auto lines = Lines(out.str());
    ASSERT_EQ(lines.size(), 3u);
    EXPECT_EQ(lines[0],
              "task_id,agent,agent_version,model_name,timestamp,success,score,iterations,duration_secs,tokens_used,error");
    EXPECT_EQ(lines[1],
              "a,opencode,opencode-http/1,anthropic/claude-sonnet-4-5,2026-01-01T00:00:00.000Z,true,100,3,12.50,900,");
    EXPECT_EQ(lines[2],
              "b,opencode,opencode-http/1,anthropic/claude-sonnet-4-5,2026-01-01T00:00:00.000Z,false,0,3,12.50,," +
                  std::string(100, 'x'));
}

TEST(CsvCollectorTest, CollectsRecordsOldestFirstAndSkipsSuitesAndJunk) {
    TempWorkspace workspace;
    WriteRecord(workspace.root() / "a_late.json", MakeResult("late", "2026-02-01T00:00:00.000Z"));
    WriteRecord(workspace.root() / "z_early.json", MakeResult("early", "2026-01-01T00:00:00.000Z"));
    std::ofstream(workspace.root() / "suite_opencode_1.json") << R"({"total_tasks": 2})";
    std::ofstream(workspace.root() / "broken.json") << "{";
    std::ofstream(workspace.root() / "readme.txt") << "ignore";

    std::ostringstream sink;
    Logger logger({}, sink);
    const auto results = CollectResults(workspace.root(), logger);
    ASSERT_EQ(results.size(), 2u);
    EXPECT_EQ(results[0].task_id, "early");
    EXPECT_EQ(results[1].task_id, "late");
    EXPECT_NE(sink.str().find("broken.json"), std::string::npos);
    EXPECT_EQ(sink.str().find("suite_opencode_1.json"), std::string::npos);
}

TEST(CsvCollectorTest, CollectToCsvWritesFile) {
    TempWorkspace workspace;
    WriteRecord(workspace.root() / "one.json", MakeResult("one", "2026-01-01T00:00:00.000Z"));
    const auto output = workspace.root() / "summary.csv";

    std::ostringstream sink;
    Logger logger({}, sink);
    EXPECT_EQ(CollectToCsv(workspace.root(), output, logger), 1u);

    std::ifstream in(output);
    std::stringstream buffer;
    buffer << in.rdbuf();
    EXPECT_EQ(Lines(buffer.str()).size(), 2u);
}

TEST(CsvCollectorTest, NothingToCollectWritesNothing) {
    TempWorkspace workspace;
    const auto output = workspace.root() / "summary.csv";
    std::ostringstream sink;
    Logger logger({}, sink);

    EXPECT_EQ(CollectToCsv(workspace.root() / "missing", output, logger), 0u);
    EXPECT_FALSE(std::filesystem::exists(output));
}

TEST(CsvCollectorTest, UnwritableOutputThrows) {
    TempWorkspace workspace;
    WriteRecord(workspace.root() / "one.json", MakeResult("one", "2026-01-01T00:00:00.000Z"));
    std::ostringstream sink;
    Logger logger({}, sink);

    EXPECT_THROW(CollectToCsv(workspace.root(), workspace.root() / "no" / "dir" / "out.csv", logger), BenchError);
}

}  // namespace
