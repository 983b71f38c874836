#include "agent/opencode_server.hpp"

#include <fstream>
#include <sstream>
#include <system_error>
#include <thread>
#include <utility>
#include <vector>

#include <boost/process.hpp>
#include <boost/process/extend.hpp>
#include <signal.h>
#include <unistd.h>

#include "errors/bench_error.hpp"
#include "utils/common.hpp"

namespace agentbench::agent {
namespace bp = boost::process;

namespace {
constexpr const char* kListeningBanner = "opencode server listening on ";
constexpr auto kPollInterval = std::chrono::milliseconds(100);
}  // namespace

std::string FindListeningUrl(const std::string& output) {
    const auto pos = output.find(kListeningBanner);
    if (pos == std::string::npos) {
        return {};
    }
    const auto start = pos + std::char_traits<char>::length(kListeningBanner);
    const auto end = output.find('\n', start);
    if (end == std::string::npos) {
        // Banner line not complete yet.
        return {};
    }
    return utils::Trim(output.substr(start, end - start));
}

OpencodeServer::OpencodeServer(ServerOptions options, agentbench::utils::Logger& logger)
    : options_(std::move(options))
    , logger_(logger) {}

OpencodeServer::~OpencodeServer() {
    Stop();
}

std::string OpencodeServer::Start(const std::filesystem::path& workspace) {
    using agentbench::errors::AgentError;

    std::string program = options_.command;
    if (program.find('/') == std::string::npos) {
        program = bp::search_path(options_.command).string();
    }
    if (program.empty()) {
        throw AgentError("Failed to start opencode server: command not found: " + options_.command);
    }

    const auto stamp = std::to_string(
        std::chrono::steady_clock::now().time_since_epoch().count());
    stdout_path_ = std::filesystem::temp_directory_path() / ("agentbench_opencode_stdout_" + stamp + ".log");
    stderr_path_ = std::filesystem::temp_directory_path() / ("agentbench_opencode_stderr_" + stamp + ".log");

    const std::vector<std::string> args = {
        "serve",
        "--hostname", options_.hostname,
        "--port", std::to_string(options_.port)
    };
    logger_.Info("opencode", "starting server for " + workspace.string());

    std::error_code ec;
    child_ = std::make_unique<bp::child>(
        bp::exe = program,
        bp::args = args,
        bp::start_dir = workspace.string(),
        bp::std_in.close(),
        bp::std_out > stdout_path_.string(),
        bp::std_err > stderr_path_.string(),
        bp::extend::on_exec_setup([](auto&) { ::setpgid(0, 0); }),
        ec);
    if (ec) {
        child_.reset();
        RemoveLogs();
        throw AgentError("Failed to start opencode server: " + ec.message());
    }

    const auto deadline = std::chrono::steady_clock::now() + options_.startup_timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        const auto url = FindListeningUrl(ReadFile(stdout_path_));
        if (!url.empty()) {
            logger_.Info("opencode", "server listening on " + url);
            return url;
        }
        if (!Running()) {
            const auto details = utils::Trim(ReadFile(stderr_path_));
            Stop();
            throw AgentError("opencode server exited during startup" +
                             (details.empty() ? std::string() : ": " + details));
        }
        std::this_thread::sleep_for(kPollInterval);
    }

    Stop();
    throw AgentError("opencode server did not start within " +
                     std::to_string(options_.startup_timeout.count()) + " seconds");
}

bool OpencodeServer::Running() const {
    if (!child_) {
        return false;
    }
    std::error_code ec;
    return child_->running(ec) && !ec;
}

void OpencodeServer::Stop() {
    if (!child_) {
        RemoveLogs();
        return;
    }
    std::error_code ec;
    if (Running()) {
        const pid_t group = child_->id();
        logger_.Debug("opencode", "stopping server group " + std::to_string(group));
        ::killpg(group, SIGTERM);
        const auto grace_deadline = std::chrono::steady_clock::now() + options_.kill_grace;
        while (Running() && std::chrono::steady_clock::now() < grace_deadline) {
            std::this_thread::sleep_for(kPollInterval);
        }
        if (Running()) {
            logger_.Warn("opencode", "server ignored SIGTERM, sending SIGKILL");
            ::killpg(group, SIGKILL);
        }
        child_->wait(ec);
    }
    child_.reset();
    RemoveLogs();
}

std::string OpencodeServer::ReadFile(const std::filesystem::path& path) const {
    std::ifstream input(path);
    if (!input.is_open()) {
        return {};
    }
    std::ostringstream buffer;
    buffer << input.rdbuf();
    return buffer.str();
}

void OpencodeServer::RemoveLogs() {
    std::error_code ec;
    if (!stdout_path_.empty()) {
        std::filesystem::remove(stdout_path_, ec);
    }
    if (!stderr_path_.empty()) {
        std::filesystem::remove(stderr_path_, ec);
    }
    stdout_path_.clear();
    stderr_path_.clear();
}

}  // namespace agentbench::agent
