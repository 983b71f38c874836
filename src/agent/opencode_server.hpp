#pragma once

#include <chrono>
#include <filesystem>
#include <memory>
#include <string>

#include <boost/process/child.hpp>

#include "utils/logging.hpp"

namespace agentbench::agent {

struct ServerOptions {
    std::string command = "opencode";
    std::string hostname = "127.0.0.1";
    // Zero lets the server pick a free port.
    int port = 0;
    std::chrono::seconds startup_timeout{10};
    std::chrono::seconds kill_grace{2};
};

// A `opencode serve` process scoped to one workspace.
class OpencodeServer {
public:
    OpencodeServer(ServerOptions options, agentbench::utils::Logger& logger);
    ~OpencodeServer();

    OpencodeServer(const OpencodeServer&) = delete;
    OpencodeServer& operator=(const OpencodeServer&) = delete;

    // Launches the server and waits for its listening banner. Returns the
    // announced base url; throws AgentError on failure or timeout.
    std::string Start(const std::filesystem::path& workspace);
    // SIGTERM to the process group, SIGKILL after the grace period.
    void Stop();
    bool Running() const;

private:
    std::string ReadFile(const std::filesystem::path& path) const;
    void RemoveLogs();

    ServerOptions options_;
    agentbench::utils::Logger& logger_;
    std::unique_ptr<boost::process::child> child_;
    std::filesystem::path stdout_path_;
    std::filesystem::path stderr_path_;
};

// Extracts the url from "opencode server listening on <url>" in the
// server's stdout, or an empty string when the banner is not there yet.
std::string FindListeningUrl(const std::string& output);

}  // namespace agentbench::agent
