#pragma once

#include <chrono>
#include <optional>
#include <string>

#include "agent/agent_session.hpp"
#include "agent/opencode_server.hpp"
#include "agent/sse_decoder.hpp"
#include "nlohmann/json.hpp"
#include "utils/logging.hpp"

namespace agentbench::agent {

struct OpencodeOptions {
    // Existing server to talk to. When empty a server is started per task.
    std::string url;
    ServerOptions server;
    std::chrono::seconds request_timeout{30};
};

// Talks to the opencode HTTP API: one session per Open, prompt via
// POST /session/<id>/message and progress via the /event SSE stream.
class OpencodeBackend : public AgentBackend {
public:
    OpencodeBackend(OpencodeOptions options, agentbench::utils::Logger& logger);

    std::string Name() const override { return "opencode"; }
    std::string Version() const override { return "opencode-http/1"; }
    std::unique_ptr<AgentSession> Open(boost::asio::io_context& ioc,
                                       const std::filesystem::path& workspace) override;

private:
    OpencodeOptions options_;
    agentbench::utils::Logger& logger_;
};

nlohmann::json BuildPromptBody(const PromptRequest& request);

// Decodes one SSE message into an event for `session_id`. Returns nothing
// for malformed payloads and for events that belong to another session.
std::optional<SessionEvent> TranslateMessage(const SseMessage& message, const std::string& session_id);

}  // namespace agentbench::agent
