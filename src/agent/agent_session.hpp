#pragma once

#include <exception>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include <boost/asio/io_context.hpp>

#include "agent/agent.hpp"
#include "agent/session_event.hpp"

namespace agentbench::agent {

struct PromptRequest {
    std::string text;
    // "plan" or "build".
    std::string mode;
    ModelConfig model;
    int max_steps = 20;
};

// One bounded conversation with the agent capability. All operations are
// asynchronous on the io_context the session was opened with.
class AgentSession {
public:
    using PromptHandler = std::function<void(std::exception_ptr)>;
    // An empty event means the transport reached end of stream.
    using EventHandler = std::function<void(std::exception_ptr, std::optional<SessionEvent>)>;

    virtual ~AgentSession() = default;

    virtual void AsyncSubmitPrompt(const PromptRequest& request, PromptHandler handler) = 0;
    // Pulls the next event. The stream is finite and cannot be restarted;
    // at most one pull may be outstanding.
    virtual void AsyncNextEvent(EventHandler handler) = 0;
    // Aborts outstanding operations without invoking their handlers.
    virtual void Cancel() = 0;
    // Releases the session and anything started for it. Idempotent.
    virtual void Close() = 0;
};

class AgentBackend {
public:
    virtual ~AgentBackend() = default;
    virtual std::string Name() const = 0;
    virtual std::string Version() const = 0;
    // Throws AgentError when the capability cannot be reached.
    virtual std::unique_ptr<AgentSession> Open(boost::asio::io_context& ioc,
                                               const std::filesystem::path& workspace) = 0;
};

}  // namespace agentbench::agent
