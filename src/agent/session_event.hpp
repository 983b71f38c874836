#pragma once

#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "nlohmann/json.hpp"

namespace agentbench::agent {

struct MessageUpdated {
    std::string role;
    long long input_tokens = 0;
    long long output_tokens = 0;
    double cost = 0.0;
    std::vector<std::string> texts;
};

struct SessionIdle {};

struct SessionError {
    std::string message;
};

struct UnknownEvent {
    std::string type;
};

using SessionEvent = std::variant<MessageUpdated, SessionIdle, SessionError, UnknownEvent>;

// Maps one `{"type": ..., "properties": {...}}` payload to an event.
SessionEvent ParseSessionEvent(const nlohmann::json& payload);

// Session the event belongs to, when the payload names one.
std::optional<std::string> EventSessionId(const nlohmann::json& payload);

inline bool IsRecognized(const SessionEvent& event) {
    return !std::holds_alternative<UnknownEvent>(event);
}

}  // namespace agentbench::agent
