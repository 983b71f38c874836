#include "agent/session_event.hpp"

namespace agentbench::agent {
namespace {

const nlohmann::json& Child(const nlohmann::json& data, const char* key) {
    static const nlohmann::json kNull;
    if (!data.is_object() || !data.contains(key)) {
        return kNull;
    }
    return data[key];
}

long long NumberOr(const nlohmann::json& data, const char* key, long long fallback) {
    const auto& value = Child(data, key);
    return value.is_number() ? value.get<long long>() : fallback;
}

std::string ErrorMessage(const nlohmann::json& properties) {
    const auto& message = Child(properties, "message");
    if (message.is_string() && !message.get<std::string>().empty()) {
        return message.get<std::string>();
    }
    const auto& error = Child(properties, "error");
    const auto& nested = Child(Child(error, "data"), "message");
    if (nested.is_string() && !nested.get<std::string>().empty()) {
        return nested.get<std::string>();
    }
    const auto& name = Child(error, "name");
    if (name.is_string() && !name.get<std::string>().empty()) {
        return name.get<std::string>();
    }
    return "Unknown error";
}

MessageUpdated ParseMessageUpdated(const nlohmann::json& properties) {
    MessageUpdated update{};
    const auto& info = Child(properties, "info");
    const auto& role = Child(info, "role");
    update.role = role.is_string() ? role.get<std::string>() : std::string();

    const auto& tokens = Child(info, "tokens");
    update.input_tokens = NumberOr(tokens, "input", 0);
    update.output_tokens = NumberOr(tokens, "output", 0);

    const auto& cost = Child(info, "cost");
    update.cost = cost.is_number() ? cost.get<double>() : 0.0;

    const auto& parts = Child(properties, "parts");
    if (parts.is_array()) {
        for (const auto& part : parts) {
            const auto& type = Child(part, "type");
            const auto& text = Child(part, "text");
            if (type.is_string() && type.get<std::string>() == "text" &&
                text.is_string() && !text.get<std::string>().empty()) {
                update.texts.push_back(text.get<std::string>());
            }
        }
    }
    return update;
}

}  // namespace

SessionEvent ParseSessionEvent(const nlohmann::json& payload) {
    const auto& type_value = Child(payload, "type");
    const auto type = type_value.is_string() ? type_value.get<std::string>() : std::string();
    const auto& properties = Child(payload, "properties");

    if (type == "message.updated") {
        return ParseMessageUpdated(properties);
    }
    if (type == "session.idle") {
        return SessionIdle{};
    }
    if (type == "session.error") {
        return SessionError{ErrorMessage(properties)};
    }
    return UnknownEvent{type};
}

std::optional<std::string> EventSessionId(const nlohmann::json& payload) {
    const auto& properties = Child(payload, "properties");
    for (const auto* holder : {&properties, &Child(properties, "info"), &Child(properties, "part")}) {
        const auto& id = Child(*holder, "sessionID");
        if (id.is_string()) {
            return id.get<std::string>();
        }
    }
    return std::nullopt;
}

}  // namespace agentbench::agent
