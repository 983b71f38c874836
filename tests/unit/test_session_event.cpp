#include <string>
#include <variant>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "agent/session_event.hpp"

namespace {

using agentbench::agent::EventSessionId;
using agentbench::agent::IsRecognized;
using agentbench::agent::MessageUpdated;
using agentbench::agent::ParseSessionEvent;
using agentbench::agent::SessionError;
using agentbench::agent::SessionIdle;
using agentbench::agent::UnknownEvent;
using nlohmann::json;

TEST(SessionEventTest, ParsesAssistantMessageUpdate) {
    const json payload = {
        {"type", "message.updated"},
        {"properties", {
            {"info", {{"role", "assistant"}, {"tokens", {{"input", 120}, {"output", 30}}}, {"cost", 0.25}}},
            {"parts", json::array({
                {{"type", "text"}, {"text", "first"}},
                {{"type", "tool"}, {"text", "ignored"}},
                {{"type", "text"}, {"text", ""}},
                {{"type", "text"}, {"text", "second"}}
            })}
        }}
    };

    const auto event = ParseSessionEvent(payload);
    const auto* update = std::get_if<MessageUpdated>(&event);
    ASSERT_NE(update, nullptr);
    EXPECT_EQ(update->role, "assistant");
    EXPECT_EQ(update->input_tokens, 120);
    EXPECT_EQ(update->output_tokens, 30);
    EXPECT_DOUBLE_EQ(update->cost, 0.25);
    ASSERT_EQ(update->texts.size(), 2u);
    EXPECT_EQ(update->texts[0], "first");
    EXPECT_EQ(update->texts[1], "second");
}

TEST(SessionEventTest, MissingTokenCountsDefaultToZero) {
    const json payload = {{"type", "message.updated"}, {"properties", {{"info", {{"role", "user"}}}}}};
    const auto event = ParseSessionEvent(payload);
    const auto* update = std::get_if<MessageUpdated>(&event);
    ASSERT_NE(update, nullptr);
    EXPECT_EQ(update->role, "user");
    EXPECT_EQ(update->input_tokens, 0);
    EXPECT_EQ(update->output_tokens, 0);
    EXPECT_TRUE(update->texts.empty());
}

TEST(SessionEventTest, ParsesIdle) {
    const auto event = ParseSessionEvent(json{{"type", "session.idle"}, {"properties", {{"sessionID", "s1"}}}});
    EXPECT_TRUE(std::holds_alternative<SessionIdle>(event));
    EXPECT_TRUE(IsRecognized(event));
}

TEST(SessionEventTest, ErrorMessageFallsBackThroughNestedFields) {
    const auto direct = ParseSessionEvent(json{
        {"type", "session.error"}, {"properties", {{"message", "model unavailable"}}}});
    EXPECT_EQ(std::get<SessionError>(direct).message, "model unavailable");

    const auto nested = ParseSessionEvent(json{
        {"type", "session.error"},
        {"properties", {{"error", {{"name", "ProviderAuthError"}, {"data", {{"message", "bad key"}}}}}}}});
    EXPECT_EQ(std::get<SessionError>(nested).message, "bad key");

    const auto named = ParseSessionEvent(json{
        {"type", "session.error"}, {"properties", {{"error", {{"name", "APIError"}}}}}});
    EXPECT_EQ(std::get<SessionError>(named).message, "APIError");

    const auto bare = ParseSessionEvent(json{{"type", "session.error"}});
    EXPECT_EQ(std::get<SessionError>(bare).message, "Unknown error");
}

TEST(SessionEventTest, UnrecognizedTypesAreKeptAsUnknown) {
    const auto event = ParseSessionEvent(json{{"type", "file.edited"}});
    ASSERT_TRUE(std::holds_alternative<UnknownEvent>(event));
    EXPECT_EQ(std::get<UnknownEvent>(event).type, "file.edited");
    EXPECT_FALSE(IsRecognized(event));

    EXPECT_FALSE(IsRecognized(ParseSessionEvent(json::array())));
}

TEST(SessionEventTest, SessionIdIsFoundAtAnyKnownLocation) {
    EXPECT_EQ(EventSessionId(json{{"properties", {{"sessionID", "a"}}}}), "a");
    EXPECT_EQ(EventSessionId(json{{"properties", {{"info", {{"sessionID", "b"}}}}}}), "b");
    EXPECT_EQ(EventSessionId(json{{"properties", {{"part", {{"sessionID", "c"}}}}}}), "c");
    EXPECT_FALSE(EventSessionId(json{{"type", "server.connected"}, {"properties", json::object()}}).has_value());
}

}  // namespace
