#include <stdexcept>
#include <string>
#include <gtest/gtest.h>
#include "agent/http_endpoint.hpp"

namespace {

using agentbench::agent::ParseEndpoint;
using agentbench::agent::UrlEncode;

TEST(HttpEndpointTest, ParsesHostAndPort) {
    const auto endpoint = ParseEndpoint("http://127.0.0.1:4096");
    EXPECT_FALSE(endpoint.https);
    EXPECT_EQ(endpoint.host, "127.0.0.1");
    EXPECT_EQ(endpoint.port, 4096);
    EXPECT_TRUE(endpoint.base_path.empty());
    EXPECT_EQ(endpoint.Target("/event"), "/event");
}

TEST(HttpEndpointTest, DefaultsPortFromScheme) {
    EXPECT_EQ(ParseEndpoint("http://localhost").port, 80);
    const auto secure = ParseEndpoint("https://agents.internal");
    EXPECT_TRUE(secure.https);
    EXPECT_EQ(secure.port, 443);
}

TEST(HttpEndpointTest, KeepsBasePathWithoutTrailingSlash) {
    const auto endpoint = ParseEndpoint("http://proxy:8080/opencode/");
    EXPECT_EQ(endpoint.base_path, "/opencode");
    EXPECT_EQ(endpoint.Target("/session"), "/opencode/session");
}

TEST(HttpEndpointTest, RejectsMalformedUrls) {
    EXPECT_THROW(ParseEndpoint("http://:4096"), std::invalid_argument);
    EXPECT_THROW(ParseEndpoint("http://host:abc"), std::invalid_argument);
    EXPECT_THROW(ParseEndpoint("http://host:12x"), std::invalid_argument);
    EXPECT_THROW(ParseEndpoint("http://host:70000"), std::invalid_argument);
    EXPECT_THROW(ParseEndpoint(""), std::invalid_argument);
}

TEST(HttpEndpointTest, UrlEncodeEscapesReservedCharacters) {
    EXPECT_EQ(UrlEncode("/tmp/agent-bench/task_1"), "%2Ftmp%2Fagent-bench%2Ftask_1");
    EXPECT_EQ(UrlEncode("a b~c.d"), "a%20b~c.d");
    EXPECT_EQ(UrlEncode(""), "");
}

}  // namespace
