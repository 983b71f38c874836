#pragma once

#include <string>

namespace agentbench::agent {

struct HttpEndpoint {
    bool https = false;
    std::string host;
    int port = 80;
    std::string base_path;

    std::string Target(const std::string& path) const { return base_path + path; }
};

// Accepts "http://host[:port][/base]"; throws std::invalid_argument on a
// missing host or a malformed port.
HttpEndpoint ParseEndpoint(const std::string& url);

// Percent-encodes everything outside the RFC 3986 unreserved set.
std::string UrlEncode(const std::string& value);

}  // namespace agentbench::agent
