#include "agent/http_endpoint.hpp"

#include <cctype>
#include <stdexcept>

namespace agentbench::agent {

HttpEndpoint ParseEndpoint(const std::string& url) {
    HttpEndpoint parsed{};
    std::string working = url;
    if (working.rfind("https://", 0) == 0) {
        parsed.https = true;
        parsed.port = 443;
        working = working.substr(8);
    } else if (working.rfind("http://", 0) == 0) {
        working = working.substr(7);
    }

    const auto slash_pos = working.find('/');
    std::string host_port = working;
    if (slash_pos != std::string::npos) {
        host_port = working.substr(0, slash_pos);
        parsed.base_path = working.substr(slash_pos);
    }

    const auto colon_pos = host_port.find(':');
    if (colon_pos != std::string::npos) {
        parsed.host = host_port.substr(0, colon_pos);
        const auto port_text = host_port.substr(colon_pos + 1);
        std::size_t consumed = 0;
        try {
            parsed.port = std::stoi(port_text, &consumed);
        } catch (const std::exception&) {
            throw std::invalid_argument("invalid port in url: " + url);
        }
        if (consumed != port_text.size() || parsed.port <= 0 || parsed.port > 65535) {
            throw std::invalid_argument("invalid port in url: " + url);
        }
    } else {
        parsed.host = host_port;
    }
    if (parsed.host.empty()) {
        throw std::invalid_argument("missing host in url: " + url);
    }

    if (!parsed.base_path.empty() && parsed.base_path.back() == '/') {
        parsed.base_path.pop_back();
    }

    return parsed;
}

std::string UrlEncode(const std::string& value) {
    static const char* kHex = "0123456789ABCDEF";
    std::string out;
    out.reserve(value.size());
    for (unsigned char c : value) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            out.push_back(static_cast<char>(c));
        } else {
            out.push_back('%');
            out.push_back(kHex[c >> 4]);
            out.push_back(kHex[c & 0x0F]);
        }
    }
    return out;
}

}  // namespace agentbench::agent
