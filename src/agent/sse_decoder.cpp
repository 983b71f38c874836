#include "agent/sse_decoder.hpp"

#include <utility>

#include "utils/common.hpp"

namespace agentbench::agent {

std::vector<SseMessage> SseDecoder::Feed(const std::string& chunk) {
    std::vector<SseMessage> out;
    buffer_ += chunk;
    std::size_t pos = 0;
    while (true) {
        const auto newline = buffer_.find('\n', pos);
        if (newline == std::string::npos) {
            break;
        }
        std::string line = buffer_.substr(pos, newline - pos);
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        ProcessLine(std::move(line), out);
        pos = newline + 1;
    }
    buffer_.erase(0, pos);
    return out;
}

void SseDecoder::ProcessLine(std::string line, std::vector<SseMessage>& out) {
    if (line.empty()) {
        if (!data_.empty()) {
            out.push_back(SseMessage{event_, utils::Join(data_, "\n")});
        }
        event_.clear();
        data_.clear();
        return;
    }
    if (line.front() == ':') {
        return;
    }

    std::string field = line;
    std::string value;
    const auto colon = line.find(':');
    if (colon != std::string::npos) {
        field = line.substr(0, colon);
        value = line.substr(colon + 1);
        if (!value.empty() && value.front() == ' ') {
            value.erase(0, 1);
        }
    }

    if (field == "data") {
        data_.push_back(std::move(value));
    } else if (field == "event") {
        event_ = std::move(value);
    }
}

}  // namespace agentbench::agent
