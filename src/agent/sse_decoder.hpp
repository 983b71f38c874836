#pragma once

#include <string>
#include <vector>

namespace agentbench::agent {

struct SseMessage {
    std::string event;
    std::string data;
};

// Incremental text/event-stream decoder. Bytes may arrive split at any
// position; a message is emitted when its terminating blank line is seen.
class SseDecoder {
public:
    std::vector<SseMessage> Feed(const std::string& chunk);

private:
    void ProcessLine(std::string line, std::vector<SseMessage>& out);

    std::string buffer_;
    std::string event_;
    std::vector<std::string> data_;
};

}  // namespace agentbench::agent
