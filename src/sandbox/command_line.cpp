#include "sandbox/command_line.hpp"

#include <cctype>

namespace agentbench::sandbox {
namespace {

bool IsSpace(char ch) {
    return std::isspace(static_cast<unsigned char>(ch)) != 0;
}

}  // namespace

std::vector<std::string> SplitCommandLine(const std::string& command) {
    std::vector<std::string> tokens;
    std::string current;
    bool in_token = false;

    const auto flush = [&]() {
        if (in_token) {
            tokens.push_back(current);
            current.clear();
            in_token = false;
        }
    };

    std::size_t i = 0;
    while (i < command.size()) {
        const char ch = command[i];
        if (IsSpace(ch)) {
            flush();
            ++i;
            continue;
        }
        if (ch == '"') {
            const auto closing = command.find('"', i + 1);
            if (closing == std::string::npos) {
                flush();
                ++i;
                continue;
            }
            current.append(command, i + 1, closing - i - 1);
            in_token = true;
            i = closing + 1;
            continue;
        }
        current.push_back(ch);
        in_token = true;
        ++i;
    }
    flush();
    return tokens;
}

}  // namespace agentbench::sandbox
