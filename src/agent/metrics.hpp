#pragma once

#include <string>
#include <vector>

#include "agent/session_event.hpp"

namespace agentbench::agent {

// Running totals for one agent execution.
struct Metrics {
    int iterations = 0;
    long long input_tokens = 0;
    long long output_tokens = 0;
    double cost = 0.0;
    std::vector<std::string> output;
};

struct FoldStep {
    enum class Kind {
        Continue,
        Idle,
        Failed
    };

    Kind kind = Kind::Continue;
    std::string error;
};

// Applies one event to the accumulator and says whether the stream is done.
FoldStep FoldEvent(Metrics& metrics, const SessionEvent& event);

}  // namespace agentbench::agent
