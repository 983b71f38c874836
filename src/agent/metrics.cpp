#include "agent/metrics.hpp"

namespace agentbench::agent {

FoldStep FoldEvent(Metrics& metrics, const SessionEvent& event) {
    if (const auto* update = std::get_if<MessageUpdated>(&event)) {
        if (update->role != "assistant") {
            return {};
        }
        metrics.iterations += 1;
        metrics.input_tokens += update->input_tokens;
        metrics.output_tokens += update->output_tokens;
        metrics.cost += update->cost;
        metrics.output.insert(metrics.output.end(), update->texts.begin(), update->texts.end());
        return {};
    }
    if (std::holds_alternative<SessionIdle>(event)) {
        return FoldStep{FoldStep::Kind::Idle, {}};
    }
    if (const auto* error = std::get_if<SessionError>(&event)) {
        return FoldStep{FoldStep::Kind::Failed, error->message};
    }
    return {};
}

}  // namespace agentbench::agent
