#include "agent/session_agent.hpp"

#include <chrono>
#include <utility>

#include "agent/metrics.hpp"
#include "errors/bench_error.hpp"
#include "utils/common.hpp"
#include "utils/completion_slot.hpp"

namespace agentbench::agent {
namespace {

using agentbench::errors::AgentError;

std::string Describe(const std::exception_ptr& error) {
    try {
        std::rethrow_exception(error);
    } catch (const std::exception& ex) {
        return ex.what();
    }
}

// Closes the session when the execution scope unwinds.
class SessionCloser {
public:
    SessionCloser(AgentSession& session, agentbench::utils::Logger& logger)
        : session_(session)
        , logger_(logger) {}

    ~SessionCloser() {
        try {
            session_.Close();
        } catch (const std::exception& ex) {
            logger_.Warn("agent", std::string("failed to close session: ") + ex.what());
        }
    }

    SessionCloser(const SessionCloser&) = delete;
    SessionCloser& operator=(const SessionCloser&) = delete;

private:
    AgentSession& session_;
    agentbench::utils::Logger& logger_;
};

}  // namespace

SessionAgent::SessionAgent(std::unique_ptr<AgentBackend> backend,
                           ModelConfig model,
                           agentbench::utils::Logger& logger)
    : backend_(std::move(backend))
    , model_(std::move(model))
    , logger_(logger) {}

std::string SessionAgent::Name() const {
    return backend_->Name();
}

std::string SessionAgent::Version() const {
    return backend_->Version();
}

std::string SessionAgent::ModelName() const {
    return model_.ToString();
}

AgentResult SessionAgent::Execute(const agentbench::task::Task& task,
                                  const std::filesystem::path& workspace) {
    const auto start = std::chrono::steady_clock::now();
    boost::asio::io_context ioc;

    logger_.Info("agent", "opening " + backend_->Name() + " session for " + task.id);
    std::unique_ptr<AgentSession> session;
    try {
        session = backend_->Open(ioc, workspace);
    } catch (const AgentError&) {
        throw;
    } catch (const std::exception& ex) {
        throw AgentError(std::string("Failed to open agent session: ") + ex.what());
    }
    SessionCloser closer(*session, logger_);

    PromptRequest prompt{};
    prompt.text = task.prompt;
    prompt.mode = SelectMode(task.permissions);
    prompt.model = model_;
    prompt.max_steps = task.MaxIterations();

    Metrics metrics{};
    bool saw_event = false;
    utils::CompletionSlot<bool> done;
    done.OnSettle([&session]() { session->Cancel(); });

    logger_.Info("agent", "sending prompt mode=" + prompt.mode + " model=" + model_.ToString());
    session->AsyncSubmitPrompt(prompt, [&](std::exception_ptr error) {
        if (done.Settled()) {
            return;
        }
        if (!error) {
            logger_.Debug("agent", "prompt delivered");
            return;
        }
        if (!saw_event) {
            done.Reject(std::make_exception_ptr(
                AgentError("Failed to deliver prompt: " + Describe(error))));
            return;
        }
        logger_.Warn("agent", "prompt request failed after events arrived: " + Describe(error));
    });

    std::function<void()> pull;
    pull = [&]() {
        session->AsyncNextEvent([&](std::exception_ptr error, std::optional<SessionEvent> event) {
            if (done.Settled()) {
                return;
            }
            if (error) {
                done.Reject(std::make_exception_ptr(
                    AgentError("Event stream failed: " + Describe(error))));
                return;
            }
            if (!event) {
                done.Reject(std::make_exception_ptr(
                    AgentError("Event stream ended before the session reported idle or error")));
                return;
            }
            if (IsRecognized(*event)) {
                saw_event = true;
            }
            const auto step = FoldEvent(metrics, *event);
            switch (step.kind) {
                case FoldStep::Kind::Continue:
                    if (std::holds_alternative<MessageUpdated>(*event)) {
                        logger_.Debug("agent", "iteration " + std::to_string(metrics.iterations) + ": " +
                                                   std::to_string(metrics.input_tokens + metrics.output_tokens) +
                                                   " tokens");
                    }
                    pull();
                    break;
                case FoldStep::Kind::Idle:
                    logger_.Info("agent", "session idle - task completed");
                    done.Resolve(true);
                    break;
                case FoldStep::Kind::Failed:
                    done.Reject(std::make_exception_ptr(AgentError("Session error: " + step.error)));
                    break;
            }
        });
    };
    pull();

    ioc.run();
    if (!done.Settled()) {
        throw AgentError("Agent session stopped without a result");
    }
    done.Take();

    AgentResult result{};
    result.success = true;
    result.output = utils::Join(metrics.output, "\n");
    result.iterations = metrics.iterations;
    result.input_tokens = metrics.input_tokens;
    result.output_tokens = metrics.output_tokens;
    result.cost = metrics.cost;
    result.duration_secs = utils::SecondsSince(start);
    result.agent_version = backend_->Version();
    result.model_name = model_.ToString();

    logger_.Info("agent", "completed " + std::to_string(result.iterations) + " iterations, " +
                              std::to_string(result.TokensUsed()) + " tokens");
    return result;
}

std::string SelectMode(const agentbench::task::PermissionsConfig& permissions) {
    if (!permissions.write && !permissions.bash) {
        return "plan";
    }
    return "build";
}

}  // namespace agentbench::agent
