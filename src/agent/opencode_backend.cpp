#include "agent/opencode_backend.hpp"

#include <deque>
#include <utility>

#include <boost/asio/post.hpp>

#include "agent/http_client.hpp"
#include "agent/http_endpoint.hpp"
#include "errors/bench_error.hpp"

namespace agentbench::agent {
namespace http = boost::beast::http;
using agentbench::errors::AgentError;

namespace {

bool IsSuccess(const HttpResponse& response) {
    return response.result_int() >= 200 && response.result_int() < 300;
}

std::string DescribeResponse(const HttpResponse& response) {
    std::string text = "HTTP " + std::to_string(response.result_int());
    if (!response.body().empty()) {
        text += ": " + response.body();
    }
    return text;
}

class OpencodeSession : public AgentSession {
public:
    OpencodeSession(boost::asio::io_context& ioc,
                    HttpEndpoint endpoint,
                    std::string session_id,
                    std::string query,
                    std::unique_ptr<OpencodeServer> server,
                    std::chrono::seconds timeout,
                    agentbench::utils::Logger& logger)
        : ioc_(ioc)
        , endpoint_(std::move(endpoint))
        , session_id_(std::move(session_id))
        , query_(std::move(query))
        , server_(std::move(server))
        , timeout_(timeout)
        , logger_(logger)
        , alive_(std::make_shared<bool>(true)) {}

    ~OpencodeSession() override {
        Cancel();
    }

    void Start() {
        events_ = std::make_shared<SseStream>(ioc_, timeout_);
        SseStream::Callbacks callbacks{};
        callbacks.on_open = [this](boost::system::error_code ec, unsigned status) { OnOpen(ec, status); };
        callbacks.on_message = [this](SseMessage message) { OnMessage(std::move(message)); };
        callbacks.on_close = [this](boost::system::error_code ec) { OnClose(ec); };
        logger_.Debug("opencode", "subscribing to event stream");
        events_->Start(endpoint_, "/event" + query_, std::move(callbacks));
    }

    void AsyncSubmitPrompt(const PromptRequest& request, PromptHandler handler) override {
        prompt_handler_ = std::move(handler);
        if (stream_error_) {
            FailPrompt(stream_error_);
            return;
        }
        queued_prompt_ = request;
        if (stream_open_) {
            SendPrompt();
        }
    }

    void AsyncNextEvent(EventHandler handler) override {
        waiting_ = std::move(handler);
        Deliver();
    }

    void Cancel() override {
        if (cancelled_) {
            return;
        }
        cancelled_ = true;
        *alive_ = false;
        waiting_ = nullptr;
        prompt_handler_ = nullptr;
        if (events_) {
            events_->Cancel();
        }
        if (prompt_exchange_) {
            prompt_exchange_->Cancel();
        }
    }

    void Close() override {
        if (closed_) {
            return;
        }
        closed_ = true;
        Cancel();
        if (server_) {
            server_->Stop();
            server_.reset();
        }
        logger_.Debug("opencode", "session " + session_id_ + " closed");
    }

private:
    void OnOpen(const boost::system::error_code& ec, unsigned status) {
        if (ec) {
            stream_error_ = std::make_exception_ptr(
                AgentError("Failed to subscribe to events: " + ec.message()));
        } else if (status != 200) {
            stream_error_ = std::make_exception_ptr(
                AgentError("Failed to subscribe to events: HTTP " + std::to_string(status)));
        }
        if (stream_error_) {
            if (prompt_handler_) {
                FailPrompt(stream_error_);
            }
            Deliver();
            return;
        }
        stream_open_ = true;
        if (queued_prompt_) {
            SendPrompt();
        }
    }

    void OnMessage(SseMessage message) {
        auto event = TranslateMessage(message, session_id_);
        if (!event) {
            return;
        }
        pending_.push_back(std::move(*event));
        Deliver();
    }

    void OnClose(const boost::system::error_code& ec) {
        if (ec) {
            stream_error_ = std::make_exception_ptr(AgentError(ec.message()));
        } else {
            stream_ended_ = true;
        }
        Deliver();
    }

    void SendPrompt() {
        const auto request = std::move(*queued_prompt_);
        queued_prompt_.reset();
        auto http_request = MakeRequest(http::verb::post,
                                        endpoint_,
                                        "/session/" + session_id_ + "/message" + query_,
                                        BuildPromptBody(request).dump());
        prompt_exchange_ = std::make_shared<HttpExchange>(ioc_, timeout_);
        // The reply arrives when the agent turn ends, so the read is unbounded.
        prompt_exchange_->Start(
            endpoint_,
            std::move(http_request),
            [this](boost::system::error_code ec, HttpResponse response) {
                if (cancelled_) {
                    return;
                }
                if (ec) {
                    FailPrompt(std::make_exception_ptr(AgentError(ec.message())));
                } else if (!IsSuccess(response)) {
                    FailPrompt(std::make_exception_ptr(AgentError(DescribeResponse(response))));
                } else {
                    auto handler = std::move(prompt_handler_);
                    prompt_handler_ = nullptr;
                    if (handler) {
                        handler(nullptr);
                    }
                }
            },
            false);
    }

    void FailPrompt(std::exception_ptr error) {
        auto handler = std::move(prompt_handler_);
        prompt_handler_ = nullptr;
        if (!handler) {
            return;
        }
        auto alive = alive_;
        boost::asio::post(ioc_, [alive, handler = std::move(handler), error]() {
            if (*alive) {
                handler(error);
            }
        });
    }

    void Deliver() {
        if (!waiting_) {
            return;
        }
        auto handler = std::move(waiting_);
        waiting_ = nullptr;
        std::exception_ptr error;
        std::optional<SessionEvent> event;
        if (!pending_.empty()) {
            event = std::move(pending_.front());
            pending_.pop_front();
        } else if (stream_error_) {
            error = stream_error_;
        } else if (!stream_ended_) {
            waiting_ = std::move(handler);
            return;
        }
        auto alive = alive_;
        boost::asio::post(ioc_, [alive, handler = std::move(handler), error, event = std::move(event)]() {
            if (*alive) {
                handler(error, event);
            }
        });
    }

    boost::asio::io_context& ioc_;
    HttpEndpoint endpoint_;
    std::string session_id_;
    std::string query_;
    std::unique_ptr<OpencodeServer> server_;
    std::chrono::seconds timeout_;
    agentbench::utils::Logger& logger_;
    std::shared_ptr<bool> alive_;

    std::shared_ptr<SseStream> events_;
    std::shared_ptr<HttpExchange> prompt_exchange_;
    std::optional<PromptRequest> queued_prompt_;
    PromptHandler prompt_handler_;
    EventHandler waiting_;
    std::deque<SessionEvent> pending_;
    std::exception_ptr stream_error_;
    bool stream_open_ = false;
    bool stream_ended_ = false;
    bool cancelled_ = false;
    bool closed_ = false;
};

std::string CreateSession(const HttpEndpoint& endpoint,
                          const std::string& query,
                          std::chrono::seconds timeout) {
    boost::asio::io_context ioc;
    boost::system::error_code error;
    HttpResponse response;
    auto exchange = std::make_shared<HttpExchange>(ioc, timeout);
    exchange->Start(endpoint,
                    MakeRequest(http::verb::post, endpoint, "/session" + query, "{}"),
                    [&](boost::system::error_code ec, HttpResponse reply) {
                        error = ec;
                        response = std::move(reply);
                    });
    ioc.run();

    if (error) {
        throw AgentError("Failed to create opencode session: " + error.message());
    }
    if (!IsSuccess(response)) {
        throw AgentError("Failed to create opencode session: " + DescribeResponse(response));
    }
    const auto body = nlohmann::json::parse(response.body(), nullptr, false);
    if (body.is_discarded() || !body.is_object() || !body.contains("id") || !body["id"].is_string()) {
        throw AgentError("Failed to create opencode session: response carries no session id");
    }
    return body["id"].get<std::string>();
}

}  // namespace

OpencodeBackend::OpencodeBackend(OpencodeOptions options, agentbench::utils::Logger& logger)
    : options_(std::move(options))
    , logger_(logger) {}

std::unique_ptr<AgentSession> OpencodeBackend::Open(boost::asio::io_context& ioc,
                                                    const std::filesystem::path& workspace) {
    std::unique_ptr<OpencodeServer> server;
    std::string url = options_.url;
    if (url.empty()) {
        server = std::make_unique<OpencodeServer>(options_.server, logger_);
        url = server->Start(workspace);
    }

    HttpEndpoint endpoint{};
    try {
        endpoint = ParseEndpoint(url);
    } catch (const std::invalid_argument& ex) {
        throw AgentError(std::string("Invalid opencode url: ") + ex.what());
    }
    if (endpoint.https) {
        throw AgentError("Unsupported opencode url (https): " + url);
    }

    std::error_code ec;
    auto directory = std::filesystem::absolute(workspace, ec);
    if (ec) {
        directory = workspace;
    }
    const auto query = "?directory=" + UrlEncode(directory.string());

    logger_.Info("opencode", "creating session");
    const auto session_id = CreateSession(endpoint, query, options_.request_timeout);
    logger_.Info("opencode", "session created: " + session_id);

    auto session = std::make_unique<OpencodeSession>(
        ioc, endpoint, session_id, query, std::move(server), options_.request_timeout, logger_);
    session->Start();
    return session;
}

nlohmann::json BuildPromptBody(const PromptRequest& request) {
    return nlohmann::json{
        {"parts", nlohmann::json::array({{{"type", "text"}, {"text", request.text}}})},
        {"agent", request.mode},
        {"model", {{"providerID", request.model.provider_id}, {"modelID", request.model.model_id}}},
        {"maxSteps", request.max_steps}
    };
}

std::optional<SessionEvent> TranslateMessage(const SseMessage& message, const std::string& session_id) {
    const auto payload = nlohmann::json::parse(message.data, nullptr, false);
    if (payload.is_discarded() || !payload.is_object()) {
        return std::nullopt;
    }
    const auto owner = EventSessionId(payload);
    if (owner && *owner != session_id) {
        return std::nullopt;
    }
    return ParseSessionEvent(payload);
}

}  // namespace agentbench::agent
