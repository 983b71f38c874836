#include "agent/http_client.hpp"

#include <utility>

namespace agentbench::agent {
namespace beast = boost::beast;
namespace http = beast::http;
using tcp = boost::asio::ip::tcp;

HttpRequest MakeRequest(http::verb method,
                        const HttpEndpoint& endpoint,
                        const std::string& target,
                        const std::string& json_body) {
    HttpRequest request{method, endpoint.Target(target), 11};
    request.set(http::field::host, endpoint.host + ":" + std::to_string(endpoint.port));
    request.set(http::field::user_agent, "agentbench");
    request.set(http::field::accept, "application/json");
    if (method != http::verb::get) {
        request.set(http::field::content_type, "application/json");
        request.body() = json_body;
    }
    request.prepare_payload();
    return request;
}

HttpExchange::HttpExchange(boost::asio::io_context& ioc, std::chrono::seconds timeout)
    : resolver_(ioc)
    , stream_(ioc)
    , timeout_(timeout) {}

void HttpExchange::Start(const HttpEndpoint& endpoint, HttpRequest request, Handler handler, bool bounded_read) {
    request_ = std::move(request);
    handler_ = std::move(handler);
    bounded_read_ = bounded_read;
    resolver_.async_resolve(
        endpoint.host,
        std::to_string(endpoint.port),
        [self = shared_from_this()](const boost::system::error_code& ec, tcp::resolver::results_type results) {
            self->OnResolve(ec, results);
        });
}

void HttpExchange::Cancel() {
    cancelled_ = true;
    handler_ = nullptr;
    resolver_.cancel();
    stream_.close();
}

void HttpExchange::OnResolve(const boost::system::error_code& ec, const tcp::resolver::results_type& results) {
    if (cancelled_) {
        return;
    }
    if (ec) {
        Finish(ec);
        return;
    }
    stream_.expires_after(timeout_);
    stream_.async_connect(
        results,
        [self = shared_from_this()](const boost::system::error_code& connect_ec, const tcp::endpoint&) {
            self->OnConnect(connect_ec);
        });
}

void HttpExchange::OnConnect(const boost::system::error_code& ec) {
    if (cancelled_) {
        return;
    }
    if (ec) {
        Finish(ec);
        return;
    }
    stream_.expires_after(timeout_);
    http::async_write(
        stream_,
        request_,
        [self = shared_from_this()](const boost::system::error_code& write_ec, std::size_t) {
            self->OnWrite(write_ec);
        });
}

void HttpExchange::OnWrite(const boost::system::error_code& ec) {
    if (cancelled_) {
        return;
    }
    if (ec) {
        Finish(ec);
        return;
    }
    if (bounded_read_) {
        stream_.expires_after(timeout_);
    } else {
        stream_.expires_never();
    }
    http::async_read(
        stream_,
        buffer_,
        response_,
        [self = shared_from_this()](const boost::system::error_code& read_ec, std::size_t) {
            self->OnRead(read_ec);
        });
}

void HttpExchange::OnRead(const boost::system::error_code& ec) {
    if (!ec) {
        beast::error_code ignored;
        stream_.socket().shutdown(tcp::socket::shutdown_both, ignored);
    }
    Finish(ec);
}

void HttpExchange::Finish(const boost::system::error_code& ec) {
    if (cancelled_ || !handler_) {
        return;
    }
    auto handler = std::move(handler_);
    handler_ = nullptr;
    handler(ec, std::move(response_));
}

SseStream::SseStream(boost::asio::io_context& ioc, std::chrono::seconds connect_timeout)
    : resolver_(ioc)
    , stream_(ioc)
    , connect_timeout_(connect_timeout) {
    parser_.body_limit(boost::none);
}

void SseStream::Start(const HttpEndpoint& endpoint, const std::string& target, Callbacks callbacks) {
    callbacks_ = std::move(callbacks);
    request_ = MakeRequest(http::verb::get, endpoint, target);
    request_.set(http::field::accept, "text/event-stream");
    request_.set(http::field::cache_control, "no-cache");
    resolver_.async_resolve(
        endpoint.host,
        std::to_string(endpoint.port),
        [self = shared_from_this()](const boost::system::error_code& ec, tcp::resolver::results_type results) {
            self->OnResolve(ec, results);
        });
}

void SseStream::Cancel() {
    cancelled_ = true;
    resolver_.cancel();
    stream_.close();
}

void SseStream::OnResolve(const boost::system::error_code& ec, const tcp::resolver::results_type& results) {
    if (cancelled_) {
        return;
    }
    if (ec) {
        Fail(ec);
        return;
    }
    stream_.expires_after(connect_timeout_);
    stream_.async_connect(
        results,
        [self = shared_from_this()](const boost::system::error_code& connect_ec, const tcp::endpoint&) {
            self->OnConnect(connect_ec);
        });
}

void SseStream::OnConnect(const boost::system::error_code& ec) {
    if (cancelled_) {
        return;
    }
    if (ec) {
        Fail(ec);
        return;
    }
    stream_.expires_after(connect_timeout_);
    http::async_write(
        stream_,
        request_,
        [self = shared_from_this()](const boost::system::error_code& write_ec, std::size_t) {
            self->OnWrite(write_ec);
        });
}

void SseStream::OnWrite(const boost::system::error_code& ec) {
    if (cancelled_) {
        return;
    }
    if (ec) {
        Fail(ec);
        return;
    }
    stream_.expires_after(connect_timeout_);
    http::async_read_header(
        stream_,
        buffer_,
        parser_,
        [self = shared_from_this()](const boost::system::error_code& read_ec, std::size_t) {
            self->OnHeader(read_ec);
        });
}

void SseStream::OnHeader(const boost::system::error_code& ec) {
    if (cancelled_) {
        return;
    }
    if (ec) {
        Fail(ec);
        return;
    }
    opened_ = true;
    const auto status = parser_.get().result_int();
    if (callbacks_.on_open) {
        callbacks_.on_open({}, status);
    }
    if (cancelled_ || status != 200) {
        return;
    }
    stream_.expires_never();
    ReadBody();
}

void SseStream::ReadBody() {
    if (parser_.is_done()) {
        if (callbacks_.on_close) {
            callbacks_.on_close({});
        }
        return;
    }
    parser_.get().body().data = body_chunk_.data();
    parser_.get().body().size = body_chunk_.size();
    http::async_read_some(
        stream_,
        buffer_,
        parser_,
        [self = shared_from_this()](boost::system::error_code read_ec, std::size_t) {
            self->OnBody(read_ec);
        });
}

void SseStream::OnBody(boost::system::error_code ec) {
    if (cancelled_) {
        return;
    }
    if (ec == http::error::need_buffer) {
        ec = {};
    }
    const auto received = body_chunk_.size() - parser_.get().body().size;
    if (received > 0) {
        for (auto& message : decoder_.Feed(std::string(body_chunk_.data(), received))) {
            if (cancelled_) {
                return;
            }
            if (callbacks_.on_message) {
                callbacks_.on_message(std::move(message));
            }
        }
    }
    if (cancelled_) {
        return;
    }
    if (ec == http::error::end_of_stream || ec == boost::asio::error::eof) {
        if (callbacks_.on_close) {
            callbacks_.on_close({});
        }
        return;
    }
    if (ec) {
        Fail(ec);
        return;
    }
    ReadBody();
}

void SseStream::Fail(const boost::system::error_code& ec) {
    if (cancelled_) {
        return;
    }
    if (!opened_) {
        opened_ = true;
        if (callbacks_.on_open) {
            callbacks_.on_open(ec, 0);
        }
        return;
    }
    if (callbacks_.on_close) {
        callbacks_.on_close(ec);
    }
}

}  // namespace agentbench::agent
