#pragma once

#include <array>
#include <chrono>
#include <functional>
#include <memory>
#include <string>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include "agent/http_endpoint.hpp"
#include "agent/sse_decoder.hpp"

namespace agentbench::agent {

using HttpRequest = boost::beast::http::request<boost::beast::http::string_body>;
using HttpResponse = boost::beast::http::response<boost::beast::http::string_body>;

HttpRequest MakeRequest(boost::beast::http::verb method,
                        const HttpEndpoint& endpoint,
                        const std::string& target,
                        const std::string& json_body = {});

// One request/response round trip. Connect and write are bounded by the
// timeout; the read is bounded only when `bounded_read` is set.
class HttpExchange : public std::enable_shared_from_this<HttpExchange> {
public:
    using Handler = std::function<void(boost::system::error_code, HttpResponse)>;

    HttpExchange(boost::asio::io_context& ioc, std::chrono::seconds timeout);

    void Start(const HttpEndpoint& endpoint, HttpRequest request, Handler handler, bool bounded_read = true);
    // The handler is not invoked after Cancel.
    void Cancel();

private:
    void OnResolve(const boost::system::error_code& ec,
                   const boost::asio::ip::tcp::resolver::results_type& results);
    void OnConnect(const boost::system::error_code& ec);
    void OnWrite(const boost::system::error_code& ec);
    void OnRead(const boost::system::error_code& ec);
    void Finish(const boost::system::error_code& ec);

    boost::asio::ip::tcp::resolver resolver_;
    boost::beast::tcp_stream stream_;
    boost::beast::flat_buffer buffer_;
    std::chrono::seconds timeout_;
    bool bounded_read_ = true;
    bool cancelled_ = false;
    HttpRequest request_;
    HttpResponse response_;
    Handler handler_;
};

// GET on a text/event-stream resource, decoded message by message.
class SseStream : public std::enable_shared_from_this<SseStream> {
public:
    struct Callbacks {
        // Headers received, or the stream could not be opened. The status
        // is zero when the error is set.
        std::function<void(boost::system::error_code, unsigned status)> on_open;
        std::function<void(SseMessage)> on_message;
        // Empty error on a clean end of stream.
        std::function<void(boost::system::error_code)> on_close;
    };

    SseStream(boost::asio::io_context& ioc, std::chrono::seconds connect_timeout);

    void Start(const HttpEndpoint& endpoint, const std::string& target, Callbacks callbacks);
    // No callback runs after Cancel.
    void Cancel();

private:
    void OnResolve(const boost::system::error_code& ec,
                   const boost::asio::ip::tcp::resolver::results_type& results);
    void OnConnect(const boost::system::error_code& ec);
    void OnWrite(const boost::system::error_code& ec);
    void OnHeader(const boost::system::error_code& ec);
    void ReadBody();
    void OnBody(boost::system::error_code ec);
    void Fail(const boost::system::error_code& ec);

    boost::asio::ip::tcp::resolver resolver_;
    boost::beast::tcp_stream stream_;
    boost::beast::flat_buffer buffer_;
    std::chrono::seconds connect_timeout_;
    HttpRequest request_;
    boost::beast::http::response_parser<boost::beast::http::buffer_body> parser_;
    std::array<char, 8192> body_chunk_{};
    SseDecoder decoder_;
    Callbacks callbacks_;
    bool opened_ = false;
    bool cancelled_ = false;
};

}  // namespace agentbench::agent
