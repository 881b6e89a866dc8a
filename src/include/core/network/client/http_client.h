#pragma once

#include <utility>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/http/string_body.hpp>
#include <boost/beast/version.hpp>
#include <chrono>
#include <core/constant/transfer.h>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace wledbackup::core {

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = net::ip::tcp;

// Plain HTTP/1.1 client over one TCP connection. Errors are thrown as
// boost::system::system_error.
class HttpClient {
public:
    explicit HttpClient(net::io_context& ioc,
                        std::chrono::seconds timeout = transfer::kDefaultHttpTimeout);
    ~HttpClient();

    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    net::awaitable<void> Connect(std::string_view host, unsigned short port);

    net::awaitable<void> Disconnect();

    template<typename RequestBody>
    net::awaitable<http::response<http::string_body>> SendRequest(http::request<RequestBody>& req);

    template<typename Body>
    http::request<Body> CreateRequest(http::verb method,
                                      const std::string& target,
                                      bool keepAlive = false);

    // "host:port", with IPv6 literals bracketed.
    static std::string HostHeader(std::string_view host, unsigned short port);

private:
    net::io_context& ioc_;
    std::chrono::seconds timeout_;
    std::unique_ptr<beast::tcp_stream> connection_;
    std::string current_host_;
    unsigned short current_port_ = 0;
};

template<typename RequestBody>
net::awaitable<http::response<http::string_body>> HttpClient::SendRequest(
    http::request<RequestBody>& req) {
    if (!connection_) {
        throw std::runtime_error("No active connection");
    }

    connection_->expires_after(timeout_);
    co_await http::async_write(*connection_, req, net::use_awaitable);

    beast::flat_buffer buffer;
    http::response_parser<http::string_body> parser;
    parser.body_limit(transfer::kMaxBodySize);
    co_await http::async_read(*connection_, buffer, parser, net::use_awaitable);
    connection_->expires_never();

    co_return parser.release();
}

template<typename Body>
http::request<Body> HttpClient::CreateRequest(http::verb method,
                                              const std::string& target,
                                              bool keepAlive) {
    http::request<Body> req{method, target, 11};

    if (!current_host_.empty()) {
        req.set(http::field::host, HostHeader(current_host_, current_port_));
    }

    req.set(http::field::user_agent, BOOST_BEAST_VERSION_STRING);
    req.set(http::field::accept, "application/json");
    req.keep_alive(keepAlive);

    return req;
}

} // namespace wledbackup::core
