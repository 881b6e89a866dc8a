#include <core/network/client/http_client.h>
#include <spdlog/spdlog.h>

namespace wledbackup::core {

HttpClient::HttpClient(net::io_context& ioc, std::chrono::seconds timeout)
    : ioc_(ioc)
    , timeout_(timeout) {}

HttpClient::~HttpClient() {
    if (connection_) {
        beast::error_code ec;
        connection_->socket().close(ec);
    }
}

net::awaitable<void> HttpClient::Connect(std::string_view host, unsigned short port) {
    if (connection_) {
        co_await Disconnect();
    }

    auto stream = std::make_unique<beast::tcp_stream>(ioc_);

    tcp::resolver resolver(ioc_);
    auto results = co_await resolver.async_resolve(std::string(host),
                                                   std::to_string(port),
                                                   net::use_awaitable);

    stream->expires_after(timeout_);
    co_await stream->async_connect(results, net::use_awaitable);
    stream->expires_never();

    connection_ = std::move(stream);
    current_host_ = host;
    current_port_ = port;

    spdlog::debug("Connected to {}", HostHeader(host, port));
}

net::awaitable<void> HttpClient::Disconnect() {
    if (!connection_) {
        co_return;
    }

    beast::error_code ec;
    connection_->socket().shutdown(tcp::socket::shutdown_both, ec);
    if (ec && ec != beast::errc::not_connected) {
        spdlog::debug("Shutdown notice: {}", ec.message());
    }

    connection_.reset();
    current_host_.clear();
    current_port_ = 0;

    spdlog::debug("Disconnected");
    co_return;
}

std::string HttpClient::HostHeader(std::string_view host, unsigned short port) {
    std::string header;
    if (host.find(':') != std::string_view::npos) {
        header.append("[").append(host).append("]");
    } else {
        header.append(host);
    }
    return header + ":" + std::to_string(port);
}

} // namespace wledbackup::core
