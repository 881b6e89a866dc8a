#include <utility>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <core/error/backup_error.h>
#include <core/network/client/http_client.h>
#include <core/network/client/resource_fetcher.h>
#include <exception>
#include <optional>
#include <spdlog/spdlog.h>

namespace wledbackup::core {

std::string DescribeUrl(const boost::asio::ip::address& address,
                        std::uint16_t port,
                        std::string_view target) {
    return "http://" + HttpClient::HostHeader(address.to_string(), port) + std::string(target);
}

HttpResourceFetcher::HttpResourceFetcher(std::chrono::seconds timeout)
    : timeout_(timeout) {}

FetchResponse HttpResourceFetcher::Fetch(const boost::asio::ip::address& address,
                                         std::uint16_t port,
                                         std::string_view target) {
    const auto url = DescribeUrl(address, port, target);
    spdlog::debug("GET {}", url);

    net::io_context ioc;
    std::optional<FetchResponse> response;
    std::exception_ptr failure;

    net::co_spawn(
        ioc,
        [&]() -> net::awaitable<void> {
            HttpClient client(ioc, timeout_);
            co_await client.Connect(address.to_string(), port);
            auto req = client.CreateRequest<http::empty_body>(http::verb::get, std::string(target));
            auto res = co_await client.SendRequest(req);
            co_await client.Disconnect();
            response = FetchResponse{.status = res.result_int(), .body = std::move(res.body())};
        },
        [&](std::exception_ptr e) { failure = e; });
    ioc.run();

    if (failure) {
        try {
            std::rethrow_exception(failure);
        } catch (const std::exception& e) {
            throw BackupError(BackupErrorKind::kTransport,
                              "GET " + url + " failed: " + e.what());
        }
    }
    if (!response) {
        throw BackupError(BackupErrorKind::kTransport, "GET " + url + " failed: no response");
    }

    spdlog::debug("GET {} -> {} ({} bytes)", url, response->status, response->body.size());
    return std::move(*response);
}

} // namespace wledbackup::core
