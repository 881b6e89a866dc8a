#include <array>
#include <utility>
#include <boost/asio/buffer.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/ip/multicast.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <core/error/backup_error.h>
#include <core/network/discovery/mdns_browser.h>
#include <spdlog/spdlog.h>

using namespace boost::asio;

namespace wledbackup::core {

std::unique_ptr<Subscription> MdnsBrowser::Browse(std::string_view service_type) {
    return std::make_unique<MdnsSubscription>(service_type);
}

MdnsSubscription::MdnsSubscription(std::string_view service_type)
    : socket_(io_context_)
    , query_timer_(io_context_)
    , group_endpoint_(ip::make_address_v4(mdns::kGroupAddressV4), mdns::kPort)
    , resolver_(service_type) {
    try {
        query_ = dns::BuildQuery(resolver_.service_type(), dns::RecordType::kPtr);
    } catch (const std::invalid_argument& e) {
        throw DiscoveryError("Failed to browse " + std::string(service_type) + ": " + e.what());
    }

    try {
        openSocket();
        // 先同步发送一次查询，发送失败直接视为致命错误
        socket_.send_to(buffer(query_), group_endpoint_);
    } catch (const boost::system::system_error& e) {
        boost::system::error_code ignored;
        socket_.close(ignored);
        throw DiscoveryError("Failed to browse " + std::string(service_type) + ": " + e.what());
    }
    spdlog::debug("mDNS: browsing for {}", resolver_.service_type());

    co_spawn(io_context_, listener(), detached);
    co_spawn(io_context_, querier(), detached);
    io_thread_ = std::thread([this]() {
        try {
            io_context_.run();
        } catch (const std::exception& e) {
            spdlog::error("mDNS io thread stopped: {}", e.what());
        }
        channel_.Close();
    });
}

MdnsSubscription::~MdnsSubscription() {
    Stop();
}

void MdnsSubscription::openSocket() {
    ip::udp::endpoint listen_endpoint(ip::address_v4::any(), mdns::kPort);
    socket_.open(listen_endpoint.protocol());
    socket_.set_option(socket_base::reuse_address(true));
    socket_.bind(listen_endpoint);
    socket_.set_option(ip::multicast::join_group(group_endpoint_.address()));
    socket_.set_option(ip::multicast::enable_loopback(true));
    socket_.set_option(ip::multicast::hops(255));
}

std::optional<ServiceEvent> MdnsSubscription::Receive(std::chrono::milliseconds timeout) {
    return channel_.Receive(timeout);
}

void MdnsSubscription::Stop() {
    std::call_once(stop_flag_, [this]() {
        post(io_context_, [this]() {
            boost::system::error_code ec;
            query_timer_.cancel();
            socket_.close(ec);
            if (ec) {
                spdlog::debug("mDNS: socket close notice: {}", ec.message());
            }
        });
        if (io_thread_.joinable()) {
            io_thread_.join();
        }
        channel_.Close();
        spdlog::debug("mDNS: browse stopped");
    });
}

awaitable<void> MdnsSubscription::querier() {
    try {
        while (socket_.is_open()) {
            query_timer_.expires_after(mdns::kRequeryInterval);
            co_await query_timer_.async_wait(use_awaitable);
            co_await socket_.async_send_to(buffer(query_), group_endpoint_, use_awaitable);
            spdlog::trace("mDNS: re-sent query for {}", resolver_.service_type());
        }
    } catch (const boost::system::system_error& e) {
        if (e.code() != error::operation_aborted && e.code() != error::bad_descriptor) {
            spdlog::warn("mDNS: query loop stopped: {}", e.what());
        }
    }
}

awaitable<void> MdnsSubscription::listener() {
    std::array<std::uint8_t, mdns::kMaxPacketSize> recv_buffer;
    ip::udp::endpoint sender_endpoint;
    try {
        while (socket_.is_open()) {
            std::size_t bytes_received = co_await socket_.async_receive_from(buffer(recv_buffer),
                                                                             sender_endpoint,
                                                                             use_awaitable);
            auto message = dns::ParseMessage(recv_buffer.data(), bytes_received);
            if (!message) {
                spdlog::debug("mDNS: dropped malformed packet from {}",
                              sender_endpoint.address().to_string());
                continue;
            }
            for (auto& event : resolver_.Apply(*message)) {
                channel_.Push(std::move(event));
            }
        }
    } catch (const boost::system::system_error& e) {
        if (e.code() != error::operation_aborted && e.code() != error::bad_descriptor) {
            spdlog::warn("mDNS: listener stopped: {}", e.what());
        }
    }
}

} // namespace wledbackup::core
