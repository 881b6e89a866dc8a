#pragma once

#include <array>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/udp.hpp>
#include <boost/asio/steady_timer.hpp>
#include <core/constant/transfer.h>
#include <core/network/discovery/discovery_service.h>
#include <core/network/discovery/event_channel.h>
#include <core/network/discovery/service_resolver.h>
#include <cstdint>
#include <mutex>
#include <thread>
#include <vector>

namespace wledbackup::core {

// Browses a DNS-SD service type over IPv4 multicast DNS.
class MdnsBrowser : public DiscoveryService {
public:
    MdnsBrowser() = default;

    std::unique_ptr<Subscription> Browse(std::string_view service_type) override;
};

// One running browse: a socket joined to 224.0.0.251:5353 plus the io thread serving it.
class MdnsSubscription : public Subscription {
public:
    explicit MdnsSubscription(std::string_view service_type);
    ~MdnsSubscription() override;

    MdnsSubscription(const MdnsSubscription&) = delete;
    MdnsSubscription& operator=(const MdnsSubscription&) = delete;

    std::optional<ServiceEvent> Receive(std::chrono::milliseconds timeout) override;

    void Stop() override;

private:
    // 协程任务
    boost::asio::awaitable<void> querier();
    boost::asio::awaitable<void> listener();

    void openSocket();

    boost::asio::io_context io_context_;
    boost::asio::ip::udp::socket socket_;
    boost::asio::steady_timer query_timer_;
    boost::asio::ip::udp::endpoint group_endpoint_;
    std::vector<std::uint8_t> query_;
    ServiceResolver resolver_;
    EventChannel channel_;
    std::thread io_thread_;
    std::once_flag stop_flag_;
};

} // namespace wledbackup::core
