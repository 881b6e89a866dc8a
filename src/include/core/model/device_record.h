#pragma once

#include <boost/asio/ip/address.hpp>
#include <cstdint>
#include <set>
#include <string>

namespace wledbackup::core {

// One controller as resolved from its service announcement.
struct DeviceRecord {
    std::string fullname; // 服务实例名, e.g. "kitchen._wled._tcp.local."
    std::string hostname; // SRV target, e.g. "kitchen.local."
    std::set<boost::asio::ip::address> addresses;
    std::uint16_t port = 0;

    bool operator==(const DeviceRecord&) const = default;
};

} // namespace wledbackup::core
