#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>

namespace wledbackup::core {

namespace transfer {

constexpr std::size_t kMaxBodySize = 64 * 1024 * 1024; // 64 MB
constexpr std::chrono::seconds kDefaultHttpTimeout{30};
constexpr std::uint64_t kMaxHttpTimeoutSecs = 3600;

} // namespace transfer

namespace mdns {

constexpr std::uint16_t kPort = 5353;
constexpr const char* kGroupAddressV4 = "224.0.0.251";
constexpr std::size_t kMaxPacketSize = 9000;
constexpr std::chrono::seconds kRequeryInterval{1};
constexpr std::uint64_t kMaxSearchSecs = 86400; // 一天

} // namespace mdns

} // namespace wledbackup::core
