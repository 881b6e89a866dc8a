#pragma once

#include <boost/asio/ip/address.hpp>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace wledbackup::core::dns {

enum class RecordType : std::uint16_t {
    kA = 1,
    kPtr = 12,
    kTxt = 16,
    kAaaa = 28,
    kSrv = 33,
    kAny = 255,
};

constexpr std::uint16_t kClassIn = 1;
constexpr std::uint16_t kCacheFlushBit = 0x8000;
constexpr std::uint16_t kResponseFlag = 0x8000;

struct Question {
    std::string name;
    std::uint16_t type = 0;
    std::uint16_t rrclass = 0;
};

// A decoded resource record. Only the fields matching `type` are filled in.
struct ResourceRecord {
    std::string name; // absolute, with trailing dot
    std::uint16_t type = 0;
    std::uint16_t rrclass = 0; // cache-flush bit stripped
    std::uint32_t ttl = 0;

    std::string target;       // PTR / SRV
    std::uint16_t port = 0;   // SRV
    std::uint16_t priority = 0;
    std::uint16_t weight = 0;
    std::optional<boost::asio::ip::address> address; // A / AAAA
    std::vector<std::string> txt;

    bool Is(RecordType record_type) const { return type == static_cast<std::uint16_t>(record_type); }
};

struct Message {
    std::uint16_t id = 0;
    std::uint16_t flags = 0;
    std::vector<Question> questions;
    std::vector<ResourceRecord> records; // answers, authorities and additionals in wire order

    bool IsResponse() const { return (flags & kResponseFlag) != 0; }
};

// Builds a single-question query packet. `name` may omit the trailing dot.
std::vector<std::uint8_t> BuildQuery(std::string_view name, RecordType type, std::uint16_t id = 0);

// Returns nullopt for truncated or malformed packets. Record types other than
// A/AAAA/PTR/SRV/TXT are kept with only their header fields.
std::optional<Message> ParseMessage(const std::uint8_t* data, std::size_t size);

// ASCII lowercase with a guaranteed trailing dot, used as cache key.
std::string CanonicalName(std::string_view name);

} // namespace wledbackup::core::dns
