#pragma once

#include <boost/asio/ip/address.hpp>
#include <chrono>
#include <core/constant/transfer.h>
#include <cstdint>
#include <string>
#include <string_view>

namespace wledbackup::core {

struct FetchResponse {
    unsigned int status = 0;
    std::string body; // raw bytes, untouched
};

// Blocking GET of one resource from a device.
class ResourceFetcher {
public:
    virtual ~ResourceFetcher() = default;

    // Throws BackupError(kTransport) when no response could be obtained. Any HTTP
    // status, including errors, is returned to the caller.
    virtual FetchResponse Fetch(const boost::asio::ip::address& address,
                                std::uint16_t port,
                                std::string_view target)
        = 0;
};

class HttpResourceFetcher : public ResourceFetcher {
public:
    explicit HttpResourceFetcher(std::chrono::seconds timeout = transfer::kDefaultHttpTimeout);

    FetchResponse Fetch(const boost::asio::ip::address& address,
                        std::uint16_t port,
                        std::string_view target) override;

private:
    std::chrono::seconds timeout_;
};

// "http://host:port/target" for logs and error messages.
std::string DescribeUrl(const boost::asio::ip::address& address,
                        std::uint16_t port,
                        std::string_view target);

} // namespace wledbackup::core
