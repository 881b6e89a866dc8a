#pragma once

#include <boost/asio/ip/address.hpp>
#include <core/model/service_event.h>
#include <core/network/discovery/dns_message.h>
#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace wledbackup::core {

// Joins PTR -> SRV -> A/AAAA records of one service type across packets and turns
// them into service events. Not thread-safe; owned by the browser's io thread.
class ServiceResolver {
public:
    explicit ServiceResolver(std::string_view service_type);

    std::vector<ServiceEvent> Apply(const dns::Message& message);

    const std::string& service_type() const { return service_type_; }

private:
    struct InstanceEntry {
        std::string fullname;
        std::optional<std::string> target; // SRV target as advertised
        std::uint16_t port = 0;
        std::optional<DeviceRecord> last_resolved;
    };

    bool belongsToService(const std::string& canonical_instance) const;
    InstanceEntry& trackInstance(const std::string& fullname, std::vector<ServiceEvent>& events);

    std::string service_type_; // canonical
    std::map<std::string, InstanceEntry> instances_;
    std::map<std::string, std::set<boost::asio::ip::address>> host_addresses_;
};

} // namespace wledbackup::core
