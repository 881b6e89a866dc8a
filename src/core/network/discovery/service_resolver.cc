#include <core/network/discovery/service_resolver.h>
#include <spdlog/spdlog.h>

namespace wledbackup::core {

ServiceResolver::ServiceResolver(std::string_view service_type)
    : service_type_(dns::CanonicalName(service_type)) {}

bool ServiceResolver::belongsToService(const std::string& canonical_instance) const {
    return canonical_instance.size() > service_type_.size() + 1
           && canonical_instance.compare(canonical_instance.size() - service_type_.size(),
                                         service_type_.size(),
                                         service_type_)
                  == 0
           && canonical_instance[canonical_instance.size() - service_type_.size() - 1] == '.';
}

ServiceResolver::InstanceEntry& ServiceResolver::trackInstance(const std::string& fullname,
                                                               std::vector<ServiceEvent>& events) {
    auto key = dns::CanonicalName(fullname);
    auto it = instances_.find(key);
    if (it == instances_.end()) {
        it = instances_.emplace(key, InstanceEntry{.fullname = fullname}).first;
        spdlog::debug("mDNS: found instance {}", fullname);
        events.push_back(ServiceEvent{.type = ServiceEventType::kServiceFound,
                                      .record = DeviceRecord{.fullname = fullname}});
    }
    return it->second;
}

std::vector<ServiceEvent> ServiceResolver::Apply(const dns::Message& message) {
    std::vector<ServiceEvent> events;
    if (!message.IsResponse()) {
        return events;
    }

    for (const auto& record : message.records) {
        if (record.Is(dns::RecordType::kPtr)) {
            if (dns::CanonicalName(record.name) != service_type_) {
                continue;
            }
            if (record.ttl == 0) {
                auto it = instances_.find(dns::CanonicalName(record.target));
                if (it != instances_.end()) {
                    spdlog::debug("mDNS: instance {} said goodbye", record.target);
                    events.push_back(ServiceEvent{.type = ServiceEventType::kServiceRemoved,
                                                  .record = DeviceRecord{.fullname = it->second.fullname}});
                    instances_.erase(it);
                }
                continue;
            }
            trackInstance(record.target, events);
        } else if (record.Is(dns::RecordType::kSrv)) {
            if (!belongsToService(dns::CanonicalName(record.name)) || record.ttl == 0) {
                continue;
            }
            auto& entry = trackInstance(record.name, events);
            entry.target = record.target;
            entry.port = record.port;
        } else if ((record.Is(dns::RecordType::kA) || record.Is(dns::RecordType::kAaaa))
                   && record.address) {
            auto& addresses = host_addresses_[dns::CanonicalName(record.name)];
            if (record.ttl == 0) {
                addresses.erase(*record.address);
            } else {
                addresses.insert(*record.address);
            }
        }
    }

    for (auto& [key, entry] : instances_) {
        if (!entry.target) {
            continue;
        }
        auto host = host_addresses_.find(dns::CanonicalName(*entry.target));
        if (host == host_addresses_.end() || host->second.empty()) {
            continue;
        }
        DeviceRecord resolved{.fullname = entry.fullname,
                              .hostname = *entry.target,
                              .addresses = host->second,
                              .port = entry.port};
        if (entry.last_resolved && *entry.last_resolved == resolved) {
            continue;
        }
        entry.last_resolved = resolved;
        spdlog::debug("mDNS: resolved {} -> {}:{}", resolved.fullname, resolved.hostname, resolved.port);
        events.push_back(ServiceEvent{.type = ServiceEventType::kServiceResolved,
                                      .record = std::move(resolved)});
    }
    return events;
}

} // namespace wledbackup::core
