#pragma once

#include <chrono>
#include <core/model/device_record.h>
#include <core/network/discovery/discovery_service.h>
#include <functional>
#include <string>
#include <vector>

namespace wledbackup::core {

// Collects resolved devices until no event has arrived for a whole time budget.
class DiscoveryCollector {
public:
    DiscoveryCollector(DiscoveryService& service, std::string service_type);

    // Throws DiscoveryError if the browse cannot be started. The returned order is unspecified.
    std::vector<DeviceRecord> Collect(std::chrono::milliseconds time_budget);

    // Called the first time a hostname is added during a Collect().
    void SetDeviceFoundCallback(std::function<void(const DeviceRecord&)> callback);

private:
    DiscoveryService& service_;
    std::string service_type_;
    std::function<void(const DeviceRecord&)> device_found_callback_ = nullptr;
};

} // namespace wledbackup::core
