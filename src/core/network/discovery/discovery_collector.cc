#include <core/network/discovery/discovery_collector.h>
#include <spdlog/spdlog.h>
#include <unordered_map>

namespace wledbackup::core {

DiscoveryCollector::DiscoveryCollector(DiscoveryService& service, std::string service_type)
    : service_(service)
    , service_type_(std::move(service_type))
    , device_found_callback_(
          [](const DeviceRecord& device) { spdlog::info("Discovered: {}", device.fullname); }) {}

void DiscoveryCollector::SetDeviceFoundCallback(std::function<void(const DeviceRecord&)> callback) {
    device_found_callback_ = callback;
}

std::vector<DeviceRecord> DiscoveryCollector::Collect(std::chrono::milliseconds time_budget) {
    auto subscription = service_.Browse(service_type_);

    // 同一设备可能在多个网卡上多次应答，按 hostname 去重，后到的覆盖先到的
    std::unordered_map<std::string, DeviceRecord> devices;
    while (auto event = subscription->Receive(time_budget)) {
        if (event->type != ServiceEventType::kServiceResolved) {
            spdlog::trace("Ignoring {} for {}",
                          ServiceEventTypeToString(event->type),
                          event->record.fullname);
            continue;
        }
        std::string hostname = event->record.hostname;
        auto [it, inserted] = devices.insert_or_assign(std::move(hostname), std::move(event->record));
        if (inserted && device_found_callback_) {
            device_found_callback_(it->second);
        }
    }
    subscription->Stop();

    std::vector<DeviceRecord> result;
    result.reserve(devices.size());
    for (auto& pair : devices) {
        result.push_back(std::move(pair.second));
    }
    spdlog::debug("Discovery finished with {} device(s)", result.size());
    return result;
}

} // namespace wledbackup::core
