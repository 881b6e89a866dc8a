#pragma once

#include "core/model/device_record.h"
#include <string>
#include <string_view>

namespace wledbackup::core {

enum class ServiceEventType {
    kServiceFound,    // PTR 记录首次出现，只有 fullname
    kServiceResolved, // SRV + 地址齐全，record 完整
    kServiceRemoved,  // goodbye 包 (TTL 为 0)
};

struct ServiceEvent {
    ServiceEventType type;
    DeviceRecord record;
};

inline std::string_view ServiceEventTypeToString(ServiceEventType type) {
    switch (type) {
    case ServiceEventType::kServiceFound:
        return "ServiceFound";
    case ServiceEventType::kServiceResolved:
        return "ServiceResolved";
    case ServiceEventType::kServiceRemoved:
        return "ServiceRemoved";
    }
    return "Unknown";
}

} // namespace wledbackup::core
