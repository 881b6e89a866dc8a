#pragma once

#include <chrono>
#include <core/model/service_event.h>
#include <memory>
#include <optional>
#include <string_view>

namespace wledbackup::core {

// An open browse operation. Destroying it releases the underlying resources.
class Subscription {
public:
    virtual ~Subscription() = default;

    virtual std::optional<ServiceEvent> Receive(std::chrono::milliseconds timeout) = 0;

    virtual void Stop() = 0;
};

class DiscoveryService {
public:
    virtual ~DiscoveryService() = default;

    // Throws DiscoveryError if the browse cannot be started.
    virtual std::unique_ptr<Subscription> Browse(std::string_view service_type) = 0;
};

} // namespace wledbackup::core
