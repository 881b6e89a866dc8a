#include <catch2/catch.hpp>
#include <algorithm>
#include <chrono>
#include <core/error/backup_error.h>
#include <core/network/discovery/discovery_collector.h>
#include <deque>
#include <memory>
#include <string>
#include <vector>

using namespace wledbackup::core;
using namespace std::chrono_literals;

namespace {

// Replays a fixed event script, then reports the quiet period as a timeout.
class ScriptedSubscription : public Subscription {
public:
    ScriptedSubscription(std::deque<ServiceEvent> events,
                         std::vector<std::chrono::milliseconds>& timeouts,
                         bool& stopped)
        : events_(std::move(events))
        , timeouts_(timeouts)
        , stopped_(stopped) {}

    std::optional<ServiceEvent> Receive(std::chrono::milliseconds timeout) override {
        timeouts_.push_back(timeout);
        if (events_.empty()) {
            return std::nullopt;
        }
        ServiceEvent event = std::move(events_.front());
        events_.pop_front();
        return event;
    }

    void Stop() override { stopped_ = true; }

private:
    std::deque<ServiceEvent> events_;
    std::vector<std::chrono::milliseconds>& timeouts_;
    bool& stopped_;
};

class ScriptedService : public DiscoveryService {
public:
    std::deque<ServiceEvent> events;
    std::vector<std::chrono::milliseconds> timeouts;
    std::string browsed_type;
    bool stopped = false;
    bool fail = false;

    std::unique_ptr<Subscription> Browse(std::string_view service_type) override {
        if (fail) {
            throw DiscoveryError("Could not join mDNS group: no network");
        }
        browsed_type = service_type;
        return std::make_unique<ScriptedSubscription>(events, timeouts, stopped);
    }
};

ServiceEvent event(ServiceEventType type, const std::string& instance, const std::string& hostname, std::uint16_t port) {
    return ServiceEvent{.type = type,
                        .record = DeviceRecord{.fullname = instance + "._wled._tcp.local.",
                                               .hostname = hostname,
                                               .addresses = {boost::asio::ip::make_address("10.0.0.1")},
                                               .port = port}};
}

} // namespace

TEST_CASE("Collect deduplicates by hostname and keeps the last record", "[discovery][collector]") {
    ScriptedService service;
    service.events = {event(ServiceEventType::kServiceResolved, "a", "a.local.", 80),
                      event(ServiceEventType::kServiceResolved, "b", "b.local.", 80),
                      event(ServiceEventType::kServiceResolved, "a-again", "a.local.", 8080)};
    DiscoveryCollector collector(service, "_wled._tcp.local.");

    auto devices = collector.Collect(250ms);

    REQUIRE(service.browsed_type == "_wled._tcp.local.");
    REQUIRE(devices.size() == 2);
    auto a = std::find_if(devices.begin(), devices.end(), [](const DeviceRecord& d) {
        return d.hostname == "a.local.";
    });
    REQUIRE(a != devices.end());
    REQUIRE(a->port == 8080);
    REQUIRE(a->fullname == "a-again._wled._tcp.local.");
}

TEST_CASE("Every wait restarts the full quiet period", "[discovery][collector]") {
    ScriptedService service;
    service.events = {event(ServiceEventType::kServiceResolved, "a", "a.local.", 80),
                      event(ServiceEventType::kServiceFound, "b", "", 0)};
    DiscoveryCollector collector(service, "_wled._tcp.local.");

    collector.Collect(1500ms);

    REQUIRE(service.timeouts == std::vector<std::chrono::milliseconds>{1500ms, 1500ms, 1500ms});
    REQUIRE(service.stopped);
}

TEST_CASE("Only resolved events become devices", "[discovery][collector]") {
    ScriptedService service;
    service.events = {event(ServiceEventType::kServiceFound, "a", "", 0),
                      event(ServiceEventType::kServiceRemoved, "b", "b.local.", 80)};
    DiscoveryCollector collector(service, "_wled._tcp.local.");

    REQUIRE(collector.Collect(10ms).empty());
}

TEST_CASE("The found callback fires once per hostname", "[discovery][collector]") {
    ScriptedService service;
    service.events = {event(ServiceEventType::kServiceResolved, "a", "a.local.", 80),
                      event(ServiceEventType::kServiceResolved, "a", "a.local.", 80),
                      event(ServiceEventType::kServiceResolved, "b", "b.local.", 80)};
    DiscoveryCollector collector(service, "_wled._tcp.local.");
    std::vector<std::string> found;
    collector.SetDeviceFoundCallback([&found](const DeviceRecord& device) {
        found.push_back(device.hostname);
    });

    collector.Collect(10ms);

    REQUIRE(found == std::vector<std::string>{"a.local.", "b.local."});
}

TEST_CASE("A browse that cannot start propagates DiscoveryError", "[discovery][collector]") {
    ScriptedService service;
    service.fail = true;
    DiscoveryCollector collector(service, "_wled._tcp.local.");

    REQUIRE_THROWS_AS(collector.Collect(10ms), DiscoveryError);
}
