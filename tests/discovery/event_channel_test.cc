#include <catch2/catch.hpp>
#include <chrono>
#include <core/network/discovery/event_channel.h>
#include <thread>

using namespace wledbackup::core;
using namespace std::chrono_literals;

namespace {

ServiceEvent resolved(const std::string& hostname) {
    return ServiceEvent{.type = ServiceEventType::kServiceResolved,
                        .record = DeviceRecord{.fullname = hostname, .hostname = hostname}};
}

} // namespace

TEST_CASE("Events are received in push order", "[discovery][channel]") {
    EventChannel channel;
    channel.Push(resolved("a.local."));
    channel.Push(resolved("b.local."));

    REQUIRE(channel.Receive(10ms)->record.hostname == "a.local.");
    REQUIRE(channel.Receive(10ms)->record.hostname == "b.local.");
    REQUIRE_FALSE(channel.Receive(10ms).has_value());
}

TEST_CASE("Receive wakes up for an event pushed from another thread", "[discovery][channel]") {
    EventChannel channel;
    std::thread producer([&channel]() {
        std::this_thread::sleep_for(20ms);
        channel.Push(resolved("late.local."));
    });

    auto event = channel.Receive(5s);
    producer.join();

    REQUIRE(event.has_value());
    REQUIRE(event->record.hostname == "late.local.");
}

TEST_CASE("A closed channel drains and then stops blocking", "[discovery][channel]") {
    EventChannel channel;
    channel.Push(resolved("a.local."));
    channel.Close();

    REQUIRE(channel.closed());
    REQUIRE(channel.Receive(10ms).has_value());

    auto start = std::chrono::steady_clock::now();
    REQUIRE_FALSE(channel.Receive(5s).has_value());
    REQUIRE(std::chrono::steady_clock::now() - start < 1s);

    channel.Push(resolved("ignored.local."));
    REQUIRE_FALSE(channel.Receive(10ms).has_value());
}
