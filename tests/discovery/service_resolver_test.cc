#include <catch2/catch.hpp>
#include <core/network/discovery/service_resolver.h>
#include <string>
#include <vector>

using namespace wledbackup::core;

namespace {

constexpr const char* kServiceType = "_wled._tcp.local.";

dns::ResourceRecord ptr(const std::string& instance, std::uint32_t ttl = 4500) {
    dns::ResourceRecord record;
    record.name = kServiceType;
    record.type = static_cast<std::uint16_t>(dns::RecordType::kPtr);
    record.rrclass = dns::kClassIn;
    record.ttl = ttl;
    record.target = instance;
    return record;
}

dns::ResourceRecord srv(const std::string& instance, const std::string& host, std::uint16_t port) {
    dns::ResourceRecord record;
    record.name = instance;
    record.type = static_cast<std::uint16_t>(dns::RecordType::kSrv);
    record.rrclass = dns::kClassIn;
    record.ttl = 120;
    record.target = host;
    record.port = port;
    return record;
}

dns::ResourceRecord a(const std::string& host, const std::string& address) {
    dns::ResourceRecord record;
    record.name = host;
    record.type = static_cast<std::uint16_t>(dns::RecordType::kA);
    record.rrclass = dns::kClassIn;
    record.ttl = 120;
    record.address = boost::asio::ip::make_address(address);
    return record;
}

dns::Message response(std::vector<dns::ResourceRecord> records) {
    dns::Message message;
    message.flags = 0x8400;
    message.records = std::move(records);
    return message;
}

std::vector<ServiceEventType> typesOf(const std::vector<ServiceEvent>& events) {
    std::vector<ServiceEventType> types;
    for (const auto& event : events) {
        types.push_back(event.type);
    }
    return types;
}

} // namespace

TEST_CASE("A complete announcement resolves in one packet", "[discovery][resolver]") {
    ServiceResolver resolver(kServiceType);

    auto events = resolver.Apply(response({ptr("kitchen._wled._tcp.local."),
                                           srv("kitchen._wled._tcp.local.", "wled-kitchen.local.", 80),
                                           a("wled-kitchen.local.", "192.168.1.20")}));

    REQUIRE(typesOf(events)
            == std::vector<ServiceEventType>{ServiceEventType::kServiceFound,
                                             ServiceEventType::kServiceResolved});
    const auto& record = events[1].record;
    REQUIRE(record.fullname == "kitchen._wled._tcp.local.");
    REQUIRE(record.hostname == "wled-kitchen.local.");
    REQUIRE(record.port == 80);
    REQUIRE(record.addresses.count(boost::asio::ip::make_address("192.168.1.20")) == 1);
}

TEST_CASE("Records spread over several packets are joined", "[discovery][resolver]") {
    ServiceResolver resolver(kServiceType);

    REQUIRE(typesOf(resolver.Apply(response({ptr("desk._wled._tcp.local.")})))
            == std::vector<ServiceEventType>{ServiceEventType::kServiceFound});
    REQUIRE(resolver.Apply(response({srv("desk._wled._tcp.local.", "desk.local.", 80)})).empty());

    auto events = resolver.Apply(response({a("DESK.local.", "10.0.0.7")}));

    REQUIRE(events.size() == 1);
    REQUIRE(events[0].type == ServiceEventType::kServiceResolved);
    REQUIRE(events[0].record.hostname == "desk.local.");
}

TEST_CASE("Repeated identical announcements resolve once", "[discovery][resolver]") {
    ServiceResolver resolver(kServiceType);
    auto packet = response({ptr("desk._wled._tcp.local."),
                            srv("desk._wled._tcp.local.", "desk.local.", 80),
                            a("desk.local.", "10.0.0.7")});

    REQUIRE(resolver.Apply(packet).size() == 2);
    REQUIRE(resolver.Apply(packet).empty());

    auto events = resolver.Apply(response({a("desk.local.", "10.0.0.8")}));
    REQUIRE(events.size() == 1);
    REQUIRE(events[0].record.addresses.size() == 2);
}

TEST_CASE("Other service types and queries are ignored", "[discovery][resolver]") {
    ServiceResolver resolver(kServiceType);

    dns::ResourceRecord foreign = ptr("printer._ipp._tcp.local.");
    foreign.name = "_ipp._tcp.local.";
    REQUIRE(resolver.Apply(response({foreign,
                                     srv("printer._ipp._tcp.local.", "printer.local.", 631),
                                     a("printer.local.", "10.0.0.9")}))
                .empty());

    dns::Message query = response({ptr("kitchen._wled._tcp.local.")});
    query.flags = 0;
    REQUIRE(resolver.Apply(query).empty());
}

TEST_CASE("A goodbye PTR removes the instance", "[discovery][resolver]") {
    ServiceResolver resolver(kServiceType);
    resolver.Apply(response({ptr("desk._wled._tcp.local.")}));

    auto events = resolver.Apply(response({ptr("desk._wled._tcp.local.", 0)}));

    REQUIRE(events.size() == 1);
    REQUIRE(events[0].type == ServiceEventType::kServiceRemoved);
    REQUIRE(events[0].record.fullname == "desk._wled._tcp.local.");
    REQUIRE(resolver.Apply(response({ptr("desk._wled._tcp.local.", 0)})).empty());
}
