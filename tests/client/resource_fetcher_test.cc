#include "common/mock_device_server.h"

#include <catch2/catch.hpp>
#include <core/error/backup_error.h>
#include <core/network/client/resource_fetcher.h>

using namespace wledbackup::core;
using wledbackup::tests::common::MockDeviceServer;
using wledbackup::tests::common::UnusedPort;

namespace {

const auto kLoopback = boost::asio::ip::make_address("127.0.0.1");

} // namespace

TEST_CASE("Fetch returns the body unchanged", "[client][fetcher]") {
    const std::string body("{\"a\": 1}\n\0\x80", 11);
    MockDeviceServer server({{"/cfg.json", {200, body}}});
    HttpResourceFetcher fetcher(std::chrono::seconds(5));

    auto response = fetcher.Fetch(kLoopback, server.port(), "/cfg.json");

    REQUIRE(response.status == 200);
    REQUIRE(response.body == body);
    REQUIRE(server.requested_targets() == std::vector<std::string>{"/cfg.json"});
}

TEST_CASE("HTTP error statuses are returned, not thrown", "[client][fetcher]") {
    MockDeviceServer server({{"/cfg.json", {503, "busy"}}});
    HttpResourceFetcher fetcher(std::chrono::seconds(5));

    REQUIRE(fetcher.Fetch(kLoopback, server.port(), "/cfg.json").status == 503);
    REQUIRE(fetcher.Fetch(kLoopback, server.port(), "/presets.json").status == 404);
}

TEST_CASE("Unreachable devices raise a transport error", "[client][fetcher]") {
    HttpResourceFetcher fetcher(std::chrono::seconds(5));

    try {
        fetcher.Fetch(kLoopback, UnusedPort(), "/cfg.json");
        FAIL("expected BackupError");
    } catch (const BackupError& e) {
        REQUIRE(e.kind() == BackupErrorKind::kTransport);
        REQUIRE(std::string(e.what()).find("/cfg.json") != std::string::npos);
    }
}

TEST_CASE("URLs bracket IPv6 hosts", "[client][fetcher]") {
    REQUIRE(DescribeUrl(kLoopback, 80, "/cfg.json") == "http://127.0.0.1:80/cfg.json");
    REQUIRE(DescribeUrl(boost::asio::ip::make_address("fe80::1"), 8080, "/presets.json")
            == "http://[fe80::1]:8080/presets.json");
}
