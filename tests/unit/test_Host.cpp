#include <catch2/catch_test_macros.hpp>

#include "core/types/Host.hpp"

using namespace signfleet::core;

TEST_CASE("Host status string conversions", "[Host][Status]") {
    SECTION("Every status round-trips through its wire name") {
        for (auto status : {HostStatus::Unknown, HostStatus::Healthy, HostStatus::Unhealthy,
                            HostStatus::ConnectionRefused, HostStatus::Unreachable,
                            HostStatus::Stale}) {
            REQUIRE(hostStatusFromString(hostStatusToString(status)) == status);
        }
    }

    SECTION("Wire names use the spaced form") {
        REQUIRE(hostStatusToString(HostStatus::ConnectionRefused) == "Connection Refused");
        REQUIRE(hostStatusToString(HostStatus::Stale) == "Stale");
    }

    SECTION("Unrecognised text maps to Unknown") {
        REQUIRE(hostStatusFromString("") == HostStatus::Unknown);
        REQUIRE(hostStatusFromString("healthy") == HostStatus::Unknown);
        REQUIRE(cmsStatusFromString("Sleeping") == CmsStatus::Unknown);
    }

    SECTION("CMS status names") {
        REQUIRE(cmsStatusToString(CmsStatus::Online) == "Online");
        REQUIRE(cmsStatusToString(CmsStatus::Offline) == "Offline");
        REQUIRE(cmsStatusFromString("Online") == CmsStatus::Online);
    }
}

TEST_CASE("IPv4 validation", "[Host][Validation]") {
    SECTION("Accepts dotted quads") {
        REQUIRE(isValidIpv4("192.168.1.10"));
        REQUIRE(isValidIpv4("0.0.0.0"));
        REQUIRE(isValidIpv4("255.255.255.255"));
        REQUIRE(isValidIpv4("127.0.0.1"));
    }

    SECTION("Rejects malformed text") {
        REQUIRE_FALSE(isValidIpv4(""));
        REQUIRE_FALSE(isValidIpv4("192.168.1"));
        REQUIRE_FALSE(isValidIpv4("192.168.1.1.1"));
        REQUIRE_FALSE(isValidIpv4("192.168.1.256"));
        REQUIRE_FALSE(isValidIpv4("192.168..1"));
        REQUIRE_FALSE(isValidIpv4("192.168.1.1."));
        REQUIRE_FALSE(isValidIpv4("a.b.c.d"));
        REQUIRE_FALSE(isValidIpv4(" 10.0.0.1"));
        REQUIRE_FALSE(isValidIpv4("1000.0.0.1"));
    }

    SECTION("Host validity requires a primary and an optional valid VPN address") {
        Host host;
        host.ipAddress = "10.0.0.5";
        REQUIRE(host.isValid());

        host.vpnIpAddress = "100.64.0.5";
        REQUIRE(host.isValid());

        host.vpnIpAddress = "not-an-ip";
        REQUIRE_FALSE(host.isValid());

        host.vpnIpAddress.clear();
        host.ipAddress.clear();
        REQUIRE_FALSE(host.isValid());
    }
}

TEST_CASE("Host defaults and helpers", "[Host]") {
    SECTION("withDefaults describes a never-probed node") {
        auto host = Host::withDefaults("10.1.2.3", 8080);
        REQUIRE(host.ipAddress == "10.1.2.3");
        REQUIRE(host.primary.status == HostStatus::Unreachable);
        REQUIRE(host.primary.serviceStatus == "NSM Offline");
        REQUIRE(host.primary.serviceVersion == "unknown");
        REQUIRE(host.primary.cmsStatus == CmsStatus::Unknown);
        REQUIRE(host.primary.dashboardUrl == "http://10.1.2.3:8080");
        REQUIRE_FALSE(host.primary.lastChecked.has_value());
        REQUIRE(host.id.empty());
    }

    SECTION("key prefers the id") {
        Host host;
        host.ipAddress = "10.0.0.1";
        REQUIRE(host.key() == "10.0.0.1");
        host.id = "node-a";
        REQUIRE(host.key() == "node-a");
    }

    SECTION("copyNetworkState leaves descriptive fields alone") {
        Host target;
        target.id = "a";
        target.nickname = "Lobby";
        target.ipAddress = "10.0.0.1";

        Host probed;
        probed.id = "b";
        probed.nickname = "Other";
        probed.ipAddress = "10.0.0.2";
        probed.primary.status = HostStatus::Healthy;
        probed.primary.assetCount = 7;
        probed.vpn.status = HostStatus::ConnectionRefused;

        target.copyNetworkState(probed);
        REQUIRE(target.id == "a");
        REQUIRE(target.nickname == "Lobby");
        REQUIRE(target.ipAddress == "10.0.0.1");
        REQUIRE(target.primary.status == HostStatus::Healthy);
        REQUIRE(target.primary.assetCount == 7);
        REQUIRE(target.vpn.status == HostStatus::ConnectionRefused);
    }
}

TEST_CASE("Version comparison", "[Host][Version]") {
    REQUIRE(compareVersions("1.2.3", "1.2.3") == 0);
    REQUIRE(compareVersions("1.2.3", "1.2.4") < 0);
    REQUIRE(compareVersions("1.10.0", "1.9.9") > 0);
    REQUIRE(compareVersions("v2.0", "2.0.0") == 0);
    REQUIRE(compareVersions("1.2", "1.2.1") < 0);
    REQUIRE(compareVersions("1.4.0-beta", "1.4.0") == 0);
    REQUIRE(compareVersions("unknown", "0.0.1") < 0);
}
