#include <catch2/catch_test_macros.hpp>

#include "core/types/Errors.hpp"
#include "core/types/NetworkInterface.hpp"
#include "core/types/Subnet.hpp"
#include "infrastructure/network/DiscoveryScanner.hpp"

#include <algorithm>
#include <stdexcept>

using namespace signfleet::core;
using signfleet::infra::DiscoveryScanner;

TEST_CASE("Subnet arithmetic", "[Subnet]") {
    SECTION("A /24 has 254 host addresses") {
        auto subnet = Subnet::containing("192.168.1.77", 24);
        REQUIRE(subnet.networkAddress() == "192.168.1.0");
        REQUIRE(subnet.broadcastAddress() == "192.168.1.255");
        REQUIRE(subnet.hostCount() == 254);
        REQUIRE(subnet.toString() == "192.168.1.0/24");

        auto hosts = subnet.hosts();
        REQUIRE(hosts.size() == 254);
        REQUIRE(hosts.front() == "192.168.1.1");
        REQUIRE(hosts.back() == "192.168.1.254");
    }

    SECTION("hosts skips the excluded address") {
        auto hosts = Subnet::containing("10.0.0.5", 24).hosts("10.0.0.5");
        REQUIRE(hosts.size() == 253);
        REQUIRE(std::find(hosts.begin(), hosts.end(), "10.0.0.5") == hosts.end());
    }

    SECTION("Point-to-point and single-host subnets have no scan candidates") {
        REQUIRE(Subnet::containing("10.0.0.1", 31).hosts().empty());
        REQUIRE(Subnet::containing("10.0.0.1", 32).hosts().empty());
    }

    SECTION("contains") {
        auto subnet = Subnet::containing("172.16.5.1", 23);
        REQUIRE(subnet.contains("172.16.4.10"));
        REQUIRE(subnet.contains("172.16.5.250"));
        REQUIRE_FALSE(subnet.contains("172.16.6.1"));
        REQUIRE_FALSE(subnet.contains("not-an-ip"));
    }

    SECTION("Rejects bad input") {
        REQUIRE_THROWS_AS(Subnet(0, 33), std::invalid_argument);
        REQUIRE_THROWS_AS(Subnet::containing("10.0.0", 24), InvalidAddressError);
    }
}

TEST_CASE("Subnet scan range clamping", "[Subnet][Discovery]") {
    SECTION("Narrow subnets are scanned whole") {
        REQUIRE(Subnet::scanRange("10.0.0.9", 24) == Subnet::containing("10.0.0.9", 24));
        REQUIRE(Subnet::scanRange("10.0.0.9", 23).hostCount() == 510);
        REQUIRE(Subnet::scanRange("10.0.0.9", 28).hostCount() == 14);
    }

    SECTION("Wide subnets are clamped to the local /24") {
        auto range = Subnet::scanRange("10.20.30.40", 16);
        REQUIRE(range.prefixLength() == 24);
        REQUIRE(range.networkAddress() == "10.20.30.0");

        REQUIRE(Subnet::scanRange("10.20.30.40", 8).hostCount() == 254);
    }
}

TEST_CASE("Interface helpers", "[NetworkInterface]") {
    SECTION("Netmask to prefix") {
        REQUIRE(NetworkInterfaceEnumerator::prefixFromNetmask("255.255.255.0") == 24);
        REQUIRE(NetworkInterfaceEnumerator::prefixFromNetmask("255.255.254.0") == 23);
        REQUIRE(NetworkInterfaceEnumerator::prefixFromNetmask("255.0.0.0") == 8);
        REQUIRE(NetworkInterfaceEnumerator::prefixFromNetmask("255.0.255.0") == -1);
    }

    SECTION("Link-local detection") {
        NetworkInterface iface;
        iface.ipAddress = "169.254.10.1";
        REQUIRE(iface.isLinkLocal());
        iface.ipAddress = "192.168.0.1";
        REQUIRE_FALSE(iface.isLinkLocal());
    }
}

TEST_CASE("Discovery target planning", "[Discovery]") {
    auto makeInterface = [](const std::string& ip, int prefix) {
        NetworkInterface iface;
        iface.name = "eth" + ip;
        iface.ipAddress = ip;
        iface.prefixLength = prefix;
        iface.isUp = true;
        return iface;
    };

    SECTION("An override scans only its /24") {
        auto targets = DiscoveryScanner::planTargets("192.168.50.20",
                                                     {makeInterface("10.0.0.1", 24)});
        REQUIRE(targets.size() == 1);
        REQUIRE(targets[0].subnet.toString() == "192.168.50.0/24");
        REQUIRE(targets[0].ownAddress == "192.168.50.20");
    }

    SECTION("A malformed override is rejected") {
        REQUIRE_THROWS_AS(DiscoveryScanner::planTargets("192.168.50", {}), InvalidAddressError);
    }

    SECTION("Each interface contributes its range once") {
        auto targets = DiscoveryScanner::planTargets(
            "", {makeInterface("10.0.0.1", 24), makeInterface("10.0.0.2", 24),
                 makeInterface("172.16.9.9", 12)});
        REQUIRE(targets.size() == 2);
        REQUIRE(targets[0].subnet.toString() == "10.0.0.0/24");
        REQUIRE(targets[1].subnet.toString() == "172.16.9.0/24");
        REQUIRE(targets[1].ownAddress == "172.16.9.9");
    }

    SECTION("Interfaces without a usable prefix are skipped") {
        REQUIRE(DiscoveryScanner::planTargets("", {makeInterface("10.0.0.1", 0)}).empty());
    }
}
