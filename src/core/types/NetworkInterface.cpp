#include "core/types/NetworkInterface.hpp"

#include <cstdint>

#ifdef __linux__
#include <arpa/inet.h>
#include <ifaddrs.h>
#include <net/if.h>
#include <netinet/in.h>
#include <sys/socket.h>
#endif

namespace signfleet::core {

bool NetworkInterface::isLinkLocal() const {
    return ipAddress.rfind("169.254.", 0) == 0;
}

std::vector<NetworkInterface> NetworkInterfaceEnumerator::enumerate() {
    std::vector<NetworkInterface> interfaces;

#ifdef __linux__
    struct ifaddrs* ifaddr = nullptr;
    if (getifaddrs(&ifaddr) == -1) {
        return interfaces;
    }

    for (struct ifaddrs* ifa = ifaddr; ifa != nullptr; ifa = ifa->ifa_next) {
        if (ifa->ifa_addr == nullptr || ifa->ifa_addr->sa_family != AF_INET) {
            continue;
        }

        NetworkInterface iface;
        iface.name = ifa->ifa_name;
        iface.isUp = (ifa->ifa_flags & IFF_UP) != 0;
        iface.isLoopback = (ifa->ifa_flags & IFF_LOOPBACK) != 0;

        char ipStr[INET_ADDRSTRLEN];
        auto* addr = reinterpret_cast<struct sockaddr_in*>(ifa->ifa_addr);
        inet_ntop(AF_INET, &addr->sin_addr, ipStr, INET_ADDRSTRLEN);
        iface.ipAddress = ipStr;

        if (ifa->ifa_netmask != nullptr) {
            auto* mask = reinterpret_cast<struct sockaddr_in*>(ifa->ifa_netmask);
            inet_ntop(AF_INET, &mask->sin_addr, ipStr, INET_ADDRSTRLEN);
            iface.netmask = ipStr;
            iface.prefixLength = prefixFromNetmask(iface.netmask);
        }

        interfaces.push_back(std::move(iface));
    }

    freeifaddrs(ifaddr);
#endif

    return interfaces;
}

std::vector<NetworkInterface> NetworkInterfaceEnumerator::scannable() {
    std::vector<NetworkInterface> result;
    for (auto& iface : enumerate()) {
        if (iface.isUp && !iface.isLoopback && !iface.isLinkLocal() && iface.prefixLength > 0) {
            result.push_back(std::move(iface));
        }
    }
    return result;
}

int NetworkInterfaceEnumerator::prefixFromNetmask(const std::string& netmask) {
#ifdef __linux__
    in_addr addr{};
    if (inet_pton(AF_INET, netmask.c_str(), &addr) != 1) {
        return -1;
    }
    uint32_t mask = ntohl(addr.s_addr);
    int prefix = 0;
    while (prefix < 32 && (mask & (0x80000000u >> prefix)) != 0) {
        ++prefix;
    }
    // Remaining bits must all be zero
    uint32_t expected = prefix == 0 ? 0 : (0xFFFFFFFFu << (32 - prefix));
    return mask == expected ? prefix : -1;
#else
    (void)netmask;
    return -1;
#endif
}

} // namespace signfleet::core
