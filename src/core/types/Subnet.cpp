#include "core/types/Subnet.hpp"

#include "core/types/Errors.hpp"
#include "core/types/Host.hpp"

#include <sstream>
#include <stdexcept>

namespace signfleet::core {

Subnet::Subnet(uint32_t network, int prefixLength) : prefixLength_(prefixLength) {
    if (prefixLength < 0 || prefixLength > 32) {
        throw std::invalid_argument("prefix length out of range: " + std::to_string(prefixLength));
    }
    network_ = network & mask();
}

Subnet Subnet::containing(const std::string& address, int prefixLength) {
    return Subnet(parseAddress(address), prefixLength);
}

Subnet Subnet::scanRange(const std::string& address, int prefixLength) {
    if (prefixLength < MinScanPrefix) {
        prefixLength = 24;
    }
    return containing(address, prefixLength);
}

std::vector<std::string> Subnet::hosts(const std::string& exclude) const {
    std::vector<std::string> result;
    if (prefixLength_ >= 31) {
        return result;
    }

    uint32_t first = network_ + 1;
    uint32_t last = (network_ | ~mask()) - 1;
    result.reserve(last - first + 1);
    for (uint32_t addr = first; addr <= last; ++addr) {
        auto text = formatAddress(addr);
        if (text != exclude) {
            result.push_back(std::move(text));
        }
    }
    return result;
}

bool Subnet::contains(const std::string& address) const {
    if (!isValidIpv4(address)) {
        return false;
    }
    return (parseAddress(address) & mask()) == network_;
}

std::string Subnet::networkAddress() const {
    return formatAddress(network_);
}

std::string Subnet::broadcastAddress() const {
    return formatAddress(network_ | ~mask());
}

uint32_t Subnet::hostCount() const {
    if (prefixLength_ >= 31) {
        return 0;
    }
    return (~mask()) - 1;
}

std::string Subnet::toString() const {
    return networkAddress() + "/" + std::to_string(prefixLength_);
}

uint32_t Subnet::parseAddress(const std::string& address) {
    if (!isValidIpv4(address)) {
        throw InvalidAddressError(address);
    }

    uint32_t result = 0;
    std::istringstream iss(address);
    std::string octet;
    while (std::getline(iss, octet, '.')) {
        result = (result << 8) | static_cast<uint32_t>(std::stoul(octet));
    }
    return result;
}

std::string Subnet::formatAddress(uint32_t address) {
    return std::to_string((address >> 24) & 0xFF) + "." + std::to_string((address >> 16) & 0xFF) +
           "." + std::to_string((address >> 8) & 0xFF) + "." + std::to_string(address & 0xFF);
}

uint32_t Subnet::mask() const {
    return prefixLength_ == 0 ? 0 : (0xFFFFFFFFu << (32 - prefixLength_));
}

} // namespace signfleet::core
