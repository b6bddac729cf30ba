#pragma once

#include "core/services/IDiscoveryScanner.hpp"
#include "core/types/NetworkInterface.hpp"
#include "core/types/Subnet.hpp"
#include "infrastructure/network/AsioContext.hpp"

#include <chrono>
#include <functional>
#include <string>
#include <vector>

namespace signfleet::infra {

/**
 * @brief Dial limits for DiscoveryScanner.
 */
struct DiscoveryScannerConfig {
    std::chrono::milliseconds dialTimeout{500}; ///< Timeout of one TCP dial.
    int maxConcurrency{50};                     ///< Dials in flight per scan.
};

/**
 * @brief One subnet to sweep and the local address to skip in it.
 */
struct ScanTarget {
    core::Subnet subnet;
    std::string ownAddress;

    bool operator==(const ScanTarget& other) const = default;
};

/**
 * @brief Finds peers by dialing every address of the local subnets.
 *
 * Each subnet is swept by its own driver thread. Dials are asynchronous
 * connects on the shared AsioContext, one strand per dial, bounded by a
 * counting semaphore per scan. When the token fires, drivers stop issuing
 * dials and in-flight sockets are closed.
 */
class DiscoveryScanner : public core::IDiscoveryScanner {
public:
    using InterfaceSource = std::function<std::vector<core::NetworkInterface>()>;

    /**
     * @brief Constructs a scanner.
     * @param context I/O pool the dials run on; must outlive every scan.
     * @param config Dial timeout and concurrency.
     * @param interfaces Source of local interface addresses.
     */
    explicit DiscoveryScanner(AsioContext& context, DiscoveryScannerConfig config = {},
                              InterfaceSource interfaces = &core::NetworkInterfaceEnumerator::scannable);

    std::shared_ptr<core::CandidateStream> scan(uint16_t port, const std::string& overrideAddress,
                                                const core::CancellationToken& token) override;

    /**
     * @brief Computes the subnets a scan covers.
     *
     * An override address yields the /24 around it. Otherwise every
     * interface address yields its scan range (see Subnet::scanRange);
     * duplicate ranges are swept once.
     *
     * @throws core::InvalidAddressError for a malformed override.
     */
    static std::vector<ScanTarget> planTargets(const std::string& overrideAddress,
                                               const std::vector<core::NetworkInterface>& interfaces);

private:
    AsioContext& context_;
    DiscoveryScannerConfig config_;
    InterfaceSource interfaces_;
};

} // namespace signfleet::infra
