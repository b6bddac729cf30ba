/**
 * @file IDiscoveryScanner.hpp
 * @brief Interface for finding live peers on local subnets.
 */

#pragma once

#include "core/concurrency/CancellationToken.hpp"
#include "core/concurrency/ResultStream.hpp"

#include <cstdint>
#include <memory>
#include <string>

namespace signfleet::core {

/**
 * @brief An address that accepted a connection on the peer port.
 */
struct DiscoveryCandidate {
    std::string ip;  ///< Address that answered
    uint16_t port{0}; ///< Port that accepted the connection

    bool operator==(const DiscoveryCandidate& other) const = default;
};

using CandidateStream = ResultStream<DiscoveryCandidate>;

/**
 * @brief Interface for the discovery scanner.
 */
class IDiscoveryScanner {
public:
    virtual ~IDiscoveryScanner() = default;

    /**
     * @brief Starts a scan and returns its result stream immediately.
     *
     * Candidates are pushed as they are found. The stream closes once every
     * subnet has been scanned or the token fires, whichever is first.
     *
     * @param port TCP port to dial on each candidate address.
     * @param overrideAddress When non-empty, scan only the /24 around it.
     * @param token Deadline and cancellation for the whole scan.
     * @return Stream of candidates; a new scan needs a new call.
     */
    virtual std::shared_ptr<CandidateStream> scan(uint16_t port,
                                                  const std::string& overrideAddress,
                                                  const CancellationToken& token) = 0;
};

} // namespace signfleet::core
