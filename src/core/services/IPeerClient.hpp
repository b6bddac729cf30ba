/**
 * @file IPeerClient.hpp
 * @brief Interface for talking to another fleet node.
 */

#pragma once

#include "core/concurrency/CancellationToken.hpp"
#include "core/types/Host.hpp"

#include <string>
#include <vector>

namespace signfleet::core {

/**
 * @brief Identity a peer reports about itself.
 */
struct PeerIdentity {
    std::string id;       ///< Node identifier; empty for nodes that predate ids
    std::string version;  ///< Management service version
    std::string hostname; ///< Host name, may be empty
};

/**
 * @brief Interface for the peer-to-peer calls used by fleet synchronization.
 *
 * Every call throws PeerUnreachableError when the peer cannot be reached or
 * answers with an error status.
 */
class IPeerClient {
public:
    virtual ~IPeerClient() = default;

    /**
     * @brief Fetches the peer's description of its own record.
     * @param ip Address of the peer.
     * @param token Cancellation for the request.
     * @return The peer's self-description.
     */
    virtual Host fetchSelfDescription(const std::string& ip, const CancellationToken& token) = 0;

    /**
     * @brief Fetches the lighter identification reply.
     */
    virtual PeerIdentity fetchIdentity(const std::string& ip, const CancellationToken& token) = 0;

    /**
     * @brief Delivers a roster to the peer's receive endpoint.
     * @param ip Address of the peer.
     * @param hosts Records to deliver.
     * @param merge True to merge into the peer's roster, false to replace it.
     * @param token Cancellation for the request.
     */
    virtual void pushRoster(const std::string& ip, const std::vector<Host>& hosts, bool merge,
                            const CancellationToken& token) = 0;
};

} // namespace signfleet::core
