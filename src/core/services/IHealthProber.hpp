/**
 * @file IHealthProber.hpp
 * @brief Interface for classifying a host's reachability and service state.
 */

#pragma once

#include "core/concurrency/CancellationToken.hpp"
#include "core/types/Host.hpp"

namespace signfleet::core {

/**
 * @brief Interface for the health prober.
 *
 * Implementations are stateless: probing the same host twice performs the
 * same network checks twice.
 */
class IHealthProber {
public:
    virtual ~IHealthProber() = default;

    /**
     * @brief Probes every network path of a host.
     *
     * The primary address is always probed; the VPN address only when set.
     * Only probe-owned fields change: status, service text and version,
     * CMS status, asset count, the check time and a missing dashboard URL.
     *
     * @param host Record to probe.
     * @param token Abandons in-flight checks when fired.
     * @return Copy of host with refreshed network state.
     */
    virtual Host probe(const Host& host, const CancellationToken& token) = 0;
};

} // namespace signfleet::core
