#pragma once

#include "core/Version.hpp"
#include "core/services/IHealthProber.hpp"
#include "infrastructure/network/HttpClient.hpp"

#include <chrono>
#include <cstdint>
#include <string>

namespace signfleet::infra {

/**
 * @brief Ports and limits used by HealthProber.
 */
struct HealthProberConfig {
    uint16_t managementPort{8080};             ///< Port of the peer management service.
    uint16_t cmsPort{80};                      ///< Port of the content-management service.
    std::chrono::milliseconds timeout{3000};   ///< Per-check timeout.
    std::string localVersion{core::Version};   ///< Peers older than this are Stale.
};

/**
 * @brief Layered TCP and HTTP health checks.
 *
 * Per network path: TCP connect to the management port, CMS asset listing,
 * version query, health query. Each step uses its own bounded request.
 */
class HealthProber : public core::IHealthProber {
public:
    explicit HealthProber(HealthProberConfig config = {});

    core::Host probe(const core::Host& host, const core::CancellationToken& token) override;

    /**
     * @brief Probes a single address.
     * @param ip Address to check.
     * @param previous Current state; fields the probe does not own are kept.
     * @param token Cancellation for every request of the probe.
     * @return Updated state with lastChecked set to now.
     */
    core::NetworkState probeAddress(const std::string& ip, const core::NetworkState& previous,
                                    const core::CancellationToken& token) const;

    const HealthProberConfig& config() const { return config_; }

private:
    void checkCms(const std::string& ip, core::NetworkState& state,
                  const core::CancellationToken& token) const;

    HealthProberConfig config_;
    HttpClient client_;
};

} // namespace signfleet::infra
