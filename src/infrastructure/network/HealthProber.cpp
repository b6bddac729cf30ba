#include "infrastructure/network/HealthProber.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace signfleet::infra {

namespace {

constexpr const char* ServiceOnline = "NSM Online";
constexpr const char* ServiceOffline = "NSM Offline";

} // namespace

HealthProber::HealthProber(HealthProberConfig config)
    : config_(std::move(config)), client_(config_.timeout) {}

core::Host HealthProber::probe(const core::Host& host, const core::CancellationToken& token) {
    core::Host result = host;
    result.primary = probeAddress(host.ipAddress, host.primary, token);
    if (!host.vpnIpAddress.empty()) {
        result.vpn = probeAddress(host.vpnIpAddress, host.vpn, token);
    }
    return result;
}

core::NetworkState HealthProber::probeAddress(const std::string& ip,
                                              const core::NetworkState& previous,
                                              const core::CancellationToken& token) const {
    core::NetworkState state = previous;
    state.lastChecked = std::chrono::system_clock::now();
    state.serviceStatus = ServiceOffline;
    if (state.dashboardUrl.empty()) {
        state.dashboardUrl = "http://" + ip + ":" + std::to_string(config_.managementPort);
    }

    if (!core::isValidIpv4(ip)) {
        state.status = core::HostStatus::Unreachable;
        state.cmsStatus = core::CmsStatus::Unknown;
        return state;
    }

    // Step 1: can we reach the management port at all
    auto connectError = client_.connect(ip, config_.managementPort, token);
    if (connectError != ConnectError::None) {
        state.cmsStatus = core::CmsStatus::Unknown;
        state.status = connectError == ConnectError::Refused ? core::HostStatus::ConnectionRefused
                                                             : core::HostStatus::Unreachable;
        spdlog::debug("Probe {}: {}", ip, connectErrorToString(connectError));
        return state;
    }

    // Step 2: content-management service, independent of the outcome below
    checkCms(ip, state, token);

    // Step 3: version
    auto version = client_.get(ip, config_.managementPort, "/api/version", token);
    bool stale = false;
    if (version.statusCode == 200) {
        try {
            auto json = nlohmann::json::parse(version.body);
            state.serviceVersion = json.value("version", "unknown");
            stale = core::compareVersions(state.serviceVersion, config_.localVersion) < 0;
        } catch (const nlohmann::json::exception&) {
            state.serviceVersion = "unknown";
            state.status = core::HostStatus::Unhealthy;
            return state;
        }
    } else {
        spdlog::debug("Probe {}: version check failed: {}", ip, version.errorMessage);
        state.serviceVersion = "unknown";
        state.status = core::HostStatus::Unhealthy;
        return state;
    }

    // Step 4: health
    auto health = client_.get(ip, config_.managementPort, "/api/health", token);
    if (health.statusCode == 200) {
        state.serviceStatus = ServiceOnline;
        state.status = stale ? core::HostStatus::Stale : core::HostStatus::Healthy;
    } else {
        state.status = stale ? core::HostStatus::Stale : core::HostStatus::Unhealthy;
    }
    return state;
}

void HealthProber::checkCms(const std::string& ip, core::NetworkState& state,
                            const core::CancellationToken& token) const {
    auto response = client_.get(ip, config_.cmsPort, "/api/v1/assets", token);
    if (response.statusCode != 200) {
        state.cmsStatus = core::CmsStatus::Offline;
        return;
    }

    state.cmsStatus = core::CmsStatus::Online;
    try {
        auto assets = nlohmann::json::parse(response.body);
        if (assets.is_array()) {
            state.assetCount = static_cast<int>(assets.size());
        }
    } catch (const nlohmann::json::exception& e) {
        spdlog::debug("CMS on {} returned a non-JSON asset list: {}", ip, e.what());
    }
}

} // namespace signfleet::infra
