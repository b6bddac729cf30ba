#include "infrastructure/network/PeerClient.hpp"

#include "core/types/Errors.hpp"
#include "infrastructure/api/HostJson.hpp"

#include <spdlog/spdlog.h>

namespace signfleet::infra {

PeerClient::PeerClient(uint16_t port, std::chrono::milliseconds requestTimeout,
                       std::chrono::milliseconds pushTimeout)
    : port_(port), requestClient_(requestTimeout), pushClient_(pushTimeout) {}

nlohmann::json PeerClient::getJson(const std::string& ip, const std::string& target,
                                   const core::CancellationToken& token) const {
    auto response = requestClient_.get(ip, port_, target, token);
    if (!response.success) {
        throw core::PeerUnreachableError(ip, response.errorMessage);
    }

    try {
        return nlohmann::json::parse(response.body);
    } catch (const nlohmann::json::parse_error& e) {
        throw core::PeerUnreachableError(ip, std::string("invalid JSON from ") + target + ": " +
                                                 e.what());
    }
}

core::Host PeerClient::fetchSelfDescription(const std::string& ip,
                                            const core::CancellationToken& token) {
    auto json = getJson(ip, "/api/host/local", token);
    try {
        return hostFromJson(json);
    } catch (const std::exception& e) {
        throw core::PeerUnreachableError(ip, std::string("invalid self-description: ") + e.what());
    }
}

core::PeerIdentity PeerClient::fetchIdentity(const std::string& ip,
                                             const core::CancellationToken& token) {
    auto json = getJson(ip, "/api/version", token);
    if (!json.is_object()) {
        throw core::PeerUnreachableError(ip, "version reply is not an object");
    }

    core::PeerIdentity identity;
    try {
        identity.id = json.value("id", "");
        identity.version = json.value("version", "unknown");
        identity.hostname = json.value("hostname", "");
    } catch (const nlohmann::json::exception& e) {
        throw core::PeerUnreachableError(ip, std::string("invalid version reply: ") + e.what());
    }
    return identity;
}

void PeerClient::pushRoster(const std::string& ip, const std::vector<core::Host>& hosts,
                            bool merge, const core::CancellationToken& token) {
    auto target = std::string("/api/hosts/receive?merge=") + (merge ? "true" : "false");
    auto response = pushClient_.post(ip, port_, target, hostsToJson(hosts).dump(),
                                     "application/json", token);
    if (!response.success) {
        throw core::PeerUnreachableError(ip, response.errorMessage);
    }
    spdlog::debug("Delivered {} hosts to {} ({})", hosts.size(), ip, merge ? "merge" : "replace");
}

} // namespace signfleet::infra
