#pragma once

#include "core/services/IPeerClient.hpp"
#include "infrastructure/network/HttpClient.hpp"

#include <chrono>
#include <cstdint>

#include <nlohmann/json.hpp>

namespace signfleet::infra {

/**
 * @brief Peer calls over HTTP to another node's management port.
 */
class PeerClient : public core::IPeerClient {
public:
    /**
     * @brief Constructs a client.
     * @param port Management port of remote nodes.
     * @param requestTimeout Timeout of identification calls.
     * @param pushTimeout Timeout of roster deliveries, which carry the whole roster.
     */
    PeerClient(uint16_t port, std::chrono::milliseconds requestTimeout,
               std::chrono::milliseconds pushTimeout);

    core::Host fetchSelfDescription(const std::string& ip,
                                    const core::CancellationToken& token) override;

    core::PeerIdentity fetchIdentity(const std::string& ip,
                                     const core::CancellationToken& token) override;

    void pushRoster(const std::string& ip, const std::vector<core::Host>& hosts, bool merge,
                    const core::CancellationToken& token) override;

private:
    nlohmann::json getJson(const std::string& ip, const std::string& target,
                           const core::CancellationToken& token) const;

    uint16_t port_;
    HttpClient requestClient_;
    HttpClient pushClient_;
};

} // namespace signfleet::infra
