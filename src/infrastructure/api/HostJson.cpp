#include "infrastructure/api/HostJson.hpp"

#include "core/types/Timestamp.hpp"

#include <stdexcept>

namespace signfleet::infra {

namespace {

nlohmann::json timestampToJson(
    const std::optional<std::chrono::system_clock::time_point>& tp) {
    if (!tp) {
        return nullptr;
    }
    return core::formatTimestamp(*tp);
}

std::optional<std::chrono::system_clock::time_point> timestampFromJson(const nlohmann::json& j,
                                                                       const char* key) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) {
        return std::nullopt;
    }
    auto text = it->get<std::string>();
    // Peers that never probed a host send the zero time
    if (text.rfind("0001-01-01", 0) == 0) {
        return std::nullopt;
    }
    return core::parseTimestamp(text);
}

std::string stringField(const nlohmann::json& j, const char* key, const std::string& fallback) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return fallback;
    }
    return it->get<std::string>();
}

void writeState(nlohmann::json& j, const core::NetworkState& state, const std::string& suffix) {
    j["status" + suffix] = core::hostStatusToString(state.status);
    j["nsm_status" + suffix] = state.serviceStatus;
    j["nsm_version" + suffix] = state.serviceVersion;
    j["anthias_version" + suffix] = state.anthiasVersion;
    j["anthias_status" + suffix] = state.anthiasStatus;
    j["cms_status" + suffix] = core::cmsStatusToString(state.cmsStatus);
    j["asset_count" + suffix] = state.assetCount;
    j["dashboard_url" + suffix] = state.dashboardUrl;
    j["last_checked" + suffix] = timestampToJson(state.lastChecked);
}

void readState(const nlohmann::json& j, core::NetworkState& state, const std::string& suffix) {
    auto key = [&suffix](const char* base) { return std::string(base) + suffix; };

    if (auto it = j.find(key("status")); it != j.end() && it->is_string()) {
        state.status = core::hostStatusFromString(it->get<std::string>());
    }
    state.serviceStatus = stringField(j, key("nsm_status").c_str(), state.serviceStatus);
    state.serviceVersion = stringField(j, key("nsm_version").c_str(), state.serviceVersion);
    state.anthiasVersion = stringField(j, key("anthias_version").c_str(), state.anthiasVersion);
    state.anthiasStatus = stringField(j, key("anthias_status").c_str(), state.anthiasStatus);
    if (auto it = j.find(key("cms_status")); it != j.end() && it->is_string()) {
        state.cmsStatus = core::cmsStatusFromString(it->get<std::string>());
    }
    if (auto it = j.find(key("asset_count")); it != j.end() && it->is_number_integer()) {
        state.assetCount = it->get<int>();
    }
    state.dashboardUrl = stringField(j, key("dashboard_url").c_str(), state.dashboardUrl);
    state.lastChecked = timestampFromJson(j, key("last_checked").c_str());
}

} // namespace

nlohmann::json hostToJson(const core::Host& host) {
    nlohmann::json j;
    j["nickname"] = host.nickname;
    j["ip_address"] = host.ipAddress;
    j["vpn_ip_address"] = host.vpnIpAddress;
    j["hostname"] = host.hostname;
    j["notes"] = host.notes;
    writeState(j, host.primary, "");
    writeState(j, host.vpn, "_vpn");
    j["id"] = host.id;
    return j;
}

core::Host hostFromJson(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw std::invalid_argument("host record must be a JSON object");
    }

    core::Host host;
    host.id = stringField(j, "id", "");
    host.nickname = stringField(j, "nickname", "");
    host.hostname = stringField(j, "hostname", "");
    host.notes = stringField(j, "notes", "");
    host.ipAddress = stringField(j, "ip_address", "");
    host.vpnIpAddress = stringField(j, "vpn_ip_address", "");
    readState(j, host.primary, "");
    readState(j, host.vpn, "_vpn");
    return host;
}

nlohmann::json hostsToJson(const std::vector<core::Host>& hosts) {
    auto j = nlohmann::json::array();
    for (const auto& host : hosts) {
        j.push_back(hostToJson(host));
    }
    return j;
}

std::vector<core::Host> hostsFromJson(const nlohmann::json& j) {
    if (!j.is_array()) {
        throw std::invalid_argument("host list must be a JSON array");
    }

    std::vector<core::Host> hosts;
    hosts.reserve(j.size());
    for (const auto& item : j) {
        hosts.push_back(hostFromJson(item));
    }
    return hosts;
}

} // namespace signfleet::infra
