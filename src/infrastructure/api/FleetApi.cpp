#include "infrastructure/api/FleetApi.hpp"

#include "core/Version.hpp"
#include "core/types/Errors.hpp"
#include "core/types/Timestamp.hpp"
#include "core/types/Uuid.hpp"
#include "infrastructure/api/HostJson.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <chrono>
#include <stdexcept>

namespace signfleet::infra {

namespace {

nlohmann::json parseBody(const ApiRequest& req) {
    if (req.body.empty()) {
        throw std::invalid_argument("request body is empty");
    }
    return nlohmann::json::parse(req.body);
}

std::string requireQuery(const ApiRequest& req, const std::string& key) {
    auto value = req.query(key);
    if (value.empty()) {
        throw std::invalid_argument("missing '" + key + "' query parameter");
    }
    return value;
}

// Optional string field of an edit request; absent or null leaves the target alone.
void applyField(const nlohmann::json& j, const char* key, std::string& target) {
    auto it = j.find(key);
    if (it != j.end() && !it->is_null()) {
        target = it->get<std::string>();
    }
}

std::vector<std::string> parseTargets(const std::string& body) {
    std::vector<std::string> targets;
    if (body.empty()) {
        return targets;
    }

    auto json = nlohmann::json::parse(body);
    const nlohmann::json* list = &json;
    if (json.is_object()) {
        auto it = json.find("targets");
        if (it == json.end()) {
            return targets;
        }
        list = &*it;
    }
    if (!list->is_array()) {
        throw std::invalid_argument("push targets must be an array of addresses");
    }
    for (const auto& item : *list) {
        targets.push_back(item.get<std::string>());
    }
    return targets;
}

std::string todayStamp() {
    // formatTimestamp yields YYYY-MM-DDTHH:MM:SS...; keep the date
    return core::formatTimestamp(std::chrono::system_clock::now()).substr(0, 10);
}

} // namespace

FleetApi::FleetApi(Router& router, HostStore& store, fleet::FleetSyncCoordinator& coordinator,
                   LocalNode& localNode, FleetApiConfig config)
    : store_(store)
    , coordinator_(coordinator)
    , localNode_(localNode)
    , config_(std::move(config)) {
    registerRoutes(router);
}

void FleetApi::registerRoutes(Router& router) {
    auto bind = [this](void (FleetApi::*handler)(const ApiRequest&, ApiResponse&)) {
        return [this, handler](const ApiRequest& req, ApiResponse& res) {
            (this->*handler)(req, res);
        };
    };

    router.add(HttpMethod::GET, "/api/health", bind(&FleetApi::handleHealth));
    router.add(HttpMethod::GET, "/api/version", bind(&FleetApi::handleVersion));
    router.add(HttpMethod::GET, "/api/host/local", bind(&FleetApi::handleLocalHost));

    router.add(HttpMethod::GET, "/api/hosts", bind(&FleetApi::handleGetHosts));
    router.add(HttpMethod::POST, "/api/hosts/add", bind(&FleetApi::handleAddHost));
    router.add(HttpMethod::POST, "/api/hosts/update", bind(&FleetApi::handleUpdateHost));
    router.add(HttpMethod::POST, "/api/hosts/delete", bind(&FleetApi::handleDeleteHost));
    router.add(HttpMethod::POST, "/api/hosts/set-primary", bind(&FleetApi::handleSetPrimary));
    router.add(HttpMethod::POST, "/api/hosts/check", bind(&FleetApi::handleCheckAll));
    router.add(HttpMethod::POST, "/api/hosts/check-one", bind(&FleetApi::handleCheckOne));
    router.add(HttpMethod::POST, "/api/hosts/push", bind(&FleetApi::handlePush));
    router.add(HttpMethod::POST, "/api/hosts/receive", bind(&FleetApi::handleReceive));
    router.add(HttpMethod::POST, "/api/hosts/announce", bind(&FleetApi::handleAnnounce));
    router.add(HttpMethod::GET, "/api/hosts/export", bind(&FleetApi::handleExport));
    router.add(HttpMethod::POST, "/api/hosts/import", bind(&FleetApi::handleImport));

    router.add(HttpMethod::POST, "/api/discovery/scan", bind(&FleetApi::handleScan));

    router.add(HttpMethod::POST, "/api/backups/create", bind(&FleetApi::handleCreateBackup));
    router.add(HttpMethod::GET, "/api/backups", bind(&FleetApi::handleListBackups));
    router.add(HttpMethod::POST, "/api/backups/restore", bind(&FleetApi::handleRestoreBackup));

    router.add(HttpMethod::GET, "/api/snapshot", bind(&FleetApi::handleGetSnapshot));
    router.add(HttpMethod::POST, "/api/snapshot", bind(&FleetApi::handlePutSnapshot));
}

// ============================================================================
// Peer-facing handlers
// ============================================================================

void FleetApi::handleHealth(const ApiRequest& /*req*/, ApiResponse& res) {
    res.setJson({{"status", "ok"}});
}

void FleetApi::handleVersion(const ApiRequest& /*req*/, ApiResponse& res) {
    nlohmann::json response;
    response["version"] = core::Version;
    response["status"] = "ok";
    response["hostname"] = localNode_.hostname();
    response["id"] = localNode_.id();
    res.setJson(response);
}

void FleetApi::handleLocalHost(const ApiRequest& /*req*/, ApiResponse& res) {
    res.setJson(hostToJson(coordinator_.localDescription()));
}

void FleetApi::handleReceive(const ApiRequest& req, ApiResponse& res) {
    bool merge = req.query("merge") == "true";
    auto hosts = hostsFromJson(parseBody(req));

    auto applied = coordinator_.receiveRoster(hosts, merge);
    spdlog::info("Received {} host(s) from peer ({} mode)", hosts.size(),
                 merge ? "merge" : "replace");

    res.setJson({{"applied", applied}});
}

void FleetApi::handleAnnounce(const ApiRequest& req, ApiResponse& res) {
    coordinator_.announce(hostFromJson(parseBody(req)));
    res.setStatus(204);
}

// ============================================================================
// Roster handlers
// ============================================================================

void FleetApi::handleGetHosts(const ApiRequest& /*req*/, ApiResponse& res) {
    res.setJson(hostsToJson(store_.getAll()));
}

void FleetApi::handleAddHost(const ApiRequest& req, ApiResponse& res) {
    auto json = parseBody(req);
    auto submitted = hostFromJson(json);

    auto host = core::Host::withDefaults(submitted.ipAddress, localNode_.managementPort());
    host.id = submitted.id.empty() ? core::generateUuid() : submitted.id;
    host.nickname = submitted.nickname;
    host.hostname = submitted.hostname;
    host.notes = submitted.notes;
    host.vpnIpAddress = submitted.vpnIpAddress;

    store_.add(host);
    spdlog::info("Added host '{}' ({})", host.nickname, host.ipAddress);

    coordinator_.startProbe(host.ipAddress);

    res.setStatus(201);
    res.setJson(hostToJson(host));
}

void FleetApi::handleUpdateHost(const ApiRequest& req, ApiResponse& res) {
    auto ip = requireQuery(req, "ip");
    auto json = parseBody(req);
    if (!json.is_object()) {
        throw std::invalid_argument("update must be a JSON object");
    }

    auto port = localNode_.managementPort();
    std::string newIp = ip;
    store_.update(ip, [&json, &newIp, port](core::Host& host) {
        applyField(json, "nickname", host.nickname);
        applyField(json, "hostname", host.hostname);
        applyField(json, "notes", host.notes);
        applyField(json, "vpn_ip_address", host.vpnIpAddress);
        applyField(json, "ip_address", host.ipAddress);
        if (host.ipAddress != newIp) {
            host.primary.dashboardUrl = "http://" + host.ipAddress + ":" + std::to_string(port);
        }
        newIp = host.ipAddress;
    });
    spdlog::info("Updated host {}", newIp);

    if (newIp != ip) {
        coordinator_.startProbe(newIp);
    }
    res.setJson(hostToJson(store_.getByIp(newIp)));
}

void FleetApi::handleDeleteHost(const ApiRequest& req, ApiResponse& res) {
    auto ip = requireQuery(req, "ip");
    store_.remove(ip);
    spdlog::info("Deleted host {}", ip);
    res.setStatus(204);
}

void FleetApi::handleSetPrimary(const ApiRequest& req, ApiResponse& res) {
    auto id = requireQuery(req, "id");
    auto removed = store_.setPrimary(id);
    res.setJson({{"removed", removed}});
}

void FleetApi::handleCheckAll(const ApiRequest& /*req*/, ApiResponse& res) {
    coordinator_.startProbeAll();
    res.setStatus(202);
    res.setJson({{"status", "started"}});
}

void FleetApi::handleCheckOne(const ApiRequest& req, ApiResponse& res) {
    coordinator_.startProbe(requireQuery(req, "ip"));
    res.setStatus(202);
    res.setJson({{"status", "started"}});
}

void FleetApi::handlePush(const ApiRequest& req, ApiResponse& res) {
    auto explicitTargets = parseTargets(req.body);
    auto targets = coordinator_.pushTargets(explicitTargets);
    coordinator_.pushRoster(explicitTargets);

    res.setStatus(202);
    res.setJson({{"targets", targets}});
}

void FleetApi::handleScan(const ApiRequest& req, ApiResponse& res) {
    auto overrideAddress = req.query("interface_ip", config_.scanOverride);
    coordinator_.startDiscovery(overrideAddress);
    res.setStatus(202);
    res.setJson({{"status", "started"}});
}

// ============================================================================
// Backup and transfer handlers
// ============================================================================

void FleetApi::handleCreateBackup(const ApiRequest& /*req*/, ApiResponse& res) {
    auto path = store_.backupCurrent(config_.manualBackupRetention);
    if (path.empty()) {
        throw core::NotFoundError("no live roster to back up");
    }
    res.setStatus(201);
    res.setJson({{"path", path.filename().string()}});
}

void FleetApi::handleListBackups(const ApiRequest& /*req*/, ApiResponse& res) {
    auto backups = nlohmann::json::array();
    for (const auto& backup : store_.listBackups()) {
        nlohmann::json entry;
        entry["filename"] = backup.name;
        entry["timestamp"] =
            core::formatTimestamp(std::chrono::system_clock::from_time_t(backup.timestamp));
        entry["size"] = backup.sizeBytes;
        backups.push_back(entry);
    }
    res.setJson(backups);
}

void FleetApi::handleRestoreBackup(const ApiRequest& req, ApiResponse& res) {
    auto name = req.query("file");
    if (name.empty()) {
        name = store_.restoreLatestBackup(config_.maxBackups);
    } else {
        store_.restoreBackup(name, config_.maxBackups);
    }
    spdlog::warn("Roster restored from backup {}", name);
    res.setJson({{"source", name}});
}

void FleetApi::handleExport(const ApiRequest& /*req*/, ApiResponse& res) {
    res.setAttachment(hostsToJson(store_.getAll()).dump(2), "application/json",
                      "signfleet-hosts-" + todayStamp() + ".json");
}

void FleetApi::handleImport(const ApiRequest& req, ApiResponse& res) {
    auto hosts = hostsFromJson(parseBody(req));

    store_.backupCurrent(config_.maxBackups);
    store_.replaceAll(hosts);
    spdlog::info("Imported {} host(s)", hosts.size());

    res.setJson({{"imported", hosts.size()}});
}

void FleetApi::handleGetSnapshot(const ApiRequest& /*req*/, ApiResponse& res) {
    res.setAttachment(store_.exportSnapshot(), "application/octet-stream",
                      "signfleet-" + todayStamp() + store_.path().extension().string());
}

void FleetApi::handlePutSnapshot(const ApiRequest& req, ApiResponse& res) {
    if (req.body.empty()) {
        throw core::InvalidSnapshotError("snapshot upload is empty");
    }
    auto previous = store_.importSnapshot(req.body, config_.maxBackups);
    spdlog::warn("Roster replaced by uploaded snapshot");
    res.setJson({{"previous", previous.filename().string()}});
}

} // namespace signfleet::infra
