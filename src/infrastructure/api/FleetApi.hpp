/**
 * @file FleetApi.hpp
 * @brief HTTP endpoints of a fleet node.
 */

#pragma once

#include "fleet/FleetSyncCoordinator.hpp"
#include "infrastructure/api/Router.hpp"
#include "infrastructure/database/HostStore.hpp"
#include "infrastructure/identity/LocalNode.hpp"

#include <string>

namespace signfleet::infra {

/**
 * @brief Settings the endpoints need beyond their collaborators.
 */
struct FleetApiConfig {
    int maxBackups{HostStore::DefaultMaxBackups}; ///< Retention for restores and imports.
    int manualBackupRetention{100};                ///< Retention for operator-created backups.
    std::string scanOverride;                      ///< Default interface address for scans.
};

/**
 * @brief Registers the roster, gossip, discovery and backup endpoints.
 *
 * Operator endpoints (add, update, delete, backups) and peer endpoints
 * (version, host/local, receive, announce) live on the same router. Long
 * running work is handed to the coordinator and answered with 202.
 *
 * @note All collaborators must outlive the router.
 */
class FleetApi {
public:
    FleetApi(Router& router, HostStore& store, fleet::FleetSyncCoordinator& coordinator,
             LocalNode& localNode, FleetApiConfig config = {});

    FleetApi(const FleetApi&) = delete;
    FleetApi& operator=(const FleetApi&) = delete;

private:
    void registerRoutes(Router& router);

    // Peer-facing
    void handleHealth(const ApiRequest& req, ApiResponse& res);
    void handleVersion(const ApiRequest& req, ApiResponse& res);
    void handleLocalHost(const ApiRequest& req, ApiResponse& res);
    void handleReceive(const ApiRequest& req, ApiResponse& res);
    void handleAnnounce(const ApiRequest& req, ApiResponse& res);

    // Roster
    void handleGetHosts(const ApiRequest& req, ApiResponse& res);
    void handleAddHost(const ApiRequest& req, ApiResponse& res);
    void handleUpdateHost(const ApiRequest& req, ApiResponse& res);
    void handleDeleteHost(const ApiRequest& req, ApiResponse& res);
    void handleSetPrimary(const ApiRequest& req, ApiResponse& res);
    void handleCheckAll(const ApiRequest& req, ApiResponse& res);
    void handleCheckOne(const ApiRequest& req, ApiResponse& res);
    void handlePush(const ApiRequest& req, ApiResponse& res);
    void handleScan(const ApiRequest& req, ApiResponse& res);

    // Backups and transfer
    void handleCreateBackup(const ApiRequest& req, ApiResponse& res);
    void handleListBackups(const ApiRequest& req, ApiResponse& res);
    void handleRestoreBackup(const ApiRequest& req, ApiResponse& res);
    void handleExport(const ApiRequest& req, ApiResponse& res);
    void handleImport(const ApiRequest& req, ApiResponse& res);
    void handleGetSnapshot(const ApiRequest& req, ApiResponse& res);
    void handlePutSnapshot(const ApiRequest& req, ApiResponse& res);

    HostStore& store_;
    fleet::FleetSyncCoordinator& coordinator_;
    LocalNode& localNode_;
    FleetApiConfig config_;
};

} // namespace signfleet::infra
