#pragma once

#include "fleet/FleetSyncCoordinator.hpp"
#include "infrastructure/api/FleetApi.hpp"
#include "infrastructure/api/HttpServer.hpp"
#include "infrastructure/api/Router.hpp"
#include "infrastructure/config/ConfigManager.hpp"
#include "infrastructure/database/HostStore.hpp"
#include "infrastructure/identity/LocalNode.hpp"
#include "infrastructure/network/AsioContext.hpp"
#include "infrastructure/network/DiscoveryScanner.hpp"
#include "infrastructure/network/HealthProber.hpp"
#include "infrastructure/network/PeerClient.hpp"

#include <asio.hpp>

#include <condition_variable>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>

namespace signfleet::app {

/**
 * @brief Wires one fleet node together and runs it until signalled.
 *
 * Owns two asio pools: one for sockets (the API server and discovery
 * dials) and one for detached blocking work (probes, pushes, discovery
 * passes), so long-running tasks never starve socket handlers.
 */
class Application {
public:
    Application(int argc, char** argv);
    ~Application();

    Application(const Application&) = delete;
    Application& operator=(const Application&) = delete;

    /**
     * @brief Serves until SIGINT or SIGTERM arrives.
     * @return Process exit code.
     */
    int run();

    /**
     * @brief Requests shutdown; run() returns afterwards.
     */
    void requestStop();

    infra::ConfigManager& config() { return *config_; }
    infra::HostStore& store() { return *store_; }
    fleet::FleetSyncCoordinator& coordinator() { return *coordinator_; }

    /**
     * @brief Resolves the configuration directory from the command line.
     *
     * The first argument wins; otherwise $HOME/.signfleet, or ./.signfleet
     * when HOME is unset.
     */
    static std::filesystem::path configDirectory(int argc, char** argv);

private:
    void initializeLogging();
    void initializeComponents();
    void scheduleRefresh();
    void shutdown();

    std::filesystem::path configDir_;
    std::unique_ptr<infra::ConfigManager> config_;

    std::unique_ptr<infra::AsioContext> ioContext_;
    std::unique_ptr<infra::AsioContext> workers_;

    std::unique_ptr<infra::HostStore> store_;
    std::unique_ptr<infra::LocalNode> localNode_;
    std::unique_ptr<infra::HealthProber> prober_;
    std::unique_ptr<infra::DiscoveryScanner> scanner_;
    std::unique_ptr<infra::PeerClient> peers_;
    std::unique_ptr<fleet::FleetSyncCoordinator> coordinator_;

    infra::Router router_;
    std::unique_ptr<infra::FleetApi> api_;
    std::shared_ptr<infra::HttpServer> server_;

    std::optional<asio::signal_set> signals_;
    std::optional<asio::steady_timer> refreshTimer_;

    std::mutex stopMutex_;
    std::condition_variable stopCv_;
    bool stopRequested_{false};
    bool shutDown_{false};
};

} // namespace signfleet::app
