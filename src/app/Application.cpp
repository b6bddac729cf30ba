#include "app/Application.hpp"

#include "core/Version.hpp"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <csignal>
#include <cstdlib>

namespace signfleet::app {

Application::Application(int argc, char** argv) : configDir_(configDirectory(argc, argv)) {
    config_ = std::make_unique<infra::ConfigManager>(configDir_);
    config_->load();

    initializeLogging();
    initializeComponents();
}

Application::~Application() {
    shutdown();
}

std::filesystem::path Application::configDirectory(int argc, char** argv) {
    if (argc > 1 && argv[1] != nullptr && *argv[1] != '\0') {
        return argv[1];
    }

    const char* home = std::getenv("HOME");
    if (home != nullptr && *home != '\0') {
        return std::filesystem::path(home) / ".signfleet";
    }
    return std::filesystem::current_path() / ".signfleet";
}

void Application::initializeLogging() {
    const auto& cfg = config_->config();
    auto logPath = config_->logPath();
    if (logPath.has_parent_path()) {
        std::filesystem::create_directories(logPath.parent_path());
    }

    auto level = spdlog::level::from_str(cfg.logLevel);

    auto consoleSink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    consoleSink->set_level(level);

    auto fileSink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
        logPath.string(), cfg.logMaxFileSize, cfg.logMaxFiles);
    fileSink->set_level(spdlog::level::debug);

    auto logger =
        std::make_shared<spdlog::logger>("signfleet", spdlog::sinks_init_list{consoleSink, fileSink});
    logger->set_level(std::min(level, spdlog::level::debug));
    spdlog::set_default_logger(logger);

    spdlog::info("SignFleet {} starting...", core::Version);
    spdlog::info("Config directory: {}", configDir_.string());
    spdlog::info("Log file: {}", logPath.string());
}

void Application::initializeComponents() {
    const auto& cfg = config_->config();
    auto threads = static_cast<size_t>(std::max(1, cfg.workerThreads));

    // Asio pools
    ioContext_ = std::make_unique<infra::AsioContext>(threads);
    ioContext_->start();
    workers_ = std::make_unique<infra::AsioContext>(threads);
    workers_->start();

    // Roster
    store_ = std::make_unique<infra::HostStore>(config_->databasePath(), config_->legacyJsonPath());

    // Identity
    localNode_ = std::make_unique<infra::LocalNode>(configDir_, cfg.hostIp, cfg.managementPort);
    spdlog::info("Node id {} at {}", localNode_->id(), localNode_->address());

    // Network services
    infra::HealthProberConfig proberConfig;
    proberConfig.managementPort = cfg.managementPort;
    proberConfig.cmsPort = cfg.cmsPort;
    proberConfig.timeout = std::chrono::milliseconds(cfg.probeTimeoutMs);
    prober_ = std::make_unique<infra::HealthProber>(proberConfig);

    infra::DiscoveryScannerConfig scannerConfig;
    scannerConfig.dialTimeout = std::chrono::milliseconds(cfg.dialTimeoutMs);
    scannerConfig.maxConcurrency = cfg.maxConcurrency;
    scanner_ = std::make_unique<infra::DiscoveryScanner>(*ioContext_, scannerConfig);

    peers_ = std::make_unique<infra::PeerClient>(cfg.managementPort,
                                                 std::chrono::milliseconds(cfg.peerTimeoutMs),
                                                 std::chrono::milliseconds(cfg.pushTimeoutMs));

    // Synchronization
    fleet::FleetSyncConfig syncConfig;
    syncConfig.managementPort = cfg.managementPort;
    syncConfig.maxBackups = cfg.maxBackups;
    syncConfig.discoveryBudget = std::chrono::seconds(cfg.discoveryBudgetSeconds);
    coordinator_ = std::make_unique<fleet::FleetSyncCoordinator>(
        *store_, *prober_, *scanner_, *peers_, *localNode_, *workers_, syncConfig);

    // API
    infra::FleetApiConfig apiConfig;
    apiConfig.maxBackups = cfg.maxBackups;
    apiConfig.manualBackupRetention = cfg.manualBackupRetention;
    apiConfig.scanOverride = cfg.hostIp;
    api_ = std::make_unique<infra::FleetApi>(router_, *store_, *coordinator_, *localNode_,
                                             apiConfig);

    server_ = std::make_shared<infra::HttpServer>(*ioContext_, router_, cfg.bindAddress,
                                                  cfg.serverPort);
    server_->start();

    // Self-registration, now and periodically
    coordinator_->registerLocalHost();
    refreshTimer_.emplace(ioContext_->getContext());
    scheduleRefresh();

    signals_.emplace(ioContext_->getContext(), SIGINT, SIGTERM);
    signals_->async_wait([this](const asio::error_code& ec, int signal) {
        if (ec) {
            return;
        }
        spdlog::info("Received signal {}, shutting down", signal);
        requestStop();
    });

    spdlog::info("Application components initialized");
}

void Application::scheduleRefresh() {
    auto interval = std::chrono::seconds(std::max(1, config_->config().refreshIntervalSeconds));
    refreshTimer_->expires_after(interval);
    refreshTimer_->async_wait([this](const asio::error_code& ec) {
        if (ec) {
            return;
        }
        workers_->spawn("register local host", [this]() { coordinator_->registerLocalHost(); });
        scheduleRefresh();
    });
}

int Application::run() {
    spdlog::info("Serving on {}:{}", config_->config().bindAddress, server_->port());

    std::unique_lock lock(stopMutex_);
    stopCv_.wait(lock, [this]() { return stopRequested_; });
    lock.unlock();

    shutdown();
    return 0;
}

void Application::requestStop() {
    {
        std::lock_guard lock(stopMutex_);
        stopRequested_ = true;
    }
    stopCv_.notify_all();
}

void Application::shutdown() {
    if (shutDown_) {
        return;
    }
    shutDown_ = true;

    spdlog::info("Application shutting down...");

    if (coordinator_) {
        coordinator_->shutdown();
    }
    if (server_) {
        server_->stop();
    }
    if (refreshTimer_) {
        refreshTimer_->cancel();
    }
    if (signals_) {
        asio::error_code ignored;
        signals_->cancel(ignored);
    }

    // Detached tasks finish before the pools go away
    if (coordinator_ && !coordinator_->waitIdle(std::chrono::seconds(30))) {
        spdlog::warn("Background tasks still running at shutdown");
    }
    if (workers_) {
        workers_->stop();
    }
    if (ioContext_) {
        ioContext_->stop();
    }

    spdlog::info("Shutdown complete");
}

} // namespace signfleet::app
