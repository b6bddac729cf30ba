#include "infrastructure/config/ConfigManager.hpp"

#include <spdlog/spdlog.h>

#include <cstdlib>
#include <fstream>

namespace signfleet::infra {

ConfigManager::ConfigManager(const std::filesystem::path& configDir) : configDir_(configDir) {
    if (!std::filesystem::exists(configDir_)) {
        std::filesystem::create_directories(configDir_);
    }

    configPath_ = configDir_ / "config.json";
}

bool ConfigManager::load() {
    if (!std::filesystem::exists(configPath_)) {
        spdlog::info("Config file not found, using defaults");
        bool saved = save();
        applyEnvironment();
        return saved;
    }

    bool loaded = false;
    try {
        std::ifstream file(configPath_);
        if (!file) {
            spdlog::error("Failed to open config file: {}", configPath_.string());
        } else {
            nlohmann::json j;
            file >> j;
            fromJson(j);

            spdlog::info("Loaded configuration from {}", configPath_.string());
            loaded = true;
        }
    } catch (const std::exception& e) {
        config_ = AppConfig{};
        spdlog::error("Failed to load config, keeping defaults: {}", e.what());
    }

    applyEnvironment();
    return loaded;
}

bool ConfigManager::save() {
    try {
        auto j = toJson();

        std::ofstream file(configPath_);
        if (!file) {
            spdlog::error("Failed to open config file for writing: {}", configPath_.string());
            return false;
        }

        file << j.dump(2);
        spdlog::debug("Saved configuration to {}", configPath_.string());
        return true;
    } catch (const std::exception& e) {
        spdlog::error("Failed to save config: {}", e.what());
        return false;
    }
}

void ConfigManager::applyEnvironment() {
    const char* hostIp = std::getenv(HostIpEnvironmentVariable);
    if (hostIp != nullptr && *hostIp != '\0') {
        config_.hostIp = hostIp;
        spdlog::info("Using host address {} from {}", config_.hostIp, HostIpEnvironmentVariable);
    }
}

nlohmann::json ConfigManager::toJson() const {
    nlohmann::json j;

    // Server
    j["server"]["bind_address"] = config_.bindAddress;
    j["server"]["port"] = config_.serverPort;
    j["server"]["worker_threads"] = config_.workerThreads;

    // Storage
    j["storage"]["database_file"] = config_.databaseFile;
    j["storage"]["max_backups"] = config_.maxBackups;
    j["storage"]["manual_backup_retention"] = config_.manualBackupRetention;
    j["storage"]["legacy_json_file"] = config_.legacyJsonFile;

    // Network
    j["network"]["management_port"] = config_.managementPort;
    j["network"]["cms_port"] = config_.cmsPort;
    j["network"]["probe_timeout_ms"] = config_.probeTimeoutMs;
    j["network"]["peer_timeout_ms"] = config_.peerTimeoutMs;
    j["network"]["push_timeout_ms"] = config_.pushTimeoutMs;
    j["network"]["host_ip"] = config_.hostIp;

    // Discovery
    j["discovery"]["dial_timeout_ms"] = config_.dialTimeoutMs;
    j["discovery"]["max_concurrency"] = config_.maxConcurrency;
    j["discovery"]["budget_seconds"] = config_.discoveryBudgetSeconds;

    // Logging
    j["logging"]["level"] = config_.logLevel;
    j["logging"]["file"] = config_.logFile;
    j["logging"]["max_file_size"] = config_.logMaxFileSize;
    j["logging"]["max_files"] = config_.logMaxFiles;

    // Node
    j["node"]["refresh_interval_seconds"] = config_.refreshIntervalSeconds;

    return j;
}

void ConfigManager::fromJson(const nlohmann::json& j) {
    AppConfig defaults;
    AppConfig parsed;

    if (j.contains("server")) {
        const auto& s = j["server"];
        parsed.bindAddress = s.value("bind_address", defaults.bindAddress);
        parsed.serverPort = s.value("port", defaults.serverPort);
        parsed.workerThreads = s.value("worker_threads", defaults.workerThreads);
    }

    if (j.contains("storage")) {
        const auto& s = j["storage"];
        parsed.databaseFile = s.value("database_file", defaults.databaseFile);
        parsed.maxBackups = s.value("max_backups", defaults.maxBackups);
        parsed.manualBackupRetention =
            s.value("manual_backup_retention", defaults.manualBackupRetention);
        parsed.legacyJsonFile = s.value("legacy_json_file", defaults.legacyJsonFile);
    }

    if (j.contains("network")) {
        const auto& n = j["network"];
        parsed.managementPort = n.value("management_port", defaults.managementPort);
        parsed.cmsPort = n.value("cms_port", defaults.cmsPort);
        parsed.probeTimeoutMs = n.value("probe_timeout_ms", defaults.probeTimeoutMs);
        parsed.peerTimeoutMs = n.value("peer_timeout_ms", defaults.peerTimeoutMs);
        parsed.pushTimeoutMs = n.value("push_timeout_ms", defaults.pushTimeoutMs);
        parsed.hostIp = n.value("host_ip", defaults.hostIp);
    }

    if (j.contains("discovery")) {
        const auto& d = j["discovery"];
        parsed.dialTimeoutMs = d.value("dial_timeout_ms", defaults.dialTimeoutMs);
        parsed.maxConcurrency = d.value("max_concurrency", defaults.maxConcurrency);
        parsed.discoveryBudgetSeconds = d.value("budget_seconds", defaults.discoveryBudgetSeconds);
    }

    if (j.contains("logging")) {
        const auto& l = j["logging"];
        parsed.logLevel = l.value("level", defaults.logLevel);
        parsed.logFile = l.value("file", defaults.logFile);
        parsed.logMaxFileSize = l.value("max_file_size", defaults.logMaxFileSize);
        parsed.logMaxFiles = l.value("max_files", defaults.logMaxFiles);
    }

    if (j.contains("node")) {
        const auto& n = j["node"];
        parsed.refreshIntervalSeconds =
            n.value("refresh_interval_seconds", defaults.refreshIntervalSeconds);
    }

    // Assigned last so a type error leaves the previous settings intact
    config_ = parsed;
}

std::filesystem::path ConfigManager::resolve(const std::string& file) const {
    std::filesystem::path path(file);
    return path.is_absolute() ? path : configDir_ / path;
}

std::filesystem::path ConfigManager::databasePath() const {
    return resolve(config_.databaseFile);
}

std::filesystem::path ConfigManager::legacyJsonPath() const {
    if (config_.legacyJsonFile.empty()) {
        return {};
    }
    return resolve(config_.legacyJsonFile);
}

std::filesystem::path ConfigManager::logPath() const {
    return resolve(config_.logFile);
}

} // namespace signfleet::infra
