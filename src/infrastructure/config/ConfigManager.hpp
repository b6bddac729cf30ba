#pragma once

#include <cstdint>
#include <filesystem>
#include <nlohmann/json.hpp>
#include <string>

namespace signfleet::infra {

/**
 * @brief Node configuration settings.
 *
 * Mirrors the grouped objects of config.json. Every field has a default so
 * a missing or partial file still yields a runnable node.
 */
struct AppConfig {
    // Server
    std::string bindAddress{"0.0.0.0"}; ///< Address the API listens on.
    uint16_t serverPort{8080};          ///< Port the API listens on.
    int workerThreads{4};               ///< Threads in each asio pool.

    // Storage
    std::string databaseFile{"hosts.db"};   ///< Roster file, relative to the config dir.
    int maxBackups{20};                     ///< Retention for automatic backups.
    int manualBackupRetention{100};         ///< Retention for operator-created backups.
    std::string legacyJsonFile{"hosts.json"}; ///< Roster format of older releases.

    // Network
    uint16_t managementPort{8080}; ///< Port peers serve the API on.
    uint16_t cmsPort{80};          ///< Port of the CMS player.
    int probeTimeoutMs{3000};      ///< Per-request timeout of a health probe.
    int peerTimeoutMs{2000};       ///< Timeout for identity and self-description requests.
    int pushTimeoutMs{5000};       ///< Timeout for a roster push.
    std::string hostIp;            ///< Override of this node's own address.

    // Discovery
    int dialTimeoutMs{500};       ///< Timeout of one discovery dial.
    int maxConcurrency{50};       ///< Concurrent dials per scan.
    int discoveryBudgetSeconds{30}; ///< Wall-clock limit of one scan.

    // Logging
    std::string logLevel{"info"};          ///< spdlog level name.
    std::string logFile{"signfleet.log"};  ///< Log file, relative to the config dir.
    size_t logMaxFileSize{5 * 1024 * 1024}; ///< Rotation size in bytes.
    size_t logMaxFiles{3};                 ///< Rotated files kept.

    // Node
    int refreshIntervalSeconds{30}; ///< Period of self-registration.
};

/**
 * @brief Manages node configuration persistence.
 *
 * Handles loading and saving of config.json in the configuration directory.
 * The SIGNFLEET_HOST_IP environment variable overrides network.host_ip.
 */
class ConfigManager {
public:
    static constexpr const char* HostIpEnvironmentVariable = "SIGNFLEET_HOST_IP";

    /**
     * @brief Constructs a ConfigManager for the specified config directory.
     * @param configDir Path to the configuration directory; created if missing.
     */
    explicit ConfigManager(const std::filesystem::path& configDir);

    /**
     * @brief Loads configuration from disk.
     *
     * A missing file is created with defaults. A malformed file is logged
     * and the defaults are kept.
     *
     * @return True if loaded (or created) successfully, false otherwise.
     */
    bool load();

    /**
     * @brief Saves configuration to disk.
     * @return True if saved successfully, false otherwise.
     */
    bool save();

    AppConfig& config() { return config_; }
    const AppConfig& config() const { return config_; }

    std::filesystem::path configPath() const { return configPath_; }

    /**
     * @brief Returns the path to the roster database.
     */
    std::filesystem::path databasePath() const;

    /**
     * @brief Returns the path of the legacy JSON roster.
     */
    std::filesystem::path legacyJsonPath() const;

    /**
     * @brief Returns the path of the log file.
     */
    std::filesystem::path logPath() const;

    const std::filesystem::path& configDir() const { return configDir_; }

private:
    nlohmann::json toJson() const;
    void fromJson(const nlohmann::json& j);
    void applyEnvironment();
    std::filesystem::path resolve(const std::string& file) const;

    std::filesystem::path configDir_;
    std::filesystem::path configPath_;
    AppConfig config_;
};

} // namespace signfleet::infra
