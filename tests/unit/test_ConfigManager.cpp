#include <catch2/catch_test_macros.hpp>

#include "infrastructure/config/ConfigManager.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>

using namespace signfleet::infra;

namespace {

class TestConfigDir {
public:
    TestConfigDir()
        : configDir_(std::filesystem::temp_directory_path() / "signfleet_config_test") {
        cleanup();
        std::filesystem::create_directories(configDir_);
    }

    ~TestConfigDir() { cleanup(); }

    std::filesystem::path path() const { return configDir_; }

    void write(const std::string& content) const {
        std::ofstream(configDir_ / "config.json") << content;
    }

private:
    void cleanup() {
        if (std::filesystem::exists(configDir_)) {
            std::filesystem::remove_all(configDir_);
        }
    }

    std::filesystem::path configDir_;
};

/// Sets an environment variable for the lifetime of the scope.
class ScopedEnv {
public:
    ScopedEnv(const char* name, const char* value) : name_(name) { setenv(name, value, 1); }
    ~ScopedEnv() { unsetenv(name_); }

private:
    const char* name_;
};

} // namespace

TEST_CASE("ConfigManager constructor", "[ConfigManager]") {
    SECTION("Creates config directory if it does not exist") {
        auto tempPath = std::filesystem::temp_directory_path() / "signfleet_config_new_test";
        std::filesystem::remove_all(tempPath);

        ConfigManager manager(tempPath);
        REQUIRE(std::filesystem::exists(tempPath));
        REQUIRE(manager.configPath() == tempPath / "config.json");

        std::filesystem::remove_all(tempPath);
    }
}

TEST_CASE("ConfigManager defaults", "[ConfigManager]") {
    TestConfigDir dir;
    ConfigManager manager(dir.path());

    SECTION("A missing file is created with defaults") {
        REQUIRE(manager.load());
        REQUIRE(std::filesystem::exists(manager.configPath()));

        const auto& config = manager.config();
        REQUIRE(config.bindAddress == "0.0.0.0");
        REQUIRE(config.serverPort == 8080);
        REQUIRE(config.managementPort == 8080);
        REQUIRE(config.cmsPort == 80);
        REQUIRE(config.maxBackups == 20);
        REQUIRE(config.dialTimeoutMs == 500);
        REQUIRE(config.maxConcurrency == 50);
        REQUIRE(config.discoveryBudgetSeconds == 30);
        REQUIRE(config.logLevel == "info");
    }

    SECTION("Relative file names resolve against the config directory") {
        REQUIRE(manager.databasePath() == dir.path() / "hosts.db");
        REQUIRE(manager.legacyJsonPath() == dir.path() / "hosts.json");
        REQUIRE(manager.logPath() == dir.path() / "signfleet.log");

        manager.config().databaseFile = "/var/lib/signfleet/roster.db";
        REQUIRE(manager.databasePath() == std::filesystem::path("/var/lib/signfleet/roster.db"));

        manager.config().legacyJsonFile.clear();
        REQUIRE(manager.legacyJsonPath().empty());
    }
}

TEST_CASE("ConfigManager load and save", "[ConfigManager]") {
    TestConfigDir dir;

    SECTION("Saved settings survive a reload") {
        {
            ConfigManager manager(dir.path());
            manager.load();
            manager.config().serverPort = 9090;
            manager.config().maxBackups = 5;
            manager.config().hostIp = "10.1.2.3";
            manager.config().logLevel = "debug";
            REQUIRE(manager.save());
        }

        ConfigManager reloaded(dir.path());
        REQUIRE(reloaded.load());
        REQUIRE(reloaded.config().serverPort == 9090);
        REQUIRE(reloaded.config().maxBackups == 5);
        REQUIRE(reloaded.config().hostIp == "10.1.2.3");
        REQUIRE(reloaded.config().logLevel == "debug");
    }

    SECTION("Missing keys keep their defaults") {
        dir.write(R"({"network": {"cms_port": 8000}})");

        ConfigManager manager(dir.path());
        REQUIRE(manager.load());
        REQUIRE(manager.config().cmsPort == 8000);
        REQUIRE(manager.config().managementPort == 8080);
        REQUIRE(manager.config().serverPort == 8080);
    }

    SECTION("A malformed file falls back to defaults") {
        dir.write("{ not json");

        ConfigManager manager(dir.path());
        REQUIRE_FALSE(manager.load());
        REQUIRE(manager.config().serverPort == 8080);
    }

    SECTION("A wrongly typed value falls back to defaults") {
        dir.write(R"({"server": {"port": "eighty"}})");

        ConfigManager manager(dir.path());
        REQUIRE_FALSE(manager.load());
        REQUIRE(manager.config().serverPort == 8080);
    }
}

TEST_CASE("ConfigManager environment override", "[ConfigManager]") {
    TestConfigDir dir;
    dir.write(R"({"network": {"host_ip": "10.0.0.1"}})");

    SECTION("The environment wins over the file") {
        ScopedEnv env(ConfigManager::HostIpEnvironmentVariable, "192.168.7.7");
        ConfigManager manager(dir.path());
        manager.load();
        REQUIRE(manager.config().hostIp == "192.168.7.7");
    }

    SECTION("An empty variable is ignored") {
        ScopedEnv env(ConfigManager::HostIpEnvironmentVariable, "");
        ConfigManager manager(dir.path());
        manager.load();
        REQUIRE(manager.config().hostIp == "10.0.0.1");
    }
}
