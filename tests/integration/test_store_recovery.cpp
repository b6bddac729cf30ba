#include <catch2/catch_test_macros.hpp>

#include "core/types/Host.hpp"
#include "infrastructure/api/HostJson.hpp"
#include "infrastructure/database/HostStore.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>

using namespace signfleet::core;
using namespace signfleet::infra;

namespace {

class RecoveryDir {
public:
    RecoveryDir() : dir_(std::filesystem::temp_directory_path() / "signfleet_recovery_test") {
        std::filesystem::remove_all(dir_);
        std::filesystem::create_directories(dir_);
    }

    ~RecoveryDir() { std::filesystem::remove_all(dir_); }

    std::filesystem::path file(const std::string& name) const { return dir_ / name; }

    void clobber(const std::filesystem::path& path) const {
        std::filesystem::remove(path.string() + "-wal");
        std::filesystem::remove(path.string() + "-shm");
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        out << "this is not a database file, it was overwritten by something else";
    }

private:
    std::filesystem::path dir_;
};

Host makeHost(const std::string& id, const std::string& ip, const std::string& nickname) {
    Host host = Host::withDefaults(ip);
    host.id = id;
    host.nickname = nickname;
    return host;
}

} // namespace

TEST_CASE("Roster survives a corrupted file across restarts", "[Integration][Recovery]") {
    RecoveryDir dir;
    auto dbPath = dir.file("hosts.db");

    // First run: build a roster, receive a replacement from a peer (which backs up)
    {
        HostStore store(dbPath);
        store.add(makeHost("lobby", "10.30.0.1", "Lobby"));
        store.add(makeHost("gym", "10.30.0.2", "Gym"));
        store.backupCurrent(HostStore::DefaultMaxBackups);
        store.update("10.30.0.2", [](Host& host) { host.notes = "after backup"; });
    }

    dir.clobber(dbPath);

    // Second run: the newest backup is restored and the store keeps working
    {
        HostStore store(dbPath);
        REQUIRE(store.size() == 2);
        REQUIRE(store.getById("gym").notes.empty());
        REQUIRE(std::filesystem::exists(dbPath.string() + ".corrupt"));

        store.add(makeHost("cafe", "10.30.0.3", "Cafe"));
    }

    // Third run: the recovered file is a normal live file again
    {
        HostStore store(dbPath);
        REQUIRE(store.size() == 3);
        REQUIRE(store.getById("cafe").nickname == "Cafe");
    }
}

TEST_CASE("Legacy JSON roster is migrated once", "[Integration][Recovery]") {
    RecoveryDir dir;
    auto dbPath = dir.file("hosts.db");
    auto legacyPath = dir.file("hosts.json");

    {
        std::ofstream out(legacyPath);
        out << hostsToJson({makeHost("lobby", "10.40.0.1", "Lobby"),
                            makeHost("gym", "10.40.0.2", "Gym")})
                   .dump(2);
    }

    {
        HostStore store(dbPath, legacyPath);
        REQUIRE(store.size() == 2);
        REQUIRE(store.getByIp("10.40.0.2").nickname == "Gym");
        store.remove("10.40.0.1");
    }

    REQUIRE_FALSE(std::filesystem::exists(legacyPath));
    REQUIRE(std::filesystem::exists(legacyPath.string() + ".migrated"));

    // A later start must not re-import the old roster
    HostStore reopened(dbPath, legacyPath);
    REQUIRE(reopened.size() == 1);
}

TEST_CASE("An empty legacy roster never replaces the live one", "[Integration][Recovery]") {
    RecoveryDir dir;
    auto dbPath = dir.file("hosts.db");
    auto legacyPath = dir.file("hosts.json");

    {
        HostStore store(dbPath);
        store.add(makeHost("a", "10.45.0.1", "Lobby"));
        store.add(makeHost("b", "10.45.0.2", "Gym"));
    }

    SECTION("An empty array") { std::ofstream(legacyPath) << "[]"; }
    SECTION("An empty object") { std::ofstream(legacyPath) << "{}"; }
    SECTION("Only whitespace") { std::ofstream(legacyPath) << "  \n\t\n"; }

    HostStore store(dbPath, legacyPath);
    REQUIRE(store.size() == 2);
    REQUIRE(store.getById("a").nickname == "Lobby");
    REQUIRE(store.listBackups().empty());
    REQUIRE_FALSE(std::filesystem::exists(legacyPath));
    REQUIRE_FALSE(std::filesystem::exists(legacyPath.string() + ".migrated"));
}

TEST_CASE("A legacy roster over a populated store keeps a backup", "[Integration][Recovery]") {
    RecoveryDir dir;
    auto dbPath = dir.file("hosts.db");
    auto legacyPath = dir.file("hosts.json");

    {
        HostStore store(dbPath);
        store.add(makeHost("a", "10.46.0.1", "Lobby"));
    }
    std::ofstream(legacyPath) << hostsToJson({makeHost("old", "10.46.0.9", "Old")}).dump();

    HostStore store(dbPath, legacyPath);
    REQUIRE(store.size() == 1);
    REQUIRE(store.getById("old").nickname == "Old");
    REQUIRE(std::filesystem::exists(legacyPath.string() + ".migrated"));

    REQUIRE(store.listBackups().size() == 1);
    store.restoreLatestBackup(HostStore::DefaultMaxBackups);
    REQUIRE(store.getById("a").nickname == "Lobby");
}

TEST_CASE("A malformed legacy roster is left for the operator", "[Integration][Recovery]") {
    RecoveryDir dir;
    auto legacyPath = dir.file("hosts.json");
    std::ofstream(legacyPath) << "[{\"ip_address\": ";

    HostStore store(dir.file("hosts.db"), legacyPath);
    REQUIRE(store.size() == 0);
    REQUIRE(std::filesystem::exists(legacyPath));
}

TEST_CASE("Snapshots move a roster between stores", "[Integration][Snapshot]") {
    RecoveryDir dir;
    HostStore source(dir.file("source.db"));
    source.add(makeHost("lobby", "10.50.0.1", "Lobby"));
    source.add(makeHost("gym", "10.50.0.2", "Gym"));

    HostStore target(dir.file("target.db"));
    target.add(makeHost("old", "10.50.0.9", "Old"));

    auto previous = target.importSnapshot(source.exportSnapshot(), HostStore::DefaultMaxBackups);

    REQUIRE(target.size() == 2);
    REQUIRE(target.getById("lobby").nickname == "Lobby");

    // the replaced roster is recoverable from the backup that import made
    target.restoreBackup(previous.filename().string(), HostStore::DefaultMaxBackups);
    REQUIRE(target.size() == 1);
    REQUIRE(target.getById("old").nickname == "Old");
}
