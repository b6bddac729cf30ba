#include <catch2/catch_test_macros.hpp>

#include "core/types/Errors.hpp"
#include "infrastructure/database/HostStore.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <string>

using namespace signfleet::infra;
using namespace signfleet::core;

namespace {

class TestStoreDir {
public:
    TestStoreDir() : dir_(std::filesystem::temp_directory_path() / "signfleet_backups_test") {
        std::filesystem::remove_all(dir_);
        std::filesystem::create_directories(dir_);
    }

    ~TestStoreDir() { std::filesystem::remove_all(dir_); }

    std::filesystem::path dbPath() const { return dir_ / "hosts.db"; }
    std::filesystem::path backupDir() const { return dir_ / "backups"; }

    size_t backupCount() const {
        if (!std::filesystem::exists(backupDir())) {
            return 0;
        }
        size_t count = 0;
        for (const auto& entry : std::filesystem::directory_iterator(backupDir())) {
            if (entry.is_regular_file()) {
                ++count;
            }
        }
        return count;
    }

    void corruptLiveFile() const {
        std::filesystem::remove(dbPath().string() + "-wal");
        std::filesystem::remove(dbPath().string() + "-shm");
        std::ofstream out(dbPath(), std::ios::binary | std::ios::trunc);
        out << std::string(4096, '\x5a');
    }

private:
    std::filesystem::path dir_;
};

Host makeHost(const std::string& id, const std::string& ip) {
    Host host = Host::withDefaults(ip);
    host.id = id;
    return host;
}

} // namespace

TEST_CASE("HostStore backupCurrent", "[HostStore][Backup]") {
    TestStoreDir dir;
    HostStore store(dir.dbPath());
    store.add(makeHost("a", "10.0.0.1"));

    SECTION("Creates exactly one file per call") {
        auto first = store.backupCurrent(10);
        REQUIRE(std::filesystem::exists(first));
        REQUIRE(first.parent_path() == dir.backupDir());
        REQUIRE(dir.backupCount() == 1);

        auto second = store.backupCurrent(10);
        REQUIRE(second != first);
        REQUIRE(dir.backupCount() == 2);
    }

    SECTION("Names embed a timestamp and keep the live extension") {
        auto path = store.backupCurrent(10);
        auto name = path.filename().string();
        REQUIRE(name.rfind("hosts-", 0) == 0);
        REQUIRE(path.extension() == ".db");
    }

    SECTION("Never keeps more than the retention") {
        for (int i = 0; i < 6; ++i) {
            store.backupCurrent(3);
            REQUIRE(dir.backupCount() <= 3);
        }
        REQUIRE(dir.backupCount() == 3);
    }

    SECTION("Pruning drops the oldest first") {
        auto oldest = store.backupCurrent(2);
        auto middle = store.backupCurrent(2);
        auto newest = store.backupCurrent(2);

        REQUIRE_FALSE(std::filesystem::exists(oldest));
        REQUIRE(std::filesystem::exists(middle));
        REQUIRE(std::filesystem::exists(newest));
    }

    SECTION("listBackups is newest first with sizes") {
        store.backupCurrent(10);
        auto newest = store.backupCurrent(10);

        auto backups = store.listBackups();
        REQUIRE(backups.size() == 2);
        REQUIRE(backups[0].path == newest);
        REQUIRE(backups[0].timestamp > backups[1].timestamp);
        REQUIRE(backups[0].sizeBytes > 0);
    }
}

TEST_CASE("HostStore backups made faster than one per second", "[HostStore][Backup]") {
    TestStoreDir dir;
    HostStore store(dir.dbPath());

    for (int i = 1; i <= 10; ++i) {
        store.add(makeHost("h" + std::to_string(i), "10.0.1." + std::to_string(i)));
        auto path = store.backupCurrent(2);

        REQUIRE(std::filesystem::exists(path));
        auto backups = store.listBackups();
        REQUIRE(backups.size() == static_cast<size_t>(std::min(i, 2)));
        REQUIRE(backups.front().path == path);
    }

    // The newest backup holds the last state, not an older one
    store.replaceAll({});
    store.restoreLatestBackup(2);
    REQUIRE(store.size() == 10);
}

TEST_CASE("HostStore backup names that are not timestamps", "[HostStore][Backup]") {
    TestStoreDir dir;
    std::filesystem::create_directories(dir.backupDir());
    auto odd = dir.backupDir() / "hosts-99999999999999999999999.db";
    std::ofstream(odd, std::ios::binary) << "not a database";

    HostStore store(dir.dbPath());
    REQUIRE(store.size() == 0);

    auto backups = store.listBackups();
    REQUIRE(backups.size() == 1);
    REQUIRE(backups[0].path == odd);
    REQUIRE(backups[0].timestamp > 0);

    store.add(makeHost("a", "10.0.0.1"));
    auto path = store.backupCurrent(10);
    REQUIRE(store.listBackups().front().path == path);
}

TEST_CASE("HostStore backup of a missing live file", "[HostStore][Backup]") {
    TestStoreDir dir;
    HostStore store(dir.dbPath());

    // The store only ever loses its file through outside interference
    std::filesystem::remove(dir.dbPath());

    REQUIRE(store.backupCurrent(10).empty());
    REQUIRE(dir.backupCount() == 0);
}

TEST_CASE("HostStore recovery at open", "[HostStore][Recovery]") {
    TestStoreDir dir;

    SECTION("Corrupt file with a valid backup restores the newest backup") {
        {
            HostStore store(dir.dbPath());
            store.add(makeHost("a", "10.0.0.1"));
            store.backupCurrent(10);
            store.add(makeHost("b", "10.0.0.2"));
            store.backupCurrent(10);
            store.add(makeHost("c", "10.0.0.3"));
        }
        dir.corruptLiveFile();

        HostStore recovered(dir.dbPath());
        auto all = recovered.getAll();
        REQUIRE(all.size() == 2);
        REQUIRE(all[0].id == "a");
        REQUIRE(all[1].id == "b");
        REQUIRE(std::filesystem::exists(dir.dbPath().string() + ".corrupt"));
    }

    SECTION("Unreadable newest backup falls back to the next one") {
        {
            HostStore store(dir.dbPath());
            store.add(makeHost("a", "10.0.0.1"));
            store.backupCurrent(10);
            store.add(makeHost("b", "10.0.0.2"));
            auto newest = store.backupCurrent(10);
            std::ofstream(newest, std::ios::binary | std::ios::trunc) << "garbage";
        }
        dir.corruptLiveFile();

        HostStore recovered(dir.dbPath());
        REQUIRE(recovered.size() == 1);
        REQUIRE(recovered.getById("a").ipAddress == "10.0.0.1");
    }

    SECTION("Corrupt file without backups yields an empty, writable roster") {
        {
            HostStore store(dir.dbPath());
            store.add(makeHost("a", "10.0.0.1"));
        }
        dir.corruptLiveFile();

        HostStore recovered(dir.dbPath());
        REQUIRE(recovered.size() == 0);
        recovered.add(makeHost("z", "10.0.0.26"));
        REQUIRE(recovered.size() == 1);
    }

    SECTION("An empty file is treated like a missing one") {
        std::ofstream(dir.dbPath()).close();

        HostStore store(dir.dbPath());
        REQUIRE(store.size() == 0);
        store.add(makeHost("a", "10.0.0.1"));
        REQUIRE(store.size() == 1);
    }

    SECTION("A missing file with backups restores the newest backup") {
        {
            HostStore store(dir.dbPath());
            store.add(makeHost("a", "10.0.0.1"));
            store.backupCurrent(10);
        }
        std::filesystem::remove(dir.dbPath());

        HostStore recovered(dir.dbPath());
        REQUIRE(recovered.getById("a").ipAddress == "10.0.0.1");
    }
}

TEST_CASE("HostStore snapshots", "[HostStore][Snapshot]") {
    TestStoreDir dir;
    HostStore store(dir.dbPath());
    store.add(makeHost("a", "10.0.0.1"));

    SECTION("Export then import restores the exported roster") {
        auto bytes = store.exportSnapshot();
        REQUIRE(bytes.size() > 0);
        REQUIRE(bytes.rfind("SQLite format 3", 0) == 0);

        store.replaceAll({makeHost("b", "10.0.0.2")});
        auto previous = store.importSnapshot(bytes, 10);

        REQUIRE(std::filesystem::exists(previous));
        REQUIRE(store.size() == 1);
        REQUIRE(store.getById("a").ipAddress == "10.0.0.1");
        REQUIRE(dir.backupCount() == 1);
    }

    SECTION("Import backs up the live roster first") {
        auto bytes = store.exportSnapshot();
        store.replaceAll({makeHost("b", "10.0.0.2")});
        auto previous = store.importSnapshot(bytes, 10);

        REQUIRE(previous.parent_path() == dir.backupDir());
        REQUIRE(std::filesystem::file_size(previous) > 0);
    }

    SECTION("Garbage bytes are rejected without touching the roster") {
        REQUIRE_THROWS_AS(store.importSnapshot("definitely not sqlite", 10),
                          InvalidSnapshotError);
        REQUIRE(store.getById("a").ipAddress == "10.0.0.1");
        REQUIRE(dir.backupCount() == 0);
    }

    SECTION("A failed install leaves the old roster usable") {
        auto bytes = store.exportSnapshot();
        // a file where the backups directory belongs makes moving the live file aside fail
        std::ofstream(dir.backupDir()) << "in the way";

        REQUIRE_THROWS_AS(store.importSnapshot(bytes, 10), StoreIoError);
        REQUIRE(store.getById("a").ipAddress == "10.0.0.1");
        store.add(makeHost("b", "10.0.0.2"));
        REQUIRE(store.size() == 2);
    }

    SECTION("Import publishes a change") {
        auto bytes = store.exportSnapshot();
        auto subscription = store.updates().subscribe();
        store.importSnapshot(bytes, 10);
        REQUIRE(subscription->tryConsume());
    }

    SECTION("The store keeps working after an import") {
        store.importSnapshot(store.exportSnapshot(), 10);
        store.add(makeHost("b", "10.0.0.2"));
        REQUIRE(store.size() == 2);
    }
}

TEST_CASE("HostStore restore from backups", "[HostStore][Restore]") {
    TestStoreDir dir;
    HostStore store(dir.dbPath());
    store.add(makeHost("a", "10.0.0.1"));
    auto backup = store.backupCurrent(10);
    store.replaceAll({makeHost("b", "10.0.0.2")});

    SECTION("Restores a named backup") {
        store.restoreBackup(backup.filename().string(), 10);
        REQUIRE(store.size() == 1);
        REQUIRE(store.getById("a").ipAddress == "10.0.0.1");
        // the backup itself stays available
        REQUIRE(std::filesystem::exists(backup));
    }

    SECTION("Directory components are stripped from the name") {
        store.restoreBackup("../../" + backup.filename().string(), 10);
        REQUIRE(store.getById("a").ipAddress == "10.0.0.1");
    }

    SECTION("Restores the newest backup") {
        auto name = store.restoreLatestBackup(10);
        REQUIRE(name == backup.filename().string());
        REQUIRE(store.getById("a").ipAddress == "10.0.0.1");
    }

    SECTION("Missing backups are reported as unavailable") {
        REQUIRE_THROWS_AS(store.restoreBackup("hosts-1.db", 10), BackupUnavailableError);
        REQUIRE_THROWS_AS(store.restoreBackup("", 10), BackupUnavailableError);
        REQUIRE(store.getById("b").ipAddress == "10.0.0.2");
    }

    SECTION("Unreadable backups are reported as unavailable") {
        std::ofstream(backup, std::ios::binary | std::ios::trunc) << "garbage";
        REQUIRE_THROWS_AS(store.restoreBackup(backup.filename().string(), 10),
                          BackupUnavailableError);
        REQUIRE(store.getById("b").ipAddress == "10.0.0.2");
    }

    SECTION("Unavailable is a kind of not found") {
        REQUIRE_THROWS_AS(store.restoreBackup("nope.db", 10), NotFoundError);
    }
}

TEST_CASE("HostStore restoreLatestBackup without backups", "[HostStore][Restore]") {
    TestStoreDir dir;
    HostStore store(dir.dbPath());
    REQUIRE_THROWS_AS(store.restoreLatestBackup(10), BackupUnavailableError);
}
