#include "infrastructure/database/HostStore.hpp"

#include "core/types/Errors.hpp"
#include "infrastructure/api/HostJson.hpp"
#include "infrastructure/database/HostRepository.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <chrono>
#include <fstream>
#include <iterator>
#include <mutex>
#include <set>
#include <sstream>

namespace fs = std::filesystem;

namespace signfleet::infra {

namespace {

int64_t nowSeconds() {
    return std::chrono::duration_cast<std::chrono::seconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

int64_t fileTimeSeconds(const fs::path& file) {
    std::error_code ec;
    auto mtime = fs::last_write_time(file, ec);
    if (ec) {
        return 0;
    }
    auto system = std::chrono::file_clock::to_sys(mtime);
    return std::chrono::duration_cast<std::chrono::seconds>(system.time_since_epoch()).count();
}

// "<stem>-<digits><ext>" gives the embedded seconds, anything else the mtime
int64_t backupTimestamp(const fs::path& file, const std::string& stem, const std::string& ext) {
    auto name = file.filename().string();
    auto prefix = stem + "-";
    if (name.size() > prefix.size() + ext.size() && name.rfind(prefix, 0) == 0 &&
        name.compare(name.size() - ext.size(), ext.size(), ext) == 0) {
        auto digits = name.substr(prefix.size(), name.size() - prefix.size() - ext.size());
        int64_t seconds = 0;
        auto [end, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), seconds);
        bool numeric = !digits.empty() && std::all_of(digits.begin(), digits.end(), [](unsigned char c) {
            return std::isdigit(c);
        });
        if (numeric && ec == std::errc() && end == digits.data() + digits.size()) {
            return seconds;
        }
    }
    return fileTimeSeconds(file);
}

void validateAddresses(const core::Host& host, bool requirePrimary) {
    if ((requirePrimary || !host.ipAddress.empty()) && !core::isValidIpv4(host.ipAddress)) {
        throw core::InvalidAddressError(host.ipAddress);
    }
    if (!host.vpnIpAddress.empty() && !core::isValidIpv4(host.vpnIpAddress)) {
        throw core::InvalidAddressError(host.vpnIpAddress);
    }
}

void removeQuietly(const fs::path& file) {
    std::error_code ec;
    fs::remove(file, ec);
    if (ec) {
        spdlog::warn("Could not remove {}: {}", file.string(), ec.message());
    }
}

void writeFile(const fs::path& file, const std::string& bytes) {
    std::ofstream out(file, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw core::StoreIoError("Cannot write " + file.string());
    }
    out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    if (!out) {
        throw core::StoreIoError("Short write to " + file.string());
    }
}

std::string readFile(const fs::path& file) {
    std::ifstream in(file, std::ios::binary);
    if (!in) {
        throw core::StoreIoError("Cannot read " + file.string());
    }
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

} // namespace

HostStore::HostStore(fs::path path, fs::path legacyJsonPath)
    : path_(std::move(path)), legacyJsonPath_(std::move(legacyJsonPath)) {
    backupDir_ = path_.parent_path() / "backups";
    open();
}

HostStore::~HostStore() = default;

// Open and recovery

void HostStore::open() {
    std::error_code ec;
    if (!path_.parent_path().empty()) {
        fs::create_directories(path_.parent_path(), ec);
    }

    bool present = fs::exists(path_, ec);
    bool empty = present && fs::file_size(path_, ec) == 0;

    if (present && !empty) {
        try {
            db_ = openVerified(path_);
        } catch (const core::StoreCorruptError& e) {
            spdlog::warn("Roster file {} is corrupt: {}", path_.string(), e.what());
            fs::rename(path_, fs::path(path_.string() + ".corrupt"), ec);
        }
    } else if (empty) {
        spdlog::warn("Roster file {} is empty", path_.string());
    }

    if (!db_) {
        bool hadBackups = !listBackupsLocked().empty();
        if (!restoreFromBackups()) {
            if (present || hadBackups) {
                spdlog::error("No usable backup in {}; starting with an empty roster",
                              backupDir_.string());
            } else {
                spdlog::info("Creating new roster at {}", path_.string());
            }
            resetFiles();
            try {
                db_ = openVerified(path_);
            } catch (const core::StoreCorruptError& e) {
                throw core::StoreIoError(std::string("Cannot create roster: ") + e.what());
            }
        }
    }

    migrateLegacyJson();

    HostRepository repo(liveDb());
    spdlog::info("Roster {} opened with {} hosts", path_.string(), repo.count());
}

std::unique_ptr<Database> HostStore::openVerified(const fs::path& file) {
    try {
        auto db = std::make_unique<Database>(file.string());
        if (!db->checkIntegrity()) {
            throw core::StoreCorruptError("integrity check failed for " + file.string());
        }
        db->runMigrations();
        HostRepository(*db).count();
        return db;
    } catch (const core::StoreIoError& e) {
        throw core::StoreCorruptError(e.what());
    }
}

bool HostStore::restoreFromBackups() {
    for (const auto& backup : listBackupsLocked()) {
        try {
            resetFiles();
            fs::copy_file(backup.path, path_, fs::copy_options::overwrite_existing);
            db_ = openVerified(path_);
            spdlog::warn("Recovered roster from backup {}", backup.name);
            return true;
        } catch (const core::StoreCorruptError& e) {
            spdlog::warn("Backup {} is not usable: {}", backup.name, e.what());
        } catch (const fs::filesystem_error& e) {
            spdlog::warn("Backup {} could not be copied: {}", backup.name, e.what());
        }
    }
    return false;
}

void HostStore::resetFiles() {
    db_.reset();
    std::error_code ec;
    fs::remove(path_, ec);
    fs::remove(fs::path(path_.string() + "-wal"), ec);
    fs::remove(fs::path(path_.string() + "-shm"), ec);
}

void HostStore::migrateLegacyJson() {
    std::error_code ec;
    if (legacyJsonPath_.empty() || !fs::exists(legacyJsonPath_, ec)) {
        return;
    }

    try {
        auto text = readFile(legacyJsonPath_);
        auto first = text.find_first_not_of(" \t\r\n");
        auto trimmed = first == std::string::npos
                           ? std::string()
                           : text.substr(first, text.find_last_not_of(" \t\r\n") - first + 1);
        if (trimmed.empty() || trimmed == "[]" || trimmed == "{}") {
            spdlog::info("Removing empty legacy roster {}", legacyJsonPath_.string());
            removeQuietly(legacyJsonPath_);
            return;
        }

        auto hosts = hostsFromJson(nlohmann::json::parse(text));
        if (hosts.empty()) {
            removeQuietly(legacyJsonPath_);
            return;
        }

        // A populated roster is kept in a backup before the legacy one replaces it
        if (HostRepository(liveDb()).count() > 0) {
            backupLocked(DefaultMaxBackups);
        }
        replaceAllLocked(hosts);
        fs::rename(legacyJsonPath_, fs::path(legacyJsonPath_.string() + ".migrated"));
        spdlog::info("Migrated {} hosts from {}", hosts.size(), legacyJsonPath_.string());
    } catch (const std::exception& e) {
        spdlog::error("Failed to migrate legacy roster {}: {}", legacyJsonPath_.string(),
                      e.what());
    }
}

// Reads

std::vector<core::Host> HostStore::getAll() const {
    std::shared_lock lock(mutex_);
    return HostRepository(liveDb()).findAll();
}

core::Host HostStore::getById(const std::string& id) const {
    std::shared_lock lock(mutex_);
    auto row = HostRepository(liveDb()).findById(id);
    if (id.empty() || !row) {
        throw core::NotFoundError("host with id '" + id + "' not found");
    }
    return row->host;
}

core::Host HostStore::getByIp(const std::string& ip) const {
    std::shared_lock lock(mutex_);
    auto row = HostRepository(liveDb()).findByAddress(ip);
    if (ip.empty() || !row) {
        throw core::NotFoundError("host at '" + ip + "' not found");
    }
    return row->host;
}

size_t HostStore::size() const {
    std::shared_lock lock(mutex_);
    return static_cast<size_t>(HostRepository(liveDb()).count());
}

// Mutations

void HostStore::add(const core::Host& host) {
    validateAddresses(host, true);
    {
        std::unique_lock lock(mutex_);
        HostRepository repo(liveDb());
        if (repo.findByAddress(host.ipAddress)) {
            throw core::DuplicateHostError("a host at " + host.ipAddress + " already exists");
        }
        if (!host.id.empty() && repo.findById(host.id)) {
            throw core::DuplicateHostError("a host with id " + host.id + " already exists");
        }
        repo.insert(host);
    }
    notifier_.publish();
}

void HostStore::update(const std::string& ip,
                       const std::function<void(core::Host&)>& mutation) {
    {
        std::unique_lock lock(mutex_);
        HostRepository repo(liveDb());
        auto row = ip.empty() ? std::nullopt : repo.findByAddress(ip);
        if (!row) {
            throw core::NotFoundError("host at '" + ip + "' not found");
        }

        core::Host updated = row->host;
        mutation(updated);
        validateAddresses(updated, true);

        if (updated.ipAddress != row->host.ipAddress) {
            auto taken = repo.findByAddress(updated.ipAddress);
            if (taken && taken->rowId != row->rowId) {
                throw core::DuplicateHostError("a host at " + updated.ipAddress +
                                               " already exists");
            }
        }
        if (!updated.id.empty() && updated.id != row->host.id) {
            auto taken = repo.findById(updated.id);
            if (taken && taken->rowId != row->rowId) {
                throw core::DuplicateHostError("a host with id " + updated.id +
                                               " already exists");
            }
        }

        repo.update(row->rowId, updated);
    }
    notifier_.publish();
}

void HostStore::remove(const std::string& ip) {
    {
        std::unique_lock lock(mutex_);
        if (ip.empty() || !HostRepository(liveDb()).removeByAddress(ip)) {
            throw core::NotFoundError("host at '" + ip + "' not found");
        }
    }
    notifier_.publish();
}

void HostStore::upsert(const core::Host& host) {
    validateAddresses(host, host.id.empty());
    {
        std::unique_lock lock(mutex_);
        HostRepository repo(liveDb());
        liveDb().transaction([&]() {
            std::optional<HostRow> target;
            if (!host.id.empty()) {
                target = repo.findById(host.id);
            }

            if (!host.ipAddress.empty()) {
                auto occupant = repo.findByAddress(host.ipAddress);
                if (occupant && (!target || occupant->rowId != target->rowId)) {
                    if (!target && (host.id.empty() || occupant->host.id.empty())) {
                        target = occupant;
                    } else {
                        spdlog::info("Evicting stale host {} ({}) superseded by {}",
                                     occupant->host.ipAddress, occupant->host.id, host.id);
                        repo.remove(occupant->rowId);
                    }
                }
            }

            if (target) {
                repo.update(target->rowId, host);
            } else {
                repo.insert(host);
            }
        });
    }
    notifier_.publish();
}

void HostStore::replaceAll(const std::vector<core::Host>& hosts) {
    {
        std::unique_lock lock(mutex_);
        replaceAllLocked(hosts);
    }
    notifier_.publish();
}

void HostStore::replaceAllLocked(const std::vector<core::Host>& hosts) {
    std::set<std::string> ids;
    std::set<std::string> addresses;
    for (const auto& host : hosts) {
        validateAddresses(host, host.id.empty());
        if (!host.id.empty() && !ids.insert(host.id).second) {
            throw core::DuplicateHostError("id " + host.id + " appears twice");
        }
        if (!host.ipAddress.empty() && !addresses.insert(host.ipAddress).second) {
            throw core::DuplicateHostError("address " + host.ipAddress + " appears twice");
        }
    }

    HostRepository repo(liveDb());
    liveDb().transaction([&]() {
        repo.removeAll();
        for (const auto& host : hosts) {
            repo.insert(host);
        }
    });
    spdlog::debug("Roster replaced with {} hosts", hosts.size());
}

int HostStore::setPrimary(const std::string& id) {
    int removed = 0;
    {
        std::unique_lock lock(mutex_);
        HostRepository repo(liveDb());
        auto primary = id.empty() ? std::nullopt : repo.findById(id);
        if (!primary) {
            throw core::NotFoundError("host with id '" + id + "' not found");
        }
        if (primary->host.hostname.empty()) {
            return 0;
        }

        liveDb().transaction([&]() {
            for (const auto& row : repo.findByHostname(primary->host.hostname)) {
                if (row.rowId != primary->rowId) {
                    repo.remove(row.rowId);
                    ++removed;
                }
            }
        });
        spdlog::info("Set {} as primary for {}, removed {} duplicates", id,
                     primary->host.hostname, removed);
    }
    if (removed > 0) {
        notifier_.publish();
    }
    return removed;
}

// Backups and snapshots

Database& HostStore::liveDb() const {
    if (!db_) {
        throw core::StoreIoError("roster database " + path_.string() + " is not open");
    }
    return *db_;
}

// Always newer than every existing backup, so retention never prunes it
fs::path HostStore::nextBackupPath() const {
    auto stem = path_.stem().string();
    auto ext = path_.extension().string();
    auto timestamp = nowSeconds();
    auto existing = listBackupsLocked();
    if (!existing.empty() && existing.front().timestamp >= timestamp) {
        timestamp = existing.front().timestamp + 1;
    }

    fs::path candidate;
    do {
        candidate = backupDir_ / (stem + "-" + std::to_string(timestamp) + ext);
        ++timestamp;
    } while (fs::exists(candidate));
    return candidate;
}

std::vector<BackupInfo> HostStore::listBackupsLocked() const {
    std::vector<BackupInfo> backups;
    std::error_code ec;
    if (!fs::is_directory(backupDir_, ec)) {
        return backups;
    }

    auto stem = path_.stem().string();
    auto ext = path_.extension().string();
    for (const auto& entry : fs::directory_iterator(backupDir_, ec)) {
        if (!entry.is_regular_file() || entry.path().extension().string() != ext) {
            continue;
        }
        BackupInfo info;
        info.name = entry.path().filename().string();
        info.path = entry.path();
        info.timestamp = backupTimestamp(entry.path(), stem, ext);
        info.sizeBytes = entry.file_size(ec);
        backups.push_back(std::move(info));
    }

    std::sort(backups.begin(), backups.end(), [](const BackupInfo& a, const BackupInfo& b) {
        if (a.timestamp != b.timestamp) {
            return a.timestamp > b.timestamp;
        }
        return a.path > b.path;
    });
    return backups;
}

std::vector<BackupInfo> HostStore::listBackups() const {
    std::shared_lock lock(mutex_);
    return listBackupsLocked();
}

void HostStore::pruneLocked(int maxBackups) {
    if (maxBackups <= 0) {
        maxBackups = DefaultMaxBackups;
    }

    auto backups = listBackupsLocked();
    for (size_t i = static_cast<size_t>(maxBackups); i < backups.size(); ++i) {
        spdlog::debug("Pruning backup {}", backups[i].name);
        removeQuietly(backups[i].path);
    }
}

fs::path HostStore::backupLocked(int maxBackups) {
    std::error_code ec;
    if (!fs::exists(path_, ec)) {
        return {};
    }

    fs::create_directories(backupDir_, ec);
    if (ec) {
        throw core::StoreIoError("Cannot create backup directory: " + ec.message());
    }

    auto target = nextBackupPath();
    liveDb().vacuumInto(target);
    pruneLocked(maxBackups);

    spdlog::info("Backed up roster to {}", target.string());
    return target;
}

fs::path HostStore::backupCurrent(int maxBackups) {
    std::unique_lock lock(mutex_);
    return backupLocked(maxBackups);
}

fs::path HostStore::stageCopy(const fs::path& source) const {
    auto staged = path_.parent_path() /
                  (path_.filename().string() + ".staged-" + std::to_string(nowSeconds()));
    std::error_code ec;
    fs::copy_file(source, staged, fs::copy_options::overwrite_existing, ec);
    if (ec) {
        throw core::BackupUnavailableError("Cannot read backup " + source.filename().string() +
                                           ": " + ec.message());
    }
    return staged;
}

fs::path HostStore::installLocked(const fs::path& source, int maxBackups) {
    // Validate before touching the live file
    try {
        Database probe(source.string());
        if (!probe.checkIntegrity()) {
            throw core::InvalidSnapshotError("snapshot failed its integrity check");
        }
        probe.runMigrations();
        HostRepository(probe).count();
    } catch (const core::StoreIoError& e) {
        removeQuietly(source);
        throw core::InvalidSnapshotError(std::string("not a roster database: ") + e.what());
    } catch (const core::InvalidSnapshotError&) {
        removeQuietly(source);
        throw;
    }

    std::error_code ec;
    fs::create_directories(backupDir_, ec);

    fs::path previous;
    db_.reset();
    try {
        if (fs::exists(path_)) {
            previous = nextBackupPath();
            fs::rename(path_, previous);
        }
        fs::remove(fs::path(path_.string() + "-wal"), ec);
        fs::remove(fs::path(path_.string() + "-shm"), ec);
        fs::rename(source, path_);
        db_ = openVerified(path_);
    } catch (const std::exception& e) {
        spdlog::error("Installing snapshot failed: {}", e.what());
        removeQuietly(source);
        if (!previous.empty()) {
            fs::rename(previous, path_, ec);
        }
        try {
            db_ = openVerified(path_);
        } catch (const core::StoreCorruptError& reopen) {
            spdlog::critical("Roster could not be reopened ({}); starting with an empty roster",
                             reopen.what());
            resetFiles();
            try {
                db_ = openVerified(path_);
            } catch (const core::StoreCorruptError& fresh) {
                spdlog::critical("Cannot create roster {}: {}", path_.string(), fresh.what());
            }
        }
        throw core::StoreIoError(std::string("Installing snapshot failed: ") + e.what());
    }

    pruneLocked(maxBackups);
    spdlog::info("Installed snapshot; previous roster kept at {}", previous.string());
    return previous;
}

fs::path HostStore::importSnapshot(const std::string& bytes, int maxBackups) {
    fs::path previous;
    {
        std::unique_lock lock(mutex_);
        auto staged = path_.parent_path() /
                      (path_.filename().string() + ".import-" + std::to_string(nowSeconds()));
        writeFile(staged, bytes);
        previous = installLocked(staged, maxBackups);
    }
    notifier_.publish();
    return previous;
}

std::string HostStore::exportSnapshot() {
    std::unique_lock lock(mutex_);
    auto temp = path_.parent_path() /
                (path_.filename().string() + ".export-" + std::to_string(nowSeconds()));
    removeQuietly(temp);

    liveDb().vacuumInto(temp);
    auto bytes = readFile(temp);
    removeQuietly(temp);
    return bytes;
}

void HostStore::restoreBackup(const std::string& name, int maxBackups) {
    auto fileName = fs::path(name).filename();
    if (fileName.empty() || fileName == "." || fileName == "..") {
        throw core::BackupUnavailableError("invalid backup name '" + name + "'");
    }

    {
        std::unique_lock lock(mutex_);
        auto source = backupDir_ / fileName;
        std::error_code ec;
        if (!fs::is_regular_file(source, ec)) {
            throw core::BackupUnavailableError("backup " + fileName.string() + " not found");
        }

        try {
            installLocked(stageCopy(source), maxBackups);
        } catch (const core::InvalidSnapshotError& e) {
            throw core::BackupUnavailableError("backup " + fileName.string() +
                                               " is unreadable: " + e.what());
        }
        spdlog::info("Restored roster from backup {}", fileName.string());
    }
    notifier_.publish();
}

std::string HostStore::restoreLatestBackup(int maxBackups) {
    auto backups = listBackups();
    if (backups.empty()) {
        throw core::BackupUnavailableError("no backups available");
    }
    restoreBackup(backups.front().name, maxBackups);
    return backups.front().name;
}

} // namespace signfleet::infra
