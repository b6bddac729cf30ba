/**
 * @file HostStore.hpp
 * @brief Durable, concurrent-safe roster of fleet hosts.
 *
 * HostStore owns the SQLite roster file and its backups directory. It
 * recovers from a corrupt or missing file at construction time, serializes
 * all mutations behind one reader/writer lock and hands out copies only.
 */

#pragma once

#include "core/events/ChangeNotifier.hpp"
#include "core/types/Host.hpp"
#include "infrastructure/database/Database.hpp"

#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <shared_mutex>
#include <string>
#include <vector>

namespace signfleet::infra {

/**
 * @brief Metadata of one file in the backups directory.
 */
struct BackupInfo {
    std::string name;            ///< File name inside the backups directory
    std::filesystem::path path;  ///< Full path
    int64_t timestamp{0};        ///< Unix seconds embedded in the name (or mtime)
    uintmax_t sizeBytes{0};      ///< File size

    bool operator==(const BackupInfo& other) const = default;
};

/**
 * @brief The roster store.
 *
 * Reads take a shared lock and return copies; writes, backups and restores
 * take the exclusive lock for the whole mutation including persistence.
 * Every successful mutation publishes once on updates().
 *
 * @note This class is non-copyable.
 */
class HostStore {
public:
    static constexpr int DefaultMaxBackups = 20;

    /**
     * @brief Opens the roster, recovering if necessary.
     *
     * A missing, empty or corrupt file is replaced by the newest backup
     * that opens cleanly, or by an empty roster if none does. When
     * legacyJsonPath names an existing JSON roster, its records replace the
     * roster and the file is renamed with a ".migrated" suffix.
     *
     * @param path Path of the SQLite roster file.
     * @param legacyJsonPath Optional JSON roster from older releases.
     * @throws core::StoreIoError only if not even an empty roster can be
     *         created (e.g. the directory is not writable).
     */
    explicit HostStore(std::filesystem::path path, std::filesystem::path legacyJsonPath = {});

    ~HostStore();

    HostStore(const HostStore&) = delete;
    HostStore& operator=(const HostStore&) = delete;

    /**
     * @brief Returns a copy of the roster in storage order.
     */
    std::vector<core::Host> getAll() const;

    /**
     * @brief Returns the record with the given id.
     * @throws core::NotFoundError if absent.
     */
    core::Host getById(const std::string& id) const;

    /**
     * @brief Returns the record with the given primary address.
     * @throws core::NotFoundError if absent.
     */
    core::Host getByIp(const std::string& ip) const;

    /**
     * @brief Returns the number of records.
     */
    size_t size() const;

    /**
     * @brief Appends a new record.
     * @param host Record to add; its primary address must be valid.
     * @throws core::InvalidAddressError for a malformed address.
     * @throws core::DuplicateHostError if the address or id is taken.
     * @throws core::StoreIoError if the write fails.
     */
    void add(const core::Host& host);

    /**
     * @brief Mutates the record at an address in place.
     *
     * The mutation may change the address; the record keeps its position.
     *
     * @param ip Current primary address of the record.
     * @param mutation Callback applied to a copy that is then persisted.
     * @throws core::NotFoundError if no record has that address.
     * @throws core::InvalidAddressError if the mutation leaves an invalid address.
     * @throws core::DuplicateHostError if the new address or id is taken.
     */
    void update(const std::string& ip, const std::function<void(core::Host&)>& mutation);

    /**
     * @brief Deletes the record at an address.
     * @throws core::NotFoundError if no record has that address.
     */
    void remove(const std::string& ip);

    /**
     * @brief Inserts or overwrites a record.
     *
     * The target is the record with the same id, or (for an empty id, or
     * an id-less record at the same address) the record at the same
     * address. Any other record occupying the incoming address is evicted
     * as stale in the same transaction.
     *
     * @throws core::InvalidAddressError if an address is malformed or both
     *         id and address are empty.
     */
    void upsert(const core::Host& host);

    /**
     * @brief Atomically replaces the roster.
     * @throws core::InvalidAddressError for a malformed address.
     * @throws core::DuplicateHostError if the set repeats an id or address.
     */
    void replaceAll(const std::vector<core::Host>& hosts);

    /**
     * @brief Keeps one record per hostname.
     *
     * Deletes every other record that shares the chosen record's hostname.
     *
     * @param id Id of the record to keep.
     * @return Number of records removed.
     * @throws core::NotFoundError if the id is unknown.
     */
    int setPrimary(const std::string& id);

    /**
     * @brief Copies the live file into the backups directory.
     * @param maxBackups Retention; older backups beyond it are pruned.
     * @return Path of the new backup, or an empty path if there is no live file.
     * @throws core::StoreIoError if the copy fails.
     */
    std::filesystem::path backupCurrent(int maxBackups = DefaultMaxBackups);

    /**
     * @brief Installs a serialized roster database as the live store.
     *
     * The bytes are validated before the live file is touched; the live
     * file is then moved into the backups directory.
     *
     * @param bytes Contents of a roster database file.
     * @param maxBackups Retention applied afterwards.
     * @return Path the previous live file was moved to (empty if none).
     * @throws core::InvalidSnapshotError if the bytes are not a roster database.
     * @throws core::StoreIoError if installing fails.
     */
    std::filesystem::path importSnapshot(const std::string& bytes,
                                         int maxBackups = DefaultMaxBackups);

    /**
     * @brief Returns the bytes of a consistent copy of the live roster.
     * @throws core::StoreIoError if the copy fails.
     */
    std::string exportSnapshot();

    /**
     * @brief Lists backups, newest first.
     */
    std::vector<BackupInfo> listBackups() const;

    /**
     * @brief Restores a named backup through the import path.
     * @param name File name inside the backups directory; directories are stripped.
     * @param maxBackups Retention applied afterwards.
     * @throws core::BackupUnavailableError if the backup is missing or unreadable.
     */
    void restoreBackup(const std::string& name, int maxBackups = DefaultMaxBackups);

    /**
     * @brief Restores the newest backup.
     * @return Name of the restored backup.
     * @throws core::BackupUnavailableError if there are no usable backups.
     */
    std::string restoreLatestBackup(int maxBackups = DefaultMaxBackups);

    /**
     * @brief Returns the change broadcast.
     */
    core::ChangeNotifier& updates() { return notifier_; }

    const std::filesystem::path& path() const { return path_; }
    const std::filesystem::path& backupDirectory() const { return backupDir_; }

private:
    void open();
    Database& liveDb() const;
    std::unique_ptr<Database> openVerified(const std::filesystem::path& file);
    bool restoreFromBackups();
    void resetFiles();
    void migrateLegacyJson();

    void replaceAllLocked(const std::vector<core::Host>& hosts);
    std::filesystem::path backupLocked(int maxBackups);
    std::filesystem::path nextBackupPath() const;
    std::vector<BackupInfo> listBackupsLocked() const;
    void pruneLocked(int maxBackups);
    std::filesystem::path installLocked(const std::filesystem::path& source, int maxBackups);
    std::filesystem::path stageCopy(const std::filesystem::path& source) const;

    std::filesystem::path path_;
    std::filesystem::path backupDir_;
    std::filesystem::path legacyJsonPath_;
    std::unique_ptr<Database> db_;
    mutable std::shared_mutex mutex_;
    core::ChangeNotifier notifier_;
};

} // namespace signfleet::infra
