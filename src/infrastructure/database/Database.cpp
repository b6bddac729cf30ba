#include "infrastructure/database/Database.hpp"

#include "core/types/Errors.hpp"

#include <spdlog/spdlog.h>

namespace signfleet::infra {

// Statement implementation
Statement::Statement(sqlite3_stmt* stmt) : stmt_(stmt) {}

Statement::~Statement() {
    if (stmt_) {
        sqlite3_finalize(stmt_);
    }
}

Statement::Statement(Statement&& other) noexcept : stmt_(other.stmt_) {
    other.stmt_ = nullptr;
}

Statement& Statement::operator=(Statement&& other) noexcept {
    if (this != &other) {
        if (stmt_) {
            sqlite3_finalize(stmt_);
        }
        stmt_ = other.stmt_;
        other.stmt_ = nullptr;
    }
    return *this;
}

void Statement::bind(int index, int value) {
    if (sqlite3_bind_int(stmt_, index, value) != SQLITE_OK) {
        throw core::StoreIoError("Failed to bind int parameter");
    }
}

void Statement::bind(int index, int64_t value) {
    if (sqlite3_bind_int64(stmt_, index, value) != SQLITE_OK) {
        throw core::StoreIoError("Failed to bind int64 parameter");
    }
}

void Statement::bind(int index, const std::string& value) {
    if (sqlite3_bind_text(stmt_, index, value.c_str(), static_cast<int>(value.size()),
                          SQLITE_TRANSIENT) != SQLITE_OK) {
        throw core::StoreIoError("Failed to bind text parameter");
    }
}

void Statement::bindNull(int index) {
    if (sqlite3_bind_null(stmt_, index) != SQLITE_OK) {
        throw core::StoreIoError("Failed to bind null parameter");
    }
}

bool Statement::step() {
    int rc = sqlite3_step(stmt_);
    if (rc == SQLITE_ROW) {
        return true;
    }
    if (rc == SQLITE_DONE) {
        return false;
    }
    throw core::StoreIoError(std::string("SQLite step failed: ") +
                             sqlite3_errmsg(sqlite3_db_handle(stmt_)));
}

int Statement::columnInt(int index) const {
    return sqlite3_column_int(stmt_, index);
}

int64_t Statement::columnInt64(int index) const {
    return sqlite3_column_int64(stmt_, index);
}

std::string Statement::columnText(int index) const {
    const auto* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt_, index));
    return text ? text : "";
}

bool Statement::columnIsNull(int index) const {
    return sqlite3_column_type(stmt_, index) == SQLITE_NULL;
}

// Database implementation
Database::Database(const std::string& path) : path_(path) {
    spdlog::debug("Opening database: {}", path);

    int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
    if (sqlite3_open_v2(path.c_str(), &db_, flags, nullptr) != SQLITE_OK) {
        std::string error = db_ ? sqlite3_errmsg(db_) : "out of memory";
        sqlite3_close(db_);
        db_ = nullptr;
        throw core::StoreIoError("Failed to open database: " + error);
    }

    try {
        configureConnection();
        createMigrationsTable();
    } catch (...) {
        sqlite3_close(db_);
        db_ = nullptr;
        throw;
    }
}

Database::~Database() {
    if (db_) {
        sqlite3_close(db_);
    }
}

void Database::configureConnection() {
    sqlite3_busy_timeout(db_, 5000);
    execute("PRAGMA journal_mode=WAL");
    execute("PRAGMA synchronous=NORMAL");
}

void Database::execute(const std::string& sql) {
    std::lock_guard lock(mutex_);
    char* errMsg = nullptr;
    if (sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &errMsg) != SQLITE_OK) {
        std::string error = errMsg ? errMsg : "Unknown error";
        sqlite3_free(errMsg);
        throw core::StoreIoError("SQL execution failed: " + error);
    }
}

Statement Database::prepare(const std::string& sql) {
    std::lock_guard lock(mutex_);
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
        throw core::StoreIoError(std::string("Failed to prepare statement: ") +
                                 sqlite3_errmsg(db_));
    }
    return Statement(stmt);
}

int64_t Database::lastInsertRowId() const {
    return sqlite3_last_insert_rowid(db_);
}

int Database::changes() const {
    return sqlite3_changes(db_);
}

void Database::beginTransaction() {
    execute("BEGIN IMMEDIATE TRANSACTION");
}

void Database::commit() {
    execute("COMMIT");
}

void Database::rollback() {
    execute("ROLLBACK");
}

bool Database::checkIntegrity() {
    auto stmt = prepare("PRAGMA quick_check");
    if (!stmt.step()) {
        return false;
    }
    auto result = stmt.columnText(0);
    if (result != "ok") {
        spdlog::warn("Integrity check of {} failed: {}", path_, result);
        return false;
    }
    return true;
}

void Database::vacuumInto(const std::filesystem::path& target) {
    auto stmt = prepare("VACUUM INTO ?");
    stmt.bind(1, target.string());
    stmt.step();
}

void Database::createMigrationsTable() {
    execute(R"(
        CREATE TABLE IF NOT EXISTS schema_migrations (
            version INTEGER PRIMARY KEY,
            applied_at TEXT DEFAULT CURRENT_TIMESTAMP
        )
    )");
}

int Database::getCurrentVersion() {
    auto stmt = prepare("SELECT MAX(version) FROM schema_migrations");
    if (stmt.step() && !stmt.columnIsNull(0)) {
        return stmt.columnInt(0);
    }
    return 0;
}

void Database::setVersion(int version) {
    auto stmt = prepare("INSERT INTO schema_migrations (version) VALUES (?)");
    stmt.bind(1, version);
    stmt.step();
}

void Database::runMigrations() {
    int currentVersion = getCurrentVersion();
    spdlog::debug("Current schema version of {}: {}", path_, currentVersion);

    // Migration 1: Roster table
    if (currentVersion < 1) {
        spdlog::info("Applying migration 1: hosts table");
        transaction([this]() {
            execute(R"(
                CREATE TABLE IF NOT EXISTS hosts (
                    row_id INTEGER PRIMARY KEY AUTOINCREMENT,
                    id TEXT NOT NULL DEFAULT '',
                    nickname TEXT NOT NULL DEFAULT '',
                    ip_address TEXT NOT NULL DEFAULT '',
                    vpn_ip_address TEXT NOT NULL DEFAULT '',
                    hostname TEXT NOT NULL DEFAULT '',
                    notes TEXT NOT NULL DEFAULT '',
                    status TEXT NOT NULL DEFAULT 'Unreachable',
                    status_vpn TEXT NOT NULL DEFAULT 'Unreachable',
                    nsm_status TEXT NOT NULL DEFAULT '',
                    nsm_status_vpn TEXT NOT NULL DEFAULT '',
                    nsm_version TEXT NOT NULL DEFAULT '',
                    nsm_version_vpn TEXT NOT NULL DEFAULT '',
                    anthias_version TEXT NOT NULL DEFAULT '',
                    anthias_version_vpn TEXT NOT NULL DEFAULT '',
                    anthias_status TEXT NOT NULL DEFAULT '',
                    anthias_status_vpn TEXT NOT NULL DEFAULT '',
                    cms_status TEXT NOT NULL DEFAULT 'Unknown',
                    cms_status_vpn TEXT NOT NULL DEFAULT 'Unknown',
                    asset_count INTEGER NOT NULL DEFAULT 0,
                    asset_count_vpn INTEGER NOT NULL DEFAULT 0,
                    dashboard_url TEXT NOT NULL DEFAULT '',
                    dashboard_url_vpn TEXT NOT NULL DEFAULT '',
                    last_checked TEXT,
                    last_checked_vpn TEXT
                )
            )");

            execute("CREATE UNIQUE INDEX IF NOT EXISTS idx_hosts_id ON hosts(id) WHERE id <> ''");
            execute(
                "CREATE UNIQUE INDEX IF NOT EXISTS idx_hosts_ip ON hosts(ip_address) "
                "WHERE ip_address <> ''");

            setVersion(1);
        });
    }
}

} // namespace signfleet::infra
