#pragma once

#include <filesystem>
#include <memory>
#include <mutex>
#include <sqlite3.h>
#include <string>

namespace signfleet::infra {

/**
 * @brief RAII wrapper for SQLite prepared statements.
 *
 * Provides type-safe parameter binding and column value extraction
 * for SQLite prepared statements. Supports move semantics.
 *
 * @note This class is non-copyable but moveable.
 */
class Statement {
public:
    /**
     * @brief Constructs a Statement from a raw SQLite statement handle.
     * @param stmt SQLite prepared statement handle (takes ownership).
     */
    explicit Statement(sqlite3_stmt* stmt);

    /**
     * @brief Destructor. Finalizes the statement.
     */
    ~Statement();

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    Statement(Statement&& other) noexcept;
    Statement& operator=(Statement&& other) noexcept;

    /**
     * @brief Binds an integer value to a parameter.
     * @param index Parameter index (1-based).
     * @param value Integer value to bind.
     */
    void bind(int index, int value);

    /**
     * @brief Binds a 64-bit integer value to a parameter.
     * @param index Parameter index (1-based).
     * @param value 64-bit integer value to bind.
     */
    void bind(int index, int64_t value);

    /**
     * @brief Binds a string value to a parameter.
     * @param index Parameter index (1-based).
     * @param value String value to bind.
     */
    void bind(int index, const std::string& value);

    /**
     * @brief Binds NULL to a parameter.
     * @param index Parameter index (1-based).
     */
    void bindNull(int index);

    /**
     * @brief Executes the statement and advances to the next row.
     * @return True if a row is available, false if done.
     * @throws core::StoreIoError on any SQLite error.
     */
    bool step();

    int columnInt(int index) const;
    int64_t columnInt64(int index) const;
    std::string columnText(int index) const;
    bool columnIsNull(int index) const;

private:
    sqlite3_stmt* stmt_{nullptr};
};

/**
 * @brief SQLite database wrapper with connection management.
 *
 * Provides transactions, prepared statements, schema migrations, an
 * integrity probe and consistent file copies. Uses WAL mode for
 * concurrent access. Every SQLite failure is raised as core::StoreIoError.
 *
 * @note This class is non-copyable.
 */
class Database {
public:
    /**
     * @brief Opens or creates a database at the specified path.
     * @param path File path to the SQLite database.
     * @throws core::StoreIoError if the database cannot be opened or is not
     *         an SQLite file.
     */
    explicit Database(const std::string& path);

    /**
     * @brief Destructor. Closes the database connection.
     */
    ~Database();

    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;

    /**
     * @brief Executes a SQL statement without returning results.
     * @param sql SQL statement to execute.
     * @throws core::StoreIoError on SQL error.
     */
    void execute(const std::string& sql);

    /**
     * @brief Prepares a SQL statement for execution.
     * @param sql SQL statement to prepare.
     * @return Prepared Statement object.
     * @throws core::StoreIoError if preparation fails.
     */
    Statement prepare(const std::string& sql);

    /**
     * @brief Returns the row ID of the last inserted row.
     * @return Last insert row ID.
     */
    int64_t lastInsertRowId() const;

    /**
     * @brief Returns the number of rows affected by the last statement.
     * @return Number of changed rows.
     */
    int changes() const;

    void beginTransaction();
    void commit();
    void rollback();

    /**
     * @brief Executes a function within a transaction.
     *
     * Automatically commits on success or rolls back on exception.
     *
     * @tparam Func Callable type.
     * @param func Function to execute within the transaction.
     */
    template <typename Func>
    void transaction(Func&& func) {
        beginTransaction();
        try {
            func();
            commit();
        } catch (...) {
            rollback();
            throw;
        }
    }

    /**
     * @brief Runs pending database schema migrations.
     */
    void runMigrations();

    /**
     * @brief Runs SQLite's quick integrity check.
     * @return True if the check reports "ok".
     */
    bool checkIntegrity();

    /**
     * @brief Writes a consistent, compacted copy of the database.
     * @param target Destination file; must not exist.
     * @throws core::StoreIoError if the copy fails.
     */
    void vacuumInto(const std::filesystem::path& target);

    /**
     * @brief Returns the path the database was opened with.
     */
    const std::string& path() const { return path_; }

    /**
     * @brief Executes a SQL statement with bound parameters.
     * @tparam Args Parameter types.
     * @param sql SQL statement with placeholders.
     * @param args Values to bind to placeholders.
     */
    template <typename... Args>
    void execute(const std::string& sql, Args&&... args) {
        auto stmt = prepare(sql);
        bindAll(stmt, 1, std::forward<Args>(args)...);
        stmt.step();
    }

private:
    template <typename T, typename... Rest>
    void bindAll(Statement& stmt, int index, T&& first, Rest&&... rest) {
        bindValue(stmt, index, std::forward<T>(first));
        if constexpr (sizeof...(rest) > 0) {
            bindAll(stmt, index + 1, std::forward<Rest>(rest)...);
        }
    }

    void bindValue(Statement& stmt, int index, int value) { stmt.bind(index, value); }
    void bindValue(Statement& stmt, int index, int64_t value) { stmt.bind(index, value); }
    void bindValue(Statement& stmt, int index, const std::string& value) { stmt.bind(index, value); }

    void configureConnection();
    void createMigrationsTable();
    int getCurrentVersion();
    void setVersion(int version);

    std::string path_;
    sqlite3* db_{nullptr};
    mutable std::mutex mutex_;
};

} // namespace signfleet::infra
