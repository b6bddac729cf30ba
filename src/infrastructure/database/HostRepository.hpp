#pragma once

#include "core/types/Host.hpp"
#include "infrastructure/database/Database.hpp"

#include <memory>
#include <optional>
#include <vector>

namespace signfleet::infra {

/**
 * @brief A host together with its storage position.
 */
struct HostRow {
    int64_t rowId{0};  ///< Autoincrement key; defines roster order
    core::Host host;   ///< Stored record
};

/**
 * @brief Repository for Host persistence operations.
 *
 * Maps Host records to rows of the hosts table. Performs no locking and no
 * validation; HostStore is the only caller and provides both.
 */
class HostRepository {
public:
    /**
     * @brief Constructs a HostRepository over the given database.
     * @param db Database holding the hosts table (migrations already run).
     */
    explicit HostRepository(Database& db);

    /**
     * @brief Appends a host at the end of the roster.
     * @param host Host to insert.
     * @return Row id of the inserted host.
     */
    int64_t insert(const core::Host& host);

    /**
     * @brief Overwrites every column of an existing row.
     * @param rowId Row to overwrite.
     * @param host New contents.
     */
    void update(int64_t rowId, const core::Host& host);

    /**
     * @brief Removes a row.
     * @param rowId Row to remove.
     */
    void remove(int64_t rowId);

    /**
     * @brief Removes the host stored at an address.
     * @param ipAddress Primary address of the host.
     * @return True if a row was deleted.
     */
    bool removeByAddress(const std::string& ipAddress);

    /**
     * @brief Removes every host.
     */
    void removeAll();

    std::optional<HostRow> findById(const std::string& id);
    std::optional<HostRow> findByAddress(const std::string& ipAddress);

    /**
     * @brief Finds every host reporting the given hostname.
     * @param hostname Hostname to match exactly.
     * @return Matching rows in roster order.
     */
    std::vector<HostRow> findByHostname(const std::string& hostname);

    /**
     * @brief Retrieves the whole roster in storage order.
     * @return Vector of all hosts.
     */
    std::vector<core::Host> findAll();

    /**
     * @brief Returns the number of hosts in the roster.
     */
    int count();

private:
    static void bindHost(Statement& stmt, const core::Host& host);
    static HostRow rowToHost(Statement& stmt);

    Database& db_;
};

} // namespace signfleet::infra
