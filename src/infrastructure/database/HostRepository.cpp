#include "infrastructure/database/HostRepository.hpp"

#include "core/types/Timestamp.hpp"

#include <spdlog/spdlog.h>

namespace signfleet::infra {

namespace {

constexpr const char* kColumns =
    "id, nickname, ip_address, vpn_ip_address, hostname, notes, "
    "status, status_vpn, nsm_status, nsm_status_vpn, nsm_version, nsm_version_vpn, "
    "anthias_version, anthias_version_vpn, anthias_status, anthias_status_vpn, "
    "cms_status, cms_status_vpn, asset_count, asset_count_vpn, "
    "dashboard_url, dashboard_url_vpn, last_checked, last_checked_vpn";

std::string selectSql(const std::string& where) {
    return std::string("SELECT row_id, ") + kColumns + " FROM hosts " + where;
}

void bindTimestamp(Statement& stmt, int index,
                   const std::optional<std::chrono::system_clock::time_point>& tp) {
    if (tp) {
        stmt.bind(index, core::formatTimestamp(*tp));
    } else {
        stmt.bindNull(index);
    }
}

std::optional<std::chrono::system_clock::time_point> columnTimestamp(Statement& stmt, int index) {
    if (stmt.columnIsNull(index)) {
        return std::nullopt;
    }
    return core::parseTimestamp(stmt.columnText(index));
}

} // namespace

HostRepository::HostRepository(Database& db) : db_(db) {}

void HostRepository::bindHost(Statement& stmt, const core::Host& host) {
    stmt.bind(1, host.id);
    stmt.bind(2, host.nickname);
    stmt.bind(3, host.ipAddress);
    stmt.bind(4, host.vpnIpAddress);
    stmt.bind(5, host.hostname);
    stmt.bind(6, host.notes);
    stmt.bind(7, core::hostStatusToString(host.primary.status));
    stmt.bind(8, core::hostStatusToString(host.vpn.status));
    stmt.bind(9, host.primary.serviceStatus);
    stmt.bind(10, host.vpn.serviceStatus);
    stmt.bind(11, host.primary.serviceVersion);
    stmt.bind(12, host.vpn.serviceVersion);
    stmt.bind(13, host.primary.anthiasVersion);
    stmt.bind(14, host.vpn.anthiasVersion);
    stmt.bind(15, host.primary.anthiasStatus);
    stmt.bind(16, host.vpn.anthiasStatus);
    stmt.bind(17, core::cmsStatusToString(host.primary.cmsStatus));
    stmt.bind(18, core::cmsStatusToString(host.vpn.cmsStatus));
    stmt.bind(19, host.primary.assetCount);
    stmt.bind(20, host.vpn.assetCount);
    stmt.bind(21, host.primary.dashboardUrl);
    stmt.bind(22, host.vpn.dashboardUrl);
    bindTimestamp(stmt, 23, host.primary.lastChecked);
    bindTimestamp(stmt, 24, host.vpn.lastChecked);
}

int64_t HostRepository::insert(const core::Host& host) {
    auto stmt = db_.prepare(std::string("INSERT INTO hosts (") + kColumns +
                            ") VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, "
                            "?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)");
    bindHost(stmt, host);

    stmt.step();
    auto rowId = db_.lastInsertRowId();
    spdlog::debug("Inserted host {} ({}) as row {}", host.ipAddress, host.id, rowId);
    return rowId;
}

void HostRepository::update(int64_t rowId, const core::Host& host) {
    auto stmt = db_.prepare(R"(
        UPDATE hosts SET
            id = ?, nickname = ?, ip_address = ?, vpn_ip_address = ?, hostname = ?, notes = ?,
            status = ?, status_vpn = ?, nsm_status = ?, nsm_status_vpn = ?,
            nsm_version = ?, nsm_version_vpn = ?, anthias_version = ?, anthias_version_vpn = ?,
            anthias_status = ?, anthias_status_vpn = ?, cms_status = ?, cms_status_vpn = ?,
            asset_count = ?, asset_count_vpn = ?, dashboard_url = ?, dashboard_url_vpn = ?,
            last_checked = ?, last_checked_vpn = ?
        WHERE row_id = ?
    )");
    bindHost(stmt, host);
    stmt.bind(25, rowId);

    stmt.step();
    spdlog::debug("Updated host row {}", rowId);
}

void HostRepository::remove(int64_t rowId) {
    db_.execute("DELETE FROM hosts WHERE row_id = ?", rowId);
    spdlog::debug("Removed host row {}", rowId);
}

bool HostRepository::removeByAddress(const std::string& ipAddress) {
    auto stmt = db_.prepare("DELETE FROM hosts WHERE ip_address = ?");
    stmt.bind(1, ipAddress);
    stmt.step();
    return db_.changes() > 0;
}

void HostRepository::removeAll() {
    db_.execute("DELETE FROM hosts");
}

std::optional<HostRow> HostRepository::findById(const std::string& id) {
    auto stmt = db_.prepare(selectSql("WHERE id = ?"));
    stmt.bind(1, id);

    if (stmt.step()) {
        return rowToHost(stmt);
    }
    return std::nullopt;
}

std::optional<HostRow> HostRepository::findByAddress(const std::string& ipAddress) {
    auto stmt = db_.prepare(selectSql("WHERE ip_address = ?"));
    stmt.bind(1, ipAddress);

    if (stmt.step()) {
        return rowToHost(stmt);
    }
    return std::nullopt;
}

std::vector<HostRow> HostRepository::findByHostname(const std::string& hostname) {
    std::vector<HostRow> rows;
    auto stmt = db_.prepare(selectSql("WHERE hostname = ? ORDER BY row_id"));
    stmt.bind(1, hostname);

    while (stmt.step()) {
        rows.push_back(rowToHost(stmt));
    }
    return rows;
}

std::vector<core::Host> HostRepository::findAll() {
    std::vector<core::Host> hosts;
    auto stmt = db_.prepare(selectSql("ORDER BY row_id"));

    while (stmt.step()) {
        hosts.push_back(rowToHost(stmt).host);
    }
    return hosts;
}

int HostRepository::count() {
    auto stmt = db_.prepare("SELECT COUNT(*) FROM hosts");
    stmt.step();
    return stmt.columnInt(0);
}

HostRow HostRepository::rowToHost(Statement& stmt) {
    HostRow row;
    row.rowId = stmt.columnInt64(0);

    auto& host = row.host;
    host.id = stmt.columnText(1);
    host.nickname = stmt.columnText(2);
    host.ipAddress = stmt.columnText(3);
    host.vpnIpAddress = stmt.columnText(4);
    host.hostname = stmt.columnText(5);
    host.notes = stmt.columnText(6);
    host.primary.status = core::hostStatusFromString(stmt.columnText(7));
    host.vpn.status = core::hostStatusFromString(stmt.columnText(8));
    host.primary.serviceStatus = stmt.columnText(9);
    host.vpn.serviceStatus = stmt.columnText(10);
    host.primary.serviceVersion = stmt.columnText(11);
    host.vpn.serviceVersion = stmt.columnText(12);
    host.primary.anthiasVersion = stmt.columnText(13);
    host.vpn.anthiasVersion = stmt.columnText(14);
    host.primary.anthiasStatus = stmt.columnText(15);
    host.vpn.anthiasStatus = stmt.columnText(16);
    host.primary.cmsStatus = core::cmsStatusFromString(stmt.columnText(17));
    host.vpn.cmsStatus = core::cmsStatusFromString(stmt.columnText(18));
    host.primary.assetCount = stmt.columnInt(19);
    host.vpn.assetCount = stmt.columnInt(20);
    host.primary.dashboardUrl = stmt.columnText(21);
    host.vpn.dashboardUrl = stmt.columnText(22);
    host.primary.lastChecked = columnTimestamp(stmt, 23);
    host.vpn.lastChecked = columnTimestamp(stmt, 24);

    return row;
}

} // namespace signfleet::infra
