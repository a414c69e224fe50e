#include "infrastructure/database/DeviceRepository.hpp"

#include "infrastructure/database/TimeFormat.hpp"

#include <spdlog/spdlog.h>

namespace vikabh::infra {

namespace {

constexpr const char* kSelectDevice = R"(
    SELECT id, name, host, method, port, team_id, enabled, monitoring,
           last_status, last_latency_us, last_checked_at, offline_since,
           last_offline_at, remote_access, created_at
    FROM devices
)";

std::string selectWhere(const std::string& clause) {
    return std::string(kSelectDevice) + clause;
}

} // namespace

DeviceRepository::DeviceRepository(std::shared_ptr<Database> db) : db_(std::move(db)) {}

int64_t DeviceRepository::insert(const core::Device& device) {
    device.validate();

    auto guard = db_->lock();
    auto stmt = db_->prepare(R"(
        INSERT INTO devices (name, host, method, port, team_id, enabled, monitoring, created_at)
        VALUES (?, ?, ?, ?, ?, ?, ?, ?)
        RETURNING id
    )");

    stmt.bind(1, device.name);
    stmt.bind(2, device.host);
    stmt.bind(3, device.methodToString());
    stmt.bind(4, device.port);
    stmt.bindOptional(5, device.teamId);
    stmt.bind(6, device.enabled ? 1 : 0);
    stmt.bind(7, device.monitoring ? 1 : 0);
    stmt.bind(8, timePointToString(device.createdAt));

    int64_t id = 0;
    if (stmt.step()) {
        id = stmt.columnInt64(0);
    }
    spdlog::debug("Inserted device with id: {}", id);
    return id;
}

bool DeviceRepository::update(const core::Device& device) {
    device.validate();

    auto guard = db_->lock();
    auto stmt = db_->prepare(R"(
        UPDATE devices SET
            name = ?, host = ?, method = ?, port = ?, team_id = ?, enabled = ?, monitoring = ?
        WHERE id = ?
    )");

    stmt.bind(1, device.name);
    stmt.bind(2, device.host);
    stmt.bind(3, device.methodToString());
    stmt.bind(4, device.port);
    stmt.bindOptional(5, device.teamId);
    stmt.bind(6, device.enabled ? 1 : 0);
    stmt.bind(7, device.monitoring ? 1 : 0);
    stmt.bind(8, device.id);

    stmt.step();
    bool updated = db_->changes() > 0;
    spdlog::debug("Updated device: {} (found={})", device.id, updated);
    return updated;
}

void DeviceRepository::remove(int64_t id) {
    auto guard = db_->lock();
    auto stmt = db_->prepare("DELETE FROM devices WHERE id = ?");
    stmt.bind(1, id);
    stmt.step();
    spdlog::debug("Removed device: {}", id);
}

std::optional<core::Device> DeviceRepository::findById(int64_t id) {
    auto guard = db_->lock();
    auto stmt = db_->prepare(selectWhere("WHERE id = ?"));
    stmt.bind(1, id);

    if (stmt.step()) {
        return rowToDevice(stmt);
    }
    return std::nullopt;
}

std::vector<core::Device> DeviceRepository::findAll() {
    auto guard = db_->lock();
    auto stmt = db_->prepare(selectWhere("ORDER BY name COLLATE NOCASE, id"));
    return collect(stmt);
}

std::vector<core::Device> DeviceRepository::findMonitored() {
    auto guard = db_->lock();
    auto stmt = db_->prepare(
        selectWhere("WHERE enabled = 1 AND monitoring = 1 ORDER BY name COLLATE NOCASE, id"));
    return collect(stmt);
}

std::vector<core::Device> DeviceRepository::findByTeam(std::optional<int64_t> teamId) {
    auto guard = db_->lock();
    Statement stmt = teamId
        ? db_->prepare(selectWhere("WHERE team_id = ? ORDER BY name COLLATE NOCASE, id"))
        : db_->prepare(selectWhere("WHERE team_id IS NULL ORDER BY name COLLATE NOCASE, id"));

    if (teamId) {
        stmt.bind(1, *teamId);
    }
    return collect(stmt);
}

std::vector<core::Device> DeviceRepository::findByTeamOrUnassigned(int64_t teamId) {
    auto guard = db_->lock();
    auto stmt = db_->prepare(selectWhere(
        "WHERE enabled = 1 AND (team_id = ? OR team_id IS NULL) ORDER BY name COLLATE NOCASE, id"));
    stmt.bind(1, teamId);
    return collect(stmt);
}

void DeviceRepository::setTeam(int64_t deviceId, std::optional<int64_t> teamId) {
    auto guard = db_->lock();
    auto stmt = db_->prepare("UPDATE devices SET team_id = ? WHERE id = ?");
    stmt.bindOptional(1, teamId);
    stmt.bind(2, deviceId);
    stmt.step();
    spdlog::debug("Set device {} team to {}", deviceId, teamId.value_or(-1));
}

void DeviceRepository::setEnabled(int64_t deviceId, bool enabled) {
    auto guard = db_->lock();
    auto stmt = db_->prepare("UPDATE devices SET enabled = ? WHERE id = ?");
    stmt.bind(1, enabled ? 1 : 0);
    stmt.bind(2, deviceId);
    stmt.step();
}

void DeviceRepository::setMonitoring(const std::vector<int64_t>& deviceIds, bool monitoring) {
    db_->transaction([&]() {
        auto stmt = db_->prepare("UPDATE devices SET monitoring = ? WHERE id = ?");
        for (int64_t id : deviceIds) {
            stmt.bind(1, monitoring ? 1 : 0);
            stmt.bind(2, id);
            stmt.step();
            stmt.reset();
        }
    });
    spdlog::debug("Set monitoring={} for {} devices", monitoring, deviceIds.size());
}

bool DeviceRepository::recordResult(const core::ProbeResult& result) {
    auto guard = db_->lock();
    auto stmt = db_->prepare(R"(
        UPDATE devices SET
            last_status = ?1,
            last_latency_us = ?2,
            last_checked_at = ?3,
            remote_access = ?4,
            offline_since = CASE
                WHEN ?5 = 1 THEN NULL
                ELSE COALESCE(offline_since, ?3)
            END,
            last_offline_at = CASE
                WHEN ?5 = 0 AND offline_since IS NULL THEN ?3
                ELSE last_offline_at
            END
        WHERE id = ?6
    )");

    stmt.bind(1, core::outcomeToString(result.outcome));
    if (result.latency) {
        stmt.bind(2, static_cast<int64_t>(result.latency->count()));
    } else {
        stmt.bindNull(2);
    }
    stmt.bind(3, timePointToString(result.timestamp));
    stmt.bind(4, result.auxiliaryServiceDetected ? 1 : 0);
    stmt.bind(5, result.isOnline() ? 1 : 0);
    stmt.bind(6, result.deviceId);

    stmt.step();
    return db_->changes() > 0;
}

int DeviceRepository::count() {
    auto guard = db_->lock();
    auto stmt = db_->prepare("SELECT COUNT(*) FROM devices");
    stmt.step();
    return stmt.columnInt(0);
}

std::vector<core::Device> DeviceRepository::collect(Statement& stmt) {
    std::vector<core::Device> devices;
    while (stmt.step()) {
        devices.push_back(rowToDevice(stmt));
    }
    return devices;
}

core::Device DeviceRepository::rowToDevice(Statement& stmt) {
    core::Device device;
    device.id = stmt.columnInt64(0);
    device.name = stmt.columnText(1);
    device.host = stmt.columnText(2);
    device.method = core::Device::methodFromString(stmt.columnText(3));
    device.port = stmt.columnInt(4);
    device.teamId = stmt.columnOptionalInt64(5);
    device.enabled = stmt.columnInt(6) != 0;
    device.monitoring = stmt.columnInt(7) != 0;
    device.lastStatus = core::outcomeFromString(stmt.columnText(8));

    if (auto latency = stmt.columnOptionalInt64(9)) {
        device.lastLatency = std::chrono::microseconds(*latency);
    }
    if (auto checked = stmt.columnOptionalText(10)) {
        device.lastCheckedAt = stringToTimePoint(*checked);
    }
    if (auto since = stmt.columnOptionalText(11)) {
        device.offlineSince = stringToTimePoint(*since);
    }
    if (auto last = stmt.columnOptionalText(12)) {
        device.lastOfflineAt = stringToTimePoint(*last);
    }

    device.remoteAccess = stmt.columnInt(13) != 0;
    device.createdAt = stringToTimePoint(stmt.columnText(14)).value_or(
        std::chrono::system_clock::time_point{});
    return device;
}

} // namespace vikabh::infra
