#pragma once

#include "core/types/Device.hpp"
#include "core/types/ProbeResult.hpp"
#include "infrastructure/database/Database.hpp"

#include <memory>
#include <optional>
#include <vector>

namespace vikabh::infra {

/**
 * @brief Repository for Device persistence operations.
 *
 * Configuration fields are owned by device management; the status columns
 * (last_status, last_latency_us, last_checked_at, offline tracking and
 * remote_access) are written only through recordResult().
 */
class DeviceRepository {
public:
    /**
     * @brief Constructs a DeviceRepository with the given database.
     * @param db Shared pointer to the Database instance.
     */
    explicit DeviceRepository(std::shared_ptr<Database> db);

    /**
     * @brief Inserts a new device.
     * @param device Device to insert; its id is ignored.
     * @return ID of the newly inserted device.
     * @throws core::ConfigurationError if the device is invalid.
     */
    int64_t insert(const core::Device& device);

    /**
     * @brief Updates the configuration fields of an existing device.
     *
     * Status columns are left untouched.
     *
     * @param device Device with updated values (id must be set).
     * @return True if a row was updated.
     * @throws core::ConfigurationError if the device is invalid.
     */
    bool update(const core::Device& device);

    /**
     * @brief Removes a device.
     * @param id ID of the device to remove.
     */
    void remove(int64_t id);

    /**
     * @brief Finds a device by its ID.
     * @param id ID of the device to find.
     * @return Device if found, nullopt otherwise.
     */
    std::optional<core::Device> findById(int64_t id);

    /**
     * @brief Retrieves all devices ordered by name.
     */
    std::vector<core::Device> findAll();

    /**
     * @brief Retrieves devices that are enabled and not paused.
     */
    std::vector<core::Device> findMonitored();

    /**
     * @brief Finds devices belonging to a team.
     * @param teamId ID of the team, or nullopt for unassigned devices.
     */
    std::vector<core::Device> findByTeam(std::optional<int64_t> teamId);

    /**
     * @brief Finds enabled devices of a team together with unassigned ones.
     *
     * This is the device list shown when a team filter is active.
     *
     * @param teamId ID of the team to filter on.
     */
    std::vector<core::Device> findByTeamOrUnassigned(int64_t teamId);

    /**
     * @brief Assigns a device to a team.
     * @param deviceId ID of the device.
     * @param teamId ID of the team, or nullopt to unassign.
     */
    void setTeam(int64_t deviceId, std::optional<int64_t> teamId);

    /**
     * @brief Enables or disables a device.
     */
    void setEnabled(int64_t deviceId, bool enabled);

    /**
     * @brief Pauses or resumes monitoring for several devices at once.
     * @param deviceIds Devices to change.
     * @param monitoring True to resume, false to pause.
     */
    void setMonitoring(const std::vector<int64_t>& deviceIds, bool monitoring);

    /**
     * @brief Writes a probe result to the device's status columns.
     *
     * offline_since is set when the device first goes non-online and cleared
     * when it is online again; last_offline_at keeps the start of the most
     * recent outage.
     *
     * @param result Result to store.
     * @return False if the device no longer exists.
     */
    bool recordResult(const core::ProbeResult& result);

    /**
     * @brief Returns the total count of devices.
     */
    int count();

private:
    std::vector<core::Device> collect(Statement& stmt);
    core::Device rowToDevice(Statement& stmt);
    std::shared_ptr<Database> db_;
};

} // namespace vikabh::infra
