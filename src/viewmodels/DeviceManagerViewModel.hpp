/**
 * @file DeviceManagerViewModel.hpp
 * @brief ViewModel for device and team management.
 */

#pragma once

#include "core/types/Device.hpp"
#include "core/types/Team.hpp"
#include "infrastructure/database/DeviceRegistry.hpp"

#include <QObject>
#include <memory>
#include <optional>
#include <vector>

namespace vikabh::viewmodels {

/**
 * @brief ViewModel for editing the device registry.
 *
 * Provides device and team CRUD for the management dialogs. Changes are
 * committed to the registry immediately; the monitoring engine sees them
 * at its next cycle.
 */
class DeviceManagerViewModel : public QObject {
    Q_OBJECT

public:
    /**
     * @brief Constructs a DeviceManagerViewModel.
     * @param registry Shared device registry.
     * @param parent Optional parent QObject for Qt ownership.
     */
    explicit DeviceManagerViewModel(std::shared_ptr<infra::DeviceRegistry> registry,
                                    QObject* parent = nullptr);

    /**
     * @brief Adds a device.
     * @param device Device configuration; id and status fields are ignored.
     * @return The new device id.
     * @throws ConfigurationError if the configuration is invalid.
     */
    int64_t addDevice(const core::Device& device);

    /**
     * @brief Updates a device's configuration fields.
     * @throws ConfigurationError if the configuration is invalid.
     */
    void updateDevice(const core::Device& device);

    void removeDevice(int64_t id);

    std::optional<core::Device> getDevice(int64_t id) const;

    std::vector<core::Device> getAllDevices() const;

    /**
     * @brief Devices of a team together with unassigned devices.
     * @param teamId Team to filter by, or nullopt for all devices.
     */
    std::vector<core::Device> getDevicesForTeam(std::optional<int64_t> teamId) const;

    void setDeviceEnabled(int64_t id, bool enabled);

    /**
     * @brief Pauses or resumes monitoring without disabling the devices.
     */
    void setMonitoring(const std::vector<int64_t>& ids, bool monitoring);

    void assignDeviceToTeam(int64_t deviceId, std::optional<int64_t> teamId);

    /**
     * @brief Adds a team.
     * @throws ConfigurationError if the name is blank or already used.
     */
    int64_t addTeam(const std::string& name);

    void renameTeam(int64_t id, const std::string& name);

    /**
     * @brief Deletes a team; its devices become unassigned.
     * @return Number of devices that were unassigned.
     */
    int removeTeam(int64_t id);

    std::vector<core::Team> getAllTeams() const;

signals:
    void deviceAdded(int64_t deviceId);
    void deviceUpdated(int64_t deviceId);
    void deviceRemoved(int64_t deviceId);
    void teamAdded(int64_t teamId);
    void teamUpdated(int64_t teamId);
    void teamRemoved(int64_t teamId);

private:
    std::shared_ptr<infra::DeviceRegistry> registry_;
};

} // namespace vikabh::viewmodels
