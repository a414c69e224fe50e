#pragma once

#include "core/services/IDeviceRegistry.hpp"
#include "infrastructure/database/Database.hpp"
#include "infrastructure/database/DeviceRepository.hpp"
#include "infrastructure/database/SettingsRepository.hpp"
#include "infrastructure/database/TeamRepository.hpp"

#include <memory>

namespace vikabh::infra {

/**
 * @brief Durable store of devices, teams and settings.
 *
 * One Database handle is shared by the three repositories. The monitoring
 * engine sees the registry through core::IDeviceRegistry, whose methods
 * translate storage failures into RegistryReadError / RegistryWriteError.
 * Device management uses the repositories directly.
 */
class DeviceRegistry : public core::IDeviceRegistry {
public:
    /**
     * @brief Constructs the registry over an opened, migrated database.
     * @param db Shared pointer to the Database instance.
     */
    explicit DeviceRegistry(std::shared_ptr<Database> db);

    std::vector<core::Device> monitoredDevices() override;
    void recordResult(const core::ProbeResult& result) override;
    core::MonitorSettings loadSettings() override;

    DeviceRepository& devices() { return devices_; }
    TeamRepository& teams() { return teams_; }
    SettingsRepository& settings() { return settings_; }

    std::shared_ptr<Database> database() const { return db_; }

private:
    std::shared_ptr<Database> db_;
    DeviceRepository devices_;
    TeamRepository teams_;
    SettingsRepository settings_;
};

} // namespace vikabh::infra
