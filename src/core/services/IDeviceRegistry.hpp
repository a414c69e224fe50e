/**
 * @file IDeviceRegistry.hpp
 * @brief The part of the Device Registry the monitoring engine depends on.
 */

#pragma once

#include "core/types/Device.hpp"
#include "core/types/MonitorSettings.hpp"
#include "core/types/ProbeResult.hpp"

#include <vector>

namespace vikabh::core {

/**
 * @brief Registry access used by the monitoring engine.
 *
 * The engine only reads the monitored device set and settings, and writes
 * the status columns of a device. All other fields belong to the device
 * management layer.
 */
class IDeviceRegistry {
public:
    virtual ~IDeviceRegistry() = default;

    /**
     * @brief Devices that are enabled and not paused, as last committed.
     * @throws RegistryReadError if the store cannot be read.
     */
    virtual std::vector<Device> monitoredDevices() = 0;

    /**
     * @brief Writes a probe result to the device's status columns.
     *
     * Also maintains the offline tracking columns.
     *
     * @throws RegistryWriteError if the write fails.
     */
    virtual void recordResult(const ProbeResult& result) = 0;

    /**
     * @brief Reads the typed runtime settings.
     * @throws RegistryReadError if the store cannot be read.
     */
    virtual MonitorSettings loadSettings() = 0;
};

} // namespace vikabh::core
