#include "infrastructure/database/DeviceRegistry.hpp"

#include "core/types/Errors.hpp"

#include <spdlog/spdlog.h>

namespace vikabh::infra {

DeviceRegistry::DeviceRegistry(std::shared_ptr<Database> db)
    : db_(std::move(db)), devices_(db_), teams_(db_), settings_(db_) {}

std::vector<core::Device> DeviceRegistry::monitoredDevices() {
    try {
        return devices_.findMonitored();
    } catch (const std::exception& e) {
        throw core::RegistryReadError(std::string("Failed to read monitored devices: ") + e.what());
    }
}

void DeviceRegistry::recordResult(const core::ProbeResult& result) {
    bool found = false;
    try {
        found = devices_.recordResult(result);
    } catch (const std::exception& e) {
        throw core::RegistryWriteError("Failed to record status for device " +
                                       std::to_string(result.deviceId) + ": " + e.what());
    }
    if (!found) {
        spdlog::debug("Device {} was removed before its status could be recorded",
                      result.deviceId);
    }
}

core::MonitorSettings DeviceRegistry::loadSettings() {
    try {
        return settings_.loadMonitorSettings();
    } catch (const std::exception& e) {
        throw core::RegistryReadError(std::string("Failed to read settings: ") + e.what());
    }
}

} // namespace vikabh::infra
