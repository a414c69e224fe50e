#include "viewmodels/DeviceManagerViewModel.hpp"

#include <spdlog/spdlog.h>

namespace vikabh::viewmodels {

DeviceManagerViewModel::DeviceManagerViewModel(std::shared_ptr<infra::DeviceRegistry> registry,
                                               QObject* parent)
    : QObject(parent), registry_(std::move(registry)) {}

int64_t DeviceManagerViewModel::addDevice(const core::Device& device) {
    core::Device added = device;
    added.createdAt = std::chrono::system_clock::now();

    int64_t id = registry_->devices().insert(added);
    spdlog::info("Added device: {} ({} {})", added.name, added.methodToString(), added.host);

    emit deviceAdded(id);
    return id;
}

void DeviceManagerViewModel::updateDevice(const core::Device& device) {
    if (!registry_->devices().update(device)) {
        spdlog::warn("Device {} not found for update", device.id);
        return;
    }
    spdlog::info("Updated device: {}", device.name);
    emit deviceUpdated(device.id);
}

void DeviceManagerViewModel::removeDevice(int64_t id) {
    registry_->devices().remove(id);
    spdlog::info("Removed device: {}", id);
    emit deviceRemoved(id);
}

std::optional<core::Device> DeviceManagerViewModel::getDevice(int64_t id) const {
    return registry_->devices().findById(id);
}

std::vector<core::Device> DeviceManagerViewModel::getAllDevices() const {
    return registry_->devices().findAll();
}

std::vector<core::Device> DeviceManagerViewModel::getDevicesForTeam(
    std::optional<int64_t> teamId) const {
    if (!teamId) {
        return registry_->devices().findAll();
    }
    return registry_->devices().findByTeamOrUnassigned(*teamId);
}

void DeviceManagerViewModel::setDeviceEnabled(int64_t id, bool enabled) {
    registry_->devices().setEnabled(id, enabled);
    spdlog::info("Device {} {}", id, enabled ? "enabled" : "disabled");
    emit deviceUpdated(id);
}

void DeviceManagerViewModel::setMonitoring(const std::vector<int64_t>& ids, bool monitoring) {
    registry_->devices().setMonitoring(ids, monitoring);
    spdlog::info("Monitoring {} for {} devices", monitoring ? "resumed" : "paused", ids.size());
    for (auto id : ids) {
        emit deviceUpdated(id);
    }
}

void DeviceManagerViewModel::assignDeviceToTeam(int64_t deviceId, std::optional<int64_t> teamId) {
    registry_->devices().setTeam(deviceId, teamId);
    spdlog::info("Assigned device {} to team {}", deviceId, teamId.value_or(-1));
    emit deviceUpdated(deviceId);
}

int64_t DeviceManagerViewModel::addTeam(const std::string& name) {
    core::Team team;
    team.name = name;
    team.createdAt = std::chrono::system_clock::now();

    int64_t id = registry_->teams().insert(team);
    spdlog::info("Added team: {}", name);

    emit teamAdded(id);
    return id;
}

void DeviceManagerViewModel::renameTeam(int64_t id, const std::string& name) {
    auto team = registry_->teams().findById(id);
    if (!team) {
        spdlog::warn("Team {} not found for rename", id);
        return;
    }
    team->name = name;
    registry_->teams().update(*team);
    spdlog::info("Renamed team {} to {}", id, name);
    emit teamUpdated(id);
}

int DeviceManagerViewModel::removeTeam(int64_t id) {
    int unassigned = registry_->teams().remove(id);
    spdlog::info("Removed team {}, {} devices unassigned", id, unassigned);
    emit teamRemoved(id);
    return unassigned;
}

std::vector<core::Team> DeviceManagerViewModel::getAllTeams() const {
    return registry_->teams().findAll();
}

} // namespace vikabh::viewmodels
