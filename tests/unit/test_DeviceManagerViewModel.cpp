#include <catch2/catch_test_macros.hpp>

#include "core/types/Errors.hpp"
#include "infrastructure/database/Database.hpp"
#include "infrastructure/database/DeviceRegistry.hpp"
#include "viewmodels/DeviceManagerViewModel.hpp"

#include <QCoreApplication>
#include <filesystem>

using namespace vikabh::core;
using namespace vikabh::infra;
using namespace vikabh::viewmodels;

namespace {

class TestDatabase {
public:
    TestDatabase()
        : dbPath_(std::filesystem::temp_directory_path() / "vikabh_devicemanagervm_test.db") {
        cleanup();
        db_ = std::make_shared<Database>(dbPath_.string());
        db_->runMigrations();
    }

    ~TestDatabase() {
        db_.reset();
        cleanup();
    }

    std::shared_ptr<Database> get() { return db_; }

private:
    void cleanup() {
        std::filesystem::remove(dbPath_);
        std::filesystem::remove(dbPath_.string() + "-wal");
        std::filesystem::remove(dbPath_.string() + "-shm");
    }

    std::filesystem::path dbPath_;
    std::shared_ptr<Database> db_;
};

Device createDevice(const std::string& name, const std::string& host) {
    Device device;
    device.name = name;
    device.host = host;
    return device;
}

} // namespace

TEST_CASE("DeviceManagerViewModel device management", "[DeviceManagerViewModel]") {
    int argc = 0;
    char* argv[] = {nullptr};
    QCoreApplication app(argc, argv);

    TestDatabase testDb;
    auto registry = std::make_shared<DeviceRegistry>(testDb.get());
    DeviceManagerViewModel vm(registry);

    std::vector<int64_t> added;
    std::vector<int64_t> updated;
    std::vector<int64_t> removed;
    QObject::connect(&vm, &DeviceManagerViewModel::deviceAdded,
                     [&added](int64_t id) { added.push_back(id); });
    QObject::connect(&vm, &DeviceManagerViewModel::deviceUpdated,
                     [&updated](int64_t id) { updated.push_back(id); });
    QObject::connect(&vm, &DeviceManagerViewModel::deviceRemoved,
                     [&removed](int64_t id) { removed.push_back(id); });

    auto id = vm.addDevice(createDevice("Front Desk", "10.0.3.1"));

    SECTION("Add stamps the creation time and signals") {
        REQUIRE(added == std::vector<int64_t>{id});
        auto device = vm.getDevice(id);
        REQUIRE(device.has_value());
        REQUIRE(device->createdAt.time_since_epoch().count() > 0);
    }

    SECTION("Invalid device is rejected without a signal") {
        REQUIRE_THROWS_AS(vm.addDevice(createDevice("", "10.0.3.2")), ConfigurationError);
        REQUIRE(added.size() == 1);
    }

    SECTION("Update and enable state") {
        auto device = *vm.getDevice(id);
        device.name = "Front Desk PC";
        vm.updateDevice(device);
        vm.setDeviceEnabled(id, false);

        REQUIRE(updated == std::vector<int64_t>{id, id});
        REQUIRE(vm.getDevice(id)->name == "Front Desk PC");
        REQUIRE_FALSE(vm.getDevice(id)->enabled);
    }

    SECTION("Update of a missing device is ignored") {
        auto ghost = createDevice("Ghost", "10.0.3.9");
        ghost.id = 777;
        vm.updateDevice(ghost);
        REQUIRE(updated.empty());
    }

    SECTION("Pause and resume monitoring") {
        vm.setMonitoring({id}, false);
        REQUIRE(registry->monitoredDevices().empty());
        vm.setMonitoring({id}, true);
        REQUIRE(registry->monitoredDevices().size() == 1);
    }

    SECTION("Remove") {
        vm.removeDevice(id);
        REQUIRE(removed == std::vector<int64_t>{id});
        REQUIRE(vm.getAllDevices().empty());
    }
}

TEST_CASE("DeviceManagerViewModel team management", "[DeviceManagerViewModel]") {
    int argc = 0;
    char* argv[] = {nullptr};
    QCoreApplication app(argc, argv);

    TestDatabase testDb;
    auto registry = std::make_shared<DeviceRegistry>(testDb.get());
    DeviceManagerViewModel vm(registry);

    auto team = vm.addTeam("Clinic");
    auto member = vm.addDevice(createDevice("Ultrasound", "10.0.4.1"));
    auto loose = vm.addDevice(createDevice("Fax", "10.0.4.2"));
    auto other = vm.addDevice(createDevice("Badge Reader", "10.0.4.3"));
    auto otherTeam = vm.addTeam("Security");
    vm.assignDeviceToTeam(member, team);
    vm.assignDeviceToTeam(other, otherTeam);

    SECTION("Team view includes unassigned devices") {
        auto devices = vm.getDevicesForTeam(team);
        // Sorted by name
        REQUIRE(devices.size() == 2);
        REQUIRE(devices[0].id == loose);
        REQUIRE(devices[1].id == member);

        REQUIRE(vm.getDevicesForTeam(std::nullopt).size() == 3);
    }

    SECTION("Rename") {
        vm.renameTeam(team, "Clinic East");
        REQUIRE(registry->teams().findById(team)->name == "Clinic East");
        REQUIRE_THROWS_AS(vm.renameTeam(team, "security"), ConfigurationError);
    }

    SECTION("Remove unassigns members") {
        int teamRemovedCount = 0;
        QObject::connect(&vm, &DeviceManagerViewModel::teamRemoved,
                         [&teamRemovedCount](int64_t) { ++teamRemovedCount; });

        REQUIRE(vm.removeTeam(team) == 1);
        REQUIRE(teamRemovedCount == 1);
        REQUIRE(vm.getAllTeams().size() == 1);
        REQUIRE_FALSE(vm.getDevice(member)->teamId.has_value());
    }
}
