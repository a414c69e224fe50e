#include <catch2/catch_test_macros.hpp>

#include "infrastructure/database/Database.hpp"
#include "infrastructure/database/DeviceRegistry.hpp"
#include "infrastructure/monitoring/ChangeNotifier.hpp"
#include "infrastructure/monitoring/MonitorEngine.hpp"
#include "infrastructure/monitoring/StatusCache.hpp"
#include "infrastructure/network/AsioContext.hpp"
#include "support/MonitoringFakes.hpp"
#include "viewmodels/MonitorViewModel.hpp"

#include <QCoreApplication>
#include <chrono>
#include <filesystem>

using namespace vikabh::core;
using namespace vikabh::infra;
using namespace vikabh::viewmodels;
using namespace vikabh::testing;
using namespace std::chrono_literals;

namespace {

class TestDatabase {
public:
    TestDatabase() : dbPath_(std::filesystem::temp_directory_path() / "vikabh_monitorvm_test.db") {
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

constexpr uint16_t kRemotePort = 5900;

IntervalBounds testBounds() {
    IntervalBounds bounds;
    bounds.min = 50ms;
    bounds.interactiveMax = 10s;
    bounds.unattendedMax = 3600s;
    return bounds;
}

/**
 * @brief Real registry and engine around a scripted prober.
 */
struct ViewModelFixture {
    ViewModelFixture()
        : registry(std::make_shared<DeviceRegistry>(testDb.get())), workers(2),
          cache(std::make_shared<StatusCache>()), notifier(std::make_shared<ChangeNotifier>()) {
        MonitorEngineOptions options;
        options.bounds = testBounds();
        engine = std::make_shared<MonitorEngine>(*registry, prober, workers, *cache, *notifier,
                                                 options);
        viewModel = std::make_unique<MonitorViewModel>(registry, engine, cache, notifier,
                                                       testBounds(), kRemotePort);
    }

    ~ViewModelFixture() {
        viewModel.reset();
        engine->stop();
        workers.stop();
    }

    int64_t addDevice(const std::string& name, const std::string& host) {
        Device device;
        device.name = name;
        device.host = host;
        device.createdAt = std::chrono::system_clock::now();
        return registry->devices().insert(device);
    }

    /// Runs the event loop until the predicate holds or the timeout expires
    template <typename Predicate>
    bool pumpUntil(Predicate pred, std::chrono::milliseconds timeout = 5s) {
        return waitUntil(
            [&]() {
                QCoreApplication::processEvents();
                return pred();
            },
            timeout);
    }

    TestDatabase testDb;
    std::shared_ptr<DeviceRegistry> registry;
    FakeProber prober;
    AsioContext workers;
    std::shared_ptr<StatusCache> cache;
    std::shared_ptr<ChangeNotifier> notifier;
    std::shared_ptr<MonitorEngine> engine;
    std::unique_ptr<MonitorViewModel> viewModel;
};

} // namespace

TEST_CASE("MonitorViewModel forwards status changes", "[MonitorViewModel]") {
    int argc = 0;
    char* argv[] = {nullptr};
    QCoreApplication app(argc, argv);

    ViewModelFixture f;
    auto printer = f.addDevice("Printer", "10.0.0.20");
    f.addDevice("Scanner", "10.0.0.21");

    int changes = 0;
    std::vector<EngineState> states;
    QObject::connect(f.viewModel.get(), &MonitorViewModel::statusesChanged,
                     [&changes]() { ++changes; });
    QObject::connect(f.viewModel.get(), &MonitorViewModel::engineStateChanged,
                     [&states](EngineState state) { states.push_back(state); });

    REQUIRE(f.viewModel->startMonitoring());
    REQUIRE(f.viewModel->engineState() == EngineState::Running);
    REQUIRE(states == std::vector<EngineState>{EngineState::Running});

    REQUIRE(f.pumpUntil([&]() { return changes >= 1; }));

    SECTION("Snapshot covers every monitored device") {
        auto statuses = f.viewModel->statuses();
        REQUIRE(statuses.size() == 2);
        REQUIRE(f.viewModel->status(printer)->result.outcome == ProbeOutcome::Online);

        auto summary = f.viewModel->summary();
        REQUIRE(summary.online == 2);
        REQUIRE(summary.unknown == 0);
    }

    SECTION("Probe now triggers another notification") {
        int before = changes;
        REQUIRE(f.viewModel->probeNow());
        REQUIRE(f.pumpUntil([&]() { return changes > before; }));
    }

    SECTION("Stopping reports the state change") {
        f.viewModel->stopMonitoring();
        REQUIRE(f.viewModel->engineState() == EngineState::Stopped);
        REQUIRE(states.back() == EngineState::Stopped);
        REQUIRE_FALSE(f.viewModel->probeNow());
    }
}

TEST_CASE("MonitorViewModel poll interval", "[MonitorViewModel]") {
    int argc = 0;
    char* argv[] = {nullptr};
    QCoreApplication app(argc, argv);

    ViewModelFixture f;

    std::vector<qint64> announced;
    QString lastError;
    QObject::connect(f.viewModel.get(), &MonitorViewModel::pollIntervalChanged,
                     [&announced](qint64 ms) { announced.push_back(ms); });
    QObject::connect(f.viewModel.get(), &MonitorViewModel::errorOccurred,
                     [&lastError](const QString& message) { lastError = message; });

    SECTION("Accepted interval is applied and persisted") {
        REQUIRE(f.viewModel->setPollInterval(30s));
        REQUIRE(f.viewModel->pollInterval() == 30s);
        REQUIRE(f.registry->settings().getDuration(settings_keys::kInterval) == 30000ms);
        REQUIRE(announced == std::vector<qint64>{30000});
    }

    SECTION("Rejected interval keeps the previous one") {
        auto previous = f.viewModel->pollInterval();
        REQUIRE_FALSE(f.viewModel->setPollInterval(1ms));
        REQUIRE(f.viewModel->pollInterval() == previous);
        REQUIRE(f.registry->settings().get(settings_keys::kInterval) == "10");
        REQUIRE_FALSE(lastError.isEmpty());
        REQUIRE(announced.empty());
    }

    SECTION("Unattended intervals are clamped for the toolbar") {
        REQUIRE(f.viewModel->setPollInterval(600s));
        REQUIRE(f.viewModel->interactivePollInterval() == 10s);
    }

    SECTION("Stored interval is used on start") {
        f.registry->settings().setDuration(settings_keys::kInterval, 45s);
        REQUIRE(f.viewModel->startMonitoring());
        REQUIRE(f.viewModel->pollInterval() == 45s);
        REQUIRE(announced.back() == 45000);
    }
}

TEST_CASE("MonitorViewModel fast refresh", "[MonitorViewModel]") {
    int argc = 0;
    char* argv[] = {nullptr};
    QCoreApplication app(argc, argv);

    ViewModelFixture f;
    auto a = f.addDevice("Till 1", "10.0.1.1");
    auto b = f.addDevice("Till 2", "10.0.1.2");
    f.registry->devices().setMonitoring({a, b}, false);

    REQUIRE(f.viewModel->setPollInterval(20s));
    REQUIRE_FALSE(f.viewModel->isFastRefreshActive());

    f.viewModel->startFastRefresh({a, b});

    REQUIRE(f.viewModel->isFastRefreshActive());
    REQUIRE(f.viewModel->pollInterval() == testBounds().min);
    REQUIRE(f.registry->devices().findMonitored().size() == 2);

    SECTION("Starting again keeps the original interval") {
        f.viewModel->startFastRefresh({a});
        f.viewModel->stopFastRefresh({a, b});
        REQUIRE(f.viewModel->pollInterval() == 20s);
    }

    SECTION("Stopping restores the interval and pauses the devices") {
        f.viewModel->stopFastRefresh({a, b});

        REQUIRE_FALSE(f.viewModel->isFastRefreshActive());
        REQUIRE(f.viewModel->pollInterval() == 20s);
        REQUIRE(f.registry->settings().getDuration(settings_keys::kInterval) == 20000ms);
        REQUIRE(f.registry->devices().findMonitored().empty());
    }
}

TEST_CASE("MonitorViewModel remote access and summary", "[MonitorViewModel]") {
    int argc = 0;
    char* argv[] = {nullptr};
    QCoreApplication app(argc, argv);

    ViewModelFixture f;
    auto desk = f.addDevice("Desk", "10.0.2.1");
    auto kiosk = f.addDevice("Kiosk", "10.0.2.2");

    SECTION("Unknown device has no target") {
        REQUIRE_FALSE(f.viewModel->remoteTarget(9999).has_value());
    }

    SECTION("Port is reported only when the service was seen") {
        ProbeResult result;
        result.deviceId = desk;
        result.timestamp = std::chrono::system_clock::now();
        result.outcome = ProbeOutcome::Online;
        result.auxiliaryServiceDetected = true;
        f.cache->set(StatusEntry{result, true});

        auto target = f.viewModel->remoteTarget(desk);
        REQUIRE(target.has_value());
        REQUIRE(target->host == "10.0.2.1");
        REQUIRE(target->port == kRemotePort);

        auto plain = f.viewModel->remoteTarget(kiosk);
        REQUIRE(plain->host == "10.0.2.2");
        REQUIRE_FALSE(plain->port.has_value());
    }

    SECTION("Registry flag is used before the first probe") {
        ProbeResult stored;
        stored.deviceId = kiosk;
        stored.timestamp = std::chrono::system_clock::now();
        stored.outcome = ProbeOutcome::Online;
        stored.auxiliaryServiceDetected = true;
        f.registry->devices().recordResult(stored);

        REQUIRE(f.viewModel->remoteTarget(kiosk)->port == kRemotePort);
    }

    SECTION("Devices not probed yet count as unknown") {
        ProbeResult result;
        result.deviceId = desk;
        result.timestamp = std::chrono::system_clock::now();
        result.outcome = ProbeOutcome::Offline;
        f.cache->set(StatusEntry{result, true});

        auto summary = f.viewModel->summary();
        REQUIRE(summary.offline == 1);
        REQUIRE(summary.unknown == 1);
    }
}
