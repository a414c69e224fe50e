#include "viewmodels/MonitorViewModel.hpp"

#include "core/types/Errors.hpp"

#include <QMetaObject>
#include <spdlog/spdlog.h>

namespace vikabh::viewmodels {

namespace keys = core::settings_keys;

MonitorViewModel::MonitorViewModel(std::shared_ptr<infra::DeviceRegistry> registry,
                                   std::shared_ptr<core::IMonitorEngine> engine,
                                   std::shared_ptr<infra::StatusCache> cache,
                                   std::shared_ptr<infra::ChangeNotifier> notifier,
                                   core::IntervalBounds bounds, uint16_t auxiliaryPort,
                                   QObject* parent)
    : QObject(parent), registry_(std::move(registry)), engine_(std::move(engine)),
      cache_(std::move(cache)), notifier_(std::move(notifier)), bounds_(bounds),
      auxiliaryPort_(auxiliaryPort), lastState_(engine_->state()) {
    notifier_->setListener([this]() {
        QMetaObject::invokeMethod(this, [this]() { onStatusesChanged(); }, Qt::QueuedConnection);
    });
}

MonitorViewModel::~MonitorViewModel() {
    notifier_->setListener({});
}

bool MonitorViewModel::startMonitoring() {
    try {
        engine_->start();
    } catch (const core::MonitorFatalError& e) {
        spdlog::critical("Cannot start monitoring: {}", e.what());
        emit errorOccurred(QString::fromStdString(e.what()));
        publishState();
        return false;
    }
    publishState();
    emit pollIntervalChanged(engine_->pollInterval().count());
    return true;
}

void MonitorViewModel::stopMonitoring() {
    engine_->stop();
    publishState();
}

bool MonitorViewModel::probeNow() {
    return engine_->probeNow();
}

bool MonitorViewModel::setPollInterval(std::chrono::milliseconds interval) {
    try {
        engine_->setPollInterval(interval);
    } catch (const core::ConfigurationError& e) {
        spdlog::warn("Rejected poll interval: {}", e.what());
        emit errorOccurred(QString::fromStdString(e.what()));
        return false;
    }

    try {
        registry_->settings().setDuration(keys::kInterval, interval);
    } catch (const std::exception& e) {
        spdlog::error("Poll interval applied but not saved: {}", e.what());
        emit errorOccurred(QString::fromStdString(e.what()));
    }

    emit pollIntervalChanged(interval.count());
    return true;
}

std::chrono::milliseconds MonitorViewModel::pollInterval() const {
    return engine_->pollInterval();
}

std::chrono::milliseconds MonitorViewModel::interactivePollInterval() const {
    return bounds_.clampInteractive(engine_->pollInterval());
}

void MonitorViewModel::startFastRefresh(const std::vector<int64_t>& deviceIds) {
    registry_->devices().setMonitoring(deviceIds, true);

    auto& settings = registry_->settings();
    if (!settings.get(keys::kFastRefreshPrevious)) {
        settings.setDuration(keys::kFastRefreshPrevious, engine_->pollInterval());
    }
    setPollInterval(bounds_.min);

    spdlog::info("Fast refresh started for {} devices", deviceIds.size());
    probeNow();
}

void MonitorViewModel::stopFastRefresh(const std::vector<int64_t>& deviceIds) {
    registry_->devices().setMonitoring(deviceIds, false);

    auto& settings = registry_->settings();
    if (auto previous = settings.getDuration(keys::kFastRefreshPrevious)) {
        if (setPollInterval(*previous)) {
            settings.remove(keys::kFastRefreshPrevious);
        }
    }

    spdlog::info("Monitoring paused for {} devices", deviceIds.size());
}

bool MonitorViewModel::isFastRefreshActive() const {
    return registry_->settings().get(keys::kFastRefreshPrevious).has_value();
}

std::vector<core::StatusEntry> MonitorViewModel::statuses() const {
    return cache_->snapshot();
}

std::optional<core::StatusEntry> MonitorViewModel::status(int64_t deviceId) const {
    return cache_->get(deviceId);
}

core::StatusSummary MonitorViewModel::summary() const {
    auto summary = cache_->summary();
    try {
        for (const auto& device : registry_->devices().findMonitored()) {
            if (!cache_->get(device.id)) {
                ++summary.unknown;
            }
        }
    } catch (const std::exception& e) {
        spdlog::warn("Cannot count unprobed devices: {}", e.what());
    }
    return summary;
}

std::optional<core::RemoteAccessTarget> MonitorViewModel::remoteTarget(int64_t deviceId) const {
    auto device = registry_->devices().findById(deviceId);
    if (!device) {
        return std::nullopt;
    }

    bool detected = device->remoteAccess;
    if (auto entry = cache_->get(deviceId)) {
        detected = entry->result.auxiliaryServiceDetected;
    }

    core::RemoteAccessTarget target;
    target.host = device->host;
    if (detected) {
        target.port = auxiliaryPort_;
    }
    return target;
}

core::EngineState MonitorViewModel::engineState() const {
    return engine_->state();
}

void MonitorViewModel::onStatusesChanged() {
    if (notifier_->consume()) {
        emit statusesChanged();
    }
    publishState();
}

void MonitorViewModel::publishState() {
    auto state = engine_->state();
    if (state != lastState_) {
        lastState_ = state;
        spdlog::debug("Monitor engine is {}", core::engineStateToString(state));
        emit engineStateChanged(state);
    }
}

} // namespace vikabh::viewmodels
