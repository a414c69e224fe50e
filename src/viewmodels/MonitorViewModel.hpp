/**
 * @file MonitorViewModel.hpp
 * @brief ViewModel for the live device status view.
 *
 * Bridges the background monitoring engine to the presentation layer in the
 * MVVM architecture: engine commands in, status snapshots and change
 * signals out.
 */

#pragma once

#include "core/services/IMonitorEngine.hpp"
#include "core/types/DeviceStatus.hpp"
#include "core/types/MonitorSettings.hpp"
#include "infrastructure/database/DeviceRegistry.hpp"
#include "infrastructure/monitoring/ChangeNotifier.hpp"
#include "infrastructure/monitoring/StatusCache.hpp"

#include <QObject>
#include <QString>
#include <chrono>
#include <memory>
#include <optional>
#include <vector>

namespace vikabh::viewmodels {

/**
 * @brief ViewModel for the monitoring status view.
 *
 * Status changes raised on the engine thread are forwarded to the thread
 * this object lives on with a queued invocation, so statusesChanged() is
 * always emitted on the UI thread and the engine never waits for the UI.
 */
class MonitorViewModel : public QObject {
    Q_OBJECT

public:
    /**
     * @brief Constructs a MonitorViewModel.
     * @param registry Registry used for settings and device lookups.
     * @param engine The monitoring engine to drive.
     * @param cache Status cache filled by the engine.
     * @param notifier Change signal raised by the engine.
     * @param bounds Valid poll interval range.
     * @param auxiliaryPort Port reported for devices with remote access.
     * @param parent Optional parent QObject for Qt ownership.
     */
    MonitorViewModel(std::shared_ptr<infra::DeviceRegistry> registry,
                     std::shared_ptr<core::IMonitorEngine> engine,
                     std::shared_ptr<infra::StatusCache> cache,
                     std::shared_ptr<infra::ChangeNotifier> notifier, core::IntervalBounds bounds,
                     uint16_t auxiliaryPort, QObject* parent = nullptr);

    /**
     * @brief Destroys the view model and detaches it from the notifier.
     */
    ~MonitorViewModel() override;

    /**
     * @brief Starts the monitoring engine.
     * @return False if the engine could not start; errorOccurred() is emitted.
     */
    bool startMonitoring();

    /**
     * @brief Stops the engine, waiting for the in-flight cycle.
     */
    void stopMonitoring();

    /**
     * @brief Requests an immediate extra cycle.
     * @return False if the engine is not running or a request is already pending.
     */
    bool probeNow();

    /**
     * @brief Changes and persists the poll interval.
     * @return False if the interval was rejected; the previous one stays in effect.
     */
    bool setPollInterval(std::chrono::milliseconds interval);

    std::chrono::milliseconds pollInterval() const;

    /**
     * @brief Poll interval clamped to the interactive (toolbar) range.
     */
    std::chrono::milliseconds interactivePollInterval() const;

    const core::IntervalBounds& intervalBounds() const { return bounds_; }

    /**
     * @brief Resumes monitoring of the given devices and switches to fast refresh.
     *
     * The current interval is remembered (persisted) and replaced by the
     * minimum interval, then an immediate cycle is requested.
     */
    void startFastRefresh(const std::vector<int64_t>& deviceIds);

    /**
     * @brief Pauses monitoring of the given devices and restores the remembered interval.
     */
    void stopFastRefresh(const std::vector<int64_t>& deviceIds);

    /**
     * @brief Whether an interval is remembered from a fast refresh.
     */
    bool isFastRefreshActive() const;

    std::vector<core::StatusEntry> statuses() const;

    std::optional<core::StatusEntry> status(int64_t deviceId) const;

    /**
     * @brief Counts for the status bar, including monitored devices not probed yet.
     */
    core::StatusSummary summary() const;

    /**
     * @brief Host and remote-access port for launching a viewer.
     * @return Nullopt if the device does not exist.
     */
    std::optional<core::RemoteAccessTarget> remoteTarget(int64_t deviceId) const;

    core::EngineState engineState() const;

signals:
    /**
     * @brief Emitted on the UI thread when a new status snapshot is available.
     */
    void statusesChanged();

    /**
     * @brief Emitted when the engine state changes.
     */
    void engineStateChanged(vikabh::core::EngineState state);

    void pollIntervalChanged(qint64 intervalMs);

    void errorOccurred(const QString& message);

private:
    void onStatusesChanged();
    void publishState();

    std::shared_ptr<infra::DeviceRegistry> registry_;
    std::shared_ptr<core::IMonitorEngine> engine_;
    std::shared_ptr<infra::StatusCache> cache_;
    std::shared_ptr<infra::ChangeNotifier> notifier_;
    core::IntervalBounds bounds_;
    uint16_t auxiliaryPort_;
    core::EngineState lastState_{core::EngineState::Idle};
};

} // namespace vikabh::viewmodels
