#pragma once

#include "core/services/IDeviceRegistry.hpp"
#include "core/services/IMonitorEngine.hpp"
#include "core/services/IProber.hpp"
#include "core/types/MonitorSettings.hpp"
#include "infrastructure/monitoring/ChangeNotifier.hpp"
#include "infrastructure/monitoring/StatusCache.hpp"
#include "infrastructure/network/AsioContext.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace vikabh::infra {

/**
 * @brief Initial values for the monitoring engine.
 */
struct MonitorEngineOptions {
    std::chrono::milliseconds pollInterval{std::chrono::seconds(10)};
    std::chrono::milliseconds probeTimeout{std::chrono::seconds(2)};
    core::IntervalBounds bounds;
};

/**
 * @brief Background monitoring loop.
 *
 * The loop runs on its own thread. Each cycle reads the monitored devices,
 * probes them on the AsioContext worker pool, writes every result to the
 * registry and then to the status cache, and raises the change notifier
 * once. Between cycles the thread sleeps until the next scheduled start,
 * waking early for stop, probe-now and interval changes.
 *
 * Scheduling: a regular cycle is due one interval after the start of the
 * previous regular cycle. A cycle that overruns its interval is followed
 * immediately by the next one, and the baseline restarts from there.
 * Probe-now cycles run in between without moving the baseline.
 */
class MonitorEngine : public core::IMonitorEngine {
public:
    /**
     * @brief Constructs an idle engine.
     * @param registry Device and settings source, and result sink.
     * @param prober Performs the per-device checks.
     * @param workers Pool the probes run on; started by start() if needed.
     * @param cache Receives every result after the registry write.
     * @param notifier Raised once per completed cycle.
     * @param options Initial interval, timeout and interval bounds.
     * @throws ConfigurationError if the options are invalid.
     */
    MonitorEngine(core::IDeviceRegistry& registry, core::IProber& prober, AsioContext& workers,
                  StatusCache& cache, ChangeNotifier& notifier, MonitorEngineOptions options = {});

    /**
     * @brief Destructor. Stops the loop and waits for it.
     */
    ~MonitorEngine() override;

    MonitorEngine(const MonitorEngine&) = delete;
    MonitorEngine& operator=(const MonitorEngine&) = delete;

    /**
     * @brief Starts the loop thread.
     *
     * Valid settings stored in the registry (interval, timeout) replace the
     * current values; unreadable or invalid ones are logged and ignored.
     * The first cycle runs immediately.
     */
    void start() override;
    void stop() override;
    void requestStop() override;
    bool probeNow() override;
    void setPollInterval(std::chrono::milliseconds interval) override;
    std::chrono::milliseconds pollInterval() const override;
    core::EngineState state() const override;
    uint64_t cycleCount() const override;
    std::optional<std::string> lastFatalError() const override;

    /**
     * @brief Changes the per-probe timeout, effective from the next cycle.
     * @throws ConfigurationError if the timeout is not positive.
     */
    void setProbeTimeout(std::chrono::milliseconds timeout);

    [[nodiscard]] std::chrono::milliseconds probeTimeout() const;

    [[nodiscard]] const core::IntervalBounds& bounds() const { return bounds_; }

private:
    void applyStoredSettings();
    void run();
    void runCycle(bool extra, std::chrono::milliseconds interval);
    void markAllError(const std::string& reason);
    core::ProbeResult probeDevice(const core::Device& device, std::chrono::milliseconds timeout);
    void fail(const std::string& message);

    core::IDeviceRegistry& registry_;
    core::IProber& prober_;
    AsioContext& workers_;
    StatusCache& cache_;
    ChangeNotifier& notifier_;
    const core::IntervalBounds bounds_;

    std::atomic<int64_t> pollIntervalMs_;
    std::atomic<int64_t> probeTimeoutMs_;
    std::atomic<core::EngineState> state_{core::EngineState::Idle};
    std::atomic<uint64_t> cycleCount_{0};

    // Guards the wake-up flags below and the sleep in run()
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool stopRequested_{false};
    bool probeNowPending_{false};
    std::optional<std::string> lastFatalError_;

    // Serializes start() and stop()
    std::mutex lifecycleMutex_;
    std::thread thread_;

    // Devices of the last successful registry read, touched only by the loop thread
    std::vector<core::Device> lastDevices_;
};

} // namespace vikabh::infra
