#include "infrastructure/monitoring/MonitorEngine.hpp"

#include "core/types/Errors.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <future>
#include <memory>
#include <new>
#include <set>
#include <system_error>

namespace vikabh::infra {

namespace {

using Clock = std::chrono::steady_clock;

int64_t elapsedMs(Clock::time_point since) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - since).count();
}

} // namespace

MonitorEngine::MonitorEngine(core::IDeviceRegistry& registry, core::IProber& prober,
                             AsioContext& workers, StatusCache& cache, ChangeNotifier& notifier,
                             MonitorEngineOptions options)
    : registry_(registry), prober_(prober), workers_(workers), cache_(cache),
      notifier_(notifier), bounds_(options.bounds),
      pollIntervalMs_(options.pollInterval.count()),
      probeTimeoutMs_(options.probeTimeout.count()) {
    bounds_.validate();
    bounds_.check(options.pollInterval);
    if (options.probeTimeout.count() <= 0) {
        throw core::ConfigurationError("Probe timeout must be positive");
    }
}

MonitorEngine::~MonitorEngine() {
    stop();
}

void MonitorEngine::start() {
    std::lock_guard lifecycle(lifecycleMutex_);

    auto current = state_.load();
    if (current == core::EngineState::Running || current == core::EngineState::Stopping) {
        spdlog::warn("Monitor engine start ignored: engine is {}",
                     core::engineStateToString(current));
        return;
    }

    if (thread_.joinable()) {
        thread_.join();
    }

    applyStoredSettings();

    try {
        workers_.start();
    } catch (const std::system_error& e) {
        fail(std::string("cannot start probe workers: ") + e.what());
        throw core::MonitorFatalError(*lastFatalError());
    }

    {
        std::lock_guard lock(mutex_);
        stopRequested_ = false;
        probeNowPending_ = false;
        lastFatalError_.reset();
    }

    state_ = core::EngineState::Running;
    try {
        thread_ = std::thread(&MonitorEngine::run, this);
    } catch (const std::system_error& e) {
        fail(std::string("cannot create monitoring thread: ") + e.what());
        throw core::MonitorFatalError(*lastFatalError());
    }

    spdlog::info("Monitor engine started (interval {}ms, probe timeout {}ms)",
                 pollIntervalMs_.load(), probeTimeoutMs_.load());
}

void MonitorEngine::stop() {
    std::lock_guard lifecycle(lifecycleMutex_);

    requestStop();

    if (!thread_.joinable()) {
        return;
    }
    if (thread_.get_id() == std::this_thread::get_id()) {
        // Called from a notifier listener on the loop thread; the loop
        // exits on its own once the current cycle returns.
        return;
    }
    thread_.join();
    spdlog::info("Monitor engine stopped after {} cycles", cycleCount_.load());
}

void MonitorEngine::requestStop() {
    {
        std::lock_guard lock(mutex_);
        auto expected = core::EngineState::Running;
        if (!state_.compare_exchange_strong(expected, core::EngineState::Stopping)) {
            return;
        }
        stopRequested_ = true;
    }
    cv_.notify_all();
    spdlog::debug("Monitor engine stop requested");
}

bool MonitorEngine::probeNow() {
    bool queued = false;
    {
        std::lock_guard lock(mutex_);
        if (state_.load() != core::EngineState::Running) {
            spdlog::debug("Probe now ignored: engine is {}",
                          core::engineStateToString(state_.load()));
            return false;
        }
        queued = !probeNowPending_;
        probeNowPending_ = true;
    }
    cv_.notify_all();
    return queued;
}

void MonitorEngine::setPollInterval(std::chrono::milliseconds interval) {
    bounds_.check(interval);
    {
        std::lock_guard lock(mutex_);
        pollIntervalMs_ = interval.count();
    }
    cv_.notify_all();
    spdlog::info("Poll interval set to {}ms", interval.count());
}

std::chrono::milliseconds MonitorEngine::pollInterval() const {
    return std::chrono::milliseconds(pollIntervalMs_.load());
}

void MonitorEngine::setProbeTimeout(std::chrono::milliseconds timeout) {
    if (timeout.count() <= 0) {
        throw core::ConfigurationError("Probe timeout must be positive");
    }
    probeTimeoutMs_ = timeout.count();
    spdlog::info("Probe timeout set to {}ms", timeout.count());
}

std::chrono::milliseconds MonitorEngine::probeTimeout() const {
    return std::chrono::milliseconds(probeTimeoutMs_.load());
}

core::EngineState MonitorEngine::state() const {
    return state_.load();
}

uint64_t MonitorEngine::cycleCount() const {
    return cycleCount_.load();
}

std::optional<std::string> MonitorEngine::lastFatalError() const {
    std::lock_guard lock(mutex_);
    return lastFatalError_;
}

void MonitorEngine::applyStoredSettings() {
    core::MonitorSettings stored;
    try {
        stored = registry_.loadSettings();
    } catch (const core::RegistryError& e) {
        spdlog::warn("Using current monitor settings, stored settings unavailable: {}", e.what());
        return;
    }

    try {
        bounds_.check(stored.pollInterval);
        pollIntervalMs_ = stored.pollInterval.count();
    } catch (const core::ConfigurationError& e) {
        spdlog::warn("Ignoring stored interval: {}", e.what());
    }

    if (stored.probeTimeout.count() > 0) {
        probeTimeoutMs_ = stored.probeTimeout.count();
    } else {
        spdlog::warn("Ignoring stored probe timeout {}ms", stored.probeTimeout.count());
    }
}

void MonitorEngine::run() {
    std::optional<Clock::time_point> baseline;

    try {
        while (true) {
            bool extra = false;
            {
                std::unique_lock lock(mutex_);
                while (!stopRequested_) {
                    if (!baseline) {
                        break;
                    }
                    auto due = *baseline + std::chrono::milliseconds(pollIntervalMs_.load());
                    if (Clock::now() >= due) {
                        break;
                    }
                    if (probeNowPending_) {
                        extra = true;
                        break;
                    }
                    cv_.wait_until(lock, due);
                }
                if (stopRequested_) {
                    break;
                }
                // The cycle about to run satisfies any pending probe-now request
                probeNowPending_ = false;
            }

            auto cycleStart = Clock::now();
            if (!extra) {
                baseline = cycleStart;
            }

            // A poll interval change made while this cycle runs applies to the next one
            const auto interval = std::chrono::milliseconds(pollIntervalMs_.load());
            runCycle(extra, interval);

            if (!extra) {
                if (Clock::now() - cycleStart > interval) {
                    spdlog::warn("Cycle took {}ms, longer than the {}ms interval; next cycle "
                                 "starts immediately",
                                 elapsedMs(cycleStart), interval.count());
                }
            }
        }
    } catch (const std::bad_alloc&) {
        fail("out of memory while scheduling a monitoring cycle");
        return;
    } catch (const std::system_error& e) {
        fail(std::string("cannot schedule monitoring cycle: ") + e.what());
        return;
    }

    state_ = core::EngineState::Stopped;
}

void MonitorEngine::runCycle(bool extra, std::chrono::milliseconds interval) {
    const auto cycleStart = Clock::now();
    const uint64_t cycle = cycleCount_.load() + 1;
    const auto timeout = std::min(std::chrono::milliseconds(probeTimeoutMs_.load()), interval);

    std::vector<core::Device> devices;
    try {
        devices = registry_.monitoredDevices();
        lastDevices_ = devices;
    } catch (const core::RegistryError& e) {
        spdlog::info("Cycle {} started{}: device list unavailable", cycle,
                     extra ? " (probe now)" : "");
        spdlog::error("Cycle {}: cannot read devices, marking {} known devices as Error: {}",
                      cycle, lastDevices_.size(), e.what());
        markAllError(e.what());
        ++cycleCount_;
        notifier_.notify();
        spdlog::info("Cycle {} finished in {}ms: 0 online, 0 offline, {} error", cycle,
                     elapsedMs(cycleStart), lastDevices_.size());
        return;
    }

    spdlog::info("Cycle {} started{}: {} devices, timeout {}ms", cycle,
                 extra ? " (probe now)" : "", devices.size(), timeout.count());

    std::set<int64_t> ids;
    for (const auto& device : devices) {
        ids.insert(device.id);
    }
    if (size_t dropped = cache_.retain(ids); dropped > 0) {
        spdlog::debug("Cycle {}: dropped {} devices no longer monitored", cycle, dropped);
    }

    std::vector<std::future<core::ProbeResult>> pending;
    pending.reserve(devices.size());
    for (const auto& device : devices) {
        auto task = std::make_shared<std::packaged_task<core::ProbeResult()>>(
            [this, device, timeout]() { return probeDevice(device, timeout); });
        pending.push_back(task->get_future());
        workers_.post([task]() { (*task)(); });
    }

    size_t online = 0;
    size_t offline = 0;
    size_t errors = 0;
    size_t writeFailures = 0;

    for (size_t i = 0; i < devices.size(); ++i) {
        core::ProbeResult result;
        try {
            result = pending[i].get();
        } catch (const std::future_error& e) {
            result.deviceId = devices[i].id;
            result.timestamp = std::chrono::system_clock::now();
            result.outcome = core::ProbeOutcome::Error;
            result.failure = core::ProbeFailure::Internal;
            result.message = std::string("probe was abandoned: ") + e.what();
        }

        switch (result.outcome) {
        case core::ProbeOutcome::Online:
            ++online;
            break;
        case core::ProbeOutcome::Offline:
            ++offline;
            break;
        case core::ProbeOutcome::Error:
            ++errors;
            break;
        }

        core::StatusEntry entry{result, true};
        try {
            registry_.recordResult(result);
        } catch (const std::exception& e) {
            ++writeFailures;
            entry.persisted = false;
            spdlog::error("Cycle {}: status of device {} not saved, will retry next cycle: {}",
                          cycle, result.deviceId, e.what());
        }
        cache_.set(std::move(entry));
    }

    ++cycleCount_;
    notifier_.notify();

    spdlog::info("Cycle {} finished in {}ms: {} online, {} offline, {} error{}", cycle,
                 elapsedMs(cycleStart), online, offline, errors,
                 writeFailures > 0 ? fmt::format(", {} not saved", writeFailures) : "");
}

void MonitorEngine::markAllError(const std::string& reason) {
    std::set<int64_t> ids;
    const auto now = std::chrono::system_clock::now();
    for (const auto& device : lastDevices_) {
        ids.insert(device.id);

        core::ProbeResult result;
        result.deviceId = device.id;
        result.timestamp = now;
        result.outcome = core::ProbeOutcome::Error;
        result.failure = core::ProbeFailure::Internal;
        result.message = "device registry unavailable: " + reason;
        cache_.set(core::StatusEntry{std::move(result), false});
    }
    cache_.retain(ids);
}

core::ProbeResult MonitorEngine::probeDevice(const core::Device& device,
                                             std::chrono::milliseconds timeout) {
    core::ProbeResult result;
    try {
        result = prober_.probe(device, timeout);
    } catch (const std::exception& e) {
        spdlog::error("Probe of {} ({}) threw: {}", device.name, device.host, e.what());
        result = core::ProbeResult{};
        result.timestamp = std::chrono::system_clock::now();
        result.outcome = core::ProbeOutcome::Error;
        result.failure = core::ProbeFailure::Internal;
        result.message = e.what();
    }
    result.deviceId = device.id;
    if (result.outcome != core::ProbeOutcome::Online) {
        result.latency.reset();
    }
    return result;
}

void MonitorEngine::fail(const std::string& message) {
    spdlog::critical("Monitor engine stopped: {}", message);
    {
        std::lock_guard lock(mutex_);
        lastFatalError_ = message;
        stopRequested_ = true;
    }
    state_ = core::EngineState::Stopped;
    notifier_.notify();
}

} // namespace vikabh::infra
