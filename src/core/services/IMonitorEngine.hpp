/**
 * @file IMonitorEngine.hpp
 * @brief Interface for the background monitoring loop.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace vikabh::core {

/**
 * @brief Lifecycle state of the monitoring loop.
 */
enum class EngineState : int {
    Idle = 0,     ///< Created, never started
    Running = 1,  ///< Cycling at the configured interval
    Stopping = 2, ///< Stop requested, in-flight cycle draining
    Stopped = 3   ///< Loop thread finished
};

/**
 * @brief Converts an engine state to a human-readable string.
 */
inline std::string engineStateToString(EngineState state) {
    switch (state) {
    case EngineState::Idle:
        return "Idle";
    case EngineState::Running:
        return "Running";
    case EngineState::Stopping:
        return "Stopping";
    case EngineState::Stopped:
        return "Stopped";
    }
    return "Idle";
}

/**
 * @brief Repeatedly probes the monitored devices and publishes the results.
 */
class IMonitorEngine {
public:
    virtual ~IMonitorEngine() = default;

    /**
     * @brief Starts the loop. Valid from Idle or Stopped; ignored otherwise.
     * @throws MonitorFatalError if the loop thread cannot be created.
     */
    virtual void start() = 0;

    /**
     * @brief Stops the loop and waits until the in-flight cycle is written back.
     */
    virtual void stop() = 0;

    /**
     * @brief Asks the loop to stop without waiting for it.
     */
    virtual void requestStop() = 0;

    /**
     * @brief Requests an immediate extra cycle.
     *
     * Requests arriving before the extra cycle starts are coalesced into it.
     * The scheduled cycle baseline is not moved.
     *
     * @return True if a new request was queued, false if one was already pending.
     */
    virtual bool probeNow() = 0;

    /**
     * @brief Changes the poll interval, effective from the next cycle.
     * @throws ConfigurationError if the interval is out of bounds; the
     *         previous interval stays in effect.
     */
    virtual void setPollInterval(std::chrono::milliseconds interval) = 0;

    virtual std::chrono::milliseconds pollInterval() const = 0;

    virtual EngineState state() const = 0;

    /**
     * @brief Number of completed cycles since construction.
     */
    virtual uint64_t cycleCount() const = 0;

    /**
     * @brief Message of the unrecoverable failure that stopped the loop, if any.
     */
    virtual std::optional<std::string> lastFatalError() const = 0;
};

} // namespace vikabh::core
