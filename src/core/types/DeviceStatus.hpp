/**
 * @file DeviceStatus.hpp
 * @brief Presentation-facing status types.
 *
 * These are the values the presentation layer reads: the cached status of
 * one device, aggregate counts for the status bar, and the host/port handed
 * to the remote viewer launcher.
 */

#pragma once

#include "core/types/ProbeResult.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace vikabh::core {

/**
 * @brief Last known status of a device as held in the status cache.
 */
struct StatusEntry {
    ProbeResult result;   ///< Most recent probe result
    bool persisted{true}; ///< False when writing the result to the registry failed

    [[nodiscard]] int64_t deviceId() const { return result.deviceId; }

    bool operator==(const StatusEntry& other) const = default;
};

/**
 * @brief Aggregate counts over the cached statuses.
 */
struct StatusSummary {
    int online{0};
    int offline{0};
    int error{0};
    int stale{0};   ///< Entries whose registry write failed
    int unknown{0}; ///< Monitored devices not probed yet, filled in by the view model
    std::optional<std::chrono::system_clock::time_point> lastUpdate;

    [[nodiscard]] int total() const { return online + offline + error; }
};

/**
 * @brief Where a remote viewer should connect for a device.
 *
 * The port is present only when the auxiliary remote-access service was
 * detected on the last probe.
 */
struct RemoteAccessTarget {
    std::string host;
    std::optional<uint16_t> port;

    bool operator==(const RemoteAccessTarget& other) const = default;
};

} // namespace vikabh::core
