#pragma once

#include "core/types/DeviceStatus.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <shared_mutex>
#include <vector>

namespace vikabh::infra {

/**
 * @brief In-memory last known status per device.
 *
 * Written only by the monitoring engine, read by the presentation layer.
 * Readers share the lock and copy values out, so neither side holds the
 * lock longer than one map operation.
 */
class StatusCache {
public:
    /**
     * @brief Last known status of a device.
     * @return The entry, or nullopt when the device has not been probed
     *         (or is no longer monitored).
     */
    [[nodiscard]] std::optional<core::StatusEntry> get(int64_t deviceId) const;

    /**
     * @brief Replaces the entry of the device named in the entry's result.
     */
    void set(core::StatusEntry entry);

    /**
     * @brief Copy of all entries, ordered by device id.
     */
    [[nodiscard]] std::vector<core::StatusEntry> snapshot() const;

    /**
     * @brief Drops entries of devices not in the given set.
     * @return Number of entries removed.
     */
    size_t retain(const std::set<int64_t>& deviceIds);

    /**
     * @brief Counts entries by outcome and staleness.
     */
    [[nodiscard]] core::StatusSummary summary() const;

    [[nodiscard]] size_t size() const;

    void clear();

private:
    mutable std::shared_mutex mutex_;
    std::map<int64_t, core::StatusEntry> entries_;
};

} // namespace vikabh::infra
