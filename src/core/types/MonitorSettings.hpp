/**
 * @file MonitorSettings.hpp
 * @brief Typed runtime settings for the monitoring engine.
 *
 * Runtime settings are stored as key/value rows in the registry. This file
 * defines the typed view over them and the bounds a poll interval must
 * respect.
 */

#pragma once

#include <chrono>
#include <map>
#include <string>

namespace vikabh::core {

/**
 * @brief Valid range for the poll interval.
 *
 * The interactive range is what the toolbar offers; the unattended range is
 * the widest value accepted through settings.
 */
struct IntervalBounds {
    std::chrono::milliseconds min{std::chrono::seconds(1)};
    std::chrono::milliseconds interactiveMax{std::chrono::seconds(10)};
    std::chrono::milliseconds unattendedMax{std::chrono::seconds(3600)};

    /**
     * @brief Checks an interval against [min, unattendedMax].
     * @throws ConfigurationError if the interval is out of range.
     */
    void check(std::chrono::milliseconds interval) const;

    /**
     * @brief Whether the interval lies within [min, interactiveMax].
     */
    [[nodiscard]] bool isInteractive(std::chrono::milliseconds interval) const {
        return interval >= min && interval <= interactiveMax;
    }

    /**
     * @brief Clamps an interval into the interactive range for display.
     */
    [[nodiscard]] std::chrono::milliseconds clampInteractive(std::chrono::milliseconds interval) const;

    /**
     * @brief Checks that the bounds themselves are ordered and positive.
     * @throws ConfigurationError otherwise.
     */
    void validate() const;

    bool operator==(const IntervalBounds& other) const = default;
};

/**
 * @brief Runtime settings recognized by the monitoring core.
 */
struct MonitorSettings {
    std::chrono::milliseconds pollInterval{std::chrono::seconds(10)}; ///< Time between cycle starts
    std::chrono::milliseconds probeTimeout{std::chrono::seconds(2)};  ///< Per-probe deadline
    bool exportOnClose{false};                   ///< Opaque to the core, kept for the UI
    std::map<std::string, std::string> theme;    ///< Opaque personalization values

    /**
     * @brief Validates interval and timeout.
     * @throws ConfigurationError if the interval is out of bounds or the
     *         timeout is not positive.
     */
    void validate(const IntervalBounds& bounds) const;

    /**
     * @brief Probe timeout capped at the poll interval.
     */
    [[nodiscard]] std::chrono::milliseconds effectiveProbeTimeout() const {
        return probeTimeout < pollInterval ? probeTimeout : pollInterval;
    }

    bool operator==(const MonitorSettings& other) const = default;
};

/// Settings keys understood by the registry
namespace settings_keys {
inline constexpr const char* kInterval = "interval";
inline constexpr const char* kTimeout = "timeout";
inline constexpr const char* kExportOnClose = "export_on_close";
inline constexpr const char* kFastRefreshPrevious = "fast_refresh_previous_interval";
inline constexpr const char* kThemePrefix = "theme.";
} // namespace settings_keys

} // namespace vikabh::core
