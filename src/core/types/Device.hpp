/**
 * @file Device.hpp
 * @brief Monitored device definition and check method types.
 *
 * A Device is a network endpoint (host plus check method) stored in the
 * registry. Besides its configuration it carries the last known status
 * written back by the monitoring engine.
 */

#pragma once

#include "core/types/ProbeResult.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace vikabh::core {

/**
 * @brief How reachability of a device is checked.
 */
enum class CheckMethod : int {
    Ping = 0, ///< ICMP echo request
    Tcp = 1   ///< TCP connect to host:port
};

constexpr int kMinPort = 1;
constexpr int kMaxPort = 65535;

/**
 * @brief Represents a monitored network device.
 */
struct Device {
    int64_t id{0};                   ///< Stable identifier, assigned on insert, never reused
    std::string name;                ///< Display name
    std::string host;                ///< Hostname or IP address
    CheckMethod method{CheckMethod::Ping}; ///< Primary check method
    int port{0};                     ///< TCP port; ignored for Ping
    std::optional<int64_t> teamId;   ///< Owning team, nullopt when unassigned
    bool enabled{true};              ///< Disabled devices are kept but never probed
    bool monitoring{true};           ///< Paused devices are listed but not probed
    std::chrono::system_clock::time_point createdAt; ///< When the device was created

    // Last known status, written only by the monitoring engine
    std::optional<ProbeOutcome> lastStatus;          ///< Nullopt until first probe
    std::optional<std::chrono::microseconds> lastLatency;
    std::optional<std::chrono::system_clock::time_point> lastCheckedAt;
    std::optional<std::chrono::system_clock::time_point> offlineSince; ///< Start of current outage
    std::optional<std::chrono::system_clock::time_point> lastOfflineAt; ///< Start of latest outage
    bool remoteAccess{false};        ///< Auxiliary remote-access service seen on last probe

    /**
     * @brief Checks the configuration without throwing.
     * @return True if name and host are set and a TCP device has a valid port.
     */
    [[nodiscard]] bool isValid() const;

    /**
     * @brief Checks the configuration.
     * @throws ConfigurationError describing the first invalid field.
     */
    void validate() const;

    /**
     * @brief True when the device takes part in monitoring cycles.
     */
    [[nodiscard]] bool isMonitored() const { return enabled && monitoring; }

    /**
     * @brief Converts the check method to its persisted string ("Ping" or "TCP").
     */
    [[nodiscard]] std::string methodToString() const;

    /**
     * @brief Parses a persisted method string.
     *
     * Any text starting with "tcp" (case-insensitive) is TCP, everything else
     * falls back to Ping.
     */
    static CheckMethod methodFromString(const std::string& str);

    bool operator==(const Device& other) const = default;
};

} // namespace vikabh::core
