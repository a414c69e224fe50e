/**
 * @file ProbeResult.hpp
 * @brief Result of a single reachability check.
 *
 * A ProbeResult is produced by the prober, consumed by the monitoring engine
 * in the same cycle and superseded by the next cycle's result.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace vikabh::core {

/**
 * @brief Outcome of a reachability check.
 */
enum class ProbeOutcome : int {
    Online = 0,  ///< Reply or connection received within the timeout
    Offline = 1, ///< No reply, connection refused or host unreachable
    Error = 2    ///< The check itself could not be performed
};

/**
 * @brief Reason a check did not report Online.
 */
enum class ProbeFailure : int {
    None = 0,             ///< Check succeeded
    Timeout = 1,          ///< No answer before the deadline
    Refused = 2,          ///< TCP connection actively refused
    Unreachable = 3,      ///< Network or host unreachable
    ResolutionFailed = 4, ///< Hostname could not be resolved
    PermissionDenied = 5, ///< Socket type not permitted (e.g. raw ICMP)
    Internal = 6          ///< Unexpected error while probing
};

/**
 * @brief Result of probing one device.
 */
struct ProbeResult {
    int64_t deviceId{0};                                  ///< Device that was probed
    std::chrono::system_clock::time_point timestamp;      ///< When the check finished
    ProbeOutcome outcome{ProbeOutcome::Error};            ///< Primary check outcome
    std::optional<std::chrono::microseconds> latency;     ///< Round trip / connect time, Online only
    bool auxiliaryServiceDetected{false};                 ///< Remote-access port answered
    ProbeFailure failure{ProbeFailure::None};             ///< Why the check was not Online
    std::string message;                                  ///< Diagnostic text for Offline/Error

    /**
     * @brief Converts the latency to milliseconds.
     * @return Latency in milliseconds, or nullopt when not Online.
     */
    [[nodiscard]] std::optional<double> latencyMs() const {
        if (!latency) {
            return std::nullopt;
        }
        return static_cast<double>(latency->count()) / 1000.0;
    }

    [[nodiscard]] bool isOnline() const { return outcome == ProbeOutcome::Online; }

    bool operator==(const ProbeResult& other) const = default;
};

/**
 * @brief Converts an outcome to its persisted string form.
 */
std::string outcomeToString(ProbeOutcome outcome);

/**
 * @brief Parses a persisted outcome string.
 * @return The outcome, or nullopt for unknown text.
 */
std::optional<ProbeOutcome> outcomeFromString(const std::string& str);

/**
 * @brief Converts a failure reason to a short label used in logs.
 */
std::string failureToString(ProbeFailure failure);

/**
 * @brief Maps a failure reason to the outcome it implies.
 *
 * Timeout, Refused and Unreachable describe a device that is down; the rest
 * describe a check that could not be carried out.
 */
ProbeOutcome outcomeForFailure(ProbeFailure failure);

} // namespace vikabh::core
