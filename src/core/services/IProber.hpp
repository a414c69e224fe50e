/**
 * @file IProber.hpp
 * @brief Interface for single-device reachability checks.
 */

#pragma once

#include "core/types/Device.hpp"
#include "core/types/ProbeResult.hpp"

#include <chrono>

namespace vikabh::core {

/**
 * @brief Performs one reachability check for one device.
 *
 * Implementations must be safe to call concurrently for independent devices
 * and must return within the timeout plus scheduling slack.
 */
class IProber {
public:
    virtual ~IProber() = default;

    /**
     * @brief Probes a device.
     * @param device Device to check (method, host and port are used).
     * @param timeout Deadline for the primary check and for the auxiliary check.
     * @return Result with outcome, latency when Online, and auxiliary flag.
     *         Failures are reported in the result, never thrown.
     */
    virtual ProbeResult probe(const Device& device, std::chrono::milliseconds timeout) = 0;
};

} // namespace vikabh::core
