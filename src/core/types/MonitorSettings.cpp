#include "core/types/MonitorSettings.hpp"

#include "core/types/Errors.hpp"

#include <algorithm>

namespace vikabh::core {

void IntervalBounds::check(std::chrono::milliseconds interval) const {
    if (interval < min || interval > unattendedMax) {
        throw ConfigurationError("Poll interval " + std::to_string(interval.count()) +
                                 "ms is outside the allowed range [" +
                                 std::to_string(min.count()) + "ms, " +
                                 std::to_string(unattendedMax.count()) + "ms]");
    }
}

std::chrono::milliseconds IntervalBounds::clampInteractive(std::chrono::milliseconds interval) const {
    return std::clamp(interval, min, interactiveMax);
}

void IntervalBounds::validate() const {
    if (min.count() <= 0) {
        throw ConfigurationError("Minimum poll interval must be positive");
    }
    if (interactiveMax < min || unattendedMax < interactiveMax) {
        throw ConfigurationError("Poll interval bounds must satisfy min <= interactive <= unattended");
    }
}

void MonitorSettings::validate(const IntervalBounds& bounds) const {
    bounds.check(pollInterval);
    if (probeTimeout.count() <= 0) {
        throw ConfigurationError("Probe timeout must be positive");
    }
}

} // namespace vikabh::core
