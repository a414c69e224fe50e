#pragma once

#include "core/types/ProbeResult.hpp"

#include <chrono>
#include <string>

namespace vikabh::infra {

/**
 * @brief Outcome of one low-level network check (echo or connect).
 */
struct CheckResult {
    core::ProbeFailure failure{core::ProbeFailure::Internal}; ///< None on success
    std::chrono::microseconds elapsed{0}; ///< Round trip or connect time on success
    std::string message;                  ///< Diagnostic text on failure

    [[nodiscard]] bool ok() const { return failure == core::ProbeFailure::None; }

    static CheckResult success(std::chrono::microseconds elapsed) {
        CheckResult result;
        result.failure = core::ProbeFailure::None;
        result.elapsed = elapsed;
        return result;
    }

    static CheckResult failed(core::ProbeFailure failure, std::string message) {
        CheckResult result;
        result.failure = failure;
        result.message = std::move(message);
        return result;
    }
};

} // namespace vikabh::infra
