/**
 * @file Errors.hpp
 * @brief Exception types raised by the monitoring core.
 *
 * Probe failures are never raised; they are carried inside ProbeResult.
 * The types below cover configuration problems, registry access failures
 * and the single unrecoverable engine failure.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace vikabh::core {

/**
 * @brief Invalid interval, timeout or malformed device record.
 *
 * Raised at the point of change; the previous valid value stays in effect.
 */
class ConfigurationError : public std::runtime_error {
public:
    explicit ConfigurationError(const std::string& message) : std::runtime_error(message) {}
};

/**
 * @brief Base class for Device Registry access failures.
 */
class RegistryError : public std::runtime_error {
public:
    explicit RegistryError(const std::string& message) : std::runtime_error(message) {}
};

/**
 * @brief Reading devices, teams or settings from the registry failed.
 */
class RegistryReadError : public RegistryError {
public:
    explicit RegistryReadError(const std::string& message) : RegistryError(message) {}
};

/**
 * @brief Writing to the registry failed.
 */
class RegistryWriteError : public RegistryError {
public:
    explicit RegistryWriteError(const std::string& message) : RegistryError(message) {}
};

/**
 * @brief The monitoring engine cannot obtain the resources it needs to run.
 */
class MonitorFatalError : public std::runtime_error {
public:
    explicit MonitorFatalError(const std::string& message) : std::runtime_error(message) {}
};

} // namespace vikabh::core
