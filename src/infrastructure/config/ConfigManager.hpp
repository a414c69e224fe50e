#pragma once

#include "core/types/MonitorSettings.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <nlohmann/json.hpp>
#include <string>

namespace vikabh::infra {

/**
 * @brief Logging configuration.
 */
struct LoggingConfig {
    std::string level{"debug"};        ///< Level of the rotating file sink.
    std::string consoleLevel{"info"};  ///< Level of the console sink.
    int fileMaxSizeMb{5};              ///< Size at which the log file rotates.
    int fileCount{3};                  ///< Rotated files kept.
};

/**
 * @brief Application configuration settings.
 *
 * Startup values for the monitoring engine, the interval bounds, logging
 * and the registry database. Runtime settings changed from the UI live in
 * the registry, not here.
 */
struct AppConfig {
    LoggingConfig logging;

    // Monitoring defaults
    int defaultPollIntervalSeconds{10}; ///< Interval used until the registry says otherwise.
    int probeTimeoutMs{2000};           ///< Per-probe deadline.
    int workerThreads{4};               ///< Probes running at the same time.
    uint16_t auxiliaryPort{5900};       ///< Remote-access port checked on every probe.
    uint16_t defaultTcpPort{80};        ///< Port for TCP devices stored without one.

    // Interval bounds
    int minIntervalSeconds{1};
    int interactiveMaxIntervalSeconds{10};
    int unattendedMaxIntervalSeconds{3600};

    // Database
    std::string databaseFileName{"devices.db"}; ///< Relative to the config directory.
    int busyTimeoutMs{5000};                     ///< SQLite busy timeout.

    /**
     * @brief Interval bounds as typed durations.
     */
    [[nodiscard]] core::IntervalBounds intervalBounds() const;
};

/**
 * @brief Manages application configuration persistence.
 *
 * Handles loading and saving of the application configuration from
 * config.json in the configuration directory.
 */
class ConfigManager {
public:
    /**
     * @brief Constructs a ConfigManager for the specified config directory.
     * @param configDir Path to the configuration directory (created if missing).
     */
    explicit ConfigManager(const std::filesystem::path& configDir);

    /**
     * @brief Loads configuration from disk.
     *
     * A missing file is created with defaults. Out-of-range values are
     * clamped and logged.
     *
     * @return True if loaded successfully, false if the file is unreadable
     *         or malformed (defaults stay in effect).
     */
    bool load();

    /**
     * @brief Saves configuration to disk.
     * @return True if saved successfully, false otherwise.
     */
    bool save();

    AppConfig& config() { return config_; }
    const AppConfig& config() const { return config_; }

    std::filesystem::path configPath() const { return configPath_; }

    /**
     * @brief Returns the path to the registry database file.
     */
    std::filesystem::path databasePath() const;

    /**
     * @brief Returns the path to the rotating log file.
     */
    std::filesystem::path logPath() const;

    std::string configDir() const { return configDir_.string(); }

private:
    nlohmann::json toJson() const;
    void fromJson(const nlohmann::json& j);
    void clampValues();

    std::filesystem::path configDir_;
    std::filesystem::path configPath_;
    AppConfig config_;
};

} // namespace vikabh::infra
