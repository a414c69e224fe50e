#pragma once

#include "core/types/MonitorSettings.hpp"
#include "infrastructure/database/Database.hpp"

#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <string>

namespace vikabh::infra {

/**
 * @brief Repository for the key/value settings table.
 *
 * Exposes raw key/value access plus the typed MonitorSettings view. Durations
 * are stored as seconds, fractional values allowed ("10", "0.5").
 */
class SettingsRepository {
public:
    /**
     * @brief Constructs a SettingsRepository with the given database.
     * @param db Shared pointer to the Database instance.
     */
    explicit SettingsRepository(std::shared_ptr<Database> db);

    /**
     * @brief Reads a raw setting.
     * @param key Setting key.
     * @return Stored value, or nullopt if absent.
     */
    std::optional<std::string> get(const std::string& key);

    /**
     * @brief Inserts or replaces a raw setting.
     */
    void set(const std::string& key, const std::string& value);

    /**
     * @brief Deletes a setting.
     */
    void remove(const std::string& key);

    /**
     * @brief Returns every stored setting.
     */
    std::map<std::string, std::string> findAll();

    /**
     * @brief Builds the typed settings from the stored rows.
     *
     * Missing or malformed values fall back to the MonitorSettings defaults
     * and are logged.
     */
    core::MonitorSettings loadMonitorSettings();

    /**
     * @brief Stores every recognized field of the typed settings.
     */
    void saveMonitorSettings(const core::MonitorSettings& settings);

    /**
     * @brief Stores a duration setting as seconds.
     */
    void setDuration(const std::string& key, std::chrono::milliseconds value);

    /**
     * @brief Reads a duration setting stored as seconds.
     * @return The duration, or nullopt if absent or not a number.
     */
    std::optional<std::chrono::milliseconds> getDuration(const std::string& key);

    /**
     * @brief Formats a duration as seconds for storage.
     */
    static std::string formatSeconds(std::chrono::milliseconds value);

    /**
     * @brief Parses a seconds value.
     * @return The duration, or nullopt if the text is not a non-negative number.
     */
    static std::optional<std::chrono::milliseconds> parseSeconds(const std::string& text);

private:
    std::shared_ptr<Database> db_;
};

} // namespace vikabh::infra
