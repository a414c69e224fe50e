#include "infrastructure/database/SettingsRepository.hpp"

#include <spdlog/spdlog.h>

#include <cmath>

namespace vikabh::infra {

namespace keys = core::settings_keys;

SettingsRepository::SettingsRepository(std::shared_ptr<Database> db) : db_(std::move(db)) {}

std::optional<std::string> SettingsRepository::get(const std::string& key) {
    auto guard = db_->lock();
    auto stmt = db_->prepare("SELECT value FROM settings WHERE key = ?");
    stmt.bind(1, key);

    if (stmt.step()) {
        return stmt.columnText(0);
    }
    return std::nullopt;
}

void SettingsRepository::set(const std::string& key, const std::string& value) {
    auto guard = db_->lock();
    auto stmt = db_->prepare("INSERT OR REPLACE INTO settings (key, value) VALUES (?, ?)");
    stmt.bind(1, key);
    stmt.bind(2, value);
    stmt.step();
    spdlog::debug("Setting {} = {}", key, value);
}

void SettingsRepository::remove(const std::string& key) {
    auto guard = db_->lock();
    auto stmt = db_->prepare("DELETE FROM settings WHERE key = ?");
    stmt.bind(1, key);
    stmt.step();
}

std::map<std::string, std::string> SettingsRepository::findAll() {
    std::map<std::string, std::string> settings;
    auto guard = db_->lock();
    for (const auto& row : db_->query("SELECT key, value FROM settings ORDER BY key")) {
        settings[row["key"].get<std::string>()] = row["value"].get<std::string>();
    }
    return settings;
}

core::MonitorSettings SettingsRepository::loadMonitorSettings() {
    core::MonitorSettings settings;
    auto all = findAll();

    auto readDuration = [&all](const char* key, std::chrono::milliseconds& target) {
        auto it = all.find(key);
        if (it == all.end()) {
            return;
        }
        if (auto parsed = parseSeconds(it->second); parsed && parsed->count() > 0) {
            target = *parsed;
        } else {
            spdlog::warn("Ignoring malformed setting {}='{}', using {}ms", key, it->second,
                         target.count());
        }
    };

    readDuration(keys::kInterval, settings.pollInterval);
    readDuration(keys::kTimeout, settings.probeTimeout);

    if (auto it = all.find(keys::kExportOnClose); it != all.end()) {
        settings.exportOnClose = it->second == "1" || it->second == "true";
    }

    const std::string prefix(keys::kThemePrefix);
    for (const auto& [key, value] : all) {
        if (key.starts_with(prefix)) {
            settings.theme[key.substr(prefix.size())] = value;
        }
    }

    return settings;
}

void SettingsRepository::saveMonitorSettings(const core::MonitorSettings& settings) {
    db_->transaction([&]() {
        setDuration(keys::kInterval, settings.pollInterval);
        setDuration(keys::kTimeout, settings.probeTimeout);
        set(keys::kExportOnClose, settings.exportOnClose ? "1" : "0");
        for (const auto& [key, value] : settings.theme) {
            set(keys::kThemePrefix + key, value);
        }
    });
}

void SettingsRepository::setDuration(const std::string& key, std::chrono::milliseconds value) {
    set(key, formatSeconds(value));
}

std::optional<std::chrono::milliseconds> SettingsRepository::getDuration(const std::string& key) {
    auto value = get(key);
    if (!value) {
        return std::nullopt;
    }
    return parseSeconds(*value);
}

std::string SettingsRepository::formatSeconds(std::chrono::milliseconds value) {
    if (value.count() % 1000 == 0) {
        return std::to_string(value.count() / 1000);
    }
    const auto magnitude = value.count() < 0 ? -value.count() : value.count();
    std::string text = fmt::format("{}{}.{:03}", value.count() < 0 ? "-" : "", magnitude / 1000,
                                   magnitude % 1000);
    // Millisecond precision, without trailing zeros
    text.erase(text.find_last_not_of('0') + 1);
    return text;
}

std::optional<std::chrono::milliseconds> SettingsRepository::parseSeconds(const std::string& text) {
    try {
        size_t consumed = 0;
        double seconds = std::stod(text, &consumed);
        if (consumed != text.size() || !std::isfinite(seconds) || seconds < 0.0) {
            return std::nullopt;
        }
        return std::chrono::milliseconds(static_cast<int64_t>(std::llround(seconds * 1000.0)));
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

} // namespace vikabh::infra
