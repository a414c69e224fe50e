#include "infrastructure/config/ConfigManager.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <fstream>

namespace vikabh::infra {

namespace {

template <typename T>
void clampSetting(const char* name, T& value, T low, T high) {
    T clamped = std::clamp(value, low, high);
    if (clamped != value) {
        spdlog::warn("Config value {}={} out of range, using {}", name, value, clamped);
        value = clamped;
    }
}

} // namespace

core::IntervalBounds AppConfig::intervalBounds() const {
    core::IntervalBounds bounds;
    bounds.min = std::chrono::seconds(minIntervalSeconds);
    bounds.interactiveMax = std::chrono::seconds(interactiveMaxIntervalSeconds);
    bounds.unattendedMax = std::chrono::seconds(unattendedMaxIntervalSeconds);
    return bounds;
}

ConfigManager::ConfigManager(const std::filesystem::path& configDir) : configDir_(configDir) {
    if (!std::filesystem::exists(configDir_)) {
        std::filesystem::create_directories(configDir_);
    }

    configPath_ = configDir_ / "config.json";
}

bool ConfigManager::load() {
    if (!std::filesystem::exists(configPath_)) {
        spdlog::info("Config file not found, using defaults");
        return save();
    }

    try {
        std::ifstream file(configPath_);
        if (!file) {
            spdlog::error("Failed to open config file: {}", configPath_.string());
            return false;
        }

        nlohmann::json j;
        file >> j;

        AppConfig previous = config_;
        try {
            fromJson(j);
        } catch (const nlohmann::json::exception&) {
            config_ = previous;
            throw;
        }
        clampValues();

        spdlog::info("Loaded configuration from {}", configPath_.string());
        return true;
    } catch (const std::exception& e) {
        spdlog::error("Failed to load config: {}", e.what());
        return false;
    }
}

bool ConfigManager::save() {
    try {
        auto j = toJson();

        std::ofstream file(configPath_);
        if (!file) {
            spdlog::error("Failed to open config file for writing: {}", configPath_.string());
            return false;
        }

        file << j.dump(2);
        spdlog::debug("Saved configuration to {}", configPath_.string());
        return true;
    } catch (const std::exception& e) {
        spdlog::error("Failed to save config: {}", e.what());
        return false;
    }
}

nlohmann::json ConfigManager::toJson() const {
    nlohmann::json j;

    // Logging
    j["logging"]["level"] = config_.logging.level;
    j["logging"]["console_level"] = config_.logging.consoleLevel;
    j["logging"]["file_max_size_mb"] = config_.logging.fileMaxSizeMb;
    j["logging"]["file_count"] = config_.logging.fileCount;

    // Monitoring defaults
    j["monitoring"]["default_poll_interval_seconds"] = config_.defaultPollIntervalSeconds;
    j["monitoring"]["probe_timeout_ms"] = config_.probeTimeoutMs;
    j["monitoring"]["worker_threads"] = config_.workerThreads;
    j["monitoring"]["auxiliary_port"] = config_.auxiliaryPort;
    j["monitoring"]["default_tcp_port"] = config_.defaultTcpPort;

    // Interval bounds
    j["interval_bounds"]["min_seconds"] = config_.minIntervalSeconds;
    j["interval_bounds"]["interactive_max_seconds"] = config_.interactiveMaxIntervalSeconds;
    j["interval_bounds"]["unattended_max_seconds"] = config_.unattendedMaxIntervalSeconds;

    // Database
    j["database"]["file_name"] = config_.databaseFileName;
    j["database"]["busy_timeout_ms"] = config_.busyTimeoutMs;

    return j;
}

void ConfigManager::fromJson(const nlohmann::json& j) {
    // Logging
    if (j.contains("logging")) {
        const auto& l = j["logging"];
        config_.logging.level = l.value("level", "debug");
        config_.logging.consoleLevel = l.value("console_level", "info");
        config_.logging.fileMaxSizeMb = l.value("file_max_size_mb", 5);
        config_.logging.fileCount = l.value("file_count", 3);
    }

    // Monitoring
    if (j.contains("monitoring")) {
        const auto& m = j["monitoring"];
        config_.defaultPollIntervalSeconds = m.value("default_poll_interval_seconds", 10);
        config_.probeTimeoutMs = m.value("probe_timeout_ms", 2000);
        config_.workerThreads = m.value("worker_threads", 4);
        config_.auxiliaryPort = m.value("auxiliary_port", static_cast<uint16_t>(5900));
        config_.defaultTcpPort = m.value("default_tcp_port", static_cast<uint16_t>(80));
    }

    // Interval bounds
    if (j.contains("interval_bounds")) {
        const auto& b = j["interval_bounds"];
        config_.minIntervalSeconds = b.value("min_seconds", 1);
        config_.interactiveMaxIntervalSeconds = b.value("interactive_max_seconds", 10);
        config_.unattendedMaxIntervalSeconds = b.value("unattended_max_seconds", 3600);
    }

    // Database
    if (j.contains("database")) {
        const auto& d = j["database"];
        config_.databaseFileName = d.value("file_name", "devices.db");
        config_.busyTimeoutMs = d.value("busy_timeout_ms", 5000);
    }
}

void ConfigManager::clampValues() {
    clampSetting("logging.file_max_size_mb", config_.logging.fileMaxSizeMb, 1, 1024);
    clampSetting("logging.file_count", config_.logging.fileCount, 1, 100);
    clampSetting("monitoring.probe_timeout_ms", config_.probeTimeoutMs, 100, 60000);
    clampSetting("monitoring.worker_threads", config_.workerThreads, 1, 256);
    clampSetting("monitoring.auxiliary_port", config_.auxiliaryPort, static_cast<uint16_t>(1),
                 static_cast<uint16_t>(65535));
    clampSetting("monitoring.default_tcp_port", config_.defaultTcpPort, static_cast<uint16_t>(1),
                 static_cast<uint16_t>(65535));

    clampSetting("interval_bounds.min_seconds", config_.minIntervalSeconds, 1, 3600);
    clampSetting("interval_bounds.interactive_max_seconds", config_.interactiveMaxIntervalSeconds,
                 config_.minIntervalSeconds, 86400);
    clampSetting("interval_bounds.unattended_max_seconds", config_.unattendedMaxIntervalSeconds,
                 config_.interactiveMaxIntervalSeconds, 86400);
    clampSetting("monitoring.default_poll_interval_seconds", config_.defaultPollIntervalSeconds,
                 config_.minIntervalSeconds, config_.unattendedMaxIntervalSeconds);

    clampSetting("database.busy_timeout_ms", config_.busyTimeoutMs, 0, 600000);
    if (config_.databaseFileName.empty()) {
        spdlog::warn("Config value database.file_name is empty, using devices.db");
        config_.databaseFileName = "devices.db";
    }
}

std::filesystem::path ConfigManager::databasePath() const {
    return configDir_ / config_.databaseFileName;
}

std::filesystem::path ConfigManager::logPath() const {
    return configDir_ / "vikabh.log";
}

} // namespace vikabh::infra
