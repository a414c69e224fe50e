#pragma once

#include <chrono>
#include <optional>
#include <string>

namespace vikabh::infra {

/**
 * @brief Formats a time point as UTC "YYYY-MM-DD HH:MM:SS" for storage.
 */
std::string timePointToString(const std::chrono::system_clock::time_point& tp);

/**
 * @brief Parses a stored UTC timestamp.
 * @return The time point, or nullopt if the text is empty or malformed.
 */
std::optional<std::chrono::system_clock::time_point> stringToTimePoint(const std::string& str);

} // namespace vikabh::infra
