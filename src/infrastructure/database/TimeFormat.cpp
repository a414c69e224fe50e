#include "infrastructure/database/TimeFormat.hpp"

#include <ctime>

namespace vikabh::infra {

std::string timePointToString(const std::chrono::system_clock::time_point& tp) {
    auto time = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    gmtime_r(&time, &tm);
    char buffer[32];
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%d %H:%M:%S", &tm);
    return buffer;
}

std::optional<std::chrono::system_clock::time_point> stringToTimePoint(const std::string& str) {
    if (str.empty()) {
        return std::nullopt;
    }
    std::tm tm{};
    if (strptime(str.c_str(), "%Y-%m-%d %H:%M:%S", &tm) == nullptr) {
        return std::nullopt;
    }
    return std::chrono::system_clock::from_time_t(timegm(&tm));
}

} // namespace vikabh::infra
