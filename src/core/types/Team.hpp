/**
 * @file Team.hpp
 * @brief Team (department) used to organize devices.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace vikabh::core {

/**
 * @brief A named group of devices.
 *
 * Team names are unique. Deleting a team leaves its devices in place with
 * no team assigned.
 */
struct Team {
    int64_t id{0};      ///< Unique identifier for the team
    std::string name;   ///< Display name, unique among teams
    std::chrono::system_clock::time_point createdAt; ///< When the team was created

    /**
     * @brief Validates the team.
     * @return True if the name is not blank.
     */
    [[nodiscard]] bool isValid() const;

    bool operator==(const Team& other) const = default;
};

} // namespace vikabh::core
