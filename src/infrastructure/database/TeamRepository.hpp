#pragma once

#include "core/types/Team.hpp"
#include "infrastructure/database/Database.hpp"

#include <memory>
#include <optional>
#include <vector>

namespace vikabh::infra {

/**
 * @brief Repository for Team persistence operations.
 *
 * Team names are unique (case-insensitive). Removing a team unassigns its
 * devices in the same transaction; no device row is ever deleted here.
 */
class TeamRepository {
public:
    /**
     * @brief Constructs a TeamRepository with the given database.
     * @param db Shared pointer to the Database instance.
     */
    explicit TeamRepository(std::shared_ptr<Database> db);

    /**
     * @brief Inserts a new team.
     * @param team Team to insert.
     * @return ID of the newly inserted team.
     * @throws core::ConfigurationError if the name is blank or already taken.
     */
    int64_t insert(const core::Team& team);

    /**
     * @brief Renames an existing team.
     * @param team Team with updated name (id must be set).
     * @throws core::ConfigurationError if the name is blank or taken by another team.
     */
    void update(const core::Team& team);

    /**
     * @brief Removes a team and unassigns its devices.
     * @param id ID of the team to remove.
     * @return Number of devices that were unassigned.
     */
    int remove(int64_t id);

    /**
     * @brief Finds a team by its ID.
     */
    std::optional<core::Team> findById(int64_t id);

    /**
     * @brief Finds a team by name (case-insensitive).
     */
    std::optional<core::Team> findByName(const std::string& name);

    /**
     * @brief Retrieves all teams ordered by name.
     */
    std::vector<core::Team> findAll();

    /**
     * @brief Returns the total count of teams.
     */
    int count();

private:
    void checkNameAvailable(const core::Team& team);
    core::Team rowToTeam(Statement& stmt);
    std::shared_ptr<Database> db_;
};

} // namespace vikabh::infra
