#include "infrastructure/database/TeamRepository.hpp"

#include "core/types/Errors.hpp"
#include "infrastructure/database/TimeFormat.hpp"

#include <spdlog/spdlog.h>

namespace vikabh::infra {

TeamRepository::TeamRepository(std::shared_ptr<Database> db) : db_(std::move(db)) {}

void TeamRepository::checkNameAvailable(const core::Team& team) {
    if (!team.isValid()) {
        throw core::ConfigurationError("Team name must not be empty");
    }
    auto existing = findByName(team.name);
    if (existing && existing->id != team.id) {
        throw core::ConfigurationError("Team '" + team.name + "' already exists");
    }
}

int64_t TeamRepository::insert(const core::Team& team) {
    auto guard = db_->lock();
    checkNameAvailable(team);

    auto stmt = db_->prepare("INSERT INTO teams (name, created_at) VALUES (?, ?) RETURNING id");
    stmt.bind(1, team.name);
    stmt.bind(2, timePointToString(team.createdAt));

    int64_t id = 0;
    if (stmt.step()) {
        id = stmt.columnInt64(0);
    }
    spdlog::debug("Inserted team '{}' with id: {}", team.name, id);
    return id;
}

void TeamRepository::update(const core::Team& team) {
    auto guard = db_->lock();
    checkNameAvailable(team);

    auto stmt = db_->prepare("UPDATE teams SET name = ? WHERE id = ?");
    stmt.bind(1, team.name);
    stmt.bind(2, team.id);
    stmt.step();
    spdlog::debug("Updated team: {}", team.id);
}

int TeamRepository::remove(int64_t id) {
    int unassigned = 0;
    db_->transaction([&]() {
        auto unassign = db_->prepare("UPDATE devices SET team_id = NULL WHERE team_id = ?");
        unassign.bind(1, id);
        unassign.step();
        unassigned = db_->changes();

        auto stmt = db_->prepare("DELETE FROM teams WHERE id = ?");
        stmt.bind(1, id);
        stmt.step();
    });
    spdlog::debug("Removed team {} ({} devices unassigned)", id, unassigned);
    return unassigned;
}

std::optional<core::Team> TeamRepository::findById(int64_t id) {
    auto guard = db_->lock();
    auto stmt = db_->prepare("SELECT id, name, created_at FROM teams WHERE id = ?");
    stmt.bind(1, id);

    if (stmt.step()) {
        return rowToTeam(stmt);
    }
    return std::nullopt;
}

std::optional<core::Team> TeamRepository::findByName(const std::string& name) {
    auto guard = db_->lock();
    auto stmt = db_->prepare("SELECT id, name, created_at FROM teams WHERE name = ? COLLATE NOCASE");
    stmt.bind(1, name);

    if (stmt.step()) {
        return rowToTeam(stmt);
    }
    return std::nullopt;
}

std::vector<core::Team> TeamRepository::findAll() {
    auto guard = db_->lock();
    std::vector<core::Team> teams;
    auto stmt = db_->prepare("SELECT id, name, created_at FROM teams ORDER BY name COLLATE NOCASE");

    while (stmt.step()) {
        teams.push_back(rowToTeam(stmt));
    }
    return teams;
}

int TeamRepository::count() {
    auto guard = db_->lock();
    auto stmt = db_->prepare("SELECT COUNT(*) FROM teams");
    stmt.step();
    return stmt.columnInt(0);
}

core::Team TeamRepository::rowToTeam(Statement& stmt) {
    core::Team team;
    team.id = stmt.columnInt64(0);
    team.name = stmt.columnText(1);
    team.createdAt = stringToTimePoint(stmt.columnText(2)).value_or(
        std::chrono::system_clock::time_point{});
    return team;
}

} // namespace vikabh::infra
