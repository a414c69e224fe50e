#include "infrastructure/database/Database.hpp"

#include <spdlog/spdlog.h>
#include <stdexcept>

namespace vikabh::infra {

// Statement implementation
Statement::Statement(sqlite3_stmt* stmt) : stmt_(stmt) {}

Statement::~Statement() {
    if (stmt_) {
        sqlite3_finalize(stmt_);
    }
}

Statement::Statement(Statement&& other) noexcept : stmt_(other.stmt_) {
    other.stmt_ = nullptr;
}

Statement& Statement::operator=(Statement&& other) noexcept {
    if (this != &other) {
        if (stmt_) {
            sqlite3_finalize(stmt_);
        }
        stmt_ = other.stmt_;
        other.stmt_ = nullptr;
    }
    return *this;
}

void Statement::bind(int index, int value) {
    if (sqlite3_bind_int(stmt_, index, value) != SQLITE_OK) {
        throw std::runtime_error("Failed to bind int parameter " + std::to_string(index));
    }
}

void Statement::bind(int index, int64_t value) {
    if (sqlite3_bind_int64(stmt_, index, value) != SQLITE_OK) {
        throw std::runtime_error("Failed to bind int64 parameter " + std::to_string(index));
    }
}

void Statement::bind(int index, double value) {
    if (sqlite3_bind_double(stmt_, index, value) != SQLITE_OK) {
        throw std::runtime_error("Failed to bind double parameter " + std::to_string(index));
    }
}

void Statement::bind(int index, const std::string& value) {
    if (sqlite3_bind_text(stmt_, index, value.c_str(), static_cast<int>(value.size()),
                          SQLITE_TRANSIENT) != SQLITE_OK) {
        throw std::runtime_error("Failed to bind text parameter " + std::to_string(index));
    }
}

void Statement::bindNull(int index) {
    if (sqlite3_bind_null(stmt_, index) != SQLITE_OK) {
        throw std::runtime_error("Failed to bind null parameter " + std::to_string(index));
    }
}

void Statement::bindOptional(int index, const std::optional<int64_t>& value) {
    if (value) {
        bind(index, *value);
    } else {
        bindNull(index);
    }
}

void Statement::bindOptional(int index, const std::optional<std::string>& value) {
    if (value) {
        bind(index, *value);
    } else {
        bindNull(index);
    }
}

bool Statement::step() {
    int rc = sqlite3_step(stmt_);
    if (rc == SQLITE_ROW) {
        return true;
    }
    if (rc == SQLITE_DONE) {
        return false;
    }
    throw std::runtime_error(std::string("SQLite step failed: ") +
                             sqlite3_errmsg(sqlite3_db_handle(stmt_)));
}

void Statement::reset() {
    sqlite3_reset(stmt_);
    sqlite3_clear_bindings(stmt_);
}

int Statement::columnInt(int index) const {
    return sqlite3_column_int(stmt_, index);
}

int64_t Statement::columnInt64(int index) const {
    return sqlite3_column_int64(stmt_, index);
}

double Statement::columnDouble(int index) const {
    return sqlite3_column_double(stmt_, index);
}

std::string Statement::columnText(int index) const {
    const auto* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt_, index));
    return text ? text : "";
}

std::optional<int64_t> Statement::columnOptionalInt64(int index) const {
    if (columnIsNull(index)) {
        return std::nullopt;
    }
    return columnInt64(index);
}

std::optional<std::string> Statement::columnOptionalText(int index) const {
    if (columnIsNull(index)) {
        return std::nullopt;
    }
    auto text = columnText(index);
    if (text.empty()) {
        return std::nullopt;
    }
    return text;
}

bool Statement::columnIsNull(int index) const {
    return sqlite3_column_type(stmt_, index) == SQLITE_NULL;
}

int Statement::columnCount() const {
    return sqlite3_column_count(stmt_);
}

std::string Statement::columnName(int index) const {
    const char* name = sqlite3_column_name(stmt_, index);
    return name ? name : "";
}

int Statement::columnType(int index) const {
    return sqlite3_column_type(stmt_, index);
}

// Database implementation
Database::Database(const std::string& path, std::chrono::milliseconds busyTimeout) {
    spdlog::info("Opening device registry: {}", path);

    int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
    if (sqlite3_open_v2(path.c_str(), &db_, flags, nullptr) != SQLITE_OK) {
        std::string error = db_ ? sqlite3_errmsg(db_) : "out of memory";
        sqlite3_close(db_);
        db_ = nullptr;
        throw std::runtime_error("Failed to open database: " + error);
    }

    configureConnection(busyTimeout);
    createMigrationsTable();
}

Database::~Database() {
    if (db_) {
        sqlite3_close(db_);
        spdlog::debug("Device registry closed");
    }
}

void Database::configureConnection(std::chrono::milliseconds busyTimeout) {
    sqlite3_busy_timeout(db_, static_cast<int>(busyTimeout.count()));
    execute("PRAGMA journal_mode=WAL");
    execute("PRAGMA synchronous=NORMAL");
    execute("PRAGMA foreign_keys=ON");
}

void Database::execute(const std::string& sql) {
    std::lock_guard guard(mutex_);
    char* errMsg = nullptr;
    if (sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &errMsg) != SQLITE_OK) {
        std::string error = errMsg ? errMsg : "Unknown error";
        sqlite3_free(errMsg);
        throw std::runtime_error("SQL execution failed: " + error);
    }
}

Statement Database::prepare(const std::string& sql) {
    std::lock_guard guard(mutex_);
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
        throw std::runtime_error(std::string("Failed to prepare statement: ") +
                                 sqlite3_errmsg(db_));
    }
    return Statement(stmt);
}

int Database::changes() const {
    return sqlite3_changes(db_);
}

void Database::beginTransaction() {
    execute("BEGIN IMMEDIATE TRANSACTION");
}

void Database::commit() {
    execute("COMMIT");
}

void Database::rollback() {
    execute("ROLLBACK");
}

void Database::createMigrationsTable() {
    execute(R"(
        CREATE TABLE IF NOT EXISTS schema_migrations (
            version INTEGER PRIMARY KEY,
            applied_at TEXT DEFAULT CURRENT_TIMESTAMP
        )
    )");
}

int Database::schemaVersion() {
    auto guard = lock();
    auto stmt = prepare("SELECT MAX(version) FROM schema_migrations");
    if (stmt.step() && !stmt.columnIsNull(0)) {
        return stmt.columnInt(0);
    }
    return 0;
}

void Database::setVersion(int version) {
    auto stmt = prepare("INSERT INTO schema_migrations (version) VALUES (?)");
    stmt.bind(1, version);
    stmt.step();
}

void Database::runMigrations() {
    auto guard = lock();
    spdlog::info("Running database migrations...");

    int currentVersion = schemaVersion();
    spdlog::info("Current schema version: {}", currentVersion);

    // Migration 1: devices, teams, settings
    if (currentVersion < 1) {
        spdlog::info("Applying migration 1: Initial registry schema");
        transaction([this]() {
            execute(R"(
                CREATE TABLE IF NOT EXISTS teams (
                    id INTEGER PRIMARY KEY AUTOINCREMENT,
                    name TEXT NOT NULL UNIQUE COLLATE NOCASE,
                    created_at TEXT DEFAULT CURRENT_TIMESTAMP
                )
            )");

            execute(R"(
                CREATE TABLE IF NOT EXISTS devices (
                    id INTEGER PRIMARY KEY AUTOINCREMENT,
                    name TEXT NOT NULL,
                    host TEXT NOT NULL,
                    method TEXT NOT NULL DEFAULT 'Ping',
                    port INTEGER NOT NULL DEFAULT 0,
                    team_id INTEGER REFERENCES teams(id) ON DELETE SET NULL,
                    enabled INTEGER NOT NULL DEFAULT 1,
                    last_status TEXT NOT NULL DEFAULT 'Unknown',
                    last_latency_us INTEGER,
                    last_checked_at TEXT,
                    created_at TEXT DEFAULT CURRENT_TIMESTAMP
                )
            )");

            execute("CREATE INDEX IF NOT EXISTS idx_devices_team ON devices(team_id)");

            execute(R"(
                CREATE TABLE IF NOT EXISTS settings (
                    key TEXT PRIMARY KEY,
                    value TEXT NOT NULL
                )
            )");

            execute("INSERT OR IGNORE INTO settings (key, value) VALUES ('interval', '10')");
            execute("INSERT OR IGNORE INTO settings (key, value) VALUES ('timeout', '2')");
            execute("INSERT OR IGNORE INTO settings (key, value) VALUES ('export_on_close', '0')");

            setVersion(1);
        });
    }

    // Migration 2: monitoring pause, offline tracking, remote access
    if (currentVersion < 2) {
        spdlog::info("Applying migration 2: Add monitoring and outage tracking columns");
        transaction([this]() {
            execute("ALTER TABLE devices ADD COLUMN monitoring INTEGER NOT NULL DEFAULT 1");
            execute("ALTER TABLE devices ADD COLUMN offline_since TEXT");
            execute("ALTER TABLE devices ADD COLUMN last_offline_at TEXT");
            execute("ALTER TABLE devices ADD COLUMN remote_access INTEGER NOT NULL DEFAULT 0");
            execute("CREATE INDEX IF NOT EXISTS idx_devices_monitored ON devices(enabled, monitoring)");
            setVersion(2);
        });
    }

    spdlog::info("Database migrations complete. Version: {}", schemaVersion());
}

} // namespace vikabh::infra
