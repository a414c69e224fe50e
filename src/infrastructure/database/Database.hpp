#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <sqlite3.h>
#include <string>
#include <vector>

namespace vikabh::infra {

/**
 * @brief Owning handle for a prepared SQLite statement.
 *
 * Bind indices are 1-based, column indices 0-based, as in the SQLite C API.
 * Bind and step failures throw std::runtime_error with the SQLite message.
 */
class Statement {
public:
    explicit Statement(sqlite3_stmt* stmt);
    ~Statement();

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;
    Statement(Statement&& other) noexcept;
    Statement& operator=(Statement&& other) noexcept;

    void bind(int index, int value);
    void bind(int index, int64_t value);
    void bind(int index, double value);
    void bind(int index, const std::string& value);
    void bindNull(int index);

    /// Binds the value, or NULL when empty
    void bindOptional(int index, const std::optional<int64_t>& value);
    void bindOptional(int index, const std::optional<std::string>& value);

    /**
     * @brief Runs the statement up to the next row.
     * @return True while rows are available, false once done.
     */
    bool step();

    /**
     * @brief Rewinds the statement and clears its bindings for the next row of a batch.
     */
    void reset();

    int columnInt(int index) const;
    int64_t columnInt64(int index) const;
    double columnDouble(int index) const;
    std::string columnText(int index) const;

    std::optional<int64_t> columnOptionalInt64(int index) const;

    /// Nullopt for NULL and for empty text
    std::optional<std::string> columnOptionalText(int index) const;

    bool columnIsNull(int index) const;

    int columnCount() const;
    std::string columnName(int index) const;
    int columnType(int index) const;

private:
    sqlite3_stmt* stmt_{nullptr};
};

/**
 * @brief SQLite database wrapper with connection management.
 *
 * Backs the Device Registry: devices, teams and settings live in one
 * file opened at startup and closed at exit. Provides transactions,
 * prepared statements and schema migrations. Uses WAL mode so the
 * monitoring loop's status writes do not block readers.
 *
 * @note This class is non-copyable.
 */
class Database {
public:
    using Lock = std::unique_lock<std::recursive_mutex>;

    /**
     * @brief Opens or creates a database at the specified path.
     * @param path File path to the SQLite database.
     * @param busyTimeout How long SQLite waits on a locked database file.
     * @throws std::runtime_error if database cannot be opened.
     */
    explicit Database(const std::string& path,
                      std::chrono::milliseconds busyTimeout = std::chrono::milliseconds(5000));

    ~Database();

    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;

    /**
     * @brief Runs one or more SQL statements that return no rows.
     * @throws std::runtime_error with the SQLite message on failure.
     */
    void execute(const std::string& sql);

    /**
     * @throws std::runtime_error if the SQL does not compile.
     */
    Statement prepare(const std::string& sql);

    /**
     * @brief Locks the connection for a sequence of statements.
     *
     * The connection is shared between the monitoring loop and the device
     * management layer. Holding the lock keeps another thread's statements
     * out of a running transaction or read-modify-write sequence.
     *
     * @return Lock owning the connection until it goes out of scope.
     */
    [[nodiscard]] Lock lock() const { return Lock(mutex_); }

    /**
     * @brief Rows changed by the most recent INSERT, UPDATE or DELETE.
     *
     * Only meaningful while the caller holds lock() across the statement.
     */
    int changes() const;

    void beginTransaction();
    void commit();
    void rollback();

    /**
     * @brief Runs func inside BEGIN IMMEDIATE / COMMIT with the connection locked.
     *
     * The transaction is rolled back and the exception rethrown if func throws.
     */
    template <typename Func>
    void transaction(Func&& func) {
        auto guard = lock();
        beginTransaction();
        try {
            func();
            commit();
        } catch (...) {
            rollback();
            throw;
        }
    }

    /**
     * @brief Applies the registry schema migrations not yet recorded.
     */
    void runMigrations();

    /**
     * @return Highest applied migration, 0 for a new file.
     */
    int schemaVersion();

    /**
     * @brief Runs a query and returns each row as a JSON object keyed by column name.
     *
     * Meant for small key/value reads; repositories map typed rows themselves.
     */
    template <typename... Args>
    std::vector<nlohmann::json> query(const std::string& sql, Args&&... args) {
        auto guard = lock();
        auto stmt = prepare(sql);
        if constexpr (sizeof...(args) > 0) {
            bindAll(stmt, 1, std::forward<Args>(args)...);
        }

        std::vector<nlohmann::json> rows;
        const int columns = stmt.columnCount();
        while (stmt.step()) {
            nlohmann::json row;
            for (int i = 0; i < columns; ++i) {
                auto name = stmt.columnName(i);
                switch (stmt.columnType(i)) {
                case SQLITE_INTEGER:
                    row[name] = stmt.columnInt64(i);
                    break;
                case SQLITE_FLOAT:
                    row[name] = stmt.columnDouble(i);
                    break;
                case SQLITE_NULL:
                    row[name] = nullptr;
                    break;
                default:
                    row[name] = stmt.columnText(i);
                    break;
                }
            }
            rows.push_back(std::move(row));
        }
        return rows;
    }

private:
    template <typename T, typename... Rest>
    void bindAll(Statement& stmt, int index, T&& first, Rest&&... rest) {
        bindValue(stmt, index, std::forward<T>(first));
        if constexpr (sizeof...(rest) > 0) {
            bindAll(stmt, index + 1, std::forward<Rest>(rest)...);
        }
    }

    void bindValue(Statement& stmt, int index, int value) { stmt.bind(index, value); }
    void bindValue(Statement& stmt, int index, int64_t value) { stmt.bind(index, value); }
    void bindValue(Statement& stmt, int index, double value) { stmt.bind(index, value); }
    void bindValue(Statement& stmt, int index, const std::string& value) { stmt.bind(index, value); }
    void bindValue(Statement& stmt, int index, const char* value) { stmt.bind(index, std::string(value)); }

    void configureConnection(std::chrono::milliseconds busyTimeout);
    void createMigrationsTable();
    void setVersion(int version);

    sqlite3* db_{nullptr};
    mutable std::recursive_mutex mutex_;
};

} // namespace vikabh::infra
