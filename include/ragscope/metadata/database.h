#pragma once

#include <ragscope/core/types.h>
#include <sqlite3.h>

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace ragscope::metadata {

enum class ConnectionMode {
    Create, ///< File database, created if missing
    Memory  ///< Private in-memory database
};

/**
 * @brief Prepared statement owned by RAII. Obtained from Database::prepare().
 */
class Statement {
public:
    ~Statement();

    Statement(Statement&& other) noexcept;
    Statement& operator=(Statement&& other) noexcept;
    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    Result<void> bind(int index, int64_t value);
    Result<void> bind(int index, const std::string& value);
    Result<void> bind(int index, std::span<const std::byte> blob);

    /**
     * @brief Binds args to parameters 1..N in order
     */
    template <typename... Args> Result<void> bindAll(Args&&... args) {
        int index = 0;
        Result<void> result;
        ((result = bind(++index, std::forward<Args>(args)), static_cast<bool>(result)) && ...);
        return result;
    }

    // Runs a statement that returns no rows
    Result<void> execute();

    // true while a row is available
    Result<bool> step();

    int64_t getInt64(int column) const;
    std::string getString(int column) const;
    std::vector<std::byte> getBlob(int column) const;

private:
    friend class Database;
    explicit Statement(sqlite3_stmt* stmt) : stmt_(stmt) {}

    // sqlite3_step with backoff on SQLITE_BUSY / SQLITE_LOCKED
    int stepWithRetry();

    sqlite3_stmt* stmt_ = nullptr;
};

/**
 * @brief Single SQLite connection. Not synchronized; callers serialize access.
 */
class Database {
public:
    Database() = default;
    ~Database();

    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;

    Result<void> open(const std::string& path, ConnectionMode mode);
    void close();
    [[nodiscard]] bool isOpen() const { return db_ != nullptr; }

    Result<Statement> prepare(const std::string& sql);

    // Runs one or more statements without results
    Result<void> execute(const std::string& sql);

    /**
     * @brief Runs func inside BEGIN IMMEDIATE / COMMIT. A failed Result or an
     * exception rolls back; the exception is rethrown.
     */
    template <typename Func> Result<void> transaction(Func&& func) {
        if (auto begin = execute("BEGIN IMMEDIATE"); !begin)
            return begin;
        try {
            auto result = func();
            if (!result) {
                rollback();
                return result;
            }
            return execute("COMMIT");
        } catch (...) {
            rollback();
            throw;
        }
    }

    // Rows touched by the last INSERT, UPDATE or DELETE
    int changes() const;

    Result<void> enableWAL();

private:
    void rollback();
    std::string lastError() const;

    sqlite3* db_ = nullptr;
};

} // namespace ragscope::metadata
