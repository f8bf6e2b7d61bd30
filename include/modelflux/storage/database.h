#pragma once

#include <modelflux/core/types.h>
#include <sqlite3.h>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace modelflux::storage {

/**
 * @brief Connection settings applied by Database::open
 *
 * The WAL journal is skipped for ":memory:" databases, which cannot use it.
 */
struct OpenOptions {
    bool walJournal{true};
    bool foreignKeys{true};
    std::chrono::milliseconds busyTimeout{5000};
};

/**
 * @brief Prepared statement, finalized on destruction
 *
 * Parameters are 1-based, result columns 0-based. execute() resets the statement when it
 * finishes so the same object can be re-bound for the next row.
 */
class Statement {
public:
    ~Statement();

    Statement(Statement&& other) noexcept;
    Statement& operator=(Statement&& other) noexcept;
    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    Result<void> bind(int index, int64_t value);
    Result<void> bind(int index, int value) { return bind(index, static_cast<int64_t>(value)); }
    Result<void> bind(int index, std::string_view text);
    Result<void> bind(int index, std::span<const std::byte> blob);

    template <typename... Args> Result<void> bindAll(Args&&... args) {
        return bindFrom(1, std::forward<Args>(args)...);
    }

    // Run to completion (INSERT/UPDATE/DELETE)
    Result<void> execute();

    // Advance one row; false once the result set is exhausted
    Result<bool> step();

    int64_t columnInt64(int column) const;
    std::string columnText(int column) const;
    std::vector<std::byte> columnBlob(int column) const;

private:
    friend class Database;
    explicit Statement(sqlite3_stmt* stmt) : stmt_(stmt) {}

    int stepWithRetry();
    Error stepError(int rc) const;

    template <typename T, typename... Rest>
    Result<void> bindFrom(int index, T&& value, Rest&&... rest) {
        auto result = bind(index, std::forward<T>(value));
        if (!result)
            return result;
        if constexpr (sizeof...(rest) > 0) {
            return bindFrom(index + 1, std::forward<Rest>(rest)...);
        }
        return {};
    }

    sqlite3_stmt* stmt_ = nullptr;
};

/**
 * @brief Single SQLite connection opened in serialized (full mutex) mode
 */
class Database {
public:
    Database() = default;
    ~Database();

    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;

    Result<void> open(const std::string& path, const OpenOptions& options = {});
    void close();
    [[nodiscard]] bool isOpen() const { return db_ != nullptr; }

    Result<Statement> prepare(std::string_view sql);

    // One or more ';'-separated statements without parameters
    Result<void> execute(const std::string& sql);

    /**
     * @brief Run func inside BEGIN IMMEDIATE / COMMIT
     *
     * Rolls back when func returns an error or throws; exceptions are rethrown. Nested
     * transactions are rejected with InvalidState.
     */
    template <typename Func> Result<void> transaction(Func&& func) {
        auto begun = begin();
        if (!begun)
            return begun;
        try {
            Result<void> result = func();
            if (!result) {
                rollback();
                return result;
            }
            return commit();
        } catch (...) {
            rollback();
            throw;
        }
    }

    int64_t lastInsertRowId() const;
    int changes() const;

private:
    Result<void> begin();
    Result<void> commit();
    void rollback();

    sqlite3* db_ = nullptr;
    bool inTransaction_ = false;
};

} // namespace modelflux::storage
