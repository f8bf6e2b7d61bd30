#include <spdlog/spdlog.h>
#include <algorithm>
#include <cstring>
#include <thread>
#include <modelflux/storage/database.h>

namespace modelflux::storage {

namespace {

// SQLITE_BUSY can still surface past the busy handler when a writer holds the lock
constexpr int kStepAttempts = 5;
constexpr auto kStepBackoff = std::chrono::milliseconds(10);

Error sqliteError(sqlite3* db, const std::string& what) {
    return Error{ErrorCode::DatabaseError,
                 what + ": " + (db ? sqlite3_errmsg(db) : "no connection")};
}

} // namespace

// Statement

Statement::~Statement() {
    if (stmt_)
        sqlite3_finalize(stmt_);
}

Statement::Statement(Statement&& other) noexcept : stmt_(other.stmt_) {
    other.stmt_ = nullptr;
}

Statement& Statement::operator=(Statement&& other) noexcept {
    if (this != &other) {
        if (stmt_)
            sqlite3_finalize(stmt_);
        stmt_ = other.stmt_;
        other.stmt_ = nullptr;
    }
    return *this;
}

Result<void> Statement::bind(int index, int64_t value) {
    if (sqlite3_bind_int64(stmt_, index, value) != SQLITE_OK)
        return sqliteError(sqlite3_db_handle(stmt_), "Failed to bind integer #" + std::to_string(index));
    return {};
}

Result<void> Statement::bind(int index, std::string_view text) {
    if (sqlite3_bind_text(stmt_, index, text.data(), static_cast<int>(text.size()),
                          SQLITE_TRANSIENT) != SQLITE_OK)
        return sqliteError(sqlite3_db_handle(stmt_), "Failed to bind text #" + std::to_string(index));
    return {};
}

Result<void> Statement::bind(int index, std::span<const std::byte> blob) {
    if (sqlite3_bind_blob(stmt_, index, blob.data(), static_cast<int>(blob.size()),
                          SQLITE_TRANSIENT) != SQLITE_OK)
        return sqliteError(sqlite3_db_handle(stmt_), "Failed to bind blob #" + std::to_string(index));
    return {};
}

int Statement::stepWithRetry() {
    auto backoff = kStepBackoff;
    int rc = sqlite3_step(stmt_);
    for (int attempt = 1; (rc == SQLITE_BUSY || rc == SQLITE_LOCKED) && attempt < kStepAttempts;
         ++attempt) {
        sqlite3_reset(stmt_);
        std::this_thread::sleep_for(backoff);
        backoff *= 2;
        rc = sqlite3_step(stmt_);
    }
    return rc;
}

Error Statement::stepError(int rc) const {
    std::string msg = std::string("Statement failed: ") + sqlite3_errstr(rc);
    if ((rc & 0xff) == SQLITE_CONSTRAINT) {
        // Name the statement so foreign-key and uniqueness failures are traceable
        if (const char* sql = sqlite3_sql(stmt_)) {
            const std::size_t len = std::strlen(sql);
            msg += " [SQL: " + std::string(sql, std::min<std::size_t>(len, 100)) +
                   (len > 100 ? "...]" : "]");
        }
    }
    return Error{ErrorCode::DatabaseError, msg};
}

Result<void> Statement::execute() {
    const int rc = stepWithRetry();
    sqlite3_reset(stmt_);
    if (rc == SQLITE_DONE || rc == SQLITE_ROW)
        return {};
    return stepError(rc);
}

Result<bool> Statement::step() {
    const int rc = stepWithRetry();
    if (rc == SQLITE_ROW)
        return true;
    if (rc == SQLITE_DONE)
        return false;
    return stepError(rc);
}

int64_t Statement::columnInt64(int column) const {
    return sqlite3_column_int64(stmt_, column);
}

std::string Statement::columnText(int column) const {
    const auto* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt_, column));
    if (!text)
        return {};
    return std::string(text, static_cast<std::size_t>(sqlite3_column_bytes(stmt_, column)));
}

std::vector<std::byte> Statement::columnBlob(int column) const {
    const void* data = sqlite3_column_blob(stmt_, column);
    const int size = sqlite3_column_bytes(stmt_, column);
    if (!data || size <= 0)
        return {};
    std::vector<std::byte> out(static_cast<std::size_t>(size));
    std::memcpy(out.data(), data, out.size());
    return out;
}

// Database

Database::~Database() {
    close();
}

Result<void> Database::open(const std::string& path, const OpenOptions& options) {
    if (db_)
        return Error{ErrorCode::InvalidState, "Database already open: " + path};

    const int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
    const int rc = sqlite3_open_v2(path.c_str(), &db_, flags, nullptr);
    if (rc != SQLITE_OK) {
        auto err = sqliteError(db_, "Failed to open database " + path);
        close();
        return err;
    }
    sqlite3_busy_timeout(db_, static_cast<int>(options.busyTimeout.count()));

    if (options.walJournal && path != ":memory:") {
        auto wal = execute("PRAGMA journal_mode=WAL");
        if (!wal)
            spdlog::warn("[Database] WAL unavailable for {}: {}", path, wal.error().message);
    }
    if (options.foreignKeys) {
        auto fk = execute("PRAGMA foreign_keys = ON");
        if (!fk) {
            close();
            return fk;
        }
    }
    return {};
}

void Database::close() {
    if (db_) {
        sqlite3_close_v2(db_);
        db_ = nullptr;
    }
    inTransaction_ = false;
}

Result<Statement> Database::prepare(std::string_view sql) {
    if (!db_)
        return Error{ErrorCode::InvalidState, "Database not open"};
    sqlite3_stmt* raw = nullptr;
    if (sqlite3_prepare_v2(db_, sql.data(), static_cast<int>(sql.size()), &raw, nullptr) !=
        SQLITE_OK) {
        sqlite3_finalize(raw);
        return sqliteError(db_, "Failed to prepare statement");
    }
    return Statement(raw);
}

Result<void> Database::execute(const std::string& sql) {
    if (!db_)
        return Error{ErrorCode::InvalidState, "Database not open"};
    char* errMsg = nullptr;
    if (sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &errMsg) != SQLITE_OK) {
        std::string error = errMsg ? errMsg : sqlite3_errmsg(db_);
        sqlite3_free(errMsg);
        spdlog::error("[Database] SQL exec failed ({}): {}", error, sql);
        return Error{ErrorCode::DatabaseError, "Failed to execute SQL: " + error};
    }
    return {};
}

Result<void> Database::begin() {
    if (inTransaction_)
        return Error{ErrorCode::InvalidState, "Already in transaction"};
    auto r = execute("BEGIN IMMEDIATE");
    if (r)
        inTransaction_ = true;
    return r;
}

Result<void> Database::commit() {
    auto r = execute("COMMIT");
    if (!r) {
        rollback();
        return r;
    }
    inTransaction_ = false;
    return r;
}

void Database::rollback() {
    inTransaction_ = false;
    auto r = execute("ROLLBACK");
    if (!r)
        spdlog::warn("[Database] Rollback failed: {}", r.error().message);
}

int64_t Database::lastInsertRowId() const {
    return db_ ? sqlite3_last_insert_rowid(db_) : 0;
}

int Database::changes() const {
    return db_ ? sqlite3_changes(db_) : 0;
}

} // namespace modelflux::storage
