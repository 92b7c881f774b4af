#include <ragscope/metadata/database.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <cstring>
#include <thread>

namespace ragscope::metadata {

namespace {
constexpr int kMaxRetries = 5;
constexpr auto kInitialBackoff = std::chrono::milliseconds(10);
constexpr int kBusyTimeoutMs = 5000;

Error bindError(int rc, int index) {
    return Error{ErrorCode::StorageError, "Failed to bind parameter " + std::to_string(index) +
                                              ": " + sqlite3_errstr(rc)};
}
} // namespace

// ============================================================================
// Statement
// ============================================================================

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
    if (int rc = sqlite3_bind_int64(stmt_, index, value); rc != SQLITE_OK)
        return bindError(rc, index);
    return {};
}

Result<void> Statement::bind(int index, const std::string& value) {
    int rc = sqlite3_bind_text(stmt_, index, value.data(), static_cast<int>(value.size()),
                               SQLITE_TRANSIENT);
    if (rc != SQLITE_OK)
        return bindError(rc, index);
    return {};
}

Result<void> Statement::bind(int index, std::span<const std::byte> blob) {
    int rc = sqlite3_bind_blob(stmt_, index, blob.data(), static_cast<int>(blob.size()),
                               SQLITE_TRANSIENT);
    if (rc != SQLITE_OK)
        return bindError(rc, index);
    return {};
}

int Statement::stepWithRetry() {
    auto backoff = kInitialBackoff;
    int rc = SQLITE_OK;
    for (int attempt = 0; attempt < kMaxRetries; ++attempt) {
        rc = sqlite3_step(stmt_);
        if (rc != SQLITE_BUSY && rc != SQLITE_LOCKED)
            return rc;
        sqlite3_reset(stmt_);
        std::this_thread::sleep_for(backoff);
        backoff *= 2;
    }
    return rc;
}

Result<void> Statement::execute() {
    int rc = stepWithRetry();
    if (rc == SQLITE_DONE || rc == SQLITE_ROW)
        return {};
    std::string message = std::string("Failed to execute statement: ") + sqlite3_errstr(rc);
    if (rc == SQLITE_CONSTRAINT) {
        if (const char* sql = sqlite3_sql(stmt_)) {
            message += " [SQL: " + std::string(sql, std::min<size_t>(std::strlen(sql), 100)) + "]";
        }
    }
    return Error{ErrorCode::StorageError, message};
}

Result<bool> Statement::step() {
    int rc = stepWithRetry();
    if (rc == SQLITE_ROW)
        return true;
    if (rc == SQLITE_DONE)
        return false;
    return Error{ErrorCode::StorageError,
                 std::string("Failed to step statement: ") + sqlite3_errstr(rc)};
}

int64_t Statement::getInt64(int column) const {
    return sqlite3_column_int64(stmt_, column);
}

std::string Statement::getString(int column) const {
    const auto* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt_, column));
    if (!text)
        return {};
    return std::string(text, static_cast<size_t>(sqlite3_column_bytes(stmt_, column)));
}

std::vector<std::byte> Statement::getBlob(int column) const {
    const void* blob = sqlite3_column_blob(stmt_, column);
    int size = sqlite3_column_bytes(stmt_, column);
    if (!blob || size <= 0)
        return {};
    std::vector<std::byte> out(static_cast<size_t>(size));
    std::memcpy(out.data(), blob, out.size());
    return out;
}

// ============================================================================
// Database
// ============================================================================

Database::~Database() {
    close();
}

Result<void> Database::open(const std::string& path, ConnectionMode mode) {
    close();
    int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
    if (mode == ConnectionMode::Memory)
        flags |= SQLITE_OPEN_MEMORY;

    if (int rc = sqlite3_open_v2(path.c_str(), &db_, flags, nullptr); rc != SQLITE_OK) {
        std::string error = db_ ? sqlite3_errmsg(db_) : sqlite3_errstr(rc);
        close();
        return Error{ErrorCode::StorageError, "Failed to open database '" + path + "': " + error};
    }
    sqlite3_busy_timeout(db_, kBusyTimeoutMs);
    spdlog::debug("Opened SQLite database '{}' (sqlite {})", path, sqlite3_libversion());
    return {};
}

void Database::close() {
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

Result<Statement> Database::prepare(const std::string& sql) {
    if (!db_)
        return Error{ErrorCode::InvalidState, "Database not open"};
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
        return Error{ErrorCode::StorageError, "Failed to prepare statement: " + lastError()};
    }
    return Statement(stmt);
}

Result<void> Database::execute(const std::string& sql) {
    if (!db_)
        return Error{ErrorCode::InvalidState, "Database not open"};
    char* errMsg = nullptr;
    if (sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &errMsg) != SQLITE_OK) {
        std::string error = errMsg ? errMsg : lastError();
        sqlite3_free(errMsg);
        return Error{ErrorCode::StorageError, "Failed to execute SQL: " + error};
    }
    return {};
}

void Database::rollback() {
    if (auto r = execute("ROLLBACK"); !r)
        spdlog::warn("Transaction rollback failed: {}", r.error().message);
}

int Database::changes() const {
    return db_ ? sqlite3_changes(db_) : 0;
}

Result<void> Database::enableWAL() {
    return execute("PRAGMA journal_mode=WAL");
}

std::string Database::lastError() const {
    return db_ ? sqlite3_errmsg(db_) : "Database not open";
}

} // namespace ragscope::metadata
