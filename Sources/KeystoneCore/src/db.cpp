#include "keystone/db.hpp"
#include "keystone/log.hpp"
#include <algorithm>
#include <chrono>
#include <thread>

namespace keystone {

namespace {

constexpr int busy_timeout_ms = 5000;
constexpr int max_begin_backoff_ms = 500;
constexpr int max_begin_wait_ms = 30000;

} // namespace

// ============================================================================
// statement
// ============================================================================

statement::statement(sqlite3* db, const std::string& sql) : db_(db) {
    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt_, nullptr) != SQLITE_OK) {
        std::string error = sqlite3_errmsg(db_);
        LOG_ERROR("db", "cannot prepare \"%s\": %s", sql.c_str(), error.c_str());
        throw store_error("cannot prepare statement: " + error);
    }
}

statement::statement(statement&& other) noexcept : db_(other.db_), stmt_(other.stmt_) {
    other.stmt_ = nullptr;
}

statement::~statement() {
    sqlite3_finalize(stmt_);
}

statement& statement::bind(int index, const std::string& text) {
    if (sqlite3_bind_text(stmt_, index, text.data(), static_cast<int>(text.size()),
                          SQLITE_TRANSIENT) != SQLITE_OK) {
        fail("bind");
    }
    return *this;
}

bool statement::step() {
    int rc = sqlite3_step(stmt_);
    if (rc == SQLITE_ROW) return true;
    if (rc == SQLITE_DONE) return false;
    fail("step");
}

void statement::reset() {
    sqlite3_reset(stmt_);
    sqlite3_clear_bindings(stmt_);
}

std::optional<std::string> statement::text(int column) const {
    if (sqlite3_column_type(stmt_, column) == SQLITE_NULL) {
        return std::nullopt;
    }
    auto data = reinterpret_cast<const char*>(sqlite3_column_text(stmt_, column));
    return std::string(data, static_cast<size_t>(sqlite3_column_bytes(stmt_, column)));
}

void statement::fail(const char* what) const {
    std::string error = sqlite3_errmsg(db_);
    LOG_ERROR("db", "%s failed: %s (SQL: %s)", what, error.c_str(), sqlite3_sql(stmt_));
    throw store_error(std::string(what) + " failed: " + error);
}

// ============================================================================
// database
// ============================================================================

database::database(const std::string& path) : path_(path) {
    // FULLMUTEX: one connection is shared by every thread of a context
    int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
    int rc = sqlite3_open_v2(path.c_str(), &db_, flags, nullptr);
    if (rc != SQLITE_OK) {
        std::string error = db_ ? sqlite3_errmsg(db_) : sqlite3_errstr(rc);
        sqlite3_close(db_);
        db_ = nullptr;
        LOG_ERROR("db", "cannot open %s: %s", path.c_str(), error.c_str());
        throw store_error("cannot open database " + path + ": " + error);
    }

    sqlite3_busy_timeout(db_, busy_timeout_ms);
    if (!in_memory()) {
        exec("PRAGMA journal_mode = WAL");
        exec("PRAGMA synchronous = NORMAL");
    }
}

database::~database() {
    if (db_ == nullptr) return;
    if (!in_memory()) {
        sqlite3_wal_checkpoint_v2(db_, nullptr, SQLITE_CHECKPOINT_TRUNCATE, nullptr, nullptr);
    }
    sqlite3_close(db_);
}

void database::exec(const std::string& sql) {
    char* message = nullptr;
    if (sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &message) != SQLITE_OK) {
        std::string error = message ? message : sqlite3_errmsg(db_);
        sqlite3_free(message);
        LOG_ERROR("db", "\"%s\" failed: %s", sql.c_str(), error.c_str());
        throw store_error(sql + " failed: " + error);
    }
}

void database::begin() {
    // Writers queue here instead of failing later at COMMIT
    const char* sql = "BEGIN IMMEDIATE";
    int rc = sqlite3_exec(db_, sql, nullptr, nullptr, nullptr);

    int delay_ms = 1;
    int waited_ms = 0;
    while ((rc == SQLITE_BUSY || rc == SQLITE_LOCKED) && waited_ms < max_begin_wait_ms) {
        std::this_thread::sleep_for(std::chrono::milliseconds(delay_ms));
        waited_ms += delay_ms;
        delay_ms = std::min(delay_ms * 2, max_begin_backoff_ms);
        rc = sqlite3_exec(db_, sql, nullptr, nullptr, nullptr);
    }

    if (rc != SQLITE_OK) {
        std::string error = sqlite3_errmsg(db_);
        LOG_ERROR("db", "cannot begin transaction on %s: %s", path_.c_str(), error.c_str());
        throw store_error("cannot begin transaction: " + error);
    }
}

// ============================================================================
// transaction
// ============================================================================

transaction::transaction(database& db) : db_(db) {
    db_.begin();
}

transaction::~transaction() {
    if (committed_ || !db_.in_transaction()) return;
    try {
        db_.rollback();
    } catch (const store_error& e) {
        LOG_ERROR("db", "rollback failed: %s", e.what());
    }
}

void transaction::commit() {
    db_.commit();
    committed_ = true;
}

} // namespace keystone
