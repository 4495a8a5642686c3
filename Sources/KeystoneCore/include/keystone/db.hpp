#pragma once

#ifdef __cplusplus

#include "types.hpp"
#include <sqlite3.h>
#include <optional>
#include <string>

namespace keystone {

// ============================================================================
// statement - one compiled SQL statement, finalized on destruction
// ============================================================================

class statement {
public:
    statement(sqlite3* db, const std::string& sql);
    ~statement();

    statement(const statement&) = delete;
    statement& operator=(const statement&) = delete;
    statement(statement&& other) noexcept;

    // Parameters are 1-based, as in sqlite3_bind_*
    statement& bind(int index, const std::string& text);

    /// Advances to the next row. Returns false once the statement is done.
    bool step();

    /// Clears bindings and rewinds so the statement can run again.
    void reset();

    std::optional<std::string> text(int column) const;

private:
    [[noreturn]] void fail(const char* what) const;

    sqlite3* db_;
    sqlite3_stmt* stmt_ = nullptr;
};

// ============================================================================
// database - a serialized sqlite3 connection. Errors throw store_error.
// ============================================================================

class database {
public:
    /// ":memory:" opens a private in-memory database; files use WAL.
    explicit database(const std::string& path);
    ~database();

    database(const database&) = delete;
    database& operator=(const database&) = delete;

    statement prepare(const std::string& sql) { return statement(db_, sql); }

    // Runs statements without parameters or results (DDL, pragmas, COMMIT)
    void exec(const std::string& sql);

    // Rows modified by the most recent statement
    int changes() const { return sqlite3_changes(db_); }

    // BEGIN IMMEDIATE: takes the write lock up front
    void begin();
    void commit() { exec("COMMIT"); }
    void rollback() { exec("ROLLBACK"); }
    bool in_transaction() const { return sqlite3_get_autocommit(db_) == 0; }

    const std::string& path() const { return path_; }

private:
    bool in_memory() const { return path_ == ":memory:"; }

    sqlite3* db_ = nullptr;
    std::string path_;
};

// RAII transaction guard: rolls back unless committed
class transaction {
public:
    explicit transaction(database& db);
    ~transaction();

    void commit();

private:
    database& db_;
    bool committed_ = false;
};

} // namespace keystone

#endif // __cplusplus
