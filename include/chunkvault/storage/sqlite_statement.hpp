#pragma once

#include <cstdint>
#include <string>
#include <vector>

struct sqlite3;
struct sqlite3_stmt;

namespace chunkvault::storage {

// Prepared statement that finalizes itself. Failures throw
// core::TransientIOError carrying sqlite's message.
class SqliteStatement {
public:
    SqliteStatement(sqlite3* db, const char* sql);
    ~SqliteStatement();
    
    SqliteStatement(const SqliteStatement&) = delete;
    SqliteStatement& operator=(const SqliteStatement&) = delete;
    
    SqliteStatement& bind(int index, const std::string& value);
    SqliteStatement& bind(int index, std::int64_t value);
    SqliteStatement& bind_null(int index);
    
    // True while a row is available, false once the statement is done.
    bool step();
    
    // Runs a statement that returns no rows.
    void execute();
    
    void reset();
    
    std::string column_text(int index) const;
    std::int64_t column_int64(int index) const;

private:
    sqlite3* db_;
    sqlite3_stmt* stmt_;
};

// Runs one or more statements without parameters.
void sqlite_exec(sqlite3* db, const char* sql);

// Rolls back unless commit() was called. Nested use is not supported.
class SqliteTransaction {
public:
    explicit SqliteTransaction(sqlite3* db, bool immediate = false);
    ~SqliteTransaction();
    
    SqliteTransaction(const SqliteTransaction&) = delete;
    SqliteTransaction& operator=(const SqliteTransaction&) = delete;
    
    void commit();
    void rollback();
    bool active() const { return active_; }

private:
    sqlite3* db_;
    bool active_;
};

} // namespace chunkvault::storage
