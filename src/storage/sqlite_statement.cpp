#include "chunkvault/storage/sqlite_statement.hpp"
#include "chunkvault/core/errors.hpp"
#include "chunkvault/core/logger.hpp"
#include <sqlite3.h>

namespace chunkvault::storage {

namespace {

[[noreturn]] void throw_sqlite_error(sqlite3* db, const std::string& context) {
    throw core::TransientIOError(context + ": " + (db ? sqlite3_errmsg(db) : "no database"));
}

}

SqliteStatement::SqliteStatement(sqlite3* db, const char* sql)
    : db_(db), stmt_(nullptr) {
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt_, nullptr) != SQLITE_OK) {
        throw_sqlite_error(db_, "Failed to prepare statement");
    }
}

SqliteStatement::~SqliteStatement() {
    if (stmt_) {
        sqlite3_finalize(stmt_);
    }
}

SqliteStatement& SqliteStatement::bind(int index, const std::string& value) {
    if (sqlite3_bind_text(stmt_, index, value.c_str(), static_cast<int>(value.size()), SQLITE_TRANSIENT) != SQLITE_OK) {
        throw_sqlite_error(db_, "Failed to bind text parameter");
    }
    return *this;
}

SqliteStatement& SqliteStatement::bind(int index, std::int64_t value) {
    if (sqlite3_bind_int64(stmt_, index, value) != SQLITE_OK) {
        throw_sqlite_error(db_, "Failed to bind integer parameter");
    }
    return *this;
}

SqliteStatement& SqliteStatement::bind_null(int index) {
    if (sqlite3_bind_null(stmt_, index) != SQLITE_OK) {
        throw_sqlite_error(db_, "Failed to bind null parameter");
    }
    return *this;
}

bool SqliteStatement::step() {
    int result = sqlite3_step(stmt_);
    if (result == SQLITE_ROW) {
        return true;
    }
    if (result == SQLITE_DONE) {
        return false;
    }
    throw_sqlite_error(db_, "Failed to execute statement");
}

void SqliteStatement::execute() {
    while (step()) {
    }
}

void SqliteStatement::reset() {
    sqlite3_reset(stmt_);
    sqlite3_clear_bindings(stmt_);
}

std::string SqliteStatement::column_text(int index) const {
    auto text = sqlite3_column_text(stmt_, index);
    if (!text) {
        return {};
    }
    return std::string(reinterpret_cast<const char*>(text),
                       static_cast<size_t>(sqlite3_column_bytes(stmt_, index)));
}

std::int64_t SqliteStatement::column_int64(int index) const {
    return sqlite3_column_int64(stmt_, index);
}

void sqlite_exec(sqlite3* db, const char* sql) {
    char* error_msg = nullptr;
    int result = sqlite3_exec(db, sql, nullptr, nullptr, &error_msg);
    if (result != SQLITE_OK) {
        std::string message = error_msg ? error_msg : "unknown error";
        sqlite3_free(error_msg);
        throw core::TransientIOError("SQL execution failed: " + message);
    }
}

SqliteTransaction::SqliteTransaction(sqlite3* db, bool immediate)
    : db_(db), active_(false) {
    sqlite_exec(db_, immediate ? "BEGIN IMMEDIATE;" : "BEGIN;");
    active_ = true;
}

SqliteTransaction::~SqliteTransaction() {
    if (active_) {
        rollback();
    }
}

void SqliteTransaction::commit() {
    sqlite_exec(db_, "COMMIT;");
    active_ = false;
}

void SqliteTransaction::rollback() {
    if (!active_) {
        return;
    }
    active_ = false;
    
    char* error_msg = nullptr;
    if (sqlite3_exec(db_, "ROLLBACK;", nullptr, nullptr, &error_msg) != SQLITE_OK) {
        LOG_WARN("Rollback failed: {}", error_msg ? error_msg : "unknown error");
        sqlite3_free(error_msg);
    }
}

} // namespace chunkvault::storage
