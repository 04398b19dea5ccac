#include "chunkvault/upload/sqlite_session_store.hpp"
#include "chunkvault/storage/sqlite_statement.hpp"
#include "chunkvault/core/logger.hpp"
#include "chunkvault/core/utils.hpp"
#include <sqlite3.h>

namespace chunkvault::upload {

using storage::SqliteStatement;
using storage::SqliteTransaction;
using core::utils::TimeUtils;

SqliteSessionStore::SqliteSessionStore(const std::filesystem::path& database_path)
    : db_path_(database_path), db_(nullptr) {
}

SqliteSessionStore::~SqliteSessionStore() {
    if (db_) {
        sqlite3_close(db_);
    }
}

bool SqliteSessionStore::initialize() {
    std::lock_guard<std::mutex> lock(mutex_);
    
    int result = sqlite3_open(db_path_.string().c_str(), &db_);
    if (result != SQLITE_OK) {
        LOG_ERROR("Failed to open session database {}: {}", db_path_.string(), sqlite3_errmsg(db_));
        return false;
    }
    
    sqlite3_busy_timeout(db_, 5000);
    
    try {
        create_tables();
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to create session tables: {}", e.what());
        return false;
    }
    
    LOG_DEBUG("Session store opened at {}", db_path_.string());
    return true;
}

void SqliteSessionStore::create_tables() {
    storage::sqlite_exec(db_, R"(
        CREATE TABLE IF NOT EXISTS upload_sessions (
            file_id TEXT PRIMARY KEY,
            filename TEXT NOT NULL,
            owner TEXT NOT NULL,
            total_chunks INTEGER NOT NULL,
            total_size INTEGER NOT NULL,
            bytes_received INTEGER NOT NULL,
            status TEXT NOT NULL,
            error_message TEXT,
            created_at INTEGER NOT NULL,
            updated_at INTEGER NOT NULL
        );
        
        CREATE TABLE IF NOT EXISTS upload_chunks (
            file_id TEXT NOT NULL,
            chunk_index INTEGER NOT NULL,
            checksum INTEGER NOT NULL,
            chunk_size INTEGER NOT NULL,
            PRIMARY KEY (file_id, chunk_index)
        );
        
        CREATE INDEX IF NOT EXISTS idx_upload_sessions_updated_at ON upload_sessions(updated_at);
    )");
}

std::optional<UploadSession> SqliteSessionStore::load_session(const std::string& file_id) const {
    SqliteStatement select(db_, R"(
        SELECT filename, owner, total_chunks, total_size, bytes_received, status,
               error_message, created_at, updated_at
        FROM upload_sessions WHERE file_id = ?;
    )");
    select.bind(1, file_id);
    
    if (!select.step()) {
        return std::nullopt;
    }
    
    UploadSession session;
    session.file_id = file_id;
    session.filename = select.column_text(0);
    session.owner = select.column_text(1);
    session.total_chunks = static_cast<uint32_t>(select.column_int64(2));
    session.total_size = static_cast<uint64_t>(select.column_int64(3));
    session.bytes_received = static_cast<uint64_t>(select.column_int64(4));
    session.status = status_from_string(select.column_text(5)).value_or(UploadStatus::ERROR);
    session.error_message = select.column_text(6);
    session.created_at = TimeUtils::from_unix_millis(select.column_int64(7));
    session.updated_at = TimeUtils::from_unix_millis(select.column_int64(8));
    
    SqliteStatement chunks(db_, R"(
        SELECT chunk_index, checksum, chunk_size FROM upload_chunks
        WHERE file_id = ? ORDER BY chunk_index;
    )");
    chunks.bind(1, file_id);
    
    while (chunks.step()) {
        auto index = static_cast<uint32_t>(chunks.column_int64(0));
        session.received_chunks.insert(index);
        session.chunk_checksums[index] = static_cast<uint32_t>(chunks.column_int64(1));
        session.chunk_sizes[index] = static_cast<uint64_t>(chunks.column_int64(2));
    }
    
    return session;
}

void SqliteSessionStore::save_session(const UploadSession& session) {
    SqliteStatement upsert_session(db_, R"(
        INSERT OR REPLACE INTO upload_sessions
        (file_id, filename, owner, total_chunks, total_size, bytes_received, status,
         error_message, created_at, updated_at)
        VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?);
    )");
    upsert_session.bind(1, session.file_id)
        .bind(2, session.filename)
        .bind(3, session.owner)
        .bind(4, static_cast<std::int64_t>(session.total_chunks))
        .bind(5, static_cast<std::int64_t>(session.total_size))
        .bind(6, static_cast<std::int64_t>(session.bytes_received))
        .bind(7, std::string(to_string(session.status)))
        .bind(8, session.error_message)
        .bind(9, TimeUtils::to_unix_millis(session.created_at))
        .bind(10, TimeUtils::to_unix_millis(session.updated_at));
    upsert_session.execute();
    
    SqliteStatement clear_chunks(db_, "DELETE FROM upload_chunks WHERE file_id = ?;");
    clear_chunks.bind(1, session.file_id);
    clear_chunks.execute();
    
    SqliteStatement insert_chunk(db_, R"(
        INSERT INTO upload_chunks (file_id, chunk_index, checksum, chunk_size)
        VALUES (?, ?, ?, ?);
    )");
    
    for (auto index : session.received_chunks) {
        auto checksum = session.chunk_checksums.find(index);
        auto size = session.chunk_sizes.find(index);
        
        insert_chunk.bind(1, session.file_id)
            .bind(2, static_cast<std::int64_t>(index))
            .bind(3, static_cast<std::int64_t>(checksum != session.chunk_checksums.end() ? checksum->second : 0))
            .bind(4, static_cast<std::int64_t>(size != session.chunk_sizes.end() ? size->second : 0));
        insert_chunk.execute();
        insert_chunk.reset();
    }
}

void SqliteSessionStore::delete_session(const std::string& file_id) {
    SqliteStatement delete_chunks(db_, "DELETE FROM upload_chunks WHERE file_id = ?;");
    delete_chunks.bind(1, file_id);
    delete_chunks.execute();
    
    SqliteStatement delete_row(db_, "DELETE FROM upload_sessions WHERE file_id = ?;");
    delete_row.bind(1, file_id);
    delete_row.execute();
}

std::optional<UploadSession> SqliteSessionStore::get(const std::string& file_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return load_session(file_id);
}

void SqliteSessionStore::put(const UploadSession& session) {
    std::lock_guard<std::mutex> lock(mutex_);
    
    SqliteTransaction transaction(db_, true);
    save_session(session);
    transaction.commit();
}

std::optional<UploadSession> SqliteSessionStore::update(const std::string& file_id, const Mutator& mutate) {
    std::lock_guard<std::mutex> lock(mutex_);
    
    SqliteTransaction transaction(db_, true);
    auto session = load_session(file_id);
    if (!session) {
        return std::nullopt;
    }
    
    mutate(*session);
    save_session(*session);
    transaction.commit();
    return session;
}

UploadSession SqliteSessionStore::upsert(const UploadSession& initial, const Mutator& mutate) {
    std::lock_guard<std::mutex> lock(mutex_);
    
    SqliteTransaction transaction(db_, true);
    auto existing = load_session(initial.file_id);
    UploadSession working = existing ? *existing : initial;
    
    mutate(working);
    save_session(working);
    transaction.commit();
    return working;
}

bool SqliteSessionStore::remove(const std::string& file_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    
    SqliteTransaction transaction(db_, true);
    bool existed = load_session(file_id).has_value();
    if (existed) {
        delete_session(file_id);
    }
    transaction.commit();
    return existed;
}

std::vector<std::string> SqliteSessionStore::scan_expired(std::chrono::system_clock::time_point cutoff) const {
    std::lock_guard<std::mutex> lock(mutex_);
    
    SqliteStatement select(db_, "SELECT file_id FROM upload_sessions WHERE updated_at < ? ORDER BY updated_at;");
    select.bind(1, TimeUtils::to_unix_millis(cutoff));
    
    std::vector<std::string> expired;
    while (select.step()) {
        expired.push_back(select.column_text(0));
    }
    return expired;
}

std::vector<UploadSession> SqliteSessionStore::list() const {
    std::lock_guard<std::mutex> lock(mutex_);
    
    std::vector<std::string> ids;
    {
        SqliteStatement select(db_, "SELECT file_id FROM upload_sessions ORDER BY created_at;");
        while (select.step()) {
            ids.push_back(select.column_text(0));
        }
    }
    
    std::vector<UploadSession> sessions;
    sessions.reserve(ids.size());
    for (const auto& id : ids) {
        if (auto session = load_session(id)) {
            sessions.push_back(std::move(*session));
        }
    }
    return sessions;
}

size_t SqliteSessionStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    
    SqliteStatement count(db_, "SELECT COUNT(*) FROM upload_sessions;");
    return count.step() ? static_cast<size_t>(count.column_int64(0)) : 0;
}

} // namespace chunkvault::upload
