#include "chunkvault/commit/sqlite_record_store.hpp"
#include "chunkvault/storage/sqlite_statement.hpp"
#include "chunkvault/core/errors.hpp"
#include "chunkvault/core/logger.hpp"
#include "chunkvault/core/utils.hpp"
#include <sqlite3.h>

namespace chunkvault::commit {

using storage::SqliteStatement;
using storage::SqliteTransaction;
using core::utils::TimeUtils;

namespace {

constexpr const char* RECORD_COLUMNS = R"(
    uuid, module, title, original_name, stored_filename, file_path, target_path, file_size,
    content_hash, mime_type, description, owner, parent_id, finalize_state, created_at, updated_at
)";

PersistedRecord read_record(SqliteStatement& stmt) {
    PersistedRecord record;
    record.uuid = stmt.column_text(0);
    record.module = stmt.column_text(1);
    record.title = stmt.column_text(2);
    record.original_name = stmt.column_text(3);
    record.stored_filename = stmt.column_text(4);
    record.file_path = stmt.column_text(5);
    record.target_path = stmt.column_text(6);
    record.file_size = static_cast<uint64_t>(stmt.column_int64(7));
    record.content_hash = stmt.column_text(8);
    record.mime_type = stmt.column_text(9);
    record.description = stmt.column_text(10);
    record.owner = stmt.column_text(11);
    record.parent_id = stmt.column_text(12);
    record.finalize_state = finalize_state_from_string(stmt.column_text(13))
        .value_or(FinalizeState::PENDING_FINALIZE);
    record.created_at = TimeUtils::from_unix_millis(stmt.column_int64(14));
    record.updated_at = TimeUtils::from_unix_millis(stmt.column_int64(15));
    return record;
}

}

class SqliteRecordTransaction : public RecordTransaction {
public:
    explicit SqliteRecordTransaction(SqliteRecordStore& store)
        : store_(store)
        , lock_(store.mutex_)
        , transaction_(store.db_, true) {
    }
    
    void create_record(const PersistedRecord& record) override {
        require_active();
        store_.insert_record(record);
    }
    
    void attach_associations(const std::string& record_id, const Associations& associations) override {
        require_active();
        store_.insert_associations(record_id, associations);
    }
    
    void commit() override {
        require_active();
        transaction_.commit();
    }
    
    void rollback() override {
        if (transaction_.active()) {
            transaction_.rollback();
        }
    }

private:
    SqliteRecordStore& store_;
    std::unique_lock<std::mutex> lock_;
    SqliteTransaction transaction_;
    
    void require_active() const {
        if (!transaction_.active()) {
            throw core::InvalidStateError("Record transaction is already closed");
        }
    }
};

SqliteRecordStore::SqliteRecordStore(const std::filesystem::path& db_path)
    : db_path_(db_path), db_(nullptr) {
}

SqliteRecordStore::~SqliteRecordStore() {
    if (db_) {
        sqlite3_close(db_);
    }
}

bool SqliteRecordStore::initialize() {
    std::lock_guard<std::mutex> lock(mutex_);
    
    int result = sqlite3_open(db_path_.string().c_str(), &db_);
    if (result != SQLITE_OK) {
        LOG_ERROR("Failed to open record database {}: {}", db_path_.string(), sqlite3_errmsg(db_));
        return false;
    }
    
    sqlite3_busy_timeout(db_, 5000);
    
    try {
        create_tables();
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to create record tables: {}", e.what());
        return false;
    }
    
    return true;
}

void SqliteRecordStore::create_tables() {
    storage::sqlite_exec(db_, R"(
        PRAGMA foreign_keys = ON;
        
        CREATE TABLE IF NOT EXISTS records (
            uuid TEXT PRIMARY KEY,
            module TEXT NOT NULL,
            title TEXT,
            original_name TEXT NOT NULL,
            stored_filename TEXT NOT NULL,
            file_path TEXT NOT NULL,
            target_path TEXT NOT NULL,
            file_size INTEGER NOT NULL,
            content_hash TEXT NOT NULL,
            mime_type TEXT,
            description TEXT,
            owner TEXT NOT NULL,
            parent_id TEXT,
            finalize_state TEXT NOT NULL,
            created_at INTEGER NOT NULL,
            updated_at INTEGER NOT NULL
        );
        
        CREATE TABLE IF NOT EXISTS record_tags (
            record_id TEXT NOT NULL,
            tag TEXT NOT NULL,
            PRIMARY KEY (record_id, tag),
            FOREIGN KEY (record_id) REFERENCES records(uuid) ON DELETE CASCADE
        );
        
        CREATE TABLE IF NOT EXISTS record_links (
            record_id TEXT NOT NULL,
            link_type TEXT NOT NULL,
            target_id TEXT NOT NULL,
            PRIMARY KEY (record_id, link_type, target_id),
            FOREIGN KEY (record_id) REFERENCES records(uuid) ON DELETE CASCADE
        );
        
        CREATE INDEX IF NOT EXISTS idx_records_module ON records(module);
        CREATE INDEX IF NOT EXISTS idx_records_finalize_state ON records(finalize_state);
        CREATE INDEX IF NOT EXISTS idx_record_tags_tag ON record_tags(tag);
    )");
}

std::unique_ptr<RecordTransaction> SqliteRecordStore::begin() {
    return std::make_unique<SqliteRecordTransaction>(*this);
}

void SqliteRecordStore::insert_record(const PersistedRecord& record) {
    SqliteStatement insert(db_, R"(
        INSERT INTO records
        (uuid, module, title, original_name, stored_filename, file_path, target_path, file_size,
         content_hash, mime_type, description, owner, parent_id, finalize_state, created_at, updated_at)
        VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?);
    )");
    
    insert.bind(1, record.uuid)
        .bind(2, record.module)
        .bind(3, record.title)
        .bind(4, record.original_name)
        .bind(5, record.stored_filename)
        .bind(6, record.file_path)
        .bind(7, record.target_path)
        .bind(8, static_cast<std::int64_t>(record.file_size))
        .bind(9, record.content_hash)
        .bind(10, record.mime_type)
        .bind(11, record.description)
        .bind(12, record.owner);
    
    if (record.parent_id.empty()) {
        insert.bind_null(13);
    } else {
        insert.bind(13, record.parent_id);
    }
    
    insert.bind(14, std::string(to_string(record.finalize_state)))
        .bind(15, TimeUtils::to_unix_millis(record.created_at))
        .bind(16, TimeUtils::to_unix_millis(record.updated_at));
    insert.execute();
}

void SqliteRecordStore::insert_associations(const std::string& record_id, const Associations& associations) {
    if (!associations.tags.empty()) {
        SqliteStatement insert_tag(db_, "INSERT OR IGNORE INTO record_tags (record_id, tag) VALUES (?, ?);");
        for (const auto& tag : associations.tags) {
            insert_tag.bind(1, record_id).bind(2, tag);
            insert_tag.execute();
            insert_tag.reset();
        }
    }
    
    if (!associations.links.empty()) {
        SqliteStatement insert_link(db_, R"(
            INSERT OR IGNORE INTO record_links (record_id, link_type, target_id) VALUES (?, ?, ?);
        )");
        for (const auto& link : associations.links) {
            insert_link.bind(1, record_id).bind(2, link.link_type).bind(3, link.target_id);
            insert_link.execute();
            insert_link.reset();
        }
    }
}

void SqliteRecordStore::finalize_path(const std::string& record_id, const std::string& file_path) {
    std::lock_guard<std::mutex> lock(mutex_);
    
    SqliteTransaction transaction(db_, true);
    
    SqliteStatement update(db_, R"(
        UPDATE records SET file_path = ?, finalize_state = ?, updated_at = ? WHERE uuid = ?;
    )");
    update.bind(1, file_path)
        .bind(2, std::string(to_string(FinalizeState::FINALIZED)))
        .bind(3, TimeUtils::to_unix_millis(TimeUtils::now()))
        .bind(4, record_id);
    update.execute();
    
    if (sqlite3_changes(db_) == 0) {
        throw core::ResourceNotFound("Record " + record_id + " not found");
    }
    
    transaction.commit();
}

std::vector<PersistedRecord> SqliteRecordStore::select_records(const char* sql, const std::string& parameter) {
    SqliteStatement select(db_, sql);
    if (!parameter.empty()) {
        select.bind(1, parameter);
    }
    
    std::vector<PersistedRecord> records;
    while (select.step()) {
        records.push_back(read_record(select));
    }
    
    for (auto& record : records) {
        load_associations(record);
    }
    return records;
}

void SqliteRecordStore::load_associations(PersistedRecord& record) {
    SqliteStatement tags(db_, "SELECT tag FROM record_tags WHERE record_id = ? ORDER BY tag;");
    tags.bind(1, record.uuid);
    while (tags.step()) {
        record.tags.push_back(tags.column_text(0));
    }
    
    SqliteStatement projects(db_, R"(
        SELECT target_id FROM record_links WHERE record_id = ? AND link_type = 'project' ORDER BY target_id;
    )");
    projects.bind(1, record.uuid);
    while (projects.step()) {
        record.project_ids.push_back(projects.column_text(0));
    }
}

std::optional<PersistedRecord> SqliteRecordStore::get_record(const std::string& record_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    
    auto sql = std::string("SELECT ") + RECORD_COLUMNS + " FROM records WHERE uuid = ?;";
    auto records = select_records(sql.c_str(), record_id);
    if (records.empty()) {
        return std::nullopt;
    }
    return records.front();
}

std::vector<PersistedRecord> SqliteRecordStore::list_pending_finalize() {
    std::lock_guard<std::mutex> lock(mutex_);
    
    auto sql = std::string("SELECT ") + RECORD_COLUMNS +
               " FROM records WHERE finalize_state = ? ORDER BY created_at;";
    return select_records(sql.c_str(), to_string(FinalizeState::PENDING_FINALIZE));
}

std::vector<PersistedRecord> SqliteRecordStore::list_records(const std::string& module) {
    std::lock_guard<std::mutex> lock(mutex_);
    
    if (module.empty()) {
        auto sql = std::string("SELECT ") + RECORD_COLUMNS + " FROM records ORDER BY created_at;";
        return select_records(sql.c_str(), "");
    }
    
    auto sql = std::string("SELECT ") + RECORD_COLUMNS + " FROM records WHERE module = ? ORDER BY created_at;";
    return select_records(sql.c_str(), module);
}

size_t SqliteRecordStore::get_record_count() {
    std::lock_guard<std::mutex> lock(mutex_);
    
    SqliteStatement count(db_, "SELECT COUNT(*) FROM records;");
    return count.step() ? static_cast<size_t>(count.column_int64(0)) : 0;
}

uint64_t SqliteRecordStore::get_total_size() {
    std::lock_guard<std::mutex> lock(mutex_);
    
    SqliteStatement total(db_, "SELECT COALESCE(SUM(file_size), 0) FROM records;");
    return total.step() ? static_cast<uint64_t>(total.column_int64(0)) : 0;
}

} // namespace chunkvault::commit
