#pragma once

#include "record_store.hpp"
#include <filesystem>
#include <mutex>

struct sqlite3;

namespace chunkvault::commit {

// Records, their tags and their links in one SQLite database. A
// transaction returned by begin() holds the store's lock until it commits
// or rolls back, so writers are serialised.
class SqliteRecordStore : public RecordStore {
public:
    explicit SqliteRecordStore(const std::filesystem::path& db_path);
    ~SqliteRecordStore() override;
    
    SqliteRecordStore(const SqliteRecordStore&) = delete;
    SqliteRecordStore& operator=(const SqliteRecordStore&) = delete;
    
    bool initialize();
    
    std::unique_ptr<RecordTransaction> begin() override;
    void finalize_path(const std::string& record_id, const std::string& file_path) override;
    std::optional<PersistedRecord> get_record(const std::string& record_id) override;
    std::vector<PersistedRecord> list_pending_finalize() override;
    std::vector<PersistedRecord> list_records(const std::string& module = "") override;
    
    size_t get_record_count();
    uint64_t get_total_size();

private:
    friend class SqliteRecordTransaction;
    
    std::filesystem::path db_path_;
    sqlite3* db_;
    std::mutex mutex_;
    
    void create_tables();
    
    // Callers hold mutex_.
    std::vector<PersistedRecord> select_records(const char* sql, const std::string& parameter);
    void load_associations(PersistedRecord& record);
    void insert_record(const PersistedRecord& record);
    void insert_associations(const std::string& record_id, const Associations& associations);
};

} // namespace chunkvault::commit
