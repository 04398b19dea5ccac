#pragma once

#include "session_store.hpp"
#include <filesystem>
#include <mutex>

struct sqlite3;

namespace chunkvault::upload {

// Session store that survives restarts. Uploads interrupted by a restart
// keep their received-chunk set and checksums and can be resumed.
class SqliteSessionStore : public SessionStore {
public:
    explicit SqliteSessionStore(const std::filesystem::path& database_path);
    ~SqliteSessionStore() override;
    
    SqliteSessionStore(const SqliteSessionStore&) = delete;
    SqliteSessionStore& operator=(const SqliteSessionStore&) = delete;
    
    bool initialize();
    
    std::optional<UploadSession> get(const std::string& file_id) const override;
    void put(const UploadSession& session) override;
    std::optional<UploadSession> update(const std::string& file_id, const Mutator& mutate) override;
    UploadSession upsert(const UploadSession& initial, const Mutator& mutate) override;
    bool remove(const std::string& file_id) override;
    std::vector<std::string> scan_expired(std::chrono::system_clock::time_point cutoff) const override;
    std::vector<UploadSession> list() const override;
    size_t size() const override;

private:
    std::filesystem::path db_path_;
    sqlite3* db_;
    mutable std::mutex mutex_;
    
    void create_tables();
    
    // Callers hold mutex_.
    std::optional<UploadSession> load_session(const std::string& file_id) const;
    void save_session(const UploadSession& session);
    void delete_session(const std::string& file_id);
};

} // namespace chunkvault::upload
