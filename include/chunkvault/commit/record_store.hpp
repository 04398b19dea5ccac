#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace chunkvault::commit {

enum class FinalizeState {
    PENDING_FINALIZE,
    FINALIZED
};

const char* to_string(FinalizeState state);
std::optional<FinalizeState> finalize_state_from_string(const std::string& name);

// Caller-supplied description of the file being committed. `fields`
// carries module-specific extras (folder, caption, mime_type, ...).
struct CommitMetadata {
    std::string title;
    std::string description;
    std::string original_name;
    std::vector<std::string> tags;
    std::vector<std::string> project_ids;
    std::string parent_id;
    std::map<std::string, std::string> fields;
    
    std::string field(const std::string& key, const std::string& fallback = "") const;
};

struct PersistedRecord {
    std::string uuid;
    std::string module;
    std::string title;
    std::string original_name;
    std::string stored_filename;
    
    // Relative to the file storage directory. Points at the staging file
    // while the record is PENDING_FINALIZE; target_path is where it goes.
    std::string file_path;
    std::string target_path;
    
    uint64_t file_size = 0;
    std::string content_hash;
    std::string mime_type;
    std::string description;
    std::string owner;
    std::string parent_id;
    FinalizeState finalize_state = FinalizeState::PENDING_FINALIZE;
    
    std::vector<std::string> tags;
    std::vector<std::string> project_ids;
    
    std::chrono::system_clock::time_point created_at;
    std::chrono::system_clock::time_point updated_at;
};

struct RecordLink {
    std::string link_type;
    std::string target_id;
};

struct Associations {
    std::vector<std::string> tags;
    std::vector<RecordLink> links;
    
    bool empty() const { return tags.empty() && links.empty(); }
};

// One open write transaction. Destroying it without commit() rolls back.
class RecordTransaction {
public:
    virtual ~RecordTransaction() = default;
    
    virtual void create_record(const PersistedRecord& record) = 0;
    virtual void attach_associations(const std::string& record_id, const Associations& associations) = 0;
    virtual void commit() = 0;
    virtual void rollback() = 0;
};

class RecordStore {
public:
    virtual ~RecordStore() = default;
    
    virtual std::unique_ptr<RecordTransaction> begin() = 0;
    
    // Points the record at its final location and marks it FINALIZED.
    virtual void finalize_path(const std::string& record_id, const std::string& file_path) = 0;
    
    virtual std::optional<PersistedRecord> get_record(const std::string& record_id) = 0;
    virtual std::vector<PersistedRecord> list_pending_finalize() = 0;
    virtual std::vector<PersistedRecord> list_records(const std::string& module = "") = 0;
};

} // namespace chunkvault::commit
