#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <span>
#include <string>
#include "storage_config.hpp"
#include "../upload/session_store.hpp"

namespace chunkvault::storage {

struct ChunkUpload {
    std::string file_id;
    std::int64_t chunk_index = 0;
    std::string filename;
    std::int64_t total_chunks = 0;
    std::int64_t total_size = 0;
    std::string owner;
};

// Persists individual chunks under temp_uploads/<file_id>/ and keeps the
// upload session in step with what is on disk.
class ChunkStore {
public:
    ChunkStore(const StorageConfig& config, std::shared_ptr<upload::SessionStore> sessions);
    
    // Writes one chunk and records it on the session, creating the session
    // on first contact. Once every index has arrived the session moves to
    // ASSEMBLING.
    //
    // Throws ValidationError, OwnershipError, InvalidStateError or
    // TransientIOError.
    upload::ProgressSnapshot save(const ChunkUpload& upload, std::span<const std::uint8_t> bytes);
    
    // completed_set is true only for the call whose chunk moved the session
    // to ASSEMBLING; re-deliveries acknowledged afterwards report false.
    upload::ProgressSnapshot save(const ChunkUpload& upload, std::span<const std::uint8_t> bytes,
                                  bool& completed_set);
    
    // Removes the chunk directory. Never throws.
    bool discard_chunks(const std::string& file_id);
    
    // Drops the per-file lock once nothing holds it.
    void release(const std::string& file_id);
    
    std::shared_ptr<std::mutex> lock_for(const std::string& file_id);
    
    size_t tracked_locks() const;
    
    const StorageConfig& config() const { return config_; }

private:
    StorageConfig config_;
    std::shared_ptr<upload::SessionStore> sessions_;
    
    mutable std::mutex locks_mutex_;
    std::map<std::string, std::shared_ptr<std::mutex>> file_locks_;
    
    void validate(const ChunkUpload& upload, size_t chunk_size) const;
    void check_consistent(const upload::UploadSession& session, const ChunkUpload& upload) const;
    void write_chunk(const std::filesystem::path& chunk_path, std::span<const std::uint8_t> bytes);
};

} // namespace chunkvault::storage
