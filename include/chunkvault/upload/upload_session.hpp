#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>

namespace chunkvault::upload {

enum class UploadStatus {
    UPLOADING,
    ASSEMBLING,
    COMPLETED,
    ERROR
};

const char* to_string(UploadStatus status);
std::optional<UploadStatus> status_from_string(const std::string& name);

// Status only moves forward: UPLOADING -> ASSEMBLING -> {COMPLETED, ERROR},
// or UPLOADING -> ERROR directly.
bool is_forward_transition(UploadStatus from, UploadStatus to);

struct ProgressSnapshot {
    std::string file_id;
    std::string filename;
    std::string owner;
    uint64_t bytes_uploaded = 0;
    uint64_t total_size = 0;
    uint32_t received_chunks = 0;
    uint32_t total_chunks = 0;
    UploadStatus status = UploadStatus::UPLOADING;
    double progress_percent = 0.0;
    std::string error_message;
};

struct UploadSession {
    std::string file_id;
    std::string filename;
    std::string owner;
    uint32_t total_chunks = 0;
    uint64_t total_size = 0;
    
    std::set<uint32_t> received_chunks;
    std::map<uint32_t, uint32_t> chunk_checksums;
    std::map<uint32_t, uint64_t> chunk_sizes;
    uint64_t bytes_received = 0;
    
    UploadStatus status = UploadStatus::UPLOADING;
    std::string error_message;
    
    std::chrono::system_clock::time_point created_at;
    std::chrono::system_clock::time_point updated_at;
    
    UploadSession() = default;
    
    UploadSession(const std::string& id, const std::string& name, const std::string& owner_id,
                  uint32_t chunk_count, uint64_t size);
    
    bool has_chunk(uint32_t chunk_index) const;
    bool all_chunks_received() const;
    double progress_percent() const;
    
    // Records one chunk arrival. Re-recording an index replaces its size and
    // checksum; bytes_received stays the sum over distinct indices.
    void record_chunk(uint32_t chunk_index, uint32_t checksum, uint64_t size);
    
    // Throws InvalidStateError for backward or sideways moves. Advancing to
    // the current status is a no-op.
    void advance(UploadStatus next);
    
    void mark_error(const std::string& message);
    
    void touch();
    
    ProgressSnapshot snapshot() const;
};

} // namespace chunkvault::upload
