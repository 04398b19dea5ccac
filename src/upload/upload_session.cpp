#include "chunkvault/upload/upload_session.hpp"
#include "chunkvault/core/errors.hpp"

namespace chunkvault::upload {

const char* to_string(UploadStatus status) {
    switch (status) {
        case UploadStatus::UPLOADING: return "uploading";
        case UploadStatus::ASSEMBLING: return "assembling";
        case UploadStatus::COMPLETED: return "completed";
        case UploadStatus::ERROR: return "error";
    }
    return "unknown";
}

std::optional<UploadStatus> status_from_string(const std::string& name) {
    if (name == "uploading") return UploadStatus::UPLOADING;
    if (name == "assembling") return UploadStatus::ASSEMBLING;
    if (name == "completed") return UploadStatus::COMPLETED;
    if (name == "error") return UploadStatus::ERROR;
    return std::nullopt;
}

bool is_forward_transition(UploadStatus from, UploadStatus to) {
    switch (from) {
        case UploadStatus::UPLOADING:
            return to == UploadStatus::ASSEMBLING || to == UploadStatus::ERROR;
        case UploadStatus::ASSEMBLING:
            return to == UploadStatus::COMPLETED || to == UploadStatus::ERROR;
        case UploadStatus::COMPLETED:
        case UploadStatus::ERROR:
            return false;
    }
    return false;
}

UploadSession::UploadSession(const std::string& id, const std::string& name, const std::string& owner_id,
                             uint32_t chunk_count, uint64_t size)
    : file_id(id)
    , filename(name)
    , owner(owner_id)
    , total_chunks(chunk_count)
    , total_size(size)
    , created_at(std::chrono::system_clock::now())
    , updated_at(created_at) {
}

bool UploadSession::has_chunk(uint32_t chunk_index) const {
    return received_chunks.count(chunk_index) > 0;
}

bool UploadSession::all_chunks_received() const {
    return total_chunks > 0 && received_chunks.size() == total_chunks;
}

double UploadSession::progress_percent() const {
    if (total_chunks == 0) {
        return 0.0;
    }
    return static_cast<double>(received_chunks.size()) / static_cast<double>(total_chunks) * 100.0;
}

void UploadSession::record_chunk(uint32_t chunk_index, uint32_t checksum, uint64_t size) {
    auto previous = chunk_sizes.find(chunk_index);
    if (previous != chunk_sizes.end()) {
        bytes_received -= previous->second;
    }
    
    received_chunks.insert(chunk_index);
    chunk_checksums[chunk_index] = checksum;
    chunk_sizes[chunk_index] = size;
    bytes_received += size;
}

void UploadSession::advance(UploadStatus next) {
    if (next == status) {
        return;
    }
    
    if (!is_forward_transition(status, next)) {
        throw core::InvalidStateError(
            std::string("Upload ") + file_id + " cannot move from " + to_string(status) + " to " + to_string(next));
    }
    
    status = next;
}

void UploadSession::mark_error(const std::string& message) {
    if (status != UploadStatus::ERROR && is_forward_transition(status, UploadStatus::ERROR)) {
        status = UploadStatus::ERROR;
    }
    error_message = message;
    touch();
}

void UploadSession::touch() {
    updated_at = std::chrono::system_clock::now();
}

ProgressSnapshot UploadSession::snapshot() const {
    ProgressSnapshot result;
    result.file_id = file_id;
    result.filename = filename;
    result.owner = owner;
    result.bytes_uploaded = bytes_received;
    result.total_size = total_size;
    result.received_chunks = static_cast<uint32_t>(received_chunks.size());
    result.total_chunks = total_chunks;
    result.status = status;
    result.progress_percent = progress_percent();
    result.error_message = error_message;
    return result;
}

} // namespace chunkvault::upload
