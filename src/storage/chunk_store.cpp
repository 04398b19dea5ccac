#include "chunkvault/storage/chunk_store.hpp"
#include "chunkvault/core/errors.hpp"
#include "chunkvault/core/logger.hpp"
#include "chunkvault/core/utils.hpp"
#include "chunkvault/crypto/checksum.hpp"
#include <fstream>
#include <limits>

namespace chunkvault::storage {

using core::utils::FileUtils;
using core::utils::IdUtils;
using upload::UploadSession;
using upload::UploadStatus;

ChunkStore::ChunkStore(const StorageConfig& config, std::shared_ptr<upload::SessionStore> sessions)
    : config_(config), sessions_(std::move(sessions)) {
}

upload::ProgressSnapshot ChunkStore::save(const ChunkUpload& upload, std::span<const std::uint8_t> bytes) {
    bool completed_set = false;
    return save(upload, bytes, completed_set);
}

upload::ProgressSnapshot ChunkStore::save(const ChunkUpload& upload, std::span<const std::uint8_t> bytes,
                                          bool& completed_set) {
    completed_set = false;
    validate(upload, bytes.size());
    
    auto index = static_cast<uint32_t>(upload.chunk_index);
    auto file_lock = lock_for(upload.file_id);
    std::lock_guard<std::mutex> guard(*file_lock);
    
    auto checksum = crypto::Crc32::compute(bytes);
    auto existing = sessions_->get(upload.file_id);
    
    if (existing) {
        if (existing->owner != upload.owner) {
            throw core::OwnershipError("Upload " + upload.file_id + " belongs to another user");
        }
        check_consistent(*existing, upload);
        
        if (existing->status != UploadStatus::UPLOADING) {
            auto recorded = existing->chunk_checksums.find(index);
            if (recorded != existing->chunk_checksums.end() && recorded->second == checksum) {
                LOG_DEBUG("Ignoring re-delivered chunk {} of {} ({})",
                          index, upload.file_id, upload::to_string(existing->status));
                return existing->snapshot();
            }
            throw core::InvalidStateError("Upload " + upload.file_id + " is " +
                                          upload::to_string(existing->status) + " and accepts no new chunks");
        }
    }
    
    auto chunk_path = config_.get_chunk_path(upload.file_id, index);
    try {
        write_chunk(chunk_path, bytes);
    } catch (const core::TransientIOError& e) {
        LOG_ERROR("Failed to write chunk {} of {}: {}", index, upload.file_id, e.what());
        if (existing) {
            sessions_->update(upload.file_id, [&](UploadSession& session) {
                session.mark_error(e.what());
            });
        }
        throw;
    }
    
    UploadSession initial(upload.file_id, upload.filename, upload.owner,
                          static_cast<uint32_t>(upload.total_chunks),
                          static_cast<uint64_t>(upload.total_size));
    
    auto session = sessions_->upsert(initial, [&](UploadSession& current) {
        if (current.status != UploadStatus::UPLOADING) {
            throw core::InvalidStateError("Upload " + current.file_id + " is no longer accepting chunks");
        }
        current.record_chunk(index, checksum, bytes.size());
        if (current.all_chunks_received()) {
            current.advance(UploadStatus::ASSEMBLING);
        }
        current.touch();
    });
    
    if (!existing) {
        LOG_INFO("Upload session {} created for {} ({} chunks, {})",
                 upload.file_id, upload.filename, upload.total_chunks,
                 core::utils::StringUtils::format_bytes(static_cast<uint64_t>(upload.total_size)));
    }
    
    LOG_DEBUG("Stored chunk {}/{} of {} ({} bytes, crc {:08x})",
              index + 1, session.total_chunks, upload.file_id, bytes.size(), checksum);
    
    if (session.status == UploadStatus::ASSEMBLING) {
        completed_set = true;
        LOG_INFO("All {} chunks received for {}", session.total_chunks, upload.file_id);
    }
    
    return session.snapshot();
}

bool ChunkStore::discard_chunks(const std::string& file_id) {
    if (!IdUtils::is_safe_identifier(file_id)) {
        return false;
    }
    
    auto directory = config_.get_chunk_directory(file_id);
    if (!FileUtils::exists(directory)) {
        return true;
    }
    return FileUtils::remove_all_quietly(directory);
}

void ChunkStore::release(const std::string& file_id) {
    std::lock_guard<std::mutex> lock(locks_mutex_);
    
    auto it = file_locks_.find(file_id);
    if (it != file_locks_.end() && it->second.use_count() == 1) {
        file_locks_.erase(it);
    }
}

std::shared_ptr<std::mutex> ChunkStore::lock_for(const std::string& file_id) {
    std::lock_guard<std::mutex> lock(locks_mutex_);
    
    auto& entry = file_locks_[file_id];
    if (!entry) {
        entry = std::make_shared<std::mutex>();
    }
    return entry;
}

size_t ChunkStore::tracked_locks() const {
    std::lock_guard<std::mutex> lock(locks_mutex_);
    return file_locks_.size();
}

void ChunkStore::validate(const ChunkUpload& upload, size_t chunk_size) const {
    if (!IdUtils::is_safe_identifier(upload.file_id)) {
        throw core::ValidationError("Invalid file id");
    }
    
    if (upload.filename.empty()) {
        throw core::ValidationError("Filename is required");
    }
    
    if (upload.owner.empty()) {
        throw core::ValidationError("Owner is required");
    }
    
    if (upload.total_chunks <= 0 || upload.total_chunks > std::numeric_limits<uint32_t>::max()) {
        throw core::ValidationError("Total chunk count must be positive");
    }
    
    if (upload.total_size < 0) {
        throw core::ValidationError("Total size must not be negative");
    }
    
    if (upload.chunk_index < 0 || upload.chunk_index >= upload.total_chunks) {
        throw core::ValidationError("Chunk index " + std::to_string(upload.chunk_index) +
                                    " is outside [0, " + std::to_string(upload.total_chunks) + ")");
    }
    
    if (chunk_size > config_.max_chunk_size) {
        throw core::ValidationError("Chunk of " + std::to_string(chunk_size) + " bytes exceeds the " +
                                    std::to_string(config_.max_chunk_size) + " byte limit");
    }
}

void ChunkStore::check_consistent(const UploadSession& session, const ChunkUpload& upload) const {
    if (session.total_chunks != static_cast<uint32_t>(upload.total_chunks) ||
        session.total_size != static_cast<uint64_t>(upload.total_size) ||
        session.filename != upload.filename) {
        throw core::ValidationError("Chunk metadata does not match upload " + upload.file_id);
    }
}

void ChunkStore::write_chunk(const std::filesystem::path& chunk_path, std::span<const std::uint8_t> bytes) {
    std::error_code ec;
    std::filesystem::create_directories(chunk_path.parent_path(), ec);
    if (ec) {
        throw core::TransientIOError("Cannot create " + chunk_path.parent_path().string() + ": " + ec.message());
    }
    
    std::ofstream file(chunk_path, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        throw core::TransientIOError("Cannot open " + chunk_path.string() + " for writing");
    }
    
    file.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    file.flush();
    if (!file.good()) {
        throw core::TransientIOError("Short write to " + chunk_path.string());
    }
}

} // namespace chunkvault::storage
