#include "chunkvault/storage/assembly_engine.hpp"
#include "chunkvault/core/errors.hpp"
#include "chunkvault/core/logger.hpp"
#include "chunkvault/core/utils.hpp"
#include "chunkvault/crypto/checksum.hpp"
#include <fstream>
#include <vector>

namespace chunkvault::storage {

using core::utils::FileUtils;
using upload::UploadSession;
using upload::UploadStatus;

namespace {

class SlotGuard {
public:
    explicit SlotGuard(std::counting_semaphore<>& slots) : slots_(slots) { slots_.acquire(); }
    ~SlotGuard() { slots_.release(); }
    
    SlotGuard(const SlotGuard&) = delete;
    SlotGuard& operator=(const SlotGuard&) = delete;

private:
    std::counting_semaphore<>& slots_;
};

}

AssemblyEngine::AssemblyEngine(const StorageConfig& config,
                               std::shared_ptr<upload::SessionStore> sessions,
                               std::shared_ptr<ChunkStore> chunks)
    : config_(config)
    , sessions_(std::move(sessions))
    , chunks_(std::move(chunks))
    , slots_(static_cast<std::ptrdiff_t>(config.max_concurrent_assemblies)) {
}

std::filesystem::path AssemblyEngine::assemble(const std::string& file_id) {
    SlotGuard slot(slots_);
    
    std::filesystem::path output_path;
    uint64_t total_size = 0;
    
    try {
        auto file_lock = chunks_->lock_for(file_id);
        std::lock_guard<std::mutex> guard(*file_lock);
        
        auto session = sessions_->get(file_id);
        if (!session) {
            throw core::ResourceNotFound("Upload " + file_id + " not found");
        }
        
        if (session->status != UploadStatus::ASSEMBLING) {
            throw core::InvalidStateError("Upload " + file_id + " is " + upload::to_string(session->status) +
                                          ", not ready for assembly");
        }
        
        output_path = config_.get_assembled_path(file_id, session->filename);
        total_size = session->total_size;
        
        if (session->total_size > config_.max_file_size) {
            std::string reason = "Upload of " + std::to_string(session->total_size) +
                                 " bytes exceeds the " + std::to_string(config_.max_file_size) + " byte limit";
            fail(file_id, output_path, reason);
            throw core::ValidationError(reason);
        }
        
        LOG_DEBUG("Assembling {} from {} chunks into {}", file_id, session->total_chunks, output_path.string());
        
        try {
            write_output(*session, output_path);
        } catch (const core::UploadError& e) {
            fail(file_id, output_path, e.what());
            throw;
        } catch (const std::exception& e) {
            fail(file_id, output_path, e.what());
            throw core::TransientIOError("Assembly of " + file_id + " failed: " + e.what());
        }
        
        sessions_->update(file_id, [](UploadSession& current) {
            current.advance(UploadStatus::COMPLETED);
            current.touch();
        });
        
        if (!chunks_->discard_chunks(file_id)) {
            LOG_WARN("Chunks of {} could not be fully removed after assembly", file_id);
        }
    } catch (const std::exception&) {
        // The lock entry of a completed upload lives until commit or purge.
        chunks_->release(file_id);
        throw;
    }
    
    LOG_INFO("Assembled {} ({})", output_path.filename().string(),
             core::utils::StringUtils::format_bytes(total_size));
    return output_path;
}

uint64_t AssemblyEngine::write_output(const UploadSession& session, const std::filesystem::path& output_path) {
    std::ofstream output(output_path, std::ios::binary | std::ios::trunc);
    if (!output.is_open()) {
        throw core::TransientIOError("Cannot open " + output_path.string() + " for writing");
    }
    
    std::vector<char> buffer(COPY_BUFFER_SIZE);
    uint64_t total_written = 0;
    
    for (uint32_t index = 0; index < session.total_chunks; ++index) {
        auto chunk_path = config_.get_chunk_path(session.file_id, index);
        
        std::ifstream input(chunk_path, std::ios::binary);
        if (!input.is_open()) {
            throw core::ResourceNotFound("Chunk " + std::to_string(index) + " of " + session.file_id + " is missing");
        }
        
        auto expected = session.chunk_checksums.find(index);
        if (expected == session.chunk_checksums.end()) {
            throw core::IntegrityError("No checksum recorded for chunk " + std::to_string(index) +
                                       " of " + session.file_id);
        }
        
        crypto::Crc32 crc;
        while (input) {
            input.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
            auto bytes_read = input.gcount();
            if (bytes_read <= 0) {
                break;
            }
            
            crc.update(std::span<const std::uint8_t>(reinterpret_cast<const std::uint8_t*>(buffer.data()),
                                                     static_cast<size_t>(bytes_read)));
            output.write(buffer.data(), bytes_read);
            total_written += static_cast<uint64_t>(bytes_read);
        }
        
        if (input.bad()) {
            throw core::TransientIOError("Failed reading " + chunk_path.string());
        }
        
        if (crc.value() != expected->second) {
            throw core::IntegrityError("Checksum mismatch in chunk " + std::to_string(index) + " of " + session.file_id);
        }
        
        if (!output.good()) {
            throw core::TransientIOError("Failed writing " + output_path.string());
        }
    }
    
    output.close();
    if (output.fail()) {
        throw core::TransientIOError("Failed to close " + output_path.string());
    }
    
    if (total_written != session.total_size) {
        throw core::IntegrityError("Assembled size " + std::to_string(total_written) +
                                   " does not match declared size " + std::to_string(session.total_size));
    }
    
    return total_written;
}

void AssemblyEngine::fail(const std::string& file_id, const std::filesystem::path& output_path,
                          const std::string& reason) {
    LOG_ERROR("Assembly of {} failed: {}", file_id, reason);
    
    if (FileUtils::exists(output_path)) {
        FileUtils::remove_quietly(output_path);
    }
    
    try {
        sessions_->update(file_id, [&](UploadSession& current) {
            current.mark_error(reason);
        });
    } catch (const std::exception& e) {
        LOG_WARN("Could not record assembly failure for {}: {}", file_id, e.what());
    }
}

} // namespace chunkvault::storage
