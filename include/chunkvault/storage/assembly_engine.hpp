#pragma once

#include <filesystem>
#include <memory>
#include <semaphore>
#include <string>
#include "chunk_store.hpp"
#include "storage_config.hpp"
#include "../upload/session_store.hpp"

namespace chunkvault::storage {

// Concatenates the chunks of a fully received upload into
// temp_uploads/complete_<file_id>_<filename>. At most
// max_concurrent_assemblies run at once; further callers block.
class AssemblyEngine {
public:
    static constexpr size_t COPY_BUFFER_SIZE = 64 * 1024;
    
    AssemblyEngine(const StorageConfig& config,
                   std::shared_ptr<upload::SessionStore> sessions,
                   std::shared_ptr<ChunkStore> chunks);
    
    // Returns the assembled file's path and marks the session COMPLETED.
    // On any failure the session is marked ERROR, the partial output is
    // removed and the exception propagates.
    std::filesystem::path assemble(const std::string& file_id);

private:
    StorageConfig config_;
    std::shared_ptr<upload::SessionStore> sessions_;
    std::shared_ptr<ChunkStore> chunks_;
    std::counting_semaphore<> slots_;
    
    uint64_t write_output(const upload::UploadSession& session, const std::filesystem::path& output_path);
    void fail(const std::string& file_id, const std::filesystem::path& output_path, const std::string& reason);
};

} // namespace chunkvault::storage
