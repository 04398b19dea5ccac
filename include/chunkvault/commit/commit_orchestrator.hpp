#pragma once

#include <cstddef>
#include <filesystem>
#include <memory>
#include <string>
#include <boost/asio/thread_pool.hpp>
#include "artifact_generator.hpp"
#include "module_registry.hpp"
#include "record_store.hpp"
#include "../storage/chunk_store.hpp"
#include "../storage/storage_config.hpp"
#include "../upload/session_store.hpp"

namespace chunkvault::commit {

struct ReconcileReport {
    size_t finalized = 0;
    size_t failed = 0;
};

// Moves an assembled upload into permanent storage and records it.
//
// The record is written inside one transaction together with its
// associations while the file sits at a staging path next to its final
// location. Until that transaction commits, any failure rolls it back and
// deletes both the staged and the assembled file. After it commits, the
// file is renamed into place and the record marked finalized; if that last
// step fails the record stays PENDING_FINALIZE and retry_finalize() or
// reconcile() complete it later.
class CommitOrchestrator {
public:
    CommitOrchestrator(const storage::StorageConfig& config,
                       std::shared_ptr<upload::SessionStore> sessions,
                       std::shared_ptr<storage::ChunkStore> chunks,
                       std::shared_ptr<RecordStore> records,
                       std::shared_ptr<const ModuleRegistry> modules,
                       std::shared_ptr<ArtifactGenerator> artifacts = nullptr,
                       boost::asio::thread_pool* pool = nullptr);
    
    PersistedRecord commit(const std::string& file_id, const std::string& module,
                           const std::string& owner, const CommitMetadata& metadata);
    
    PersistedRecord retry_finalize(const std::string& record_id);
    
    ReconcileReport reconcile();

private:
    storage::StorageConfig config_;
    std::shared_ptr<upload::SessionStore> sessions_;
    std::shared_ptr<storage::ChunkStore> chunks_;
    std::shared_ptr<RecordStore> records_;
    std::shared_ptr<const ModuleRegistry> modules_;
    std::shared_ptr<ArtifactGenerator> artifacts_;
    boost::asio::thread_pool* pool_;
    
    std::filesystem::path locate(const std::string& file_id, const std::string& owner,
                                 upload::UploadSession& session) const;
    
    PersistedRecord persist(const std::string& file_id, const std::string& module, const std::string& owner,
                            const CommitMetadata& metadata, const upload::UploadSession& session,
                            const std::filesystem::path& assembled_path);
    
    PersistedRecord finalize(PersistedRecord record);
    
    void generate_artifacts(const PersistedRecord& record);
    void release_session(const std::string& file_id);
    
    std::filesystem::path absolute(const std::filesystem::path& relative) const;
};

} // namespace chunkvault::commit
