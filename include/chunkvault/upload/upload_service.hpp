#pragma once

#include <future>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <vector>
#include <boost/asio/thread_pool.hpp>
#include "cleanup_sweeper.hpp"
#include "session_store.hpp"
#include "../commit/commit_orchestrator.hpp"
#include "../commit/module_registry.hpp"
#include "../commit/record_store.hpp"
#include "../storage/assembly_engine.hpp"
#include "../storage/chunk_store.hpp"
#include "../storage/storage_config.hpp"

namespace chunkvault::upload {

class UploadService {
public:
    UploadService(const storage::StorageConfig& config,
                  std::shared_ptr<SessionStore> sessions,
                  std::shared_ptr<commit::RecordStore> records,
                  std::shared_ptr<const commit::ModuleRegistry> modules,
                  std::shared_ptr<commit::ArtifactGenerator> artifacts = nullptr);
    ~UploadService();
    
    UploadService(const UploadService&) = delete;
    UploadService& operator=(const UploadService&) = delete;
    
    // Opens the configured session backend and the record database under
    // config.base_directory. Throws TransientIOError if either cannot be
    // opened.
    static std::unique_ptr<UploadService> create(const storage::StorageConfig& config,
                                                 std::shared_ptr<commit::ArtifactGenerator> artifacts = nullptr);
    
    // Stores one chunk. The chunk that completes the set also triggers
    // assembly; the returned snapshot then reports COMPLETED.
    ProgressSnapshot save_chunk(const storage::ChunkUpload& upload, std::span<const std::uint8_t> bytes);
    
    std::filesystem::path assemble(const std::string& file_id);
    std::future<std::filesystem::path> assemble_async(const std::string& file_id);
    
    std::optional<ProgressSnapshot> get_status(const std::string& file_id) const;
    std::vector<ProgressSnapshot> list_sessions() const;
    
    // Never throws. False when the upload is unknown or could not be removed.
    bool cleanup(const std::string& file_id);
    
    commit::PersistedRecord commit(const std::string& file_id, const std::string& module,
                                   const std::string& owner, const commit::CommitMetadata& metadata);
    std::future<commit::PersistedRecord> commit_async(const std::string& file_id, const std::string& module,
                                                      const std::string& owner,
                                                      const commit::CommitMetadata& metadata);
    
    commit::PersistedRecord retry_finalize(const std::string& record_id);
    commit::ReconcileReport reconcile();
    
    std::optional<commit::PersistedRecord> get_record(const std::string& record_id);
    std::vector<commit::PersistedRecord> list_records(const std::string& module = "");
    
    SweepReport sweep(std::chrono::system_clock::time_point now = std::chrono::system_clock::now());
    bool start_sweeper();
    void stop_sweeper();
    
    // Stops the sweeper and waits for queued background work.
    void shutdown();
    
    const storage::StorageConfig& config() const { return config_; }

private:
    storage::StorageConfig config_;
    std::shared_ptr<SessionStore> sessions_;
    std::shared_ptr<commit::RecordStore> records_;
    std::unique_ptr<boost::asio::thread_pool> pool_;
    
    std::shared_ptr<storage::ChunkStore> chunks_;
    std::unique_ptr<storage::AssemblyEngine> assembler_;
    std::unique_ptr<CleanupSweeper> sweeper_;
    std::unique_ptr<commit::CommitOrchestrator> orchestrator_;
    
    template<typename Result, typename Function>
    std::future<Result> run_async(Function function);
};

} // namespace chunkvault::upload
