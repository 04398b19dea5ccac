#include "chunkvault/upload/upload_service.hpp"
#include "chunkvault/upload/sqlite_session_store.hpp"
#include "chunkvault/commit/sqlite_record_store.hpp"
#include "chunkvault/core/errors.hpp"
#include "chunkvault/core/logger.hpp"
#include <boost/asio/post.hpp>

namespace chunkvault::upload {

UploadService::UploadService(const storage::StorageConfig& config,
                             std::shared_ptr<SessionStore> sessions,
                             std::shared_ptr<commit::RecordStore> records,
                             std::shared_ptr<const commit::ModuleRegistry> modules,
                             std::shared_ptr<commit::ArtifactGenerator> artifacts)
    : config_(config)
    , sessions_(std::move(sessions))
    , records_(std::move(records))
    , pool_(std::make_unique<boost::asio::thread_pool>(config.io_threads)) {
    
    chunks_ = std::make_shared<storage::ChunkStore>(config_, sessions_);
    assembler_ = std::make_unique<storage::AssemblyEngine>(config_, sessions_, chunks_);
    sweeper_ = std::make_unique<CleanupSweeper>(config_, sessions_, chunks_);
    orchestrator_ = std::make_unique<commit::CommitOrchestrator>(
        config_, sessions_, chunks_, records_, std::move(modules), std::move(artifacts), pool_.get());
}

template<typename Result, typename Function>
std::future<Result> UploadService::run_async(Function function) {
    auto task = std::make_shared<std::packaged_task<Result()>>(std::move(function));
    auto future = task->get_future();
    boost::asio::post(*pool_, [task]() { (*task)(); });
    return future;
}

UploadService::~UploadService() {
    shutdown();
}

std::unique_ptr<UploadService> UploadService::create(const storage::StorageConfig& config,
                                                     std::shared_ptr<commit::ArtifactGenerator> artifacts) {
    if (!config.validate()) {
        throw core::ValidationError("Invalid storage configuration for " + config.base_directory.string());
    }
    
    if (!config.create_directories()) {
        throw core::TransientIOError("Cannot create storage directories under " + config.base_directory.string());
    }
    
    std::shared_ptr<SessionStore> sessions;
    if (config.session_backend == "memory") {
        sessions = std::make_shared<InMemorySessionStore>();
    } else {
        auto sqlite_sessions = std::make_shared<SqliteSessionStore>(config.database_path);
        if (!sqlite_sessions->initialize()) {
            throw core::TransientIOError("Cannot open session database " + config.database_path.string());
        }
        sessions = std::move(sqlite_sessions);
    }
    
    auto records = std::make_shared<commit::SqliteRecordStore>(config.database_path);
    if (!records->initialize()) {
        throw core::TransientIOError("Cannot open record database " + config.database_path.string());
    }
    
    auto modules = std::make_shared<const commit::ModuleRegistry>(commit::ModuleRegistry::with_default_modules());
    
    LOG_INFO("Upload service ready at {} ({} session store, {} io threads)",
             config.base_directory.string(), config.session_backend, config.io_threads);
    
    return std::make_unique<UploadService>(config, std::move(sessions), std::move(records),
                                           std::move(modules), std::move(artifacts));
}

ProgressSnapshot UploadService::save_chunk(const storage::ChunkUpload& upload, std::span<const std::uint8_t> bytes) {
    bool completed_set = false;
    auto snapshot = chunks_->save(upload, bytes, completed_set);
    
    // Only the delivery that completed the set assembles; a concurrent
    // identical re-delivery returns the snapshot it was given.
    if (completed_set) {
        assembler_->assemble(upload.file_id);
        if (auto refreshed = get_status(upload.file_id)) {
            return *refreshed;
        }
    }
    
    return snapshot;
}

std::filesystem::path UploadService::assemble(const std::string& file_id) {
    return assembler_->assemble(file_id);
}

std::future<std::filesystem::path> UploadService::assemble_async(const std::string& file_id) {
    return run_async<std::filesystem::path>([this, file_id]() {
        return assembler_->assemble(file_id);
    });
}

std::optional<ProgressSnapshot> UploadService::get_status(const std::string& file_id) const {
    auto session = sessions_->get(file_id);
    if (!session) {
        return std::nullopt;
    }
    return session->snapshot();
}

std::vector<ProgressSnapshot> UploadService::list_sessions() const {
    std::vector<ProgressSnapshot> result;
    for (const auto& session : sessions_->list()) {
        result.push_back(session.snapshot());
    }
    return result;
}

bool UploadService::cleanup(const std::string& file_id) {
    try {
        bool removed = sweeper_->purge(file_id);
        if (removed) {
            LOG_INFO("Upload {} cancelled", file_id);
        }
        return removed;
    } catch (const std::exception& e) {
        LOG_ERROR("Cleanup of {} failed: {}", file_id, e.what());
        return false;
    }
}

commit::PersistedRecord UploadService::commit(const std::string& file_id, const std::string& module,
                                              const std::string& owner, const commit::CommitMetadata& metadata) {
    return orchestrator_->commit(file_id, module, owner, metadata);
}

std::future<commit::PersistedRecord> UploadService::commit_async(const std::string& file_id,
                                                                 const std::string& module,
                                                                 const std::string& owner,
                                                                 const commit::CommitMetadata& metadata) {
    return run_async<commit::PersistedRecord>([this, file_id, module, owner, metadata]() {
        return orchestrator_->commit(file_id, module, owner, metadata);
    });
}

commit::PersistedRecord UploadService::retry_finalize(const std::string& record_id) {
    return orchestrator_->retry_finalize(record_id);
}

commit::ReconcileReport UploadService::reconcile() {
    return orchestrator_->reconcile();
}

std::optional<commit::PersistedRecord> UploadService::get_record(const std::string& record_id) {
    return records_->get_record(record_id);
}

std::vector<commit::PersistedRecord> UploadService::list_records(const std::string& module) {
    return records_->list_records(module);
}

SweepReport UploadService::sweep(std::chrono::system_clock::time_point now) {
    return sweeper_->sweep_once(now);
}

bool UploadService::start_sweeper() {
    return sweeper_->start();
}

void UploadService::stop_sweeper() {
    sweeper_->stop();
}

void UploadService::shutdown() {
    if (sweeper_) {
        sweeper_->stop();
    }
    if (pool_) {
        pool_->join();
    }
}

} // namespace chunkvault::upload
