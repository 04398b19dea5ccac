#include "chunkvault/commit/commit_orchestrator.hpp"
#include "chunkvault/core/errors.hpp"
#include "chunkvault/core/logger.hpp"
#include "chunkvault/core/utils.hpp"
#include "chunkvault/crypto/hash.hpp"
#include <boost/asio/post.hpp>

namespace chunkvault::commit {

using core::utils::FileUtils;
using core::utils::IdUtils;
using core::utils::MimeUtils;
using core::utils::StringUtils;
using core::utils::TimeUtils;
using upload::UploadSession;
using upload::UploadStatus;

CommitOrchestrator::CommitOrchestrator(const storage::StorageConfig& config,
                                       std::shared_ptr<upload::SessionStore> sessions,
                                       std::shared_ptr<storage::ChunkStore> chunks,
                                       std::shared_ptr<RecordStore> records,
                                       std::shared_ptr<const ModuleRegistry> modules,
                                       std::shared_ptr<ArtifactGenerator> artifacts,
                                       boost::asio::thread_pool* pool)
    : config_(config)
    , sessions_(std::move(sessions))
    , chunks_(std::move(chunks))
    , records_(std::move(records))
    , modules_(std::move(modules))
    , artifacts_(std::move(artifacts))
    , pool_(pool) {
}

PersistedRecord CommitOrchestrator::commit(const std::string& file_id, const std::string& module,
                                           const std::string& owner, const CommitMetadata& metadata) {
    PersistedRecord record;
    
    try {
        auto file_lock = chunks_->lock_for(file_id);
        std::lock_guard<std::mutex> guard(*file_lock);
        
        UploadSession session;
        auto assembled_path = locate(file_id, owner, session);
        
        record = persist(file_id, module, owner, metadata, session, assembled_path);
        
        try {
            record = finalize(std::move(record));
        } catch (const core::PartialCommitInconsistency&) {
            release_session(file_id);
            throw;
        }
        
        release_session(file_id);
    } catch (const std::exception&) {
        chunks_->release(file_id);
        throw;
    }
    
    chunks_->release(file_id);
    
    LOG_INFO("Committed {} to {} as {} ({})", file_id, module, record.uuid, record.file_path);
    
    generate_artifacts(record);
    return record;
}

std::filesystem::path CommitOrchestrator::locate(const std::string& file_id, const std::string& owner,
                                                 UploadSession& session) const {
    auto found = sessions_->get(file_id);
    if (!found) {
        throw core::ResourceNotFound("Upload " + file_id + " not found");
    }
    
    if (found->owner != owner) {
        throw core::OwnershipError("Upload " + file_id + " belongs to another user");
    }
    
    if (found->status != UploadStatus::COMPLETED) {
        throw core::InvalidStateError("Upload " + file_id + " is " + upload::to_string(found->status) +
                                      ", not completed");
    }
    
    auto assembled_path = config_.get_assembled_path(file_id, found->filename);
    if (!FileUtils::exists(assembled_path)) {
        throw core::ResourceNotFound("Assembled file for " + file_id + " not found");
    }
    
    session = std::move(*found);
    return assembled_path;
}

PersistedRecord CommitOrchestrator::persist(const std::string& file_id, const std::string& module,
                                            const std::string& owner, const CommitMetadata& metadata,
                                            const UploadSession& session,
                                            const std::filesystem::path& assembled_path) {
    std::filesystem::path temp_path;
    std::unique_ptr<RecordTransaction> transaction;
    
    try {
        const auto& handler = modules_->resolve(module);
        
        auto original_name = StringUtils::sanitize_filename(
            metadata.original_name.empty() ? session.filename : metadata.original_name);
        auto uuid = IdUtils::generate_uuid();
        auto paths = modules_->plan_paths(module, metadata, original_name, uuid);
        
        temp_path = absolute(paths.temp_path);
        FileUtils::move_file(assembled_path, temp_path);
        
        auto file_size = FileUtils::file_size(temp_path);
        if (!file_size) {
            throw core::TransientIOError("Cannot stat staged file " + temp_path.string());
        }
        if (*file_size != session.total_size) {
            throw core::IntegrityError("Staged file size " + std::to_string(*file_size) +
                                       " does not match upload size " + std::to_string(session.total_size));
        }
        
        auto content_hash = crypto::ContentHasher::hash_file(temp_path);
        if (!content_hash) {
            throw core::TransientIOError("Cannot hash staged file " + temp_path.string());
        }
        
        PersistedRecord record;
        record.uuid = uuid;
        record.module = module;
        record.title = metadata.title;
        record.original_name = original_name;
        record.stored_filename = paths.final_path.filename().string();
        record.file_path = paths.temp_path.generic_string();
        record.target_path = paths.final_path.generic_string();
        record.file_size = *file_size;
        record.content_hash = crypto::hash_utils::hash_to_hex(*content_hash);
        record.mime_type = metadata.field("mime_type", MimeUtils::detect_mime_type(original_name));
        record.description = metadata.description;
        record.owner = owner;
        record.parent_id = metadata.parent_id;
        record.finalize_state = FinalizeState::PENDING_FINALIZE;
        record.created_at = TimeUtils::now();
        record.updated_at = record.created_at;
        
        handler.build_record(record, metadata);
        auto associations = handler.build_associations(record, metadata);
        
        transaction = records_->begin();
        transaction->create_record(record);
        transaction->attach_associations(record.uuid, associations);
        transaction->commit();
        
        record.tags = associations.tags;
        for (const auto& link : associations.links) {
            if (link.link_type == "project") {
                record.project_ids.push_back(link.target_id);
            }
        }
        
        LOG_DEBUG("Record {} written for {}, staged at {}", record.uuid, file_id, record.file_path);
        return record;
        
    } catch (const std::exception& e) {
        LOG_ERROR("Commit of {} to {} failed: {}", file_id, module, e.what());
        
        if (transaction) {
            transaction->rollback();
            transaction.reset();
        }
        
        if (!temp_path.empty() && FileUtils::exists(temp_path)) {
            FileUtils::remove_quietly(temp_path);
        }
        if (FileUtils::exists(assembled_path)) {
            FileUtils::remove_quietly(assembled_path);
        }
        
        if (dynamic_cast<const core::UploadError*>(&e)) {
            throw;
        }
        throw core::TransientIOError("Commit of " + file_id + " failed: " + e.what());
    }
}

PersistedRecord CommitOrchestrator::finalize(PersistedRecord record) {
    auto temp_path = absolute(record.file_path);
    auto final_path = absolute(record.target_path);
    
    try {
        if (FileUtils::exists(temp_path)) {
            std::filesystem::rename(temp_path, final_path);
        } else if (!FileUtils::exists(final_path)) {
            throw core::IntegrityError("Neither staged nor final file exists for record " + record.uuid);
        }
        
        records_->finalize_path(record.uuid, record.target_path);
    } catch (const std::exception& e) {
        LOG_ERROR("Finalize of record {} failed, left pending: {}", record.uuid, e.what());
        throw core::PartialCommitInconsistency(record.uuid,
                                               "Record " + record.uuid + " is pending finalize: " + e.what());
    }
    
    record.file_path = record.target_path;
    record.finalize_state = FinalizeState::FINALIZED;
    record.updated_at = TimeUtils::now();
    return record;
}

PersistedRecord CommitOrchestrator::retry_finalize(const std::string& record_id) {
    auto record = records_->get_record(record_id);
    if (!record) {
        throw core::ResourceNotFound("Record " + record_id + " not found");
    }
    
    if (record->finalize_state == FinalizeState::FINALIZED) {
        return *record;
    }
    
    auto finalized = finalize(std::move(*record));
    LOG_INFO("Record {} finalized at {}", finalized.uuid, finalized.file_path);
    return finalized;
}

ReconcileReport CommitOrchestrator::reconcile() {
    ReconcileReport report;
    
    for (const auto& record : records_->list_pending_finalize()) {
        try {
            retry_finalize(record.uuid);
            ++report.finalized;
        } catch (const core::UploadError& e) {
            ++report.failed;
            LOG_WARN("Record {} still pending: {}", record.uuid, e.what());
        }
    }
    
    if (report.finalized > 0 || report.failed > 0) {
        LOG_INFO("Reconcile finalized {} records, {} still pending", report.finalized, report.failed);
    }
    return report;
}

void CommitOrchestrator::generate_artifacts(const PersistedRecord& record) {
    if (!artifacts_) {
        return;
    }
    
    auto generator = artifacts_;
    auto path = absolute(record.file_path);
    auto task = [generator, record, path]() {
        try {
            generator->generate(record, path);
        } catch (const std::exception& e) {
            LOG_WARN("Artifact generation for {} failed: {}", record.uuid, e.what());
        }
    };
    
    if (pool_) {
        boost::asio::post(*pool_, std::move(task));
    } else {
        task();
    }
}

void CommitOrchestrator::release_session(const std::string& file_id) {
    try {
        chunks_->discard_chunks(file_id);
        sessions_->remove(file_id);
    } catch (const std::exception& e) {
        LOG_WARN("Could not remove session {} after commit: {}", file_id, e.what());
    }
}

std::filesystem::path CommitOrchestrator::absolute(const std::filesystem::path& relative) const {
    return config_.file_storage_directory / relative;
}

} // namespace chunkvault::commit
