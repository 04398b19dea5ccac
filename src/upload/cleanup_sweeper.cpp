#include "chunkvault/upload/cleanup_sweeper.hpp"
#include "chunkvault/core/logger.hpp"
#include "chunkvault/core/utils.hpp"
#include <set>

namespace chunkvault::upload {

using core::utils::FileUtils;
using core::utils::StringUtils;

CleanupSweeper::CleanupSweeper(const storage::StorageConfig& config,
                               std::shared_ptr<SessionStore> sessions,
                               std::shared_ptr<storage::ChunkStore> chunks)
    : config_(config)
    , sessions_(std::move(sessions))
    , chunks_(std::move(chunks))
    , running_(false)
    , io_context_()
    , timer_(io_context_) {
}

CleanupSweeper::~CleanupSweeper() {
    stop();
}

bool CleanupSweeper::start() {
    if (running_) {
        LOG_WARN("Cleanup sweeper already running");
        return false;
    }
    
    running_ = true;
    io_context_.restart();
    schedule_next();
    
    sweeper_thread_ = std::thread([this]() {
        LOG_INFO("Cleanup sweeper started, interval {}s, max age {}h",
                 config_.sweep_interval.count(), config_.session_max_age.count());
        
        while (running_) {
            try {
                io_context_.run();
                break;
            } catch (const std::exception& e) {
                LOG_ERROR("Cleanup sweeper error: {}", e.what());
                if (!running_) break;
                
                io_context_.restart();
                schedule_next();
            }
        }
        
        LOG_INFO("Cleanup sweeper stopped");
    });
    
    return true;
}

void CleanupSweeper::stop() {
    if (!running_) {
        return;
    }
    
    running_ = false;
    io_context_.stop();
    
    if (sweeper_thread_.joinable()) {
        sweeper_thread_.join();
    }
}

void CleanupSweeper::schedule_next() {
    timer_.expires_after(config_.sweep_interval);
    timer_.async_wait([this](const boost::system::error_code& ec) {
        if (ec || !running_) {
            return;
        }
        
        auto report = sweep_once(std::chrono::system_clock::now());
        if (report.sessions_removed > 0 || report.stray_files_removed > 0) {
            LOG_INFO("Sweep removed {} sessions and {} stray files",
                     report.sessions_removed, report.stray_files_removed);
        }
        
        schedule_next();
    });
}

SweepReport CleanupSweeper::sweep_once(std::chrono::system_clock::time_point now) {
    SweepReport report;
    auto cutoff = now - config_.session_max_age;
    
    for (const auto& file_id : sessions_->scan_expired(cutoff)) {
        try {
            if (purge(file_id)) {
                ++report.sessions_removed;
                LOG_DEBUG("Expired upload {} removed", file_id);
            }
        } catch (const std::exception& e) {
            LOG_WARN("Failed to remove expired upload {}: {}", file_id, e.what());
        }
    }
    
    report.stray_files_removed = remove_stray_files(cutoff);
    return report;
}

bool CleanupSweeper::purge(const std::string& file_id) {
    auto file_lock = chunks_->lock_for(file_id);
    bool removed = false;
    
    {
        std::lock_guard<std::mutex> guard(*file_lock);
        
        auto session = sessions_->get(file_id);
        if (session) {
            chunks_->discard_chunks(file_id);
            
            auto assembled = config_.get_assembled_path(file_id, session->filename);
            if (FileUtils::exists(assembled)) {
                FileUtils::remove_quietly(assembled);
            }
            
            removed = sessions_->remove(file_id);
        }
    }
    
    file_lock.reset();
    chunks_->release(file_id);
    return removed;
}

size_t CleanupSweeper::remove_stray_files(std::chrono::system_clock::time_point cutoff) {
    std::error_code ec;
    if (!std::filesystem::is_directory(config_.temp_upload_directory, ec)) {
        return 0;
    }
    
    std::set<std::filesystem::path> live;
    for (const auto& session : sessions_->list()) {
        live.insert(config_.get_chunk_directory(session.file_id));
        live.insert(config_.get_assembled_path(session.file_id, session.filename));
    }
    
    // Express the cutoff on the filesystem clock.
    auto file_cutoff = std::filesystem::file_time_type::clock::now() -
        std::chrono::duration_cast<std::filesystem::file_time_type::duration>(std::chrono::system_clock::now() - cutoff);
    
    size_t removed = 0;
    for (std::filesystem::directory_iterator it(config_.temp_upload_directory, ec), end; !ec && it != end;
         it.increment(ec)) {
        const auto& path = it->path();
        if (live.count(path) > 0) {
            continue;
        }
        
        bool assembled = it->is_regular_file(ec) && StringUtils::starts_with(path.filename().string(), "complete_");
        bool chunk_dir = it->is_directory(ec);
        if (!assembled && !chunk_dir) {
            continue;
        }
        
        auto modified = it->last_write_time(ec);
        if (ec || modified >= file_cutoff) {
            ec.clear();
            continue;
        }
        
        bool ok = assembled ? FileUtils::remove_quietly(path) : FileUtils::remove_all_quietly(path);
        if (ok) {
            ++removed;
            LOG_DEBUG("Removed stray upload leftover {}", path.filename().string());
        }
    }
    
    if (ec) {
        LOG_WARN("Could not scan {}: {}", config_.temp_upload_directory.string(), ec.message());
    }
    
    return removed;
}

} // namespace chunkvault::upload
