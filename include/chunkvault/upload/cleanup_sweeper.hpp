#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <memory>
#include <string>
#include <thread>
#include <utility>
#include <boost/asio.hpp>
#include "session_store.hpp"
#include "../storage/chunk_store.hpp"
#include "../storage/storage_config.hpp"

namespace chunkvault::upload {

struct SweepReport {
    size_t sessions_removed = 0;
    size_t stray_files_removed = 0;
};

// Removes abandoned uploads. Runs sweep_once() every sweep_interval on a
// dedicated io_context thread once start() is called.
class CleanupSweeper {
public:
    CleanupSweeper(const storage::StorageConfig& config,
                   std::shared_ptr<SessionStore> sessions,
                   std::shared_ptr<storage::ChunkStore> chunks);
    ~CleanupSweeper();
    
    CleanupSweeper(const CleanupSweeper&) = delete;
    CleanupSweeper& operator=(const CleanupSweeper&) = delete;
    
    bool start();
    void stop();
    bool is_running() const { return running_; }
    
    // Sessions idle since before now - session_max_age are purged along with
    // their chunks and assembled file. Temp files older than that with no
    // session are removed too.
    SweepReport sweep_once(std::chrono::system_clock::time_point now);
    
    // Removes one session and everything it left in temp storage.
    // Returns false when the session is unknown.
    bool purge(const std::string& file_id);

private:
    storage::StorageConfig config_;
    std::shared_ptr<SessionStore> sessions_;
    std::shared_ptr<storage::ChunkStore> chunks_;
    
    std::atomic<bool> running_;
    boost::asio::io_context io_context_;
    boost::asio::steady_timer timer_;
    std::thread sweeper_thread_;
    
    void schedule_next();
    size_t remove_stray_files(std::chrono::system_clock::time_point cutoff);
};

} // namespace chunkvault::upload
