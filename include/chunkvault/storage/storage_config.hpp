#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>

namespace chunkvault::core {
class Config;
}

namespace chunkvault::storage {

struct StorageConfig {
    std::filesystem::path base_directory;
    std::filesystem::path temp_upload_directory;
    std::filesystem::path file_storage_directory;
    std::filesystem::path database_path;
    
    uint64_t max_file_size = 50ULL * 1024 * 1024; // 50MB
    uint64_t max_chunk_size = 8ULL * 1024 * 1024; // 8MB
    uint32_t max_concurrent_assemblies = 3;
    uint32_t io_threads = 4;
    
    std::chrono::hours session_max_age{24};
    std::chrono::seconds sweep_interval{3600};
    
    std::string session_backend = "sqlite";
    
    StorageConfig() = default;
    
    explicit StorageConfig(const std::filesystem::path& base_dir);
    
    static StorageConfig from_config(const core::Config& config);
    
    bool validate() const;
    
    bool create_directories() const;
    
    // temp_uploads/<file_id>
    std::filesystem::path get_chunk_directory(const std::string& file_id) const;
    
    // temp_uploads/<file_id>/chunk_<index>
    std::filesystem::path get_chunk_path(const std::string& file_id, uint32_t chunk_index) const;
    
    // temp_uploads/complete_<file_id>_<filename>
    std::filesystem::path get_assembled_path(const std::string& file_id, const std::string& filename) const;
    
    void set_base_directory(const std::filesystem::path& base_dir);
};

} // namespace chunkvault::storage
