#include "chunkvault/storage/storage_config.hpp"
#include "chunkvault/core/config.hpp"
#include "chunkvault/core/utils.hpp"

namespace chunkvault::storage {

StorageConfig::StorageConfig(const std::filesystem::path& base_dir) {
    set_base_directory(base_dir);
}

StorageConfig StorageConfig::from_config(const core::Config& config) {
    StorageConfig result(std::filesystem::absolute(config.get_string("storage.base_dir", "./chunkvault_data")));
    
    result.max_file_size = config.get_uint64("upload.max_file_size", result.max_file_size);
    result.max_chunk_size = config.get_uint64("upload.max_chunk_size", result.max_chunk_size);
    result.max_concurrent_assemblies =
        config.get_uint32("upload.max_concurrent_assemblies", result.max_concurrent_assemblies);
    result.io_threads = config.get_uint32("upload.io_threads", result.io_threads);
    result.session_max_age = std::chrono::hours(
        config.get_uint32("upload.session_max_age_hours", static_cast<std::uint32_t>(result.session_max_age.count())));
    result.sweep_interval = std::chrono::seconds(
        config.get_uint32("upload.sweep_interval_seconds", static_cast<std::uint32_t>(result.sweep_interval.count())));
    result.session_backend = config.get_string("upload.session_backend", result.session_backend);
    
    return result;
}

bool StorageConfig::validate() const {
    // Check if paths are valid
    if (temp_upload_directory.empty() || file_storage_directory.empty() || database_path.empty()) {
        return false;
    }
    
    // Check if paths are absolute
    if (!temp_upload_directory.is_absolute() || 
        !file_storage_directory.is_absolute() || 
        !database_path.is_absolute()) {
        return false;
    }
    
    if (max_file_size == 0 || max_chunk_size == 0) {
        return false;
    }
    
    if (max_concurrent_assemblies == 0 || max_concurrent_assemblies > 64) {
        return false;
    }
    
    if (io_threads == 0 || io_threads > 256) {
        return false;
    }
    
    if (session_max_age.count() <= 0 || sweep_interval.count() <= 0) {
        return false;
    }
    
    return session_backend == "memory" || session_backend == "sqlite";
}

bool StorageConfig::create_directories() const {
    try {
        std::filesystem::create_directories(temp_upload_directory);
        std::filesystem::create_directories(file_storage_directory);
        
        // Create database directory
        auto db_dir = database_path.parent_path();
        if (!db_dir.empty()) {
            std::filesystem::create_directories(db_dir);
        }
        
        return true;
    } catch (const std::filesystem::filesystem_error&) {
        return false;
    }
}

std::filesystem::path StorageConfig::get_chunk_directory(const std::string& file_id) const {
    return temp_upload_directory / file_id;
}

std::filesystem::path StorageConfig::get_chunk_path(const std::string& file_id, uint32_t chunk_index) const {
    return get_chunk_directory(file_id) / ("chunk_" + std::to_string(chunk_index));
}

std::filesystem::path StorageConfig::get_assembled_path(const std::string& file_id,
                                                        const std::string& filename) const {
    return temp_upload_directory /
        ("complete_" + file_id + "_" + core::utils::StringUtils::sanitize_filename(filename));
}

void StorageConfig::set_base_directory(const std::filesystem::path& base_dir) {
    base_directory = base_dir;
    temp_upload_directory = base_dir / "temp_uploads";
    file_storage_directory = base_dir / "storage";
    database_path = base_dir / "chunkvault.db";
}

} // namespace chunkvault::storage
