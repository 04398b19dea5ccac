#pragma once

#include <string>
#include <vector>
#include <chrono>
#include <filesystem>
#include <optional>
#include <cstdint>

namespace chunkvault::core::utils {

class StringUtils {
public:
    static std::vector<std::string> split(const std::string& str, char delimiter);
    static std::string join(const std::vector<std::string>& parts, const std::string& delimiter);
    static std::string trim(const std::string& str);
    static std::string to_lower(const std::string& str);
    static bool starts_with(const std::string& str, const std::string& prefix);
    static bool ends_with(const std::string& str, const std::string& suffix);
    static std::string format_bytes(std::uint64_t bytes);
    
    // Reduces a client-supplied name to a single safe path component.
    // Separators, control characters and reserved characters become '_',
    // leading dots are stripped, and the result is capped at max_length.
    static std::string sanitize_filename(const std::string& name, size_t max_length = 255);
};

class FileUtils {
public:
    static bool exists(const std::filesystem::path& path);
    static std::optional<std::uint64_t> file_size(const std::filesystem::path& path);
    static bool create_directories(const std::filesystem::path& path);
    static std::string get_file_extension(const std::filesystem::path& path);
    
    // Best-effort removal. Never throws; failures are logged and reported
    // through the return value.
    static bool remove_quietly(const std::filesystem::path& path);
    static bool remove_all_quietly(const std::filesystem::path& path);
    
    // Renames src to dst, creating dst's parent. Falls back to copy then
    // delete when the two paths are on different filesystems. Throws
    // TransientIOError once both strategies are exhausted.
    static void move_file(const std::filesystem::path& src, const std::filesystem::path& dst);
    
    // Copy-then-delete half of move_file. Throws TransientIOError if the copy
    // fails; returns false when dst is complete but src could not be removed.
    static bool copy_across_devices(const std::filesystem::path& src, const std::filesystem::path& dst);
};

class TimeUtils {
public:
    static std::chrono::system_clock::time_point now();
    static std::string to_iso_string(const std::chrono::system_clock::time_point& time);
    static std::int64_t to_unix_millis(const std::chrono::system_clock::time_point& time);
    static std::chrono::system_clock::time_point from_unix_millis(std::int64_t millis);
};

class IdUtils {
public:
    // RFC 4122 version 4 identifier, lower-case hex with dashes.
    static std::string generate_uuid();
    
    // Accepts identifiers usable as a single directory name.
    static bool is_safe_identifier(const std::string& id);
};

class MimeUtils {
public:
    static std::string detect_mime_type(const std::filesystem::path& path);
};

}
