#include "chunkvault/core/utils.hpp"
#include "chunkvault/core/errors.hpp"
#include "chunkvault/core/logger.hpp"
#include "chunkvault/crypto/random.hpp"
#include <algorithm>
#include <array>
#include <cctype>
#include <cerrno>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <unordered_map>

namespace chunkvault::core::utils {

std::vector<std::string> StringUtils::split(const std::string& str, char delimiter) {
    std::vector<std::string> result;
    std::stringstream ss(str);
    std::string item;
    
    while (std::getline(ss, item, delimiter)) {
        result.push_back(item);
    }
    
    if (result.empty()) {
        result.emplace_back();
    }
    
    return result;
}

std::string StringUtils::join(const std::vector<std::string>& parts, const std::string& delimiter) {
    if (parts.empty()) return "";
    
    std::ostringstream oss;
    oss << parts[0];
    
    for (size_t i = 1; i < parts.size(); ++i) {
        oss << delimiter << parts[i];
    }
    
    return oss.str();
}

std::string StringUtils::trim(const std::string& str) {
    auto start = str.begin();
    while (start != str.end() && std::isspace(static_cast<unsigned char>(*start))) {
        start++;
    }
    
    if (start == str.end()) {
        return {};
    }
    
    auto end = str.end();
    do {
        end--;
    } while (std::distance(start, end) > 0 && std::isspace(static_cast<unsigned char>(*end)));
    
    return std::string(start, end + 1);
}

std::string StringUtils::to_lower(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(), ::tolower);
    return result;
}

bool StringUtils::starts_with(const std::string& str, const std::string& prefix) {
    return str.size() >= prefix.size() && 
           str.compare(0, prefix.size(), prefix) == 0;
}

bool StringUtils::ends_with(const std::string& str, const std::string& suffix) {
    return str.size() >= suffix.size() && 
           str.compare(str.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::string StringUtils::format_bytes(std::uint64_t bytes) {
    const char* units[] = {"B", "KB", "MB", "GB", "TB"};
    int unit = 0;
    double size = static_cast<double>(bytes);
    
    while (size >= 1024.0 && unit < 4) {
        size /= 1024.0;
        unit++;
    }
    
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << size << " " << units[unit];
    return oss.str();
}

std::string StringUtils::sanitize_filename(const std::string& name, size_t max_length) {
    static const std::string reserved = "/\\:*?\"<>|";
    
    std::string result;
    result.reserve(name.size());
    for (char c : name) {
        auto uc = static_cast<unsigned char>(c);
        if (uc < 0x20 || uc == 0x7f || reserved.find(c) != std::string::npos) {
            result.push_back('_');
        } else {
            result.push_back(c);
        }
    }
    
    result = trim(result);
    
    size_t first = result.find_first_not_of('.');
    result = first == std::string::npos ? std::string() : result.substr(first);
    
    if (result.size() > max_length) {
        result.resize(max_length);
    }
    
    return result.empty() ? "file" : result;
}

bool FileUtils::exists(const std::filesystem::path& path) {
    std::error_code ec;
    return std::filesystem::exists(path, ec);
}

std::optional<std::uint64_t> FileUtils::file_size(const std::filesystem::path& path) {
    std::error_code ec;
    auto size = std::filesystem::file_size(path, ec);
    if (ec) return std::nullopt;
    return size;
}

bool FileUtils::create_directories(const std::filesystem::path& path) {
    std::error_code ec;
    std::filesystem::create_directories(path, ec);
    return !ec;
}

std::string FileUtils::get_file_extension(const std::filesystem::path& path) {
    return path.extension().string();
}

bool FileUtils::remove_quietly(const std::filesystem::path& path) {
    std::error_code ec;
    std::filesystem::remove(path, ec);
    if (ec) {
        LOG_WARN("Could not remove {}: {}", path.string(), ec.message());
        return false;
    }
    return true;
}

bool FileUtils::remove_all_quietly(const std::filesystem::path& path) {
    std::error_code ec;
    std::filesystem::remove_all(path, ec);
    if (!ec) {
        return true;
    }
    
    LOG_WARN("Could not remove directory {}: {}, removing entries individually",
             path.string(), ec.message());
    
    // Remove what can be removed; locked entries are left for the sweeper.
    std::filesystem::directory_iterator it(path, ec);
    if (!ec) {
        for (const auto& entry : it) {
            remove_quietly(entry.path());
        }
    }
    return remove_quietly(path);
}

void FileUtils::move_file(const std::filesystem::path& src, const std::filesystem::path& dst) {
    std::error_code ec;
    std::filesystem::create_directories(dst.parent_path(), ec);
    if (ec) {
        throw TransientIOError("Cannot create directory " + dst.parent_path().string() + ": " + ec.message());
    }
    
    std::filesystem::rename(src, dst, ec);
    if (!ec) {
        return;
    }
    
    if (ec.value() != EXDEV) {
        throw TransientIOError("Cannot move " + src.string() + " to " + dst.string() + ": " + ec.message());
    }
    
    LOG_DEBUG("Cross-device move {} -> {}, copying", src.string(), dst.string());
    
    if (!copy_across_devices(src, dst)) {
        LOG_WARN("Moved {} to {} by copy but the source was left behind", src.string(), dst.string());
    }
}

bool FileUtils::copy_across_devices(const std::filesystem::path& src, const std::filesystem::path& dst) {
    std::error_code ec;
    std::filesystem::copy_file(src, dst, std::filesystem::copy_options::overwrite_existing, ec);
    if (ec) {
        remove_quietly(dst);
        throw TransientIOError("Cannot copy " + src.string() + " to " + dst.string() + ": " + ec.message());
    }
    
    return remove_quietly(src);
}

std::chrono::system_clock::time_point TimeUtils::now() {
    return std::chrono::system_clock::now();
}

std::string TimeUtils::to_iso_string(const std::chrono::system_clock::time_point& time) {
    auto time_t = std::chrono::system_clock::to_time_t(time);
    std::tm tm{};
    gmtime_r(&time_t, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

std::int64_t TimeUtils::to_unix_millis(const std::chrono::system_clock::time_point& time) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(time.time_since_epoch()).count();
}

std::chrono::system_clock::time_point TimeUtils::from_unix_millis(std::int64_t millis) {
    return std::chrono::system_clock::time_point(
        std::chrono::duration_cast<std::chrono::system_clock::duration>(std::chrono::milliseconds(millis)));
}

std::string IdUtils::generate_uuid() {
    std::array<std::uint8_t, 16> bytes;
    crypto::SecureRandom::fill(bytes);
    
    bytes[6] = static_cast<std::uint8_t>((bytes[6] & 0x0f) | 0x40);
    bytes[8] = static_cast<std::uint8_t>((bytes[8] & 0x3f) | 0x80);
    
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (size_t i = 0; i < bytes.size(); ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) {
            oss << '-';
        }
        oss << std::setw(2) << static_cast<unsigned>(bytes[i]);
    }
    return oss.str();
}

bool IdUtils::is_safe_identifier(const std::string& id) {
    if (id.empty() || id.size() > 128 || id == "." || id == "..") {
        return false;
    }
    
    return std::all_of(id.begin(), id.end(), [](char c) {
        return std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_' || c == '.';
    });
}

std::string MimeUtils::detect_mime_type(const std::filesystem::path& path) {
    static const std::unordered_map<std::string, std::string> types = {
        {".txt", "text/plain"},
        {".md", "text/markdown"},
        {".csv", "text/csv"},
        {".html", "text/html"},
        {".json", "application/json"},
        {".xml", "application/xml"},
        {".pdf", "application/pdf"},
        {".zip", "application/zip"},
        {".gz", "application/gzip"},
        {".doc", "application/msword"},
        {".docx", "application/vnd.openxmlformats-officedocument.wordprocessingml.document"},
        {".xlsx", "application/vnd.openxmlformats-officedocument.spreadsheetml.sheet"},
        {".pptx", "application/vnd.openxmlformats-officedocument.presentationml.presentation"},
        {".png", "image/png"},
        {".jpg", "image/jpeg"},
        {".jpeg", "image/jpeg"},
        {".gif", "image/gif"},
        {".webp", "image/webp"},
        {".svg", "image/svg+xml"},
        {".mp3", "audio/mpeg"},
        {".wav", "audio/wav"},
        {".ogg", "audio/ogg"},
        {".mp4", "video/mp4"},
        {".webm", "video/webm"},
        {".mov", "video/quicktime"}
    };
    
    auto it = types.find(StringUtils::to_lower(path.extension().string()));
    return it != types.end() ? it->second : "application/octet-stream";
}

}
