#include "chunkvault/core/config.hpp"
#include "chunkvault/core/errors.hpp"
#include "chunkvault/core/utils.hpp"
#include <charconv>
#include <fstream>
#include <limits>
#include <utility>

namespace chunkvault::core {

namespace {

const std::pair<const char*, const char*> kDefaults[] = {
    {"storage.base_dir", "./chunkvault_data"},
    {"upload.max_file_size", "52428800"},
    {"upload.max_chunk_size", "8388608"},
    {"upload.max_concurrent_assemblies", "3"},
    {"upload.session_max_age_hours", "24"},
    {"upload.sweep_interval_seconds", "3600"},
    {"upload.io_threads", "4"},
    {"upload.session_backend", "sqlite"},
    {"log.level", "info"},
    {"log.file", "chunkvault.log"},
};

}

Config& Config::instance() {
    static Config instance;
    return instance;
}

void Config::load_from_file(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw TransientIOError("Cannot open configuration " + path.string());
    }

    std::string line;
    size_t line_number = 0;
    while (std::getline(file, line)) {
        ++line_number;
        line = utils::StringUtils::trim(line);
        if (line.empty() || line[0] == '#') {
            continue;
        }

        auto eq_pos = line.find('=');
        auto key = eq_pos == std::string::npos ? std::string() : utils::StringUtils::trim(line.substr(0, eq_pos));
        if (key.empty()) {
            throw ValidationError(path.string() + ":" + std::to_string(line_number) +
                                  ": expected key=value, got '" + line + "'");
        }

        values_[key] = utils::StringUtils::trim(line.substr(eq_pos + 1));
    }
}

void Config::set(const std::string& key, const std::string& value) {
    values_[key] = value;
}

std::optional<std::string> Config::get(const std::string& key) const {
    auto it = values_.find(key);
    if (it != values_.end()) {
        return it->second;
    }
    return std::nullopt;
}

std::string Config::get_string(const std::string& key, const std::string& default_value) const {
    auto value = get(key);
    return value ? *value : default_value;
}

std::uint64_t Config::get_uint64(const std::string& key, std::uint64_t default_value) const {
    auto value = get(key);
    if (!value) return default_value;

    std::uint64_t result = 0;
    const auto* first = value->data();
    const auto* last = first + value->size();
    auto [ptr, ec] = std::from_chars(first, last, result);
    if (value->empty() || ec != std::errc() || ptr != last) {
        throw ValidationError("Setting " + key + " must be a non-negative integer, got '" + *value + "'");
    }
    return result;
}

std::uint32_t Config::get_uint32(const std::string& key, std::uint32_t default_value) const {
    auto result = get_uint64(key, default_value);
    if (result > std::numeric_limits<std::uint32_t>::max()) {
        throw ValidationError("Setting " + key + " is out of range: " + std::to_string(result));
    }
    return static_cast<std::uint32_t>(result);
}

std::vector<std::string> Config::unknown_keys() const {
    std::vector<std::string> unknown;
    for (const auto& [key, value] : values_) {
        bool known = false;
        for (const auto& [default_key, default_value] : kDefaults) {
            if (key == default_key) {
                known = true;
                break;
            }
        }
        if (!known) {
            unknown.push_back(key);
        }
    }
    return unknown;
}

void Config::set_defaults() {
    for (const auto& [key, value] : kDefaults) {
        values_[key] = value;
    }
}

}
