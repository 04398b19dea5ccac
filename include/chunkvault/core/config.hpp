#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace chunkvault::core {

// Flat key=value settings read by StorageConfig::from_config and main().
class Config {
public:
    Config() = default;

    static Config& instance();

    // Lines are key=value; blank lines and lines starting with '#' are
    // skipped. Throws TransientIOError when the file cannot be opened and
    // ValidationError, naming the line number, for a malformed line.
    void load_from_file(const std::filesystem::path& path);

    void set(const std::string& key, const std::string& value);
    std::optional<std::string> get(const std::string& key) const;

    std::string get_string(const std::string& key, const std::string& default_value = "") const;

    // Return default_value when the key is absent. A value that is not a
    // plain non-negative integer in range throws ValidationError.
    std::uint64_t get_uint64(const std::string& key, std::uint64_t default_value = 0) const;
    std::uint32_t get_uint32(const std::string& key, std::uint32_t default_value = 0) const;

    // Keys set that set_defaults() does not know about, usually typos.
    std::vector<std::string> unknown_keys() const;

    void set_defaults();
    void clear() { values_.clear(); }

private:
    std::map<std::string, std::string> values_;
};

}
