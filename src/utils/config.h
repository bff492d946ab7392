#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>

namespace utils {

// Settings read from a sift.env style file, one KEY=VALUE per line.
// Blank lines and '#' lines are skipped, one pair of surrounding quotes is
// stripped, keys are case-insensitive. A variable named <prefix><KEY> in the
// environment wins over the file.
class Config {
public:
    explicit Config(std::string env_prefix = "");

    // false when the file cannot be opened; nothing is loaded then.
    bool load_file(const std::string& path);

    void set(const std::string& key, const std::string& value);
    bool has(const std::string& key) const;

    std::optional<std::string> get_string_opt(const std::string& key) const;
    std::string get_string(const std::string& key, const std::string& default_value = "") const;

    // Malformed values log a warning and yield the default.
    int get_int(const std::string& key, int default_value) const;
    std::size_t get_size(const std::string& key, std::size_t default_value) const;
    bool get_bool(const std::string& key, bool default_value) const;

private:
    std::string env_prefix_;
    std::unordered_map<std::string, std::string> kv_;

    static std::string trim_(std::string s);
    static std::string upper_(std::string s);
    std::optional<std::string> getenv_(const std::string& key) const;
};

} // namespace utils
