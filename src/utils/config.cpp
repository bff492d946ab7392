#include "config.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <stdexcept>

#include "logging.h"

namespace utils {

namespace {

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return (char)std::tolower(c); });
    return s;
}

// Strips one pair of matching surrounding quotes.
std::string unquote(const std::string& v) {
    if (v.size() < 2) return v;
    char q = v.front();
    if ((q == '"' || q == '\'') && v.back() == q) return v.substr(1, v.size() - 2);
    return v;
}

} // namespace

Config::Config(std::string env_prefix) : env_prefix_(upper_(std::move(env_prefix))) {}

std::string Config::trim_(std::string s) {
    auto not_space = [](unsigned char ch) { return !std::isspace(ch); };
    s.erase(s.begin(), std::find_if(s.begin(), s.end(), not_space));
    s.erase(std::find_if(s.rbegin(), s.rend(), not_space).base(), s.end());
    return s;
}

std::string Config::upper_(std::string s) {
    for (char& c : s) c = (char)std::toupper((unsigned char)c);
    return s;
}

std::optional<std::string> Config::getenv_(const std::string& key) const {
    if (const char* v = std::getenv((env_prefix_ + key).c_str())) return std::string(v);
    return std::nullopt;
}

bool Config::load_file(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) return false;

    std::string raw;
    std::size_t line_no = 0;
    while (std::getline(in, raw)) {
        ++line_no;
        std::string line = trim_(raw);
        if (line.empty() || line.front() == '#') continue;

        auto eq = line.find('=');
        std::string key = eq == std::string::npos ? "" : trim_(line.substr(0, eq));
        if (key.empty()) {
            LOG_DEBUG("config: " + path + ":" + std::to_string(line_no) + ": expected KEY=VALUE");
            continue;
        }

        kv_[upper_(key)] = unquote(trim_(line.substr(eq + 1)));
    }
    return true;
}

void Config::set(const std::string& key, const std::string& value) {
    kv_[upper_(key)] = value;
}

bool Config::has(const std::string& key) const {
    return get_string_opt(key).has_value();
}

std::optional<std::string> Config::get_string_opt(const std::string& key) const {
    const std::string k = upper_(key);
    if (auto env = getenv_(k)) return env;

    auto it = kv_.find(k);
    if (it != kv_.end()) return it->second;
    return std::nullopt;
}

std::string Config::get_string(const std::string& key, const std::string& default_value) const {
    return get_string_opt(key).value_or(default_value);
}

int Config::get_int(const std::string& key, int default_value) const {
    auto s = get_string_opt(key);
    if (!s) return default_value;
    try {
        return std::stoi(*s);
    } catch (const std::logic_error&) {
        LOG_WARN("config: " + upper_(key) + "='" + *s + "' is not a number");
        return default_value;
    }
}

std::size_t Config::get_size(const std::string& key, std::size_t default_value) const {
    int v = get_int(key, -1);
    return v < 0 ? default_value : (std::size_t)v;
}

bool Config::get_bool(const std::string& key, bool default_value) const {
    auto s = get_string_opt(key);
    if (!s) return default_value;

    const std::string v = lower(trim_(*s));
    if (v == "1" || v == "true" || v == "yes" || v == "y" || v == "on") return true;
    if (v == "0" || v == "false" || v == "no" || v == "n" || v == "off") return false;

    LOG_WARN("config: " + upper_(key) + "='" + *s + "' is not a boolean");
    return default_value;
}

} // namespace utils
