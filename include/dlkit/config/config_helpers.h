#pragma once

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace dlkit::config {

// String trimming utilities
inline void ltrim(std::string& s) {
    s.erase(s.begin(),
            std::find_if(s.begin(), s.end(), [](unsigned char ch) { return !std::isspace(ch); }));
}

inline void rtrim(std::string& s) {
    s.erase(std::find_if(s.rbegin(), s.rend(), [](unsigned char ch) { return !std::isspace(ch); })
                .base(),
            s.end());
}

inline void trim(std::string& s) {
    ltrim(s);
    rtrim(s);
}

// Quote handling
inline std::string unquote(std::string val) {
    trim(val);
    if (val.size() >= 2 && ((val.front() == '"' && val.back() == '"') ||
                            (val.front() == '\'' && val.back() == '\''))) {
        return val.substr(1, val.size() - 2);
    }
    return val;
}

// Tilde expansion
inline std::filesystem::path expand_tilde(const std::string& path) {
    if (!path.empty() && path[0] == '~') {
        const char* home = std::getenv("HOME");
        if (home) {
            return std::filesystem::path(home) / path.substr(path.size() > 1 ? 2 : 1);
        }
    }
    return path;
}

// Time parsing
inline std::chrono::milliseconds parse_ms(std::string_view s) {
    try {
        return std::chrono::milliseconds(std::stol(std::string(s)));
    } catch (const std::exception&) {
        return std::chrono::milliseconds(0);
    }
}

// Parse a value from TOML config file. Accepts both "[section] key = v" and
// "section.key = v". Returns an empty string when absent.
std::string parse_config_value(const std::filesystem::path& config_path, const std::string& section,
                               const std::string& key);

// Get standard config path: override, $DLKIT_CONFIG, $XDG_CONFIG_HOME/dlkit/config.toml,
// ~/.config/dlkit/config.toml
std::filesystem::path get_config_path(const std::string& override_path = "");

// Environment first, then config.toml [section] key. Empty when neither is set.
std::string resolve_value(const char* env_name, const std::string& section,
                          const std::string& key);

std::optional<long long> parse_integer(std::string_view s);
std::optional<bool> parse_bool(std::string_view s);

// Sets the global spdlog level ("trace", "debug", "info", "warn", "error", "critical", "off").
// Unknown names leave the level unchanged and return false.
bool apply_log_level(std::string_view level);

} // namespace dlkit::config
