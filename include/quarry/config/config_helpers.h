#pragma once

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace quarry::config {

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

inline std::filesystem::path expand_tilde(const std::string& path) {
    if (!path.empty() && path[0] == '~') {
        if (const char* home = std::getenv("HOME")) {
            if (path.size() == 1) {
                return std::filesystem::path(home);
            }
            return std::filesystem::path(home) / path.substr(2);
        }
    }
    return path;
}

// Non-empty, trimmed value of an environment variable
inline std::optional<std::string> env_value(const char* name) {
    const char* raw = std::getenv(name);
    if (!raw) {
        return std::nullopt;
    }
    std::string value(raw);
    trim(value);
    if (value.empty()) {
        return std::nullopt;
    }
    return value;
}

// "1", "true", "yes", "on" (any case) are true; "0", "false", "no", "off" are false
std::optional<bool> parse_bool(std::string_view raw);

/// Returns the user config directory: $XDG_CONFIG_HOME/quarry or ~/.config/quarry
std::filesystem::path get_config_dir();

/// Config file resolution: explicit override, then QUARRY_CONFIG, then
/// <config dir>/quarry.json
std::filesystem::path get_config_path(const std::string& override_path = "");

/// Cache directory: QUARRY_CACHE_DIR, then $XDG_CACHE_HOME/quarry, then ~/.cache/quarry
std::filesystem::path get_cache_dir();

} // namespace quarry::config
