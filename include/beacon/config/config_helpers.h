#pragma once

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <map>
#include <string>
#include <string_view>

namespace beacon::config {

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
    if (path.size() >= 2 && path[0] == '~' && path[1] == '/') {
        if (const char* home = std::getenv("HOME")) {
            return std::filesystem::path(home) / path.substr(2);
        }
    }
    return path;
}

// Parse a single value from a TOML config file; empty when absent
std::string parse_config_value(const std::filesystem::path& config_path, const std::string& section,
                               const std::string& key);

// All key/value pairs of one section (unquoted, inline comments stripped)
std::map<std::string, std::string> parse_config_section(const std::filesystem::path& config_path,
                                                        const std::string& section);

// Get standard config path: override, then BEACON_CONFIG, then XDG location
std::filesystem::path get_config_path(const std::string& override_path = "");

/// Returns the user config directory
/// Unix: $XDG_CONFIG_HOME/beacon or ~/.config/beacon
std::filesystem::path get_config_dir();

} // namespace beacon::config
