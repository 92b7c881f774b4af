#pragma once

#include <ragscope/core/types.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <map>
#include <string>

namespace ragscope::config {

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

// section -> key -> unquoted value. Keys before any header land in section "".
using ConfigSections = std::map<std::string, std::map<std::string, std::string>>;

// Parse TOML-style text: [section] headers, key = value lines, # comments
ConfigSections parse_config_text(const std::string& text);

// Parse a TOML-style config file. A missing file yields NotFound.
Result<ConfigSections> parse_config_file(const std::filesystem::path& config_path);

// Get standard config path
std::filesystem::path get_config_path(const std::string& override_path = "");

/// Returns the user config directory
/// $XDG_CONFIG_HOME/ragscope or ~/.config/ragscope
std::filesystem::path get_config_dir();

/// Returns the user data directory (databases)
/// $XDG_DATA_HOME/ragscope or ~/.local/share/ragscope
std::filesystem::path get_data_dir();

} // namespace ragscope::config
