#pragma once

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace evistore::config {

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

inline std::string unquote(std::string val) {
    trim(val);
    if (val.size() >= 2 && ((val.front() == '"' && val.back() == '"') ||
                            (val.front() == '\'' && val.back() == '\''))) {
        return val.substr(1, val.size() - 2);
    }
    return val;
}

// "~" and "~/x" are resolved against $HOME; anything else is returned as-is
inline std::filesystem::path expand_tilde(const std::string& path) {
    if (!path.empty() && path[0] == '~' && (path.size() == 1 || path[1] == '/')) {
        if (const char* home = std::getenv("HOME")) {
            if (path.size() <= 2)
                return std::filesystem::path(home);
            return std::filesystem::path(home) / path.substr(2);
        }
    }
    return path;
}

// Non-empty environment variable value, or nullopt
inline std::optional<std::string> env_value(const char* name) {
    if (const char* v = std::getenv(name); v && *v) {
        return std::string(v);
    }
    return std::nullopt;
}

/**
 * Read `key` from `[section]` of a TOML-style config file.
 *
 * Understands section headers, `key = value` lines, `#` comments (whole-line and
 * trailing, outside of quotes) and single or double quoted values. Dotted keys
 * (`section.key = value`) at top level are also accepted. Returns an empty string
 * when the file or key is missing.
 */
std::string parse_config_value(const std::filesystem::path& config_path, const std::string& section,
                               const std::string& key);

/**
 * Resolve the config file location.
 * Order: explicit override, EVISTORE_CONFIG, $XDG_CONFIG_HOME/evistore/config.toml,
 * ~/.config/evistore/config.toml.
 */
std::filesystem::path get_config_path(const std::string& override_path = "");

/// Returns the user data directory: $XDG_DATA_HOME/evistore or ~/.local/share/evistore
std::filesystem::path get_data_dir();

} // namespace evistore::config
