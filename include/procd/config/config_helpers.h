#pragma once

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace procd::config {

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
            return path.size() > 1 ? std::filesystem::path(home) / path.substr(2)
                                   : std::filesystem::path(home);
        }
    }
    return path;
}

// Non-empty value of an environment variable
inline std::optional<std::string> env_value(const char* name) {
    if (const char* v = std::getenv(name); v && *v) {
        return std::string(v);
    }
    return std::nullopt;
}

/**
 * @brief Flat parse of a TOML subset into "section.key" → value
 *
 * Handles `[section]` headers, `key = value` pairs, quoted strings and `#` comments outside
 * quotes. Keys before the first header are stored without a prefix. A missing file yields an
 * empty map.
 */
std::map<std::string, std::string> parseSimpleTomlFlat(const std::filesystem::path& path);

// Same grammar, from an in-memory document
std::map<std::string, std::string> parseSimpleTomlFlatString(std::string_view text);

// Get standard config path: override, else $XDG_CONFIG_HOME/procd/config.toml or
// ~/.config/procd/config.toml
std::filesystem::path get_config_path(const std::string& override_path = "");

/// Returns the user config directory
/// $XDG_CONFIG_HOME/procd or ~/.config/procd
std::filesystem::path get_config_dir();

/// Returns the runtime directory (sockets)
/// $XDG_RUNTIME_DIR/procd or /tmp/procd-$UID
std::filesystem::path get_runtime_dir();

} // namespace procd::config
