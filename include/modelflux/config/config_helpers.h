#pragma once

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace modelflux::config {

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
            if (path.size() <= 2)
                return std::filesystem::path(home);
            return std::filesystem::path(home) / path.substr(2);
        }
    }
    return path;
}

// Numeric parsing; nullopt when the value is missing or malformed
std::optional<long long> parse_int(std::string_view s);
std::optional<double> parse_double(std::string_view s);
std::optional<bool> parse_bool(std::string_view s);

inline std::chrono::milliseconds parse_ms(std::string_view s,
                                          std::chrono::milliseconds fallback = {}) {
    auto v = parse_int(s);
    return v ? std::chrono::milliseconds(*v) : fallback;
}

// Parse a value from TOML config file. Accepts "[section] key" and "section.key" forms.
std::string parse_config_value(const std::filesystem::path& config_path, const std::string& section,
                               const std::string& key);

// Get standard config path
std::filesystem::path get_config_path(const std::string& override_path = "");

/// Returns the user config directory
/// $XDG_CONFIG_HOME/modelflux or ~/.config/modelflux
std::filesystem::path get_config_dir();

/// Returns the user data directory (models, downloads registry, RAG database)
/// $XDG_DATA_HOME/modelflux or ~/.local/share/modelflux
std::filesystem::path get_data_dir();

// Config file resolution: MODELFLUX_CONFIG env, then the standard path
std::filesystem::path resolve_config_path();

// Data dir resolution (env → config → defaults)
std::filesystem::path resolve_data_dir_from_config();

} // namespace modelflux::config
