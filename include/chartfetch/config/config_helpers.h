#pragma once

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace chartfetch::config {

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
    } catch (...) {
        return std::chrono::milliseconds(0);
    }
}

// Numeric parsing; nullopt when the text is empty or not fully numeric
std::optional<std::uint64_t> parse_u64(std::string_view s);
std::optional<double> parse_double(std::string_view s);

// Parse a value from TOML config file
std::string parse_config_value(const std::filesystem::path& config_path, const std::string& section,
                               const std::string& key);

// Get standard config path
// $CHARTFETCH_CONFIG, else $XDG_CONFIG_HOME/chartfetch/config.toml or ~/.config/chartfetch/config.toml
std::filesystem::path get_config_path(const std::string& override_path = "");

/// Returns the user data directory (charts, integrity store, resume state)
/// $XDG_DATA_HOME/chartfetch or ~/.local/share/chartfetch
std::filesystem::path get_data_dir();

/// Applies a textual log level (trace, debug, info, warn, error, off) to spdlog.
/// Returns false and leaves the level unchanged when the name is not recognised.
bool apply_log_level(std::string_view level);

} // namespace chartfetch::config
