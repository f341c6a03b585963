#pragma once

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace prompter::config {

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

// Milliseconds, nullopt when the text is not a non-negative integer
inline std::optional<std::chrono::milliseconds> parse_ms(std::string_view s) {
    try {
        size_t idx = 0;
        std::string str(s);
        long long v = std::stoll(str, &idx);
        if (idx != str.size() || v < 0) {
            return std::nullopt;
        }
        return std::chrono::milliseconds(v);
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

// Positive count, nullopt otherwise
inline std::optional<size_t> parse_count(std::string_view s) {
    try {
        size_t idx = 0;
        std::string str(s);
        long long v = std::stoll(str, &idx);
        if (idx != str.size() || v <= 0) {
            return std::nullopt;
        }
        return static_cast<size_t>(v);
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

// Parse a value from TOML config file
std::string parse_config_value(const std::filesystem::path& config_path, const std::string& section,
                               const std::string& key);

// Config file location: PROMPTER_CONFIG, then $XDG_CONFIG_HOME/prompter/config.toml,
// then ~/.config/prompter/config.toml
std::filesystem::path get_config_path(const std::string& override_path = "");

/// Returns the user state directory
/// $XDG_STATE_HOME/prompter or ~/.local/state/prompter
std::filesystem::path get_state_dir();

// Session directory resolution (env → config → defaults)
std::filesystem::path resolve_sessions_dir_from_config();

} // namespace prompter::config
