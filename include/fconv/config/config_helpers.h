#pragma once

#include <fconv/core/types.h>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <exception>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace fconv::config {

// Section name -> (key -> raw value)
using TomlSections = std::map<std::string, std::map<std::string, std::string>>;

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
            if (path.size() == 1)
                return std::filesystem::path(home);
            return std::filesystem::path(home) / path.substr(2);
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

inline std::optional<bool> parse_bool(std::string v) {
    trim(v);
    std::transform(v.begin(), v.end(), v.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (v == "1" || v == "true" || v == "yes" || v == "on")
        return true;
    if (v == "0" || v == "false" || v == "no" || v == "off")
        return false;
    return std::nullopt;
}

// Parse a flat TOML file into sections. Arrays and inline tables are kept as raw strings.
Result<TomlSections> parse_toml_sections(const std::filesystem::path& path);

// Parse a single value from a TOML config file; empty when absent
std::string parse_config_value(const std::filesystem::path& config_path, const std::string& section,
                               const std::string& key);

// Resolve the config file: explicit override, then $XDG_CONFIG_HOME, then ~/.config
std::filesystem::path get_config_path(const std::string& override_path = "");

} // namespace fconv::config
