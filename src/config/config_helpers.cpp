#include <fconv/config/config_helpers.h>

#include <fstream>

namespace fconv::config {

namespace {

std::string strip_inline_comment(std::string v) {
    // Only strip '#' outside of quotes
    bool inQuotes = false;
    char quote = 0;
    for (size_t i = 0; i < v.size(); ++i) {
        char c = v[i];
        if (inQuotes) {
            if (c == quote)
                inQuotes = false;
        } else if (c == '"' || c == '\'') {
            inQuotes = true;
            quote = c;
        } else if (c == '#') {
            v.erase(i);
            break;
        }
    }
    trim(v);
    return v;
}

} // namespace

Result<TomlSections> parse_toml_sections(const std::filesystem::path& path) {
    TomlSections config;
    std::ifstream file(path);
    if (!file) {
        return Error{ErrorCode::FileNotFound, "Cannot open config file: " + path.string()};
    }

    std::string line;
    std::string currentSection;

    while (std::getline(file, line)) {
        trim(line);

        // Skip comments and empty lines
        if (line.empty() || line[0] == '#')
            continue;

        // Check for section headers
        if (line[0] == '[') {
            size_t end = line.find(']');
            if (end == std::string::npos) {
                return Error{ErrorCode::InvalidArgument,
                             "Unterminated section header in " + path.string() + ": " + line};
            }
            currentSection = line.substr(1, end - 1);
            trim(currentSection);
            continue;
        }

        size_t eq = line.find('=');
        if (eq == std::string::npos)
            continue;

        std::string key = line.substr(0, eq);
        trim(key);
        std::string value = unquote(strip_inline_comment(line.substr(eq + 1)));

        // Dotted keys ("server.port = 1") land in their own section
        auto dot = key.find('.');
        if (currentSection.empty() && dot != std::string::npos) {
            config[key.substr(0, dot)][key.substr(dot + 1)] = value;
        } else {
            config[currentSection][key] = value;
        }
    }

    return config;
}

std::string parse_config_value(const std::filesystem::path& config_path, const std::string& section,
                               const std::string& key) {
    auto parsed = parse_toml_sections(config_path);
    if (!parsed)
        return "";
    const auto& sections = parsed.value();
    auto it = sections.find(section);
    if (it == sections.end())
        return "";
    auto kv = it->second.find(key);
    return kv == it->second.end() ? "" : kv->second;
}

std::filesystem::path get_config_path(const std::string& override_path) {
    if (!override_path.empty()) {
        return expand_tilde(override_path);
    }

    const char* xdgConfigHome = std::getenv("XDG_CONFIG_HOME");
    const char* homeEnv = std::getenv("HOME");

    std::filesystem::path configHome;
    if (xdgConfigHome && *xdgConfigHome) {
        configHome = std::filesystem::path(xdgConfigHome);
    } else if (homeEnv && *homeEnv) {
        configHome = std::filesystem::path(homeEnv) / ".config";
    } else {
        return {};
    }

    return configHome / "fconv" / "config.toml";
}

} // namespace fconv::config
