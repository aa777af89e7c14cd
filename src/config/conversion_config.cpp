#include <fconv/config/conversion_config.h>

#include <spdlog/spdlog.h>

#include <cctype>
#include <limits>

namespace fconv::config {

namespace {

using Section = std::map<std::string, std::string>;

const std::string* find_key(const Section& section, const std::string& key) {
    auto it = section.find(key);
    return it == section.end() ? nullptr : &it->second;
}

Error bad_value(const std::string& section, const std::string& key, const std::string& value) {
    return Error{ErrorCode::InvalidArgument,
                 "Invalid value for " + section + "." + key + ": '" + value + "'"};
}

template <typename T>
Result<void> read_unsigned(const Section& s, const std::string& section, const std::string& key,
                           T& out, unsigned long long minValue = 0) {
    const auto* raw = find_key(s, key);
    if (!raw)
        return {};
    // stoull accepts "-1" (wrapping to ULLONG_MAX) and leading blanks
    if (raw->empty() || !std::isdigit(static_cast<unsigned char>(raw->front())))
        return bad_value(section, key, *raw);
    try {
        size_t used = 0;
        auto v = std::stoull(*raw, &used);
        if (used != raw->size() || v < minValue || v > std::numeric_limits<T>::max())
            return bad_value(section, key, *raw);
        out = static_cast<T>(v);
    } catch (const std::exception&) {
        return bad_value(section, key, *raw);
    }
    return {};
}

Result<void> read_ms(const Section& s, const std::string& section, const std::string& key,
                     std::chrono::milliseconds& out) {
    const auto* raw = find_key(s, key);
    if (!raw)
        return {};
    auto ms = parse_ms(*raw);
    if (ms.count() <= 0)
        return bad_value(section, key, *raw);
    out = ms;
    return {};
}

Result<void> read_bool(const Section& s, const std::string& section, const std::string& key,
                       bool& out) {
    const auto* raw = find_key(s, key);
    if (!raw)
        return {};
    auto b = parse_bool(*raw);
    if (!b)
        return bad_value(section, key, *raw);
    out = *b;
    return {};
}

void read_path(const Section& s, const std::string& key, std::filesystem::path& out) {
    if (const auto* raw = find_key(s, key); raw && !raw->empty())
        out = expand_tilde(*raw);
}

void read_string(const Section& s, const std::string& key, std::string& out) {
    if (const auto* raw = find_key(s, key); raw && !raw->empty())
        out = *raw;
}

} // namespace

Result<void> apply_server_section(const TomlSections& sections, ServerSettings& settings) {
    auto it = sections.find("server");
    if (it == sections.end())
        return {};
    const auto& s = it->second;
    const std::string name = "server";

    read_string(s, "host", settings.host);
    if (auto r = read_unsigned(s, name, "port", settings.port); !r)
        return r;
    read_path(s, "cert_path", settings.certPath);
    read_path(s, "key_path", settings.keyPath);
    read_path(s, "output_dir", settings.outputDir);
    if (auto r = read_bool(s, name, "save_outputs", settings.saveOutputs); !r)
        return r;
    if (auto r = read_unsigned(s, name, "worker_threads", settings.workerThreads, 1); !r)
        return r;
    if (auto r = read_unsigned(s, name, "conversion_threads", settings.conversionThreads); !r)
        return r;
    if (auto r = read_unsigned(s, name, "max_connections", settings.maxConnections, 1); !r)
        return r;
    if (auto r = read_ms(s, name, "connection_timeout_ms", settings.connectionTimeout); !r)
        return r;
    if (auto r = read_unsigned(s, name, "max_payload_bytes", settings.maxPayloadBytes, 1); !r)
        return r;
    if (auto r = read_unsigned(s, name, "max_pdf_pages", settings.maxPdfPages, 1); !r)
        return r;

    if (const auto* raw = find_key(s, "pdf_zoom")) {
        try {
            settings.pdfZoom = std::stod(*raw);
        } catch (const std::exception&) {
            return bad_value(name, "pdf_zoom", *raw);
        }
        if (settings.pdfZoom <= 0.0 || settings.pdfZoom > 16.0)
            return bad_value(name, "pdf_zoom", *raw);
    }
    if (const auto* raw = find_key(s, "jpeg_quality")) {
        int q = 0;
        try {
            q = std::stoi(*raw);
        } catch (const std::exception&) {
            return bad_value(name, "jpeg_quality", *raw);
        }
        if (q < 1 || q > 100)
            return bad_value(name, "jpeg_quality", *raw);
        settings.jpegQuality = q;
    }

    read_string(s, "log_level", settings.logLevel);
    read_path(s, "log_file", settings.logFile);
    return {};
}

Result<void> apply_client_section(const TomlSections& sections, ClientSettings& settings) {
    auto it = sections.find("client");
    if (it == sections.end())
        return {};
    const auto& s = it->second;
    const std::string name = "client";

    read_string(s, "host", settings.host);
    if (auto r = read_unsigned(s, name, "port", settings.port); !r)
        return r;
    read_path(s, "cert_path", settings.certPath);
    read_path(s, "output_dir", settings.outputDir);
    if (auto r = read_ms(s, name, "connect_timeout_ms", settings.connectTimeout); !r)
        return r;
    if (auto r = read_ms(s, name, "request_timeout_ms", settings.requestTimeout); !r)
        return r;
    if (auto r = read_unsigned(s, name, "max_payload_bytes", settings.maxPayloadBytes, 1); !r)
        return r;
    if (auto r = read_bool(s, name, "verify_peer", settings.verifyPeer); !r)
        return r;
    return {};
}

Result<void> load_server_settings(const std::filesystem::path& path, ServerSettings& settings) {
    std::error_code ec;
    if (path.empty() || !std::filesystem::exists(path, ec)) {
        spdlog::debug("No config file at '{}', using defaults", path.string());
        return {};
    }
    auto parsed = parse_toml_sections(path);
    if (!parsed)
        return parsed.error();
    return apply_server_section(parsed.value(), settings);
}

Result<void> load_client_settings(const std::filesystem::path& path, ClientSettings& settings) {
    std::error_code ec;
    if (path.empty() || !std::filesystem::exists(path, ec)) {
        spdlog::debug("No config file at '{}', using defaults", path.string());
        return {};
    }
    auto parsed = parse_toml_sections(path);
    if (!parsed)
        return parsed.error();
    return apply_client_section(parsed.value(), settings);
}

} // namespace fconv::config
