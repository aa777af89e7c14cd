#pragma once

#include <fconv/config/config_helpers.h>
#include <fconv/core/types.h>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>

namespace fconv::config {

// Values read from the [server] section. Defaults match the original deployment:
// certificate material and outputs live next to the working directory.
struct ServerSettings {
    std::string host = "127.0.0.1";
    uint16_t port = DEFAULT_PORT;
    std::filesystem::path certPath = "cert.pem";
    std::filesystem::path keyPath = "key.pem";
    std::filesystem::path outputDir = "converted_files";
    bool saveOutputs = false;
    size_t workerThreads = 2;
    size_t conversionThreads = 0; // 0 = hardware concurrency
    size_t maxConnections = 16;
    std::chrono::milliseconds connectionTimeout{60000};
    size_t maxPayloadBytes = DEFAULT_MAX_PAYLOAD_SIZE;
    double pdfZoom = 3.0;
    int jpegQuality = 90;
    size_t maxPdfPages = 500;
    std::string logLevel = "info";
    std::filesystem::path logFile;
};

// Values read from the [client] section
struct ClientSettings {
    std::string host = "localhost";
    uint16_t port = DEFAULT_PORT;
    std::filesystem::path certPath = "cert.pem";
    std::filesystem::path outputDir = "converted_files";
    std::chrono::milliseconds connectTimeout{5000};
    std::chrono::milliseconds requestTimeout{60000};
    size_t maxPayloadBytes = DEFAULT_MAX_PAYLOAD_SIZE;
    bool verifyPeer = true;
};

// Apply the [server] section of a parsed config on top of the given settings.
// Keys that are absent leave the current value untouched; malformed values are errors.
Result<void> apply_server_section(const TomlSections& sections, ServerSettings& settings);
Result<void> apply_client_section(const TomlSections& sections, ClientSettings& settings);

// Convenience: parse the file if it exists and apply its section. A missing file is not an error.
Result<void> load_server_settings(const std::filesystem::path& path, ServerSettings& settings);
Result<void> load_client_settings(const std::filesystem::path& path, ClientSettings& settings);

} // namespace fconv::config
