#include <fconv/config/config_helpers.h>
#include <fconv/config/conversion_config.h>
#include <fconv/server/ConversionDispatcher.h>
#include <fconv/server/ConversionServer.h>
#include <fconv/server/crash_report.h>
#include <fconv/version.hpp>

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <CLI/CLI.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

#include <csignal>
#include <exception>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace {

constexpr const char* kLoggerName = "fconv-server";

bool apply_log_level(const std::string& level) {
    if (level == "trace") {
        spdlog::set_level(spdlog::level::trace);
    } else if (level == "debug") {
        spdlog::set_level(spdlog::level::debug);
    } else if (level == "info") {
        spdlog::set_level(spdlog::level::info);
    } else if (level == "warn") {
        spdlog::set_level(spdlog::level::warn);
    } else if (level == "error") {
        spdlog::set_level(spdlog::level::err);
    } else {
        return false;
    }
    return true;
}

void configure_logging(const fconv::config::ServerSettings& settings) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    if (!settings.logFile.empty()) {
        try {
            std::filesystem::create_directories(settings.logFile.parent_path());
            const size_t max_size = 10 * 1024 * 1024; // 10MB per file
            const size_t max_files = 5;
            sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                settings.logFile.string(), max_size, max_files));
        } catch (const std::exception& e) {
            std::cerr << "Cannot open log file " << settings.logFile << ": " << e.what()
                      << std::endl;
        }
    }
    auto logger = std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(), sinks.end());
    spdlog::set_default_logger(logger);
    spdlog::flush_on(spdlog::level::info);
    if (!apply_log_level(settings.logLevel)) {
        spdlog::set_level(spdlog::level::info);
        spdlog::warn("Unknown log level '{}', using info", settings.logLevel);
    }
}
} // namespace

int main(int argc, char* argv[]) {
    fconv::server::install_crash_reporting(kLoggerName);

    CLI::App app{"fconv conversion server"};
    app.set_version_flag("--version", std::string(fconv::version::string_v));

    std::string configPath;
    std::string host;
    uint16_t port = 0;
    std::filesystem::path certPath;
    std::filesystem::path keyPath;
    std::filesystem::path outputDir;
    bool saveOutputs = false;
    size_t workers = 0;
    size_t conversionThreads = 0;
    size_t maxConnections = 0;
    std::string logLevel;
    std::filesystem::path logFile;

    app.add_option("--config", configPath, "Configuration file path");
    auto* hostOpt = app.add_option("--host", host, "Listen address");
    auto* portOpt = app.add_option("--port", port, "Listen port (0 = ephemeral)");
    auto* certOpt = app.add_option("--cert", certPath, "Certificate chain (PEM)");
    auto* keyOpt = app.add_option("--key", keyPath, "Private key (PEM)");
    auto* outputOpt =
        app.add_option("--output-dir", outputDir, "Directory for saved conversion results");
    auto* saveOpt = app.add_flag("--save-outputs", saveOutputs,
                                 "Also write results to the server's output directory");
    auto* workersOpt = app.add_option("--workers", workers, "Number of I/O threads")
                           ->check(CLI::PositiveNumber);
    auto* convOpt = app.add_option("--conversion-threads", conversionThreads,
                                   "Number of conversion threads (0 = hardware concurrency)");
    auto* maxConnOpt = app.add_option("--max-connections", maxConnections,
                                      "Maximum concurrent connections")
                           ->check(CLI::PositiveNumber);
    auto* levelOpt = app.add_option("--log-level", logLevel,
                                    "Log level (trace/debug/info/warn/error)")
                         ->check(CLI::IsMember({"trace", "debug", "info", "warn", "error"}));
    auto* logFileOpt = app.add_option("--log-file", logFile, "Also log to this rotating file");

    CLI11_PARSE(app, argc, argv);

    // Precedence: built-in defaults < config file < command line
    fconv::config::ServerSettings settings;
    const auto resolvedConfig = fconv::config::get_config_path(configPath);
    if (!resolvedConfig.empty()) {
        if (auto loaded = fconv::config::load_server_settings(resolvedConfig, settings); !loaded) {
            std::cerr << "Configuration error in " << resolvedConfig << ": "
                      << loaded.error().message << std::endl;
            return 1;
        }
    }
    if (hostOpt->count())
        settings.host = host;
    if (portOpt->count())
        settings.port = port;
    if (certOpt->count())
        settings.certPath = certPath;
    if (keyOpt->count())
        settings.keyPath = keyPath;
    if (outputOpt->count())
        settings.outputDir = outputDir;
    if (saveOpt->count())
        settings.saveOutputs = saveOutputs;
    if (workersOpt->count())
        settings.workerThreads = workers;
    if (convOpt->count())
        settings.conversionThreads = conversionThreads;
    if (maxConnOpt->count())
        settings.maxConnections = maxConnections;
    if (levelOpt->count())
        settings.logLevel = logLevel;
    if (logFileOpt->count())
        settings.logFile = logFile;

    configure_logging(settings);
    spdlog::info("fconv-server {} starting", fconv::version::string_v);
    if (!resolvedConfig.empty()) {
        spdlog::debug("Configuration file: {}", resolvedConfig.string());
    }

    try {
        fconv::server::DispatcherOptions dispatcherOptions;
        dispatcherOptions.pdfZoom = static_cast<float>(settings.pdfZoom);
        dispatcherOptions.jpegQuality = settings.jpegQuality;
        dispatcherOptions.maxPdfPages = settings.maxPdfPages;
        fconv::server::ConversionDispatcher dispatcher(dispatcherOptions);

        fconv::server::ConversionServer::Config serverConfig;
        serverConfig.host = settings.host;
        serverConfig.port = settings.port;
        serverConfig.certPath = settings.certPath;
        serverConfig.keyPath = settings.keyPath;
        serverConfig.outputDir = settings.outputDir;
        serverConfig.saveOutputs = settings.saveOutputs;
        serverConfig.workerThreads = settings.workerThreads;
        serverConfig.conversionThreads = settings.conversionThreads;
        serverConfig.maxConnections = settings.maxConnections;
        serverConfig.connectionTimeout = settings.connectionTimeout;
        serverConfig.limits.maxPayloadBytes = settings.maxPayloadBytes;

        fconv::server::ConversionServer server(serverConfig, dispatcher);
        if (auto started = server.start(); !started) {
            spdlog::error("Failed to start server: {}", started.error().message);
            if (started.error().code == fconv::ErrorCode::FileNotFound) {
                spdlog::error("Generate a certificate first: fconv gen-cert");
            }
            return 1;
        }

        // Keep running until SIGINT/SIGTERM
        boost::asio::io_context signalContext;
        boost::asio::signal_set signals(signalContext, SIGINT, SIGTERM);
        signals.async_wait([](const boost::system::error_code& ec, int signo) {
            if (!ec)
                spdlog::info("Received signal {}, shutting down", signo);
        });
        signalContext.run();

        if (auto stopped = server.stop(); !stopped) {
            spdlog::warn("Server stop: {}", stopped.error().message);
        }
        spdlog::shutdown();
        return 0;
    } catch (const std::exception& e) {
        spdlog::error("Server error: {}", e.what());
        return 1;
    }
}
