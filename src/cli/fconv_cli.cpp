#include <fconv/cli/fconv_cli.h>
#include <fconv/client/conversion_client.h>
#include <fconv/config/config_helpers.h>
#include <fconv/config/conversion_config.h>
#include <fconv/ipc/conversion_protocol.h>
#include <fconv/tls/cert_generator.h>
#include <fconv/version.hpp>

#include <spdlog/spdlog.h>
#include <CLI/CLI.hpp>

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace fconv::cli {

namespace {

void report(const fconv::Error& error) {
    fmt::print(stderr, "Error: {}: {}\n", fconv::errorKindName(error.code), error.message);
}

struct GlobalOptions {
    std::string configPath;
    std::string host;
    uint16_t port = 0;
    std::filesystem::path certPath;
    std::filesystem::path outputDir;
    int64_t timeoutMs = 0;
    bool insecure = false;
    bool verbose = false;

    CLI::Option* hostOpt = nullptr;
    CLI::Option* portOpt = nullptr;
    CLI::Option* certOpt = nullptr;
    CLI::Option* outputOpt = nullptr;
    CLI::Option* timeoutOpt = nullptr;
};

// Precedence: built-in defaults < config file < command line
fconv::Result<fconv::client::ClientConfig> resolve_client_config(const GlobalOptions& g) {
    fconv::config::ClientSettings settings;
    const auto path = fconv::config::get_config_path(g.configPath);
    if (!path.empty()) {
        if (auto loaded = fconv::config::load_client_settings(path, settings); !loaded) {
            return loaded.error();
        }
    }

    fconv::client::ClientConfig config;
    config.host = g.hostOpt->count() ? g.host : settings.host;
    config.port = g.portOpt->count() ? g.port : settings.port;
    config.certPath = g.certOpt->count() ? g.certPath : settings.certPath;
    config.outputDir = g.outputOpt->count() ? g.outputDir : settings.outputDir;
    config.connectTimeout = settings.connectTimeout;
    config.requestTimeout = g.timeoutOpt->count() ? std::chrono::milliseconds(g.timeoutMs)
                                                  : settings.requestTimeout;
    config.maxPayloadBytes = settings.maxPayloadBytes;
    config.verifyPeer = g.insecure ? false : settings.verifyPeer;
    return config;
}

} // namespace

int FconvCli::run(int argc, char* argv[]) {
    CLI::App app{"fconv - convert files through a local conversion server", "fconv"};
    app.set_version_flag("--version", std::string(fconv::version::string_v));
    app.require_subcommand(1);

    GlobalOptions g;
    app.add_option("--config", g.configPath, "Configuration file path");
    g.hostOpt = app.add_option("--host", g.host, "Server host");
    g.portOpt = app.add_option("--port", g.port, "Server port");
    g.certOpt = app.add_option("--cert", g.certPath, "Trusted server certificate (PEM)");
    g.outputOpt = app.add_option("--output-dir", g.outputDir, "Where converted files are stored");
    g.timeoutOpt = app.add_option("--timeout-ms", g.timeoutMs, "Request timeout in milliseconds")
                       ->check(CLI::PositiveNumber);
    app.add_flag("--insecure", g.insecure, "Do not verify the server certificate");
    app.add_flag("-v,--verbose", g.verbose, "Enable debug logging");

    int exitCode = 0;

    // convert
    auto* convertCmd = app.add_subcommand("convert", "Convert a file");
    std::filesystem::path inputPath;
    std::string operationName;
    std::optional<int64_t> width;
    std::optional<int64_t> height;
    convertCmd->add_option("path", inputPath, "File to convert")->required();
    convertCmd
        ->add_option("operation", operationName,
                     "pdf_to_png | png_to_jpg | jpg_to_png | to_grayscale | resize")
        ->required();
    convertCmd->add_option("--width", width, "Target width for resize");
    convertCmd->add_option("--height", height, "Target height for resize");
    convertCmd->callback([&]() {
        auto op = fconv::ipc::parseOperation(operationName);
        if (!op) {
            report(op.error());
            exitCode = 1;
            return;
        }

        fconv::ipc::ParamMap raw;
        if (width)
            raw.emplace_back("width", fconv::ipc::ParamValue{*width});
        if (height)
            raw.emplace_back("height", fconv::ipc::ParamValue{*height});
        auto params = fconv::ipc::makeParams(op.value(), raw);
        if (!params) {
            report(params.error());
            exitCode = 1;
            return;
        }
        if (op.value() != fconv::ipc::Operation::Resize && (width || height)) {
            spdlog::warn("--width/--height only apply to resize; ignoring");
        }

        auto config = resolve_client_config(g);
        if (!config) {
            report(config.error());
            exitCode = 1;
            return;
        }

        fconv::client::ConversionClient client(config.value());
        auto result = client.convert(inputPath, op.value(), params.value());
        if (!result) {
            report(result.error());
            exitCode = 1;
            return;
        }
        for (const auto& path : result.value().outputPaths) {
            fmt::print("{}\n", path.string());
        }
    });

    // status
    auto* statusCmd = app.add_subcommand("status", "Check whether the server is reachable");
    statusCmd->callback([&]() {
        auto config = resolve_client_config(g);
        if (!config) {
            report(config.error());
            exitCode = 1;
            return;
        }
        fconv::client::ConversionClient client(config.value());
        if (client.probe()) {
            fmt::print("Server is running at {}:{}\n", config.value().host, config.value().port);
        } else {
            fmt::print(stderr, "Server is not reachable at {}:{}\n", config.value().host,
                       config.value().port);
            exitCode = 1;
        }
    });

    // gen-cert
    auto* certCmd = app.add_subcommand("gen-cert", "Generate a self-signed TLS certificate");
    fconv::tls::CertificateOptions certOptions;
    certCmd->add_option("--cert-out", certOptions.certPath, "Certificate output path")
        ->default_val(certOptions.certPath.string());
    certCmd->add_option("--key-out", certOptions.keyPath, "Private key output path")
        ->default_val(certOptions.keyPath.string());
    certCmd->add_option("--days", certOptions.days, "Validity in days")
        ->default_val(certOptions.days)
        ->check(CLI::Range(1, 36500));
    certCmd->add_option("--cn", certOptions.commonName, "Common name")
        ->default_val(certOptions.commonName);
    certCmd->add_flag("--force", certOptions.overwrite, "Overwrite existing files");
    certCmd->callback([&]() {
        if (auto r = fconv::tls::generate_self_signed(certOptions); !r) {
            report(r.error());
            exitCode = 1;
            return;
        }
        fmt::print("Certificate: {}\nPrivate key: {}\n", certOptions.certPath.string(),
                   certOptions.keyPath.string());
    });

    app.parse_complete_callback([&]() {
        if (g.verbose)
            spdlog::set_level(spdlog::level::debug);
    });

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        // Collapse CLI11's own exit codes; --help and --version stay 0
        const int rc = app.exit(e);
        return rc == 0 ? 0 : 1;
    }
    return exitCode;
}

} // namespace fconv::cli
