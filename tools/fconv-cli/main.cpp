#include <fconv/cli/fconv_cli.h>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <exception>
#include <memory>

int main(int argc, char* argv[]) {
    try {
        // Conservative default; FconvCli::run() raises it for --verbose
        auto logger = std::make_shared<spdlog::logger>(
            "fconv", std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
        spdlog::set_default_logger(logger);
        spdlog::set_level(spdlog::level::warn);
        spdlog::set_pattern("[%H:%M:%S] [%l] %v");

        fconv::cli::FconvCli cli;
        return cli.run(argc, argv);
    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}
