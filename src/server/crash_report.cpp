#include <fconv/server/crash_report.h>

#include <spdlog/spdlog.h>

#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <memory>
#include <typeinfo>
#include <utility>
#if !defined(_WIN32)
#include <cxxabi.h>
#include <execinfo.h>
#include <unistd.h>
#endif

namespace fconv::server {

namespace {

// Written once before any handler is installed
std::string g_loggerName = "fconv";

#if !defined(_WIN32)
struct FatalSignal {
    int signo;
    const char* name;
};

constexpr FatalSignal kFatalSignals[] = {{SIGSEGV, "SIGSEGV"},
                                         {SIGBUS, "SIGBUS"},
                                         {SIGFPE, "SIGFPE"},
                                         {SIGILL, "SIGILL"},
                                         {SIGABRT, "SIGABRT"}};

const char* fatal_signal_name(int signo) {
    for (const auto& s : kFatalSignals) {
        if (s.signo == signo)
            return s.name;
    }
    return "fatal signal";
}
#endif

void report_crash(const char* what) {
    if (auto logger = spdlog::get(g_loggerName)) {
        logger->critical("{} crashed: {}", g_loggerName, what);
        logger->flush();
    } else {
        std::fprintf(stderr, "%s crashed: %s\n", g_loggerName.c_str(), what);
        std::fflush(stderr);
    }
}

#if !defined(_WIN32)
void on_fatal_signal(int signo) {
    report_crash(fatal_signal_name(signo));

    void* frames[64];
    const int depth = backtrace(frames, 64);
    auto logger = spdlog::get(g_loggerName);
    char** symbols = logger ? backtrace_symbols(frames, depth) : nullptr;
    if (symbols) {
        for (int i = 0; i < depth; ++i)
            logger->critical("  #{} {}", i, symbols[i]);
        logger->flush();
        std::free(symbols);
    } else {
        backtrace_symbols_fd(frames, depth, STDERR_FILENO);
    }

    // SA_RESETHAND restored the default action
    std::raise(signo);
}

std::string uncaught_exception_type() {
    const std::type_info* type = abi::__cxa_current_exception_type();
    if (!type)
        return {};
    int status = 0;
    std::unique_ptr<char, decltype(&std::free)> demangled(
        abi::__cxa_demangle(type->name(), nullptr, nullptr, &status), &std::free);
    return status == 0 && demangled ? std::string(demangled.get()) : std::string(type->name());
}
#endif

} // namespace

void install_crash_reporting(std::string loggerName) {
    g_loggerName = std::move(loggerName);
#if !defined(_WIN32)
    struct sigaction action {};
    action.sa_handler = on_fatal_signal;
    sigemptyset(&action.sa_mask);
    action.sa_flags = SA_RESETHAND;
    for (const auto& s : kFatalSignals)
        sigaction(s.signo, &action, nullptr);

    std::set_terminate([]() noexcept {
        std::string reason = "std::terminate";
        if (const auto type = uncaught_exception_type(); !type.empty())
            reason += " with uncaught " + type;
        report_crash(reason.c_str());
        std::abort();
    });
#endif
}

} // namespace fconv::server
