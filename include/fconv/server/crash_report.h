#pragma once

#include <string>

namespace fconv::server {

/**
 * Report crashes through the named spdlog logger (stderr until it exists).
 *
 * SIGSEGV, SIGBUS, SIGFPE, SIGILL and SIGABRT log the signal and a backtrace,
 * then re-raise with the default action so the exit status and core dump are
 * preserved. std::terminate logs the uncaught exception type and aborts.
 * SIGINT/SIGTERM are left to the caller for graceful shutdown.
 */
void install_crash_reporting(std::string loggerName);

} // namespace fconv::server
