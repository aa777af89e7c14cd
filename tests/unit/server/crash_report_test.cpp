#include <gtest/gtest.h>

#include <fconv/server/crash_report.h>

#include <csignal>
#include <stdexcept>
#include <thread>

namespace fconv::test {

#if !defined(_WIN32)

TEST(CrashReportDeathTest, FatalSignalIsReportedAndKeepsItsExitStatus) {
    EXPECT_EXIT(
        {
            server::install_crash_reporting("crash-test");
            std::raise(SIGSEGV);
        },
        ::testing::KilledBySignal(SIGSEGV), "crash-test crashed: SIGSEGV");
}

TEST(CrashReportDeathTest, UncaughtExceptionNamesItsType) {
    EXPECT_EXIT(
        {
            server::install_crash_reporting("crash-test");
            std::thread worker([] { throw std::runtime_error("boom"); });
            worker.join();
        },
        ::testing::KilledBySignal(SIGABRT), "uncaught std::runtime_error");
}

#endif

} // namespace fconv::test
