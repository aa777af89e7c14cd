#include <gtest/gtest.h>

#include <common/test_certs.h>
#include <fconv/server/ConversionDispatcher.h>
#include <fconv/server/ConversionServer.h>
#include <support/temp_dir_scope.hpp>

#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>

#include <chrono>
#include <string_view>

namespace fconv::test {

using server::ConversionDispatcher;
using server::ConversionServer;
using test_support::TempDirScope;

namespace {

template <typename ResultLike> bool isPermissionDenied(const ResultLike& result) {
    if (result) {
        return false;
    }
    const std::string_view message{result.error().message};
    return message.find("Operation not permitted") != std::string_view::npos ||
           message.find("Permission denied") != std::string_view::npos;
}

bool canConnect(uint16_t port) {
    boost::asio::io_context io;
    boost::asio::ip::tcp::socket socket(io);
    boost::system::error_code ec;
    socket.connect({boost::asio::ip::make_address("127.0.0.1"), port}, ec);
    return !ec;
}

} // namespace

class ConversionServerLifecycleTest : public ::testing::Test {
protected:
    void SetUp() override { cert_ = makeTestCertificate(dir_); }

    ConversionServer::Config config() const {
        ConversionServer::Config cfg;
        cfg.host = "127.0.0.1";
        cfg.port = 0;
        cfg.certPath = cert_.cert;
        cfg.keyPath = cert_.key;
        cfg.workerThreads = 1;
        cfg.conversionThreads = 1;
        cfg.connectionTimeout = std::chrono::milliseconds(1500);
        cfg.drainTimeout = std::chrono::milliseconds(1000);
        return cfg;
    }

    TempDirScope dir_ = TempDirScope::unique_under("fconv-server-lifecycle");
    TestCertificate cert_;
    ConversionDispatcher dispatcher_;
};

TEST_F(ConversionServerLifecycleTest, StartBindsEphemeralPortAndSignalsReady) {
    ConversionServer server(config(), dispatcher_);
    EXPECT_FALSE(server.isRunning());
    EXPECT_FALSE(server.waitUntilReady(std::chrono::milliseconds(10)));

    auto started = server.start();
    if (isPermissionDenied(started)) {
        GTEST_SKIP() << "Skipping: TCP listeners are not permitted: " << started.error().message;
    }
    ASSERT_TRUE(started) << started.error().message;
    EXPECT_TRUE(server.isRunning());
    EXPECT_TRUE(server.waitUntilReady(std::chrono::seconds(2)));
    ASSERT_NE(server.port(), 0);
    EXPECT_TRUE(canConnect(server.port()));

    ASSERT_TRUE(server.stop());
    EXPECT_FALSE(server.isRunning());
    EXPECT_EQ(server.port(), 0);
}

TEST_F(ConversionServerLifecycleTest, RestartAfterStop) {
    ConversionServer server(config(), dispatcher_);

    auto first = server.start();
    if (isPermissionDenied(first)) {
        GTEST_SKIP() << "Skipping: TCP listeners are not permitted: " << first.error().message;
    }
    ASSERT_TRUE(first) << first.error().message;
    ASSERT_TRUE(server.stop());

    auto second = server.start();
    ASSERT_TRUE(second) << second.error().message;
    EXPECT_TRUE(server.waitUntilReady(std::chrono::seconds(2)));
    EXPECT_TRUE(canConnect(server.port()));
    EXPECT_TRUE(server.stop());
}

TEST_F(ConversionServerLifecycleTest, DoubleStartIsInvalidState) {
    ConversionServer server(config(), dispatcher_);
    auto first = server.start();
    if (isPermissionDenied(first)) {
        GTEST_SKIP() << "Skipping: TCP listeners are not permitted: " << first.error().message;
    }
    ASSERT_TRUE(first);

    auto second = server.start();
    ASSERT_FALSE(second);
    EXPECT_EQ(second.error().code, ErrorCode::InvalidState);
    EXPECT_TRUE(server.stop());
}

TEST_F(ConversionServerLifecycleTest, StopWithoutStartIsInvalidState) {
    ConversionServer server(config(), dispatcher_);
    auto stopped = server.stop();
    ASSERT_FALSE(stopped);
    EXPECT_EQ(stopped.error().code, ErrorCode::InvalidState);
}

TEST_F(ConversionServerLifecycleTest, MissingCertificateFailsStart) {
    auto cfg = config();
    cfg.certPath = dir_.path() / "absent.pem";
    ConversionServer server(cfg, dispatcher_);

    auto started = server.start();
    ASSERT_FALSE(started);
    EXPECT_EQ(started.error().code, ErrorCode::FileNotFound);
    EXPECT_FALSE(server.isRunning());
}

TEST_F(ConversionServerLifecycleTest, PortInUseIsIOError) {
    ConversionServer first(config(), dispatcher_);
    auto a = first.start();
    if (isPermissionDenied(a)) {
        GTEST_SKIP() << "Skipping: TCP listeners are not permitted: " << a.error().message;
    }
    ASSERT_TRUE(a);

    auto cfg = config();
    cfg.port = first.port();
    ConversionServer second(cfg, dispatcher_);
    auto b = second.start();
    ASSERT_FALSE(b);
    EXPECT_EQ(b.error().code, ErrorCode::IOError);
    EXPECT_FALSE(second.isRunning());

    EXPECT_TRUE(first.stop());
}

TEST_F(ConversionServerLifecycleTest, StopClosesIdleConnections) {
    ConversionServer server(config(), dispatcher_);
    auto started = server.start();
    if (isPermissionDenied(started)) {
        GTEST_SKIP() << "Skipping: TCP listeners are not permitted: " << started.error().message;
    }
    ASSERT_TRUE(started);

    // A connection that never handshakes must not keep stop() waiting
    boost::asio::io_context io;
    boost::asio::ip::tcp::socket idle(io);
    boost::system::error_code ec;
    idle.connect({boost::asio::ip::make_address("127.0.0.1"), server.port()}, ec);
    ASSERT_FALSE(ec) << ec.message();

    const auto before = std::chrono::steady_clock::now();
    EXPECT_TRUE(server.stop());
    EXPECT_LT(std::chrono::steady_clock::now() - before, std::chrono::seconds(5));
}

} // namespace fconv::test
