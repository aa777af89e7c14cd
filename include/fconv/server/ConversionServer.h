#pragma once

#include <fconv/core/types.h>
#include <fconv/ipc/message_framing.h>
#include <fconv/server/OutputStore.h>
#include <fconv/tls/tls_context.h>

#include <utility> // boost 1.74 awaitable.hpp uses std::exchange without it

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/stream.hpp>
#include <boost/asio/strand.hpp>
#include <boost/asio/thread_pool.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <semaphore>
#include <string>
#include <thread>
#include <vector>

namespace fconv::server {

class ConversionDispatcher;

/**
 * TLS conversion listener built on Boost.ASIO coroutines.
 *
 * Each accepted connection runs in its own coroutine on its own strand and
 * carries exactly one request/response exchange. Conversions run on a
 * separate thread pool so slow PDFs never stall the I/O threads.
 *
 * Lifecycle is explicit: start() binds and returns once the listener is
 * accepting, stop() closes the listener and every live connection, then joins
 * all threads. A stopped server can be started again.
 */
class ConversionServer {
public:
    struct Config {
        std::string host = "127.0.0.1";
        uint16_t port = DEFAULT_PORT; // 0 = ephemeral
        std::filesystem::path certPath = "cert.pem";
        std::filesystem::path keyPath = "key.pem";
        size_t maxConnections = 16;
        size_t workerThreads = 2;
        size_t conversionThreads = 0; // 0 = hardware concurrency
        std::chrono::milliseconds connectionTimeout{60000};
        std::chrono::milliseconds acceptBackoffMs{50};
        std::chrono::milliseconds drainTimeout{5000}; // stop() waits this long for live work
        ipc::FramingLimits limits;
        bool saveOutputs = false;
        std::filesystem::path outputDir = "converted_files";
    };

    ConversionServer(Config config, const ConversionDispatcher& dispatcher);
    ~ConversionServer();

    ConversionServer(const ConversionServer&) = delete;
    ConversionServer& operator=(const ConversionServer&) = delete;

    // Lifecycle
    Result<void> start();
    Result<void> stop();
    bool isRunning() const { return running_.load(); }

    // Blocks until the listener accepts connections or the timeout expires
    bool waitUntilReady(std::chrono::milliseconds timeout) const;

    // Bound port; differs from Config::port when that was 0
    uint16_t port() const { return boundPort_.load(); }
    const Config& config() const noexcept { return config_; }

    // Metrics
    size_t activeConnections() const { return activeConnections_.load(); }
    uint64_t totalConnections() const { return totalConnections_.load(); }

private:
    using tcp = boost::asio::ip::tcp;
    using SslStream = boost::asio::ssl::stream<tcp::socket>;

    struct TrackedStream {
        std::weak_ptr<SslStream> stream;
        boost::asio::any_io_executor executor;
    };

    boost::asio::awaitable<void> accept_loop();
    boost::asio::awaitable<void> run_connection(tcp::socket socket, uint64_t connId);
    boost::asio::awaitable<void> handle_connection(tcp::socket socket, uint64_t connId);
    boost::asio::awaitable<ipc::ConversionResponse> convert(ipc::ConversionRequest request,
                                                            const std::string& requestId);

    Result<tcp::endpoint> resolve_endpoint() const;
    void register_stream(std::shared_ptr<SslStream> stream, boost::asio::any_io_executor executor);
    void close_streams();
    void set_ready(bool ready);
    void drain_and_join_workers();

    Config config_;
    const ConversionDispatcher& dispatcher_;
    ipc::MessageFramer framer_;
    OutputStore outputStore_;

    // Recreated on every start() so handlers left over from a forced stop die with it
    std::unique_ptr<boost::asio::io_context> io_context_;
    std::optional<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>>
        work_guard_;
    std::vector<std::thread> workers_;
    std::atomic<size_t> workersRunning_{0};
    std::unique_ptr<boost::asio::thread_pool> conversionPool_;
    std::unique_ptr<boost::asio::strand<boost::asio::io_context::executor_type>> acceptStrand_;

    tls::SslContextPtr sslContext_;
    std::unique_ptr<tcp::acceptor> acceptor_;
    std::atomic<uint16_t> boundPort_{0};

    std::atomic<size_t> activeConnections_{0};
    std::atomic<uint64_t> totalConnections_{0};

    std::atomic<bool> running_{false};
    std::atomic<bool> stopping_{false};

    mutable std::mutex readyMutex_;
    mutable std::condition_variable readyCv_;
    bool ready_ = false;

    std::mutex activeStreamsMutex_;
    std::vector<TrackedStream> activeStreams_;

    std::unique_ptr<std::counting_semaphore<>> connectionSlots_;
};

} // namespace fconv::server
