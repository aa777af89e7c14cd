#include <fconv/core/request_id.h>
#include <fconv/ipc/frame_stream.h>
#include <fconv/server/ConversionDispatcher.h>
#include <fconv/server/ConversionServer.h>

#include <spdlog/spdlog.h>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <algorithm>

#ifdef __linux__
#include <sys/prctl.h>
#endif

namespace {
void set_current_thread_name(const std::string& name) {
#ifdef __linux__
    prctl(PR_SET_NAME, name.c_str(), 0, 0, 0);
#elif __APPLE__
    pthread_setname_np(name.c_str());
#endif
}
} // namespace

namespace fconv::server {

using boost::asio::awaitable;
using boost::asio::co_spawn;
using boost::asio::detached;
using boost::asio::redirect_error;
using boost::asio::use_awaitable;
namespace ssl = boost::asio::ssl;

ConversionServer::ConversionServer(Config config, const ConversionDispatcher& dispatcher)
    : config_(std::move(config)), dispatcher_(dispatcher), framer_(config_.limits),
      outputStore_(config_.outputDir) {}

ConversionServer::~ConversionServer() {
    if (running_.load()) {
        if (auto r = stop(); !r) {
            spdlog::warn("ConversionServer: stop during destruction failed: {}",
                         r.error().message);
        }
    }
}

Result<ConversionServer::tcp::endpoint> ConversionServer::resolve_endpoint() const {
    boost::system::error_code ec;
    auto address = boost::asio::ip::make_address(config_.host, ec);
    if (!ec) {
        return tcp::endpoint(address, config_.port);
    }

    boost::asio::io_context resolverContext;
    tcp::resolver resolver(resolverContext);
    auto results = resolver.resolve(config_.host, std::to_string(config_.port), ec);
    if (ec || results.empty()) {
        return Error{ErrorCode::InvalidArgument,
                     "cannot resolve listen address '" + config_.host +
                         "': " + (ec ? ec.message() : std::string("no results"))};
    }
    return results.begin()->endpoint();
}

Result<void> ConversionServer::start() {
    if (running_.exchange(true)) {
        return Error{ErrorCode::InvalidState, "Conversion server already running"};
    }
    stopping_.store(false, std::memory_order_relaxed);

    try {
        auto ctx = tls::make_server_context(config_.certPath, config_.keyPath);
        if (!ctx) {
            running_ = false;
            spdlog::error("ConversionServer: {}", ctx.error().message);
            return ctx.error();
        }
        sslContext_ = ctx.value();

        if (config_.workerThreads == 0) {
            config_.workerThreads = 1;
            spdlog::warn("ConversionServer: workerThreads was 0; coercing to 1");
        }
        if (config_.maxConnections == 0) {
            config_.maxConnections = 1;
            spdlog::warn("ConversionServer: maxConnections was 0; coercing to 1");
        }

        auto endpoint = resolve_endpoint();
        if (!endpoint) {
            running_ = false;
            sslContext_.reset();
            return endpoint.error();
        }

        io_context_ = std::make_unique<boost::asio::io_context>();
        work_guard_.emplace(io_context_->get_executor());
        acceptStrand_ = std::make_unique<boost::asio::strand<boost::asio::io_context::executor_type>>(
            io_context_->get_executor());

        acceptor_ = std::make_unique<tcp::acceptor>(*acceptStrand_);
        boost::system::error_code ec;
        acceptor_->open(endpoint.value().protocol(), ec);
        if (!ec)
            acceptor_->set_option(tcp::acceptor::reuse_address(true), ec);
        if (!ec)
            acceptor_->bind(endpoint.value(), ec);
        if (!ec)
            acceptor_->listen(boost::asio::socket_base::max_listen_connections, ec);
        if (ec) {
            const auto where = config_.host + ":" + std::to_string(config_.port);
            acceptor_.reset();
            acceptStrand_.reset();
            work_guard_.reset();
            io_context_.reset();
            sslContext_.reset();
            running_ = false;
            spdlog::error("ConversionServer: cannot listen on {}: {}", where, ec.message());
            return Error{ErrorCode::IOError, "cannot listen on " + where + ": " + ec.message()};
        }
        boundPort_.store(acceptor_->local_endpoint().port());

        // Bounded concurrency: accept backs off while every slot is busy
        connectionSlots_ = std::make_unique<std::counting_semaphore<>>(
            static_cast<std::ptrdiff_t>(config_.maxConnections));

        size_t conversionThreads = config_.conversionThreads;
        if (conversionThreads == 0)
            conversionThreads = std::max(1u, std::thread::hardware_concurrency());
        conversionPool_ = std::make_unique<boost::asio::thread_pool>(conversionThreads);

        co_spawn(*acceptStrand_, accept_loop(), detached);

        workers_.reserve(config_.workerThreads);
        for (size_t i = 0; i < config_.workerThreads; ++i) {
            workersRunning_.fetch_add(1);
            workers_.emplace_back([this, i]() {
                set_current_thread_name("fconv-io-" + std::to_string(i));
                spdlog::debug("ConversionServer: worker {} starting", i);
                for (;;) {
                    try {
                        io_context_->run();
                        break;
                    } catch (const std::exception& e) {
                        spdlog::error("ConversionServer: worker {} exception: {}", i, e.what());
                    }
                }
                workersRunning_.fetch_sub(1);
                spdlog::debug("ConversionServer: worker {} exiting", i);
            });
        }

        set_ready(true);
        spdlog::info("Conversion server listening on {}:{} (tls, io_threads={}, "
                     "conversion_threads={}, max_connections={})",
                     config_.host, boundPort_.load(), config_.workerThreads, conversionThreads,
                     config_.maxConnections);
        return {};
    } catch (const std::exception& e) {
        spdlog::error("ConversionServer::start exception: {}", e.what());
        stopping_ = true;
        if (work_guard_)
            work_guard_.reset();
        if (io_context_)
            io_context_->stop();
        drain_and_join_workers();
        acceptor_.reset();
        acceptStrand_.reset();
        io_context_.reset();
        conversionPool_.reset();
        sslContext_.reset();
        running_ = false;
        return Error{ErrorCode::IOError,
                     fmt::format("Failed to start conversion server: {}", e.what())};
    }
}

Result<void> ConversionServer::stop() {
    if (!running_.exchange(false)) {
        return Error{ErrorCode::InvalidState, "Conversion server not running"};
    }

    spdlog::info("Stopping conversion server");
    stopping_.store(true, std::memory_order_relaxed);
    set_ready(false);

    try {
        if (acceptStrand_ && acceptor_) {
            boost::asio::post(*acceptStrand_, [this]() {
                boost::system::error_code ec;
                acceptor_->cancel(ec);
                acceptor_->close(ec);
            });
        }
        close_streams();

        work_guard_.reset();
        drain_and_join_workers();

        if (conversionPool_) {
            conversionPool_->join();
            conversionPool_.reset();
        }
    } catch (const std::exception& e) {
        spdlog::error("ConversionServer::stop exception: {}", e.what());
    }

    acceptor_.reset();
    acceptStrand_.reset();
    io_context_.reset();
    connectionSlots_.reset();
    sslContext_.reset();
    {
        std::lock_guard<std::mutex> lk(activeStreamsMutex_);
        activeStreams_.clear();
    }
    boundPort_.store(0);
    stopping_.store(false, std::memory_order_relaxed);

    spdlog::info("Conversion server stopped (total_conn={} active_conn={})",
                 totalConnections_.load(std::memory_order_relaxed),
                 activeConnections_.load(std::memory_order_relaxed));
    return {};
}

bool ConversionServer::waitUntilReady(std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lk(readyMutex_);
    return readyCv_.wait_for(lk, timeout, [this] { return ready_; });
}

void ConversionServer::set_ready(bool ready) {
    {
        std::lock_guard<std::mutex> lk(readyMutex_);
        ready_ = ready;
    }
    readyCv_.notify_all();
}

void ConversionServer::drain_and_join_workers() {
    // Live connections finish on their own once their sockets are closed; give
    // them drainTimeout before abandoning queued handlers.
    const auto deadline = std::chrono::steady_clock::now() + config_.drainTimeout;
    while (workersRunning_.load() > 0 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    if (workersRunning_.load() > 0 && io_context_) {
        spdlog::warn("ConversionServer: {} worker(s) still busy after {}ms; forcing stop",
                     workersRunning_.load(), config_.drainTimeout.count());
        io_context_->stop();
    }

    for (size_t i = 0; i < workers_.size(); ++i) {
        if (workers_[i].joinable()) {
            try {
                workers_[i].join();
            } catch (const std::system_error& e) {
                spdlog::warn("ConversionServer: worker {} join failed: {}", i, e.what());
            }
        }
    }
    workers_.clear();
}

void ConversionServer::register_stream(std::shared_ptr<SslStream> stream,
                                       boost::asio::any_io_executor executor) {
    std::lock_guard<std::mutex> lk(activeStreamsMutex_);
    activeStreams_.erase(std::remove_if(activeStreams_.begin(), activeStreams_.end(),
                                        [](const auto& t) { return t.stream.expired(); }),
                         activeStreams_.end());
    activeStreams_.push_back(TrackedStream{std::move(stream), std::move(executor)});
}

void ConversionServer::close_streams() {
    std::vector<TrackedStream> streams;
    {
        std::lock_guard<std::mutex> lk(activeStreamsMutex_);
        streams.swap(activeStreams_);
    }
    size_t closed = 0;
    for (auto& tracked : streams) {
        if (auto stream = tracked.stream.lock()) {
            // Socket state belongs to the connection's strand
            boost::asio::post(tracked.executor, [stream]() {
                boost::system::error_code ec;
                stream->lowest_layer().cancel(ec);
                stream->lowest_layer().close(ec);
            });
            ++closed;
        }
    }
    if (closed > 0)
        spdlog::info("ConversionServer: closing {} active connection(s)", closed);
}

awaitable<void> ConversionServer::accept_loop() {
    spdlog::debug("Accept loop started");

    while (running_ && !stopping_) {
        try {
            if (!connectionSlots_->try_acquire()) {
                boost::asio::steady_timer timer(co_await boost::asio::this_coro::executor);
                timer.expires_after(config_.acceptBackoffMs);
                boost::system::error_code ignored;
                co_await timer.async_wait(redirect_error(use_awaitable, ignored));
                continue;
            }

            auto connStrand = boost::asio::make_strand(io_context_->get_executor());
            tcp::socket socket(connStrand);
            boost::system::error_code ec;
            co_await acceptor_->async_accept(socket, redirect_error(use_awaitable, ec));

            if (ec) {
                connectionSlots_->release();
                if (!running_ || stopping_ || ec == boost::asio::error::operation_aborted) {
                    break;
                }
                spdlog::warn("Accept error: {} ({})", ec.message(), ec.value());
                boost::asio::steady_timer timer(co_await boost::asio::this_coro::executor);
                timer.expires_after(config_.acceptBackoffMs);
                boost::system::error_code ignored;
                co_await timer.async_wait(redirect_error(use_awaitable, ignored));
                continue;
            }

            auto current = activeConnections_.fetch_add(1) + 1;
            auto connId = totalConnections_.fetch_add(1) + 1;
            spdlog::debug("ConversionServer: accepted connection {}, active={}", connId, current);

            co_spawn(connStrand, run_connection(std::move(socket), connId), detached);
        } catch (const std::exception& e) {
            if (!running_ || stopping_)
                break;
            spdlog::error("Unexpected error in accept loop: {}", e.what());
            break;
        }
    }

    spdlog::debug("Accept loop ended");
}

awaitable<void> ConversionServer::run_connection(tcp::socket socket, uint64_t connId) {
    // Releases the connection slot on every exit path
    struct SlotGuard {
        std::counting_semaphore<>* slots;
        ~SlotGuard() {
            if (slots)
                slots->release();
        }
    } slot{connectionSlots_.get()};

    co_await handle_connection(std::move(socket), connId);
}

awaitable<void> ConversionServer::handle_connection(tcp::socket socket, uint64_t connId) {
    struct CleanupGuard {
        ConversionServer* server;
        uint64_t id;
        ~CleanupGuard() {
            auto current = server->activeConnections_.fetch_sub(1) - 1;
            spdlog::debug("Connection {} closed, active: {}", id, current);
        }
    } guard{this, connId};

    try {
        auto executor = co_await boost::asio::this_coro::executor;
        boost::system::error_code ec;
        auto peer = socket.remote_endpoint(ec);
        const std::string peerText =
            ec ? std::string("unknown peer")
               : peer.address().to_string() + ":" + std::to_string(peer.port());

        auto stream = std::make_shared<SslStream>(std::move(socket), *sslContext_);
        register_stream(stream, executor);

        // Deadline: expiry closes the socket, which fails whatever is pending on it.
        // Stale expirations (after disarm) are ignored via the generation counter.
        struct DeadlineState {
            uint64_t generation = 0;
            bool expired = false;
        };
        auto deadlineState = std::make_shared<DeadlineState>();
        boost::asio::steady_timer deadline(executor);
        auto arm = [&deadline, weak = std::weak_ptr<SslStream>(stream),
                    deadlineState](std::chrono::milliseconds timeout) {
            if (timeout.count() <= 0)
                return;
            const auto generation = ++deadlineState->generation;
            deadline.expires_after(timeout);
            deadline.async_wait(
                [weak, deadlineState, generation](const boost::system::error_code& wec) {
                    if (wec || deadlineState->generation != generation)
                        return;
                    deadlineState->expired = true;
                    if (auto s = weak.lock()) {
                        boost::system::error_code ignored;
                        s->lowest_layer().close(ignored);
                    }
                });
        };
        auto disarm = [&deadline, deadlineState]() {
            ++deadlineState->generation;
            deadline.cancel();
        };
        auto close = [&stream]() {
            boost::system::error_code ignored;
            stream->lowest_layer().close(ignored);
        };

        arm(config_.connectionTimeout);
        co_await stream->async_handshake(ssl::stream_base::server,
                                         redirect_error(use_awaitable, ec));
        if (ec) {
            if (deadlineState->expired) {
                spdlog::warn("Connection {} ({}): TLS handshake timed out", connId, peerText);
            } else {
                spdlog::debug("Connection {} ({}): TLS handshake failed: {}", connId, peerText,
                              ec.message());
            }
            close();
            co_return;
        }

        const std::string requestId = core::generateRequestId();
        auto request = co_await ipc::async_read_request(*stream, framer_);
        disarm();

        ipc::ConversionResponse response;
        if (!request) {
            const auto& err = request.error();
            if (deadlineState->expired) {
                spdlog::warn("Connection {} ({}): timed out waiting for request", connId,
                             peerText);
                close();
                co_return;
            }
            if (err.code == ErrorCode::FramingError) {
                spdlog::warn("Connection {} ({}): dropping connection: {}", connId, peerText,
                             err.message);
                close();
                co_return;
            }
            spdlog::info("Connection {} [{}]: rejected request: {} ({})", connId, requestId,
                         err.code, err.message);
            response = ipc::ConversionResponse::failure(err);
        } else {
            spdlog::info("Connection {} [{}]: {} '{}' ({} bytes) from {}", connId, requestId,
                         ipc::operationName(request.value().operation),
                         request.value().sourceName, request.value().source.size(), peerText);
            response = co_await convert(std::move(request).value(), requestId);
        }

        auto frame = framer_.encode_response(response);
        if (!frame) {
            spdlog::error("Connection {} [{}]: {}", connId, requestId, frame.error().message);
            frame = framer_.encode_response(ipc::ConversionResponse::failure(frame.error()));
            if (!frame) {
                close();
                co_return;
            }
        }

        arm(config_.connectionTimeout);
        auto wrote = co_await ipc::async_write_frame(*stream, frame.value());
        if (!wrote) {
            if (deadlineState->expired) {
                spdlog::warn("Connection {} [{}]: timed out writing response", connId, requestId);
            } else {
                spdlog::warn("Connection {} [{}]: {}", connId, requestId, wrote.error().message);
            }
            disarm();
            close();
            co_return;
        }

        co_await stream->async_shutdown(redirect_error(use_awaitable, ec));
        if (ec && ec != boost::asio::error::eof && ec != ssl::error::stream_truncated) {
            spdlog::debug("Connection {} [{}]: TLS shutdown: {}", connId, requestId, ec.message());
        }
        disarm();
        close();
    } catch (const std::exception& e) {
        spdlog::error("ConversionServer::handle_connection error: {}", e.what());
    }
}

awaitable<ipc::ConversionResponse> ConversionServer::convert(ipc::ConversionRequest request,
                                                             const std::string& requestId) {
    co_return co_await co_spawn(
        conversionPool_->get_executor(),
        [this, &request, &requestId]() -> awaitable<ipc::ConversionResponse> {
            auto response = dispatcher_.dispatch(request);
            if (!response.ok() || !config_.saveOutputs)
                co_return response;

            auto stored = outputStore_.store(request.sourceName, request.operation,
                                             response.outputs, requestId);
            if (!stored) {
                spdlog::error("[{}] saving outputs failed: {}", requestId,
                              stored.error().message);
                co_return ipc::ConversionResponse::failure(stored.error());
            }
            for (size_t i = 0; i < response.outputs.size(); ++i) {
                response.outputs[i].name = stored.value()[i].filename().string();
            }
            spdlog::info("[{}] saved {} output(s) to {}", requestId, stored.value().size(),
                         outputStore_.directory().string());
            co_return response;
        },
        use_awaitable);
}

} // namespace fconv::server
