#include <fconv/client/conversion_client.h>
#include <fconv/core/request_id.h>
#include <fconv/ipc/frame_stream.h>
#include <fconv/ipc/message_framing.h>
#include <fconv/server/OutputStore.h>

#include <spdlog/spdlog.h>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/connect.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <fstream>
#include <iterator>
#include <memory>
#include <optional>

namespace fconv::client {

namespace fs = std::filesystem;
namespace ssl = boost::asio::ssl;
using boost::asio::awaitable;
using boost::asio::redirect_error;
using boost::asio::use_awaitable;
using tcp = boost::asio::ip::tcp;

namespace {

// Closes the socket when it fires; pending operations then fail and the
// caller reports Timeout instead of the socket error. A wait that completes
// after disarm() or destruction is ignored.
class Deadline {
public:
    Deadline(boost::asio::any_io_executor ex, tcp::socket& socket)
        : timer_(std::move(ex)), state_(std::make_shared<State>()) {
        state_->socket = &socket;
    }

    ~Deadline() { state_->socket = nullptr; }

    Deadline(const Deadline&) = delete;
    Deadline& operator=(const Deadline&) = delete;

    void arm(std::chrono::milliseconds timeout) {
        if (timeout.count() <= 0)
            return;
        const auto generation = ++state_->generation;
        timer_.expires_after(timeout);
        timer_.async_wait([state = state_, generation](const boost::system::error_code& ec) {
            if (ec || state->generation != generation || !state->socket)
                return;
            state->expired = true;
            boost::system::error_code ignored;
            state->socket->close(ignored);
        });
    }

    void disarm() {
        ++state_->generation;
        timer_.cancel();
    }

    bool expired() const noexcept { return state_->expired; }

private:
    struct State {
        tcp::socket* socket = nullptr;
        uint64_t generation = 0;
        bool expired = false;
    };

    boost::asio::steady_timer timer_;
    std::shared_ptr<State> state_;
};

std::string endpoint_text(const ClientConfig& config) {
    return config.host + ":" + std::to_string(config.port);
}

Error connect_error(const ClientConfig& config, const boost::system::error_code& ec,
                    bool timedOut) {
    if (timedOut) {
        return Error{ErrorCode::Timeout, "connecting to " + endpoint_text(config) + " timed out"};
    }
    if (ec == boost::asio::error::connection_refused) {
        return Error{ErrorCode::ConnectionRefused,
                     "server at " + endpoint_text(config) +
                         " refused the connection (is fconv-server running?)"};
    }
    return Error{ErrorCode::NetworkError,
                 "cannot connect to " + endpoint_text(config) + ": " + ec.message()};
}

awaitable<Result<ipc::ConversionResponse>> exchange(const ClientConfig& config,
                                                    ssl::context& ctx, const ByteVector& frame,
                                                    const ipc::MessageFramer& framer) {
    auto ex = co_await boost::asio::this_coro::executor;
    boost::system::error_code ec;

    tcp::resolver resolver(ex);
    auto endpoints =
        co_await resolver.async_resolve(config.host, std::to_string(config.port),
                                        redirect_error(use_awaitable, ec));
    if (ec) {
        co_return Error{ErrorCode::NetworkError,
                        "cannot resolve " + config.host + ": " + ec.message()};
    }

    ssl::stream<tcp::socket> stream(ex, ctx);
    Deadline deadline(ex, stream.next_layer());

    deadline.arm(config.connectTimeout);
    co_await boost::asio::async_connect(stream.next_layer(), endpoints,
                                        redirect_error(use_awaitable, ec));
    deadline.disarm();
    if (ec || deadline.expired()) {
        co_return connect_error(config, ec, deadline.expired());
    }

    deadline.arm(config.requestTimeout);
    auto timeoutError = [&]() {
        return Error{ErrorCode::Timeout, "no response from " + endpoint_text(config) +
                                             " within " +
                                             std::to_string(config.requestTimeout.count()) + "ms"};
    };

    if (!SSL_set_tlsext_host_name(stream.native_handle(), config.host.c_str())) {
        spdlog::debug("Could not set SNI host name '{}'", config.host);
    }
    if (config.verifyPeer) {
        stream.set_verify_callback(ssl::host_name_verification(config.host));
    }

    co_await stream.async_handshake(ssl::stream_base::client, redirect_error(use_awaitable, ec));
    if (ec) {
        if (deadline.expired())
            co_return timeoutError();
        co_return Error{ErrorCode::NetworkError, "TLS handshake failed: " + ec.message()};
    }

    auto wrote = co_await ipc::async_write_frame(stream, frame);
    if (!wrote) {
        if (deadline.expired())
            co_return timeoutError();
        co_return wrote.error();
    }

    auto response = co_await ipc::async_read_response(stream, framer);
    if (!response) {
        if (deadline.expired())
            co_return timeoutError();
        co_return response.error();
    }

    co_await stream.async_shutdown(redirect_error(use_awaitable, ec));
    if (ec && ec != boost::asio::error::eof && ec != ssl::error::stream_truncated) {
        spdlog::debug("TLS shutdown: {}", ec.message());
    }
    deadline.disarm();
    boost::system::error_code ignored;
    stream.next_layer().close(ignored);
    co_return response;
}

Result<ByteVector> read_file(const fs::path& path) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        return Error{ErrorCode::FileNotFound, "file not found: " + path.string()};
    }
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return Error{ErrorCode::IOError, "cannot open " + path.string()};
    }
    ByteVector data((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) {
        return Error{ErrorCode::IOError, "cannot read " + path.string()};
    }
    return data;
}

} // namespace

ConversionClient::ConversionClient(ClientConfig config) : config_(std::move(config)) {}

Result<tls::SslContextPtr> ConversionClient::sslContext() {
    if (sslContext_)
        return sslContext_;
    auto ctx = tls::make_client_context(config_.certPath, config_.verifyPeer);
    if (!ctx)
        return ctx.error();
    sslContext_ = ctx.value();
    return sslContext_;
}

Result<ipc::ConversionResponse> ConversionClient::roundTrip(const ipc::ConversionRequest& request) {
    ipc::FramingLimits limits;
    limits.maxPayloadBytes = config_.maxPayloadBytes;
    ipc::MessageFramer framer(limits);

    auto frame = framer.encode_request(request);
    if (!frame)
        return frame.error();

    auto ctx = sslContext();
    if (!ctx)
        return ctx.error();

    try {
        boost::asio::io_context io;
        std::optional<Result<ipc::ConversionResponse>> outcome;
        boost::asio::co_spawn(
            io,
            [&]() -> awaitable<void> {
                outcome.emplace(co_await exchange(config_, *ctx.value(), frame.value(), framer));
            },
            [&](std::exception_ptr e) {
                if (!e)
                    return;
                try {
                    std::rethrow_exception(e);
                } catch (const std::exception& ex) {
                    outcome.emplace(Error{ErrorCode::InternalError, ex.what()});
                }
            });
        io.run();
        if (!outcome) {
            return Error{ErrorCode::InternalError, "exchange finished without a result"};
        }
        return std::move(*outcome);
    } catch (const std::exception& e) {
        return Error{ErrorCode::InternalError, std::string("client failure: ") + e.what()};
    }
}

Result<ConversionResult> ConversionClient::submit(ByteVector bytes, std::string sourceName,
                                                  ipc::Operation operation,
                                                  const ipc::OperationParams& params) {
    ipc::ConversionRequest request;
    request.operation = operation;
    request.params = params;
    request.sourceName = std::move(sourceName);
    request.source = std::move(bytes);

    spdlog::debug("Sending {} for '{}' ({} bytes) to {}", ipc::operationName(operation),
                  request.sourceName, request.source.size(), endpoint_text(config_));

    auto response = roundTrip(request);
    if (!response)
        return response.error();
    if (!response.value().ok()) {
        return Error{response.value().status, response.value().errorMessage};
    }

    ConversionResult result;
    result.requestId = core::generateRequestId();
    server::OutputStore store(config_.outputDir);
    auto stored =
        store.store(request.sourceName, operation, response.value().outputs, result.requestId);
    if (!stored)
        return stored.error();
    result.outputPaths = std::move(stored).value();
    return result;
}

Result<ConversionResult> ConversionClient::convert(const fs::path& path, ipc::Operation operation,
                                                   const ipc::OperationParams& params) {
    auto data = read_file(path);
    if (!data)
        return data.error();
    return submit(std::move(data).value(), path.filename().string(), operation, params);
}

bool ConversionClient::probe() {
    try {
        boost::asio::io_context io;
        bool reachable = false;
        boost::asio::co_spawn(
            io,
            [&]() -> awaitable<void> {
                auto ex = co_await boost::asio::this_coro::executor;
                boost::system::error_code ec;
                tcp::resolver resolver(ex);
                auto endpoints =
                    co_await resolver.async_resolve(config_.host, std::to_string(config_.port),
                                                    redirect_error(use_awaitable, ec));
                if (ec)
                    co_return;
                tcp::socket socket(ex);
                Deadline deadline(ex, socket);
                deadline.arm(config_.connectTimeout);
                co_await boost::asio::async_connect(socket, endpoints,
                                                    redirect_error(use_awaitable, ec));
                deadline.disarm();
                reachable = !ec && !deadline.expired();
                boost::system::error_code ignored;
                socket.close(ignored);
            },
            boost::asio::detached);
        io.run();
        return reachable;
    } catch (const std::exception& e) {
        spdlog::debug("probe failed: {}", e.what());
        return false;
    }
}

} // namespace fconv::client
