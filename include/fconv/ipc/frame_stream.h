#pragma once

#include <fconv/core/types.h>
#include <fconv/ipc/message_framing.h>

#include <utility> // boost 1.74 awaitable.hpp uses std::exchange without it

#include <boost/asio/awaitable.hpp>
#include <boost/asio/buffer.hpp>
#include <boost/asio/read.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/write.hpp>
#include <boost/system/error_code.hpp>

#include <array>
#include <string>

namespace fconv::ipc {

namespace detail {

inline Error stream_error(const boost::system::error_code& ec, const char* what) {
    return Error{ErrorCode::FramingError,
                 std::string("stream ended while reading ") + what + ": " + ec.message()};
}

// Read exactly buffer.size() bytes; any shortfall is a FramingError
template <typename AsyncReadStream>
boost::asio::awaitable<Result<void>> read_exact(AsyncReadStream& stream, uint8_t* data, size_t size,
                                                const char* what) {
    if (size == 0)
        co_return Result<void>();
    boost::system::error_code ec;
    auto n = co_await boost::asio::async_read(stream, boost::asio::buffer(data, size),
                                              boost::asio::redirect_error(
                                                  boost::asio::use_awaitable, ec));
    if (ec)
        co_return stream_error(ec, what);
    if (n != size) {
        co_return Error{ErrorCode::FramingError, std::string("short read on ") + what};
    }
    co_return Result<void>();
}

template <typename AsyncReadStream>
boost::asio::awaitable<Result<uint64_t>> read_u64(AsyncReadStream& stream, const char* what) {
    std::array<uint8_t, MessageFramer::LENGTH_PREFIX_SIZE> prefix{};
    auto r = co_await read_exact(stream, prefix.data(), prefix.size(), what);
    if (!r)
        co_return r.error();
    co_return MessageFramer::get_u64(prefix.data());
}

} // namespace detail

/**
 * Read one request frame from a stream.
 *
 * Length prefixes are read first and checked against the framer's limits before any
 * buffer is allocated. The header is parsed before the source is read, so a garbage
 * header fails fast. FramingError means the stream is unusable; any other error code
 * means the frame was consumed completely and the peer can still be answered.
 */
template <typename AsyncReadStream>
boost::asio::awaitable<Result<ConversionRequest>> async_read_request(AsyncReadStream& stream,
                                                                     const MessageFramer& framer) {
    auto headerLen = co_await detail::read_u64(stream, "header length");
    if (!headerLen)
        co_return headerLen.error();
    if (auto ok = framer.check_header_length(headerLen.value()); !ok)
        co_return ok.error();

    ByteVector headerBytes(static_cast<size_t>(headerLen.value()));
    if (auto r = co_await detail::read_exact(stream, headerBytes.data(), headerBytes.size(),
                                             "header");
        !r)
        co_return r.error();
    auto header = framer.parse_request_header(headerBytes);
    if (!header)
        co_return header.error();

    auto sourceLen = co_await detail::read_u64(stream, "source length");
    if (!sourceLen)
        co_return sourceLen.error();
    if (auto ok = framer.check_payload_length(sourceLen.value()); !ok)
        co_return ok.error();

    ByteVector source(static_cast<size_t>(sourceLen.value()));
    if (auto r = co_await detail::read_exact(stream, source.data(), source.size(), "source"); !r)
        co_return r.error();

    co_return MessageFramer::build_request(std::move(header).value(), std::move(source));
}

// Read one response frame from a stream; every failure is a FramingError.
template <typename AsyncReadStream>
boost::asio::awaitable<Result<ConversionResponse>>
async_read_response(AsyncReadStream& stream, const MessageFramer& framer) {
    auto headerLen = co_await detail::read_u64(stream, "header length");
    if (!headerLen)
        co_return headerLen.error();
    if (auto ok = framer.check_header_length(headerLen.value()); !ok)
        co_return ok.error();

    ByteVector headerBytes(static_cast<size_t>(headerLen.value()));
    if (auto r = co_await detail::read_exact(stream, headerBytes.data(), headerBytes.size(),
                                             "header");
        !r)
        co_return r.error();
    auto header = framer.parse_response_header(headerBytes);
    if (!header)
        co_return header.error();

    auto count = co_await detail::read_u64(stream, "output count");
    if (!count)
        co_return count.error();
    if (auto ok = framer.check_output_count(count.value()); !ok)
        co_return ok.error();
    auto& names = header.value().outputNames;
    if (names.size() != count.value()) {
        co_return Error{ErrorCode::FramingError,
                        "response header names " + std::to_string(names.size()) +
                            " outputs but frame carries " + std::to_string(count.value())};
    }

    ConversionResponse response;
    response.status = header.value().status;
    response.errorMessage = std::move(header.value().errorMessage);
    response.outputs.reserve(names.size());
    for (auto& name : names) {
        auto len = co_await detail::read_u64(stream, "output length");
        if (!len)
            co_return len.error();
        if (auto ok = framer.check_payload_length(len.value()); !ok)
            co_return ok.error();
        OutputFile file{std::move(name), ByteVector(static_cast<size_t>(len.value()))};
        if (auto r = co_await detail::read_exact(stream, file.data.data(), file.data.size(),
                                                 "output");
            !r)
            co_return r.error();
        response.outputs.push_back(std::move(file));
    }
    co_return response;
}

template <typename AsyncWriteStream>
boost::asio::awaitable<Result<void>> async_write_frame(AsyncWriteStream& stream,
                                                       const ByteVector& frame) {
    boost::system::error_code ec;
    auto n = co_await boost::asio::async_write(
        stream, boost::asio::buffer(frame),
        boost::asio::redirect_error(boost::asio::use_awaitable, ec));
    if (ec) {
        co_return Error{ErrorCode::NetworkError, "write failed: " + ec.message()};
    }
    if (n != frame.size()) {
        co_return Error{ErrorCode::NetworkError, "short write on transport stream"};
    }
    co_return Result<void>();
}

} // namespace fconv::ipc
