#pragma once

#include <fconv/core/types.h>
#include <fconv/ipc/conversion_protocol.h>

#include <bit>
#include <cstdint>
#include <cstring>
#include <span>
#include <string>
#include <vector>

namespace fconv::ipc {

struct FramingLimits {
    size_t maxHeaderBytes = MAX_HEADER_SIZE;
    size_t maxPayloadBytes = DEFAULT_MAX_PAYLOAD_SIZE; // per source or per output
    size_t maxOutputs = 4096;
};

// Decoded request header, before the operation and parameters are interpreted
struct RequestHeader {
    uint32_t version = PROTOCOL_VERSION;
    std::string operation;
    ParamMap params;
    std::string sourceName;
};

struct ResponseHeader {
    uint32_t version = PROTOCOL_VERSION;
    ErrorCode status = ErrorCode::Success;
    std::string errorMessage;
    std::vector<std::string> outputNames;
};

/**
 * Length-prefixed framing for one request or one response.
 *
 * Request:  u64be header_len | JSON header | u64be source_len | source
 * Response: u64be header_len | JSON header | u64be count | count x (u64be len | bytes)
 *
 * All lengths are 8-byte unsigned big-endian. Errors:
 *  - FramingError: truncated data, lengths above the limits, malformed header
 *  - UnsupportedOperation / InvalidParameter: complete request frame whose header
 *    names an unknown operation or carries unusable parameters
 */
class MessageFramer {
public:
    static constexpr size_t LENGTH_PREFIX_SIZE = sizeof(uint64_t);

    explicit MessageFramer(FramingLimits limits = {}) : limits_(limits) {}

    const FramingLimits& limits() const noexcept { return limits_; }

    [[nodiscard]] Result<ByteVector> encode_request(const ConversionRequest& request) const;
    [[nodiscard]] Result<ByteVector> encode_response(const ConversionResponse& response) const;

    // Decode a complete in-memory frame. Trailing bytes are a FramingError.
    [[nodiscard]] Result<ConversionRequest> decode_request(std::span<const uint8_t> frame) const;
    [[nodiscard]] Result<ConversionResponse> decode_response(std::span<const uint8_t> frame) const;

    // Segment-level helpers shared with the stream readers
    [[nodiscard]] Result<uint64_t> check_header_length(uint64_t declared) const;
    [[nodiscard]] Result<uint64_t> check_payload_length(uint64_t declared) const;
    [[nodiscard]] Result<uint64_t> check_output_count(uint64_t declared) const;
    [[nodiscard]] Result<RequestHeader> parse_request_header(std::span<const uint8_t> bytes) const;
    [[nodiscard]] Result<ResponseHeader> parse_response_header(std::span<const uint8_t> bytes) const;

    // Interpret a header plus its source bytes into a typed request
    [[nodiscard]] static Result<ConversionRequest> build_request(RequestHeader header,
                                                                 ByteVector source);

    static void put_u64(ByteVector& out, uint64_t value) {
        if constexpr (std::endian::native != std::endian::big) {
            value = __builtin_bswap64(value);
        }
        const auto* p = reinterpret_cast<const uint8_t*>(&value);
        out.insert(out.end(), p, p + sizeof(value));
    }

    static uint64_t get_u64(const uint8_t* data) noexcept {
        uint64_t value = 0;
        std::memcpy(&value, data, sizeof(value));
        if constexpr (std::endian::native != std::endian::big) {
            value = __builtin_bswap64(value);
        }
        return value;
    }

private:
    FramingLimits limits_;
};

} // namespace fconv::ipc
