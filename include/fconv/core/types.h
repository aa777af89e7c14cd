#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace fconv {

using ByteVector = std::vector<uint8_t>;

// Error types
enum class ErrorCode {
    Success = 0,
    FramingError,
    UnsupportedOperation,
    InvalidParameter,
    DecodeError,
    Timeout,
    IOError,
    ConnectionRefused,
    NetworkError,
    FileNotFound,
    InvalidArgument,
    InvalidState,
    InternalError,
    Unknown
};

// Convert error code to string
constexpr const char* errorToString(ErrorCode error) {
    switch (error) {
        case ErrorCode::Success: return "Success";
        case ErrorCode::FramingError: return "Malformed or truncated frame";
        case ErrorCode::UnsupportedOperation: return "Unsupported operation";
        case ErrorCode::InvalidParameter: return "Invalid parameter";
        case ErrorCode::DecodeError: return "Input could not be decoded";
        case ErrorCode::Timeout: return "Operation timed out";
        case ErrorCode::IOError: return "I/O error";
        case ErrorCode::ConnectionRefused: return "Connection refused";
        case ErrorCode::NetworkError: return "Network error";
        case ErrorCode::FileNotFound: return "File not found";
        case ErrorCode::InvalidArgument: return "Invalid argument";
        case ErrorCode::InvalidState: return "Invalid state";
        case ErrorCode::InternalError: return "Internal error";
        case ErrorCode::Unknown: return "Unknown error";
    }
    return "Unknown error";
}

// Stable identifiers used when an error kind crosses the wire
constexpr const char* errorKindName(ErrorCode error) {
    switch (error) {
        case ErrorCode::Success: return "Success";
        case ErrorCode::FramingError: return "FramingError";
        case ErrorCode::UnsupportedOperation: return "UnsupportedOperationError";
        case ErrorCode::InvalidParameter: return "InvalidParameterError";
        case ErrorCode::DecodeError: return "DecodeError";
        case ErrorCode::Timeout: return "TimeoutError";
        case ErrorCode::IOError: return "IOError";
        case ErrorCode::ConnectionRefused: return "ConnectionRefusedError";
        case ErrorCode::NetworkError: return "NetworkError";
        case ErrorCode::FileNotFound: return "FileNotFoundError";
        case ErrorCode::InvalidArgument: return "InvalidArgumentError";
        case ErrorCode::InvalidState: return "InvalidStateError";
        case ErrorCode::InternalError: return "InternalError";
        case ErrorCode::Unknown: return "UnknownError";
    }
    return "UnknownError";
}

inline std::optional<ErrorCode> errorKindFromName(std::string_view name) {
    for (int i = static_cast<int>(ErrorCode::Success); i <= static_cast<int>(ErrorCode::Unknown);
         ++i) {
        auto code = static_cast<ErrorCode>(i);
        if (name == errorKindName(code))
            return code;
    }
    return std::nullopt;
}

// Error struct for detailed error information
struct Error {
    ErrorCode code;
    std::string message;

    Error() : code(ErrorCode::Success), message("") {}
    Error(ErrorCode c, std::string msg) : code(c), message(std::move(msg)) {}
    Error(ErrorCode c) : code(c), message(errorToString(c)) {}

    bool operator==(ErrorCode c) const { return code == c; }
    bool operator!=(ErrorCode c) const { return code != c; }

    friend bool operator==(ErrorCode c, const Error& error) { return error.code == c; }
    friend bool operator!=(ErrorCode c, const Error& error) { return error.code != c; }
};

// Result type for operations that can fail
template <typename T> class Result {
public:
    Result(T&& value) : data_(std::move(value)) {}
    Result(const T& value) : data_(value) {}
    Result(ErrorCode error) : data_(Error{error}) {}
    Result(Error error) : data_(std::move(error)) {}

    bool has_value() const noexcept { return std::holds_alternative<T>(data_); }

    explicit operator bool() const noexcept { return has_value(); }

    const T& value() const& {
        if (!has_value()) {
            throw std::runtime_error("Result contains error: " + std::get<Error>(data_).message);
        }
        return std::get<T>(data_);
    }

    T& value() & {
        if (!has_value()) {
            throw std::runtime_error("Result contains error: " + std::get<Error>(data_).message);
        }
        return std::get<T>(data_);
    }

    T&& value() && {
        if (!has_value()) {
            throw std::runtime_error("Result contains error: " + std::get<Error>(data_).message);
        }
        return std::get<T>(std::move(data_));
    }

    const Error& error() const {
        if (has_value()) {
            throw std::runtime_error("Result contains value");
        }
        return std::get<Error>(data_);
    }

private:
    std::variant<T, Error> data_;
};

// Specialization for void
template <> class Result<void> {
public:
    Result() : error_() {}
    Result(ErrorCode error) : error_(Error{error}) {}
    Result(Error error) : error_(std::move(error)) {}

    bool has_value() const noexcept { return error_.code == ErrorCode::Success; }

    explicit operator bool() const noexcept { return has_value(); }

    void value() const {
        if (!has_value()) {
            throw std::runtime_error("Result contains error: " + error_.message);
        }
    }

    const Error& error() const {
        if (has_value()) {
            throw std::runtime_error("Result contains value");
        }
        return error_;
    }

private:
    Error error_{ErrorCode::Success, ""};
};

} // namespace fconv

// fmt library support for ErrorCode (for spdlog)
#include <fmt/format.h>
template <> struct fmt::formatter<fconv::ErrorCode> {
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template <typename FormatContext>
    auto format(fconv::ErrorCode error, FormatContext& ctx) const {
        return fmt::format_to(ctx.out(), "{}", fconv::errorKindName(error));
    }
};

namespace fconv {

// Common constants
inline constexpr uint16_t DEFAULT_PORT = 8443;
inline constexpr size_t DEFAULT_MAX_PAYLOAD_SIZE = 256ULL * 1024 * 1024; // 256MB
inline constexpr size_t MAX_HEADER_SIZE = 64 * 1024;                    // 64KB

} // namespace fconv
