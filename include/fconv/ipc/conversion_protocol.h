#pragma once

#include <fconv/core/types.h>

#include <array>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace fconv::ipc {

// ============================================================================
// Operations
// ============================================================================

enum class Operation : uint8_t { PdfToPng, PngToJpg, JpgToPng, ToGrayscale, Resize };

inline constexpr std::array<Operation, 5> ALL_OPERATIONS = {
    Operation::PdfToPng, Operation::PngToJpg, Operation::JpgToPng, Operation::ToGrayscale,
    Operation::Resize};

constexpr const char* operationName(Operation op) {
    switch (op) {
        case Operation::PdfToPng: return "pdf_to_png";
        case Operation::PngToJpg: return "png_to_jpg";
        case Operation::JpgToPng: return "jpg_to_png";
        case Operation::ToGrayscale: return "to_grayscale";
        case Operation::Resize: return "resize";
    }
    return "unknown";
}

// Accepts canonical names and the legacy short forms (pdf2png, img_resize, ...)
Result<Operation> parseOperation(std::string_view name);

// ============================================================================
// Parameters: one alternative per parameter shape
// ============================================================================

struct NoParams {
    bool operator==(const NoParams&) const = default;
};

struct ResizeParams {
    uint32_t width = 0;
    uint32_t height = 0;

    bool operator==(const ResizeParams&) const = default;
};

using OperationParams = std::variant<NoParams, ResizeParams>;

// Loosely typed values as they arrive from a CLI or UI form
struct ParamValue {
    std::variant<int64_t, std::string> value;
};
using ParamMap = std::vector<std::pair<std::string, ParamValue>>;

// Build the parameter variant an operation requires, rejecting missing or ill-typed values.
Result<OperationParams> makeParams(Operation op, const ParamMap& raw);

// Check that the variant alternative and its values satisfy the operation.
Result<void> validateParams(Operation op, const OperationParams& params);

// ============================================================================
// Request / Response
// ============================================================================

struct ConversionRequest {
    Operation operation = Operation::PngToJpg;
    OperationParams params;
    std::string sourceName; // base name of the input, used for output naming only
    ByteVector source;
};

struct OutputFile {
    std::string name;
    ByteVector data;
};

struct ConversionResponse {
    ErrorCode status = ErrorCode::Success; // Success or the failure kind
    std::string errorMessage;
    std::vector<OutputFile> outputs;

    bool ok() const noexcept { return status == ErrorCode::Success; }

    static ConversionResponse success(std::vector<OutputFile> files) {
        ConversionResponse r;
        r.outputs = std::move(files);
        return r;
    }

    static ConversionResponse failure(const Error& e) {
        ConversionResponse r;
        r.status = e.code == ErrorCode::Success ? ErrorCode::InternalError : e.code;
        r.errorMessage = e.message;
        return r;
    }
};

constexpr uint32_t PROTOCOL_VERSION = 1;

} // namespace fconv::ipc
