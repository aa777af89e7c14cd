#include <fconv/ipc/conversion_protocol.h>

#include <algorithm>
#include <cctype>

namespace fconv::ipc {

namespace {

struct OperationAlias {
    std::string_view name;
    Operation op;
};

constexpr std::array<OperationAlias, 5> LEGACY_ALIASES = {{
    {"pdf2png", Operation::PdfToPng},
    {"png2jpg", Operation::PngToJpg},
    {"jpg2png", Operation::JpgToPng},
    {"img_grayscale", Operation::ToGrayscale},
    {"img_resize", Operation::Resize},
}};

// Largest edge we agree to allocate for; keeps width*height*channels well inside size_t.
constexpr int64_t MAX_DIMENSION = 65535;

Result<uint32_t> dimension(const ParamMap& raw, const std::string& key) {
    auto it = std::find_if(raw.begin(), raw.end(), [&](const auto& kv) { return kv.first == key; });
    if (it == raw.end()) {
        return Error{ErrorCode::InvalidParameter, "missing required parameter '" + key + "'"};
    }

    int64_t v = 0;
    if (const auto* i = std::get_if<int64_t>(&it->second.value)) {
        v = *i;
    } else {
        const auto& s = std::get<std::string>(it->second.value);
        size_t used = 0;
        try {
            v = std::stoll(s, &used);
        } catch (const std::exception&) {
            used = 0;
        }
        if (s.empty() || used != s.size() || std::isspace(static_cast<unsigned char>(s[0]))) {
            return Error{ErrorCode::InvalidParameter,
                         "parameter '" + key + "' must be an integer, got '" + s + "'"};
        }
    }

    if (v <= 0 || v > MAX_DIMENSION) {
        return Error{ErrorCode::InvalidParameter, "parameter '" + key + "' must be in 1.." +
                                                      std::to_string(MAX_DIMENSION) + ", got " +
                                                      std::to_string(v)};
    }
    return static_cast<uint32_t>(v);
}

} // namespace

Result<Operation> parseOperation(std::string_view name) {
    for (auto op : ALL_OPERATIONS) {
        if (name == operationName(op))
            return op;
    }
    for (const auto& alias : LEGACY_ALIASES) {
        if (name == alias.name)
            return alias.op;
    }
    return Error{ErrorCode::UnsupportedOperation,
                 "unsupported operation '" + std::string(name) + "'"};
}

Result<OperationParams> makeParams(Operation op, const ParamMap& raw) {
    switch (op) {
        case Operation::Resize: {
            auto w = dimension(raw, "width");
            if (!w)
                return w.error();
            auto h = dimension(raw, "height");
            if (!h)
                return h.error();
            return OperationParams{ResizeParams{w.value(), h.value()}};
        }
        case Operation::PdfToPng:
        case Operation::PngToJpg:
        case Operation::JpgToPng:
        case Operation::ToGrayscale:
            // Extra keys are ignored, matching the loose form handling of the UI
            return OperationParams{NoParams{}};
    }
    return Error{ErrorCode::UnsupportedOperation, "unsupported operation"};
}

Result<void> validateParams(Operation op, const OperationParams& params) {
    if (op == Operation::Resize) {
        const auto* rp = std::get_if<ResizeParams>(&params);
        if (!rp) {
            return Error{ErrorCode::InvalidParameter, "resize requires width and height"};
        }
        if (rp->width == 0 || rp->height == 0 || rp->width > MAX_DIMENSION ||
            rp->height > MAX_DIMENSION) {
            return Error{ErrorCode::InvalidParameter,
                         "resize dimensions must be in 1.." + std::to_string(MAX_DIMENSION) +
                             ", got " + std::to_string(rp->width) + "x" +
                             std::to_string(rp->height)};
        }
        return {};
    }
    if (!std::holds_alternative<NoParams>(params)) {
        return Error{ErrorCode::InvalidParameter,
                     std::string(operationName(op)) + " takes no parameters"};
    }
    return {};
}

} // namespace fconv::ipc
