#include <fconv/ipc/message_framing.h>

#include <nlohmann/json.hpp>

namespace fconv::ipc {

using json = nlohmann::json;

namespace {

Error framing(std::string msg) {
    return Error{ErrorCode::FramingError, std::move(msg)};
}

// Cursor over an in-memory frame; every read is bounds checked
class SpanReader {
public:
    explicit SpanReader(std::span<const uint8_t> data) : data_(data) {}

    Result<uint64_t> u64(const char* what) {
        if (remaining() < MessageFramer::LENGTH_PREFIX_SIZE) {
            return framing(std::string("truncated frame: missing ") + what);
        }
        auto v = MessageFramer::get_u64(data_.data() + pos_);
        pos_ += MessageFramer::LENGTH_PREFIX_SIZE;
        return v;
    }

    Result<std::span<const uint8_t>> bytes(uint64_t n, const char* what) {
        if (remaining() < n) {
            return framing(std::string("truncated frame: ") + what + " declares " +
                           std::to_string(n) + " bytes, " + std::to_string(remaining()) +
                           " available");
        }
        auto out = data_.subspan(pos_, static_cast<size_t>(n));
        pos_ += static_cast<size_t>(n);
        return out;
    }

    size_t remaining() const noexcept { return data_.size() - pos_; }

private:
    std::span<const uint8_t> data_;
    size_t pos_ = 0;
};

Result<json> parse_json_object(std::span<const uint8_t> bytes) {
    json j = json::parse(bytes.begin(), bytes.end(), nullptr, /*allow_exceptions=*/false);
    if (j.is_discarded()) {
        return framing("frame header is not valid JSON");
    }
    if (!j.is_object()) {
        return framing("frame header must be a JSON object");
    }
    return j;
}

Result<uint32_t> header_version(const json& j) {
    auto it = j.find("version");
    if (it == j.end())
        return PROTOCOL_VERSION;
    if (!it->is_number_unsigned() || it->get<uint64_t>() != PROTOCOL_VERSION) {
        return framing("unsupported protocol version " + it->dump());
    }
    return PROTOCOL_VERSION;
}

json params_to_json(const OperationParams& params) {
    json out = json::object();
    if (const auto* rp = std::get_if<ResizeParams>(&params)) {
        out["width"] = rp->width;
        out["height"] = rp->height;
    }
    return out;
}

ParamMap params_from_json(const json& j) {
    ParamMap out;
    for (auto it = j.begin(); it != j.end(); ++it) {
        const auto& v = it.value();
        if (v.is_number_integer()) {
            out.emplace_back(it.key(), ParamValue{v.get<int64_t>()});
        } else if (v.is_string()) {
            out.emplace_back(it.key(), ParamValue{v.get<std::string>()});
        } else {
            // Floats, booleans and nested values never satisfy an integer parameter; keep
            // their text so the error message shows what was sent.
            out.emplace_back(it.key(), ParamValue{v.dump()});
        }
    }
    return out;
}

} // namespace

// ============================================================================
// Length checks
// ============================================================================

Result<uint64_t> MessageFramer::check_header_length(uint64_t declared) const {
    if (declared == 0) {
        return framing("frame header is empty");
    }
    if (declared > limits_.maxHeaderBytes) {
        return framing("frame header of " + std::to_string(declared) + " bytes exceeds limit of " +
                       std::to_string(limits_.maxHeaderBytes));
    }
    return declared;
}

Result<uint64_t> MessageFramer::check_payload_length(uint64_t declared) const {
    if (declared > limits_.maxPayloadBytes) {
        return framing("payload of " + std::to_string(declared) + " bytes exceeds limit of " +
                       std::to_string(limits_.maxPayloadBytes));
    }
    return declared;
}

Result<uint64_t> MessageFramer::check_output_count(uint64_t declared) const {
    if (declared > limits_.maxOutputs) {
        return framing("output count " + std::to_string(declared) + " exceeds limit of " +
                       std::to_string(limits_.maxOutputs));
    }
    return declared;
}

// ============================================================================
// Headers
// ============================================================================

Result<RequestHeader> MessageFramer::parse_request_header(std::span<const uint8_t> bytes) const {
    auto parsed = parse_json_object(bytes);
    if (!parsed)
        return parsed.error();
    const auto& j = parsed.value();

    RequestHeader header;
    auto version = header_version(j);
    if (!version)
        return version.error();
    header.version = version.value();

    auto op = j.find("operation");
    if (op == j.end() || !op->is_string()) {
        return framing("request header lacks a string 'operation'");
    }
    header.operation = op->get<std::string>();

    if (auto p = j.find("params"); p != j.end() && !p->is_null()) {
        if (!p->is_object()) {
            return framing("request header 'params' must be an object");
        }
        header.params = params_from_json(*p);
    }

    if (auto name = j.find("source_name"); name != j.end() && !name->is_null()) {
        if (!name->is_string()) {
            return framing("request header 'source_name' must be a string");
        }
        header.sourceName = name->get<std::string>();
    }
    return header;
}

Result<ResponseHeader> MessageFramer::parse_response_header(std::span<const uint8_t> bytes) const {
    auto parsed = parse_json_object(bytes);
    if (!parsed)
        return parsed.error();
    const auto& j = parsed.value();

    ResponseHeader header;
    auto version = header_version(j);
    if (!version)
        return version.error();
    header.version = version.value();

    auto status = j.find("status");
    if (status == j.end() || !status->is_string()) {
        return framing("response header lacks a string 'status'");
    }
    const auto statusText = status->get<std::string>();
    if (statusText == "ok") {
        header.status = ErrorCode::Success;
    } else if (statusText == "error") {
        header.status = ErrorCode::Unknown;
        if (auto kind = j.find("error_kind"); kind != j.end() && kind->is_string()) {
            if (auto code = errorKindFromName(kind->get<std::string>());
                code && *code != ErrorCode::Success) {
                header.status = *code;
            }
        }
        if (auto msg = j.find("error"); msg != j.end() && msg->is_string()) {
            header.errorMessage = msg->get<std::string>();
        }
    } else {
        return framing("response header has unknown status '" + statusText + "'");
    }

    if (auto outputs = j.find("outputs"); outputs != j.end() && !outputs->is_null()) {
        if (!outputs->is_array()) {
            return framing("response header 'outputs' must be an array");
        }
        for (const auto& name : *outputs) {
            if (!name.is_string()) {
                return framing("response header output names must be strings");
            }
            header.outputNames.push_back(name.get<std::string>());
        }
    }
    return header;
}

Result<ConversionRequest> MessageFramer::build_request(RequestHeader header, ByteVector source) {
    auto op = parseOperation(header.operation);
    if (!op)
        return op.error();

    auto params = makeParams(op.value(), header.params);
    if (!params)
        return params.error();

    ConversionRequest req;
    req.operation = op.value();
    req.params = std::move(params).value();
    req.sourceName = std::move(header.sourceName);
    req.source = std::move(source);
    return req;
}

// ============================================================================
// Encoding
// ============================================================================

Result<ByteVector> MessageFramer::encode_request(const ConversionRequest& request) const {
    if (auto valid = validateParams(request.operation, request.params); !valid) {
        return valid.error();
    }
    if (request.source.size() > limits_.maxPayloadBytes) {
        return Error{ErrorCode::InvalidArgument,
                     "source of " + std::to_string(request.source.size()) +
                         " bytes exceeds limit of " + std::to_string(limits_.maxPayloadBytes)};
    }

    std::string headerText;
    try {
        json header = {{"version", PROTOCOL_VERSION},
                       {"operation", operationName(request.operation)},
                       {"params", params_to_json(request.params)},
                       {"source_name", request.sourceName}};
        headerText = header.dump();
    } catch (const json::exception& e) {
        // dump() rejects names that are not valid UTF-8
        return Error{ErrorCode::InvalidArgument,
                     std::string("cannot encode request header: ") + e.what()};
    }

    ByteVector frame;
    frame.reserve(2 * LENGTH_PREFIX_SIZE + headerText.size() + request.source.size());
    put_u64(frame, headerText.size());
    frame.insert(frame.end(), headerText.begin(), headerText.end());
    put_u64(frame, request.source.size());
    frame.insert(frame.end(), request.source.begin(), request.source.end());
    return frame;
}

Result<ByteVector> MessageFramer::encode_response(const ConversionResponse& response) const {
    std::string headerText;
    try {
        json header = {{"version", PROTOCOL_VERSION}, {"status", response.ok() ? "ok" : "error"}};
        if (!response.ok()) {
            header["error_kind"] = errorKindName(response.status);
            header["error"] = response.errorMessage;
        }
        json names = json::array();
        for (const auto& out : response.outputs) {
            names.push_back(out.name);
        }
        header["outputs"] = std::move(names);
        headerText = header.dump(-1, ' ', false, json::error_handler_t::replace);
    } catch (const json::exception& e) {
        return Error{ErrorCode::InternalError,
                     std::string("cannot encode response header: ") + e.what()};
    }

    size_t total = 2 * LENGTH_PREFIX_SIZE + headerText.size();
    for (const auto& out : response.outputs) {
        total += LENGTH_PREFIX_SIZE + out.data.size();
    }

    ByteVector frame;
    frame.reserve(total);
    put_u64(frame, headerText.size());
    frame.insert(frame.end(), headerText.begin(), headerText.end());
    put_u64(frame, response.outputs.size());
    for (const auto& out : response.outputs) {
        put_u64(frame, out.data.size());
        frame.insert(frame.end(), out.data.begin(), out.data.end());
    }
    return frame;
}

// ============================================================================
// Decoding complete frames
// ============================================================================

Result<ConversionRequest> MessageFramer::decode_request(std::span<const uint8_t> frame) const {
    SpanReader reader(frame);

    auto headerLen = reader.u64("header length");
    if (!headerLen)
        return headerLen.error();
    if (auto ok = check_header_length(headerLen.value()); !ok)
        return ok.error();
    auto headerBytes = reader.bytes(headerLen.value(), "header");
    if (!headerBytes)
        return headerBytes.error();
    auto header = parse_request_header(headerBytes.value());
    if (!header)
        return header.error();

    auto sourceLen = reader.u64("source length");
    if (!sourceLen)
        return sourceLen.error();
    if (auto ok = check_payload_length(sourceLen.value()); !ok)
        return ok.error();
    auto source = reader.bytes(sourceLen.value(), "source");
    if (!source)
        return source.error();

    if (reader.remaining() != 0) {
        return framing(std::to_string(reader.remaining()) + " trailing bytes after request frame");
    }

    return build_request(std::move(header).value(),
                         ByteVector(source.value().begin(), source.value().end()));
}

Result<ConversionResponse> MessageFramer::decode_response(std::span<const uint8_t> frame) const {
    SpanReader reader(frame);

    auto headerLen = reader.u64("header length");
    if (!headerLen)
        return headerLen.error();
    if (auto ok = check_header_length(headerLen.value()); !ok)
        return ok.error();
    auto headerBytes = reader.bytes(headerLen.value(), "header");
    if (!headerBytes)
        return headerBytes.error();
    auto header = parse_response_header(headerBytes.value());
    if (!header)
        return header.error();

    auto count = reader.u64("output count");
    if (!count)
        return count.error();
    if (auto ok = check_output_count(count.value()); !ok)
        return ok.error();
    auto& names = header.value().outputNames;
    if (names.size() != count.value()) {
        return framing("response header names " + std::to_string(names.size()) +
                       " outputs but frame carries " + std::to_string(count.value()));
    }

    ConversionResponse response;
    response.status = header.value().status;
    response.errorMessage = std::move(header.value().errorMessage);
    response.outputs.reserve(names.size());
    for (auto& name : names) {
        auto len = reader.u64("output length");
        if (!len)
            return len.error();
        if (auto ok = check_payload_length(len.value()); !ok)
            return ok.error();
        auto data = reader.bytes(len.value(), "output");
        if (!data)
            return data.error();
        response.outputs.push_back(
            OutputFile{std::move(name), ByteVector(data.value().begin(), data.value().end())});
    }

    if (reader.remaining() != 0) {
        return framing(std::to_string(reader.remaining()) + " trailing bytes after response frame");
    }
    return response;
}

} // namespace fconv::ipc
