#include <fconv/imaging/image_ops.h>
#include <fconv/imaging/jpeg_codec.h>
#include <fconv/imaging/pdf_renderer.h>
#include <fconv/imaging/png_codec.h>
#include <fconv/server/ConversionDispatcher.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>

namespace fconv::server {

using imaging::Image;
using imaging::ImageFormat;
using ipc::Operation;

ConversionDispatcher::ConversionDispatcher(DispatcherOptions options) : options_(options) {
    options_.jpegQuality = std::clamp(options_.jpegQuality, 1, 100);
    if (options_.pdfZoom <= 0.0f)
        options_.pdfZoom = 1.0f;
    if (options_.maxPdfPages == 0)
        options_.maxPdfPages = 1;
}

std::vector<ImageFormat> ConversionDispatcher::acceptedFormats(Operation op) {
    switch (op) {
        case Operation::PdfToPng: return {ImageFormat::Pdf};
        case Operation::PngToJpg: return {ImageFormat::Png};
        case Operation::JpgToPng: return {ImageFormat::Jpeg};
        case Operation::ToGrayscale:
        case Operation::Resize: return {ImageFormat::Png, ImageFormat::Jpeg};
    }
    return {};
}

ipc::ConversionResponse
ConversionDispatcher::dispatch(const ipc::ConversionRequest& request) const noexcept {
    const auto started = std::chrono::steady_clock::now();
    try {
        auto result = run(request);
        const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                                 std::chrono::steady_clock::now() - started)
                                 .count();
        if (!result) {
            spdlog::info("{} on '{}' failed after {}ms: {} ({})",
                         ipc::operationName(request.operation), request.sourceName, elapsed,
                         result.error().code, result.error().message);
            return ipc::ConversionResponse::failure(result.error());
        }
        spdlog::info("{} on '{}' produced {} output(s) in {}ms",
                     ipc::operationName(request.operation), request.sourceName,
                     result.value().size(), elapsed);
        return ipc::ConversionResponse::success(std::move(result).value());
    } catch (const std::bad_alloc&) {
        spdlog::error("ConversionDispatcher: out of memory during {}",
                      ipc::operationName(request.operation));
        return ipc::ConversionResponse::failure(
            Error{ErrorCode::InternalError, "out of memory during conversion"});
    } catch (const std::exception& e) {
        spdlog::error("ConversionDispatcher: unexpected failure in {}: {}",
                      ipc::operationName(request.operation), e.what());
        return ipc::ConversionResponse::failure(
            Error{ErrorCode::InternalError, std::string("conversion failed: ") + e.what()});
    }
}

auto ConversionDispatcher::run(const ipc::ConversionRequest& request) const -> Result<Outputs> {
    if (auto valid = ipc::validateParams(request.operation, request.params); !valid) {
        return valid.error();
    }

    auto format = checkFormat(request.operation, request.source);
    if (!format)
        return format.error();

    switch (request.operation) {
        case Operation::PdfToPng: return pdfToPng(request.source);
        case Operation::PngToJpg: return pngToJpg(request.source);
        case Operation::JpgToPng: return jpgToPng(request.source);
        case Operation::ToGrayscale: return toGrayscale(request.source, format.value());
        case Operation::Resize:
            return resize(request.source, format.value(),
                          std::get<ipc::ResizeParams>(request.params));
    }
    return Error{ErrorCode::UnsupportedOperation,
                 "unsupported operation " +
                     std::to_string(static_cast<int>(request.operation))};
}

Result<ImageFormat> ConversionDispatcher::checkFormat(Operation op,
                                                      std::span<const uint8_t> source) const {
    const auto accepted = acceptedFormats(op);
    if (accepted.empty()) {
        return Error{ErrorCode::UnsupportedOperation,
                     "unsupported operation " + std::to_string(static_cast<int>(op))};
    }
    if (source.empty()) {
        return Error{ErrorCode::DecodeError, "source is empty"};
    }

    const auto detected = imaging::detectFormat(source);
    if (std::find(accepted.begin(), accepted.end(), detected) == accepted.end()) {
        std::string expected;
        for (auto f : accepted) {
            if (!expected.empty())
                expected += " or ";
            expected += imaging::formatName(f);
        }
        return Error{ErrorCode::DecodeError, std::string(ipc::operationName(op)) +
                                                 " expects " + expected + " input, got " +
                                                 imaging::formatName(detected) + " data"};
    }
    return detected;
}

Result<Image> ConversionDispatcher::decode(std::span<const uint8_t> source,
                                           ImageFormat format) const {
    switch (format) {
        case ImageFormat::Png: return imaging::PngCodec::decode(source);
        case ImageFormat::Jpeg: return imaging::JpegCodec::decode(source);
        default: break;
    }
    return Error{ErrorCode::DecodeError,
                 std::string("no raster decoder for ") + imaging::formatName(format)};
}

Result<ByteVector> ConversionDispatcher::encode(const Image& image, ImageFormat format) const {
    switch (format) {
        case ImageFormat::Png: return imaging::PngCodec::encode(image);
        case ImageFormat::Jpeg: return imaging::JpegCodec::encode(image, options_.jpegQuality);
        default: break;
    }
    return Error{ErrorCode::InternalError,
                 std::string("no raster encoder for ") + imaging::formatName(format)};
}

auto ConversionDispatcher::pdfToPng(std::span<const uint8_t> source) const -> Result<Outputs> {
    imaging::PdfRenderOptions renderOptions;
    renderOptions.zoom = options_.pdfZoom;
    renderOptions.maxPages = options_.maxPdfPages;

    auto pages = imaging::PdfRenderer::renderPages(source, renderOptions);
    if (!pages)
        return pages.error();

    Outputs outputs;
    outputs.reserve(pages.value().size());
    size_t index = 0;
    for (const auto& page : pages.value()) {
        auto png = imaging::PngCodec::encode(page);
        if (!png)
            return png.error();
        outputs.push_back({"page_" + std::to_string(++index) + ".png", std::move(png).value()});
    }
    return outputs;
}

auto ConversionDispatcher::pngToJpg(std::span<const uint8_t> source) const -> Result<Outputs> {
    auto image = decode(source, ImageFormat::Png);
    if (!image)
        return image.error();
    auto jpg = encode(image.value(), ImageFormat::Jpeg);
    if (!jpg)
        return jpg.error();
    Outputs outputs;
    outputs.push_back({"converted.jpg", std::move(jpg).value()});
    return outputs;
}

auto ConversionDispatcher::jpgToPng(std::span<const uint8_t> source) const -> Result<Outputs> {
    auto image = decode(source, ImageFormat::Jpeg);
    if (!image)
        return image.error();
    auto png = encode(image.value(), ImageFormat::Png);
    if (!png)
        return png.error();
    Outputs outputs;
    outputs.push_back({"converted.png", std::move(png).value()});
    return outputs;
}

auto ConversionDispatcher::toGrayscale(std::span<const uint8_t> source, ImageFormat format) const
    -> Result<Outputs> {
    auto image = decode(source, format);
    if (!image)
        return image.error();
    auto gray = imaging::toGrayscale(image.value());
    if (!gray)
        return gray.error();
    auto encoded = encode(gray.value(), format);
    if (!encoded)
        return encoded.error();
    Outputs outputs;
    outputs.push_back({std::string("grayscale.") + imaging::formatExtension(format),
                       std::move(encoded).value()});
    return outputs;
}

auto ConversionDispatcher::resize(std::span<const uint8_t> source, ImageFormat format,
                                  const ipc::ResizeParams& params) const -> Result<Outputs> {
    auto image = decode(source, format);
    if (!image)
        return image.error();
    auto resized = imaging::resize(image.value(), params.width, params.height);
    if (!resized)
        return resized.error();
    auto encoded = encode(resized.value(), format);
    if (!encoded)
        return encoded.error();
    Outputs outputs;
    outputs.push_back({std::string("resized.") + imaging::formatExtension(format),
                       std::move(encoded).value()});
    return outputs;
}

} // namespace fconv::server
