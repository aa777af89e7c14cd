#pragma once

#include <fconv/core/types.h>
#include <fconv/imaging/image.h>
#include <fconv/ipc/conversion_protocol.h>

#include <span>
#include <vector>

namespace fconv::server {

struct DispatcherOptions {
    float pdfZoom = 3.0f;
    int jpegQuality = 90;
    size_t maxPdfPages = 500;
};

/**
 * Maps a decoded request onto the imaging providers.
 *
 * Validation runs in a fixed order: parameters, then the input format sniffed
 * from the source bytes, then the provider itself. dispatch() never throws;
 * every failure comes back as an error response carrying its kind.
 *
 * Stateless apart from its options, so one instance serves all connections.
 */
class ConversionDispatcher {
public:
    explicit ConversionDispatcher(DispatcherOptions options = {});

    ipc::ConversionResponse dispatch(const ipc::ConversionRequest& request) const noexcept;

    const DispatcherOptions& options() const noexcept { return options_; }

    // Source formats each operation accepts
    static std::vector<imaging::ImageFormat> acceptedFormats(ipc::Operation op);

private:
    using Outputs = std::vector<ipc::OutputFile>;

    Result<Outputs> run(const ipc::ConversionRequest& request) const;
    Result<imaging::ImageFormat> checkFormat(ipc::Operation op,
                                             std::span<const uint8_t> source) const;

    Result<Outputs> pdfToPng(std::span<const uint8_t> source) const;
    Result<Outputs> pngToJpg(std::span<const uint8_t> source) const;
    Result<Outputs> jpgToPng(std::span<const uint8_t> source) const;
    Result<Outputs> toGrayscale(std::span<const uint8_t> source, imaging::ImageFormat format) const;
    Result<Outputs> resize(std::span<const uint8_t> source, imaging::ImageFormat format,
                           const ipc::ResizeParams& params) const;

    Result<imaging::Image> decode(std::span<const uint8_t> source,
                                  imaging::ImageFormat format) const;
    Result<ByteVector> encode(const imaging::Image& image, imaging::ImageFormat format) const;

    DispatcherOptions options_;
};

} // namespace fconv::server
