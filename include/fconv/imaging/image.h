#pragma once

#include <fconv/core/types.h>

#include <cstdint>
#include <span>
#include <string_view>
#include <vector>

namespace fconv::imaging {

enum class ImageFormat { Png, Jpeg, Pdf, Unknown };

// Upper bound on the sample buffer of any decoded or produced raster
inline constexpr size_t MAX_PIXEL_BYTES = size_t{1} << 30;

constexpr const char* formatName(ImageFormat f) {
    switch (f) {
        case ImageFormat::Png: return "PNG";
        case ImageFormat::Jpeg: return "JPEG";
        case ImageFormat::Pdf: return "PDF";
        case ImageFormat::Unknown: return "unknown";
    }
    return "unknown";
}

constexpr const char* formatExtension(ImageFormat f) {
    switch (f) {
        case ImageFormat::Png: return "png";
        case ImageFormat::Jpeg: return "jpg";
        case ImageFormat::Pdf: return "pdf";
        case ImageFormat::Unknown: return "bin";
    }
    return "bin";
}

// Identify the container by its leading magic bytes
ImageFormat detectFormat(std::span<const uint8_t> data) noexcept;

/**
 * Decoded raster: 8 bits per sample, rows packed without padding.
 * channels is 1 (gray), 2 (gray+alpha), 3 (RGB) or 4 (RGBA).
 */
struct Image {
    uint32_t width = 0;
    uint32_t height = 0;
    uint32_t channels = 0;
    std::vector<uint8_t> pixels;

    Image() = default;
    Image(uint32_t w, uint32_t h, uint32_t c)
        : width(w), height(h), channels(c), pixels(static_cast<size_t>(w) * h * c) {}

    size_t stride() const noexcept { return static_cast<size_t>(width) * channels; }

    bool valid() const noexcept {
        return width > 0 && height > 0 && channels >= 1 && channels <= 4 &&
               pixels.size() == stride() * height;
    }

    bool hasAlpha() const noexcept { return channels == 2 || channels == 4; }
};

} // namespace fconv::imaging
