#pragma once

#include <fconv/core/types.h>
#include <fconv/imaging/image.h>
#include <fconv/imaging/jpeg_codec.h>
#include <fconv/imaging/png_codec.h>

#include <algorithm>
#include <cstdio>
#include <stdexcept>
#include <string>
#include <vector>

namespace fconv::test {

// Deterministic gradient so decoded pixels can be compared approximately
inline imaging::Image gradientImage(uint32_t width, uint32_t height, uint32_t channels = 3) {
    imaging::Image img(width, height, channels);
    for (uint32_t y = 0; y < height; ++y) {
        for (uint32_t x = 0; x < width; ++x) {
            uint8_t* p = img.pixels.data() + y * img.stride() + x * channels;
            const auto r = static_cast<uint8_t>((x * 255) / std::max(1u, width - 1));
            const auto g = static_cast<uint8_t>((y * 255) / std::max(1u, height - 1));
            const auto b = static_cast<uint8_t>(128);
            if (channels >= 3) {
                p[0] = r;
                p[1] = g;
                p[2] = b;
                if (channels == 4)
                    p[3] = 255;
            } else {
                p[0] = r;
                if (channels == 2)
                    p[1] = 255;
            }
        }
    }
    return img;
}

inline ByteVector makePng(uint32_t width, uint32_t height, uint32_t channels = 3) {
    auto encoded = imaging::PngCodec::encode(gradientImage(width, height, channels));
    if (!encoded)
        throw std::runtime_error("test PNG encode failed: " + encoded.error().message);
    return std::move(encoded).value();
}

inline ByteVector makeJpeg(uint32_t width, uint32_t height) {
    auto encoded = imaging::JpegCodec::encode(gradientImage(width, height, 3), 90);
    if (!encoded)
        throw std::runtime_error("test JPEG encode failed: " + encoded.error().message);
    return std::move(encoded).value();
}

/**
 * Build a small valid PDF with `pages` US-letter-quarter pages (153x198 pt).
 * Each page draws a filled rectangle so rendering produces non-blank output.
 * Byte offsets in the xref table are computed, not hard-coded.
 */
inline ByteVector makePdf(int pages) {
    std::vector<std::string> objects;
    std::string kids;
    for (int i = 0; i < pages; ++i) {
        kids += std::to_string(3 + 2 * i) + " 0 R ";
    }
    objects.push_back("<< /Type /Catalog /Pages 2 0 R >>");
    objects.push_back("<< /Type /Pages /Kids [" + kids + "] /Count " + std::to_string(pages) +
                      " >>");
    for (int i = 0; i < pages; ++i) {
        const int contentId = 4 + 2 * i;
        objects.push_back("<< /Type /Page /Parent 2 0 R /MediaBox [0 0 153 198] /Contents " +
                          std::to_string(contentId) + " 0 R /Resources << >> >>");
        const std::string stream = "0.2 0.4 0.8 rg 20 20 " + std::to_string(40 + 10 * i) +
                                   " 100 re f";
        objects.push_back("<< /Length " + std::to_string(stream.size()) + " >>\nstream\n" +
                          stream + "\nendstream");
    }

    std::string pdf = "%PDF-1.4\n";
    std::vector<size_t> offsets;
    for (size_t i = 0; i < objects.size(); ++i) {
        offsets.push_back(pdf.size());
        pdf += std::to_string(i + 1) + " 0 obj\n" + objects[i] + "\nendobj\n";
    }
    const size_t xrefOffset = pdf.size();
    pdf += "xref\n0 " + std::to_string(objects.size() + 1) + "\n0000000000 65535 f \n";
    for (size_t off : offsets) {
        char line[32];
        std::snprintf(line, sizeof(line), "%010zu 00000 n \n", off);
        pdf += line;
    }
    pdf += "trailer\n<< /Size " + std::to_string(objects.size() + 1) +
           " /Root 1 0 R >>\nstartxref\n" + std::to_string(xrefOffset) + "\n%%EOF\n";
    return ByteVector(pdf.begin(), pdf.end());
}

inline ByteVector bytesOf(const std::string& text) {
    return ByteVector(text.begin(), text.end());
}

} // namespace fconv::test
