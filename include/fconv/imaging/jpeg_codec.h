#pragma once

#include <fconv/core/types.h>
#include <fconv/imaging/image.h>

#include <span>

namespace fconv::imaging {

// JPEG encode/decode through libjpeg. JPEG has no alpha: encode flattens
// transparent pixels onto white, the way image editors export.
class JpegCodec {
public:
    static constexpr int DEFAULT_QUALITY = 90;

    static Result<Image> decode(std::span<const uint8_t> data);
    static Result<ByteVector> encode(const Image& image, int quality = DEFAULT_QUALITY);
};

} // namespace fconv::imaging
