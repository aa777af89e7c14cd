#pragma once

#include <fconv/core/types.h>
#include <fconv/imaging/image.h>

#include <span>

namespace fconv::imaging {

// PNG encode/decode through libpng. Decoding normalizes to 8-bit samples
// (palette expanded, 16-bit stripped) and keeps the gray/alpha layout.
class PngCodec {
public:
    static Result<Image> decode(std::span<const uint8_t> data);
    static Result<ByteVector> encode(const Image& image, int compressionLevel = 6);
};

} // namespace fconv::imaging
