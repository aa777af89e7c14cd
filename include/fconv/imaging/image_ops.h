#pragma once

#include <fconv/core/types.h>
#include <fconv/imaging/image.h>

namespace fconv::imaging {

// Luma conversion (cv::COLOR_RGB2GRAY). Alpha is preserved, so RGB -> gray
// and RGBA -> gray+alpha.
Result<Image> toGrayscale(const Image& src);

// Bilinear resample (cv::INTER_LINEAR) to exactly width x height. Targets whose
// sample buffer would exceed MAX_PIXEL_BYTES are rejected as InvalidParameter.
Result<Image> resize(const Image& src, uint32_t width, uint32_t height);

// Drop alpha by compositing over an opaque background level.
Result<Image> flattenAlpha(const Image& src, uint8_t background = 255);

} // namespace fconv::imaging
