#pragma once

#include <fconv/core/types.h>
#include <fconv/imaging/image.h>

#include <span>
#include <vector>

namespace fconv::imaging {

struct PdfRenderOptions {
    float zoom = 3.0f; // 1.0 = 72 dpi
    size_t maxPages = 500;
};

/**
 * Rasterize every page of a PDF with MuPDF.
 *
 * Pages come back as RGB images in document order. Each call owns its own
 * fz_context, so concurrent calls from different threads are independent.
 */
class PdfRenderer {
public:
    static Result<std::vector<Image>> renderPages(std::span<const uint8_t> pdf,
                                                  const PdfRenderOptions& options = {});
    static Result<size_t> pageCount(std::span<const uint8_t> pdf);
};

} // namespace fconv::imaging
