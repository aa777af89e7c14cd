#include <fconv/imaging/pdf_renderer.h>

#include <spdlog/spdlog.h>

#include <mupdf/fitz.h>

#include <cstring>
#include <new>

namespace fconv::imaging {

namespace {

// Copy the pixmap rows into a packed Image; false on allocation failure
bool copy_pixmap(fz_context* ctx, fz_pixmap* pix, std::vector<Image>& pages) noexcept {
    try {
        const auto width = static_cast<uint32_t>(fz_pixmap_width(ctx, pix));
        const auto height = static_cast<uint32_t>(fz_pixmap_height(ctx, pix));
        const auto channels = static_cast<uint32_t>(fz_pixmap_components(ctx, pix));
        const auto srcStride = static_cast<size_t>(fz_pixmap_stride(ctx, pix));
        const unsigned char* samples = fz_pixmap_samples(ctx, pix);

        Image page(width, height, channels);
        for (uint32_t y = 0; y < height; ++y) {
            std::memcpy(page.pixels.data() + y * page.stride(), samples + y * srcStride,
                        page.stride());
        }
        pages.push_back(std::move(page));
        return true;
    } catch (const std::bad_alloc&) {
        return false;
    }
}

class ContextGuard {
public:
    ContextGuard() : ctx_(fz_new_context(nullptr, nullptr, FZ_STORE_DEFAULT)) {}
    ~ContextGuard() {
        if (ctx_)
            fz_drop_context(ctx_);
    }
    ContextGuard(const ContextGuard&) = delete;
    ContextGuard& operator=(const ContextGuard&) = delete;

    fz_context* get() const noexcept { return ctx_; }

private:
    fz_context* ctx_;
};

} // namespace

Result<std::vector<Image>> PdfRenderer::renderPages(std::span<const uint8_t> pdf,
                                                    const PdfRenderOptions& options) {
    if (pdf.empty()) {
        return Error{ErrorCode::DecodeError, "PDF document is empty"};
    }

    ContextGuard guard;
    fz_context* ctx = guard.get();
    if (!ctx)
        return Error{ErrorCode::InternalError, "cannot create MuPDF context"};

    std::vector<Image> pages;
    std::string failure;
    int pageCount = 0;
    bool tooManyPages = false;
    bool failed = false;

    fz_stream* stm = nullptr;
    fz_document* doc = nullptr;
    fz_pixmap* pix = nullptr;
    fz_var(stm);
    fz_var(doc);
    fz_var(pix);
    fz_var(pageCount);
    fz_var(tooManyPages);

    fz_try(ctx) {
        fz_register_document_handlers(ctx);
        stm = fz_open_memory(ctx, pdf.data(), pdf.size());
        doc = fz_open_document_with_stream(ctx, "application/pdf", stm);
        pageCount = fz_count_pages(ctx, doc);
        if (pageCount <= 0) {
            fz_throw(ctx, FZ_ERROR_GENERIC, "document has no pages");
        }
        if (static_cast<size_t>(pageCount) > options.maxPages) {
            tooManyPages = true;
        } else {
            const fz_matrix ctm = fz_scale(options.zoom, options.zoom);
            for (int i = 0; i < pageCount; ++i) {
                pix = fz_new_pixmap_from_page_number(ctx, doc, i, ctm, fz_device_rgb(ctx), 0);
                if (!copy_pixmap(ctx, pix, pages)) {
                    fz_throw(ctx, FZ_ERROR_GENERIC, "out of memory copying page %d", i + 1);
                }
                fz_drop_pixmap(ctx, pix);
                pix = nullptr;
            }
        }
    }
    fz_always(ctx) {
        fz_drop_pixmap(ctx, pix);
        fz_drop_document(ctx, doc);
        fz_drop_stream(ctx, stm);
    }
    fz_catch(ctx) {
        failed = true;
        failure = fz_caught_message(ctx);
    }

    if (failed) {
        spdlog::debug("MuPDF failed: {}", failure);
        return Error{ErrorCode::DecodeError, "PDF could not be rendered: " + failure};
    }
    if (tooManyPages) {
        return Error{ErrorCode::InvalidParameter,
                     "document has too many pages (" + std::to_string(pageCount) + " > " +
                         std::to_string(options.maxPages) + ")"};
    }
    spdlog::debug("Rendered {} PDF page(s) at zoom {}", pages.size(), options.zoom);
    return pages;
}

Result<size_t> PdfRenderer::pageCount(std::span<const uint8_t> pdf) {
    ContextGuard guard;
    fz_context* ctx = guard.get();
    if (!ctx)
        return Error{ErrorCode::InternalError, "cannot create MuPDF context"};

    int count = 0;
    bool failed = false;
    std::string failure;
    fz_stream* stm = nullptr;
    fz_document* doc = nullptr;
    fz_var(stm);
    fz_var(doc);
    fz_var(count);

    fz_try(ctx) {
        fz_register_document_handlers(ctx);
        stm = fz_open_memory(ctx, pdf.data(), pdf.size());
        doc = fz_open_document_with_stream(ctx, "application/pdf", stm);
        count = fz_count_pages(ctx, doc);
    }
    fz_always(ctx) {
        fz_drop_document(ctx, doc);
        fz_drop_stream(ctx, stm);
    }
    fz_catch(ctx) {
        failed = true;
        failure = fz_caught_message(ctx);
    }

    if (failed)
        return Error{ErrorCode::DecodeError, "PDF could not be opened: " + failure};
    return static_cast<size_t>(count);
}

} // namespace fconv::imaging
