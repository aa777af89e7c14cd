#include <gtest/gtest.h>

#include <common/test_images.h>
#include <fconv/imaging/pdf_renderer.h>

namespace fconv::test {

using imaging::PdfRenderer;

TEST(PdfRendererTest, CountsPages) {
    auto count = PdfRenderer::pageCount(makePdf(3));
    ASSERT_TRUE(count) << count.error().message;
    EXPECT_EQ(count.value(), 3u);
}

TEST(PdfRendererTest, RendersEveryPageAtZoom) {
    imaging::PdfRenderOptions options;
    options.zoom = 2.0f;
    auto pages = PdfRenderer::renderPages(makePdf(2), options);
    ASSERT_TRUE(pages) << pages.error().message;
    ASSERT_EQ(pages.value().size(), 2u);
    for (const auto& page : pages.value()) {
        EXPECT_EQ(page.channels, 3u);
        EXPECT_NEAR(static_cast<double>(page.width), 306.0, 1.0);
        EXPECT_NEAR(static_cast<double>(page.height), 396.0, 1.0);
        EXPECT_TRUE(page.valid());
    }
}

TEST(PdfRendererTest, PagesAreNotBlank) {
    auto pages = PdfRenderer::renderPages(makePdf(1), {1.0f, 10});
    ASSERT_TRUE(pages) << pages.error().message;
    const auto& px = pages.value().front().pixels;
    bool sawInk = false;
    for (size_t i = 0; i + 2 < px.size(); i += 3) {
        if (px[i] != 255 || px[i + 1] != 255 || px[i + 2] != 255) {
            sawInk = true;
            break;
        }
    }
    EXPECT_TRUE(sawInk);
}

TEST(PdfRendererTest, PageLimitIsInvalidParameter) {
    auto pages = PdfRenderer::renderPages(makePdf(3), {1.0f, 2});
    ASSERT_FALSE(pages);
    EXPECT_EQ(pages.error().code, ErrorCode::InvalidParameter);
}

TEST(PdfRendererTest, GarbageIsDecodeError) {
    auto pages = PdfRenderer::renderPages(bytesOf("%PDF-1.4\nthis is not really a pdf"));
    ASSERT_FALSE(pages);
    EXPECT_EQ(pages.error().code, ErrorCode::DecodeError);

    auto empty = PdfRenderer::renderPages(ByteVector{});
    ASSERT_FALSE(empty);
    EXPECT_EQ(empty.error().code, ErrorCode::DecodeError);
}

} // namespace fconv::test
