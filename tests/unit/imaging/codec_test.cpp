#include <gtest/gtest.h>

#include <common/test_images.h>
#include <fconv/imaging/image.h>
#include <fconv/imaging/jpeg_codec.h>
#include <fconv/imaging/png_codec.h>

#include <cstdlib>

namespace fconv::test {

using imaging::detectFormat;
using imaging::Image;
using imaging::ImageFormat;
using imaging::JpegCodec;
using imaging::PngCodec;

TEST(ImageFormatTest, DetectsByMagicBytes) {
    EXPECT_EQ(detectFormat(makePng(2, 2)), ImageFormat::Png);
    EXPECT_EQ(detectFormat(makeJpeg(2, 2)), ImageFormat::Jpeg);
    EXPECT_EQ(detectFormat(makePdf(1)), ImageFormat::Pdf);
    EXPECT_EQ(detectFormat(bytesOf("hello world")), ImageFormat::Unknown);
    EXPECT_EQ(detectFormat(ByteVector{}), ImageFormat::Unknown);
    EXPECT_EQ(detectFormat(ByteVector{0xFF, 0xD8}), ImageFormat::Unknown);
}

TEST(PngCodecTest, RoundTripIsLossless) {
    auto original = gradientImage(17, 9, 3);
    auto encoded = PngCodec::encode(original);
    ASSERT_TRUE(encoded) << encoded.error().message;

    auto decoded = PngCodec::decode(encoded.value());
    ASSERT_TRUE(decoded) << decoded.error().message;
    EXPECT_EQ(decoded.value().width, 17u);
    EXPECT_EQ(decoded.value().height, 9u);
    EXPECT_EQ(decoded.value().channels, 3u);
    EXPECT_EQ(decoded.value().pixels, original.pixels);
}

TEST(PngCodecTest, KeepsAlphaAndGrayLayouts) {
    for (uint32_t channels : {1u, 2u, 4u}) {
        auto decoded = PngCodec::decode(makePng(5, 4, channels));
        ASSERT_TRUE(decoded) << decoded.error().message;
        EXPECT_EQ(decoded.value().channels, channels);
    }
}

TEST(PngCodecTest, GarbageIsDecodeError) {
    auto decoded = PngCodec::decode(bytesOf("definitely not an image"));
    ASSERT_FALSE(decoded);
    EXPECT_EQ(decoded.error().code, ErrorCode::DecodeError);
}

TEST(PngCodecTest, TruncatedDataIsDecodeError) {
    auto png = makePng(64, 64);
    png.resize(png.size() / 2);
    auto decoded = PngCodec::decode(png);
    ASSERT_FALSE(decoded);
    EXPECT_EQ(decoded.error().code, ErrorCode::DecodeError);
}

TEST(PngCodecTest, EncodeRejectsInvalidImage) {
    Image bad;
    auto encoded = PngCodec::encode(bad);
    EXPECT_FALSE(encoded);
}

TEST(JpegCodecTest, RoundTripKeepsDimensions) {
    auto original = gradientImage(40, 30, 3);
    auto encoded = JpegCodec::encode(original, 95);
    ASSERT_TRUE(encoded) << encoded.error().message;
    EXPECT_EQ(detectFormat(encoded.value()), ImageFormat::Jpeg);

    auto decoded = JpegCodec::decode(encoded.value());
    ASSERT_TRUE(decoded) << decoded.error().message;
    EXPECT_EQ(decoded.value().width, 40u);
    EXPECT_EQ(decoded.value().height, 30u);
    EXPECT_EQ(decoded.value().channels, 3u);

    // Lossy, but a smooth gradient at high quality stays close
    const auto& a = original.pixels;
    const auto& b = decoded.value().pixels;
    ASSERT_EQ(a.size(), b.size());
    long long total = 0;
    for (size_t i = 0; i < a.size(); ++i)
        total += std::abs(static_cast<int>(a[i]) - static_cast<int>(b[i]));
    EXPECT_LT(total / static_cast<long long>(a.size()), 8);
}

TEST(JpegCodecTest, AlphaIsFlattenedOnEncode) {
    auto rgba = gradientImage(8, 8, 4);
    auto encoded = JpegCodec::encode(rgba);
    ASSERT_TRUE(encoded) << encoded.error().message;
    auto decoded = JpegCodec::decode(encoded.value());
    ASSERT_TRUE(decoded);
    EXPECT_EQ(decoded.value().channels, 3u);
}

TEST(JpegCodecTest, GrayscaleStaysSingleChannel) {
    auto gray = gradientImage(8, 8, 1);
    auto encoded = JpegCodec::encode(gray);
    ASSERT_TRUE(encoded) << encoded.error().message;
    auto decoded = JpegCodec::decode(encoded.value());
    ASSERT_TRUE(decoded);
    EXPECT_EQ(decoded.value().channels, 1u);
}

TEST(JpegCodecTest, GarbageIsDecodeError) {
    auto decoded = JpegCodec::decode(bytesOf("\xFF\xD8\xFFgarbage follows the marker"));
    ASSERT_FALSE(decoded);
    EXPECT_EQ(decoded.error().code, ErrorCode::DecodeError);

    auto png = JpegCodec::decode(makePng(4, 4));
    ASSERT_FALSE(png);
    EXPECT_EQ(png.error().code, ErrorCode::DecodeError);
}

} // namespace fconv::test
