#include <fconv/imaging/png_codec.h>

#include <spdlog/spdlog.h>
#include <png.h>

#include <array>
#include <cstdio>
#include <cstring>
#include <new>

namespace fconv::imaging {

namespace {

// Decoded images larger than this are rejected before allocation
constexpr uint32_t MAX_DIMENSION = 32768;

struct PngErrorSink {
    std::array<char, 256> message{};
};

struct ReadCursor {
    std::span<const uint8_t> data;
    size_t offset = 0;
};

void on_error(png_structp png, png_const_charp msg) {
    if (auto* sink = static_cast<PngErrorSink*>(png_get_error_ptr(png))) {
        std::snprintf(sink->message.data(), sink->message.size(), "%s", msg ? msg : "unknown");
    }
    png_longjmp(png, 1);
}

void on_warning(png_structp, png_const_charp msg) {
    spdlog::debug("libpng: {}", msg ? msg : "");
}

void read_callback(png_structp png, png_bytep out, png_size_t len) {
    auto* cursor = static_cast<ReadCursor*>(png_get_io_ptr(png));
    if (cursor->data.size() - cursor->offset < len) {
        png_error(png, "unexpected end of PNG data");
    }
    std::memcpy(out, cursor->data.data() + cursor->offset, len);
    cursor->offset += len;
}

void write_callback(png_structp png, png_bytep data, png_size_t len) {
    auto* out = static_cast<ByteVector*>(png_get_io_ptr(png));
    bool grown = true;
    try {
        out->insert(out->end(), data, data + len);
    } catch (const std::bad_alloc&) {
        grown = false;
    }
    if (!grown)
        png_error(png, "out of memory while writing PNG");
}

void flush_callback(png_structp) {}

} // namespace

Result<Image> PngCodec::decode(std::span<const uint8_t> data) {
    if (data.size() < 8 || png_sig_cmp(data.data(), 0, 8) != 0) {
        return Error{ErrorCode::DecodeError, "data is not a PNG image"};
    }

    PngErrorSink sink;
    png_structp png = png_create_read_struct(PNG_LIBPNG_VER_STRING, &sink, on_error, on_warning);
    if (!png)
        return Error{ErrorCode::InternalError, "png_create_read_struct failed"};
    png_infop info = png_create_info_struct(png);
    if (!info) {
        png_destroy_read_struct(&png, nullptr, nullptr);
        return Error{ErrorCode::InternalError, "png_create_info_struct failed"};
    }

    ReadCursor cursor{data, 0};
    Image image;
    std::vector<png_bytep> rows;
    volatile bool tooLarge = false;

    if (setjmp(png_jmpbuf(png))) {
        png_destroy_read_struct(&png, &info, nullptr);
        if (tooLarge)
            return Error{ErrorCode::DecodeError, "PNG dimensions exceed supported size"};
        return Error{ErrorCode::DecodeError,
                     std::string("PNG decode failed: ") + sink.message.data()};
    }

    png_set_read_fn(png, &cursor, read_callback);
    png_set_user_limits(png, MAX_DIMENSION, MAX_DIMENSION);
    png_read_info(png, info);

    const auto colorType = png_get_color_type(png, info);
    const auto bitDepth = png_get_bit_depth(png, info);
    if (colorType == PNG_COLOR_TYPE_PALETTE)
        png_set_palette_to_rgb(png);
    if (colorType == PNG_COLOR_TYPE_GRAY && bitDepth < 8)
        png_set_expand_gray_1_2_4_to_8(png);
    if (png_get_valid(png, info, PNG_INFO_tRNS))
        png_set_tRNS_to_alpha(png);
    if (bitDepth == 16)
        png_set_strip_16(png);
    png_set_interlace_handling(png);
    png_read_update_info(png, info);

    const uint32_t width = png_get_image_width(png, info);
    const uint32_t height = png_get_image_height(png, info);
    const uint32_t channels = png_get_channels(png, info);
    if (static_cast<size_t>(width) * height * channels > MAX_PIXEL_BYTES) {
        tooLarge = true;
        png_error(png, "image too large");
    }

    image = Image(width, height, channels);
    rows.resize(height);
    for (uint32_t y = 0; y < height; ++y) {
        rows[y] = image.pixels.data() + y * image.stride();
    }
    png_read_image(png, rows.data());
    png_read_end(png, nullptr);
    png_destroy_read_struct(&png, &info, nullptr);
    return image;
}

Result<ByteVector> PngCodec::encode(const Image& image, int compressionLevel) {
    if (!image.valid()) {
        return Error{ErrorCode::InvalidArgument, "cannot encode an empty or malformed image"};
    }

    int colorType = PNG_COLOR_TYPE_RGB;
    switch (image.channels) {
        case 1: colorType = PNG_COLOR_TYPE_GRAY; break;
        case 2: colorType = PNG_COLOR_TYPE_GRAY_ALPHA; break;
        case 3: colorType = PNG_COLOR_TYPE_RGB; break;
        case 4: colorType = PNG_COLOR_TYPE_RGB_ALPHA; break;
    }

    PngErrorSink sink;
    png_structp png = png_create_write_struct(PNG_LIBPNG_VER_STRING, &sink, on_error, on_warning);
    if (!png)
        return Error{ErrorCode::InternalError, "png_create_write_struct failed"};
    png_infop info = png_create_info_struct(png);
    if (!info) {
        png_destroy_write_struct(&png, nullptr);
        return Error{ErrorCode::InternalError, "png_create_info_struct failed"};
    }

    ByteVector out;
    std::vector<png_bytep> rows(image.height);
    for (uint32_t y = 0; y < image.height; ++y) {
        rows[y] = const_cast<png_bytep>(image.pixels.data() + y * image.stride());
    }

    if (setjmp(png_jmpbuf(png))) {
        png_destroy_write_struct(&png, &info);
        return Error{ErrorCode::InternalError,
                     std::string("PNG encode failed: ") + sink.message.data()};
    }

    png_set_write_fn(png, &out, write_callback, flush_callback);
    png_set_compression_level(png, compressionLevel);
    png_set_IHDR(png, info, image.width, image.height, 8, colorType, PNG_INTERLACE_NONE,
                 PNG_COMPRESSION_TYPE_DEFAULT, PNG_FILTER_TYPE_DEFAULT);
    png_write_info(png, info);
    png_write_image(png, rows.data());
    png_write_end(png, nullptr);
    png_destroy_write_struct(&png, &info);
    return out;
}

} // namespace fconv::imaging
