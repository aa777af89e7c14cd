#include <fconv/imaging/image_ops.h>
#include <fconv/imaging/jpeg_codec.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <csetjmp>
#include <cstdio>
#include <cstdlib>

// jpeglib.h expects FILE and size_t to be declared first
#include <jpeglib.h>

namespace fconv::imaging {

namespace {

constexpr uint32_t MAX_DIMENSION = 32768;

struct JpegErrorManager {
    jpeg_error_mgr pub;
    std::jmp_buf jump;
    char message[JMSG_LENGTH_MAX];
};

void on_error_exit(j_common_ptr cinfo) {
    auto* err = reinterpret_cast<JpegErrorManager*>(cinfo->err);
    (*cinfo->err->format_message)(cinfo, err->message);
    std::longjmp(err->jump, 1);
}

void on_output_message(j_common_ptr cinfo) {
    char buffer[JMSG_LENGTH_MAX];
    (*cinfo->err->format_message)(cinfo, buffer);
    spdlog::debug("libjpeg: {}", buffer);
}

void install_error_manager(JpegErrorManager& jerr) {
    jerr.message[0] = '\0';
    jpeg_std_error(&jerr.pub);
    jerr.pub.error_exit = on_error_exit;
    jerr.pub.output_message = on_output_message;
}

} // namespace

Result<Image> JpegCodec::decode(std::span<const uint8_t> data) {
    if (data.size() < 3 || data[0] != 0xFF || data[1] != 0xD8) {
        return Error{ErrorCode::DecodeError, "data is not a JPEG image"};
    }

    jpeg_decompress_struct cinfo{};
    JpegErrorManager jerr;
    install_error_manager(jerr);
    cinfo.err = &jerr.pub;

    Image image;
    if (setjmp(jerr.jump)) {
        jpeg_destroy_decompress(&cinfo);
        return Error{ErrorCode::DecodeError, std::string("JPEG decode failed: ") + jerr.message};
    }

    jpeg_create_decompress(&cinfo);
    jpeg_mem_src(&cinfo, const_cast<unsigned char*>(data.data()),
                 static_cast<unsigned long>(data.size()));
    if (jpeg_read_header(&cinfo, TRUE) != JPEG_HEADER_OK) {
        jpeg_destroy_decompress(&cinfo);
        return Error{ErrorCode::DecodeError, "JPEG header is incomplete"};
    }

    switch (cinfo.jpeg_color_space) {
        case JCS_GRAYSCALE: cinfo.out_color_space = JCS_GRAYSCALE; break;
        case JCS_CMYK:
        case JCS_YCCK:
            jpeg_destroy_decompress(&cinfo);
            return Error{ErrorCode::DecodeError, "CMYK JPEG images are not supported"};
        default: cinfo.out_color_space = JCS_RGB; break;
    }

    if (cinfo.image_width > MAX_DIMENSION || cinfo.image_height > MAX_DIMENSION) {
        jpeg_destroy_decompress(&cinfo);
        return Error{ErrorCode::DecodeError, "JPEG dimensions exceed supported size"};
    }

    jpeg_start_decompress(&cinfo);
    image = Image(cinfo.output_width, cinfo.output_height,
                  static_cast<uint32_t>(cinfo.output_components));
    while (cinfo.output_scanline < cinfo.output_height) {
        JSAMPROW row = image.pixels.data() + cinfo.output_scanline * image.stride();
        jpeg_read_scanlines(&cinfo, &row, 1);
    }
    jpeg_finish_decompress(&cinfo);
    jpeg_destroy_decompress(&cinfo);
    return image;
}

Result<ByteVector> JpegCodec::encode(const Image& image, int quality) {
    if (!image.valid()) {
        return Error{ErrorCode::InvalidArgument, "cannot encode an empty or malformed image"};
    }

    Image flat;
    if (image.hasAlpha()) {
        auto flattened = flattenAlpha(image);
        if (!flattened)
            return flattened.error();
        flat = std::move(flattened).value();
    }
    const Image& src = image.hasAlpha() ? flat : image;

    jpeg_compress_struct cinfo{};
    JpegErrorManager jerr;
    install_error_manager(jerr);
    cinfo.err = &jerr.pub;

    unsigned char* buffer = nullptr;
    unsigned long size = 0;

    if (setjmp(jerr.jump)) {
        jpeg_destroy_compress(&cinfo);
        std::free(buffer);
        return Error{ErrorCode::InternalError, std::string("JPEG encode failed: ") + jerr.message};
    }

    jpeg_create_compress(&cinfo);
    jpeg_mem_dest(&cinfo, &buffer, &size);
    cinfo.image_width = src.width;
    cinfo.image_height = src.height;
    cinfo.input_components = static_cast<int>(src.channels);
    cinfo.in_color_space = src.channels == 1 ? JCS_GRAYSCALE : JCS_RGB;
    jpeg_set_defaults(&cinfo);
    jpeg_set_quality(&cinfo, std::clamp(quality, 1, 100), TRUE);

    jpeg_start_compress(&cinfo, TRUE);
    while (cinfo.next_scanline < cinfo.image_height) {
        JSAMPROW row = const_cast<JSAMPROW>(src.pixels.data() + cinfo.next_scanline * src.stride());
        jpeg_write_scanlines(&cinfo, &row, 1);
    }
    jpeg_finish_compress(&cinfo);

    ByteVector out(buffer, buffer + size);
    jpeg_destroy_compress(&cinfo);
    std::free(buffer);
    return out;
}

} // namespace fconv::imaging
