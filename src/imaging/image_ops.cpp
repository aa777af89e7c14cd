#include <fconv/imaging/image_ops.h>

#include <spdlog/spdlog.h>

#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>

#include <cstring>
#include <string>
#include <vector>

namespace fconv::imaging {

namespace {

// Borrow the sample buffer; the Mat must not outlive src
cv::Mat asMat(const Image& src) {
    return cv::Mat(static_cast<int>(src.height), static_cast<int>(src.width),
                   CV_8UC(static_cast<int>(src.channels)),
                   const_cast<uint8_t*>(src.pixels.data()), src.stride());
}

Image fromMat(const cv::Mat& mat) {
    Image out(static_cast<uint32_t>(mat.cols), static_cast<uint32_t>(mat.rows),
              static_cast<uint32_t>(mat.channels()));
    if (mat.isContinuous()) {
        std::memcpy(out.pixels.data(), mat.data, out.pixels.size());
    } else {
        for (int y = 0; y < mat.rows; ++y) {
            std::memcpy(out.pixels.data() + static_cast<size_t>(y) * out.stride(), mat.ptr(y),
                        out.stride());
        }
    }
    return out;
}

Error opencvError(const char* what, const cv::Exception& e) {
    spdlog::debug("OpenCV {} failed: {}", what, e.what());
    return Error{ErrorCode::InternalError, std::string(what) + " failed: " + e.err};
}

} // namespace

Result<Image> toGrayscale(const Image& src) {
    if (!src.valid()) {
        return Error{ErrorCode::InvalidArgument, "cannot convert an empty or malformed image"};
    }
    if (src.channels <= 2)
        return src;

    try {
        const cv::Mat in = asMat(src);
        cv::Mat gray;
        cv::cvtColor(in, gray, src.hasAlpha() ? cv::COLOR_RGBA2GRAY : cv::COLOR_RGB2GRAY);
        if (!src.hasAlpha())
            return fromMat(gray);

        cv::Mat alpha;
        cv::extractChannel(in, alpha, 3);
        cv::Mat grayAlpha;
        cv::merge(std::vector<cv::Mat>{gray, alpha}, grayAlpha);
        return fromMat(grayAlpha);
    } catch (const cv::Exception& e) {
        return opencvError("grayscale", e);
    }
}

Result<Image> resize(const Image& src, uint32_t width, uint32_t height) {
    if (!src.valid()) {
        return Error{ErrorCode::InvalidArgument, "cannot resize an empty or malformed image"};
    }
    if (width == 0 || height == 0) {
        return Error{ErrorCode::InvalidParameter, "resize target must be at least 1x1"};
    }
    if (static_cast<size_t>(width) * height * src.channels > MAX_PIXEL_BYTES) {
        return Error{ErrorCode::InvalidParameter,
                     "resize target too large (" + std::to_string(width) + "x" +
                         std::to_string(height) + ")"};
    }
    if (width == src.width && height == src.height)
        return src;

    try {
        cv::Mat out;
        cv::resize(asMat(src), out, cv::Size(static_cast<int>(width), static_cast<int>(height)),
                   0, 0, cv::INTER_LINEAR);
        return fromMat(out);
    } catch (const cv::Exception& e) {
        return opencvError("resize", e);
    }
}

Result<Image> flattenAlpha(const Image& src, uint8_t background) {
    if (!src.hasAlpha())
        return src;
    if (!src.valid()) {
        return Error{ErrorCode::InvalidArgument, "cannot flatten an empty or malformed image"};
    }

    try {
        std::vector<cv::Mat> planes;
        cv::split(asMat(src), planes);
        const cv::Mat alpha = planes.back();
        planes.pop_back();

        // out = color * a/255 + background * (255 - a)/255
        const cv::Mat coverage = 255 - alpha;
        cv::Mat backdrop;
        coverage.convertTo(backdrop, CV_32F, background / 255.0);
        for (auto& plane : planes) {
            cv::Mat blended;
            cv::multiply(plane, alpha, blended, 1.0 / 255.0, CV_32F);
            blended += backdrop;
            blended.convertTo(plane, CV_8U);
        }

        cv::Mat flat;
        cv::merge(planes, flat);
        return fromMat(flat);
    } catch (const cv::Exception& e) {
        return opencvError("alpha flattening", e);
    }
}

} // namespace fconv::imaging
