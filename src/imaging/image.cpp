#include <fconv/imaging/image.h>

#include <array>
#include <cstring>

namespace fconv::imaging {

namespace {
constexpr std::array<uint8_t, 8> PNG_MAGIC = {0x89, 'P', 'N', 'G', '\r', '\n', 0x1A, '\n'};
constexpr std::array<uint8_t, 3> JPEG_MAGIC = {0xFF, 0xD8, 0xFF};
constexpr std::array<uint8_t, 5> PDF_MAGIC = {'%', 'P', 'D', 'F', '-'};

template <size_t N>
bool starts_with(std::span<const uint8_t> data, const std::array<uint8_t, N>& magic) {
    return data.size() >= N && std::memcmp(data.data(), magic.data(), N) == 0;
}
} // namespace

ImageFormat detectFormat(std::span<const uint8_t> data) noexcept {
    if (starts_with(data, PNG_MAGIC))
        return ImageFormat::Png;
    if (starts_with(data, JPEG_MAGIC))
        return ImageFormat::Jpeg;
    if (starts_with(data, PDF_MAGIC))
        return ImageFormat::Pdf;
    return ImageFormat::Unknown;
}

} // namespace fconv::imaging
