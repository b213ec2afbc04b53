#pragma once

#include <cstdint>
#include <vector>

namespace qrbackup::image {

using Bytes = std::vector<std::uint8_t>;

// Interleaved 8-bit samples, row-major, no row padding.
struct ImageBuffer {
    int width = 0;
    int height = 0;
    int channels = 0;
    Bytes pixels;

    bool Empty() const noexcept { return width <= 0 || height <= 0; }
    std::size_t Offset(int x, int y) const {
        return (static_cast<std::size_t>(y) * static_cast<std::size_t>(width) + static_cast<std::size_t>(x))
               * static_cast<std::size_t>(channels);
    }
};

inline constexpr std::uint8_t kWhite = 0xFF;
inline constexpr std::uint8_t kBlack = 0x00;

ImageBuffer Blank(int width, int height, int channels, std::uint8_t fill = kWhite);

// Copies src into dst with its top-left corner at (x, y), clipping at dst edges.
// Both buffers must have the same channel count.
void Blit(ImageBuffer& dst, const ImageBuffer& src, int x, int y);

ImageBuffer ToGray(const ImageBuffer& src);

// Exposure in EV stops, contrast as a gain around mid-grey (1.0 = unchanged).
ImageBuffer Adjust(const ImageBuffer& src, double exposure, double contrast);

ImageBuffer Rotate180(const ImageBuffer& src);

}  // namespace qrbackup::image
