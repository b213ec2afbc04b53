#include "qrbackup/image.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <stdexcept>

namespace qrbackup::image {

namespace {

std::array<std::uint8_t, 256> BuildAdjustTable(double exposure, double contrast) {
    std::array<std::uint8_t, 256> table{};
    const double gain = std::pow(2.0, exposure);
    for (int i = 0; i < 256; ++i) {
        double value = (static_cast<double>(i) / 255.0) * gain;
        value = (value - 0.5) * contrast + 0.5;
        value = std::clamp(value, 0.0, 1.0);
        table[static_cast<std::size_t>(i)] = static_cast<std::uint8_t>(std::lround(value * 255.0));
    }
    return table;
}

}  // namespace

ImageBuffer Blank(int width, int height, int channels, std::uint8_t fill) {
    if (width < 0 || height < 0 || channels <= 0) {
        throw std::invalid_argument("Invalid image dimensions");
    }
    ImageBuffer out;
    out.width = width;
    out.height = height;
    out.channels = channels;
    out.pixels.assign(static_cast<std::size_t>(width) * static_cast<std::size_t>(height)
                          * static_cast<std::size_t>(channels),
                      fill);
    return out;
}

void Blit(ImageBuffer& dst, const ImageBuffer& src, int x, int y) {
    if (dst.channels != src.channels) {
        throw std::invalid_argument("Blit requires matching channel counts");
    }
    int x0 = std::max(0, x);
    int y0 = std::max(0, y);
    int x1 = std::min(dst.width, x + src.width);
    int y1 = std::min(dst.height, y + src.height);
    if (x0 >= x1 || y0 >= y1) {
        return;
    }
    const std::size_t row_bytes = static_cast<std::size_t>(x1 - x0) * static_cast<std::size_t>(dst.channels);
    for (int row = y0; row < y1; ++row) {
        const std::uint8_t* from = src.pixels.data() + src.Offset(x0 - x, row - y);
        std::uint8_t* to = dst.pixels.data() + dst.Offset(x0, row);
        std::copy(from, from + row_bytes, to);
    }
}

ImageBuffer ToGray(const ImageBuffer& src) {
    if (src.channels == 1) {
        return src;
    }
    ImageBuffer out = Blank(src.width, src.height, 1);
    const std::size_t total = static_cast<std::size_t>(src.width) * static_cast<std::size_t>(src.height);
    for (std::size_t i = 0; i < total; ++i) {
        const std::uint8_t* px = src.pixels.data() + i * static_cast<std::size_t>(src.channels);
        if (src.channels < 3) {
            out.pixels[i] = px[0];
            continue;
        }
        // ITU-R BT.601 luma
        int luma = (299 * px[0] + 587 * px[1] + 114 * px[2] + 500) / 1000;
        out.pixels[i] = static_cast<std::uint8_t>(luma);
    }
    return out;
}

ImageBuffer Adjust(const ImageBuffer& src, double exposure, double contrast) {
    auto table = BuildAdjustTable(exposure, contrast);
    ImageBuffer out = src;
    for (std::size_t i = 0; i < out.pixels.size(); ++i) {
        // leave alpha untouched
        if (out.channels == 4 && i % 4 == 3) {
            continue;
        }
        out.pixels[i] = table[out.pixels[i]];
    }
    return out;
}

ImageBuffer Rotate180(const ImageBuffer& src) {
    ImageBuffer out = src;
    const std::size_t total = static_cast<std::size_t>(src.width) * static_cast<std::size_t>(src.height);
    const std::size_t channels = static_cast<std::size_t>(src.channels);
    for (std::size_t i = 0; i < total; ++i) {
        const std::size_t from = (total - 1 - i) * channels;
        std::copy(src.pixels.begin() + static_cast<std::ptrdiff_t>(from),
                  src.pixels.begin() + static_cast<std::ptrdiff_t>(from + channels),
                  out.pixels.begin() + static_cast<std::ptrdiff_t>(i * channels));
    }
    return out;
}

}  // namespace qrbackup::image
