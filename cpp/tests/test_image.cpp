#include <gtest/gtest.h>
#include "qrbackup/image.hpp"

#include <stdexcept>

using namespace qrbackup;

namespace {

image::ImageBuffer Ramp(int width, int height) {
    auto out = image::Blank(width, height, 1);
    for (std::size_t i = 0; i < out.pixels.size(); ++i) {
        out.pixels[i] = static_cast<std::uint8_t>(i);
    }
    return out;
}

}  // namespace

TEST(ImageTest, BlankFillsEverySample) {
    auto img = image::Blank(3, 2, 4, 7);
    EXPECT_EQ(img.pixels.size(), 24u);
    EXPECT_EQ(img.pixels, image::Bytes(24, 7));
    EXPECT_THROW(image::Blank(2, 2, 0), std::invalid_argument);
}

TEST(ImageTest, BlitCopiesAtOffset) {
    auto dst = image::Blank(4, 4, 1);
    image::Blit(dst, Ramp(2, 2), 1, 2);
    EXPECT_EQ(dst.pixels[dst.Offset(1, 2)], 0);
    EXPECT_EQ(dst.pixels[dst.Offset(2, 2)], 1);
    EXPECT_EQ(dst.pixels[dst.Offset(1, 3)], 2);
    EXPECT_EQ(dst.pixels[dst.Offset(2, 3)], 3);
    EXPECT_EQ(dst.pixels[dst.Offset(0, 0)], image::kWhite);
}

TEST(ImageTest, BlitClipsAtEdges) {
    auto dst = image::Blank(3, 3, 1);
    image::Blit(dst, Ramp(3, 3), -1, 1);
    EXPECT_EQ(dst.pixels[dst.Offset(0, 1)], 1);
    EXPECT_EQ(dst.pixels[dst.Offset(1, 1)], 2);
    EXPECT_EQ(dst.pixels[dst.Offset(2, 1)], image::kWhite);
    EXPECT_EQ(dst.pixels[dst.Offset(0, 2)], 4);

    auto untouched = image::Blank(3, 3, 1);
    image::Blit(untouched, Ramp(2, 2), 5, 5);
    EXPECT_EQ(untouched.pixels, image::Bytes(9, image::kWhite));
}

TEST(ImageTest, BlitRejectsChannelMismatch) {
    auto dst = image::Blank(2, 2, 1);
    EXPECT_THROW(image::Blit(dst, image::Blank(1, 1, 3), 0, 0), std::invalid_argument);
}

TEST(ImageTest, Rotate180ReversesPixels) {
    auto rotated = image::Rotate180(Ramp(3, 2));
    EXPECT_EQ(rotated.pixels, (image::Bytes{5, 4, 3, 2, 1, 0}));
    EXPECT_EQ(image::Rotate180(rotated).pixels, Ramp(3, 2).pixels);
}

TEST(ImageTest, Rotate180KeepsChannelsTogether) {
    image::ImageBuffer rgb = image::Blank(2, 1, 3);
    rgb.pixels = {1, 2, 3, 4, 5, 6};
    EXPECT_EQ(image::Rotate180(rgb).pixels, (image::Bytes{4, 5, 6, 1, 2, 3}));
}

TEST(ImageTest, AdjustIdentity) {
    auto src = Ramp(16, 16);
    EXPECT_EQ(image::Adjust(src, 0.0, 1.0).pixels, src.pixels);
}

TEST(ImageTest, AdjustExposureAndContrast) {
    auto src = image::Blank(3, 1, 1);
    src.pixels = {0, 64, 200};
    auto brighter = image::Adjust(src, 1.0, 1.0);
    EXPECT_EQ(brighter.pixels[0], 0);
    EXPECT_EQ(brighter.pixels[1], 128);
    EXPECT_EQ(brighter.pixels[2], 255);

    auto harder = image::Adjust(src, 0.0, 3.0);
    EXPECT_EQ(harder.pixels[0], 0);
    EXPECT_EQ(harder.pixels[2], 255);
}

TEST(ImageTest, AdjustLeavesAlpha) {
    auto rgba = image::Blank(1, 1, 4);
    rgba.pixels = {10, 20, 30, 40};
    auto out = image::Adjust(rgba, 2.0, 1.0);
    EXPECT_EQ(out.pixels[3], 40);
    EXPECT_EQ(out.pixels[0], 40);
}

TEST(ImageTest, ToGrayUsesLuma) {
    auto rgb = image::Blank(3, 1, 3);
    rgb.pixels = {255, 255, 255, 0, 0, 0, 255, 0, 0};
    auto gray = image::ToGray(rgb);
    EXPECT_EQ(gray.channels, 1);
    EXPECT_EQ(gray.pixels, (image::Bytes{255, 0, 76}));

    auto ga = image::Blank(1, 1, 2);
    ga.pixels = {90, 255};
    EXPECT_EQ(image::ToGray(ga).pixels, image::Bytes{90});
}
