#include <gtest/gtest.h>
#include "qrbackup/constants.hpp"
#include "qrbackup/errors.hpp"
#include "qrbackup/frame.hpp"

using namespace qrbackup;

namespace {

frame::Bytes Body(std::initializer_list<std::uint8_t> bytes) {
    return frame::Bytes(bytes);
}

}  // namespace

// ============================================================================
// Encoding layout
// ============================================================================

TEST(FrameTest, EncodeProducesCanonicalLayout) {
    auto encoded = frame::Encode("a.txt", 0x11223344u, 3, 2, 2, Body({0xDE, 0xAD}));

    frame::Bytes expected = {
        0x5C, 0xA1, 0x10, 0xCF,              // magic
        0x44, 0x33, 0x22, 0x11,              // checksum
        0x1C, 0x00, 0x00, 0x00,              // header size 20 + 5 + 1 + 2
        0x03, 0x00, 0x00, 0x00,              // count
        0x02, 0x00, 0x00, 0x00,              // index
        'a', '.', 't', 'x', 't', 0x00,       // name
        0x00, 0x00,                          // padding
        0xDE, 0xAD,                          // body
    };
    EXPECT_EQ(encoded, expected);
}

TEST(FrameTest, HeaderSizeIsComputedFromFields) {
    frame::Frame part;
    part.file_name = "photo.jpg";
    part.padding = 7;
    part.body = frame::Bytes(11, 0x42);
    EXPECT_EQ(part.HeaderSize(), 20u + 9u + 1u + 7u);
    EXPECT_EQ(part.EncodedSize(), part.HeaderSize() + 11u);
    EXPECT_EQ(frame::Encode(part).size(), part.EncodedSize());
}

TEST(FrameTest, EncodeRejectsEmptyName) {
    EXPECT_THROW(frame::Encode("", 0, 1, 0, 0, {}), FormatError);
}

TEST(FrameTest, EncodeRejectsNameWithNul) {
    EXPECT_THROW(frame::Encode(std::string("a\0b", 3), 0, 1, 0, 0, {}), FormatError);
}

// ============================================================================
// Decoding
// ============================================================================

TEST(FrameTest, DecodeRecoversAllFields) {
    auto encoded = frame::Encode("notes.md", 0xCAFEBABEu, 9, 4, 3, Body({1, 2, 3, 4}));
    frame::Frame part = frame::Decode(encoded);
    EXPECT_EQ(part.checksum, 0xCAFEBABEu);
    EXPECT_EQ(part.count, 9u);
    EXPECT_EQ(part.index, 4u);
    EXPECT_EQ(part.file_name, "notes.md");
    EXPECT_EQ(part.padding, 3u);
    EXPECT_EQ(part.body, Body({1, 2, 3, 4}));
}

TEST(FrameTest, DecodeAcceptsEmptyBody) {
    auto encoded = frame::Encode("x", 0, 1, 0, 0, {});
    ASSERT_EQ(encoded.size(), constants::kMinHeaderLen);
    frame::Frame part = frame::Decode(encoded);
    EXPECT_EQ(part.file_name, "x");
    EXPECT_TRUE(part.body.empty());
}

TEST(FrameTest, DecodeKeepsUtf8Names) {
    const std::string name = "\xC5\xBC\xC3\xB3\xC5\x82w.txt";
    frame::Frame part = frame::Decode(frame::Encode(name, 1, 1, 0, 0, Body({9})));
    EXPECT_EQ(part.file_name, name);
}

TEST(FrameTest, DecodeRejectsShortInput) {
    auto encoded = frame::Encode("x", 0, 1, 0, 0, {});
    encoded.pop_back();
    EXPECT_THROW(frame::Decode(encoded), FormatError);
}

TEST(FrameTest, DecodeRejectsWrongMagic) {
    auto encoded = frame::Encode("file", 0, 1, 0, 0, Body({1}));
    encoded[0] ^= 0xFF;
    EXPECT_THROW(frame::Decode(encoded), FormatError);
}

TEST(FrameTest, DecodeRejectsHeaderSizeBelowMinimum) {
    auto encoded = frame::Encode("file", 0, 1, 0, 0, Body({1, 2, 3}));
    encoded[8] = 21;
    EXPECT_THROW(frame::Decode(encoded), FormatError);
}

TEST(FrameTest, DecodeRejectsHeaderSizeBeyondInput) {
    auto encoded = frame::Encode("file", 0, 1, 0, 0, Body({1, 2, 3}));
    encoded[8] = 200;
    EXPECT_THROW(frame::Decode(encoded), FormatError);
}

TEST(FrameTest, DecodeRejectsEmptyName) {
    auto encoded = frame::Encode("file", 0, 1, 0, 0, Body({1}));
    encoded[20] = 0;
    EXPECT_THROW(frame::Decode(encoded), FormatError);
}

TEST(FrameTest, DecodeRejectsMissingTerminator) {
    auto encoded = frame::Encode("file", 0, 1, 0, 0, Body({1}));
    // header size now points one byte into the body
    encoded[8] = static_cast<std::uint8_t>(encoded[8] + 1);
    EXPECT_THROW(frame::Decode(encoded), FormatError);
}

TEST(FrameTest, BodyStartsAtHeaderSize) {
    auto encoded = frame::Encode("file", 0, 1, 0, 0, Body({0, 7, 8}));
    // Declare the body's leading zero byte as padding instead.
    encoded[8] = static_cast<std::uint8_t>(encoded[8] + 1);
    frame::Frame part = frame::Decode(encoded);
    EXPECT_EQ(part.padding, 1u);
    EXPECT_EQ(part.body, Body({7, 8}));
}

TEST(FrameTest, IdentifierUsesUpperCaseHexChecksum) {
    EXPECT_EQ(frame::Identifier("a.zip", 0x00ABCDEFu), "a.zip 00ABCDEF");
}
