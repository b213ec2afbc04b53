#include <gtest/gtest.h>
#include "qrbackup/checksum.hpp"

#include <string>

using namespace qrbackup;

namespace {

checksum::Bytes FromString(const std::string& text) {
    return checksum::Bytes(text.begin(), text.end());
}

}  // namespace

TEST(ChecksumTest, Crc32CheckValue) {
    EXPECT_EQ(checksum::Crc32(FromString("123456789")), 0xCBF43926u);
}

TEST(ChecksumTest, Crc32OfEmptyInputIsZero) {
    EXPECT_EQ(checksum::Crc32(checksum::Bytes{}), 0u);
}

TEST(ChecksumTest, Crc32DetectsSingleBitFlip) {
    auto data = FromString("The quick brown fox jumps over the lazy dog");
    EXPECT_EQ(checksum::Crc32(data), 0x414FA339u);
    data[10] ^= 0x01;
    EXPECT_NE(checksum::Crc32(data), 0x414FA339u);
}

TEST(ChecksumTest, Sha256KnownVectors) {
    EXPECT_EQ(checksum::Sha256Hex({}),
              "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
    EXPECT_EQ(checksum::Sha256Hex(FromString("abc")),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}
