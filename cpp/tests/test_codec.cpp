#include <gtest/gtest.h>
#include "qrbackup/codec.hpp"
#include "qrbackup/constants.hpp"

#include <string>

using namespace qrbackup;

namespace {

std::vector<std::uint8_t> FromString(const std::string& text) {
    return std::vector<std::uint8_t>(text.begin(), text.end());
}

}  // namespace

// ============================================================================
// RFC 4648 test vectors
// ============================================================================

TEST(Base32Test, EncodesRfcVectors) {
    EXPECT_EQ(codec::Base32Encode(FromString("")), "");
    EXPECT_EQ(codec::Base32Encode(FromString("f")), "MY======");
    EXPECT_EQ(codec::Base32Encode(FromString("fo")), "MZXQ====");
    EXPECT_EQ(codec::Base32Encode(FromString("foo")), "MZXW6===");
    EXPECT_EQ(codec::Base32Encode(FromString("foob")), "MZXW6YQ=");
    EXPECT_EQ(codec::Base32Encode(FromString("fooba")), "MZXW6YTB");
    EXPECT_EQ(codec::Base32Encode(FromString("foobar")), "MZXW6YTBOI======");
}

TEST(Base32Test, DecodesRfcVectors) {
    bool ok = false;
    EXPECT_EQ(codec::Base32Decode("MZXW6YTBOI======", &ok), FromString("foobar"));
    EXPECT_TRUE(ok);
    EXPECT_EQ(codec::Base32Decode("MZXW6YQ=", &ok), FromString("foob"));
    EXPECT_TRUE(ok);
}

TEST(Base32Test, DecodeAcceptsLowerCaseAndWhitespace) {
    bool ok = false;
    EXPECT_EQ(codec::Base32Decode("mzxw 6ytb\n", &ok), FromString("fooba"));
    EXPECT_TRUE(ok);
}

TEST(Base32Test, DecodeRejectsCharactersOutsideAlphabet) {
    bool ok = true;
    auto decoded = codec::Base32Decode("MZXW1YTB", &ok);
    EXPECT_FALSE(ok);
    EXPECT_TRUE(decoded.empty());
}

TEST(Base32Test, DecodeAcceptsMissingPadding) {
    bool ok = false;
    EXPECT_EQ(codec::Base32Decode("MY", &ok), FromString("f"));
    EXPECT_TRUE(ok);
}

TEST(Base32Test, DecodeRejectsMalformedTail) {
    bool ok = true;
    // Non-zero bits below the last byte.
    EXPECT_TRUE(codec::Base32Decode("MZ======", &ok).empty());
    EXPECT_FALSE(ok);
    ok = true;
    // No length decodes to 3 symbols in a quantum.
    codec::Base32Decode("MZX", &ok);
    EXPECT_FALSE(ok);
    ok = true;
    // Data after padding.
    codec::Base32Decode("MY==MY==", &ok);
    EXPECT_FALSE(ok);
    ok = true;
    // Padding that does not complete the quantum.
    codec::Base32Decode("MY=", &ok);
    EXPECT_FALSE(ok);
}

TEST(Base32Test, FrameMagicRendersAsTransportPrefix) {
    std::vector<std::uint8_t> magic(constants::kFrameMagic.begin(), constants::kFrameMagic.end());
    magic.push_back(0x00);
    std::string encoded = codec::Base32Encode(magic);
    EXPECT_EQ(encoded.substr(0, constants::kTransportPrefix.size()), constants::kTransportPrefix);
}

// ============================================================================
// Transcoder interface
// ============================================================================

TEST(Base32TranscoderTest, BudgetSizedFramesCarryNoPadding) {
    codec::Base32Transcoder transcoder;
    for (const auto& entry : constants::kLevelBudgets) {
        std::vector<std::uint8_t> frame(entry.budget, 0xA5);
        std::string text = transcoder.Encode(frame);
        EXPECT_EQ(text.find('='), std::string::npos) << "level " << entry.level;
        EXPECT_EQ(text.size(), entry.budget * 8 / 5);
    }
}

TEST(Base32TranscoderTest, DecodeReturnsNulloptOnGarbage) {
    codec::Base32Transcoder transcoder;
    EXPECT_FALSE(transcoder.Decode("LSQRBT!!").has_value());
    auto decoded = transcoder.Decode(transcoder.Encode(FromString("payload")));
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(*decoded, FromString("payload"));
}
