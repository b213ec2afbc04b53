#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace qrbackup::constants {

inline constexpr std::array<std::uint8_t, 4> kFrameMagic = {0x5C, 0xA1, 0x10, 0xCF};
// Base32 rendering of kFrameMagic; every transport string starts with it.
inline constexpr std::string_view kTransportPrefix = "LSQRBT";

// magic + checksum + header size + count + index
inline constexpr std::size_t kFixedHeaderLen = 20;
// fixed header + at least one name byte + NUL terminator
inline constexpr std::size_t kMinHeaderLen = kFixedHeaderLen + 1 + 1;

struct LevelBudget {
    char level;
    std::size_t budget;
};

// Frame bytes per symbol, densest first. Each budget is a multiple of five so the
// base32 transport string carries no '=' padding and stays QR alphanumeric.
inline constexpr std::array<LevelBudget, 4> kLevelBudgets = {{
    {'L', 2680},
    {'M', 2115},
    {'Q', 1510},
    {'H', 1155},
}};

inline constexpr std::string_view kOutputPrefix = "lsqrbt_";
inline constexpr std::string_view kPagePrefix = "lsqrbt_page_";
inline constexpr std::string_view kCorruptedSuffix = ".corrupted";

// Longest part index list kept in errors and printed in reports.
inline constexpr std::size_t kMaxListedParts = 32;

inline constexpr int kModuleScale = 10;
inline constexpr int kQuietZoneModules = 4;
inline constexpr int kPageColumnGutter = 100;

inline constexpr std::string_view kEngineVersion = "1.1.0";

}  // namespace qrbackup::constants
