#include "qrbackup/errors.hpp"

#include "qrbackup/constants.hpp"

#include <algorithm>
#include <cstdio>
#include <sstream>

namespace qrbackup {

MissingPartsError::MissingPartsError(const std::string& identifier,
                                     std::vector<std::uint32_t> missing,
                                     std::uint64_t missing_total,
                                     std::vector<std::uint32_t> found)
    : Error("Could not read " + std::to_string(missing_total) + " part(s) of file " + identifier
            + ". Missing parts: " + FormatIndexList(missing, missing_total)
            + " (found parts: " + FormatIndexList(found) + ")"),
      missing_(std::move(missing)),
      missing_total_(missing_total),
      found_(std::move(found)) {}

CorruptionError::CorruptionError(const std::string& identifier, std::uint32_t expected, std::uint32_t actual)
    : Error("Decoded file " + identifier + " has invalid checksum (expected 0x" + FormatCrc(expected)
            + ", got 0x" + FormatCrc(actual) + "). File corrupted!"),
      expected_(expected),
      actual_(actual) {}

std::string FormatIndexList(const std::vector<std::uint32_t>& indices, std::uint64_t total) {
    const std::size_t shown = std::min(indices.size(), constants::kMaxListedParts);
    std::ostringstream oss;
    oss << '[';
    for (std::size_t i = 0; i < shown; ++i) {
        if (i > 0) {
            oss << ", ";
        }
        oss << indices[i];
    }
    if (total > shown) {
        oss << (shown > 0 ? ", " : "") << "... " << (total - shown) << " more";
    }
    oss << ']';
    return oss.str();
}

std::string FormatIndexList(const std::vector<std::uint32_t>& indices) {
    return FormatIndexList(indices, indices.size());
}

std::string FormatCrc(std::uint32_t crc) {
    char buffer[9];
    std::snprintf(buffer, sizeof(buffer), "%08X", static_cast<unsigned int>(crc));
    return std::string(buffer);
}

}  // namespace qrbackup
