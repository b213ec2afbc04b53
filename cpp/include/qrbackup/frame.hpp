#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace qrbackup::frame {

using Bytes = std::vector<std::uint8_t>;

struct Frame {
    std::uint32_t checksum = 0;
    std::uint32_t count = 0;
    std::uint32_t index = 0;
    std::string file_name;
    std::size_t padding = 0;
    Bytes body;

    std::uint32_t HeaderSize() const;
    // Encoded length of the whole frame.
    std::size_t EncodedSize() const;
};

std::size_t HeaderSizeFor(const std::string& file_name, std::size_t padding);

Bytes Encode(const std::string& file_name,
             std::uint32_t checksum,
             std::uint32_t count,
             std::uint32_t index,
             std::size_t padding,
             const Bytes& body);
Bytes Encode(const Frame& frame);

// Throws FormatError on malformed input. The body is never checked against an
// expected length here.
Frame Decode(const Bytes& data);

// "<name> <CRC in upper-case hex>", the key frames are grouped by.
std::string Identifier(const std::string& file_name, std::uint32_t checksum);
std::string Identifier(const Frame& frame);

}  // namespace qrbackup::frame
