#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace qrbackup::checksum {

using Bytes = std::vector<std::uint8_t>;

// CRC-32 as used by zip/gzip.
std::uint32_t Crc32(const Bytes& data);
std::uint32_t Crc32(const std::uint8_t* data, std::size_t size);

std::string Sha256Hex(const Bytes& data);

}  // namespace qrbackup::checksum
