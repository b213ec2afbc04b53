#include "qrbackup/frame.hpp"

#include "qrbackup/constants.hpp"
#include "qrbackup/errors.hpp"

#include <algorithm>
#include <limits>

namespace qrbackup::frame {

namespace {

using qrbackup::constants::kFixedHeaderLen;
using qrbackup::constants::kFrameMagic;
using qrbackup::constants::kMinHeaderLen;

std::uint32_t ReadU32LE(const Bytes& data, std::size_t offset) {
    return static_cast<std::uint32_t>(data[offset])
           | (static_cast<std::uint32_t>(data[offset + 1]) << 8)
           | (static_cast<std::uint32_t>(data[offset + 2]) << 16)
           | (static_cast<std::uint32_t>(data[offset + 3]) << 24);
}

void WriteU32LE(Bytes& out, std::uint32_t value) {
    out.push_back(static_cast<std::uint8_t>(value & 0xFF));
    out.push_back(static_cast<std::uint8_t>((value >> 8) & 0xFF));
    out.push_back(static_cast<std::uint8_t>((value >> 16) & 0xFF));
    out.push_back(static_cast<std::uint8_t>((value >> 24) & 0xFF));
}

void ValidateFileName(const std::string& file_name) {
    if (file_name.empty()) {
        throw FormatError("Frame file name must not be empty");
    }
    if (file_name.find('\0') != std::string::npos) {
        throw FormatError("Frame file name must not contain NUL bytes");
    }
}

}  // namespace

std::size_t HeaderSizeFor(const std::string& file_name, std::size_t padding) {
    return kFixedHeaderLen + file_name.size() + 1 + padding;
}

std::uint32_t Frame::HeaderSize() const {
    return static_cast<std::uint32_t>(HeaderSizeFor(file_name, padding));
}

std::size_t Frame::EncodedSize() const {
    return HeaderSizeFor(file_name, padding) + body.size();
}

Bytes Encode(const std::string& file_name,
             std::uint32_t checksum,
             std::uint32_t count,
             std::uint32_t index,
             std::size_t padding,
             const Bytes& body) {
    ValidateFileName(file_name);
    std::size_t header_size = HeaderSizeFor(file_name, padding);
    if (header_size > std::numeric_limits<std::uint32_t>::max()) {
        throw FormatError("Frame header too large");
    }
    Bytes out;
    out.reserve(header_size + body.size());
    out.insert(out.end(), kFrameMagic.begin(), kFrameMagic.end());
    WriteU32LE(out, checksum);
    WriteU32LE(out, static_cast<std::uint32_t>(header_size));
    WriteU32LE(out, count);
    WriteU32LE(out, index);
    out.insert(out.end(), file_name.begin(), file_name.end());
    out.push_back(0);
    out.insert(out.end(), padding, 0);
    out.insert(out.end(), body.begin(), body.end());
    return out;
}

Bytes Encode(const Frame& frame) {
    return Encode(frame.file_name, frame.checksum, frame.count, frame.index, frame.padding, frame.body);
}

Frame Decode(const Bytes& data) {
    if (data.size() < kMinHeaderLen) {
        throw FormatError("Frame too short (" + std::to_string(data.size()) + " bytes)");
    }
    if (!std::equal(kFrameMagic.begin(), kFrameMagic.end(), data.begin())) {
        throw FormatError("Frame magic mismatch");
    }
    Frame frame;
    frame.checksum = ReadU32LE(data, 4);
    std::uint32_t header_size = ReadU32LE(data, 8);
    frame.count = ReadU32LE(data, 12);
    frame.index = ReadU32LE(data, 16);
    if (header_size < kMinHeaderLen) {
        throw FormatError("Frame header size " + std::to_string(header_size) + " below minimum");
    }
    if (data.size() < header_size) {
        throw FormatError("Frame truncated (header size " + std::to_string(header_size) + ", got "
                          + std::to_string(data.size()) + " bytes)");
    }
    if (data[kFixedHeaderLen] == 0) {
        throw FormatError("Frame file name is empty");
    }
    if (data[header_size - 1] != 0) {
        throw FormatError("Frame file name terminator missing");
    }
    const auto name_begin = data.begin() + static_cast<std::ptrdiff_t>(kFixedHeaderLen);
    const auto header_end = data.begin() + static_cast<std::ptrdiff_t>(header_size);
    const auto name_end = std::find(name_begin, header_end, std::uint8_t{0});
    frame.file_name.assign(name_begin, name_end);
    // Everything after the terminator up to the body is filler.
    frame.padding = static_cast<std::size_t>(header_end - name_end) - 1;
    frame.body.assign(header_end, data.end());
    return frame;
}

std::string Identifier(const std::string& file_name, std::uint32_t checksum) {
    return file_name + " " + FormatCrc(checksum);
}

std::string Identifier(const Frame& frame) {
    return Identifier(frame.file_name, frame.checksum);
}

}  // namespace qrbackup::frame
