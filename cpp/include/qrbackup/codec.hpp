#pragma once

#include "qrbackup/capabilities.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace qrbackup::codec {

// RFC 4648 base32, upper-case alphabet with '=' padding.
std::string Base32Encode(const std::vector<std::uint8_t>& data);
std::vector<std::uint8_t> Base32Decode(const std::string& input, bool* ok = nullptr);

class Base32Transcoder : public TextTranscoder {
public:
    std::string Encode(const Bytes& data) const override;
    std::optional<Bytes> Decode(const std::string& text) const override;
};

}  // namespace qrbackup::codec
