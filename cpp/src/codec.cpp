#include "qrbackup/codec.hpp"

#include <array>
#include <cctype>

namespace qrbackup::codec {

namespace {

constexpr char kBase32Alphabet[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZ234567";

std::array<int, 256> BuildBase32DecodeTable() {
    std::array<int, 256> table{};
    table.fill(-1);
    for (int i = 0; i < 32; ++i) {
        table[static_cast<unsigned char>(kBase32Alphabet[i])] = i;
        table[static_cast<unsigned char>(std::tolower(kBase32Alphabet[i]))] = i;
    }
    return table;
}

const std::array<int, 256> kBase32DecodeTable = BuildBase32DecodeTable();

}  // namespace

std::string Base32Encode(const std::vector<std::uint8_t>& data) {
    if (data.empty()) {
        return "";
    }
    std::string out;
    out.reserve(((data.size() + 4) / 5) * 8);
    std::uint32_t buffer = 0;
    int bits_left = 0;

    for (std::uint8_t byte : data) {
        buffer = (buffer << 8) | byte;
        bits_left += 8;
        while (bits_left >= 5) {
            int index = (buffer >> (bits_left - 5)) & 0x1F;
            out.push_back(kBase32Alphabet[index]);
            bits_left -= 5;
        }
    }
    if (bits_left > 0) {
        buffer <<= (5 - bits_left);
        int index = buffer & 0x1F;
        out.push_back(kBase32Alphabet[index]);
    }
    while (out.size() % 8 != 0) {
        out.push_back('=');
    }
    return out;
}

std::vector<std::uint8_t> Base32Decode(const std::string& input, bool* ok) {
    bool success = true;
    std::vector<std::uint8_t> out;
    out.reserve((input.size() / 8) * 5);
    std::uint32_t buffer = 0;
    int bits_left = 0;
    std::size_t symbols = 0;
    std::size_t padding = 0;

    for (unsigned char c : input) {
        if (std::isspace(c)) {
            continue;
        }
        if (c == '=') {
            ++padding;
            continue;
        }
        int val = kBase32DecodeTable[c];
        if (val < 0 || padding > 0) {
            success = false;
            break;
        }
        ++symbols;
        buffer = (buffer << 5) | static_cast<std::uint32_t>(val);
        bits_left += 5;
        if (bits_left >= 8) {
            out.push_back(static_cast<std::uint8_t>((buffer >> (bits_left - 8)) & 0xFF));
            bits_left -= 8;
        }
    }
    if (success) {
        // A final quantum holds 2, 4, 5 or 7 symbols and its unused low bits are zero.
        const std::size_t tail = symbols % 8;
        if (tail == 1 || tail == 3 || tail == 6) {
            success = false;
        } else if (bits_left > 0 && (buffer & ((1u << bits_left) - 1u)) != 0) {
            success = false;
        } else if (padding > 0 && (symbols + padding) % 8 != 0) {
            success = false;
        }
    }
    if (ok) {
        *ok = success;
    }
    if (!success) {
        out.clear();
    }
    return out;
}

std::string Base32Transcoder::Encode(const Bytes& data) const {
    return Base32Encode(data);
}

std::optional<Bytes> Base32Transcoder::Decode(const std::string& text) const {
    bool ok = false;
    Bytes decoded = Base32Decode(text, &ok);
    if (!ok) {
        return std::nullopt;
    }
    return decoded;
}

}  // namespace qrbackup::codec
