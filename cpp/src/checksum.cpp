#include "qrbackup/checksum.hpp"

#include <openssl/evp.h>
#include <zlib.h>

#include <algorithm>
#include <limits>
#include <stdexcept>

namespace qrbackup::checksum {

namespace {

void Ensure(bool ok, const char* message) {
    if (!ok) {
        throw std::runtime_error(message);
    }
}

}  // namespace

std::uint32_t Crc32(const std::uint8_t* data, std::size_t size) {
    uLong crc = crc32(0L, Z_NULL, 0);
    // zlib takes uInt lengths; feed large buffers in slices.
    constexpr std::size_t kMaxSlice = std::numeric_limits<uInt>::max();
    while (size > 0) {
        std::size_t slice = std::min(size, kMaxSlice);
        crc = crc32(crc, data, static_cast<uInt>(slice));
        data += slice;
        size -= slice;
    }
    return static_cast<std::uint32_t>(crc);
}

std::uint32_t Crc32(const Bytes& data) {
    return Crc32(data.data(), data.size());
}

std::string Sha256Hex(const Bytes& data) {
    static constexpr char kHex[] = "0123456789abcdef";
    const EVP_MD* md = EVP_sha256();
    EVP_MD_CTX* ctx = EVP_MD_CTX_new();
    if (!ctx) {
        throw std::runtime_error("SHA-256 context allocation failed");
    }
    unsigned int out_len = 0;
    Bytes digest(EVP_MD_size(md));
    try {
        Ensure(EVP_DigestInit_ex(ctx, md, nullptr) == 1, "SHA-256 init failed");
        if (!data.empty()) {
            Ensure(EVP_DigestUpdate(ctx, data.data(), data.size()) == 1, "SHA-256 update failed");
        }
        Ensure(EVP_DigestFinal_ex(ctx, digest.data(), &out_len) == 1, "SHA-256 final failed");
    } catch (...) {
        EVP_MD_CTX_free(ctx);
        throw;
    }
    EVP_MD_CTX_free(ctx);
    digest.resize(out_len);

    std::string out;
    out.reserve(digest.size() * 2);
    for (std::uint8_t byte : digest) {
        out.push_back(kHex[byte >> 4]);
        out.push_back(kHex[byte & 0x0F]);
    }
    return out;
}

}  // namespace qrbackup::checksum
