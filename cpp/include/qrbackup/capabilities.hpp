#pragma once

#include "qrbackup/image.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace qrbackup {

using Bytes = std::vector<std::uint8_t>;

// Binary frame <-> transport string.
class TextTranscoder {
public:
    virtual ~TextTranscoder() = default;
    virtual std::string Encode(const Bytes& data) const = 0;
    virtual std::optional<Bytes> Decode(const std::string& text) const = 0;
};

class SymbolEncoder {
public:
    virtual ~SymbolEncoder() = default;
    virtual image::ImageBuffer Render(const std::string& payload) = 0;
};

// Must be safe to call from several worker threads at once.
class SymbolDetector {
public:
    virtual ~SymbolDetector() = default;
    virtual std::vector<std::string> Detect(const image::ImageBuffer& image) = 0;
};

// Raster image I/O. Must be safe to call from several worker threads at once.
class Canvas {
public:
    virtual ~Canvas() = default;
    virtual image::ImageBuffer Load(const std::filesystem::path& path) = 0;
    virtual void SavePng(const image::ImageBuffer& image, const std::filesystem::path& path) = 0;
};

}  // namespace qrbackup
