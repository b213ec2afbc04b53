#pragma once

#include "qrbackup/capabilities.hpp"

#include <filesystem>

namespace qrbackup::symbols {

// PNG/JPEG/BMP input and PNG output through stb_image.
class StbCanvas : public Canvas {
public:
    image::ImageBuffer Load(const std::filesystem::path& path) override;
    void SavePng(const image::ImageBuffer& image, const std::filesystem::path& path) override;
};

}  // namespace qrbackup::symbols
