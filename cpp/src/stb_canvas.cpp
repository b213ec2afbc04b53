#include "qrbackup/stb_canvas.hpp"

#include "qrbackup/errors.hpp"
#include "qrbackup/fileio.hpp"

#define STB_IMAGE_IMPLEMENTATION
#define STBI_FAILURE_USERMSG
#include "stb_image.h"
#define STB_IMAGE_WRITE_IMPLEMENTATION
#include "stb_image_write.h"

#include <limits>
#include <string>
#include <system_error>

namespace qrbackup::symbols {

image::ImageBuffer StbCanvas::Load(const std::filesystem::path& path) {
    fileio::Bytes blob = fileio::ReadFile(path);
    if (blob.size() > static_cast<std::size_t>(std::numeric_limits<int>::max())) {
        throw IoError("Image too large: " + path.string());
    }
    int width = 0;
    int height = 0;
    int channels_in_file = 0;
    if (!stbi_info_from_memory(blob.data(), static_cast<int>(blob.size()), &width, &height, &channels_in_file)) {
        throw IoError("Unsupported image input: " + path.string());
    }
    int target_channels = 0;
    if (channels_in_file == 1) {
        target_channels = 1;
    } else if (channels_in_file >= 4) {
        target_channels = 4;
    } else {
        target_channels = 3;
    }

    int loaded_channels = 0;
    unsigned char* data = stbi_load_from_memory(blob.data(), static_cast<int>(blob.size()),
                                                &width, &height, &loaded_channels, target_channels);
    if (!data) {
        const char* reason = stbi_failure_reason();
        std::string msg = reason ? reason : "unknown error";
        throw IoError("Failed to decode image " + path.string() + ": " + msg);
    }
    std::size_t total = static_cast<std::size_t>(width) * static_cast<std::size_t>(height)
                        * static_cast<std::size_t>(target_channels);
    image::ImageBuffer buffer;
    buffer.width = width;
    buffer.height = height;
    buffer.channels = target_channels;
    buffer.pixels.assign(data, data + total);
    stbi_image_free(data);
    return buffer;
}

void StbCanvas::SavePng(const image::ImageBuffer& image, const std::filesystem::path& path) {
    if (image.Empty() || image.channels < 1 || image.channels > 4) {
        throw IoError("Refusing to write an empty image: " + path.string());
    }
    if (path.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            throw IoError("Could not create directory " + path.parent_path().string() + ": " + ec.message());
        }
    }
    std::filesystem::path temp = path;
    temp += "._tmp";
    int ok = stbi_write_png(temp.string().c_str(), image.width, image.height, image.channels,
                            image.pixels.data(), image.width * image.channels);
    if (ok == 0) {
        std::error_code ignored;
        std::filesystem::remove(temp, ignored);
        throw IoError("Could not save png file: " + path.string());
    }
    std::error_code ec;
    std::filesystem::rename(temp, path, ec);
    if (ec) {
        std::filesystem::remove(temp, ec);
        throw IoError("Failed to finalize image output: " + path.string());
    }
}

}  // namespace qrbackup::symbols
