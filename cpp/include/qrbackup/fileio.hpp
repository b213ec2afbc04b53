#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace qrbackup::fileio {

using Bytes = std::vector<std::uint8_t>;

// All helpers throw IoError naming the path.
Bytes ReadFile(const std::filesystem::path& path);
std::string ReadText(const std::filesystem::path& path);
// Non-empty lines with trailing '\r' removed.
std::vector<std::string> ReadLines(const std::filesystem::path& path);

// Writes to "<path>._tmp" and renames over `path`.
void WriteFileAtomic(const std::filesystem::path& path, const Bytes& data);

// Unique scratch path under `directory`, removed (if it exists) on destruction.
class ScopedTempFile {
public:
    ScopedTempFile(const std::filesystem::path& directory, const std::string& stem, const std::string& extension);
    ~ScopedTempFile();

    ScopedTempFile(const ScopedTempFile&) = delete;
    ScopedTempFile& operator=(const ScopedTempFile&) = delete;

    const std::filesystem::path& Path() const noexcept { return path_; }

private:
    std::filesystem::path path_;
};

}  // namespace qrbackup::fileio
