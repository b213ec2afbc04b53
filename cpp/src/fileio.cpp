#include "qrbackup/fileio.hpp"

#include "qrbackup/errors.hpp"

#include <atomic>
#include <chrono>
#include <fstream>
#include <sstream>
#include <system_error>

namespace qrbackup::fileio {

Bytes ReadFile(const std::filesystem::path& path) {
    std::ifstream input(path, std::ios::binary);
    if (!input) {
        throw IoError("Could not read file: " + path.string());
    }
    input.seekg(0, std::ios::end);
    std::streamoff size = input.tellg();
    if (size < 0) {
        throw IoError("Could not read file size: " + path.string());
    }
    input.seekg(0, std::ios::beg);

    Bytes data(static_cast<std::size_t>(size));
    if (!data.empty()) {
        input.read(reinterpret_cast<char*>(data.data()), static_cast<std::streamsize>(data.size()));
        if (!input) {
            throw IoError("Could not read file: " + path.string());
        }
    }
    return data;
}

std::string ReadText(const std::filesystem::path& path) {
    Bytes data = ReadFile(path);
    return std::string(data.begin(), data.end());
}

std::vector<std::string> ReadLines(const std::filesystem::path& path) {
    std::istringstream iss(ReadText(path));
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(iss, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (!line.empty()) {
            lines.push_back(line);
        }
    }
    return lines;
}

void WriteFileAtomic(const std::filesystem::path& path, const Bytes& data) {
    std::filesystem::path temp = path;
    temp += "._tmp";
    {
        std::ofstream output(temp, std::ios::binary | std::ios::trunc);
        if (!output) {
            throw IoError("Could not open file for writing: " + temp.string());
        }
        if (!data.empty()) {
            output.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
        }
        output.flush();
        if (!output) {
            std::error_code ignored;
            output.close();
            std::filesystem::remove(temp, ignored);
            throw IoError("Could not write file: " + temp.string());
        }
    }
    std::error_code ec;
    std::filesystem::rename(temp, path, ec);
    if (ec) {
        std::error_code ignored;
        std::filesystem::remove(temp, ignored);
        throw IoError("Could not finalize file " + path.string() + ": " + ec.message());
    }
}

namespace {

std::atomic<std::uint64_t> g_temp_counter{0};

}  // namespace

ScopedTempFile::ScopedTempFile(const std::filesystem::path& directory,
                               const std::string& stem,
                               const std::string& extension) {
    const auto ticks = static_cast<std::uint64_t>(
        std::chrono::steady_clock::now().time_since_epoch().count());
    const std::uint64_t serial = g_temp_counter.fetch_add(1);
    path_ = directory / (stem + "_" + std::to_string(ticks) + "_" + std::to_string(serial) + extension);
}

ScopedTempFile::~ScopedTempFile() {
    std::error_code ignored;
    std::filesystem::remove(path_, ignored);
}

}  // namespace qrbackup::fileio
