#pragma once

#include "qrbackup/capabilities.hpp"
#include "qrbackup/config.hpp"
#include "qrbackup/reassembler.hpp"
#include "qrbackup/splitter.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <ostream>
#include <string>
#include <vector>

namespace qrbackup::backup {

// "lsqrbt_<index>_<total>_<stem>.png" with `index` 1-based and zero-padded to the
// width of `total`.
std::string PartFileName(std::size_t index, std::size_t total, const std::string& stem);
std::string PageFileName(std::size_t page, std::size_t total, const std::string& stem);
// Output name for a decoded file; only the last component of `file_name` is kept.
std::string DecodedFileName(const std::string& file_name, bool corrupted = false);
// "lsqrbt_<name>.<CRC>", used when two restored files in one run share a name.
std::string DecodedFileName(const std::string& file_name, std::uint32_t checksum, bool corrupted);

struct EncodeResult {
    splitter::SplitPlan plan;
    std::vector<std::filesystem::path> symbols;
    std::vector<std::filesystem::path> pages;
};

// Splits options.encode_path into frames, renders one symbol image per frame next
// to the input and, when a page grid is set, composes print pages from them.
EncodeResult EncodeFile(const config::Options& options,
                        const TextTranscoder& transcoder,
                        SymbolEncoder& encoder,
                        Canvas& canvas,
                        std::ostream& out);

struct DecodeResult {
    std::size_t codes_from_images = 0;
    std::size_t codes_from_file = 0;
    std::size_t unique_codes = 0;
    std::size_t rejected_codes = 0;
    std::vector<reassembler::GroupResult> groups;
    std::vector<std::filesystem::path> written;

    // True when at least one file was restored and every file verified.
    bool Succeeded() const;
};

// Collects codes from the list file images and the codes file, rebuilds every
// file found and writes it next to the inputs. Group failures are reported and
// reflected in the result; unreadable inputs and write failures throw IoError.
DecodeResult DecodeInputs(const config::Options& options,
                          const TextTranscoder& transcoder,
                          SymbolDetector& detector,
                          Canvas& canvas,
                          std::ostream& out);

}  // namespace qrbackup::backup
