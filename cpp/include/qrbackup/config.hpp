#pragma once

#include "qrbackup/layout.hpp"

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace qrbackup::config {

enum class RobustnessLevel {
    L,
    M,
    Q,
    H,
};

char LevelName(RobustnessLevel level);
RobustnessLevel ParseLevel(std::string_view text);
// Frame bytes that fit one symbol at `level`.
std::size_t LevelBudget(RobustnessLevel level);

struct Options {
    std::optional<std::filesystem::path> encode_path;
    RobustnessLevel level = RobustnessLevel::L;
    std::optional<layout::PageGrid> page_grid;
    std::optional<std::filesystem::path> list_file;
    std::optional<std::filesystem::path> codes_file;
    // 0 means no early exit.
    std::size_t max_codes_per_image = 0;
    std::size_t workers = 1;
    bool color = true;
    bool show_help = false;

    bool IsEncode() const noexcept { return encode_path.has_value(); }
    bool IsDecode() const noexcept { return list_file.has_value() || codes_file.has_value(); }
};

// "<W>x<H>", both at least 1.
layout::PageGrid ParsePageGrid(const std::string& text);

std::size_t DefaultWorkers();

// Throws UsageError on unknown flags, missing values and invalid combinations.
Options ParseArgs(int argc, const char* const* argv);

std::string UsageText();

}  // namespace qrbackup::config
