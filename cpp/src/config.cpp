#include "qrbackup/config.hpp"

#include "qrbackup/constants.hpp"
#include "qrbackup/env.hpp"
#include "qrbackup/errors.hpp"

#include <cctype>
#include <limits>
#include <thread>

namespace qrbackup::config {

namespace {

long long ParseInteger(const std::string& flag, const std::string& raw) {
    std::size_t consumed = 0;
    long long value = 0;
    try {
        value = std::stoll(raw, &consumed);
    } catch (const std::exception&) {
        throw UsageError("Invalid integer for " + flag + ": " + raw);
    }
    if (consumed != raw.size()) {
        throw UsageError("Invalid integer for " + flag + ": " + raw);
    }
    return value;
}

std::string RequireValue(int argc, const char* const* argv, int idx, const std::string& flag) {
    if (idx + 1 >= argc) {
        throw UsageError("Missing value for " + flag);
    }
    return std::string(argv[idx + 1]);
}

}  // namespace

char LevelName(RobustnessLevel level) {
    switch (level) {
        case RobustnessLevel::L:
            return 'L';
        case RobustnessLevel::M:
            return 'M';
        case RobustnessLevel::Q:
            return 'Q';
        case RobustnessLevel::H:
            return 'H';
    }
    return '?';
}

RobustnessLevel ParseLevel(std::string_view text) {
    if (text.size() == 1) {
        switch (std::toupper(static_cast<unsigned char>(text[0]))) {
            case 'L':
                return RobustnessLevel::L;
            case 'M':
                return RobustnessLevel::M;
            case 'Q':
                return RobustnessLevel::Q;
            case 'H':
                return RobustnessLevel::H;
            default:
                break;
        }
    }
    throw UsageError("Invalid correction level \"" + std::string(text) + "\" (choose from: L, M, Q, H)");
}

std::size_t LevelBudget(RobustnessLevel level) {
    const char name = LevelName(level);
    for (const auto& entry : constants::kLevelBudgets) {
        if (entry.level == name) {
            return entry.budget;
        }
    }
    throw UsageError(std::string("No capacity budget for level ") + name);
}

layout::PageGrid ParsePageGrid(const std::string& text) {
    auto sep = text.find_first_of("xX");
    if (sep == std::string::npos) {
        throw UsageError("Invalid page size \"" + text + "\" (expected <W>x<H>, e.g. 4x5)");
    }
    long long width = ParseInteger("-t", text.substr(0, sep));
    long long height = ParseInteger("-t", text.substr(sep + 1));
    if (width < 1 || height < 1 || width > std::numeric_limits<int>::max()
        || height > std::numeric_limits<int>::max()) {
        throw UsageError("Page size must be at least 1x1: " + text);
    }
    layout::PageGrid grid;
    grid.width = static_cast<int>(width);
    grid.height = static_cast<int>(height);
    return grid;
}

std::size_t DefaultWorkers() {
    unsigned int hw = std::thread::hardware_concurrency();
    return qrbackup::env::GetSize("QRBACKUP_WORKERS", hw > 0 ? static_cast<std::size_t>(hw) : 1);
}

Options ParseArgs(int argc, const char* const* argv) {
    Options opts;
    opts.workers = DefaultWorkers();
    int idx = 1;
    while (idx < argc) {
        std::string flag(argv[idx]);
        if (flag == "-h" || flag == "--help") {
            opts.show_help = true;
            idx += 1;
        } else if (flag == "-e") {
            opts.encode_path = std::filesystem::path(RequireValue(argc, argv, idx, flag));
            idx += 2;
        } else if (flag == "-c") {
            opts.level = ParseLevel(RequireValue(argc, argv, idx, flag));
            idx += 2;
        } else if (flag == "-t") {
            opts.page_grid = ParsePageGrid(RequireValue(argc, argv, idx, flag));
            idx += 2;
        } else if (flag == "-d") {
            opts.list_file = std::filesystem::path(RequireValue(argc, argv, idx, flag));
            idx += 2;
        } else if (flag == "-s") {
            opts.codes_file = std::filesystem::path(RequireValue(argc, argv, idx, flag));
            idx += 2;
        } else if (flag == "-m") {
            long long value = ParseInteger(flag, RequireValue(argc, argv, idx, flag));
            if (value < 0) {
                throw UsageError("Maximum number of codes per image must not be negative");
            }
            opts.max_codes_per_image = static_cast<std::size_t>(value);
            idx += 2;
        } else if (flag == "-j") {
            long long value = ParseInteger(flag, RequireValue(argc, argv, idx, flag));
            if (value < 1) {
                throw UsageError("Worker count must be at least 1");
            }
            opts.workers = static_cast<std::size_t>(value);
            idx += 2;
        } else if (flag == "--no-color") {
            opts.color = false;
            idx += 1;
        } else {
            throw UsageError("Unknown flag: " + flag);
        }
    }
    if (opts.show_help) {
        return opts;
    }
    if (!opts.IsEncode() && !opts.IsDecode()) {
        throw UsageError("Nothing to do: pass -e, -d or -s");
    }
    if (opts.IsEncode() && opts.IsDecode()) {
        throw UsageError("-e cannot be combined with -d or -s");
    }
    return opts;
}

std::string UsageText() {
    std::string text;
    text += "qrbackup " + std::string(constants::kEngineVersion) + "\n\n";
    text += "Converts any file to a set of QR barcode images for printing, and converts\n";
    text += "scanned QR barcode images (or codes read by a phone) back to the file.\n\n";
    text += "Usage:\n";
    text += "  qrbackup -e <file> [-c L|M|Q|H] [-t <W>x<H>]\n";
    text += "  qrbackup [-d <list file>] [-s <codes file>] [-m <n>] [-j <n>]\n\n";
    text += "Options:\n";
    text += "  -e <file>         Encode the file to QR barcode images\n";
    text += "  -c <level>        Correction level, L (default, densest) to H (most robust)\n";
    text += "  -t <W>x<H>        Also compose pages of W x H barcodes for printing\n";
    text += "  -d <list file>    Decode the images listed (one path per line) in the file\n";
    text += "  -s <codes file>   Decode scanned codes saved one per line in the file\n";
    text += "  -m <n>            Move to the next image once n codes were found on it\n";
    text += "                    (0 = search every setting, the default)\n";
    text += "  -j <n>            Number of images scanned in parallel\n";
    text += "  --no-color        Disable colored output\n\n";
    text += "Examples:\n";
    text += "  qrbackup -e ~/backup.zip -t 4x5\n";
    text += "  qrbackup -d ~/list.txt -m 20\n";
    text += "  qrbackup -d ~/list.txt -s ~/codes.txt -m 20\n\n";
    text += "Environment:\n";
    text += "  QRBACKUP_WORKERS   default for -j\n";
    text += "  QRBACKUP_NO_COLOR  disable colored output\n";
    text += "  QRBACKUP_ZBARIMG   zbarimg executable used for detection\n";
    return text;
}

}  // namespace qrbackup::config
