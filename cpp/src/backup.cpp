#include "qrbackup/backup.hpp"

#include "qrbackup/checksum.hpp"
#include "qrbackup/cli_colors.hpp"
#include "qrbackup/collector.hpp"
#include "qrbackup/constants.hpp"
#include "qrbackup/detect.hpp"
#include "qrbackup/errors.hpp"
#include "qrbackup/fileio.hpp"
#include "qrbackup/layout.hpp"

#include <algorithm>
#include <iomanip>
#include <map>
#include <set>
#include <sstream>

namespace qrbackup::backup {

namespace {

std::string ZeroPadded(std::size_t value, std::size_t total) {
    const std::size_t width = std::to_string(total).size();
    std::ostringstream oss;
    oss << std::setw(static_cast<int>(width)) << std::setfill('0') << value;
    return oss.str();
}

std::filesystem::path DirectoryOf(const std::filesystem::path& path) {
    std::filesystem::path parent = path.parent_path();
    return parent.empty() ? std::filesystem::path(".") : parent;
}

std::string HumanCrc(std::uint32_t crc) {
    return "0x" + FormatCrc(crc);
}

void ComposePages(const config::Options& options,
                  const std::vector<std::filesystem::path>& symbols,
                  layout::CellSize cell,
                  const std::filesystem::path& directory,
                  const std::string& stem,
                  Canvas& canvas,
                  EncodeResult& result,
                  std::ostream& out) {
    const layout::PageGrid grid = *options.page_grid;
    const auto plans = layout::PlanPages(symbols.size(), grid);
    out << "Generating " << plans.size() << " page(s) for printing (width: " << grid.width
        << ", height: " << grid.height << ")\n";
    for (const auto& plan : plans) {
        const std::string page_name = PageFileName(plan.page + 1, plans.size(), stem);
        const std::filesystem::path page_path = directory / page_name;
        {
            image::ImageBuffer page = layout::ComposePage(
                plan, cell, constants::kPageColumnGutter,
                [&](std::size_t item) { return canvas.Load(symbols[item]); });
            canvas.SavePng(page, page_path);
        }
        result.pages.push_back(page_path);
        out << "Generated " << page_name << "\n";
    }
}

bool HasData(const reassembler::GroupResult& group) {
    return group.status == reassembler::GroupStatus::Verified
           || group.status == reassembler::GroupStatus::Corrupted;
}

void ReportGroup(const reassembler::GroupResult& group, std::ostream& out) {
    using reassembler::GroupStatus;
    switch (group.status) {
        case GroupStatus::Verified:
            out << cli::Green("Checksum validated successfully.", out) << " (crc32: " << HumanCrc(group.checksum)
                << ", sha256: " << checksum::Sha256Hex(group.data) << ")\n";
            break;
        case GroupStatus::Corrupted:
        case GroupStatus::MissingParts:
        case GroupStatus::ConflictingMetadata:
            out << cli::ErrorLine(group.error, out) << "\n";
            break;
    }
}

}  // namespace

std::string PartFileName(std::size_t index, std::size_t total, const std::string& stem) {
    return std::string(constants::kOutputPrefix) + ZeroPadded(index, total) + "_" + std::to_string(total) + "_"
           + stem + ".png";
}

std::string PageFileName(std::size_t page, std::size_t total, const std::string& stem) {
    return std::string(constants::kPagePrefix) + ZeroPadded(page, total) + "_" + std::to_string(total) + "_"
           + stem + ".png";
}

std::string DecodedFileName(const std::string& file_name, bool corrupted) {
    std::string base = std::filesystem::path(file_name).filename().string();
    if (base.empty() || base == "." || base == "..") {
        base = "unnamed";
    }
    std::string out = std::string(constants::kOutputPrefix) + base;
    if (corrupted) {
        out += constants::kCorruptedSuffix;
    }
    return out;
}

std::string DecodedFileName(const std::string& file_name, std::uint32_t checksum, bool corrupted) {
    std::string out = DecodedFileName(file_name, false) + "." + FormatCrc(checksum);
    if (corrupted) {
        out += constants::kCorruptedSuffix;
    }
    return out;
}

bool DecodeResult::Succeeded() const {
    if (groups.empty()) {
        return false;
    }
    for (const auto& group : groups) {
        if (!group.Verified()) {
            return false;
        }
    }
    return true;
}

EncodeResult EncodeFile(const config::Options& options,
                        const TextTranscoder& transcoder,
                        SymbolEncoder& encoder,
                        Canvas& canvas,
                        std::ostream& out) {
    if (!options.encode_path) {
        throw UsageError("No file to encode");
    }
    const std::filesystem::path& input = *options.encode_path;
    const fileio::Bytes data = fileio::ReadFile(input);
    const std::string file_name = input.filename().string();
    const std::string stem = input.stem().string();
    const std::filesystem::path directory = DirectoryOf(input);
    const std::uint32_t crc = checksum::Crc32(data);

    EncodeResult result;
    result.plan = splitter::Plan(file_name, data.size(), crc, config::LevelBudget(options.level));
    const splitter::SplitPlan& plan = result.plan;

    out << "Encoding file: " << cli::Bold("\"" + file_name + "\"", out) << " (size: " << data.size()
        << ", crc32: " << HumanCrc(crc) << ", sha256: " << checksum::Sha256Hex(data) << ")\n";
    out << "Correction level: " << config::LevelName(options.level)
        << (options.level == config::RobustnessLevel::L ? " (Default)" : "") << "\n";
    out << "Number of parts: " << plan.count << "\n\n";

    layout::CellSize cell;
    result.symbols.reserve(plan.count);
    splitter::ForEachFrame(plan, data, [&](std::uint32_t index, const fileio::Bytes& encoded) {
        const std::string part_name = PartFileName(static_cast<std::size_t>(index) + 1, plan.count, stem);
        const std::filesystem::path part_path = directory / part_name;
        {
            image::ImageBuffer symbol = encoder.Render(transcoder.Encode(encoded));
            cell.width = std::max(cell.width, symbol.width);
            cell.height = std::max(cell.height, symbol.height);
            canvas.SavePng(symbol, part_path);
        }
        result.symbols.push_back(part_path);
        const std::size_t done = static_cast<std::size_t>(index) + 1;
        out << "Generated \"" << part_name << "\" [" << (100 * done / plan.count) << "%]\n";
    });

    if (options.page_grid) {
        ComposePages(options, result.symbols, cell, directory, stem, canvas, result, out);
    }

    out << cli::BoldGreen("Encoding finished!", out) << "\n";
    return result;
}

DecodeResult DecodeInputs(const config::Options& options,
                          const TextTranscoder& transcoder,
                          SymbolDetector& detector,
                          Canvas& canvas,
                          std::ostream& out) {
    if (!options.IsDecode()) {
        throw UsageError("Nothing to decode");
    }
    std::vector<std::filesystem::path> images;
    std::string codes_text;
    std::filesystem::path directory;
    if (options.list_file) {
        for (const auto& line : fileio::ReadLines(*options.list_file)) {
            std::string trimmed = collector::Trim(line);
            if (!trimmed.empty()) {
                images.emplace_back(trimmed);
            }
        }
        directory = DirectoryOf(*options.list_file);
    }
    if (options.codes_file) {
        codes_text = fileio::ReadText(*options.codes_file);
        directory = DirectoryOf(*options.codes_file);
    }

    DecodeResult result;
    collector::CodeCollector codes;
    if (options.list_file) {
        detect::ScanSummary scan = detect::ScanImages(images, canvas, detector, options.max_codes_per_image,
                                                      options.workers, codes, out);
        result.codes_from_images = scan.codes;
        out << "Detected " << scan.codes << " code(s) from list file.\n";
    }
    if (options.codes_file) {
        result.codes_from_file = codes.AddCodesText(codes_text);
        out << "Detected " << result.codes_from_file << " code(s) from codes file.\n";
    }
    result.unique_codes = codes.Size();
    out << "Detected " << result.unique_codes << " unique code(s) in total.\n";

    reassembler::Reassembler assembler(transcoder);
    for (const auto& code : codes.Codes()) {
        assembler.AddCode(code);
    }
    result.rejected_codes = assembler.Rejected().size();
    for (const auto& reason : assembler.Rejected()) {
        out << cli::Yellow("Skipped: " + reason, out) << "\n";
    }
    for (const auto& entry : assembler.Groups()) {
        out << "Found " << entry.second.frames.size() << " parts of file " << entry.first << ".\n";
    }

    result.groups = assembler.ResolveAll();
    if (result.groups.empty()) {
        out << cli::ErrorLine("No backup codes could be decoded.", out) << "\n";
    }
    // Several restored files may carry one name (two versions of a file in one
    // batch); every one of them then gets its checksum in the output name.
    std::map<std::string, std::size_t> name_uses;
    for (const auto& group : result.groups) {
        if (HasData(group)) {
            ++name_uses[DecodedFileName(group.file_name)];
        }
    }
    std::set<std::string> taken;
    for (const auto& group : result.groups) {
        if (HasData(group)) {
            const bool corrupted = group.status == reassembler::GroupStatus::Corrupted;
            const bool shared = name_uses[DecodedFileName(group.file_name)] > 1;
            std::string name = shared ? DecodedFileName(group.file_name, group.checksum, corrupted)
                                      : DecodedFileName(group.file_name, corrupted);
            // Stored names that differ only in their directory part can still meet here.
            for (std::size_t copy = 2; !taken.insert(name).second; ++copy) {
                name = DecodedFileName(group.file_name, group.checksum, false) + "_" + std::to_string(copy)
                       + (corrupted ? std::string(constants::kCorruptedSuffix) : std::string());
            }
            const std::filesystem::path destination = directory / name;
            fileio::WriteFileAtomic(destination, group.data);
            result.written.push_back(destination);
            out << "Decoded " << group.identifier << " and saved to " << destination.string() << ".\n";
        }
        ReportGroup(group, out);
    }

    out << (result.Succeeded() ? cli::BoldGreen("Decoding finished!", out) : cli::BoldRed("Decoding failed!", out))
        << "\n";
    return result;
}

}  // namespace qrbackup::backup
