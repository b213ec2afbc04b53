#include "qrbackup/detect.hpp"

#include "qrbackup/cli_colors.hpp"
#include "qrbackup/errors.hpp"
#include "qrbackup/image.hpp"
#include "qrbackup/parallel.hpp"

#include <algorithm>
#include <atomic>
#include <mutex>
#include <optional>
#include <set>

namespace qrbackup::detect {

namespace {

std::vector<SearchStep> BuildSearchSteps() {
    std::vector<SearchStep> steps;
    for (int c = 0; c <= 4; ++c) {
        for (int e = 0; e <= 4; ++e) {
            for (bool rotated : {false, true}) {
                SearchStep step;
                step.contrast = 1.0 + 0.5 * c;
                step.exposure = 0.5 * e;
                step.rotated = rotated;
                steps.push_back(step);
            }
        }
    }
    return steps;
}

}  // namespace

const std::vector<SearchStep>& SearchSteps() {
    static const std::vector<SearchStep> steps = BuildSearchSteps();
    return steps;
}

ImageScan DetectCodes(const image::ImageBuffer& image, SymbolDetector& detector, std::size_t max_codes) {
    const image::ImageBuffer upright = image::ToGray(image);
    std::optional<image::ImageBuffer> rotated;
    std::set<std::string> unique;
    ImageScan scan;
    for (const SearchStep& step : SearchSteps()) {
        const image::ImageBuffer* source = &upright;
        if (step.rotated) {
            if (!rotated) {
                rotated = image::Rotate180(upright);
            }
            source = &*rotated;
        }
        image::ImageBuffer adjusted = image::Adjust(*source, step.exposure, step.contrast);
        for (auto& code : detector.Detect(adjusted)) {
            unique.insert(std::move(code));
        }
        ++scan.attempts;
        if (max_codes > 0 && unique.size() >= max_codes) {
            break;
        }
    }
    scan.codes.assign(unique.begin(), unique.end());
    return scan;
}

ScanSummary ScanImages(const std::vector<std::filesystem::path>& images,
                       Canvas& canvas,
                       SymbolDetector& detector,
                       std::size_t max_codes,
                       std::size_t workers,
                       collector::CodeCollector& collector,
                       std::ostream& log) {
    std::mutex log_mutex;
    std::atomic<std::size_t> unreadable{0};
    std::atomic<std::size_t> codes{0};

    parallel::ParallelFor(images.size(), workers, [&](std::size_t idx) {
        const std::filesystem::path& path = images[idx];
        const std::string name = path.filename().string();
        std::optional<image::ImageBuffer> loaded;
        try {
            loaded = canvas.Load(path);
        } catch (const IoError& exc) {
            unreadable.fetch_add(1);
            std::lock_guard<std::mutex> lock(log_mutex);
            log << cli::ErrorLine("Could not read image from file " + name + " (" + exc.what() + ")", log) << "\n";
            return;
        }
        {
            std::lock_guard<std::mutex> lock(log_mutex);
            log << "Detecting QR barcode(s) on " << name << "\n";
        }
        ImageScan scan = DetectCodes(*loaded, detector, max_codes);
        loaded.reset();

        std::size_t candidates = 0;
        for (auto& code : scan.codes) {
            if (!collector::IsCandidate(code)) {
                continue;
            }
            ++candidates;
            collector.Add(std::move(code));
        }
        codes.fetch_add(candidates);
        std::lock_guard<std::mutex> lock(log_mutex);
        log << "Detected " << scan.codes.size() << " QR barcode(s) on " << name << " ("
            << candidates << " backup code(s), " << scan.attempts << " attempt(s))\n";
    });

    ScanSummary summary;
    summary.images = images.size();
    summary.unreadable = unreadable.load();
    summary.codes = codes.load();
    return summary;
}

}  // namespace qrbackup::detect
