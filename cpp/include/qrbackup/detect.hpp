#pragma once

#include "qrbackup/capabilities.hpp"
#include "qrbackup/collector.hpp"

#include <cstddef>
#include <filesystem>
#include <ostream>
#include <string>
#include <vector>

namespace qrbackup::detect {

struct SearchStep {
    double contrast = 1.0;
    double exposure = 0.0;
    bool rotated = false;
};

// Contrast 1.0..3.0 and exposure 0.0..2.0 EV in 0.5 steps, each tried upright
// and rotated by 180 degrees.
const std::vector<SearchStep>& SearchSteps();

struct ImageScan {
    std::vector<std::string> codes;
    std::size_t attempts = 0;
};

// Unique payloads found on `image`. When `max_codes` is non-zero the search stops
// after the first attempt that brings the unique count to `max_codes` or more.
ImageScan DetectCodes(const image::ImageBuffer& image, SymbolDetector& detector, std::size_t max_codes);

struct ScanSummary {
    std::size_t images = 0;
    std::size_t unreadable = 0;
    // Candidate codes summed over images; the same code on two images counts twice.
    std::size_t codes = 0;
};

// Scans `images` on up to `workers` threads, feeding every candidate into
// `collector`. Unreadable images are reported and skipped; detector failures
// abort the scan.
ScanSummary ScanImages(const std::vector<std::filesystem::path>& images,
                       Canvas& canvas,
                       SymbolDetector& detector,
                       std::size_t max_codes,
                       std::size_t workers,
                       collector::CodeCollector& collector,
                       std::ostream& log);

}  // namespace qrbackup::detect
