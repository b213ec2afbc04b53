#include <gtest/gtest.h>
#include "fakes.hpp"
#include "qrbackup/collector.hpp"
#include "qrbackup/detect.hpp"
#include "qrbackup/image.hpp"

#include <set>
#include <sstream>
#include <stdexcept>
#include <tuple>

using namespace qrbackup;
using qrbackup::testing::MemoryCanvas;
using qrbackup::testing::ScriptedDetector;

namespace {

// Fails on every call.
class ThrowingDetector : public SymbolDetector {
public:
    std::vector<std::string> Detect(const image::ImageBuffer&) override {
        throw Error("detector crashed");
    }
};

}  // namespace

// ============================================================================
// Search schedule
// ============================================================================

TEST(DetectTest, SearchCoversEverySetting) {
    const auto& steps = detect::SearchSteps();
    ASSERT_EQ(steps.size(), 50u);
    EXPECT_DOUBLE_EQ(steps.front().contrast, 1.0);
    EXPECT_DOUBLE_EQ(steps.front().exposure, 0.0);
    EXPECT_FALSE(steps.front().rotated);
    EXPECT_TRUE(steps[1].rotated);
    EXPECT_DOUBLE_EQ(steps.back().contrast, 3.0);
    EXPECT_DOUBLE_EQ(steps.back().exposure, 2.0);

    std::set<std::tuple<double, double, bool>> distinct;
    for (const auto& step : steps) {
        distinct.emplace(step.contrast, step.exposure, step.rotated);
    }
    EXPECT_EQ(distinct.size(), 50u);
}

// ============================================================================
// DetectCodes
// ============================================================================

TEST(DetectTest, UnionsCodesAcrossAttempts) {
    ScriptedDetector detector({{"LSQRBTA"}, {}, {"LSQRBTB", "LSQRBTA"}, {"other"}});
    auto scan = detect::DetectCodes(image::Blank(4, 4, 1), detector, 0);
    EXPECT_EQ(scan.attempts, detect::SearchSteps().size());
    EXPECT_EQ(detector.Calls(), detect::SearchSteps().size());
    EXPECT_EQ(scan.codes, (std::vector<std::string>{"LSQRBTA", "LSQRBTB", "other"}));
}

TEST(DetectTest, StopsOnceEnoughCodesFound) {
    ScriptedDetector detector({{"LSQRBTA"}, {"LSQRBTA"}, {"LSQRBTB"}, {"LSQRBTC"}});
    auto scan = detect::DetectCodes(image::Blank(4, 4, 3), detector, 2);
    EXPECT_EQ(scan.attempts, 3u);
    EXPECT_EQ(detector.Calls(), 3u);
    EXPECT_EQ(scan.codes.size(), 2u);
}

// ============================================================================
// ScanImages
// ============================================================================

TEST(DetectTest, SkipsUnreadableImages) {
    MemoryCanvas canvas;
    canvas.SavePng(image::Blank(2, 2, 1), "scans/a.png");
    canvas.SavePng(image::Blank(2, 2, 1), "scans/c.png");
    ScriptedDetector detector(std::vector<std::vector<std::string>>{{"LSQRBTONE", "not-ours"}});
    collector::CodeCollector codes;
    std::ostringstream log;

    auto summary = detect::ScanImages({"scans/a.png", "scans/b.png", "scans/c.png"},
                                      canvas, detector, 1, 1, codes, log);
    EXPECT_EQ(summary.images, 3u);
    EXPECT_EQ(summary.unreadable, 1u);
    EXPECT_EQ(summary.codes, 1u);
    EXPECT_EQ(codes.Codes(), (std::vector<std::string>{"LSQRBTONE"}));
    EXPECT_NE(log.str().find("Could not read image from file b.png"), std::string::npos);
}

TEST(DetectTest, ParallelScanCollectsEveryImage) {
    MemoryCanvas canvas;
    std::vector<std::filesystem::path> paths;
    for (int i = 0; i < 12; ++i) {
        std::filesystem::path path = "scan_" + std::to_string(i) + ".png";
        canvas.SavePng(image::Blank(3, 3, 1, image::kBlack), path);
        paths.push_back(path);
    }
    qrbackup::testing::EchoSymbolDetector detector;
    collector::CodeCollector codes;
    std::ostringstream log;
    auto summary = detect::ScanImages(paths, canvas, detector, 0, 4, codes, log);
    EXPECT_EQ(summary.images, 12u);
    EXPECT_EQ(summary.unreadable, 0u);
    EXPECT_EQ(detector.calls.load(), 12u * detect::SearchSteps().size());
}

TEST(DetectTest, DetectorFailureAbortsScan) {
    MemoryCanvas canvas;
    canvas.SavePng(image::Blank(2, 2, 1), "a.png");
    canvas.SavePng(image::Blank(2, 2, 1), "b.png");
    ThrowingDetector detector;
    collector::CodeCollector codes;
    std::ostringstream log;
    EXPECT_THROW(detect::ScanImages({"a.png", "b.png"}, canvas, detector, 0, 2, codes, log), Error);
}
