#include "qrbackup/zbar_detector.hpp"

#include "qrbackup/env.hpp"
#include "qrbackup/errors.hpp"
#include "qrbackup/fileio.hpp"

#include <array>
#include <cstdio>
#include <sstream>

#if defined(_WIN32) || defined(_WIN64)
    #define popen _popen
    #define pclose _pclose
#else
    #include <sys/wait.h>
#endif

namespace qrbackup::symbols {

namespace {

// zbarimg exit status when the image holds no barcode
constexpr int kZbarNothingFound = 4;

std::string QuoteArg(const std::string& arg) {
    std::string out;
    out.reserve(arg.size() + 2);
    out.push_back('"');
    for (char ch : arg) {
        if (ch == '"' || ch == '\\' || ch == '$' || ch == '`') {
            out.push_back('\\');
        }
        out.push_back(ch);
    }
    out.push_back('"');
    return out;
}

std::string JoinArgs(const std::vector<std::string>& args) {
    std::ostringstream oss;
    bool first = true;
    for (const auto& arg : args) {
        if (!first) {
            oss << ' ';
        }
        first = false;
        oss << QuoteArg(arg);
    }
    return oss.str();
}

std::vector<std::string> SplitLines(const std::string& input) {
    std::vector<std::string> lines;
    std::istringstream iss(input);
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

}  // namespace

CommandResult RunCommandCapture(const std::vector<std::string>& args) {
    std::string cmd = JoinArgs(args);
#if !defined(_WIN32) && !defined(_WIN64)
    cmd += " 2>/dev/null";
#endif
    std::array<char, 4096> buffer{};
    CommandResult result;
    FILE* pipe = popen(cmd.c_str(), "r");
    if (!pipe) {
        throw Error("Failed to run command: " + cmd);
    }
    while (std::fgets(buffer.data(), static_cast<int>(buffer.size()), pipe)) {
        result.output.append(buffer.data());
    }
    int status = pclose(pipe);
    if (status == -1) {
        throw Error("Failed to wait for command: " + cmd);
    }
#if defined(_WIN32) || defined(_WIN64)
    result.exit_code = status;
#else
    if (!WIFEXITED(status)) {
        throw Error("Command terminated abnormally: " + cmd);
    }
    result.exit_code = WEXITSTATUS(status);
#endif
    return result;
}

ZbarSymbolDetector::ZbarSymbolDetector(Canvas& canvas, std::filesystem::path scratch_dir, std::string executable)
    : canvas_(canvas), scratch_dir_(std::move(scratch_dir)), executable_(std::move(executable)) {
    if (scratch_dir_.empty()) {
        scratch_dir_ = std::filesystem::temp_directory_path();
    }
    if (executable_.empty()) {
        executable_ = qrbackup::env::Get("QRBACKUP_ZBARIMG");
    }
    if (executable_.empty()) {
        executable_ = "zbarimg";
    }
}

std::vector<std::string> ZbarSymbolDetector::Detect(const image::ImageBuffer& image) {
    fileio::ScopedTempFile scratch(scratch_dir_, "qrbackup_scan", ".png");
    canvas_.SavePng(image, scratch.Path());

    CommandResult result = RunCommandCapture({
        executable_, "--quiet", "--raw", "-Sdisable", "-Sqrcode.enable", scratch.Path().string()
    });
    if (result.exit_code == kZbarNothingFound) {
        return {};
    }
    if (result.exit_code != 0) {
        throw Error("Barcode detector " + executable_ + " failed with exit status "
                    + std::to_string(result.exit_code));
    }
    return SplitLines(result.output);
}

}  // namespace qrbackup::symbols
