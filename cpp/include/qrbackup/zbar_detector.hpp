#pragma once

#include "qrbackup/capabilities.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace qrbackup::symbols {

// Hands each image to the `zbarimg` tool through a scratch PNG written by
// `canvas`. Safe for concurrent Detect calls.
class ZbarSymbolDetector : public SymbolDetector {
public:
    explicit ZbarSymbolDetector(Canvas& canvas,
                                std::filesystem::path scratch_dir = {},
                                std::string executable = {});

    std::vector<std::string> Detect(const image::ImageBuffer& image) override;

    const std::string& Executable() const noexcept { return executable_; }

private:
    Canvas& canvas_;
    std::filesystem::path scratch_dir_;
    std::string executable_;
};

struct CommandResult {
    int exit_code = 0;
    std::string output;
};

// Runs `args` through the shell, capturing stdout. Throws Error when the command
// cannot be started or does not exit normally.
CommandResult RunCommandCapture(const std::vector<std::string>& args);

}  // namespace qrbackup::symbols
