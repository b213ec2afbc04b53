#pragma once

#include <iostream>
#include <ostream>
#include <string>

namespace qrbackup::cli {

namespace color {
    constexpr const char* RESET = "\033[0m";

    constexpr const char* RED = "\033[0;31m";
    constexpr const char* GREEN = "\033[0;32m";
    constexpr const char* YELLOW = "\033[0;33m";
    constexpr const char* CYAN = "\033[0;36m";

    constexpr const char* BOLD_RED = "\033[1;31m";
    constexpr const char* BOLD_GREEN = "\033[1;32m";
    constexpr const char* BOLD_WHITE = "\033[1;37m";
}

// Colors are on only when the stream is a TTY, QRBACKUP_NO_COLOR is unset and
// SetColorsEnabled(false) was not called.
bool ColorsEnabled(std::ostream& os = std::cout);

void SetColorsEnabled(bool enabled);

std::string Colorize(const std::string& text, const char* color, std::ostream& os = std::cout);

inline std::string Red(const std::string& text, std::ostream& os = std::cout) { return Colorize(text, color::RED, os); }
inline std::string Green(const std::string& text, std::ostream& os = std::cout) { return Colorize(text, color::GREEN, os); }
inline std::string Yellow(const std::string& text, std::ostream& os = std::cout) { return Colorize(text, color::YELLOW, os); }
inline std::string Cyan(const std::string& text, std::ostream& os = std::cout) { return Colorize(text, color::CYAN, os); }

inline std::string BoldRed(const std::string& text, std::ostream& os = std::cout) { return Colorize(text, color::BOLD_RED, os); }
inline std::string BoldGreen(const std::string& text, std::ostream& os = std::cout) { return Colorize(text, color::BOLD_GREEN, os); }
inline std::string Bold(const std::string& text, std::ostream& os = std::cout) { return Colorize(text, color::BOLD_WHITE, os); }

// "Error: <message>" in red, the way every failure is reported.
std::string ErrorLine(const std::string& message, std::ostream& os = std::cerr);

}  // namespace qrbackup::cli
