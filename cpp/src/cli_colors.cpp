#include "qrbackup/cli_colors.hpp"

#include "qrbackup/env.hpp"

#include <iostream>

#if defined(_WIN32) || defined(_WIN64)
    #include <io.h>
    #include <windows.h>
    #define isatty _isatty
    #define fileno _fileno

    #ifndef ENABLE_VIRTUAL_TERMINAL_PROCESSING
        #define ENABLE_VIRTUAL_TERMINAL_PROCESSING 0x0004
    #endif
#else
    #include <unistd.h>
#endif

namespace qrbackup::cli {

namespace {
    bool g_forced_off = false;

#if defined(_WIN32) || defined(_WIN64)
    bool EnableWindowsAnsiColors() {
        HANDLE hOut = GetStdHandle(STD_OUTPUT_HANDLE);
        if (hOut == INVALID_HANDLE_VALUE) {
            return false;
        }
        DWORD mode = 0;
        if (!GetConsoleMode(hOut, &mode)) {
            return false;
        }
        mode |= ENABLE_VIRTUAL_TERMINAL_PROCESSING;
        return SetConsoleMode(hOut, mode) != 0;
    }
#endif

    bool StreamIsTty(std::ostream& os) {
        if (&os == &std::cout) {
            return isatty(fileno(stdout)) != 0;
        }
        if (&os == &std::cerr) {
            return isatty(fileno(stderr)) != 0;
        }
        // string streams and files in tests never get escape codes
        return false;
    }
}

bool ColorsEnabled(std::ostream& os) {
    if (g_forced_off || qrbackup::env::IsEnabled("QRBACKUP_NO_COLOR")) {
        return false;
    }
    bool is_tty = StreamIsTty(os);
#if defined(_WIN32) || defined(_WIN64)
    if (is_tty) {
        static const bool ansi_ok = EnableWindowsAnsiColors();
        is_tty = ansi_ok;
    }
#endif
    return is_tty;
}

void SetColorsEnabled(bool enabled) {
    g_forced_off = !enabled;
}

std::string Colorize(const std::string& text, const char* color, std::ostream& os) {
    if (!ColorsEnabled(os)) {
        return text;
    }
    return std::string(color) + text + color::RESET;
}

std::string ErrorLine(const std::string& message, std::ostream& os) {
    return BoldRed("Error: ", os) + Red(message, os);
}

}  // namespace qrbackup::cli
