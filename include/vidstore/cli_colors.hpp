#pragma once

#include <string>

namespace vidstore::cli {

// ANSI color codes
namespace color {
    constexpr const char* RESET = "\033[0m";

    constexpr const char* GREEN = "\033[0;32m";
    constexpr const char* CYAN = "\033[0;36m";

    constexpr const char* BOLD_RED = "\033[1;31m";
    constexpr const char* BOLD_YELLOW = "\033[1;33m";

    constexpr const char* BRIGHT_BLACK = "\033[0;90m";
}

// Diagnostics go to stderr, so detection looks at stderr. NO_COLOR or TERM=dumb disables.
bool ColorsEnabled();

// --no-color
void SetColorsEnabled(bool enabled);

std::string Colorize(const std::string& text, const char* color);

inline std::string Green(const std::string& text) { return Colorize(text, color::GREEN); }
inline std::string Dim(const std::string& text) { return Colorize(text, color::BRIGHT_BLACK); }

inline std::string BoldRed(const std::string& text) { return Colorize(text, color::BOLD_RED); }

}  // namespace vidstore::cli
