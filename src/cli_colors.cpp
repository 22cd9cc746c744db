#include "vidstore/cli_colors.hpp"

#include "vidstore/env.hpp"

#include <cstdio>
#include <unistd.h>

namespace vidstore::cli {

namespace {
    bool g_colors_enabled = true;
    bool g_colors_checked = false;
}

bool ColorsEnabled() {
    if (!g_colors_checked) {
        const std::string term = env::Get("TERM");
        g_colors_enabled = isatty(fileno(stderr)) != 0 && env::Get("NO_COLOR").empty() && term != "dumb";
        g_colors_checked = true;
    }
    return g_colors_enabled;
}

void SetColorsEnabled(bool enabled) {
    g_colors_enabled = enabled;
    g_colors_checked = true;
}

std::string Colorize(const std::string& text, const char* color) {
    if (!ColorsEnabled()) {
        return text;
    }
    return std::string(color) + text + color::RESET;
}

}  // namespace vidstore::cli
