#include "vidstore/progress.hpp"

#include "vidstore/cli_colors.hpp"

#include <cmath>
#include <iostream>
#include <utility>

namespace vidstore::progress {

ProgressReporter::ProgressReporter(std::string label, bool enabled)
    : label_(std::move(label)), enabled_(enabled) {
    use_ansi_ = cli::ColorsEnabled();
    last_tick_ = std::chrono::steady_clock::now();
}

std::string ProgressReporter::RenderBar(double fraction, int width) {
    if (fraction < 0.0) {
        fraction = 0.0;
    } else if (fraction > 1.0) {
        fraction = 1.0;
    }
    int filled = static_cast<int>(std::round(fraction * width));
    if (filled > width) {
        filled = width;
    }
    std::string bar;
    bar.reserve(static_cast<std::size_t>(width + 2));
    bar.push_back('(');
    bar.append(static_cast<std::size_t>(filled), '#');
    bar.append(static_cast<std::size_t>(width - filled), ' ');
    bar.push_back(')');
    return bar;
}

void ProgressReporter::Update(double overall, const std::string& stage, double stage_fraction) {
    if (!enabled_) {
        return;
    }
    auto now = std::chrono::steady_clock::now();
    auto delta = std::chrono::duration_cast<std::chrono::milliseconds>(now - last_tick_);
    if (printed_ && stage == last_stage_ && delta.count() < 120 && overall < 1.0 &&
        std::abs(overall - last_fraction_) < 0.005) {
        return;
    }
    last_tick_ = now;
    last_fraction_ = overall;
    last_stage_ = stage;
    const int pct = static_cast<int>(std::round(overall * 100.0));
    const int stage_pct = static_cast<int>(std::round(stage_fraction * 100.0));
    std::string line1 = "Overall " + RenderBar(overall) + " " + std::to_string(pct) + "% " + label_;
    std::string line2 = "Stage   " + RenderBar(stage_fraction) + " " + std::to_string(stage_pct) + "% " + stage;
    if (use_ansi_) {
        if (printed_) {
            std::cerr << "\033[2A";
        }
        std::cerr << "\r\033[2K" << line1 << "\n"
                  << "\r\033[2K" << line2 << "\n" << std::flush;
    } else {
        std::cerr << line1 << "\n" << line2 << std::endl;
    }
    printed_ = true;
}

}  // namespace vidstore::progress
