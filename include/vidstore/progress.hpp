#pragma once

#include <chrono>
#include <string>

namespace vidstore::progress {

// Two-line bar on stderr: overall progress and the current stage.
class ProgressReporter {
public:
    explicit ProgressReporter(std::string label, bool enabled = true);

    ProgressReporter(const ProgressReporter&) = delete;
    ProgressReporter& operator=(const ProgressReporter&) = delete;

    void Update(double overall, const std::string& stage, double stage_fraction);

    static std::string RenderBar(double fraction, int width = 30);

private:
    std::string label_;
    bool enabled_;
    bool printed_ = false;
    bool use_ansi_ = false;
    std::chrono::steady_clock::time_point last_tick_{};
    double last_fraction_ = -1.0;
    std::string last_stage_;
};

}  // namespace vidstore::progress
