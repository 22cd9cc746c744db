#include "vidstore/log.hpp"

#include "vidstore/cli_colors.hpp"
#include "vidstore/env.hpp"

#include <atomic>
#include <iostream>
#include <mutex>

namespace vidstore::log {

namespace {

Level InitialLevel() {
    if (env::IsEnabled("VIDSTORE_DEBUG")) {
        return Level::Debug;
    }
    if (env::IsEnabled("VIDSTORE_QUIET")) {
        return Level::Warn;
    }
    return Level::Info;
}

std::atomic<int>& LevelSlot() {
    static std::atomic<int> level{static_cast<int>(InitialLevel())};
    return level;
}

std::mutex& OutputMutex() {
    static std::mutex mutex;
    return mutex;
}

void Emit(Level level, const char* tag, const char* color, const std::string& message) {
    if (static_cast<int>(level) < LevelSlot().load()) {
        return;
    }
    std::lock_guard<std::mutex> lock(OutputMutex());
    std::cerr << cli::Colorize(tag, color) << " " << message << std::endl;
}

}  // namespace

void SetLevel(Level level) {
    LevelSlot().store(static_cast<int>(level));
}

Level CurrentLevel() {
    return static_cast<Level>(LevelSlot().load());
}

void Debug(const std::string& message) {
    Emit(Level::Debug, "[debug]", cli::color::BRIGHT_BLACK, message);
}

void Info(const std::string& message) {
    Emit(Level::Info, "[info]", cli::color::CYAN, message);
}

void Warn(const std::string& message) {
    Emit(Level::Warn, "[warn]", cli::color::BOLD_YELLOW, message);
}

void Error(const std::string& message) {
    Emit(Level::Error, "[error]", cli::color::BOLD_RED, message);
}

}  // namespace vidstore::log
