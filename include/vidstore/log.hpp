#pragma once

#include <string>

namespace vidstore::log {

enum class Level {
    Debug = 0,
    Info = 1,
    Warn = 2,
    Error = 3
};

// Defaults come from VIDSTORE_QUIET and VIDSTORE_DEBUG.
void SetLevel(Level level);
Level CurrentLevel();

void Debug(const std::string& message);
void Info(const std::string& message);
void Warn(const std::string& message);
void Error(const std::string& message);

}  // namespace vidstore::log
