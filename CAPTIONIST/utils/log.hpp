#pragma once

#include <string>

namespace captionist::log {

enum class Level {
    Error = 0,
    Warn  = 1,
    Info  = 2,
    Debug = 3,
};

// The starting level comes from CAPTIONIST_LOG_LEVEL (error|warn|info|debug, default info).
// CAPTIONIST_LOG_FILE mirrors every line into a file, appended when CAPTIONIST_LOG_APPEND is set.
void set_level(Level level);
Level level();

void error(const std::string& message);
void warn(const std::string& message);
void info(const std::string& message);
void debug(const std::string& message);

// Restores the previous level on destruction.
class ScopedLevel {
public:
    explicit ScopedLevel(Level next);
    ~ScopedLevel();

    ScopedLevel(const ScopedLevel&) = delete;
    ScopedLevel& operator=(const ScopedLevel&) = delete;

private:
    Level previous_;
};

}
