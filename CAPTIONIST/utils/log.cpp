#include "log.hpp"

#include <atomic>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <mutex>

#include "utils/string_utils.hpp"

namespace captionist::log {

namespace {

Level level_from_env(const char* value) {
    if (!value) {
        return Level::Info;
    }
    const std::string name = strings::to_lower_copy(strings::trim_copy(value));
    if (name == "error") return Level::Error;
    if (name == "warn" || name == "warning") return Level::Warn;
    if (name == "debug") return Level::Debug;
    return Level::Info;
}

bool flag_from_env(const char* value) {
    const std::string flag = value ? strings::to_lower_copy(strings::trim_copy(value)) : std::string{};
    return flag == "1" || flag == "true" || flag == "yes" || flag == "on";
}

const char* tag_for(Level level) {
    switch (level) {
        case Level::Error: return "ERROR";
        case Level::Warn:  return "WARN";
        case Level::Info:  return "INFO";
        case Level::Debug: return "DEBUG";
    }
    return "INFO";
}

// Process-wide output state, configured from the environment on first use.
struct Sink {
    Sink()
    : threshold(level_from_env(std::getenv("CAPTIONIST_LOG_LEVEL"))),
      started(std::chrono::steady_clock::now()) {
        const char* path = std::getenv("CAPTIONIST_LOG_FILE");
        if (path && *path) {
            const auto mode = flag_from_env(std::getenv("CAPTIONIST_LOG_APPEND")) ? std::ios::app : std::ios::trunc;
            file.open(path, std::ios::out | mode);
            if (!file.is_open()) {
                std::cerr << "[WARN] could not open log file '" << path << "'\n";
            }
        }
    }

    void write(Level level, const std::string& message) {
        if (static_cast<int>(level) > static_cast<int>(threshold.load())) {
            return;
        }
        const double seconds = std::chrono::duration<double>(std::chrono::steady_clock::now() - started).count();
        char stamp[32];
        std::snprintf(stamp, sizeof(stamp), "%.3f", seconds);

        std::lock_guard<std::mutex> lock(mutex);
        std::ostream& console = level == Level::Error ? std::cerr : std::cout;
        console << '[' << tag_for(level) << "] +" << stamp << "s: " << message << std::endl;
        if (file.is_open()) {
            file << '[' << tag_for(level) << "] +" << stamp << "s: " << message << std::endl;
        }
    }

    std::atomic<Level> threshold;
    std::chrono::steady_clock::time_point started;
    std::mutex mutex;
    std::ofstream file;
};

Sink& sink() {
    static Sink instance;
    return instance;
}

}

void set_level(Level level) { sink().threshold.store(level); }
Level level() { return sink().threshold.load(); }

void error(const std::string& message) { sink().write(Level::Error, message); }
void warn(const std::string& message)  { sink().write(Level::Warn, message); }
void info(const std::string& message)  { sink().write(Level::Info, message); }
void debug(const std::string& message) { sink().write(Level::Debug, message); }

ScopedLevel::ScopedLevel(Level next)
: previous_(level()) {
    set_level(next);
}

ScopedLevel::~ScopedLevel() {
    set_level(previous_);
}

}
