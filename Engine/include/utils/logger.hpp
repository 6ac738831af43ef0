#pragma once

#include <atomic>
#include <iostream>
#include <string>
#include <mutex>

namespace Engram {

/**
 * @brief Thread-safe console logger for the engine and its tools.
 *
 * Warnings and errors go to stderr, progress output to stdout.
 */
class Logger {
public:
    enum class Level {
        Info = 0,
        Step,
        Success,
        Warning,
        Error,
        Silent
    };

    static void log(Level level, const std::string& message) {
        if (static_cast<int>(level) < static_cast<int>(threshold().load())) return;

        static std::mutex mutex;
        std::lock_guard<std::mutex> lock(mutex);

        const char* color = "";
        const char* prefix = "";

        switch (level) {
            case Level::Info:    color = "\033[0;36m"; prefix = "=== "; break; // Cyan
            case Level::Step:    color = "\033[1;33m"; prefix = ">>> "; break; // Yellow
            case Level::Success: color = "\033[0;32m"; prefix = "✓ ";   break; // Green
            case Level::Warning: color = "\033[1;33m"; prefix = "⚠ ";   break; // Yellow
            case Level::Error:   color = "\033[0;31m"; prefix = "✗ ";   break; // Red
            case Level::Silent:  return;
        }

        std::ostream& out = (level >= Level::Warning) ? std::cerr : std::cout;
        out << color << prefix << message << "\033[0m" << std::endl;
    }

    /**
     * @brief Drop every message below the given level.
     */
    static void set_level(Level level) { threshold().store(level); }
    static Level level() { return threshold().load(); }

    static void info(const std::string& msg)    { log(Level::Info, msg); }
    static void step(const std::string& msg)    { log(Level::Step, msg); }
    static void success(const std::string& msg) { log(Level::Success, msg); }
    static void warn(const std::string& msg)    { log(Level::Warning, msg); }
    static void error(const std::string& msg)   { log(Level::Error, msg); }

private:
    static std::atomic<Level>& threshold() {
        static std::atomic<Level> value{Level::Info};
        return value;
    }
};

} // namespace Engram
