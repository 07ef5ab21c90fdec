#pragma once

#include <iostream>
#include <string>
#include <mutex>
#include <atomic>

namespace Seed {

/**
 * @brief Thread-safe console logger shared by the library and the tools.
 *
 * Info/Step/Success/Progress go to stdout, Warning/Error to stderr.
 * Levels below the configured minimum are dropped.
 */
class Logger {
public:
    enum class Level {
        Progress = 0,
        Info,
        Step,
        Success,
        Warning,
        Error,
        Silent
    };

    static void log(Level level, const std::string& message) {
        if (level < min_level() || level == Level::Silent) return;

        static std::mutex mutex;
        std::lock_guard<std::mutex> lock(mutex);

        const char* color = "";
        const char* prefix = "";

        switch (level) {
            case Level::Progress: color = "\033[0;35m"; prefix = "[..] "; break; // Magenta
            case Level::Info:     color = "\033[0;36m"; prefix = "=== "; break;  // Cyan
            case Level::Step:     color = "\033[1;33m"; prefix = ">>> "; break;  // Yellow
            case Level::Success:  color = "\033[0;32m"; prefix = "✓ ";   break;  // Green
            case Level::Warning:  color = "\033[1;33m"; prefix = "⚠ ";   break;  // Yellow
            case Level::Error:    color = "\033[0;31m"; prefix = "✗ ";   break;  // Red
            case Level::Silent:   break;
        }

        std::ostream& out = (level >= Level::Warning) ? std::cerr : std::cout;
        if (use_color()) {
            out << color << prefix << message << "\033[0m" << std::endl;
        } else {
            out << prefix << message << std::endl;
        }
    }

    static void progress(const std::string& msg) { log(Level::Progress, msg); }
    static void info(const std::string& msg)     { log(Level::Info, msg); }
    static void step(const std::string& msg)     { log(Level::Step, msg); }
    static void success(const std::string& msg)  { log(Level::Success, msg); }
    static void warn(const std::string& msg)     { log(Level::Warning, msg); }
    static void error(const std::string& msg)    { log(Level::Error, msg); }

    static void set_min_level(Level level) { min_level_ref().store(level); }
    static Level min_level() { return min_level_ref().load(); }

    static void set_color(bool enabled) { color_ref().store(enabled); }
    static bool use_color() { return color_ref().load(); }

private:
    static std::atomic<Level>& min_level_ref() {
        static std::atomic<Level> level{Level::Progress};
        return level;
    }

    static std::atomic<bool>& color_ref() {
        static std::atomic<bool> enabled{true};
        return enabled;
    }
};

} // namespace Seed
