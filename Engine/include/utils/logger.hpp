#pragma once

#include <iostream>
#include <string>
#include <mutex>
#include <atomic>

namespace Glossa {

/**
 * @brief Thread-safe logging utility for the translation engine.
 *
 * Messages below the process-wide threshold are dropped before the lock is
 * taken. Output goes to stderr so that rendered prose on stdout stays clean.
 */
class Logger {
public:
    enum class Level {
        Debug,
        Info,
        Step,
        Success,
        Warning,
        Error,
        Bulk,
        Off
    };

    static void set_threshold(Level level) { threshold().store(level); }
    static Level get_threshold() { return threshold().load(); }

    static bool enabled(Level level) {
        Level t = threshold().load();
        if (t == Level::Off) return false;
        // Bulk is progress output: shown whenever Info would be.
        Level effective = (level == Level::Bulk) ? Level::Info : level;
        return rank(effective) >= rank(t);
    }

    static void log(Level level, const std::string& message) {
        if (!enabled(level)) return;

        static std::mutex mutex;
        std::lock_guard<std::mutex> lock(mutex);

        const char* color = "";
        const char* prefix = "";

        switch (level) {
            case Level::Debug:   color = "\033[0;90m"; prefix = "... "; break; // Grey
            case Level::Info:    color = "\033[0;36m"; prefix = "=== "; break; // Cyan
            case Level::Step:    color = "\033[1;33m"; prefix = ">>> "; break; // Yellow
            case Level::Success: color = "\033[0;32m"; prefix = "✓ ";   break; // Green
            case Level::Warning: color = "\033[1;33m"; prefix = "⚠ ";   break; // Yellow
            case Level::Error:   color = "\033[0;31m"; prefix = "✗ ";   break; // Red
            case Level::Bulk:    color = "\033[0;35m"; prefix = "[BULK] "; break; // Magenta
            case Level::Off:     return;
        }

        std::cerr << color << prefix << message << "\033[0m" << std::endl;
    }

    /**
     * @brief Parse a level name as used by GLOSSA_LOG_LEVEL.
     * @throws std::invalid_argument on an unknown name
     */
    static Level parse_level(const std::string& name);

    static void debug(const std::string& msg)   { log(Level::Debug, msg); }
    static void info(const std::string& msg)    { log(Level::Info, msg); }
    static void step(const std::string& msg)    { log(Level::Step, msg); }
    static void success(const std::string& msg) { log(Level::Success, msg); }
    static void warn(const std::string& msg)    { log(Level::Warning, msg); }
    static void error(const std::string& msg)   { log(Level::Error, msg); }
    static void bulk(const std::string& msg)    { log(Level::Bulk, msg); }

private:
    static std::atomic<Level>& threshold() {
        static std::atomic<Level> level{Level::Warning};
        return level;
    }

    static int rank(Level level) {
        switch (level) {
            case Level::Debug:   return 0;
            case Level::Info:
            case Level::Step:
            case Level::Success:
            case Level::Bulk:    return 1;
            case Level::Warning: return 2;
            case Level::Error:   return 3;
            case Level::Off:     return 4;
        }
        return 4;
    }
};

} // namespace Glossa
