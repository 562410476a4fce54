#pragma once

#include <atomic>
#include <mutex>
#include <optional>
#include <string>

namespace monosync {

enum class LogLevel { Error = 0, Warn = 1, Info = 2, Debug = 3 };

/// Parse "debug|info|warn|error" or "0".."3"
std::optional<LogLevel> parseLogLevel(const std::string& text);

/**
 * @brief Process-wide leveled logger
 *
 * Initial level comes from MONOSYNC_LOG (defaults to warn). Every line goes
 * to stderr so that command output on stdout stays parseable. Lines from
 * concurrent pushes are not interleaved.
 */
class Logger {
public:
    static Logger& instance();
    void setLevel(LogLevel level);
    LogLevel level() const;
    bool enabled(LogLevel level) const { return currentLevel >= level; }
    void error(const std::string& msg) const;
    void warn(const std::string& msg) const;
    void info(const std::string& msg) const;
    void debug(const std::string& msg) const;

private:
    Logger();
    void write(const char* tag, const std::string& msg) const;

    std::atomic<LogLevel> currentLevel;
    mutable std::mutex mtx;
};

}
