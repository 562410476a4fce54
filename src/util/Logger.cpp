#include "util/Logger.hpp"

#include <cstdlib>
#include <iostream>

namespace monosync {

std::optional<LogLevel> parseLogLevel(const std::string& v) {
    if (v == "debug" || v == "3") return LogLevel::Debug;
    if (v == "info" || v == "2") return LogLevel::Info;
    if (v == "warn" || v == "1") return LogLevel::Warn;
    if (v == "error" || v == "0") return LogLevel::Error;
    return std::nullopt;
}

static LogLevel levelFromEnv() {
    const char* env = std::getenv("MONOSYNC_LOG");
    if (!env) return LogLevel::Warn;
    return parseLogLevel(env).value_or(LogLevel::Warn);
}

Logger& Logger::instance() {
    static Logger inst;
    return inst;
}

Logger::Logger() : currentLevel(levelFromEnv()) {}

void Logger::setLevel(LogLevel level) { currentLevel = level; }
LogLevel Logger::level() const { return currentLevel; }

void Logger::write(const char* tag, const std::string& msg) const {
    std::scoped_lock lock(mtx);
    std::cerr << tag << ' ' << msg << '\n';
}

void Logger::error(const std::string& msg) const { if (enabled(LogLevel::Error)) write("[error]", msg); }
void Logger::warn(const std::string& msg) const { if (enabled(LogLevel::Warn)) write("[warn ]", msg); }
void Logger::info(const std::string& msg) const { if (enabled(LogLevel::Info)) write("[info ]", msg); }
void Logger::debug(const std::string& msg) const { if (enabled(LogLevel::Debug)) write("[debug]", msg); }

}
