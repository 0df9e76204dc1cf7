#pragma once

#include <iostream>
#include <mutex>
#include <string>

enum class LogLevel { Debug, Info, Warning, Error };

const char* log_level_name(LogLevel level);

// Line-oriented diagnostics sink. Safe to call from the playback thread and
// the capture callback.
class Logger {
public:
    explicit Logger(std::ostream& out = std::cerr, LogLevel minLevel = LogLevel::Warning)
        : out_(&out), minLevel_(minLevel) {}

    bool enabled(LogLevel level) const { return level >= minLevel_; }

    void log(LogLevel level, const std::string& msg);

    void debug(const std::string& msg) { log(LogLevel::Debug, msg); }
    void info(const std::string& msg) { log(LogLevel::Info, msg); }
    void warn(const std::string& msg) { log(LogLevel::Warning, msg); }
    void error(const std::string& msg) { log(LogLevel::Error, msg); }

private:
    std::ostream* out_;
    LogLevel minLevel_;
    std::mutex mu_;
};
