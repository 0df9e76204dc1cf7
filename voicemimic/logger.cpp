#include "logger.hpp"

#include <mutex>
#include <string>


const char* log_level_name(LogLevel level) {
    switch (level) {
        case LogLevel::Debug:   return "debug";
        case LogLevel::Info:    return "info";
        case LogLevel::Warning: return "warning";
        case LogLevel::Error:   return "error";
    }
    return "?";
}

void Logger::log(LogLevel level, const std::string& msg) {
    if (!enabled(level)) return;
    std::lock_guard<std::mutex> lock(mu_);
    (*out_) << "[" << log_level_name(level) << "] " << msg << "\n";
    out_->flush();
}
