#include "logging.hpp"

#include <iostream>
#include <mutex>

namespace {
const char* level_tag(LogLevel lvl) {
    switch (lvl) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
        case LogLevel::Off:   break;
    }
    return "";
}

// keeps lines from concurrent engines whole
std::mutex& stderr_mutex() {
    static std::mutex mu;
    return mu;
}
} // namespace

void Logger::write(LogLevel lvl, const std::string& msg) const {
    std::lock_guard<std::mutex> lk(stderr_mutex());
    std::cerr << "[plutodb] " << level_tag(lvl) << ": " << msg << "\n";
}
