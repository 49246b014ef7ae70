#pragma once

#include <sstream>
#include <string>

enum class LogLevel { Debug = 0, Info = 1, Warn = 2, Error = 3, Off = 4 };

class Logger {
public:
    explicit Logger(LogLevel threshold = LogLevel::Warn) : threshold_(threshold) {}

    bool enabled(LogLevel lvl) const { return lvl >= threshold_ && lvl != LogLevel::Off; }
    void write(LogLevel lvl, const std::string& msg) const;

    LogLevel threshold() const { return threshold_; }

private:
    LogLevel threshold_;
};

// Streams into a buffer and emits a single line when it goes out of scope.
//   LogLine(logger_, LogLevel::Info) << "replayed " << n << " records";
class LogLine {
public:
    LogLine(const Logger& logger, LogLevel lvl) : logger_(logger), lvl_(lvl) {}
    ~LogLine() {
        if (logger_.enabled(lvl_)) logger_.write(lvl_, os_.str());
    }

    template <typename T>
    LogLine& operator<<(const T& v) {
        if (logger_.enabled(lvl_)) os_ << v;
        return *this;
    }

private:
    const Logger& logger_;
    LogLevel lvl_;
    std::ostringstream os_;
};
