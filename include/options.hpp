#pragma once

#include <cstddef>
#include <string>

#include "logging.hpp"

struct Options {
    std::string dir = ".";

    // WAL record count above which the next write compacts first.
    size_t log_limit = 4096;

    // fdatasync the log after every append.
    bool sync_writes = true;

    // Reapply logged records to the tables when the engine opens.
    bool replay_on_open = true;

    LogLevel log_level = LogLevel::Warn;
};
