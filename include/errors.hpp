#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

// File open/read/write/truncate/rename failures.
class IOError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

enum class DecodeFault {
    BadLength,         // missing/overflowing digits, or length < key + 2
    BadAction,         // action tag not in {p, g, d}
    MissingSeparator,  // key not terminated by '|'
    Truncated,         // buffer ends inside a record
    BadDocument        // SSTable content is not the expected JSON object
};

const char* to_string(DecodeFault fault);

// Malformed WAL or SSTable content. offset is the start of the record
// (or document) that failed to decode.
class DecodeError : public std::runtime_error {
public:
    DecodeError(DecodeFault fault, size_t offset, const std::string& detail);

    DecodeFault kind() const { return kind_; }
    size_t offset() const { return offset_; }

private:
    DecodeFault kind_;
    size_t offset_;
};

// Builds an IOError message of the form "<what> <path>: <strerror(errno)>".
IOError io_error(const std::string& what, const std::string& path, int err);
