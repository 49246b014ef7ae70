#pragma once

#include <string>
#include <vector>
#include <mutex>
#include <cstddef>

#include "record.hpp"

// Append-only log of encoded records in <dir>/wal.log. The in-memory record
// list mirrors the file: it is filled by decoding the file on open, grows on
// append, and is cleared together with the file on compact.
class WAL {
public:
    static constexpr const char* kFileName = "wal.log";

    // Throws IOError if the file cannot be opened or read, DecodeError if its
    // contents are malformed.
    WAL(const std::string& dir, bool sync);
    ~WAL();

    WAL(const WAL&) = delete;
    WAL& operator=(const WAL&) = delete;

    // Adds the record to the list, then writes it. On IOError the record
    // stays in the list but may not be on disk.
    void append(const Record& record);

    size_t size() const;
    Record last() const;
    std::vector<Record> records() const;

    // Truncates the file and clears the list. Once the truncation succeeds the
    // list is cleared even if the following seek or sync throws.
    void compact();
    void close();

    bool is_open() const;
    const std::string& path() const { return path_; }

private:
    std::string path_;
    int fd_{-1};
    bool sync_;

    std::vector<Record> records_;
    mutable std::mutex mutex_;

    std::string read_all_();
    void write_all_(const std::string& bytes);
    void ensure_open_() const;
};
