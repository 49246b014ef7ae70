#pragma once

#include <string>
#include <vector>
#include <utility>
#include <cstdint>

// One flushed generation: <dir>/<level>.sst, a JSON object mapping each key
// to its value in ascending key order. Written once, never modified.
class SSTable {
public:
    using Entries = std::vector<std::pair<std::string, std::string>>;

    static constexpr const char* kExtension = ".sst";

    static std::string file_name(uint64_t level);

    // entries must be sorted by key ascending; they are written in the order
    // given. Writes <path>.tmp, fsyncs, then renames over path. Throws IOError.
    static void write_atomic(const std::string& final_path, const Entries& entries);

    // Reads a generation back in document order. Throws IOError / DecodeError.
    static Entries load(const std::string& path);

    // One past the highest <n>.sst in dir, or 0 if there is none.
    static uint64_t discover_next_level(const std::string& dir);
};
