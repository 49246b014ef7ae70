#pragma once

#include <string>
#include <optional>
#include <memory>
#include <mutex>
#include <cstdint>
#include <cstddef>

#include "options.hpp"
#include "logging.hpp"
#include "memtable.hpp"
#include "record.hpp"

class WAL;

class PlutoDB {
public:
    explicit PlutoDB(const Options& options);
    explicit PlutoDB(const std::string& data_dir);
    ~PlutoDB();

    PlutoDB(const PlutoDB&) = delete;
    PlutoDB& operator=(const PlutoDB&) = delete;

    // Durable once these return. Keys must not contain '|'
    // (std::invalid_argument); log failures throw IOError and leave the
    // tables untouched.
    void put(const std::string& key, const std::string& value);
    void del(const std::string& key);

    // nullopt when the key is in neither table.
    std::optional<std::string> get(const std::string& key) const;

    // Flush the immutable table (if any) to the next generation, truncate the
    // log, and freeze the active table. Runs automatically before a write
    // once the log holds more than Options::log_limit records.
    void compact();

    void close();

    size_t log_size() const;
    uint64_t next_level() const;
    const std::string& data_dir() const { return options_.dir; }

private:
    Options options_;
    Logger log_;

    MemTable tables_;
    std::unique_ptr<WAL> wal_;
    uint64_t level_{0};

    // held across compaction check, log append and table apply
    mutable std::mutex write_mu_;

    void write_(Action action, const std::string& key, const std::string& value);
    void apply_(const Record& record);
    void replay_();
    void compact_unsafe_();
};
