#pragma once

#include <string>
#include <optional>
#include <unordered_map>
#include <shared_mutex>
#include <functional>
#include <utility>
#include <vector>
#include <cstddef>

// Active + immutable key/value tables. Writes land in the active table;
// rotate() freezes it as the immutable table, which is held until the next
// rotation flushes it.
class MemTable {
public:
    using Entries = std::vector<std::pair<std::string, std::string>>;

    void put(const std::string& key, const std::string& value);

    // Erases from the active table only. A value still sitting in the
    // immutable table stays visible to get().
    void del(const std::string& key);

    std::optional<std::string> get(const std::string& key) const;

    // Immutable entries, ascending by key.
    Entries immutable_sorted() const;

    // Calls sink with immutable_sorted() if the immutable table is non-empty.
    // Returns false when there was nothing to flush.
    bool flush_immutable_to(const std::function<void(const Entries&)>& sink) const;

    // active -> immutable, fresh empty active.
    void rotate();

    size_t active_size() const;
    size_t immutable_size() const;

private:
    using Map = std::unordered_map<std::string, std::string>;

    Map active_;
    Map immutable_;
    mutable std::shared_mutex mutex_;
};
