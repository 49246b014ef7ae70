#include "memtable.hpp"

#include <algorithm>
#include <mutex>

void MemTable::put(const std::string& key, const std::string& value) {
    std::unique_lock lock(mutex_);
    active_[key] = value;
}

void MemTable::del(const std::string& key) {
    std::unique_lock lock(mutex_);
    active_.erase(key);
}

std::optional<std::string> MemTable::get(const std::string& key) const {
    std::shared_lock lock(mutex_);
    auto it = active_.find(key);
    if (it != active_.end()) return it->second;

    it = immutable_.find(key);
    if (it != immutable_.end()) return it->second;
    return std::nullopt;
}

MemTable::Entries MemTable::immutable_sorted() const {
    std::shared_lock lock(mutex_);
    Entries entries(immutable_.begin(), immutable_.end());
    std::sort(entries.begin(), entries.end(),
              [](const auto& a, const auto& b) { return a.first < b.first; });
    return entries;
}

bool MemTable::flush_immutable_to(const std::function<void(const Entries&)>& sink) const {
    Entries entries = immutable_sorted();
    if (entries.empty()) return false;
    sink(entries);
    return true;
}

void MemTable::rotate() {
    std::unique_lock lock(mutex_);
    immutable_ = std::move(active_);
    active_ = Map{};
}

size_t MemTable::active_size() const {
    std::shared_lock lock(mutex_);
    return active_.size();
}

size_t MemTable::immutable_size() const {
    std::shared_lock lock(mutex_);
    return immutable_.size();
}
