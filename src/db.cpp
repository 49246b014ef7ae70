#include "db.hpp"
#include "wal.hpp"
#include "sstable.hpp"
#include "errors.hpp"

#include <filesystem>
#include <stdexcept>

static Options with_dir(const std::string& dir) {
    Options o;
    o.dir = dir;
    return o;
}

PlutoDB::PlutoDB(const Options& options)
    : options_(options),
      log_(options.log_level)
{
    std::error_code ec;
    std::filesystem::create_directories(options_.dir, ec);
    if (ec) throw IOError("create directory " + options_.dir + ": " + ec.message());

    level_ = SSTable::discover_next_level(options_.dir);
    wal_ = std::make_unique<WAL>(options_.dir, options_.sync_writes);

    if (options_.replay_on_open) replay_();

    LogLine(log_, LogLevel::Info) << "opened " << options_.dir << ": " << wal_->size()
                                  << " logged records, next generation " << level_;
}

PlutoDB::PlutoDB(const std::string& data_dir)
    : PlutoDB(with_dir(data_dir)) {}

PlutoDB::~PlutoDB() {
    close();
}

void PlutoDB::close() {
    std::lock_guard<std::mutex> lk(write_mu_);
    if (wal_) wal_->close();
}

void PlutoDB::replay_() {
    for (const auto& r : wal_->records()) apply_(r);
}

void PlutoDB::apply_(const Record& record) {
    switch (record.action) {
        case Action::Put:
            tables_.put(record.key, record.value);
            break;
        case Action::Delete:
            tables_.del(record.key);
            break;
        case Action::Get:
            break;
    }
}

void PlutoDB::put(const std::string& key, const std::string& value) {
    write_(Action::Put, key, value);
}

void PlutoDB::del(const std::string& key) {
    write_(Action::Delete, key, {});
}

void PlutoDB::write_(Action action, const std::string& key, const std::string& value) {
    if (!key_is_encodable(key)) {
        throw std::invalid_argument("key contains separator '|'");
    }
    Record record = Record::make(action, key, value);

    std::lock_guard<std::mutex> lk(write_mu_);
    if (!wal_->is_open()) throw IOError("database is closed: " + options_.dir);

    if (wal_->size() > options_.log_limit) compact_unsafe_();

    wal_->append(record);
    apply_(wal_->last());
}

std::optional<std::string> PlutoDB::get(const std::string& key) const {
    return tables_.get(key);
}

void PlutoDB::compact() {
    std::lock_guard<std::mutex> lk(write_mu_);
    if (!wal_->is_open()) throw IOError("database is closed: " + options_.dir);
    compact_unsafe_();
}

// Writers are excluded by write_mu_, so the immutable table cannot change
// between the flush and the rotation.
void PlutoDB::compact_unsafe_() {
    try {
        const bool flushed = tables_.flush_immutable_to([&](const MemTable::Entries& entries) {
            const std::string path = options_.dir + "/" + SSTable::file_name(level_);
            SSTable::write_atomic(path, entries);
            LogLine(log_, LogLevel::Info) << "wrote generation " << path << " ("
                                          << entries.size() << " keys)";
        });
        if (flushed) ++level_;

        wal_->compact();
    } catch (const std::exception& e) {
        LogLine(log_, LogLevel::Warn) << "compaction aborted, tables kept: " << e.what();
        throw;
    }
    tables_.rotate();
}

size_t PlutoDB::log_size() const {
    return wal_->size();
}

uint64_t PlutoDB::next_level() const {
    std::lock_guard<std::mutex> lk(write_mu_);
    return level_;
}
