#include "db.hpp"
#include "wal.hpp"
#include "sstable.hpp"
#include <atomic>
#include <cassert>
#include <filesystem>
#include <string>
#include <thread>
#include <vector>

static std::string slot_key(int writer, int i) {
    return "w" + std::to_string(writer) + "-" + std::to_string(i);
}

// Without compaction every acknowledged write must still be in the active
// table once the writers are done: a writer applying some other writer's log
// record instead of its own would lose keys here.
static void test_acknowledged_writes_visible() {
    const std::string dir = "data_test_concurrency_ack";
    std::filesystem::remove_all(dir);

    constexpr int kWriters = 4;
    constexpr int kPerWriter = 800;

    Options o;
    o.dir = dir;
    o.sync_writes = false;
    PlutoDB db(o);

    std::vector<std::thread> writers;
    for (int w = 0; w < kWriters; w++) {
        writers.emplace_back([&db, w] {
            for (int i = 0; i < kPerWriter; i++) {
                db.put(slot_key(w, i), "first:" + std::to_string(i));
            }
            // overwrite every tenth key, delete every fifteenth
            for (int i = 0; i < kPerWriter; i += 10) {
                db.put(slot_key(w, i), "second:" + std::to_string(i));
            }
            for (int i = 0; i < kPerWriter; i += 15) {
                db.del(slot_key(w, i));
            }
        });
    }
    for (auto& t : writers) t.join();

    assert(db.next_level() == 0);

    int missing = 0;
    for (int w = 0; w < kWriters; w++) {
        for (int i = 0; i < kPerWriter; i++) {
            auto v = db.get(slot_key(w, i));
            if (i % 15 == 0) {
                if (v.has_value()) missing++;
                continue;
            }
            const std::string want = (i % 10 == 0 ? "second:" : "first:") + std::to_string(i);
            if (!v || *v != want) missing++;
        }
    }
    assert(missing == 0);

    // the log holds exactly the acknowledged writes
    const size_t per_writer = kPerWriter + (kPerWriter + 9) / 10 + (kPerWriter + 14) / 15;
    assert(db.log_size() == kWriters * per_writer);

    db.close();
    std::filesystem::remove_all(dir);
}

// Writers race each other and a reader while small log limits force many
// inline compactions.
int main() {
    test_acknowledged_writes_visible();

    const std::string dir = "data_test_concurrency";
    std::filesystem::remove_all(dir);

    constexpr int kWriters = 4;
    constexpr int kPerWriter = 500;
    constexpr size_t kLimit = 64;

    {
        Options o;
        o.dir = dir;
        o.log_limit = kLimit;
        o.sync_writes = false;
        PlutoDB db(o);

        std::atomic<bool> done{false};
        std::atomic<int> bad_reads{0};

        // each writer owns its key space, so the last value it wrote is the
        // only one a reader may see for that key
        std::thread reader([&] {
            while (!done.load()) {
                for (int w = 0; w < kWriters; w++) {
                    auto v = db.get("w" + std::to_string(w) + "-0");
                    if (v && v->rfind("w" + std::to_string(w) + ":", 0) != 0) bad_reads++;
                }
            }
        });

        std::vector<std::thread> writers;
        for (int w = 0; w < kWriters; w++) {
            writers.emplace_back([&db, w] {
                const std::string prefix = "w" + std::to_string(w);
                for (int i = 0; i < kPerWriter; i++) {
                    db.put(prefix + "-" + std::to_string(i % 50), prefix + ":" + std::to_string(i));
                    if (i % 7 == 0) db.del(prefix + "-" + std::to_string((i + 1) % 50));
                }
            });
        }
        for (auto& t : writers) t.join();
        done.store(true);
        reader.join();

        assert(bad_reads.load() == 0);

        // appends and compactions never interleave: the log never overshoots
        // the limit by more than the one record written after a compaction
        assert(db.log_size() <= kLimit + 1);

        const int total_writes = kWriters * (kPerWriter + (kPerWriter + 6) / 7);
        assert(db.next_level() > 0);
        assert(static_cast<int>(db.next_level()) < total_writes / static_cast<int>(kLimit) + 1);

        // every generation written so far is a complete, sorted document
        for (uint64_t lvl = 0; lvl < db.next_level(); lvl++) {
            auto entries = SSTable::load(dir + "/" + SSTable::file_name(lvl));
            assert(!entries.empty());
            for (size_t i = 1; i < entries.size(); i++) assert(entries[i - 1].first < entries[i].first);
        }
    }

    // the log on disk is whole after the races
    {
        WAL wal(dir, false);
        assert(wal.size() <= kLimit + 1);
    }

    std::filesystem::remove_all(dir);
    return 0;
}
