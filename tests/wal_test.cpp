#include "wal.hpp"
#include "errors.hpp"
#include <cassert>
#include <csignal>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>

#include <sys/resource.h>

// Caps the size of files this process may write at `bytes` so the next write
// past it fails with EFBIG instead of raising SIGXFSZ. Restores both on exit.
struct FileSizeCap {
    explicit FileSizeCap(rlim_t bytes) {
        old_handler = std::signal(SIGXFSZ, SIG_IGN);
        getrlimit(RLIMIT_FSIZE, &old_limit);
        rlimit capped = old_limit;
        capped.rlim_cur = bytes;
        const int rc = setrlimit(RLIMIT_FSIZE, &capped);
        assert(rc == 0);
    }
    ~FileSizeCap() {
        setrlimit(RLIMIT_FSIZE, &old_limit);
        std::signal(SIGXFSZ, old_handler);
    }

    rlimit old_limit{};
    void (*old_handler)(int){nullptr};
};

static std::string read_file(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

int main() {
    const std::string dir = "data_test_wal";
    const std::string path = dir + "/" + WAL::kFileName;

    std::filesystem::remove_all(dir);

    Record r1 = Record::make(Action::Put, "hello", "world");
    Record r2 = Record::make(Action::Delete, "hello");

    // fresh log, append, file mirrors the list
    {
        WAL wal(dir, true);
        assert(std::filesystem::exists(path));
        assert(wal.size() == 0);

        wal.append(r1);
        wal.append(r2);
        assert(wal.size() == 2);
        assert(wal.last() == r2);
        assert(read_file(path) == "12phello|world7dhello|");
    }

    // reopen decodes the file and keeps appending at the end
    {
        WAL wal(dir, false);
        auto recs = wal.records();
        assert(recs.size() == 2);
        assert(recs[0] == r1);
        assert(recs[1] == r2);

        Record r3 = Record::make(Action::Put, "k", "v|v");
        wal.append(r3);
        assert(read_file(path) == "12phello|world7dhello|6pk|v|v");

        wal.compact();
        assert(wal.size() == 0);
        assert(std::filesystem::file_size(path) == 0);

        // writes after truncation start at offset zero
        wal.append(r1);
        assert(read_file(path) == "12phello|world");
        assert(wal.size() == 1);
    }

    // close is final
    {
        WAL wal(dir, false);
        assert(wal.size() == 1);
        wal.close();
        wal.close();
        assert(!wal.is_open());
        bool threw = false;
        try {
            wal.append(r2);
        } catch (const IOError&) {
            threw = true;
        }
        assert(threw);
        assert(wal.size() == 1);
    }

    // a failed write keeps the record in the list; the file is untouched
    {
        WAL wal(dir, false);
        assert(wal.size() == 1);
        const auto on_disk = std::filesystem::file_size(path);

        bool threw = false;
        {
            FileSizeCap cap(static_cast<rlim_t>(on_disk));
            try {
                wal.append(r2);
            } catch (const IOError&) {
                threw = true;
            }
        }
        assert(threw);
        assert(wal.size() == 2);
        assert(wal.last() == r2);
        assert(std::filesystem::file_size(path) == on_disk);
        assert(read_file(path) == "12phello|world");
    }

    // invalid key never reaches the list or the file
    {
        WAL wal(dir, false);
        bool threw = false;
        try {
            wal.append(Record::make(Action::Put, "a|b", "v"));
        } catch (const std::invalid_argument&) {
            threw = true;
        }
        assert(threw);
        assert(wal.size() == 1);
        assert(read_file(path) == "12phello|world");
    }

    // last() on an empty log is a logic error
    {
        std::filesystem::remove_all(dir);
        WAL wal(dir, false);
        bool threw = false;
        try {
            wal.last();
        } catch (const std::logic_error&) {
            threw = true;
        }
        assert(threw);
    }

    // a log cut mid-record refuses to open
    {
        std::filesystem::remove_all(dir);
        std::filesystem::create_directories(dir);
        {
            std::ofstream out(path, std::ios::binary);
            out << "12phello|world" << "12phello|wo";
        }
        bool threw = false;
        try {
            WAL wal(dir, false);
        } catch (const DecodeError& e) {
            threw = true;
            assert(e.kind() == DecodeFault::Truncated);
            assert(e.offset() == 14);
        }
        assert(threw);
    }

    std::filesystem::remove_all(dir);
    return 0;
}
