#include "sstable.hpp"
#include "errors.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <algorithm>
#include <cctype>
#include <cerrno>

#include <fcntl.h>
#include <unistd.h>

using ordered_json = nlohmann::ordered_json;

static void fsync_path(const std::string& path, int flags) {
    int fd = ::open(path.c_str(), flags | O_CLOEXEC);
    if (fd < 0) throw io_error("open for fsync", path, errno);
    const int rc = ::fsync(fd);
    const int err = errno;
    ::close(fd);
    if (rc != 0) throw io_error("fsync", path, err);
}

// Writes body to path and fsyncs it before closing.
static void write_file_synced(const std::string& path, const std::string& body) {
    int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (fd < 0) throw io_error("open", path, errno);

    const char* p = body.data();
    size_t left = body.size();
    while (left > 0) {
        ssize_t n = ::write(fd, p, left);
        if (n < 0) {
            if (errno == EINTR) continue;
            const int err = errno;
            ::close(fd);
            throw io_error("write", path, err);
        }
        p += n;
        left -= static_cast<size_t>(n);
    }
    if (::fsync(fd) != 0) {
        const int err = errno;
        ::close(fd);
        throw io_error("fsync", path, err);
    }
    if (::close(fd) != 0) throw io_error("close", path, errno);
}

std::string SSTable::file_name(uint64_t level) {
    return std::to_string(level) + kExtension;
}

void SSTable::write_atomic(const std::string& final_path, const Entries& entries) {
    const std::string tmp = final_path + ".tmp";

    ordered_json doc = ordered_json::object();
    for (const auto& [k, v] : entries) doc[k] = v;

    // values are arbitrary bytes; invalid UTF-8 becomes U+FFFD
    const std::string body = doc.dump(-1, ' ', false, ordered_json::error_handler_t::replace);

    try {
        write_file_synced(tmp, body);

        std::error_code ec;
        std::filesystem::rename(tmp, final_path, ec);
        if (ec) throw IOError("rename " + tmp + " -> " + final_path + ": " + ec.message());
    } catch (...) {
        std::error_code ec;
        std::filesystem::remove(tmp, ec);
        throw;
    }

    const std::string parent = std::filesystem::path(final_path).parent_path().string();
    fsync_path(parent.empty() ? "." : parent, O_RDONLY | O_DIRECTORY);
}

SSTable::Entries SSTable::load(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) throw IOError("open " + path + ": cannot open for reading");
    std::stringstream ss;
    ss << in.rdbuf();

    ordered_json doc;
    try {
        doc = ordered_json::parse(ss.str());
    } catch (const ordered_json::parse_error& e) {
        throw DecodeError(DecodeFault::BadDocument, e.byte, path + ": " + e.what());
    }
    if (!doc.is_object()) {
        throw DecodeError(DecodeFault::BadDocument, 0, path + ": top level is not an object");
    }

    Entries entries;
    entries.reserve(doc.size());
    for (const auto& item : doc.items()) {
        if (!item.value().is_string()) {
            throw DecodeError(DecodeFault::BadDocument, 0,
                              path + ": value of '" + item.key() + "' is not a string");
        }
        entries.emplace_back(item.key(), item.value().get<std::string>());
    }
    return entries;
}

uint64_t SSTable::discover_next_level(const std::string& dir) {
    uint64_t next = 0;
    std::error_code ec;
    std::filesystem::directory_iterator it(dir, ec);
    if (ec) throw IOError("list " + dir + ": " + ec.message());

    for (const auto& entry : it) {
        const auto& p = entry.path();
        if (p.extension() != kExtension) continue;
        const std::string stem = p.stem().string();
        if (stem.empty() || !std::all_of(stem.begin(), stem.end(),
                                            [](unsigned char c) { return std::isdigit(c) != 0; })) continue;
        try {
            next = std::max<uint64_t>(next, std::stoull(stem) + 1);
        } catch (const std::out_of_range&) {
            // not a generation we could have written
        }
    }
    return next;
}
