#include "wal.hpp"
#include "errors.hpp"

#include <filesystem>
#include <stdexcept>
#include <cerrno>

#include <fcntl.h>
#include <unistd.h>

WAL::WAL(const std::string& dir, bool sync)
    : path_(dir + "/" + kFileName),
      sync_(sync)
{
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec) throw IOError("create directory " + dir + ": " + ec.message());

    fd_ = ::open(path_.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
    if (fd_ < 0) throw io_error("open", path_, errno);

    try {
        records_ = decode(read_all_());
        // append from here on
        if (::lseek(fd_, 0, SEEK_END) < 0) throw io_error("seek", path_, errno);
    } catch (...) {
        ::close(fd_);
        fd_ = -1;
        throw;
    }
}

WAL::~WAL() {
    close();
}

std::string WAL::read_all_() {
    std::string data;
    char buf[64 * 1024];
    while (true) {
        ssize_t n = ::read(fd_, buf, sizeof(buf));
        if (n < 0) {
            if (errno == EINTR) continue;
            throw io_error("read", path_, errno);
        }
        if (n == 0) break;
        data.append(buf, static_cast<size_t>(n));
    }
    return data;
}

void WAL::write_all_(const std::string& bytes) {
    const char* p = bytes.data();
    size_t left = bytes.size();
    while (left > 0) {
        ssize_t n = ::write(fd_, p, left);
        if (n < 0) {
            if (errno == EINTR) continue;
            throw io_error("write", path_, errno);
        }
        p += n;
        left -= static_cast<size_t>(n);
    }
    if (sync_ && ::fdatasync(fd_) != 0) throw io_error("fdatasync", path_, errno);
}

void WAL::ensure_open_() const {
    if (fd_ < 0) throw IOError("write-ahead log is closed: " + path_);
}

void WAL::append(const Record& record) {
    std::lock_guard<std::mutex> lk(mutex_);
    ensure_open_();
    const std::string bytes = encode(record);
    records_.push_back(record);
    write_all_(bytes);
}

size_t WAL::size() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return records_.size();
}

Record WAL::last() const {
    std::lock_guard<std::mutex> lk(mutex_);
    if (records_.empty()) throw std::logic_error("last() on empty write-ahead log");
    return records_.back();
}

std::vector<Record> WAL::records() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return records_;
}

void WAL::compact() {
    std::lock_guard<std::mutex> lk(mutex_);
    ensure_open_();
    if (::ftruncate(fd_, 0) != 0) throw io_error("truncate", path_, errno);
    // the file is empty from here on, so the list must be too
    records_.clear();
    if (::lseek(fd_, 0, SEEK_SET) < 0) throw io_error("seek", path_, errno);
    if (sync_ && ::fdatasync(fd_) != 0) throw io_error("fdatasync", path_, errno);
}

void WAL::close() {
    std::lock_guard<std::mutex> lk(mutex_);
    if (fd_ < 0) return;
    ::close(fd_);
    fd_ = -1;
}

bool WAL::is_open() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return fd_ >= 0;
}
