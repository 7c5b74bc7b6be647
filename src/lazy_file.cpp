#include "flatpush/lazy_file.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <unistd.h>

namespace flatpush {

LazyFileReader::LazyFileReader(std::filesystem::path path, uint64_t expected_size,
                               size_t block_size)
    : path_(std::move(path))
    , expected_size_(expected_size)
    , block_size_(block_size == 0 ? constants::UPLOAD_READ_BLOCK : block_size) {}

LazyFileReader::~LazyFileReader() {
    close();
}

ssize_t LazyFileReader::read(char* buffer, size_t max_bytes) {
    if (finished_) return 0;

    if (fd_ < 0) {
        fd_ = ::open(path_.c_str(), O_RDONLY | O_CLOEXEC);
        if (fd_ < 0) {
            error_ = "cannot open " + path_.string() + ": " + std::strerror(errno);
            return -1;
        }
    }

    size_t want = std::min(max_bytes, block_size_);
    ssize_t n;
    do {
        n = ::read(fd_, buffer, want);
    } while (n < 0 && errno == EINTR);

    if (n < 0) {
        error_ = "read failed on " + path_.string() + ": " + std::strerror(errno);
        close();
        return -1;
    }
    if (n == 0) {
        finished_ = true;
        close();
        return 0;
    }

    bytes_read_ += static_cast<uint64_t>(n);
    if (expected_size_ > 0 && bytes_read_ >= expected_size_) {
        finished_ = true;
        close();
    }
    return n;
}

void LazyFileReader::rewind() {
    close();
    finished_ = false;
    bytes_read_ = 0;
    error_.clear();
}

void LazyFileReader::close() {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

}  // namespace flatpush
