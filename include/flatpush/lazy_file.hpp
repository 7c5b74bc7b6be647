#pragma once

#include "flatpush/constants.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <sys/types.h>

namespace flatpush {

/// Sequential reader that opens its file on the first read and closes it
/// as soon as the last block has been handed out.
///
/// Multipart uploads hold one reader per part, so a batch of thousands of
/// objects never keeps more than one descriptor open at a time, and no part
/// is ever loaded whole: each read returns at most one block.
class LazyFileReader {
public:
    /// @param expected_size  Known size of the file, 0 if unknown. When set,
    ///                       the descriptor is closed right after the block
    ///                       that reaches it, without waiting for an EOF read.
    explicit LazyFileReader(std::filesystem::path path,
                            uint64_t expected_size = 0,
                            size_t block_size = constants::UPLOAD_READ_BLOCK);
    ~LazyFileReader();

    LazyFileReader(const LazyFileReader&) = delete;
    LazyFileReader& operator=(const LazyFileReader&) = delete;

    /// Read up to min(max_bytes, block size) bytes.
    /// Returns 0 at end of file (the descriptor is closed by then),
    /// or -1 on error (see error()).
    ssize_t read(char* buffer, size_t max_bytes);

    /// Restart from the beginning; the file is reopened lazily.
    void rewind();

    void close();

    bool is_open() const { return fd_ >= 0; }
    bool finished() const { return finished_; }
    uint64_t bytes_read() const { return bytes_read_; }
    const std::filesystem::path& path() const { return path_; }
    const std::string& error() const { return error_; }

private:
    std::filesystem::path path_;
    uint64_t expected_size_;
    size_t block_size_;
    int fd_ = -1;
    bool finished_ = false;
    uint64_t bytes_read_ = 0;
    std::string error_;
};

}  // namespace flatpush
