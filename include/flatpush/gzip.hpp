#pragma once

#include <cstdint>
#include <span>
#include <string_view>
#include <vector>

namespace flatpush {

// gzip-framed deflate (RFC 1952), used for compressed request bodies.
// Throws std::runtime_error on zlib failure.
std::vector<uint8_t> gzip_compress(std::span<const uint8_t> data);
std::vector<uint8_t> gzip_compress(std::string_view text);

}  // namespace flatpush
