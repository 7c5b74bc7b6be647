#include "flatpush/gzip.hpp"

#include <zlib.h>

#include <stdexcept>
#include <string>

namespace flatpush {

namespace {

// windowBits 15 + 16 selects the gzip wrapper instead of raw zlib
constexpr int GZIP_WINDOW_BITS = 15 + 16;

}  // namespace

std::vector<uint8_t> gzip_compress(std::span<const uint8_t> data) {
    z_stream zs{};
    if (deflateInit2(&zs, Z_DEFAULT_COMPRESSION, Z_DEFLATED, GZIP_WINDOW_BITS, 8,
                     Z_DEFAULT_STRATEGY) != Z_OK) {
        throw std::runtime_error("zlib deflateInit2 failed");
    }

    std::vector<uint8_t> out(deflateBound(&zs, static_cast<uLong>(data.size())));
    zs.next_in = const_cast<Bytef*>(reinterpret_cast<const Bytef*>(data.data()));
    zs.avail_in = static_cast<uInt>(data.size());
    zs.next_out = reinterpret_cast<Bytef*>(out.data());
    zs.avail_out = static_cast<uInt>(out.size());

    const int rc = deflate(&zs, Z_FINISH);
    const size_t produced = zs.total_out;
    deflateEnd(&zs);
    if (rc != Z_STREAM_END) {
        throw std::runtime_error("zlib deflate failed: " + std::to_string(rc));
    }
    out.resize(produced);
    return out;
}

std::vector<uint8_t> gzip_compress(std::string_view text) {
    return gzip_compress(std::span<const uint8_t>(
        reinterpret_cast<const uint8_t*>(text.data()), text.size()));
}

}  // namespace flatpush
