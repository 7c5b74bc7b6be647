#include "flatpush/gvariant.hpp"

namespace flatpush::gvariant {

namespace {

size_t align_up(size_t offset, size_t alignment) {
    if (alignment <= 1) return offset;
    return (offset + alignment - 1) & ~(alignment - 1);
}

// Little-endian framing offset at byte position `pos`
size_t read_offset(View data, size_t pos, size_t width) {
    if (pos + width > data.size()) {
        throw FormatError("framing offset out of range");
    }
    uint64_t value = 0;
    for (size_t i = 0; i < width; ++i) {
        value |= static_cast<uint64_t>(data[pos + i]) << (8 * i);
    }
    return static_cast<size_t>(value);
}

}  // namespace

size_t offset_size(size_t container_size) {
    if (container_size == 0) return 0;
    if (container_size <= 0xff) return 1;
    if (container_size <= 0xffff) return 2;
    if (container_size <= 0xffffffffULL) return 4;
    return 8;
}

std::vector<View> split_tuple(View data, const std::vector<Member>& members) {
    const size_t width = offset_size(data.size());

    // Every variable member except the last one has a framing offset,
    // stored from the end of the tuple backwards.
    size_t framed = 0;
    for (size_t i = 0; i + 1 < members.size(); ++i) {
        if (members[i].fixed_size == 0) ++framed;
    }
    if (framed * width > data.size()) {
        throw FormatError("tuple too small for its framing offsets");
    }
    const size_t body_end = data.size() - framed * width;

    std::vector<View> result;
    result.reserve(members.size());

    size_t offset = 0;
    size_t frame_index = 0;
    for (size_t i = 0; i < members.size(); ++i) {
        const auto& member = members[i];
        const size_t start = align_up(offset, member.alignment);
        size_t end;
        if (member.fixed_size != 0) {
            end = start + member.fixed_size;
        } else if (i + 1 == members.size()) {
            end = body_end;
        } else {
            end = read_offset(data, data.size() - (frame_index + 1) * width, width);
            ++frame_index;
        }
        if (start > end || end > body_end) {
            throw FormatError("tuple member " + std::to_string(i) + " out of bounds");
        }
        result.push_back(data.subspan(start, end - start));
        offset = end;
    }
    return result;
}

std::vector<View> split_array(View data, size_t alignment) {
    std::vector<View> result;
    if (data.empty()) return result;

    const size_t width = offset_size(data.size());
    const size_t table_start = read_offset(data, data.size() - width, width);
    if (table_start > data.size() || (data.size() - table_start) % width != 0) {
        throw FormatError("array offset table out of bounds");
    }
    const size_t count = (data.size() - table_start) / width;
    result.reserve(count);

    size_t offset = 0;
    for (size_t i = 0; i < count; ++i) {
        const size_t start = align_up(offset, alignment);
        const size_t end = read_offset(data, table_start + i * width, width);
        if (start > end || end > table_start) {
            throw FormatError("array element " + std::to_string(i) + " out of bounds");
        }
        result.push_back(data.subspan(start, end - start));
        offset = end;
    }
    return result;
}

std::string read_string(View data) {
    if (data.empty() || data.back() != 0) {
        throw FormatError("string is not NUL terminated");
    }
    return std::string(reinterpret_cast<const char*>(data.data()), data.size() - 1);
}

uint32_t read_u32_be(View data) {
    if (data.size() != 4) throw FormatError("expected 4 byte integer");
    return (static_cast<uint32_t>(data[0]) << 24) | (static_cast<uint32_t>(data[1]) << 16) |
           (static_cast<uint32_t>(data[2]) << 8) | static_cast<uint32_t>(data[3]);
}

uint64_t read_u64_be(View data) {
    if (data.size() != 8) throw FormatError("expected 8 byte integer");
    uint64_t value = 0;
    for (uint8_t b : data) {
        value = (value << 8) | b;
    }
    return value;
}

std::string to_hex(View data) {
    static const char digits[] = "0123456789abcdef";
    std::string out;
    out.reserve(data.size() * 2);
    for (uint8_t b : data) {
        out.push_back(digits[b >> 4]);
        out.push_back(digits[b & 0x0f]);
    }
    return out;
}

}  // namespace flatpush::gvariant
