#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

// Minimal reader for the GVariant serialization format, enough to decode
// the commit, dirtree and dirmeta objects of an OSTree repository.
namespace flatpush::gvariant {

class FormatError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

using View = std::span<const uint8_t>;

// Layout of one tuple member
struct Member {
    size_t alignment = 1;
    size_t fixed_size = 0;  // 0 = variable sized
};

/// Size in bytes of each framing offset inside a container of `container_size`.
size_t offset_size(size_t container_size);

/// Split a tuple into its members.
std::vector<View> split_tuple(View data, const std::vector<Member>& members);

/// Split an array of variable sized elements (with the given alignment).
std::vector<View> split_array(View data, size_t alignment = 1);

/// Decode a NUL terminated string member.
std::string read_string(View data);

uint32_t read_u32_be(View data);
uint64_t read_u64_be(View data);

std::string to_hex(View data);

}  // namespace flatpush::gvariant
