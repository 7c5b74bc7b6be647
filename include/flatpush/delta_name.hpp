#pragma once

#include <string>
#include <string_view>

namespace flatpush {

// Static delta names are one or more hex checksums joined by '-'
// ("<to>" for a from-scratch delta, "<from>-<to>" otherwise). On disk and
// on the wire each checksum is written as unpadded base64 over the raw
// bytes, with '_' in place of '/'.
//
// All functions throw std::invalid_argument on malformed input.

std::string delta_name_part_encode(std::string_view hex_checksum);
std::string delta_name_part_decode(std::string_view encoded);

std::string delta_name_encode(std::string_view delta_name);
std::string delta_name_decode(std::string_view encoded_name);

}  // namespace flatpush
