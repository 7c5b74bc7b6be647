#include "flatpush/delta_name.hpp"

#include <array>
#include <cstdint>
#include <stdexcept>
#include <vector>

namespace flatpush {

namespace {

constexpr char B64_TABLE[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+_";
constexpr char HEX_DIGITS[] = "0123456789abcdef";

constexpr std::array<int8_t, 256> make_b64_lookup() {
    std::array<int8_t, 256> lookup{};
    for (auto& v : lookup) v = -1;
    for (int i = 0; i < 64; ++i) {
        lookup[static_cast<uint8_t>(B64_TABLE[i])] = static_cast<int8_t>(i);
    }
    return lookup;
}

constexpr auto B64_LOOKUP = make_b64_lookup();

int hex_nibble(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    return -1;
}

std::vector<uint8_t> hex_to_bytes(std::string_view hex) {
    if (hex.empty() || hex.size() % 2 != 0) {
        throw std::invalid_argument("Invalid checksum '" + std::string(hex) + "' in delta name");
    }
    std::vector<uint8_t> bytes;
    bytes.reserve(hex.size() / 2);
    for (size_t i = 0; i < hex.size(); i += 2) {
        const int hi = hex_nibble(hex[i]);
        const int lo = hex_nibble(hex[i + 1]);
        if (hi < 0 || lo < 0) {
            throw std::invalid_argument("Invalid checksum '" + std::string(hex) + "' in delta name");
        }
        bytes.push_back(static_cast<uint8_t>((hi << 4) | lo));
    }
    return bytes;
}

template <typename Fn>
std::string map_parts(std::string_view name, Fn&& fn) {
    std::string result;
    size_t start = 0;
    while (true) {
        const size_t dash = name.find('-', start);
        const auto part = name.substr(start, dash == std::string_view::npos ? dash : dash - start);
        if (start != 0) result += '-';
        result += fn(part);
        if (dash == std::string_view::npos) break;
        start = dash + 1;
    }
    return result;
}

}  // namespace

std::string delta_name_part_encode(std::string_view hex_checksum) {
    const auto bytes = hex_to_bytes(hex_checksum);

    std::string out;
    out.reserve((bytes.size() + 2) / 3 * 4);
    size_t i = 0;
    for (; i + 3 <= bytes.size(); i += 3) {
        const uint32_t triple = (bytes[i] << 16) | (bytes[i + 1] << 8) | bytes[i + 2];
        out += B64_TABLE[(triple >> 18) & 0x3F];
        out += B64_TABLE[(triple >> 12) & 0x3F];
        out += B64_TABLE[(triple >> 6) & 0x3F];
        out += B64_TABLE[triple & 0x3F];
    }
    // Tail without '=' padding
    const size_t rest = bytes.size() - i;
    if (rest == 1) {
        const uint32_t triple = bytes[i] << 16;
        out += B64_TABLE[(triple >> 18) & 0x3F];
        out += B64_TABLE[(triple >> 12) & 0x3F];
    } else if (rest == 2) {
        const uint32_t triple = (bytes[i] << 16) | (bytes[i + 1] << 8);
        out += B64_TABLE[(triple >> 18) & 0x3F];
        out += B64_TABLE[(triple >> 12) & 0x3F];
        out += B64_TABLE[(triple >> 6) & 0x3F];
    }
    return out;
}

std::string delta_name_part_decode(std::string_view encoded) {
    if (encoded.empty() || encoded.size() % 4 == 1) {
        throw std::invalid_argument("Invalid encoded delta name part '" + std::string(encoded) + "'");
    }

    std::vector<uint8_t> bytes;
    bytes.reserve(encoded.size() * 3 / 4);
    uint32_t acc = 0;
    int bits = 0;
    for (char c : encoded) {
        const int v = B64_LOOKUP[static_cast<uint8_t>(c)];
        if (v < 0) {
            throw std::invalid_argument("Invalid character in delta name part '" + std::string(encoded) + "'");
        }
        acc = (acc << 6) | static_cast<uint32_t>(v);
        bits += 6;
        if (bits >= 8) {
            bits -= 8;
            bytes.push_back(static_cast<uint8_t>((acc >> bits) & 0xFF));
        }
    }
    // Leftover bits of the last symbol must be zero for a canonical encoding
    if ((acc & ((1u << bits) - 1)) != 0) {
        throw std::invalid_argument("Non-canonical delta name part '" + std::string(encoded) + "'");
    }

    std::string hex;
    hex.reserve(bytes.size() * 2);
    for (uint8_t b : bytes) {
        hex += HEX_DIGITS[b >> 4];
        hex += HEX_DIGITS[b & 0x0F];
    }
    return hex;
}

std::string delta_name_encode(std::string_view delta_name) {
    return map_parts(delta_name, [](std::string_view part) { return delta_name_part_encode(part); });
}

std::string delta_name_decode(std::string_view encoded_name) {
    return map_parts(encoded_name, [](std::string_view part) { return delta_name_part_decode(part); });
}

}  // namespace flatpush
