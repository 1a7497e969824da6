#pragma once

#include "common/types.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <ctime>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace canonical {

using Timestamp = uint64_t;     // Nanoseconds, monotonic

inline Timestamp now_ns() noexcept {
    struct timespec ts;
    clock_gettime(CLOCK_MONOTONIC, &ts);
    return static_cast<Timestamp>(ts.tv_sec) * 1'000'000'000ULL + static_cast<Timestamp>(ts.tv_nsec);
}

constexpr bool is_power_of_two(size_t n) noexcept {
    return n > 0 && (n & (n - 1)) == 0;
}

/// Big-endian 32-byte word <-> Uint256.
inline Uint256 load_word(const uint8_t* in) {
    Uint256 value = 0;
    for (size_t i = 0; i < WORD_BYTES; ++i) {
        value <<= 8;
        value |= in[i];
    }
    return value;
}

inline void store_word(const Uint256& value, uint8_t* out) {
    Uint256 v = value;
    for (size_t i = WORD_BYTES; i-- > 0;) {
        out[i] = static_cast<uint8_t>(v & 0xff);
        v >>= 8;
    }
}

inline Bytes32 to_bytes32(const Uint256& value) {
    Bytes32 out{};
    store_word(value, out.data());
    return out;
}

inline std::string to_hex(std::span<const uint8_t> bytes) {
    static constexpr char DIGITS[] = "0123456789abcdef";
    std::string out;
    out.reserve(2 + bytes.size() * 2);
    out += "0x";
    for (uint8_t b : bytes) {
        out += DIGITS[b >> 4];
        out += DIGITS[b & 0x0f];
    }
    return out;
}

inline int hex_nibble(char c) noexcept {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

/// Parse hex with optional 0x prefix. Returns false on odd length or bad digit.
inline bool from_hex(std::string_view text, std::vector<uint8_t>& out) {
    if (text.size() >= 2 && text[0] == '0' && (text[1] == 'x' || text[1] == 'X')) {
        text.remove_prefix(2);
    }
    if (text.size() % 2 != 0) return false;

    out.clear();
    out.reserve(text.size() / 2);
    for (size_t i = 0; i < text.size(); i += 2) {
        int hi = hex_nibble(text[i]);
        int lo = hex_nibble(text[i + 1]);
        if (hi < 0 || lo < 0) return false;
        out.push_back(static_cast<uint8_t>((hi << 4) | lo));
    }
    return true;
}

inline bool parse_address(std::string_view text, Address& out) {
    std::vector<uint8_t> bytes;
    if (!from_hex(text, bytes) || bytes.size() != out.size()) return false;
    std::copy(bytes.begin(), bytes.end(), out.begin());
    return true;
}

inline bool parse_bytes32(std::string_view text, Bytes32& out) {
    std::vector<uint8_t> bytes;
    if (!from_hex(text, bytes) || bytes.size() != out.size()) return false;
    std::copy(bytes.begin(), bytes.end(), out.begin());
    return true;
}

} // namespace canonical
