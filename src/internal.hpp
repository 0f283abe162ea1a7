#pragma once

// Helpers shared by the writer and the view layer. Not installed.

#include <cstddef>
#include <cstdint>
#include <limits>
#include <vector>

namespace blobfig::internal {

// ------------------------------
// Checked arithmetic
// ------------------------------

inline bool checked_mul_u64(std::uint64_t a, std::uint64_t b, std::uint64_t& out) {
    if (a == 0 || b == 0) { out = 0; return true; }
    if (a > (std::numeric_limits<std::uint64_t>::max)() / b) return false;
    out = a * b;
    return true;
}

inline bool checked_add_size(std::size_t a, std::size_t b, std::size_t& out) {
    if (a > (std::numeric_limits<std::size_t>::max)() - b) return false;
    out = a + b;
    return true;
}

// Round `pos` up to a multiple of `align` (a power of two).
inline bool checked_align_up(std::size_t pos, std::size_t align, std::size_t& out) {
    std::size_t bumped = 0;
    if (!checked_add_size(pos, align - 1, bumped)) return false;
    out = bumped & ~(align - 1);
    return true;
}

// ------------------------------
// Little-endian encoding
// ------------------------------

inline void append_u16_le(std::vector<std::uint8_t>& out, std::uint16_t v) {
    out.push_back(static_cast<std::uint8_t>(v & 0xFFu));
    out.push_back(static_cast<std::uint8_t>((v >> 8) & 0xFFu));
}

inline void store_u32_le(std::uint8_t* p, std::uint32_t v) {
    p[0] = static_cast<std::uint8_t>(v & 0xFFu);
    p[1] = static_cast<std::uint8_t>((v >> 8) & 0xFFu);
    p[2] = static_cast<std::uint8_t>((v >> 16) & 0xFFu);
    p[3] = static_cast<std::uint8_t>((v >> 24) & 0xFFu);
}

inline void append_u32_le(std::vector<std::uint8_t>& out, std::uint32_t v) {
    std::uint8_t b[4];
    store_u32_le(b, v);
    out.insert(out.end(), b, b + 4);
}

inline void append_u64_le(std::vector<std::uint8_t>& out, std::uint64_t v) {
    for (int i = 0; i < 8; ++i) out.push_back(static_cast<std::uint8_t>((v >> (8*i)) & 0xFFu));
}

inline std::uint16_t read_u16_le_from(const std::uint8_t* p) {
    return static_cast<std::uint16_t>(p[0] | (static_cast<std::uint16_t>(p[1]) << 8));
}

inline std::uint32_t read_u32_le_from(const std::uint8_t* p) {
    return (static_cast<std::uint32_t>(p[0])      ) |
           (static_cast<std::uint32_t>(p[1]) <<  8) |
           (static_cast<std::uint32_t>(p[2]) << 16) |
           (static_cast<std::uint32_t>(p[3]) << 24);
}

inline std::uint64_t read_u64_le_from(const std::uint8_t* p) {
    std::uint64_t u = 0;
    for (int i = 0; i < 8; ++i) u |= (static_cast<std::uint64_t>(p[i]) << (8*i));
    return u;
}

// ------------------------------
// UTF-8
// ------------------------------

// Strict check: rejects overlong forms, surrogates and code points > U+10FFFF.
inline bool is_valid_utf8(const std::uint8_t* p, std::size_t n) {
    std::size_t i = 0;
    while (i < n) {
        std::uint8_t c = p[i];
        if (c < 0x80) { ++i; continue; }

        std::size_t len = 0;
        std::uint32_t cp = 0;
        if ((c & 0xE0) == 0xC0) { len = 2; cp = c & 0x1Fu; }
        else if ((c & 0xF0) == 0xE0) { len = 3; cp = c & 0x0Fu; }
        else if ((c & 0xF8) == 0xF0) { len = 4; cp = c & 0x07u; }
        else return false;

        if (n - i < len) return false;
        for (std::size_t k = 1; k < len; ++k) {
            std::uint8_t cc = p[i + k];
            if ((cc & 0xC0) != 0x80) return false;
            cp = (cp << 6) | (cc & 0x3Fu);
        }
        if ((len == 2 && cp < 0x80) || (len == 3 && cp < 0x800) || (len == 4 && cp < 0x10000)) return false;
        if (cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) return false;
        i += len;
    }
    return true;
}

inline bool is_valid_utf8(const char* p, std::size_t n) {
    return is_valid_utf8(reinterpret_cast<const std::uint8_t*>(p), n);
}

} // namespace blobfig::internal
