#pragma once

#include "blobfig/blobfig.hpp"

#include <cstdint>
#include <cstring>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#define CHECK(cond) do { \
    if (!(cond)) { \
        std::ostringstream _oss; \
        _oss << "CHECK failed: " #cond " at " << __FILE__ << ":" << __LINE__; \
        throw std::runtime_error(_oss.str()); \
    } \
} while (0)

// True when f() throws E with the given kind.
template <typename E, typename K, typename F>
static bool throws_kind(F&& f, K kind) {
    try {
        f();
    } catch (const E& e) {
        return e.kind() == kind;
    }
    return false;
}

template <typename T>
static std::vector<std::uint8_t> le_bytes(const std::vector<T>& v) {
    std::vector<std::uint8_t> out(v.size() * sizeof(T));
    if (!out.empty()) std::memcpy(out.data(), v.data(), out.size());
    return out;
}

// Builds raw buffers by hand for malformed-input tests.
struct ByteWriter {
    std::vector<std::uint8_t> b;

    ByteWriter& u8(std::uint8_t v) { b.push_back(v); return *this; }
    ByteWriter& u16(std::uint16_t v) {
        for (int i = 0; i < 2; ++i) b.push_back(static_cast<std::uint8_t>(v >> (8 * i)));
        return *this;
    }
    ByteWriter& u32(std::uint32_t v) {
        for (int i = 0; i < 4; ++i) b.push_back(static_cast<std::uint8_t>(v >> (8 * i)));
        return *this;
    }
    ByteWriter& u64(std::uint64_t v) {
        for (int i = 0; i < 8; ++i) b.push_back(static_cast<std::uint8_t>(v >> (8 * i)));
        return *this;
    }
    ByteWriter& raw(const std::string& s) {
        b.insert(b.end(), s.begin(), s.end());
        return *this;
    }
    ByteWriter& header(std::uint16_t version = blobfig::VERSION, std::uint32_t root = 10) {
        raw("BLBF");
        u16(version);
        u32(root);
        return *this;
    }
    // Key length, key and child length of one object entry.
    ByteWriter& entry(const std::string& key, std::uint32_t child_len) {
        u32(static_cast<std::uint32_t>(key.size()));
        raw(key);
        u32(child_len);
        return *this;
    }
};
