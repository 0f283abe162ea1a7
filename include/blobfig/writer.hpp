#pragma once

#include "blobfig/value.hpp"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace blobfig {

enum class DuplicateKeys {
    Reject,   // EncodeError(DuplicateKey)
    KeepLast, // earlier entries with the same key are dropped
};

struct WriteOptions {
    DuplicateKeys duplicate_keys{DuplicateKeys::Reject};
    bool validate_utf8{true}; // strings, keys and mime types
};

/// Encode a complete value tree into one buffer. Throws EncodeError; nothing
/// is returned on failure.
std::vector<std::uint8_t> to_bytes(const Value& root, const WriteOptions& opts = WriteOptions{});

/// Exact size to_bytes() would produce, alignment padding included.
std::size_t encoded_size(const Value& root, const WriteOptions& opts = WriteOptions{});

} // namespace blobfig
