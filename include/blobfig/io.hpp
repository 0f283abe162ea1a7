#pragma once

#include "blobfig/value.hpp"
#include "blobfig/writer.hpp"

#include <cstdint>
#include <filesystem>
#include <span>
#include <vector>

namespace blobfig {

/// Read a whole file into memory. Throws IoError.
std::vector<std::uint8_t> load_bytes(const std::filesystem::path& file);

/// Replace `file` with `bytes`. Throws IoError.
void save_bytes(const std::filesystem::path& file, std::span<const std::uint8_t> bytes);

/// Encode `root` and write it to `file`. The file is left untouched when
/// encoding fails.
void write_file(
    const std::filesystem::path& file,
    const Value& root,
    const WriteOptions& opts = WriteOptions{}
);

} // namespace blobfig
