#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace blobfig {

// Element type of an Array. Values are the on-disk dtype tags.
enum class DType : std::uint8_t {
    U8 = 0x01,
    I8 = 0x02,
    U16 = 0x03,
    I16 = 0x04,
    U32 = 0x05,
    I32 = 0x06,
    U64 = 0x07,
    I64 = 0x08,
    F32 = 0x09,
    F64 = 0x0A,
};

std::string to_string(DType d);
std::optional<DType> dtype_from_u8(std::uint8_t tag) noexcept;

/// Size in bytes of one element (1, 2, 4 or 8). Also the payload alignment.
std::size_t element_size(DType d) noexcept;

} // namespace blobfig
