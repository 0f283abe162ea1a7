#include "blobfig/dtype.hpp"

namespace blobfig {

std::string to_string(DType d) {
    switch (d) {
        case DType::U8: return "u8";
        case DType::I8: return "i8";
        case DType::U16: return "u16";
        case DType::I16: return "i16";
        case DType::U32: return "u32";
        case DType::I32: return "i32";
        case DType::U64: return "u64";
        case DType::I64: return "i64";
        case DType::F32: return "f32";
        case DType::F64: return "f64";
    }
    return "unknown";
}

std::optional<DType> dtype_from_u8(std::uint8_t tag) noexcept {
    if (tag >= 0x01 && tag <= 0x0A) return static_cast<DType>(tag);
    return std::nullopt;
}

std::size_t element_size(DType d) noexcept {
    switch (d) {
        case DType::U8: return 1;
        case DType::I8: return 1;
        case DType::U16: return 2;
        case DType::I16: return 2;
        case DType::U32: return 4;
        case DType::I32: return 4;
        case DType::F32: return 4;
        case DType::U64: return 8;
        case DType::I64: return 8;
        case DType::F64: return 8;
    }
    return 1;
}

} // namespace blobfig
