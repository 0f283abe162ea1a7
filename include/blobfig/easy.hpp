#pragma once

#include "blobfig/error.hpp"
#include "blobfig/value.hpp"
#include "blobfig/view.hpp"

#include <cstdint>
#include <cstring>
#include <span>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace blobfig::easy {

// Typed adapters between native element vectors and the (dtype, shape,
// bytes) triple. The on-disk representation is always little-endian.
namespace detail {
inline bool is_little_endian() {
    const std::uint16_t x = 1;
    return *reinterpret_cast<const std::uint8_t*>(&x) == 1;
}

inline void bswap_inplace(std::uint8_t* buf, std::size_t elem_size, std::size_t n_elems) {
    if (!buf || elem_size <= 1 || n_elems == 0) return;
    for (std::size_t i = 0; i < n_elems; ++i) {
        std::uint8_t* p = buf + i * elem_size;
        for (std::size_t a = 0, b = elem_size - 1; a < b; ++a, --b) {
            std::uint8_t t = p[a];
            p[a] = p[b];
            p[b] = t;
        }
    }
}
} // namespace detail

template <typename T> struct dtype_of;
template <> struct dtype_of<std::uint8_t>  { static constexpr DType value = DType::U8; };
template <> struct dtype_of<std::int8_t>   { static constexpr DType value = DType::I8; };
template <> struct dtype_of<std::uint16_t> { static constexpr DType value = DType::U16; };
template <> struct dtype_of<std::int16_t>  { static constexpr DType value = DType::I16; };
template <> struct dtype_of<std::uint32_t> { static constexpr DType value = DType::U32; };
template <> struct dtype_of<std::int32_t>  { static constexpr DType value = DType::I32; };
template <> struct dtype_of<std::uint64_t> { static constexpr DType value = DType::U64; };
template <> struct dtype_of<std::int64_t>  { static constexpr DType value = DType::I64; };
template <> struct dtype_of<float>         { static constexpr DType value = DType::F32; };
template <> struct dtype_of<double>        { static constexpr DType value = DType::F64; };

template <typename T>
inline constexpr DType dtype_of_v = dtype_of<T>::value;

template <typename T>
inline std::vector<std::uint8_t> pack_le(const std::vector<T>& v) {
    static_assert(std::is_trivially_copyable_v<T>, "pack_le requires trivially copyable types");
    std::vector<std::uint8_t> out(sizeof(T) * v.size());
    if (!out.empty()) {
        std::memcpy(out.data(), v.data(), out.size());
        if (!detail::is_little_endian()) {
            detail::bswap_inplace(out.data(), sizeof(T), v.size());
        }
    }
    return out;
}

/// Build an Array from row-major elements. Throws EncodeError when the
/// element count does not match the shape.
template <typename T>
inline Array make_array(std::vector<std::uint64_t> shape, const std::vector<T>& data_rowmajor) {
    auto n = checked_numel(shape);
    if (!n) {
        throw EncodeError(EncodeErrorKind::SizeOverflow, "array shape product overflows");
    }
    if (*n != static_cast<std::uint64_t>(data_rowmajor.size())) {
        throw EncodeError(EncodeErrorKind::ArrayLengthMismatch,
                          "element count " + std::to_string(data_rowmajor.size()) +
                          " does not match shape product " + std::to_string(*n));
    }
    return Array(dtype_of_v<T>, std::move(shape), pack_le(data_rowmajor));
}

template <typename T>
inline Value make_value(std::vector<std::uint64_t> shape, const std::vector<T>& data_rowmajor) {
    return Value::make_array(make_array(std::move(shape), data_rowmajor));
}

/// Copy the elements of a parsed array out as native values.
template <typename T>
inline std::vector<T> to_vector(const ArrayView& a) {
    if (a.dtype() != dtype_of_v<T>) {
        throw DecodeError(DecodeErrorKind::TagMismatch, a.offset(),
                          "dtype mismatch: array holds " + to_string(a.dtype()) +
                          ", requested " + to_string(dtype_of_v<T>));
    }
    std::vector<T> out(static_cast<std::size_t>(a.num_elements()));
    if (!out.empty()) {
        std::memcpy(out.data(), a.data().data(), a.data().size());
        if (!detail::is_little_endian()) {
            detail::bswap_inplace(reinterpret_cast<std::uint8_t*>(out.data()), sizeof(T), out.size());
        }
    }
    return out;
}

/// Zero-copy typed span over a parsed array. Requires a little-endian host
/// and a payload whose address is aligned for T (the writer aligns offsets;
/// the caller's buffer base must be aligned too).
template <typename T>
inline std::span<const T> elements(const ArrayView& a) {
    if (a.dtype() != dtype_of_v<T>) {
        throw DecodeError(DecodeErrorKind::TagMismatch, a.offset(),
                          "dtype mismatch: array holds " + to_string(a.dtype()) +
                          ", requested " + to_string(dtype_of_v<T>));
    }
    if (!detail::is_little_endian()) {
        throw DecodeError(DecodeErrorKind::Misaligned, a.offset(),
                          "zero-copy element access requires a little-endian host");
    }
    const std::uint8_t* p = a.data().data();
    if (a.num_elements() == 0) return {};
    if (reinterpret_cast<std::uintptr_t>(p) % alignof(T) != 0) {
        throw DecodeError(DecodeErrorKind::Misaligned, a.offset(),
                          "array payload is not aligned for " + to_string(a.dtype()));
    }
    return {reinterpret_cast<const T*>(p), static_cast<std::size_t>(a.num_elements())};
}

inline void set(Value::Object& obj, std::string key, Value v) {
    obj.emplace_back(std::move(key), std::move(v));
}

} // namespace blobfig::easy
