#pragma once

#include "blobfig/dtype.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace blobfig {

// ------------------------------
// Owned data model (writer side)
// ------------------------------

// On-disk value tags. The order matches the alternatives of Value::v.
enum class ValueTag : std::uint8_t {
    Null = 0,
    Bool = 1,
    Int = 2,
    Float = 3,
    String = 4,
    Array = 5,
    File = 6,
    Object = 7,
};

std::string to_string(ValueTag t);
std::optional<ValueTag> value_tag_from_u8(std::uint8_t tag) noexcept;

struct Array {
    DType dtype{DType::U8};
    // Dimension sizes, outermost first. Empty means a 0-d (single element) array.
    std::vector<std::uint64_t> shape{};
    // Little-endian element bytes in row-major order.
    std::vector<std::uint8_t> data{};

    Array() = default;
    Array(DType d, std::vector<std::uint64_t> s, std::vector<std::uint8_t> bytes);

    // nullopt when the product overflows.
    std::optional<std::uint64_t> num_elements() const noexcept;
    std::optional<std::uint64_t> expected_size() const noexcept;
};

struct File {
    std::string mime{};
    std::vector<std::uint8_t> data{};

    File() = default;
    File(std::string m, std::vector<std::uint8_t> bytes);
};

struct Value {
    using Object = std::vector<std::pair<std::string, Value>>;

    std::variant<
        std::monostate,
        bool,
        std::int64_t,
        double,
        std::string,
        Array,
        File,
        Object
    > v;

    // Convenience constructors
    static Value make_null();
    static Value make_bool(bool b);
    static Value make_int(std::int64_t i);
    static Value make_float(double f);
    static Value make_string(std::string s);
    static Value make_array(Array a);
    static Value make_file(File f);
    static Value make_object();
    static Value make_object(Object entries);

    ValueTag tag() const noexcept;

    bool is_null() const noexcept;
    bool is_object() const noexcept;

    // Typed accessors; throw AccessError(TypeMismatch) on a tag mismatch.
    bool as_bool() const;
    std::int64_t as_int() const;
    double as_float() const;
    const std::string& as_string() const;
    const Array& as_array() const;
    const File& as_file() const;
    const Object& as_object() const;
    Object& as_object();

    /// First entry named `key` when this is an Object, otherwise nullptr.
    /// Matches ObjectView::get on a buffer holding the same entries. An
    /// object with repeated keys encoded under DuplicateKeys::KeepLast keeps
    /// only the last one, so there the two lookups can differ; use
    /// easy::set to build objects without repeats.
    const Value* find(std::string_view key) const;

    /// Resolve a '/'-separated path through nested objects (same rules as
    /// the view-side resolver). nullptr when not found or malformed.
    const Value* get(std::string_view path) const;
};

bool operator==(const Array& a, const Array& b);
bool operator==(const File& a, const File& b);
bool operator==(const Value& a, const Value& b);

// ------------------------------
// Utilities
// ------------------------------

/// Product of dims, nullopt on overflow. An empty shape yields 1.
std::optional<std::uint64_t> checked_numel(const std::vector<std::uint64_t>& shape) noexcept;

} // namespace blobfig
