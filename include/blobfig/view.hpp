#pragma once

#include "blobfig/dtype.hpp"
#include "blobfig/value.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <iterator>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace blobfig {

// ------------------------------
// Format constants
// ------------------------------

inline constexpr std::array<char, 4> MAGIC{'B', 'L', 'B', 'F'};
inline constexpr std::uint16_t VERSION = 1;
// magic(4) + version(2) + root offset(4)
inline constexpr std::size_t HEADER_SIZE = 10;

using Bytes = std::span<const std::uint8_t>;

struct Header {
    std::string magic{};
    std::uint16_t version{0};
    std::uint32_t root_offset{0};
    std::size_t buffer_size{0};
};

struct ParseOptions {
    // Walk and check the whole tree once before returning the root view.
    bool validate{false};
    // Nesting limit for the validating walk.
    std::size_t max_depth{512};
};

// ------------------------------
// Borrowed views (parser side)
//
// Every view points into the caller's buffer and is only valid while that
// buffer is alive and unmodified. Views never allocate except in the
// explicit to_*() conversions and ArrayView::shape().
// ------------------------------

class ValueView;
class ObjectView;

/// Validate the header and return a view positioned at the root value.
ValueView parse(Bytes bytes, const ParseOptions& opts = ParseOptions{});

class ArrayView {
public:
    DType dtype() const noexcept { return dtype_; }
    std::size_t ndim() const noexcept { return ndim_; }
    /// Size of dimension i; throws std::out_of_range when i >= ndim().
    std::uint64_t dim(std::size_t i) const;
    std::vector<std::uint64_t> shape() const;
    std::uint64_t num_elements() const noexcept { return numel_; }
    /// Raw element bytes, borrowed from the parsed buffer.
    Bytes data() const noexcept { return data_; }
    /// Absolute offset of the first element byte in the buffer.
    std::size_t offset() const noexcept { return offset_; }

    Array to_array() const;

private:
    friend class ValueView;

    DType dtype_{DType::U8};
    const std::uint8_t* dims_{nullptr};
    std::size_t ndim_{0};
    std::uint64_t numel_{0};
    Bytes data_{};
    std::size_t offset_{0};
};

class FileView {
public:
    std::string_view mime() const noexcept { return mime_; }
    Bytes data() const noexcept { return data_; }
    std::size_t offset() const noexcept { return offset_; }

    File to_file() const;

private:
    friend class ValueView;

    std::string_view mime_{};
    Bytes data_{};
    std::size_t offset_{0};
};

class ValueView {
public:
    /// Reads the tag byte. Throws DecodeError(InvalidTag) for unknown tags.
    ValueTag tag() const;
    ValueTag kind() const { return tag(); }

    /// Absolute offset of the tag byte.
    std::size_t offset() const noexcept { return pos_; }
    /// Number of bytes this value may occupy (its recorded extent).
    std::size_t extent() const noexcept { return end_ - pos_; }
    Bytes buffer() const noexcept { return buf_; }

    bool is_null() const { return tag() == ValueTag::Null; }
    bool is_object() const { return tag() == ValueTag::Object; }

    // Decode exactly this value's payload. DecodeError(TagMismatch) when the
    // stored tag is a different variant.
    bool as_bool() const;
    std::int64_t as_int() const;
    double as_float() const;
    std::string_view as_string() const;
    ArrayView as_array() const;
    FileView as_file() const;
    ObjectView as_object() const;

    // Path lookups, see path.hpp for the rules.
    std::optional<ValueView> get(std::string_view path) const;
    ValueView at(std::string_view path) const;

    // nullopt when the path is missing or holds another variant.
    std::optional<bool> get_bool(std::string_view path) const;
    std::optional<std::int64_t> get_int(std::string_view path) const;
    std::optional<double> get_float(std::string_view path) const;
    std::optional<std::string_view> get_string(std::string_view path) const;

    /// Deep copy into an owned tree.
    Value to_value() const;

private:
    friend class ObjectView;
    friend ValueView parse(Bytes bytes, const ParseOptions& opts);

    ValueView(Bytes buf, std::size_t pos, std::size_t end) noexcept
        : buf_(buf), pos_(pos), end_(end) {}

    void expect(ValueTag t) const;
    // Decodes this value and everything below it; the encoding must fill
    // [pos_, end_) exactly.
    void check_tree(std::size_t depth, std::size_t max_depth) const;
    std::size_t decoded_end(std::size_t depth, std::size_t max_depth) const;

    Bytes buf_{};
    std::size_t pos_{0};
    std::size_t end_{0};
};

struct ObjectEntry {
    std::string_view key;
    ValueView value;
};

class ObjectView {
public:
    // Lazily decodes one entry per increment. Copying an iterator (or calling
    // begin() again) restarts from that point without touching the buffer.
    class iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = ObjectEntry;
        using difference_type = std::ptrdiff_t;
        using pointer = const ObjectEntry*;
        using reference = const ObjectEntry&;

        iterator() = default;

        reference operator*() const { return *current_; }
        pointer operator->() const { return &*current_; }
        iterator& operator++();
        iterator operator++(int);

        friend bool operator==(const iterator& a, const iterator& b) noexcept {
            return a.index_ == b.index_;
        }
        friend bool operator!=(const iterator& a, const iterator& b) noexcept {
            return !(a == b);
        }

    private:
        friend class ObjectView;

        iterator(Bytes buf, std::size_t end, std::size_t count, std::size_t index, std::size_t pos);
        void load();

        Bytes buf_{};
        std::size_t end_{0};
        std::size_t count_{0};
        std::size_t index_{0};
        std::size_t pos_{0};
        std::size_t next_{0};
        std::optional<ObjectEntry> current_{};
    };

    std::size_t size() const noexcept { return count_; }
    std::size_t len() const noexcept { return count_; }
    bool empty() const noexcept { return count_ == 0; }

    /// Linear scan comparing key bytes in place.
    std::optional<ValueView> get(std::string_view key) const;
    bool contains(std::string_view key) const { return get(key).has_value(); }

    iterator begin() const;
    iterator end() const;

    std::size_t offset() const noexcept { return pos_; }

private:
    friend class ValueView;

    // Decodes the entry at `pos` and stores the position after it in `next`.
    static ObjectEntry read_entry(Bytes buf, std::size_t end, std::size_t pos, std::size_t& next);

    Bytes buf_{};
    std::size_t pos_{0};      // first entry
    std::size_t end_{0};      // extent of the object
    std::size_t count_{0};
};

// ------------------------------
// API
// ------------------------------

/// Check the fixed header without touching the tree.
Header read_header(Bytes bytes);

} // namespace blobfig
