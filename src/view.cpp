#include "blobfig/view.hpp"

#include "blobfig/error.hpp"
#include "blobfig/path.hpp"
#include "internal.hpp"

#include <cstring>
#include <limits>
#include <stdexcept>
#include <string>
#include <unordered_set>

namespace blobfig {

namespace {

// Smallest possible object entry: key length, empty key, child length, tag.
constexpr std::size_t kMinEntrySize = 4 + 0 + 4 + 1;

void need(std::size_t pos, std::size_t n, std::size_t end, const char* what) {
    if (pos > end || n > end - pos) {
        std::size_t avail = pos > end ? 0 : end - pos;
        throw DecodeError(DecodeErrorKind::Truncated, pos,
                          std::string(what) + " needs " + std::to_string(n) +
                          " bytes, " + std::to_string(avail) + " available");
    }
}

std::uint32_t read_u32(Bytes buf, std::size_t pos, std::size_t end, const char* what) {
    need(pos, 4, end, what);
    return internal::read_u32_le_from(buf.data() + pos);
}

std::string_view as_chars(Bytes buf, std::size_t pos, std::size_t n) {
    return std::string_view(reinterpret_cast<const char*>(buf.data() + pos), n);
}

void check_utf8(Bytes buf, std::size_t pos, std::size_t n, const char* what) {
    if (!internal::is_valid_utf8(buf.data() + pos, n)) {
        throw DecodeError(DecodeErrorKind::InvalidUtf8, pos, std::string(what) + " is not valid UTF-8");
    }
}

Value to_value_at(const ValueView& v, std::size_t depth) {
    if (depth > ParseOptions{}.max_depth) {
        throw DecodeError(DecodeErrorKind::DepthExceeded, v.offset(),
                          "nesting deeper than " + std::to_string(ParseOptions{}.max_depth));
    }
    switch (v.tag()) {
        case ValueTag::Null: return Value::make_null();
        case ValueTag::Bool: return Value::make_bool(v.as_bool());
        case ValueTag::Int: return Value::make_int(v.as_int());
        case ValueTag::Float: return Value::make_float(v.as_float());
        case ValueTag::String: return Value::make_string(std::string(v.as_string()));
        case ValueTag::Array: return Value::make_array(v.as_array().to_array());
        case ValueTag::File: return Value::make_file(v.as_file().to_file());
        case ValueTag::Object: {
            Value::Object out;
            ObjectView obj = v.as_object();
            out.reserve(obj.size());
            for (const auto& e : obj) {
                out.emplace_back(std::string(e.key), to_value_at(e.value, depth + 1));
            }
            return Value::make_object(std::move(out));
        }
    }
    throw DecodeError(DecodeErrorKind::InvalidTag, v.offset(), "invalid value tag");
}

} // namespace

// ------------------------------
// Header
// ------------------------------

Header read_header(Bytes bytes) {
    if (bytes.size() < MAGIC.size()) {
        throw DecodeError(DecodeErrorKind::Truncated, bytes.size(), "buffer too small for magic");
    }
    if (std::memcmp(bytes.data(), MAGIC.data(), MAGIC.size()) != 0) {
        throw DecodeError(DecodeErrorKind::BadMagic, 0, "bad magic (expected BLBF)");
    }
    if (bytes.size() < HEADER_SIZE) {
        throw DecodeError(DecodeErrorKind::Truncated, bytes.size(), "buffer too small for header");
    }

    Header h;
    h.magic.assign(reinterpret_cast<const char*>(bytes.data()), MAGIC.size());
    h.version = internal::read_u16_le_from(bytes.data() + 4);
    h.root_offset = internal::read_u32_le_from(bytes.data() + 6);
    h.buffer_size = bytes.size();

    if (h.version != VERSION) {
        throw DecodeError(DecodeErrorKind::UnsupportedVersion, 4,
                          "unsupported version " + std::to_string(h.version) +
                          " (supported: " + std::to_string(VERSION) + ")");
    }
    if (h.root_offset < HEADER_SIZE || h.root_offset >= bytes.size()) {
        throw DecodeError(DecodeErrorKind::Truncated, 6,
                          "root offset " + std::to_string(h.root_offset) +
                          " outside buffer of " + std::to_string(bytes.size()) + " bytes");
    }
    return h;
}

ValueView parse(Bytes bytes, const ParseOptions& opts) {
    Header h = read_header(bytes);
    ValueView root(bytes, h.root_offset, bytes.size());
    if (opts.validate) root.check_tree(0, opts.max_depth);
    return root;
}

// ------------------------------
// ValueView
// ------------------------------

ValueTag ValueView::tag() const {
    need(pos_, 1, end_, "value tag");
    auto t = value_tag_from_u8(buf_[pos_]);
    if (!t) {
        throw DecodeError(DecodeErrorKind::InvalidTag, pos_,
                          "invalid value tag " + std::to_string(buf_[pos_]));
    }
    return *t;
}

void ValueView::expect(ValueTag t) const {
    ValueTag actual = tag();
    if (actual != t) {
        throw DecodeError(DecodeErrorKind::TagMismatch, pos_,
                          "expected " + to_string(t) + ", found " + to_string(actual));
    }
}

bool ValueView::as_bool() const {
    expect(ValueTag::Bool);
    need(pos_ + 1, 1, end_, "bool");
    return buf_[pos_ + 1] != 0;
}

std::int64_t ValueView::as_int() const {
    expect(ValueTag::Int);
    need(pos_ + 1, 8, end_, "int");
    return static_cast<std::int64_t>(internal::read_u64_le_from(buf_.data() + pos_ + 1));
}

double ValueView::as_float() const {
    expect(ValueTag::Float);
    need(pos_ + 1, 8, end_, "float");
    std::uint64_t bits = internal::read_u64_le_from(buf_.data() + pos_ + 1);
    double d = 0.0;
    std::memcpy(&d, &bits, sizeof(d));
    return d;
}

std::string_view ValueView::as_string() const {
    expect(ValueTag::String);
    std::size_t p = pos_ + 1;
    std::uint32_t n = read_u32(buf_, p, end_, "string length");
    p += 4;
    need(p, n, end_, "string");
    check_utf8(buf_, p, n, "string");
    return as_chars(buf_, p, n);
}

ArrayView ValueView::as_array() const {
    expect(ValueTag::Array);
    std::size_t p = pos_ + 1;

    need(p, 1, end_, "array dtype");
    auto dt = dtype_from_u8(buf_[p]);
    if (!dt) {
        throw DecodeError(DecodeErrorKind::InvalidDType, p, "invalid dtype tag " + std::to_string(buf_[p]));
    }
    p += 1;

    std::uint32_t ndim = read_u32(buf_, p, end_, "array rank");
    p += 4;

    std::uint64_t dims_bytes = static_cast<std::uint64_t>(ndim) * 4u;
    if (dims_bytes > end_ - p) {
        throw DecodeError(DecodeErrorKind::Truncated, p,
                          "array dims need " + std::to_string(dims_bytes) + " bytes, " +
                          std::to_string(end_ - p) + " available");
    }
    const std::uint8_t* dims = buf_.data() + p;

    std::uint64_t numel = 1;
    for (std::uint32_t i = 0; i < ndim; ++i) {
        std::uint64_t d = internal::read_u32_le_from(dims + 4u * i);
        if (!internal::checked_mul_u64(numel, d, numel)) {
            throw DecodeError(DecodeErrorKind::ArithmeticOverflow, p, "array shape product overflows");
        }
    }
    p += static_cast<std::size_t>(dims_bytes);

    std::size_t esz = element_size(*dt);
    std::uint64_t nbytes = 0;
    if (!internal::checked_mul_u64(numel, esz, nbytes) ||
        nbytes > (std::numeric_limits<std::size_t>::max)()) {
        throw DecodeError(DecodeErrorKind::ArithmeticOverflow, p, "array byte size overflows");
    }

    std::size_t start = 0;
    if (!internal::checked_align_up(p, esz, start)) {
        throw DecodeError(DecodeErrorKind::ArithmeticOverflow, p, "array payload offset overflows");
    }
    need(p, start - p, end_, "array padding");
    need(start, static_cast<std::size_t>(nbytes), end_, "array payload");

    ArrayView a;
    a.dtype_ = *dt;
    a.dims_ = dims;
    a.ndim_ = ndim;
    a.numel_ = numel;
    a.data_ = buf_.subspan(start, static_cast<std::size_t>(nbytes));
    a.offset_ = start;
    return a;
}

FileView ValueView::as_file() const {
    expect(ValueTag::File);
    std::size_t p = pos_ + 1;

    std::uint32_t mime_len = read_u32(buf_, p, end_, "mime length");
    p += 4;
    need(p, mime_len, end_, "mime");
    check_utf8(buf_, p, mime_len, "mime type");
    std::string_view mime = as_chars(buf_, p, mime_len);
    p += mime_len;

    std::uint32_t data_len = read_u32(buf_, p, end_, "file data length");
    p += 4;
    need(p, data_len, end_, "file data");

    FileView f;
    f.mime_ = mime;
    f.data_ = buf_.subspan(p, data_len);
    f.offset_ = p;
    return f;
}

ObjectView ValueView::as_object() const {
    expect(ValueTag::Object);
    std::uint32_t count = read_u32(buf_, pos_ + 1, end_, "object entry count");
    std::size_t first = pos_ + 5;
    // Reject impossible counts before anyone loops over them.
    if (count > (end_ - first) / kMinEntrySize) {
        throw DecodeError(DecodeErrorKind::Truncated, pos_ + 1,
                          "object claims " + std::to_string(count) + " entries in " +
                          std::to_string(end_ - first) + " bytes");
    }

    ObjectView o;
    o.buf_ = buf_;
    o.pos_ = first;
    o.end_ = end_;
    o.count_ = count;
    return o;
}

std::optional<ValueView> ValueView::get(std::string_view path) const {
    return blobfig::get(*this, path);
}

ValueView ValueView::at(std::string_view path) const {
    return blobfig::at(*this, path);
}

std::optional<bool> ValueView::get_bool(std::string_view path) const {
    auto v = get(path);
    if (!v || v->tag() != ValueTag::Bool) return std::nullopt;
    return v->as_bool();
}

std::optional<std::int64_t> ValueView::get_int(std::string_view path) const {
    auto v = get(path);
    if (!v || v->tag() != ValueTag::Int) return std::nullopt;
    return v->as_int();
}

std::optional<double> ValueView::get_float(std::string_view path) const {
    auto v = get(path);
    if (!v || v->tag() != ValueTag::Float) return std::nullopt;
    return v->as_float();
}

std::optional<std::string_view> ValueView::get_string(std::string_view path) const {
    auto v = get(path);
    if (!v || v->tag() != ValueTag::String) return std::nullopt;
    return v->as_string();
}

Value ValueView::to_value() const {
    return to_value_at(*this, 0);
}

void ValueView::check_tree(std::size_t depth, std::size_t max_depth) const {
    std::size_t stop = decoded_end(depth, max_depth);
    if (stop != end_) {
        throw DecodeError(DecodeErrorKind::LengthMismatch, stop,
                          to_string(tag()) + " ends at " + std::to_string(stop) +
                          " but its extent ends at " + std::to_string(end_));
    }
}

std::size_t ValueView::decoded_end(std::size_t depth, std::size_t max_depth) const {
    if (depth > max_depth) {
        throw DecodeError(DecodeErrorKind::DepthExceeded, pos_,
                          "nesting deeper than " + std::to_string(max_depth));
    }
    auto offset_of = [this](const void* p) {
        return static_cast<std::size_t>(static_cast<const std::uint8_t*>(p) - buf_.data());
    };
    switch (tag()) {
        case ValueTag::Null: return pos_ + 1;
        case ValueTag::Bool: (void)as_bool(); return pos_ + 2;
        case ValueTag::Int: (void)as_int(); return pos_ + 9;
        case ValueTag::Float: (void)as_float(); return pos_ + 9;
        case ValueTag::String: {
            std::string_view s = as_string();
            return offset_of(s.data()) + s.size();
        }
        case ValueTag::Array: {
            ArrayView a = as_array();
            return a.offset() + a.data().size();
        }
        case ValueTag::File: {
            FileView f = as_file();
            return f.offset() + f.data().size();
        }
        case ValueTag::Object: {
            ObjectView obj = as_object();
            std::size_t stop = obj.offset();
            std::unordered_set<std::string_view> seen;
            seen.reserve(obj.size());
            for (const auto& e : obj) {
                if (!seen.insert(e.key).second) {
                    throw DecodeError(DecodeErrorKind::DuplicateKey, offset_of(e.key.data()),
                                      "duplicate key \"" + std::string(e.key) + "\"");
                }
                e.value.check_tree(depth + 1, max_depth);
                stop = e.value.end_;
            }
            return stop;
        }
    }
    throw DecodeError(DecodeErrorKind::InvalidTag, pos_, "invalid value tag");
}

// ------------------------------
// ArrayView / FileView
// ------------------------------

std::uint64_t ArrayView::dim(std::size_t i) const {
    if (i >= ndim_) {
        throw std::out_of_range("array dim " + std::to_string(i) + " out of range (ndim " +
                                std::to_string(ndim_) + ")");
    }
    return internal::read_u32_le_from(dims_ + 4u * i);
}

std::vector<std::uint64_t> ArrayView::shape() const {
    std::vector<std::uint64_t> out;
    out.reserve(ndim_);
    for (std::size_t i = 0; i < ndim_; ++i) {
        out.push_back(internal::read_u32_le_from(dims_ + 4u * i));
    }
    return out;
}

Array ArrayView::to_array() const {
    return Array(dtype_, shape(), std::vector<std::uint8_t>(data_.begin(), data_.end()));
}

File FileView::to_file() const {
    return File(std::string(mime_), std::vector<std::uint8_t>(data_.begin(), data_.end()));
}

// ------------------------------
// ObjectView
// ------------------------------

ObjectEntry ObjectView::read_entry(Bytes buf, std::size_t end, std::size_t pos, std::size_t& next) {
    std::uint32_t key_len = read_u32(buf, pos, end, "key length");
    std::size_t p = pos + 4;
    need(p, key_len, end, "key");
    check_utf8(buf, p, key_len, "key");
    std::string_view key = as_chars(buf, p, key_len);
    p += key_len;

    std::uint32_t child_len = read_u32(buf, p, end, "child length");
    p += 4;
    if (child_len == 0) {
        throw DecodeError(DecodeErrorKind::Truncated, p - 4, "empty child for key \"" + std::string(key) + "\"");
    }
    need(p, child_len, end, "child");

    next = p + child_len;
    return ObjectEntry{key, ValueView(buf, p, p + child_len)};
}

std::optional<ValueView> ObjectView::get(std::string_view key) const {
    std::size_t pos = pos_;
    for (std::size_t i = 0; i < count_; ++i) {
        std::size_t next = 0;
        ObjectEntry e = read_entry(buf_, end_, pos, next);
        if (e.key == key) return e.value;
        pos = next;
    }
    return std::nullopt;
}

ObjectView::iterator ObjectView::begin() const {
    return iterator(buf_, end_, count_, 0, pos_);
}

ObjectView::iterator ObjectView::end() const {
    return iterator(buf_, end_, count_, count_, pos_);
}

ObjectView::iterator::iterator(Bytes buf, std::size_t end, std::size_t count, std::size_t index, std::size_t pos)
    : buf_(buf), end_(end), count_(count), index_(index), pos_(pos) {
    if (index_ < count_) load();
}

void ObjectView::iterator::load() {
    current_ = ObjectView::read_entry(buf_, end_, pos_, next_);
}

ObjectView::iterator& ObjectView::iterator::operator++() {
    ++index_;
    pos_ = next_;
    if (index_ < count_) {
        load();
    } else {
        current_.reset();
    }
    return *this;
}

ObjectView::iterator ObjectView::iterator::operator++(int) {
    iterator tmp = *this;
    ++(*this);
    return tmp;
}

} // namespace blobfig
