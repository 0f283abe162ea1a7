#include "blobfig/value.hpp"

#include "blobfig/error.hpp"
#include "blobfig/path.hpp"
#include "internal.hpp"

namespace blobfig {

std::string to_string(ValueTag t) {
    switch (t) {
        case ValueTag::Null: return "null";
        case ValueTag::Bool: return "bool";
        case ValueTag::Int: return "int";
        case ValueTag::Float: return "float";
        case ValueTag::String: return "string";
        case ValueTag::Array: return "array";
        case ValueTag::File: return "file";
        case ValueTag::Object: return "object";
    }
    return "unknown";
}

std::optional<ValueTag> value_tag_from_u8(std::uint8_t tag) noexcept {
    if (tag <= static_cast<std::uint8_t>(ValueTag::Object)) return static_cast<ValueTag>(tag);
    return std::nullopt;
}

std::optional<std::uint64_t> checked_numel(const std::vector<std::uint64_t>& shape) noexcept {
    std::uint64_t n = 1;
    for (auto d : shape) {
        std::uint64_t tmp = 0;
        if (!internal::checked_mul_u64(n, d, tmp)) return std::nullopt;
        n = tmp;
    }
    return n;
}

// ------------------------------
// Array / File
// ------------------------------

Array::Array(DType d, std::vector<std::uint64_t> s, std::vector<std::uint8_t> bytes)
    : dtype(d), shape(std::move(s)), data(std::move(bytes)) {}

std::optional<std::uint64_t> Array::num_elements() const noexcept {
    return checked_numel(shape);
}

std::optional<std::uint64_t> Array::expected_size() const noexcept {
    auto n = num_elements();
    if (!n) return std::nullopt;
    std::uint64_t out = 0;
    if (!internal::checked_mul_u64(*n, element_size(dtype), out)) return std::nullopt;
    return out;
}

File::File(std::string m, std::vector<std::uint8_t> bytes)
    : mime(std::move(m)), data(std::move(bytes)) {}

// ------------------------------
// Value helpers
// ------------------------------

Value Value::make_null() {
    return Value{};
}

Value Value::make_bool(bool b) {
    Value v;
    v.v = b;
    return v;
}

Value Value::make_int(std::int64_t i) {
    Value v;
    v.v = i;
    return v;
}

Value Value::make_float(double f) {
    Value v;
    v.v = f;
    return v;
}

Value Value::make_string(std::string s) {
    Value v;
    v.v = std::move(s);
    return v;
}

Value Value::make_array(Array a) {
    Value v;
    v.v = std::move(a);
    return v;
}

Value Value::make_file(File f) {
    Value v;
    v.v = std::move(f);
    return v;
}

Value Value::make_object() {
    Value v;
    v.v = Object{};
    return v;
}

Value Value::make_object(Object entries) {
    Value v;
    v.v = std::move(entries);
    return v;
}

ValueTag Value::tag() const noexcept {
    return static_cast<ValueTag>(v.index());
}

bool Value::is_null() const noexcept {
    return std::holds_alternative<std::monostate>(v);
}

bool Value::is_object() const noexcept {
    return std::holds_alternative<Object>(v);
}

template <typename T>
static const T& get_or_throw(const Value& val, ValueTag want) {
    if (const T* p = std::get_if<T>(&val.v)) return *p;
    throw AccessError(AccessErrorKind::TypeMismatch, "",
                      "type mismatch: expected " + to_string(want) + ", got " + to_string(val.tag()));
}

bool Value::as_bool() const { return get_or_throw<bool>(*this, ValueTag::Bool); }

std::int64_t Value::as_int() const { return get_or_throw<std::int64_t>(*this, ValueTag::Int); }

double Value::as_float() const { return get_or_throw<double>(*this, ValueTag::Float); }

const std::string& Value::as_string() const { return get_or_throw<std::string>(*this, ValueTag::String); }

const Array& Value::as_array() const { return get_or_throw<Array>(*this, ValueTag::Array); }

const File& Value::as_file() const { return get_or_throw<File>(*this, ValueTag::File); }

const Value::Object& Value::as_object() const { return get_or_throw<Object>(*this, ValueTag::Object); }

Value::Object& Value::as_object() {
    return const_cast<Object&>(static_cast<const Value&>(*this).as_object());
}

const Value* Value::find(std::string_view key) const {
    const Object* obj = std::get_if<Object>(&v);
    if (!obj) return nullptr;
    for (const auto& kv : *obj) {
        if (kv.first == key) return &kv.second;
    }
    return nullptr;
}

const Value* Value::get(std::string_view path) const {
    auto parts = split_path(path);
    if (!parts) return nullptr;
    const Value* cur = this;
    for (auto part : *parts) {
        cur = cur->find(part);
        if (!cur) return nullptr;
    }
    return cur;
}

bool operator==(const Array& a, const Array& b) {
    return a.dtype == b.dtype && a.shape == b.shape && a.data == b.data;
}

bool operator==(const File& a, const File& b) {
    return a.mime == b.mime && a.data == b.data;
}

bool operator==(const Value& a, const Value& b) {
    return a.v == b.v;
}

} // namespace blobfig
