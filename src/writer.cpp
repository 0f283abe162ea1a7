#include "blobfig/writer.hpp"

#include "blobfig/error.hpp"
#include "blobfig/view.hpp"
#include "internal.hpp"

#include <cstring>
#include <limits>
#include <string>
#include <string_view>
#include <unordered_map>

namespace blobfig {

namespace {

constexpr std::size_t kMaxU32 = (std::numeric_limits<std::uint32_t>::max)();

std::string where(const std::string& path) {
    return path.empty() ? std::string("<root>") : path;
}

std::string child_path(const std::string& parent, const std::string& key) {
    return parent.empty() ? key : (parent + "/" + key);
}

std::uint32_t checked_len(std::size_t n, const char* what, const std::string& path) {
    if (n > kMaxU32) {
        throw EncodeError(EncodeErrorKind::SizeOverflow,
                          std::string(what) + " length " + std::to_string(n) +
                          " exceeds u32 at '" + where(path) + "'");
    }
    return static_cast<std::uint32_t>(n);
}

// Writes (or, with a null sink, only measures) the encoding. Positions are
// absolute buffer offsets, so alignment padding comes out the same in both
// modes.
class Encoder {
public:
    Encoder(const WriteOptions& opts, std::vector<std::uint8_t>* out)
        : opts_(opts), out_(out) {}

    std::size_t pos() const noexcept { return pos_; }

    void header() {
        put_bytes(reinterpret_cast<const std::uint8_t*>(MAGIC.data()), MAGIC.size());
        put_u16(VERSION);
        put_u32(static_cast<std::uint32_t>(HEADER_SIZE));
    }

    void value(const Value& v, const std::string& path) {
        switch (v.tag()) {
            case ValueTag::Null:
                put_u8(static_cast<std::uint8_t>(ValueTag::Null));
                return;
            case ValueTag::Bool:
                put_u8(static_cast<std::uint8_t>(ValueTag::Bool));
                put_u8(std::get<bool>(v.v) ? 1 : 0);
                return;
            case ValueTag::Int:
                put_u8(static_cast<std::uint8_t>(ValueTag::Int));
                put_u64(static_cast<std::uint64_t>(std::get<std::int64_t>(v.v)));
                return;
            case ValueTag::Float: {
                double f = std::get<double>(v.v);
                std::uint64_t bits = 0;
                std::memcpy(&bits, &f, sizeof(bits));
                put_u8(static_cast<std::uint8_t>(ValueTag::Float));
                put_u64(bits);
                return;
            }
            case ValueTag::String:
                string_value(std::get<std::string>(v.v), path);
                return;
            case ValueTag::Array:
                array_value(std::get<Array>(v.v), path);
                return;
            case ValueTag::File:
                file_value(std::get<File>(v.v), path);
                return;
            case ValueTag::Object:
                object_value(std::get<Value::Object>(v.v), path);
                return;
        }
    }

private:
    const WriteOptions& opts_;
    std::vector<std::uint8_t>* out_;
    std::size_t pos_{0};

    void advance(std::size_t n) {
        if (!internal::checked_add_size(pos_, n, pos_)) {
            throw EncodeError(EncodeErrorKind::SizeOverflow, "encoded size overflows size_t");
        }
    }

    void put_u8(std::uint8_t b) {
        if (out_) out_->push_back(b);
        advance(1);
    }

    void put_u16(std::uint16_t v) {
        if (out_) internal::append_u16_le(*out_, v);
        advance(2);
    }

    void put_u32(std::uint32_t v) {
        if (out_) internal::append_u32_le(*out_, v);
        advance(4);
    }

    void put_u64(std::uint64_t v) {
        if (out_) internal::append_u64_le(*out_, v);
        advance(8);
    }

    void put_bytes(const std::uint8_t* p, std::size_t n) {
        if (out_ && n != 0) out_->insert(out_->end(), p, p + n);
        advance(n);
    }

    void put_bytes(const std::string& s) {
        put_bytes(reinterpret_cast<const std::uint8_t*>(s.data()), s.size());
    }

    void pad_to(std::size_t align) {
        std::size_t aligned = 0;
        if (!internal::checked_align_up(pos_, align, aligned)) {
            throw EncodeError(EncodeErrorKind::SizeOverflow, "encoded size overflows size_t");
        }
        std::size_t pad = aligned - pos_;
        if (out_) out_->insert(out_->end(), pad, 0);
        advance(pad);
    }

    // Length slot for a child whose size is not known yet.
    std::size_t reserve_u32() {
        std::size_t at = pos_;
        put_u32(0);
        return at;
    }

    void backfill_u32(std::size_t at, std::uint32_t v) {
        if (out_) internal::store_u32_le(out_->data() + at, v);
    }

    void check_utf8(const std::string& s, const char* what, const std::string& path) {
        if (opts_.validate_utf8 && !internal::is_valid_utf8(s.data(), s.size())) {
            throw EncodeError(EncodeErrorKind::InvalidUtf8,
                              std::string(what) + " is not valid UTF-8 at '" + where(path) + "'");
        }
    }

    void string_value(const std::string& s, const std::string& path) {
        check_utf8(s, "string", path);
        std::uint32_t n = checked_len(s.size(), "string", path);
        put_u8(static_cast<std::uint8_t>(ValueTag::String));
        put_u32(n);
        put_bytes(s);
    }

    void array_value(const Array& a, const std::string& path) {
        auto expected = a.expected_size();
        if (!expected) {
            throw EncodeError(EncodeErrorKind::SizeOverflow,
                              "array shape product overflows at '" + where(path) + "'");
        }
        if (*expected != static_cast<std::uint64_t>(a.data.size())) {
            throw EncodeError(EncodeErrorKind::ArrayLengthMismatch,
                              "array data is " + std::to_string(a.data.size()) + " bytes, shape/dtype require " +
                              std::to_string(*expected) + " at '" + where(path) + "'");
        }
        std::uint32_t ndim = checked_len(a.shape.size(), "array rank", path);
        for (auto d : a.shape) {
            if (d > kMaxU32) {
                throw EncodeError(EncodeErrorKind::SizeOverflow,
                                  "array dimension " + std::to_string(d) + " exceeds u32 at '" + where(path) + "'");
            }
        }

        put_u8(static_cast<std::uint8_t>(ValueTag::Array));
        put_u8(static_cast<std::uint8_t>(a.dtype));
        put_u32(ndim);
        for (auto d : a.shape) put_u32(static_cast<std::uint32_t>(d));
        pad_to(element_size(a.dtype));
        put_bytes(a.data.data(), a.data.size());
    }

    void file_value(const File& f, const std::string& path) {
        check_utf8(f.mime, "mime type", path);
        std::uint32_t mime_len = checked_len(f.mime.size(), "mime type", path);
        std::uint32_t data_len = checked_len(f.data.size(), "file data", path);
        put_u8(static_cast<std::uint8_t>(ValueTag::File));
        put_u32(mime_len);
        put_bytes(f.mime);
        put_u32(data_len);
        put_bytes(f.data.data(), f.data.size());
    }

    void object_value(const Value::Object& entries, const std::string& path) {
        // key -> index of its last occurrence
        std::unordered_map<std::string_view, std::size_t> last;
        last.reserve(entries.size());
        for (std::size_t i = 0; i < entries.size(); ++i) {
            const std::string& key = entries[i].first;
            if (key.find('/') != std::string::npos) {
                throw EncodeError(EncodeErrorKind::InvalidKey,
                                  "key contains '/': \"" + key + "\" in '" + where(path) + "'");
            }
            check_utf8(key, "key", path);
            auto [it, inserted] = last.emplace(std::string_view(key), i);
            if (!inserted) {
                if (opts_.duplicate_keys == DuplicateKeys::Reject) {
                    throw EncodeError(EncodeErrorKind::DuplicateKey,
                                      "duplicate key \"" + key + "\" in '" + where(path) + "'");
                }
                it->second = i;
            }
        }

        put_u8(static_cast<std::uint8_t>(ValueTag::Object));
        put_u32(checked_len(last.size(), "object entry count", path));

        for (std::size_t i = 0; i < entries.size(); ++i) {
            const auto& [key, child] = entries[i];
            if (last.find(key)->second != i) continue;

            put_u32(checked_len(key.size(), "key", path));
            put_bytes(key);

            std::size_t slot = reserve_u32();
            std::size_t start = pos_;
            std::string sub = child_path(path, key);
            value(child, sub);
            backfill_u32(slot, checked_len(pos_ - start, "child", sub));
        }
    }
};

} // namespace

std::vector<std::uint8_t> to_bytes(const Value& root, const WriteOptions& opts) {
    std::vector<std::uint8_t> out;
    out.reserve(1024);
    Encoder enc(opts, &out);
    enc.header();
    enc.value(root, "");
    return out;
}

std::size_t encoded_size(const Value& root, const WriteOptions& opts) {
    Encoder enc(opts, nullptr);
    enc.header();
    enc.value(root, "");
    return enc.pos();
}

} // namespace blobfig
