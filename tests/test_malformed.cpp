#include "test_util.hpp"

#include <iostream>

using blobfig::Array;
using blobfig::DecodeError;
using blobfig::DecodeErrorKind;
using blobfig::DType;
using blobfig::ParseOptions;
using blobfig::Value;

static bool parse_fails(const std::vector<std::uint8_t>& b, DecodeErrorKind kind, bool validate = false) {
    return throws_kind<DecodeError>([&] { (void)blobfig::parse(b, ParseOptions{validate}); }, kind);
}

int main() {
    // Header checks fail the whole parse
    {
        ByteWriter bad_magic;
        bad_magic.raw("BLBX").u16(1).u32(10).u8(0);
        CHECK(parse_fails(bad_magic.b, DecodeErrorKind::BadMagic));

        ByteWriter v2;
        v2.header(2).u8(0);
        CHECK(parse_fails(v2.b, DecodeErrorKind::UnsupportedVersion));

        ByteWriter far;
        far.header(1, 200).u8(0);
        CHECK(parse_fails(far.b, DecodeErrorKind::Truncated));

        ByteWriter inside_header;
        inside_header.header(1, 5).u8(0);
        CHECK(parse_fails(inside_header.b, DecodeErrorKind::Truncated));

        ByteWriter ok;
        ok.header().u8(0);
        CHECK(blobfig::parse(ok.b).is_null());
    }

    // Unknown value tag
    {
        ByteWriter w;
        w.header().u8(9);
        auto v = blobfig::parse(w.b);
        CHECK((throws_kind<DecodeError>([&] { (void)v.tag(); }, DecodeErrorKind::InvalidTag)));
        CHECK(parse_fails(w.b, DecodeErrorKind::InvalidTag, true));
    }

    // Bool payloads are true for any nonzero byte
    {
        ByteWriter w;
        w.header().u8(1).u8(2);
        CHECK(blobfig::parse(w.b).as_bool());
    }

    // Unknown dtype
    {
        ByteWriter zero;
        zero.header().u8(5).u8(0).u32(0);
        CHECK((throws_kind<DecodeError>([&] { (void)blobfig::parse(zero.b).as_array(); },
                                        DecodeErrorKind::InvalidDType)));
        ByteWriter eleven;
        eleven.header().u8(5).u8(11).u32(0);
        CHECK((throws_kind<DecodeError>([&] { (void)blobfig::parse(eleven.b).as_array(); },
                                        DecodeErrorKind::InvalidDType)));
    }

    // Shape product overflow is reported, not wrapped
    {
        ByteWriter w;
        w.header().u8(5).u8(10).u32(3).u32(0xFFFFFFFFu).u32(0xFFFFFFFFu).u32(0xFFFFFFFFu);
        CHECK((throws_kind<DecodeError>([&] { (void)blobfig::parse(w.b).as_array(); },
                                        DecodeErrorKind::ArithmeticOverflow)));
    }

    // Dims or payload running past the end
    {
        ByteWriter dims;
        dims.header().u8(5).u8(1).u32(1000).u32(1);
        CHECK((throws_kind<DecodeError>([&] { (void)blobfig::parse(dims.b).as_array(); },
                                        DecodeErrorKind::Truncated)));

        ByteWriter payload;
        payload.header().u8(5).u8(9).u32(1).u32(4).u64(0); // needs 16 bytes, has 8
        CHECK((throws_kind<DecodeError>([&] { (void)blobfig::parse(payload.b).as_array(); },
                                        DecodeErrorKind::Truncated)));
    }

    // String length past the end
    {
        ByteWriter w;
        w.header().u8(4).u32(50).raw("short");
        CHECK((throws_kind<DecodeError>([&] { (void)blobfig::parse(w.b).as_string(); },
                                        DecodeErrorKind::Truncated)));
    }

    // Duplicate keys: lookups see the first, validation rejects
    {
        ByteWriter w;
        w.header().u8(7).u32(2);
        w.entry("x", 1).u8(0);
        w.entry("x", 2).u8(1).u8(1);

        auto root = blobfig::parse(w.b);
        CHECK(root.get("x")->is_null());
        CHECK(root.as_object().size() == 2);
        CHECK(parse_fails(w.b, DecodeErrorKind::DuplicateKey, true));
    }

    // A child never reads outside its recorded extent
    {
        ByteWriter w;
        w.header().u8(7).u32(1);
        w.entry("n", 1).u8(2).u64(5); // Int needs 9 bytes, extent says 1
        auto root = blobfig::parse(w.b);
        CHECK((throws_kind<DecodeError>([&] { (void)root.get("n")->as_int(); }, DecodeErrorKind::Truncated)));
    }

    // Child length past the parent
    {
        ByteWriter w;
        w.header().u8(7).u32(1);
        w.entry("k", 100).u8(0);
        CHECK((throws_kind<DecodeError>([&] { (void)blobfig::parse(w.b).get("k"); }, DecodeErrorKind::Truncated)));
    }

    // Validation requires every value to fill its extent exactly
    {
        ByteWriter slack;
        slack.header().u8(7).u32(1);
        slack.entry("n", 12).u8(2).u64(5).u8(0xAA).u8(0xBB).u8(0xCC);
        CHECK(blobfig::parse(slack.b).get_int("n") == 5);
        CHECK(parse_fails(slack.b, DecodeErrorKind::LengthMismatch, true));

        Value::Object o;
        o.emplace_back("n", Value::make_int(5));
        auto clean = blobfig::to_bytes(Value::make_object(std::move(o)));
        auto trailing = clean;
        trailing.insert(trailing.end(), {0, 0, 0, 0});
        CHECK(blobfig::parse(trailing).get_int("n") == 5);
        CHECK(parse_fails(trailing, DecodeErrorKind::LengthMismatch, true));

        ByteWriter nested;
        nested.header().u8(7).u32(1);
        nested.entry("o", 7).u8(7).u32(0).u8(0).u8(0);
        CHECK(parse_fails(nested.b, DecodeErrorKind::LengthMismatch, true));

        CHECK(blobfig::parse(clean, ParseOptions{true}).get_int("n") == 5);
    }

    // Zero-length child
    {
        ByteWriter w;
        w.header().u8(7).u32(1);
        w.entry("k", 0).u8(0);
        CHECK((throws_kind<DecodeError>([&] { (void)blobfig::parse(w.b).get("k"); }, DecodeErrorKind::Truncated)));
    }

    // Entry counts that cannot fit the object
    {
        ByteWriter w;
        w.header().u8(7).u32(0xFFFFFFFFu).u32(0);
        CHECK((throws_kind<DecodeError>([&] { (void)blobfig::parse(w.b).as_object(); },
                                        DecodeErrorKind::Truncated)));
    }

    // Keys must be UTF-8
    {
        Value::Object o;
        o.emplace_back(std::string("\xff", 1), Value::make_null());
        blobfig::WriteOptions wo;
        wo.validate_utf8 = false;
        auto bytes = blobfig::to_bytes(Value::make_object(std::move(o)), wo);
        auto root = blobfig::parse(bytes);
        CHECK((throws_kind<DecodeError>([&] { (void)root.as_object().begin(); }, DecodeErrorKind::InvalidUtf8)));
        CHECK(parse_fails(bytes, DecodeErrorKind::InvalidUtf8, true));
    }

    // Nesting limit of the validating walk
    {
        Value v = Value::make_int(0);
        for (int i = 0; i < 10; ++i) {
            Value::Object o;
            o.emplace_back("d", std::move(v));
            v = Value::make_object(std::move(o));
        }
        auto bytes = blobfig::to_bytes(v);
        CHECK((throws_kind<DecodeError>([&] { (void)blobfig::parse(bytes, ParseOptions{true, 3}); },
                                        DecodeErrorKind::DepthExceeded)));
        auto root = blobfig::parse(bytes, ParseOptions{true, 10});
        CHECK(root.get_int("d/d/d/d/d/d/d/d/d/d") == 0);
    }

    // Flipping any single byte never escapes the error model
    {
        Value::Object o;
        o.emplace_back("version", Value::make_int(1));
        o.emplace_back("mean", Value::make_array(Array(DType::F32, {3}, le_bytes<float>({1.0f, 2.0f, 3.0f}))));
        o.emplace_back("name", Value::make_string("cfg"));
        o.emplace_back("doc", Value::make_file(blobfig::File("text/plain", {'o', 'k'})));
        Value::Object sub;
        sub.emplace_back("flag", Value::make_bool(false));
        sub.emplace_back("ids", Value::make_array(Array(DType::I64, {2}, le_bytes<std::int64_t>({7, 8}))));
        o.emplace_back("sub", Value::make_object(std::move(sub)));
        const auto clean = blobfig::to_bytes(Value::make_object(std::move(o)));

        std::size_t failures = 0;
        for (std::size_t i = 0; i < clean.size(); ++i) {
            for (std::uint8_t mask : {std::uint8_t{0x01}, std::uint8_t{0x80}, std::uint8_t{0xFF}}) {
                auto b = clean;
                b[i] ^= mask;
                for (bool validate : {false, true}) {
                    try {
                        (void)blobfig::parse(b, ParseOptions{validate}).to_value();
                    } catch (const DecodeError&) {
                        ++failures;
                    }
                }
            }
        }
        CHECK(failures > 0);
    }

    std::cout << "All tests passed.\n";
    return 0;
}
