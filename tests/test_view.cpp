#include "test_util.hpp"

#include <iostream>
#include <stdexcept>

using blobfig::Array;
using blobfig::DecodeError;
using blobfig::DecodeErrorKind;
using blobfig::DType;
using blobfig::Value;

int main() {
    // Scenario: version + mean
    {
        Value::Object o;
        o.emplace_back("version", Value::make_int(1));
        o.emplace_back("mean", Value::make_array(Array(DType::F32, {3}, le_bytes<float>({1.0f, 2.0f, 3.0f}))));
        auto bytes = blobfig::to_bytes(Value::make_object(std::move(o)));

        auto root = blobfig::parse(bytes);
        CHECK(root.get("version")->as_int() == 1);

        auto mean = root.get("mean")->as_array();
        CHECK(mean.dtype() == DType::F32);
        CHECK(mean.ndim() == 1);
        CHECK(mean.dim(0) == 3);
        CHECK(mean.shape() == std::vector<std::uint64_t>{3});
        CHECK(mean.data().size() == 12);

        const std::uint8_t expected[12] = {
            0x00, 0x00, 0x80, 0x3F,
            0x00, 0x00, 0x00, 0x40,
            0x00, 0x00, 0x40, 0x40,
        };
        CHECK(std::memcmp(mean.data().data(), expected, sizeof(expected)) == 0);

        // Zero-copy: the payload is the buffer itself, at the aligned offset.
        CHECK(mean.offset() == 64);
        CHECK(mean.data().data() == bytes.data() + 64);

        bool threw = false;
        try {
            (void)mean.dim(1);
        } catch (const std::out_of_range&) {
            threw = true;
        }
        CHECK(threw);
    }

    // Strings, file data and keys all borrow from the buffer
    {
        Value::Object o;
        o.emplace_back("greeting", Value::make_string("hello"));
        o.emplace_back("blob", Value::make_file(blobfig::File("image/png", {0x89, 'P', 'N', 'G'})));
        auto bytes = blobfig::to_bytes(Value::make_object(std::move(o)));
        const char* lo = reinterpret_cast<const char*>(bytes.data());
        const char* hi = lo + bytes.size();

        auto root = blobfig::parse(bytes);
        auto s = root.get("greeting")->as_string();
        CHECK(s == "hello");
        CHECK(s.data() >= lo && s.data() + s.size() <= hi);

        auto f = root.get("blob")->as_file();
        CHECK(f.mime() == "image/png");
        CHECK(f.mime().data() >= lo && f.mime().data() < hi);
        CHECK(f.data().data() == bytes.data() + f.offset());
        CHECK(f.data()[0] == 0x89);

        for (const auto& e : root.as_object()) {
            CHECK(e.key.data() >= lo && e.key.data() + e.key.size() <= hi);
        }
    }

    // Alignment for every dtype, behind odd-length prefixes
    {
        const DType all[] = {DType::U8, DType::I8, DType::U16, DType::I16, DType::U32,
                             DType::I32, DType::U64, DType::I64, DType::F32, DType::F64};
        Value::Object o;
        std::string key = "a";
        for (DType d : all) {
            std::size_t n = blobfig::element_size(d);
            o.emplace_back(key, Value::make_array(Array(d, {2}, std::vector<std::uint8_t>(2 * n, 0x5A))));
            key += "b";
            o.emplace_back(key, Value::make_string(key));
            key += "c";
            o.emplace_back(key, Value::make_array(Array(d, {}, std::vector<std::uint8_t>(n, 0x11))));
            key += "d";
        }
        auto bytes = blobfig::to_bytes(Value::make_object(std::move(o)));
        auto root = blobfig::parse(bytes, blobfig::ParseOptions{true});

        std::size_t arrays = 0;
        for (const auto& e : root.as_object()) {
            if (e.value.tag() != blobfig::ValueTag::Array) continue;
            auto a = e.value.as_array();
            std::size_t n = blobfig::element_size(a.dtype());
            CHECK(a.offset() % n == 0);
            CHECK(a.data().data() == bytes.data() + a.offset());
            CHECK(a.data().size() == a.num_elements() * n);
            ++arrays;
        }
        CHECK(arrays == 20);
    }

    // Iteration is lazy, ordered and restartable
    {
        Value::Object o;
        o.emplace_back("zeta", Value::make_int(0));
        o.emplace_back("alpha", Value::make_int(1));
        o.emplace_back("mid", Value::make_int(2));
        auto bytes = blobfig::to_bytes(Value::make_object(std::move(o)));
        auto obj = blobfig::parse(bytes).as_object();

        CHECK(obj.len() == 3);
        CHECK(!obj.empty());
        CHECK(obj.contains("mid"));
        CHECK(!obj.contains("beta"));
        CHECK(!obj.get("ZETA").has_value());

        std::vector<std::string> first;
        for (const auto& e : obj) first.emplace_back(e.key);
        std::vector<std::string> second;
        for (auto it = obj.begin(); it != obj.end(); ++it) second.emplace_back(it->key);
        CHECK(first == (std::vector<std::string>{"zeta", "alpha", "mid"}));
        CHECK(first == second);

        // A copied iterator replays from its own position.
        auto it = obj.begin();
        ++it;
        auto saved = it;
        ++it;
        CHECK(it->key == "mid");
        CHECK(saved->key == "alpha");
        CHECK(saved->value.as_int() == 1);

        std::int64_t sum = 0;
        for (const auto& e : obj) sum += e.value.as_int();
        CHECK(sum == 3);
    }

    // Accessors check the tag
    {
        auto bytes = blobfig::to_bytes(Value::make_int(5));
        auto v = blobfig::parse(bytes);
        CHECK(v.kind() == blobfig::ValueTag::Int);
        CHECK((throws_kind<DecodeError>([&] { (void)v.as_bool(); }, DecodeErrorKind::TagMismatch)));
        CHECK((throws_kind<DecodeError>([&] { (void)v.as_float(); }, DecodeErrorKind::TagMismatch)));
        CHECK((throws_kind<DecodeError>([&] { (void)v.as_string(); }, DecodeErrorKind::TagMismatch)));
        CHECK((throws_kind<DecodeError>([&] { (void)v.as_array(); }, DecodeErrorKind::TagMismatch)));
        CHECK((throws_kind<DecodeError>([&] { (void)v.as_file(); }, DecodeErrorKind::TagMismatch)));
        CHECK((throws_kind<DecodeError>([&] { (void)v.as_object(); }, DecodeErrorKind::TagMismatch)));
        CHECK(v.as_int() == 5);
        CHECK(v.offset() == blobfig::HEADER_SIZE);
        CHECK(v.extent() == 9);
    }

    // A failing subtree does not poison its siblings
    {
        Value::Object o;
        o.emplace_back("good", Value::make_int(7));
        o.emplace_back("bad", Value::make_string(std::string("\xff", 1)));
        blobfig::WriteOptions wo;
        wo.validate_utf8 = false;
        auto bytes = blobfig::to_bytes(Value::make_object(std::move(o)), wo);

        auto root = blobfig::parse(bytes);
        CHECK((throws_kind<DecodeError>([&] { (void)root.get("bad")->as_string(); },
                                        DecodeErrorKind::InvalidUtf8)));
        CHECK(root.get("good")->as_int() == 7);
        CHECK((throws_kind<DecodeError>([&] { (void)blobfig::parse(bytes, blobfig::ParseOptions{true}); },
                                        DecodeErrorKind::InvalidUtf8)));
    }

    std::cout << "All tests passed.\n";
    return 0;
}
