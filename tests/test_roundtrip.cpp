#include "test_util.hpp"

#include <cmath>
#include <filesystem>
#include <iostream>
#include <limits>

using blobfig::Array;
using blobfig::DType;
using blobfig::File;
using blobfig::Value;

static Value make_sample_root() {
    Value::Object root;

    root.emplace_back("name", Value::make_string("resnet-small"));
    root.emplace_back("version", Value::make_int(3));
    root.emplace_back("enabled", Value::make_bool(true));
    root.emplace_back("disabled", Value::make_bool(false));
    root.emplace_back("nothing", Value::make_null());
    root.emplace_back("lr", Value::make_float(0.001));
    root.emplace_back("neg_inf", Value::make_float(-std::numeric_limits<double>::infinity()));
    root.emplace_back("min", Value::make_int(std::numeric_limits<std::int64_t>::min()));
    root.emplace_back("max", Value::make_int(std::numeric_limits<std::int64_t>::max()));
    root.emplace_back("unicode", Value::make_string("caff\xc3\xa8 \xe2\x82\xac"));
    root.emplace_back("empty_string", Value::make_string(""));

    // 2x3 row-major f64: [[1 2 3]; [4 5 6]]
    root.emplace_back("weights", Value::make_array(Array(DType::F64, {2, 3}, le_bytes<double>({1, 2, 3, 4, 5, 6}))));
    // 0-d array holds exactly one element
    root.emplace_back("scalar", Value::make_array(Array(DType::I16, {}, le_bytes<std::int16_t>({-7}))));
    root.emplace_back("empty", Value::make_array(Array(DType::U32, {0, 4}, {})));
    root.emplace_back("bytes", Value::make_array(Array(DType::U8, {5}, {1, 2, 3, 4, 5})));

    root.emplace_back("readme", Value::make_file(File("text/markdown", {'#', ' ', 'h', 'i', '\n'})));
    root.emplace_back("blank", Value::make_file(File("application/octet-stream", {})));

    Value::Object nested;
    nested.emplace_back("depth", Value::make_int(2));
    Value::Object inner;
    inner.emplace_back("mean", Value::make_array(Array(DType::F32, {3}, le_bytes<float>({1.0f, 2.0f, 3.0f}))));
    inner.emplace_back("ok", Value::make_bool(true));
    nested.emplace_back("inner", Value::make_object(std::move(inner)));
    nested.emplace_back("none", Value::make_object());
    root.emplace_back("nested", Value::make_object(std::move(nested)));

    return Value::make_object(std::move(root));
}

int main() {
    Value root = make_sample_root();

    // Whole-tree round trip through the owned model
    {
        auto bytes = blobfig::to_bytes(root);
        CHECK(bytes.size() == blobfig::encoded_size(root));

        auto view = blobfig::parse(bytes);
        CHECK(view.tag() == blobfig::ValueTag::Object);
        CHECK(view.to_value() == root);

        auto validated = blobfig::parse(bytes, blobfig::ParseOptions{true});
        CHECK(validated.to_value() == root);
    }

    // Per-variant reads against the source tree
    {
        auto bytes = blobfig::to_bytes(root);
        auto view = blobfig::parse(bytes);
        auto obj = view.as_object();
        const auto& src = root.as_object();
        CHECK(obj.size() == src.size());

        std::size_t i = 0;
        for (const auto& e : obj) {
            CHECK(e.key == src[i].first);
            CHECK(e.value.tag() == src[i].second.tag());
            ++i;
        }
        CHECK(i == src.size());

        CHECK(obj.get("name")->as_string() == "resnet-small");
        CHECK(obj.get("version")->as_int() == 3);
        CHECK(obj.get("enabled")->as_bool());
        CHECK(!obj.get("disabled")->as_bool());
        CHECK(obj.get("nothing")->is_null());
        CHECK(obj.get("lr")->as_float() == 0.001);
        CHECK(std::isinf(obj.get("neg_inf")->as_float()));
        CHECK(obj.get("min")->as_int() == std::numeric_limits<std::int64_t>::min());
        CHECK(obj.get("max")->as_int() == std::numeric_limits<std::int64_t>::max());
        CHECK(obj.get("unicode")->as_string() == "caff\xc3\xa8 \xe2\x82\xac");
        CHECK(obj.get("empty_string")->as_string().empty());

        auto w = obj.get("weights")->as_array();
        CHECK(w.dtype() == DType::F64);
        CHECK(w.shape() == (std::vector<std::uint64_t>{2, 3}));
        CHECK(w.num_elements() == 6);
        CHECK(w.to_array() == root.get("weights")->as_array());

        auto s = obj.get("scalar")->as_array();
        CHECK(s.ndim() == 0);
        CHECK(s.num_elements() == 1);
        CHECK(s.data().size() == 2);

        auto e = obj.get("empty")->as_array();
        CHECK(e.num_elements() == 0);
        CHECK(e.data().empty());
        CHECK(e.dim(1) == 4);

        auto f = obj.get("readme")->as_file();
        CHECK(f.mime() == "text/markdown");
        CHECK(f.data().size() == 5);
        CHECK(f.to_file() == root.get("readme")->as_file());

        auto b = obj.get("blank")->as_file();
        CHECK(b.data().empty());

        CHECK(obj.get("nested")->as_object().get("none")->as_object().empty());
    }

    // Non-object roots
    {
        Value leaf = Value::make_string("just a string");
        auto bytes = blobfig::to_bytes(leaf);
        CHECK(blobfig::parse(bytes).as_string() == "just a string");

        Value null_root = Value::make_null();
        auto nb = blobfig::to_bytes(null_root);
        CHECK(nb.size() == blobfig::HEADER_SIZE + 1);
        CHECK(blobfig::parse(nb).is_null());
    }

    // Header fields
    {
        auto bytes = blobfig::to_bytes(root);
        auto h = blobfig::read_header(bytes);
        CHECK(h.magic == "BLBF");
        CHECK(h.version == blobfig::VERSION);
        CHECK(h.root_offset == blobfig::HEADER_SIZE);
        CHECK(h.buffer_size == bytes.size());
    }

    // Owned accessors
    {
        CHECK(root.get("nested/inner/ok")->as_bool());
        CHECK(root.get("nested/missing") == nullptr);
        CHECK(root.find("version")->as_int() == 3);
        CHECK((throws_kind<blobfig::AccessError>(
            [&] { (void)root.get("name")->as_int(); }, blobfig::AccessErrorKind::TypeMismatch)));
    }

    // File helpers
    {
        std::filesystem::path tmp = std::filesystem::temp_directory_path() / "blobfig_roundtrip_test.blbf";
        std::filesystem::remove(tmp);

        blobfig::write_file(tmp, root);
        auto loaded = blobfig::load_bytes(tmp);
        CHECK(loaded == blobfig::to_bytes(root));
        CHECK(blobfig::parse(loaded).to_value() == root);

        // A failed encode must leave the previous file alone.
        Value::Object dup;
        dup.emplace_back("x", Value::make_null());
        dup.emplace_back("x", Value::make_null());
        bool threw = false;
        try {
            blobfig::write_file(tmp, Value::make_object(std::move(dup)));
        } catch (const blobfig::EncodeError&) {
            threw = true;
        }
        CHECK(threw);
        CHECK(blobfig::load_bytes(tmp) == loaded);

        std::filesystem::remove(tmp);

        bool io_threw = false;
        try {
            (void)blobfig::load_bytes(tmp);
        } catch (const blobfig::IoError&) {
            io_threw = true;
        }
        CHECK(io_threw);
    }

    std::cout << "All tests passed.\n";
    return 0;
}
