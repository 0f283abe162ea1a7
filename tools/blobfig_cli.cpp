#include "blobfig/blobfig.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <cstring>
#include <iomanip>
#include <locale>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>
#include <set>

#include <zlib.h>

// FTXUI TUI
#include <ftxui/component/component.hpp>
#include <ftxui/component/event.hpp>
#include <ftxui/component/component_base.hpp>
#include <ftxui/component/screen_interactive.hpp>
#include <ftxui/dom/elements.hpp>

#if !defined(_WIN32)
#include <unistd.h>
#endif


namespace {

struct Ansi {
    bool enabled{true};

    std::string reset() const { return enabled ? "\x1b[0m" : ""; }
    std::string dim() const { return enabled ? "\x1b[2m" : ""; }
    std::string bold() const { return enabled ? "\x1b[1m" : ""; }
    std::string red() const { return enabled ? "\x1b[31m" : ""; }
    std::string green() const { return enabled ? "\x1b[32m" : ""; }
    std::string yellow() const { return enabled ? "\x1b[33m" : ""; }
    std::string magenta() const { return enabled ? "\x1b[35m" : ""; }
    std::string cyan() const { return enabled ? "\x1b[36m" : ""; }
    std::string gray() const { return enabled ? "\x1b[90m" : ""; }
};

static bool is_tty() {
#if defined(_WIN32)
    return false;
#else
    return ::isatty(fileno(stdout));
#endif
}

static std::string fmt_shape(const blobfig::ArrayView& a) {
    std::ostringstream oss;
    oss << '[';
    for (std::size_t i = 0; i < a.ndim(); ++i) {
        if (i) oss << " x ";
        oss << a.dim(i);
    }
    oss << ']';
    return oss.str();
}

static std::string hex8(std::uint32_t v) {
    std::ostringstream oss;
    oss << std::uppercase << std::hex << std::setw(8) << std::setfill('0') << v;
    return oss.str();
}

static std::uint32_t crc32_bytes(blobfig::Bytes data) {
    uLong crc = ::crc32(0L, Z_NULL, 0);
    // crc32() takes a uInt length
    std::size_t off = 0;
    while (off < data.size()) {
        std::size_t chunk = std::min<std::size_t>(data.size() - off, std::size_t{1} << 30);
        crc = ::crc32(crc, reinterpret_cast<const Bytef*>(data.data() + off), static_cast<uInt>(chunk));
        off += chunk;
    }
    return static_cast<std::uint32_t>(crc);
}

static std::string child_path(const std::string& parent, std::string_view key) {
    if (parent.empty()) return std::string(key);
    return parent + "/" + std::string(key);
}

// Quoted, with control bytes escaped and long strings cut.
static std::string quote(std::string_view s, std::size_t max_len) {
    std::ostringstream oss;
    oss << '"';
    std::size_t n = std::min(s.size(), max_len);
    for (std::size_t i = 0; i < n; ++i) {
        unsigned char c = static_cast<unsigned char>(s[i]);
        if (c == '"') oss << "\\\"";
        else if (c == '\\') oss << "\\\\";
        else if (c == '\n') oss << "\\n";
        else if (c == '\t') oss << "\\t";
        else if (c < 0x20) oss << "\\x" << std::hex << std::setw(2) << std::setfill('0') << (int)c << std::dec;
        else oss << s[i];
    }
    oss << '"';
    if (s.size() > max_len) oss << "...";
    return oss.str();
}

static void usage() {
    std::cerr <<
        "blobfig - blobfig container inspector\n"
        "\n"
        "Usage:\n"
        "  blobfig header <FILE> [--validate] [--no-color]\n"
        "  blobfig tree   <FILE> [--prefix <P>] [--max-depth N] [--details] [--validate] [--no-color]\n"
        "  blobfig dump   <FILE> [<PATH>] [--max-elems N] [--rows N] [--cols N] [--validate] [--no-color]\n"
        "  blobfig show   <FILE> [<PATH>] [--max-elems N] [--rows N] [--cols N] [--validate] [--no-color]\n";
}

struct Args {
    std::string cmd;
    std::string file;
    std::string path;
    bool validate{false};
    bool details{false};
    bool no_color{false};
    std::string prefix;
    std::size_t max_depth{static_cast<std::size_t>(-1)};
    std::size_t max_elems{20};
    std::size_t rows{6};
    std::size_t cols{6};
};

static bool parse_args(int argc, char** argv, Args& a) {
    if (argc < 3) return false;
    a.cmd = argv[1];
    a.file = argv[2];

    int i = 3;
    // positional path for dump/show
    if ((a.cmd == "show" || a.cmd == "dump") && i < argc && std::string(argv[i]).rfind("--", 0) != 0) {
        a.path = argv[i++];
    }

    while (i < argc) {
        std::string opt = argv[i++];
        try {
            if (opt == "--validate") a.validate = true;
            else if (opt == "--details") a.details = true;
            else if (opt == "--no-color") a.no_color = true;
            else if (opt == "--prefix" && i < argc) a.prefix = argv[i++];
            else if (opt == "--max-depth" && i < argc) a.max_depth = static_cast<std::size_t>(std::stoull(argv[i++]));
            else if (opt == "--max-elems" && i < argc) a.max_elems = static_cast<std::size_t>(std::stoull(argv[i++]));
            else if (opt == "--rows" && i < argc) a.rows = static_cast<std::size_t>(std::stoull(argv[i++]));
            else if (opt == "--cols" && i < argc) a.cols = static_cast<std::size_t>(std::stoull(argv[i++]));
            else {
                std::cerr << "Unknown option: " << opt << "\n";
                return false;
            }
        } catch (const std::exception&) {
            std::cerr << "Invalid number for " << opt << ": " << argv[i - 1] << "\n";
            return false;
        }
    }

    if (a.cmd != "header" && a.cmd != "tree" && a.cmd != "dump" && a.cmd != "show") {
        std::cerr << "Unknown command: " << a.cmd << "\n";
        return false;
    }
    return true;
}

// ----------------- Value summaries -----------------

// One-line description used by tree and the TUI list.
static std::string summarize(const blobfig::ValueView& v) {
    using blobfig::ValueTag;
    switch (v.tag()) {
        case ValueTag::Null: return "null";
        case ValueTag::Bool: return v.as_bool() ? "true" : "false";
        case ValueTag::Int: return std::to_string(v.as_int());
        case ValueTag::Float: {
            std::ostringstream oss;
            oss.imbue(std::locale::classic());
            oss << v.as_float();
            return oss.str();
        }
        case ValueTag::String: return quote(v.as_string(), 40);
        case ValueTag::Array: {
            auto a = v.as_array();
            return blobfig::to_string(a.dtype()) + " " + fmt_shape(a);
        }
        case ValueTag::File: {
            auto f = v.as_file();
            return std::string(f.mime()) + " " + std::to_string(f.data().size()) + " B";
        }
        case ValueTag::Object: return "{" + std::to_string(v.as_object().size()) + "}";
    }
    return "?";
}

// Offset, extent and payload CRC for --details and the TUI status pane.
static std::vector<std::pair<std::string, std::string>> describe(const blobfig::ValueView& v) {
    using blobfig::ValueTag;
    std::vector<std::pair<std::string, std::string>> kv;
    blobfig::ValueTag t = v.tag();
    kv.emplace_back("kind", blobfig::to_string(t));
    kv.emplace_back("off", std::to_string(v.offset()));
    kv.emplace_back("size", std::to_string(v.extent()));

    if (t == ValueTag::Array) {
        auto a = v.as_array();
        kv.emplace_back("dtype", blobfig::to_string(a.dtype()));
        kv.emplace_back("shape", fmt_shape(a));
        kv.emplace_back("data_off", std::to_string(a.offset()));
        kv.emplace_back("bytes", std::to_string(a.data().size()));
        kv.emplace_back("crc32", hex8(crc32_bytes(a.data())));
    } else if (t == ValueTag::File) {
        auto f = v.as_file();
        kv.emplace_back("mime", std::string(f.mime()));
        kv.emplace_back("data_off", std::to_string(f.offset()));
        kv.emplace_back("bytes", std::to_string(f.data().size()));
        kv.emplace_back("crc32", hex8(crc32_bytes(f.data())));
    } else if (t == ValueTag::Object) {
        kv.emplace_back("entries", std::to_string(v.as_object().size()));
    }
    return kv;
}

// ----------------- Tree printer -----------------

static void print_tree(
    const blobfig::ObjectView& obj,
    const Ansi& ansi,
    std::size_t indent,
    std::size_t depth,
    std::size_t max_depth,
    bool details
) {
    if (depth > max_depth) return;
    for (const auto& e : obj) {
        std::string pad(indent, ' ');
        std::string name(e.key);

        try {
            bool is_dir = e.value.tag() == blobfig::ValueTag::Object;
            if (is_dir) {
                std::cout << pad << ansi.magenta() << name << "/" << ansi.reset();
            } else {
                std::cout << pad
                          << ansi.cyan() << name << ansi.reset()
                          << " " << ansi.gray() << summarize(e.value) << ansi.reset()
                          << " " << ansi.yellow() << blobfig::to_string(e.value.tag()) << ansi.reset();
            }

            if (details) {
                std::cout << " " << ansi.dim();
                for (const auto& kv : describe(e.value)) {
                    if (kv.first == "kind") continue;
                    std::cout << kv.first << "=" << kv.second << " ";
                }
                std::cout << ansi.reset();
            }
            std::cout << "\n";

            if (is_dir) {
                print_tree(e.value.as_object(), ansi, indent + 2, depth + 1, max_depth, details);
            }
        } catch (const blobfig::DecodeError& err) {
            std::cout << "\n" << pad << ansi.red() << name << ": " << err.what() << ansi.reset() << "\n";
        }
    }
}

// ----------------- Value preview -----------------

template <typename T>
static std::string elem_to_string(const std::uint8_t* p) {
    T v;
    std::memcpy(&v, p, sizeof(T));
    std::ostringstream oss;
    oss.imbue(std::locale::classic());
    if constexpr (sizeof(T) == 1) {
        oss << static_cast<int>(v);
    } else {
        oss << v;
    }
    return oss.str();
}

static std::string decode_elem(const blobfig::ArrayView& a, std::uint64_t idx) {
    std::size_t elem = blobfig::element_size(a.dtype());
    std::uint64_t off = idx * elem;
    if (off + elem > a.data().size()) return "?";
    const std::uint8_t* p = a.data().data() + off;

    switch (a.dtype()) {
        case blobfig::DType::U8: return elem_to_string<std::uint8_t>(p);
        case blobfig::DType::I8: return elem_to_string<std::int8_t>(p);
        case blobfig::DType::U16: return elem_to_string<std::uint16_t>(p);
        case blobfig::DType::I16: return elem_to_string<std::int16_t>(p);
        case blobfig::DType::U32: return elem_to_string<std::uint32_t>(p);
        case blobfig::DType::I32: return elem_to_string<std::int32_t>(p);
        case blobfig::DType::U64: return elem_to_string<std::uint64_t>(p);
        case blobfig::DType::I64: return elem_to_string<std::int64_t>(p);
        case blobfig::DType::F32: return elem_to_string<float>(p);
        case blobfig::DType::F64: return elem_to_string<double>(p);
    }
    return "?";
}

static void print_array_preview(const blobfig::ArrayView& a, std::size_t max_elems, std::size_t rows, std::size_t cols) {
    std::cout << "array:\n";
    std::cout << "  dtype=" << blobfig::to_string(a.dtype()) << "\n";
    std::cout << "  shape=" << fmt_shape(a) << "\n";
    std::cout << "  numel=" << a.num_elements() << "\n";
    std::cout << "  bytes=" << a.data().size() << "\n";
    std::cout << "  data_off=" << a.offset() << "\n";

    if (a.ndim() == 2) {
        std::uint64_t r_total = a.dim(0);
        std::uint64_t c_total = a.dim(1);
        std::uint64_t r_show = std::min<std::uint64_t>(rows, r_total);
        std::uint64_t c_show = std::min<std::uint64_t>(cols, c_total);

        std::cout << "preview:\n";
        std::cout << "  top-left " << r_show << "x" << c_show << ":\n";
        for (std::uint64_t r = 0; r < r_show; ++r) {
            std::cout << "  ";
            for (std::uint64_t c = 0; c < c_show; ++c) {
                std::uint64_t idx = r * c_total + c; // row-major
                std::cout << decode_elem(a, idx);
                if (c + 1 < c_show) std::cout << "  ";
            }
            std::cout << "\n";
        }
    } else {
        std::uint64_t show = std::min<std::uint64_t>(max_elems, a.num_elements());
        std::cout << "preview:\n";
        std::cout << "  first " << show << ":\n";
        std::cout << "  ";
        for (std::uint64_t i = 0; i < show; ++i) {
            std::cout << decode_elem(a, i) << " ";
        }
        std::cout << "\n";
    }
}

static void print_value_preview(const blobfig::ValueView& v, std::size_t max_elems, std::size_t rows, std::size_t cols) {
    using blobfig::ValueTag;
    switch (v.tag()) {
        case ValueTag::Object: {
            auto obj = v.as_object();
            std::cout << "object:\n";
            std::cout << "  entries=" << obj.size() << "\n";
            std::cout << "preview:\n";
            for (const auto& e : obj) {
                std::cout << "  " << e.key << "\n";
            }
            return;
        }
        case ValueTag::Array:
            print_array_preview(v.as_array(), max_elems, rows, cols);
            return;
        case ValueTag::String: {
            auto s = v.as_string();
            std::cout << "string:\n";
            std::cout << "  bytes=" << s.size() << "\n";
            std::cout << "preview:\n";
            std::cout << "  " << quote(s, 4096) << "\n";
            return;
        }
        case ValueTag::File: {
            auto f = v.as_file();
            std::cout << "file:\n";
            std::cout << "  mime=" << f.mime() << "\n";
            std::cout << "  bytes=" << f.data().size() << "\n";
            std::cout << "  crc32=" << hex8(crc32_bytes(f.data())) << "\n";
            std::size_t show = std::min(max_elems, f.data().size());
            std::cout << "preview:\n";
            std::cout << "  first " << show << " bytes:\n";
            std::cout << "  ";
            for (std::size_t i = 0; i < show; ++i) {
                std::cout << std::hex << std::setw(2) << std::setfill('0') << (int)f.data()[i] << std::dec << " ";
            }
            std::cout << "\n";
            if (f.mime().rfind("text/", 0) == 0) {
                std::string_view text(reinterpret_cast<const char*>(f.data().data()), f.data().size());
                std::cout << "  " << quote(text, 4096) << "\n";
            }
            return;
        }
        case ValueTag::Null:
        case ValueTag::Bool:
        case ValueTag::Int:
        case ValueTag::Float:
            std::cout << blobfig::to_string(v.tag()) << ": " << summarize(v) << "\n";
            return;
    }
    std::cout << "<unhandled>\n";
}

static std::string preview_to_string(const blobfig::ValueView& v, std::size_t max_elems, std::size_t rows, std::size_t cols) {
    std::ostringstream oss;
    std::streambuf* old = std::cout.rdbuf(oss.rdbuf());
    try {
        print_value_preview(v, max_elems, rows, cols);
    } catch (...) {
        std::cout.rdbuf(old);
        throw;
    }
    std::cout.rdbuf(old);
    return oss.str();
}

// ----------------- Interactive UI tree (FTXUI) -----------------

struct UiRow {
    std::string name;
    std::string full_path; // '/'-separated, relative to the file root
    blobfig::ValueView view;
    int depth{0};
    bool is_dir{false};
};

// Objects are only decoded when their path is in `expanded`.
static void flatten_rows(const blobfig::ObjectView& obj,
                         const std::string& parent,
                         const std::set<std::string>& expanded,
                         int depth,
                         std::vector<UiRow>& out) {
    for (const auto& e : obj) {
        std::string path = child_path(parent, e.key);
        bool is_dir = e.value.tag() == blobfig::ValueTag::Object;
        out.push_back(UiRow{std::string(e.key), path, e.value, depth, is_dir});

        if (is_dir && expanded.find(path) != expanded.end()) {
            flatten_rows(e.value.as_object(), path, expanded, depth + 1, out);
        }
    }
}

// Preview text with its "section:" lines highlighted.
static ftxui::Element render_preview(const std::string& preview) {
    using namespace ftxui;

    std::vector<Element> els;
    std::istringstream in(preview);
    std::string line;
    while (std::getline(in, line)) {
        bool section = !line.empty() && line.back() == ':' && line.rfind("  ", 0) != 0;
        els.push_back(section ? text(line) | bold | color(Color::Magenta) : text(line));
    }
    if (els.empty()) return text("(no preview)") | dim;
    return vbox(std::move(els));
}

static int run_show(const Args& a, const blobfig::ValueView& root, const Ansi& ansi) {
    std::string start_path;
    blobfig::ValueView start = root;
    if (!a.path.empty()) {
        auto found = root.get(a.path);
        if (!found) {
            std::cerr << ansi.red() << "Error" << ansi.reset() << ": path not found: " << a.path << "\n";
            return 2;
        }
        start = *found;
        auto parts = blobfig::split_path(a.path);
        start_path = blobfig::join_path(*parts, parts->size());
    }
    if (start.tag() != blobfig::ValueTag::Object) {
        std::cerr << ansi.red() << "Error" << ansi.reset() << ": not an object: "
                  << (start_path.empty() ? "<root>" : start_path) << " (use dump)\n";
        return 2;
    }
    const blobfig::ObjectView start_obj = start.as_object();

    using namespace ftxui;

    std::set<std::string> expanded;
    std::vector<UiRow> rows;
    std::string walk_error;
    int selected = 0;

    std::string selected_path;
    std::vector<std::pair<std::string, std::string>> status_kv;
    std::string preview;

    auto rebuild = [&] {
        rows.clear();
        walk_error.clear();
        try {
            flatten_rows(start_obj, start_path, expanded, 0, rows);
        } catch (const blobfig::DecodeError& e) {
            walk_error = e.what();
        }
        selected = std::clamp(selected, 0, std::max(0, (int)rows.size() - 1));
    };

    auto load_selected = [&] {
        if (rows.empty()) return;
        const UiRow& r = rows[(std::size_t)selected];
        selected_path = r.full_path;
        try {
            status_kv = describe(r.view);
            preview = preview_to_string(r.view, a.max_elems, a.rows, a.cols);
        } catch (const blobfig::DecodeError& e) {
            status_kv = {{"error", e.what()}};
            preview.clear();
        }
    };

    rebuild();
    load_selected();

    auto left_pane = Renderer([&] {
        std::vector<Element> items;
        for (std::size_t i = 0; i < rows.size(); ++i) {
            const UiRow& r = rows[i];
            std::string glyph = !r.is_dir ? "  " : expanded.count(r.full_path) ? "- " : "+ ";
            std::string meta;
            try {
                meta = summarize(r.view);
            } catch (const blobfig::DecodeError&) {
                meta = "<invalid>";
            }
            Element line = hbox({
                text(std::string((std::size_t)r.depth * 2, ' ') + glyph + r.name) |
                    color(r.is_dir ? Color::Magenta : Color::Cyan) | flex,
                text(meta) | color(Color::Yellow),
            });
            if ((int)i == selected) line = line | inverted | focus;
            items.push_back(line);
        }
        if (!walk_error.empty()) items.push_back(text(walk_error) | color(Color::Red));

        return vbox({
                   text(a.file) | bold,
                   separator(),
                   vbox(std::move(items)) | vscroll_indicator | frame | flex,
               }) |
               border;
    });

    auto right_pane = Renderer([&] {
        std::vector<Element> meta_lines;
        for (const auto& kv : status_kv) {
            meta_lines.push_back(hbox({
                text(kv.first) | bold | color(Color::Yellow),
                text(": " + kv.second),
            }));
        }
        return vbox({
                   text(selected_path.empty() ? "<root>" : selected_path) | bold | color(Color::Green),
                   separator(),
                   vbox(std::move(meta_lines)),
                   separator(),
                   render_preview(preview) | vscroll_indicator | frame | flex,
               }) |
               flex | border;
    });

    auto layout = Renderer([&] {
        return hbox({
            left_pane->Render() | size(WIDTH, EQUAL, 60),
            right_pane->Render() | flex,
        });
    });

    auto screen = ScreenInteractive::Fullscreen();

    // Up/down select, right/left expand and collapse, q quits.
    auto app = CatchEvent(layout, [&](Event e) {
        if (e == Event::Character('q') || e == Event::Escape) {
            screen.Exit();
            return true;
        }
        if (rows.empty()) return false;

        int last = (int)rows.size() - 1;
        if (e == Event::ArrowUp || e == Event::ArrowDown) {
            selected = std::clamp(selected + (e == Event::ArrowUp ? -1 : 1), 0, last);
            load_selected();
            return true;
        }
        const UiRow& r = rows[(std::size_t)selected];
        if ((e == Event::ArrowRight || e == Event::ArrowLeft) && r.is_dir) {
            if (e == Event::ArrowRight) expanded.insert(r.full_path);
            else expanded.erase(r.full_path);
            rebuild();
            return true;
        }
        return false;
    });

    screen.Loop(app);
    return 0;
}

} // namespace

int main(int argc, char** argv) {
    Args a;
    if (!parse_args(argc, argv, a)) {
        usage();
        return 2;
    }

    Ansi ansi;
    ansi.enabled = !a.no_color && is_tty();

    try {
        // Views borrow from this buffer for the rest of main.
        std::vector<std::uint8_t> buf = blobfig::load_bytes(a.file);

        if (a.cmd == "header") {
            blobfig::Header hdr = blobfig::read_header(buf);
            blobfig::ValueView root = blobfig::parse(buf, blobfig::ParseOptions{a.validate});

            std::cout << ansi.bold() << "File" << ansi.reset() << ": " << a.file << "\n";
            std::cout << ansi.bold() << "Magic" << ansi.reset() << ": " << hdr.magic << "\n";
            std::cout << ansi.bold() << "Version" << ansi.reset() << ": " << hdr.version << "\n";
            std::cout << ansi.bold() << "Root offset" << ansi.reset() << ": " << hdr.root_offset << "\n";
            std::cout << ansi.bold() << "File size" << ansi.reset() << ": " << hdr.buffer_size << "\n";
            std::cout << ansi.bold() << "Root kind" << ansi.reset() << ": " << blobfig::to_string(root.tag()) << "\n";
            if (a.validate) {
                std::cout << ansi.bold() << "Validated" << ansi.reset() << ": " << ansi.green() << "ok" << ansi.reset() << "\n";
            } else {
                std::cout << ansi.dim() << "(use --validate to check the whole tree)\n" << ansi.reset();
            }
            return 0;
        }

        blobfig::ValueView root = blobfig::parse(buf, blobfig::ParseOptions{a.validate});

        if (a.cmd == "tree") {
            blobfig::ValueView node = root;
            if (!a.prefix.empty()) {
                auto found = root.get(a.prefix);
                if (!found) {
                    std::cerr << "prefix not found: " << a.prefix << "\n";
                    return 2;
                }
                node = *found;
                std::cout << ansi.dim() << "prefix: " << a.prefix << ansi.reset() << "\n";
            }

            std::cout << ansi.bold() << "blobfig tree" << ansi.reset() << ": " << a.file << "\n";
            if (node.tag() == blobfig::ValueTag::Object) {
                print_tree(node.as_object(), ansi, 0, 0, a.max_depth, a.details);
            } else {
                std::cout << ansi.gray() << summarize(node) << ansi.reset()
                          << " " << ansi.yellow() << blobfig::to_string(node.tag()) << ansi.reset() << "\n";
            }
            return 0;
        }

        if (a.cmd == "dump") {
            blobfig::ValueView v = root.at(a.path);
            print_value_preview(v, a.max_elems, a.rows, a.cols);
            return 0;
        }

        if (a.cmd == "show") {
            return run_show(a, root, ansi);
        }

    } catch (const blobfig::Error& e) {
        std::cerr << ansi.red() << "Error" << ansi.reset() << ": " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << ansi.red() << "Error" << ansi.reset() << ": " << e.what() << "\n";
        return 1;
    }

    usage();
    return 2;
}
