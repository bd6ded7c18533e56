
#include "mincbor/cbor.hpp"
#include "cli_args.hpp"

#include <algorithm>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <iterator>
#include <set>
#include <sstream>
#include <string>
#include <vector>

#include <zlib.h>

// FTXUI TUI
#include <ftxui/component/component.hpp>
#include <ftxui/component/event.hpp>
#include <ftxui/component/component_base.hpp>
#include <ftxui/component/screen_interactive.hpp>
#include <ftxui/dom/elements.hpp>
#include <ftxui/screen/terminal.hpp>

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

static bool is_tty(FILE* f) {
#if defined(_WIN32)
    (void)f;
    return false;
#else
    return ::isatty(fileno(f));
#endif
}

static std::string hex8(std::uint32_t v) {
    std::ostringstream oss;
    oss << std::uppercase << std::hex << std::setw(8) << std::setfill('0') << v;
    return oss.str();
}

static std::string hex_bytes(const std::vector<std::uint8_t>& b, std::size_t max_bytes) {
    std::ostringstream oss;
    const std::size_t n = std::min(b.size(), max_bytes);
    for (std::size_t i = 0; i < n; ++i) {
        if (i) oss << ' ';
        oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<unsigned>(b[i]);
    }
    if (n < b.size()) oss << " .. (+" << std::dec << (b.size() - n) << ")";
    return oss.str();
}

static std::uint32_t crc32_of(const std::vector<std::uint8_t>& b) {
    uLong crc = ::crc32(0L, Z_NULL, 0);
    crc = ::crc32(crc, reinterpret_cast<const Bytef*>(b.data()), static_cast<uInt>(b.size()));
    return static_cast<std::uint32_t>(crc);
}

static void usage() {
    std::cerr << mincbor::cli::usage_text();
}

using mincbor::cli::Args;

static std::string read_input(const std::string& input) {
    if (input == "-") {
        return std::string(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
    }
    std::ifstream is(input, std::ios::binary);
    if (!is) throw mincbor::CborError(mincbor::ErrorKind::Io, "failed to open for read: " + input);
    std::string s((std::istreambuf_iterator<char>(is)), std::istreambuf_iterator<char>());
    if (is.bad()) throw mincbor::CborError(mincbor::ErrorKind::Io, "failed reading: " + input);
    return s;
}

// ----------------- Wire header description -----------------

// Describe the leading header byte of an encoded item: major type and width.
static std::string describe_header(const std::vector<std::uint8_t>& enc) {
    if (enc.empty()) return "";
    const auto major = static_cast<mincbor::Major>(enc[0] >> 5);
    const std::uint8_t info = enc[0] & 0x1Fu;

    std::string out = mincbor::to_string(major);
    if (major == mincbor::Major::Simple) {
        switch (info) {
            case mincbor::minor::kFalse: return out + " false";
            case mincbor::minor::kTrue: return out + " true";
            case mincbor::minor::kNull: return out + " null";
            case mincbor::minor::kFloat16: return "float16";
            case mincbor::minor::kFloat32: return "float32";
            case mincbor::minor::kFloat64: return "float64";
            default: return out + " " + std::to_string(info);
        }
    }
    if (info <= mincbor::minor::kMaxInline) return out + " inline";
    switch (info) {
        case mincbor::minor::kUInt8: return out + " +1";
        case mincbor::minor::kUInt16: return out + " +2";
        case mincbor::minor::kUInt32: return out + " +4";
        case mincbor::minor::kUInt64: return out + " +8";
        default: return out + " ?";
    }
}

static std::string short_preview(const mincbor::Value& v) {
    const auto& x = v.v;
    if (std::holds_alternative<mincbor::Nil>(x)) return "null";
    if (const auto* b = std::get_if<bool>(&x)) return *b ? "true" : "false";
    if (const auto* i = std::get_if<std::int64_t>(&x)) return std::to_string(*i);
    if (const auto* u = std::get_if<std::uint64_t>(&x)) return std::to_string(*u);
    if (const auto* d = std::get_if<double>(&x)) {
        std::ostringstream oss;
        oss << std::setprecision(17) << *d;
        return oss.str();
    }
    if (const auto* s = std::get_if<std::string>(&x)) {
        std::string t = *s;
        if (t.size() > 32) t = t.substr(0, 29) + "...";
        return "\"" + t + "\"";
    }
    if (const auto* b = std::get_if<mincbor::Value::Bytes>(&x)) return "h'" + std::to_string(b->size()) + " bytes'";
    if (const auto* a = std::get_if<mincbor::Value::Array>(&x)) return "[" + std::to_string(a->size()) + "]";
    if (const auto* m = std::get_if<mincbor::Value::Map>(&x)) return "{" + std::to_string(m->size()) + "}";
    if (const auto* r = std::get_if<mincbor::Record>(&x)) return r->type_name + "{..}";
    if (const auto* p = std::get_if<mincbor::Value::Pointer>(&x)) return *p ? "&" : "nil";
    return mincbor::kind_name(v);
}

// ----------------- Value tree -----------------

struct TreeNode {
    std::string label;
    std::string path;
    const mincbor::Value* value{nullptr};
    std::size_t depth{0}; // nesting depth in the whole document
    bool omitted{false}; // record field dropped by its tag
    std::vector<TreeNode> children;
};

static TreeNode build_tree(const mincbor::Value& v, std::string label, std::string path, std::size_t depth) {
    TreeNode n;
    n.label = std::move(label);
    n.path = std::move(path);
    n.value = &v;
    n.depth = depth;

    const auto& x = v.v;
    auto child_path = [&](const std::string& part) {
        return n.path.empty() ? part : n.path + "/" + part;
    };

    if (const auto* a = std::get_if<mincbor::Value::Array>(&x)) {
        for (std::size_t i = 0; i < a->size(); ++i) {
            const std::string part = "[" + std::to_string(i) + "]";
            n.children.push_back(build_tree((*a)[i], part, child_path(part), depth + 1));
        }
    } else if (const auto* m = std::get_if<mincbor::Value::Map>(&x)) {
        for (std::size_t i = 0; i < m->size(); ++i) {
            const std::string part = short_preview((*m)[i].first);
            n.children.push_back(build_tree((*m)[i].second, part, child_path("#" + std::to_string(i)), depth + 1));
        }
    } else if (const auto* r = std::get_if<mincbor::Record>(&x)) {
        for (std::size_t i = 0; i < r->fields.size(); ++i) {
            const auto& f = r->fields[i];
            const mincbor::FieldTag tag = mincbor::parse_field_tag(f.tag);
            const std::string key = tag.name.empty() ? f.name : tag.name;
            TreeNode c = build_tree(f.value, key, child_path(f.name), depth + 1);
            c.omitted = tag.skip || (tag.omit_empty && mincbor::is_empty_value(f.value));
            n.children.push_back(std::move(c));
        }
    } else if (const auto* p = std::get_if<mincbor::Value::Pointer>(&x)) {
        // pointer hops add no depth
        if (*p) n.children.push_back(build_tree(**p, "*", child_path("*"), depth));
    }
    return n;
}

// Encode one node at its document depth so max_depth matches the full encode.
static std::vector<std::uint8_t> encode_node(const TreeNode& node, const mincbor::EncodeOptions& opts) {
    mincbor::VectorSink sink;
    mincbor::Encoder(sink, opts).encode(*node.value, node.depth);
    return sink.take();
}

static void print_tree(const TreeNode& node,
                       const Ansi& ansi,
                       const mincbor::EncodeOptions& opts,
                       std::size_t max_bytes,
                       std::size_t indent) {
    const std::string pad(indent, ' ');
    std::cout << pad << ansi.cyan() << node.label << ansi.reset()
              << " " << ansi.gray() << mincbor::kind_name(*node.value) << ansi.reset();

    if (node.omitted) {
        std::cout << " " << ansi.dim() << "(omitted)" << ansi.reset() << "\n";
        return;
    }

    try {
        const auto enc = encode_node(node, opts);
        std::cout << " " << ansi.yellow() << describe_header(enc) << ansi.reset()
                  << " " << ansi.dim() << enc.size() << "B" << ansi.reset()
                  << "  " << ansi.green() << hex_bytes(enc, max_bytes) << ansi.reset() << "\n";
    } catch (const mincbor::CborError& e) {
        std::cout << " " << ansi.red() << mincbor::to_string(e.kind()) << ": " << e.what() << ansi.reset() << "\n";
    }

    for (const auto& c : node.children) {
        print_tree(c, ansi, opts, max_bytes, indent + 2);
    }
}

// ----------------- Interactive UI tree (FTXUI) -----------------

struct UiRow {
    const TreeNode* node{nullptr};
    int depth{0};
};

static void flatten_rows(const TreeNode& node,
                         const std::set<std::string>& expanded,
                         int depth,
                         std::vector<UiRow>& out) {
    out.push_back(UiRow{&node, depth});
    if (node.children.empty()) return;
    if (expanded.find(node.path) == expanded.end()) return;
    for (const auto& c : node.children) {
        flatten_rows(c, expanded, depth + 1, out);
    }
}

static const UiRow* safe_row_at(const std::vector<UiRow>& rows, int idx) {
    if (rows.empty()) return nullptr;
    if (idx < 0) return nullptr;
    if ((std::size_t)idx >= rows.size()) return nullptr;
    return &rows[(std::size_t)idx];
}

static std::vector<std::string> hex_lines(const std::vector<std::uint8_t>& b) {
    std::vector<std::string> out;
    for (std::size_t off = 0; off < b.size(); off += 16) {
        std::ostringstream oss;
        oss << std::hex << std::setw(6) << std::setfill('0') << off << "  ";
        for (std::size_t i = off; i < std::min(b.size(), off + 16); ++i) {
            oss << std::setw(2) << static_cast<unsigned>(b[i]) << ' ';
        }
        out.push_back(oss.str());
    }
    return out;
}

static int run_view(const Args& a, const TreeNode& root, const mincbor::EncodeOptions& opts) {
    using namespace ftxui;

    std::set<std::string> expanded;
    expanded.insert(root.path);

    int selected = 0;
    int left_scroll = 0;

    struct StatusKV {
        std::string k;
        std::string v;
    };
    std::vector<StatusKV> status_kv;
    std::vector<std::string> preview;
    std::string selected_path;

    auto rebuild = [&]() -> std::vector<UiRow> {
        std::vector<UiRow> out;
        flatten_rows(root, expanded, 0, out);
        if (selected < 0) selected = 0;
        if (selected >= (int)out.size()) selected = (int)out.size() - 1;
        return out;
    };

    auto rows = rebuild();

    auto load_preview_for_selected = [&]() {
        const UiRow* pr = safe_row_at(rows, selected);
        if (!pr || !pr->node) return;
        const TreeNode& n = *pr->node;
        selected_path = n.path;

        status_kv.clear();
        preview.clear();
        status_kv.push_back({"kind", mincbor::kind_name(*n.value)});
        status_kv.push_back({"value", short_preview(*n.value)});
        if (n.omitted) {
            status_kv.push_back({"note", "omitted by field tag"});
            return;
        }
        try {
            const auto enc = encode_node(n, opts);
            status_kv.push_back({"header", describe_header(enc)});
            status_kv.push_back({"size", std::to_string(enc.size()) + " bytes"});
            status_kv.push_back({"crc32", hex8(crc32_of(enc))});
            preview = hex_lines(enc);
        } catch (const mincbor::CborError& e) {
            status_kv.push_back({"error", e.what()});
        }
    };

    load_preview_for_selected();

    auto left_pane = Renderer([&] {
        rows = rebuild();

        auto dim = ftxui::Terminal::Size();
        int term_h = std::max(10, dim.dimy);
        int visible_rows = std::max(3, term_h - 6);

        int total = (int)rows.size();
        if (total <= 0) {
            left_scroll = 0;
        } else {
            left_scroll = std::max(0, std::min(left_scroll, std::max(0, total - visible_rows)));
            if (selected < left_scroll) left_scroll = selected;
            if (selected >= left_scroll + visible_rows) left_scroll = selected - visible_rows + 1;
        }

        int begin = left_scroll;
        int end = std::min(total, begin + visible_rows);

        std::vector<Element> items;
        constexpr int kLeftLineMax = 58;

        if (begin > 0) items.push_back(text("↑ more") | color(Color::GrayDark));

        for (int i = begin; i < end; ++i) {
            const UiRow& r = rows[(std::size_t)i];
            const TreeNode* n = r.node;

            std::string glyph = "• ";
            if (!n->children.empty()) glyph = (expanded.count(n->path) != 0) ? "▾ " : "▸ ";
            std::string indent((std::size_t)r.depth * 2, ' ');

            Element left_txt = text(indent + glyph + n->label) | color(n->omitted ? Color::GrayDark : Color::Cyan) | flex;
            Element right_txt = text(mincbor::kind_name(*n->value)) | color(Color::Yellow);
            Element line = hbox({left_txt, right_txt}) | size(WIDTH, LESS_THAN, kLeftLineMax);
            if (i == selected) line = line | inverted;
            items.push_back(line);
        }

        if (end < total) items.push_back(text("↓ more") | color(Color::GrayDark));

        auto header = hbox({
            text("CBOR") | bold | color(Color::White),
            text("  "),
            text(a.input) | color(Color::GrayDark),
            filler(),
            text("q") | bold | color(Color::Yellow),
            text(" quit  ") | color(Color::GrayDark),
            text("←→") | bold | color(Color::Yellow),
            text(" collapse/expand  ") | color(Color::GrayDark),
            text("↑↓") | bold | color(Color::Yellow),
            text(" move  ") | color(Color::GrayDark),
            text("Enter") | bold | color(Color::Yellow),
            text(" encode") | color(Color::GrayDark),
        });

        return vbox({header, separator(), vbox(std::move(items)) | flex}) | flex | border;
    });

    auto right_pane = Renderer([&] {
        std::vector<Element> meta_lines;
        for (const auto& kv : status_kv) {
            meta_lines.push_back(hbox({
                text(kv.k) | bold | color(Color::Yellow),
                text(": ") | color(Color::GrayDark),
                text(kv.v) | color(Color::GrayLight) | flex,
            }));
        }
        if (meta_lines.empty()) meta_lines.push_back(text("(no metadata)") | color(Color::GrayDark));

        std::vector<Element> hex_els;
        for (const auto& line : preview) hex_els.push_back(text(line) | color(Color::Green));
        if (hex_els.empty()) hex_els.push_back(text("(no bytes)") | color(Color::GrayDark));

        Element top = vbox({
            text(selected_path.empty() ? "<root>" : selected_path) | bold | color(Color::Green),
            separator(),
            vbox(std::move(meta_lines)) | flex,
        }) | size(HEIGHT, LESS_THAN, 10);

        Element body = vbox({
            text("bytes") | bold | color(Color::Magenta),
            separator(),
            vbox(std::move(hex_els)) | flex,
        }) | vscroll_indicator | frame | flex;

        return vbox({top, separator(), body}) | flex | border;
    });

    auto layout = Renderer([&] {
        auto dim = ftxui::Terminal::Size();
        int term_w = std::max(20, dim.dimx);
        int term_h = std::max(10, dim.dimy);
        return hbox({
                   left_pane->Render() | size(WIDTH, EQUAL, 60),
                   right_pane->Render() | flex,
               })
            | size(WIDTH, EQUAL, term_w)
            | size(HEIGHT, EQUAL, term_h);
    });

    auto screen = ScreenInteractive::TerminalOutput();
    screen.TrackMouse(true);

    auto app = CatchEvent(layout, [&](Event e) {
        rows = rebuild();

        if (e == Event::Character('q') || e == Event::Escape) {
            screen.Exit();
            return true;
        }
        const UiRow* pr = safe_row_at(rows, selected);
        if (!pr) return false;
        const TreeNode* n = pr->node;

        if (e == Event::ArrowUp) {
            if (selected > 0) selected--;
            return true;
        }
        if (e == Event::ArrowDown) {
            if (selected + 1 < (int)rows.size()) selected++;
            return true;
        }
        if (e == Event::PageUp) {
            selected = std::max(0, selected - 25);
            return true;
        }
        if (e == Event::PageDown) {
            selected = std::min((int)rows.size() - 1, selected + 25);
            return true;
        }
        if (e.is_mouse()) {
            auto m = e.mouse();
            if (m.button == Mouse::WheelUp) {
                selected = std::max(0, selected - 3);
                return true;
            }
            if (m.button == Mouse::WheelDown) {
                selected = std::min((int)rows.size() - 1, selected + 3);
                return true;
            }
        }
        if (e == Event::ArrowRight) {
            if (!n->children.empty()) expanded.insert(n->path);
            return true;
        }
        if (e == Event::ArrowLeft) {
            if (!n->children.empty()) expanded.erase(n->path);
            return true;
        }
        if (e == Event::Return) {
            load_preview_for_selected();
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
    if (!mincbor::cli::parse_args(argc, argv, a, std::cerr)) {
        usage();
        return 2;
    }

    Ansi ansi;
    ansi.enabled = !a.no_color && is_tty(stdout);
    Ansi err_ansi;
    err_ansi.enabled = !a.no_color && is_tty(stderr);

    mincbor::EncodeOptions opts;
    opts.sort_map_keys = a.sort_keys;
    opts.max_depth = a.max_depth;

    try {
        const mincbor::Value root = mincbor::value_from_json(read_input(a.input));

        if (a.cmd == "encode") {
            if (a.out.empty()) {
                mincbor::encode_to_stream(std::cout, root, opts);
                std::cout.flush();
                if (!std::cout) throw mincbor::CborError(mincbor::ErrorKind::Io, "failed writing to stdout");
                return 0;
            }

            const auto enc = mincbor::encode(root, opts);

            mincbor::WriteOptions wo;
            wo.compression = a.gzip ? mincbor::CompressionMode::Gzip : mincbor::CompressionMode::Never;
            wo.zlib_level = a.level;
            mincbor::write_encoded_file(a.out, enc, wo);

            std::cerr << err_ansi.bold() << "Wrote" << err_ansi.reset() << ": " << a.out
                      << " " << err_ansi.dim() << enc.size() << " bytes"
                      << (a.gzip ? " before gzip" : "")
                      << ", crc32 " << hex8(crc32_of(enc)) << err_ansi.reset() << "\n";
            return 0;
        }

        if (a.cmd == "hex") {
            const auto enc = mincbor::encode(root, opts);
            for (const auto& line : hex_lines(enc)) {
                std::cout << ansi.green() << line << ansi.reset() << "\n";
            }
            std::cout << ansi.dim() << enc.size() << " bytes" << ansi.reset() << "\n";
            return 0;
        }

        const TreeNode tree = build_tree(root, "<root>", "", 0);

        if (a.cmd == "explain") {
            std::cout << ansi.bold() << "CBOR encoding" << ansi.reset() << ": " << a.input << "\n";
            print_tree(tree, ansi, opts, a.max_bytes, 0);
            return 0;
        }

        if (a.cmd == "view") {
            return run_view(a, tree, opts);
        }

    } catch (const mincbor::CborError& e) {
        std::cerr << err_ansi.red() << "Error" << err_ansi.reset() << " (" << mincbor::to_string(e.kind()) << "): " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << err_ansi.red() << "Error" << err_ansi.reset() << ": " << e.what() << "\n";
        return 1;
    }

    usage();
    return 2;
}
