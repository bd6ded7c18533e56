#pragma once

#include <cstddef>
#include <exception>
#include <stdexcept>
#include <ostream>
#include <string>

namespace mincbor {
namespace cli {

inline const char* usage_text() {
    return
        "mincbor - minimal CBOR encoder\n"
        "\n"
        "Usage:\n"
        "  mincbor encode  <FILE|-> [-o OUT] [--gzip] [--level N] [--sort-keys] [--max-depth N] [--no-color]\n"
        "  mincbor hex     <FILE|-> [--sort-keys] [--max-depth N] [--no-color]\n"
        "  mincbor explain <FILE|-> [--sort-keys] [--max-depth N] [--max-bytes N] [--no-color]\n"
        "  mincbor view    <FILE|-> [--sort-keys] [--max-depth N]\n"
        "\n"
        "FILE holds JSON text; '-' reads it from stdin.\n";
}

struct Args {
    std::string cmd;
    std::string input;
    std::string out;
    bool gzip{false};
    int level{6};
    bool sort_keys{false};
    std::size_t max_depth{0};
    std::size_t max_bytes{24};
    bool no_color{false};
};

// Whole-string unsigned number; std::stoull alone accepts "12x" and "-1".
inline std::size_t parse_count(const std::string& s) {
    if (s.empty() || s[0] == '-' || s[0] == '+') throw std::invalid_argument("not a count");
    std::size_t pos = 0;
    const unsigned long long v = std::stoull(s, &pos);
    if (pos != s.size()) throw std::invalid_argument("not a count");
    return static_cast<std::size_t>(v);
}

inline int parse_int(const std::string& s) {
    std::size_t pos = 0;
    const int v = std::stoi(s, &pos);
    if (pos != s.size()) throw std::invalid_argument("not an integer");
    return v;
}

inline bool parse_args(int argc, const char* const* argv, Args& a, std::ostream& err) {
    if (argc < 3) return false;
    a.cmd = argv[1];
    a.input = argv[2];

    int i = 3;
    while (i < argc) {
        std::string opt = argv[i++];
        try {
            if (opt == "--gzip") a.gzip = true;
            else if (opt == "--sort-keys") a.sort_keys = true;
            else if (opt == "--no-color") a.no_color = true;
            else if ((opt == "-o" || opt == "--out") && i < argc) a.out = argv[i++];
            else if (opt == "--level" && i < argc) a.level = parse_int(argv[i++]);
            else if (opt == "--max-depth" && i < argc) a.max_depth = parse_count(argv[i++]);
            else if (opt == "--max-bytes" && i < argc) a.max_bytes = parse_count(argv[i++]);
            else {
                err << "Unknown option: " << opt << "\n";
                return false;
            }
        } catch (const std::exception&) {
            err << "Invalid value for " << opt << ": " << argv[i - 1] << "\n";
            return false;
        }
    }

    if (a.cmd != "encode" && a.cmd != "hex" && a.cmd != "explain" && a.cmd != "view") {
        err << "Unknown command: " << a.cmd << "\n";
        return false;
    }
    if (a.gzip && a.out.empty()) {
        err << "--gzip requires -o <OUT>\n";
        return false;
    }
    return true;
}

} // namespace cli
} // namespace mincbor
