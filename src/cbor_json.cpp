
#include "mincbor/cbor.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <limits>

namespace mincbor {

// ------------------------------
// JSON text -> Value
// ------------------------------

namespace internal {

// Arrays and objects nest at most this deep; the reader recurses per level.
static constexpr std::size_t kMaxJsonDepth = 512;

class JsonReader {
public:
    explicit JsonReader(std::string_view s) : s_(s) {}

    Value parse() {
        skip_ws();
        Value out = parse_value();
        skip_ws();
        if (pos_ != s_.size()) {
            fail("trailing data in JSON");
        }
        return out;
    }

private:
    std::string_view s_;
    std::size_t pos_{0};
    std::size_t depth_{0};

    [[noreturn]] void fail(const std::string& what) const {
        throw CborError(ErrorKind::JsonParse, what + " at offset " + std::to_string(pos_));
    }

    void skip_ws() {
        while (pos_ < s_.size()) {
            char c = s_[pos_];
            if (c == ' ' || c == '\n' || c == '\r' || c == '\t') {
                ++pos_;
                continue;
            }
            break;
        }
    }

    char peek() const { return pos_ < s_.size() ? s_[pos_] : '\0'; }

    char get() {
        if (pos_ >= s_.size()) {
            fail("unexpected end of JSON");
        }
        return s_[pos_++];
    }

    static void append_utf8(std::string& out, unsigned codepoint) {
        if (codepoint <= 0x7F) {
            out.push_back(static_cast<char>(codepoint));
        } else if (codepoint <= 0x7FF) {
            out.push_back(static_cast<char>(0xC0 | ((codepoint >> 6) & 0x1F)));
            out.push_back(static_cast<char>(0x80 | (codepoint & 0x3F)));
        } else if (codepoint <= 0xFFFF) {
            out.push_back(static_cast<char>(0xE0 | ((codepoint >> 12) & 0x0F)));
            out.push_back(static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (codepoint & 0x3F)));
        } else {
            out.push_back(static_cast<char>(0xF0 | ((codepoint >> 18) & 0x07)));
            out.push_back(static_cast<char>(0x80 | ((codepoint >> 12) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (codepoint & 0x3F)));
        }
    }

    unsigned parse_hex4() {
        unsigned v = 0;
        for (int i = 0; i < 4; ++i) {
            char c = get();
            v <<= 4;
            if (c >= '0' && c <= '9') v |= static_cast<unsigned>(c - '0');
            else if (c >= 'a' && c <= 'f') v |= static_cast<unsigned>(10 + (c - 'a'));
            else if (c >= 'A' && c <= 'F') v |= static_cast<unsigned>(10 + (c - 'A'));
            else fail("invalid \\u escape");
        }
        return v;
    }

    std::string parse_string() {
        // assumes opening quote already consumed
        std::string out;
        while (true) {
            char c = get();
            if (c == '"') break;
            if (static_cast<unsigned char>(c) < 0x20) fail("control character in JSON string");
            if (c == '\\') {
                char e = get();
                switch (e) {
                    case '"': out.push_back('"'); break;
                    case '\\': out.push_back('\\'); break;
                    case '/': out.push_back('/'); break;
                    case 'b': out.push_back('\b'); break;
                    case 'f': out.push_back('\f'); break;
                    case 'n': out.push_back('\n'); break;
                    case 'r': out.push_back('\r'); break;
                    case 't': out.push_back('\t'); break;
                    case 'u': {
                        unsigned u = parse_hex4();
                        if (u >= 0xD800 && u <= 0xDBFF) {
                            // high surrogate; expect \uXXXX
                            if (get() != '\\' || get() != 'u') {
                                fail("invalid surrogate pair");
                            }
                            unsigned u2 = parse_hex4();
                            if (u2 < 0xDC00 || u2 > 0xDFFF) {
                                fail("invalid surrogate pair");
                            }
                            unsigned codepoint = 0x10000 + (((u - 0xD800) << 10) | (u2 - 0xDC00));
                            append_utf8(out, codepoint);
                        } else if (u >= 0xDC00 && u <= 0xDFFF) {
                            fail("unpaired low surrogate");
                        } else {
                            append_utf8(out, u);
                        }
                        break;
                    }
                    default:
                        fail("invalid escape in JSON string");
                }
            } else {
                out.push_back(c);
            }
        }
        return out;
    }

    // Integers become int/uint when they fit, everything else a double.
    Value parse_number() {
        std::size_t start = pos_;
        bool negative = false;
        if (peek() == '-') {
            negative = true;
            ++pos_;
        }
        bool has_digit = false;
        bool has_dot = false;
        bool has_exp = false;
        while (pos_ < s_.size()) {
            char c = s_[pos_];
            if (c >= '0' && c <= '9') { has_digit = true; ++pos_; continue; }
            if (c == '.') { has_dot = true; ++pos_; continue; }
            if (c == 'e' || c == 'E') {
                has_exp = true; ++pos_;
                if (peek() == '+' || peek() == '-') ++pos_;
                continue;
            }
            break;
        }
        std::string raw(s_.substr(start, pos_ - start));
        if (!has_digit) {
            fail("invalid number in JSON");
        }

        if (!has_dot && !has_exp) {
            errno = 0;
            char* end = nullptr;
            if (negative) {
                long long v = std::strtoll(raw.c_str(), &end, 10);
                if (errno == 0 && end == raw.c_str() + raw.size()) {
                    return Value::make_int(static_cast<std::int64_t>(v));
                }
            } else {
                unsigned long long v = std::strtoull(raw.c_str(), &end, 10);
                if (errno == 0 && end == raw.c_str() + raw.size()) {
                    if (v <= static_cast<unsigned long long>((std::numeric_limits<std::int64_t>::max)())) {
                        return Value::make_int(static_cast<std::int64_t>(v));
                    }
                    return Value::make_uint(static_cast<std::uint64_t>(v));
                }
            }
            // out of 64-bit range: fall back to a double
        }

        errno = 0;
        char* end = nullptr;
        double d = std::strtod(raw.c_str(), &end);
        if (end != raw.c_str() + raw.size()) {
            fail("invalid number in JSON");
        }
        return Value::make_float(d);
    }

    void enter_nested() {
        if (++depth_ > kMaxJsonDepth) fail("JSON nesting too deep");
    }

    Value parse_array() {
        // assumes '[' consumed
        enter_nested();
        Value::Array arr;
        skip_ws();
        if (peek() == ']') {
            get();
            --depth_;
            return Value::make_array(std::move(arr));
        }
        while (true) {
            skip_ws();
            arr.push_back(parse_value());
            skip_ws();
            char c = get();
            if (c == ']') break;
            if (c != ',') fail("expected ',' in array");
        }
        --depth_;
        return Value::make_array(std::move(arr));
    }

    Value parse_object() {
        // assumes '{' consumed
        enter_nested();
        Value::Map obj;
        skip_ws();
        if (peek() == '}') {
            get();
            --depth_;
            return Value::make_map(std::move(obj));
        }
        while (true) {
            skip_ws();
            if (get() != '"') fail("expected string key");
            std::string key = parse_string();
            skip_ws();
            if (get() != ':') fail("expected ':' in object");
            skip_ws();
            Value val = parse_value();
            obj.emplace_back(Value::make_text(std::move(key)), std::move(val));
            skip_ws();
            char c = get();
            if (c == '}') break;
            if (c != ',') fail("expected ',' in object");
        }
        --depth_;
        return Value::make_map(std::move(obj));
    }

    Value parse_value() {
        skip_ws();
        char c = peek();
        if (c == '"') { get(); return Value::make_text(parse_string()); }
        if (c == '{') { get(); return parse_object(); }
        if (c == '[') { get(); return parse_array(); }
        if (c == 't') { expect("true"); return Value::make_bool(true); }
        if (c == 'f') { expect("false"); return Value::make_bool(false); }
        if (c == 'n') { expect("null"); return Value::make_nil(); }
        if (c == '-' || (c >= '0' && c <= '9')) return parse_number();
        fail("unexpected character in JSON");
    }

    void expect(const char* lit) {
        std::size_t n = std::strlen(lit);
        if (pos_ + n > s_.size() || s_.substr(pos_, n) != lit) {
            fail(std::string("expected '") + lit + "'");
        }
        pos_ += n;
    }
};

} // namespace internal

Value value_from_json(std::string_view json) {
    return internal::JsonReader(json).parse();
}

} // namespace mincbor
