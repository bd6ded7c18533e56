
#include "mincbor/cbor.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <cstring>
#include <fstream>
#include <ostream>

#include <zlib.h>

namespace mincbor {

CborError::CborError(ErrorKind k, const std::string& msg)
    : std::runtime_error(msg), kind_(k) {}

ErrorKind CborError::kind() const noexcept { return kind_; }

std::string to_string(ErrorKind k) {
    switch (k) {
        case ErrorKind::Io: return "io";
        case ErrorKind::UnsupportedType: return "unsupported-type";
        case ErrorKind::DepthExceeded: return "depth-exceeded";
        case ErrorKind::JsonParse: return "json-parse";
        case ErrorKind::InvalidArgument: return "invalid-argument";
        default: return "unknown";
    }
}

std::string to_string(Major m) {
    switch (m) {
        case Major::UnsignedInt: return "uint";
        case Major::NegativeInt: return "nint";
        case Major::ByteString: return "bytes";
        case Major::TextString: return "text";
        case Major::Array: return "array";
        case Major::Map: return "map";
        case Major::Tag: return "tag";
        case Major::Simple: return "simple";
        default: return "unknown";
    }
}

// ------------------------------
// Float layout
// ------------------------------

static constexpr int kFloat16ExpBias  = 15;
static constexpr int kFloat16FracBits = 10;
static constexpr int kFloat32FracBits = 23;
static constexpr int kFloat64ExpBias  = 1023;
static constexpr int kFloat64FracBits = 52;

static constexpr std::uint64_t kFloat64ExpMask  = (1ull << 11) - 1;
static constexpr std::uint64_t kFloat64FracMask = (1ull << kFloat64FracBits) - 1;
static constexpr std::uint64_t kFloat64Hidden   = 1ull << kFloat64FracBits;

// Trailing zeros the float64 mantissa needs for an exact narrowing.
static constexpr int kFloat16MinZeros = kFloat64FracBits - kFloat16FracBits; // 42
static constexpr int kFloat32MinZeros = kFloat64FracBits - kFloat32FracBits; // 29

static constexpr std::uint16_t kFloat16ExpAllOnes = 0x1F;
static constexpr std::uint16_t kFloat16QuietNaN   = 0x200;

static std::uint64_t double_bits(double d) {
    std::uint64_t u = 0;
    std::memcpy(&u, &d, sizeof(u));
    return u;
}

static std::uint32_t float_bits(float f) {
    std::uint32_t u = 0;
    std::memcpy(&u, &f, sizeof(u));
    return u;
}

static int mantissa_trailing_zeros(std::uint64_t frac) {
    if (frac == 0) return kFloat64FracBits;
    int n = 0;
    while ((frac & 1u) == 0) {
        frac >>= 1;
        ++n;
    }
    return n;
}

// ------------------------------
// Value helpers
// ------------------------------

Value Value::make_nil() {
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

Value Value::make_uint(std::uint64_t u) {
    Value v;
    v.v = u;
    return v;
}

Value Value::make_bytes(Bytes b) {
    Value v;
    v.v = std::move(b);
    return v;
}

Value Value::make_text(std::string s) {
    Value v;
    v.v = std::move(s);
    return v;
}

Value Value::make_array(Array a) {
    Value v;
    v.v = std::move(a);
    return v;
}

Value Value::make_map(Map m) {
    Value v;
    v.v = std::move(m);
    return v;
}

Value Value::make_record(Record r) {
    Value v;
    v.v = std::move(r);
    return v;
}

Value Value::make_float(double d) {
    Value v;
    v.v = d;
    return v;
}

Value Value::make_pointer(Pointer p) {
    Value v;
    v.v = std::move(p);
    return v;
}

Value Value::make_pointer_to(Value target) {
    return make_pointer(std::make_shared<const Value>(std::move(target)));
}

Value Value::make_opaque(std::string type_name) {
    Value v;
    v.v = Opaque{std::move(type_name)};
    return v;
}

bool Value::is_nil() const noexcept {
    return std::holds_alternative<Nil>(v);
}

bool Value::is_array() const noexcept {
    return std::holds_alternative<Array>(v);
}

bool Value::is_map() const noexcept {
    return std::holds_alternative<Map>(v);
}

bool Value::is_record() const noexcept {
    return std::holds_alternative<Record>(v);
}

const Value::Array& Value::as_array() const {
    if (!is_array()) throw CborError(ErrorKind::InvalidArgument, "value is not an array");
    return std::get<Array>(v);
}

Value::Array& Value::as_array() {
    if (!is_array()) throw CborError(ErrorKind::InvalidArgument, "value is not an array");
    return std::get<Array>(v);
}

const Value::Map& Value::as_map() const {
    if (!is_map()) throw CborError(ErrorKind::InvalidArgument, "value is not a map");
    return std::get<Map>(v);
}

Value::Map& Value::as_map() {
    if (!is_map()) throw CborError(ErrorKind::InvalidArgument, "value is not a map");
    return std::get<Map>(v);
}

const Record& Value::as_record() const {
    if (!is_record()) throw CborError(ErrorKind::InvalidArgument, "value is not a record");
    return std::get<Record>(v);
}

Record& Value::as_record() {
    if (!is_record()) throw CborError(ErrorKind::InvalidArgument, "value is not a record");
    return std::get<Record>(v);
}

std::string kind_name(const Value& x) {
    const auto& v = x.v;
    if (std::holds_alternative<Nil>(v)) return "nil";
    if (std::holds_alternative<bool>(v)) return "bool";
    if (std::holds_alternative<std::int64_t>(v)) return "int";
    if (std::holds_alternative<std::uint64_t>(v)) return "uint";
    if (std::holds_alternative<Value::Bytes>(v)) return "bytes";
    if (std::holds_alternative<std::string>(v)) return "text";
    if (std::holds_alternative<Value::Array>(v)) return "array";
    if (std::holds_alternative<Value::Map>(v)) return "map";
    if (std::holds_alternative<Record>(v)) return "record";
    if (std::holds_alternative<double>(v)) return "float";
    if (std::holds_alternative<Value::Pointer>(v)) return "pointer";
    if (std::holds_alternative<Opaque>(v)) return "opaque";
    return "invalid";
}

bool is_empty_value(const Value& x) {
    const auto& v = x.v;
    if (std::holds_alternative<Nil>(v)) return true;
    if (const auto* b = std::get_if<bool>(&v)) return !*b;
    if (const auto* i = std::get_if<std::int64_t>(&v)) return *i == 0;
    if (const auto* u = std::get_if<std::uint64_t>(&v)) return *u == 0;
    if (const auto* d = std::get_if<double>(&v)) return *d == 0.0;
    if (const auto* b = std::get_if<Value::Bytes>(&v)) return b->empty();
    if (const auto* s = std::get_if<std::string>(&v)) return s->empty();
    if (const auto* a = std::get_if<Value::Array>(&v)) return a->empty();
    if (const auto* m = std::get_if<Value::Map>(&v)) return m->empty();
    if (const auto* p = std::get_if<Value::Pointer>(&v)) return !*p;
    // Records and opaque values are never empty.
    return false;
}

// ------------------------------
// Field directives
// ------------------------------

FieldTag parse_field_tag(std::string_view tag) {
    FieldTag out;
    if (tag == "-") {
        out.skip = true;
        return out;
    }

    std::size_t comma = tag.find(',');
    out.name = std::string(tag.substr(0, comma));
    while (comma != std::string_view::npos) {
        const std::size_t start = comma + 1;
        comma = tag.find(',', start);
        std::string_view opt = tag.substr(start, comma == std::string_view::npos ? std::string_view::npos : comma - start);
        if (opt == "omitempty") out.omit_empty = true;
        // other options are ignored
    }
    return out;
}

// ------------------------------
// Sinks
// ------------------------------

void VectorSink::write(const std::uint8_t* data, std::size_t n) {
    bytes_.insert(bytes_.end(), data, data + n);
}

void CountingSink::write(const std::uint8_t*, std::size_t n) {
    count_ += n;
}

StreamSink::StreamSink(std::ostream& os) : os_(os) {}

void StreamSink::write(const std::uint8_t* data, std::size_t n) {
    os_.write(reinterpret_cast<const char*>(data), static_cast<std::streamsize>(n));
    if (!os_) throw CborError(ErrorKind::Io, "stream write failed");
}

GzipFileSink::GzipFileSink(const std::filesystem::path& file, int level)
    : path_(file.string()) {
    if (level < 0 || level > 9) {
        throw CborError(ErrorKind::InvalidArgument, "zlib level must be in 0..9");
    }
    const std::string mode = "wb" + std::to_string(level);
    gz_ = ::gzopen(path_.c_str(), mode.c_str());
    if (!gz_) throw CborError(ErrorKind::Io, "failed to open for write: " + path_);
}

GzipFileSink::~GzipFileSink() {
    if (gz_) {
        // Errors here are only reported through close().
        (void)::gzclose(gz_);
        gz_ = nullptr;
    }
}

void GzipFileSink::write(const std::uint8_t* data, std::size_t n) {
    if (!gz_) throw CborError(ErrorKind::Io, "gzip stream is closed: " + path_);
    constexpr std::size_t kChunk = 1u << 30;
    while (n > 0) {
        const std::size_t chunk = std::min(n, kChunk);
        const int written = ::gzwrite(gz_, data, static_cast<unsigned>(chunk));
        if (written <= 0) {
            int errnum = 0;
            const char* msg = ::gzerror(gz_, &errnum);
            throw CborError(ErrorKind::Io, std::string("gzwrite failed: ") + (msg ? msg : "unknown error"));
        }
        data += written;
        n -= static_cast<std::size_t>(written);
    }
}

void GzipFileSink::close() {
    if (!gz_) return;
    const int rc = ::gzclose(gz_);
    gz_ = nullptr;
    if (rc != Z_OK) throw CborError(ErrorKind::Io, "failed closing gzip file: " + path_);
}

// ------------------------------
// Encoder
// ------------------------------

Encoder::Encoder(Sink& sink, const EncodeOptions& opts)
    : sink_(sink), opts_(opts) {}

static std::uint8_t header_byte(Major major, std::uint8_t info) {
    return static_cast<std::uint8_t>((static_cast<std::uint8_t>(major) << 5) | (info & 0x1Fu));
}

void Encoder::write_header(Major major, std::uint8_t info) {
    const std::uint8_t h = header_byte(major, info);
    sink_.write(&h, 1);
}

// Header plus big-endian payload go out in a single write.
template <typename T>
static void write_header_be(Sink& sink, Major major, std::uint8_t info, T payload) {
    std::array<std::uint8_t, 1 + sizeof(T)> buf{};
    buf[0] = header_byte(major, info);
    for (std::size_t i = 0; i < sizeof(T); ++i) {
        buf[1 + i] = static_cast<std::uint8_t>((static_cast<std::uint64_t>(payload) >> (8 * (sizeof(T) - 1 - i))) & 0xFFu);
    }
    sink.write(buf.data(), buf.size());
}

void Encoder::write_header_payload(Major major, std::uint8_t info, std::uint8_t payload) {
    write_header_be(sink_, major, info, payload);
}

void Encoder::write_header_payload(Major major, std::uint8_t info, std::uint16_t payload) {
    write_header_be(sink_, major, info, payload);
}

void Encoder::write_header_payload(Major major, std::uint8_t info, std::uint32_t payload) {
    write_header_be(sink_, major, info, payload);
}

void Encoder::write_header_payload(Major major, std::uint8_t info, std::uint64_t payload) {
    write_header_be(sink_, major, info, payload);
}

void Encoder::write_integer(Major major, std::uint64_t value) {
    if (value <= minor::kMaxInline) {
        write_header(major, static_cast<std::uint8_t>(value));
    } else if (value <= 0xFFu) {
        write_header_payload(major, minor::kUInt8, static_cast<std::uint8_t>(value));
    } else if (value <= 0xFFFFu) {
        write_header_payload(major, minor::kUInt16, static_cast<std::uint16_t>(value));
    } else if (value <= 0xFFFFFFFFu) {
        write_header_payload(major, minor::kUInt32, static_cast<std::uint32_t>(value));
    } else {
        write_header_payload(major, minor::kUInt64, value);
    }
}

void Encoder::write_float16(bool negative, std::uint16_t exp, std::uint16_t frac) {
    std::uint16_t out = negative ? 0x8000u : 0u;
    out |= static_cast<std::uint16_t>(exp << kFloat16FracBits);
    out |= frac;
    write_header_payload(Major::Simple, minor::kFloat16, out);
}

void Encoder::write_float(double value) {
    const std::uint64_t bits = double_bits(value);
    const bool negative = (bits >> 63) != 0;

    // Special values first: they have no usable exponent/mantissa split.
    if (value == 0.0) {
        write_float16(negative, 0, 0);
        return;
    }
    if (std::isnan(value)) {
        write_float16(negative, kFloat16ExpAllOnes, kFloat16QuietNaN);
        return;
    }
    if (std::isinf(value)) {
        write_float16(negative, kFloat16ExpAllOnes, 0);
        return;
    }

    const int exp = static_cast<int>((bits >> kFloat64FracBits) & kFloat64ExpMask) - kFloat64ExpBias;
    const std::uint64_t frac = bits & kFloat64FracMask;
    const int tz = mantissa_trailing_zeros(frac);

    // float16 normal
    if (exp >= -14 && exp <= 15 && tz >= kFloat16MinZeros) {
        write_float16(negative,
                      static_cast<std::uint16_t>(exp + kFloat16ExpBias),
                      static_cast<std::uint16_t>(frac >> kFloat16MinZeros));
        return;
    }

    // float16 subnormal: m * 2^-24 with m in [1, 1023]. The hidden bit moves
    // into the mantissa, so every bit below the shift must be zero.
    if (exp >= -24 && exp <= -15) {
        const int shift = 28 - exp; // 43..52
        if (tz >= shift) {
            const std::uint64_t m = (kFloat64Hidden | frac) >> shift;
            write_float16(negative, 0, static_cast<std::uint16_t>(m));
            return;
        }
    }

    // float32, normal or subnormal (m * 2^-149). Both preconditions make the
    // native conversion exact.
    const bool f32_normal = exp >= -126 && exp <= 127 && tz >= kFloat32MinZeros;
    const bool f32_subnormal = exp >= -149 && exp <= -127 && tz >= -97 - exp;
    if (f32_normal || f32_subnormal) {
        const float f = static_cast<float>(value);
        write_header_payload(Major::Simple, minor::kFloat32, float_bits(f));
        return;
    }

    write_header_payload(Major::Simple, minor::kFloat64, bits);
}

void Encoder::write_bytes(const Value::Bytes& bytes) {
    write_integer(Major::ByteString, static_cast<std::uint64_t>(bytes.size()));
    if (!bytes.empty()) sink_.write(bytes.data(), bytes.size());
}

void Encoder::write_text(std::string_view text) {
    write_integer(Major::TextString, static_cast<std::uint64_t>(text.size()));
    if (!text.empty()) sink_.write(reinterpret_cast<const std::uint8_t*>(text.data()), text.size());
}

void Encoder::write_array(const Value::Array& items) {
    write_array_at(items, 0);
}

void Encoder::write_map(const Value::Map& pairs) {
    write_map_at(pairs, 0);
}

void Encoder::write_record(const Record& rec) {
    write_record_at(rec, 0);
}

void Encoder::encode(const Value& v) {
    encode_at(v, 0);
}

void Encoder::encode(const Value& v, std::size_t depth) {
    encode_at(v, depth);
}

void Encoder::enter(std::size_t depth) const {
    if (opts_.max_depth != 0 && depth > opts_.max_depth) {
        throw CborError(ErrorKind::DepthExceeded,
                        "nesting depth exceeds max_depth=" + std::to_string(opts_.max_depth));
    }
}

void Encoder::write_array_at(const Value::Array& items, std::size_t depth) {
    write_integer(Major::Array, static_cast<std::uint64_t>(items.size()));
    for (const auto& item : items) {
        encode_at(item, depth + 1);
    }
}

void Encoder::write_map_at(const Value::Map& pairs, std::size_t depth) {
    write_integer(Major::Map, static_cast<std::uint64_t>(pairs.size()));
    if (!opts_.sort_map_keys) {
        for (const auto& kv : pairs) {
            encode_at(kv.first, depth + 1);
            encode_at(kv.second, depth + 1);
        }
        return;
    }

    // Canonical order: encode every key up front, then sort by
    // (encoded length, bytes).
    std::vector<std::pair<std::vector<std::uint8_t>, const Value*>> keyed;
    keyed.reserve(pairs.size());
    for (const auto& kv : pairs) {
        VectorSink ks;
        Encoder sub(ks, opts_);
        sub.encode_at(kv.first, depth + 1);
        keyed.emplace_back(ks.take(), &kv.second);
    }
    std::stable_sort(keyed.begin(), keyed.end(), [](const auto& a, const auto& b) {
        if (a.first.size() != b.first.size()) return a.first.size() < b.first.size();
        return a.first < b.first;
    });
    for (const auto& k : keyed) {
        sink_.write(k.first.data(), k.first.size());
        encode_at(*k.second, depth + 1);
    }
}

void Encoder::write_record_at(const Record& rec, std::size_t depth) {
    std::vector<std::pair<std::string, const Value*>> kept;
    kept.reserve(rec.fields.size());
    for (const auto& f : rec.fields) {
        FieldTag tag = parse_field_tag(f.tag);
        if (tag.skip) continue;
        if (tag.omit_empty && is_empty_value(f.value)) continue;
        kept.emplace_back(tag.name.empty() ? f.name : std::move(tag.name), &f.value);
    }

    write_integer(Major::Map, static_cast<std::uint64_t>(kept.size()));
    for (const auto& kv : kept) {
        write_text(kv.first);
        encode_at(*kv.second, depth + 1);
    }
}

void Encoder::encode_at(const Value& x, std::size_t depth) {
    enter(depth);

    // Pointer chains unwrap fully; a null link anywhere is null.
    const Value* cur = &x;
    while (const auto* p = std::get_if<Value::Pointer>(&cur->v)) {
        if (!*p) {
            write_header(Major::Simple, minor::kNull);
            return;
        }
        cur = p->get();
    }
    const auto& v = cur->v;

    if (std::holds_alternative<Nil>(v)) {
        write_header(Major::Simple, minor::kNull);
        return;
    }

    if (const auto* b = std::get_if<bool>(&v)) {
        write_header(Major::Simple, *b ? minor::kTrue : minor::kFalse);
        return;
    }

    if (const auto* i = std::get_if<std::int64_t>(&v)) {
        if (*i < 0) {
            // -(n+1) cannot overflow for any negative int64.
            write_integer(Major::NegativeInt, static_cast<std::uint64_t>(-(*i + 1)));
        } else {
            write_integer(Major::UnsignedInt, static_cast<std::uint64_t>(*i));
        }
        return;
    }

    if (const auto* u = std::get_if<std::uint64_t>(&v)) {
        write_integer(Major::UnsignedInt, *u);
        return;
    }

    if (const auto* b = std::get_if<Value::Bytes>(&v)) {
        write_bytes(*b);
        return;
    }

    if (const auto* a = std::get_if<Value::Array>(&v)) {
        write_array_at(*a, depth);
        return;
    }

    if (const auto* s = std::get_if<std::string>(&v)) {
        write_text(*s);
        return;
    }

    if (const auto* m = std::get_if<Value::Map>(&v)) {
        write_map_at(*m, depth);
        return;
    }

    if (const auto* r = std::get_if<Record>(&v)) {
        write_record_at(*r, depth);
        return;
    }

    if (const auto* d = std::get_if<double>(&v)) {
        write_float(*d);
        return;
    }

    if (const auto* o = std::get_if<Opaque>(&v)) {
        throw CborError(ErrorKind::UnsupportedType,
                        "unsupported type: " + (o->type_name.empty() ? std::string("<opaque>") : o->type_name));
    }

    throw CborError(ErrorKind::UnsupportedType, "value holds no alternative");
}

// ------------------------------
// API
// ------------------------------

std::vector<std::uint8_t> encode(const Value& v, const EncodeOptions& opts) {
    VectorSink sink;
    Encoder(sink, opts).encode(v);
    return sink.take();
}

void encode_to_stream(std::ostream& os, const Value& v, const EncodeOptions& opts) {
    StreamSink sink(os);
    Encoder(sink, opts).encode(v);
}

std::size_t encoded_size(const Value& v, const EncodeOptions& opts) {
    CountingSink sink;
    Encoder(sink, opts).encode(v);
    return sink.count();
}

void write_file(const std::filesystem::path& file, const Value& v, const WriteOptions& opts) {
    if (opts.compression == CompressionMode::Gzip) {
        GzipFileSink sink(file, opts.zlib_level);
        Encoder(sink, opts.encode).encode(v);
        sink.close();
        return;
    }

    std::ofstream os(file, std::ios::binary | std::ios::trunc);
    if (!os) throw CborError(ErrorKind::Io, "failed to open for write: " + file.string());
    encode_to_stream(os, v, opts.encode);
    os.flush();
    if (!os) throw CborError(ErrorKind::Io, "failed writing CBOR file");
}

void write_encoded_file(const std::filesystem::path& file,
                        const std::vector<std::uint8_t>& encoded,
                        const WriteOptions& opts) {
    if (opts.compression == CompressionMode::Gzip) {
        GzipFileSink sink(file, opts.zlib_level);
        if (!encoded.empty()) sink.write(encoded.data(), encoded.size());
        sink.close();
        return;
    }

    std::ofstream os(file, std::ios::binary | std::ios::trunc);
    if (!os) throw CborError(ErrorKind::Io, "failed to open for write: " + file.string());
    StreamSink sink(os);
    if (!encoded.empty()) sink.write(encoded.data(), encoded.size());
    os.flush();
    if (!os) throw CborError(ErrorKind::Io, "failed writing CBOR file");
}

} // namespace mincbor
