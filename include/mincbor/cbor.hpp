#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <iosfwd>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

struct gzFile_s;

namespace mincbor {

// ------------------------------
// Error model
// ------------------------------

enum class ErrorKind {
    Io,
    UnsupportedType,
    DepthExceeded,
    JsonParse,
    InvalidArgument,
};

std::string to_string(ErrorKind k);

class CborError : public std::runtime_error {
public:
    CborError(ErrorKind k, const std::string& msg);
    ErrorKind kind() const noexcept;

private:
    ErrorKind kind_;
};

// ------------------------------
// Wire constants (RFC 7049 subset)
// ------------------------------

enum class Major : std::uint8_t {
    UnsignedInt = 0,
    NegativeInt = 1,
    ByteString = 2,
    TextString = 3,
    Array = 4,
    Map = 5,
    Tag = 6, // reserved, never emitted
    Simple = 7,
};

std::string to_string(Major m);

namespace minor {
// Extended-length selectors.
constexpr std::uint8_t kUInt8 = 24;
constexpr std::uint8_t kUInt16 = 25;
constexpr std::uint8_t kUInt32 = 26;
constexpr std::uint8_t kUInt64 = 27;

// Major type 7.
constexpr std::uint8_t kFalse = 20;
constexpr std::uint8_t kTrue = 21;
constexpr std::uint8_t kNull = 22;
constexpr std::uint8_t kFloat16 = 25;
constexpr std::uint8_t kFloat32 = 26;
constexpr std::uint8_t kFloat64 = 27;

constexpr std::uint8_t kMaxInline = 23;
} // namespace minor

// ------------------------------
// Public data model
// ------------------------------

struct Value;
struct Field;

struct Nil {};

struct Record {
    std::string type_name{};
    // Declaration order is emission order.
    std::vector<Field> fields{};
};

// A native value with no wire mapping (complex numbers, callables, ...).
struct Opaque {
    std::string type_name{};
};

struct Value {
    using Bytes = std::vector<std::uint8_t>;
    using Array = std::vector<Value>;
    using Map = std::vector<std::pair<Value, Value>>;
    // Null means a nil pointer / empty optional.
    using Pointer = std::shared_ptr<const Value>;

    std::variant<
        Nil,
        bool,
        std::int64_t,
        std::uint64_t,
        Bytes,
        std::string,
        Array,
        Map,
        Record,
        double,
        Pointer,
        Opaque
    > v;

    // Convenience constructors
    static Value make_nil();
    static Value make_bool(bool b);
    static Value make_int(std::int64_t i);
    static Value make_uint(std::uint64_t u);
    static Value make_bytes(Bytes b);
    static Value make_text(std::string s);
    static Value make_array(Array a);
    static Value make_map(Map m);
    static Value make_record(Record r);
    static Value make_float(double d);
    static Value make_pointer(Pointer p);
    static Value make_pointer_to(Value target);
    static Value make_opaque(std::string type_name);

    bool is_nil() const noexcept;
    bool is_array() const noexcept;
    bool is_map() const noexcept;
    bool is_record() const noexcept;

    const Array& as_array() const;
    Array& as_array();
    const Map& as_map() const;
    Map& as_map();
    const Record& as_record() const;
    Record& as_record();
};

struct Field {
    std::string name{};
    // Directive list, e.g. "renamed,omitempty" or "-".
    std::string tag{};
    Value value{};
};

/// Short name of the alternative held by `v` ("nil", "int", "record", ...).
std::string kind_name(const Value& v);

/// True for the values an `omitempty` field drops: nil, false, numeric zero,
/// empty bytes/text/array/map and null pointers.
bool is_empty_value(const Value& v);

// ------------------------------
// Field directives
// ------------------------------

struct FieldTag {
    std::string name{}; // empty => use the declared field name
    bool skip{false};
    bool omit_empty{false};
};

FieldTag parse_field_tag(std::string_view tag);

// ------------------------------
// Options
// ------------------------------

struct EncodeOptions {
    // Emit map pairs ordered by encoded key (shorter first, then bytewise).
    bool sort_map_keys{false};
    // 0 => unlimited.
    std::size_t max_depth{0};
};

enum class CompressionMode {
    Never,
    Gzip,
};

struct WriteOptions {
    EncodeOptions encode{};
    CompressionMode compression{CompressionMode::Never};
    int zlib_level{6}; // 0..9
};

// ------------------------------
// Sinks
// ------------------------------

class Sink {
public:
    virtual ~Sink() = default;
    /// Write all `n` bytes or throw CborError(ErrorKind::Io).
    virtual void write(const std::uint8_t* data, std::size_t n) = 0;
};

class VectorSink : public Sink {
public:
    void write(const std::uint8_t* data, std::size_t n) override;

    const std::vector<std::uint8_t>& bytes() const noexcept { return bytes_; }
    std::vector<std::uint8_t> take() { return std::move(bytes_); }

private:
    std::vector<std::uint8_t> bytes_;
};

class CountingSink : public Sink {
public:
    void write(const std::uint8_t* data, std::size_t n) override;
    std::size_t count() const noexcept { return count_; }

private:
    std::size_t count_{0};
};

class StreamSink : public Sink {
public:
    explicit StreamSink(std::ostream& os);
    void write(const std::uint8_t* data, std::size_t n) override;

private:
    std::ostream& os_;
};

class GzipFileSink : public Sink {
public:
    GzipFileSink(const std::filesystem::path& file, int level);
    ~GzipFileSink() override;

    GzipFileSink(const GzipFileSink&) = delete;
    GzipFileSink& operator=(const GzipFileSink&) = delete;

    void write(const std::uint8_t* data, std::size_t n) override;
    /// Flush and close the gzip stream; further writes fail.
    void close();

private:
    gzFile_s* gz_{nullptr};
    std::string path_;
};

// ------------------------------
// Encoder
// ------------------------------

class Encoder {
public:
    explicit Encoder(Sink& sink, const EncodeOptions& opts = EncodeOptions{});

    /// Encode one value (recursively).
    void encode(const Value& v);

    /// Encode `v` as a node already `depth` levels below the document root,
    /// so max_depth applies as it would inside the full document.
    void encode(const Value& v, std::size_t depth);

    void write_header(Major major, std::uint8_t info);
    void write_header_payload(Major major, std::uint8_t info, std::uint8_t payload);
    void write_header_payload(Major major, std::uint8_t info, std::uint16_t payload);
    void write_header_payload(Major major, std::uint8_t info, std::uint32_t payload);
    void write_header_payload(Major major, std::uint8_t info, std::uint64_t payload);

    /// Canonical minimal-width integer under `major`.
    void write_integer(Major major, std::uint64_t value);

    /// Narrowest of float16/float32/float64 that reproduces `value` exactly.
    void write_float(double value);

    void write_bytes(const Value::Bytes& bytes);
    void write_text(std::string_view text);
    void write_array(const Value::Array& items);
    void write_map(const Value::Map& pairs);
    void write_record(const Record& rec);

private:
    void encode_at(const Value& v, std::size_t depth);
    void write_array_at(const Value::Array& items, std::size_t depth);
    void write_map_at(const Value::Map& pairs, std::size_t depth);
    void write_record_at(const Record& rec, std::size_t depth);
    void write_float16(bool negative, std::uint16_t exp, std::uint16_t frac);
    void enter(std::size_t depth) const;

    Sink& sink_;
    EncodeOptions opts_;
};

// ------------------------------
// API
// ------------------------------

/// Encode into a fresh byte vector.
std::vector<std::uint8_t> encode(const Value& v, const EncodeOptions& opts = EncodeOptions{});

/// Encode into an output stream; throws ErrorKind::Io when the stream fails.
void encode_to_stream(std::ostream& os, const Value& v, const EncodeOptions& opts = EncodeOptions{});

/// Encoded byte count, without materializing the output.
std::size_t encoded_size(const Value& v, const EncodeOptions& opts = EncodeOptions{});

/// Write the encoding of `v` to `file`, optionally gzip-compressed.
void write_file(
    const std::filesystem::path& file,
    const Value& v,
    const WriteOptions& opts = WriteOptions{}
);

/// Write an already encoded byte sequence to `file`, optionally
/// gzip-compressed. `opts.encode` is not used.
void write_encoded_file(
    const std::filesystem::path& file,
    const std::vector<std::uint8_t>& encoded,
    const WriteOptions& opts = WriteOptions{}
);

/// Parse JSON text into a Value (objects become maps in document order).
Value value_from_json(std::string_view json);

} // namespace mincbor
