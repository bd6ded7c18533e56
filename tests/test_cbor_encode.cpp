#include "mincbor/cbor.hpp"
#include "test_util.hpp"

#include <cstdint>
#include <iostream>
#include <limits>
#include <string>
#include <vector>

using mincbor::Major;
using mincbor::Value;

static std::vector<std::uint8_t> enc(const Value& v, const mincbor::EncodeOptions& opts = mincbor::EncodeOptions{}) {
    return mincbor::encode(v, opts);
}

static Value ints(std::initializer_list<std::int64_t> xs) {
    Value::Array a;
    for (auto x : xs) a.push_back(Value::make_int(x));
    return Value::make_array(std::move(a));
}

static void test_header_writer() {
    mincbor::VectorSink sink;
    mincbor::Encoder e(sink);
    e.write_header(Major::Simple, mincbor::minor::kNull);
    e.write_header_payload(Major::UnsignedInt, mincbor::minor::kUInt8, std::uint8_t{0xAB});
    e.write_header_payload(Major::ByteString, mincbor::minor::kUInt16, std::uint16_t{0x0102});
    e.write_header_payload(Major::Array, mincbor::minor::kUInt32, std::uint32_t{0x01020304});
    e.write_header_payload(Major::Map, mincbor::minor::kUInt64, std::uint64_t{0x0102030405060708ull});
    CHECK_BYTES(sink.bytes(), bytes({
        0xf6,
        0x18, 0xab,
        0x59, 0x01, 0x02,
        0x9a, 0x01, 0x02, 0x03, 0x04,
        0xbb, 0x01, 0x02, 0x03, 0x04, 0x05, 0x06, 0x07, 0x08,
    }));
}

static void test_unsigned_minimal_width() {
    for (std::uint64_t i = 0; i <= 23; ++i) {
        CHECK_BYTES(enc(Value::make_uint(i)), bytes({static_cast<int>(i)}));
    }
    CHECK_BYTES(enc(Value::make_uint(24)), bytes({0x18, 0x18}));
    CHECK_BYTES(enc(Value::make_uint(25)), bytes({0x18, 0x19}));
    CHECK_BYTES(enc(Value::make_uint(100)), bytes({0x18, 0x64}));
    CHECK_BYTES(enc(Value::make_uint(255)), bytes({0x18, 0xff}));
    CHECK_BYTES(enc(Value::make_uint(256)), bytes({0x19, 0x01, 0x00}));
    CHECK_BYTES(enc(Value::make_uint(1000)), bytes({0x19, 0x03, 0xe8}));
    CHECK_BYTES(enc(Value::make_uint(65535)), bytes({0x19, 0xff, 0xff}));
    CHECK_BYTES(enc(Value::make_uint(65536)), bytes({0x1a, 0x00, 0x01, 0x00, 0x00}));
    CHECK_BYTES(enc(Value::make_uint(1000000)), bytes({0x1a, 0x00, 0x0f, 0x42, 0x40}));
    CHECK_BYTES(enc(Value::make_uint(4294967295ull)), bytes({0x1a, 0xff, 0xff, 0xff, 0xff}));
    CHECK_BYTES(enc(Value::make_uint(4294967296ull)), bytes({0x1b, 0x00, 0x00, 0x00, 0x01, 0x00, 0x00, 0x00, 0x00}));
    CHECK_BYTES(enc(Value::make_uint(1000000000000ull)),
                bytes({0x1b, 0x00, 0x00, 0x00, 0xe8, 0xd4, 0xa5, 0x10, 0x00}));
    CHECK_BYTES(enc(Value::make_uint((std::numeric_limits<std::uint64_t>::max)())),
                bytes({0x1b, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff}));

    // The same table drives every length prefix.
    mincbor::VectorSink sink;
    mincbor::Encoder(sink).write_integer(Major::TextString, 300);
    CHECK_BYTES(sink.bytes(), bytes({0x79, 0x01, 0x2c}));
}

static void test_signed_integers() {
    CHECK_BYTES(enc(Value::make_int(0)), bytes({0x00}));
    CHECK_BYTES(enc(Value::make_int(10)), bytes({0x0a}));
    CHECK_BYTES(enc(Value::make_int(-1)), bytes({0x20}));
    CHECK_BYTES(enc(Value::make_int(-10)), bytes({0x29}));
    CHECK_BYTES(enc(Value::make_int(-24)), bytes({0x37}));
    CHECK_BYTES(enc(Value::make_int(-25)), bytes({0x38, 0x18}));
    CHECK_BYTES(enc(Value::make_int(-100)), bytes({0x38, 0x63}));
    CHECK_BYTES(enc(Value::make_int(-1000)), bytes({0x39, 0x03, 0xe7}));
    CHECK_BYTES(enc(Value::make_int((std::numeric_limits<std::int64_t>::max)())),
                bytes({0x1b, 0x7f, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff}));
    CHECK_BYTES(enc(Value::make_int((std::numeric_limits<std::int64_t>::min)())),
                bytes({0x3b, 0x7f, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff}));

    // -1 is unsigned 0 under the negative major type.
    mincbor::VectorSink sink;
    mincbor::Encoder(sink).write_integer(Major::NegativeInt, 0);
    CHECK_BYTES(enc(Value::make_int(-1)), sink.bytes());
}

static void test_simple_values() {
    CHECK_BYTES(enc(Value::make_nil()), bytes({0xf6}));
    CHECK_BYTES(enc(Value{}), bytes({0xf6}));
    CHECK_BYTES(enc(Value::make_bool(false)), bytes({0xf4}));
    CHECK_BYTES(enc(Value::make_bool(true)), bytes({0xf5}));
}

static void test_byte_and_text_strings() {
    CHECK_BYTES(enc(Value::make_bytes({})), bytes({0x40}));
    CHECK_BYTES(enc(Value::make_bytes({1, 2, 3, 4})), bytes({0x44, 0x01, 0x02, 0x03, 0x04}));
    CHECK_BYTES(enc(Value::make_bytes({'h', 'e', 'l', 'l', 'o'})), bytes({0x45, 0x68, 0x65, 0x6c, 0x6c, 0x6f}));

    CHECK_BYTES(enc(Value::make_text("")), bytes({0x60}));
    CHECK_BYTES(enc(Value::make_text("IETF")), bytes({0x64, 0x49, 0x45, 0x54, 0x46}));
    CHECK_BYTES(enc(Value::make_text("\"\\")), bytes({0x62, 0x22, 0x5c}));
    // Length counts UTF-8 bytes, not characters.
    CHECK_BYTES(enc(Value::make_text("\xc3\xbc")), bytes({0x62, 0xc3, 0xbc}));
    CHECK_BYTES(enc(Value::make_text("\xe6\xb0\xb4")), bytes({0x63, 0xe6, 0xb0, 0xb4}));
    CHECK_BYTES(enc(Value::make_text("\xf0\x90\x85\x91")), bytes({0x64, 0xf0, 0x90, 0x85, 0x91}));

    // 24-byte payload switches to a one-byte length.
    std::vector<std::uint8_t> b24(24, 0x11);
    std::vector<std::uint8_t> out = enc(Value::make_bytes(b24));
    CHECK(out.size() == 26);
    CHECK(out[0] == 0x58 && out[1] == 24);
}

static void test_arrays() {
    CHECK_BYTES(enc(Value::make_array({})), bytes({0x80}));
    CHECK_BYTES(enc(ints({1, 2, 3})), bytes({0x83, 0x01, 0x02, 0x03}));

    Value nested = Value::make_array({Value::make_int(1), ints({2, 3}), ints({4, 5})});
    CHECK_BYTES(enc(nested), bytes({0x83, 0x01, 0x82, 0x02, 0x03, 0x82, 0x04, 0x05}));

    CHECK_BYTES(enc(ints({1, 2, 3, 4, 5, 6, 7, 8, 9, 10, 11, 12, 13, 14, 15, 16, 17, 18, 19, 20, 21, 22, 23, 24, 25})),
                bytes({0x98, 0x19, 0x01, 0x02, 0x03, 0x04, 0x05, 0x06, 0x07, 0x08,
                       0x09, 0x0a, 0x0b, 0x0c, 0x0d, 0x0e, 0x0f, 0x10, 0x11, 0x12,
                       0x13, 0x14, 0x15, 0x16, 0x17, 0x18, 0x18, 0x18, 0x19}));

    // Heterogeneous items keep their order.
    Value mixed = Value::make_array({Value::make_text("a"), Value::make_nil(), Value::make_bool(true), Value::make_int(-1)});
    CHECK_BYTES(enc(mixed), bytes({0x84, 0x61, 0x61, 0xf6, 0xf5, 0x20}));
}

static void test_maps() {
    CHECK_BYTES(enc(Value::make_map({})), bytes({0xa0}));

    Value::Map m;
    m.emplace_back(Value::make_int(1), Value::make_int(2));
    m.emplace_back(Value::make_int(3), Value::make_int(4));
    CHECK_BYTES(enc(Value::make_map(m)), bytes({0xa2, 0x01, 0x02, 0x03, 0x04}));

    // ["a", {"b": "c"}]
    Value::Map bc;
    bc.emplace_back(Value::make_text("b"), Value::make_text("c"));
    Value arr = Value::make_array({Value::make_text("a"), Value::make_map(bc)});
    CHECK_BYTES(enc(arr), bytes({0x82, 0x61, 0x61, 0xa1, 0x61, 0x62, 0x61, 0x63}));

    // Iteration order is kept as given.
    Value::Map rev;
    rev.emplace_back(Value::make_text("b"), ints({2, 3}));
    rev.emplace_back(Value::make_text("a"), Value::make_int(1));
    CHECK_BYTES(enc(Value::make_map(rev)), bytes({0xa2, 0x61, 0x62, 0x82, 0x02, 0x03, 0x61, 0x61, 0x01}));
}

static void test_sorted_map_keys() {
    mincbor::EncodeOptions opts;
    opts.sort_map_keys = true;

    Value::Map a;
    a.emplace_back(Value::make_text("aa"), Value::make_int(3));
    a.emplace_back(Value::make_int(100), Value::make_int(2));
    a.emplace_back(Value::make_int(10), Value::make_int(1));
    a.emplace_back(Value::make_text("b"), Value::make_int(4));

    Value::Map b(a.rbegin(), a.rend());

    // Shorter encoded keys first, then bytewise: 0a, 18 64, 61 62, 62 61 61.
    const auto expected = bytes({0xa4, 0x0a, 0x01, 0x18, 0x64, 0x02, 0x61, 0x62, 0x04, 0x62, 0x61, 0x61, 0x03});
    CHECK_BYTES(enc(Value::make_map(a), opts), expected);
    CHECK_BYTES(enc(Value::make_map(b), opts), expected);

    // Without the option the two permutations differ.
    CHECK(enc(Value::make_map(a)) != enc(Value::make_map(b)));

    // Nested maps are sorted too.
    Value outer = Value::make_array({Value::make_map(b)});
    std::vector<std::uint8_t> nested_expected = {0x81};
    nested_expected.insert(nested_expected.end(), expected.begin(), expected.end());
    CHECK_BYTES(enc(outer, opts), nested_expected);
}

static void test_pointer_chains() {
    Value ten = Value::make_uint(10);
    CHECK_BYTES(enc(Value::make_pointer_to(ten)), bytes({0x0a}));

    // Depth k non-null chain encodes like the target.
    Value target = ints({1, 2});
    Value chain = target;
    for (int k = 0; k < 5; ++k) {
        chain = Value::make_pointer_to(chain);
        CHECK_BYTES(enc(chain), enc(target));
    }

    // Null at any level is null.
    CHECK_BYTES(enc(Value::make_pointer(nullptr)), bytes({0xf6}));
    Value broken = Value::make_pointer(nullptr);
    for (int k = 0; k < 3; ++k) {
        broken = Value::make_pointer_to(broken);
        CHECK_BYTES(enc(broken), bytes({0xf6}));
    }

    // Pointers inside containers.
    Value arr = Value::make_array({Value::make_pointer_to(Value::make_int(-1)), Value::make_pointer(nullptr)});
    CHECK_BYTES(enc(arr), bytes({0x82, 0x20, 0xf6}));
}

static void test_unsupported_type() {
    CHECK_ERROR_KIND(enc(Value::make_opaque("complex")), mincbor::ErrorKind::UnsupportedType);

    // Bytes before the failing item stay in the sink.
    mincbor::VectorSink sink;
    mincbor::Encoder e(sink);
    Value arr = Value::make_array({Value::make_int(1), Value::make_opaque("func")});
    CHECK_ERROR_KIND(e.encode(arr), mincbor::ErrorKind::UnsupportedType);
    CHECK_BYTES(sink.bytes(), bytes({0x82, 0x01}));

    try {
        (void)enc(Value::make_opaque("chan"));
        CHECK(false);
    } catch (const mincbor::CborError& err) {
        CHECK(std::string(err.what()).find("chan") != std::string::npos);
    }
}

static void test_max_depth() {
    mincbor::EncodeOptions opts;
    opts.max_depth = 2;

    Value ok = Value::make_array({ints({1})});
    CHECK_BYTES(enc(ok, opts), bytes({0x81, 0x81, 0x01}));

    Value deep = Value::make_array({Value::make_array({ints({1})})});
    CHECK_ERROR_KIND(enc(deep, opts), mincbor::ErrorKind::DepthExceeded);

    // A subtree encoded at its document depth sees the same limit.
    {
        mincbor::VectorSink sink;
        mincbor::Encoder(sink, opts).encode(Value::make_int(1), 2);
        CHECK_BYTES(sink.bytes(), bytes({0x01}));
    }
    {
        mincbor::VectorSink sink;
        CHECK_ERROR_KIND(mincbor::Encoder(sink, opts).encode(ints({1}), 2), mincbor::ErrorKind::DepthExceeded);
        CHECK_ERROR_KIND(mincbor::Encoder(sink, opts).encode(Value::make_int(1), 3), mincbor::ErrorKind::DepthExceeded);
    }

    // Unlimited by default.
    Value v = Value::make_int(0);
    for (int i = 0; i < 200; ++i) v = Value::make_array({v});
    CHECK(enc(v).size() == 201);
}

static void test_encoded_size_matches() {
    Value::Map m;
    m.emplace_back(Value::make_text("pi"), Value::make_float(3.14159));
    m.emplace_back(Value::make_text("n"), Value::make_uint(70000));
    Value v = Value::make_array({Value::make_map(m), Value::make_bytes({1, 2, 3})});
    CHECK(mincbor::encoded_size(v) == enc(v).size());
}

static void test_value_accessors() {
    Value a = ints({1});
    CHECK(a.is_array());
    CHECK(a.as_array().size() == 1);
    CHECK_ERROR_KIND(a.as_map(), mincbor::ErrorKind::InvalidArgument);
    CHECK(mincbor::kind_name(a) == "array");
    CHECK(mincbor::kind_name(Value::make_pointer(nullptr)) == "pointer");
    CHECK(mincbor::to_string(Major::NegativeInt) == "nint");
}

int main() {
    try {
        test_header_writer();
        test_unsigned_minimal_width();
        test_signed_integers();
        test_simple_values();
        test_byte_and_text_strings();
        test_arrays();
        test_maps();
        test_sorted_map_keys();
        test_pointer_chains();
        test_unsupported_type();
        test_max_depth();
        test_encoded_size_matches();
        test_value_accessors();
    } catch (const std::exception& e) {
        std::cerr << e.what() << "\n";
        return 1;
    }
    std::cout << "All tests passed.\n";
    return 0;
}
