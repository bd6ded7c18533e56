#pragma once

#include "mincbor/cbor.hpp"

#include <array>
#include <complex>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <vector>

namespace mincbor::easy {

// Convert native C++ values into mincbor::Value. Byte containers become byte
// strings, other sequences arrays, optionals and pointers pointer values.
template <typename T>
Value to_value(const T& x);

namespace detail {

template <typename T>
struct is_byte : std::bool_constant<
    std::is_same_v<T, std::uint8_t> || std::is_same_v<T, unsigned char> || std::is_same_v<T, std::byte>> {};

template <typename T> struct is_vector : std::false_type {};
template <typename T, typename A> struct is_vector<std::vector<T, A>> : std::true_type {};

template <typename T> struct is_std_array : std::false_type {};
template <typename T, std::size_t N> struct is_std_array<std::array<T, N>> : std::true_type {};

template <typename T> struct is_map_like : std::false_type {};
template <typename K, typename V, typename C, typename A>
struct is_map_like<std::map<K, V, C, A>> : std::true_type {};
template <typename K, typename V, typename H, typename E, typename A>
struct is_map_like<std::unordered_map<K, V, H, E, A>> : std::true_type {};

template <typename T> struct is_optional : std::false_type {};
template <typename T> struct is_optional<std::optional<T>> : std::true_type {};

template <typename T> struct is_smart_ptr : std::false_type {};
template <typename T, typename D> struct is_smart_ptr<std::unique_ptr<T, D>> : std::true_type {};
template <typename T> struct is_smart_ptr<std::shared_ptr<T>> : std::true_type {};

template <typename T> struct is_complex : std::false_type {};
template <typename T> struct is_complex<std::complex<T>> : std::true_type {};

template <typename T> struct dependent_false : std::false_type {};

template <typename Seq>
Value sequence_to_value(const Seq& seq) {
    using Elem = typename Seq::value_type;
    if constexpr (is_byte<Elem>::value) {
        Value::Bytes b;
        b.reserve(seq.size());
        for (const auto& e : seq) b.push_back(static_cast<std::uint8_t>(e));
        return Value::make_bytes(std::move(b));
    } else {
        Value::Array a;
        a.reserve(seq.size());
        for (const auto& e : seq) a.push_back(to_value(e));
        return Value::make_array(std::move(a));
    }
}

} // namespace detail

template <typename T>
Value to_value(const T& x) {
    using U = std::remove_cv_t<T>;
    if constexpr (std::is_same_v<U, Value>) {
        return x;
    } else if constexpr (std::is_same_v<U, std::nullptr_t>) {
        return Value::make_nil();
    } else if constexpr (std::is_same_v<U, bool>) {
        return Value::make_bool(x);
    } else if constexpr (std::is_integral_v<U> && std::is_signed_v<U>) {
        return Value::make_int(static_cast<std::int64_t>(x));
    } else if constexpr (std::is_integral_v<U>) {
        return Value::make_uint(static_cast<std::uint64_t>(x));
    } else if constexpr (std::is_same_v<U, std::byte>) {
        return Value::make_uint(static_cast<std::uint64_t>(x));
    } else if constexpr (std::is_floating_point_v<U>) {
        // float and long double are routed through double
        return Value::make_float(static_cast<double>(x));
    } else if constexpr (std::is_same_v<U, std::string> || std::is_same_v<U, std::string_view>) {
        return Value::make_text(std::string(x));
    } else if constexpr (std::is_same_v<U, const char*> || std::is_same_v<U, char*>) {
        if (!x) return Value::make_pointer(nullptr);
        return Value::make_text(std::string(x));
    } else if constexpr (std::is_array_v<U> && std::is_same_v<std::remove_cv_t<std::remove_extent_t<U>>, char>) {
        return Value::make_text(std::string(x));
    } else if constexpr (std::is_array_v<U>) {
        using Elem = std::remove_cv_t<std::remove_extent_t<U>>;
        if constexpr (detail::is_byte<Elem>::value) {
            Value::Bytes b;
            for (const auto& e : x) b.push_back(static_cast<std::uint8_t>(e));
            return Value::make_bytes(std::move(b));
        } else {
            Value::Array a;
            for (const auto& e : x) a.push_back(to_value(e));
            return Value::make_array(std::move(a));
        }
    } else if constexpr (detail::is_vector<U>::value || detail::is_std_array<U>::value) {
        return detail::sequence_to_value(x);
    } else if constexpr (detail::is_map_like<U>::value) {
        Value::Map m;
        m.reserve(x.size());
        for (const auto& kv : x) m.emplace_back(to_value(kv.first), to_value(kv.second));
        return Value::make_map(std::move(m));
    } else if constexpr (detail::is_optional<U>::value) {
        if (!x) return Value::make_pointer(nullptr);
        return Value::make_pointer_to(to_value(*x));
    } else if constexpr (detail::is_smart_ptr<U>::value || std::is_pointer_v<U>) {
        if (!x) return Value::make_pointer(nullptr);
        return Value::make_pointer_to(to_value(*x));
    } else if constexpr (detail::is_complex<U>::value) {
        return Value::make_opaque("complex");
    } else {
        static_assert(detail::dependent_false<U>::value, "mincbor::easy::to_value: no mapping for this type");
    }
}

// Builds a Record field by field, in declaration order.
//
//   Value v = easy::RecordBuilder("Point")
//       .field("X", 1, "x")
//       .field("Label", std::string(), "label,omitempty")
//       .build();
class RecordBuilder {
public:
    explicit RecordBuilder(std::string type_name = {}) {
        rec_.type_name = std::move(type_name);
    }

    template <typename T>
    RecordBuilder& field(std::string name, const T& value, std::string tag = {}) {
        rec_.fields.push_back(Field{std::move(name), std::move(tag), to_value(value)});
        return *this;
    }

    Value build() const { return Value::make_record(rec_); }

private:
    Record rec_;
};

inline Value record(std::string type_name, std::vector<Field> fields) {
    Record r;
    r.type_name = std::move(type_name);
    r.fields = std::move(fields);
    return Value::make_record(std::move(r));
}

template <typename T>
inline std::vector<std::uint8_t> encode(const T& x, const EncodeOptions& opts = EncodeOptions{}) {
    return mincbor::encode(to_value(x), opts);
}

} // namespace mincbor::easy
