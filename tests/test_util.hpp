#pragma once

#include "mincbor/cbor.hpp"

#include <cstdint>
#include <initializer_list>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#define CHECK(cond) do { \
    if (!(cond)) { \
        std::ostringstream _oss; \
        _oss << "CHECK failed: " #cond " at " << __FILE__ << ":" << __LINE__; \
        throw std::runtime_error(_oss.str()); \
    } \
} while (0)

#define CHECK_BYTES(actual, expected) do { \
    const std::vector<std::uint8_t> _a = (actual); \
    const std::vector<std::uint8_t> _e = (expected); \
    if (_a != _e) { \
        std::ostringstream _oss; \
        _oss << "CHECK_BYTES failed at " << __FILE__ << ":" << __LINE__ \
             << "\n  actual:   " << hex(_a) << "\n  expected: " << hex(_e); \
        throw std::runtime_error(_oss.str()); \
    } \
} while (0)

#define CHECK_ERROR_KIND(expr, expected_kind) do { \
    bool _threw = false; \
    try { \
        (void)(expr); \
    } catch (const mincbor::CborError& _e) { \
        _threw = (_e.kind() == (expected_kind)); \
    } \
    if (!_threw) { \
        std::ostringstream _oss; \
        _oss << "CHECK_ERROR_KIND failed: " #expr " did not throw " \
             << mincbor::to_string(expected_kind) << " at " << __FILE__ << ":" << __LINE__; \
        throw std::runtime_error(_oss.str()); \
    } \
} while (0)

static inline std::string hex(const std::vector<std::uint8_t>& b) {
    std::ostringstream oss;
    for (std::size_t i = 0; i < b.size(); ++i) {
        if (i) oss << ' ';
        oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<unsigned>(b[i]);
    }
    return oss.str();
}

static inline std::vector<std::uint8_t> bytes(std::initializer_list<int> v) {
    std::vector<std::uint8_t> out;
    out.reserve(v.size());
    for (int x : v) out.push_back(static_cast<std::uint8_t>(x));
    return out;
}
