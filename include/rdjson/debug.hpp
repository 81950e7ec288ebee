#pragma once

/// @file debug.hpp
/// @brief Debug formatting of Number and Value.
///
/// Output shows the variant structure rather than JSON text:
///
///   Object{"a": Number(Int(1)), "b": Array[Bool(true), Null, String("x")]}
///
/// Floats are printed in shortest round-trip form (plain notation between
/// 1e-5 and 1e16) and always carry a '.' or an exponent, so Int(1) and
/// Float(1.0) read differently. Object members appear in stored order.
/// GoogleTest picks up operator<< when it prints a value in a failed
/// assertion.

#include "number.hpp"
#include "value.hpp"

#include <charconv>
#include <cmath>
#include <cstdio>
#include <ostream>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>

namespace rdjson {
namespace detail {

inline void write_debug_double(std::ostream& os, double d) {
    char buf[32];
#if defined(__cpp_lib_to_chars) && __cpp_lib_to_chars >= 201611L
    // Plain notation for everyday magnitudes, shortest round-trip otherwise.
    const double mag = std::fabs(d);
    const bool plain = mag == 0.0 || (mag >= 1e-5 && mag < 1e16);
    auto [end, ec] = plain ? std::to_chars(buf, buf + sizeof(buf), d, std::chars_format::fixed)
                           : std::to_chars(buf, buf + sizeof(buf), d);
    const size_t len = ec == std::errc{} ? static_cast<size_t>(end - buf) : 0;
#else
    const int n = std::snprintf(buf, sizeof(buf), "%.17g", d);
    const size_t len = n > 0 ? static_cast<size_t>(n) : 0;
#endif
    std::string_view text(buf, len);
    os << text;
    if (text.find_first_of(".eEn") == std::string_view::npos) os << ".0";
}

inline void write_debug_string(std::ostream& os, std::string_view s) {
    static constexpr char kHex[] = "0123456789abcdef";
    os << '"';
    for (char c : s) {
        switch (c) {
            case '"':  os << "\\\""; break;
            case '\\': os << "\\\\"; break;
            case '\n': os << "\\n";  break;
            case '\r': os << "\\r";  break;
            case '\t': os << "\\t";  break;
            default: {
                const auto u = static_cast<unsigned char>(c);
                if (u < 0x20) os << "\\x" << kHex[u >> 4] << kHex[u & 0xF];
                else os << c;
            }
        }
    }
    os << '"';
}

inline void write_debug(std::ostream& os, const Value& v);

inline void write_debug_array(std::ostream& os, const Array& arr) {
    os << "Array[";
    bool first = true;
    for (const auto& elem : arr) {
        if (!first) os << ", ";
        first = false;
        write_debug(os, elem);
    }
    os << ']';
}

inline void write_debug_object(std::ostream& os, const Object& obj) {
    os << "Object{";
    bool first = true;
    for (const auto& [key, val] : obj) {
        if (!first) os << ", ";
        first = false;
        write_debug_string(os, key);
        os << ": ";
        write_debug(os, val);
    }
    os << '}';
}

} // namespace detail

inline std::ostream& operator<<(std::ostream& os, const Number& n) {
    switch (n.kind()) {
        case Number::Kind::Int:
            os << "Int(" << n.as_int() << ')';
            break;
        case Number::Kind::Float:
            os << "Float(";
            detail::write_debug_double(os, n.as_float());
            os << ')';
            break;
    }
    return os;
}

namespace detail {

inline void write_debug(std::ostream& os, const Value& v) {
    switch (v.type()) {
        case Type::Null:   os << "Null"; break;
        case Type::Bool:   os << (v.as_bool() ? "Bool(true)" : "Bool(false)"); break;
        case Type::Number: os << "Number(" << v.as_number() << ')'; break;
        case Type::String:
            os << "String(";
            write_debug_string(os, v.as_string());
            os << ')';
            break;
        case Type::Array:  write_debug_array(os, v.as_array()); break;
        case Type::Object: write_debug_object(os, v.as_object()); break;
    }
}

} // namespace detail

inline std::ostream& operator<<(std::ostream& os, const Value& v) {
    detail::write_debug(os, v);
    return os;
}

[[nodiscard]] inline std::string to_debug_string(const Value& v) {
    std::ostringstream oss;
    oss << v;
    return oss.str();
}

} // namespace rdjson
