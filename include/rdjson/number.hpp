#pragma once

/// @file number.hpp
/// @brief Number: a closed two-case sum of a 64-bit integer and a double.
///
/// A literal written without '.' and without an exponent is an Int; any other
/// literal is a Float. The two cases never convert into each other implicitly:
/// as_int() on a Float (or as_float() on an Int) throws TypeError, and
/// Int(1) != Float(1.0). Use visit() to handle both cases exhaustively.

#include "config.hpp"
#include "error.hpp"

#include <cstdint>
#include <string>
#include <utility>

namespace rdjson {

class Number {
public:
    enum class Kind : uint8_t {
        Int   = 0,
        Float = 1
    };

    [[nodiscard]] static Number integer(int64_t v) noexcept {
        Number n;
        n.kind_ = Kind::Int;
        n.u_.i = v;
        return n;
    }

    [[nodiscard]] static Number floating(double v) noexcept {
        Number n;
        n.kind_ = Kind::Float;
        n.u_.d = v;
        return n;
    }

    /// Int(0).
    Number() noexcept : kind_(Kind::Int) { u_.i = 0; }

    [[nodiscard]] Kind kind() const noexcept { return kind_; }
    [[nodiscard]] bool is_int()   const noexcept { return kind_ == Kind::Int; }
    [[nodiscard]] bool is_float() const noexcept { return kind_ == Kind::Float; }

    int64_t as_int() const {
        if (RDJSON_UNLIKELY(!is_int()))
            throw TypeError("expected integer number, got float");
        return u_.i;
    }

    double as_float() const {
        if (RDJSON_UNLIKELY(!is_float()))
            throw TypeError("expected float number, got integer");
        return u_.d;
    }

    /// @brief Call vis(int64_t) or vis(double) depending on the case.
    ///
    /// @code
    ///   n.visit([](auto v) { std::cout << v; });
    /// @endcode
    template <typename Visitor>
    decltype(auto) visit(Visitor&& vis) const {
        switch (kind_) {
            case Kind::Int:   return std::forward<Visitor>(vis)(u_.i);
            case Kind::Float: return std::forward<Visitor>(vis)(u_.d);
        }
        // Unreachable: Kind has exactly two enumerators.
        return std::forward<Visitor>(vis)(u_.i);
    }

    [[nodiscard]] bool operator==(const Number& other) const noexcept {
        if (kind_ != other.kind_) return false;
        return kind_ == Kind::Int ? u_.i == other.u_.i : u_.d == other.u_.d;
    }
    [[nodiscard]] bool operator!=(const Number& other) const noexcept { return !(*this == other); }

private:
    Kind kind_;
    union {
        int64_t i;
        double d;
    } u_;
};

inline const char* kind_name(Number::Kind k) noexcept {
    switch (k) {
        case Number::Kind::Int:   return "Int";
        case Number::Kind::Float: return "Float";
    }
    return "unknown";
}

} // namespace rdjson
