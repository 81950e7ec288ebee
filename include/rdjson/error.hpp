#pragma once

/// @file error.hpp
/// @brief Error types for rdjson: exceptions + std::error_code system.
///
/// Dual error reporting:
///   - Via exceptions: ParseError, TypeError, OutOfRangeError (rdjson::parse)
///   - Via error_code: rdjson::errc enum + rdjson_category() (rdjson::try_parse)
///
/// Every parse error carries the position where it was detected and the
/// grammar production the parser expected there.

#include <cstddef>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>

namespace rdjson {

// =====================================================================
// Source position for parse errors
// =====================================================================

/// @brief Position in the source text.
struct SourceLocation {
    size_t line   = 1;  ///< Line number (1-based)
    size_t column = 1;  ///< Column number (1-based, in bytes)
    size_t offset = 0;  ///< Byte offset from the beginning
};

// =====================================================================
// Error code enumeration
// =====================================================================

/// @brief rdjson error codes for std::error_code integration.
enum class errc : int {
    ok = 0,

    // Parse errors (1-49)
    no_match            = 1,
    malformed_number    = 2,
    unterminated_string = 3,
    depth_exceeded      = 4,
    invalid_escape      = 5,
    trailing_content    = 6,

    // Value access errors (50-79)
    type_mismatch       = 50,
    out_of_range        = 51,
    key_not_found       = 52,
};

// =====================================================================
// Error category
// =====================================================================

namespace detail {

class rdjson_error_category_impl : public std::error_category {
public:
    const char* name() const noexcept override {
        return "rdjson";
    }

    std::string message(int ev) const override {
        switch (static_cast<errc>(ev)) {
            case errc::ok:                  return "success";
            case errc::no_match:            return "no grammar production matches";
            case errc::malformed_number:    return "malformed number";
            case errc::unterminated_string: return "unterminated string";
            case errc::depth_exceeded:      return "maximum nesting depth exceeded";
            case errc::invalid_escape:      return "invalid escape sequence";
            case errc::trailing_content:    return "trailing content after value";
            case errc::type_mismatch:       return "type mismatch";
            case errc::out_of_range:        return "index out of range";
            case errc::key_not_found:       return "key not found";
            default:                        return "unknown rdjson error";
        }
    }
};

} // namespace detail

/// @brief Get the rdjson error category singleton.
inline const std::error_category& rdjson_category() noexcept {
    static const detail::rdjson_error_category_impl instance;
    return instance;
}

/// @brief Create an error_code from rdjson::errc.
inline std::error_code make_error_code(errc e) noexcept {
    return {static_cast<int>(e), rdjson_category()};
}

/// @brief True for codes produced by the parser (as opposed to value access).
inline bool is_parse_error(errc e) noexcept {
    const int v = static_cast<int>(e);
    return v > 0 && v < 50;
}

// =====================================================================
// Exception types
// =====================================================================

/// @brief Parse failure with source position and expected production.
class ParseError : public std::system_error {
public:
    ParseError(const std::string& message, SourceLocation loc,
               errc code, std::string expected)
        : std::system_error(make_error_code(code))
        , what_(format_message(message, loc))
        , location_(loc)
        , expected_(std::move(expected)) {}

    /// @brief "rdjson parse error at line L, column C: message".
    /// Unlike system_error, the category message is not appended.
    const char* what() const noexcept override {
        return what_.c_str();
    }

    /// @brief Error position in the source text.
    [[nodiscard]] const SourceLocation& location() const noexcept {
        return location_;
    }

    /// @brief Name of the production expected at location(), e.g. "value".
    [[nodiscard]] const std::string& expected() const noexcept {
        return expected_;
    }

private:
    static std::string format_message(const std::string& msg,
                                      const SourceLocation& loc) {
        return "rdjson parse error at line " + std::to_string(loc.line) +
               ", column " + std::to_string(loc.column) + ": " + msg;
    }

    std::string what_;
    SourceLocation location_;
    std::string expected_;
};

/// @brief Type mismatch when reading a value as the wrong variant.
class TypeError : public std::system_error {
public:
    explicit TypeError(const std::string& msg)
        : std::system_error(make_error_code(errc::type_mismatch), msg) {}
};

/// @brief Array index out of range or object key not found.
class OutOfRangeError : public std::system_error {
public:
    explicit OutOfRangeError(const std::string& msg,
                             errc code = errc::out_of_range)
        : std::system_error(make_error_code(code), msg) {}
};

// =====================================================================
// Result type for exception-free operations
// =====================================================================

/// @brief Value or error: what try_parse() returns.
/// Usage: auto [val, ec, loc, expected] = rdjson::try_parse(input);
template <typename T>
struct result {
    T value;
    std::error_code ec;
    SourceLocation location;  ///< Meaningful only when ec is set
    std::string expected;     ///< Production expected at location

    explicit operator bool() const noexcept { return !ec; }
    bool has_value() const noexcept { return !ec; }
};

} // namespace rdjson

// Register rdjson::errc as an error_code enum
namespace std {
template <>
struct is_error_code_enum<rdjson::errc> : true_type {};
} // namespace std
