#pragma once

/// @file parser.hpp
/// @brief Recursive-descent parser producing a Value tree.
///
/// Structure:
///   - Lexical recognizers: null / true / false keywords, numbers, strings
///   - Structural combinators: arrays and objects, recursing through the
///     value dispatcher for every element and member value
///   - Value dispatcher: picks exactly one production from the lookahead,
///     in the fixed order null, bool, number, string, array, object
///
/// The first failure aborts the parse with a ParseError; there is no recovery
/// and no partial tree. Nesting depth travels as an argument through the
/// recursion and is checked against the configured limit on every array and
/// object. The parser keeps no state beyond one call, so independent parses
/// may run concurrently.

#include "config.hpp"
#include "detail/utf8.hpp"
#include "error.hpp"
#include "number.hpp"
#include "parse_options.hpp"
#include "value.hpp"

#include <charconv>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <limits>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

namespace rdjson {
namespace detail {

class Parser {
public:
    /// @brief Parse a complete text (with exceptions).
    [[nodiscard]] static Value parse(std::string_view input,
                                     const ParseOptions& opts = {}) {
        Parser p(input.data(), input.data() + input.size(), opts);
        p.skip_whitespace();
        Value result = p.parse_value(0);
        p.skip_whitespace();
        if (RDJSON_UNLIKELY(p.ptr_ < p.end_ && !p.opts_.allow_trailing_content)) {
            p.fail(p.ptr_, "unexpected trailing content", errc::trailing_content,
                   "end of input");
        }
        return result;
    }

    /// @brief Parse a complete text (no exceptions, error_code).
    ///
    /// Only ParseError is converted; allocation failure stays fatal.
    [[nodiscard]] static result<Value> try_parse(
            std::string_view input, const ParseOptions& opts = {}) noexcept {
        try {
            return {parse(input, opts), {}, {}, {}};
        } catch (const ParseError& e) {
            return {Value{}, e.code(), e.location(), e.expected()};
        }
    }

private:
    const char* ptr_;
    const char* end_;
    const char* begin_;
    ParseOptions opts_;
    size_t max_depth_;

    Parser(const char* begin, const char* end, const ParseOptions& opts) noexcept
        : ptr_(begin), end_(end), begin_(begin), opts_(opts)
        , max_depth_(opts.max_depth > 0 ? opts.max_depth : RDJSON_MAX_DEPTH) {}

    // ─── Error reporting ──────────────────────────────────────────────────

    [[nodiscard]] SourceLocation location_of(const char* at) const noexcept {
        SourceLocation loc;
        loc.offset = static_cast<size_t>(at - begin_);
        for (const char* p = begin_; p < at; ++p) {
            if (*p == '\n') { ++loc.line; loc.column = 1; }
            else { ++loc.column; }
        }
        return loc;
    }

    [[noreturn]] RDJSON_NOINLINE void fail(const char* at, const std::string& msg,
                                           errc code, const char* expected) const {
        throw ParseError(msg, location_of(at), code, expected);
    }

    /// no_match at the cursor: "expected <production>, got <what is there>".
    [[noreturn]] RDJSON_NOINLINE void fail_no_match(const char* expected) const {
        std::string got = ptr_ < end_ ? std::string("'") + *ptr_ + "'"
                                      : std::string("end of input");
        fail(ptr_, std::string("expected ") + expected + ", got " + got,
             errc::no_match, expected);
    }

    // ─── Cursor ───────────────────────────────────────────────────────────

    char peek() const noexcept {
        return RDJSON_LIKELY(ptr_ < end_) ? *ptr_ : '\0';
    }

    static bool is_digit(char c) noexcept {
        return static_cast<unsigned>(c - '0') <= 9u;
    }

    void skip_whitespace() noexcept {
        while (ptr_ < end_) {
            char c = *ptr_;
            if (c == ' ' || c == '\t' || c == '\n' || c == '\r') ++ptr_;
            else return;
        }
    }

    void skip_digits() noexcept {
        while (ptr_ < end_ && is_digit(*ptr_)) ++ptr_;
    }

    /// Consume the keyword if it is next; the cursor is untouched otherwise.
    template <size_t N>
    bool match_literal(const char (&literal)[N]) noexcept {
        constexpr size_t len = N - 1;
        if (static_cast<size_t>(end_ - ptr_) < len ||
            std::memcmp(ptr_, literal, len) != 0) {
            return false;
        }
        ptr_ += len;
        return true;
    }

    // ─── Value dispatcher ─────────────────────────────────────────────────

    /// @param depth  Number of arrays/objects enclosing this value.
    Value parse_value(size_t depth) {
        if (match_literal("null"))  return Value(nullptr);
        if (match_literal("true"))  return Value(true);
        if (match_literal("false")) return Value(false);

        const char c = peek();
        if (c == '+' || c == '-' || is_digit(c)) return Value(parse_number());
        if (c == '"') return Value(parse_string());
        if (c == '[') return parse_array(depth);
        if (c == '{') return parse_object(depth);
        fail_no_match("value");
    }

    // ─── Numbers ──────────────────────────────────────────────────────────

    /// [sign] digits ['.' digits] [('e'|'E') [sign] digits]
    Number parse_number() {
        const char* start = ptr_;
        bool negative = false;
        if (*ptr_ == '+' || *ptr_ == '-') {
            negative = (*ptr_ == '-');
            ++ptr_;
        }

        const char* digits = ptr_;
        if (RDJSON_UNLIKELY(!is_digit(peek()))) {
            fail(ptr_, "expected digit after sign", errc::malformed_number, "digit");
        }

        // Integer part, accumulated as magnitude; overflow only matters if
        // the literal stays an Int.
        constexpr uint64_t kCutoff = std::numeric_limits<uint64_t>::max() / 10;
        uint64_t magnitude = 0;
        bool overflow = false;
        while (ptr_ < end_ && is_digit(*ptr_)) {
            const auto digit = static_cast<uint64_t>(*ptr_ - '0');
            if (magnitude > kCutoff || (magnitude == kCutoff && digit > 5)) overflow = true;
            else magnitude = magnitude * 10 + digit;
            ++ptr_;
        }

        bool is_float = false;

        if (peek() == '.') {
            is_float = true;
            ++ptr_;
            if (RDJSON_UNLIKELY(!is_digit(peek()))) {
                fail(ptr_, "expected digit after decimal point",
                     errc::malformed_number, "digit");
            }
            skip_digits();
        }

        if (peek() == 'e' || peek() == 'E') {
            if (RDJSON_UNLIKELY(!is_float && !opts_.allow_bare_exponent)) {
                fail(ptr_, "exponent without fractional part",
                     errc::malformed_number, "'.'");
            }
            is_float = true;
            ++ptr_;
            if (peek() == '+' || peek() == '-') ++ptr_;
            if (RDJSON_UNLIKELY(!is_digit(peek()))) {
                fail(ptr_, "expected digit in exponent", errc::malformed_number, "digit");
            }
            skip_digits();
        }

        if (!is_float) {
            constexpr auto kMaxPos = static_cast<uint64_t>(std::numeric_limits<int64_t>::max());
            if (RDJSON_UNLIKELY(overflow || magnitude > kMaxPos + (negative ? 1 : 0))) {
                fail(start, "integer literal out of 64-bit range",
                     errc::malformed_number, "number");
            }
            if (negative) {
                // -(2^63) has no positive counterpart; negate in unsigned space.
                return Number::integer(static_cast<int64_t>(0 - magnitude));
            }
            return Number::integer(static_cast<int64_t>(magnitude));
        }

        const double value = to_double(start, digits);
        return Number::floating(negative ? -value : value);
    }

    /// Convert [digits, ptr_) in one step, so the result is the correctly
    /// rounded double of the literal. `start` is only used for error positions.
    /// Underflow yields the subnormal or zero nearest the literal; only
    /// overflow to infinity is an error.
    RDJSON_NOINLINE double to_double(const char* start, const char* digits) const {
#if defined(__cpp_lib_to_chars) && __cpp_lib_to_chars >= 201611L
        double value = 0.0;
        auto [p, ec] = std::from_chars(digits, ptr_, value);
        if (RDJSON_LIKELY(ec == std::errc{} && p == ptr_)) {
            return value;
        }
        if (ec != std::errc::result_out_of_range || p != ptr_) {
            fail(start, "invalid number", errc::malformed_number, "number");
        }
        // from_chars leaves value untouched on range errors; strtod reports
        // the rounded subnormal (or zero) for underflow and HUGE_VAL for overflow.
#endif
        std::string text(digits, ptr_);
        char* end_ptr = nullptr;
        const double converted = std::strtod(text.c_str(), &end_ptr);
        if (RDJSON_UNLIKELY(end_ptr != text.c_str() + text.size())) {
            fail(start, "invalid number", errc::malformed_number, "number");
        }
        if (RDJSON_UNLIKELY(std::isinf(converted))) {
            fail(start, "number out of double range", errc::malformed_number, "number");
        }
        return converted;
    }

    // ─── Strings ──────────────────────────────────────────────────────────

    /// '"' ... '"'; the cursor is on the opening quote.
    std::string parse_string() {
        const char* open = ptr_;
        ++ptr_;

        if (!opts_.decode_escapes) {
            const auto* close = static_cast<const char*>(
                std::memchr(ptr_, '"', static_cast<size_t>(end_ - ptr_)));
            if (RDJSON_UNLIKELY(close == nullptr)) fail_unterminated(open);
            std::string text(ptr_, static_cast<size_t>(close - ptr_));
            ptr_ = close + 1;
            return text;
        }

        std::string out;
        for (;;) {
            const char* run = ptr_;
            while (ptr_ < end_ && *ptr_ != '"' && *ptr_ != '\\') ++ptr_;
            out.append(run, static_cast<size_t>(ptr_ - run));

            if (RDJSON_UNLIKELY(ptr_ >= end_)) fail_unterminated(open);
            if (*ptr_ == '"') {
                ++ptr_;
                return out;
            }
            parse_escape(out);
        }
    }

    [[noreturn]] void fail_unterminated(const char* open) const {
        fail(end_, "unterminated string starting at offset " +
                       std::to_string(static_cast<size_t>(open - begin_)),
             errc::unterminated_string, "'\"'");
    }

    /// The cursor is on the backslash.
    void parse_escape(std::string& out) {
        const char* backslash = ptr_++;
        if (RDJSON_UNLIKELY(ptr_ >= end_)) fail_unterminated_escape(backslash);
        const char c = *ptr_++;
        switch (c) {
            case '"':  out.push_back('"');  return;
            case '\\': out.push_back('\\'); return;
            case '/':  out.push_back('/');  return;
            case 'b':  out.push_back('\b'); return;
            case 'f':  out.push_back('\f'); return;
            case 'n':  out.push_back('\n'); return;
            case 'r':  out.push_back('\r'); return;
            case 't':  out.push_back('\t'); return;
            case 'u':  parse_unicode_escape(backslash, out); return;
            default:
                fail(backslash, std::string("invalid escape '\\") + c + "'",
                     errc::invalid_escape, "escape sequence");
        }
    }

    [[noreturn]] void fail_unterminated_escape(const char* backslash) const {
        fail(backslash, "unterminated escape sequence", errc::invalid_escape,
             "escape sequence");
    }

    uint32_t parse_hex4(const char* backslash) {
        if (RDJSON_UNLIKELY(end_ - ptr_ < 4)) {
            fail(backslash, "incomplete unicode escape", errc::invalid_escape, "4 hex digits");
        }
        uint32_t val = 0;
        for (int i = 0; i < 4; ++i) {
            const char h = ptr_[i];
            uint32_t nib = 0;
            if (h >= '0' && h <= '9')      nib = static_cast<uint32_t>(h - '0');
            else if (h >= 'a' && h <= 'f') nib = static_cast<uint32_t>(h - 'a' + 10);
            else if (h >= 'A' && h <= 'F') nib = static_cast<uint32_t>(h - 'A' + 10);
            else fail(backslash, "invalid hex digit in unicode escape",
                      errc::invalid_escape, "4 hex digits");
            val = (val << 4) | nib;
        }
        ptr_ += 4;
        return val;
    }

    void parse_unicode_escape(const char* backslash, std::string& out) {
        uint32_t cp = parse_hex4(backslash);

        if (utf8::is_high_surrogate(cp)) {
            if (RDJSON_UNLIKELY(end_ - ptr_ < 2 || ptr_[0] != '\\' || ptr_[1] != 'u')) {
                fail(backslash, "missing low surrogate", errc::invalid_escape,
                     "low surrogate escape");
            }
            const char* second = ptr_;
            ptr_ += 2;
            const uint32_t low = parse_hex4(second);
            if (RDJSON_UNLIKELY(!utf8::is_low_surrogate(low))) {
                fail(second, "invalid low surrogate", errc::invalid_escape,
                     "low surrogate escape");
            }
            cp = utf8::combine_surrogates(cp, low);
        } else if (RDJSON_UNLIKELY(utf8::is_low_surrogate(cp))) {
            fail(backslash, "unpaired low surrogate", errc::invalid_escape,
                 "high surrogate escape");
        }

        char buf[4];
        out.append(buf, utf8::encode(cp, buf));
    }

    // ─── Arrays ───────────────────────────────────────────────────────────

    /// The cursor is on '['.
    Value parse_array(size_t depth) {
        enter(depth);
        ++ptr_;
        skip_whitespace();

        Array arr;
        if (peek() == ']') {
            ++ptr_;
            return Value(std::move(arr));
        }

        for (;;) {
            arr.push_back(parse_value(depth + 1));
            skip_whitespace();

            if (peek() == ',') {
                ++ptr_;
                skip_whitespace();
                continue;
            }
            if (RDJSON_LIKELY(peek() == ']')) {
                ++ptr_;
                return Value(std::move(arr));
            }
            fail_no_match("',' or ']'");
        }
    }

    // ─── Objects ──────────────────────────────────────────────────────────

    /// The cursor is on '{'.
    Value parse_object(size_t depth) {
        enter(depth);
        ++ptr_;
        skip_whitespace();

        Object obj;
        if (peek() == '}') {
            if (RDJSON_UNLIKELY(!opts_.allow_empty_object)) fail_no_match("string key");
            ++ptr_;
            return Value(std::move(obj));
        }

        for (;;) {
            if (RDJSON_UNLIKELY(peek() != '"')) fail_no_match("string key");
            std::string key = parse_string();
            skip_whitespace();

            if (RDJSON_UNLIKELY(peek() != ':')) fail_no_match("':'");
            ++ptr_;
            skip_whitespace();

            Value value = parse_value(depth + 1);
            obj.append(std::move(key), std::move(value));
            skip_whitespace();

            if (peek() == ',') {
                ++ptr_;
                skip_whitespace();
                continue;
            }
            if (RDJSON_LIKELY(peek() == '}')) {
                ++ptr_;
                obj.finalize();
                return Value(std::move(obj));
            }
            fail_no_match("',' or '}'");
        }
    }

    /// Check the limit before descending into a container at `depth`.
    void enter(size_t depth) const {
        if (RDJSON_UNLIKELY(depth + 1 > max_depth_)) {
            fail(ptr_, "maximum nesting depth of " + std::to_string(max_depth_) +
                           " exceeded", errc::depth_exceeded, "value");
        }
    }
};

} // namespace detail

// ─── Public parsing API ─────────────────────────────────────────────────────

/// @brief Parse a complete text into a Value tree.
/// @throws ParseError on the first grammar violation.
[[nodiscard]] inline Value parse(std::string_view input,
                                 const ParseOptions& opts = {}) {
    return detail::Parser::parse(input, opts);
}

/// @brief Parse a complete text; failures are returned, not thrown.
[[nodiscard]] inline result<Value> try_parse(std::string_view input,
                                             const ParseOptions& opts = {}) noexcept {
    return detail::Parser::try_parse(input, opts);
}

} // namespace rdjson
