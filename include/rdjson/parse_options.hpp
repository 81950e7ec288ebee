#pragma once

/// @file parse_options.hpp
/// @brief Runtime grammar switches and limits for the parser.
///
/// The defaults accept the grammar
///
///   value   := null | bool | number | string | array | object
///   number  := ["+"|"-"] digit+ ["." digit+] [("e"|"E") ["+"|"-"] digit+]
///   array   := "[" ws (value ws ("," ws value ws)*)? "]"
///   object  := "{" ws pair ws ("," ws pair ws)* "}"
///
/// with JSON escapes decoded inside strings. Note that an object needs at
/// least one member unless allow_empty_object is set.

#include <cstddef>

namespace rdjson {

struct ParseOptions {
    // ─── Grammar switches ────────────────────────────────────────────────

    /// Decode \" \\ \/ \b \f \n \r \t \uXXXX in strings. When false, a string
    /// is everything up to the next '"', taken verbatim.
    bool decode_escapes         = true;

    /// Accept {} (by default an object must have at least one member).
    bool allow_empty_object     = false;

    /// Accept an exponent with no fractional part: 1e5, -2E-3.
    bool allow_bare_exponent    = true;

    /// Ignore anything after the root value instead of failing.
    bool allow_trailing_content = false;

    // ─── Limits ──────────────────────────────────────────────────────────

    /// Maximum nesting depth of arrays/objects (0 = RDJSON_MAX_DEPTH).
    size_t max_depth = 0;

    // ─── Factory methods ─────────────────────────────────────────────────

    static constexpr ParseOptions defaults() noexcept {
        return {};
    }

    /// The bare grammar above: strings verbatim, trailing content ignored.
    static constexpr ParseOptions verbatim() noexcept {
        ParseOptions opts;
        opts.decode_escapes         = false;
        opts.allow_trailing_content = true;
        return opts;
    }

    /// Defaults plus empty objects.
    static constexpr ParseOptions relaxed() noexcept {
        ParseOptions opts;
        opts.allow_empty_object = true;
        return opts;
    }
};

} // namespace rdjson
