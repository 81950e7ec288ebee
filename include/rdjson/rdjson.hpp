#pragma once

/// @file rdjson.hpp
/// @brief Main header file for the rdjson library.
///
/// @code
///   auto v = rdjson::parse(R"({"a": 1, "b": [1.5, "x"]})");
///   v["a"].as_int();            // 1
///   v["b"][0].as_float();       // 1.5
///
///   auto r = rdjson::try_parse("[1, 2,]");
///   if (!r) std::cerr << r.ec.message() << " at offset " << r.location.offset;
/// @endcode

#include "config.hpp"
#include "fwd.hpp"
#include "error.hpp"
#include "number.hpp"
#include "value.hpp"
#include "parse_options.hpp"
#include "parser.hpp"
#include "debug.hpp"
