/// @file test_debug.cpp
/// @brief Debug formatting of Number and Value (operator<<, to_debug_string).

#include <rdjson/rdjson.hpp>

#include <gtest/gtest.h>

#include <sstream>
#include <string>

using namespace rdjson;

namespace {

std::string show(const Number& n) {
    std::ostringstream os;
    os << n;
    return os.str();
}

} // namespace

// ═══════════════════════════════════════════════════════════════════════════════
// Scalars
// ═══════════════════════════════════════════════════════════════════════════════

TEST(Debug, NumberCases) {
    EXPECT_EQ(show(Number::integer(42)), "Int(42)");
    EXPECT_EQ(show(Number::integer(-7)), "Int(-7)");
    EXPECT_EQ(show(Number::floating(1.5)), "Float(1.5)");
    EXPECT_EQ(show(Number::floating(-0.25)), "Float(-0.25)");
}

TEST(Debug, WholeFloatKeepsDecimalPoint) {
    EXPECT_EQ(show(Number::floating(1.0)), "Float(1.0)");
    EXPECT_EQ(show(Number::floating(-80.0)), "Float(-80.0)");
    EXPECT_EQ(show(Number::floating(0.0)), "Float(0.0)");
}

TEST(Debug, Scalars) {
    EXPECT_EQ(to_debug_string(Value()), "Null");
    EXPECT_EQ(to_debug_string(Value(true)), "Bool(true)");
    EXPECT_EQ(to_debug_string(Value(false)), "Bool(false)");
    EXPECT_EQ(to_debug_string(Value(42)), "Number(Int(42))");
    EXPECT_EQ(to_debug_string(Value(2.5)), "Number(Float(2.5))");
    EXPECT_EQ(to_debug_string(Value("hi")), "String(\"hi\")");
}

TEST(Debug, StringEscaping) {
    EXPECT_EQ(to_debug_string(Value("a\"b\\c")), R"(String("a\"b\\c"))");
    EXPECT_EQ(to_debug_string(Value("l1\nl2\tx\r")), R"(String("l1\nl2\tx\r"))");
    EXPECT_EQ(to_debug_string(Value(std::string("\x01\x1f", 2))), R"(String("\x01\x1f"))");
}

// ═══════════════════════════════════════════════════════════════════════════════
// Containers
// ═══════════════════════════════════════════════════════════════════════════════

TEST(Debug, Arrays) {
    EXPECT_EQ(to_debug_string(Value(Array{})), "Array[]");
    EXPECT_EQ(to_debug_string(parse(R"([1, "a", null])")),
              R"(Array[Number(Int(1)), String("a"), Null])");
    EXPECT_EQ(to_debug_string(parse("[[1.0], []]")),
              "Array[Array[Number(Float(1.0))], Array[]]");
}

TEST(Debug, ObjectsInStoredOrder) {
    EXPECT_EQ(to_debug_string(parse(R"({"a": 1, "b": [true]})")),
              R"(Object{"a": Number(Int(1)), "b": Array[Bool(true)]})");
    EXPECT_EQ(to_debug_string(parse("{}", ParseOptions::relaxed())), "Object{}");
}

TEST(Debug, DistinguishesIntFromFloat) {
    EXPECT_NE(to_debug_string(parse("1")), to_debug_string(parse("1.0")));
    EXPECT_EQ(to_debug_string(parse("1e5")), "Number(Float(100000.0))");
}

TEST(Debug, UsedByGoogleTestPrinter) {
    EXPECT_EQ(::testing::PrintToString(parse("[true]")), "Array[Bool(true)]");
}
