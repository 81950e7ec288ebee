#pragma once

/// @file testdata.hpp
/// @brief Input generators shared by the benchmark programs.
///
/// Every generator produces text both rdjson's default grammar and a strict
/// JSON parser accept (no empty objects, no escapes rdjson would treat
/// differently).

#include <cstdio>
#include <string>

namespace testdata {

/// Small object (~50 bytes): typical status message.
inline std::string small_json() {
    return R"({"name":"John","age":30,"active":true,"score":95.5})";
}

/// Medium document (~2KB): list of users.
inline std::string medium_json() {
    std::string s = R"({"users":[)";
    for (int i = 0; i < 20; ++i) {
        if (i > 0) s += ",";
        s += R"({"id":)" + std::to_string(i) +
             R"(,"name":"user_)" + std::to_string(i) +
             R"(","email":"user)" + std::to_string(i) +
             R"(@test.com","active":)" + (i % 2 == 0 ? "true" : "false") +
             R"(,"score":)" + std::to_string(50.0 + i * 2.5) + "}";
    }
    s += R"(],"total":20,"page":1,"version":"2.0"})";
    return s;
}

/// Large document (~200KB): records with text, numbers and tag arrays.
inline std::string large_json() {
    std::string s = R"({"data":[)";
    for (int i = 0; i < 1000; ++i) {
        if (i > 0) s += ",";
        s += R"({"id":)" + std::to_string(i) +
             R"(,"title":"Item )" + std::to_string(i) +
             R"( with a longer title")" +
             R"(,"description":"Record )" + std::to_string(i) +
             R"( carries enough text to look like real payload data.")" +
             R"(,"price":)" + std::to_string(9.99 + i * 0.1) +
             R"(,"quantity":)" + std::to_string(i % 100) +
             R"(,"tags":["tag)" + std::to_string(i % 10) +
             R"(","tag)" + std::to_string(i % 5) +
             R"(","common"],"active":)" + (i % 3 == 0 ? "false" : "true") + "}";
    }
    s += R"(],"meta":{"total":1000,"generated":true}})";
    return s;
}

/// [0,1,2,...,n-1]
inline std::string int_array(int n) {
    std::string s = "[";
    for (int i = 0; i < n; ++i) {
        if (i) s += ',';
        s += std::to_string(i);
    }
    return s + "]";
}

/// Floats, half of them in scientific notation.
inline std::string float_array(int n) {
    std::string s = "[";
    for (int i = 0; i < n; ++i) {
        if (i) s += ',';
        char buf[32];
        std::snprintf(buf, sizeof(buf), (i % 2) ? "%.6e" : "%.6f", i * 1.123456);
        s += buf;
    }
    return s + "]";
}

/// Strings of roughly avg_len bytes.
inline std::string string_array(int n, int avg_len) {
    std::string s = "[";
    const std::string payload(static_cast<size_t>(avg_len), 'x');
    for (int i = 0; i < n; ++i) {
        if (i) s += ',';
        s += '"';
        s += payload;
        s += std::to_string(i);
        s += '"';
    }
    return s + "]";
}

/// Objects nested `depth` levels deep.
inline std::string nested(int depth) {
    std::string s;
    for (int i = 0; i < depth; ++i)
        s += R"({"level":)" + std::to_string(i) + R"(,"child":)";
    s += "null";
    for (int i = 0; i < depth; ++i)
        s += "}";
    return s;
}

/// Flat object with n keys.
inline std::string flat_object(int n) {
    std::string s = "{";
    for (int i = 0; i < n; ++i) {
        if (i) s += ',';
        s += "\"key_" + std::to_string(i) + "\":" + std::to_string(i);
    }
    return s + "}";
}

} // namespace testdata
