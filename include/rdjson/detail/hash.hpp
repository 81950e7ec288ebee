#pragma once

/// @file hash.hpp
/// @brief String hashing for object key lookup.
///
/// Multiply-mix over 8-byte words, which keeps typical short JSON keys
/// ("id", "name", "timestamp") to one or two rounds. Transparent, so the
/// index can be probed with a std::string_view without building a string.

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <string>
#include <string_view>

namespace rdjson::detail {

struct StringHash {
    using is_transparent = void;

    static size_t hash(const char* data, size_t len) noexcept {
        constexpr uint64_t kMul1 = 0xa0761d6478bd642fULL;
        constexpr uint64_t kMul2 = 0xe7037ed1a0b428dbULL;

        uint64_t h = kMul1 ^ (static_cast<uint64_t>(len) * kMul2);
        size_t i = 0;
        for (; i + 8 <= len; i += 8) {
            uint64_t word;
            std::memcpy(&word, data + i, sizeof(word));
            h = (h ^ word) * kMul2;
            h ^= h >> 31;
        }
        // Tail: fewer than 8 bytes left, packed little end first.
        uint64_t tail = 0;
        for (size_t shift = 0; i < len; ++i, shift += 8) {
            tail |= static_cast<uint64_t>(static_cast<unsigned char>(data[i])) << shift;
        }
        h = (h ^ tail) * kMul1;

        h ^= h >> 32;
        h *= kMul1;
        h ^= h >> 29;
        return static_cast<size_t>(h);
    }

    size_t operator()(std::string_view sv) const noexcept {
        return hash(sv.data(), sv.size());
    }

    size_t operator()(const std::string& s) const noexcept {
        return hash(s.data(), s.size());
    }
};

/// @brief Transparent equality matching StringHash.
struct StringEqual {
    using is_transparent = void;

    bool operator()(std::string_view a, std::string_view b) const noexcept {
        return a == b;
    }
};

} // namespace rdjson::detail
