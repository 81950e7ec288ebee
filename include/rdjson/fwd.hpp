#pragma once

/// @file fwd.hpp
/// @brief Forward declarations and container types for rdjson.

#include "config.hpp"
#include "detail/hash.hpp"

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace rdjson {

// ─── Forward declarations ───────────────────────────────────────────────
class Value;
namespace detail { class Parser; } // Forward for friend access

/// Value variants.
enum class Type : uint8_t {
    Null   = 0,
    Bool   = 1,
    Number = 2,
    String = 3,
    Array  = 4,
    Object = 5
};

/// @brief Returns the name of a variant.
inline const char* type_name(Type t) noexcept {
    switch (t) {
        case Type::Null:   return "null";
        case Type::Bool:   return "bool";
        case Type::Number: return "number";
        case Type::String: return "string";
        case Type::Array:  return "array";
        case Type::Object: return "object";
    }
    return "unknown";
}

// ─── Containers ─────────────────────────────────────────────────────────

/// Array: elements in source order.
using Array = std::vector<Value>;

/// @brief Object: string keys mapped to values, keys unique.
///
/// Entries are kept in a vector; objects with at least
/// RDJSON_OBJECT_INDEX_THRESHOLD keys also carry a hash index from key to
/// entry position. The index is built once, when the object is constructed,
/// so const lookups never mutate and may run concurrently.
///
/// A key given twice keeps the last value. Entry order carries no meaning:
/// two objects compare equal when they hold the same key/value pairs.
class Object {
public:
    using value_type = std::pair<std::string, Value>;
    using storage_type = std::vector<value_type>;
    using size_type = size_t;
    using const_iterator = storage_type::const_iterator;

    Object() = default;
    ~Object();
    Object(const Object&);
    Object(Object&&) noexcept;
    Object& operator=(const Object&);
    Object& operator=(Object&&) noexcept;

    /// {{"key", value}, ...}; a repeated key keeps the last value.
    Object(std::initializer_list<value_type> init);

    [[nodiscard]] bool empty() const noexcept { return entries_.empty(); }
    [[nodiscard]] size_type size() const noexcept { return entries_.size(); }

    const_iterator begin()  const noexcept { return entries_.begin(); }
    const_iterator end()    const noexcept { return entries_.end(); }
    const_iterator cbegin() const noexcept { return entries_.cbegin(); }
    const_iterator cend()   const noexcept { return entries_.cend(); }

    /// Lookup; nullptr when the key is absent.
    [[nodiscard]] const Value* find(std::string_view key) const noexcept;
    [[nodiscard]] bool contains(std::string_view key) const noexcept;

    /// Throws OutOfRangeError (errc::key_not_found) when the key is absent.
    [[nodiscard]] const Value& at(std::string_view key) const;

    /// True once the hash index has been built.
    [[nodiscard]] bool indexed() const noexcept { return index_ != nullptr; }

    bool operator==(const Object& other) const;
    bool operator!=(const Object& other) const { return !(*this == other); }

private:
    friend class detail::Parser;

    using index_type = std::unordered_map<std::string_view, size_type,
                                          detail::StringHash,
                                          detail::StringEqual>;

    static constexpr size_type kIndexThreshold = RDJSON_OBJECT_INDEX_THRESHOLD;

    /// Append without duplicate checks; finalize() must follow.
    void append(std::string key, Value value);

    /// Drop earlier duplicates (last value wins) and build the index.
    void finalize();

    void rebuild_index();

    storage_type entries_;
    /// Index views point into entries_[i].first; rebuilt on every copy.
    std::unique_ptr<index_type> index_;
};

} // namespace rdjson
