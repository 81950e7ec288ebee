#pragma once

/// @file value.hpp
/// @brief Value: the tagged union a parse produces.
///
/// Implementation:
///   - Compact tagged union: 1-byte Type tag, 1-byte Number::Kind, 8-byte payload
///   - Scalars (bool, int64_t, double) stored inline
///   - String, Array and Object payloads owned through heap pointers
///   - Manual resource management (copy/move/destroy)
///
/// A Value is read-only once built: there are constructors, checked
/// accessors and comparison, but no mutation beyond whole-value assignment.

#include "config.hpp"
#include "error.hpp"
#include "fwd.hpp"
#include "number.hpp"

#include <cstddef>
#include <cstring>
#include <string>
#include <string_view>
#include <utility>

namespace rdjson {

class Value {
public:
    Value() noexcept : kind_(Type::Null), num_kind_(Number::Kind::Int) { u_.i = 0; }
    Value(std::nullptr_t) noexcept : Value() {}
    Value(bool v) noexcept : kind_(Type::Bool), num_kind_(Number::Kind::Int) { u_.i = 0; u_.b = v; }
    Value(Number n) noexcept : kind_(Type::Number), num_kind_(n.kind()) {
        if (n.is_int()) u_.i = n.as_int();
        else            u_.d = n.as_float();
    }
    Value(int v) noexcept : Value(Number::integer(v)) {}
    Value(int64_t v) noexcept : Value(Number::integer(v)) {}
    Value(double v) noexcept : Value(Number::floating(v)) {}
    Value(const char* v) : Value(std::string(v)) {}
    Value(std::string_view v) : Value(std::string(v)) {}
    Value(std::string v) : kind_(Type::String), num_kind_(Number::Kind::Int) {
        u_.str = new std::string(std::move(v));
    }
    Value(Array v) : kind_(Type::Array), num_kind_(Number::Kind::Int) {
        u_.arr = new Array(std::move(v));
    }
    Value(Object v) : kind_(Type::Object), num_kind_(Number::Kind::Int) {
        u_.obj = new Object(std::move(v));
    }

    Value(const Value& o) : kind_(o.kind_), num_kind_(o.num_kind_) {
        copy_payload(o);
    }
    Value(Value&& o) noexcept : kind_(o.kind_), num_kind_(o.num_kind_) {
        std::memcpy(&u_, &o.u_, sizeof(u_));
        o.kind_ = Type::Null;  // Only this is needed for destroy() to be a no-op
    }
    Value& operator=(const Value& o) {
        if (this != &o) { Value tmp(o); swap(tmp); }
        return *this;
    }
    Value& operator=(Value&& o) noexcept {
        if (this != &o) {
            destroy();
            kind_ = o.kind_;
            num_kind_ = o.num_kind_;
            std::memcpy(&u_, &o.u_, sizeof(u_));
            o.kind_ = Type::Null;
        }
        return *this;
    }
    ~Value() { destroy(); }

    void swap(Value& o) noexcept {
        std::swap(kind_, o.kind_);
        std::swap(num_kind_, o.num_kind_);
        Payload tmp;
        std::memcpy(&tmp, &u_, sizeof(u_));
        std::memcpy(&u_, &o.u_, sizeof(u_));
        std::memcpy(&o.u_, &tmp, sizeof(u_));
    }

    [[nodiscard]] Type type() const noexcept { return kind_; }
    [[nodiscard]] bool is_null()   const noexcept { return kind_ == Type::Null; }
    [[nodiscard]] bool is_bool()   const noexcept { return kind_ == Type::Bool; }
    [[nodiscard]] bool is_number() const noexcept { return kind_ == Type::Number; }
    [[nodiscard]] bool is_int()    const noexcept { return is_number() && num_kind_ == Number::Kind::Int; }
    [[nodiscard]] bool is_float()  const noexcept { return is_number() && num_kind_ == Number::Kind::Float; }
    [[nodiscard]] bool is_string() const noexcept { return kind_ == Type::String; }
    [[nodiscard]] bool is_array()  const noexcept { return kind_ == Type::Array; }
    [[nodiscard]] bool is_object() const noexcept { return kind_ == Type::Object; }

    bool as_bool() const {
        if (RDJSON_UNLIKELY(!is_bool())) throw_type_error("bool");
        return u_.b;
    }
    Number as_number() const {
        if (RDJSON_UNLIKELY(!is_number())) throw_type_error("number");
        return num_kind_ == Number::Kind::Int ? Number::integer(u_.i)
                                              : Number::floating(u_.d);
    }
    /// Strict: a Float is not read back as an integer.
    int64_t as_int() const { return as_number().as_int(); }
    /// Strict: an Int is not read back as a double.
    double as_float() const { return as_number().as_float(); }

    [[nodiscard]] const std::string& as_string() const {
        if (RDJSON_UNLIKELY(!is_string())) throw_type_error("string");
        return *u_.str;
    }
    [[nodiscard]] const Array& as_array() const {
        if (RDJSON_UNLIKELY(!is_array())) throw_type_error("array");
        return *u_.arr;
    }
    [[nodiscard]] const Object& as_object() const {
        if (RDJSON_UNLIKELY(!is_object())) throw_type_error("object");
        return *u_.obj;
    }

    const Value& operator[](size_t index) const {
        const auto& a = as_array();
        if (RDJSON_UNLIKELY(index >= a.size()))
            throw OutOfRangeError("array index " + std::to_string(index) +
                                  " out of range (size=" + std::to_string(a.size()) + ")");
        return a[index];
    }
    const Value& operator[](int index) const { return operator[](static_cast<size_t>(index)); }
    const Value& operator[](std::string_view key) const { return as_object().at(key); }
    const Value& operator[](const char* key) const { return as_object().at(key); }
    const Value& operator[](const std::string& key) const { return as_object().at(key); }

    [[nodiscard]] const Value* find(std::string_view key) const {
        return is_object() ? u_.obj->find(key) : nullptr;
    }
    [[nodiscard]] bool contains(std::string_view key) const {
        return is_object() && u_.obj->contains(key);
    }

    /// Element count for arrays and objects, 0 otherwise.
    [[nodiscard]] size_t size() const noexcept {
        if (is_array())  return u_.arr->size();
        if (is_object()) return u_.obj->size();
        return 0;
    }
    [[nodiscard]] bool empty() const noexcept {
        if (is_null())   return true;
        if (is_array())  return u_.arr->empty();
        if (is_object()) return u_.obj->empty();
        return false;
    }

    /// Deep structural equality. Numbers compare by case and payload,
    /// objects ignore entry order.
    [[nodiscard]] bool operator==(const Value& other) const {
        if (kind_ != other.kind_) return false;
        switch (kind_) {
            case Type::Null:   return true;
            case Type::Bool:   return u_.b == other.u_.b;
            case Type::Number: return as_number() == other.as_number();
            case Type::String: return *u_.str == *other.u_.str;
            case Type::Array:  return *u_.arr == *other.u_.arr;
            case Type::Object: return *u_.obj == *other.u_.obj;
        }
        return false;
    }
    [[nodiscard]] bool operator!=(const Value& other) const { return !(*this == other); }

private:
    Type kind_;
    Number::Kind num_kind_;  ///< Meaningful only when kind_ == Type::Number
    union Payload {
        bool b; int64_t i; double d;
        std::string* str;
        Array* arr;
        Object* obj;
    } u_;

    [[noreturn]] void throw_type_error(const char* expected) const {
        throw TypeError(std::string("expected ") + expected + ", got " + type_name(kind_));
    }

    void copy_payload(const Value& o) {
        switch (o.kind_) {
            case Type::String: u_.str = new std::string(*o.u_.str); break;
            case Type::Array:  u_.arr = new Array(*o.u_.arr); break;
            case Type::Object: u_.obj = new Object(*o.u_.obj); break;
            default:
                std::memcpy(&u_, &o.u_, sizeof(u_));
                break;
        }
    }

    void destroy() noexcept {
        switch (kind_) {
            case Type::String: delete u_.str; break;
            case Type::Array:  delete u_.arr; break;
            case Type::Object: delete u_.obj; break;
            default: break;
        }
    }
};

// ─── Object special member functions ─────────────────────────────────────

inline Object::~Object() = default;
inline Object::Object(const Object& o) : entries_(o.entries_) {
    if (o.index_) rebuild_index();
}
inline Object::Object(Object&& o) noexcept
    : entries_(std::move(o.entries_)), index_(std::move(o.index_)) {}
inline Object& Object::operator=(const Object& o) {
    if (this != &o) {
        entries_ = o.entries_;
        index_.reset();
        if (o.index_) rebuild_index();
    }
    return *this;
}
inline Object& Object::operator=(Object&& o) noexcept {
    if (this != &o) { entries_ = std::move(o.entries_); index_ = std::move(o.index_); }
    return *this;
}
inline Object::Object(std::initializer_list<value_type> init) {
    entries_.reserve(init.size());
    for (const auto& kv : init) append(kv.first, kv.second);
    finalize();
}

// ─── Object lookup ───────────────────────────────────────────────────────

inline const Value* Object::find(std::string_view key) const noexcept {
    if (index_) {
        auto it = index_->find(key);
        return it != index_->end() ? &entries_[it->second].second : nullptr;
    }
    for (const auto& [k, v] : entries_) if (k == key) return &v;
    return nullptr;
}
inline bool Object::contains(std::string_view key) const noexcept { return find(key) != nullptr; }
inline const Value& Object::at(std::string_view key) const {
    const auto* p = find(key);
    if (RDJSON_UNLIKELY(!p))
        throw OutOfRangeError("key not found: \"" + std::string(key) + "\"", errc::key_not_found);
    return *p;
}
inline bool Object::operator==(const Object& other) const {
    if (size() != other.size()) return false;
    for (const auto& [key, val] : entries_) {
        const auto* p = other.find(key);
        if (!p || *p != val) return false;
    }
    return true;
}

// ─── Object construction (parser side) ───────────────────────────────────

inline void Object::append(std::string key, Value value) {
    entries_.emplace_back(std::move(key), std::move(value));
}

inline void Object::rebuild_index() {
    if (!index_) index_ = std::make_unique<index_type>(entries_.size() * 2);
    else         index_->clear();
    for (size_type i = 0; i < entries_.size(); ++i)
        (*index_)[std::string_view(entries_[i].first)] = i;
}

inline void Object::finalize() {
    const size_type n = entries_.size();
    if (n >= kIndexThreshold) {
        // Forward pass: the index ends up pointing at the last occurrence.
        rebuild_index();
        if (index_->size() < n) {
            // Mark survivors before moving anything: the index holds views
            // into the keys being compacted.
            std::vector<bool> keep(n, false);
            for (const auto& slot : *index_) keep[slot.second] = true;
            index_->clear();
            size_type write = 0;
            for (size_type i = 0; i < n; ++i) {
                if (!keep[i]) continue;
                if (write != i) entries_[write] = std::move(entries_[i]);
                ++write;
            }
            entries_.resize(write);
            rebuild_index();
        }
        return;
    }
    // Small object: quadratic scan, keep an entry only if no later one shares its key.
    for (size_type i = 0; i < entries_.size();) {
        bool shadowed = false;
        for (size_type j = i + 1; j < entries_.size(); ++j) {
            if (entries_[i].first == entries_[j].first) { shadowed = true; break; }
        }
        if (RDJSON_UNLIKELY(shadowed))
            entries_.erase(entries_.begin() + static_cast<std::ptrdiff_t>(i));
        else
            ++i;
    }
}

} // namespace rdjson
