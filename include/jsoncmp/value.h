// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file value.h
/// @brief Immutable Value type for parsed JSON documents.
///
/// Value is a tagged variant over the JSON shapes:
/// - Null (std::monostate), Boolean (bool), String (std::string)
/// - Number, stored as int64_t for integer literals that fit and double otherwise
/// - Array (immer::vector of boxed values)
/// - Object (ValueObject: ordered, unique keys, insertion order preserved)
///
/// Containers are immer persistent structures, so copying a Value is O(1)
/// and a tree can be shared freely once built.

#pragma once

#include <jsoncmp/jsoncmp_config.h>
#include <jsoncmp/api.h>
#include <jsoncmp/value_fwd.h>

#include <immer/box.hpp>
#include <immer/map.hpp>
#include <immer/vector.hpp>

#include <cstdint>
#include <functional>
#include <initializer_list>
#include <iostream>
#include <optional>
#include <source_location>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace jsoncmp {

namespace detail {

inline void log_access_error(
    std::string_view func,
    std::string_view message,
    std::source_location loc = std::source_location::current()) noexcept
{
#if JSONCMP_VERBOSE_LOG
    std::cerr << "[" << func << "] " << message
              << " (called from " << loc.file_name()
              << ":" << loc.line() << ")\n";
#else
    (void)func;
    (void)message;
    (void)loc;
#endif
}

inline void log_key_error(
    std::string_view func,
    std::string_view key,
    std::string_view reason,
    std::source_location loc = std::source_location::current()) noexcept
{
#if JSONCMP_VERBOSE_LOG
    std::cerr << "[" << func << "] key '" << key << "' " << reason
              << " (called from " << loc.file_name()
              << ":" << loc.line() << ")\n";
#else
    (void)func;
    (void)key;
    (void)reason;
    (void)loc;
#endif
}

inline void log_index_error(
    std::string_view func,
    std::size_t index,
    std::string_view reason,
    std::source_location loc = std::source_location::current()) noexcept
{
#if JSONCMP_VERBOSE_LOG
    std::cerr << "[" << func << "] index " << index << " " << reason
              << " (called from " << loc.file_name()
              << ":" << loc.line() << ")\n";
#else
    (void)func;
    (void)index;
    (void)reason;
    (void)loc;
#endif
}

template <typename>
inline constexpr bool always_false_v = false;

} // namespace detail

/// The six JSON shapes. Both numeric storage forms report Number.
enum class JsonType : std::uint8_t {
    Null,
    Boolean,
    Number,
    String,
    Array,
    Object
};

/// "null", "boolean", "number", "string", "array" or "object"
[[nodiscard]] JSONCMP_API std::string_view type_name(JsonType type) noexcept;

using ValueBox   = immer::box<Value, memory_policy>;
using ValueArray = immer::vector<ValueBox, memory_policy>;

struct ObjectMember {
    std::string key;
    ValueBox value;
};

// ============================================================
// ValueObject - ordered JSON object
//
// Members live in an immer::vector in insertion order; a parallel
// immer::map from key to position gives O(log n) lookup.
// ============================================================

class JSONCMP_API ValueObject {
public:
    using member_vector = immer::vector<ObjectMember, memory_policy>;
    using index_map     = immer::map<std::string,
                                     std::size_t,
                                     std::hash<std::string>,
                                     std::equal_to<std::string>,
                                     memory_policy>;
    using const_iterator = member_vector::const_iterator;

    ValueObject() = default;

    /// Value stored under key, nullptr when absent
    [[nodiscard]] const Value* find(const std::string& key) const;

    [[nodiscard]] bool contains(const std::string& key) const { return index_.count(key) > 0; }
    [[nodiscard]] std::size_t size() const noexcept { return members_.size(); }
    [[nodiscard]] bool empty() const noexcept { return members_.empty(); }

    [[nodiscard]] const_iterator begin() const { return members_.begin(); }
    [[nodiscard]] const_iterator end() const { return members_.end(); }

    /// Member at insertion position
    [[nodiscard]] const ObjectMember& operator[](std::size_t position) const { return members_[position]; }

    /// Keys in insertion order
    [[nodiscard]] std::vector<std::string> keys() const;

    /// Returns a new object with key bound to val.
    /// Replacing an existing key keeps its original position.
    [[nodiscard]] ValueObject set(std::string key, Value val) const;

private:
    friend class ObjectBuilder;

    ValueObject(member_vector members, index_map index)
        : members_(std::move(members)), index_(std::move(index)) {}

    member_vector members_;
    index_map index_;
};

// ============================================================
// Value
// ============================================================

struct JSONCMP_API Value
{
    using variant_type = std::variant<std::monostate,
                                      bool,
                                      std::int64_t,
                                      double,
                                      std::string,
                                      ValueArray,
                                      ValueObject>;

    variant_type data;

    Value() noexcept : data(std::monostate{}) {}
    Value(std::nullptr_t) noexcept : data(std::monostate{}) {}
    Value(bool v) noexcept : data(v) {}
    Value(int v) noexcept : data(std::int64_t{v}) {}
    Value(std::int64_t v) noexcept : data(v) {}
    Value(double v) noexcept : data(v) {}
    Value(const std::string& v) : data(v) {}
    Value(std::string&& v) noexcept : data(std::move(v)) {}
    Value(std::string_view v) : data(std::in_place_type<std::string>, v) {}
    Value(const char* v) : data(std::in_place_type<std::string>, v) {}
    Value(ValueArray v) : data(std::move(v)) {}
    Value(ValueObject v) : data(std::move(v)) {}

    // Factory functions for container types
    static Value object(std::initializer_list<std::pair<std::string, Value>> init);
    static Value array(std::initializer_list<Value> init);

    template <typename T>
    [[nodiscard]] const T* get_if() const { return std::get_if<T>(&data); }

    template <typename T>
    [[nodiscard]] bool is() const { return std::holds_alternative<T>(data); }

    [[nodiscard]] JsonType kind() const noexcept;

    [[nodiscard]] bool is_null() const noexcept { return is<std::monostate>(); }
    [[nodiscard]] bool is_bool() const noexcept { return is<bool>(); }
    [[nodiscard]] bool is_integer() const noexcept { return is<std::int64_t>(); }
    [[nodiscard]] bool is_number() const noexcept { return is<std::int64_t>() || is<double>(); }
    [[nodiscard]] bool is_string() const noexcept { return is<std::string>(); }
    [[nodiscard]] bool is_array() const noexcept { return is<ValueArray>(); }
    [[nodiscard]] bool is_object() const noexcept { return is<ValueObject>(); }
    [[nodiscard]] bool is_container() const noexcept { return is_array() || is_object(); }

    /// Member lookup; a null Value when absent or not an object
    [[nodiscard]] Value at(const std::string& key) const;

    /// Element lookup; a null Value when out of range or not an array
    [[nodiscard]] Value at(std::size_t index) const;

    [[nodiscard]] bool contains(const std::string& key) const {
        if (auto* o = get_if<ValueObject>()) return o->contains(key);
        return false;
    }

    [[nodiscard]] bool contains(std::size_t index) const {
        if (auto* a = get_if<ValueArray>()) return index < a->size();
        return false;
    }

    /// Member/element count for containers, 0 otherwise
    [[nodiscard]] std::size_t size() const noexcept {
        if (auto* o = get_if<ValueObject>()) return o->size();
        if (auto* a = get_if<ValueArray>()) return a->size();
        return 0;
    }

    [[nodiscard]] bool as_bool(bool default_val = false) const {
        if (auto* p = get_if<bool>()) return *p;
        return default_val;
    }

    [[nodiscard]] std::int64_t as_int64(std::int64_t default_val = 0) const {
        if (auto* p = get_if<std::int64_t>()) return *p;
        return default_val;
    }

    [[nodiscard]] double as_number(double default_val = 0.0) const {
        if (auto* p = get_if<double>()) return *p;
        if (auto* p = get_if<std::int64_t>()) return static_cast<double>(*p);
        return default_val;
    }

    [[nodiscard]] std::string as_string(std::string default_val = "") const {
        if (auto* p = get_if<std::string>()) return *p;
        return default_val;
    }
};

/// Structural equality: same alternative and same content.
/// Objects compare as key sets (member order is ignored); an integer
/// never equals a double here, see CompareOptions for numeric policy.
[[nodiscard]] JSONCMP_API bool operator==(const Value& a, const Value& b);
[[nodiscard]] JSONCMP_API bool operator==(const ValueObject& a, const ValueObject& b);

[[nodiscard]] inline bool operator==(const ObjectMember& a, const ObjectMember& b)
{
    return a.key == b.key && a.value.get() == b.value.get();
}

// ============================================================
// Utility functions
// ============================================================

/// Debug form of a value, e.g. "42", "\"text\"", "{object:3}", "[array:2]"
[[nodiscard]] JSONCMP_API std::string value_to_string(const Value& val);

/// Print Value with indentation
JSONCMP_API void print_value(const Value& val, std::ostream& os = std::cout,
                             const std::string& prefix = "", std::size_t depth = 0);

/// Convert Path to dot-notation string (e.g., ".users[0].name")
[[nodiscard]] JSONCMP_API std::string path_to_string(const Path& path);

} // namespace jsoncmp
