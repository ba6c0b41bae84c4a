// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

// value.cpp - Value type utilities

#include <jsoncmp/value.h>
#include <jsoncmp/builders.h>
#include <jsoncmp/serialization.h>

#include <immer/vector_transient.hpp>

#include <algorithm>

namespace jsoncmp {

std::string_view type_name(JsonType type) noexcept
{
    switch (type) {
        case JsonType::Null:    return "null";
        case JsonType::Boolean: return "boolean";
        case JsonType::Number:  return "number";
        case JsonType::String:  return "string";
        case JsonType::Array:   return "array";
        case JsonType::Object:  return "object";
    }
    return "unknown";
}

// ============================================================
// ValueObject
// ============================================================

const Value* ValueObject::find(const std::string& key) const
{
    if (auto* position = index_.find(key)) {
        return &members_[*position].value.get();
    }
    return nullptr;
}

std::vector<std::string> ValueObject::keys() const
{
    std::vector<std::string> result;
    result.reserve(members_.size());
    for (const auto& member : members_) {
        result.push_back(member.key);
    }
    return result;
}

ValueObject ValueObject::set(std::string key, Value val) const
{
    if (auto* position = index_.find(key)) {
        return ValueObject{members_.set(*position, ObjectMember{std::move(key), ValueBox{std::move(val)}}),
                           index_};
    }
    const std::size_t position = members_.size();
    auto members = members_.push_back(ObjectMember{key, ValueBox{std::move(val)}});
    return ValueObject{std::move(members), index_.set(std::move(key), position)};
}

// ============================================================
// Value
// ============================================================

Value Value::object(std::initializer_list<std::pair<std::string, Value>> init)
{
    ObjectBuilder builder;
    for (const auto& [key, val] : init) {
        builder.set(key, val);
    }
    return builder.finish();
}

Value Value::array(std::initializer_list<Value> init)
{
    auto t = ValueArray{}.transient();
    for (const auto& val : init) {
        t.push_back(ValueBox{val});
    }
    return Value{t.persistent()};
}

JsonType Value::kind() const noexcept
{
    return std::visit([](const auto& arg) -> JsonType {
        using T = std::decay_t<decltype(arg)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
            return JsonType::Null;
        } else if constexpr (std::is_same_v<T, bool>) {
            return JsonType::Boolean;
        } else if constexpr (std::is_same_v<T, std::int64_t> || std::is_same_v<T, double>) {
            return JsonType::Number;
        } else if constexpr (std::is_same_v<T, std::string>) {
            return JsonType::String;
        } else if constexpr (std::is_same_v<T, ValueArray>) {
            return JsonType::Array;
        } else if constexpr (std::is_same_v<T, ValueObject>) {
            return JsonType::Object;
        } else {
            static_assert(detail::always_false_v<T>, "unhandled Value alternative");
        }
    }, data);
}

Value Value::at(const std::string& key) const
{
    if (auto* o = get_if<ValueObject>()) {
        if (auto* found = o->find(key)) return *found;
    }
    detail::log_key_error("Value::at", key, "not found or type mismatch");
    return Value{};
}

Value Value::at(std::size_t index) const
{
    if (auto* a = get_if<ValueArray>()) {
        if (index < a->size()) return (*a)[index].get();
    }
    detail::log_index_error("Value::at", index, "out of range or type mismatch");
    return Value{};
}

// ============================================================
// Equality
// ============================================================

bool operator==(const ValueObject& a, const ValueObject& b)
{
    if (a.size() != b.size()) {
        return false;
    }
    return std::all_of(a.begin(), a.end(), [&b](const ObjectMember& member) {
        const Value* other = b.find(member.key);
        return other != nullptr && member.value.get() == *other;
    });
}

bool operator==(const Value& a, const Value& b)
{
    if (a.data.index() != b.data.index()) {
        return false;
    }

    return std::visit([&b](const auto& lhs) -> bool {
        using T = std::decay_t<decltype(lhs)>;
        const auto& rhs = std::get<T>(b.data);

        if constexpr (std::is_same_v<T, std::monostate>) {
            return true;
        } else if constexpr (std::is_same_v<T, ValueArray>) {
            if (lhs.size() != rhs.size()) return false;
            for (std::size_t i = 0; i < lhs.size(); ++i) {
                // Shared boxes are trivially equal
                if (&lhs[i].get() == &rhs[i].get()) continue;
                if (!(lhs[i].get() == rhs[i].get())) return false;
            }
            return true;
        } else {
            return lhs == rhs;
        }
    }, a.data);
}

// ============================================================
// Debug helpers
// ============================================================

std::string value_to_string(const Value& val)
{
    return std::visit([](const auto& arg) -> std::string {
        using T = std::decay_t<decltype(arg)>;
        if constexpr (std::is_same_v<T, std::string>) {
            return "\"" + arg + "\"";
        } else if constexpr (std::is_same_v<T, bool>) {
            return arg ? "true" : "false";
        } else if constexpr (std::is_same_v<T, std::int64_t>) {
            return std::to_string(arg);
        } else if constexpr (std::is_same_v<T, double>) {
            return format_json_number(arg);
        } else if constexpr (std::is_same_v<T, ValueObject>) {
            return "{object:" + std::to_string(arg.size()) + "}";
        } else if constexpr (std::is_same_v<T, ValueArray>) {
            return "[array:" + std::to_string(arg.size()) + "]";
        } else {
            return "null";
        }
    }, val.data);
}

void print_value(const Value& val, std::ostream& os, const std::string& prefix, std::size_t depth)
{
    const std::string indent(depth * 2, ' ');

    std::visit(
        [&](const auto& arg) {
            using T = std::decay_t<decltype(arg)>;

            if constexpr (std::is_same_v<T, ValueObject>) {
                for (const auto& member : arg) {
                    os << indent << prefix << member.key << ":\n";
                    print_value(member.value.get(), os, "", depth + 1);
                }
            } else if constexpr (std::is_same_v<T, ValueArray>) {
                for (std::size_t i = 0; i < arg.size(); ++i) {
                    os << indent << prefix << "[" << i << "]:\n";
                    print_value(arg[i].get(), os, "", depth + 1);
                }
            } else if constexpr (std::is_same_v<T, std::string>) {
                os << indent << prefix << arg << "\n";
            } else {
                os << indent << prefix << value_to_string(val) << "\n";
            }
        },
        val.data);
}

std::string path_to_string(const Path& path)
{
    std::string result;
    for (const auto& elem : path) {
        std::visit([&](const auto& v) {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, std::string>) {
                result += "." + v;
            } else {
                result += "[" + std::to_string(v) + "]";
            }
        }, elem);
    }
    return result.empty() ? "/" : result;
}

} // namespace jsoncmp
