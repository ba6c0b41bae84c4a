// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file builders.h
/// @brief Builder classes for efficient O(n) construction of immutable Value containers.
///
/// - ObjectBuilder: Build a ValueObject, keeping insertion order
/// - ArrayBuilder:  Build a ValueArray
///
/// Usage:
/// @code
///   #include <jsoncmp/builders.h>
///
///   Value config = ObjectBuilder()
///       .set("width", 1920)
///       .set("height", 1080)
///       .set("fullscreen", true)
///       .finish();
///
///   Value items = ArrayBuilder()
///       .push_back("item1")
///       .push_back("item2")
///       .finish();
/// @endcode

#pragma once

#include "value.h"

#include <immer/map_transient.hpp>
#include <immer/vector_transient.hpp>

namespace jsoncmp {

/// Builder for constructing ValueObject efficiently - O(n) complexity
class ObjectBuilder {
public:
    using members_transient = ValueObject::member_vector::transient_type;
    using index_transient   = ValueObject::index_map::transient_type;

    ObjectBuilder()
        : members_(ValueObject::member_vector{}.transient())
        , index_(ValueObject::index_map{}.transient()) {}

    explicit ObjectBuilder(const ValueObject& existing)
        : members_(existing.members_.transient())
        , index_(existing.index_.transient()) {}

    // Move operations (allowed)
    ObjectBuilder(ObjectBuilder&&) noexcept = default;
    ObjectBuilder& operator=(ObjectBuilder&&) noexcept = default;

    // Copy operations (disabled - transient sharing is dangerous)
    ObjectBuilder(const ObjectBuilder&) = delete;
    ObjectBuilder& operator=(const ObjectBuilder&) = delete;

    /// Bind key to val. A repeated key keeps its first position and takes the new value.
    ObjectBuilder& set(const std::string& key, Value val) {
        if (auto* position = index_.find(key)) {
            members_.set(*position, ObjectMember{key, ValueBox{std::move(val)}});
        } else {
            index_.set(key, members_.size());
            members_.push_back(ObjectMember{key, ValueBox{std::move(val)}});
        }
        return *this;
    }

    [[nodiscard]] bool contains(const std::string& key) const {
        return index_.count(key) > 0;
    }

    [[nodiscard]] std::size_t size() const {
        return members_.size();
    }

    /// Finish building and return the object as a Value
    [[nodiscard]] Value finish() {
        return Value{finish_object()};
    }

    /// Finish building and return the bare ValueObject
    [[nodiscard]] ValueObject finish_object() {
        return ValueObject{members_.persistent(), index_.persistent()};
    }

private:
    members_transient members_;
    index_transient index_;
};

/// Builder for constructing ValueArray efficiently - O(n) complexity
class ArrayBuilder {
public:
    using transient_type = ValueArray::transient_type;

    ArrayBuilder() : transient_(ValueArray{}.transient()) {}
    explicit ArrayBuilder(const ValueArray& existing) : transient_(existing.transient()) {}

    ArrayBuilder(ArrayBuilder&&) noexcept = default;
    ArrayBuilder& operator=(ArrayBuilder&&) noexcept = default;

    ArrayBuilder(const ArrayBuilder&) = delete;
    ArrayBuilder& operator=(const ArrayBuilder&) = delete;

    ArrayBuilder& push_back(Value val) {
        transient_.push_back(ValueBox{std::move(val)});
        return *this;
    }

    [[nodiscard]] std::size_t size() const {
        return transient_.size();
    }

    [[nodiscard]] Value finish() {
        return Value{transient_.persistent()};
    }

private:
    transient_type transient_;
};

} // namespace jsoncmp
