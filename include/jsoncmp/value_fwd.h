// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file value_fwd.h
/// @brief Forward declarations for Value and Builder types
///
/// Lets headers declare functions taking or returning Value without
/// including the full value.h (and with it every immer container header).

#pragma once

#include <jsoncmp/jsoncmp_config.h>

#include <immer/memory_policy.hpp>

#include <cstddef>
#include <string>
#include <variant>
#include <vector>

namespace jsoncmp {

/// Memory policy shared by every immer container inside a Value tree
using memory_policy = immer::default_memory_policy;

struct Value;
class ValueObject;
struct ObjectMember;

class ObjectBuilder;
class ArrayBuilder;

using PathElement = std::variant<std::string, std::size_t>;
using Path        = std::vector<PathElement>;

} // namespace jsoncmp
