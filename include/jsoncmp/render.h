// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file render.h
/// @brief Human-readable rendering of values for comparison output.
///
/// render_value() produces the strings shown in ComparisonNode::value1/value2.
/// It has no comparison semantics of its own.

#pragma once

#include <jsoncmp/api.h>
#include <jsoncmp/value.h>

#include <cstdint>
#include <string>

namespace jsoncmp {

/// How containers are rendered when they appear on a leaf node
/// (a missing counterpart or a type mismatch)
enum class ContainerRendering : std::uint8_t {
    Json,    ///< compact JSON text: {"a":1}
    Summary  ///< size summary: {1 key}, [3 items]
};

struct RenderOptions {
    /// Render strings as quoted JSON literals; raw text when false
    bool quote_strings = true;
    ContainerRendering containers = ContainerRendering::Json;
    /// Truncate longer renderings to this many characters plus "..."; 0 disables
    std::size_t max_length = 0;
};

[[nodiscard]] JSONCMP_API std::string render_value(const Value& val, const RenderOptions& options = {});

} // namespace jsoncmp
