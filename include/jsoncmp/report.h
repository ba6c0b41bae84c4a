// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file report.h
/// @brief Output forms for a ComparisonResult: Value/JSON, text tree, summary counts.
///
/// Text tree format (two spaces of indentation per level):
/// @code
///   = id: 1 | 1
///   ! tags:
///     = 0: "x" | "x"
///     ! 1: <missing> | "y"
/// @endcode

#pragma once

#include <jsoncmp/api.h>
#include <jsoncmp/comparison.h>
#include <jsoncmp/value.h>

#include <cstddef>
#include <iostream>
#include <string>
#include <string_view>

namespace jsoncmp {

/// "match", "missing_in_first", "missing_in_second",
/// "type_mismatch", "value_mismatch" or "child_mismatch"
[[nodiscard]] JSONCMP_API std::string_view status_name(NodeStatus status) noexcept;

/// Array of node objects with keys field, value1, value2, type1, type2,
/// matched, status and (containers only) children. Absent sides are null.
[[nodiscard]] JSONCMP_API Value comparison_to_value(const ComparisonResult& result);

[[nodiscard]] JSONCMP_API std::string comparison_to_json(const ComparisonResult& result, bool compact = false);

struct PrintOptions {
    /// Skip nodes that matched (with everything beneath them)
    bool only_mismatches = false;
};

JSONCMP_API void print_comparison(const ComparisonResult& result, std::ostream& os = std::cout,
                                  const PrintOptions& options = {});

struct ComparisonSummary {
    std::size_t total = 0;              ///< every node, containers included
    std::size_t matched = 0;            ///< nodes with matched == true
    std::size_t mismatched_leaves = 0;
    std::size_t missing_in_first = 0;
    std::size_t missing_in_second = 0;
    std::size_t type_mismatches = 0;
    std::size_t value_mismatches = 0;
};

[[nodiscard]] JSONCMP_API ComparisonSummary summarize(const ComparisonResult& result);

} // namespace jsoncmp
