// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file serialization.h
/// @brief JSON text reader and writer for Value.
///
/// Usage:
/// @code
///   #include <jsoncmp/serialization.h>
///
///   Value doc = parse_json(R"({"name": "Alice", "tags": [1, 2]})");
///   std::string text = to_json(doc);        // pretty-printed
///   std::string line = to_json(doc, true);  // compact
/// @endcode
///
/// Reader rules:
/// - RFC 8259 grammar, surrounding whitespace allowed, nothing else after the document
/// - Object member order is preserved
/// - Integer literals that fit int64_t are stored as int64_t, every other number as double
/// - Numbers whose magnitude overflows double are rejected
/// - \uXXXX escapes (including surrogate pairs) are decoded to UTF-8

#pragma once

#include <jsoncmp/api.h>
#include <jsoncmp/errors.h>
#include <jsoncmp/value.h>

#include <cstdint>
#include <string>
#include <string_view>

namespace jsoncmp {

/// How the reader treats a key repeated inside one object
enum class DuplicateKeys : std::uint8_t {
    LastWins, ///< keep the first position, take the last value
    Reject    ///< raise JsonParseError
};

struct ParseOptions {
    /// Maximum nesting of arrays/objects; deeper documents are rejected
    std::size_t max_depth = JSONCMP_DEFAULT_MAX_DEPTH;
    DuplicateKeys duplicate_keys = DuplicateKeys::LastWins;
};

// ============================================================
// Reader
// ============================================================

/// Parse JSON text into a Value
/// @throws JsonParseError on malformed input
[[nodiscard]] JSONCMP_API Value parse_json(std::string_view text, const ParseOptions& options = {});

/// Non-throwing reader
/// @param json_str The JSON string to parse
/// @param error_out If provided, receives error message on failure
/// @return Parsed Value, or null Value on parse error
[[nodiscard]] JSONCMP_API Value from_json(const std::string& json_str, std::string* error_out = nullptr);

// ============================================================
// Writer
// ============================================================

/// Convert Value to JSON string
/// @param val The Value to convert
/// @param compact If true, produce minimal output; if false, pretty-print with two-space indentation
[[nodiscard]] JSONCMP_API std::string to_json(const Value& val, bool compact = false);

/// Escape a string for use between JSON double quotes
[[nodiscard]] JSONCMP_API std::string json_escape_string(std::string_view s);

/// Shortest round-trip text for a double; integral values keep a ".0"
/// suffix so they stay distinguishable from integers ("1.0", "1.5", "1e+100")
[[nodiscard]] JSONCMP_API std::string format_json_number(double value);

} // namespace jsoncmp
