// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file json_pointer.h
/// @brief JSON Pointer (RFC 6901) style paths.
///
/// Addresses a position inside a document or a comparison tree:
///   "/users/0/name"  ->  ["users", 0, "name"]
///
/// RFC 6901: https://datatracker.ietf.org/doc/html/rfc6901
///
/// Key features:
/// - Paths start with "/" (root reference)
/// - Segments separated by "/"
/// - Numeric segments (e.g., "0", "123") are treated as array indices
/// - Escape sequences: "~0" -> "~", "~1" -> "/"
/// - Empty pointer "" refers to the whole document

#pragma once

#include <jsoncmp/api.h>
#include <jsoncmp/value.h>

#include <string>
#include <string_view>

namespace jsoncmp {

// Parse JSON Pointer string into Path
// Examples:
//   "/users/0/name"  -> ["users", 0, "name"]
//   "/config/theme"  -> ["config", "theme"]
//   ""               -> []  (root)
//   "/"              -> [""]  (key is empty string)
[[nodiscard]] JSONCMP_API Path parse_json_pointer(std::string_view pointer);

// Convert Path back to JSON Pointer string
[[nodiscard]] JSONCMP_API std::string path_to_json_pointer(const Path& path);

// Label a path element carries in a comparison tree ("name" or "0")
[[nodiscard]] JSONCMP_API std::string path_element_label(const PathElement& element);

// Value at path, null Value if path not found
[[nodiscard]] JSONCMP_API Value get_by_pointer(const Value& data, std::string_view pointer);

} // namespace jsoncmp
