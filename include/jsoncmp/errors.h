// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file errors.h
/// @brief Exception types raised by jsoncmp.
///
/// Error
///  +- JsonParseError   malformed JSON text (reader)
///  +- InvalidRootType  a compared document is not a JSON object (comparator)

#pragma once

#include <jsoncmp/api.h>
#include <jsoncmp/value.h>

#include <cstddef>
#include <stdexcept>
#include <string>

namespace jsoncmp {

/// Root of every exception thrown by the library
class JSONCMP_API Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Malformed JSON text. Position is reported as a byte offset and as a
/// 1-based line/column pair.
class JSONCMP_API JsonParseError : public Error {
public:
    JsonParseError(const std::string& message, std::size_t offset, std::size_t line, std::size_t column);

    [[nodiscard]] std::size_t offset() const noexcept { return offset_; }
    [[nodiscard]] std::size_t line() const noexcept { return line_; }
    [[nodiscard]] std::size_t column() const noexcept { return column_; }

    /// Message without the position suffix
    [[nodiscard]] const std::string& reason() const noexcept { return reason_; }

private:
    std::string reason_;
    std::size_t offset_;
    std::size_t line_;
    std::size_t column_;
};

/// Raised when either document handed to the comparator is not an object
class JSONCMP_API InvalidRootType : public Error {
public:
    InvalidRootType(JsonType first, JsonType second);

    [[nodiscard]] JsonType first_type() const noexcept { return first_; }
    [[nodiscard]] JsonType second_type() const noexcept { return second_; }
    [[nodiscard]] bool first_invalid() const noexcept { return first_ != JsonType::Object; }
    [[nodiscard]] bool second_invalid() const noexcept { return second_ != JsonType::Object; }

private:
    JsonType first_;
    JsonType second_;
};

} // namespace jsoncmp
