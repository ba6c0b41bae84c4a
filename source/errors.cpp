// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

#include <jsoncmp/errors.h>

namespace jsoncmp {

namespace {

std::string describe_roots(JsonType first, JsonType second)
{
    std::string message = "both documents must be JSON objects, got ";
    message += type_name(first);
    message += " and ";
    message += type_name(second);
    return message;
}

} // anonymous namespace

JsonParseError::JsonParseError(const std::string& message, std::size_t offset, std::size_t line,
                               std::size_t column)
    : Error(message + " at line " + std::to_string(line) + ", column " + std::to_string(column))
    , reason_(message)
    , offset_(offset)
    , line_(line)
    , column_(column)
{
}

InvalidRootType::InvalidRootType(JsonType first, JsonType second)
    : Error(describe_roots(first, second))
    , first_(first)
    , second_(second)
{
}

} // namespace jsoncmp
