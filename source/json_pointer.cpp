// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

// json_pointer.cpp
// Implementation of JSON Pointer (RFC 6901) paths

#include <jsoncmp/json_pointer.h>

#include <algorithm>
#include <cctype>
#include <charconv>

namespace jsoncmp {

namespace {

/// Unescape a JSON Pointer segment according to RFC 6901
/// ~1 -> /, ~0 -> ~
std::string unescape_segment(std::string_view segment)
{
    std::string result;
    result.reserve(segment.size());

    for (size_t i = 0; i < segment.size(); ++i) {
        if (segment[i] == '~' && i + 1 < segment.size()) {
            if (segment[i + 1] == '1') {
                result += '/';
                ++i;
                continue;
            } else if (segment[i + 1] == '0') {
                result += '~';
                ++i;
                continue;
            }
        }
        result += segment[i];
    }

    return result;
}

/// Index value of a segment, or false when it is not a plain decimal index.
/// "-" (end of array) and leading zeros are keys per RFC 6901.
bool to_array_index(const std::string& s, std::size_t& index)
{
    if (s.empty() || (s.size() > 1 && s[0] == '0')) {
        return false;
    }
    if (!std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isdigit(c); })) {
        return false;
    }
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), index);
    return ec == std::errc{} && ptr == s.data() + s.size();
}

} // anonymous namespace

Path parse_json_pointer(std::string_view pointer)
{
    // Empty pointer refers to root
    if (pointer.empty()) {
        return Path{};
    }

    // JSON Pointer must start with '/'
    if (pointer[0] != '/') {
        detail::log_access_error("parse_json_pointer",
                                 "invalid pointer, must start with '/': " + std::string(pointer));
        return Path{};
    }

    Path path;

    // Skip leading '/'
    pointer = pointer.substr(1);

    while (true) {
        auto pos = pointer.find('/');
        std::string_view segment = (pos == std::string_view::npos)
                                    ? pointer
                                    : pointer.substr(0, pos);

        std::string unescaped = unescape_segment(segment);

        std::size_t index = 0;
        if (to_array_index(unescaped, index)) {
            path.emplace_back(index);
        } else {
            path.emplace_back(std::move(unescaped));
        }

        if (pos == std::string_view::npos) {
            break;
        }
        pointer = pointer.substr(pos + 1);
    }

    return path;
}

std::string path_to_json_pointer(const Path& path)
{
    if (path.empty()) {
        return "";  // Root reference
    }

    std::string result;
    for (const auto& elem : path) {
        result += '/';
        std::visit([&](const auto& v) {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, std::string>) {
                // Escape: ~ -> ~0, / -> ~1
                for (char c : v) {
                    if (c == '~') {
                        result += "~0";
                    } else if (c == '/') {
                        result += "~1";
                    } else {
                        result += c;
                    }
                }
            } else {
                result += std::to_string(v);
            }
        }, elem);
    }
    return result;
}

std::string path_element_label(const PathElement& element)
{
    if (auto* key = std::get_if<std::string>(&element)) {
        return *key;
    }
    return std::to_string(std::get<std::size_t>(element));
}

Value get_by_pointer(const Value& data, std::string_view pointer)
{
    const Value* current = &data;
    for (const auto& elem : parse_json_pointer(pointer)) {
        const Value* next = nullptr;
        if (auto* object = current->get_if<ValueObject>()) {
            // Numeric segments still name members of an object
            next = object->find(path_element_label(elem));
        } else if (auto* array = current->get_if<ValueArray>()) {
            if (auto* index = std::get_if<std::size_t>(&elem); index && *index < array->size()) {
                next = &(*array)[*index].get();
            }
        }
        if (!next) {
            detail::log_access_error("get_by_pointer", "path not found: " + std::string(pointer));
            return Value{};
        }
        current = next;
    }
    return *current;
}

} // namespace jsoncmp
