// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

// render.cpp - display strings for comparison nodes

#include <jsoncmp/render.h>
#include <jsoncmp/serialization.h>

namespace jsoncmp {

namespace {

std::string count_label(std::size_t n, const char* singular, const char* plural)
{
    return std::to_string(n) + " " + (n == 1 ? singular : plural);
}

} // anonymous namespace

std::string render_value(const Value& val, const RenderOptions& options)
{
    std::string text = std::visit([&](const auto& arg) -> std::string {
        using T = std::decay_t<decltype(arg)>;

        if constexpr (std::is_same_v<T, std::monostate>) {
            return "null";
        } else if constexpr (std::is_same_v<T, bool>) {
            return arg ? "true" : "false";
        } else if constexpr (std::is_same_v<T, std::int64_t>) {
            return std::to_string(arg);
        } else if constexpr (std::is_same_v<T, double>) {
            return format_json_number(arg);
        } else if constexpr (std::is_same_v<T, std::string>) {
            return options.quote_strings ? "\"" + json_escape_string(arg) + "\"" : arg;
        } else if constexpr (std::is_same_v<T, ValueObject>) {
            if (options.containers == ContainerRendering::Summary) {
                return arg.empty() ? "{}" : "{" + count_label(arg.size(), "key", "keys") + "}";
            }
            return to_json(val, true);
        } else if constexpr (std::is_same_v<T, ValueArray>) {
            if (options.containers == ContainerRendering::Summary) {
                return arg.empty() ? "[]" : "[" + count_label(arg.size(), "item", "items") + "]";
            }
            return to_json(val, true);
        } else {
            static_assert(detail::always_false_v<T>, "unhandled Value alternative");
        }
    }, val.data);

    if (options.max_length > 0 && text.size() > options.max_length) {
        // Cut on a UTF-8 lead byte, never inside a multi-byte sequence
        std::size_t cut = options.max_length;
        while (cut > 0 && (static_cast<unsigned char>(text[cut]) & 0xC0) == 0x80) {
            --cut;
        }
        text.resize(cut);
        text += "...";
    }
    return text;
}

} // namespace jsoncmp
