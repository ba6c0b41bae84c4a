// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

// serialization.cpp - JSON reader and writer

#include <jsoncmp/serialization.h>
#include <jsoncmp/builders.h>

#include <algorithm>
#include <charconv>
#include <cmath>
#include <cstdio>
#include <sstream>

namespace jsoncmp {

// ============================================================
// Writer
// ============================================================

std::string json_escape_string(std::string_view s)
{
    std::string result;
    result.reserve(s.size() + 16);

    for (char c : s) {
        switch (c) {
            case '"':  result += "\\\""; break;
            case '\\': result += "\\\\"; break;
            case '\b': result += "\\b"; break;
            case '\f': result += "\\f"; break;
            case '\n': result += "\\n"; break;
            case '\r': result += "\\r"; break;
            case '\t': result += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    // Control characters as \uXXXX
                    char buf[7];
                    std::snprintf(buf, sizeof(buf), "\\u%04x",
                                  static_cast<unsigned int>(static_cast<unsigned char>(c)));
                    result += buf;
                } else {
                    result += c;
                }
        }
    }
    return result;
}

std::string format_json_number(double value)
{
    if (!std::isfinite(value)) {
        return "null";
    }
    char buf[32];
    auto [end, ec] = std::to_chars(buf, buf + sizeof(buf), value);
    if (ec != std::errc{}) {
        std::ostringstream oss;
        oss.precision(17);
        oss << value;
        return oss.str();
    }
    std::string text(buf, end);
    if (text.find_first_of(".eE") == std::string::npos) {
        text += ".0";
    }
    return text;
}

namespace {

void to_json_impl(const Value& val, std::ostringstream& oss, bool compact, int indent_level)
{
    const std::string indent = compact ? "" : std::string(indent_level * 2, ' ');
    const std::string child_indent = compact ? "" : std::string((indent_level + 1) * 2, ' ');
    const std::string newline = compact ? "" : "\n";
    const std::string space_after_colon = compact ? "" : " ";

    std::visit([&](const auto& arg) {
        using T = std::decay_t<decltype(arg)>;

        if constexpr (std::is_same_v<T, std::monostate>) {
            oss << "null";
        } else if constexpr (std::is_same_v<T, bool>) {
            oss << (arg ? "true" : "false");
        } else if constexpr (std::is_same_v<T, std::int64_t>) {
            oss << arg;
        } else if constexpr (std::is_same_v<T, double>) {
            oss << format_json_number(arg);
        } else if constexpr (std::is_same_v<T, std::string>) {
            oss << "\"" << json_escape_string(arg) << "\"";
        } else if constexpr (std::is_same_v<T, ValueObject>) {
            if (arg.empty()) {
                oss << "{}";
            } else {
                oss << "{" << newline;
                bool first = true;
                for (const auto& member : arg) {
                    if (!first) oss << "," << newline;
                    first = false;
                    oss << child_indent << "\"" << json_escape_string(member.key) << "\":" << space_after_colon;
                    to_json_impl(member.value.get(), oss, compact, indent_level + 1);
                }
                oss << newline << indent << "}";
            }
        } else if constexpr (std::is_same_v<T, ValueArray>) {
            if (arg.empty()) {
                oss << "[]";
            } else {
                oss << "[" << newline;
                bool first = true;
                for (const auto& v : arg) {
                    if (!first) oss << "," << newline;
                    first = false;
                    oss << child_indent;
                    to_json_impl(v.get(), oss, compact, indent_level + 1);
                }
                oss << newline << indent << "]";
            }
        } else {
            static_assert(detail::always_false_v<T>, "unhandled Value alternative");
        }
    }, val.data);
}

// ============================================================
// Reader
// ============================================================

class JsonParser {
public:
    JsonParser(std::string_view json, const ParseOptions& options)
        : json_(json), options_(options) {}

    Value parse() {
        skip_whitespace();
        if (pos_ >= json_.size()) {
            fail("empty JSON input");
        }
        Value result = parse_value();
        skip_whitespace();
        if (pos_ < json_.size()) {
            fail("unexpected trailing content");
        }
        return result;
    }

private:
    std::string_view json_;
    const ParseOptions& options_;
    std::size_t pos_ = 0;
    std::size_t depth_ = 0;

    [[noreturn]] void fail(const std::string& message) const {
        fail_at(message, pos_);
    }

    [[noreturn]] void fail_at(const std::string& message, std::size_t offset) const {
        std::size_t line = 1;
        std::size_t column = 1;
        const std::size_t limit = std::min(offset, json_.size());
        for (std::size_t i = 0; i < limit; ++i) {
            if (json_[i] == '\n') {
                ++line;
                column = 1;
            } else {
                ++column;
            }
        }
        throw JsonParseError(message, offset, line, column);
    }

    char peek() const {
        return pos_ < json_.size() ? json_[pos_] : '\0';
    }

    char consume() {
        return pos_ < json_.size() ? json_[pos_++] : '\0';
    }

    void skip_whitespace() {
        while (pos_ < json_.size()) {
            const char c = json_[pos_];
            if (c != ' ' && c != '\t' && c != '\n' && c != '\r') break;
            ++pos_;
        }
    }

    void expect(char c) {
        skip_whitespace();
        if (peek() != c) {
            fail(std::string("expected '") + c + "'");
        }
        ++pos_;
    }

    void enter_container() {
        if (++depth_ > options_.max_depth) {
            fail("maximum nesting depth of " + std::to_string(options_.max_depth) + " exceeded");
        }
    }

    Value parse_value() {
        skip_whitespace();
        const char c = peek();

        if (c == '{') return parse_object();
        if (c == '[') return parse_array();
        if (c == '"') return Value{parse_string_raw()};
        if (c == 't' || c == 'f') return parse_bool();
        if (c == 'n') return parse_null();
        if (c == '-' || (c >= '0' && c <= '9')) return parse_number();

        if (pos_ >= json_.size()) {
            fail("unexpected end of input");
        }
        fail("unexpected character '" + std::string(1, c) + "'");
    }

    Value parse_object() {
        expect('{');
        enter_container();
        skip_whitespace();

        ObjectBuilder builder;

        if (peek() == '}') {
            consume();
            --depth_;
            return builder.finish();
        }

        while (true) {
            skip_whitespace();
            const std::size_t key_offset = pos_;
            if (peek() != '"') {
                fail("expected string key");
            }
            std::string key = parse_string_raw();
            if (options_.duplicate_keys == DuplicateKeys::Reject && builder.contains(key)) {
                fail_at("duplicate key \"" + json_escape_string(key) + "\"", key_offset);
            }
            expect(':');
            builder.set(key, parse_value());

            skip_whitespace();
            const char c = peek();
            if (c == '}') {
                consume();
                break;
            }
            if (c != ',') {
                fail("expected ',' or '}' in object");
            }
            consume();
        }

        --depth_;
        return builder.finish();
    }

    Value parse_array() {
        expect('[');
        enter_container();
        skip_whitespace();

        ArrayBuilder builder;

        if (peek() == ']') {
            consume();
            --depth_;
            return builder.finish();
        }

        while (true) {
            builder.push_back(parse_value());

            skip_whitespace();
            const char c = peek();
            if (c == ']') {
                consume();
                break;
            }
            if (c != ',') {
                fail("expected ',' or ']' in array");
            }
            consume();
        }

        --depth_;
        return builder.finish();
    }

    unsigned parse_hex4() {
        if (pos_ + 4 > json_.size()) {
            fail("invalid unicode escape");
        }
        unsigned value = 0;
        for (int i = 0; i < 4; ++i) {
            const char h = json_[pos_++];
            value <<= 4;
            if (h >= '0' && h <= '9') {
                value |= static_cast<unsigned>(h - '0');
            } else if (h >= 'a' && h <= 'f') {
                value |= static_cast<unsigned>(h - 'a' + 10);
            } else if (h >= 'A' && h <= 'F') {
                value |= static_cast<unsigned>(h - 'A' + 10);
            } else {
                fail("invalid hex digit in unicode escape");
            }
        }
        return value;
    }

    static void append_utf8(std::string& out, unsigned codepoint) {
        if (codepoint < 0x80) {
            out += static_cast<char>(codepoint);
        } else if (codepoint < 0x800) {
            out += static_cast<char>(0xC0 | (codepoint >> 6));
            out += static_cast<char>(0x80 | (codepoint & 0x3F));
        } else if (codepoint < 0x10000) {
            out += static_cast<char>(0xE0 | (codepoint >> 12));
            out += static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F));
            out += static_cast<char>(0x80 | (codepoint & 0x3F));
        } else {
            out += static_cast<char>(0xF0 | (codepoint >> 18));
            out += static_cast<char>(0x80 | ((codepoint >> 12) & 0x3F));
            out += static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F));
            out += static_cast<char>(0x80 | (codepoint & 0x3F));
        }
    }

    std::string parse_string_raw() {
        expect('"');
        std::string result;

        while (pos_ < json_.size()) {
            const char c = consume();
            if (c == '"') {
                return result;
            }
            if (static_cast<unsigned char>(c) < 0x20) {
                fail("unescaped control character in string");
            }
            if (c != '\\') {
                result += c;
                continue;
            }
            if (pos_ >= json_.size()) {
                fail("unexpected end of string escape");
            }
            const char escaped = consume();
            switch (escaped) {
                case '"':  result += '"'; break;
                case '\\': result += '\\'; break;
                case '/':  result += '/'; break;
                case 'b':  result += '\b'; break;
                case 'f':  result += '\f'; break;
                case 'n':  result += '\n'; break;
                case 'r':  result += '\r'; break;
                case 't':  result += '\t'; break;
                case 'u': {
                    unsigned codepoint = parse_hex4();
                    if (codepoint >= 0xD800 && codepoint <= 0xDBFF) {
                        // High surrogate must be followed by an escaped low surrogate
                        if (json_.substr(pos_, 2) != "\\u") {
                            fail("unpaired surrogate in unicode escape");
                        }
                        pos_ += 2;
                        const unsigned low = parse_hex4();
                        if (low < 0xDC00 || low > 0xDFFF) {
                            fail("invalid low surrogate in unicode escape");
                        }
                        codepoint = 0x10000 + ((codepoint - 0xD800) << 10) + (low - 0xDC00);
                    } else if (codepoint >= 0xDC00 && codepoint <= 0xDFFF) {
                        fail("unpaired surrogate in unicode escape");
                    }
                    append_utf8(result, codepoint);
                    break;
                }
                default:
                    fail("invalid escape sequence: \\" + std::string(1, escaped));
            }
        }

        fail("unterminated string");
    }

    static bool is_digit(char c) {
        return c >= '0' && c <= '9';
    }

    Value parse_number() {
        const std::size_t start = pos_;
        bool integral = true;

        if (peek() == '-') consume();

        if (peek() == '0') {
            consume();
            if (is_digit(peek())) {
                fail("leading zeros are not allowed");
            }
        } else if (is_digit(peek())) {
            while (is_digit(peek())) consume();
        } else {
            fail("expected digit");
        }

        if (peek() == '.') {
            integral = false;
            consume();
            if (!is_digit(peek())) {
                fail("expected digit after decimal point");
            }
            while (is_digit(peek())) consume();
        }

        if (peek() == 'e' || peek() == 'E') {
            integral = false;
            consume();
            if (peek() == '+' || peek() == '-') consume();
            if (!is_digit(peek())) {
                fail("expected digit in exponent");
            }
            while (is_digit(peek())) consume();
        }

        const char* first = json_.data() + start;
        const char* last = json_.data() + pos_;

        if (integral) {
            std::int64_t value = 0;
            auto [ptr, ec] = std::from_chars(first, last, value);
            if (ec == std::errc{} && ptr == last) {
                return Value{value};
            }
            // Too large for int64_t: fall through to double
        }

        double value = 0.0;
        auto [ptr, ec] = std::from_chars(first, last, value);
        if (ec == std::errc::result_out_of_range) {
            fail_at("number out of range", start);
        }
        if (ec != std::errc{} || ptr != last) {
            fail_at("invalid number", start);
        }
        return Value{value};
    }

    Value parse_bool() {
        if (json_.substr(pos_, 4) == "true") {
            pos_ += 4;
            return Value{true};
        }
        if (json_.substr(pos_, 5) == "false") {
            pos_ += 5;
            return Value{false};
        }
        fail("expected 'true' or 'false'");
    }

    Value parse_null() {
        if (json_.substr(pos_, 4) == "null") {
            pos_ += 4;
            return Value{};
        }
        fail("expected 'null'");
    }
};

} // anonymous namespace

std::string to_json(const Value& val, bool compact)
{
    std::ostringstream oss;
    to_json_impl(val, oss, compact, 0);
    return oss.str();
}

Value parse_json(std::string_view text, const ParseOptions& options)
{
    JsonParser parser(text, options);
    return parser.parse();
}

Value from_json(const std::string& json_str, std::string* error_out)
{
    try {
        return parse_json(json_str);
    } catch (const JsonParseError& e) {
        detail::log_access_error("from_json", e.what());
        if (error_out) *error_out = e.what();
        return Value{};
    }
}

} // namespace jsoncmp
