// test_serialization.cpp - Tests for the JSON reader and writer

#include <catch2/catch_all.hpp>
#include <jsoncmp/serialization.h>
#include <jsoncmp/value.h>

#include <cstdint>
#include <string>
#include <vector>

using namespace jsoncmp;

// ============================================================
// Reader
// ============================================================

TEST_CASE("parse_json scalars and containers", "[serialization][parse]") {
    auto doc = parse_json(R"({"s": "text", "i": 42, "d": 1.5, "b": true, "n": null, "a": [1, 2], "o": {}})");

    REQUIRE(doc.is_object());
    REQUIRE(doc.at("s").as_string() == "text");
    REQUIRE(doc.at("i").is_integer());
    REQUIRE(doc.at("i").as_int64() == 42);
    REQUIRE(doc.at("d").is<double>());
    REQUIRE(doc.at("d").as_number() == 1.5);
    REQUIRE(doc.at("b").as_bool() == true);
    REQUIRE(doc.at("n").is_null());
    REQUIRE(doc.at("a").size() == 2);
    REQUIRE(doc.at("o").is_object());
    REQUIRE(doc.at("o").size() == 0);
}

TEST_CASE("parse_json number forms", "[serialization][parse][number]") {
    SECTION("integral literal with fraction is a double") {
        REQUIRE(parse_json("1.0").is<double>());
        REQUIRE(parse_json("1e2").is<double>());
    }

    SECTION("int64 boundaries") {
        REQUIRE(parse_json("9223372036854775807").as_int64() == INT64_MAX);
        REQUIRE(parse_json("-9223372036854775808").as_int64() == INT64_MIN);
        REQUIRE(parse_json("9223372036854775808").is<double>());
    }

    SECTION("out of range is rejected") {
        REQUIRE_THROWS_AS(parse_json("1e999"), JsonParseError);
    }

    SECTION("leading zeros are rejected") {
        REQUIRE_THROWS_AS(parse_json("01"), JsonParseError);
    }
}

TEST_CASE("parse_json strings", "[serialization][parse][string]") {
    REQUIRE(parse_json(R"("a\"b\\c\n")").as_string() == "a\"b\\c\n");
    REQUIRE(parse_json(R"("\u00e9")").as_string() == "\xC3\xA9");
    REQUIRE(parse_json(R"("\ud83d\ude00")").as_string() == "\xF0\x9F\x98\x80");
    REQUIRE_THROWS_AS(parse_json(R"("\ud83d")"), JsonParseError);
    REQUIRE_THROWS_AS(parse_json("\"a\x01\""), JsonParseError);
}

TEST_CASE("parse_json preserves key order", "[serialization][parse][object]") {
    auto doc = parse_json(R"({"b": 1, "a": 2, "c": 3})");
    auto keys = doc.get_if<ValueObject>()->keys();
    REQUIRE(keys == std::vector<std::string>{"b", "a", "c"});
}

TEST_CASE("parse_json duplicate keys", "[serialization][parse][object]") {
    const std::string text = R"({"a": 1, "b": 2, "a": 3})";

    SECTION("last value wins at first position") {
        auto doc = parse_json(text);
        REQUIRE(doc.size() == 2);
        REQUIRE(doc.get_if<ValueObject>()->keys()[0] == "a");
        REQUIRE(doc.at("a").as_int64() == 3);
    }

    SECTION("reject") {
        ParseOptions options;
        options.duplicate_keys = DuplicateKeys::Reject;
        REQUIRE_THROWS_AS(parse_json(text, options), JsonParseError);
    }
}

TEST_CASE("parse_json errors carry a position", "[serialization][parse][error]") {
    SECTION("line and column") {
        try {
            (void)parse_json("{\n  \"a\": tru\n}");
            FAIL("expected JsonParseError");
        } catch (const JsonParseError& e) {
            REQUIRE(e.line() == 2);
            REQUIRE(e.column() == 8);
            REQUIRE(e.offset() == 9);
            REQUIRE(std::string(e.what()).find("line 2, column 8") != std::string::npos);
        }
    }

    SECTION("empty input") {
        REQUIRE_THROWS_AS(parse_json(""), JsonParseError);
        REQUIRE_THROWS_AS(parse_json("   "), JsonParseError);
    }

    SECTION("trailing content") {
        REQUIRE_THROWS_AS(parse_json("{} {}"), JsonParseError);
        REQUIRE_NOTHROW((void)parse_json("  {}  \n"));
    }

    SECTION("trailing comma") {
        REQUIRE_THROWS_AS(parse_json("[1, 2,]"), JsonParseError);
        REQUIRE_THROWS_AS(parse_json(R"({"a": 1,})"), JsonParseError);
    }

    SECTION("parse errors are jsoncmp::Error") {
        REQUIRE_THROWS_AS(parse_json("{"), Error);
    }
}

TEST_CASE("parse_json depth limit", "[serialization][parse][depth]") {
    ParseOptions options;
    options.max_depth = 3;

    REQUIRE_NOTHROW((void)parse_json("[[[1]]]", options));
    REQUIRE_THROWS_AS(parse_json("[[[[1]]]]", options), JsonParseError);
}

TEST_CASE("from_json does not throw", "[serialization][parse]") {
    std::string error;
    auto bad = from_json("{\"a\": }", &error);
    REQUIRE(bad.is_null());
    REQUIRE_FALSE(error.empty());

    error.clear();
    auto good = from_json(R"({"a": 1})", &error);
    REQUIRE(good.is_object());
    REQUIRE(error.empty());
}

// ============================================================
// Writer
// ============================================================

TEST_CASE("to_json", "[serialization][write]") {
    auto doc = Value::object({
        {"name", "A\"B"},
        {"n", 1.0},
        {"list", Value::array({1, Value{}})},
        {"empty", Value::object({})}
    });

    SECTION("compact") {
        REQUIRE(to_json(doc, true) == R"({"name":"A\"B","n":1.0,"list":[1,null],"empty":{}})");
    }

    SECTION("pretty") {
        const std::string expected =
            "{\n"
            "  \"name\": \"A\\\"B\",\n"
            "  \"n\": 1.0,\n"
            "  \"list\": [\n"
            "    1,\n"
            "    null\n"
            "  ],\n"
            "  \"empty\": {}\n"
            "}";
        REQUIRE(to_json(doc) == expected);
    }

    SECTION("reparse gives an equal value") {
        REQUIRE(parse_json(to_json(doc)) == doc);
    }
}

TEST_CASE("format_json_number", "[serialization][write][number]") {
    REQUIRE(format_json_number(1.0) == "1.0");
    REQUIRE(format_json_number(1.5) == "1.5");
    REQUIRE(format_json_number(-0.25) == "-0.25");
    REQUIRE(format_json_number(1e100) == "1e+100");
    REQUIRE(format_json_number(0.1) == "0.1");
}

TEST_CASE("json_escape_string", "[serialization][write][string]") {
    REQUIRE(json_escape_string("plain") == "plain");
    REQUIRE(json_escape_string("a\"b") == "a\\\"b");
    REQUIRE(json_escape_string("tab\there") == "tab\\there");
    REQUIRE(json_escape_string(std::string("\x01", 1)) == "\\u0001");
}
