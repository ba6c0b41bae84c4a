// test_render.cpp - Tests for render_value

#include <catch2/catch_all.hpp>
#include <jsoncmp/render.h>
#include <jsoncmp/value.h>

using namespace jsoncmp;

TEST_CASE("render_value scalars", "[render]") {
    REQUIRE(render_value(Value{}) == "null");
    REQUIRE(render_value(Value{true}) == "true");
    REQUIRE(render_value(Value{false}) == "false");
    REQUIRE(render_value(Value{-7}) == "-7");
    REQUIRE(render_value(Value{1.0}) == "1.0");
    REQUIRE(render_value(Value{2.5}) == "2.5");
    REQUIRE(render_value(Value{1e100}) == "1e+100");
}

TEST_CASE("render_value strings", "[render][string]") {
    SECTION("quoted by default") {
        REQUIRE(render_value(Value{"Alice"}) == "\"Alice\"");
        REQUIRE(render_value(Value{"say \"hi\""}) == "\"say \\\"hi\\\"\"");
    }

    SECTION("raw") {
        RenderOptions options;
        options.quote_strings = false;
        REQUIRE(render_value(Value{"say \"hi\""}, options) == "say \"hi\"");
    }

    SECTION("string that looks like a number stays distinguishable") {
        REQUIRE(render_value(Value{"1"}) != render_value(Value{1}));
    }
}

TEST_CASE("render_value containers", "[render][container]") {
    auto obj = Value::object({{"a", 1}, {"b", Value::array({true})}});
    auto arr = Value::array({1, 2});

    SECTION("compact JSON") {
        REQUIRE(render_value(obj) == R"({"a":1,"b":[true]})");
        REQUIRE(render_value(arr) == "[1,2]");
    }

    SECTION("summary") {
        RenderOptions options;
        options.containers = ContainerRendering::Summary;
        REQUIRE(render_value(obj, options) == "{2 keys}");
        REQUIRE(render_value(Value::object({{"a", 1}}), options) == "{1 key}");
        REQUIRE(render_value(arr, options) == "[2 items]");
        REQUIRE(render_value(Value::array({1}), options) == "[1 item]");
        REQUIRE(render_value(Value::object({}), options) == "{}");
        REQUIRE(render_value(Value::array({}), options) == "[]");
    }
}

TEST_CASE("render_value truncation", "[render]") {
    RenderOptions options;
    options.max_length = 5;
    REQUIRE(render_value(Value{"abcdefgh"}, options) == "\"abcd...");
    REQUIRE(render_value(Value{"ab"}, options) == "\"ab\"");
}

TEST_CASE("render_value truncation keeps UTF-8 sequences whole", "[render][string]") {
    RenderOptions options;
    options.quote_strings = false;

    // "\u00e9\u00e9" as two 2-byte sequences
    const Value accented{"\xC3\xA9\xC3\xA9"};

    SECTION("cut between sequences") {
        options.max_length = 2;
        REQUIRE(render_value(accented, options) == "\xC3\xA9...");
    }

    SECTION("cut inside a sequence backs off to its lead byte") {
        options.max_length = 3;
        REQUIRE(render_value(accented, options) == "\xC3\xA9...");
        options.max_length = 1;
        REQUIRE(render_value(accented, options) == "...");
    }

    SECTION("four-byte sequence") {
        // U+1F600 followed by 'x'
        const Value emoji{"\xF0\x9F\x98\x80x"};
        options.max_length = 3;
        REQUIRE(render_value(emoji, options) == "...");
        options.max_length = 4;
        REQUIRE(render_value(emoji, options) == "\xF0\x9F\x98\x80...");
    }

    SECTION("quoted strings count the quote") {
        options.quote_strings = true;
        options.max_length = 2;
        REQUIRE(render_value(accented, options) == "\"...");
    }
}
