// test_json_pointer.cpp - Tests for JSON Pointer paths

#include <catch2/catch_all.hpp>
#include <jsoncmp/json_pointer.h>
#include <jsoncmp/serialization.h>

#include <string>

using namespace jsoncmp;

TEST_CASE("parse_json_pointer", "[path][pointer]") {
    SECTION("root") {
        REQUIRE(parse_json_pointer("").empty());
    }

    SECTION("keys and indices") {
        auto path = parse_json_pointer("/users/0/name");
        REQUIRE(path.size() == 3);
        REQUIRE(std::get<std::string>(path[0]) == "users");
        REQUIRE(std::get<std::size_t>(path[1]) == 0);
        REQUIRE(std::get<std::string>(path[2]) == "name");
    }

    SECTION("escapes") {
        auto path = parse_json_pointer("/a~1b/c~0d");
        REQUIRE(std::get<std::string>(path[0]) == "a/b");
        REQUIRE(std::get<std::string>(path[1]) == "c~d");
    }

    SECTION("empty key") {
        auto path = parse_json_pointer("/");
        REQUIRE(path.size() == 1);
        REQUIRE(std::get<std::string>(path[0]).empty());
    }

    SECTION("leading zero and dash are keys") {
        auto path = parse_json_pointer("/01/-");
        REQUIRE(std::holds_alternative<std::string>(path[0]));
        REQUIRE(std::holds_alternative<std::string>(path[1]));
    }

    SECTION("invalid pointer yields empty path") {
        REQUIRE(parse_json_pointer("no/slash").empty());
    }
}

TEST_CASE("path_to_json_pointer", "[path][pointer]") {
    REQUIRE(path_to_json_pointer(Path{}) == "");

    Path path{std::string("a/b"), std::size_t{2}, std::string("c~d")};
    REQUIRE(path_to_json_pointer(path) == "/a~1b/2/c~0d");
    REQUIRE(parse_json_pointer(path_to_json_pointer(path)) == path);
}

TEST_CASE("path_element_label", "[path]") {
    REQUIRE(path_element_label(PathElement{std::string("key")}) == "key");
    REQUIRE(path_element_label(PathElement{std::size_t{12}}) == "12");
}

TEST_CASE("get_by_pointer", "[path][pointer]") {
    auto doc = parse_json(R"({"users": [{"name": "Alice"}], "7": "seven"})");

    REQUIRE(get_by_pointer(doc, "/users/0/name").as_string() == "Alice");
    REQUIRE(get_by_pointer(doc, "/7").as_string() == "seven");
    REQUIRE(get_by_pointer(doc, "/users/3").is_null());
    REQUIRE(get_by_pointer(doc, "").is_object());
}
