// test_value.cpp - Tests for Value, ValueObject and builders

#include <catch2/catch_all.hpp>
#include <jsoncmp/builders.h>
#include <jsoncmp/value.h>

#include <sstream>
#include <string>

using namespace jsoncmp;

// ============================================================
// Construction and type queries
// ============================================================

TEST_CASE("Value construction", "[value][basic]") {
    SECTION("default is null") {
        Value v;
        REQUIRE(v.is_null());
        REQUIRE(v.kind() == JsonType::Null);
    }

    SECTION("scalars") {
        REQUIRE(Value{true}.kind() == JsonType::Boolean);
        REQUIRE(Value{42}.is_integer());
        REQUIRE(Value{42}.kind() == JsonType::Number);
        REQUIRE(Value{1.5}.kind() == JsonType::Number);
        REQUIRE_FALSE(Value{1.5}.is_integer());
        REQUIRE(Value{"text"}.kind() == JsonType::String);
        REQUIRE(Value{std::string("text")}.as_string() == "text");
    }

    SECTION("containers") {
        auto obj = Value::object({{"a", 1}});
        auto arr = Value::array({1, 2, 3});
        REQUIRE(obj.kind() == JsonType::Object);
        REQUIRE(arr.kind() == JsonType::Array);
        REQUIRE(obj.is_container());
        REQUIRE(arr.size() == 3);
    }
}

TEST_CASE("type_name", "[value][basic]") {
    REQUIRE(type_name(JsonType::Null) == "null");
    REQUIRE(type_name(JsonType::Boolean) == "boolean");
    REQUIRE(type_name(JsonType::Number) == "number");
    REQUIRE(type_name(JsonType::String) == "string");
    REQUIRE(type_name(JsonType::Array) == "array");
    REQUIRE(type_name(JsonType::Object) == "object");
}

// ============================================================
// ValueObject
// ============================================================

TEST_CASE("ValueObject preserves insertion order", "[value][object]") {
    auto obj = Value::object({{"zeta", 1}, {"alpha", 2}, {"mid", 3}});
    const auto& members = *obj.get_if<ValueObject>();

    auto keys = members.keys();
    REQUIRE(keys.size() == 3);
    REQUIRE(keys[0] == "zeta");
    REQUIRE(keys[1] == "alpha");
    REQUIRE(keys[2] == "mid");

    SECTION("find") {
        REQUIRE(members.find("alpha") != nullptr);
        REQUIRE(members.find("alpha")->as_int64() == 2);
        REQUIRE(members.find("missing") == nullptr);
    }

    SECTION("set replaces in place") {
        auto updated = members.set("zeta", Value{"changed"});
        REQUIRE(updated.keys()[0] == "zeta");
        REQUIRE(updated.find("zeta")->as_string() == "changed");
        REQUIRE(updated.size() == 3);
        // original untouched
        REQUIRE(members.find("zeta")->as_int64() == 1);
    }

    SECTION("set appends new keys") {
        auto updated = members.set("new", Value{true});
        REQUIRE(updated.size() == 4);
        REQUIRE(updated[3].key == "new");
    }
}

TEST_CASE("Value accessors", "[value][access]") {
    auto doc = Value::object({
        {"name", "Alice"},
        {"tags", Value::array({"x", "y"})}
    });

    REQUIRE(doc.at("name").as_string() == "Alice");
    REQUIRE(doc.at("missing").is_null());
    REQUIRE(doc.at("tags").at(1).as_string() == "y");
    REQUIRE(doc.at("tags").at(5).is_null());
    REQUIRE(doc.contains("tags"));
    REQUIRE_FALSE(doc.contains("nope"));
    REQUIRE(doc.at("tags").contains(std::size_t{1}));

    SECTION("defaults for wrong type") {
        REQUIRE(doc.at("name").as_number(7.0) == 7.0);
        REQUIRE(doc.at("name").as_bool(true) == true);
        REQUIRE(Value{3}.as_number() == 3.0);
    }
}

// ============================================================
// Equality
// ============================================================

TEST_CASE("Value equality", "[value][equality]") {
    SECTION("object key order is ignored") {
        auto a = Value::object({{"x", 1}, {"y", 2}});
        auto b = Value::object({{"y", 2}, {"x", 1}});
        REQUIRE(a == b);
    }

    SECTION("arrays are positional") {
        REQUIRE(Value::array({1, 2}) == Value::array({1, 2}));
        REQUIRE_FALSE(Value::array({1, 2}) == Value::array({2, 1}));
    }

    SECTION("integer never equals double structurally") {
        REQUIRE_FALSE(Value{1} == Value{1.0});
    }

    SECTION("nested difference") {
        auto a = Value::object({{"o", Value::object({{"k", "v"}})}});
        auto b = Value::object({{"o", Value::object({{"k", "w"}})}});
        REQUIRE_FALSE(a == b);
    }
}

// ============================================================
// Builders
// ============================================================

TEST_CASE("ObjectBuilder", "[value][builder]") {
    SECTION("repeated key keeps first position") {
        ObjectBuilder builder;
        builder.set("a", 1).set("b", 2).set("a", 3);
        REQUIRE(builder.size() == 2);
        auto obj = builder.finish_object();
        REQUIRE(obj.keys()[0] == "a");
        REQUIRE(obj.find("a")->as_int64() == 3);
    }

    SECTION("extend existing object") {
        auto base = Value::object({{"a", 1}});
        ObjectBuilder builder(*base.get_if<ValueObject>());
        builder.set("b", 2);
        auto result = builder.finish();
        REQUIRE(result.size() == 2);
        REQUIRE(result.at("a").as_int64() == 1);
    }
}

TEST_CASE("ArrayBuilder", "[value][builder]") {
    ArrayBuilder builder;
    builder.push_back(1).push_back("two").push_back(Value{});
    REQUIRE(builder.size() == 3);
    auto arr = builder.finish();
    REQUIRE(arr.at(std::size_t{1}).as_string() == "two");
    REQUIRE(arr.at(std::size_t{2}).is_null());
}

// ============================================================
// Debug helpers
// ============================================================

TEST_CASE("value_to_string and path_to_string", "[value][utility]") {
    REQUIRE(value_to_string(Value{}) == "null");
    REQUIRE(value_to_string(Value{"s"}) == "\"s\"");
    REQUIRE(value_to_string(Value{2.0}) == "2.0");
    REQUIRE(value_to_string(Value::object({{"a", 1}})) == "{object:1}");
    REQUIRE(value_to_string(Value::array({1, 2})) == "[array:2]");

    Path path{std::string("users"), std::size_t{0}, std::string("name")};
    REQUIRE(path_to_string(path) == ".users[0].name");
    REQUIRE(path_to_string(Path{}) == "/");
}

TEST_CASE("print_value writes an indented dump", "[value][utility]") {
    std::ostringstream os;
    print_value(Value::object({{"a", Value::array({1})}}), os);
    REQUIRE(os.str() == "a:\n  [0]:\n    1\n");
}
