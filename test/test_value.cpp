// test_value.cpp - Tests for Value construction, access and equality

#include <catch2/catch_all.hpp>
#include <jsonrfc/builders.h>
#include <jsonrfc/value.h>

using namespace jsonrfc;

// ============================================================
// Construction Tests
// ============================================================

TEST_CASE("Value default construction", "[value][construction]") {
    Value v;
    REQUIRE(v.is_null());
    REQUIRE(v.type_index() == 6);  // std::monostate is last in variant
    REQUIRE(Value{nullptr}.is_null());
}

TEST_CASE("Value scalar construction", "[value][construction]") {
    SECTION("bool") {
        Value v{true};
        REQUIRE(v.is_bool());
        REQUIRE(v.as_bool() == true);
    }

    SECTION("int widens to int64_t") {
        Value v{42};
        REQUIRE(v.is<int64_t>());
        REQUIRE(v.as_int64() == 42);
        REQUIRE(v.is_number());
    }

    SECTION("double") {
        Value v{2.5};
        REQUIRE(v.is<double>());
        REQUIRE(v.as_number() == Catch::Approx(2.5));
    }

    SECTION("string from const char*") {
        Value v{"hello"};
        REQUIRE(v.is_string());
        REQUIRE(v.as_string() == "hello");
        REQUIRE(v.as_string_view() == "hello");
    }
}

TEST_CASE("Value container factories", "[value][construction]") {
    Value doc = Value::map({
        {"foo", Value::vector({1, 2, 3})},
        {"bar", Value::map({{"baz", "qux"}})},
    });

    REQUIRE(doc.is_map());
    REQUIRE(doc.size() == 2);
    REQUIRE(doc.at("foo").is_vector());
    REQUIRE(doc.at("foo").size() == 3);
    REQUIRE(doc.at("foo").at(std::size_t{1}) == Value{2});
    REQUIRE(doc.at("bar").at("baz") == Value{"qux"});
}

// ============================================================
// Access Tests
// ============================================================

TEST_CASE("Value find does not copy", "[value][access]") {
    Value doc = Value::map({{"a", Value::vector({"x"})}});

    const Value* a = doc.find("a");
    REQUIRE(a != nullptr);
    REQUIRE(a == doc.find("a"));
    REQUIRE(a->find(std::size_t{0}) != nullptr);

    SECTION("missing key") {
        REQUIRE(doc.find("b") == nullptr);
        REQUIRE(doc.at("b").is_null());
    }

    SECTION("index out of range") {
        REQUIRE(a->find(std::size_t{1}) == nullptr);
    }

    SECTION("type mismatch") {
        REQUIRE(doc.find(std::size_t{0}) == nullptr);
        REQUIRE(a->find("x") == nullptr);
        REQUIRE(Value{5}.find("a") == nullptr);
    }
}

// ============================================================
// Equality Tests
// ============================================================

TEST_CASE("Value structural equality", "[value][equality]") {
    SECTION("maps compare by content, not insertion order") {
        Value a = Value::map({{"x", 1}, {"y", 2}});
        Value b = Value::map({{"y", 2}, {"x", 1}});
        REQUIRE(a == b);
    }

    SECTION("nested differences are detected") {
        Value a = Value::map({{"x", Value::vector({1, 2})}});
        Value b = Value::map({{"x", Value::vector({1, 3})}});
        REQUIRE_FALSE(a == b);
    }

    SECTION("integer and double are distinct") {
        REQUIRE_FALSE(Value{1} == Value{1.0});
    }
}

// ============================================================
// Builder Tests
// ============================================================

TEST_CASE("Builders construct containers", "[value][builders]") {
    Value users = VectorBuilder()
        .push_back(MapBuilder().set("name", "Alice").finish())
        .push_back(MapBuilder().set("name", "Bob").finish())
        .finish();

    REQUIRE(users.size() == 2);
    REQUIRE(users.at(std::size_t{1}).at("name") == Value{"Bob"});
}

TEST_CASE("value_to_string renders compact JSON", "[value][string]") {
    Value doc = Value::map({
        {"b", Value::vector({1, true, nullptr})},
        {"a", "q\"uote"},
    });
    REQUIRE(value_to_string(doc) == R"({"a":"q\"uote","b":[1,true,null]})");
}
