// test_json_pointer.cpp - Tests for JSON Pointer parsing and formatting

#include <catch2/catch_all.hpp>
#include <jsonrfc/json_pointer.h>
#include <jsonrfc/pointer.h>

#include <string>

using namespace jsonrfc;

namespace {

Path parsed(std::string_view pointer)
{
    auto result = parse_json_pointer(pointer);
    REQUIRE(result.ok());
    return result.value();
}

} // namespace

// ============================================================
// Parsing Tests
// ============================================================

TEST_CASE("parse_json_pointer root forms", "[pointer][parse]") {
    SECTION("empty pointer is the whole document") {
        REQUIRE(parsed("").empty());
    }

    SECTION("lone slash is the empty key") {
        REQUIRE(parsed("/") == Path{""});
    }

    SECTION("trailing slash adds an empty key") {
        REQUIRE(parsed("/foo/") == Path{"foo", ""});
    }
}

TEST_CASE("parse_json_pointer splits segments", "[pointer][parse]") {
    REQUIRE(parsed("/foo/bar/4/baz") == Path{"foo", "bar", std::size_t{4}, "baz"});
}

TEST_CASE("parse_json_pointer rejects malformed pointers", "[pointer][parse]") {
    for (std::string bad : {"whatever", "foo/bar", " /foo", "#/foo"}) {
        auto result = parse_json_pointer(bad);
        REQUIRE_FALSE(result.ok());
        REQUIRE(result.error().code == ErrorCode::InvalidPointer);
    }
}

TEST_CASE("parse_json_pointer integer disambiguation", "[pointer][parse]") {
    SECTION("plain digits are indices") {
        REQUIRE(parsed("/8") == Path{std::size_t{8}});
        REQUIRE(parsed("/123") == Path{std::size_t{123}});
    }

    SECTION("zero is an index") {
        REQUIRE(parsed("/0") == Path{std::size_t{0}});
    }

    SECTION("leading zero stays a key") {
        REQUIRE(parsed("/03") == Path{"03"});
        REQUIRE(parsed("/00") == Path{"00"});
    }

    SECTION("trailing non-digits stay a key") {
        REQUIRE(parsed("/8bar") == Path{"8bar"});
    }

    SECTION("signs stay keys") {
        REQUIRE(parsed("/-1") == Path{"-1"});
        REQUIRE(parsed("/+5") == Path{"+5"});
    }

    SECTION("append marker stays a key") {
        REQUIRE(parsed("/foo/-") == Path{"foo", "-"});
    }

    SECTION("digits too large for an index stay a key") {
        REQUIRE(parsed("/99999999999999999999999") == Path{"99999999999999999999999"});
    }
}

TEST_CASE("parse_json_pointer escape order", "[pointer][parse][escape]") {
    SECTION("~1 is decoded before ~0") {
        REQUIRE(parsed("/~10/~01/~0/~1") == Path{"/0", "~1", "~", "/"});
    }

    SECTION("escaped slash does not split") {
        REQUIRE(parsed("/a~1b/c") == Path{"a/b", "c"});
    }

    SECTION("backslash escapes are decoded first") {
        REQUIRE(parsed(R"(/say \"hi\")") == Path{R"(say "hi")"});
        REQUIRE(parsed(R"(/back\\slash)") == Path{R"(back\slash)"});
    }

    SECTION("an escaped digit key is still classified") {
        REQUIRE(parsed("/~01") == Path{"~1"});
    }
}

// ============================================================
// Formatting Tests
// ============================================================

TEST_CASE("path_to_json_pointer", "[pointer][format]") {
    REQUIRE(path_to_json_pointer(Path{}) == "");
    REQUIRE(path_to_json_pointer(Path{""}) == "/");
    REQUIRE(path_to_json_pointer(Path{"users", std::size_t{0}, "name"}) == "/users/0/name");
    REQUIRE(path_to_json_pointer(Path{"a/b", "~x"}) == "/a~1b/~0x");
}

TEST_CASE("formatted pointers parse back to the same path", "[pointer][format]") {
    const Path path{"a/b", "~1", R"(q"b\s)", std::size_t{7}, "", "-"};
    REQUIRE(parsed(path_to_json_pointer(path)) == path);
}

TEST_CASE("digit-only string keys come back as indices", "[pointer][format]") {
    REQUIRE(path_to_json_pointer(Path{"7"}) == "/7");
    REQUIRE(parsed("/7") == Path{std::size_t{7}});
    REQUIRE(parsed(path_to_json_pointer(Path{"a", "0"})) == Path{"a", std::size_t{0}});

    SECTION("keys that cannot be indices survive") {
        const Path path{"07", "-", "8x"};
        REQUIRE(parsed(path_to_json_pointer(path)) == path);
    }
}

TEST_CASE("pointer text and parsed path address the same value", "[pointer][format]") {
    Value doc = Value::map({
        {"a/b", Value::map({{"~", Value::vector({10, 20})}})},
        {"03", "leading zero key"},
        {"7", "numeric key"},
    });

    for (std::string pointer : {"/a~1b/~0/1", "/03", "/7", "/a~1b/~0/5", "/missing"}) {
        auto by_text = fetch(doc, pointer);
        auto by_path = fetch(doc, parsed(pointer));
        REQUIRE(by_text == by_path);
    }
}

TEST_CASE("resolve_pointer and pointer_text", "[pointer][ref]") {
    REQUIRE(resolve_pointer(PointerRef{"/x/1"}).value() == Path{"x", std::size_t{1}});
    REQUIRE(resolve_pointer(PointerRef{Path{"y"}}).value() == Path{"y"});
    REQUIRE(resolve_pointer(PointerRef{"nope"}).error().code == ErrorCode::InvalidPointer);

    REQUIRE(pointer_text(PointerRef{"/raw~1text"}) == "/raw~1text");
    REQUIRE(pointer_text(PointerRef{Path{"a/b"}}) == "/a~1b");
}
