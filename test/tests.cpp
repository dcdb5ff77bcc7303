#include <catch2/catch_all.hpp>

#include "sieve/sieve.hpp"

#include <array>
#include <cmath>
#include <limits>
#include <memory_resource>
#include <sstream>

using namespace Catch;

namespace {

    Sieve::value nested_arrays(size_t depth) {
        Sieve::value v;
        Sieve::value* cur = &v;
        for (size_t i = 0; i < depth; i++) {
            auto& arr = cur->as_array();
            if (i + 1 < depth) cur = &arr.emplace_back();
        }
        return v;
    }

    void expect_fail(std::string_view s, Sieve::ParseError::code code, const Sieve::ParseOptions& opts = {}) {
        auto r = Sieve::parse(s, opts);
        REQUIRE_FALSE(r);
        REQUIRE(r.error().errc == code);
    }
}

using Sieve::kind;
using Sieve::ParseError;


TEST_CASE("Parse Yields the Expected Kinds") {
    auto [text, expected] = GENERATE(table<std::string_view, kind>({
        { "null", kind::null },
        { " true ", kind::boolean },
        { "-12.5e1", kind::number },
        { R"("maxime")", kind::string },
        { "[1, [2], {}]", kind::array },
        { "\n{\"a\": {\"b\": null}}\t", kind::object },
    }));

    INFO("parsing: " << text);
    auto r = Sieve::parse(text);
    REQUIRE(r);
    REQUIRE(r->type() == expected);
}

TEST_CASE("Parse Numbers and Strings") {
    auto num = Sieve::parse("-12.5e1");
    REQUIRE(num);
    REQUIRE(num->as_number() == Approx(-125.0));

    auto large = Sieve::parse("1e308");
    REQUIRE(large);
    REQUIRE(std::isfinite(large->as_number()));

    auto escapes = Sieve::parse(R"("tab\tquote\"\u20AC\uD83D\uDE00")");
    REQUIRE(escapes);
    REQUIRE(escapes->as_string() == "tab\tquote\"\xE2\x82\xAC\xF0\x9F\x98\x80");
}

TEST_CASE("Parse Maps Numbers Beyond the double Range") {
    static constexpr double inf = std::numeric_limits<double>::infinity();

    auto [text, expected] = GENERATE(table<std::string_view, double>({
        { "1e400", inf },
        { "-1E+400", -inf },
        { "1" "000000000000000000000000000000000000000000000000000000000000000000000000000000"
              "000000000000000000000000000000000000000000000000000000000000000000000000000000"
              "000000000000000000000000000000000000000000000000000000000000000000000000000000"
              "000000000000000000000000000000000000000000000000000000000000000000000000000000", inf },
        { "1e-400", 0.0 },
        { "-0.0001e-400", -0.0 },
        { "123.5e-999999999999", 0.0 },
        { "0.00000000001e400", inf },
    }));

    INFO("parsing: " << text);
    auto r = Sieve::parse(text);
    REQUIRE(r);
    REQUIRE(r->as_number() == expected);
    REQUIRE(std::signbit(r->as_number()) == std::signbit(expected));
}

TEST_CASE("Parse Rejects Malformed Text") {
    expect_fail("", ParseError::code::unexpected_end_of_input);
    expect_fail("[1, 2", ParseError::code::unexpected_end_of_input);
    expect_fail("{\"a\":1} 0", ParseError::code::trailing_characters);
    expect_fail("null true", ParseError::code::trailing_characters);
    expect_fail("01", ParseError::code::invalid_number);
    expect_fail(R"("\uD83D")", ParseError::code::invalid_unicode_escape);
    expect_fail("{ // note\n \"x\": 1 }", ParseError::code::unexpected_character);
    REQUIRE_FALSE(Sieve::parse("\xC2\xA0" "1"));
    REQUIRE_FALSE(Sieve::parse("[1,]"));
}

TEST_CASE("Parse Options Relax the Grammar") {
    Sieve::ParseOptions relaxed{ .allow_comments = true, .allow_trailing_commas = true };

    auto r = Sieve::parse(R"(
        // user record
        {
            "name": "maxime", /* inline */
            "tags": [1, 2,],
        }
    )", relaxed);

    REQUIRE(r);
    REQUIRE(r->size() == 2);
    REQUIRE(r->at("tags").size() == 2);
}

TEST_CASE("Parse Depth Limit") {
    REQUIRE(Sieve::parse("[[[1]]]", { .max_depth = 3 }));
    expect_fail("[[[[1]]]]", ParseError::code::depth_limit_exceeded, { .max_depth = 3 });
    expect_fail(R"({"a":{"b":{"c":{}}}})", ParseError::code::depth_limit_exceeded, { .max_depth = 3 });
    REQUIRE(Sieve::parse("[[[[1]]]]"));
}

TEST_CASE("Parse Error Reports Its Position") {
    std::string s = "{\n  \"x\": 1,\n  oops\n}";
    auto r = Sieve::parse(s);
    REQUIRE_FALSE(r);

    const auto& e = r.error();
    REQUIRE(e.line == 3);
    REQUIRE(e.column >= 1);
    REQUIRE(e.offset <= s.size());
    REQUIRE_FALSE(e.msg.empty());
}

TEST_CASE("Parse Reads Streams") {
    std::istringstream is{ R"({"scores": [1, 2, 3]})" };
    auto r = Sieve::parse(is);
    REQUIRE(r);
    REQUIRE(r->at("scores").size() == 3);
}

TEST_CASE("Duplicate Keys Keep the First Position and the Last Value") {
    auto r = Sieve::parse(R"({"a":1,"b":2,"a":3})");
    REQUIRE(r);

    const auto& obj = r->as_object();
    REQUIRE(obj.size() == 2);
    REQUIRE(obj[0].key == "a");
    REQUIRE(obj[0].val.as_number() == Approx(3.0));
    REQUIRE(Sieve::dump(*r) == R"({"a":3,"b":2})");
}

TEST_CASE("Object Members Keep Insertion Order") {
    Sieve::value v;
    v["zeta"] = 1.0;
    v["alpha"] = 2.0;
    v["zeta"] = 4.0;
    v["mid"];

    const auto& obj = v.as_object();
    REQUIRE(obj.size() == 3);
    REQUIRE(obj[0].key == "zeta");
    REQUIRE(obj[1].key == "alpha");
    REQUIRE(obj[2].val.is_null());
    REQUIRE(Sieve::dump(v) == R"({"zeta":4,"alpha":2,"mid":null})");
}

TEST_CASE("Lookups Never Mutate") {
    auto r = Sieve::parse(R"({"a": 1, "b": null, "list": [true]})");
    REQUIRE(r);
    const Sieve::value& v = *r;

    REQUIRE(v.find("a")->as_number() == Approx(1.0));
    REQUIRE(v.find("b")->is_null());
    REQUIRE(v.find("c") == nullptr);
    REQUIRE_THROWS_AS(v.at("c"), std::out_of_range);

    const Sieve::value& list = v.at("list");
    REQUIRE(list[size_t{ 0 }].as_bool());
    REQUIRE(list[size_t{ 5 }].is_null());
    REQUIRE(v.at("a")[size_t{ 0 }].is_null());
    REQUIRE(v.at("a").find("x") == nullptr);
    REQUIRE(v.size() == 3);
    REQUIRE(v.at("a").size() == 0);
}

TEST_CASE("Mutable Indexing Builds Trees") {
    Sieve::value v;
    v["a"][2] = 42.0;

    REQUIRE(v.is_object());
    const auto& arr = v["a"].as_array();
    REQUIRE(arr.size() == 3);
    REQUIRE(arr[0].is_null());
    REQUIRE(arr[2].as_number() == Approx(42.0));
}

TEST_CASE("Equality is Structural and Copies are Deep") {
    auto a = Sieve::parse(R"({"x":1,"y":[true,"s"]})");
    REQUIRE(a);

    Sieve::value b = *a;
    REQUIRE(b == *a);

    b["y"].as_array().emplace_back(nullptr);
    REQUIRE(b != *a);
    REQUIRE(a->at("y").size() == 2);

    auto reordered = Sieve::parse(R"({"y":[true,"s"],"x":1})");
    REQUIRE(reordered);
    REQUIRE(*reordered != *a);
}

TEST_CASE("Values Allocate From Their memory_resource") {
    std::array<std::byte, 4096> buffer{};
    std::pmr::monotonic_buffer_resource pool{ buffer.data(), buffer.size(), std::pmr::null_memory_resource() };

    Sieve::value v{ &pool };
    v["name"] = Sieve::value{ "a string long enough to need its own allocation", &pool };
    v["tags"].as_array().emplace_back(1.0);

    REQUIRE(v.resource() == &pool);
    REQUIRE(v.at("name").as_string().get_allocator().resource() == &pool);

    Sieve::value copy = v;
    REQUIRE(copy.resource() == &pool);
    REQUIRE(copy == v);
}

TEST_CASE("Dump Writes Shortest Numbers") {
    REQUIRE(Sieve::dump(Sieve::value{ 25.0 }) == "25");
    REQUIRE(Sieve::dump(Sieve::value{ 1.2 }) == "1.2");
    REQUIRE(Sieve::dump(Sieve::value{ -0.5 }) == "-0.5");
    REQUIRE(Sieve::dump(Sieve::value{ 7 }) == "7");
    REQUIRE(Sieve::dump(Sieve::value{ std::numeric_limits<double>::quiet_NaN() }) == "null");
    REQUIRE(Sieve::dump(Sieve::value{ std::numeric_limits<double>::infinity() }) == "null");
}

TEST_CASE("Dump Escapes Strings") {
    REQUIRE(Sieve::dump(Sieve::value{ "a\"b\\c\n\x01" }) == R"("a\"b\\c\n\u0001")");
}

TEST_CASE("Dump Pretty Prints With Indent and Colon-Space") {
    auto r = Sieve::parse(R"({"a":[1,{}],"b":{"c":true}})");
    REQUIRE(r);

    const Sieve::WriteOptions opts{ .pretty = true, .indent = 2 };
    REQUIRE(Sieve::dump(*r, opts) ==
        "{\n  \"a\": [\n    1,\n    {}\n  ],\n  \"b\": {\n    \"c\": true\n  }\n}");

    std::ostringstream os;
    Sieve::dump(*r, os, opts);
    REQUIRE(os.str() == Sieve::dump(*r, opts));
}

TEST_CASE("Dumped Text Parses Back to an Equal Value") {
    auto text = GENERATE(as<std::string>{},
        "[]",
        "{}",
        R"([null,true,false,0,-1.5,"x"])",
        R"({"user":{"name":"maxime","tags":["a","b"],"age":25}})",
        R"([[[[{"deep":[1,2,{"deeper":null}]}]]]])");

    auto parsed = Sieve::parse(text);
    REQUIRE(parsed);

    for (bool pretty : { false, true }) {
        auto reparsed = Sieve::parse(Sieve::dump(*parsed, { .pretty = pretty }));
        REQUIRE(reparsed);
        REQUIRE(*reparsed == *parsed);
    }
}

TEST_CASE("try_dump Gives Up Beyond max_depth") {
    auto shallow = nested_arrays(3);
    auto deep = nested_arrays(10);

    auto ok = Sieve::try_dump(shallow, { .max_depth = 3 });
    REQUIRE(ok);
    REQUIRE(*ok == "[[[]]]");

    REQUIRE_FALSE(Sieve::try_dump(deep, { .max_depth = 3 }));
    REQUIRE(Sieve::try_dump(deep, { .max_depth = 0 }));
}
