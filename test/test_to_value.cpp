// test_to_value.cpp - Tests for converting serializable values into Value trees
// Module 2: Value assembler and composite builders

#include "test_helpers.h"

#include <mpvalue/to_value.h>

#include <array>
#include <cstdint>
#include <iostream>
#include <limits>
#include <map>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <tuple>
#include <utility>
#include <variant>
#include <vector>

using namespace mpvalue;

namespace {

// ============================================================
// Test producers
// ============================================================

struct Point {
    int32_t x;
    int32_t y;

    template <Serializer S>
    typename S::ok_type serialize(S& s) const {
        auto st = s.serialize_struct("Point", 2);
        st.serialize_field("x", x);
        st.serialize_field("y", y);
        return st.end();
    }
};

struct Marker {
    template <Serializer S>
    typename S::ok_type serialize(S& s) const {
        return s.serialize_unit_struct("Marker");
    }
};

struct Meters {
    double value;

    template <Serializer S>
    typename S::ok_type serialize(S& s) const {
        return s.serialize_newtype_struct("Meters", value);
    }
};

struct Rgb {
    uint8_t r, g, b;

    template <Serializer S>
    typename S::ok_type serialize(S& s) const {
        auto st = s.serialize_tuple_struct("Rgb", 3);
        st.serialize_field(r);
        st.serialize_field(g);
        st.serialize_field(b);
        return st.end();
    }
};

// enum E { A, B, C, D, X(i32), T(i32, String, f64), S { a: bool, b: Option<i32> } }
struct UnitAlt {
    template <Serializer S>
    typename S::ok_type serialize(S& s) const {
        return s.serialize_unit_variant("E", 3, "D");
    }
};

struct NewtypeAlt {
    int32_t v;

    template <Serializer S>
    typename S::ok_type serialize(S& s) const {
        return s.serialize_newtype_variant("E", 3, "X", v);
    }
};

struct TupleAlt {
    template <Serializer S>
    typename S::ok_type serialize(S& s) const {
        auto tv = s.serialize_tuple_variant("E", 1, "T", 3);
        tv.serialize_field(1);
        tv.serialize_field(std::string{"two"});
        tv.serialize_field(3.0);
        return tv.end();
    }
};

struct StructAlt {
    template <Serializer S>
    typename S::ok_type serialize(S& s) const {
        auto sv = s.serialize_struct_variant("E", 2, "S", 2);
        sv.serialize_field("a", true);
        sv.serialize_field("b", std::optional<int32_t>{});
        return sv.end();
    }
};

// Map entries written in a fixed order, possibly repeating keys
struct OrderedPairs {
    std::vector<std::pair<std::string, int>> entries;

    template <Serializer S>
    typename S::ok_type serialize(S& s) const {
        auto map = s.serialize_map(entries.size());
        for (const auto& [k, v] : entries) {
            map.serialize_key(k);
            map.serialize_value(v);
        }
        return map.end();
    }
};

struct RekeyedMap {
    template <Serializer S>
    typename S::ok_type serialize(S& s) const {
        auto map = s.serialize_map(std::nullopt);
        map.serialize_key("a");
        map.serialize_key("b");
        map.serialize_value(1);
        return map.end();
    }
};

// Declares more elements than it writes
struct ShortSeq {
    template <Serializer S>
    typename S::ok_type serialize(S& s) const {
        auto seq = s.serialize_seq(10);
        seq.serialize_element(1);
        return seq.end();
    }
};

} // namespace

// ============================================================
// Primitive Tests
// ============================================================

TEST_CASE("to_value integers keep magnitude and sign class", "[to_value][primitive]") {
    SECTION("u8 255") {
        auto v = to_value(uint8_t{255});
        REQUIRE(v.is_integer());
        REQUIRE(v.get_if<Integer>()->is_u64());
        REQUIRE(v.as_u64().value() == 255);
    }

    SECTION("i8 -1") {
        auto v = to_value(int8_t{-1});
        REQUIRE(v.get_if<Integer>()->is_negative());
        REQUIRE(v.as_i64().value() == -1);
    }

    SECTION("every width") {
        REQUIRE(to_value(int16_t{-300}) == Value{-300});
        REQUIRE(to_value(int32_t{70000}) == Value{70000});
        REQUIRE(to_value(uint16_t{65535}) == Value{65535});
        REQUIRE(to_value(uint32_t{4000000000U}) == Value{uint64_t{4000000000U}});
    }

    SECTION("extremes") {
        auto max = to_value(std::numeric_limits<uint64_t>::max());
        REQUIRE(max.as_u64().value() == std::numeric_limits<uint64_t>::max());
        REQUIRE_FALSE(max.as_i64().has_value());

        auto min = to_value(std::numeric_limits<int64_t>::min());
        REQUIRE(min.as_i64().value() == std::numeric_limits<int64_t>::min());
    }
}

TEST_CASE("to_value floats are never promoted", "[to_value][primitive]") {
    auto f = to_value(1.5f);
    REQUIRE(f.is_f32());
    REQUIRE(*f.get_if<float>() == 1.5f);

    auto d = to_value(1.5);
    REQUIRE(d.is_f64());
    REQUIRE(*d.get_if<double>() == 1.5);
}

TEST_CASE("to_value bool", "[to_value][primitive]") {
    REQUIRE(to_value(true) == Value{true});
    REQUIRE(to_value(false) == Value{false});
}

TEST_CASE("to_value char", "[to_value][primitive]") {
    SECTION("ascii") {
        REQUIRE(*to_value(U'a').as_str() == "a");
    }

    SECTION("multi-byte") {
        REQUIRE(*to_value(U'\u00e9').as_str() == "\xc3\xa9");
    }

    SECTION("surrogate is rejected") {
        REQUIRE_THROWS_AS(to_value(char32_t{0xD800}), Error);
        REQUIRE_THROWS_WITH(to_value(char32_t{0xD800}), "invalid char U+d800");
    }
}

TEST_CASE("to_value text", "[to_value][primitive]") {
    SECTION("literal") {
        REQUIRE(to_value("hello") == Value{"hello"});
    }

    SECTION("std::string and string_view") {
        REQUIRE(to_value(std::string{"abc"}) == Value{"abc"});
        REQUIRE(to_value(std::string_view{"abc"}) == Value{"abc"});
    }

    SECTION("invalid UTF-8 keeps original bytes") {
        const std::string raw{"ok\xff", 3};
        auto v = to_value(raw);
        REQUIRE(v.is_string());
        const auto* s = v.get_if<Utf8String>();
        REQUIRE(s->is_err());
        REQUIRE(s->valid_up_to().value() == 2);
        const auto bytes = s->as_bytes();
        REQUIRE(ByteBuffer(bytes.begin(), bytes.end()) == ByteBuffer{'o', 'k', 0xff});
    }

    SECTION("invalid UTF-8 converts without writing to stderr") {
        std::ostringstream captured;
        auto* old = std::cerr.rdbuf(captured.rdbuf());
        auto v = to_value(std::string{"\xc3(", 2});
        std::cerr.rdbuf(old);
        REQUIRE(v.get_if<Utf8String>()->is_err());
        REQUIRE(captured.str().empty());
    }

    SECTION("char buffer stops at the terminator") {
        char name[16] = "abc";
        REQUIRE(to_value(name) == Value{"abc"});
        REQUIRE(*to_value(name).get_if<Utf8String>()->as_str() == "abc");
    }

    SECTION("char buffer without a terminator uses every byte") {
        const char tag[3] = {'x', 'y', 'z'};
        REQUIRE(to_value(tag) == Value{"xyz"});
    }

    SECTION("const char pointer") {
        const char* name = "x";
        REQUIRE(to_value(name) == Value{"x"});
    }

    SECTION("null const char pointer is nil") {
        const char* missing = nullptr;
        REQUIRE(to_value(missing).is_nil());
        REQUIRE(to_value(std::vector<const char*>{"a", nullptr}) == Value::array({"a", Value{}}));
    }
}

TEST_CASE("to_value bytes", "[to_value][primitive]") {
    const ByteBuffer payload{1, 2, 3};

    SECTION("Bytes wrapper is Binary") {
        auto v = to_value(Bytes{payload});
        REQUIRE(v == Value::binary({1, 2, 3}));
    }

    SECTION("plain vector is an Array of integers") {
        auto v = to_value(payload);
        REQUIRE(v == Value::array({1, 2, 3}));
    }
}

TEST_CASE("to_value unit shapes", "[to_value][primitive]") {
    REQUIRE(to_value(std::optional<int>{}).is_nil());
    REQUIRE(to_value(std::optional<int>{5}) == Value{5});
    REQUIRE(to_value(std::monostate{}).is_nil());
    REQUIRE(to_value(nullptr).is_nil());
    REQUIRE(to_value(Marker{}) == Value::array({}));
}

// ============================================================
// Composite Tests
// ============================================================

TEST_CASE("to_value sequences and tuples", "[to_value][composite]") {
    SECTION("vector") {
        REQUIRE(to_value(std::vector<std::string>{"a", "b"}) == Value::array({"a", "b"}));
    }

    SECTION("empty vector") {
        REQUIRE(to_value(std::vector<int>{}) == Value::array({}));
    }

    SECTION("nested") {
        std::vector<std::vector<int>> nested{{1}, {2, 3}};
        REQUIRE(to_value(nested) == Value::array({Value::array({1}), Value::array({2, 3})}));
    }

    SECTION("std::array") {
        REQUIRE(to_value(std::array<int, 3>{4, 5, 6}) == Value::array({4, 5, 6}));
    }

    SECTION("tuple") {
        auto v = to_value(std::make_tuple(1, std::string{"a"}, true));
        REQUIRE(v == Value::array({1, "a", true}));
    }

    SECTION("pair") {
        REQUIRE(to_value(std::make_pair(1.5f, -2)) == Value::array({1.5f, -2}));
    }

    SECTION("declared length is only a hint") {
        REQUIRE(to_value(ShortSeq{}) == Value::array({1}));
    }
}

TEST_CASE("to_value structs drop field names", "[to_value][composite]") {
    REQUIRE(to_value(Point{3, -4}) == Value::array({3, -4}));
    REQUIRE(to_value(Rgb{255, 128, 0}) == Value::array({255, 128, 0}));
    REQUIRE(to_value(Meters{2.5}) == Value{2.5});
}

TEST_CASE("to_value maps", "[to_value][composite]") {
    SECTION("call order is kept") {
        auto v = to_value(OrderedPairs{{{"b", 2}, {"a", 1}}});
        REQUIRE(v == Value::map({{"b", 2}, {"a", 1}}));
    }

    SECTION("duplicate keys are kept") {
        auto v = to_value(OrderedPairs{{{"k", 1}, {"k", 2}}});
        REQUIRE(v.size() == 2);
        REQUIRE(v == Value::map({{"k", 1}, {"k", 2}}));
    }

    SECTION("std::map iterates in key order") {
        std::map<std::string, int> m{{"b", 2}, {"a", 1}};
        REQUIRE(to_value(m) == Value::map({{"a", 1}, {"b", 2}}));
    }

    SECTION("composite keys") {
        std::map<int, std::vector<int>> m{{1, {10, 11}}};
        REQUIRE(to_value(m) == Value::map({{1, Value::array({10, 11})}}));
    }

    SECTION("a second key replaces the pending one") {
        REQUIRE(to_value(RekeyedMap{}) == Value::map({{"b", 1}}));
    }

    SECTION("empty") {
        REQUIRE(to_value(OrderedPairs{}) == Value::map({}));
    }
}

// ============================================================
// Enum Tests
// ============================================================

TEST_CASE("to_value enum alternatives", "[to_value][enum]") {
    SECTION("unit variant") {
        REQUIRE(to_value(UnitAlt{}) == Value::array({3, Value::array({})}));
    }

    SECTION("newtype variant") {
        REQUIRE(to_value(NewtypeAlt{7}) == Value::array({3, Value::array({7})}));
    }

    SECTION("tuple variant") {
        REQUIRE(to_value(TupleAlt{}) == Value::array({1, Value::array({1, "two", 3.0})}));
    }

    SECTION("struct variant") {
        REQUIRE(to_value(StructAlt{}) == Value::array({2, Value::array({true, Value{}})}));
    }
}

TEST_CASE("to_value std::variant", "[to_value][enum]") {
    using Choice = std::variant<std::monostate, int, std::string>;

    REQUIRE(to_value(Choice{}) == Value::array({0, Value::array({})}));
    REQUIRE(to_value(Choice{7}) == Value::array({1, Value::array({7})}));
    REQUIRE(to_value(Choice{std::string{"s"}}) == Value::array({2, Value::array({"s"})}));
}

// ============================================================
// Passthrough Tests
// ============================================================

TEST_CASE("to_value on a Value reproduces it", "[to_value][passthrough]") {
    auto tree = Value::array({
        Value{},
        true,
        -5,
        std::numeric_limits<uint64_t>::max(),
        1.5f,
        2.5,
        "text",
        Value::binary({0, 1}),
        Value::map({{1, "one"}, {Value::array({1}), Value::map({})}}),
        Value::ext(-3, {9, 8}),
    });

    REQUIRE(to_value(tree) == tree);
    REQUIRE(to_value(to_value(tree)) == tree);
}

TEST_CASE("to_value on invalid text reproduces the bytes as Binary", "[to_value][passthrough]") {
    Value bad{std::string{"\xfe\xff", 2}};
    REQUIRE(bad.is_string());
    REQUIRE(to_value(bad) == Value::binary({0xfe, 0xff}));
}

TEST_CASE("to_value with the thread-safe memory policy", "[to_value][policy]") {
    auto v = to_value<thread_safe_memory_policy>(std::vector<int>{1, 2});
    REQUIRE(v.is_array());
    REQUIRE(v.size() == 2);
    REQUIRE(v.at(1).as_i64().value() == 2);
}
