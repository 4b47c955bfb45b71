#include "../testing.test.hpp"

#include <tbson/de/deserializer.hpp>

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <tuple>
#include <variant>
#include <vector>

using tbson::testing::bytes;
using tbson::testing::doc;

using Catch::Matchers::ContainsSubstring;

namespace de = tbson::de;

namespace {

struct person {
    std::string                name;
    std::int32_t               age = 0;
    std::optional<std::string> nick;
    std::vector<std::int64_t>  scores;

    static constexpr auto bson_fields() {
        return std::tuple(de::field("name", &person::name),
                          de::field("age", &person::age),
                          de::field("nick", &person::nick),
                          de::field("scores", &person::scores));
    }
};

struct meters {
    static constexpr std::string_view bson_newtype = "meters";
    double                            value        = 0;
};

struct unit_v {
    static constexpr std::string_view bson_variant = "Unit";
};

struct newtype_v {
    static constexpr std::string_view bson_variant = "Newtype";
    std::int32_t                      value        = 0;
};

struct tuple_v {
    static constexpr std::string_view  bson_variant = "Tuple";
    std::tuple<std::int32_t, std::int32_t> value;
};

struct struct_v {
    static constexpr std::string_view bson_variant = "Struct";
    std::int32_t                      x            = 0;

    static constexpr auto bson_fields() { return std::tuple(de::field("x", &struct_v::x)); }
};

using shape = std::variant<unit_v, newtype_v, tuple_v, struct_v>;

enum class color { red, green };

// An array nested `levels` deep, with an empty array innermost
tbson::bson nested_arrays(int levels) {
    tbson::bson out = tbson::array{};
    for (int i = 1; i < levels; ++i) {
        tbson::array wrap;
        wrap.push_back(std::move(out));
        out = std::move(wrap);
    }
    return out;
}

std::vector<std::byte> sixteen_bytes() {
    std::vector<std::byte> out;
    for (int i = 0; i < 16; ++i) {
        out.push_back(static_cast<std::byte>(i));
    }
    return out;
}

}  // namespace

template <>
struct tbson::de::enum_variants<color> {
    static constexpr std::pair<std::string_view, color> table[] = {
        {"red", color::red},
        {"green", color::green},
    };
};

TEST_CASE("tbson/de/deserializer/Scalars") {
    CHECK(de::from_bson<bool>(true).value() == true);
    CHECK(de::from_bson<std::int32_t>(5).value() == 5);
    CHECK(de::from_bson<std::int64_t>(5).value() == 5);
    CHECK(de::from_bson<std::uint8_t>(200).value() == 200);
    CHECK(de::from_bson<std::uint64_t>(std::uint32_t{7}).value() == 7);
    CHECK(de::from_bson<double>(3).value() == 3.0);
    CHECK(de::from_bson<double>(2.5).value() == 2.5);
    CHECK(de::from_bson<std::string>("hey").value() == "hey");
    CHECK(de::from_bson<tbson::unit>(tbson::null{}).has_value());
}

TEST_CASE("tbson/de/deserializer/Scalar mismatches") {
    auto b = de::from_bson<bool>(1);
    REQUIRE(b.has_error());
    CHECK(b.error().kind() == tbson::errc::invalid_type);
    CHECK(b.error().message() == "invalid type: integer `1`, expected a boolean");

    auto s = de::from_bson<std::string>(1);
    REQUIRE(s.has_error());
    CHECK(s.error().message() == "invalid type: integer `1`, expected a string");

    auto i = de::from_bson<std::int32_t>(1.5);
    REQUIRE(i.has_error());
    CHECK(i.error().message() == "invalid type: floating point `1.5`, expected i32");

    // Owned strings cannot be borrowed
    auto sv = de::from_bson<std::string_view>("x");
    REQUIRE(sv.has_error());
    CHECK(sv.error().message() == R"(invalid type: string "x", expected a borrowed string)");
}

TEST_CASE("tbson/de/deserializer/Integer range") {
    auto r = de::from_bson<std::uint8_t>(300);
    REQUIRE(r.has_error());
    CHECK(r.error().kind() == tbson::errc::invalid_value);
    CHECK(r.error().message() == "invalid value: integer `300`, expected u8");

    auto neg = de::from_bson<std::uint32_t>(-1);
    REQUIRE(neg.has_error());
    CHECK(neg.error().message() == "invalid value: integer `-1`, expected u32");

    CHECK(de::from_bson<std::int32_t>(std::int64_t{1} << 40).has_error());
    CHECK(de::from_bson<std::int64_t>(std::uint64_t{1} << 63).has_error());
    CHECK(de::from_bson<std::int32_t>(std::int64_t{-12}).value() == -12);
}

TEST_CASE("tbson/de/deserializer/Options") {
    CHECK(de::from_bson<std::optional<int>>(tbson::null{}).value() == std::nullopt);
    CHECK(de::from_bson<std::optional<int>>(4).value() == 4);
    auto bad = de::from_bson<std::optional<int>>("four");
    REQUIRE(bad.has_error());
    CHECK(bad.error().kind() == tbson::errc::invalid_type);
}

TEST_CASE("tbson/de/deserializer/Sequences and maps") {
    using strings = std::vector<std::string>;
    CHECK(de::from_bson<strings>(tbson::array{"a", "b"}).value() == strings{"a", "b"});
    CHECK(de::from_bson<strings>(tbson::array{}).value().empty());

    auto not_seq = de::from_bson<std::vector<int>>(1);
    REQUIRE(not_seq.has_error());
    CHECK(not_seq.error().message() == "invalid type: integer `1`, expected a sequence");

    using int_map = std::map<std::string, std::int32_t>;
    CHECK(de::from_document<int_map>(doc({{"a", 1}, {"b", 2}})).value()
          == int_map{{"a", 1}, {"b", 2}});
}

TEST_CASE("tbson/de/deserializer/Tuples") {
    using pair_type = std::tuple<int, std::string>;
    CHECK(de::from_bson<pair_type>(tbson::array{1, "x"}).value() == pair_type{1, "x"});

    auto r = de::from_bson<pair_type>(tbson::array{1});
    REQUIRE(r.has_error());
    CHECK(r.error().kind() == tbson::errc::invalid_length);
    CHECK(r.error().message() == "invalid length 1, expected a tuple of size 2");
}

TEST_CASE("tbson/de/deserializer/Byte buffers") {
    auto r = de::from_bson<std::vector<std::byte>>(
        tbson::binary{tbson::binary_subtype::generic, bytes(1, 2)});
    REQUIRE(r.has_value());
    CHECK(*r == bytes(1, 2));
}

TEST_CASE("tbson/de/deserializer/Described structures") {
    auto p = de::from_document<person>(doc({
        {"name", "ann"},
        {"age", 30},
        {"scores", tbson::array{1, std::int64_t{2}}},
        {"unknown", doc({{"skipped", true}})},
    }));
    REQUIRE(p.has_value());
    CHECK(p->name == "ann");
    CHECK(p->age == 30);
    CHECK(p->nick == std::nullopt);
    CHECK(p->scores == std::vector<std::int64_t>{1, 2});

    auto with_null = de::from_document<person>(
        doc({{"name", "bo"}, {"age", 1}, {"nick", tbson::null{}}, {"scores", tbson::array{}}}));
    REQUIRE(with_null.has_value());
    CHECK(with_null->nick == std::nullopt);

    auto with_nick = de::from_document<person>(
        doc({{"name", "bo"}, {"age", 1}, {"nick", "b"}, {"scores", tbson::array{}}}));
    REQUIRE(with_nick.has_value());
    CHECK(with_nick->nick == "b");
}

TEST_CASE("tbson/de/deserializer/Missing fields") {
    auto r = de::from_document<person>(doc({{"age", 1}}));
    REQUIRE(r.has_error());
    CHECK(r.error().kind() == tbson::errc::custom);
    CHECK(r.error().message() == "missing field `name`");

    r = de::from_document<person>(doc({{"name", "x"}, {"age", 1}}));
    REQUIRE(r.has_error());
    CHECK(r.error().message() == "missing field `scores`");
}

TEST_CASE("tbson/de/deserializer/Field type mismatch") {
    auto r = de::from_document<person>(doc({{"name", 5}}));
    REQUIRE(r.has_error());
    CHECK(r.error().message() == "invalid type: integer `5`, expected a string");

    auto not_doc = de::from_bson<person>(tbson::array{});
    REQUIRE(not_doc.has_error());
    CHECK(not_doc.error().message() == "invalid type: sequence, expected a document");
}

TEST_CASE("tbson/de/deserializer/Newtypes") {
    CHECK(de::from_bson<meters>(2.5).value().value == 2.5);
    CHECK(de::from_bson<meters>("far").has_error());
}

TEST_CASE("tbson/de/deserializer/Enums") {
    SECTION("Unit variant by name") {
        auto r = de::from_bson<shape>("Unit");
        REQUIRE(r.has_value());
        CHECK(std::holds_alternative<unit_v>(*r));
    }
    SECTION("Unit variant with a payload") {
        auto r = de::from_document<shape>(doc({{"Unit", 5}}));
        REQUIRE(r.has_value());
        CHECK(std::holds_alternative<unit_v>(*r));
    }
    SECTION("Newtype variant") {
        auto r = de::from_document<shape>(doc({{"Newtype", 9}}));
        REQUIRE(r.has_value());
        REQUIRE(std::holds_alternative<newtype_v>(*r));
        CHECK(std::get<newtype_v>(*r).value == 9);
    }
    SECTION("Newtype variant without a payload") {
        auto r = de::from_bson<shape>("Newtype");
        REQUIRE(r.has_error());
        CHECK(r.error().kind() == tbson::errc::end_of_stream);
    }
    SECTION("Tuple variant") {
        auto r = de::from_document<shape>(doc({{"Tuple", tbson::array{1, 2}}}));
        REQUIRE(r.has_value());
        REQUIRE(std::holds_alternative<tuple_v>(*r));
        CHECK(std::get<tuple_v>(*r).value == std::tuple(1, 2));
    }
    SECTION("Tuple variant payload is not an array") {
        auto r = de::from_document<shape>(doc({{"Tuple", 1}}));
        REQUIRE(r.has_error());
        CHECK(r.error().kind() == tbson::errc::invalid_type);
    }
    SECTION("Struct variant") {
        auto r = de::from_document<shape>(doc({{"Struct", doc({{"x", 5}})}}));
        REQUIRE(r.has_value());
        REQUIRE(std::holds_alternative<struct_v>(*r));
        CHECK(std::get<struct_v>(*r).x == 5);
    }
    SECTION("Extra key") {
        auto r = de::from_document<shape>(doc({{"Unit", 1}, {"B", 2}}));
        REQUIRE(r.has_error());
        CHECK(r.error().kind() == tbson::errc::invalid_value);
        CHECK_THAT(r.error().message(), ContainsSubstring(R"(got extra key "B")"));
    }
    SECTION("Empty document") {
        auto r = de::from_document<shape>(tbson::document{});
        REQUIRE(r.has_error());
        CHECK(r.error().message() == "invalid value: empty document, expected variant name");
    }
    SECTION("Not an enum") {
        auto r = de::from_bson<shape>(5);
        REQUIRE(r.has_error());
        CHECK(r.error().kind() == tbson::errc::invalid_type);
    }
    SECTION("Unknown variant") {
        auto r = de::from_document<shape>(doc({{"Nope", 1}}));
        REQUIRE(r.has_error());
        CHECK(r.error().message()
              == "unknown variant `Nope`, expected one of `Unit`, `Newtype`, `Tuple`, `Struct`");
    }
    SECTION("A lone string cannot offer an enum") {
        de::str_deserializer d("Unit", true, {});
        auto                 r = de::deserialize<shape>(d);
        REQUIRE(r.has_error());
        CHECK(r.error().message() == "unexpected Enum");
    }
}

TEST_CASE("tbson/de/deserializer/Plain enumerations") {
    CHECK(de::from_bson<color>("green").value() == color::green);
    CHECK(de::from_document<color>(doc({{"red", tbson::null{}}})).value() == color::red);
    auto r = de::from_bson<color>("blue");
    REQUIRE(r.has_error());
    CHECK(r.error().message() == "unknown variant `blue`, expected one of `red`, `green`");
}

TEST_CASE("tbson/de/deserializer/UUIDs") {
    auto raw = sixteen_bytes();
    auto r   = de::from_bson<tbson::uuid>(tbson::binary{tbson::binary_subtype::uuid, raw});
    REQUIRE(r.has_value());
    CHECK(r->to_string() == "00010203-0405-0607-0809-0a0b0c0d0e0f");

    auto generic = de::from_bson<tbson::uuid>(tbson::binary{tbson::binary_subtype::generic, raw});
    REQUIRE(generic.has_error());
    CHECK(generic.error().kind() == tbson::errc::custom);
    CHECK_THAT(generic.error().message(), ContainsSubstring("expected Binary with subtype 4"));

    auto text = de::from_bson<tbson::uuid>("00010203-0405-0607-0809-0a0b0c0d0e0f");
    REQUIRE(text.has_error());
    CHECK_THAT(text.error().message(),
               ContainsSubstring(R"(instead got "00010203-0405-0607-0809-0a0b0c0d0e0f")"));
}

TEST_CASE("tbson/de/deserializer/Object IDs") {
    constexpr std::string_view hex = "0123456789abcdef01234567";
    auto                       r   = de::from_bson<tbson::object_id>(hex);
    REQUIRE(r.has_value());
    CHECK(r->to_hex() == hex);

    auto compact = de::from_bson<tbson::object_id>(
        tbson::binary{tbson::binary_subtype::generic, std::vector<std::byte>(r->bytes().begin(),
                                                                             r->bytes().end())},
        de::options{.human_readable = false});
    REQUIRE(compact.has_value());
    CHECK(*compact == *r);

    auto from_map = de::from_document<tbson::object_id>(doc({{"a", 1}}));
    REQUIRE(from_map.has_error());
    CHECK(from_map.error().message()
          == R"(expected map containing extended-JSON formatted ObjectId, instead found { "a": 1:i32 })");
}

TEST_CASE("tbson/de/deserializer/Values are consumed once") {
    de::deserializer d(tbson::bson(1));
    CHECK(de::deserialize<int>(d).value() == 1);
    auto again = de::deserialize<int>(d);
    REQUIRE(again.has_error());
    CHECK(again.error().kind() == tbson::errc::end_of_stream);
    CHECK(again.error().message() == "end of stream");
    CHECK(de::deserialize<std::optional<int>>(d).has_error());
}

TEST_CASE("tbson/de/deserializer/Map cursor") {
    de::map_deserializer m(doc({{"a", 1}, {"b", 2}}), {}, 0);
    CHECK(m.size_hint() == std::size_t{2});

    // A value must be preceded by its key
    auto early = m.next_value<int>();
    REQUIRE(early.has_error());
    CHECK(early.error().kind() == tbson::errc::end_of_stream);

    CHECK(m.next_key<std::string>().value() == "a");
    CHECK(m.next_value<int>().value() == 1);
    CHECK(m.next_value<int>().has_error());
    CHECK(m.size_hint() == std::size_t{1});

    // Skipping a value is allowed
    CHECK(m.next_key<std::string>().value() == "b");
    CHECK(m.next_key<std::string>().value() == std::nullopt);
}

TEST_CASE("tbson/de/deserializer/Sequence cursor") {
    de::seq_deserializer s(tbson::array{1, 2, 3}, {}, 0);
    CHECK(s.size_hint() == std::size_t{3});
    CHECK(s.next_element<int>().value() == 1);
    CHECK(s.size_hint() == std::size_t{2});
    CHECK(s.next_element<int>().value() == 2);
    CHECK(s.next_element<int>().value() == 3);
    CHECK(s.next_element<int>().value() == std::nullopt);
}

TEST_CASE("tbson/de/deserializer/Depth limit") {
    const auto opts = de::options{.max_depth = 3};
    CHECK(de::from_bson<tbson::bson>(nested_arrays(3), opts).has_value());

    auto deep = de::from_bson<tbson::bson>(nested_arrays(4), opts);
    REQUIRE(deep.has_error());
    CHECK(deep.error().reason() == tbson::raw_errc::depth_exceeded);

    auto typed = de::from_bson<std::vector<std::vector<std::vector<std::vector<int>>>>>(
        nested_arrays(4), opts);
    REQUIRE(typed.has_error());
    CHECK(typed.error().reason() == tbson::raw_errc::depth_exceeded);

    CHECK(de::from_bson<tbson::bson>(nested_arrays(4)).has_value());
}
