#include "../testing.test.hpp"

#include <tbson/de/raw_deserializer.hpp>

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <tuple>
#include <variant>

using tbson::testing::bytes;
using tbson::testing::doc;
using tbson::testing::nest;
using tbson::testing::view_of;

using Catch::Matchers::ContainsSubstring;

namespace de = tbson::de;

namespace {

struct borrowed_view {
    std::string_view           s;
    std::span<const std::byte> g;

    static constexpr auto bson_fields() {
        return std::tuple(de::field("s", &borrowed_view::s), de::field("g", &borrowed_view::g));
    }
};

struct raw_parts {
    tbson::raw_document o;
    tbson::raw_array    a;
    tbson::raw_bson     d;
    tbson::raw_binary   b;

    static constexpr auto bson_fields() {
        return std::tuple(de::field("o", &raw_parts::o),
                          de::field("a", &raw_parts::a),
                          de::field("d", &raw_parts::d),
                          de::field("b", &raw_parts::b));
    }
};

struct point_x {
    std::int32_t x = 0;

    static constexpr auto bson_fields() { return std::tuple(de::field("x", &point_x::x)); }
};

struct unit_v {
    static constexpr std::string_view bson_variant = "Unit";
};

struct tuple_v {
    static constexpr std::string_view      bson_variant = "Tuple";
    std::tuple<std::int32_t, std::int32_t> value;
};

struct struct_v {
    static constexpr std::string_view bson_variant = "Struct";
    std::int32_t                      x            = 0;

    static constexpr auto bson_fields() { return std::tuple(de::field("x", &struct_v::x)); }
};

struct holder {
    std::variant<unit_v, tuple_v, struct_v> e;

    static constexpr auto bson_fields() { return std::tuple(de::field("e", &holder::e)); }
};

struct with_id {
    tbson::uuid id;

    static constexpr auto bson_fields() { return std::tuple(de::field("id", &with_id::id)); }
};

// Test whether `part` lies within `whole`
bool points_into(std::span<const std::byte> whole, const void* part) {
    auto p = static_cast<const std::byte*>(part);
    return p >= whole.data() and p < whole.data() + whole.size();
}

}  // namespace

TEST_CASE("tbson/de/raw/Same result as converting to owned") {
    auto buf   = tbson::testing::sample_bytes();
    auto owned = view_of(buf).to_document();
    REQUIRE(owned.has_value());

    auto direct = de::from_slice<tbson::document>(buf);
    REQUIRE(direct.has_value());
    CHECK(*direct == *owned);
    CHECK(*direct == tbson::testing::sample_document());

    auto value = de::from_slice<tbson::bson>(buf);
    REQUIRE(value.has_value());
    CHECK(*value == tbson::bson(*owned));
}

TEST_CASE("tbson/de/raw/Borrowed strings and bytes") {
    auto buf = tbson::testing::sample_bytes();
    auto r   = de::from_slice<borrowed_view>(buf);
    REQUIRE(r.has_value());
    CHECK(r->s == "hi");
    CHECK(points_into(buf, r->s.data()));
    REQUIRE(r->g.size() == 1);
    CHECK(r->g[0] == std::byte{9});
    CHECK(points_into(buf, r->g.data()));
}

TEST_CASE("tbson/de/raw/Borrowed fields from an owned value fail") {
    auto r = de::from_document<borrowed_view>(doc({{"s", "hi"}}));
    REQUIRE(r.has_error());
    CHECK(r.error().kind() == tbson::errc::invalid_type);
}

TEST_CASE("tbson/de/raw/Raw targets") {
    auto buf = tbson::testing::sample_bytes();
    auto r   = de::from_slice<raw_parts>(buf);
    REQUIRE(r.has_value());

    CHECK(points_into(buf, r->o.bytes().data()));
    CHECK(r->o.get("n")->value().as_null().has_value());

    CHECK(points_into(buf, r->a.bytes().data()));
    CHECK(r->a.to_array().value() == tbson::array{1, true});

    CHECK(r->d.as_double() == 1.5);

    CHECK(r->b.subtype == tbson::binary_subtype::user_defined);
    CHECK(points_into(buf, r->b.bytes.data()));
    CHECK(r->b.to_owned().bytes == bytes(1, 2, 3));
}

TEST_CASE("tbson/de/raw/Whole document as a raw target") {
    auto buf = tbson::testing::sample_bytes();
    auto d   = de::from_slice<tbson::raw_document>(buf);
    REQUIRE(d.has_value());
    CHECK(*d == view_of(buf));

    auto v = de::from_slice<tbson::raw_bson>(buf);
    REQUIRE(v.has_value());
    CHECK(v->as_document() == view_of(buf));
}

TEST_CASE("tbson/de/raw/Every element as a raw value") {
    auto buf    = tbson::testing::sample_bytes();
    auto values = de::from_slice<std::map<std::string, tbson::raw_bson>>(buf);
    REQUIRE(values.has_value());
    CHECK(values->size() == 12);
    for (auto& elem : view_of(buf)) {
        INFO(elem.key());
        REQUIRE(values->contains(std::string(elem.key())));
        CHECK(values->at(std::string(elem.key())) == elem.value());
    }
}

TEST_CASE("tbson/de/raw/Raw target mismatches") {
    auto buf = tbson::testing::sample_bytes();

    auto bin = de::from_slice<std::map<std::string, tbson::raw_binary>>(buf);
    REQUIRE(bin.has_error());
    CHECK(bin.error().message() == "expected binary, but got 1.5:f64 instead");

    struct wants_doc {
        tbson::raw_document s;

        static constexpr auto bson_fields() { return std::tuple(de::field("s", &wants_doc::s)); }
    };
    auto d = de::from_slice<wants_doc>(buf);
    REQUIRE(d.has_error());
    CHECK(d.error().message() == R"(expected a raw document, but got "hi" instead)");
}

TEST_CASE("tbson/de/raw/Enums") {
    SECTION("Unit") {
        // clang-format off
        auto buf = bytes(
            17, 0, 0, 0,
            0x02, 'e', 0, 5, 0, 0, 0, 'U', 'n', 'i', 't', 0,
            0);
        // clang-format on
        auto r = de::from_slice<holder>(buf);
        REQUIRE(r.has_value());
        CHECK(std::holds_alternative<unit_v>(r->e));
    }
    SECTION("Tuple") {
        // clang-format off
        auto buf = bytes(
            39, 0, 0, 0,
            0x03, 'e', 0,
                31, 0, 0, 0,
                0x04, 'T', 'u', 'p', 'l', 'e', 0,
                    19, 0, 0, 0,
                    0x10, '0', 0, 1, 0, 0, 0,
                    0x10, '1', 0, 2, 0, 0, 0,
                    0,
                0,
            0);
        // clang-format on
        auto r = de::from_slice<holder>(buf);
        REQUIRE(r.has_value());
        REQUIRE(std::holds_alternative<tuple_v>(r->e));
        CHECK(std::get<tuple_v>(r->e).value == std::tuple(1, 2));
    }
    SECTION("Struct") {
        // clang-format off
        auto buf = bytes(
            33, 0, 0, 0,
            0x03, 'e', 0,
                25, 0, 0, 0,
                0x03, 'S', 't', 'r', 'u', 'c', 't', 0,
                    12, 0, 0, 0,
                    0x10, 'x', 0, 5, 0, 0, 0,
                    0,
                0,
            0);
        // clang-format on
        auto r = de::from_slice<holder>(buf);
        REQUIRE(r.has_value());
        REQUIRE(std::holds_alternative<struct_v>(r->e));
        CHECK(std::get<struct_v>(r->e).x == 5);
    }
    SECTION("Extra key") {
        // clang-format off
        auto buf = bytes(
            27, 0, 0, 0,
            0x03, 'e', 0,
                19, 0, 0, 0,
                0x10, 'A', 0, 1, 0, 0, 0,
                0x10, 'B', 0, 2, 0, 0, 0,
                0,
            0);
        // clang-format on
        auto r = de::from_slice<holder>(buf);
        REQUIRE(r.has_error());
        CHECK(r.error().kind() == tbson::errc::invalid_value);
        CHECK_THAT(r.error().message(), ContainsSubstring(R"(got extra key "B")"));
    }
}

TEST_CASE("tbson/de/raw/UUIDs are borrowed from binary values") {
    // clang-format off
    auto buf = bytes(
        30, 0, 0, 0,
        0x05, 'i', 'd', 0, 16, 0, 0, 0, 0x04,
            0, 1, 2, 3, 4, 5, 6, 7, 8, 9, 10, 11, 12, 13, 14, 15,
        0);
    // clang-format on
    auto r = de::from_slice<with_id>(buf);
    REQUIRE(r.has_value());
    CHECK(r->id.to_string() == "00010203-0405-0607-0809-0a0b0c0d0e0f");

    auto sample = tbson::testing::sample_bytes();
    auto bad    = de::from_slice<std::map<std::string, tbson::uuid>>(sample);
    REQUIRE(bad.has_error());
    CHECK_THAT(bad.error().message(), ContainsSubstring("expected Binary with subtype 4"));
}

TEST_CASE("tbson/de/raw/Unsigned 32-bit values widen") {
    // clang-format off
    auto buf = bytes(
        12, 0, 0, 0,
        0x14, 'n', 0, 7, 0, 0, 0,
        0);
    // clang-format on
    CHECK(view_of(buf).to_document().value() == doc({{"n", std::uint32_t{7}}}));
    CHECK(de::from_slice<tbson::document>(buf).value() == doc({{"n", std::uint64_t{7}}}));

    auto typed = de::from_slice<std::map<std::string, std::uint32_t>>(buf);
    REQUIRE(typed.has_value());
    CHECK(typed->at("n") == 7);

    auto raw = de::from_slice<std::map<std::string, tbson::raw_bson>>(buf);
    REQUIRE(raw.has_value());
    CHECK(raw->at("n") == tbson::raw_bson(std::uint64_t{7}));
}

TEST_CASE("tbson/de/raw/Duplicate fields") {
    // clang-format off
    auto buf = bytes(
        19, 0, 0, 0,
        0x10, 'x', 0, 1, 0, 0, 0,
        0x10, 'x', 0, 2, 0, 0, 0,
        0);
    // clang-format on
    auto r = de::from_slice<point_x>(buf);
    REQUIRE(r.has_error());
    CHECK(r.error().message() == "duplicate field `x`");
}

TEST_CASE("tbson/de/raw/Depth limit") {
    std::vector<std::byte> buf  = nest(nest(bytes(5, 0, 0, 0, 0)));
    const auto             opts = de::options{.human_readable = false, .max_depth = 3};
    CHECK(de::from_slice<tbson::bson>(buf, opts).has_value());

    buf       = nest(buf);
    auto deep = de::from_slice<tbson::bson>(buf, opts);
    REQUIRE(deep.has_error());
    CHECK(deep.error().reason() == tbson::raw_errc::depth_exceeded);
    CHECK(de::from_slice<tbson::bson>(buf).has_value());
}

TEST_CASE("tbson/de/raw/Malformed buffers") {
    auto bad_header = de::from_slice<tbson::bson>(bytes(5, 0, 0, 0, 1));
    REQUIRE(bad_header.has_error());
    CHECK(bad_header.error().reason() == tbson::raw_errc::invalid_terminator);

    auto truncated = de::from_slice<tbson::bson>(bytes(9, 0, 0, 0, 0));
    REQUIRE(truncated.has_error());
    CHECK(truncated.error().reason() == tbson::raw_errc::short_read);
}

TEST_CASE("tbson/de/raw/A malformed element fails the decode") {
    // clang-format off
    auto buf = bytes(
        19, 0, 0, 0,
        0x10, 'a', 0, 1, 0, 0, 0,
        0x07, 'b', 0, 1, 0, 0, 0,
        0);
    // clang-format on
    auto r = de::from_slice<tbson::bson>(buf);
    REQUIRE(r.has_error());
    CHECK(r.error().kind() == tbson::errc::custom);
    CHECK(r.error().reason() == tbson::raw_errc::invalid_type);

    auto typed = de::from_slice<std::map<std::string, int>>(buf);
    REQUIRE(typed.has_error());
    CHECK(typed.error().reason() == tbson::raw_errc::invalid_type);
}
