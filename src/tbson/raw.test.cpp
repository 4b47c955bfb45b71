#include "./testing.test.hpp"

#include <tbson/raw.hpp>

#include <catch2/catch_test_macros.hpp>

#include <iterator>
#include <string>

using tbson::testing::bytes;
using tbson::testing::doc;
using tbson::testing::nest;
using tbson::testing::view_of;

using std::operator""sv;

static_assert(std::forward_iterator<tbson::raw_document::iterator>);

TEST_CASE("tbson/raw/Empty") {
    auto buf = bytes(5, 0, 0, 0, 0);
    auto d   = view_of(buf);
    CHECK(d.empty());
    CHECK(d.begin() == d.end());
    CHECK(d.begin().stop());
    CHECK(tbson::raw_document().empty());
    CHECK(d == tbson::raw_document());
}

TEST_CASE("tbson/raw/Header validation") {
    auto check_fails = [](std::vector<std::byte> buf, tbson::raw_errc expect) {
        auto r = tbson::raw_document::from_bytes(buf);
        REQUIRE(r.has_error());
        CHECK(r.error().kind() == tbson::errc::custom);
        CHECK(r.error().reason() == expect);
    };
    // Too short to hold a header and terminator
    check_fails(bytes(5, 0, 0, 0), tbson::raw_errc::short_read);
    check_fails(bytes(), tbson::raw_errc::short_read);
    // Declared length is shorter than the smallest document
    check_fails(bytes(4, 0, 0, 0, 0), tbson::raw_errc::invalid_header);
    check_fails(bytes(0xff, 0xff, 0xff, 0xff, 0), tbson::raw_errc::invalid_header);
    // Declared length is longer than the buffer
    check_fails(bytes(6, 0, 0, 0, 0), tbson::raw_errc::short_read);
    // Final byte is not a null terminator
    check_fails(bytes(5, 0, 0, 0, 1), tbson::raw_errc::invalid_terminator);
}

TEST_CASE("tbson/raw/Buffer may be longer than the document") {
    auto buf = bytes(5, 0, 0, 0, 0, 'j', 'u', 'n', 'k');
    auto d   = view_of(buf);
    CHECK(d.byte_size() == 5);
    CHECK(d.empty());
}

TEST_CASE("tbson/raw/Iterate") {
    auto        buf = tbson::testing::sample_bytes();
    auto        d   = view_of(buf);
    std::string keys;
    for (auto& elem : d) {
        keys += elem.key();
        keys += ",";
    }
    CHECK(keys == "d,s,o,a,b,g,t,ts,i,l,dec,u,");
    CHECK(std::ranges::distance(d) == 12);
}

TEST_CASE("tbson/raw/Accessors") {
    auto buf = tbson::testing::sample_bytes();
    auto d   = view_of(buf);

    auto get = [&](std::string_view key) {
        auto r = d.get(key);
        REQUIRE(r.has_value());
        REQUIRE(r->has_value());
        return **r;
    };
    CHECK(get("d").as_double() == 1.5);
    CHECK(get("s").as_str() == "hi"sv);
    CHECK(get("i").as_int32() == -5);
    CHECK(get("l").as_int64() == std::int64_t{1} << 40);
    CHECK(get("t").as_datetime() == tbson::datetime::from_millis(1000));
    CHECK(get("ts").as_timestamp() == tbson::timestamp{.time = 7, .increment = 3});
    CHECK(get("o").as_document()->get("n")->value().as_null().has_value());
    CHECK(get("u").type() == tbson::element_type::uint64);

    auto bin = get("b").as_binary();
    REQUIRE(bin.has_value());
    CHECK(bin->subtype == tbson::binary_subtype::user_defined);
    CHECK(bin->to_owned().bytes == bytes(1, 2, 3));

    // Mismatched accessors are empty
    CHECK_FALSE(get("s").as_int32().has_value());
    CHECK_FALSE(get("i").as_int64().has_value());
    CHECK_FALSE(get("d").as_bool().has_value());

    auto missing = d.get("nope");
    REQUIRE(missing.has_value());
    CHECK_FALSE(missing->has_value());
}

TEST_CASE("tbson/raw/Array access") {
    auto buf = tbson::testing::sample_bytes();
    auto arr = view_of(buf).get("a").value()->as_array();
    REQUIRE(arr.has_value());
    CHECK(arr->get(0).value()->as_int32() == 1);
    CHECK(arr->get(1).value()->as_bool() == true);
    CHECK_FALSE(arr->get(2).value().has_value());
    auto owned = arr->to_array();
    REQUIRE(owned.has_value());
    CHECK(*owned == tbson::array{1, true});
}

TEST_CASE("tbson/raw/Convert to owned") {
    auto buf   = tbson::testing::sample_bytes();
    auto owned = view_of(buf).to_document();
    REQUIRE(owned.has_value());
    CHECK(*owned == tbson::testing::sample_document());
}

TEST_CASE("tbson/raw/Unknown element type") {
    // clang-format off
    auto buf = bytes(
        12, 0, 0, 0,
        0x07, 'a', 0, 1, 0, 0, 0,
        0);
    // clang-format on
    auto d  = view_of(buf);
    auto it = d.begin();
    CHECK(it.has_error());
    CHECK(it.error() == tbson::raw_errc::invalid_type);
    CHECK(it != d.end());
    CHECK_THROWS_AS(*it, tbson::exception);
    // Incrementing an errant iterator has no effect
    ++it;
    CHECK(it.error() == tbson::raw_errc::invalid_type);

    auto owned = d.to_document();
    REQUIRE(owned.has_error());
    CHECK(owned.error().reason() == tbson::raw_errc::invalid_type);
}

TEST_CASE("tbson/raw/Old binary subtype") {
    // clang-format off
    auto buf = bytes(
        20, 0, 0, 0,
        0x05, 'b', 0, 7, 0, 0, 0, 0x02,
            3, 0, 0, 0, 1, 2, 3,
        0);
    // clang-format on
    auto d   = view_of(buf);
    auto it  = d.begin();
    REQUIRE_FALSE(it.has_error());
    auto bin = it->value().as_binary();
    REQUIRE(bin.has_value());
    CHECK(bin->subtype == tbson::binary_subtype::binary_old);
    // The inner length prefix is not part of the payload
    CHECK(bin->to_owned().bytes == bytes(1, 2, 3));

    auto owned = d.to_document();
    REQUIRE(owned.has_value());
    CHECK(*owned == doc({{"b", tbson::binary{tbson::binary_subtype::binary_old, bytes(1, 2, 3)}}}));

    // The inner length must match the outer length
    // clang-format off
    auto bad = bytes(
        20, 0, 0, 0,
        0x05, 'b', 0, 7, 0, 0, 0, 0x02,
            4, 0, 0, 0, 1, 2, 3,
        0);
    // clang-format on
    it = view_of(bad).begin();
    CHECK(it.error() == tbson::raw_errc::invalid_length);

    // Too short to hold the inner length
    // clang-format off
    auto tiny = bytes(
        15, 0, 0, 0,
        0x05, 'b', 0, 2, 0, 0, 0, 0x02, 1, 2,
        0);
    // clang-format on
    it = view_of(tiny).begin();
    CHECK(it.error() == tbson::raw_errc::invalid_length);
}

TEST_CASE("tbson/raw/Invalid boolean") {
    // clang-format off
    auto buf = bytes(
        9, 0, 0, 0,
        0x08, 'b', 0, 2,
        0);
    // clang-format on
    auto it = view_of(buf).begin();
    CHECK(it.error() == tbson::raw_errc::invalid_document);
}

TEST_CASE("tbson/raw/Invalid UTF-8") {
    // clang-format off
    auto key = bytes(
        12, 0, 0, 0,
        0x10, 0xc3, 0, 1, 0, 0, 0,
        0);
    auto str = bytes(
        14, 0, 0, 0,
        0x02, 's', 0, 2, 0, 0, 0, 0xff, 0,
        0);
    // clang-format on
    CHECK(view_of(key).begin().error() == tbson::raw_errc::invalid_utf8);
    CHECK(view_of(str).begin().error() == tbson::raw_errc::invalid_utf8);
}

TEST_CASE("tbson/raw/String without terminator") {
    // clang-format off
    auto buf = bytes(
        14, 0, 0, 0,
        0x02, 's', 0, 2, 0, 0, 0, 'x', 'y',
        0);
    // clang-format on
    CHECK(view_of(buf).begin().error() == tbson::raw_errc::invalid_length);
}

TEST_CASE("tbson/raw/Nested document overruns its parent") {
    // clang-format off
    auto buf = bytes(
        13, 0, 0, 0,
        0x03, 'o', 0,
            9, 0, 0, 0, // Claims more bytes than remain
            0,
        0);
    // clang-format on
    CHECK(view_of(buf).begin().error() == tbson::raw_errc::short_read);
}

TEST_CASE("tbson/raw/Errors are found lazily") {
    // clang-format off
    auto buf = bytes(
        19, 0, 0, 0,
        0x10, 'a', 0, 1, 0, 0, 0,
        0x07, 'b', 0, 1, 0, 0, 0,
        0);
    // clang-format on
    auto d = view_of(buf);
    // The first element is reachable before the bad one
    auto a = d.get("a");
    REQUIRE(a.has_value());
    CHECK(a->value().as_int32() == 1);
    auto b = d.get("b");
    REQUIRE(b.has_error());
    CHECK(b.error().reason() == tbson::raw_errc::invalid_type);
}

TEST_CASE("tbson/raw/Depth limit") {
    std::vector<std::byte> buf = bytes(5, 0, 0, 0, 0);
    // Three levels of documents
    buf = nest(nest(buf));
    CHECK(view_of(buf).to_document(3).has_value());
    // Four levels
    buf        = nest(buf);
    auto deep  = view_of(buf).to_document(3);
    REQUIRE(deep.has_error());
    CHECK(deep.error().reason() == tbson::raw_errc::depth_exceeded);
    CHECK(view_of(buf).to_document().has_value());
}

TEST_CASE("tbson/raw/Binary serializes by subtype") {
    auto payload = bytes(1, 2, 3);
    auto generic = tbson::raw_binary{tbson::binary_subtype::generic, payload}.to_bson(true);
    CHECK(generic == tbson::bson(tbson::binary{tbson::binary_subtype::generic, payload}));

    tbson::raw_binary uuid_bin{tbson::binary_subtype::uuid, payload};
    CHECK(uuid_bin.to_bson(true)
          == tbson::bson(doc({{"$binary", doc({{"base64", "AQID"}, {"subType", "04"}})}})));
    CHECK(uuid_bin.to_bson(false)
          == tbson::bson(doc({{"$binary",
                               doc({{"bytes", tbson::binary{tbson::binary_subtype::generic, payload}},
                                    {"subType", 4}})}})));
}
