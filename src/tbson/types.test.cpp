#include <tbson/types.hpp>

#include <catch2/catch_test_macros.hpp>

#include <array>

TEST_CASE("tbson/types/element type names") {
    CHECK(tbson::name_of(tbson::element_type::int32) == "int32");
    CHECK(tbson::name_of(tbson::element_type::double_) == "double_");
    CHECK(tbson::is_known_type_tag(0x15));
    CHECK(tbson::is_known_type_tag(0x0A));
    // ObjectId, regex and the other legacy tags are not part of the value model
    CHECK_FALSE(tbson::is_known_type_tag(0x07));
    CHECK_FALSE(tbson::is_known_type_tag(0x0B));
    CHECK_FALSE(tbson::is_known_type_tag(0x00));
}

TEST_CASE("tbson/types/datetime/Parse UTC") {
    auto dt = tbson::datetime::parse_rfc3339("1970-01-01T00:00:01.5Z");
    REQUIRE(dt.has_value());
    CHECK(dt->millis() == 1500);

    dt = tbson::datetime::parse_rfc3339("2020-01-01T00:00:00Z");
    REQUIRE(dt.has_value());
    CHECK(dt->millis() == 1577836800000);
}

TEST_CASE("tbson/types/datetime/Parse with offset") {
    auto dt = tbson::datetime::parse_rfc3339("2020-01-01T00:00:00+01:00");
    REQUIRE(dt.has_value());
    CHECK(dt->millis() == 1577833200000);
    // Sub-millisecond digits are dropped
    dt = tbson::datetime::parse_rfc3339("1970-01-01T00:00:00.123999-00:00");
    REQUIRE(dt.has_value());
    CHECK(dt->millis() == 123);
}

TEST_CASE("tbson/types/datetime/Invalid strings") {
    for (auto s : {"", "2020-13-01T00:00:00Z", "2020-01-01", "2020-01-01T00:00:00", "2020-02-30T00:00:00Z",
                   "2020-01-01T00:00:00.Z", "2020-01-01T00:00:00Zjunk", "2020-01-01T-0:00:00Z",
                   "+020-01-01T00:00:00Z", "2020-01-01T00:00:00+-1:00"}) {
        INFO(s);
        auto dt = tbson::datetime::parse_rfc3339(s);
        REQUIRE(dt.has_error());
        CHECK(dt.error().kind() == tbson::errc::invalid_value);
    }
}

TEST_CASE("tbson/types/datetime/Format") {
    CHECK(tbson::datetime::from_millis(0).to_rfc3339() == "1970-01-01T00:00:00.000Z");
    CHECK(tbson::datetime::from_millis(1577836800123).to_rfc3339() == "2020-01-01T00:00:00.123Z");
    CHECK(tbson::datetime::from_millis(-1).to_rfc3339() == "1969-12-31T23:59:59.999Z");
}

TEST_CASE("tbson/types/decimal128/Length") {
    std::array<std::byte, 16> sixteen{};
    sixteen[0] = std::byte{0x2a};
    auto d     = tbson::decimal128::from_bytes(sixteen);
    REQUIRE(d.has_value());
    CHECK(d->bytes()[0] == std::byte{0x2a});

    auto short_ = tbson::decimal128::from_bytes(std::span(sixteen).first(15));
    REQUIRE(short_.has_error());
    CHECK(short_.error().kind() == tbson::errc::invalid_length);
    CHECK(short_.error().message() == "invalid length 15, expected 16 bytes");
}

TEST_CASE("tbson/types/object_id") {
    auto oid = tbson::object_id::parse_str("0123456789abcdef01234567");
    REQUIRE(oid.has_value());
    CHECK(oid->to_hex() == "0123456789abcdef01234567");
    CHECK(oid->bytes()[1] == std::byte{0x23});

    auto bad = tbson::object_id::parse_str("xyz");
    REQUIRE(bad.has_error());
    CHECK(bad.error().message()
          == R"(invalid value: string "xyz", expected 24-character, big-endian hex string)");

    std::array<std::byte, 11> eleven{};
    auto                      short_ = tbson::object_id::from_bytes(eleven);
    REQUIRE(short_.has_error());
    CHECK(short_.error().message() == "invalid length 11, expected 12 bytes");
}

TEST_CASE("tbson/types/uuid") {
    auto u = tbson::uuid::parse_str("00112233-4455-6677-8899-aabbccddeeff");
    REQUIRE(u.has_value());
    CHECK(u->to_string() == "00112233-4455-6677-8899-aabbccddeeff");
    CHECK(u->bytes()[15] == std::byte{0xff});

    auto plain = tbson::uuid::parse_str("00112233445566778899AABBCCDDEEFF");
    REQUIRE(plain.has_value());
    CHECK(*plain == *u);

    CHECK(tbson::uuid::parse_str("00112233-4455-6677-8899_aabbccddeeff").has_error());
    CHECK(tbson::uuid::parse_str("0011").has_error());
}
