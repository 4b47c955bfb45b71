#pragma once

#include <tbson/result.hpp>

#include <array>
#include <compare>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

/**
 * @brief X-macro list of the element types that tbson understands.
 *
 * Invoked as X(Code, Type, Name), where `Code` is the element type tag in the
 * encoded form, `Type` is the C++ type that holds an owned value of that
 * element, and `Name` is the enumerator name in `tbson::element_type`.
 *
 * The order of this list is the order of the alternatives of `tbson::bson`.
 */
#define TBSON_ELEMENT_TYPE_X_LIST                                                                  \
    X(0x01, double, double_)                                                                       \
    X(0x02, std::string, string)                                                                   \
    X(0x03, ::tbson::document, document)                                                           \
    X(0x04, ::tbson::array, array)                                                                 \
    X(0x05, ::tbson::binary, binary)                                                               \
    X(0x08, bool, boolean)                                                                         \
    X(0x09, ::tbson::datetime, datetime)                                                           \
    X(0x0A, ::tbson::null, null)                                                                   \
    X(0x10, std::int32_t, int32)                                                                   \
    X(0x11, ::tbson::timestamp, timestamp)                                                         \
    X(0x12, std::int64_t, int64)                                                                   \
    X(0x13, ::tbson::decimal128, decimal128)                                                       \
    X(0x14, std::uint32_t, uint32)                                                                 \
    X(0x15, std::uint64_t, uint64)

namespace tbson {

/**
 * @brief The type of a BSON element
 */
enum class element_type : std::uint8_t {
#define X(Code, _type, Name) Name = Code,
    TBSON_ELEMENT_TYPE_X_LIST
#undef X
};

/**
 * @brief Get the name of an element type, as it appears in diagnostics
 */
[[nodiscard]] std::string_view name_of(element_type t) noexcept;

/**
 * @brief Test whether the given tag byte names a known element type
 */
[[nodiscard]] bool is_known_type_tag(std::uint8_t tag) noexcept;

/**
 * @brief The subtype byte of a binary value. Values not named here may still be
 * stored.
 */
enum class binary_subtype : std::uint8_t {
    generic      = 0x00,
    function     = 0x01,
    binary_old   = 0x02,
    uuid_old     = 0x03,
    uuid         = 0x04,
    md5          = 0x05,
    encrypted    = 0x06,
    column       = 0x07,
    user_defined = 0x80,
};

/**
 * @brief The null value
 */
struct null {
    bool operator==(const null&) const = default;
};

/**
 * @brief An owned binary value with a subtype
 */
struct binary {
    binary_subtype         subtype = binary_subtype::generic;
    std::vector<std::byte> bytes;

    bool operator==(const binary&) const = default;
};

/**
 * @brief A replication timestamp. Not a point in time.
 */
struct timestamp {
    std::uint32_t time      = 0;
    std::uint32_t increment = 0;

    bool operator==(const timestamp&) const = default;
};

/**
 * @brief A UTC point in time with millisecond precision
 */
class datetime {
public:
    constexpr datetime() noexcept = default;

    static constexpr datetime from_millis(std::int64_t ms) noexcept {
        datetime r;
        r._ms = ms;
        return r;
    }

    /**
     * @brief Parse an RFC 3339 date-time string, as used in relaxed extended JSON.
     *
     * Accepts `YYYY-MM-DDTHH:MM:SS[.fraction](Z|±HH:MM)`. Fractions below one
     * millisecond are truncated.
     */
    static result<datetime> parse_rfc3339(std::string_view str);

    [[nodiscard]] constexpr std::int64_t millis() const noexcept { return _ms; }

    /// Render as an RFC 3339 string in UTC with millisecond precision
    [[nodiscard]] std::string to_rfc3339() const;

    auto operator<=>(const datetime&) const = default;

private:
    std::int64_t _ms = 0;
};

/**
 * @brief An opaque IEEE 754-2008 decimal128 value. Only the encoded bytes are
 * stored.
 */
class decimal128 {
public:
    constexpr decimal128() noexcept = default;

    /**
     * @brief Create a decimal from its 16 little-endian encoded bytes.
     *
     * Fails with `errc::invalid_length` if `bytes` is not exactly sixteen bytes long
     */
    static result<decimal128> from_bytes(std::span<const std::byte> bytes);

    [[nodiscard]] std::span<const std::byte, 16> bytes() const noexcept { return _bytes; }

    bool operator==(const decimal128&) const = default;

private:
    std::array<std::byte, 16> _bytes{};
};

/**
 * @brief A twelve-byte object identifier
 */
class object_id {
public:
    constexpr object_id() noexcept = default;

    /**
     * @brief Parse a 24-character big-endian hex string
     */
    static result<object_id> parse_str(std::string_view hex);
    /**
     * @brief Create an identifier from exactly twelve bytes
     */
    static result<object_id> from_bytes(std::span<const std::byte> bytes);

    [[nodiscard]] std::span<const std::byte, 12> bytes() const noexcept { return _bytes; }
    [[nodiscard]] std::string                    to_hex() const;

    bool operator==(const object_id&) const = default;

private:
    std::array<std::byte, 12> _bytes{};
};

/**
 * @brief A UUID. Stored in BSON as a binary value with the `uuid` subtype.
 */
class uuid {
public:
    constexpr uuid() noexcept = default;

    /**
     * @brief Parse a UUID string, either hyphenated (36 characters) or plain
     * (32 hex characters)
     */
    static result<uuid> parse_str(std::string_view str);
    /**
     * @brief Create a UUID from exactly sixteen bytes
     */
    static result<uuid> from_bytes(std::span<const std::byte> bytes);

    [[nodiscard]] std::span<const std::byte, 16> bytes() const noexcept { return _bytes; }
    [[nodiscard]] std::string                    to_string() const;

    bool operator==(const uuid&) const = default;

private:
    std::array<std::byte, 16> _bytes{};
};

namespace detail {

// Decode one hex digit, or -1 if the character is not a hex digit
constexpr int hex_digit(char c) noexcept {
    if (c >= '0' and c <= '9') {
        return c - '0';
    }
    if (c >= 'a' and c <= 'f') {
        return c - 'a' + 10;
    }
    if (c >= 'A' and c <= 'F') {
        return c - 'A' + 10;
    }
    return -1;
}

}  // namespace detail

}  // namespace tbson
