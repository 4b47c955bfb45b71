#pragma once

#include <tbson/de/deserialize.hpp>
#include <tbson/de/visitor.hpp>
#include <tbson/extjson.hpp>
#include <tbson/types.hpp>

#include <fmt/format.h>

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <tuple>
#include <utility>
#include <vector>

/**
 * @brief The bodies of the structured extended JSON markers
 */
namespace tbson::de::extjson_models {

/// The body of `$timestamp`: `{"t": <time>, "i": <increment>}`
struct timestamp_body {
    std::uint32_t t = 0;
    std::uint32_t i = 0;

    static constexpr auto bson_fields() {
        return std::tuple(field("t", &timestamp_body::t), field("i", &timestamp_body::i));
    }

    timestamp to_timestamp() const noexcept { return timestamp{.time = t, .increment = i}; }
};

/**
 * @brief The `subType` of a `$binary` body. Textual bodies carry one or two hex
 * digits. Binary-native bodies carry an integer.
 */
struct subtype_code {
    binary_subtype value = binary_subtype::generic;
};

/**
 * @brief The body of `$binary`. Textual bodies carry `base64` text, and
 * binary-native bodies carry the `bytes` directly.
 */
struct binary_body {
    std::optional<std::string>            base64;
    std::optional<std::vector<std::byte>> bytes;
    subtype_code                          subtype;

    static constexpr auto bson_fields() {
        return std::tuple(field("base64", &binary_body::base64),
                          field("bytes", &binary_body::bytes),
                          field("subType", &binary_body::subtype));
    }

    result<binary> to_binary() && {
        if (bytes) {
            return binary{subtype.value, std::move(*bytes)};
        }
        if (not base64) {
            return error(decode_error::custom("missing field `base64`"));
        }
        TBSON_TRY(auto decoded, extjson::base64_decode(*base64));
        return binary{subtype.value, std::move(decoded)};
    }
};

/// The body of `$binary` as offered by a binary-native producer. The bytes are borrowed.
struct borrowed_binary_body {
    std::span<const std::byte> bytes;
    std::uint8_t               subtype = 0;

    static constexpr auto bson_fields() {
        return std::tuple(field("bytes", &borrowed_binary_body::bytes),
                          field("subType", &borrowed_binary_body::subtype));
    }
};

/**
 * @brief The body of `$date`. One of: an integer number of milliseconds, an
 * RFC 3339 string, or `{"$numberLong": "<milliseconds>"}`.
 */
struct date_body {
    datetime value;
};

}  // namespace tbson::de::extjson_models

namespace tbson::de {

template <>
struct deserialize_traits<extjson_models::subtype_code> {
    using code = extjson_models::subtype_code;

    struct visitor : visitor_base<visitor, code> {
        std::string_view expecting() const noexcept { return "a binary subtype"; }

        result<code> visit_str(std::string_view s) {
            if (s.empty() or s.size() > 2) {
                return error(decode_error::invalid_value(unexpected::str(s),
                                                         "one or two hex digits"));
            }
            unsigned n = 0;
            for (char c : s) {
                const int d = tbson::detail::hex_digit(c);
                if (d < 0) {
                    return error(decode_error::invalid_value(unexpected::str(s),
                                                             "one or two hex digits"));
                }
                n = n * 16 + static_cast<unsigned>(d);
            }
            return code{static_cast<binary_subtype>(n)};
        }

        result<code> visit_i64(std::int64_t i) {
            if (i < 0 or i > 0xff) {
                return error(decode_error::invalid_value(unexpected::signed_integer(i),
                                                         "a subtype byte"));
            }
            return code{static_cast<binary_subtype>(i)};
        }

        result<code> visit_u64(std::uint64_t u) {
            if (u > 0xff) {
                return error(decode_error::invalid_value(unexpected::unsigned_integer(u),
                                                         "a subtype byte"));
            }
            return code{static_cast<binary_subtype>(u)};
        }
    };

    template <typename D>
    static result<code> deserialize(D& d) {
        return d.deserialize_any(visitor{});
    }
};

template <>
struct deserialize_traits<extjson_models::date_body> {
    using body = extjson_models::date_body;

    struct visitor : visitor_base<visitor, body> {
        std::string_view expecting() const noexcept { return "a datetime body"; }

        result<body> visit_i64(std::int64_t ms) { return body{datetime::from_millis(ms)}; }

        result<body> visit_u64(std::uint64_t ms) {
            if (not std::in_range<std::int64_t>(ms)) {
                return error(decode_error::invalid_value(unexpected::unsigned_integer(ms),
                                                         "milliseconds since the epoch"));
            }
            return body{datetime::from_millis(static_cast<std::int64_t>(ms))};
        }

        result<body> visit_str(std::string_view s) {
            return datetime::parse_rfc3339(s).transform([](datetime dt) { return body{dt}; });
        }

        template <typename M>
        result<body> visit_map(M& m) {
            TBSON_TRY(auto key, m.template next_key<std::string>());
            if (key != extjson::number_long) {
                return error(decode_error::invalid_value(unexpected::map(),
                                                         "a $numberLong datetime body"));
            }
            TBSON_TRY(auto text, m.template next_value<std::string>());
            auto ms = extjson::parse_integer<std::int64_t>(text);
            if (not ms) {
                return error(decode_error::invalid_value(unexpected::str(text),
                                                         "64-bit signed integer as a string"));
            }
            return body{datetime::from_millis(*ms)};
        }
    };

    template <typename D>
    static result<body> deserialize(D& d) {
        return d.deserialize_any(visitor{});
    }
};

}  // namespace tbson::de
