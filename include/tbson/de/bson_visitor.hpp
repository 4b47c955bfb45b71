#pragma once

#include <tbson/de/deserialize.hpp>
#include <tbson/de/extjson_models.hpp>
#include <tbson/de/visitor.hpp>
#include <tbson/extjson.hpp>
#include <tbson/format.hpp>
#include <tbson/types.hpp>
#include <tbson/value.hpp>

#include <fmt/format.h>

#include <cstdint>
#include <limits>
#include <string>
#include <string_view>

namespace tbson::de {

/**
 * @brief Decodes any self-describing input into an owned `bson` value.
 *
 * Signed integers of up to 32 bits become `int32`, signed 64-bit integers become
 * `int64`, and unsigned integers of every width become `uint64`. Maps whose
 * first key is an extended JSON marker are decoded as the marked type.
 */
struct bson_visitor : visitor_base<bson_visitor, bson> {
    std::string_view expecting() const noexcept { return "any valid BSON value"; }

    result<bson> visit_bool(bool b) { return bson(b); }
    result<bson> visit_i8(std::int8_t i) { return bson(static_cast<std::int32_t>(i)); }
    result<bson> visit_i16(std::int16_t i) { return bson(static_cast<std::int32_t>(i)); }
    result<bson> visit_i32(std::int32_t i) { return bson(i); }
    result<bson> visit_i64(std::int64_t i) { return bson(i); }
    result<bson> visit_u64(std::uint64_t u) { return bson(u); }
    result<bson> visit_f64(double d) { return bson(d); }
    result<bson> visit_str(std::string_view s) { return bson(s); }
    result<bson> visit_string(std::string&& s) { return bson(std::move(s)); }
    result<bson> visit_bytes(std::span<const std::byte> b) {
        return bson(binary{binary_subtype::generic, std::vector<std::byte>(b.begin(), b.end())});
    }
    result<bson> visit_byte_buf(std::vector<std::byte>&& b) {
        return bson(binary{binary_subtype::generic, std::move(b)});
    }
    result<bson> visit_none() { return bson(null{}); }
    result<bson> visit_unit() { return bson(null{}); }

    template <typename D>
    result<bson> visit_some(D& d) {
        return d.deserialize_any(bson_visitor{});
    }

    template <typename D>
    result<bson> visit_newtype_struct(D& d) {
        return d.deserialize_any(bson_visitor{});
    }

    template <typename S>
    result<bson> visit_seq(S& s) {
        array values;
        while (true) {
            TBSON_TRY(auto elem, s.template next_element<bson>());
            if (not elem) {
                break;
            }
            values.push_back(std::move(*elem));
        }
        return bson(std::move(values));
    }

    template <typename M>
    result<bson> visit_map(M& m) {
        return decode_map(m);
    }

    /**
     * @brief Decode the entries of a map. Only the first key is checked for an
     * extended JSON marker. When it is one, the marked value is returned and the
     * remaining entries are not read.
     */
    template <typename M>
    static result<bson> decode_map(M& m) {
        TBSON_TRY(auto first, m.template next_key<std::string>());
        document doc;
        if (not first) {
            return bson(std::move(doc));
        }
        std::string key = std::move(*first);
        if (key == extjson::number_int) {
            return _parse_integer<std::int32_t>(m, "32-bit signed integer as a string");
        } else if (key == extjson::number_long) {
            return _parse_integer<std::int64_t>(m, "64-bit signed integer as a string");
        } else if (key == extjson::number_uint32) {
            return _parse_integer<std::uint32_t>(m, "32-bit unsigned integer as a string");
        } else if (key == extjson::number_uint64) {
            return _parse_integer<std::uint64_t>(m, "64-bit unsigned integer as a string");
        } else if (key == extjson::number_double) {
            TBSON_TRY(auto text, m.template next_value<std::string>());
            if (text == "Infinity") {
                return bson(std::numeric_limits<double>::infinity());
            } else if (text == "-Infinity") {
                return bson(-std::numeric_limits<double>::infinity());
            } else if (text == "NaN") {
                return bson(std::numeric_limits<double>::quiet_NaN());
            }
            // Other text is read as an integer, not as a double
            return _to_integer<std::int64_t>(text, "64-bit signed integer as a string");
        } else if (key == extjson::binary_marker) {
            TBSON_TRY(auto body, m.template next_value<extjson_models::binary_body>());
            TBSON_TRY(auto bin, std::move(body).to_binary());
            return bson(std::move(bin));
        } else if (key == extjson::timestamp_marker) {
            TBSON_TRY(auto body, m.template next_value<extjson_models::timestamp_body>());
            return bson(body.to_timestamp());
        } else if (key == extjson::date_marker) {
            TBSON_TRY(auto body, m.template next_value<extjson_models::date_body>());
            return bson(body.value);
        } else if (key == extjson::number_decimal) {
            return error(decode_error::custom(
                "deserializing decimal128 values from strings is not currently supported"));
        } else if (key == extjson::number_decimal_bytes) {
            TBSON_TRY(auto bytes, m.template next_value<std::vector<std::byte>>());
            TBSON_TRY(auto dec, decimal128::from_bytes(bytes));
            return bson(dec);
        }
        // An ordinary document
        while (true) {
            TBSON_TRY(auto value, m.template next_value<bson>());
            doc.insert(std::move(key), std::move(value));
            TBSON_TRY(auto next, m.template next_key<std::string>());
            if (not next) {
                break;
            }
            key = std::move(*next);
        }
        return bson(std::move(doc));
    }

private:
    template <typename I, typename M>
    static result<bson> _parse_integer(M& m, std::string_view expected) {
        TBSON_TRY(auto text, m.template next_value<std::string>());
        return _to_integer<I>(text, expected);
    }

    template <typename I>
    static result<bson> _to_integer(std::string_view text, std::string_view expected) {
        auto n = extjson::parse_integer<I>(text);
        if (not n) {
            return error(decode_error::invalid_value(unexpected::str(text), expected));
        }
        return bson(*n);
    }
};

template <>
struct deserialize_traits<bson> {
    template <typename D>
    static result<bson> deserialize(D& d) {
        return d.deserialize_any(bson_visitor{});
    }
};

template <>
struct deserialize_traits<document> {
    template <typename D>
    static result<document> deserialize(D& d) {
        TBSON_TRY(bson value, d.deserialize_map(bson_visitor{}));
        if (auto doc = value.get_if<document>()) {
            return std::move(*doc);
        }
        return error(decode_error::invalid_type(
            unexpected::map(),
            fmt::format("expected document, found extended JSON data type: {}", value)));
    }
};

template <>
struct deserialize_traits<binary> {
    template <typename D>
    static result<binary> deserialize(D& d) {
        TBSON_TRY(bson value, de::deserialize<bson>(d));
        if (auto bin = value.get_if<binary>()) {
            return std::move(*bin);
        }
        return error(
            decode_error::custom(fmt::format("expecting Binary but got {} instead", value)));
    }
};

template <>
struct deserialize_traits<timestamp> {
    template <typename D>
    static result<timestamp> deserialize(D& d) {
        TBSON_TRY(bson value, de::deserialize<bson>(d));
        if (auto ts = value.get_if<timestamp>()) {
            return *ts;
        }
        return error(decode_error::custom("expecting Timestamp"));
    }
};

template <>
struct deserialize_traits<datetime> {
    template <typename D>
    static result<datetime> deserialize(D& d) {
        TBSON_TRY(bson value, de::deserialize<bson>(d));
        if (auto dt = value.get_if<datetime>()) {
            return *dt;
        }
        return error(decode_error::custom("expecting DateTime"));
    }
};

template <>
struct deserialize_traits<decimal128> {
    template <typename D>
    static result<decimal128> deserialize(D& d) {
        TBSON_TRY(bson value, de::deserialize<bson>(d));
        if (auto dec = value.get_if<decimal128>()) {
            return *dec;
        }
        return error(decode_error::custom(fmt::format("expecting Decimal128, got {}", value)));
    }
};

template <>
struct deserialize_traits<object_id> {
    struct visitor : visitor_base<visitor, object_id> {
        std::string_view expecting() const noexcept { return "expecting an ObjectId"; }

        result<object_id> visit_str(std::string_view s) { return object_id::parse_str(s); }
        result<object_id> visit_bytes(std::span<const std::byte> b) {
            return object_id::from_bytes(b);
        }

        template <typename M>
        result<object_id> visit_map(M& m) {
            TBSON_TRY(bson value, bson_visitor::decode_map(m));
            return error(decode_error::custom(fmt::format(
                "expected map containing extended-JSON formatted ObjectId, instead found {}",
                value)));
        }
    };

    template <typename D>
    static result<object_id> deserialize(D& d) {
        if (not d.is_human_readable()) {
            return d.deserialize_bytes(visitor{});
        }
        return d.deserialize_any(visitor{});
    }
};

/**
 * @brief A UUID is requested through the reserved UUID newtype name, which
 * requires the stored value to be a binary with the `uuid` subtype
 */
template <>
struct deserialize_traits<uuid> {
    struct visitor : visitor_base<visitor, uuid> {
        std::string_view expecting() const noexcept { return "a UUID"; }

        result<uuid> visit_bytes(std::span<const std::byte> b) { return uuid::from_bytes(b); }

        template <typename M>
        result<uuid> visit_map(M& m) {
            TBSON_TRY(bson value, bson_visitor::decode_map(m));
            auto bin = value.get_if<binary>();
            if (bin == nullptr or bin->subtype != binary_subtype::uuid) {
                return error(decode_error::custom(
                    fmt::format("expected Binary with subtype 4, instead got {}", value)));
            }
            return uuid::from_bytes(bin->bytes);
        }
    };

    template <typename D>
    static result<uuid> deserialize(D& d) {
        return d.deserialize_newtype_struct(newtype_names::uuid, visitor{});
    }
};

}  // namespace tbson::de
