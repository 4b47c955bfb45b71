#pragma once

#include <tbson/error.hpp>
#include <tbson/result.hpp>

#include <neo/fwd.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace tbson::de {

/**
 * @brief The result type produced when a deserializer drives the visitor `V`
 */
template <typename V>
using visit_result_t = result<typename std::remove_cvref_t<V>::value_type>;

/**
 * @brief Reserved newtype names. A target that requests one of these names asks
 * the deserializer for special handling of the value.
 */
namespace newtype_names {

/// The value must be a binary with the `uuid` subtype
inline constexpr std::string_view uuid = "$__tbson_private_uuid";
/// The value is wanted as a borrowed raw document
inline constexpr std::string_view raw_document = "$__tbson_private_raw_document";
/// The value is wanted as a borrowed raw array
inline constexpr std::string_view raw_array = "$__tbson_private_raw_array";
/// The value is wanted as a borrowed raw value
inline constexpr std::string_view raw_bson = "$__tbson_private_raw_bson";

}  // namespace newtype_names

/**
 * @brief Base class for visitors. A visitor receives exactly one of the
 * `visit_` calls from a deserializer and produces a `result<T>` from it.
 *
 * Narrow integer and float visits forward to the 64-bit visits. Borrowed and
 * owned strings forward to `visit_str`, and borrowed and owned byte buffers
 * forward to `visit_bytes`. Every other visit fails with `errc::invalid_type`,
 * naming the offered value and the text returned by the derived class's
 * `expecting()` method.
 *
 * @tparam Derived The visitor class (CRTP)
 * @tparam T The type of value produced by the visitor
 */
template <typename Derived, typename T>
class visitor_base {
public:
    using value_type  = T;
    using result_type = result<T>;

    result_type visit_bool(bool b) { return _reject(unexpected::boolean(b)); }

    result_type visit_i8(std::int8_t v) { return _self().visit_i64(v); }
    result_type visit_i16(std::int16_t v) { return _self().visit_i64(v); }
    result_type visit_i32(std::int32_t v) { return _self().visit_i64(v); }
    result_type visit_i64(std::int64_t v) { return _reject(unexpected::signed_integer(v)); }

    result_type visit_u8(std::uint8_t v) { return _self().visit_u64(v); }
    result_type visit_u16(std::uint16_t v) { return _self().visit_u64(v); }
    result_type visit_u32(std::uint32_t v) { return _self().visit_u64(v); }
    result_type visit_u64(std::uint64_t v) { return _reject(unexpected::unsigned_integer(v)); }

    result_type visit_f32(float f) { return _self().visit_f64(f); }
    result_type visit_f64(double d) { return _reject(unexpected::floating(d)); }

    result_type visit_str(std::string_view s) { return _reject(unexpected::str(s)); }
    /// Visit a string that outlives the deserializer
    result_type visit_borrowed_str(std::string_view s) { return _self().visit_str(s); }
    result_type visit_string(std::string&& s) { return _self().visit_str(s); }

    result_type visit_bytes(std::span<const std::byte>) { return _reject(unexpected::bytes()); }
    /// Visit bytes that outlive the deserializer
    result_type visit_borrowed_bytes(std::span<const std::byte> b) { return _self().visit_bytes(b); }
    result_type visit_byte_buf(std::vector<std::byte>&& b) {
        return _self().visit_bytes(std::span<const std::byte>(b));
    }

    result_type visit_none() { return _reject(unexpected::option()); }
    result_type visit_unit() { return _reject(unexpected::unit()); }

    template <typename D>
    result_type visit_some(D&) {
        return _reject(unexpected::option());
    }
    template <typename D>
    result_type visit_newtype_struct(D&) {
        return _reject(unexpected::newtype_struct());
    }
    template <typename S>
    result_type visit_seq(S&) {
        return _reject(unexpected::seq());
    }
    template <typename M>
    result_type visit_map(M&) {
        return _reject(unexpected::map());
    }
    template <typename E>
    result_type visit_enum(E&) {
        return _reject(unexpected::enum_());
    }

protected:
    result_type _reject(const unexpected& got) const {
        return error(decode_error::invalid_type(got, _cself().expecting()));
    }

private:
    Derived&       _self() noexcept { return static_cast<Derived&>(*this); }
    const Derived& _cself() const noexcept { return static_cast<const Derived&>(*this); }
};

/**
 * @brief Base class for deserializers that have a single way of offering their
 * value. Every type-specific request is answered by `deserialize_any()`, except
 * for options, which are always present, and enums, which such deserializers
 * cannot produce.
 *
 * @tparam Derived The deserializer class (CRTP). Must define `deserialize_any()`
 */
template <typename Derived>
class forward_to_any {
public:
#define TBSON_FORWARD_TO_ANY(Name)                                                                 \
    template <typename V>                                                                          \
    visit_result_t<V> Name(V&& v) {                                                                \
        return _self().deserialize_any(NEO_FWD(v));                                                \
    }
    TBSON_FORWARD_TO_ANY(deserialize_bool)
    TBSON_FORWARD_TO_ANY(deserialize_i8)
    TBSON_FORWARD_TO_ANY(deserialize_i16)
    TBSON_FORWARD_TO_ANY(deserialize_i32)
    TBSON_FORWARD_TO_ANY(deserialize_i64)
    TBSON_FORWARD_TO_ANY(deserialize_u8)
    TBSON_FORWARD_TO_ANY(deserialize_u16)
    TBSON_FORWARD_TO_ANY(deserialize_u32)
    TBSON_FORWARD_TO_ANY(deserialize_u64)
    TBSON_FORWARD_TO_ANY(deserialize_f32)
    TBSON_FORWARD_TO_ANY(deserialize_f64)
    TBSON_FORWARD_TO_ANY(deserialize_str)
    TBSON_FORWARD_TO_ANY(deserialize_string)
    TBSON_FORWARD_TO_ANY(deserialize_bytes)
    TBSON_FORWARD_TO_ANY(deserialize_byte_buf)
    TBSON_FORWARD_TO_ANY(deserialize_unit)
    TBSON_FORWARD_TO_ANY(deserialize_seq)
    TBSON_FORWARD_TO_ANY(deserialize_map)
    TBSON_FORWARD_TO_ANY(deserialize_identifier)
    TBSON_FORWARD_TO_ANY(deserialize_ignored_any)
#undef TBSON_FORWARD_TO_ANY

    template <typename V>
    visit_result_t<V> deserialize_option(V&& v) {
        return v.visit_some(_self());
    }

    template <typename V>
    visit_result_t<V> deserialize_newtype_struct(std::string_view, V&& v) {
        return _self().deserialize_any(NEO_FWD(v));
    }

    template <typename V>
    visit_result_t<V> deserialize_tuple(std::size_t, V&& v) {
        return _self().deserialize_any(NEO_FWD(v));
    }

    template <typename V>
    visit_result_t<V> deserialize_struct(std::span<const std::string_view>, V&& v) {
        return _self().deserialize_any(NEO_FWD(v));
    }

    template <typename V>
    visit_result_t<V> deserialize_enum(std::span<const std::string_view>, V&&) {
        return error(decode_error::custom("unexpected Enum"));
    }

private:
    Derived& _self() noexcept { return static_cast<Derived&>(*this); }
};

/**
 * @brief Describes one field of a structure: its key in the document, and the
 * data member that receives it
 */
template <typename Owner, typename Member>
struct field_info {
    std::string_view name;
    Member Owner::*  member;
};

/**
 * @brief Describe a structure field for use in a `bson_fields()` function.
 *
 * ```
 * struct point {
 *     int x;
 *     int y;
 *     static constexpr auto bson_fields() {
 *         return std::tuple(tbson::de::field("x", &point::x),
 *                           tbson::de::field("y", &point::y));
 *     }
 * };
 * ```
 */
template <typename Owner, typename Member>
constexpr field_info<Owner, Member> field(std::string_view name, Member Owner::*member) noexcept {
    return {name, member};
}

/**
 * @brief A target that accepts any value and discards it. Used to skip over
 * entries that a target does not want.
 */
struct ignored_any {
    bool operator==(const ignored_any&) const = default;
};

template <typename T>
constexpr bool is_optional_v = false;

template <typename T>
constexpr bool is_optional_v<std::optional<T>> = true;

}  // namespace tbson::de
