#pragma once

#include <tbson/result.hpp>
#include <tbson/types.hpp>
#include <tbson/value.hpp>

#include <charconv>
#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

/**
 * @brief Definitions for the extended JSON convention, in which BSON-only types
 * are written as documents with a single reserved `$`-prefixed key.
 */
namespace tbson::extjson {

/// Marker keys recognized by the value decoder
inline constexpr std::string_view number_int           = "$numberInt";
inline constexpr std::string_view number_long          = "$numberLong";
inline constexpr std::string_view number_uint32        = "$numberUInt32";
inline constexpr std::string_view number_uint64        = "$numberUInt64";
inline constexpr std::string_view number_double        = "$numberDouble";
inline constexpr std::string_view number_decimal       = "$numberDecimal";
inline constexpr std::string_view number_decimal_bytes = "$numberDecimalBytes";
inline constexpr std::string_view binary_marker        = "$binary";
inline constexpr std::string_view timestamp_marker     = "$timestamp";
inline constexpr std::string_view date_marker          = "$date";

/// Encode bytes as padded standard base64
[[nodiscard]] std::string base64_encode(std::span<const std::byte> bytes);
/// Decode padded standard base64. Fails with `errc::custom` on malformed input.
[[nodiscard]] result<std::vector<std::byte>> base64_decode(std::string_view text);

/**
 * @brief Parse a decimal integer that must span the whole string
 *
 * One leading `+` is accepted when a digit follows it.
 */
template <typename I>
[[nodiscard]] std::optional<I> parse_integer(std::string_view s) noexcept {
    if (s.size() > 1 and s[0] == '+' and s[1] >= '0' and s[1] <= '9') {
        s.remove_prefix(1);
    }
    I    value{};
    auto end       = s.data() + s.size();
    auto [ptr, ec] = std::from_chars(s.data(), end, value);
    if (s.empty() or ec != std::errc{} or ptr != end) {
        return std::nullopt;
    }
    return value;
}

/**
 * @brief Get the extended JSON document for a binary value:
 * `{"$binary": {"base64": <text>, "subType": <two hex digits>}}`
 */
[[nodiscard]] document extended_document(const binary& b);
/// `{"$date": {"$numberLong": <milliseconds as string>}}`
[[nodiscard]] document extended_document(datetime dt);
/// `{"$timestamp": {"t": <time>, "i": <increment>}}`
[[nodiscard]] document extended_document(timestamp ts);
/// `{"$numberDecimalBytes": <16 bytes as a generic binary>}`
[[nodiscard]] document extended_document(const decimal128& d);

/**
 * @brief Get the canonical one-key extended JSON document for a scalar value.
 *
 * Integers become `$numberInt`, `$numberLong`, `$numberUInt32` or
 * `$numberUInt64` strings. Non-finite doubles become `$numberDouble`. Binary,
 * datetime, timestamp and decimal128 values use `extended_document()`.
 *
 * @return The document, or `nullopt` for values that have no extended form
 * (strings, booleans, null, finite doubles, documents and arrays)
 */
[[nodiscard]] std::optional<document> canonical_document(const bson& value);

}  // namespace tbson::extjson
