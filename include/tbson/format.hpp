#pragma once

#include <tbson/error.hpp>
#include <tbson/raw.hpp>
#include <tbson/types.hpp>
#include <tbson/value.hpp>

#include <fmt/core.h>
#include <fmt/format.h>

namespace tbson::detail {

// Formatter base that accepts only an empty format spec
struct plain_formatter {
    constexpr auto parse(fmt::format_parse_context& ctx) { return ctx.begin(); }
};

}  // namespace tbson::detail

/**
 * @brief Formats a BSON value as a compact single-line debug representation.
 *
 * Integers carry their width as a suffix (`42:i32`), strings are quoted and
 * escaped, and binary-only types render with a type prefix, e.g.
 * `Timestamp(1, 2)`.
 */
template <>
struct fmt::formatter<tbson::bson> : tbson::detail::plain_formatter {
    fmt::format_context::iterator format(const tbson::bson& b, fmt::format_context& ctx) const;
};

template <>
struct fmt::formatter<tbson::document> : tbson::detail::plain_formatter {
    fmt::format_context::iterator format(const tbson::document& d, fmt::format_context& ctx) const;
};

template <>
struct fmt::formatter<tbson::binary> : tbson::detail::plain_formatter {
    fmt::format_context::iterator format(const tbson::binary& b, fmt::format_context& ctx) const;
};

template <>
struct fmt::formatter<tbson::raw_bson> : tbson::detail::plain_formatter {
    fmt::format_context::iterator format(const tbson::raw_bson& b, fmt::format_context& ctx) const;
};

template <>
struct fmt::formatter<tbson::raw_document> : tbson::detail::plain_formatter {
    fmt::format_context::iterator format(const tbson::raw_document& d,
                                         fmt::format_context&       ctx) const;
};

template <>
struct fmt::formatter<tbson::element_type> : fmt::formatter<std::string_view> {
    fmt::format_context::iterator format(tbson::element_type t, fmt::format_context& ctx) const {
        return fmt::formatter<std::string_view>::format(tbson::name_of(t), ctx);
    }
};

template <>
struct fmt::formatter<tbson::unexpected> : fmt::formatter<std::string_view> {
    fmt::format_context::iterator format(const tbson::unexpected& u,
                                         fmt::format_context&     ctx) const {
        return fmt::formatter<std::string_view>::format(u.describe(), ctx);
    }
};

template <>
struct fmt::formatter<tbson::decode_error> : fmt::formatter<std::string_view> {
    fmt::format_context::iterator format(const tbson::decode_error& e,
                                         fmt::format_context&       ctx) const {
        return fmt::formatter<std::string_view>::format(e.message(), ctx);
    }
};
