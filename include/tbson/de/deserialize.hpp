#pragma once

#include <tbson/de/visitor.hpp>
#include <tbson/error.hpp>
#include <tbson/result.hpp>

#include <fmt/core.h>
#include <fmt/format.h>

#include <neo/fwd.hpp>

#include <array>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

/**
 * @brief Type-directed decoding. A target type `T` is decoded from a
 * deserializer `D` by `deserialize_traits<T>::deserialize(d)`, which asks `d`
 * for a particular shape of value and hands it a visitor that builds the `T`.
 */
namespace tbson::de {

/**
 * @brief Specialize this template to make a type decodable. A specialization
 * provides `template <typename D> static result<T> deserialize(D&)`.
 */
template <typename T>
struct deserialize_traits;

/**
 * @brief Decode a `T` from the given deserializer
 */
template <typename T, typename D>
result<T> deserialize(D& d) {
    return deserialize_traits<T>::deserialize(d);
}

/**
 * @brief Specialize this template to decode a plain enumeration by name. The
 * specialization provides a `static constexpr` array `table` of
 * `std::pair<std::string_view, E>`.
 */
template <typename E>
struct enum_variants;

/// A structure that lists its fields with a `bson_fields()` function
template <typename T>
concept described_struct = requires { T::bson_fields(); };

/// A wrapper type that names itself with `bson_newtype` and holds a `value`
template <typename T>
concept named_newtype = requires(T& t) {
    { T::bson_newtype } -> std::convertible_to<std::string_view>;
    t.value;
};

/// An alternative of a tagged `std::variant` that names its variant
template <typename T>
concept tagged_alternative = requires {
    { T::bson_variant } -> std::convertible_to<std::string_view>;
};

template <typename T>
constexpr bool is_tuple_v = false;

template <typename... Ts>
constexpr bool is_tuple_v<std::tuple<Ts...>> = true;

template <>
struct deserialize_traits<bool> {
    struct visitor : visitor_base<visitor, bool> {
        std::string_view expecting() const noexcept { return "a boolean"; }
        result<bool>     visit_bool(bool b) { return b; }
    };

    template <typename D>
    static result<bool> deserialize(D& d) {
        return d.deserialize_bool(visitor{});
    }
};

template <std::integral I>
    requires(not std::same_as<I, bool>)
struct deserialize_traits<I> {
    struct visitor : visitor_base<visitor, I> {
        std::string expecting() const {
            return fmt::format("{}{}", std::is_signed_v<I> ? "i" : "u", sizeof(I) * 8);
        }

        result<I> visit_i64(std::int64_t v) {
            if (not std::in_range<I>(v)) {
                return error(decode_error::invalid_value(unexpected::signed_integer(v), expecting()));
            }
            return static_cast<I>(v);
        }

        result<I> visit_u64(std::uint64_t v) {
            if (not std::in_range<I>(v)) {
                return error(
                    decode_error::invalid_value(unexpected::unsigned_integer(v), expecting()));
            }
            return static_cast<I>(v);
        }
    };

    template <typename D>
    static result<I> deserialize(D& d) {
        if constexpr (std::is_signed_v<I>) {
            if constexpr (sizeof(I) == 1) {
                return d.deserialize_i8(visitor{});
            } else if constexpr (sizeof(I) == 2) {
                return d.deserialize_i16(visitor{});
            } else if constexpr (sizeof(I) == 4) {
                return d.deserialize_i32(visitor{});
            } else {
                return d.deserialize_i64(visitor{});
            }
        } else {
            if constexpr (sizeof(I) == 1) {
                return d.deserialize_u8(visitor{});
            } else if constexpr (sizeof(I) == 2) {
                return d.deserialize_u16(visitor{});
            } else if constexpr (sizeof(I) == 4) {
                return d.deserialize_u32(visitor{});
            } else {
                return d.deserialize_u64(visitor{});
            }
        }
    }
};

template <std::floating_point F>
struct deserialize_traits<F> {
    struct visitor : visitor_base<visitor, F> {
        std::string_view expecting() const noexcept {
            return sizeof(F) == 4 ? "f32" : "f64";
        }
        result<F> visit_f64(double d) { return static_cast<F>(d); }
        result<F> visit_i64(std::int64_t i) { return static_cast<F>(i); }
        result<F> visit_u64(std::uint64_t u) { return static_cast<F>(u); }
    };

    template <typename D>
    static result<F> deserialize(D& d) {
        if constexpr (sizeof(F) == 4) {
            return d.deserialize_f32(visitor{});
        } else {
            return d.deserialize_f64(visitor{});
        }
    }
};

template <>
struct deserialize_traits<std::string> {
    struct visitor : visitor_base<visitor, std::string> {
        std::string_view    expecting() const noexcept { return "a string"; }
        result<std::string> visit_str(std::string_view s) { return std::string(s); }
        result<std::string> visit_string(std::string&& s) { return std::move(s); }
    };

    template <typename D>
    static result<std::string> deserialize(D& d) {
        return d.deserialize_string(visitor{});
    }
};

// Only strings that outlive the deserializer can be viewed
template <>
struct deserialize_traits<std::string_view> {
    struct visitor : visitor_base<visitor, std::string_view> {
        std::string_view         expecting() const noexcept { return "a borrowed string"; }
        result<std::string_view> visit_borrowed_str(std::string_view s) { return s; }
    };

    template <typename D>
    static result<std::string_view> deserialize(D& d) {
        return d.deserialize_str(visitor{});
    }
};

template <>
struct deserialize_traits<std::vector<std::byte>> {
    using bytes_type = std::vector<std::byte>;

    struct visitor : visitor_base<visitor, bytes_type> {
        std::string_view   expecting() const noexcept { return "a byte array"; }
        result<bytes_type> visit_bytes(std::span<const std::byte> b) {
            return bytes_type(b.begin(), b.end());
        }
        result<bytes_type> visit_byte_buf(bytes_type&& b) { return std::move(b); }
    };

    template <typename D>
    static result<bytes_type> deserialize(D& d) {
        return d.deserialize_byte_buf(visitor{});
    }
};

template <>
struct deserialize_traits<std::span<const std::byte>> {
    using span_type = std::span<const std::byte>;

    struct visitor : visitor_base<visitor, span_type> {
        std::string_view  expecting() const noexcept { return "a borrowed byte array"; }
        result<span_type> visit_borrowed_bytes(span_type b) { return b; }
    };

    template <typename D>
    static result<span_type> deserialize(D& d) {
        return d.deserialize_bytes(visitor{});
    }
};

template <>
struct deserialize_traits<unit> {
    struct visitor : visitor_base<visitor, unit> {
        std::string_view expecting() const noexcept { return "unit"; }
        result<unit>     visit_unit() { return unit{}; }
    };

    template <typename D>
    static result<unit> deserialize(D& d) {
        return d.deserialize_unit(visitor{});
    }
};

template <>
struct deserialize_traits<ignored_any> {
    struct visitor : visitor_base<visitor, ignored_any> {
        std::string_view expecting() const noexcept { return "anything at all"; }

        result<ignored_any> visit_bool(bool) { return ignored_any{}; }
        result<ignored_any> visit_i64(std::int64_t) { return ignored_any{}; }
        result<ignored_any> visit_u64(std::uint64_t) { return ignored_any{}; }
        result<ignored_any> visit_f64(double) { return ignored_any{}; }
        result<ignored_any> visit_str(std::string_view) { return ignored_any{}; }
        result<ignored_any> visit_bytes(std::span<const std::byte>) { return ignored_any{}; }
        result<ignored_any> visit_none() { return ignored_any{}; }
        result<ignored_any> visit_unit() { return ignored_any{}; }

        template <typename D>
        result<ignored_any> visit_some(D& d) {
            return de::deserialize<ignored_any>(d);
        }
        template <typename D>
        result<ignored_any> visit_newtype_struct(D& d) {
            return de::deserialize<ignored_any>(d);
        }

        template <typename S>
        result<ignored_any> visit_seq(S& s) {
            while (true) {
                TBSON_TRY(auto next, s.template next_element<ignored_any>());
                if (not next) {
                    return ignored_any{};
                }
            }
        }

        template <typename M>
        result<ignored_any> visit_map(M& m) {
            while (true) {
                TBSON_TRY(auto key, m.template next_key<ignored_any>());
                if (not key) {
                    return ignored_any{};
                }
                TBSON_CHECK(m.template next_value<ignored_any>());
            }
        }

        template <typename E>
        result<ignored_any> visit_enum(E& e) {
            TBSON_TRY(auto tagged, e.template variant<ignored_any>());
            TBSON_CHECK(tagged.second.unit_variant());
            return ignored_any{};
        }
    };

    template <typename D>
    static result<ignored_any> deserialize(D& d) {
        return d.deserialize_ignored_any(visitor{});
    }
};

template <typename T>
struct deserialize_traits<std::optional<T>> {
    struct visitor : visitor_base<visitor, std::optional<T>> {
        std::string_view expecting() const noexcept { return "option"; }

        result<std::optional<T>> visit_none() { return std::optional<T>(); }
        result<std::optional<T>> visit_unit() { return std::optional<T>(); }

        template <typename D>
        result<std::optional<T>> visit_some(D& d) {
            TBSON_TRY(auto value, de::deserialize<T>(d));
            return std::optional<T>(std::move(value));
        }
    };

    template <typename D>
    static result<std::optional<T>> deserialize(D& d) {
        return d.deserialize_option(visitor{});
    }
};

template <typename T>
struct deserialize_traits<std::vector<T>> {
    struct visitor : visitor_base<visitor, std::vector<T>> {
        std::string_view expecting() const noexcept { return "a sequence"; }

        // An empty tuple variant payload is offered as unit
        result<std::vector<T>> visit_unit() { return std::vector<T>(); }

        template <typename S>
        result<std::vector<T>> visit_seq(S& s) {
            std::vector<T> out;
            if (auto hint = s.size_hint()) {
                out.reserve(*hint);
            }
            while (true) {
                TBSON_TRY(auto next, s.template next_element<T>());
                if (not next) {
                    break;
                }
                out.push_back(std::move(*next));
            }
            return out;
        }
    };

    template <typename D>
    static result<std::vector<T>> deserialize(D& d) {
        return d.deserialize_seq(visitor{});
    }
};

template <typename T>
struct deserialize_traits<std::map<std::string, T>> {
    using map_type = std::map<std::string, T>;

    struct visitor : visitor_base<visitor, map_type> {
        std::string_view expecting() const noexcept { return "a map"; }

        template <typename M>
        result<map_type> visit_map(M& m) {
            map_type out;
            while (true) {
                TBSON_TRY(auto key, m.template next_key<std::string>());
                if (not key) {
                    break;
                }
                TBSON_TRY(auto value, m.template next_value<T>());
                out.insert_or_assign(std::move(*key), std::move(value));
            }
            return out;
        }
    };

    template <typename D>
    static result<map_type> deserialize(D& d) {
        return d.deserialize_map(visitor{});
    }
};

template <typename... Ts>
struct deserialize_traits<std::tuple<Ts...>> {
    using tuple_type = std::tuple<Ts...>;

    struct visitor : visitor_base<visitor, tuple_type> {
        std::string expecting() const { return fmt::format("a tuple of size {}", sizeof...(Ts)); }

        template <typename S>
        result<tuple_type> visit_seq(S& s) {
            return _fill(s, std::index_sequence_for<Ts...>{});
        }

        template <typename S, std::size_t... Is>
        result<tuple_type> _fill(S& s, std::index_sequence<Is...>) {
            std::tuple<std::optional<Ts>...> parts;
            std::optional<decode_error>      err;
            auto step = [&]<std::size_t I>(std::integral_constant<std::size_t, I>) -> bool {
                using element_type = std::tuple_element_t<I, tuple_type>;
                auto r             = s.template next_element<element_type>();
                if (r.has_error()) {
                    err = NEO_MOVE(r).error();
                    return false;
                }
                if (not r.value().has_value()) {
                    err = decode_error::invalid_length(I, expecting());
                    return false;
                }
                std::get<I>(parts) = std::move(*NEO_MOVE(r).value());
                return true;
            };
            if (not(step(std::integral_constant<std::size_t, Is>{}) and ...)) {
                return error(std::move(*err));
            }
            return tuple_type(std::move(*std::get<Is>(parts))...);
        }
    };

    template <typename D>
    static result<tuple_type> deserialize(D& d) {
        return d.deserialize_tuple(sizeof...(Ts), visitor{});
    }
};

template <described_struct T>
struct deserialize_traits<T> {
    static constexpr auto        fields      = T::bson_fields();
    static constexpr std::size_t field_count = std::tuple_size_v<decltype(fields)>;

    static constexpr auto names = []<std::size_t... Is>(std::index_sequence<Is...>) {
        return std::array<std::string_view, field_count>{std::get<Is>(fields).name...};
    }(std::make_index_sequence<field_count>{});

    using seen_set = std::array<bool, field_count>;

    struct visitor : visitor_base<visitor, T> {
        std::string_view expecting() const noexcept { return "a document"; }

        template <typename M>
        result<T> visit_map(M& m) {
            T        out{};
            seen_set seen{};
            while (true) {
                TBSON_TRY(auto key, m.template next_key<std::string>());
                if (not key) {
                    break;
                }
                TBSON_TRY(const bool found,
                          _assign(m, out, seen, *key, std::make_index_sequence<field_count>{}));
                if (not found) {
                    TBSON_CHECK(m.template next_value<ignored_any>());
                }
            }
            TBSON_CHECK(_check_missing(seen, std::make_index_sequence<field_count>{}));
            return out;
        }

    private:
        // Decode the value for `key` into the field of that name
        template <typename M, std::size_t... Is>
        static result<bool>
        _assign(M& m, T& out, seen_set& seen, std::string_view key, std::index_sequence<Is...>) {
            std::optional<decode_error> err;
            bool                        found = false;
            auto try_field                    = [&](const auto& info, bool& was_seen) {
                using member_type = std::remove_cvref_t<decltype(out.*(info.member))>;
                if (found or info.name != key) {
                    return;
                }
                found = true;
                if (was_seen) {
                    err = decode_error::custom(fmt::format("duplicate field `{}`", key));
                    return;
                }
                was_seen = true;
                auto r   = m.template next_value<member_type>();
                if (r.has_error()) {
                    err = NEO_MOVE(r).error();
                    return;
                }
                out.*(info.member) = NEO_MOVE(r).value();
            };
            (try_field(std::get<Is>(fields), seen[Is]), ...);
            if (err) {
                return error(std::move(*err));
            }
            return found;
        }

        // Optional fields may be absent. Every other field must be present.
        template <std::size_t... Is>
        static result<unit> _check_missing(const seen_set& seen, std::index_sequence<Is...>) {
            std::optional<decode_error> err;
            auto check = [&](const auto& info, bool was_seen) {
                using member_type = std::remove_cvref_t<decltype(std::declval<T&>().*(info.member))>;
                if (err or was_seen or is_optional_v<member_type>) {
                    return;
                }
                err = decode_error::custom(fmt::format("missing field `{}`", info.name));
            };
            (check(std::get<Is>(fields), seen[Is]), ...);
            if (err) {
                return error(std::move(*err));
            }
            return unit{};
        }
    };

    template <typename D>
    static result<T> deserialize(D& d) {
        return d.deserialize_struct(std::span<const std::string_view>(names), visitor{});
    }
};

template <named_newtype T>
struct deserialize_traits<T> {
    using inner_type = std::remove_cvref_t<decltype(std::declval<T&>().value)>;

    struct visitor : visitor_base<visitor, T> {
        std::string expecting() const { return fmt::format("newtype {}", T::bson_newtype); }

        template <typename D>
        result<T> visit_newtype_struct(D& d) {
            TBSON_TRY(auto value, de::deserialize<inner_type>(d));
            return T{std::move(value)};
        }
    };

    template <typename D>
    static result<T> deserialize(D& d) {
        return d.deserialize_newtype_struct(T::bson_newtype, visitor{});
    }
};

namespace detail {

// Render the list of known variant names for an "unknown variant" error
inline std::string unknown_variant_message(std::string_view                  name,
                                           std::span<const std::string_view> known) {
    if (known.empty()) {
        return fmt::format("unknown variant `{}`, there are no variants", name);
    }
    std::string expected;
    for (auto& n : known) {
        expected += expected.empty() ? "" : ", ";
        expected += fmt::format("`{}`", n);
    }
    if (known.size() == 1) {
        return fmt::format("unknown variant `{}`, expected {}", name, expected);
    }
    return fmt::format("unknown variant `{}`, expected one of {}", name, expected);
}

}  // namespace detail

/**
 * @brief Externally tagged enumerations are decoded as a `std::variant` of
 * alternatives that each name their variant with `bson_variant`.
 *
 * The shape of an alternative selects how its payload is decoded:
 *
 * - An alternative with `bson_fields()` is a struct variant.
 * - An alternative whose `value` member is a `std::tuple` is a tuple variant.
 * - An alternative with any other `value` member is a newtype variant.
 * - An alternative with none of these is a unit variant.
 */
template <tagged_alternative... Alts>
struct deserialize_traits<std::variant<Alts...>> {
    using variant_type = std::variant<Alts...>;

    static constexpr std::array<std::string_view, sizeof...(Alts)> names{Alts::bson_variant...};

    template <typename Alt, typename A>
    static result<Alt> read_alternative(A& access) {
        if constexpr (described_struct<Alt>) {
            return access.struct_variant(deserialize_traits<Alt>::names,
                                         typename deserialize_traits<Alt>::visitor{});
        } else if constexpr (requires(Alt& a) { a.value; }) {
            using inner_type = std::remove_cvref_t<decltype(std::declval<Alt&>().value)>;
            if constexpr (is_tuple_v<inner_type>) {
                TBSON_TRY(auto value,
                          access.tuple_variant(std::tuple_size_v<inner_type>,
                                               typename deserialize_traits<inner_type>::visitor{}));
                return Alt{std::move(value)};
            } else {
                TBSON_TRY(auto value, access.template newtype_variant<inner_type>());
                return Alt{std::move(value)};
            }
        } else {
            TBSON_CHECK(access.unit_variant());
            return Alt{};
        }
    }

    struct visitor : visitor_base<visitor, variant_type> {
        std::string_view expecting() const noexcept { return "an enum"; }

        template <typename E>
        result<variant_type> visit_enum(E& e) {
            TBSON_TRY(auto tagged, e.template variant<std::string>());
            auto& name   = tagged.first;
            auto& access = tagged.second;
            std::optional<result<variant_type>> out;
            auto try_alt = [&]<typename Alt>(std::type_identity<Alt>) {
                if (out or name != Alt::bson_variant) {
                    return;
                }
                out.emplace(read_alternative<Alt>(access).transform(
                    [](Alt&& a) { return variant_type(std::in_place_type<Alt>, std::move(a)); }));
            };
            (try_alt(std::type_identity<Alts>{}), ...);
            if (not out) {
                return error(decode_error::custom(detail::unknown_variant_message(name, names)));
            }
            return std::move(*out);
        }
    };

    template <typename D>
    static result<variant_type> deserialize(D& d) {
        return d.deserialize_enum(std::span<const std::string_view>(names), visitor{});
    }
};

/**
 * @brief Plain enumerations with an `enum_variants` table are decoded as unit
 * variants of an externally tagged enumeration
 */
template <typename E>
    requires std::is_enum_v<E> and requires { enum_variants<E>::table; }
struct deserialize_traits<E> {
    static constexpr auto names = []<std::size_t... Is>(std::index_sequence<Is...>) {
        return std::array<std::string_view, sizeof...(Is)>{enum_variants<E>::table[Is].first...};
    }(std::make_index_sequence<std::size(enum_variants<E>::table)>{});

    struct visitor : visitor_base<visitor, E> {
        std::string_view expecting() const noexcept { return "an enum"; }

        template <typename A>
        result<E> visit_enum(A& e) {
            TBSON_TRY(auto tagged, e.template variant<std::string>());
            auto& name   = tagged.first;
            auto& access = tagged.second;
            for (auto& [n, value] : enum_variants<E>::table) {
                if (n == name) {
                    TBSON_CHECK(access.unit_variant());
                    return value;
                }
            }
            return error(decode_error::custom(detail::unknown_variant_message(name, names)));
        }
    };

    template <typename D>
    static result<E> deserialize(D& d) {
        return d.deserialize_enum(std::span<const std::string_view>(names), visitor{});
    }
};

}  // namespace tbson::de
