#pragma once

#include <tbson/de/bson_visitor.hpp>
#include <tbson/de/deserialize.hpp>
#include <tbson/de/options.hpp>
#include <tbson/de/visitor.hpp>
#include <tbson/extjson.hpp>
#include <tbson/format.hpp>
#include <tbson/value.hpp>

#include <fmt/format.h>

#include <neo/fwd.hpp>

#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace tbson::de {

/**
 * @brief Check that a container may be entered at the given nesting depth.
 *
 * Fails with `raw_errc::depth_exceeded` once `depth` reaches the session's
 * `max_depth`.
 */
inline result<unit> check_depth(unsigned depth, const options& opts) {
    if (depth >= opts.max_depth) {
        return error(decode_error::raw(raw_errc::depth_exceeded));
    }
    return unit{};
}

/**
 * @brief Offers a single string, either borrowed or transient
 */
class str_deserializer : public forward_to_any<str_deserializer> {
public:
    str_deserializer(std::string_view s, bool borrowed, options opts) noexcept
        : _str(s)
        , _borrowed(borrowed)
        , _opts(opts) {}

    [[nodiscard]] bool is_human_readable() const noexcept { return _opts.human_readable; }

    template <typename V>
    visit_result_t<V> deserialize_any(V&& v) {
        if (_borrowed) {
            return v.visit_borrowed_str(_str);
        }
        return v.visit_str(_str);
    }

private:
    std::string_view _str;
    bool             _borrowed;
    options          _opts;
};

/**
 * @brief Offers a single byte array, either borrowed or transient
 */
class bytes_deserializer : public forward_to_any<bytes_deserializer> {
public:
    bytes_deserializer(std::span<const std::byte> b, bool borrowed, options opts) noexcept
        : _bytes(b)
        , _borrowed(borrowed)
        , _opts(opts) {}

    [[nodiscard]] bool is_human_readable() const noexcept { return _opts.human_readable; }

    template <typename V>
    visit_result_t<V> deserialize_any(V&& v) {
        if (_borrowed) {
            return v.visit_borrowed_bytes(_bytes);
        }
        return v.visit_bytes(_bytes);
    }

private:
    std::span<const std::byte> _bytes;
    bool                       _borrowed;
    options                    _opts;
};

/**
 * @brief Drives typed extraction from one owned `bson` value.
 *
 * The deserializer holds its value until the first request for it. Every later
 * request fails with `errc::end_of_stream`.
 *
 * Doubles, strings, booleans, null, integers and generic binaries are offered
 * directly. Arrays and documents are offered through sequence and map cursors.
 * Decimal128 values are offered as a `$numberDecimalBytes` map. Every other value
 * is offered as its canonical extended JSON document.
 */
class deserializer : public forward_to_any<deserializer> {
public:
    explicit deserializer(bson value, options opts = {}, unsigned depth = 0) noexcept
        : _value(std::move(value))
        , _opts(opts)
        , _depth(depth) {}

    [[nodiscard]] bool is_human_readable() const noexcept { return _opts.human_readable; }

    template <typename V>
    visit_result_t<V> deserialize_any(V&& v);

    /// A stored null is absent. Every other value is present.
    template <typename V>
    visit_result_t<V> deserialize_option(V&& v);

    /**
     * @brief Offer the value as an externally tagged enum: either a string naming a
     * unit variant, or a document with exactly one entry.
     */
    template <typename V>
    visit_result_t<V> deserialize_enum(std::span<const std::string_view> variants, V&& v);

    /**
     * @brief The UUID newtype name requires a `uuid` subtype binary. Every other
     * name is transparent.
     */
    template <typename V>
    visit_result_t<V> deserialize_newtype_struct(std::string_view name, V&& v);

private:
    result<bson> _take() {
        if (not _value) {
            return error(decode_error::end_of_stream());
        }
        bson out = std::move(*_value);
        _value.reset();
        return out;
    }

    std::optional<bson> _value;
    options             _opts;
    unsigned            _depth;
};

/**
 * @brief Forward-only cursor over the elements of an owned array
 */
class seq_deserializer : public forward_to_any<seq_deserializer> {
public:
    seq_deserializer(array values, options opts, unsigned depth) noexcept
        : _values(std::move(values))
        , _opts(opts)
        , _depth(depth) {}

    [[nodiscard]] bool is_human_readable() const noexcept { return _opts.human_readable; }

    // An empty sequence is offered as unit
    template <typename V>
    visit_result_t<V> deserialize_any(V&& v) {
        if (_values.empty()) {
            return v.visit_unit();
        }
        return v.visit_seq(*this);
    }

    /**
     * @brief Decode the next element, or return `nullopt` when the sequence is
     * exhausted
     */
    template <typename T>
    result<std::optional<T>> next_element() {
        if (_pos == _values.size()) {
            return std::optional<T>();
        }
        deserializer d(std::move(_values[_pos]), _opts, _depth);
        ++_pos;
        TBSON_TRY(auto value, de::deserialize<T>(d));
        return std::optional<T>(std::move(value));
    }

    [[nodiscard]] std::optional<std::size_t> size_hint() const noexcept {
        return _values.size() - _pos;
    }

private:
    array       _values;
    std::size_t _pos = 0;
    options     _opts;
    unsigned    _depth;
};

/**
 * @brief Forward-only cursor over the entries of an owned document.
 *
 * Each entry is read by a call to `next_key()` followed by a call to
 * `next_value()`. Calling `next_value()` without a preceding `next_key()` fails
 * with `errc::end_of_stream`.
 */
class map_deserializer : public forward_to_any<map_deserializer> {
public:
    map_deserializer(document doc, options opts, unsigned depth) noexcept
        : _entries(std::move(doc).take_entries())
        , _opts(opts)
        , _depth(depth) {}

    [[nodiscard]] bool is_human_readable() const noexcept { return _opts.human_readable; }

    template <typename V>
    visit_result_t<V> deserialize_any(V&& v) {
        return v.visit_map(*this);
    }

    /**
     * @brief Decode the key of the next entry, or return `nullopt` when the map is
     * exhausted. The entry's value is held for the following `next_value()`.
     */
    template <typename K>
    result<std::optional<K>> next_key() {
        if (_pos == _entries.size()) {
            return std::optional<K>();
        }
        auto& entry = _entries[_pos];
        ++_pos;
        _pending = std::move(entry.value);
        deserializer d(bson(std::move(entry.key)), _opts, _depth);
        TBSON_TRY(auto key, de::deserialize<K>(d));
        return std::optional<K>(std::move(key));
    }

    template <typename T>
    result<T> next_value() {
        if (not _pending) {
            return error(decode_error::end_of_stream());
        }
        deserializer d(std::move(*_pending), _opts, _depth);
        _pending.reset();
        return de::deserialize<T>(d);
    }

    [[nodiscard]] std::optional<std::size_t> size_hint() const noexcept {
        return _entries.size() - _pos;
    }

private:
    std::vector<document_entry> _entries;
    std::size_t                 _pos = 0;
    std::optional<bson>         _pending;
    options                     _opts;
    unsigned                    _depth;
};

/**
 * @brief Presents a decimal128 as the single entry
 * `{"$numberDecimalBytes": <16 bytes>}`
 */
class decimal128_access {
public:
    decimal128_access(decimal128 d, options opts) noexcept
        : _dec(d)
        , _opts(opts) {}

    template <typename K>
    result<std::optional<K>> next_key() {
        if (_state != state::key) {
            return std::optional<K>();
        }
        _state = state::value;
        str_deserializer d(extjson::number_decimal_bytes, true, _opts);
        TBSON_TRY(auto key, de::deserialize<K>(d));
        return std::optional<K>(std::move(key));
    }

    template <typename T>
    result<T> next_value() {
        if (_state != state::value) {
            return error(decode_error::end_of_stream());
        }
        _state = state::done;
        bytes_deserializer d(_dec.bytes(), false, _opts);
        return de::deserialize<T>(d);
    }

    [[nodiscard]] std::optional<std::size_t> size_hint() const noexcept {
        return _state == state::key ? 1 : 0;
    }

private:
    enum class state { key, value, done };

    decimal128 _dec;
    options    _opts;
    state      _state = state::key;
};

/**
 * @brief Access to the payload of an enum variant
 */
class variant_access {
public:
    variant_access(std::optional<bson> payload, options opts, unsigned depth) noexcept
        : _payload(std::move(payload))
        , _opts(opts)
        , _depth(depth) {}

    /// A payload given to a unit variant is decoded and discarded
    result<unit> unit_variant() {
        if (not _payload) {
            return unit{};
        }
        deserializer d(std::move(*_payload), _opts, _depth);
        _payload.reset();
        TBSON_CHECK(de::deserialize<bson>(d));
        return unit{};
    }

    template <typename T>
    result<T> newtype_variant() {
        if (not _payload) {
            return error(decode_error::end_of_stream());
        }
        deserializer d(std::move(*_payload), _opts, _depth);
        _payload.reset();
        return de::deserialize<T>(d);
    }

    template <typename V>
    visit_result_t<V> tuple_variant(std::size_t, V&& v) {
        if (not _payload) {
            return error(decode_error::end_of_stream());
        }
        auto arr = _payload->get_if<array>();
        if (arr == nullptr) {
            return error(decode_error::invalid_type(_payload->as_unexpected(), "expected a tuple"));
        }
        TBSON_CHECK(check_depth(_depth, _opts));
        seq_deserializer seq(std::move(*arr), _opts, _depth + 1);
        _payload.reset();
        return seq.deserialize_any(NEO_FWD(v));
    }

    template <typename V>
    visit_result_t<V> struct_variant(std::span<const std::string_view>, V&& v) {
        if (not _payload) {
            return error(decode_error::end_of_stream());
        }
        auto doc = _payload->get_if<document>();
        if (doc == nullptr) {
            return error(
                decode_error::invalid_type(_payload->as_unexpected(), "expected a struct"));
        }
        TBSON_CHECK(check_depth(_depth, _opts));
        map_deserializer map(std::move(*doc), _opts, _depth + 1);
        _payload.reset();
        return map.deserialize_any(NEO_FWD(v));
    }

private:
    std::optional<bson> _payload;
    options             _opts;
    unsigned            _depth;
};

/**
 * @brief Access to an enum variant name and its payload
 */
class enum_access {
public:
    enum_access(std::string name, std::optional<bson> payload, options opts, unsigned depth) noexcept
        : _name(std::move(name))
        , _payload(std::move(payload))
        , _opts(opts)
        , _depth(depth) {}

    /// Decode the variant name as a `K`, and obtain access to the payload
    template <typename K>
    result<std::pair<K, variant_access>> variant() {
        deserializer d(bson(std::move(_name)), _opts, _depth);
        TBSON_TRY(auto key, de::deserialize<K>(d));
        return std::pair<K, variant_access>(std::move(key),
                                            variant_access(std::move(_payload), _opts, _depth));
    }

private:
    std::string         _name;
    std::optional<bson> _payload;
    options             _opts;
    unsigned            _depth;
};

template <typename V>
visit_result_t<V> deserializer::deserialize_any(V&& v) {
    TBSON_TRY(bson value, _take());
    switch (value.type()) {
    case element_type::double_:
        return v.visit_f64(*value.get_if<double>());
    case element_type::string:
        return v.visit_string(std::move(*value.get_if<std::string>()));
    case element_type::array: {
        TBSON_CHECK(check_depth(_depth, _opts));
        seq_deserializer seq(std::move(*value.get_if<array>()), _opts, _depth + 1);
        return v.visit_seq(seq);
    }
    case element_type::document: {
        TBSON_CHECK(check_depth(_depth, _opts));
        map_deserializer map(std::move(*value.get_if<document>()), _opts, _depth + 1);
        return v.visit_map(map);
    }
    case element_type::boolean:
        return v.visit_bool(*value.get_if<bool>());
    case element_type::null:
        return v.visit_unit();
    case element_type::int32:
        return v.visit_i32(*value.get_if<std::int32_t>());
    case element_type::int64:
        return v.visit_i64(*value.get_if<std::int64_t>());
    case element_type::uint32:
        return v.visit_u32(*value.get_if<std::uint32_t>());
    case element_type::uint64:
        return v.visit_u64(*value.get_if<std::uint64_t>());
    case element_type::binary:
        if (value.get_if<binary>()->subtype == binary_subtype::generic) {
            return v.visit_byte_buf(std::move(value.get_if<binary>()->bytes));
        }
        break;
    case element_type::decimal128: {
        decimal128_access access(*value.get_if<decimal128>(), _opts);
        return v.visit_map(access);
    }
    case element_type::datetime:
    case element_type::timestamp:
        break;
    }
    auto ext = extjson::canonical_document(value);
    if (not ext) {
        return error(decode_error::invalid_type(value.as_unexpected(), "a BSON value"));
    }
    map_deserializer map(std::move(*ext), _opts, _depth + 1);
    return v.visit_map(map);
}

template <typename V>
visit_result_t<V> deserializer::deserialize_option(V&& v) {
    if (not _value) {
        return error(decode_error::end_of_stream());
    }
    if (_value->is_null()) {
        _value.reset();
        return v.visit_none();
    }
    return v.visit_some(*this);
}

template <typename V>
visit_result_t<V> deserializer::deserialize_enum(std::span<const std::string_view>, V&& v) {
    TBSON_TRY(bson value, _take());
    if (auto name = value.get_if<std::string>()) {
        enum_access access(std::move(*name), std::nullopt, _opts, _depth + 1);
        return v.visit_enum(access);
    }
    auto doc = value.get_if<document>();
    if (doc == nullptr) {
        return error(decode_error::invalid_type(value.as_unexpected(), "expected an enum"));
    }
    TBSON_CHECK(check_depth(_depth, _opts));
    auto entries = std::move(*doc).take_entries();
    if (entries.empty()) {
        return error(decode_error::invalid_value(unexpected::other("empty document"), "variant name"));
    }
    if (entries.size() > 1) {
        return error(decode_error::invalid_value(
            unexpected::map(),
            fmt::format("expected map with a single key, got extra key \"{}\"", entries[1].key)));
    }
    enum_access access(std::move(entries[0].key),
                       std::move(entries[0].value),
                       _opts,
                       _depth + 1);
    return v.visit_enum(access);
}

template <typename V>
visit_result_t<V> deserializer::deserialize_newtype_struct(std::string_view name, V&& v) {
    if (name == newtype_names::uuid) {
        const binary* bin = _value ? _value->get_if<binary>() : nullptr;
        if (bin == nullptr or bin->subtype != binary_subtype::uuid) {
            return error(decode_error::custom(
                fmt::format("expected Binary with subtype 4, instead got {}",
                            _value ? fmt::format("{}", *_value) : std::string("nothing"))));
        }
        return deserialize_any(NEO_FWD(v));
    }
    return v.visit_newtype_struct(*this);
}

/**
 * @brief Decode a `T` from an owned value
 */
template <typename T>
result<T> from_bson(bson value, options opts = {}) {
    deserializer d(std::move(value), opts);
    return de::deserialize<T>(d);
}

/**
 * @brief Decode a `T` from an owned document
 */
template <typename T>
result<T> from_document(document doc, options opts = {}) {
    return de::from_bson<T>(bson(std::move(doc)), opts);
}

}  // namespace tbson::de
