#pragma once

#include <tbson/de/bson_visitor.hpp>
#include <tbson/de/deserialize.hpp>
#include <tbson/de/deserializer.hpp>
#include <tbson/de/extjson_models.hpp>
#include <tbson/de/options.hpp>
#include <tbson/de/visitor.hpp>
#include <tbson/extjson.hpp>
#include <tbson/format.hpp>
#include <tbson/raw.hpp>

#include <fmt/format.h>

#include <neo/fwd.hpp>

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace tbson::de {

namespace detail {

struct synthetic_map;

// Bytes offered inside a synthetic map. Borrowed bytes outlive the deserializer.
struct synthetic_bytes {
    std::span<const std::byte> bytes;
    bool                       borrowed = false;
};

using synthetic_value = std::variant<std::int32_t,
                                     std::int64_t,
                                     std::uint32_t,
                                     synthetic_bytes,
                                     const synthetic_map*>;

struct synthetic_entry {
    std::string_view key;
    synthetic_value  value;
};

/**
 * @brief A small map built on the stack to present a binary-native value in its
 * extended JSON shape, e.g. `{"$date": <i64>}`
 */
struct synthetic_map {
    std::array<synthetic_entry, 2> entries;
    std::size_t                    size = 0;
};

class synthetic_map_access;

// Offers one synthetic value
class synthetic_deserializer : public forward_to_any<synthetic_deserializer> {
public:
    synthetic_deserializer(synthetic_value v, options opts) noexcept
        : _value(v)
        , _opts(opts) {}

    [[nodiscard]] bool is_human_readable() const noexcept { return _opts.human_readable; }

    template <typename V>
    visit_result_t<V> deserialize_any(V&& v);

private:
    synthetic_value _value;
    options         _opts;
};

class synthetic_map_access {
public:
    synthetic_map_access(const synthetic_map& map, options opts) noexcept
        : _map(map)
        , _opts(opts) {}

    template <typename K>
    result<std::optional<K>> next_key() {
        if (_pos == _map.size) {
            return std::optional<K>();
        }
        _pending = true;
        str_deserializer d(_map.entries[_pos].key, true, _opts);
        ++_pos;
        TBSON_TRY(auto key, de::deserialize<K>(d));
        return std::optional<K>(std::move(key));
    }

    template <typename T>
    result<T> next_value() {
        if (not _pending) {
            return error(decode_error::end_of_stream());
        }
        _pending = false;
        synthetic_deserializer d(_map.entries[_pos - 1].value, _opts);
        return de::deserialize<T>(d);
    }

    [[nodiscard]] std::optional<std::size_t> size_hint() const noexcept {
        return _map.size - _pos;
    }

private:
    const synthetic_map& _map;
    std::size_t          _pos     = 0;
    bool                 _pending = false;
    options              _opts;
};

template <typename V>
visit_result_t<V> synthetic_deserializer::deserialize_any(V&& v) {
    if (auto i = std::get_if<std::int32_t>(&_value)) {
        return v.visit_i32(*i);
    } else if (auto l = std::get_if<std::int64_t>(&_value)) {
        return v.visit_i64(*l);
    } else if (auto u = std::get_if<std::uint32_t>(&_value)) {
        return v.visit_u32(*u);
    } else if (auto b = std::get_if<synthetic_bytes>(&_value)) {
        if (b->borrowed) {
            return v.visit_borrowed_bytes(b->bytes);
        }
        return v.visit_bytes(b->bytes);
    }
    synthetic_map_access access(**std::get_if<const synthetic_map*>(&_value), _opts);
    return v.visit_map(access);
}

}  // namespace detail

/**
 * @brief Drives typed extraction from one value of an encoded buffer, without
 * building owned values.
 *
 * Strings and generic binaries are offered borrowed from the buffer. Documents
 * and arrays are offered through cursors that validate each element as it is
 * reached. Binary-only types are offered in their binary-native extended JSON
 * shape: `$binary` with borrowed `bytes` and an integer `subType`, `$date` with
 * an integer, `$timestamp`, and `$numberDecimalBytes`.
 *
 * When the target asks for a raw document, array or value, documents and arrays
 * are instead offered as a reserved single-entry map carrying their bytes.
 */
class raw_deserializer : public forward_to_any<raw_deserializer> {
public:
    explicit raw_deserializer(raw_bson value, options opts, unsigned depth = 0) noexcept
        : _value(value)
        , _opts(opts)
        , _depth(depth) {}

    [[nodiscard]] bool is_human_readable() const noexcept { return _opts.human_readable; }

    template <typename V>
    visit_result_t<V> deserialize_any(V&& v);

    template <typename V>
    visit_result_t<V> deserialize_option(V&& v);

    template <typename V>
    visit_result_t<V> deserialize_enum(std::span<const std::string_view> variants, V&& v);

    template <typename V>
    visit_result_t<V> deserialize_newtype_struct(std::string_view name, V&& v);

private:
    result<raw_bson> _take() {
        if (not _value) {
            return error(decode_error::end_of_stream());
        }
        raw_bson out = *_value;
        _value.reset();
        return out;
    }

    template <typename V>
    visit_result_t<V> _visit_synthetic(const detail::synthetic_map& map, V&& v) {
        detail::synthetic_map_access access(map, _opts);
        return v.visit_map(access);
    }

    std::optional<raw_bson> _value;
    options                 _opts;
    unsigned                _depth;
    bool                    _raw_target = false;
};

/**
 * @brief Forward-only cursor over the elements of a raw array. The first
 * malformed element fails the read.
 */
class raw_seq_access {
public:
    raw_seq_access(const raw_array& arr, options opts, unsigned depth) noexcept
        : _it(arr.begin())
        , _opts(opts)
        , _depth(depth) {}

    template <typename T>
    result<std::optional<T>> next_element() {
        if (_it.has_error()) {
            return error(decode_error::raw(_it.error()));
        }
        if (_it.stop()) {
            return std::optional<T>();
        }
        raw_deserializer d(_it->value(), _opts, _depth);
        ++_it;
        TBSON_TRY(auto value, de::deserialize<T>(d));
        return std::optional<T>(std::move(value));
    }

    // The element count is not known without a scan
    [[nodiscard]] std::optional<std::size_t> size_hint() const noexcept { return std::nullopt; }

private:
    raw_array::iterator _it;
    options             _opts;
    unsigned            _depth;
};

/**
 * @brief Forward-only cursor over the elements of a raw document. Keys are
 * offered borrowed from the buffer.
 */
class raw_map_access {
public:
    raw_map_access(const raw_document& doc, options opts, unsigned depth) noexcept
        : _it(doc.begin())
        , _opts(opts)
        , _depth(depth) {}

    template <typename K>
    result<std::optional<K>> next_key() {
        if (_it.has_error()) {
            return error(decode_error::raw(_it.error()));
        }
        if (_it.stop()) {
            return std::optional<K>();
        }
        const std::string_view key = _it->key();
        _pending                   = _it->value();
        ++_it;
        str_deserializer d(key, true, _opts);
        TBSON_TRY(auto k, de::deserialize<K>(d));
        return std::optional<K>(std::move(k));
    }

    template <typename T>
    result<T> next_value() {
        if (not _pending) {
            return error(decode_error::end_of_stream());
        }
        raw_deserializer d(*_pending, _opts, _depth);
        _pending.reset();
        return de::deserialize<T>(d);
    }

    [[nodiscard]] std::optional<std::size_t> size_hint() const noexcept { return std::nullopt; }

private:
    raw_document::iterator  _it;
    std::optional<raw_bson> _pending;
    options                 _opts;
    unsigned                _depth;
};

class raw_variant_access {
public:
    raw_variant_access(std::optional<raw_bson> payload, options opts, unsigned depth) noexcept
        : _payload(payload)
        , _opts(opts)
        , _depth(depth) {}

    result<unit> unit_variant() {
        if (not _payload) {
            return unit{};
        }
        raw_deserializer d(*_payload, _opts, _depth);
        _payload.reset();
        TBSON_CHECK(de::deserialize<bson>(d));
        return unit{};
    }

    template <typename T>
    result<T> newtype_variant() {
        if (not _payload) {
            return error(decode_error::end_of_stream());
        }
        raw_deserializer d(*_payload, _opts, _depth);
        _payload.reset();
        return de::deserialize<T>(d);
    }

    template <typename V>
    visit_result_t<V> tuple_variant(std::size_t, V&& v) {
        if (not _payload) {
            return error(decode_error::end_of_stream());
        }
        auto arr = _payload->get_if<raw_array>();
        if (arr == nullptr) {
            return error(decode_error::invalid_type(_payload->as_unexpected(), "expected a tuple"));
        }
        TBSON_CHECK(check_depth(_depth, _opts));
        if (arr->empty()) {
            return v.visit_unit();
        }
        raw_seq_access seq(*arr, _opts, _depth + 1);
        return v.visit_seq(seq);
    }

    template <typename V>
    visit_result_t<V> struct_variant(std::span<const std::string_view>, V&& v) {
        if (not _payload) {
            return error(decode_error::end_of_stream());
        }
        auto doc = _payload->get_if<raw_document>();
        if (doc == nullptr) {
            return error(
                decode_error::invalid_type(_payload->as_unexpected(), "expected a struct"));
        }
        TBSON_CHECK(check_depth(_depth, _opts));
        raw_map_access map(*doc, _opts, _depth + 1);
        return v.visit_map(map);
    }

private:
    std::optional<raw_bson> _payload;
    options                 _opts;
    unsigned                _depth;
};

class raw_enum_access {
public:
    raw_enum_access(std::string_view name,
                    std::optional<raw_bson> payload,
                    options                 opts,
                    unsigned                depth) noexcept
        : _name(name)
        , _payload(payload)
        , _opts(opts)
        , _depth(depth) {}

    template <typename K>
    result<std::pair<K, raw_variant_access>> variant() {
        str_deserializer d(_name, true, _opts);
        TBSON_TRY(auto key, de::deserialize<K>(d));
        return std::pair<K, raw_variant_access>(std::move(key),
                                                raw_variant_access(_payload, _opts, _depth));
    }

private:
    std::string_view        _name;
    std::optional<raw_bson> _payload;
    options                 _opts;
    unsigned                _depth;
};

template <typename V>
visit_result_t<V> raw_deserializer::deserialize_any(V&& v) {
    TBSON_TRY(raw_bson value, _take());
    detail::synthetic_map outer;
    detail::synthetic_map inner;
    switch (value.type()) {
    case element_type::double_:
        return v.visit_f64(*value.get_if<double>());
    case element_type::string:
        return v.visit_borrowed_str(*value.get_if<std::string_view>());
    case element_type::document: {
        const raw_document& doc = *value.get_if<raw_document>();
        if (_raw_target) {
            outer.entries[0] = {newtype_names::raw_document, detail::synthetic_bytes{doc.bytes(), true}};
            outer.size       = 1;
            return _visit_synthetic(outer, NEO_FWD(v));
        }
        TBSON_CHECK(check_depth(_depth, _opts));
        raw_map_access map(doc, _opts, _depth + 1);
        return v.visit_map(map);
    }
    case element_type::array: {
        const raw_array& arr = *value.get_if<raw_array>();
        if (_raw_target) {
            outer.entries[0] = {newtype_names::raw_array, detail::synthetic_bytes{arr.bytes(), true}};
            outer.size       = 1;
            return _visit_synthetic(outer, NEO_FWD(v));
        }
        TBSON_CHECK(check_depth(_depth, _opts));
        raw_seq_access seq(arr, _opts, _depth + 1);
        return v.visit_seq(seq);
    }
    case element_type::binary: {
        const raw_binary& bin = *value.get_if<raw_binary>();
        if (bin.subtype == binary_subtype::generic) {
            return v.visit_borrowed_bytes(bin.bytes);
        }
        inner.entries[0] = {"bytes", detail::synthetic_bytes{bin.bytes, true}};
        inner.entries[1] = {"subType", static_cast<std::int32_t>(bin.subtype)};
        inner.size       = 2;
        outer.entries[0] = {extjson::binary_marker, &inner};
        outer.size       = 1;
        return _visit_synthetic(outer, NEO_FWD(v));
    }
    case element_type::boolean:
        return v.visit_bool(*value.get_if<bool>());
    case element_type::datetime:
        outer.entries[0] = {extjson::date_marker, value.get_if<datetime>()->millis()};
        outer.size       = 1;
        return _visit_synthetic(outer, NEO_FWD(v));
    case element_type::null:
        return v.visit_unit();
    case element_type::int32:
        return v.visit_i32(*value.get_if<std::int32_t>());
    case element_type::timestamp: {
        const timestamp ts = *value.get_if<timestamp>();
        inner.entries[0]   = {"t", ts.time};
        inner.entries[1]   = {"i", ts.increment};
        inner.size         = 2;
        outer.entries[0]   = {extjson::timestamp_marker, &inner};
        outer.size         = 1;
        return _visit_synthetic(outer, NEO_FWD(v));
    }
    case element_type::int64:
        return v.visit_i64(*value.get_if<std::int64_t>());
    case element_type::decimal128:
        // The decimal is a copy local to this call, so its bytes are not borrowed
        outer.entries[0] = {extjson::number_decimal_bytes,
                            detail::synthetic_bytes{value.get_if<decimal128>()->bytes(), false}};
        outer.size       = 1;
        return _visit_synthetic(outer, NEO_FWD(v));
    case element_type::uint32:
        return v.visit_u32(*value.get_if<std::uint32_t>());
    case element_type::uint64:
        return v.visit_u64(*value.get_if<std::uint64_t>());
    }
    return error(decode_error::invalid_type(value.as_unexpected(), "a BSON value"));
}

template <typename V>
visit_result_t<V> raw_deserializer::deserialize_option(V&& v) {
    if (not _value) {
        return error(decode_error::end_of_stream());
    }
    if (_value->type() == element_type::null) {
        _value.reset();
        return v.visit_none();
    }
    return v.visit_some(*this);
}

template <typename V>
visit_result_t<V> raw_deserializer::deserialize_enum(std::span<const std::string_view>, V&& v) {
    TBSON_TRY(raw_bson value, _take());
    if (auto name = value.get_if<std::string_view>()) {
        raw_enum_access access(*name, std::nullopt, _opts, _depth + 1);
        return v.visit_enum(access);
    }
    auto doc = value.get_if<raw_document>();
    if (doc == nullptr) {
        return error(decode_error::invalid_type(value.as_unexpected(), "expected an enum"));
    }
    TBSON_CHECK(check_depth(_depth, _opts));
    auto it = doc->begin();
    if (it.has_error()) {
        return error(decode_error::raw(it.error()));
    }
    if (it.stop()) {
        return error(decode_error::invalid_value(unexpected::other("empty document"), "variant name"));
    }
    const raw_element first = *it;
    ++it;
    if (it.has_error()) {
        return error(decode_error::raw(it.error()));
    }
    if (not it.stop()) {
        return error(decode_error::invalid_value(
            unexpected::map(),
            fmt::format("expected map with a single key, got extra key \"{}\"", it->key())));
    }
    raw_enum_access access(first.key(), first.value(), _opts, _depth + 1);
    return v.visit_enum(access);
}

template <typename V>
visit_result_t<V> raw_deserializer::deserialize_newtype_struct(std::string_view name, V&& v) {
    if (name == newtype_names::uuid) {
        const raw_binary* bin = _value ? _value->get_if<raw_binary>() : nullptr;
        if (bin == nullptr or bin->subtype != binary_subtype::uuid) {
            return error(decode_error::custom(
                fmt::format("expected Binary with subtype 4, instead got {}",
                            _value ? fmt::format("{}", *_value) : std::string("nothing"))));
        }
        const auto bytes = bin->bytes;
        _value.reset();
        return v.visit_borrowed_bytes(bytes);
    }
    if (name == newtype_names::raw_document or name == newtype_names::raw_array
        or name == newtype_names::raw_bson) {
        _raw_target = true;
    }
    return v.visit_newtype_struct(*this);
}

/**
 * @brief Decodes a borrowed `raw_bson` from a binary-native deserializer.
 *
 * Maps are accepted only when they carry one of the binary-native extended JSON
 * markers, or one of the reserved raw document and raw array markers.
 */
struct raw_bson_visitor : visitor_base<raw_bson_visitor, raw_bson> {
    std::string_view expecting() const noexcept { return "a raw BSON reference"; }

    result<raw_bson> visit_borrowed_str(std::string_view s) { return raw_bson(s); }
    result<raw_bson> visit_borrowed_bytes(std::span<const std::byte> b) {
        return raw_bson(raw_binary{binary_subtype::generic, b});
    }
    result<raw_bson> visit_i8(std::int8_t i) { return raw_bson(static_cast<std::int32_t>(i)); }
    result<raw_bson> visit_i16(std::int16_t i) { return raw_bson(static_cast<std::int32_t>(i)); }
    result<raw_bson> visit_i32(std::int32_t i) { return raw_bson(i); }
    result<raw_bson> visit_i64(std::int64_t i) { return raw_bson(i); }
    result<raw_bson> visit_u64(std::uint64_t u) { return raw_bson(u); }
    result<raw_bson> visit_bool(bool b) { return raw_bson(b); }
    result<raw_bson> visit_f64(double d) { return raw_bson(d); }
    result<raw_bson> visit_none() { return raw_bson(null{}); }
    result<raw_bson> visit_unit() { return raw_bson(null{}); }

    template <typename D>
    result<raw_bson> visit_newtype_struct(D& d) {
        return d.deserialize_any(raw_bson_visitor{});
    }

    template <typename M>
    result<raw_bson> visit_map(M& m) {
        TBSON_TRY(auto key, m.template next_key<std::string_view>());
        if (not key) {
            return error(decode_error::custom("expected a key when deserializing RawBson"));
        }
        if (*key == extjson::number_decimal_bytes) {
            TBSON_TRY(auto bytes, m.template next_value<std::vector<std::byte>>());
            TBSON_TRY(auto dec, decimal128::from_bytes(bytes));
            return raw_bson(dec);
        } else if (*key == extjson::binary_marker) {
            TBSON_TRY(auto body, m.template next_value<extjson_models::borrowed_binary_body>());
            return raw_bson(raw_binary{static_cast<binary_subtype>(body.subtype), body.bytes});
        } else if (*key == extjson::date_marker) {
            TBSON_TRY(auto ms, m.template next_value<std::int64_t>());
            return raw_bson(datetime::from_millis(ms));
        } else if (*key == extjson::timestamp_marker) {
            TBSON_TRY(auto body, m.template next_value<extjson_models::timestamp_body>());
            return raw_bson(body.to_timestamp());
        } else if (*key == newtype_names::raw_document) {
            TBSON_TRY(auto bytes, m.template next_value<std::span<const std::byte>>());
            TBSON_TRY(auto doc, raw_document::from_bytes(bytes));
            return raw_bson(doc);
        } else if (*key == newtype_names::raw_array) {
            TBSON_TRY(auto bytes, m.template next_value<std::span<const std::byte>>());
            TBSON_TRY(auto arr, raw_array::from_bytes(bytes));
            return raw_bson(arr);
        }
        return error(
            decode_error::custom(fmt::format("can't deserialize RawBson from map, key={}", *key)));
    }
};

template <>
struct deserialize_traits<raw_bson> {
    template <typename D>
    static result<raw_bson> deserialize(D& d) {
        return d.deserialize_newtype_struct(newtype_names::raw_bson, raw_bson_visitor{});
    }
};

template <>
struct deserialize_traits<raw_document> {
    template <typename D>
    static result<raw_document> deserialize(D& d) {
        TBSON_TRY(raw_bson value,
                  d.deserialize_newtype_struct(newtype_names::raw_document, raw_bson_visitor{}));
        if (auto doc = value.get_if<raw_document>()) {
            return *doc;
        }
        return error(decode_error::custom(
            fmt::format("expected a raw document, but got {} instead", value)));
    }
};

template <>
struct deserialize_traits<raw_array> {
    template <typename D>
    static result<raw_array> deserialize(D& d) {
        TBSON_TRY(raw_bson value,
                  d.deserialize_newtype_struct(newtype_names::raw_array, raw_bson_visitor{}));
        if (auto arr = value.get_if<raw_array>()) {
            return *arr;
        }
        return error(
            decode_error::custom(fmt::format("expected a raw array, but got {} instead", value)));
    }
};

template <>
struct deserialize_traits<raw_binary> {
    template <typename D>
    static result<raw_binary> deserialize(D& d) {
        TBSON_TRY(raw_bson value, de::deserialize<raw_bson>(d));
        if (auto bin = value.get_if<raw_binary>()) {
            return *bin;
        }
        return error(
            decode_error::custom(fmt::format("expected binary, but got {} instead", value)));
    }
};

/**
 * @brief Decode a `T` directly from an encoded document.
 *
 * Borrowed targets (`std::string_view`, byte spans, and the raw types) refer into
 * the document's buffer.
 */
template <typename T>
result<T> from_raw_document(raw_document doc, options opts = options{.human_readable = false}) {
    raw_deserializer d(raw_bson(doc), opts);
    return de::deserialize<T>(d);
}

/**
 * @brief Decode a `T` directly from a buffer that begins with an encoded document
 */
template <typename T>
result<T> from_slice(std::span<const std::byte> bytes,
                     options opts = options{.human_readable = false}) {
    TBSON_TRY(auto doc, raw_document::from_bytes(bytes));
    return de::from_raw_document<T>(doc, opts);
}

}  // namespace tbson::de
