#pragma once

#include <tbson/de/options.hpp>
#include <tbson/result.hpp>
#include <tbson/types.hpp>
#include <tbson/value.hpp>

#include <cstddef>
#include <cstdint>
#include <iterator>
#include <optional>
#include <span>
#include <string_view>
#include <variant>

namespace tbson {

class raw_bson;
class raw_element;

/**
 * @brief A read-only view of an encoded BSON document.
 *
 * The viewed bytes have the form `<int32 length><element*><0x00>`. The header
 * and terminator are validated when the view is created. Elements are decoded
 * and validated one at a time as they are reached by iteration.
 *
 * @note The view does not own its data. It must not outlive the viewed buffer,
 * and must not be used across a modification of that buffer.
 */
class raw_document {
public:
    class iterator;

    /// Create a view of a static empty document
    raw_document() noexcept;

    /**
     * @brief Create a view of the document at the beginning of `bytes`.
     *
     * @param bytes A buffer that begins with an encoded document. The buffer may
     * be longer than the document.
     * @return The new view, or a structural error if the document header or
     * terminator are invalid. The error kind is `errc::custom`, and its reason is
     * one of `short_read`, `invalid_header` or `invalid_terminator`.
     */
    static result<raw_document> from_bytes(std::span<const std::byte> bytes);

    /// The bytes of the document, including its header and terminator
    [[nodiscard]] std::span<const std::byte> bytes() const noexcept { return _bytes; }
    [[nodiscard]] std::size_t                byte_size() const noexcept { return _bytes.size(); }

    [[nodiscard]] bool empty() const noexcept { return _bytes.size() == 5; }

    [[nodiscard]] iterator begin() const noexcept;
    [[nodiscard]] iterator end() const noexcept;

    /**
     * @brief Find the first element with the given key.
     *
     * Elements before the match are validated. Fails if one of them is malformed.
     */
    [[nodiscard]] result<std::optional<raw_bson>> get(std::string_view key) const;

    /**
     * @brief Copy the viewed document into an owned `document`.
     *
     * Every element is validated. The first structural fault aborts the
     * conversion.
     */
    [[nodiscard]] result<document> to_document(unsigned max_depth = default_max_depth) const;

    bool operator==(const raw_document& other) const noexcept;

private:
    explicit raw_document(std::span<const std::byte> b) noexcept
        : _bytes(b) {}

    std::span<const std::byte> _bytes;
};

/**
 * @brief A read-only view of an encoded BSON array. An array is encoded as a
 * document whose keys are ignored.
 */
class raw_array {
public:
    using iterator = raw_document::iterator;

    raw_array() noexcept = default;
    explicit raw_array(raw_document doc) noexcept
        : _doc(doc) {}

    static result<raw_array> from_bytes(std::span<const std::byte> bytes);

    [[nodiscard]] const raw_document&        as_document() const noexcept { return _doc; }
    [[nodiscard]] std::span<const std::byte> bytes() const noexcept { return _doc.bytes(); }
    [[nodiscard]] bool                       empty() const noexcept { return _doc.empty(); }

    [[nodiscard]] iterator begin() const noexcept;
    [[nodiscard]] iterator end() const noexcept;

    /**
     * @brief Get the element at the given position, or `nullopt` if the array
     * is shorter than that
     */
    [[nodiscard]] result<std::optional<raw_bson>> get(std::size_t index) const;

    /// Copy the viewed array into an owned `array`
    [[nodiscard]] result<array> to_array(unsigned max_depth = default_max_depth) const;

    bool operator==(const raw_array& other) const noexcept { return _doc == other._doc; }

private:
    raw_document _doc;
};

/**
 * @brief A binary value whose bytes are borrowed from an encoded buffer
 */
struct raw_binary {
    binary_subtype             subtype = binary_subtype::generic;
    std::span<const std::byte> bytes;

    /// Copy the bytes into an owned binary value
    [[nodiscard]] binary to_owned() const;

    /**
     * @brief Get the shape in which this binary value is serialized.
     *
     * A generic binary serializes as plain bytes. Other subtypes serialize as a
     * `$binary` document, holding `base64` text and a hex `subType` string in
     * human-readable form, or `bytes` and an integer `subType` otherwise.
     */
    [[nodiscard]] bson to_bson(bool human_readable) const;

    bool operator==(const raw_binary& other) const noexcept;
};

/**
 * @brief A BSON value borrowed from an encoded buffer.
 *
 * Strings, documents, arrays and binary values refer into the buffer. Other
 * values are copied.
 */
class raw_bson {
public:
    using variant_type = std::variant<double,
                                      std::string_view,
                                      raw_document,
                                      raw_array,
                                      raw_binary,
                                      bool,
                                      datetime,
                                      null,
                                      std::int32_t,
                                      timestamp,
                                      std::int64_t,
                                      decimal128,
                                      std::uint32_t,
                                      std::uint64_t>;

    raw_bson() noexcept
        : _value(null{}) {}

    template <typename T>
        requires std::constructible_from<variant_type, T&&>
    raw_bson(T&& value) noexcept
        : _value(std::forward<T>(value)) {}

    [[nodiscard]] element_type type() const noexcept;

    [[nodiscard]] std::optional<double>           as_double() const noexcept;
    [[nodiscard]] std::optional<std::string_view> as_str() const noexcept;
    [[nodiscard]] std::optional<raw_array>        as_array() const noexcept;
    [[nodiscard]] std::optional<raw_document>     as_document() const noexcept;
    [[nodiscard]] std::optional<bool>             as_bool() const noexcept;
    [[nodiscard]] std::optional<std::int32_t>     as_int32() const noexcept;
    [[nodiscard]] std::optional<std::int64_t>     as_int64() const noexcept;
    [[nodiscard]] std::optional<raw_binary>       as_binary() const noexcept;
    [[nodiscard]] std::optional<datetime>         as_datetime() const noexcept;
    [[nodiscard]] std::optional<timestamp>        as_timestamp() const noexcept;
    [[nodiscard]] std::optional<null>             as_null() const noexcept;

    template <typename T>
    [[nodiscard]] const T* get_if() const noexcept {
        return std::get_if<T>(&_value);
    }

    [[nodiscard]] const variant_type& data() const noexcept { return _value; }

    /**
     * @brief Copy this value into an owned `bson`. Nested documents and arrays
     * are fully validated.
     */
    [[nodiscard]] result<bson> to_bson(unsigned max_depth = default_max_depth) const;

    /// Describe this value for use in an error message
    [[nodiscard]] unexpected as_unexpected() const;

    bool operator==(const raw_bson& other) const noexcept { return _value == other._value; }

private:
    variant_type _value;
};

/**
 * @brief A key and value read from a raw document
 */
class raw_element {
public:
    raw_element() noexcept = default;
    raw_element(std::string_view key, raw_bson value) noexcept
        : _key(key)
        , _value(value) {}

    [[nodiscard]] std::string_view key() const noexcept { return _key; }
    [[nodiscard]] element_type     type() const noexcept { return _value.type(); }
    [[nodiscard]] const raw_bson&  value() const noexcept { return _value; }

private:
    std::string_view _key;
    raw_bson         _value;
};

/**
 * @brief Iterator over the elements of a raw document.
 *
 * Each element is validated when the iterator reaches it. If the element is
 * malformed, the iterator enters an errant state: `error()` returns the reason,
 * dereferencing throws, and incrementing has no effect. An errant iterator never
 * compares equal to the end iterator.
 */
class raw_document::iterator {
public:
    using value_type        = raw_element;
    using reference         = const raw_element&;
    using pointer           = const raw_element*;
    using difference_type   = std::ptrdiff_t;
    using iterator_category = std::input_iterator_tag;
    using iterator_concept  = std::forward_iterator_tag;

    iterator() noexcept = default;

    reference operator*() const {
        throw_if_error();
        return _current;
    }
    pointer operator->() const {
        throw_if_error();
        return &_current;
    }

    iterator& operator++() noexcept;
    iterator  operator++(int) noexcept {
        auto c = *this;
        ++*this;
        return c;
    }

    bool operator==(const iterator& other) const noexcept {
        return _rest.data() == other._rest.data() and _error == other._error;
    }

    // Obtain the error associated with this iterator, if one is defined
    [[nodiscard]] raw_errc error() const noexcept { return _error; }
    // Test whether the iterator has an errant state
    [[nodiscard]] bool has_error() const noexcept { return _error != raw_errc::okay; }
    // Test whether the iterator is the "done" iterator
    [[nodiscard]] bool stop() const noexcept { return not has_error() and _rest.size() <= 1; }
    // Test whether the iterator points to a valid element
    [[nodiscard]] bool has_value() const noexcept { return not has_error() and not stop(); }

    // If the iterator has an error condition, throw an exception
    void throw_if_error() const;

    // Obtain the encoded bytes of the current element
    [[nodiscard]] std::span<const std::byte> element_bytes() const noexcept {
        return _rest.first(_size);
    }

private:
    friend raw_document;
    // `rest` runs from the current element through the document's terminator
    explicit iterator(std::span<const std::byte> rest) noexcept
        : _rest(rest) {
        _parse();
    }

    void _parse() noexcept;

    std::span<const std::byte> _rest;
    std::size_t                _size  = 0;
    raw_errc                   _error = raw_errc::okay;
    raw_element                _current;
};

}  // namespace tbson
