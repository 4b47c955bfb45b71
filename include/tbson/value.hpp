#pragma once

#include <tbson/types.hpp>

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace tbson {

class bson;
struct document_entry;

/// An ordered sequence of BSON values
using array = std::vector<bson>;

/**
 * @brief An ordered mapping of strings to BSON values.
 *
 * Iteration order is insertion order. Inserting an existing key replaces its
 * value without changing its position.
 */
class document {
public:
    using value_type     = document_entry;
    using iterator       = std::vector<document_entry>::iterator;
    using const_iterator = std::vector<document_entry>::const_iterator;

    document() noexcept;
    document(const document&);
    document(document&&) noexcept;
    document& operator=(const document&);
    document& operator=(document&&) noexcept;
    ~document();

    [[nodiscard]] std::size_t size() const noexcept;
    [[nodiscard]] bool        empty() const noexcept;

    iterator       begin() noexcept;
    iterator       end() noexcept;
    const_iterator begin() const noexcept;
    const_iterator end() const noexcept;

    /**
     * @brief Insert a new entry at the end of the document, or replace the value
     * of an existing entry with the same key.
     */
    void insert(std::string key, bson value);

    /**
     * @brief Find the value of the entry with the given key
     *
     * @return A pointer to the value, or `nullptr` if there is no such entry
     */
    [[nodiscard]] const bson* get(std::string_view key) const noexcept;
    [[nodiscard]] bson*       get(std::string_view key) noexcept;

    [[nodiscard]] bool contains(std::string_view key) const noexcept {
        return get(key) != nullptr;
    }

    /**
     * @brief Move all entries out of the document, leaving it empty
     */
    [[nodiscard]] std::vector<document_entry> take_entries() && noexcept;

    bool operator==(const document& other) const;

private:
    std::vector<document_entry> _entries;
};

/**
 * @brief An owned BSON value. A closed sum of the types in `TBSON_ELEMENT_TYPE_X_LIST`.
 */
class bson {
public:
    using variant_type = std::variant<double,
                                      std::string,
                                      document,
                                      array,
                                      binary,
                                      bool,
                                      datetime,
                                      null,
                                      std::int32_t,
                                      timestamp,
                                      std::int64_t,
                                      decimal128,
                                      std::uint32_t,
                                      std::uint64_t>;

    bson() noexcept
        : _value(null{}) {}

    bson(double d) noexcept
        : _value(d) {}
    bson(std::string s) noexcept
        : _value(std::move(s)) {}
    bson(std::string_view s)
        : _value(std::string(s)) {}
    bson(const char* s)
        : _value(std::string(s)) {}
    bson(document d) noexcept
        : _value(std::move(d)) {}
    bson(array a) noexcept
        : _value(std::move(a)) {}
    bson(binary b) noexcept
        : _value(std::move(b)) {}
    bson(bool b) noexcept
        : _value(b) {}
    bson(datetime d) noexcept
        : _value(d) {}
    bson(null n) noexcept
        : _value(n) {}
    bson(std::int32_t i) noexcept
        : _value(i) {}
    bson(timestamp t) noexcept
        : _value(t) {}
    bson(std::int64_t i) noexcept
        : _value(i) {}
    bson(decimal128 d) noexcept
        : _value(d) {}
    bson(std::uint32_t u) noexcept
        : _value(u) {}
    bson(std::uint64_t u) noexcept
        : _value(u) {}

    /// Get the element type of the stored value
    [[nodiscard]] element_type type() const noexcept;

    [[nodiscard]] bool is_null() const noexcept { return std::holds_alternative<null>(_value); }

    /**
     * @brief Obtain a pointer to the stored value if it holds a `T`, otherwise `nullptr`
     */
    template <typename T>
    [[nodiscard]] T* get_if() noexcept {
        return std::get_if<T>(&_value);
    }
    template <typename T>
    [[nodiscard]] const T* get_if() const noexcept {
        return std::get_if<T>(&_value);
    }

    [[nodiscard]] variant_type&       data() & noexcept { return _value; }
    [[nodiscard]] const variant_type& data() const& noexcept { return _value; }
    [[nodiscard]] variant_type&&      data() && noexcept { return std::move(_value); }

    /**
     * @brief Invoke `fn` with the stored value
     */
    template <typename F>
    decltype(auto) visit(F&& fn) const {
        return std::visit(std::forward<F>(fn), _value);
    }

    /**
     * @brief Describe this value for use in an error message
     */
    [[nodiscard]] unexpected as_unexpected() const;

    bool operator==(const bson& other) const { return _value == other._value; }

private:
    variant_type _value;
};

/**
 * @brief A single key/value entry of a `document`
 */
struct document_entry {
    std::string key;
    bson        value;

    bool operator==(const document_entry&) const = default;
};

}  // namespace tbson
