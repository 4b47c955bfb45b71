#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

namespace tbson {

/**
 * @brief The kinds of failure that a decoding operation can report
 */
enum class errc {
    okay = 0,
    /// A value was required, but the source was already exhausted
    end_of_stream,
    /// The offered shape does not match what the target required
    invalid_type,
    /// The shape was acceptable but its content failed to parse
    invalid_value,
    /// A fixed-size payload received the wrong number of elements or bytes
    invalid_length,
    /// Free-text error. Used for structural faults and unsupported operations
    custom,
};

/**
 * @brief Structural faults detected while reading encoded BSON data
 */
enum class raw_errc {
    okay = 0,
    /// The buffer is shorter than the data it claims to contain
    short_read,
    /// The document header declares an impossible length
    invalid_header,
    /// The document does not end with a null byte
    invalid_terminator,
    /// An element has an unrecognized type tag
    invalid_type,
    /// An element's length prefix is invalid
    invalid_length,
    /// An element value, or a nested document or array, is malformed
    invalid_document,
    /// A key or string value is not valid UTF-8
    invalid_utf8,
    /// Documents and arrays are nested deeper than the configured limit
    depth_exceeded,
};

/// The error category for `tbson::errc`
const std::error_category& decode_category() noexcept;
/// The error category for `tbson::raw_errc`
const std::error_category& raw_category() noexcept;

inline std::error_code make_error_code(errc e) noexcept {
    return std::error_code(static_cast<int>(e), decode_category());
}

inline std::error_code make_error_code(raw_errc e) noexcept {
    return std::error_code(static_cast<int>(e), raw_category());
}

/**
 * @brief A rendered description of a value that was offered to a target that
 * could not accept it. Used to build error messages.
 */
class unexpected {
public:
    static unexpected boolean(bool b);
    static unexpected signed_integer(std::int64_t i);
    static unexpected unsigned_integer(std::uint64_t u);
    static unexpected floating(double d);
    static unexpected str(std::string_view s);
    static unexpected bytes();
    static unexpected unit();
    static unexpected option();
    static unexpected newtype_struct();
    static unexpected seq();
    static unexpected map();
    static unexpected enum_();
    static unexpected other(std::string_view what);

    [[nodiscard]] const std::string& describe() const noexcept { return _text; }

private:
    explicit unexpected(std::string s) noexcept
        : _text(std::move(s)) {}

    std::string _text;
};

/**
 * @brief An error produced by a decoding operation.
 *
 * Carries the error kind, a human-readable message that names the received
 * value and the expected shape, and, for faults in encoded data, the structural
 * reason.
 */
class decode_error {
public:
    decode_error(errc kind, std::string message, raw_errc reason = raw_errc::okay) noexcept
        : _kind(kind)
        , _reason(reason)
        , _message(std::move(message)) {}

    static decode_error end_of_stream();
    static decode_error invalid_type(const unexpected& got, std::string_view expected);
    static decode_error invalid_value(const unexpected& got, std::string_view expected);
    static decode_error invalid_length(std::size_t len, std::string_view expected);
    static decode_error custom(std::string message);
    /**
     * @brief Create an error for a structural fault in encoded data. The kind is
     * always `errc::custom`.
     */
    static decode_error raw(raw_errc reason);

    [[nodiscard]] errc     kind() const noexcept { return _kind; }
    [[nodiscard]] raw_errc reason() const noexcept { return _reason; }

    [[nodiscard]] const std::string& message() const noexcept { return _message; }

    /**
     * @brief Get an error code for this error. If this error has a structural
     * reason, that reason is returned, otherwise the error kind.
     */
    [[nodiscard]] std::error_code code() const noexcept;

private:
    errc        _kind;
    raw_errc    _reason;
    std::string _message;
};

/**
 * @brief Exception thrown when the value of an errant `result` is requested
 */
class exception : public std::system_error {
public:
    explicit exception(decode_error err)
        : std::system_error(err.code(), err.message())
        , _error(std::move(err)) {}

    [[nodiscard]] const decode_error& error() const noexcept { return _error; }

private:
    decode_error _error;
};

}  // namespace tbson

template <>
struct std::is_error_code_enum<tbson::errc> : std::true_type {};

template <>
struct std::is_error_code_enum<tbson::raw_errc> : std::true_type {};
