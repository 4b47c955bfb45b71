#pragma once

#include <tbson/error.hpp>

#include <neo/concepts.hpp>
#include <neo/fwd.hpp>
#include <neo/like.hpp>
#include <neo/object_box.hpp>

#include <cassert>
#include <system_error>
#include <tuple>
#include <type_traits>
#include <utility>
#include <variant>

namespace tbson {

// Tag type that carries the success() arguments to a result<T>
template <typename... Args>
struct success_tag {
    std::tuple<Args&&...> args;
};

// Tag type that carries the error() arguments to a result<T>
template <typename... Args>
struct error_tag {
    std::tuple<Args&&...> args;
};

// Create a constructor tag for result<T> that imbues it with a success
constexpr auto success
    = []<typename... Args>(Args&&... args) -> success_tag<Args...> { return {{NEO_FWD(args)...}}; };

// Create a constructor tag for result<T> that imbues it with an error
constexpr auto error
    = []<typename... Args>(Args&&... args) -> error_tag<Args...> { return {{NEO_FWD(args)...}}; };

// Define the behavior of `result<T, E>` for handling the error type `E`
template <typename E>
struct error_traits {};

/**
 * @brief The empty success value, used by operations that produce nothing but
 * may still fail
 */
struct unit {
    bool operator==(const unit&) const = default;
};

/**
 * @brief An error-or-value sum type. A `result<T, E>` holds either a `T` in its
 * success state, or an `E` in its error state.
 *
 * @tparam T The success-value type
 * @tparam E The error-value type (default is `tbson::decode_error`)
 *
 * @note Construct using the `success` and `error` utilities in namespace scope
 */
template <typename T, typename E = decode_error>
class result {
public:
    using success_type = T;
    using error_type   = E;

    result() = default;

    template <neo::unalike<result> U>
        requires neo::explicit_convertible_to<U&&, T>
        and (not neo::explicit_convertible_to<U &&, E>)
    explicit(not neo::implicit_convertible_to<U&&, T>) constexpr result(U&& arg)
        : result(success(NEO_FWD(arg))) {}

    /// Construct a success-valued result object
    template <typename... Args>
        requires neo::constructible_from<T, Args&&...>
    constexpr result(success_tag<Args...> success)
        : result(success, NEO_MOVE(success).args, std::index_sequence_for<Args...>{}) {}

    /// Construct an error-valued result object
    template <typename... Args>
        requires neo::constructible_from<E, Args&&...>
    constexpr result(error_tag<Args...> err)
        : result(err, NEO_MOVE(err).args, std::index_sequence_for<Args...>{}) {}

    /// Returns `true` iff the result has a success value
    constexpr bool has_value() const noexcept { return _stored.index() == 0; }
    /// Returns `true` iff the result has an error value
    constexpr bool has_error() const noexcept { return _stored.index() == 1; }

    constexpr explicit operator bool() const noexcept { return has_value(); }

    /**
     * @brief Create an error_tag for the error contained by this result, useful
     * for forwarding an error from one result to another
     */
    constexpr decltype(auto) error_tag() & {
        assert(has_error());
        return tbson::error(this->error());
    }
    constexpr decltype(auto) error_tag() const& {
        assert(has_error());
        return tbson::error(this->error());
    }
    constexpr decltype(auto) error_tag() && {
        assert(has_error());
        return tbson::error(NEO_MOVE(*this).error());
    }

    /**
     * @brief Obtain the value stored in the object, throwing in case of error
     */
    constexpr decltype(auto) value() & {
        this->_maybe_throw();
        return std::get_if<0>(&_stored)->get();
    }
    constexpr decltype(auto) value() const& {
        this->_maybe_throw();
        return std::get_if<0>(&_stored)->get();
    }
    constexpr decltype(auto) value() && {
        this->_maybe_throw();
        return std::get_if<0>(&_stored)->forward();
    }

    constexpr decltype(auto) operator*() & { return this->value(); }
    constexpr decltype(auto) operator*() const& { return this->value(); }
    constexpr decltype(auto) operator*() && { return NEO_MOVE(*this).value(); }

    constexpr auto operator->() { return &this->value(); }
    constexpr auto operator->() const { return &this->value(); }

    constexpr decltype(auto) error() & {
        assert(has_error());
        return std::get_if<1>(&_stored)->get();
    }
    constexpr decltype(auto) error() const& {
        assert(has_error());
        return std::get_if<1>(&_stored)->get();
    }
    constexpr decltype(auto) error() && {
        assert(has_error());
        return std::get_if<1>(&_stored)->forward();
    }

    template <typename F>
    constexpr auto transform(F&& fn) const& -> result<std::invoke_result_t<F, T const&>, E> {
        if (has_value()) {
            return success(NEO_FWD(fn)(this->value()));
        } else {
            return this->error_tag();
        }
    }

    template <typename F>
    constexpr auto transform(F&& fn) && -> result<std::invoke_result_t<F, T&&>, E> {
        if (has_value()) {
            return success(NEO_FWD(fn)(NEO_MOVE(*this).value()));
        } else {
            return NEO_MOVE(*this).error_tag();
        }
    }

private:
    template <typename... Args, std::size_t... Ns>
    constexpr explicit result(success_tag<Args...> const&, auto&& tpl, std::index_sequence<Ns...>)
        : _stored(std::in_place_index<0>, std::in_place, std::get<Ns>(NEO_FWD(tpl))...) {}

    template <typename... Args, std::size_t... Ns>
    constexpr explicit result(tbson::error_tag<Args...> const&,
                              auto&& tpl,
                              std::index_sequence<Ns...>)
        : _stored(std::in_place_index<1>, std::in_place, std::get<Ns>(NEO_FWD(tpl))...) {}

    std::variant<neo::object_box<T>, neo::object_box<E>> _stored;

    constexpr void _maybe_throw() const {
        if (this->has_error()) {
            error_traits<E>::throw_exception(this->error());
        }
    }
};

template <>
struct error_traits<decode_error> {
    [[noreturn]] static void throw_exception(const decode_error& e) { throw tbson::exception(e); }
};

}  // namespace tbson

#define TBSON_CONCAT_IMPL(A, B) A##B
#define TBSON_CONCAT(A, B) TBSON_CONCAT_IMPL(A, B)

/**
 * @brief Evaluate a `result`-returning expression. If it holds an error, return
 * that error from the enclosing function. Otherwise, initialize `Decl` with the
 * success value.
 *
 * The enclosing function must itself return a `result` with the same error type.
 */
#define TBSON_TRY(Decl, ...) TBSON_TRY_IMPL(Decl, TBSON_CONCAT(_tbson_try_, __LINE__), __VA_ARGS__)
#define TBSON_TRY_IMPL(Decl, Tmp, ...)                                                             \
    auto&& Tmp = (__VA_ARGS__);                                                                    \
    if (Tmp.has_error()) {                                                                         \
        return NEO_FWD(Tmp).error_tag();                                                           \
    }                                                                                              \
    Decl = NEO_FWD(Tmp).value()

/**
 * @brief Evaluate a `result`-returning expression and return its error from the
 * enclosing function, if any. The success value is discarded.
 */
#define TBSON_CHECK(...) TBSON_CHECK_IMPL(TBSON_CONCAT(_tbson_chk_, __LINE__), __VA_ARGS__)
#define TBSON_CHECK_IMPL(Tmp, ...)                                                                 \
    auto&& Tmp = (__VA_ARGS__);                                                                    \
    if (Tmp.has_error()) {                                                                         \
        return NEO_FWD(Tmp).error_tag();                                                           \
    }                                                                                              \
    static_cast<void>(0)
