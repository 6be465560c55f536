#pragma once

#include <assessgrader/common/formatters/debug.hpp>

#include <fmt/format.h>
#include <libassert/assert.hpp>

#include <concepts>
#include <functional>
#include <system_error>
#include <type_traits>
#include <utility>
#include <variant>

namespace assessgrader {

template <typename T = void, typename E = std::error_code>
/**
 * @brief std::variant wrapper for a partial implementation of C++23's expected type
 *
 * @tparam T The expected value type (``void`` for operations that only succeed or fail)
 * @tparam E The error type
 *
 * Note: types T and E must not be convertible between one another.
 */
class [[nodiscard]] Expected
{
    // ``void`` cannot be stored in a variant, so a monostate stands in for it
    using StoredT = std::conditional_t<std::is_void_v<T>, std::monostate, T>;

public:
    using ExpectedT = T;
    using ErrT = E;

    constexpr Expected()
        : data_{std::in_place_index<0>} {}

    template <typename Tu>
    constexpr Expected(Tu&& value) // NOLINT(*-explicit-*)
        requires(!std::is_void_v<T> && std::convertible_to<Tu, StoredT> && !std::convertible_to<Tu, E>)
        : data_{std::in_place_index<0>, std::forward<Tu>(value)} {}

    template <typename Eu>
    constexpr Expected(Eu&& error) // NOLINT(*-explicit-*)
        requires(std::convertible_to<Eu, E> && !std::convertible_to<Eu, StoredT>)
        : data_{std::in_place_index<1>, std::forward<Eu>(error)} {}

    constexpr bool has_value() const noexcept { return data_.index() == 0; }

    constexpr bool has_error() const noexcept { return !has_value(); }

    constexpr explicit operator bool() const noexcept { return has_value(); }

    template <typename U = T>
        requires(!std::is_void_v<U>)
    constexpr U& value() {
        DEBUG_ASSERT(has_value(), "value() called on an erroneous Expected");
        return std::get<0>(data_);
    }

    template <typename U = T>
        requires(!std::is_void_v<U>)
    constexpr const U& value() const {
        DEBUG_ASSERT(has_value(), "value() called on an erroneous Expected");
        return std::get<0>(data_);
    }

    template <typename U = T>
        requires(std::is_void_v<U>)
    constexpr void value() const {
        DEBUG_ASSERT(has_value(), "value() called on an erroneous Expected");
    }

    template <typename U = T>
        requires(!std::is_void_v<U>)
    constexpr U& operator*() {
        return value();
    }

    template <typename U = T>
        requires(!std::is_void_v<U>)
    constexpr const U& operator*() const {
        return value();
    }

    template <typename U = T>
        requires(!std::is_void_v<U>)
    constexpr U* operator->() {
        return &value();
    }

    template <typename U = T>
        requires(!std::is_void_v<U>)
    constexpr const U* operator->() const {
        return &value();
    }

    template <typename Tu>
        requires(!std::is_void_v<T> && std::convertible_to<Tu, T>)
    constexpr T value_or(Tu&& default_value) const {
        if (!has_value()) {
            return static_cast<T>(std::forward<Tu>(default_value));
        }
        return std::get<0>(data_);
    }

    constexpr const E& error() const {
        DEBUG_ASSERT(has_error(), "error() called on an Expected holding a value");
        return std::get<1>(data_);
    }

    /// Map the contained value with ``func``, passing errors through untouched
    template <typename Func>
        requires(!std::is_void_v<T>)
    constexpr Expected<std::invoke_result_t<Func, const T&>, E> transform(Func&& func) const {
        if (!has_value()) {
            return error();
        }

        return std::invoke(std::forward<Func>(func), value());
    }

    /// Map the contained error with ``func``
    template <typename Func>
    constexpr Expected<T, std::invoke_result_t<Func, const E&>> transform_error(Func&& func) const {
        using NewE = std::invoke_result_t<Func, const E&>;

        if (has_error()) {
            return Expected<T, NewE>{std::invoke(std::forward<Func>(func), error())};
        }

        if constexpr (std::is_void_v<T>) {
            return Expected<T, NewE>{};
        } else {
            return Expected<T, NewE>{value()};
        }
    }

    constexpr bool operator==(const Expected& rhs) const = default;

    template <typename Tu>
        requires(!std::is_void_v<T> && !std::same_as<Tu, Expected> && std::equality_comparable_with<Tu, T>)
    constexpr bool operator==(const Tu& rhs) const {
        return has_value() && value() == rhs;
    }

    template <typename Eu>
        requires(!std::same_as<Eu, Expected> && !std::equality_comparable_with<Eu, StoredT> &&
                 std::equality_comparable_with<Eu, E>)
    constexpr bool operator==(const Eu& rhs) const {
        return has_error() && error() == rhs;
    }

private:
    std::variant<StoredT, E> data_;
};

} // namespace assessgrader

template <typename T, typename E>
struct fmt::formatter<::assessgrader::Expected<T, E>> : ::assessgrader::DebugFormatter
{
    auto format(const ::assessgrader::Expected<T, E>& from, fmt::format_context& ctx) const {
        if (!from) {
            if constexpr (fmt::is_formattable<E>::value) {
                return fmt::format_to(ctx.out(), "Error({})", from.error());
            } else {
                return fmt::format_to(ctx.out(), "Error(<unformattable>)");
            }
        }

        if constexpr (std::is_void_v<T>) {
            return fmt::format_to(ctx.out(), "Expected(void)");
        } else if constexpr (fmt::is_formattable<T>::value) {
            return fmt::format_to(ctx.out(), "Expected({})", from.value());
        } else {
            return fmt::format_to(ctx.out(), "Expected(<unformattable>)");
        }
    }
};
