#pragma once

#include <fngrader/common/formatters/debug.hpp>

#include <fmt/format.h>
#include <libassert/assert.hpp>

#include <concepts>
#include <string>
#include <system_error>
#include <type_traits>
#include <utility>
#include <variant>

namespace fngrader {

struct UnexpectedT
{
};

/// Tag to construct the error alternative of an Expected whose value and error types coincide or convert
inline constexpr UnexpectedT unexpected{};

template <typename T = void, typename E = std::error_code>
/**
 * @brief std::variant wrapper for a partial implementation of C++23's expected type
 *
 * @tparam T The expected value type
 * @tparam E The error type
 *
 * Implicit construction from E requires that T and E are not convertible between one another;
 * otherwise use the `unexpected` tag.
 */
class [[nodiscard]] Expected
{
public:
    using ExpectedT = T;
    using ErrT = E;

    constexpr Expected()
        : data_{} {}

    template <typename... Args>
    explicit constexpr Expected(std::in_place_t /*unused*/, Args&&... args)
        requires(!std::is_void_v<T> && std::constructible_from<ExpectedT, Args...>)
        : data_{std::in_place_index<0>, std::forward<Args>(args)...} {}

    template <typename Tu>
    constexpr Expected(Tu&& value) // NOLINT(*-explicit-*)
        requires(!std::is_void_v<T> && std::convertible_to<Tu, T> && !std::same_as<std::remove_cvref_t<Tu>, Expected>)
        : data_{std::in_place_index<0>, std::forward<Tu>(value)} {}

    template <typename Eu>
    constexpr Expected(Eu&& error) // NOLINT(*-explicit-*)
        requires(std::convertible_to<Eu, E> && !std::is_convertible_v<Eu, T> &&
                 !std::same_as<std::remove_cvref_t<Eu>, Expected>)
        : data_{std::in_place_index<1>, std::forward<Eu>(error)} {}

    template <typename Eu>
    constexpr Expected(UnexpectedT /*unused*/, Eu&& error)
        requires(std::convertible_to<Eu, E>)
        : data_{std::in_place_index<1>, std::forward<Eu>(error)} {}

    constexpr bool has_value() const { return data_.index() == 0; }

    constexpr bool has_error() const { return !has_value(); }

    constexpr explicit operator bool() const { return has_value(); }

    template <typename U = T>
    constexpr U& value() &
        requires(!std::is_void_v<U>)
    {
        ASSERT(has_value());
        return std::get<0>(data_);
    }

    template <typename U = T>
    constexpr const U& value() const&
        requires(!std::is_void_v<U>)
    {
        ASSERT(has_value());
        return std::get<0>(data_);
    }

    template <typename U = T>
    constexpr U&& value() &&
        requires(!std::is_void_v<U>)
    {
        ASSERT(has_value());
        return std::get<0>(std::move(data_));
    }

    template <typename U = T>
    constexpr void value() const&
        requires(std::is_void_v<U>)
    {
        ASSERT(has_value());
    }

    template <typename U = T>
    constexpr U& operator*() &
        requires(!std::is_void_v<U>)
    {
        return value();
    }

    template <typename U = T>
    constexpr const U& operator*() const&
        requires(!std::is_void_v<U>)
    {
        return value();
    }

    template <typename U = T>
    constexpr U* operator->()
        requires(!std::is_void_v<U>)
    {
        return &value();
    }

    template <typename U = T>
    constexpr const U* operator->() const
        requires(!std::is_void_v<U>)
    {
        return &value();
    }

    template <typename Tu>
    constexpr T value_or(Tu&& default_value) const
        requires(!std::is_void_v<T> && std::convertible_to<Tu, T>)
    {
        if (!has_value()) {
            return static_cast<T>(std::forward<Tu>(default_value));
        }
        return std::get<0>(data_);
    }

    constexpr const E& error() const {
        ASSERT(!has_value());
        return std::get<1>(data_);
    }

    template <typename Eu>
    constexpr E error_or(Eu&& default_value) const {
        if (has_value()) {
            return static_cast<E>(std::forward<Eu>(default_value));
        }
        return std::get<1>(data_);
    }

    template <typename Func>
    constexpr auto transform(const Func& func) const -> Expected<std::invoke_result_t<Func, const T&>, E>
        requires(!std::is_void_v<T>)
    {
        if (!has_value()) {
            return {unexpected, error()};
        }

        return func(value());
    }

    template <typename Func>
    constexpr auto transform_error(const Func& func) const -> Expected<T, std::invoke_result_t<Func, const E&>> {
        using NewE = std::invoke_result_t<Func, const E&>;

        if (!has_value()) {
            return {unexpected, func(error())};
        }

        if constexpr (std::is_void_v<T>) {
            return Expected<T, NewE>{};
        } else {
            return Expected<T, NewE>{std::in_place, value()};
        }
    }

    constexpr bool operator==(const Expected& rhs) const = default;

private:
    using StoredT = std::conditional_t<std::is_void_v<T>, std::monostate, T>;

    std::variant<StoredT, E> data_;
};

} // namespace fngrader

template <typename T, typename E>
struct fmt::formatter<::fngrader::Expected<T, E>> : ::fngrader::DebugFormatter
{
    auto format(const ::fngrader::Expected<T, E>& from, fmt::format_context& ctx) const {
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
