#pragma once

#include <libassert/assert.hpp>

#include <concepts>
#include <functional>
#include <system_error>
#include <type_traits>
#include <utility>
#include <variant>

namespace grader {

/// Tag used to force construction of the error alternative
struct UnexpectedT
{
};

inline constexpr UnexpectedT unexpected{};

/**
 * @brief Partial stand-in for C++23's std::expected, built on std::variant
 *
 * @tparam T The expected value type (may be void)
 * @tparam E The error type
 *
 * T and E must not be convertible to one another, otherwise implicit construction is ambiguous.
 * Use the ``unexpected`` tag in that case.
 */
template <typename T = void, typename E = std::error_code>
class [[nodiscard]] Expected
{
    using StoredT = std::conditional_t<std::is_void_v<T>, std::monostate, T>;

public:
    using ValueT = T;
    using ErrorT = E;

    constexpr Expected()
        requires(std::is_void_v<T> || std::default_initializable<T>)
        : data_{std::in_place_index<0>} {}

    template <typename U>
    constexpr Expected(U&& value) // NOLINT(*-explicit-*)
        requires(!std::is_void_v<T> && !std::same_as<std::remove_cvref_t<U>, Expected> &&
                 std::convertible_to<U, StoredT>)
        : data_{std::in_place_index<0>, std::forward<U>(value)} {}

    template <typename G>
    constexpr Expected(G&& error) // NOLINT(*-explicit-*)
        requires(!std::same_as<std::remove_cvref_t<G>, Expected> && std::convertible_to<G, E> &&
                 !std::convertible_to<G, StoredT>)
        : data_{std::in_place_index<1>, std::forward<G>(error)} {}

    template <typename G>
    constexpr Expected(UnexpectedT /*unused*/, G&& error)
        requires(std::convertible_to<G, E>)
        : data_{std::in_place_index<1>, std::forward<G>(error)} {}

    constexpr bool has_value() const noexcept { return data_.index() == 0; }

    constexpr bool has_error() const noexcept { return !has_value(); }

    constexpr explicit operator bool() const noexcept { return has_value(); }

    template <typename U = T>
        requires(std::is_void_v<U>)
    constexpr void value() const& {
        ASSERT(has_value(), "value() called on an Expected holding an error");
    }

    template <typename U = T>
        requires(!std::is_void_v<U>)
    constexpr const U& value() const& {
        ASSERT(has_value(), "value() called on an Expected holding an error");
        return std::get<0>(data_);
    }

    template <typename U = T>
        requires(!std::is_void_v<U>)
    constexpr U& value() & {
        ASSERT(has_value(), "value() called on an Expected holding an error");
        return std::get<0>(data_);
    }

    template <typename U = T>
        requires(!std::is_void_v<U>)
    constexpr U&& value() && {
        ASSERT(has_value(), "value() called on an Expected holding an error");
        return std::get<0>(std::move(data_));
    }

    template <typename U = T>
        requires(!std::is_void_v<U>)
    constexpr const U& operator*() const& {
        return value();
    }

    template <typename U = T>
        requires(!std::is_void_v<U>)
    constexpr U& operator*() & {
        return value();
    }

    template <typename U = T>
        requires(!std::is_void_v<U>)
    constexpr const U* operator->() const {
        return &value();
    }

    template <typename U = T>
        requires(!std::is_void_v<U>)
    constexpr U* operator->() {
        return &value();
    }

    template <typename U>
        requires(!std::is_void_v<T> && std::convertible_to<U, T>)
    constexpr T value_or(U&& default_value) const {
        if (!has_value()) {
            return static_cast<T>(std::forward<U>(default_value));
        }
        return std::get<0>(data_);
    }

    constexpr const E& error() const {
        ASSERT(has_error(), "error() called on an Expected holding a value");
        return std::get<1>(data_);
    }

    /// Apply ``func`` to the contained value, or propagate the error untouched
    template <typename Func>
        requires(!std::is_void_v<T>)
    constexpr Expected<std::invoke_result_t<Func, const StoredT&>, E> transform(Func&& func) const {
        if (!has_value()) {
            return {unexpected, error()};
        }

        return std::invoke(std::forward<Func>(func), value());
    }

    constexpr bool operator==(const Expected& rhs) const
        requires(std::equality_comparable<StoredT> && std::equality_comparable<E>)
    {
        return data_ == rhs.data_;
    }

    template <typename U>
        requires(!std::is_void_v<T> && !std::same_as<U, Expected> && std::equality_comparable_with<U, StoredT>)
    constexpr bool operator==(const U& rhs) const {
        return has_value() && std::get<0>(data_) == rhs;
    }

    template <typename G>
        requires(!std::same_as<G, Expected> && !std::equality_comparable_with<G, StoredT> &&
                 std::equality_comparable_with<G, E>)
    constexpr bool operator==(const G& rhs) const {
        return has_error() && std::get<1>(data_) == rhs;
    }

private:
    std::variant<StoredT, E> data_;
};

} // namespace grader
