#pragma once

#include <cmath>
#include <concepts>
#include <cstddef>
#include <memory>
#include <ranges>
#include <string>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <utility>

namespace RD {

namespace detail {

template <typename T>
struct IsSmartPointer : std::false_type {};
template <typename T>
struct IsSmartPointer<std::shared_ptr<T>> : std::true_type {};
template <typename T, typename D>
struct IsSmartPointer<std::unique_ptr<T, D>> : std::true_type {};

template <typename T>
struct IsTupleLike : std::false_type {};
template <typename... Ts>
struct IsTupleLike<std::tuple<Ts...>> : std::true_type {};
template <typename A, typename B>
struct IsTupleLike<std::pair<A, B>> : std::true_type {};

template <typename T>
concept StringLike = std::is_convertible_v<T const&, std::string_view>;

template <typename T>
concept SequenceRange = std::ranges::sized_range<T const> && !StringLike<T>;

} // namespace detail

/*
 * Identity comparison used by Cell::set. Pointers compare by address,
 * floating point follows Object.is (NaN is NaN, +0 is not -0), values with
 * operator== compare by value and anything else is never identical.
 */
template <typename T>
[[nodiscard]] auto sameValue(T const& lhs, T const& rhs) -> bool {
    if constexpr (std::is_floating_point_v<T>) {
        if (std::isnan(lhs) && std::isnan(rhs))
            return true;
        if (lhs == T{0} && rhs == T{0})
            return std::signbit(lhs) == std::signbit(rhs);
        return lhs == rhs;
    } else if constexpr (detail::IsSmartPointer<T>::value) {
        return lhs.get() == rhs.get();
    } else if constexpr (std::is_pointer_v<T>) {
        return lhs == rhs;
    } else if constexpr (std::equality_comparable<T>) {
        return lhs == rhs;
    } else {
        return false;
    }
}

template <typename T>
[[nodiscard]] auto sameValue(std::weak_ptr<T> const& lhs, std::weak_ptr<T> const& rhs) -> bool {
    return !lhs.owner_before(rhs) && !rhs.owner_before(lhs);
}

/*
 * One-level comparison used by the watch binders: sequences compare length
 * and elements with sameValue, tuples compare members with sameValue.
 */
template <typename T>
[[nodiscard]] auto shallowEqual(T const& lhs, T const& rhs) -> bool {
    if constexpr (detail::IsTupleLike<T>::value) {
        return std::apply(
            [&rhs](auto const&... left) {
                return std::apply(
                    [&](auto const&... right) { return (sameValue(left, right) && ...); },
                    rhs);
            },
            lhs);
    } else if constexpr (detail::SequenceRange<T>) {
        if (std::ranges::size(lhs) != std::ranges::size(rhs))
            return false;
        auto r = std::ranges::begin(rhs);
        for (auto const& item : lhs) {
            if (!sameValue(item, *r))
                return false;
            ++r;
        }
        return true;
    } else {
        return sameValue(lhs, rhs);
    }
}

} // namespace RD
