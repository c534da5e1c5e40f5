#pragma once

#include <array>
#include <charconv>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>

namespace RD {

namespace detail {

template <typename T>
struct IsOptional : std::false_type {};
template <typename T>
struct IsOptional<std::optional<T>> : std::true_type {};

template <typename T>
auto numberToText(T value) -> std::string {
    std::array<char, 64> buffer{};
    auto [end, ec] = std::to_chars(buffer.data(), buffer.data() + buffer.size(), value);
    if (ec != std::errc{})
        return {};
    return std::string(buffer.data(), end);
}

} // namespace detail

/*
 * Text form of a value as it appears in a text node or attribute: strings
 * verbatim, booleans as true/false, numbers in shortest round-trip form,
 * optionals unwrap (empty -> ""). Returns nullopt for types without a text form.
 */
template <typename T>
[[nodiscard]] auto toDisplayString(T const& value) -> std::optional<std::string> {
    using V = std::remove_cvref_t<T>;
    if constexpr (std::is_same_v<V, bool>) {
        return std::string{value ? "true" : "false"};
    } else if constexpr (std::is_same_v<V, char>) {
        return std::string(1, value);
    } else if constexpr (std::is_arithmetic_v<V>) {
        return detail::numberToText(value);
    } else if constexpr (std::is_convertible_v<V const&, std::string_view>) {
        return std::string{std::string_view{value}};
    } else if constexpr (detail::IsOptional<V>::value) {
        if (!value)
            return std::string{};
        return toDisplayString(*value);
    } else {
        return std::nullopt;
    }
}

} // namespace RD
