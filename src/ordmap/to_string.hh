#pragma once

#include <concepts>
#include <format>
#include <string>
#include <string_view>
#include <type_traits>

// The text a stored value contributes to ordered_map::concat(separator).
// concat calls to_string unqualified, so types of other namespaces opt in via ADL,
// and om::value brings its own overload (see value.hh).

namespace om
{
// "true" / "false"
[[nodiscard]] std::string to_string(bool b);

// the character itself, not its code
[[nodiscard]] std::string to_string(char c);

// decimal, any width and signedness
template <std::integral T>
    requires(!std::is_same_v<T, bool> && !std::is_same_v<T, char>)
[[nodiscard]] std::string to_string(T i)
{
    return std::format("{}", i);
}

// shortest form that reads back as the same value: 2.0 -> "2", 0.1 -> "0.1"
template <std::floating_point T>
[[nodiscard]] std::string to_string(T f)
{
    return std::format("{}", f);
}

// hex address, used for identity keys and object values
[[nodiscard]] std::string to_string(void const* ptr);

// text is taken verbatim, a null char const* is empty
[[nodiscard]] std::string to_string(char const* s);
[[nodiscard]] std::string to_string(std::string_view s);
} // namespace om
