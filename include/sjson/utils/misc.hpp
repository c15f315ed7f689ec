#pragma once

#include <concepts>
#include <type_traits>

namespace sjson::utils
{

template <typename T, typename... Ts>
concept any_of = (std::same_as<T, Ts> || ...);

template <typename T, typename... Ts>
concept none_of = (!std::same_as<T, Ts> && ...);

template <typename T>
concept character = any_of<std::remove_cv_t<T>,
                           char,
                           wchar_t,
                           char8_t,
                           char16_t,
                           char32_t>;

template <typename T>
concept integer = std::integral<T> && !character<T>
                  && none_of<std::remove_cv_t<T>, bool>;

template <typename T>
concept signed_integer = integer<T> && std::is_signed_v<T>;

template <typename T>
concept unsigned_integer = integer<T> && !signed_integer<T>;

} // namespace sjson::utils
