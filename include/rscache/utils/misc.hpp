#pragma once

#include <concepts>
#include <type_traits>

namespace rscache::utils
{

template <typename T, typename... Ts>
concept none_of = (!std::same_as<T, Ts> && ...);

template <typename T>
concept integer = std::integral<T>
                  && none_of<std::remove_cv_t<T>,
                             bool,
                             char,
                             wchar_t,
                             char8_t,
                             char16_t,
                             char32_t>;

template <typename T>
constexpr auto div_ceil(T dividend, T divisor) -> T
{
    return dividend / divisor + (dividend % divisor != 0);
}
template <typename T, typename U>
constexpr auto div_ceil(T dividend, U divisor) -> std::common_type_t<T, U>
{
    using common_t = std::common_type_t<T, U>;
    return utils::div_ceil(static_cast<common_t>(dividend),
                           static_cast<common_t>(divisor));
}

} // namespace rscache::utils
