/*
 * File: convert.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2026-01-14
 * License: MIT
 */

#pragma once

#include <cmath>
#include <concepts>
#include <cstdint>
#include <format>
#include <limits>
#include <type_traits>
#include <utility>

#include "largecol/core/errors.hpp"

namespace largecol::core {

    namespace detail {

        // std::in_range refuses bool and the character types; compare them as plain integers.
        template <typename T>
        struct integer_alias { using type = T; };
        template <>
        struct integer_alias<bool> { using type = std::uint8_t; };
        template <>
        struct integer_alias<char> { using type = std::conditional_t<std::is_signed_v<char>, signed char, unsigned char>; };
        template <>
        struct integer_alias<wchar_t> { using type = std::conditional_t<std::is_signed_v<wchar_t>, std::make_signed_t<wchar_t>, std::make_unsigned_t<wchar_t>>; };
        template <>
        struct integer_alias<char8_t> { using type = unsigned char; };
        template <>
        struct integer_alias<char16_t> { using type = std::uint_least16_t; };
        template <>
        struct integer_alias<char32_t> { using type = std::uint_least32_t; };

        template <typename T>
        using integer_alias_t = typename integer_alias<T>::type;

        template <std::floating_point F>
        F exp2_of(int e) {
            return std::ldexp(F{1}, e);
        }

        template <typename T, std::floating_point F>
        bool float_fits_integer(F value) {
            using I = integer_alias_t<T>;
            if (!std::isfinite(value) || std::trunc(value) != value) {
                return false;
            }
            const F upper = exp2_of<F>(std::numeric_limits<I>::digits);
            const F lower = std::is_signed_v<I> ? -upper : F{0};
            if (!(value >= lower && value < upper)) {
                return false;
            }
            if constexpr (std::is_same_v<T, bool>) {
                return value == F{0} || value == F{1};
            }
            return true;
        }

        // Floating targets round to nearest; finite values beyond the range become infinities.
        template <std::floating_point T, typename U>
        T round_to_float(const U& value) {
            if constexpr (std::is_floating_point_v<U>) {
                if constexpr (std::numeric_limits<T>::max_exponent < std::numeric_limits<U>::max_exponent) {
                    if (std::isfinite(value) && std::fabs(value) > static_cast<U>(std::numeric_limits<T>::max())) {
                        return std::signbit(value) ? -std::numeric_limits<T>::infinity()
                                                   : std::numeric_limits<T>::infinity();
                    }
                }
                return static_cast<T>(value);
            }
            else {
                return static_cast<T>(static_cast<integer_alias_t<U>>(value));
            }
        }

        // Integer, bool and character targets only.
        template <typename T, typename U>
        bool numeric_is_exact(const U& value) {
            using TI = integer_alias_t<T>;
            using UI = integer_alias_t<U>;
            if constexpr (std::is_floating_point_v<U>) {
                return float_fits_integer<T>(value);
            }
            else if constexpr (std::is_same_v<T, bool>) {
                return static_cast<UI>(value) == 0 || static_cast<UI>(value) == 1;
            }
            else {
                return std::in_range<TI>(static_cast<UI>(value));
            }
        }

        template <typename U>
        std::string describe_value(const U& value) {
            if constexpr (std::is_same_v<U, bool>) {
                return value ? "true" : "false";
            }
            else if constexpr (std::is_integral_v<U>) {
                return std::format("{}", static_cast<integer_alias_t<U>>(value));
            }
            else {
                return std::format("{}", value);
            }
        }
    }

    template <typename T, typename U>
    concept ConvertibleElement = std::same_as<std::remove_cvref_t<U>, T>
        || (std::is_arithmetic_v<T> && std::is_arithmetic_v<std::remove_cvref_t<U>>)
        || std::is_constructible_v<T, const U&>;

    // Converts value to T. Integer, bool and character targets must hold the
    // value unchanged; floating targets take the nearest representable value.
    template <typename T, typename U>
        requires ConvertibleElement<T, U>
    T convert_element(const U& value) {
        using source_type = std::remove_cvref_t<U>;
        if constexpr (std::same_as<source_type, T>) {
            return value;
        }
        else if constexpr (std::is_floating_point_v<T> && std::is_arithmetic_v<source_type>) {
            return detail::round_to_float<T>(value);
        }
        else if constexpr (std::is_arithmetic_v<T> && std::is_arithmetic_v<source_type>) {
            if (!detail::numeric_is_exact<T, source_type>(value)) {
                throw conversion_error(std::format("value {} cannot be represented exactly as the column type",
                    detail::describe_value(value)));
            }
            return static_cast<T>(value);
        }
        else {
            return T(value);
        }
    }

} // namespace largecol::core
