/*
 * File: record.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2026-01-16
 * License: MIT
 */

#pragma once

#include <cstdint>
#include <format>
#include <string>
#include <tuple>
#include <type_traits>
#include <utility>

#include "largecol/core/convert.hpp"
#include "largecol/core/errors.hpp"

namespace largecol::columns {

    // Inclusive, 1-based span of record numbers. {k, k - 1} is empty.
    struct record_range {
        std::uint64_t first = 1;
        std::uint64_t last = 0;

        static constexpr record_range of_length(std::uint64_t first, std::uint64_t count) noexcept {
            return { first, first + count - 1 };
        }

        constexpr std::uint64_t size() const noexcept {
            return (last + 1 >= first) ? (last + 1 - first) : 0;
        }

        constexpr bool empty() const noexcept {
            return size() == 0;
        }

        std::string to_string() const {
            return std::format("{}..{}", first, last);
        }
    };

    template <typename V, std::size_t N>
    concept TupleLike = requires {
        typename std::tuple_size<std::remove_cvref_t<V>>::type;
    } && (std::tuple_size_v<std::remove_cvref_t<V>> == N);

    namespace detail {
        template <typename Record, typename V, typename Seq>
        struct convertible_record : std::false_type {};

        template <typename... Ts, typename V, std::size_t... I>
        struct convertible_record<std::tuple<Ts...>, V, std::index_sequence<I...>>
            : std::bool_constant<(core::ConvertibleElement<Ts, std::tuple_element_t<I, V>> && ...)> {};
    }

    // Anything tuple-shaped whose components convert to Ts... one by one.
    template <typename V, typename... Ts>
    concept RecordLike = TupleLike<V, sizeof...(Ts)>
        && detail::convertible_record<std::tuple<Ts...>, std::remove_cvref_t<V>, std::index_sequence_for<Ts...>>::value;

    // All components are converted before anything is returned, so a failure leaves no partial record.
    template <typename... Ts, typename V>
        requires RecordLike<V, Ts...>
    std::tuple<Ts...> convert_record(const V& value) {
        if constexpr (std::is_same_v<std::remove_cvref_t<V>, std::tuple<Ts...>>) {
            return value;
        }
        else {
            return [&]<std::size_t... I>(std::index_sequence<I...>) {
                return std::tuple<Ts...>{ core::convert_element<Ts>(std::get<I>(value))... };
            }(std::index_sequence_for<Ts...>{});
        }
    }

} // namespace largecol::columns
