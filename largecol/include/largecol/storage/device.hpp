/*
 * File: device.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2026-01-15
 * License: MIT
 */

#pragma once

#include <cstdint>
#include <concepts>
#include "largecol/core/bytes.hpp"

namespace largecol::storage {

    using position_type = std::uint64_t;

    // Sequential writer for one column file.
    template <class D>
    concept AppendDevice = requires(
        D dev,
        const largecol::core::byte* src,
        std::size_t n
    ) {
        { dev.is_open() }  -> std::convertible_to<bool>;

        // Return bool for success/failure
        { dev.append(src, n) } -> std::same_as<bool>;
        { dev.flush() }        -> std::same_as<bool>;
        { dev.close() }        -> std::same_as<bool>;
        { dev.position() }     -> std::convertible_to<position_type>;
    };

    // Fixed-size byte region shared with a file.
    template <class M>
    concept MappedRegion = requires(M m, const M cm) {
        { m.data() }     -> std::convertible_to<largecol::core::byte*>;
        { cm.size() }    -> std::convertible_to<std::size_t>;
        { cm.is_open() } -> std::convertible_to<bool>;
        { m.sync() };
    };

} // namespace largecol::storage
