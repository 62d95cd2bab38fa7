/*
 * File: types.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2026-01-12
 * License: MIT
 */

#pragma once

#include "largecol/core/byteorder.hpp"

namespace largecol::core {
	using word_u16 = byteorder::word_le<std::uint16_t>;
} // namespace largecol::core
