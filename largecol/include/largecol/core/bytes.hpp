/*
 * File: bytes.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2026-01-12
 * License: MIT
 */
#pragma once

#include <cstdint>
#include <cstring>
#include <vector>
#include <span>
#include <type_traits>

namespace largecol::core {
	
    using byte = std::byte;
	using byte_buffer = std::vector<byte>;
	using byte_view = std::span<const byte>;
	using byte_span = std::span<byte>;

	// Raw host-order bytes of a trivially copyable value.
	template <typename T>
		requires std::is_trivially_copyable_v<T>
	inline byte_view object_bytes(const T& value) noexcept {
		return byte_view(reinterpret_cast<const byte*>(&value), sizeof(T));
	}

	template <typename T>
		requires std::is_trivially_copyable_v<T>
	inline T load_object(const byte* src) noexcept {
		T value;
		std::memcpy(&value, src, sizeof(T));
		return value;
	}

	template <typename T>
		requires std::is_trivially_copyable_v<T>
	inline void store_object(const T& value, byte* dst) noexcept {
		std::memcpy(dst, &value, sizeof(T));
	}

} // namespace largecol::core
