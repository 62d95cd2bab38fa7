/*
 * File: byteorder.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2026-01-12
 * License: MIT
 */

#pragma once

#include <bit>
#include <cstring>
#include <limits>
#include <type_traits>

#include "largecol/core/bytes.hpp"

namespace largecol::core::byteorder {

	template <typename T>
	concept SignedWord = std::is_signed_v<T> && std::is_integral_v<T> &&
		((sizeof(T) == 2) || (sizeof(T) == 4) || (sizeof(T) == 8));

	template <typename T>
	concept UnsignedWord = std::is_unsigned_v<T> && std::is_integral_v<T> &&
		((sizeof(T) == 2) || (sizeof(T) == 4) || (sizeof(T) == 8));

	template <typename T>
	concept Word = SignedWord<T> || UnsignedWord<T>;

	// Descriptor fields are always little-endian, whatever the host is.
	template <UnsignedWord WordT>
	constexpr inline WordT le_to_native_unsigned(const core::byte* mem) {
		if constexpr (std::endian::native != std::endian::little) {
			WordT result = 0;
			for (std::size_t i = 0; i < sizeof(WordT); ++i) {
				result |= static_cast<WordT>(static_cast<WordT>(mem[i]) << (8 * i));
			}
			return result;
		}
		else {
			WordT result;
			std::memcpy(&result, mem, sizeof(WordT));
			return result;
		}
	}

	template <UnsignedWord WordT>
	constexpr inline void native_to_le_unsigned(WordT val, core::byte* mem) {
		if constexpr (std::endian::native != std::endian::little) {
			for (std::size_t i = 0; i < sizeof(WordT); ++i) {
				mem[i] = static_cast<core::byte>((val >> (8 * i)) & 0xFF);
			}
		}
		else {
			std::memcpy(mem, &val, sizeof(WordT));
		}
	}

	template <Word WordT> 
	constexpr inline WordT le_to_native(const core::byte* mem) {
		if constexpr (std::is_unsigned_v<WordT>) {
			return le_to_native_unsigned<WordT>(mem);
		}
		else {
			using unsigned_type = std::make_unsigned_t<WordT>;
			return std::bit_cast<WordT>(le_to_native_unsigned<unsigned_type>(mem));
		}
	}

	template <Word WordT>
	constexpr inline void native_to_le(WordT val, core::byte* mem) {
		if constexpr (std::is_unsigned_v<WordT>) {
			native_to_le_unsigned<WordT>(val, mem);
		}
		else {
			using unsigned_type = std::make_unsigned_t<WordT>;
			native_to_le_unsigned<unsigned_type>(std::bit_cast<unsigned_type>(val), mem);
		}
	}

	template <typename WordT = std::uint32_t>
	class word_le {
	public:

		using word_type = WordT;

		word_le() = default;
		word_le(word_type val) {
			from_native(val);
		}
		word_le(word_le&&) = default;
		word_le& operator = (word_le&&) = default;
		word_le(const word_le&) = default;
		word_le& operator = (const word_le&) = default;

		operator word_type() const {
			return to_native();
		}

		word_le& operator = (word_type val) {
			from_native(val);
			return *this;
		}

		word_type get() const {
			return to_native();
		}

	private:

		constexpr word_type to_native() const {
			return byteorder::le_to_native<word_type>(&bytes_[0]);
		}

		constexpr void from_native(word_type val) {
			byteorder::native_to_le<word_type>(val, &bytes_[0]);
		}

		core::byte bytes_[sizeof(word_type)];
	};

} // namespace largecol::core::byteorder
