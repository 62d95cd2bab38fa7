/*
 * File: element_type.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2026-01-14
 * License: MIT
 */

#pragma once

#include <compare>
#include <concepts>
#include <cstdint>
#include <format>
#include <string>
#include <type_traits>

namespace largecol::layout {

	// Persisted as u16, never renumber.
	enum class element_kind : std::uint16_t {
		undefined = 0,
		boolean = 1,
		i8 = 2,
		u8 = 3,
		i16 = 4,
		u16 = 5,
		i32 = 6,
		u32 = 7,
		i64 = 8,
		u64 = 9,
		fp32 = 10,
		fp64 = 11,
		char32 = 12,
		opaque = 13,
	};

	constexpr const char* element_kind_name(element_kind k) noexcept {
		switch (k) {
		case element_kind::boolean: return "bool";
		case element_kind::i8: return "i8";
		case element_kind::u8: return "u8";
		case element_kind::i16: return "i16";
		case element_kind::u16: return "u16";
		case element_kind::i32: return "i32";
		case element_kind::u32: return "u32";
		case element_kind::i64: return "i64";
		case element_kind::u64: return "u64";
		case element_kind::fp32: return "fp32";
		case element_kind::fp64: return "fp64";
		case element_kind::char32: return "char32";
		case element_kind::opaque: return "opaque";
		case element_kind::undefined: break;
		}
		return "undefined";
	}

	constexpr bool is_known_kind(std::uint16_t raw) noexcept {
		return raw >= static_cast<std::uint16_t>(element_kind::boolean)
			&& raw <= static_cast<std::uint16_t>(element_kind::opaque);
	}

	// One column's element type: what it is and how many bytes it takes.
	// `tag` tells opaque types apart and is 0 for the builtin kinds.
	struct element_descriptor {
		element_kind kind = element_kind::undefined;
		std::uint16_t tag = 0;
		std::uint32_t width = 0;

		friend constexpr bool operator == (const element_descriptor&, const element_descriptor&) = default;

		std::string to_string() const {
			if (kind == element_kind::opaque) {
				return std::format("opaque#{}[{}]", tag, width);
			}
			return element_kind_name(kind);
		}
	};

	// Maps a C++ type to its element_descriptor. Builtin kinds below;
	// user structs opt in by specializing with opaque_element.
	template <typename T>
	struct element_traits;

	template <element_kind Kind, typename T>
	struct builtin_element {
		static constexpr element_kind kind = Kind;
		static constexpr std::uint16_t tag = 0;
	};

	template <typename T, std::uint16_t Tag>
	struct opaque_element {
		static_assert(Tag != 0, "opaque element tag must be non-zero");
		static constexpr element_kind kind = element_kind::opaque;
		static constexpr std::uint16_t tag = Tag;
	};

	template <> struct element_traits<bool> : builtin_element<element_kind::boolean, bool> {};
	template <> struct element_traits<std::int8_t> : builtin_element<element_kind::i8, std::int8_t> {};
	template <> struct element_traits<std::uint8_t> : builtin_element<element_kind::u8, std::uint8_t> {};
	template <> struct element_traits<std::int16_t> : builtin_element<element_kind::i16, std::int16_t> {};
	template <> struct element_traits<std::uint16_t> : builtin_element<element_kind::u16, std::uint16_t> {};
	template <> struct element_traits<std::int32_t> : builtin_element<element_kind::i32, std::int32_t> {};
	template <> struct element_traits<std::uint32_t> : builtin_element<element_kind::u32, std::uint32_t> {};
	template <> struct element_traits<std::int64_t> : builtin_element<element_kind::i64, std::int64_t> {};
	template <> struct element_traits<std::uint64_t> : builtin_element<element_kind::u64, std::uint64_t> {};
	template <> struct element_traits<float> : builtin_element<element_kind::fp32, float> {};
	template <> struct element_traits<double> : builtin_element<element_kind::fp64, double> {};
	template <> struct element_traits<char32_t> : builtin_element<element_kind::char32, char32_t> {};

	// Fixed size, no pointers, bytes are the whole value.
	template <typename T>
	concept BitsType = std::is_trivially_copyable_v<T>
		&& std::is_standard_layout_v<T>
		&& !std::is_pointer_v<T>
		&& !std::is_member_pointer_v<T>
		&& !std::is_reference_v<T>
		&& !std::is_const_v<T>
		&& requires {
			{ element_traits<T>::kind } -> std::convertible_to<element_kind>;
			{ element_traits<T>::tag } -> std::convertible_to<std::uint16_t>;
		};

	template <BitsType T>
	constexpr element_descriptor element_descriptor_of() noexcept {
		return element_descriptor{
			element_traits<T>::kind,
			element_traits<T>::tag,
			static_cast<std::uint32_t>(sizeof(T)),
		};
	}

} // namespace largecol::layout
