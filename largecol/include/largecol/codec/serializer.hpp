/*
 * File: serializer.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2026-01-13
 * License: MIT
 */

#pragma once

#include <cstdint>
#include <cstring>
#include <string>
#include <tuple>

#include "largecol/core/bytes.hpp"
#include "largecol/core/types.hpp"
#include "largecol/core/byteorder.hpp"

namespace largecol::codec {

	namespace byteorder = core::byteorder;

	template <typename T>
	class serializer;

	template <byteorder::Word WordT>
	struct integer_serializer {

		using value_type = WordT;
		constexpr static std::size_t store(value_type val, core::byte* where) {
			byteorder::native_to_le<value_type>(val, where);
			return sizeof(value_type);
		}

		constexpr static std::tuple<value_type, std::size_t> load(const core::byte* where, std::size_t) {
			const auto val = byteorder::le_to_native<value_type>(where);
			return { val, sizeof(value_type) };
		}

		constexpr static std::size_t size(const value_type&) {
			return sizeof(value_type);
		}
	};

	template <>
	struct serializer<std::uint16_t> : public integer_serializer<std::uint16_t> {};
	template <>
	struct serializer<std::uint32_t> : public integer_serializer<std::uint32_t> {};
	template <>
	struct serializer<std::uint64_t> : public integer_serializer<std::uint64_t> {};

	// [len_with_prefix:u32][bytes...][0]
	template <>
	struct serializer<std::string> {

		using value_type = std::string;

		static std::size_t store(const value_type& val, core::byte* where) {
			const auto total = static_cast<std::uint32_t>(size(val));
			const auto shift = serializer<std::uint32_t>::store(total, where);
			where += shift;
			std::memcpy(where, val.data(), val.size());
			where[val.size()] = core::byte{0};
			return total;
		}

		// Caller guarantees at least the length prefix is readable and that
		// the prefixed length fits in `available`.
		static std::tuple<value_type, std::size_t> load(const core::byte* where, std::size_t available) {
			auto [total, shift] = serializer<std::uint32_t>::load(where, available);
			where += shift;
			value_type val(reinterpret_cast<const char*>(where), total - shift - 1); // exclude null-terminator
			return { val, total };
		}

		static std::size_t size(const value_type& val) {
			return sizeof(std::uint32_t) + val.size() + 1;
		}
	};

	// [len_with_prefix:u32][blob...]
	template <>
	class serializer<core::byte_view> {
		public:
		using value_type = core::byte_view;
		static std::size_t store(const value_type& val, core::byte* where) {
			const auto total = static_cast<std::uint32_t>(size(val));
			const auto shift = serializer<std::uint32_t>::store(total, where);
			where += shift;
			std::memcpy(where, val.data(), val.size());
			return total;
		}
		static std::tuple<value_type, std::size_t> load(const core::byte* where, std::size_t available) {
			auto [total, shift] = serializer<std::uint32_t>::load(where, available);
			value_type val(where + shift, total - shift);
			return { val, total };
		}

		static std::size_t size(const value_type& val) {
			return sizeof(std::uint32_t) + val.size();
		}
	};
}
