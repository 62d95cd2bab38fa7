/*
 * File: field_types.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2026-01-13
 * License: MIT
 */

#pragma once

#include "largecol/core/types.hpp"
#include "largecol/core/byteorder.hpp"

namespace largecol::codec {

    using core::byte;
    using core::byte_view;
    using core::byte_span;
    using core::word_u16;

	enum class field_type : word_u16::word_type {
		undefined = 0,
		string = 2,
		ui32 = 4,
		ui64 = 6,
		blob = 9,
		signature = 11,
	};

	// Words are byte arrays, so the header has no padding.
	struct serialized_field_header {
		using word_type = word_u16::word_type;
		word_u16 type = {0}; // field_type
		word_u16 reserved = {0};
		core::byte* data() { return reinterpret_cast<core::byte*>(this) + header_size(); }
		const core::byte* data() const { return reinterpret_cast<const core::byte*>(this) + header_size(); }
		static constexpr std::size_t header_size() noexcept { return sizeof(serialized_field_header); }
	};

	static_assert(sizeof(serialized_field_header) == 4);
	static_assert(alignof(serialized_field_header) == 1);

	constexpr const char* field_type_name(field_type t) noexcept {
		switch (t) {
		case field_type::string: return "string";
		case field_type::ui32: return "ui32";
		case field_type::ui64: return "ui64";
		case field_type::blob: return "blob";
		case field_type::signature: return "signature";
		case field_type::undefined: break;
		}
		return "undefined";
	}

} // namespace largecol::codec
