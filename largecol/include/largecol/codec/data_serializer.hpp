/*
 * File: data_serializer.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2026-01-13
 * License: MIT
 */

#pragma once

#include "largecol/codec/field_types.hpp"
#include "largecol/codec/serializer.hpp"

namespace largecol::codec {

    using core::byte;
    using core::byte_buffer;
    using core::byte_span;
    using core::byte_view;

	// Appends type-tagged fields: [serialized_field_header][payload].
	class data_serializer {
	public:
		template <typename T>
		data_serializer& store(const T& val) {
			const auto sz = serializer<T>::size(val);
			auto hdr = append_header(sz);
			serializer<T>::store(val, hdr->data());

			if constexpr (std::is_same_v<T, std::string>) {
				hdr->type = static_cast<std::uint16_t>(field_type::string);
			}
			else if constexpr (std::is_same_v<T, std::uint32_t>) {
				hdr->type = static_cast<std::uint16_t>(field_type::ui32);
			}
			else if constexpr (std::is_same_v<T, std::uint64_t>) {
				hdr->type = static_cast<std::uint16_t>(field_type::ui64);
			}
			else {
				hdr->type = static_cast<std::uint16_t>(field_type::undefined);
			}
			return *this;
		}

		data_serializer& store_blob(const byte* data, std::size_t len, field_type t) {
			const auto data_view = byte_view(data, len);
			auto hdr = append_header(serializer<byte_view>::size(data_view));
			hdr->type = static_cast<std::uint16_t>(t);
			serializer<byte_view>::store(data_view, hdr->data());
			return *this;
		}

		// Raw bytes, no header.
		data_serializer& append(const byte* data, std::size_t len) {
			const auto old_size = buffer_.size();
			buffer_.resize(old_size + len);
			if (len != 0) {
				std::memcpy(&buffer_[old_size], data, len);
			}
			return *this;
		}

		template <byteorder::Word WordT>
		data_serializer& append_word(WordT val) {
			const auto old_size = buffer_.size();
			buffer_.resize(old_size + sizeof(WordT));
			serializer<WordT>::store(val, &buffer_[old_size]);
			return *this;
		}

		std::size_t size() const {
			return buffer_.size();
		}

		const byte* data() const { return buffer_.data(); }

		byte_view view() const {
			return byte_view(buffer_.data(), buffer_.size());
		}

	private:

		serialized_field_header* append_header(std::size_t payload_size) {
			const auto old_size = buffer_.size();
			buffer_.resize(old_size + payload_size + sizeof(serialized_field_header));
			auto hdr = reinterpret_cast<serialized_field_header*>(buffer_.data() + old_size);
			hdr->reserved = 0;
			return hdr;
		}

		byte_buffer buffer_;
	};

}
