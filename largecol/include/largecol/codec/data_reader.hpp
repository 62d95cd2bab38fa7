/*
 * File: data_reader.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2026-01-13
 * License: MIT
 */

#pragma once

#include <optional>
#include <string>

#include "largecol/codec/field_types.hpp"
#include "largecol/codec/serializer.hpp"

namespace largecol::codec {

    using core::byte;
    using core::byte_view;

	// Sequential reader over fields written by data_serializer.
	// Every load checks bounds and the type tag; nullopt means "not what was expected".
	class data_reader {
	public:

		data_reader() = default;
		explicit data_reader(byte_view data) : data_(data) {}

		bool empty() const noexcept { return data_.empty(); }
		std::size_t remaining() const noexcept { return data_.size(); }

		field_type peek_type() const {
			if (data_.size() < sizeof(serialized_field_header)) {
				return field_type::undefined;
			}
			const auto hdr = reinterpret_cast<const serialized_field_header*>(data_.data());
			return static_cast<field_type>(hdr->type.get());
		}

		template <typename T>
		std::optional<T> load() {
			constexpr auto expected = tag_of<T>();
			if (peek_type() != expected) {
				return std::nullopt;
			}
			const auto payload = data_.subspan(sizeof(serialized_field_header));
			if constexpr (byteorder::Word<T>) {
				if (payload.size() < sizeof(T)) {
					return std::nullopt;
				}
				auto [val, used] = serializer<T>::load(payload.data(), payload.size());
				data_ = payload.subspan(used);
				return val;
			}
			else {
				const auto total = prefixed_length(payload);
				if (!total || *total < sizeof(std::uint32_t) + 1
					|| std::to_integer<char>(payload[*total - 1]) != '\0') {
					return std::nullopt;
				}
				auto [val, used] = serializer<T>::load(payload.data(), payload.size());
				data_ = payload.subspan(used);
				return val;
			}
		}

		std::optional<byte_view> load_blob(field_type expected) {
			if (peek_type() != expected) {
				return std::nullopt;
			}
			const auto payload = data_.subspan(sizeof(serialized_field_header));
			const auto total = prefixed_length(payload);
			if (!total) {
				return std::nullopt;
			}
			auto [val, used] = serializer<byte_view>::load(payload.data(), payload.size());
			data_ = payload.subspan(used);
			return val;
		}

		// Raw little-endian word, no header.
		template <byteorder::Word WordT>
		std::optional<WordT> load_word() {
			if (data_.size() < sizeof(WordT)) {
				return std::nullopt;
			}
			auto [val, used] = serializer<WordT>::load(data_.data(), data_.size());
			data_ = data_.subspan(used);
			return val;
		}

	private:

		template <typename T>
		static constexpr field_type tag_of() {
			if constexpr (std::is_same_v<T, std::string>) {
				return field_type::string;
			}
			else if constexpr (std::is_same_v<T, std::uint32_t>) {
				return field_type::ui32;
			}
			else if constexpr (std::is_same_v<T, std::uint64_t>) {
				return field_type::ui64;
			}
			else {
				return field_type::undefined;
			}
		}

		// Length prefix of a string/blob payload, when it is sane.
		static std::optional<std::size_t> prefixed_length(byte_view payload) {
			if (payload.size() < sizeof(std::uint32_t)) {
				return std::nullopt;
			}
			auto [total, shift] = serializer<std::uint32_t>::load(payload.data(), payload.size());
			if (total < shift || total > payload.size()) {
				return std::nullopt;
			}
			return static_cast<std::size_t>(total);
		}

		byte_view data_;
	};

} // namespace largecol::codec
