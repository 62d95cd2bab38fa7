/*
 * File: column_signature.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2026-01-14
 * License: MIT
 */

#pragma once

#include <format>
#include <initializer_list>
#include <optional>
#include <string>
#include <vector>

#include "largecol/core/errors.hpp"
#include "largecol/codec/data_reader.hpp"
#include "largecol/codec/data_serializer.hpp"
#include "largecol/layout/element_type.hpp"

namespace largecol::layout {

    // Ordered element types of a dataset, one per column.
    class column_signature {
    public:
        using value_type = element_descriptor;
        using container_type = std::vector<element_descriptor>;
        using const_iterator = container_type::const_iterator;

        column_signature() = default;
        column_signature(std::initializer_list<element_descriptor> columns) : columns_(columns) {}
        explicit column_signature(container_type columns) : columns_(std::move(columns)) {}

        template <BitsType... Ts>
        static column_signature of() {
            return column_signature{ element_descriptor_of<Ts>()... };
        }

        std::size_t size() const noexcept { return columns_.size(); }
        bool empty() const noexcept { return columns_.empty(); }

        // 1-based, like the column files.
        const element_descriptor& column(std::size_t i) const {
            if (i == 0 || i > columns_.size()) {
                throw index_error(std::format("column {} out of range 1..{}", i, columns_.size()));
            }
            return columns_[i - 1];
        }

        const_iterator begin() const noexcept { return columns_.begin(); }
        const_iterator end() const noexcept { return columns_.end(); }

        // Bytes of one record across all columns.
        std::size_t record_width() const noexcept {
            std::size_t total = 0;
            for (const auto& c : columns_) {
                total += c.width;
            }
            return total;
        }

        void validate() const {
            if (columns_.empty()) {
                throw validation_error("column signature needs at least one column");
            }
            for (std::size_t i = 0; i < columns_.size(); ++i) {
                const auto& c = columns_[i];
                if (!is_known_kind(static_cast<std::uint16_t>(c.kind))) {
                    throw validation_error(std::format("column {}: undefined element kind", i + 1));
                }
                if (c.width == 0) {
                    throw validation_error(std::format("column {}: element width is zero", i + 1));
                }
                if ((c.kind == element_kind::opaque) != (c.tag != 0)) {
                    throw validation_error(std::format("column {}: tag {} does not fit kind {}",
                        i + 1, c.tag, element_kind_name(c.kind)));
                }
            }
        }

        std::string to_string() const {
            std::string out = "(";
            for (std::size_t i = 0; i < columns_.size(); ++i) {
                if (i != 0) {
                    out += ", ";
                }
                out += columns_[i].to_string();
            }
            out += ")";
            return out;
        }

        // [count:u32] then [kind:u16][tag:u16][width:u32] per column.
        void encode(codec::data_serializer& ds) const {
            codec::data_serializer inner;
            inner.append_word(static_cast<std::uint32_t>(columns_.size()));
            for (const auto& c : columns_) {
                inner.append_word(static_cast<std::uint16_t>(c.kind));
                inner.append_word(c.tag);
                inner.append_word(c.width);
            }
            ds.store_blob(inner.data(), inner.size(), codec::field_type::signature);
        }

        static std::optional<column_signature> decode(core::byte_view payload) {
            codec::data_reader reader(payload);
            const auto count = reader.load_word<std::uint32_t>();
            if (!count) {
                return std::nullopt;
            }
            container_type columns;
            for (std::uint32_t i = 0; i < *count; ++i) {
                const auto kind = reader.load_word<std::uint16_t>();
                const auto tag = reader.load_word<std::uint16_t>();
                const auto width = reader.load_word<std::uint32_t>();
                if (!kind || !tag || !width || !is_known_kind(*kind)) {
                    return std::nullopt;
                }
                columns.push_back(element_descriptor{ static_cast<element_kind>(*kind), *tag, *width });
            }
            if (!reader.empty()) {
                return std::nullopt;
            }
            return column_signature(std::move(columns));
        }

        friend bool operator == (const column_signature&, const column_signature&) = default;

    private:
        container_type columns_;
    };

} // namespace largecol::layout
