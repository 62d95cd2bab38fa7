/*
 * File: descriptor.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2026-01-15
 * License: MIT
 */

#pragma once

#include <cstdint>
#include <filesystem>
#include <format>
#include <fstream>
#include <iterator>
#include <string>

#include "largecol/core/bytes.hpp"
#include "largecol/core/errors.hpp"
#include "largecol/codec/data_reader.hpp"
#include "largecol/codec/data_serializer.hpp"
#include "largecol/layout/column_signature.hpp"
#include "largecol/layout/paths.hpp"

namespace largecol::layout {

    // Version marker, checked on every read.
    constexpr const char* magic = "LargeCol-0.1";

    struct dataset_layout {
        std::uint64_t records = 0;
        column_signature signature{};

        friend bool operator == (const dataset_layout&, const dataset_layout&) = default;
    };

    // [string magic][ui64 N][signature blob]
    inline core::byte_buffer encode_layout(std::uint64_t n, const column_signature& signature) {
        codec::data_serializer ds;
        ds.store(std::string(magic));
        ds.store(n);
        signature.encode(ds);
        return core::byte_buffer(ds.view().begin(), ds.view().end());
    }

    // `source` only names the origin in error messages.
    inline dataset_layout decode_layout(core::byte_view data, const std::string& source) {
        codec::data_reader reader(data);

        const auto stored_magic = reader.load<std::string>();
        if (!stored_magic) {
            throw format_error(std::format("{}: missing version marker (found {} field)",
                source, codec::field_type_name(reader.peek_type())));
        }
        if (*stored_magic != magic) {
            throw format_error(std::format("{}: version marker '{}' does not match '{}'",
                source, *stored_magic, magic));
        }

        const auto n = reader.load<std::uint64_t>();
        if (!n) {
            throw format_error(std::format("{}: missing record count (found {} field)",
                source, codec::field_type_name(reader.peek_type())));
        }

        const auto sig_payload = reader.load_blob(codec::field_type::signature);
        if (!sig_payload) {
            throw format_error(std::format("{}: missing column signature (found {} field)",
                source, codec::field_type_name(reader.peek_type())));
        }
        auto signature = column_signature::decode(*sig_payload);
        if (!signature) {
            throw format_error(std::format("{}: corrupt column signature", source));
        }
        if (!reader.empty()) {
            throw format_error(std::format("{}: {} trailing bytes", source, reader.remaining()));
        }
        try {
            signature->validate();
        }
        catch (const validation_error& e) {
            throw format_error(std::format("{}: {}", source, e.what()));
        }
        return dataset_layout{ *n, std::move(*signature) };
    }

    // Creates or overwrites the descriptor in dir; also creates dir and dir/meta.
    inline void write_layout(const fs::path& dir, std::uint64_t n, const column_signature& signature) {
        signature.validate();
        ensure_meta_directory(dir);
        const auto path = layout_path(dir);
        const auto bytes = encode_layout(n, signature);

        std::ofstream out(path, std::ios::out | std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            throw io_error("cannot open layout file for writing", path, last_errno());
        }
        out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
        out.flush();
        if (!out) {
            throw io_error("cannot write layout file", path, last_errno());
        }
    }

    inline dataset_layout read_layout(const fs::path& dir) {
        const auto path = layout_path(dir);
        std::ifstream in(path, std::ios::in | std::ios::binary);
        if (!in.is_open()) {
            throw io_error("cannot open layout file", path, last_errno());
        }
        std::string raw{ std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>() };
        if (in.bad()) {
            throw io_error("cannot read layout file", path, last_errno());
        }
        auto result = decode_layout(
            core::byte_view(reinterpret_cast<const core::byte*>(raw.data()), raw.size()),
            path.string());
        ensure_meta_directory(dir);
        return result;
    }

    // As read_layout, and the stored column types must be `expected`.
    inline dataset_layout read_layout(const fs::path& dir, const column_signature& expected) {
        auto result = read_layout(dir);
        if (result.signature != expected) {
            throw type_mismatch_error(std::format("{}: stored columns {} differ from expected {}",
                dir.string(), result.signature.to_string(), expected.to_string()));
        }
        return result;
    }

} // namespace largecol::layout
