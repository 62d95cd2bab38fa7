/*
 * File: sink_columns.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2026-01-17
 * License: MIT
 */

#pragma once

#include <array>
#include <cstdint>
#include <filesystem>
#include <format>
#include <tuple>
#include <utility>

#include "largecol/core/bytes.hpp"
#include "largecol/core/debug.hpp"
#include "largecol/core/errors.hpp"
#include "largecol/layout/column_signature.hpp"
#include "largecol/layout/descriptor.hpp"
#include "largecol/layout/paths.hpp"
#include "largecol/storage/append_file.hpp"
#include "largecol/columns/record.hpp"

namespace largecol::columns {

    namespace fs = std::filesystem;

    enum class sink_mode {
        create,     // new dataset in an existing directory, no layout read
        truncate,   // existing layout, discard its records
        append,     // existing layout, continue after its records
    };

    // Writes an a priori unknown number of records, one file per column.
    //
    // The layout file is written only by flush() and close(). A sink that is
    // dropped without either leaves no valid layout for its records, so a
    // layout whose count matches the file sizes means the writer finished.
    // A write error in the middle of a record leaves the columns at different
    // lengths; the sink refuses further work and the dataset is only as good
    // as its last flush.
    template <layout::BitsType... Ts>
    class sink_columns {
        static_assert(sizeof...(Ts) > 0, "sink_columns needs at least one column");

    public:
        using record_type = std::tuple<Ts...>;
        using stream_type = storage::append_file;
        static constexpr std::size_t column_count = sizeof...(Ts);

        explicit sink_columns(fs::path dir, sink_mode mode = sink_mode::create)
            : dir_(std::move(dir))
        {
            if (mode == sink_mode::create) {
                layout::check_dir(dir_);
                open_streams(stream_type::open_mode::truncate);
                return;
            }

            const auto lay = layout::read_layout(dir_, signature());
            if (mode == sink_mode::append) {
                const auto sig = signature();
                for (std::size_t i = 1; i <= column_count; ++i) {
                    layout::check_filesize(dir_, lay.records, i, sig.column(i).width);
                }
                open_streams(stream_type::open_mode::append);
                records_ = lay.records;
            }
            else {
                open_streams(stream_type::open_mode::truncate);
            }
        }

        sink_columns(sink_columns&&) = default;
        sink_columns& operator = (sink_columns&&) = default;
        sink_columns(const sink_columns&) = delete;
        sink_columns& operator = (const sink_columns&) = delete;

        static layout::column_signature signature() {
            return layout::column_signature::of<Ts...>();
        }

        std::uint64_t length() const noexcept { return records_; }

        bool is_open() const noexcept { return !closed_; }

        const fs::path& dir() const noexcept { return dir_; }

        fs::path meta_path(const fs::path& relpath) const {
            return layout::meta_path(dir_, relpath);
        }

        sink_columns& push(const record_type& rec) {
            ensure_writable();
            const auto parts = std::apply([](const Ts&... v) {
                return std::array<core::byte_view, column_count>{ core::object_bytes(v)... };
            }, rec);
            for (std::size_t i = 0; i < column_count; ++i) {
                if (!streams_[i].append(parts[i].data(), parts[i].size())) {
                    failed_ = true;
                    throw io_error(std::format("cannot append record {} to column {}", records_ + 1, i + 1),
                        streams_[i].path(), last_errno());
                }
            }
            ++records_;
            return *this;
        }

        template <typename V>
            requires (RecordLike<V, Ts...> && !std::is_same_v<std::remove_cvref_t<V>, record_type>)
        sink_columns& push(const V& value) {
            return push(convert_record<Ts...>(value));
        }

        // Records the current count in the layout, then pushes buffered bytes to the files.
        void flush() {
            ensure_writable();
            layout::write_layout(dir_, records_, signature());
            for (auto& s : streams_) {
                if (!s.flush()) {
                    failed_ = true;
                    throw io_error("cannot flush column file", s.path(), last_errno());
                }
            }
        }

        void close() {
            if (closed_) {
                return;
            }
            flush();
            for (auto& s : streams_) {
                if (!s.close()) {
                    failed_ = true;
                    throw io_error("cannot close column file", s.path(), last_errno());
                }
            }
            closed_ = true;
        }

    private:

        void open_streams(stream_type::open_mode mode) {
            for (std::size_t i = 0; i < column_count; ++i) {
                const auto fn = layout::binary_filename(dir_, i + 1);
                streams_[i] = stream_type(fn, mode);
                if (!streams_[i].is_open()) {
                    throw io_error("cannot open column file", fn, last_errno());
                }
            }
        }

        void ensure_writable() const {
            if (closed_) {
                throw io_error("sink is closed", dir_);
            }
            if (failed_) {
                throw consistency_error(std::format(
                    "sink for {} failed during a write; columns may differ in length", dir_.string()));
            }
        }

    PRIVATE_TESTABLE:
        fs::path dir_{};
        std::array<stream_type, column_count> streams_{};
        std::uint64_t records_ = 0;
        bool closed_ = false;
        bool failed_ = false;
    };

} // namespace largecol::columns
