/*
 * File: mapped_columns.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2026-01-16
 * License: MIT
 */

#pragma once

#include <algorithm>
#include <cstdint>
#include <filesystem>
#include <format>
#include <iterator>
#include <limits>
#include <ranges>
#include <span>
#include <tuple>
#include <utility>
#include <vector>

#include "largecol/core/errors.hpp"
#include "largecol/layout/column_signature.hpp"
#include "largecol/layout/descriptor.hpp"
#include "largecol/layout/paths.hpp"
#include "largecol/storage/mapped_file.hpp"
#include "largecol/columns/record.hpp"

namespace largecol::columns {

    namespace fs = std::filesystem;

    // Fixed-length, random-access view of a dataset: one read-write mapping
    // per column, records addressed 1..N. Not thread-safe.
    //
    // Creating a store writes the layout first, then the column files. When a
    // column file cannot be created the files made so far stay on disk and
    // the directory should be treated as indeterminate.
    template <layout::BitsType... Ts>
    class mapped_columns {
        static_assert(sizeof...(Ts) > 0, "mapped_columns needs at least one column");

    public:
        using record_type = std::tuple<Ts...>;
        using columns_type = std::tuple<storage::mapped_array<Ts>...>;
        using open_mode = storage::mapped_file::open_mode;
        static constexpr std::size_t column_count = sizeof...(Ts);

        class const_iterator {
        public:
            using iterator_concept = std::forward_iterator_tag;
            using iterator_category = std::input_iterator_tag;
            using value_type = record_type;
            using difference_type = std::ptrdiff_t;
            using reference = record_type;
            using pointer = void;

            const_iterator() = default;
            const_iterator(const mapped_columns* owner, std::uint64_t record)
                : owner_(owner), record_(record) {}

            record_type operator*() const {
                return owner_->get(record_);
            }

            const_iterator& operator++() {
                ++record_;
                return *this;
            }

            const_iterator operator++(int) {
                auto tmp = *this;
                ++record_;
                return tmp;
            }

            friend bool operator == (const const_iterator&, const const_iterator&) = default;

        private:
            const mapped_columns* owner_ = nullptr;
            std::uint64_t record_ = 1;
        };

        // Opens the dataset in dir using its layout file.
        explicit mapped_columns(fs::path dir)
            : dir_(std::move(dir))
        {
            const auto lay = layout::read_layout(dir_, signature());
            columns_ = map_columns(lay.records, open_mode::open_existing);
            records_ = lay.records;
        }

        // Creates (or overwrites) a dataset of n zeroed records in dir.
        mapped_columns(fs::path dir, std::uint64_t n)
            : dir_(std::move(dir))
        {
            layout::write_layout(dir_, n, signature());
            columns_ = map_columns(n, open_mode::create);
            records_ = n;
        }

        // Wraps arrays that are already mapped; they must agree on length.
        mapped_columns(fs::path dir, columns_type columns)
            : dir_(std::move(dir))
            , columns_(std::move(columns))
        {
            records_ = std::get<0>(columns_).size();
            std::size_t column = 0;
            std::apply([&](const auto&... c) {
                (check_column_length(++column, c.size()), ...);
            }, columns_);
        }

        mapped_columns(mapped_columns&&) noexcept = default;
        mapped_columns& operator = (mapped_columns&&) noexcept = default;
        mapped_columns(const mapped_columns&) = delete;
        mapped_columns& operator = (const mapped_columns&) = delete;

        static layout::column_signature signature() {
            return layout::column_signature::of<Ts...>();
        }

        std::uint64_t length() const noexcept { return records_; }
        std::uint64_t size() const noexcept { return records_; }
        bool empty() const noexcept { return records_ == 0; }

        const fs::path& dir() const noexcept { return dir_; }

        fs::path meta_path(const fs::path& relpath) const {
            return layout::meta_path(dir_, relpath);
        }

        record_type get(std::uint64_t i) const {
            check_index(i);
            return read_record(static_cast<std::size_t>(i - 1));
        }

        std::vector<record_type> get(record_range range) const {
            check_range(range);
            std::vector<record_type> result;
            result.reserve(static_cast<std::size_t>(range.size()));
            for (auto i = range.first; i <= range.last; ++i) {
                result.push_back(read_record(static_cast<std::size_t>(i - 1)));
            }
            return result;
        }

        template <typename V>
            requires RecordLike<V, Ts...>
        void set(std::uint64_t i, const V& value) {
            check_index(i);
            write_record(static_cast<std::size_t>(i - 1), convert_record<Ts...>(value));
        }

        // Positional pairing; every value is converted before the first write.
        template <std::ranges::sized_range R>
            requires RecordLike<std::ranges::range_value_t<R>, Ts...>
        void set(record_range range, const R& values) {
            check_range(range);
            const auto count = static_cast<std::uint64_t>(std::ranges::size(values));
            if (count != range.size()) {
                throw validation_error(std::format("range {} holds {} records, got {} values",
                    range.to_string(), range.size(), count));
            }
            std::vector<record_type> converted;
            converted.reserve(static_cast<std::size_t>(count));
            for (const auto& v : values) {
                converted.push_back(convert_record<Ts...>(v));
            }
            auto pos = static_cast<std::size_t>(range.first - 1);
            for (const auto& rec : converted) {
                write_record(pos++, rec);
            }
        }

        // Raw elements of column I (0-based, as std::get).
        template <std::size_t I>
        auto column() noexcept {
            return std::get<I>(columns_).values();
        }

        template <std::size_t I>
        auto column() const noexcept {
            return std::get<I>(columns_).values();
        }

        void sync() {
            std::apply([](auto&... c) { (c.sync(), ...); }, columns_);
        }

        const_iterator begin() const noexcept { return const_iterator(this, 1); }
        const_iterator end() const noexcept { return const_iterator(this, records_ + 1); }

    private:

        columns_type map_columns(std::uint64_t n, open_mode mode) const {
            const auto count = to_count(n);
            return [&]<std::size_t... I>(std::index_sequence<I...>) {
                return columns_type{
                    storage::mapped_array<Ts>(layout::binary_filename(dir_, I + 1), count, mode)...
                };
            }(std::index_sequence_for<Ts...>{});
        }

        // Record count must be addressable for every column.
        static std::size_t to_count(std::uint64_t n) {
            constexpr std::size_t widest = std::max({ sizeof(Ts)... });
            if (n > std::numeric_limits<std::size_t>::max() / widest) {
                throw validation_error(std::format("{} records do not fit in the address space", n));
            }
            return static_cast<std::size_t>(n);
        }

        void check_index(std::uint64_t i) const {
            if (i < 1 || i > records_) {
                throw index_error(std::format("record {} out of range 1..{}", i, records_));
            }
        }

        void check_column_length(std::size_t column, std::size_t length) const {
            if (length != records_) {
                throw validation_error(std::format("column {} has {} elements, column 1 has {}",
                    column, length, records_));
            }
        }

        // {k, k - 1} is a valid empty range for 1 <= k <= N + 1.
        void check_range(const record_range& range) const {
            if (range.first < 1 || range.last + 1 < range.first || range.last > records_) {
                throw index_error(std::format("records {} out of range 1..{}", range.to_string(), records_));
            }
        }

        record_type read_record(std::size_t pos) const {
            return [&]<std::size_t... I>(std::index_sequence<I...>) {
                return record_type{ std::get<I>(columns_).get(pos)... };
            }(std::index_sequence_for<Ts...>{});
        }

        void write_record(std::size_t pos, const record_type& rec) {
            [&]<std::size_t... I>(std::index_sequence<I...>) {
                (std::get<I>(columns_).set(pos, std::get<I>(rec)), ...);
            }(std::index_sequence_for<Ts...>{});
        }

        fs::path dir_{};
        columns_type columns_{};
        std::uint64_t records_ = 0;
    };

} // namespace largecol::columns
