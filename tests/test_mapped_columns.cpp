// tests/test_mapped_columns.cpp
#include "tests.hpp"

#include <algorithm>
#include <cstdint>
#include <filesystem>
#include <numeric>
#include <random>
#include <set>
#include <string>
#include <tuple>
#include <utility>
#include <vector>

#include "largecol/core/errors.hpp"
#include "largecol/columns/mapped_columns.hpp"

using namespace largecol;
using namespace largecol::columns;
namespace fs = std::filesystem;

namespace {
    using int_col = mapped_columns<std::int32_t>;
    using id_value = mapped_columns<std::int64_t, double>;
    using id_char = mapped_columns<std::int64_t, char32_t>;
    using id_byte = mapped_columns<std::int64_t, std::uint8_t>;

    std::set<std::string> entries(const fs::path& dir) {
        std::set<std::string> names;
        for (const auto& e : fs::directory_iterator(dir)) {
            names.insert(e.path().filename().string());
        }
        return names;
    }
}

TEST_SUITE("columns/mapped_columns") {

    TEST_CASE("create then reopen by directory") {
        tests::temp_dir tmp("largecol_mc");
        std::mt19937_64 rng{ 0xC011u };
        const std::uint64_t n = rng() % 500 + 1;

        {
            id_value store(tmp.path, n);
            CHECK(store.length() == n);
            CHECK(store.size() == n);
            CHECK_FALSE(store.empty());
            CHECK(store.dir() == tmp.path);
            CHECK(store.get(1) == std::make_tuple(std::int64_t{ 0 }, 0.0));
            CHECK(store.get(n) == std::make_tuple(std::int64_t{ 0 }, 0.0));
        }

        CHECK(fs::file_size(tmp.path / "1.bin") == n * sizeof(std::int64_t));
        CHECK(fs::file_size(tmp.path / "2.bin") == n * sizeof(double));

        id_value reopened(tmp.path);
        CHECK(reopened.length() == n);
        const auto expected = layout::column_signature::of<std::int64_t, double>();
        CHECK(reopened.signature() == expected);
        CHECK(reopened.signature().to_string() == "(i64, fp64)");
    }

    TEST_CASE("permutation sorted in place survives reopen") {
        tests::temp_dir tmp("largecol_mc_perm");
        constexpr std::uint64_t n = 39;

        std::vector<std::int32_t> perm(n);
        std::iota(perm.begin(), perm.end(), 1);
        std::mt19937 rng{ 39u };
        std::shuffle(perm.begin(), perm.end(), rng);

        {
            int_col store(tmp.path, n);
            for (std::uint64_t i = 1; i <= n; ++i) {
                store.set(i, std::make_tuple(perm[i - 1]));
            }
            store.sync();
        }
        {
            int_col store(tmp.path);
            REQUIRE(store.length() == n);
            CHECK(store.get(1) == std::make_tuple(perm[0]));
            std::ranges::sort(store.column<0>());
            store.sync();
        }

        int_col store(tmp.path);
        for (std::uint64_t i = 1; i <= n; ++i) {
            CHECK(store.get(i) == std::make_tuple(static_cast<std::int32_t>(i)));
        }
    }

    TEST_CASE("range set and get on a slice") {
        tests::temp_dir tmp("largecol_mc_range");
        id_char store(tmp.path, 10);

        std::vector<std::tuple<std::int64_t, char32_t>> values;
        for (std::int64_t k = 0; k < 6; ++k) {
            values.emplace_back(k * 100 - 250, static_cast<char32_t>(U'a' + k));
        }

        store.set(record_range{ 3, 8 }, values);
        const auto back = store.get(record_range{ 3, 8 });
        CHECK(back == values);

        CHECK(store.get(2) == std::make_tuple(std::int64_t{ 0 }, char32_t{ 0 }));
        CHECK(store.get(9) == std::make_tuple(std::int64_t{ 0 }, char32_t{ 0 }));
        CHECK(store.get(record_range::of_length(5, 2)).size() == 2);
    }

    TEST_CASE("range bounds") {
        tests::temp_dir tmp("largecol_mc_bounds");
        constexpr std::uint64_t n = 7;
        id_value store(tmp.path, n);

        SUBCASE("empty ranges are fine at both ends") {
            CHECK(store.get(record_range{ 1, 0 }).empty());
            CHECK(store.get(record_range{ n + 1, n }).empty());
            CHECK(store.get(record_range{ 4, 3 }).empty());
        }

        SUBCASE("out of range bounds") {
            CHECK_THROWS_AS(store.get(record_range{ 0, 2 }), index_error);
            CHECK_THROWS_AS(store.get(record_range{ 2, n + 1 }), index_error);
            CHECK_THROWS_AS(store.get(record_range{ 5, 3 }), index_error);
            CHECK_THROWS_AS(store.get(record_range{ n + 2, n + 1 }), index_error);
        }

        SUBCASE("value count must match the range") {
            std::vector<std::tuple<std::int64_t, double>> two{ { 1, 1.0 }, { 2, 2.0 } };
            CHECK_THROWS_AS(store.set(record_range{ 1, 3 }, two), validation_error);
            CHECK(store.get(1) == std::make_tuple(std::int64_t{ 0 }, 0.0));
        }
    }

    TEST_CASE("single record index checks") {
        tests::temp_dir tmp("largecol_mc_index");
        id_value store(tmp.path, 3);

        CHECK_THROWS_AS(store.get(0), index_error);
        CHECK_THROWS_AS(store.get(4), index_error);
        CHECK_THROWS_AS(store.set(0, std::make_tuple(1, 1.0)), index_error);
        CHECK_THROWS_AS(store.set(4, std::make_tuple(1, 1.0)), index_error);

        store.set(3, std::make_tuple(-5, 2.5));
        CHECK(store.get(3) == std::make_tuple(std::int64_t{ -5 }, 2.5));
        store.set(2, std::pair{ 8, 0.25f });
        CHECK(store.get(2) == std::make_tuple(std::int64_t{ 8 }, 0.25));
    }

    TEST_CASE("inexact conversions write nothing") {
        tests::temp_dir tmp("largecol_mc_conv");
        id_byte store(tmp.path, 4);
        store.set(2, std::make_tuple(7, 9));

        CHECK_THROWS_AS(store.set(2, std::make_tuple(10.5, 1)), conversion_error);
        CHECK_THROWS_AS(store.set(2, std::make_tuple(1, -1)), conversion_error);
        CHECK_THROWS_AS(store.set(2, std::make_tuple(1, 256)), type_mismatch_error);
        CHECK(store.get(2) == std::make_tuple(std::int64_t{ 7 }, std::uint8_t{ 9 }));

        std::vector<std::tuple<double, int>> values{ { 1.0, 1 }, { 2.0, 2 }, { 3.5, 3 } };
        CHECK_THROWS_AS(store.set(record_range{ 1, 3 }, values), conversion_error);
        CHECK(store.get(1) == std::make_tuple(std::int64_t{ 0 }, std::uint8_t{ 0 }));
        CHECK(store.get(2) == std::make_tuple(std::int64_t{ 7 }, std::uint8_t{ 9 }));

        values[2] = std::make_tuple(3.0, 3);
        store.set(record_range{ 1, 3 }, values);
        CHECK(store.get(3) == std::make_tuple(std::int64_t{ 3 }, std::uint8_t{ 3 }));
    }

    TEST_CASE("creating in a missing directory makes only the dataset files") {
        tests::temp_dir tmp("largecol_mc_fresh");
        const auto dir = tmp.path / "fresh" / "nested";

        id_value store(dir, 5);
        const std::set<std::string> expected{ "1.bin", "2.bin", "layout.lcol", "meta" };
        CHECK(entries(dir) == expected);
        CHECK(fs::is_directory(dir / "meta"));
        CHECK(fs::is_empty(dir / "meta"));
    }

    TEST_CASE("create over an existing dataset starts from zero") {
        tests::temp_dir tmp("largecol_mc_over");
        {
            int_col store(tmp.path, 10);
            store.set(1, std::make_tuple(42));
        }
        int_col store(tmp.path, 3);
        CHECK(store.length() == 3);
        CHECK(store.get(1) == std::make_tuple(std::int32_t{ 0 }));
        CHECK(fs::file_size(tmp.path / "1.bin") == 3 * sizeof(std::int32_t));
        CHECK(int_col(tmp.path).length() == 3);
    }

    TEST_CASE("reopening with other column types is refused") {
        tests::temp_dir tmp("largecol_mc_types");
        { id_value store(tmp.path, 4); }

        using wrong_width = mapped_columns<std::int32_t, double>;
        using wrong_count = mapped_columns<std::int64_t>;
        using swapped = mapped_columns<double, std::int64_t>;
        CHECK_THROWS_AS(wrong_width(tmp.path), type_mismatch_error);
        CHECK_THROWS_AS(wrong_count(tmp.path), type_mismatch_error);
        CHECK_THROWS_AS(swapped(tmp.path), type_mismatch_error);
        CHECK_NOTHROW(id_value(tmp.path));
    }

    TEST_CASE("missing or short column files") {
        tests::temp_dir tmp("largecol_mc_short");
        { id_value store(tmp.path, 4); }

        SUBCASE("short") {
            fs::resize_file(tmp.path / "2.bin", 3 * sizeof(double));
            CHECK_THROWS_AS(id_value(tmp.path), io_error);
        }
        SUBCASE("missing") {
            fs::remove(tmp.path / "1.bin");
            CHECK_THROWS_AS(id_value(tmp.path), io_error);
        }
        SUBCASE("no layout") {
            fs::remove(tmp.path / "layout.lcol");
            CHECK_THROWS_AS(id_value(tmp.path), io_error);
        }
    }

    TEST_CASE("assembled from mapped arrays") {
        tests::temp_dir tmp("largecol_mc_asm");
        using storage::mapped_array;
        using mode = storage::mapped_file::open_mode;

        SUBCASE("lengths must agree") {
            id_value::columns_type cols{
                mapped_array<std::int64_t>(tmp.path / "1.bin", 4, mode::create),
                mapped_array<double>(tmp.path / "2.bin", 5, mode::create),
            };
            CHECK_THROWS_AS(id_value(tmp.path, std::move(cols)), validation_error);
        }

        SUBCASE("equal lengths give a working store") {
            id_value::columns_type cols{
                mapped_array<std::int64_t>(tmp.path / "1.bin", 4, mode::create),
                mapped_array<double>(tmp.path / "2.bin", 4, mode::create),
            };
            id_value store(tmp.path, std::move(cols));
            CHECK(store.length() == 4);
            store.set(4, std::make_tuple(4, 0.5));
            CHECK(store.get(4) == std::make_tuple(std::int64_t{ 4 }, 0.5));
        }
    }

    TEST_CASE("iteration yields records in order") {
        tests::temp_dir tmp("largecol_mc_iter");
        id_value store(tmp.path, 6);
        for (std::uint64_t i = 1; i <= store.length(); ++i) {
            store.set(i, std::make_tuple(i * 2, static_cast<double>(i) / 4));
        }

        std::uint64_t i = 0;
        for (const auto& rec : store) {
            ++i;
            CHECK(std::get<0>(rec) == static_cast<std::int64_t>(i * 2));
            CHECK(std::get<1>(rec) == static_cast<double>(i) / 4);
        }
        CHECK(i == 6);

        const std::vector<id_value::record_type> all(store.begin(), store.end());
        CHECK(all == store.get(record_range{ 1, 6 }));
    }

    TEST_CASE("meta path resolves under meta") {
        tests::temp_dir tmp("largecol_mc_meta");
        id_value store(tmp.path, 1);

        CHECK(store.meta_path("a/b") == (tmp.path / "meta" / "a" / "b").lexically_normal());
        CHECK(store.meta_path("notes.txt") == layout::meta_path(tmp.path, "notes.txt"));
        CHECK_THROWS_AS(store.meta_path("../layout.lcol"), path_escape_error);
    }

    TEST_CASE("zero records") {
        tests::temp_dir tmp("largecol_mc_zero");
        {
            int_col store(tmp.path, 0);
            CHECK(store.empty());
            CHECK(store.begin() == store.end());
            CHECK(store.get(record_range{ 1, 0 }).empty());
            CHECK_THROWS_AS(store.get(1), index_error);
            CHECK(store.column<0>().empty());
            CHECK_NOTHROW(store.sync());
        }
        CHECK(fs::exists(tmp.path / "1.bin"));
        CHECK(fs::file_size(tmp.path / "1.bin") == 0);
        CHECK(int_col(tmp.path).length() == 0);
    }

    TEST_CASE("move keeps the mappings alive") {
        tests::temp_dir tmp("largecol_mc_move");
        int_col a(tmp.path, 2);
        a.set(2, std::make_tuple(11));

        int_col b(std::move(a));
        CHECK(b.get(2) == std::make_tuple(std::int32_t{ 11 }));
    }
}
