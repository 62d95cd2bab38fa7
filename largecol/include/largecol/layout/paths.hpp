/*
 * File: paths.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2026-01-14
 * License: MIT
 */

#pragma once

#include <cstdint>
#include <filesystem>
#include <limits>
#include <format>
#include <string>
#include <system_error>

#include "largecol/core/errors.hpp"
#include "largecol/layout/element_type.hpp"

namespace largecol::layout {

    namespace fs = std::filesystem;

    constexpr const char* layout_file_name = "layout.lcol";
    constexpr const char* meta_directory_name = "meta";
    constexpr const char* binary_extension = ".bin";

    // Placeholder for stricter checks (empty directory etc).
    inline void check_dir(const fs::path& dir) {
        std::error_code ec;
        if (!fs::is_directory(dir, ec)) {
            throw io_error("directory does not exist", dir, ec);
        }
    }

    // Creates <dir>/meta (and <dir>) when missing.
    inline void ensure_meta_directory(const fs::path& dir) {
        const auto meta = dir / meta_directory_name;
        std::error_code ec;
        if (fs::is_directory(meta, ec)) {
            return;
        }
        fs::create_directories(meta, ec);
        if (ec) {
            throw io_error("cannot create metadata directory", meta, ec);
        }
    }

    inline fs::path layout_path(const fs::path& dir) {
        check_dir(dir);
        return dir / layout_file_name;
    }

    // Column files are <dir>/<i>.bin, i is 1-based.
    inline fs::path binary_filename(const fs::path& dir, std::size_t i) {
        if (i == 0) {
            throw validation_error("column indices start at 1");
        }
        return dir / (std::to_string(i) + binary_extension);
    }

    inline void check_filesize(const fs::path& dir, std::uint64_t n, std::size_t i, std::size_t width) {
        const auto fn = binary_filename(dir, i);
        std::error_code ec;
        const auto actual = fs::file_size(fn, ec);
        if (ec) {
            throw io_error("cannot stat column file", fn, ec);
        }
        if (width != 0 && n > std::numeric_limits<std::uint64_t>::max() / width) {
            throw consistency_error(std::format(
                "record count {} x {} for {} does not fit in a file size", n, width, fn.string()));
        }
        const auto expected = n * static_cast<std::uint64_t>(width);
        if (actual != expected) {
            throw consistency_error(std::format(
                "inconsistent file size for {} (should be {} x {} == {}, is {})",
                fn.string(), n, width, expected, actual));
        }
    }

    template <BitsType T>
    void check_filesize(const fs::path& dir, std::uint64_t n, std::size_t i) {
        check_filesize(dir, n, i, sizeof(T));
    }

    // Lexically normalized dir/subpath, which must stay inside dir.
    // Works on paths only, nothing has to exist.
    inline fs::path ensure_proper_subpath(const fs::path& dir, const fs::path& subpath) {
        const auto norm_dir = dir.lexically_normal();
        const auto norm_sub = (norm_dir / subpath).lexically_normal();

        auto s = norm_sub.begin();
        for (auto d = norm_dir.begin(); d != norm_dir.end(); ++d) {
            if (d->empty()) {
                continue; // trailing separator
            }
            if (s == norm_sub.end() || *s != *d) {
                throw path_escape_error(std::format("'{}' is not inside '{}'",
                    subpath.string(), dir.string()));
            }
            ++s;
        }
        return norm_sub;
    }

    // Where companion metadata for the dataset in dir lives; see ensure_proper_subpath.
    inline fs::path meta_path(const fs::path& dir, const fs::path& relpath) {
        check_dir(dir);
        return ensure_proper_subpath(dir / meta_directory_name, relpath);
    }

} // namespace largecol::layout
