/*
 * File: errors.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2026-01-12
 * License: MIT
 */

#pragma once

#include <cerrno>
#include <filesystem>
#include <format>
#include <stdexcept>
#include <string>
#include <system_error>

namespace largecol {

    // Base of everything the library throws.
    class error : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };

    // Caller-supplied shape is invalid (empty signature, zero width, length mismatch).
    class validation_error : public error {
    public:
        using error::error;
    };

    // Layout descriptor is not ours or is damaged.
    class format_error : public error {
    public:
        using error::error;
    };

    // On-disk state disagrees with the recorded layout.
    class consistency_error : public error {
    public:
        using error::error;
    };

    class index_error : public error {
    public:
        using error::error;
    };

    class type_mismatch_error : public error {
    public:
        using error::error;
    };

    class conversion_error : public type_mismatch_error {
    public:
        using type_mismatch_error::type_mismatch_error;
    };

    class path_escape_error : public error {
    public:
        using error::error;
    };

    class io_error : public error {
    public:
        io_error(const std::string& what, const std::filesystem::path& path, std::error_code ec = {})
            : error(ec ? std::format("{} '{}': {}", what, path.string(), ec.message())
                       : std::format("{} '{}'", what, path.string()))
            , path_(path)
            , code_(ec)
        {}

        const std::filesystem::path& path() const noexcept {
            return path_;
        }

        std::error_code code() const noexcept {
            return code_;
        }

    private:
        std::filesystem::path path_;
        std::error_code code_;
    };

    // errno of the failed call, as an error_code.
    inline std::error_code last_errno() noexcept {
        return std::error_code(errno, std::generic_category());
    }

} // namespace largecol
