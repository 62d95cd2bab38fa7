/*
 * File: append_file.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2026-01-15
 * License: MIT
 */

#pragma once
#include <cstdint>
#include <fstream>
#include <filesystem>

#include "largecol/core/bytes.hpp"
#include "largecol/storage/device.hpp"

namespace largecol::storage {

// Buffered append-only binary file (not thread-safe).
class append_file {
public:
    using position_type = storage::position_type;

    enum class open_mode {
        truncate,   // start empty
        append,     // keep existing bytes, write after them
    };

    append_file() = default;

    explicit append_file(const std::filesystem::path& filename,
                         open_mode mode = open_mode::truncate)
        : path_(filename) {
        auto flags = std::ios::out | std::ios::binary;
        flags |= (mode == open_mode::append) ? std::ios::app : std::ios::trunc;
        file_.open(filename, flags);
        if (file_.is_open() && mode == open_mode::append) {
            file_.seekp(0, std::ios::end);
            const auto endp = file_.tellp();
            position_ = (endp >= 0) ? static_cast<position_type>(endp) : 0;
        }
    }

    append_file(append_file&&) = default;
    append_file& operator = (append_file&&) = default;
    append_file(const append_file&) = delete;
    append_file& operator = (const append_file&) = delete;

    bool is_open() const noexcept {
        return file_.is_open();
    }

    const std::filesystem::path& path() const noexcept {
        return path_;
    }

    // Bytes in the file, counting what is still buffered.
    position_type position() const noexcept {
        return position_;
    }

    bool append(const largecol::core::byte* data, std::size_t n) {
        if (!is_open()) {
            return false;
        }
        file_.write(reinterpret_cast<const char*>(data),
                    static_cast<std::streamsize>(n));
        if (!file_) {
            return false;
        }
        position_ += n;
        return true;
    }

    bool flush() {
        if (!is_open()) {
            return false;
        }
        file_.flush();
        return static_cast<bool>(file_);
    }

    bool close() {
        if (!is_open()) {
            return true;
        }
        file_.flush();
        const bool ok = static_cast<bool>(file_);
        file_.close();
        return ok && !file_.fail();
    }

private:
    std::filesystem::path path_{};
    std::ofstream file_{};
    position_type position_{0};
};

static_assert(AppendDevice<append_file>);

} // namespace largecol::storage
