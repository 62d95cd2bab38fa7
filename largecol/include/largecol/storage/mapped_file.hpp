/*
 * File: mapped_file.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2026-01-15
 * License: MIT
 */

#pragma once

#include <cstdint>
#include <filesystem>
#include <format>
#include <span>
#include <utility>

#include <fcntl.h>
#include <sys/mman.h>
#include <sys/stat.h>
#include <unistd.h>

#include "largecol/core/bytes.hpp"
#include "largecol/core/debug.hpp"
#include "largecol/core/errors.hpp"
#include "largecol/layout/element_type.hpp"
#include "largecol/storage/device.hpp"

namespace largecol::storage {

// Read-write shared mapping of the first `size` bytes of a file.
// Owns the descriptor and the mapping; releases both exactly once.
class mapped_file {
public:

    enum class open_mode {
        open_existing,  // file must exist and hold at least `size` bytes
        create,         // create or truncate, then size it to `size` zero bytes
    };

    mapped_file() = default;

    mapped_file(const std::filesystem::path& path, std::size_t size, open_mode mode)
        : path_(path), size_(size) {
        const int flags = (mode == open_mode::create) ? (O_RDWR | O_CREAT | O_TRUNC) : O_RDWR;
        fd_ = ::open(path.c_str(), flags | O_CLOEXEC, 0644);
        if (fd_ < 0) {
            throw io_error("cannot open column file", path, last_errno());
        }

        if (mode == open_mode::create) {
            if (::ftruncate(fd_, static_cast<off_t>(size)) != 0) {
                const auto ec = last_errno();
                release();
                throw io_error("cannot size column file", path, ec);
            }
        }
        else {
            struct stat st {};
            if (::fstat(fd_, &st) != 0) {
                const auto ec = last_errno();
                release();
                throw io_error("cannot stat column file", path, ec);
            }
            if (static_cast<std::uint64_t>(st.st_size) < size) {
                release();
                throw io_error(std::format("column file is short ({} bytes, need {})",
                    static_cast<std::uint64_t>(st.st_size), size), path);
            }
        }

        // mmap refuses empty ranges; an empty column stays unmapped.
        if (size_ != 0) {
            void* addr = ::mmap(nullptr, size_, PROT_READ | PROT_WRITE, MAP_SHARED, fd_, 0);
            if (addr == MAP_FAILED) {
                const auto ec = last_errno();
                release();
                throw io_error("cannot map column file", path, ec);
            }
            data_ = static_cast<core::byte*>(addr);
        }
    }

    mapped_file(mapped_file&& other) noexcept
        : path_(std::move(other.path_))
        , fd_(std::exchange(other.fd_, -1))
        , data_(std::exchange(other.data_, nullptr))
        , size_(std::exchange(other.size_, 0))
    {}

    mapped_file& operator = (mapped_file&& other) noexcept {
        if (this != &other) {
            release();
            path_ = std::move(other.path_);
            fd_ = std::exchange(other.fd_, -1);
            data_ = std::exchange(other.data_, nullptr);
            size_ = std::exchange(other.size_, 0);
        }
        return *this;
    }

    mapped_file(const mapped_file&) = delete;
    mapped_file& operator = (const mapped_file&) = delete;

    ~mapped_file() {
        release();
    }

    bool is_open() const noexcept {
        return fd_ >= 0;
    }

    std::size_t size() const noexcept {
        return size_;
    }

    const std::filesystem::path& path() const noexcept {
        return path_;
    }

    core::byte* data() noexcept {
        return data_;
    }

    const core::byte* data() const noexcept {
        return data_;
    }

    // Blocks until dirty pages reach the file.
    void sync() {
        if (data_ == nullptr) {
            return;
        }
        if (::msync(data_, size_, MS_SYNC) != 0) {
            throw io_error("cannot sync column file", path_, last_errno());
        }
    }

    void close() noexcept {
        release();
    }

private:

    void release() noexcept {
        if (data_ != nullptr) {
            ::munmap(data_, size_);
            data_ = nullptr;
        }
        if (fd_ >= 0) {
            ::close(fd_);
            fd_ = -1;
        }
    }

    std::filesystem::path path_{};
    int fd_ = -1;
    core::byte* data_ = nullptr;
    std::size_t size_ = 0;
};

static_assert(MappedRegion<mapped_file>);

// Dense array of T backed by a mapped_file. Positions are 0-based here;
// the column store translates record numbers.
template <layout::BitsType T>
class mapped_array {
public:
    using value_type = T;
    using open_mode = mapped_file::open_mode;

    mapped_array() = default;

    mapped_array(const std::filesystem::path& path, std::size_t count, open_mode mode)
        : file_(path, count * sizeof(T), mode)
        , count_(count)
    {}

    std::size_t size() const noexcept {
        return count_;
    }

    bool is_open() const noexcept {
        return file_.is_open();
    }

    const std::filesystem::path& path() const noexcept {
        return file_.path();
    }

    T get(std::size_t pos) const {
        LARGECOL_ASSERT(pos < count_, "position out of range");
        return core::load_object<T>(file_.data() + pos * sizeof(T));
    }

    void set(std::size_t pos, const T& value) {
        LARGECOL_ASSERT(pos < count_, "position out of range");
        core::store_object(value, file_.data() + pos * sizeof(T));
    }

    // Mappings are page aligned, so the elements are aligned too.
    std::span<T> values() noexcept {
        return { reinterpret_cast<T*>(file_.data()), count_ };
    }

    std::span<const T> values() const noexcept {
        return { reinterpret_cast<const T*>(file_.data()), count_ };
    }

    void sync() {
        file_.sync();
    }

private:
    mapped_file file_{};
    std::size_t count_ = 0;
};

} // namespace largecol::storage
