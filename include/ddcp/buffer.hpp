// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 ddcp Contributors


/**
 * @file buffer.hpp
 * @brief Block buffer for ddcp
 */

#ifndef DDCP_BUFFER_HPP
#define DDCP_BUFFER_HPP

#include <ddcp/error.hpp>

#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <span>
#include <utility>

namespace ddcp {

/**
 * RAII page-aligned block buffer
 *
 * Frees its memory on destruction. Move-only (cannot be copied).
 *
 * Example:
 * @code
 * ddcp::Buffer buffer(4096);
 * size_t n = source.read(buffer.span());
 * // buffer automatically freed when it goes out of scope
 * @endcode
 */
class Buffer {
  public:
    /// Alignment of every allocation
    static constexpr size_t ALIGNMENT = 4096;

    /**
     * Default constructor - creates empty buffer
     */
    Buffer() noexcept = default;

    /**
     * Allocate a buffer
     * @param size Buffer size in bytes
     * @throws Error (IOError, ENOMEM) if the allocation fails
     */
    explicit Buffer(size_t size) : size_(size) {
        if (size == 0) return;
        int rc = posix_memalign(&ptr_, ALIGNMENT, size);
        if (rc != 0) {
            ptr_ = nullptr;
            size_ = 0;
            throw Error(ErrorKind::IOError, rc, "cannot allocate block buffer");
        }
    }

    /**
     * Move constructor
     */
    Buffer(Buffer &&other) noexcept : ptr_(other.ptr_), size_(other.size_) {
        other.ptr_ = nullptr;
        other.size_ = 0;
    }

    /**
     * Move assignment
     */
    Buffer &operator=(Buffer &&other) noexcept {
        if (this != &other) {
            free(ptr_);
            ptr_ = other.ptr_;
            size_ = other.size_;
            other.ptr_ = nullptr;
            other.size_ = 0;
        }
        return *this;
    }

    // Non-copyable
    Buffer(const Buffer &) = delete;
    Buffer &operator=(const Buffer &) = delete;

    ~Buffer() { free(ptr_); }

    /**
     * Get buffer data pointer
     * @return Pointer to buffer data
     */
    [[nodiscard]] void *data() noexcept { return ptr_; }

    /**
     * Get buffer data pointer (const)
     * @return Const pointer to buffer data
     */
    [[nodiscard]] const void *data() const noexcept { return ptr_; }

    /**
     * Get buffer size
     * @return Buffer size in bytes
     */
    [[nodiscard]] size_t size() const noexcept { return size_; }

    /**
     * Get the first @p len bytes of the buffer as a span
     * @param len Span length, clamped to the buffer size
     * @return std::span over buffer contents
     */
    [[nodiscard]] std::span<std::byte> span(size_t len) noexcept {
        return {static_cast<std::byte *>(ptr_), len < size_ ? len : size_};
    }

    /**
     * Get buffer as span of bytes
     * @return std::span over buffer contents
     */
    [[nodiscard]] std::span<std::byte> span() noexcept { return span(size_); }

  private:
    void *ptr_ = nullptr;
    size_t size_ = 0;
};

} // namespace ddcp

#endif // DDCP_BUFFER_HPP
