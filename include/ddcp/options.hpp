// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 ddcp Contributors


/**
 * @file options.hpp
 * @brief Options builder and immutable transfer configuration
 */

#ifndef DDCP_OPTIONS_HPP
#define DDCP_OPTIONS_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <utility>

namespace ddcp {

/// Default block size (4 MiB)
inline constexpr uint64_t DEFAULT_BLOCK_SIZE = 4 * 1024 * 1024;

/// Default source: process standard input
inline constexpr const char *DEFAULT_SOURCE = "/dev/stdin";

/// Default destination: process standard output
inline constexpr const char *DEFAULT_DEST = "/dev/stdout";

/**
 * Transfer options
 *
 * Uses builder pattern for fluent configuration. Values are not
 * validated until a TransferConfig is built from them.
 *
 * Example:
 * @code
 * ddcp::Options opts;
 * opts.source("/dev/sda")
 *     .dest("disk.img")
 *     .block_size(1024 * 1024)
 *     .block_count(16);
 *
 * ddcp::TransferConfig config(opts);
 * @endcode
 */
class Options {
  public:
    /**
     * Set source path
     * @param path Path to read from (default: /dev/stdin)
     * @return Reference to this for chaining
     */
    Options &source(std::string path) {
        source_ = std::move(path);
        return *this;
    }

    /**
     * Set destination path
     * @param path Path to write to (default: /dev/stdout)
     * @return Reference to this for chaining
     */
    Options &dest(std::string path) {
        dest_ = std::move(path);
        return *this;
    }

    /**
     * Set block size
     * @param bytes Bytes per read/write cycle (default: 4 MiB, must be > 0)
     * @return Reference to this for chaining
     */
    Options &block_size(uint64_t bytes) noexcept {
        block_size_ = bytes;
        return *this;
    }

    /**
     * Set explicit total size (for sources whose size cannot be probed)
     * @param bytes Total bytes to transfer
     * @return Reference to this for chaining
     */
    Options &total_size(uint64_t bytes) noexcept {
        total_size_ = bytes;
        return *this;
    }

    /**
     * Set number of blocks to transfer
     * @param blocks Block count; overrides total_size
     * @return Reference to this for chaining
     */
    Options &block_count(uint64_t blocks) noexcept {
        block_count_ = blocks;
        return *this;
    }

    /**
     * Set number of source blocks to skip before reading
     * @param blocks Blocks to skip
     * @return Reference to this for chaining
     */
    Options &seek_blocks(uint64_t blocks) noexcept {
        seek_blocks_ = blocks;
        return *this;
    }

    [[nodiscard]] const std::string &source() const noexcept { return source_; }
    [[nodiscard]] const std::string &dest() const noexcept { return dest_; }
    [[nodiscard]] uint64_t block_size() const noexcept { return block_size_; }
    [[nodiscard]] std::optional<uint64_t> total_size() const noexcept { return total_size_; }
    [[nodiscard]] std::optional<uint64_t> block_count() const noexcept { return block_count_; }
    [[nodiscard]] std::optional<uint64_t> seek_blocks() const noexcept { return seek_blocks_; }

  private:
    std::string source_ = DEFAULT_SOURCE;
    std::string dest_ = DEFAULT_DEST;
    uint64_t block_size_ = DEFAULT_BLOCK_SIZE;
    std::optional<uint64_t> total_size_;
    std::optional<uint64_t> block_count_;
    std::optional<uint64_t> seek_blocks_;
};

/**
 * Validated, immutable transfer configuration
 *
 * When a block count is set, total_size() reports block_size * block_count.
 */
class TransferConfig {
  public:
    /**
     * Build from options
     * @param opts Options to validate
     * @throws Error (InvalidSize) if the block size is zero or
     *         block_size * count / block_size * seek overflows
     */
    explicit TransferConfig(const Options &opts);

    [[nodiscard]] const std::string &source_path() const noexcept { return source_path_; }
    [[nodiscard]] const std::string &dest_path() const noexcept { return dest_path_; }
    [[nodiscard]] uint64_t block_size() const noexcept { return block_size_; }

    /// Explicit total size, from --ts or derived from --count
    [[nodiscard]] std::optional<uint64_t> total_size() const noexcept { return total_size_; }
    [[nodiscard]] std::optional<uint64_t> block_count() const noexcept { return block_count_; }
    [[nodiscard]] std::optional<uint64_t> seek_blocks() const noexcept { return seek_blocks_; }

    /// Byte offset to skip on the source (0 when no seek is set)
    [[nodiscard]] uint64_t seek_bytes() const noexcept {
        return seek_blocks_ ? *seek_blocks_ * block_size_ : 0;
    }

  private:
    std::string source_path_;
    std::string dest_path_;
    uint64_t block_size_;
    std::optional<uint64_t> total_size_;
    std::optional<uint64_t> block_count_;
    std::optional<uint64_t> seek_blocks_;
};

} // namespace ddcp

#endif // DDCP_OPTIONS_HPP
