// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 ddcp Contributors


/**
 * @file planner.hpp
 * @brief Source classification and transfer size planning
 */

#ifndef DDCP_PLANNER_HPP
#define DDCP_PLANNER_HPP

#include <ddcp/fwd.hpp>

#include <cstdint>
#include <optional>

namespace ddcp {

/**
 * Source kind
 *
 * Decides how the transfer size is derived when it is not given.
 * Pipes, sockets and directories are Unsupported.
 */
enum class SourceKind {
    RegularFile,     ///< Size from st_size
    BlockDevice,     ///< Size by seeking to the end
    CharacterDevice, ///< Unknown size, not seekable
    Unsupported      ///< Needs an explicit size
};

/// Return a short name for the given source kind
[[nodiscard]] const char *source_kind_name(SourceKind kind) noexcept;

/// Result of probing an open source
struct SourceInfo {
    SourceKind kind = SourceKind::Unsupported;
    uint64_t size_bytes = 0; ///< 0 unless RegularFile or BlockDevice
};

/**
 * Classify an open source descriptor
 *
 * Block devices are sized by seeking to the end; the offset is rewound
 * to 0 afterwards.
 *
 * @param fd Open descriptor
 * @return Kind and size
 * @throws Error (IOError) if fstat or lseek fails
 */
[[nodiscard]] SourceInfo probe_source(int fd);

/**
 * Reject a seek the source cannot honor
 *
 * @param config Transfer configuration
 * @param kind Source kind
 * @throws Error (SeekOnUnseekableSource) if a seek is set and the source
 *         is a character device or otherwise unseekable
 */
void check_seek(const TransferConfig &config, SourceKind kind);

/**
 * Determine how many bytes to transfer
 *
 * Precedence: block count, then explicit total size, then the size
 * derived from the source kind. A derived size is reduced by the seek
 * offset (clamped at zero).
 *
 * @param config Transfer configuration
 * @param kind Source kind
 * @param source_size Probed source size in bytes
 * @return Total bytes, or nullopt when unbounded (character device)
 * @throws Error (UnsupportedSourceType) when the size cannot be derived
 */
[[nodiscard]] std::optional<uint64_t> plan_transfer(const TransferConfig &config, SourceKind kind,
                                                    uint64_t source_size);

} // namespace ddcp

#endif // DDCP_PLANNER_HPP
