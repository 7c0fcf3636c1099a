// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 ddcp Contributors


/**
 * @file state.hpp
 * @brief Transfer state for ddcp
 */

#ifndef DDCP_STATE_HPP
#define DDCP_STATE_HPP

#include <ddcp/fwd.hpp>

#include <chrono>
#include <cstdint>

namespace ddcp {

/**
 * Counters of a running transfer
 *
 * CopyEngine is the only writer. Everyone else gets read-only access.
 */
class TransferState {
  public:
    using Clock = std::chrono::steady_clock;

    /**
     * Get bytes written to the destination so far
     * @return Bytes actually written (not requested)
     */
    [[nodiscard]] uint64_t bytes_written() const noexcept { return bytes_written_; }

    /**
     * Get number of reads that returned data
     * @return Block reads performed
     */
    [[nodiscard]] uint64_t blocks_read() const noexcept { return blocks_read_; }

    /**
     * Get number of reads that returned less than requested
     * @return Short reads observed
     */
    [[nodiscard]] uint64_t short_reads() const noexcept { return short_reads_; }

    /// Time the copy loop started
    [[nodiscard]] Clock::time_point start_time() const noexcept { return start_time_; }

    /// Time of the last progress emission (start_time() before the first)
    [[nodiscard]] Clock::time_point last_report_time() const noexcept { return last_report_time_; }

    /**
     * Get elapsed time since start
     * @param now Reference time point
     * @return Seconds between start_time() and @p now
     */
    [[nodiscard]] double elapsed_seconds(Clock::time_point now) const noexcept {
        return std::chrono::duration<double>(now - start_time_).count();
    }

    /// Elapsed seconds up to now
    [[nodiscard]] double elapsed_seconds() const noexcept { return elapsed_seconds(Clock::now()); }

  private:
    friend class CopyEngine;

    void start(Clock::time_point now) noexcept {
        bytes_written_ = 0;
        blocks_read_ = 0;
        short_reads_ = 0;
        start_time_ = now;
        last_report_time_ = now;
    }

    uint64_t bytes_written_ = 0;
    uint64_t blocks_read_ = 0;
    uint64_t short_reads_ = 0;
    Clock::time_point start_time_{};
    Clock::time_point last_report_time_{};
};

} // namespace ddcp

#endif // DDCP_STATE_HPP
