// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 ddcp Contributors


/**
 * @file progress.hpp
 * @brief Progress and summary reporting
 */

#ifndef DDCP_PROGRESS_HPP
#define DDCP_PROGRESS_HPP

#include <cstdint>
#include <cstdio>
#include <optional>
#include <string>

namespace ddcp {

/// Bytes with binary prefixes and two decimals ("3.00 MiB", "512.00 B")
[[nodiscard]] std::string format_bytes(double bytes);

/**
 * Elapsed time
 *
 * Under a minute: "12.34 seconds". Otherwise whole units from weeks down
 * to seconds, zero units omitted: "1 hour, 2 mins, 1 sec".
 */
[[nodiscard]] std::string format_duration(double seconds);

/// Throughput as format_bytes() + "/s"; "N/A" when no time has elapsed
[[nodiscard]] std::string format_rate(double bytes, double seconds);

/**
 * Emits progress lines and the final summary
 *
 * The line builders are pure; emission writes one line to the stream
 * and flushes it. A quiet reporter emits nothing.
 */
class ProgressReporter {
  public:
    /**
     * @param out Stream to write lines to (default: stdout)
     * @param quiet Suppress all output
     */
    explicit ProgressReporter(FILE *out = stdout, bool quiet = false) noexcept
        : out_(out), quiet_(quiet) {}

    /**
     * Emit a progress line
     * @param bytes_written Bytes written so far
     * @param total_bytes Planned total, if known
     * @param elapsed Seconds since the copy started
     */
    void emit_progress(uint64_t bytes_written, std::optional<uint64_t> total_bytes,
                       double elapsed) const;

    /**
     * Emit the final summary
     * @param bytes_written Bytes written in total
     * @param elapsed Seconds since the copy started
     */
    void emit_final(uint64_t bytes_written, double elapsed) const;

    [[nodiscard]] static std::string progress_line(uint64_t bytes_written,
                                                   std::optional<uint64_t> total_bytes,
                                                   double elapsed);
    [[nodiscard]] static std::string final_line(uint64_t bytes_written, double elapsed);

    [[nodiscard]] bool quiet() const noexcept { return quiet_; }

  private:
    void emit(const std::string &line) const;

    FILE *out_;
    bool quiet_;
};

} // namespace ddcp

#endif // DDCP_PROGRESS_HPP
