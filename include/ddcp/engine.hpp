// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 ddcp Contributors


/**
 * @file engine.hpp
 * @brief Block copy engine
 */

#ifndef DDCP_ENGINE_HPP
#define DDCP_ENGINE_HPP

#include <ddcp/fwd.hpp>
#include <ddcp/buffer.hpp>
#include <ddcp/options.hpp>
#include <ddcp/state.hpp>

#include <chrono>
#include <cstdint>
#include <optional>

namespace ddcp {

/// Minimum time between two progress lines
inline constexpr std::chrono::milliseconds PROGRESS_INTERVAL{1000};

/// Outcome of a copy run that did not fail
struct TransferResult {
    enum class Outcome {
        Completed,   ///< Planned total reached, or unbounded source exhausted
        EndOfStream, ///< Source ran dry before the planned total
        Interrupted  ///< SIGINT/SIGTERM observed
    };

    TransferState state;
    Outcome outcome = Outcome::Completed;
};

/// Return a short name for the given outcome
[[nodiscard]] const char *outcome_name(TransferResult::Outcome outcome) noexcept;

/**
 * Block copy engine
 *
 * Runs Seeking (only with a seek offset), then Copying until the planned
 * total is reached or the source ends, then Done. Each iteration reads
 * min(block_size, remaining) bytes and writes exactly what was read.
 * Progress is emitted when more than PROGRESS_INTERVAL has passed since
 * the previous line. Read, write and seek errors propagate as Error.
 *
 * Example:
 * @code
 * ddcp::TransferConfig config(ddcp::Options().source("in").dest("out"));
 * ddcp::FdSource source(config.source_path());
 * ddcp::FdSink sink(config.dest_path());
 * auto info = ddcp::probe_source(source.fd());
 * auto total = ddcp::plan_transfer(config, info.kind, info.size_bytes);
 *
 * ddcp::ProgressReporter reporter;
 * ddcp::CopyEngine engine(config, reporter);
 * auto result = engine.run(total, source, sink);
 * reporter.emit_final(result.state.bytes_written(), result.state.elapsed_seconds());
 * @endcode
 */
class CopyEngine {
  public:
    enum class Phase { Idle, Seeking, Copying, Done };

    /**
     * @param config Transfer configuration (must outlive the engine)
     * @param reporter Progress sink (must outlive the engine)
     */
    CopyEngine(const TransferConfig &config, const ProgressReporter &reporter) noexcept
        : config_(config), reporter_(reporter) {}

    CopyEngine(const CopyEngine &) = delete;
    CopyEngine &operator=(const CopyEngine &) = delete;

    /**
     * Run the copy loop
     *
     * May be called more than once. Each call starts from zeroed counters
     * and a fresh start time; the previous run's state is discarded. The
     * block buffer is reallocated only when its size changes.
     *
     * @param total_bytes Planned total, nullopt to copy until end of stream
     * @param source Stream to read from
     * @param sink Stream to write to
     * @return Final state and how the loop ended
     * @throws Error (IOError) on read, write or seek failure; the
     *         destination keeps whatever was written before the failure
     */
    TransferResult run(std::optional<uint64_t> total_bytes, Source &source, Sink &sink);

    /// Current counters (valid during and after run())
    [[nodiscard]] const TransferState &state() const noexcept { return state_; }

    [[nodiscard]] Phase phase() const noexcept { return phase_; }

  private:
    [[nodiscard]] uint64_t next_block_size(std::optional<uint64_t> total_bytes) const noexcept;
    [[nodiscard]] bool write_block(Sink &sink, size_t len);
    void maybe_report(std::optional<uint64_t> total_bytes);
    TransferResult finish(TransferResult::Outcome outcome);

    const TransferConfig &config_;
    const ProgressReporter &reporter_;
    TransferState state_;
    Buffer buffer_;
    Phase phase_ = Phase::Idle;
};

} // namespace ddcp

#endif // DDCP_ENGINE_HPP
