// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 ddcp Contributors


/**
 * @file interrupt.hpp
 * @brief SIGINT/SIGTERM handling for the copy loop
 *
 * The signal handler only records the request. The copy loop polls
 * interrupt_requested() before every block, and descriptor streams wait
 * in wait_ready() so a request arriving just before a blocking read or
 * write still wakes it. The loop then finishes with a final summary.
 */

#ifndef DDCP_INTERRUPT_HPP
#define DDCP_INTERRUPT_HPP

#include <ddcp/fwd.hpp>

#include <csignal>

#include <signal.h>

namespace ddcp {

/// True once SIGINT or SIGTERM arrived while an InterruptHandler was installed
[[nodiscard]] bool interrupt_requested() noexcept;

/// Clear a recorded interrupt request
void reset_interrupt() noexcept;

/**
 * Wait until a descriptor is ready or an interrupt is requested
 *
 * SIGINT and SIGTERM stay blocked between the flag check and the wait;
 * ppoll() unblocks them atomically, so a request cannot slip in between.
 *
 * @param fd Descriptor to wait on
 * @param events poll() events (POLLIN or POLLOUT)
 * @return true once @p fd is ready, false if an interrupt is pending
 * @throws Error (IOError) if the signal mask or ppoll() fails
 */
[[nodiscard]] bool wait_ready(int fd, short events);

/**
 * Installs SIGINT and SIGTERM handlers for its lifetime
 *
 * Handlers are installed without SA_RESTART so a blocking read or write
 * returns EINTR instead of resuming. The previous dispositions are
 * restored on destruction. Non-copyable, non-movable.
 *
 * Example:
 * @code
 * ddcp::InterruptHandler interrupt;
 * auto result = engine.run(total, source, sink);
 * if (result.outcome == ddcp::TransferResult::Outcome::Interrupted) {
 *     interrupt.finish(result.state, reporter);
 *     return 0;
 * }
 * @endcode
 */
class InterruptHandler {
  public:
    /**
     * Install handlers and clear any stale request
     * @throws Error (IOError) if sigaction fails
     */
    InterruptHandler();
    ~InterruptHandler();

    InterruptHandler(const InterruptHandler &) = delete;
    InterruptHandler &operator=(const InterruptHandler &) = delete;
    InterruptHandler(InterruptHandler &&) = delete;
    InterruptHandler &operator=(InterruptHandler &&) = delete;

    /// Check for a pending request
    [[nodiscard]] bool requested() const noexcept { return interrupt_requested(); }

    /**
     * Emit the final summary for an interrupted transfer
     *
     * Reads the state as left by the copy loop; never modifies it.
     *
     * @param state Transfer state at the time the loop stopped
     * @param reporter Reporter to emit through
     */
    void finish(const TransferState &state, const ProgressReporter &reporter) const;

  private:
    struct sigaction old_int_ {};
    struct sigaction old_term_ {};
};

} // namespace ddcp

#endif // DDCP_INTERRUPT_HPP
