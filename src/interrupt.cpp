// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 ddcp Contributors

#include <ddcp/interrupt.hpp>

#include <ddcp/error.hpp>
#include <ddcp/log.hpp>
#include <ddcp/progress.hpp>
#include <ddcp/state.hpp>

#include <cerrno>

#include <poll.h>
#include <pthread.h>

namespace ddcp {

namespace {

volatile sig_atomic_t g_interrupted = 0;

void interrupt_signal_handler(int /*sig*/) {
    g_interrupted = 1;
}

} // namespace

bool interrupt_requested() noexcept {
    return g_interrupted != 0;
}

void reset_interrupt() noexcept {
    g_interrupted = 0;
}

bool wait_ready(int fd, short events) {
    sigset_t stop;
    sigset_t saved;
    sigemptyset(&stop);
    sigaddset(&stop, SIGINT);
    sigaddset(&stop, SIGTERM);

    int rc = pthread_sigmask(SIG_BLOCK, &stop, &saved);
    if (rc != 0) throw Error(ErrorKind::IOError, rc, "pthread_sigmask");

    bool ready = false;
    int err = 0;
    while (!interrupt_requested()) {
        struct pollfd pfd = {fd, events, 0};
        if (::ppoll(&pfd, 1, nullptr, &saved) >= 0) {
            ready = true;
            break;
        }
        if (errno != EINTR) {
            err = errno;
            break;
        }
    }

    pthread_sigmask(SIG_SETMASK, &saved, nullptr);
    if (err != 0) throw Error(ErrorKind::IOError, err, "ppoll");
    return ready;
}

InterruptHandler::InterruptHandler() {
    reset_interrupt();

    struct sigaction sa = {};
    sa.sa_handler = interrupt_signal_handler;
    sigemptyset(&sa.sa_mask);

    check(sigaction(SIGINT, &sa, &old_int_) == 0, "sigaction(SIGINT)");
    if (sigaction(SIGTERM, &sa, &old_term_) != 0) {
        int err = errno;
        sigaction(SIGINT, &old_int_, nullptr);
        throw Error(ErrorKind::IOError, err, "sigaction(SIGTERM)");
    }
}

InterruptHandler::~InterruptHandler() {
    sigaction(SIGTERM, &old_term_, nullptr);
    sigaction(SIGINT, &old_int_, nullptr);
}

void InterruptHandler::finish(const TransferState &state, const ProgressReporter &reporter) const {
    log_emitf(LogLevel::Notice, "interrupted after %llu bytes",
              static_cast<unsigned long long>(state.bytes_written()));
    reporter.emit_final(state.bytes_written(), state.elapsed_seconds());
}

} // namespace ddcp
