// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 ddcp Contributors

#include <ddcp/engine.hpp>

#include <ddcp/error.hpp>
#include <ddcp/interrupt.hpp>
#include <ddcp/log.hpp>
#include <ddcp/progress.hpp>
#include <ddcp/stream.hpp>

#include <algorithm>
#include <cerrno>

namespace ddcp {

const char *outcome_name(TransferResult::Outcome outcome) noexcept {
    switch (outcome) {
    case TransferResult::Outcome::Completed:
        return "completed";
    case TransferResult::Outcome::EndOfStream:
        return "end of stream";
    case TransferResult::Outcome::Interrupted:
        return "interrupted";
    default:
        return "???";
    }
}

TransferResult CopyEngine::run(std::optional<uint64_t> total_bytes, Source &source, Sink &sink) {
    // No larger than the transfer itself; kept across runs of the same size
    uint64_t buf_size = config_.block_size();
    if (total_bytes) buf_size = std::min(buf_size, *total_bytes);
    if (buffer_.size() != buf_size) buffer_ = Buffer(static_cast<size_t>(buf_size));

    if (config_.seek_blocks()) {
        phase_ = Phase::Seeking;
        log_emitf(LogLevel::Debug, "seeking %llu blocks (%llu bytes) on source",
                  static_cast<unsigned long long>(*config_.seek_blocks()),
                  static_cast<unsigned long long>(config_.seek_bytes()));
        source.seek(config_.seek_bytes());
    }

    state_.start(TransferState::Clock::now());

    phase_ = Phase::Copying;
    for (;;) {
        if (interrupt_requested()) return finish(TransferResult::Outcome::Interrupted);

        uint64_t want = next_block_size(total_bytes);
        if (want == 0) return finish(TransferResult::Outcome::Completed);

        size_t got = source.read(buffer_.span(static_cast<size_t>(want)));
        if (got == 0) {
            if (interrupt_requested()) return finish(TransferResult::Outcome::Interrupted);
            if (!total_bytes) return finish(TransferResult::Outcome::Completed);

            log_emitf(LogLevel::Warning, "source ended after %llu of %llu bytes",
                      static_cast<unsigned long long>(state_.bytes_written_),
                      static_cast<unsigned long long>(*total_bytes));
            return finish(TransferResult::Outcome::EndOfStream);
        }

        state_.blocks_read_++;
        if (got < want) state_.short_reads_++;

        if (!write_block(sink, got)) return finish(TransferResult::Outcome::Interrupted);

        maybe_report(total_bytes);
    }
}

uint64_t CopyEngine::next_block_size(std::optional<uint64_t> total_bytes) const noexcept {
    if (!total_bytes) return config_.block_size();
    uint64_t remaining =
        *total_bytes > state_.bytes_written_ ? *total_bytes - state_.bytes_written_ : 0;
    return std::min(config_.block_size(), remaining);
}

// Write len bytes from the buffer, continuing after short writes.
// Returns false if an interrupt cut the write short.
bool CopyEngine::write_block(Sink &sink, size_t len) {
    auto data = buffer_.span(len);
    size_t off = 0;
    while (off < len) {
        size_t n = sink.write(data.subspan(off));
        if (n == 0) {
            if (interrupt_requested()) return false;
            throw Error(ErrorKind::IOError, EIO, "write made no progress");
        }
        off += n;
        state_.bytes_written_ += n;
    }
    return true;
}

void CopyEngine::maybe_report(std::optional<uint64_t> total_bytes) {
    auto now = TransferState::Clock::now();
    if (now - state_.last_report_time_ <= PROGRESS_INTERVAL) return;

    state_.last_report_time_ = now;
    reporter_.emit_progress(state_.bytes_written_, total_bytes, state_.elapsed_seconds(now));
}

TransferResult CopyEngine::finish(TransferResult::Outcome outcome) {
    phase_ = Phase::Done;
    log_emitf(LogLevel::Debug, "copy %s: %llu bytes in %llu blocks (%llu short reads)",
              outcome_name(outcome), static_cast<unsigned long long>(state_.bytes_written_),
              static_cast<unsigned long long>(state_.blocks_read_),
              static_cast<unsigned long long>(state_.short_reads_));
    return TransferResult{state_, outcome};
}

} // namespace ddcp
