// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 ddcp Contributors

#include <ddcp/stream.hpp>

#include <ddcp/error.hpp>
#include <ddcp/interrupt.hpp>

#include <cerrno>
#include <cstdint>
#include <limits>
#include <string>
#include <utility>

#include <fcntl.h>
#include <poll.h>
#include <sys/stat.h>
#include <unistd.h>

namespace ddcp {

namespace {

// Capture errno before the message is built.
[[noreturn]] void fail(const char *what, const std::string &path) {
    int err = errno;
    throw Error(ErrorKind::IOError, err, std::string(what) + " '" + path + "'");
}

} // namespace

// ============================================================================
// FdSource
// ============================================================================

FdSource::FdSource(const std::string &path) : path_(path) {
    fd_ = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd_ < 0) {
        fail("cannot open", path);
    }
}

FdSource::FdSource(FdSource &&other) noexcept : path_(std::move(other.path_)), fd_(other.fd_) {
    other.fd_ = -1;
}

FdSource::~FdSource() {
    if (fd_ >= 0) ::close(fd_);
}

size_t FdSource::read(std::span<std::byte> buf) {
    for (;;) {
        if (!wait_ready(fd_, POLLIN)) return 0;
        ssize_t n = ::read(fd_, buf.data(), buf.size());
        if (n >= 0) return static_cast<size_t>(n);
        if (errno == EINTR) {
            if (interrupt_requested()) return 0;
            continue;
        }
        fail("read error on", path_);
    }
}

void FdSource::seek(uint64_t offset) {
    if (offset > static_cast<uint64_t>(std::numeric_limits<off_t>::max())) {
        throw Error(ErrorKind::IOError, EOVERFLOW, "seek offset too large for '" + path_ + "'");
    }
    if (::lseek(fd_, static_cast<off_t>(offset), SEEK_SET) < 0) fail("cannot seek", path_);
}

// ============================================================================
// FdSink
// ============================================================================

FdSink::FdSink(const std::string &path) : path_(path) {
    int flags = O_WRONLY | O_CREAT | O_CLOEXEC;

    // Truncate regular files only; a device keeps whatever lies past the copy
    struct stat st;
    if (::stat(path.c_str(), &st) != 0 || S_ISREG(st.st_mode)) flags |= O_TRUNC;

    fd_ = ::open(path.c_str(), flags, 0644);
    if (fd_ < 0) {
        fail("cannot create", path);
    }
}

FdSink::FdSink(FdSink &&other) noexcept : path_(std::move(other.path_)), fd_(other.fd_) {
    other.fd_ = -1;
}

FdSink::~FdSink() {
    if (fd_ >= 0) ::close(fd_);
}

size_t FdSink::write(std::span<const std::byte> buf) {
    for (;;) {
        if (!wait_ready(fd_, POLLOUT)) return 0;
        ssize_t n = ::write(fd_, buf.data(), buf.size());
        if (n >= 0) return static_cast<size_t>(n);
        if (errno == EINTR) {
            if (interrupt_requested()) return 0;
            continue;
        }
        fail("write error on", path_);
    }
}

void FdSink::close() {
    if (fd_ < 0) return;
    int fd = fd_;
    fd_ = -1;
    if (::close(fd) != 0) fail("cannot close", path_);
}

} // namespace ddcp
