// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 ddcp Contributors


/**
 * @file stream.hpp
 * @brief Byte stream endpoints for the copy engine
 */

#ifndef DDCP_STREAM_HPP
#define DDCP_STREAM_HPP

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>

namespace ddcp {

/**
 * Byte source
 *
 * read() returns 0 at end of stream, and also when a blocking read was
 * cut short by a pending interrupt request (see interrupt.hpp); callers
 * tell the two apart with interrupt_requested().
 */
class Source {
  public:
    virtual ~Source() = default;

    /**
     * Read up to buf.size() bytes
     * @param buf Destination span
     * @return Bytes read, possibly fewer than requested
     * @throws Error (IOError) on read failure
     */
    virtual size_t read(std::span<std::byte> buf) = 0;

    /**
     * Position the stream at an absolute byte offset
     * @param offset Offset from the start of the source
     * @throws Error (IOError) on seek failure
     */
    virtual void seek(uint64_t offset) = 0;
};

/**
 * Byte sink
 *
 * write() may accept fewer bytes than offered. It returns 0 only when a
 * blocking write was cut short by a pending interrupt request.
 */
class Sink {
  public:
    virtual ~Sink() = default;

    /**
     * Write up to buf.size() bytes
     * @param buf Bytes to write
     * @return Bytes written
     * @throws Error (IOError) on write failure
     */
    virtual size_t write(std::span<const std::byte> buf) = 0;
};

/**
 * Source backed by a file descriptor opened read-only
 *
 * Owns the descriptor. Move-only.
 */
class FdSource : public Source {
  public:
    /**
     * Open a path for reading
     * @param path File or device path
     * @throws Error (IOError) if open fails
     */
    explicit FdSource(const std::string &path);

    FdSource(FdSource &&other) noexcept;
    FdSource &operator=(FdSource &&) = delete;
    FdSource(const FdSource &) = delete;
    FdSource &operator=(const FdSource &) = delete;
    ~FdSource() override;

    size_t read(std::span<std::byte> buf) override;
    void seek(uint64_t offset) override;

    [[nodiscard]] int fd() const noexcept { return fd_; }
    [[nodiscard]] const std::string &path() const noexcept { return path_; }

  private:
    std::string path_;
    int fd_ = -1;
};

/**
 * Sink backed by a file descriptor opened write-only
 *
 * Creates the destination if it does not exist. Regular files are
 * truncated; devices are written in place.
 */
class FdSink : public Sink {
  public:
    /**
     * Open a path for writing
     * @param path File or device path
     * @throws Error (IOError) if open fails
     */
    explicit FdSink(const std::string &path);

    FdSink(FdSink &&other) noexcept;
    FdSink &operator=(FdSink &&) = delete;
    FdSink(const FdSink &) = delete;
    FdSink &operator=(const FdSink &) = delete;

    /// Closes the descriptor if close() was not called; errors are ignored.
    ~FdSink() override;

    size_t write(std::span<const std::byte> buf) override;

    /**
     * Close the descriptor, reporting deferred write errors
     * @throws Error (IOError) if close fails
     */
    void close();

    [[nodiscard]] int fd() const noexcept { return fd_; }
    [[nodiscard]] const std::string &path() const noexcept { return path_; }

  private:
    std::string path_;
    int fd_ = -1;
};

} // namespace ddcp

#endif // DDCP_STREAM_HPP
