// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 ddcp Contributors


/**
 * @file error.hpp
 * @brief Error exception class for ddcp
 */

#ifndef DDCP_ERROR_HPP
#define DDCP_ERROR_HPP

#include <cerrno>
#include <string>
#include <string_view>
#include <system_error>

namespace ddcp {

/**
 * Error kinds raised by ddcp
 *
 * User interruption is not an error and has no kind here; it is reported
 * through TransferResult::Outcome::Interrupted.
 */
enum class ErrorKind {
    InvalidSize,            ///< Malformed size or count argument, or overflow
    UnsupportedSourceType,  ///< Source is not a regular file, block or char device
    PermissionDenied,       ///< Pre-flight access check failed
    SeekOnUnseekableSource, ///< --seek requested on a character device or pipe
    IOError                 ///< open/read/write/seek failure
};

/// Return a short name for the given error kind
[[nodiscard]] inline const char *error_kind_name(ErrorKind kind) noexcept {
    switch (kind) {
    case ErrorKind::InvalidSize:
        return "invalid size";
    case ErrorKind::UnsupportedSourceType:
        return "unsupported source type";
    case ErrorKind::PermissionDenied:
        return "permission denied";
    case ErrorKind::SeekOnUnseekableSource:
        return "seek on unseekable source";
    case ErrorKind::IOError:
        return "I/O error";
    default:
        return "unknown error";
    }
}

/**
 * Exception class for ddcp errors
 *
 * Inherits from std::system_error so callers can catch either
 * ddcp::Error or std::system_error. The errno value uses
 * std::generic_category; the kind says which stage failed.
 */
class Error : public std::system_error {
  public:
    /**
     * Construct error from kind and errno value
     *
     * @param kind Error kind
     * @param err Error code (positive errno value)
     * @param context Optional context message
     */
    Error(ErrorKind kind, int err, std::string_view context = {})
        : std::system_error(err, std::generic_category(), std::string(context)), kind_(kind) {}

    /**
     * Get the error code
     * @return Positive errno value
     */
    [[nodiscard]] int code() const noexcept { return std::system_error::code().value(); }

    /**
     * Get the error kind
     * @return Stage that failed
     */
    [[nodiscard]] ErrorKind kind() const noexcept { return kind_; }

    // Convenience predicates
    [[nodiscard]] bool is_invalid_size() const noexcept { return kind_ == ErrorKind::InvalidSize; }
    [[nodiscard]] bool is_unsupported_source() const noexcept {
        return kind_ == ErrorKind::UnsupportedSourceType;
    }
    [[nodiscard]] bool is_permission_denied() const noexcept {
        return kind_ == ErrorKind::PermissionDenied;
    }
    [[nodiscard]] bool is_unseekable() const noexcept {
        return kind_ == ErrorKind::SeekOnUnseekableSource;
    }
    [[nodiscard]] bool is_io() const noexcept { return kind_ == ErrorKind::IOError; }

  private:
    ErrorKind kind_;
};

/**
 * Throw an InvalidSize error
 *
 * @param context Error context message
 * @throws Error with EINVAL
 */
[[noreturn]] inline void throw_invalid_size(std::string_view context) {
    throw Error(ErrorKind::InvalidSize, EINVAL, context);
}

/**
 * Throw an IOError from current errno
 *
 * @param context Error context message
 * @throws Error with current errno
 */
[[noreturn]] inline void throw_errno(std::string_view context = {}) {
    throw Error(ErrorKind::IOError, errno, context);
}

/**
 * Throw IOError if condition is false
 *
 * @param condition Condition to check
 * @param context Error context message
 * @throws Error with current errno if condition is false
 */
inline void check(bool condition, std::string_view context = {}) {
    if (!condition) {
        throw_errno(context);
    }
}

} // namespace ddcp

#endif // DDCP_ERROR_HPP
