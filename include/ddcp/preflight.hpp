// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 ddcp Contributors


/**
 * @file preflight.hpp
 * @brief Access checks run before any I/O
 */

#ifndef DDCP_PREFLIGHT_HPP
#define DDCP_PREFLIGHT_HPP

#include <ddcp/fwd.hpp>

#include <string>

namespace ddcp {

/**
 * Parent directory of a path ("." for a bare name, "/" for the root)
 * @param path File path
 * @return Directory that would hold @p path
 */
[[nodiscard]] std::string parent_directory(const std::string &path);

/**
 * Check that the source exists and is readable, and that the destination
 * (or its parent directory, if it does not exist yet) is writable
 *
 * @param config Transfer configuration
 * @throws Error (PermissionDenied) naming the failed path
 */
void check_access(const TransferConfig &config);

} // namespace ddcp

#endif // DDCP_PREFLIGHT_HPP
