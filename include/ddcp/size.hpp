// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 ddcp Contributors


/**
 * @file size.hpp
 * @brief Size and block count parsing
 */

#ifndef DDCP_SIZE_HPP
#define DDCP_SIZE_HPP

#include <cstdint>
#include <string_view>

namespace ddcp {

/**
 * Parse a human-entered size
 *
 * Grammar: `<digits>[K|M|G|T|P|E|Z]`, suffix case-insensitive, each
 * suffix scaling by 1024^n (K=1 .. Z=7). No suffix means bytes.
 *
 * @param text Size string, e.g. "4M" or "1024"
 * @return Size in bytes
 * @throws Error (InvalidSize) on malformed input or 64-bit overflow
 */
[[nodiscard]] uint64_t parse_size(std::string_view text);

/**
 * Parse a plain block count (used by --count and --seek)
 *
 * @param text Decimal digits only
 * @return Parsed count
 * @throws Error (InvalidSize) on malformed input or 64-bit overflow
 */
[[nodiscard]] uint64_t parse_count(std::string_view text);

} // namespace ddcp

#endif // DDCP_SIZE_HPP
