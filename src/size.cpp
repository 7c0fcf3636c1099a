// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 ddcp Contributors

#include <ddcp/size.hpp>

#include <ddcp/error.hpp>

#include <limits>
#include <string>

namespace ddcp {

namespace {

constexpr uint64_t U64_MAX = std::numeric_limits<uint64_t>::max();

// Power of 1024 for a size suffix, or -1 if the character is not one.
int suffix_exponent(char c) {
    switch (c) {
    case 'K':
    case 'k':
        return 1;
    case 'M':
    case 'm':
        return 2;
    case 'G':
    case 'g':
        return 3;
    case 'T':
    case 't':
        return 4;
    case 'P':
    case 'p':
        return 5;
    case 'E':
    case 'e':
        return 6;
    case 'Z':
    case 'z':
        return 7;
    default:
        return -1;
    }
}

// Accumulate decimal digits; false on a non-digit, empty input or overflow.
bool parse_digits(std::string_view digits, uint64_t &out) {
    if (digits.empty()) return false;

    uint64_t val = 0;
    for (char c : digits) {
        if (c < '0' || c > '9') return false;
        uint64_t d = static_cast<uint64_t>(c - '0');
        if (val > (U64_MAX - d) / 10) return false;
        val = val * 10 + d;
    }
    out = val;
    return true;
}

} // namespace

uint64_t parse_size(std::string_view text) {
    std::string_view digits = text;
    int exponent = 0;

    if (!text.empty()) {
        int e = suffix_exponent(text.back());
        if (e > 0) {
            exponent = e;
            digits.remove_suffix(1);
        }
    }

    uint64_t val;
    if (!parse_digits(digits, val)) {
        throw_invalid_size("invalid size '" + std::string(text) + "'");
    }

    for (int i = 0; i < exponent; i++) {
        if (val > U64_MAX / 1024) {
            throw_invalid_size("size '" + std::string(text) + "' exceeds 64-bit range");
        }
        val *= 1024;
    }
    return val;
}

uint64_t parse_count(std::string_view text) {
    uint64_t val;
    if (!parse_digits(text, val)) {
        throw_invalid_size("invalid block count '" + std::string(text) + "'");
    }
    return val;
}

} // namespace ddcp
