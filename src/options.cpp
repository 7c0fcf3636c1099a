// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 ddcp Contributors

#include <ddcp/options.hpp>

#include <ddcp/error.hpp>

#include <limits>

namespace ddcp {

namespace {

bool mul_overflows(uint64_t a, uint64_t b) {
    return b != 0 && a > std::numeric_limits<uint64_t>::max() / b;
}

} // namespace

TransferConfig::TransferConfig(const Options &opts)
    : source_path_(opts.source()), dest_path_(opts.dest()), block_size_(opts.block_size()),
      total_size_(opts.total_size()), block_count_(opts.block_count()),
      seek_blocks_(opts.seek_blocks()) {
    if (block_size_ == 0) {
        throw_invalid_size("block size must be greater than zero");
    }
    if (source_path_.empty() || dest_path_.empty()) {
        throw Error(ErrorKind::IOError, ENOENT, "empty source or destination path");
    }

    if (block_count_) {
        if (mul_overflows(block_size_, *block_count_)) {
            throw_invalid_size("block size * count exceeds 64-bit range");
        }
        total_size_ = block_size_ * *block_count_;
    }

    if (seek_blocks_ && mul_overflows(block_size_, *seek_blocks_)) {
        throw_invalid_size("block size * seek exceeds 64-bit range");
    }
}

} // namespace ddcp
