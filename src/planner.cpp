// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 ddcp Contributors

#include <ddcp/planner.hpp>

#include <ddcp/error.hpp>
#include <ddcp/log.hpp>
#include <ddcp/options.hpp>

#include <cerrno>
#include <string>

#include <sys/stat.h>
#include <unistd.h>

namespace ddcp {

const char *source_kind_name(SourceKind kind) noexcept {
    switch (kind) {
    case SourceKind::RegularFile:
        return "regular file";
    case SourceKind::BlockDevice:
        return "block device";
    case SourceKind::CharacterDevice:
        return "character device";
    case SourceKind::Unsupported:
        return "unsupported";
    default:
        return "???";
    }
}

SourceInfo probe_source(int fd) {
    struct stat st;
    check(fstat(fd, &st) == 0, "cannot stat source");

    SourceInfo info;
    if (S_ISREG(st.st_mode)) {
        info.kind = SourceKind::RegularFile;
        info.size_bytes = static_cast<uint64_t>(st.st_size);
    } else if (S_ISBLK(st.st_mode)) {
        info.kind = SourceKind::BlockDevice;
        off_t end = lseek(fd, 0, SEEK_END);
        check(end >= 0, "cannot determine block device size");
        check(lseek(fd, 0, SEEK_SET) == 0, "cannot rewind block device");
        info.size_bytes = static_cast<uint64_t>(end);
    } else if (S_ISCHR(st.st_mode)) {
        info.kind = SourceKind::CharacterDevice;
    }
    return info;
}

void check_seek(const TransferConfig &config, SourceKind kind) {
    if (!config.seek_blocks()) return;
    if (kind == SourceKind::CharacterDevice || kind == SourceKind::Unsupported) {
        throw Error(ErrorKind::SeekOnUnseekableSource, ESPIPE,
                    std::string("cannot seek on ") + source_kind_name(kind) + " source");
    }
}

std::optional<uint64_t> plan_transfer(const TransferConfig &config, SourceKind kind,
                                      uint64_t source_size) {
    if (config.block_count()) {
        log_emitf(LogLevel::Debug, "planned size from block count: %llu",
                  static_cast<unsigned long long>(*config.total_size()));
        return config.total_size();
    }
    if (config.total_size()) {
        log_emitf(LogLevel::Debug, "planned size from explicit total: %llu",
                  static_cast<unsigned long long>(*config.total_size()));
        return config.total_size();
    }

    switch (kind) {
    case SourceKind::RegularFile:
    case SourceKind::BlockDevice: {
        uint64_t skip = config.seek_bytes();
        uint64_t total = source_size > skip ? source_size - skip : 0;
        log_emitf(LogLevel::Debug, "planned size from %s: %llu (skipping %llu)",
                  source_kind_name(kind), static_cast<unsigned long long>(total),
                  static_cast<unsigned long long>(skip));
        return total;
    }
    case SourceKind::CharacterDevice:
        log_emit(LogLevel::Debug, "character device source: size unknown");
        return std::nullopt;
    case SourceKind::Unsupported:
    default:
        throw Error(ErrorKind::UnsupportedSourceType, ENOTSUP,
                    "source is not a regular file, block device or character device "
                    "(use --ts or --count for pipes)");
    }
}

} // namespace ddcp
