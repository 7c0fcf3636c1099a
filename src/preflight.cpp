// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 ddcp Contributors

#include <ddcp/preflight.hpp>

#include <ddcp/error.hpp>
#include <ddcp/options.hpp>

#include <cerrno>

#include <unistd.h>

namespace ddcp {

namespace {

[[noreturn]] void deny(const char *what, const std::string &path) {
    int err = errno;
    throw Error(ErrorKind::PermissionDenied, err, std::string(what) + " '" + path + "'");
}

} // namespace

std::string parent_directory(const std::string &path) {
    std::string p(path);
    // Trim trailing slashes
    while (p.size() > 1 && p.back() == '/') p.pop_back();

    auto slash = p.find_last_of('/');
    if (slash == std::string::npos) return ".";
    if (slash == 0) return "/";
    return p.substr(0, slash);
}

void check_access(const TransferConfig &config) {
    const std::string &src = config.source_path();
    if (access(src.c_str(), F_OK) != 0) deny("source does not exist:", src);
    if (access(src.c_str(), R_OK) != 0) deny("source is not readable:", src);

    const std::string &dst = config.dest_path();
    if (access(dst.c_str(), F_OK) == 0) {
        if (access(dst.c_str(), W_OK) != 0) deny("destination is not writable:", dst);
        return;
    }

    std::string dir = parent_directory(dst);
    if (access(dir.c_str(), W_OK) != 0) deny("destination directory is not writable:", dir);
}

} // namespace ddcp
