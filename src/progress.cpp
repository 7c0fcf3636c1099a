// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 ddcp Contributors

#include <ddcp/progress.hpp>

#include <array>
#include <cinttypes>
#include <cmath>

namespace ddcp {

namespace {

constexpr std::array<const char *, 7> BYTE_UNITS = {"B", "KiB", "MiB", "GiB", "TiB", "PiB", "EiB"};

struct DurationUnit {
    const char *name;
    uint64_t seconds;
};

// Value as printed with two decimals
double round_centi(double value) {
    return std::round(value * 100.0) / 100.0;
}

constexpr std::array<DurationUnit, 5> DURATION_UNITS = {{
    {"week", 7 * 24 * 3600},
    {"day", 24 * 3600},
    {"hour", 3600},
    {"min", 60},
    {"sec", 1},
}};

} // namespace

// ============================================================================
// Formatting helpers
// ============================================================================

std::string format_bytes(double bytes) {
    size_t unit = 0;
    while (round_centi(bytes) >= 1024.0 && unit + 1 < BYTE_UNITS.size()) {
        bytes /= 1024.0;
        unit++;
    }

    char buf[48];
    snprintf(buf, sizeof(buf), "%.2f %s", bytes, BYTE_UNITS[unit]);
    return buf;
}

std::string format_duration(double seconds) {
    seconds = round_centi(seconds);
    if (seconds < 60.0) {
        char buf[48];
        snprintf(buf, sizeof(buf), "%.2f seconds", seconds);
        return buf;
    }

    auto remaining = static_cast<uint64_t>(seconds);
    std::string out;
    for (const auto &unit : DURATION_UNITS) {
        uint64_t amount = remaining / unit.seconds;
        remaining %= unit.seconds;
        if (amount == 0) continue;

        char buf[48];
        snprintf(buf, sizeof(buf), "%" PRIu64 " %s%s", amount, unit.name, amount == 1 ? "" : "s");
        if (!out.empty()) out += ", ";
        out += buf;
    }
    return out;
}

std::string format_rate(double bytes, double seconds) {
    if (!(seconds > 0.0)) return "N/A";
    return format_bytes(bytes / seconds) + "/s";
}

// ============================================================================
// ProgressReporter
// ============================================================================

std::string ProgressReporter::progress_line(uint64_t bytes_written,
                                            std::optional<uint64_t> total_bytes,
                                            double elapsed) {
    auto done = static_cast<double>(bytes_written);
    std::string line = format_bytes(done);

    if (total_bytes) {
        auto total = static_cast<double>(*total_bytes);
        double pct = (total > 0) ? done / total * 100.0 : 100.0;

        char pct_str[32];
        snprintf(pct_str, sizeof(pct_str), " (%.2f%%)", pct);
        line += " / " + format_bytes(total) + pct_str;
    }

    line += " copied, " + format_duration(elapsed) + ", " + format_rate(done, elapsed);
    return line;
}

std::string ProgressReporter::final_line(uint64_t bytes_written, double elapsed) {
    auto done = static_cast<double>(bytes_written);

    char count_str[32];
    snprintf(count_str, sizeof(count_str), " (%" PRIu64 " bytes)", bytes_written);

    return "Transferred " + format_bytes(done) + count_str + " in " + format_duration(elapsed) +
           ", " + format_rate(done, elapsed);
}

void ProgressReporter::emit_progress(uint64_t bytes_written, std::optional<uint64_t> total_bytes,
                                     double elapsed) const {
    if (quiet_) return;
    emit(progress_line(bytes_written, total_bytes, elapsed));
}

void ProgressReporter::emit_final(uint64_t bytes_written, double elapsed) const {
    if (quiet_) return;
    emit(final_line(bytes_written, elapsed));
}

void ProgressReporter::emit(const std::string &line) const {
    fprintf(out_, "%s\n", line.c_str());
    fflush(out_);
}

} // namespace ddcp
