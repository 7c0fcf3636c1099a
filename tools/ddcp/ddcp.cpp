// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 ddcp Contributors

/**
 * @file ddcp.cpp
 * @brief ddcp - dd-like block copy with throughput progress
 *
 * Copies a regular file, block device, character device or pipe to a
 * destination in fixed-size blocks, printing a progress line every second
 * and a summary at the end. SIGINT/SIGTERM stop the copy with a summary
 * and exit status 0.
 *
 * Usage: ddcp [--if FILE] [--of FILE] [--bs SIZE] [--ts SIZE] [--count N] [--seek N]
 */

#include <ddcp.hpp>

#include <cstdio>
#include <cstdlib>
#include <exception>
#include <optional>
#include <string>
#include <string_view>

#include <getopt.h>
#include <sys/stat.h>
#include <unistd.h>

// ============================================================================
// Constants
// ============================================================================

static constexpr int EXIT_USAGE = 2;

// ============================================================================
// Configuration
// ============================================================================

struct CliConfig {
    ddcp::Options options;
    bool quiet = false;
    bool verbose = false;
};

// ============================================================================
// Logging
// ============================================================================

static void install_log_handler(bool verbose) {
    ddcp::LogLevel threshold = verbose ? ddcp::LogLevel::Debug : ddcp::LogLevel::Notice;
    ddcp::set_log_handler([threshold](ddcp::LogLevel level, std::string_view msg) {
        if (static_cast<int>(level) > static_cast<int>(threshold)) return;
        fprintf(stderr, "ddcp: %s: %.*s\n", ddcp::log_level_name(level),
                static_cast<int>(msg.size()), msg.data());
    });
}

// ============================================================================
// CLI parsing
// ============================================================================

static void print_usage(FILE *out, const char *argv0) {
    fprintf(out,
            "Usage: %s [OPTIONS]\n"
            "\n"
            "Copy data in fixed-size blocks with throughput progress.\n"
            "\n"
            "Options:\n"
            "  --if, --input-file FILE    Input file to read from (default: stdin)\n"
            "  --of, --output-file FILE   Output file to write to (default: stdout)\n"
            "  --bs, --block-size SIZE    Block size (default: 4M)\n"
            "  --ts, --total-size SIZE    Total size in bytes (for use with pipes)\n"
            "  --count BLOCKS             Number of blocks to transfer\n"
            "  --seek BLOCKS              Skip BLOCKS blocks of input before reading\n"
            "  -q, --quiet                Suppress progress and summary\n"
            "  -v, --verbose              Show debug messages\n"
            "  -h, --help                 Show this help\n"
            "\n"
            "Sizes:\n"
            "  Sizes for --bs and --ts can either be specified in bytes, or\n"
            "  with suffixes K, M, G, T, P, E, Z (powers of 1024). Ex:\n"
            "      1024    # 1024 bytes\n"
            "      1K      # 1 Kibibyte (1024 bytes)\n"
            "      1M      # 1 Mebibyte (1024 Kibibytes)\n"
            "      1G      # 1 Gibibyte (1024 Mebibytes)\n",
            argv0);
}

// Returns 0 on success, -1 on usage error, 1 when help was printed.
// Malformed sizes and counts throw ddcp::Error.
static int parse_args(int argc, char **argv, CliConfig &cli) {
    enum { OPT_IF = 256, OPT_OF, OPT_BS, OPT_TS, OPT_COUNT, OPT_SEEK };

    static struct option long_opts[] = {{"if", required_argument, nullptr, OPT_IF},
                                        {"input-file", required_argument, nullptr, OPT_IF},
                                        {"of", required_argument, nullptr, OPT_OF},
                                        {"output-file", required_argument, nullptr, OPT_OF},
                                        {"bs", required_argument, nullptr, OPT_BS},
                                        {"block-size", required_argument, nullptr, OPT_BS},
                                        {"ts", required_argument, nullptr, OPT_TS},
                                        {"total-size", required_argument, nullptr, OPT_TS},
                                        {"count", required_argument, nullptr, OPT_COUNT},
                                        {"seek", required_argument, nullptr, OPT_SEEK},
                                        {"quiet", no_argument, nullptr, 'q'},
                                        {"verbose", no_argument, nullptr, 'v'},
                                        {"help", no_argument, nullptr, 'h'},
                                        {nullptr, 0, nullptr, 0}};

    int opt;
    while ((opt = getopt_long(argc, argv, "qvh", long_opts, nullptr)) != -1) {
        switch (opt) {
        case OPT_IF:
            cli.options.source(optarg);
            break;
        case OPT_OF:
            cli.options.dest(optarg);
            break;
        case OPT_BS:
            cli.options.block_size(ddcp::parse_size(optarg));
            break;
        case OPT_TS:
            cli.options.total_size(ddcp::parse_size(optarg));
            break;
        case OPT_COUNT:
            cli.options.block_count(ddcp::parse_count(optarg));
            break;
        case OPT_SEEK:
            cli.options.seek_blocks(ddcp::parse_count(optarg));
            break;
        case 'q':
            cli.quiet = true;
            break;
        case 'v':
            cli.verbose = true;
            break;
        case 'h':
            print_usage(stdout, argv[0]);
            return 1;
        default:
            print_usage(stderr, argv[0]);
            return -1;
        }
    }

    if (optind < argc) {
        fprintf(stderr, "ddcp: unexpected argument '%s'\n", argv[optind]);
        print_usage(stderr, argv[0]);
        return -1;
    }
    return 0;
}

// ============================================================================
// Output helpers
// ============================================================================

// Progress goes to stdout unless stdout is the data stream itself.
static FILE *progress_stream(int dest_fd) {
    struct stat dst_st, out_st;
    if (fstat(dest_fd, &dst_st) == 0 && fstat(STDOUT_FILENO, &out_st) == 0 &&
        dst_st.st_dev == out_st.st_dev && dst_st.st_ino == out_st.st_ino) {
        return stderr;
    }
    return stdout;
}

static std::string describe_total(std::optional<uint64_t> total) {
    if (!total) return "unknown";
    return ddcp::format_bytes(static_cast<double>(*total));
}

// ============================================================================
// Copy
// ============================================================================

static int run_copy(const CliConfig &cli) {
    ddcp::TransferConfig config(cli.options);
    ddcp::check_access(config);

    ddcp::FdSource source(config.source_path());
    ddcp::SourceInfo info = ddcp::probe_source(source.fd());
    ddcp::check_seek(config, info.kind);
    std::optional<uint64_t> total = ddcp::plan_transfer(config, info.kind, info.size_bytes);

    ddcp::FdSink sink(config.dest_path());

    ddcp::log_emitf(ddcp::LogLevel::Info, "%s (%s) -> %s, block size %s, total %s",
                    config.source_path().c_str(), ddcp::source_kind_name(info.kind),
                    config.dest_path().c_str(),
                    ddcp::format_bytes(static_cast<double>(config.block_size())).c_str(),
                    describe_total(total).c_str());

    ddcp::ProgressReporter reporter(progress_stream(sink.fd()), cli.quiet);
    ddcp::InterruptHandler interrupt;
    ddcp::CopyEngine engine(config, reporter);

    ddcp::TransferResult result = engine.run(total, source, sink);
    if (result.outcome == ddcp::TransferResult::Outcome::Interrupted) {
        interrupt.finish(result.state, reporter);
        return 0;
    }

    sink.close();
    reporter.emit_final(result.state.bytes_written(), result.state.elapsed_seconds());
    return 0;
}

// ============================================================================
// Main
// ============================================================================

int main(int argc, char **argv) {
    CliConfig cli;

    try {
        int rc = parse_args(argc, argv, cli);
        if (rc > 0) return 0;
        if (rc < 0) return EXIT_USAGE;

        install_log_handler(cli.verbose);
        return run_copy(cli);
    } catch (const ddcp::Error &e) {
        fprintf(stderr, "ddcp: error: %s (%s)\n", e.what(), ddcp::error_kind_name(e.kind()));
        return EXIT_FAILURE;
    } catch (const std::exception &e) {
        fprintf(stderr, "ddcp: error: %s\n", e.what());
        return EXIT_FAILURE;
    }
}
