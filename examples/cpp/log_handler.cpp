/**
 * @file log_handler.cpp
 * @brief Route ddcp library messages through a custom log handler
 *
 * Installs a handler that stamps each message with the wall-clock time
 * and severity, then copies a file with a seek and a short source so the
 * planner and engine have something to say.
 *
 * Build: cmake --build build --target ddcp_example_log_handler
 * Run:   ./build/ddcp_example_log_handler
 */

#include <ddcp.hpp>

#include <chrono>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <string>
#include <unistd.h>

constexpr auto SOURCE_FILE = "/tmp/ddcp_log_example_src.dat";
constexpr auto DEST_FILE = "/tmp/ddcp_log_example_dst.dat";
constexpr size_t FILE_SIZE = 64 * 1024; // 64 KB

int main() {
    std::cout << "ddcp Log Handler Example\n";
    std::cout << "========================\n\n";

    // --- Step 1: Install log handler with lambda -------------------------
    ddcp::set_log_handler([](ddcp::LogLevel level, std::string_view msg) {
        auto now = std::chrono::system_clock::now();
        auto time_t_now = std::chrono::system_clock::to_time_t(now);
        auto ms =
            std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

        std::tm tm{};
        localtime_r(&time_t_now, &tm);

        std::cerr << std::put_time(&tm, "%Y-%m-%d %H:%M:%S") << '.' << std::setfill('0')
                  << std::setw(3) << ms.count() << " [example] " << ddcp::log_level_name(level)
                  << ": " << msg << '\n';
    });

    ddcp::log_emit(ddcp::LogLevel::Info, "log handler installed, creating source file");

    {
        std::ofstream out(SOURCE_FILE, std::ios::binary);
        if (!out) {
            ddcp::log_emit(ddcp::LogLevel::Error, "failed to create source file");
            ddcp::clear_log_handler();
            return 1;
        }
        std::string data(FILE_SIZE, 'A');
        out.write(data.data(), static_cast<std::streamsize>(data.size()));
    }

    try {
        // --- Step 2: Copy, skipping the first 4 blocks -------------------
        // An explicit total larger than what remains makes the engine warn
        // about the early end of stream.
        ddcp::TransferConfig config(ddcp::Options()
                                        .source(SOURCE_FILE)
                                        .dest(DEST_FILE)
                                        .block_size(ddcp::parse_size("4K"))
                                        .seek_blocks(4)
                                        .total_size(FILE_SIZE));
        ddcp::check_access(config);

        ddcp::FdSource source(config.source_path());
        auto info = ddcp::probe_source(source.fd());
        ddcp::check_seek(config, info.kind);
        auto total = ddcp::plan_transfer(config, info.kind, info.size_bytes);

        ddcp::FdSink sink(config.dest_path());
        ddcp::ProgressReporter reporter;
        ddcp::CopyEngine engine(config, reporter);

        auto result = engine.run(total, source, sink);
        sink.close();

        ddcp::log_emit(ddcp::LogLevel::Notice,
                       std::string("copy finished: ") + ddcp::outcome_name(result.outcome));
        reporter.emit_final(result.state.bytes_written(), result.state.elapsed_seconds());

    } catch (const ddcp::Error &e) {
        ddcp::log_emit(ddcp::LogLevel::Error, std::string("ddcp error: ") + e.what());
        unlink(SOURCE_FILE);
        unlink(DEST_FILE);
        ddcp::clear_log_handler();
        return 1;
    }

    // --- Step 3: Clean up ------------------------------------------------
    unlink(SOURCE_FILE);
    unlink(DEST_FILE);
    ddcp::clear_log_handler();
    return 0;
}
