/**
 * @file ddcp.hpp
 * @brief Main header for the ddcp block copy library
 *
 * This is the single header you need to include to use ddcp from C++.
 *
 * Example:
 * @code
 * #include <ddcp.hpp>
 *
 * int main() {
 *     ddcp::TransferConfig config(ddcp::Options()
 *                                     .source("/dev/sda")
 *                                     .dest("disk.img")
 *                                     .block_size(ddcp::parse_size("1M")));
 *     ddcp::check_access(config);
 *
 *     ddcp::FdSource source(config.source_path());
 *     ddcp::FdSink sink(config.dest_path());
 *     auto info = ddcp::probe_source(source.fd());
 *     ddcp::check_seek(config, info.kind);
 *     auto total = ddcp::plan_transfer(config, info.kind, info.size_bytes);
 *
 *     ddcp::ProgressReporter reporter;
 *     ddcp::InterruptHandler interrupt;
 *     ddcp::CopyEngine engine(config, reporter);
 *     auto result = engine.run(total, source, sink);
 *     reporter.emit_final(result.state.bytes_written(), result.state.elapsed_seconds());
 *     sink.close();
 * }
 * @endcode
 */

#ifndef DDCP_HPP
#define DDCP_HPP

// Order matters for dependencies
#include <ddcp/fwd.hpp>
#include <ddcp/error.hpp>
#include <ddcp/log.hpp>
#include <ddcp/size.hpp>
#include <ddcp/options.hpp>
#include <ddcp/buffer.hpp>
#include <ddcp/stream.hpp>
#include <ddcp/state.hpp>
#include <ddcp/planner.hpp>
#include <ddcp/preflight.hpp>
#include <ddcp/progress.hpp>
#include <ddcp/interrupt.hpp>
#include <ddcp/engine.hpp>

#endif // DDCP_HPP
