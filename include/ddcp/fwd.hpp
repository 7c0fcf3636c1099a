// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 ddcp Contributors


/**
 * @file fwd.hpp
 * @brief Forward declarations for ddcp
 */

#ifndef DDCP_FWD_HPP
#define DDCP_FWD_HPP

namespace ddcp {

class Error;
class Options;
class TransferConfig;
class Buffer;
class Source;
class Sink;
class FdSource;
class FdSink;
class TransferState;
class ProgressReporter;
class InterruptHandler;
class CopyEngine;

struct SourceInfo;
struct TransferResult;

} // namespace ddcp

#endif // DDCP_FWD_HPP
