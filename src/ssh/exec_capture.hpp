#pragma once

#include <chrono>
#include <cstddef>
#include <sys/types.h>
#include <core/types.hpp>
#include "remote_connection.hpp"

// Non-blocking view of a running command's stdout and stderr.
class ExecStreams {
public:
    using Clock = std::chrono::steady_clock;

    virtual ~ExecStreams() = default;

    // Bytes read, 0 when nothing is pending, -1 on a transport error.
    virtual ssize_t read_stdout(char* buf, size_t len) = 0;
    virtual ssize_t read_stderr(char* buf, size_t len) = 0;

    // True once the command has closed both streams.
    virtual bool eof() = 0;

    // Sleep until more output may be ready, never past deadline.
    virtual void wait(Clock::time_point deadline) = 0;
};

// Read both streams until EOF. Each keeps only its newest max_bytes and the
// result is flagged truncated when anything was dropped. The deadline is
// checked before every read, so a command that never stops printing still
// ends in IOError once timeout_ms has passed.
Result<ExecResult> collect_exec_output(ExecStreams& streams, ExecStreams::Clock::time_point deadline,
                                       size_t max_bytes, int timeout_ms);
