#include "exec_capture.hpp"
#include <core/constants.hpp>
#include <stream/output_buffer.hpp>
#include <fmt/format.h>

Result<ExecResult> collect_exec_output(ExecStreams& streams, ExecStreams::Clock::time_point deadline,
                                       size_t max_bytes, int timeout_ms) {
    OutputBuffer out(max_bytes, OverflowPolicy::DropOldest);
    OutputBuffer err(max_bytes, OverflowPolicy::DropOldest);
    char buf[SSH_READ_BUF_SIZE];

    while (true) {
        if (ExecStreams::Clock::now() >= deadline) {
            return Result<ExecResult>::Err(ErrorKind::IOError,
                                           fmt::format("Command timed out after {}ms", timeout_ms));
        }

        ssize_t n = streams.read_stdout(buf, sizeof(buf));
        if (n > 0) out.append(buf, static_cast<size_t>(n));
        ssize_t e = streams.read_stderr(buf, sizeof(buf));
        if (e > 0) err.append(buf, static_cast<size_t>(e));

        if (n < 0 || e < 0) {
            return Result<ExecResult>::Err(ErrorKind::IOError, "SSH channel read error");
        }
        if (n > 0 || e > 0) continue;
        if (streams.eof()) break;
        streams.wait(deadline);
    }

    auto stdout_part = out.drain();
    auto stderr_part = err.drain();
    ExecResult result;
    result.stdout_data = std::move(stdout_part.data);
    result.stderr_data = std::move(stderr_part.data);
    result.truncated = stdout_part.truncated || stderr_part.truncated;
    return Result<ExecResult>::Ok(std::move(result));
}
