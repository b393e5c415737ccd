#pragma once

#include <optional>
#include <string>
#include <vector>
#include <sys/types.h>
#include <core/types.hpp>

namespace platform {

struct PtySpawnOptions {
    std::string shell;                  // empty = default_shell()
    std::vector<std::string> args;
    std::string term = "xterm-256color";
    Geometry geometry;
};

// A child shell on its own pseudo-terminal. Owns the master fd and the child;
// destruction terminates and reaps.
class PtyProcess {
public:
    static Result<PtyProcess> spawn(const PtySpawnOptions& options);

    PtyProcess() = default;
    ~PtyProcess();

    PtyProcess(PtyProcess&& other) noexcept;
    PtyProcess& operator=(PtyProcess&& other) noexcept;
    PtyProcess(const PtyProcess&) = delete;
    PtyProcess& operator=(const PtyProcess&) = delete;

    bool valid() const { return pid_ > 0; }
    int fd() const { return master_fd_; }
    pid_t pid() const { return pid_; }

    // Non-blocking read from the master. Returns bytes read, 0 when nothing is
    // available, -1 once the slave side is gone (EIO) or on error.
    ssize_t read(char* buf, size_t len);

    Result<void> write(const char* data, size_t len, int timeout_ms);
    Result<void> resize(const Geometry& geometry);

    // Non-blocking reap. Exit status once the child has exited; signals map to
    // 128 + signo.
    std::optional<int> try_reap();

    // Close the master, SIGHUP the child, SIGKILL after grace_ms, and reap.
    // Returns the exit status (or the one already reaped).
    int terminate(int grace_ms);

private:
    int master_fd_ = -1;
    pid_t pid_ = -1;
    std::optional<int> exit_status_;

    void close_master();
};

} // namespace platform
