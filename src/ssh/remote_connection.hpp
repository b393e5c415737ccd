#pragma once

#include <memory>
#include <string>
#include <sys/types.h>
#include <core/types.hpp>

// Seams between the pool/sessions and the SSH transport. The libssh2
// implementations live in ssh_connection.* and shell_channel.*; tests supply
// in-process fakes.

// Output of a one-shot remote command. exit_code is the remote status.
using ExecResult = SSHResult;

// Interactive shell on a remote pty. One reader (the reactor) and any number
// of writers may use it concurrently; implementations serialize internally.
class RemoteShell {
public:
    virtual ~RemoteShell() = default;

    // fd to poll for readability, or -1. Data may be pending even when the fd
    // is quiet, so callers also probe read() periodically.
    virtual int poll_fd() const = 0;

    // Non-blocking read. Returns bytes read, 0 when nothing is available, or
    // -1 on a transport error.
    virtual ssize_t read(char* buf, size_t len) = 0;

    // True once the remote side has closed the stream.
    virtual bool eof() = 0;

    virtual Result<void> write(const char* data, size_t len, int timeout_ms) = 0;
    virtual Result<void> resize(const Geometry& geometry) = 0;

    // Close the channel. The connection stays usable.
    virtual void close() = 0;
};

// Live, authenticated connection to one target.
class RemoteConnection {
public:
    virtual ~RemoteConnection() = default;

    virtual const Target& target() const = 0;

    // Cheap liveness check (keepalive + socket state).
    virtual bool is_alive() = 0;

    // Run a command on a fresh exec channel. Err only on transport failure;
    // a non-zero remote exit status is Ok.
    virtual Result<ExecResult> exec(const std::string& command, int timeout_ms) = 0;

    virtual Result<std::unique_ptr<RemoteShell>> open_shell(const Geometry& geometry,
                                                            const std::string& term) = 0;
};

// Establishes connections. ConnectTimeout when timeout_ms passes,
// AuthenticationFailed when the server rejects every method, IOError otherwise.
class ConnectionFactory {
public:
    virtual ~ConnectionFactory() = default;

    virtual Result<std::unique_ptr<RemoteConnection>> connect(const Target& target,
                                                              int timeout_ms) = 0;
};
