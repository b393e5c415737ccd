#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <core/types.hpp>
#include "remote_connection.hpp"

// libssh2 forward declarations
typedef struct _LIBSSH2_CHANNEL LIBSSH2_CHANNEL;

// RAII handle for an interactive shell channel (pty + shell request done).
// Owns the channel and closes+frees on destruction. The SshConnection that
// opened it must outlive it.
// All libssh2 calls are protected by brief io_mutex_ holds shared with the
// owning connection.
class ShellChannel : public RemoteShell {
public:
    ShellChannel(LIBSSH2_CHANNEL* ch, std::shared_ptr<std::mutex> io_mutex, int sock);
    ~ShellChannel() override;

    ShellChannel(const ShellChannel&) = delete;
    ShellChannel& operator=(const ShellChannel&) = delete;

    int poll_fd() const override { return sock_; }
    ssize_t read(char* buf, size_t len) override;
    bool eof() override;
    Result<void> write(const char* data, size_t len, int timeout_ms) override;
    Result<void> resize(const Geometry& geometry) override;
    void close() override;

private:
    LIBSSH2_CHANNEL* ch_;
    std::shared_ptr<std::mutex> io_mutex_;
    int sock_;
    std::mutex write_mutex_;
};
