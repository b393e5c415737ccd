#include "shell_channel.hpp"
#include <core/constants.hpp>
#include <platform/socket_util.hpp>
#include <libssh2.h>
#include <fmt/format.h>
#include <algorithm>
#include <chrono>

ShellChannel::ShellChannel(LIBSSH2_CHANNEL* ch, std::shared_ptr<std::mutex> io_mutex, int sock)
    : ch_(ch), io_mutex_(std::move(io_mutex)), sock_(sock) {}

ShellChannel::~ShellChannel() {
    close();
}

void ShellChannel::close() {
    std::lock_guard<std::mutex> lock(*io_mutex_);
    if (!ch_) return;
    libssh2_channel_close(ch_);
    libssh2_channel_free(ch_);
    ch_ = nullptr;
}

ssize_t ShellChannel::read(char* buf, size_t len) {
    std::lock_guard<std::mutex> lock(*io_mutex_);
    if (!ch_) return -1;
    ssize_t n = libssh2_channel_read(ch_, buf, len);
    if (n > 0) return n;
    if (n == 0 || n == LIBSSH2_ERROR_EAGAIN) return 0;
    return -1;
}

bool ShellChannel::eof() {
    std::lock_guard<std::mutex> lock(*io_mutex_);
    return !ch_ || libssh2_channel_eof(ch_) != 0;
}

Result<void> ShellChannel::write(const char* data, size_t len, int timeout_ms) {
    std::lock_guard<std::mutex> write_lock(write_mutex_);
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);

    size_t sent = 0;
    while (sent < len) {
        ssize_t w;
        {
            std::lock_guard<std::mutex> lock(*io_mutex_);
            if (!ch_) return Result<void>::Err(ErrorKind::IOError, "Shell channel closed");
            w = libssh2_channel_write(ch_, data + sent, len - sent);
        }
        if (w == LIBSSH2_ERROR_EAGAIN) {
            if (std::chrono::steady_clock::now() >= deadline) {
                return Result<void>::Err(ErrorKind::IOError,
                                         fmt::format("Write timed out after {}ms ({} of {} bytes sent)",
                                                     timeout_ms, sent, len));
            }
            // Window adjusts arrive inbound; wait without holding io_mutex_
            platform::poll_socket(sock_, POLLIN, SSH_IO_WAIT_MS);
            continue;
        }
        if (w < 0) {
            return Result<void>::Err(ErrorKind::IOError,
                                     fmt::format("Channel write error ({})", w));
        }
        sent += static_cast<size_t>(w);
    }
    return Result<void>::Ok();
}

Result<void> ShellChannel::resize(const Geometry& geometry) {
    auto deadline = std::chrono::steady_clock::now() +
                    std::chrono::milliseconds(SSH_REQUEST_TIMEOUT_MS);
    while (true) {
        int rc;
        {
            std::lock_guard<std::mutex> lock(*io_mutex_);
            if (!ch_) return Result<void>::Err(ErrorKind::IOError, "Shell channel closed");
            rc = libssh2_channel_request_pty_size(ch_, geometry.cols, geometry.rows);
        }
        if (rc == 0) return Result<void>::Ok();
        if (rc != LIBSSH2_ERROR_EAGAIN) {
            return Result<void>::Err(ErrorKind::IOError, fmt::format("PTY resize failed ({})", rc));
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            return Result<void>::Err(ErrorKind::IOError, "PTY resize timed out");
        }
        platform::poll_socket(sock_, POLLIN, SSH_IO_WAIT_MS);
    }
}
