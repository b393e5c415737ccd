#include "session_backend.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <fmt/format.h>

// ── LocalBackend ─────────────────────────────────────────────

LocalBackend::LocalBackend(platform::PtyProcess process)
    : process_(std::move(process)) {}

LocalBackend::~LocalBackend() {
    int status = process_.terminate(PROCESS_TERM_GRACE_MS);
    log_debug(fmt::format("local backend: reaped shell (status {})", status));
}

ssize_t LocalBackend::read(char* buf, size_t len) {
    ssize_t n = process_.read(buf, len);
    return n < 0 ? READ_EOF : n;
}

Result<void> LocalBackend::write(const char* data, size_t len, int timeout_ms) {
    return process_.write(data, len, timeout_ms);
}

Result<void> LocalBackend::resize(const Geometry& geometry) {
    return process_.resize(geometry);
}

std::string LocalBackend::end_reason() {
    auto status = process_.try_reap();
    if (status) return fmt::format("process exited with status {}", *status);
    return "terminal closed";
}

// ── RemoteBackend ────────────────────────────────────────────

RemoteBackend::RemoteBackend(PooledConnection lease, std::unique_ptr<RemoteShell> shell)
    : lease_(std::move(lease)), shell_(std::move(shell)) {}

RemoteBackend::~RemoteBackend() {
    // The shell lives on the leased connection: close it before the lease goes back
    shell_->close();
    shell_.reset();
    lease_.release(healthy_);
}

ssize_t RemoteBackend::read(char* buf, size_t len) {
    ssize_t n = shell_->read(buf, len);
    if (n > 0) return n;
    if (n < 0) {
        healthy_ = false;
        return READ_ERROR;
    }
    return shell_->eof() ? READ_EOF : 0;
}

Result<void> RemoteBackend::write(const char* data, size_t len, int timeout_ms) {
    auto result = shell_->write(data, len, timeout_ms);
    if (result.is_err()) healthy_ = false;
    return result;
}

Result<void> RemoteBackend::resize(const Geometry& geometry) {
    return shell_->resize(geometry);
}

std::string RemoteBackend::end_reason() {
    return "remote shell exited";
}
