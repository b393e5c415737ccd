#pragma once

#include <atomic>
#include <memory>
#include <string>
#include <sys/types.h>
#include <core/types.hpp>
#include <platform/pty_process.hpp>
#include <pool/connection_pool.hpp>
#include <ssh/remote_connection.hpp>

// What a session reads from and writes to. Exactly one per attached session.
// Destruction is the teardown: it kills and reaps the process, or closes the
// shell channel and returns the lease to the pool.
class SessionBackend {
public:
    // read() results besides a positive byte count and 0 (nothing available)
    static constexpr ssize_t READ_EOF = -1;
    static constexpr ssize_t READ_ERROR = -2;

    virtual ~SessionBackend() = default;

    // fd for the reactor's poll set, or -1.
    virtual int poll_fd() const = 0;

    // True when data can be pending without the fd turning readable.
    virtual bool needs_probe() const = 0;

    virtual ssize_t read(char* buf, size_t len) = 0;
    virtual Result<void> write(const char* data, size_t len, int timeout_ms) = 0;
    virtual Result<void> resize(const Geometry& geometry) = 0;

    // Human-readable cause once read() returned READ_EOF.
    virtual std::string end_reason() = 0;

    // The underlying connection must not be reused.
    void mark_unhealthy() { healthy_ = false; }
    bool healthy() const { return healthy_; }

protected:
    std::atomic<bool> healthy_{true};
};

class LocalBackend : public SessionBackend {
public:
    explicit LocalBackend(platform::PtyProcess process);
    ~LocalBackend() override;

    int poll_fd() const override { return process_.fd(); }
    bool needs_probe() const override { return false; }
    ssize_t read(char* buf, size_t len) override;
    Result<void> write(const char* data, size_t len, int timeout_ms) override;
    Result<void> resize(const Geometry& geometry) override;
    std::string end_reason() override;

private:
    platform::PtyProcess process_;
};

class RemoteBackend : public SessionBackend {
public:
    RemoteBackend(PooledConnection lease, std::unique_ptr<RemoteShell> shell);
    ~RemoteBackend() override;

    int poll_fd() const override { return shell_->poll_fd(); }
    bool needs_probe() const override { return true; }
    ssize_t read(char* buf, size_t len) override;
    Result<void> write(const char* data, size_t len, int timeout_ms) override;
    Result<void> resize(const Geometry& geometry) override;
    std::string end_reason() override;

private:
    PooledConnection lease_;
    std::unique_ptr<RemoteShell> shell_;   // declared after lease_: closed first
};
