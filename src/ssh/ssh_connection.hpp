#pragma once

#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <core/types.hpp>
#include "remote_connection.hpp"

class Config;

// libssh2 forward declarations
typedef struct _LIBSSH2_SESSION LIBSSH2_SESSION;
typedef struct _LIBSSH2_CHANNEL LIBSSH2_CHANNEL;

struct SshCredentials {
    std::string password;
    std::optional<std::string> key_path;
    std::optional<std::string> key_passphrase;
};

// One authenticated libssh2 session over a non-blocking socket.
//
// The session is shared by the exec channels and the interactive shell opened
// on it; every libssh2 call takes a brief hold of io_mutex_, never across a
// socket wait.
class SshConnection : public RemoteConnection {
public:
    using Clock = std::chrono::steady_clock;

    // TCP connect, handshake and user authentication, all bounded by timeout_ms.
    // exec() keeps at most max_output bytes of each output stream.
    static Result<std::unique_ptr<SshConnection>> establish(const Target& target,
                                                            const SshCredentials& credentials,
                                                            int timeout_ms, size_t max_output);

    ~SshConnection() override;

    SshConnection(const SshConnection&) = delete;
    SshConnection& operator=(const SshConnection&) = delete;

    const Target& target() const override { return target_; }
    bool is_alive() override;
    Result<ExecResult> exec(const std::string& command, int timeout_ms) override;
    Result<std::unique_ptr<RemoteShell>> open_shell(const Geometry& geometry,
                                                    const std::string& term) override;

    void close();

private:
    class ChannelStreams;

    SshConnection(const Target& target, const SshCredentials& credentials, size_t max_output);

    Target target_;
    SshCredentials credentials_;
    size_t max_output_;
    LIBSSH2_SESSION* session_ = nullptr;
    int sock_ = -1;
    bool active_ = false;
    std::shared_ptr<std::mutex> io_mutex_;

    Result<void> handshake(Clock::time_point deadline);
    Result<void> userauth(Clock::time_point deadline);
    Result<LIBSSH2_CHANNEL*> open_channel(Clock::time_point deadline);
    void free_channel(LIBSSH2_CHANNEL* channel);

    // Run fn() under io_mutex_ until it stops returning LIBSSH2_ERROR_EAGAIN.
    // Returns LIBSSH2_ERROR_TIMEOUT once the deadline passes.
    template <typename Fn>
    int call_blocking(Fn&& fn, Clock::time_point deadline);

    // Wait for the socket in whichever direction libssh2 is blocked on.
    // Returns false once the deadline has passed.
    bool wait_socket(Clock::time_point deadline);
};

// Production ConnectionFactory: credentials come from the configured target
// with the same host, port and user.
class SshConnectionFactory : public ConnectionFactory {
public:
    explicit SshConnectionFactory(const Config& config);

    Result<std::unique_ptr<RemoteConnection>> connect(const Target& target,
                                                      int timeout_ms) override;

private:
    const Config& config_;
};
