#include "ssh_connection.hpp"
#include "shell_channel.hpp"
#include "exec_capture.hpp"
#include <core/config.hpp>
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <platform/socket_util.hpp>
#include <libssh2.h>
#include <fmt/format.h>
#include <algorithm>
#include <cstring>

namespace {

std::once_flag g_libssh2_init;
int g_libssh2_init_rc = 0;

// Password passed to the keyboard-interactive callback via the session
// abstract pointer.
struct KbdAuthData {
    std::string password;
    int prompts_answered = 0;
};

void kbd_callback(const char* /*name*/, int /*name_len*/,
                  const char* /*instruction*/, int /*instruction_len*/,
                  int num_prompts,
                  const LIBSSH2_USERAUTH_KBDINT_PROMPT* /*prompts*/,
                  LIBSSH2_USERAUTH_KBDINT_RESPONSE* responses,
                  void** abstract) {
    auto* data = static_cast<KbdAuthData*>(*abstract);
    // Every prompt gets the password; one-time-code prompts are out of reach
    // for an unattended daemon.
    for (int i = 0; i < num_prompts; i++) {
        responses[i].text = strdup(data->password.c_str());
        responses[i].length = static_cast<unsigned int>(data->password.length());
        data->prompts_answered++;
    }
}

int remaining_ms(SshConnection::Clock::time_point deadline) {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - SshConnection::Clock::now()).count();
    return left > 0 ? static_cast<int>(left) : 0;
}

} // namespace

// ── Lifecycle ──────────────────────────────────────────────────

SshConnection::SshConnection(const Target& target, const SshCredentials& credentials,
                             size_t max_output)
    : target_(target), credentials_(credentials), max_output_(max_output),
      io_mutex_(std::make_shared<std::mutex>()) {}

SshConnection::~SshConnection() {
    close();
}

Result<std::unique_ptr<SshConnection>> SshConnection::establish(const Target& target,
                                                                const SshCredentials& credentials,
                                                                int timeout_ms,
                                                                size_t max_output) {
    using R = Result<std::unique_ptr<SshConnection>>;

    std::call_once(g_libssh2_init, [] { g_libssh2_init_rc = libssh2_init(0); });
    if (g_libssh2_init_rc != 0) {
        return R::Err(ErrorKind::IOError, "Failed to initialize libssh2");
    }

    auto deadline = Clock::now() + std::chrono::milliseconds(timeout_ms);
    std::unique_ptr<SshConnection> conn(new SshConnection(target, credentials, max_output));

    auto sock = platform::connect_tcp(target.host, target.port, timeout_ms);
    if (sock.is_err()) return R::Err(sock.error);
    conn->sock_ = sock.value;

    auto hs = conn->handshake(deadline);
    if (hs.is_err()) return R::Err(hs.error);

    auto auth = conn->userauth(deadline);
    if (auth.is_err()) return R::Err(auth.error);

    conn->active_ = true;
    log_info(fmt::format("ssh {}: connected", target.to_string()));
    return R::Ok(std::move(conn));
}

void SshConnection::close() {
    // Mark inactive first so concurrent operations bail out early
    active_ = false;

    if (session_) {
        {
            std::lock_guard<std::mutex> lock(*io_mutex_);
            libssh2_session_disconnect(session_, "Normal disconnection");
        }
        {
            std::lock_guard<std::mutex> lock(*io_mutex_);
            libssh2_session_free(session_);
        }
        session_ = nullptr;
    }

    if (sock_ >= 0) {
        platform::close_socket(sock_);
        sock_ = -1;
    }
}

// ── Non-blocking plumbing ──────────────────────────────────────

bool SshConnection::wait_socket(Clock::time_point deadline) {
    int left = remaining_ms(deadline);
    if (left <= 0) return false;

    int dir;
    {
        std::lock_guard<std::mutex> lock(*io_mutex_);
        dir = libssh2_session_block_directions(session_);
    }
    short events = 0;
    if (dir & LIBSSH2_SESSION_BLOCK_INBOUND) events |= POLLIN;
    if (dir & LIBSSH2_SESSION_BLOCK_OUTBOUND) events |= POLLOUT;
    if (events == 0) events = POLLIN;

    // Short slices: another thread may consume the data we are waiting for.
    platform::poll_socket(sock_, events, std::min(left, SSH_IO_WAIT_MS));
    return true;
}

template <typename Fn>
int SshConnection::call_blocking(Fn&& fn, Clock::time_point deadline) {
    while (true) {
        int rc;
        {
            std::lock_guard<std::mutex> lock(*io_mutex_);
            rc = fn();
        }
        if (rc != LIBSSH2_ERROR_EAGAIN) return rc;
        if (!wait_socket(deadline)) return LIBSSH2_ERROR_TIMEOUT;
    }
}

Result<void> SshConnection::handshake(Clock::time_point deadline) {
    session_ = libssh2_session_init_ex(nullptr, nullptr, nullptr, nullptr);
    if (!session_) {
        return Result<void>::Err(ErrorKind::IOError, "Failed to create SSH session");
    }
    libssh2_session_set_blocking(session_, 0);

    // SSH handshake (key exchange)
    int rc = call_blocking([&] { return libssh2_session_handshake(session_, sock_); }, deadline);
    if (rc == LIBSSH2_ERROR_TIMEOUT) {
        return Result<void>::Err(ErrorKind::ConnectTimeout,
                                 "SSH handshake timed out: " + target_.to_string());
    }
    if (rc != 0) {
        return Result<void>::Err(ErrorKind::IOError,
                                 fmt::format("SSH handshake failed ({}): {}", rc, target_.to_string()));
    }

    libssh2_keepalive_config(session_, 1, SSH_KEEPALIVE_SECS);
    return Result<void>::Ok();
}

Result<void> SshConnection::userauth(Clock::time_point deadline) {
    const std::string& user = target_.user;
    auto timed_out = [this] {
        return Result<void>::Err(ErrorKind::ConnectTimeout,
                                 "Timed out authenticating to " + target_.to_string());
    };

    // Check what auth methods the server supports
    char* auth_list = nullptr;
    while (true) {
        int err;
        {
            std::lock_guard<std::mutex> lock(*io_mutex_);
            auth_list = libssh2_userauth_list(session_, user.c_str(),
                                              static_cast<unsigned int>(user.length()));
            err = auth_list ? 0 : libssh2_session_last_errno(session_);
        }
        if (auth_list || err != LIBSSH2_ERROR_EAGAIN) break;
        if (!wait_socket(deadline)) return timed_out();
    }

    if (!auth_list) {
        std::lock_guard<std::mutex> lock(*io_mutex_);
        if (libssh2_userauth_authenticated(session_)) {
            return Result<void>::Ok();   // server accepted "none"
        }
    }

    std::string methods = auth_list ? auth_list : "";
    log_debug(fmt::format("ssh {}: auth methods: {}", target_.to_string(), methods));

    int rc;
    if (credentials_.key_path && methods.find("publickey") != std::string::npos) {
        std::string key = expand_home(*credentials_.key_path);
        const char* passphrase = credentials_.key_passphrase
                                     ? credentials_.key_passphrase->c_str() : nullptr;
        rc = call_blocking([&] {
            return libssh2_userauth_publickey_fromfile_ex(
                session_, user.c_str(), static_cast<unsigned int>(user.length()),
                nullptr, key.c_str(), passphrase);
        }, deadline);
        if (rc == 0) return Result<void>::Ok();
        if (rc == LIBSSH2_ERROR_TIMEOUT) return timed_out();
        log_warn(fmt::format("ssh {}: public key {} rejected ({})", target_.to_string(), key, rc));
    }

    if (!credentials_.password.empty() &&
        methods.find("keyboard-interactive") != std::string::npos) {
        KbdAuthData kbd_data;
        kbd_data.password = credentials_.password;
        {
            std::lock_guard<std::mutex> lock(*io_mutex_);
            *libssh2_session_abstract(session_) = &kbd_data;
        }
        rc = call_blocking([&] {
            return libssh2_userauth_keyboard_interactive(session_, user.c_str(), kbd_callback);
        }, deadline);
        {
            std::lock_guard<std::mutex> lock(*io_mutex_);
            *libssh2_session_abstract(session_) = nullptr;
        }
        if (rc == 0) return Result<void>::Ok();
        if (rc == LIBSSH2_ERROR_TIMEOUT) return timed_out();
    }

    if (!credentials_.password.empty() &&
        (methods.empty() || methods.find("password") != std::string::npos)) {
        rc = call_blocking([&] {
            return libssh2_userauth_password(session_, user.c_str(), credentials_.password.c_str());
        }, deadline);
        if (rc == 0) return Result<void>::Ok();
        if (rc == LIBSSH2_ERROR_TIMEOUT) return timed_out();
    }

    return Result<void>::Err(ErrorKind::AuthenticationFailed,
                             fmt::format("Authentication failed for {} (server offers: {})",
                                         target_.to_string(), methods.empty() ? "none" : methods));
}

Result<LIBSSH2_CHANNEL*> SshConnection::open_channel(Clock::time_point deadline) {
    if (!active_ || !session_) {
        return Result<LIBSSH2_CHANNEL*>::Err(ErrorKind::IOError, "Connection closed");
    }
    while (true) {
        LIBSSH2_CHANNEL* ch;
        int err = 0;
        {
            std::lock_guard<std::mutex> lock(*io_mutex_);
            ch = libssh2_channel_open_session(session_);
            if (!ch) err = libssh2_session_last_errno(session_);
        }
        if (ch) return Result<LIBSSH2_CHANNEL*>::Ok(ch);
        if (err != LIBSSH2_ERROR_EAGAIN) {
            return Result<LIBSSH2_CHANNEL*>::Err(ErrorKind::IOError,
                                                 fmt::format("Failed to open SSH channel ({})", err));
        }
        if (!wait_socket(deadline)) {
            return Result<LIBSSH2_CHANNEL*>::Err(ErrorKind::IOError, "Timed out opening SSH channel");
        }
    }
}

void SshConnection::free_channel(LIBSSH2_CHANNEL* channel) {
    std::lock_guard<std::mutex> lock(*io_mutex_);
    libssh2_channel_close(channel);
    libssh2_channel_free(channel);
}

// ── RemoteConnection ───────────────────────────────────────────

bool SshConnection::is_alive() {
    std::lock_guard<std::mutex> lock(*io_mutex_);
    if (!active_ || !session_ || sock_ < 0) return false;

    int seconds_to_next = 0;
    if (libssh2_keepalive_send(session_, &seconds_to_next) != 0) {
        active_ = false;
        return false;
    }

    int revents = platform::poll_socket(sock_, POLLIN, 0);
    if (revents & (POLLERR | POLLHUP | POLLNVAL)) {
        active_ = false;
        return false;
    }
    return true;
}

// One exec channel seen through ExecStreams. EAGAIN reads as "nothing yet".
class SshConnection::ChannelStreams : public ExecStreams {
public:
    ChannelStreams(SshConnection& conn, LIBSSH2_CHANNEL* channel)
        : conn_(conn), channel_(channel) {}

    ssize_t read_stdout(char* buf, size_t len) override {
        std::lock_guard<std::mutex> lock(*conn_.io_mutex_);
        return settle(libssh2_channel_read(channel_, buf, len));
    }

    ssize_t read_stderr(char* buf, size_t len) override {
        std::lock_guard<std::mutex> lock(*conn_.io_mutex_);
        return settle(libssh2_channel_read_stderr(channel_, buf, len));
    }

    bool eof() override {
        std::lock_guard<std::mutex> lock(*conn_.io_mutex_);
        return libssh2_channel_eof(channel_) != 0;
    }

    void wait(Clock::time_point deadline) override {
        conn_.wait_socket(deadline);
    }

private:
    static ssize_t settle(ssize_t rc) {
        if (rc == LIBSSH2_ERROR_EAGAIN) return 0;
        return rc < 0 ? -1 : rc;
    }

    SshConnection& conn_;
    LIBSSH2_CHANNEL* channel_;
};

Result<ExecResult> SshConnection::exec(const std::string& command, int timeout_ms) {
    auto deadline = Clock::now() + std::chrono::milliseconds(timeout_ms);

    // Fresh exec channel (no PTY, binary-clean)
    auto opened = open_channel(deadline);
    if (opened.is_err()) return Result<ExecResult>::Err(opened.error);
    LIBSSH2_CHANNEL* exec_ch = opened.value;

    int rc = call_blocking([&] { return libssh2_channel_exec(exec_ch, command.c_str()); }, deadline);
    if (rc != 0) {
        free_channel(exec_ch);
        return Result<ExecResult>::Err(ErrorKind::IOError,
                                       rc == LIBSSH2_ERROR_TIMEOUT ? "Timed out starting command"
                                                                   : "Failed to exec command on channel");
    }

    // No stdin for one-shot commands
    rc = call_blocking([&] { return libssh2_channel_send_eof(exec_ch); }, deadline);
    if (rc != 0) {
        log_debug(fmt::format("ssh {}: send_eof returned {}", target_.to_string(), rc));
    }

    // Read stdout and stderr together so neither window stalls the other
    ChannelStreams streams(*this, exec_ch);
    auto collected = collect_exec_output(streams, deadline, max_output_, timeout_ms);
    if (collected.is_err()) {
        free_channel(exec_ch);
        return collected;
    }
    ExecResult result = std::move(collected.value);

    rc = call_blocking([&] { return libssh2_channel_close(exec_ch); }, deadline);
    if (rc == 0) {
        call_blocking([&] { return libssh2_channel_wait_closed(exec_ch); }, deadline);
        std::lock_guard<std::mutex> lock(*io_mutex_);
        result.exit_code = libssh2_channel_get_exit_status(exec_ch);
    }
    {
        std::lock_guard<std::mutex> lock(*io_mutex_);
        libssh2_channel_free(exec_ch);
    }
    if (rc != 0) {
        return Result<ExecResult>::Err(ErrorKind::IOError, "Failed to close exec channel");
    }
    return Result<ExecResult>::Ok(std::move(result));
}

Result<std::unique_ptr<RemoteShell>> SshConnection::open_shell(const Geometry& geometry,
                                                               const std::string& term) {
    using R = Result<std::unique_ptr<RemoteShell>>;
    auto deadline = Clock::now() + std::chrono::milliseconds(SSH_REQUEST_TIMEOUT_MS);

    auto opened = open_channel(deadline);
    if (opened.is_err()) return R::Err(opened.error);
    LIBSSH2_CHANNEL* ch = opened.value;

    int rc = call_blocking([&] {
        return libssh2_channel_request_pty_ex(ch, term.c_str(), static_cast<unsigned int>(term.length()),
                                              nullptr, 0, geometry.cols, geometry.rows, 0, 0);
    }, deadline);
    if (rc != 0) {
        free_channel(ch);
        return R::Err(ErrorKind::IOError, fmt::format("PTY request failed ({})", rc));
    }

    rc = call_blocking([&] { return libssh2_channel_shell(ch); }, deadline);
    if (rc != 0) {
        free_channel(ch);
        return R::Err(ErrorKind::IOError, fmt::format("Shell request failed ({})", rc));
    }

    return R::Ok(std::make_unique<ShellChannel>(ch, io_mutex_, sock_));
}

// ── SshConnectionFactory ───────────────────────────────────────

SshConnectionFactory::SshConnectionFactory(const Config& config)
    : config_(config) {}

Result<std::unique_ptr<RemoteConnection>> SshConnectionFactory::connect(const Target& target,
                                                                        int timeout_ms) {
    using R = Result<std::unique_ptr<RemoteConnection>>;

    SshCredentials credentials;
    if (const TargetConfig* tc = config_.credentials_for(target)) {
        if (tc->password) credentials.password = *tc->password;
        credentials.key_path = tc->key_path;
        credentials.key_passphrase = tc->key_passphrase;
    }

    auto conn = SshConnection::establish(target, credentials, timeout_ms,
                                         config_.stream().max_buffer_bytes);
    if (conn.is_err()) return R::Err(conn.error);
    return R::Ok(std::move(conn.value));
}
