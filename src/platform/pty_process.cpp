#include "pty_process.hpp"
#include "platform.hpp"
#include "socket_util.hpp"
#include <core/constants.hpp>
#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <string>
#include <vector>
#include <fmt/format.h>
#include <sys/ioctl.h>
#include <sys/wait.h>
#include <termios.h>
#include <unistd.h>

#if __APPLE__
#  include <util.h>
#elif __FreeBSD__
#  include <libutil.h>
#else
#  include <pty.h>
#endif

extern char** environ;

namespace platform {

static int decode_status(int status) {
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return -1;
}

// ── Spawn ────────────────────────────────────────────────────

// Absolute path for a bare program name, searched on PATH like execvp.
static std::string resolve_program(const std::string& name) {
    if (name.find('/') != std::string::npos) return name;
    const char* path = std::getenv("PATH");
    std::string dirs = path ? path : "/usr/bin:/bin";
    size_t start = 0;
    while (start <= dirs.size()) {
        size_t end = dirs.find(':', start);
        if (end == std::string::npos) end = dirs.size();
        std::string dir = dirs.substr(start, end - start);
        std::string candidate = (dir.empty() ? "." : dir) + "/" + name;
        if (access(candidate.c_str(), X_OK) == 0) return candidate;
        start = end + 1;
    }
    return name;
}

// Our environment with TERM replaced.
static std::vector<std::string> child_environment(const std::string& term) {
    std::vector<std::string> env;
    for (char** e = environ; e && *e; ++e) {
        if (std::strncmp(*e, "TERM=", 5) == 0) continue;
        env.emplace_back(*e);
    }
    env.push_back("TERM=" + term);
    return env;
}

Result<PtyProcess> PtyProcess::spawn(const PtySpawnOptions& options) {
    if (!options.geometry.valid()) {
        return Result<PtyProcess>::Err(ErrorKind::ProtocolError,
                                       fmt::format("Invalid geometry {}x{}",
                                                   options.geometry.cols, options.geometry.rows));
    }

    std::string shell = options.shell.empty() ? default_shell() : options.shell;

    // Everything the child needs is built before fork: between forkpty and
    // execve it only calls async-signal-safe functions.
    std::vector<std::string> args;
    args.push_back(shell);
    args.insert(args.end(), options.args.begin(), options.args.end());
    std::vector<char*> argv;
    for (auto& a : args) argv.push_back(const_cast<char*>(a.c_str()));
    argv.push_back(nullptr);

    std::string program = resolve_program(shell);
    std::vector<std::string> env = child_environment(options.term);
    std::vector<char*> envp;
    for (auto& e : env) envp.push_back(const_cast<char*>(e.c_str()));
    envp.push_back(nullptr);

    struct winsize ws;
    std::memset(&ws, 0, sizeof(ws));
    ws.ws_row = static_cast<unsigned short>(options.geometry.rows);
    ws.ws_col = static_cast<unsigned short>(options.geometry.cols);

    int master = -1;
    pid_t pid = forkpty(&master, nullptr, nullptr, &ws);
    if (pid < 0) {
        return Result<PtyProcess>::Err(ErrorKind::IOError,
                                       std::string("forkpty failed: ") + std::strerror(errno));
    }

    if (pid == 0) {
        // The daemon ignores SIGPIPE; the shell should not inherit that.
        struct sigaction dfl;
        std::memset(&dfl, 0, sizeof(dfl));
        dfl.sa_handler = SIG_DFL;
        sigaction(SIGCHLD, &dfl, nullptr);
        sigaction(SIGPIPE, &dfl, nullptr);
        execve(program.c_str(), argv.data(), envp.data());
        _exit(127);
    }

    set_nonblocking(master);
    set_cloexec(master);

    PtyProcess proc;
    proc.master_fd_ = master;
    proc.pid_ = pid;
    return Result<PtyProcess>::Ok(std::move(proc));
}

// ── Lifecycle ────────────────────────────────────────────────

PtyProcess::~PtyProcess() {
    if (valid()) terminate(PROCESS_TERM_GRACE_MS);
}

PtyProcess::PtyProcess(PtyProcess&& other) noexcept
    : master_fd_(other.master_fd_), pid_(other.pid_), exit_status_(other.exit_status_) {
    other.master_fd_ = -1;
    other.pid_ = -1;
    other.exit_status_.reset();
}

PtyProcess& PtyProcess::operator=(PtyProcess&& other) noexcept {
    if (this != &other) {
        if (valid()) terminate(PROCESS_TERM_GRACE_MS);
        master_fd_ = other.master_fd_;
        pid_ = other.pid_;
        exit_status_ = other.exit_status_;
        other.master_fd_ = -1;
        other.pid_ = -1;
        other.exit_status_.reset();
    }
    return *this;
}

void PtyProcess::close_master() {
    if (master_fd_ >= 0) {
        ::close(master_fd_);
        master_fd_ = -1;
    }
}

std::optional<int> PtyProcess::try_reap() {
    if (exit_status_) return exit_status_;
    if (pid_ <= 0) return std::nullopt;

    int status = 0;
    pid_t ret = waitpid(pid_, &status, WNOHANG);
    if (ret == pid_) {
        exit_status_ = decode_status(status);
    } else if (ret < 0 && errno == ECHILD) {
        exit_status_ = -1;   // reaped elsewhere
    }
    return exit_status_;
}

int PtyProcess::terminate(int grace_ms) {
    // Closing the master hangs up the terminal's session
    close_master();
    if (pid_ <= 0) return exit_status_.value_or(-1);

    if (!try_reap()) {
        kill(pid_, SIGHUP);
        for (int waited = 0; waited < grace_ms && !try_reap(); waited += 10) {
            sleep_ms(10);
        }
        if (!try_reap()) {
            kill(pid_, SIGKILL);
            int status = 0;
            pid_t ret;
            do {
                ret = waitpid(pid_, &status, 0);
            } while (ret < 0 && errno == EINTR);
            exit_status_ = (ret == pid_) ? decode_status(status) : -1;
        }
    }

    pid_ = -1;
    return exit_status_.value_or(-1);
}

// ── I/O ──────────────────────────────────────────────────────

ssize_t PtyProcess::read(char* buf, size_t len) {
    if (master_fd_ < 0) return -1;
    while (true) {
        ssize_t n = ::read(master_fd_, buf, len);
        if (n > 0) return n;
        if (n == 0) return -1;
        if (errno == EINTR) continue;
        if (errno == EAGAIN || errno == EWOULDBLOCK) return 0;
        // Linux reports EIO once every slave fd is closed
        return -1;
    }
}

Result<void> PtyProcess::write(const char* data, size_t len, int timeout_ms) {
    if (master_fd_ < 0) {
        return Result<void>::Err(ErrorKind::SessionClosed, "Terminal closed");
    }
    return write_all(master_fd_, data, len, timeout_ms);
}

Result<void> PtyProcess::resize(const Geometry& geometry) {
    if (master_fd_ < 0) {
        return Result<void>::Err(ErrorKind::SessionClosed, "Terminal closed");
    }
    struct winsize ws;
    std::memset(&ws, 0, sizeof(ws));
    ws.ws_row = static_cast<unsigned short>(geometry.rows);
    ws.ws_col = static_cast<unsigned short>(geometry.cols);
    if (ioctl(master_fd_, TIOCSWINSZ, &ws) < 0) {
        return Result<void>::Err(ErrorKind::IOError,
                                 std::string("TIOCSWINSZ failed: ") + std::strerror(errno));
    }
    return Result<void>::Ok();
}

} // namespace platform
