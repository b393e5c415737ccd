#include "socket_util.hpp"
#include <core/utils.hpp>
#include <fmt/format.h>
#include <arpa/inet.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/socket.h>
#include <sys/un.h>
#include <fcntl.h>
#include <unistd.h>
#include <algorithm>
#include <cerrno>
#include <chrono>
#include <condition_variable>
#include <cstring>
#include <mutex>
#include <thread>

namespace platform {

void set_nonblocking(socket_t sock) {
    int flags = fcntl(sock, F_GETFL, 0);
    fcntl(sock, F_SETFL, flags | O_NONBLOCK);
}

void set_cloexec(int fd) {
    int flags = fcntl(fd, F_GETFD, 0);
    fcntl(fd, F_SETFD, flags | FD_CLOEXEC);
}

int poll_socket(socket_t sock, short events, int timeout_ms) {
    struct pollfd pfd;
    pfd.fd = sock;
    pfd.events = events;
    pfd.revents = 0;
    int ret = poll(&pfd, 1, timeout_ms);
    return (ret > 0) ? pfd.revents : 0;
}

void close_socket(socket_t sock) {
    if (sock >= 0) close(sock);
}

namespace {

// Shared between the caller and the lookup thread; whichever side finishes
// last drops the final reference.
struct Lookup {
    std::mutex mutex;
    std::condition_variable cv;
    bool done = false;
    bool abandoned = false;
    int rc = 0;
    struct addrinfo* res = nullptr;
};

} // namespace

Result<AddrList> resolve_host(const std::string& host, int port, int timeout_ms,
                              Resolver resolver) {
    if (!resolver) resolver = ::getaddrinfo;

    auto lookup = std::make_shared<Lookup>();
    std::string port_str = std::to_string(port);
    std::thread([lookup, resolver, host, port_str] {
        struct addrinfo hints;
        std::memset(&hints, 0, sizeof(hints));
        hints.ai_family = AF_UNSPEC;
        hints.ai_socktype = SOCK_STREAM;

        struct addrinfo* res = nullptr;
        int rc = resolver(host.c_str(), port_str.c_str(), &hints, &res);

        std::lock_guard<std::mutex> lock(lookup->mutex);
        if (lookup->abandoned) {
            if (rc == 0 && res) freeaddrinfo(res);
            return;
        }
        lookup->rc = rc;
        lookup->res = res;
        lookup->done = true;
        lookup->cv.notify_all();
    }).detach();

    std::unique_lock<std::mutex> lock(lookup->mutex);
    bool done = lookup->cv.wait_for(lock, std::chrono::milliseconds(std::max(timeout_ms, 0)),
                                    [&] { return lookup->done; });
    if (!done) {
        lookup->abandoned = true;
        return Result<AddrList>::Err(ErrorKind::ConnectTimeout,
            fmt::format("Resolving {} timed out after {}ms", host, timeout_ms));
    }
    if (lookup->rc != 0 || !lookup->res) {
        if (lookup->res) freeaddrinfo(lookup->res);
        return Result<AddrList>::Err(ErrorKind::IOError,
            fmt::format("Failed to resolve host {}: {}", host,
                        lookup->rc != 0 ? gai_strerror(lookup->rc) : "no addresses"));
    }
    return Result<AddrList>::Ok(AddrList(lookup->res, freeaddrinfo));
}

Result<socket_t> connect_tcp(const std::string& host, int port, int timeout_ms) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);

    auto resolved = resolve_host(host, port, timeout_ms);
    if (resolved.is_err()) {
        if (resolved.error.kind == ErrorKind::ConnectTimeout) {
            return Result<socket_t>::Err(ErrorKind::ConnectTimeout,
                fmt::format("Connection to {}:{} timed out after {}ms (name lookup)",
                            host, port, timeout_ms));
        }
        return Result<socket_t>::Err(resolved.error);
    }
    AddrList res = resolved.value;

    std::string last_error = "no usable address";
    bool timed_out = false;
    for (struct addrinfo* ai = res.get(); ai; ai = ai->ai_next) {
        socket_t sock = socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
        if (sock < 0) {
            last_error = strerror(errno);
            continue;
        }
        set_cloexec(sock);
        set_nonblocking(sock);

        int ret = connect(sock, ai->ai_addr, ai->ai_addrlen);
        if (ret < 0 && errno != EINPROGRESS) {
            last_error = strerror(errno);
            close_socket(sock);
            continue;
        }

        // Wait for non-blocking connect to complete
        if (ret < 0) {
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now()).count();
            if (remaining <= 0) {
                close_socket(sock);
                timed_out = true;
                break;
            }
            int revents = poll_socket(sock, POLLOUT, static_cast<int>(remaining));
            if (revents == 0) {
                close_socket(sock);
                timed_out = true;
                break;
            }
            int sock_err = 0;
            socklen_t err_len = sizeof(sock_err);
            getsockopt(sock, SOL_SOCKET, SO_ERROR, &sock_err, &err_len);
            if (sock_err != 0) {
                last_error = strerror(sock_err);
                close_socket(sock);
                continue;
            }
        }

        int nodelay = 1;
        setsockopt(sock, IPPROTO_TCP, TCP_NODELAY, &nodelay, sizeof(nodelay));
        int keepalive = 1;
        setsockopt(sock, SOL_SOCKET, SO_KEEPALIVE, &keepalive, sizeof(keepalive));

        return Result<socket_t>::Ok(sock);
    }

    if (timed_out) {
        return Result<socket_t>::Err(ErrorKind::ConnectTimeout,
            fmt::format("Connection to {}:{} timed out after {}ms", host, port, timeout_ms));
    }
    return Result<socket_t>::Err(ErrorKind::IOError,
        fmt::format("Failed to connect to {}:{}: {}", host, port, last_error));
}

static Result<socket_t> listen_unix(const std::string& path) {
    struct sockaddr_un addr;
    std::memset(&addr, 0, sizeof(addr));
    addr.sun_family = AF_UNIX;
    if (path.empty() || path.size() >= sizeof(addr.sun_path)) {
        return Result<socket_t>::Err(ErrorKind::ConfigError,
            "Unix socket path is empty or too long: " + path);
    }
    std::memcpy(addr.sun_path, path.c_str(), path.size());

    socket_t fd = socket(AF_UNIX, SOCK_STREAM, 0);
    if (fd < 0) {
        return Result<socket_t>::Err(ErrorKind::IOError,
            fmt::format("socket() failed: {}", strerror(errno)));
    }
    set_cloexec(fd);

    // Stale socket from a previous run
    unlink(path.c_str());

    if (bind(fd, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0 ||
        listen(fd, 64) < 0) {
        std::string err = strerror(errno);
        close_socket(fd);
        return Result<socket_t>::Err(ErrorKind::IOError,
            fmt::format("Failed to listen on unix:{}: {}", path, err));
    }
    return Result<socket_t>::Ok(fd);
}

static Result<socket_t> listen_tcp(const std::string& host, int port) {
    struct addrinfo hints;
    std::memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_flags = AI_PASSIVE;

    struct addrinfo* res = nullptr;
    std::string port_str = std::to_string(port);
    int gai = getaddrinfo(host.empty() ? nullptr : host.c_str(), port_str.c_str(), &hints, &res);
    if (gai != 0 || !res) {
        return Result<socket_t>::Err(ErrorKind::ConfigError,
            fmt::format("Failed to resolve listen address {}: {}", host, gai_strerror(gai)));
    }

    socket_t fd = socket(res->ai_family, res->ai_socktype, res->ai_protocol);
    if (fd < 0) {
        freeaddrinfo(res);
        return Result<socket_t>::Err(ErrorKind::IOError,
            fmt::format("socket() failed: {}", strerror(errno)));
    }
    set_cloexec(fd);

    int reuse = 1;
    setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse));

    if (bind(fd, res->ai_addr, res->ai_addrlen) < 0 || listen(fd, 64) < 0) {
        std::string err = strerror(errno);
        freeaddrinfo(res);
        close_socket(fd);
        return Result<socket_t>::Err(ErrorKind::IOError,
            fmt::format("Failed to listen on tcp:{}:{}: {}", host, port, err));
    }
    freeaddrinfo(res);
    return Result<socket_t>::Ok(fd);
}

Result<socket_t> listen_on(const std::string& address) {
    if (address.rfind("unix:", 0) == 0) {
        return listen_unix(address.substr(5));
    }
    if (address.rfind("tcp:", 0) == 0) {
        std::string rest = address.substr(4);
        auto colon = rest.rfind(':');
        if (colon == std::string::npos) {
            return Result<socket_t>::Err(ErrorKind::ConfigError,
                "Listen address needs a port: " + address);
        }
        int port = safe_stoi(rest.substr(colon + 1), -1);
        if (port <= 0 || port > 65535) {
            return Result<socket_t>::Err(ErrorKind::ConfigError,
                "Invalid listen port: " + address);
        }
        std::string host = rest.substr(0, colon);
        // [::1]:port
        if (host.size() >= 2 && host.front() == '[' && host.back() == ']') {
            host = host.substr(1, host.size() - 2);
        }
        return listen_tcp(host, port);
    }
    return Result<socket_t>::Err(ErrorKind::ConfigError,
        "Listen address must start with tcp: or unix: (" + address + ")");
}

Result<void> write_all(int fd, const char* data, size_t len, int timeout_ms) {
    size_t sent = 0;
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    while (sent < len) {
        ssize_t w = ::write(fd, data + sent, len - sent);
        if (w > 0) {
            sent += static_cast<size_t>(w);
            continue;
        }
        if (w < 0 && errno == EINTR) continue;
        if (w < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now()).count();
            if (remaining <= 0) {
                return Result<void>::Err(ErrorKind::IOError,
                    fmt::format("Write stalled for {}ms ({} of {} bytes sent)",
                                timeout_ms, sent, len));
            }
            poll_socket(fd, POLLOUT, static_cast<int>(remaining));
            continue;
        }
        return Result<void>::Err(ErrorKind::IOError,
            fmt::format("write failed: {}", w < 0 ? strerror(errno) : "closed"));
    }
    return Result<void>::Ok();
}

} // namespace platform
