#pragma once

// POSIX socket and fd utilities.

#include <poll.h>
#include <netdb.h>
#include <functional>
#include <memory>
#include <string>
#include <core/types.hpp>

using socket_t = int;
#define SHELLPOOL_INVALID_SOCKET (-1)

namespace platform {

// Set a socket (or any fd) to non-blocking mode.
void set_nonblocking(socket_t sock);

// Mark an fd close-on-exec so spawned shells do not inherit it.
void set_cloexec(int fd);

// Poll events on a single socket. Returns revents, or 0 on timeout.
// events: POLLIN, POLLOUT, etc.
int poll_socket(socket_t sock, short events, int timeout_ms);

// Close a socket.
void close_socket(socket_t sock);

using AddrList = std::shared_ptr<struct addrinfo>;

// getaddrinfo() signature, replaceable in tests.
using Resolver = std::function<int(const char* host, const char* service,
                                   const struct addrinfo* hints, struct addrinfo** res)>;

// Resolve host:port for a TCP connect. The lookup runs on its own thread and
// the caller stops waiting after timeout_ms with ConnectTimeout; a lookup that
// finishes later frees its own result.
Result<AddrList> resolve_host(const std::string& host, int port, int timeout_ms,
                              Resolver resolver = nullptr);

// Resolve host and connect with a deadline. Resolution counts against the
// same deadline. The returned socket is non-blocking.
// Fails with ConnectTimeout when the deadline passes, IOError otherwise.
Result<socket_t> connect_tcp(const std::string& host, int port, int timeout_ms);

// Bind and listen. Address forms: "tcp:HOST:PORT" or "unix:PATH".
Result<socket_t> listen_on(const std::string& address);

// Write every byte to a non-blocking fd, waiting up to timeout_ms for POLLOUT
// whenever the fd is full.
Result<void> write_all(int fd, const char* data, size_t len, int timeout_ms);

} // namespace platform
