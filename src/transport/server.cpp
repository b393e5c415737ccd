#include "server.hpp"
#include "channel_handler.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <session/session_manager.hpp>
#include <fmt/format.h>
#include <cerrno>
#include <cstring>
#include <sys/socket.h>
#include <unistd.h>
#include <vector>

// ── SocketSink ─────────────────────────────────────────────────

namespace {

// Line-framed writer for one client socket. Owns the fd: it is closed only
// when the last holder (reader, router, exec worker) lets go.
class SocketSink : public MessageSink {
public:
    SocketSink(socket_t fd, int write_timeout_ms)
        : fd_(fd), write_timeout_ms_(write_timeout_ms) {}

    ~SocketSink() override {
        platform::close_socket(fd_);
    }

    bool send(const ServerMessage& message) override {
        if (closed_) return false;
        std::string line = encode_server_message(message);
        line.push_back('\n');

        std::lock_guard<std::mutex> lock(write_mutex_);
        auto written = platform::write_all(fd_, line.data(), line.size(), write_timeout_ms_);
        if (written.is_err()) {
            log_warn(fmt::format("channel: dropping client on {}: {}", message_type(message),
                                 written.error.message));
            close();
            return false;
        }
        return true;
    }

    void close() override {
        if (closed_.exchange(true)) return;
        // Wakes the reader; the fd itself stays valid until destruction
        ::shutdown(fd_, SHUT_RDWR);
    }

private:
    socket_t fd_;
    int write_timeout_ms_;
    std::atomic<bool> closed_{false};
    std::mutex write_mutex_;
};

} // namespace

struct Server::Channel {
    std::string id;
    std::shared_ptr<SocketSink> sink;
    std::shared_ptr<ChannelHandler> handler;
    socket_t fd = SHELLPOOL_INVALID_SOCKET;
    std::thread thread;
    std::atomic<bool> finished{false};
};

// ── Lifecycle ──────────────────────────────────────────────────

Server::Server(const Config& config, SessionManager& sessions, ConnectionPool* pool)
    : config_(config), sessions_(sessions), pool_(pool), router_(sessions) {}

Server::~Server() {
    stop();
}

Result<void> Server::start(const std::string& address) {
    if (running_) return Result<void>::Ok();

    auto fd = platform::listen_on(address);
    if (fd.is_err()) return Result<void>::Err(fd.error);
    listen_fd_ = fd.value;
    if (address.rfind("unix:", 0) == 0) unix_path_ = address.substr(5);

    running_ = true;
    router_.start();
    accept_thread_ = std::thread(&Server::accept_loop, this);
    log_info("server: listening on " + address);
    return Result<void>::Ok();
}

void Server::stop() {
    if (!running_.exchange(false)) return;

    if (accept_thread_.joinable()) accept_thread_.join();
    platform::close_socket(listen_fd_);
    listen_fd_ = SHELLPOOL_INVALID_SOCKET;
    if (!unix_path_.empty()) {
        unlink(unix_path_.c_str());
    }

    std::vector<std::shared_ptr<Channel>> channels;
    {
        std::lock_guard<std::mutex> lock(channels_mutex_);
        for (auto& [id, ch] : channels_) channels.push_back(ch);
        channels_.clear();
    }
    for (auto& ch : channels) {
        ch->sink->close();
        if (ch->thread.joinable()) ch->thread.join();
    }

    router_.stop();
    log_info(fmt::format("server: stopped ({} channel(s) disconnected)", channels.size()));
}

size_t Server::channel_count() const {
    std::lock_guard<std::mutex> lock(channels_mutex_);
    return channels_.size();
}

// ── Accept loop ────────────────────────────────────────────────

void Server::accept_loop() {
    while (running_) {
        reap_finished();

        // Accept with timeout so we can check the stop flag
        int revents = platform::poll_socket(listen_fd_, POLLIN, ACCEPT_POLL_MS);
        if (revents == 0) continue;

        socket_t client = ::accept(listen_fd_, nullptr, nullptr);
        if (client < 0) {
            if (errno != EINTR && errno != EAGAIN && errno != ECONNABORTED) {
                log_warn(fmt::format("server: accept failed: {}", std::strerror(errno)));
            }
            continue;
        }
        platform::set_nonblocking(client);
        platform::set_cloexec(client);

        auto channel = std::make_shared<Channel>();
        channel->fd = client;
        channel->sink = std::make_shared<SocketSink>(client, config_.sessions().write_timeout_ms);
        {
            std::lock_guard<std::mutex> lock(channels_mutex_);
            channel->id = fmt::format("c{}", ++next_channel_);
        }
        channel->handler = std::make_shared<ChannelHandler>(channel->id, config_, sessions_,
                                                            router_, pool_, channel->sink);
        router_.add_channel(channel->id, channel->handler);

        {
            std::lock_guard<std::mutex> lock(channels_mutex_);
            channels_[channel->id] = channel;
        }
        channel->thread = std::thread(&Server::channel_loop, this, channel);
        log_info(fmt::format("channel {}: connected", channel->id));
    }
}

void Server::reap_finished() {
    std::vector<std::shared_ptr<Channel>> done;
    {
        std::lock_guard<std::mutex> lock(channels_mutex_);
        for (auto it = channels_.begin(); it != channels_.end();) {
            if (it->second->finished) {
                done.push_back(it->second);
                it = channels_.erase(it);
            } else {
                ++it;
            }
        }
    }
    for (auto& ch : done) {
        if (ch->thread.joinable()) ch->thread.join();
    }
}

// ── Channel reader ─────────────────────────────────────────────

void Server::channel_loop(std::shared_ptr<Channel> channel) {
    const size_t max_line = config_.protocol().max_line_bytes;
    std::string pending;
    bool discarding = false;     // inside an oversized line, skipping to '\n'
    bool keep_open = true;
    char buf[CHANNEL_READ_BUF_SIZE];

    while (running_ && keep_open) {
        int revents = platform::poll_socket(channel->fd, POLLIN, ACCEPT_POLL_MS);
        if (revents == 0) continue;

        ssize_t n = ::read(channel->fd, buf, sizeof(buf));
        if (n < 0 && (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK)) continue;
        if (n <= 0) break;
        pending.append(buf, static_cast<size_t>(n));

        size_t start = 0;
        while (keep_open) {
            size_t nl = pending.find('\n', start);
            if (nl == std::string::npos) break;

            if (discarding) {
                discarding = false;
                start = nl + 1;
                continue;
            }
            std::string line = pending.substr(start, nl - start);
            start = nl + 1;
            if (!line.empty() && line.back() == '\r') line.pop_back();
            if (line.find_first_not_of(" \t") == std::string::npos) continue;

            if (line.size() > max_line) {
                keep_open = channel->handler->reject_line(
                    fmt::format("message exceeds {} bytes", max_line));
                continue;
            }
            keep_open = channel->handler->handle_line(line);
        }
        pending.erase(0, start);

        if (keep_open && pending.size() > max_line) {
            pending.clear();
            if (!discarding) {
                discarding = true;
                keep_open = channel->handler->reject_line(
                    fmt::format("message exceeds {} bytes", max_line));
            }
        }
    }

    router_.remove_channel(channel->id);
    channel->handler->disconnect();
    channel->sink->close();
    channel->finished = true;
    log_info(fmt::format("channel {}: disconnected", channel->id));
}
