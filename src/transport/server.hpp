#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <core/config.hpp>
#include <core/types.hpp>
#include <platform/socket_util.hpp>
#include "event_router.hpp"

class ConnectionPool;
class SessionManager;

// Server: accepts client channels on a TCP or Unix socket. One reader thread
// per channel feeds its ChannelHandler line by line; the EventRouter thread
// carries session output back.
class Server {
public:
    Server(const Config& config, SessionManager& sessions, ConnectionPool* pool);
    ~Server();

    Server(const Server&) = delete;
    Server& operator=(const Server&) = delete;

    // Listen on "unix:PATH" or "tcp:HOST:PORT" and start accepting.
    Result<void> start(const std::string& address);

    // Stop accepting, disconnect every channel (closing its sessions), join.
    void stop();

    bool running() const { return running_; }
    size_t channel_count() const;

private:
    struct Channel;

    const Config& config_;
    SessionManager& sessions_;
    ConnectionPool* pool_;
    EventRouter router_;

    socket_t listen_fd_ = SHELLPOOL_INVALID_SOCKET;
    std::string unix_path_;
    std::atomic<bool> running_{false};
    std::thread accept_thread_;

    mutable std::mutex channels_mutex_;
    std::unordered_map<std::string, std::shared_ptr<Channel>> channels_;
    std::uint64_t next_channel_ = 0;

    void accept_loop();
    void channel_loop(std::shared_ptr<Channel> channel);
    void reap_finished();
};
