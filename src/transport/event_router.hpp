#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <core/types.hpp>
#include <session/session.hpp>

class ChannelHandler;
class SessionManager;

// EventRouter: pulls the session manager's event stream on one thread and
// hands each event to the channel that owns the session.
//
// open_session() creates and binds under the routes lock, so an event for a
// new session can never be looked up before its route exists.
class EventRouter {
public:
    explicit EventRouter(SessionManager& sessions);
    ~EventRouter();

    EventRouter(const EventRouter&) = delete;
    EventRouter& operator=(const EventRouter&) = delete;

    void start();
    void stop();

    void add_channel(const std::string& channel_id, std::shared_ptr<ChannelHandler> handler);

    // Drop the channel and every route to it. Later events for its sessions
    // are discarded.
    void remove_channel(const std::string& channel_id);

    Result<std::string> open_session(const std::string& channel_id, const SessionRequest& request);

    // Deliver one event. False when no channel owns the session.
    bool dispatch(const SessionEvent& event);

    size_t route_count() const;

private:
    SessionManager& sessions_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<ChannelHandler>> channels_;
    std::unordered_map<std::string, std::string> routes_;   // session id → channel id

    std::atomic<bool> running_{false};
    std::thread thread_;

    void router_loop();
};
