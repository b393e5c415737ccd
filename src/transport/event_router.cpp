#include "event_router.hpp"
#include "channel_handler.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <session/session_manager.hpp>
#include <fmt/format.h>
#include <type_traits>
#include <vector>

EventRouter::EventRouter(SessionManager& sessions)
    : sessions_(sessions) {}

EventRouter::~EventRouter() {
    stop();
}

void EventRouter::start() {
    if (running_.exchange(true)) return;
    thread_ = std::thread(&EventRouter::router_loop, this);
}

void EventRouter::stop() {
    running_ = false;
    if (thread_.joinable()) thread_.join();
}

void EventRouter::router_loop() {
    while (running_) {
        auto event = sessions_.next_event(std::chrono::milliseconds(EVENT_WAIT_MS));
        if (!event) {
            if (sessions_.stopped()) break;
            continue;
        }
        if (!dispatch(*event)) {
            log_debug(fmt::format("router: dropped event for unowned session {}",
                                  event_session_id(*event)));
        }
    }
}

void EventRouter::add_channel(const std::string& channel_id,
                              std::shared_ptr<ChannelHandler> handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    channels_[channel_id] = std::move(handler);
}

void EventRouter::remove_channel(const std::string& channel_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    channels_.erase(channel_id);
    for (auto it = routes_.begin(); it != routes_.end();) {
        if (it->second == channel_id) {
            it = routes_.erase(it);
        } else {
            ++it;
        }
    }
}

Result<std::string> EventRouter::open_session(const std::string& channel_id,
                                              const SessionRequest& request) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto channel = channels_.find(channel_id);
    if (channel == channels_.end()) {
        return Result<std::string>::Err(ErrorKind::IOError, "Channel is closed");
    }

    auto created = sessions_.create(request);
    if (created.is_err()) return created;

    routes_[created.value] = channel_id;
    channel->second->adopt(created.value);
    return created;
}

bool EventRouter::dispatch(const SessionEvent& event) {
    const std::string& session_id = event_session_id(event);
    std::shared_ptr<ChannelHandler> handler;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto route = routes_.find(session_id);
        if (route == routes_.end()) return false;

        auto channel = channels_.find(route->second);
        if (channel != channels_.end()) handler = channel->second;
        if (std::holds_alternative<ClosedEvent>(event)) routes_.erase(route);
    }
    if (!handler) return false;
    handler->on_event(event);
    return true;
}

size_t EventRouter::route_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return routes_.size();
}
