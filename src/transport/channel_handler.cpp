#include "channel_handler.hpp"
#include "event_router.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <pool/connection_pool.hpp>
#include <session/session_manager.hpp>
#include <fmt/format.h>
#include <type_traits>
#include <vector>

ChannelHandler::ChannelHandler(std::string channel_id, const Config& config,
                               SessionManager& sessions, EventRouter& router,
                               ConnectionPool* pool, std::shared_ptr<MessageSink> sink)
    : channel_id_(std::move(channel_id)), config_(config), sessions_(sessions),
      router_(router), pool_(pool), sink_(std::move(sink)) {}

// ── Inbound ────────────────────────────────────────────────────

bool ChannelHandler::handle_line(const std::string& line) {
    MessageIds ids;
    auto decoded = decode_client_message(line, &ids);
    if (decoded.is_err()) {
        return count_malformed(decoded.error, ids);
    }
    handle(decoded.value);
    return true;
}

bool ChannelHandler::reject_line(const std::string& reason) {
    return count_malformed(Error{ErrorKind::ProtocolError, reason}, MessageIds{});
}

bool ChannelHandler::count_malformed(const Error& error, const MessageIds& ids) {
    int count;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        count = ++malformed_;
    }
    log_warn(fmt::format("channel {}: rejected message ({}/{}): {}", channel_id_, count,
                         config_.protocol().max_malformed, error.message));
    send_error(error, ids.session_id, ids.request_id);

    if (count > config_.protocol().max_malformed) {
        log_warn(fmt::format("channel {}: too many malformed messages, closing", channel_id_));
        send_error(Error{ErrorKind::ProtocolError, "too many malformed messages"},
                   std::nullopt, std::nullopt);
        return false;
    }
    return true;
}

void ChannelHandler::handle(const ClientMessage& message) {
    log_debug(fmt::format("channel {}: {}", channel_id_, message_type(message)));
    std::visit([this](const auto& m) {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, OpenRequest>) on_open(m);
        else if constexpr (std::is_same_v<T, InputRequest>) on_input(m);
        else if constexpr (std::is_same_v<T, ResizeRequest>) on_resize(m);
        else if constexpr (std::is_same_v<T, CloseRequest>) on_close(m);
        else if constexpr (std::is_same_v<T, ExecRequest>) on_exec(m);
        else if constexpr (std::is_same_v<T, StatsRequest>) on_stats(m);
        else if constexpr (std::is_same_v<T, ListRequest>) on_list(m);
    }, message);
}

void ChannelHandler::send_error(const Error& error, const std::optional<std::string>& session_id,
                                const std::optional<std::string>& request_id) {
    sink_->send(ErrorReply{session_id, request_id, error.kind, error.message});
}

// ── Ownership ──────────────────────────────────────────────────

Result<void> ChannelHandler::check_owner(const std::string& session_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (owned_.count(session_id)) return Result<void>::Ok();
    if (closed_.count(session_id)) {
        return Result<void>::Err(ErrorKind::SessionClosed, "Session closed: " + session_id);
    }
    return Result<void>::Err(ErrorKind::SessionNotFound, "No such session: " + session_id);
}

void ChannelHandler::forget(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (owned_.erase(session_id) == 0) return;
    closed_.insert(session_id);
    closed_order_.push_back(session_id);
    while (closed_order_.size() > CLOSED_ID_MEMORY) {
        closed_.erase(closed_order_.front());
        closed_order_.pop_front();
    }
}

void ChannelHandler::adopt(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    owned_.insert(session_id);
}

bool ChannelHandler::owns(const std::string& session_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return owned_.count(session_id) > 0;
}

size_t ChannelHandler::owned_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return owned_.size();
}

int ChannelHandler::malformed_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return malformed_;
}

Result<Target> ChannelHandler::resolve(const TargetSpec& spec) const {
    if (spec.endpoint) return Result<Target>::Ok(*spec.endpoint);
    const TargetConfig* tc = config_.find_target(spec.name);
    if (!tc) {
        return Result<Target>::Err(ErrorKind::ProtocolError, "Unknown target '" + spec.name + "'");
    }
    return Result<Target>::Ok(tc->target);
}

// ── Handlers ───────────────────────────────────────────────────

void ChannelHandler::on_open(const OpenRequest& m) {
    SessionRequest request;
    request.kind = m.kind;
    request.geometry = m.geometry;
    if (m.target) {
        auto target = resolve(*m.target);
        if (target.is_err()) {
            send_error(target.error, std::nullopt, m.request_id);
            return;
        }
        request.target = target.value;
    }

    auto created = router_.open_session(channel_id_, request);
    if (created.is_err()) {
        log_warn(fmt::format("channel {}: open failed: {}", channel_id_, created.error.message));
        send_error(created.error, std::nullopt, m.request_id);
        return;
    }
    sink_->send(OpenedReply{m.request_id, created.value});
}

void ChannelHandler::on_input(const InputRequest& m) {
    auto owner = check_owner(m.session_id);
    if (owner.is_err()) {
        send_error(owner.error, m.session_id, std::nullopt);
        return;
    }
    auto written = sessions_.write(m.session_id, m.data);
    if (written.is_err()) {
        send_error(written.error, m.session_id, std::nullopt);
    }
}

void ChannelHandler::on_resize(const ResizeRequest& m) {
    auto owner = check_owner(m.session_id);
    if (owner.is_err()) {
        // Resize racing a close is not an error
        if (owner.error.kind != ErrorKind::SessionClosed) {
            send_error(owner.error, m.session_id, std::nullopt);
        }
        return;
    }
    auto resized = sessions_.resize(m.session_id, m.geometry);
    if (resized.is_err()) {
        send_error(resized.error, m.session_id, std::nullopt);
    }
}

void ChannelHandler::on_close(const CloseRequest& m) {
    auto owner = check_owner(m.session_id);
    if (owner.is_err()) {
        if (owner.error.kind != ErrorKind::SessionClosed) {
            send_error(owner.error, m.session_id, std::nullopt);
        }
        return;
    }
    auto closed = sessions_.close(m.session_id);
    if (closed.is_err()) {
        send_error(closed.error, m.session_id, std::nullopt);
    }
}

void ChannelHandler::on_exec(const ExecRequest& m) {
    if (!pool_) {
        send_error(Error{ErrorKind::IOError, "Remote execution is not available"},
                   std::nullopt, m.request_id);
        return;
    }
    auto target = resolve(m.target);
    if (target.is_err()) {
        send_error(target.error, std::nullopt, m.request_id);
        return;
    }

    ConnectionPool* pool = pool_;
    auto sink = sink_;
    Target t = target.value;
    auto request_id = m.request_id;
    std::string command = m.command;
    int timeout_ms = m.timeout_ms;
    std::string channel_id = channel_id_;

    bool queued = sessions_.run_async([pool, sink, t, request_id, command, timeout_ms, channel_id] {
        auto result = pool->execute(t, command, timeout_ms);
        if (result.is_err()) {
            log_warn(fmt::format("channel {}: exec on {} failed: {}: {}", channel_id,
                                 t.to_string(), error_kind_name(result.error.kind),
                                 result.error.message));
            sink->send(ErrorReply{std::nullopt, request_id, result.error.kind, result.error.message});
            return;
        }
        sink->send(ExecReply{request_id, result.value});
    });
    if (!queued) {
        send_error(Error{ErrorKind::IOError, "Server is shutting down"}, std::nullopt, m.request_id);
    }
}

void ChannelHandler::on_stats(const StatsRequest& m) {
    StatsReply reply;
    reply.request_id = m.request_id;
    reply.sessions = sessions_.active_count();
    reply.routes = router_.route_count();
    reply.queued_tasks = sessions_.queued_tasks();
    if (pool_) reply.targets = pool_->stats();
    sink_->send(reply);
}

void ChannelHandler::on_list(const ListRequest& m) {
    ListReply reply;
    reply.request_id = m.request_id;
    for (auto& info : sessions_.list_sessions()) {
        if (owns(info.id)) reply.sessions.push_back(std::move(info));
    }
    sink_->send(reply);
}

// ── Outbound ───────────────────────────────────────────────────

void ChannelHandler::on_event(const SessionEvent& event) {
    std::visit([this](const auto& e) {
        using T = std::decay_t<decltype(e)>;
        if constexpr (std::is_same_v<T, OutputEvent>) {
            sink_->send(OutputNotice{e.session_id, e.data, e.truncated});
        } else if constexpr (std::is_same_v<T, ConnectedEvent>) {
            sink_->send(ConnectedNotice{e.session_id});
        } else if constexpr (std::is_same_v<T, ClosedEvent>) {
            forget(e.session_id);
            sink_->send(ClosedNotice{e.session_id, e.reason, e.kind});
        }
    }, event);
}

void ChannelHandler::disconnect() {
    std::vector<std::string> owned;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        owned.assign(owned_.begin(), owned_.end());
    }
    for (const auto& id : owned) {
        auto closed = sessions_.close(id);
        if (closed.is_err()) {
            log_warn(fmt::format("channel {}: close of {} failed: {}", channel_id_, id,
                                 closed.error.message));
        }
        forget(id);
    }
    if (!owned.empty()) {
        log_info(fmt::format("channel {}: disconnected, closed {} session(s)",
                             channel_id_, owned.size()));
    }
}
