#pragma once

#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_set>
#include <core/config.hpp>
#include <core/types.hpp>
#include <protocol/message.hpp>
#include <session/session.hpp>

class ConnectionPool;
class EventRouter;
class SessionManager;

// Where a channel's outbound messages go. Implementations are thread-safe:
// the reader thread, the event router and exec workers all send.
class MessageSink {
public:
    virtual ~MessageSink() = default;

    // False once the peer is gone.
    virtual bool send(const ServerMessage& message) = 0;

    // Drop the connection; the reader notices and cleans up.
    virtual void close() = 0;
};

// ChannelHandler: protocol state for one client connection.
//
// Messages are handled in arrival order on the channel's reader thread.
// Sessions opened here are owned here: other channels see SessionNotFound.
// Rejected lines (bad JSON, unknown type, bad fields, bad base64) each get an
// error reply and count toward protocol.max_malformed; past it the channel
// is closed.
class ChannelHandler {
public:
    ChannelHandler(std::string channel_id, const Config& config, SessionManager& sessions,
                   EventRouter& router, ConnectionPool* pool, std::shared_ptr<MessageSink> sink);

    // Decode and handle one line. False when the channel must be closed.
    bool handle_line(const std::string& line);

    // Count a line rejected before decoding (oversized). False when the
    // channel must be closed.
    bool reject_line(const std::string& reason);

    void handle(const ClientMessage& message);

    // A session event routed to this channel.
    void on_event(const SessionEvent& event);

    // Take ownership of a new session. Called by the router while it holds
    // its routes lock, before any event for the session can be dispatched.
    void adopt(const std::string& session_id);

    // Close every session this channel owns.
    void disconnect();

    bool owns(const std::string& session_id) const;
    size_t owned_count() const;
    int malformed_count() const;
    const std::string& id() const { return channel_id_; }

private:
    const std::string channel_id_;
    const Config& config_;
    SessionManager& sessions_;
    EventRouter& router_;
    ConnectionPool* pool_;
    std::shared_ptr<MessageSink> sink_;

    mutable std::mutex mutex_;
    std::unordered_set<std::string> owned_;
    std::unordered_set<std::string> closed_;
    std::deque<std::string> closed_order_;
    int malformed_ = 0;

    void on_open(const OpenRequest& m);
    void on_input(const InputRequest& m);
    void on_resize(const ResizeRequest& m);
    void on_close(const CloseRequest& m);
    void on_exec(const ExecRequest& m);
    void on_stats(const StatsRequest& m);
    void on_list(const ListRequest& m);

    Result<Target> resolve(const TargetSpec& spec) const;

    // Owned and live: Ok. Owned but ended: SessionClosed. Otherwise
    // SessionNotFound.
    Result<void> check_owner(const std::string& session_id) const;
    void forget(const std::string& session_id);

    bool count_malformed(const Error& error, const MessageIds& ids);
    void send_error(const Error& error, const std::optional<std::string>& session_id,
                    const std::optional<std::string>& request_id);
};
