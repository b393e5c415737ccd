#pragma once

#include <atomic>
#include <chrono>
#include <ctime>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <variant>
#include <vector>
#include <core/types.hpp>
#include <stream/output_buffer.hpp>

class SessionBackend;

enum class SessionKind { Local, Remote };
enum class SessionState { Active, Closing, Closed };

const char* session_kind_name(SessionKind kind);
const char* session_state_name(SessionState state);

struct SessionRequest {
    SessionKind kind = SessionKind::Local;
    Geometry geometry;
    std::optional<Target> target;     // required for Remote
};

// ── Events ──────────────────────────────────────────────────

struct OutputEvent {
    std::string session_id;
    std::string data;
    bool truncated = false;
};

struct ConnectedEvent {
    std::string session_id;
};

struct ClosedEvent {
    std::string session_id;
    std::string reason;
    std::optional<ErrorKind> kind;    // set when the session ended on a failure
};

using SessionEvent = std::variant<OutputEvent, ConnectedEvent, ClosedEvent>;

// Id of the session an event belongs to.
const std::string& event_session_id(const SessionEvent& event);

struct SessionInfo {
    std::string id;
    SessionKind kind = SessionKind::Local;
    SessionState state = SessionState::Active;
    Geometry geometry;
    std::optional<Target> target;
    std::time_t created_at = 0;
    std::time_t last_activity = 0;
    bool attached = false;
    size_t buffered_bytes = 0;
};

// One interactive execution context. Owned by SessionManager through
// shared_ptr; the reactor, writers and the event stream hold short-lived
// copies.
struct Session {
    Session(std::string id, SessionKind kind, const Geometry& geometry,
            const StreamConfig& stream);

    const std::string id;
    const SessionKind kind;
    std::optional<Target> target;
    const std::time_t created_at;

    OutputBuffer buffer;
    std::atomic<bool> output_queued{false};   // an output marker is in the event queue

    // Serializes writes, and the pending-input flush on attach.
    std::mutex write_mutex;
    // Serializes geometry changes with the attach-time resize.
    std::mutex control_mutex;

    // Guards everything below.
    mutable std::mutex mutex;
    SessionState state = SessionState::Active;
    Geometry geometry;
    std::time_t last_activity;
    std::shared_ptr<SessionBackend> backend;  // null before attach and after teardown
    std::vector<std::string> pending_input;   // remote input queued before attach

    void touch();
    SessionInfo info() const;
};
