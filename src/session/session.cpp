#include "session.hpp"

const char* session_kind_name(SessionKind kind) {
    return kind == SessionKind::Remote ? "remote" : "local";
}

const char* session_state_name(SessionState state) {
    switch (state) {
        case SessionState::Active:  return "active";
        case SessionState::Closing: return "closing";
        case SessionState::Closed:  return "closed";
    }
    return "closed";
}

const std::string& event_session_id(const SessionEvent& event) {
    return std::visit([](const auto& e) -> const std::string& { return e.session_id; }, event);
}

Session::Session(std::string id_, SessionKind kind_, const Geometry& geometry_,
                 const StreamConfig& stream)
    : id(std::move(id_)), kind(kind_), created_at(std::time(nullptr)),
      buffer(stream.max_buffer_bytes, stream.overflow_policy),
      geometry(geometry_), last_activity(created_at) {}

void Session::touch() {
    std::lock_guard<std::mutex> lock(mutex);
    last_activity = std::time(nullptr);
}

SessionInfo Session::info() const {
    SessionInfo out;
    out.id = id;
    out.kind = kind;
    out.target = target;
    out.created_at = created_at;
    out.buffered_bytes = buffer.len();

    std::lock_guard<std::mutex> lock(mutex);
    out.state = state;
    out.geometry = geometry;
    out.last_activity = last_activity;
    out.attached = backend != nullptr;
    return out;
}
