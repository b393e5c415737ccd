#pragma once

#include <optional>
#include <string>
#include <variant>
#include <vector>
#include <core/types.hpp>
#include <pool/connection_pool.hpp>
#include <session/session.hpp>
#include <ssh/remote_connection.hpp>

// Wire messages: one JSON object per line, each with a string "type".
// Binary payloads (input/output data, exec stdout/stderr) are base64.

// A remote endpoint as a client names it: a configured target name or an
// explicit host/port/user.
struct TargetSpec {
    std::string name;                 // set when the client sent a string
    std::optional<Target> endpoint;   // set when the client sent an object
};

// ── Client → server ─────────────────────────────────────────

struct OpenRequest {
    std::optional<std::string> request_id;
    SessionKind kind = SessionKind::Local;
    std::optional<TargetSpec> target;
    Geometry geometry;
};

struct InputRequest {
    std::string session_id;
    std::string data;                 // decoded bytes
};

struct ResizeRequest {
    std::string session_id;
    Geometry geometry;
};

struct CloseRequest {
    std::string session_id;
};

struct ExecRequest {
    std::optional<std::string> request_id;
    TargetSpec target;
    std::string command;
    int timeout_ms = 0;               // 0 = pool.exec_timeout_ms
};

struct StatsRequest {
    std::optional<std::string> request_id;
};

// Sessions owned by the requesting channel.
struct ListRequest {
    std::optional<std::string> request_id;
};

using ClientMessage = std::variant<OpenRequest, InputRequest, ResizeRequest,
                                   CloseRequest, ExecRequest, StatsRequest, ListRequest>;

// ── Server → client ─────────────────────────────────────────

struct OpenedReply {
    std::optional<std::string> request_id;
    std::string session_id;
};

struct ConnectedNotice {
    std::string session_id;
};

struct OutputNotice {
    std::string session_id;
    std::string data;                 // raw bytes; base64 on the wire
    bool truncated = false;
};

struct ErrorReply {
    std::optional<std::string> session_id;
    std::optional<std::string> request_id;
    ErrorKind kind = ErrorKind::ProtocolError;
    std::string message;
};

struct ClosedNotice {
    std::string session_id;
    std::string reason;
    std::optional<ErrorKind> kind;
};

struct ExecReply {
    std::optional<std::string> request_id;
    ExecResult result;
};

struct StatsReply {
    std::optional<std::string> request_id;
    size_t sessions = 0;
    size_t routes = 0;                // sessions bound to a client channel
    size_t queued_tasks = 0;          // attach/exec work waiting for a worker
    std::vector<TargetStats> targets;
};

struct ListReply {
    std::optional<std::string> request_id;
    std::vector<SessionInfo> sessions;
};

using ServerMessage = std::variant<OpenedReply, ConnectedNotice, OutputNotice, ErrorReply,
                                   ClosedNotice, ExecReply, StatsReply, ListReply>;

// Correlation ids found in a line, even one that failed to decode.
struct MessageIds {
    std::optional<std::string> session_id;
    std::optional<std::string> request_id;
};

// Parse one line. Malformed JSON, an unknown type, missing or mistyped fields
// and bad base64 are all ProtocolError. When ids is given it receives whatever
// correlation ids could be read, so the error reply can carry them.
Result<ClientMessage> decode_client_message(const std::string& line, MessageIds* ids = nullptr);

// One JSON object, no trailing newline.
std::string encode_server_message(const ServerMessage& message);

// Client-side encoder, used by tests and tooling.
std::string encode_client_message(const ClientMessage& message);

// Name of the "type" field for a message.
const char* message_type(const ClientMessage& message);
const char* message_type(const ServerMessage& message);
