#include "message.hpp"
#include <core/utils.hpp>
#include <resilience/circuit_breaker.hpp>
#include <nlohmann/json.hpp>
#include <cstdint>
#include <stdexcept>

using json = nlohmann::json;

namespace {

// Thrown by the field readers below; decode_client_message turns it into a
// ProtocolError result.
struct FieldError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

std::string require_string(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end()) throw FieldError(std::string("missing field '") + key + "'");
    if (!it->is_string()) throw FieldError(std::string("field '") + key + "' must be a string");
    return it->get<std::string>();
}

// Correlation ids may be strings or integers; integers come back as strings.
std::optional<std::string> optional_id(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return std::nullopt;
    if (it->is_string()) return it->get<std::string>();
    if (it->is_number_integer()) return std::to_string(it->get<long long>());
    throw FieldError(std::string("field '") + key + "' must be a string or integer");
}

int optional_int(const json& j, const char* key, int fallback) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return fallback;
    if (!it->is_number_integer()) throw FieldError(std::string("field '") + key + "' must be an integer");
    long long v = it->get<long long>();
    if (v < INT32_MIN || v > INT32_MAX) throw FieldError(std::string("field '") + key + "' out of range");
    return static_cast<int>(v);
}

std::string require_base64(const json& j, const char* key) {
    auto decoded = base64_decode(require_string(j, key));
    if (!decoded) throw FieldError(std::string("field '") + key + "' is not valid base64");
    return std::move(*decoded);
}

TargetSpec parse_target(const json& j) {
    TargetSpec spec;
    if (j.is_string()) {
        spec.name = j.get<std::string>();
        if (spec.name.empty()) throw FieldError("target name is empty");
        return spec;
    }
    if (!j.is_object()) throw FieldError("target must be a name or {host, port, user}");

    Target t;
    t.host = require_string(j, "host");
    t.user = require_string(j, "user");
    t.port = optional_int(j, "port", t.port);
    if (t.host.empty() || t.user.empty()) throw FieldError("target host and user must be non-empty");
    if (t.port <= 0 || t.port > 65535) throw FieldError("target port out of range");
    spec.endpoint = t;
    return spec;
}

Geometry parse_geometry(const json& j, const Geometry& fallback) {
    Geometry g;
    g.rows = optional_int(j, "rows", fallback.rows);
    g.cols = optional_int(j, "cols", fallback.cols);
    return g;
}

json target_json(const TargetSpec& spec) {
    if (spec.endpoint) {
        return json{{"host", spec.endpoint->host}, {"port", spec.endpoint->port},
                    {"user", spec.endpoint->user}};
    }
    return spec.name;
}

void put_id(json& j, const char* key, const std::optional<std::string>& id) {
    if (id) j[key] = *id;
}

// ── Server message → JSON ──────────────────────────────────────

struct ServerEncoder {
    json operator()(const OpenedReply& m) const {
        json j{{"type", "opened"}, {"session_id", m.session_id}};
        put_id(j, "request_id", m.request_id);
        return j;
    }
    json operator()(const ConnectedNotice& m) const {
        return json{{"type", "connected"}, {"session_id", m.session_id}};
    }
    json operator()(const OutputNotice& m) const {
        json j{{"type", "output"}, {"session_id", m.session_id}, {"data", base64_encode(m.data)}};
        if (m.truncated) j["truncated"] = true;
        return j;
    }
    json operator()(const ErrorReply& m) const {
        json j{{"type", "error"}, {"kind", error_kind_name(m.kind)}, {"message", m.message}};
        put_id(j, "session_id", m.session_id);
        put_id(j, "request_id", m.request_id);
        return j;
    }
    json operator()(const ClosedNotice& m) const {
        json j{{"type", "closed"}, {"session_id", m.session_id}, {"reason", m.reason}};
        if (m.kind) j["kind"] = error_kind_name(*m.kind);
        return j;
    }
    json operator()(const ExecReply& m) const {
        json j{{"type", "exec_result"},
               {"exit_code", m.result.exit_code},
               {"stdout", base64_encode(m.result.stdout_data)},
               {"stderr", base64_encode(m.result.stderr_data)}};
        if (m.result.truncated) j["truncated"] = true;
        put_id(j, "request_id", m.request_id);
        return j;
    }
    json operator()(const StatsReply& m) const {
        json targets = json::array();
        for (const auto& t : m.targets) {
            targets.push_back({{"target", t.target.to_string()},
                               {"circuit", circuit_state_name(t.circuit)},
                               {"failures", t.failures},
                               {"idle", t.idle},
                               {"in_use", t.in_use}});
        }
        json j{{"type", "stats"}, {"sessions", m.sessions}, {"routes", m.routes},
               {"queued_tasks", m.queued_tasks}, {"targets", targets}};
        put_id(j, "request_id", m.request_id);
        return j;
    }
    json operator()(const ListReply& m) const {
        json sessions = json::array();
        for (const auto& info : m.sessions) {
            json s{{"session_id", info.id},
                   {"kind", session_kind_name(info.kind)},
                   {"state", session_state_name(info.state)},
                   {"rows", info.geometry.rows},
                   {"cols", info.geometry.cols},
                   {"attached", info.attached},
                   {"buffered", info.buffered_bytes},
                   {"created_at", static_cast<long long>(info.created_at)},
                   {"last_activity", static_cast<long long>(info.last_activity)}};
            if (info.target) s["target"] = info.target->to_string();
            sessions.push_back(std::move(s));
        }
        json j{{"type", "session_list"}, {"sessions", sessions}};
        put_id(j, "request_id", m.request_id);
        return j;
    }
};

// ── Client message → JSON ──────────────────────────────────────

struct ClientEncoder {
    json operator()(const OpenRequest& m) const {
        json j{{"type", "open"}, {"kind", session_kind_name(m.kind)},
               {"rows", m.geometry.rows}, {"cols", m.geometry.cols}};
        put_id(j, "request_id", m.request_id);
        if (m.target) j["target"] = target_json(*m.target);
        return j;
    }
    json operator()(const InputRequest& m) const {
        return json{{"type", "input"}, {"session_id", m.session_id}, {"data", base64_encode(m.data)}};
    }
    json operator()(const ResizeRequest& m) const {
        return json{{"type", "resize"}, {"session_id", m.session_id},
                    {"rows", m.geometry.rows}, {"cols", m.geometry.cols}};
    }
    json operator()(const CloseRequest& m) const {
        return json{{"type", "close"}, {"session_id", m.session_id}};
    }
    json operator()(const ExecRequest& m) const {
        json j{{"type", "exec"}, {"target", target_json(m.target)}, {"command", m.command}};
        put_id(j, "request_id", m.request_id);
        if (m.timeout_ms > 0) j["timeout_ms"] = m.timeout_ms;
        return j;
    }
    json operator()(const StatsRequest& m) const {
        json j{{"type", "stats"}};
        put_id(j, "request_id", m.request_id);
        return j;
    }
    json operator()(const ListRequest& m) const {
        json j{{"type", "list"}};
        put_id(j, "request_id", m.request_id);
        return j;
    }
};

std::string dump(const json& j) {
    // Error messages can carry arbitrary bytes from a remote host
    return j.dump(-1, ' ', false, json::error_handler_t::replace);
}

ClientMessage decode_object(const json& j) {
    std::string type = require_string(j, "type");

    if (type == "open") {
        OpenRequest m;
        m.request_id = optional_id(j, "request_id");
        std::string kind = j.contains("kind") ? require_string(j, "kind") : "local";
        if (kind == "local") {
            m.kind = SessionKind::Local;
        } else if (kind == "remote") {
            m.kind = SessionKind::Remote;
        } else {
            throw FieldError("kind must be 'local' or 'remote' (got '" + kind + "')");
        }
        if (j.contains("target") && !j["target"].is_null()) {
            m.target = parse_target(j["target"]);
        }
        if (m.kind == SessionKind::Remote && !m.target) {
            throw FieldError("remote sessions require a target");
        }
        m.geometry = parse_geometry(j, Geometry{});
        return m;
    }
    if (type == "input") {
        InputRequest m;
        m.session_id = require_string(j, "session_id");
        m.data = require_base64(j, "data");
        return m;
    }
    if (type == "resize") {
        ResizeRequest m;
        m.session_id = require_string(j, "session_id");
        if (!j.contains("rows") || !j.contains("cols")) throw FieldError("resize requires rows and cols");
        m.geometry = parse_geometry(j, Geometry{});
        return m;
    }
    if (type == "close") {
        CloseRequest m;
        m.session_id = require_string(j, "session_id");
        return m;
    }
    if (type == "exec") {
        ExecRequest m;
        m.request_id = optional_id(j, "request_id");
        if (!j.contains("target")) throw FieldError("missing field 'target'");
        m.target = parse_target(j["target"]);
        m.command = require_string(j, "command");
        m.timeout_ms = optional_int(j, "timeout_ms", 0);
        if (m.timeout_ms < 0) throw FieldError("timeout_ms must not be negative");
        return m;
    }
    if (type == "stats") {
        StatsRequest m;
        m.request_id = optional_id(j, "request_id");
        return m;
    }
    if (type == "list") {
        ListRequest m;
        m.request_id = optional_id(j, "request_id");
        return m;
    }
    throw FieldError("unknown message type '" + type + "'");
}

} // namespace

Result<ClientMessage> decode_client_message(const std::string& line, MessageIds* ids) {
    json j = json::parse(line, nullptr, false);
    if (j.is_discarded()) {
        return Result<ClientMessage>::Err(ErrorKind::ProtocolError, "malformed JSON");
    }
    if (!j.is_object()) {
        return Result<ClientMessage>::Err(ErrorKind::ProtocolError, "message must be a JSON object");
    }

    if (ids) {
        auto sid = j.find("session_id");
        if (sid != j.end() && sid->is_string()) ids->session_id = sid->get<std::string>();
        try {
            ids->request_id = optional_id(j, "request_id");
        } catch (const FieldError&) {
            ids->request_id.reset();
        }
    }

    try {
        return Result<ClientMessage>::Ok(decode_object(j));
    } catch (const FieldError& e) {
        return Result<ClientMessage>::Err(ErrorKind::ProtocolError, e.what());
    } catch (const json::exception& e) {
        return Result<ClientMessage>::Err(ErrorKind::ProtocolError, e.what());
    }
}

std::string encode_server_message(const ServerMessage& message) {
    return dump(std::visit(ServerEncoder{}, message));
}

std::string encode_client_message(const ClientMessage& message) {
    return dump(std::visit(ClientEncoder{}, message));
}

const char* message_type(const ClientMessage& message) {
    static const char* names[] = {"open", "input", "resize", "close", "exec", "stats", "list"};
    return names[message.index()];
}

const char* message_type(const ServerMessage& message) {
    static const char* names[] = {"opened", "connected", "output", "error",
                                  "closed", "exec_result", "stats", "session_list"};
    return names[message.index()];
}
