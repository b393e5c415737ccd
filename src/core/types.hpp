#pragma once

#include <string>
#include <optional>
#include <vector>
#include <functional>
#include <cstdint>

// Discriminated failure kinds surfaced to callers and over the wire.
enum class ErrorKind {
    SessionNotFound,
    SessionClosed,
    ResourceExhausted,
    ConnectTimeout,
    PoolExhausted,
    CircuitOpen,
    AuthenticationFailed,
    ProtocolError,
    IOError,
    ConfigError,
};

// Stable wire name, e.g. "CircuitOpen".
const char* error_kind_name(ErrorKind kind);

struct Error {
    ErrorKind kind = ErrorKind::IOError;
    std::string message;
};

// Result type for operations that can fail
template <typename T>
struct Result {
    bool success;
    T value;
    Error error;

    static Result<T> Ok(T val) {
        return {true, std::move(val), Error{}};
    }

    static Result<T> Err(ErrorKind kind, const std::string& msg) {
        return {false, T{}, Error{kind, msg}};
    }

    static Result<T> Err(const Error& err) {
        return {false, T{}, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Specialization for void
template <>
struct Result<void> {
    bool success;
    Error error;

    static Result<void> Ok() {
        return {true, Error{}};
    }

    static Result<void> Err(ErrorKind kind, const std::string& msg) {
        return {false, Error{kind, msg}};
    }

    static Result<void> Err(const Error& err) {
        return {false, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// SSH command execution result
struct SSHResult {
    int exit_code = 0;
    std::string stdout_data;
    std::string stderr_data;
    bool truncated = false;     // output past the capture limit was dropped
};

// Terminal geometry in character cells.
struct Geometry {
    int rows = 24;
    int cols = 80;

    bool valid() const { return rows > 0 && cols > 0 && rows <= 4096 && cols <= 4096; }
};

// Identity of a remote endpoint. The pool and the breaker key on it.
struct Target {
    std::string host;
    int port = 22;
    std::string user;

    std::string to_string() const {
        return user + "@" + host + ":" + std::to_string(port);
    }

    bool operator==(const Target& o) const {
        return host == o.host && port == o.port && user == o.user;
    }
    bool operator!=(const Target& o) const { return !(*this == o); }
};

struct TargetHash {
    size_t operator()(const Target& t) const {
        size_t h = std::hash<std::string>()(t.host);
        h ^= std::hash<int>()(t.port) + 0x9e3779b9 + (h << 6) + (h >> 2);
        h ^= std::hash<std::string>()(t.user) + 0x9e3779b9 + (h << 6) + (h >> 2);
        return h;
    }
};

// Configuration structures
struct TargetConfig {
    std::string name;
    Target target;
    std::optional<std::string> password;
    std::optional<std::string> key_path;
    std::optional<std::string> key_passphrase;
};

struct SessionsConfig {
    int max_sessions = 256;
    std::string shell;                     // empty = user's login shell
    std::vector<std::string> shell_args;
    std::string term = "xterm-256color";
    int worker_threads = 4;
    int write_timeout_ms = 5000;
};

enum class OverflowPolicy {
    Block,        // producer waits (reactor stops reading) until drained
    DropOldest,   // discard oldest bytes, flag truncation
};

struct StreamConfig {
    size_t max_buffer_bytes = 1024 * 1024;
    OverflowPolicy overflow_policy = OverflowPolicy::Block;
};

enum class ExhaustedPolicy {
    Wait,   // wait up to acquire_timeout_ms for a release
    Fail,   // PoolExhausted at once
};

struct PoolConfig {
    int max_per_target = 4;
    int max_total = 64;
    int min_idle = 0;
    int idle_timeout_ms = 300000;
    int connect_timeout_ms = 10000;
    int acquire_timeout_ms = 5000;
    ExhaustedPolicy exhausted_policy = ExhaustedPolicy::Wait;
    int connect_retries = 2;
    int retry_backoff_ms = 200;
    int sweep_interval_ms = 30000;
    int exec_timeout_ms = 30000;
};

struct BreakerConfig {
    int failure_threshold = 5;
    int open_duration_ms = 60000;
};

struct ProtocolConfig {
    int max_malformed = 16;
    size_t max_line_bytes = 1024 * 1024;
};
