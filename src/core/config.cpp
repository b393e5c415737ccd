#include "config.hpp"
#include "constants.hpp"
#include "utils.hpp"
#include <platform/platform.hpp>
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>
#include <stdexcept>

namespace fs = std::filesystem;

fs::path get_default_config_dir() {
    return platform::home_dir() / ".shellpool";
}

fs::path get_default_config_path() {
    return get_default_config_dir() / "config.yaml";
}

// Reads YAML nodes into the Config's private sections. Unknown keys are
// ignored; wrong types and out-of-range values are ConfigError.
class ConfigParser {
public:
    static Result<Config> parse_root(const YAML::Node& root);

private:
    static void parse_logging(const YAML::Node& node, LogSettings& out);
    static void parse_sessions(const YAML::Node& node, SessionsConfig& out);
    static void parse_stream(const YAML::Node& node, StreamConfig& out);
    static void parse_pool(const YAML::Node& node, PoolConfig& out);
    static void parse_breaker(const YAML::Node& node, BreakerConfig& out);
    static void parse_protocol(const YAML::Node& node, ProtocolConfig& out);
    static TargetConfig parse_target(const YAML::Node& node);
    static std::string validate(const Config& config);
};

struct ConfigValueError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

void ConfigParser::parse_logging(const YAML::Node& node, LogSettings& out) {
    out.path = expand_home(node["path"].as<std::string>(out.path));
    if (node["level"]) {
        std::string level = node["level"].as<std::string>();
        if (!parse_log_level(level, out.level)) {
            throw ConfigValueError("logging.level must be debug, info, warn or error (got '" + level + "')");
        }
    }
    out.mirror_stderr = node["stderr"].as<bool>(out.mirror_stderr);
}

void ConfigParser::parse_sessions(const YAML::Node& node, SessionsConfig& out) {
    out.max_sessions = node["max_sessions"].as<int>(out.max_sessions);
    out.shell = node["shell"].as<std::string>(out.shell);
    if (node["shell_args"]) {
        out.shell_args = node["shell_args"].as<std::vector<std::string>>(std::vector<std::string>());
    }
    out.term = node["term"].as<std::string>(out.term);
    out.worker_threads = node["worker_threads"].as<int>(out.worker_threads);
    out.write_timeout_ms = node["write_timeout_ms"].as<int>(out.write_timeout_ms);
}

void ConfigParser::parse_stream(const YAML::Node& node, StreamConfig& out) {
    out.max_buffer_bytes = node["max_buffer_bytes"].as<size_t>(out.max_buffer_bytes);
    if (node["overflow_policy"]) {
        std::string policy = node["overflow_policy"].as<std::string>();
        if (policy == "block") {
            out.overflow_policy = OverflowPolicy::Block;
        } else if (policy == "drop_oldest") {
            out.overflow_policy = OverflowPolicy::DropOldest;
        } else {
            throw ConfigValueError("stream.overflow_policy must be block or drop_oldest (got '" + policy + "')");
        }
    }
}

void ConfigParser::parse_pool(const YAML::Node& node, PoolConfig& out) {
    out.max_per_target = node["max_per_target"].as<int>(out.max_per_target);
    out.max_total = node["max_total"].as<int>(out.max_total);
    out.min_idle = node["min_idle"].as<int>(out.min_idle);
    out.idle_timeout_ms = node["idle_timeout_ms"].as<int>(out.idle_timeout_ms);
    out.connect_timeout_ms = node["connect_timeout_ms"].as<int>(out.connect_timeout_ms);
    out.acquire_timeout_ms = node["acquire_timeout_ms"].as<int>(out.acquire_timeout_ms);
    if (node["exhausted_policy"]) {
        std::string policy = node["exhausted_policy"].as<std::string>();
        if (policy == "wait") {
            out.exhausted_policy = ExhaustedPolicy::Wait;
        } else if (policy == "fail") {
            out.exhausted_policy = ExhaustedPolicy::Fail;
        } else {
            throw ConfigValueError("pool.exhausted_policy must be wait or fail (got '" + policy + "')");
        }
    }
    out.connect_retries = node["connect_retries"].as<int>(out.connect_retries);
    out.retry_backoff_ms = node["retry_backoff_ms"].as<int>(out.retry_backoff_ms);
    out.sweep_interval_ms = node["sweep_interval_ms"].as<int>(out.sweep_interval_ms);
    out.exec_timeout_ms = node["exec_timeout_ms"].as<int>(out.exec_timeout_ms);
}

void ConfigParser::parse_breaker(const YAML::Node& node, BreakerConfig& out) {
    out.failure_threshold = node["failure_threshold"].as<int>(out.failure_threshold);
    out.open_duration_ms = node["open_duration_ms"].as<int>(out.open_duration_ms);
}

void ConfigParser::parse_protocol(const YAML::Node& node, ProtocolConfig& out) {
    out.max_malformed = node["max_malformed"].as<int>(out.max_malformed);
    out.max_line_bytes = node["max_line_bytes"].as<size_t>(out.max_line_bytes);
}

TargetConfig ConfigParser::parse_target(const YAML::Node& node) {
    TargetConfig tc;
    tc.name = node["name"].as<std::string>("");
    tc.target.host = node["host"].as<std::string>("");
    tc.target.port = node["port"].as<int>(DEFAULT_SSH_PORT);
    tc.target.user = node["user"].as<std::string>("");

    if (node["password"]) {
        tc.password = node["password"].as<std::string>();
    }
    if (node["key_path"]) {
        tc.key_path = expand_home(node["key_path"].as<std::string>());
    }
    if (node["key_passphrase"]) {
        tc.key_passphrase = node["key_passphrase"].as<std::string>();
    }
    if (tc.name.empty()) tc.name = tc.target.host;
    return tc;
}

std::string ConfigParser::validate(const Config& c) {
    if (c.sessions_.max_sessions <= 0) return "sessions.max_sessions must be positive";
    if (c.sessions_.worker_threads <= 0) return "sessions.worker_threads must be positive";
    if (c.sessions_.write_timeout_ms <= 0) return "sessions.write_timeout_ms must be positive";
    if (c.stream_.max_buffer_bytes == 0) return "stream.max_buffer_bytes must be positive";
    if (c.pool_.max_per_target <= 0) return "pool.max_per_target must be positive";
    if (c.pool_.max_total <= 0) return "pool.max_total must be positive";
    if (c.pool_.min_idle < 0 || c.pool_.min_idle > c.pool_.max_per_target)
        return "pool.min_idle must be between 0 and pool.max_per_target";
    if (c.pool_.connect_timeout_ms <= 0) return "pool.connect_timeout_ms must be positive";
    if (c.pool_.acquire_timeout_ms < 0) return "pool.acquire_timeout_ms must not be negative";
    if (c.pool_.idle_timeout_ms <= 0) return "pool.idle_timeout_ms must be positive";
    if (c.pool_.connect_retries < 0) return "pool.connect_retries must not be negative";
    if (c.pool_.retry_backoff_ms < 0) return "pool.retry_backoff_ms must not be negative";
    if (c.pool_.sweep_interval_ms <= 0) return "pool.sweep_interval_ms must be positive";
    if (c.pool_.exec_timeout_ms <= 0) return "pool.exec_timeout_ms must be positive";
    if (c.breaker_.failure_threshold <= 0) return "breaker.failure_threshold must be positive";
    if (c.breaker_.open_duration_ms <= 0) return "breaker.open_duration_ms must be positive";
    if (c.protocol_.max_malformed <= 0) return "protocol.max_malformed must be positive";
    if (c.protocol_.max_line_bytes < 1024) return "protocol.max_line_bytes must be at least 1024";
    for (const auto& t : c.targets_) {
        if (t.target.host.empty()) return fmt::format("target '{}' has no host", t.name);
        if (t.target.user.empty()) return fmt::format("target '{}' has no user", t.name);
        if (t.target.port <= 0 || t.target.port > 65535)
            return fmt::format("target '{}' has invalid port {}", t.name, t.target.port);
    }
    return "";
}

Result<Config> ConfigParser::parse_root(const YAML::Node& root) {
    Config config = Config::defaults();

    try {
        if (root.IsNull()) return Result<Config>::Ok(config);
        if (!root.IsMap()) {
            return Result<Config>::Err(ErrorKind::ConfigError, "Config root must be a mapping");
        }

        config.listen_ = root["listen"].as<std::string>(config.listen_);
        if (root["logging"]) parse_logging(root["logging"], config.logging_);
        if (root["sessions"]) parse_sessions(root["sessions"], config.sessions_);
        if (root["stream"]) parse_stream(root["stream"], config.stream_);
        if (root["pool"]) parse_pool(root["pool"], config.pool_);
        if (root["breaker"]) parse_breaker(root["breaker"], config.breaker_);
        if (root["protocol"]) parse_protocol(root["protocol"], config.protocol_);

        if (root["targets"]) {
            if (!root["targets"].IsSequence()) {
                return Result<Config>::Err(ErrorKind::ConfigError, "targets must be a list");
            }
            for (const auto& node : root["targets"]) {
                config.targets_.push_back(parse_target(node));
            }
        }
    } catch (const ConfigValueError& e) {
        return Result<Config>::Err(ErrorKind::ConfigError, e.what());
    } catch (const YAML::Exception& e) {
        return Result<Config>::Err(ErrorKind::ConfigError,
                                   std::string("Failed to parse config: ") + e.what());
    }

    std::string problem = validate(config);
    if (!problem.empty()) {
        return Result<Config>::Err(ErrorKind::ConfigError, problem);
    }
    return Result<Config>::Ok(config);
}

Config Config::defaults() {
    Config config;
    config.listen_ = DEFAULT_LISTEN;
    return config;
}

Result<Config> Config::load(const fs::path& path) {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        return Result<Config>::Ok(defaults());
    }

    try {
        YAML::Node root = YAML::LoadFile(path.string());
        return ConfigParser::parse_root(root);
    } catch (const YAML::Exception& e) {
        return Result<Config>::Err(ErrorKind::ConfigError,
            fmt::format("Failed to parse config {}: {}", path.string(), e.what()));
    }
}

Result<Config> Config::parse(const std::string& yaml_text) {
    try {
        YAML::Node root = YAML::Load(yaml_text);
        return ConfigParser::parse_root(root);
    } catch (const YAML::Exception& e) {
        return Result<Config>::Err(ErrorKind::ConfigError,
                                   std::string("Failed to parse config: ") + e.what());
    }
}

const TargetConfig* Config::find_target(const std::string& name) const {
    for (const auto& t : targets_) {
        if (t.name == name) return &t;
    }
    return nullptr;
}

const TargetConfig* Config::credentials_for(const Target& target) const {
    for (const auto& t : targets_) {
        if (t.target == target) return &t;
    }
    return nullptr;
}
