#pragma once

#include <string>
#include <vector>
#include <filesystem>
#include "log.hpp"
#include "types.hpp"

namespace fs = std::filesystem;

class Config {
public:
    // Built-in defaults (no file).
    static Config defaults();

    // Load from a YAML file. A missing file yields defaults; a malformed one
    // yields ConfigError.
    static Result<Config> load(const fs::path& path);

    // Parse YAML text directly.
    static Result<Config> parse(const std::string& yaml_text);

    // Accessors
    const std::string& listen() const { return listen_; }
    const LogSettings& logging() const { return logging_; }
    const SessionsConfig& sessions() const { return sessions_; }
    const StreamConfig& stream() const { return stream_; }
    const PoolConfig& pool() const { return pool_; }
    const BreakerConfig& breaker() const { return breaker_; }
    const ProtocolConfig& protocol() const { return protocol_; }
    const std::vector<TargetConfig>& targets() const { return targets_; }

    // Look up a configured target by name.
    const TargetConfig* find_target(const std::string& name) const;

    // Look up credentials for an endpoint (exact host/port/user match).
    const TargetConfig* credentials_for(const Target& target) const;

    // Command-line override of the listen address.
    void set_listen(const std::string& address) { listen_ = address; }

public:
    Config() = default;

private:
    std::string listen_;
    LogSettings logging_;
    SessionsConfig sessions_;
    StreamConfig stream_;
    PoolConfig pool_;
    BreakerConfig breaker_;
    ProtocolConfig protocol_;
    std::vector<TargetConfig> targets_;

    friend class ConfigParser;
};

// Get paths
fs::path get_default_config_dir();
fs::path get_default_config_path();
