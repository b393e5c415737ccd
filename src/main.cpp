#include <iostream>
#include <vector>
#include <string>
#include <thread>
#include <chrono>
#include <csignal>
#include <fmt/format.h>
#include "core/config.hpp"
#include "core/constants.hpp"
#include "core/log.hpp"
#include "core/utils.hpp"
#include "pool/connection_pool.hpp"
#include "resilience/circuit_breaker.hpp"
#include "session/session_manager.hpp"
#include "ssh/ssh_connection.hpp"
#include "transport/server.hpp"

namespace {

volatile std::sig_atomic_t g_stop_signal = 0;

void on_stop_signal(int sig) {
    g_stop_signal = sig;
}

void print_usage() {
    std::cout << "shellpoold " << SHELLPOOL_VERSION << "\n\n"
              << "Usage:\n"
              << "    shellpoold [--config PATH] [--listen ADDR]\n"
              << "                          Run the daemon\n"
              << "    shellpoold [--config PATH] exec <target> <command...>\n"
              << "                          Run one command through the pool\n"
              << "\n"
              << "    ADDR is unix:PATH or tcp:HOST:PORT (default " << DEFAULT_LISTEN << ")\n"
              << "    <target> is a configured target name or user@host[:port]\n"
              << "\n"
              << "    shellpoold --version   Show version\n"
              << "    shellpoold --help      Show this help\n\n";
}

// Configured name first, then user@host[:port].
Result<Target> resolve_target(const Config& config, const std::string& spec) {
    if (const TargetConfig* tc = config.find_target(spec)) {
        return Result<Target>::Ok(tc->target);
    }

    auto at = spec.find('@');
    if (at == std::string::npos || at == 0 || at + 1 == spec.size()) {
        return Result<Target>::Err(ErrorKind::ConfigError, "Unknown target: " + spec);
    }
    Target target;
    target.user = spec.substr(0, at);
    std::string rest = spec.substr(at + 1);
    auto colon = rest.rfind(':');
    if (colon != std::string::npos) {
        target.port = safe_stoi(rest.substr(colon + 1), -1);
        rest = rest.substr(0, colon);
        if (target.port <= 0 || target.port > 65535) {
            return Result<Target>::Err(ErrorKind::ConfigError, "Invalid port in " + spec);
        }
    }
    target.host = rest;
    return Result<Target>::Ok(target);
}

int run_exec(const Config& config, const std::string& target_spec, const std::string& command) {
    auto target = resolve_target(config, target_spec);
    if (target.is_err()) {
        std::cerr << "shellpoold: " << target.error.message << "\n";
        return 2;
    }

    SshConnectionFactory factory(config);
    CircuitBreakerRegistry breakers(config.breaker());
    ConnectionPool pool(factory, config.pool(), breakers);

    auto result = pool.execute(target.value, command);
    pool.stop();
    if (result.is_err()) {
        std::cerr << fmt::format("shellpoold: {}: {}\n",
                                 error_kind_name(result.error.kind), result.error.message);
        return 1;
    }
    std::cout << result.value.stdout_data;
    std::cerr << result.value.stderr_data;
    return result.value.exit_code;
}

int run_daemon(const Config& config) {
    SshConnectionFactory factory(config);
    CircuitBreakerRegistry breakers(config.breaker());
    ConnectionPool pool(factory, config.pool(), breakers);

    std::vector<Target> warm;
    for (const auto& tc : config.targets()) warm.push_back(tc.target);
    pool.keep_warm(warm);
    pool.start_sweeper();

    SessionManager sessions(config, &pool);
    auto started = sessions.start();
    if (started.is_err()) {
        std::cerr << "shellpoold: " << started.error.message << "\n";
        pool.stop();
        return 1;
    }

    Server server(config, sessions, &pool);
    auto listening = server.start(config.listen());
    if (listening.is_err()) {
        std::cerr << "shellpoold: " << listening.error.message << "\n";
        sessions.shutdown();
        pool.stop();
        return 1;
    }

    log_info(fmt::format("shellpoold {} ready on {}", SHELLPOOL_VERSION, config.listen()));
    while (g_stop_signal == 0) {
        std::this_thread::sleep_for(std::chrono::milliseconds(ACCEPT_POLL_MS));
    }
    log_info(fmt::format("shellpoold: signal {} received, shutting down", int(g_stop_signal)));

    // Channels first so their sessions close through the normal path
    server.stop();
    sessions.shutdown();
    pool.stop();
    log_info("shellpoold: stopped");
    return 0;
}

} // namespace

int main(int argc, char** argv) {
    std::string config_path = get_default_config_path().string();
    std::string listen_override;
    std::vector<std::string> rest;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (!rest.empty()) {
            rest.push_back(arg);
        } else if (arg == "--version") {
            std::cout << "shellpoold version " << SHELLPOOL_VERSION << "\n";
            return 0;
        } else if (arg == "--help" || arg == "-h") {
            print_usage();
            return 0;
        } else if (arg == "--config" || arg == "--listen") {
            if (i + 1 >= argc) {
                std::cerr << "shellpoold: " << arg << " needs a value\n";
                return 2;
            }
            (arg == "--config" ? config_path : listen_override) = argv[++i];
        } else if (arg == "exec") {
            rest.push_back(arg);
        } else {
            std::cerr << "shellpoold: unknown argument: " << arg << "\n";
            print_usage();
            return 2;
        }
    }

    auto loaded = Config::load(expand_home(config_path));
    if (loaded.is_err()) {
        std::cerr << "shellpoold: " << loaded.error.message << "\n";
        return 2;
    }
    Config config = loaded.value;
    if (!listen_override.empty()) config.set_listen(listen_override);

    std::signal(SIGPIPE, SIG_IGN);
    std::signal(SIGINT, on_stop_signal);
    std::signal(SIGTERM, on_stop_signal);

    if (!rest.empty()) {
        if (rest.size() < 3) {
            std::cerr << "shellpoold: usage: shellpoold exec <target> <command...>\n";
            return 2;
        }
        configure_logging(config.logging());
        std::string command = rest[2];
        for (size_t i = 3; i < rest.size(); ++i) command += " " + rest[i];
        return run_exec(config, rest[1], command);
    }

    configure_logging(config.logging());

    try {
        return run_daemon(config);
    } catch (const std::exception& e) {
        log_error(std::string("shellpoold: fatal: ") + e.what());
        std::cerr << "shellpoold: " << e.what() << "\n";
        return 1;
    }
}
