#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>
#include <core/types.hpp>
#include <resilience/circuit_breaker.hpp>
#include <ssh/remote_connection.hpp>

class ConnectionPool;
struct TargetPool;

// PooledConnection: exclusive lease on one live connection.
//
// Move-only. Destroying an un-released lease returns the connection as
// healthy; release(false) discards it. Releasing twice is a no-op.
// The pool must outlive every lease it hands out.
class PooledConnection {
public:
    using Clock = std::chrono::steady_clock;

    PooledConnection() = default;
    ~PooledConnection();

    PooledConnection(PooledConnection&& other) noexcept;
    PooledConnection& operator=(PooledConnection&& other) noexcept;
    PooledConnection(const PooledConnection&) = delete;
    PooledConnection& operator=(const PooledConnection&) = delete;

    explicit operator bool() const { return conn_ != nullptr; }
    RemoteConnection* operator->() const { return conn_.get(); }
    RemoteConnection& get() const { return *conn_; }

    const Target& target() const { return target_; }
    Clock::time_point created_at() const { return created_at_; }

    void release(bool healthy = true);

private:
    friend class ConnectionPool;
    PooledConnection(ConnectionPool* pool, std::shared_ptr<TargetPool> entry, const Target& target,
                     std::unique_ptr<RemoteConnection> conn, Clock::time_point created_at);

    ConnectionPool* pool_ = nullptr;
    std::shared_ptr<TargetPool> entry_;
    Target target_;
    std::unique_ptr<RemoteConnection> conn_;
    Clock::time_point created_at_;
};

struct TargetStats {
    Target target;
    int idle = 0;
    int in_use = 0;
    CircuitBreaker::State circuit = CircuitBreaker::State::Closed;
    int failures = 0;
};

// Per-target slot: idle connections plus live counts. Own mutex and condvar;
// nothing here is touched under another target's lock.
struct TargetPool {
    using Clock = std::chrono::steady_clock;

    struct IdleEntry {
        std::unique_ptr<RemoteConnection> conn;
        Clock::time_point created_at;
        Clock::time_point last_used;
    };

    std::mutex mutex;
    std::condition_variable cv;
    std::deque<IdleEntry> idle;     // most recently used at the back
    int in_use = 0;
    int connecting = 0;             // slots reserved by establishments in flight
    std::shared_ptr<CircuitBreaker> breaker;

    int live() const { return static_cast<int>(idle.size()) + in_use + connecting; }
};

// ConnectionPool: bounded pools of authenticated connections, one per target,
// gated by that target's circuit breaker.
//
// The registry map is behind a reader/writer lock held only for lookup and
// insert. Establishment (network I/O) always runs with no lock held.
class ConnectionPool {
public:
    using Clock = std::chrono::steady_clock;

    ConnectionPool(ConnectionFactory& factory, const PoolConfig& config,
                   CircuitBreakerRegistry& breakers);
    ~ConnectionPool();

    ConnectionPool(const ConnectionPool&) = delete;
    ConnectionPool& operator=(const ConnectionPool&) = delete;

    // Borrow a connection. CircuitOpen without any network attempt when the
    // breaker rejects; PoolExhausted at capacity (after acquire_timeout_ms
    // under the wait policy); ConnectTimeout / AuthenticationFailed / IOError
    // from establishment.
    Result<PooledConnection> acquire(const Target& target);

    // Return a lease. Healthy connections go back to idle; others are closed.
    void release(PooledConnection& lease, bool healthy);

    // Acquire, run command on a fresh exec channel, release, and record the
    // outcome with the breaker. A non-zero exit status is a success.
    // timeout_ms <= 0 uses pool.exec_timeout_ms.
    Result<ExecResult> execute(const Target& target, const std::string& command,
                               int timeout_ms = 0);

    // Eagerly open idle connections until the target has n idle. Returns
    // the number opened.
    Result<int> warm_up(const Target& target, int n);

    // Targets the sweeper tops back up to pool.min_idle after each sweep.
    void keep_warm(const std::vector<Target>& targets);

    // Periodic idle eviction every pool.sweep_interval_ms.
    void start_sweeper();

    // Evict idle connections past pool.idle_timeout_ms. Returns the count.
    int sweep();

    // Stop the sweeper, close idle connections, fail waiters. Leases still
    // out are closed when released.
    void stop();

    std::vector<TargetStats> stats() const;
    int total_connections() const { return total_.load(); }
    const PoolConfig& config() const { return config_; }

private:
    friend class PooledConnection;

    ConnectionFactory& factory_;
    const PoolConfig config_;
    CircuitBreakerRegistry& breakers_;

    mutable std::shared_mutex registry_mutex_;
    std::unordered_map<Target, std::shared_ptr<TargetPool>, TargetHash> pools_;

    std::atomic<int> total_{0};
    std::atomic<bool> stopped_{false};

    std::mutex sweeper_mutex_;
    std::condition_variable sweeper_cv_;
    std::thread sweeper_;
    std::vector<Target> warm_targets_;

    std::shared_ptr<TargetPool> entry_for(const Target& target);

    // Acquire without consulting the breaker; the caller records the outcome.
    Result<PooledConnection> acquire_admitted(const Target& target,
                                              const std::shared_ptr<TargetPool>& entry);

    // Factory connect with retries and exponential backoff.
    Result<std::unique_ptr<RemoteConnection>> establish(const Target& target);

    // Claim one unit of the global cap. False when max_total is reached.
    bool reserve_global();

    // Close one idle connection belonging to a target other than `except`,
    // freeing a global slot. False when there is none.
    bool evict_idle_elsewhere(const TargetPool* except);

    void return_connection(PooledConnection& lease, bool healthy);
    void sweeper_loop();

    static void settle(CircuitBreaker& breaker, const CircuitBreaker::Permit& permit,
                       const Error& error);
};
