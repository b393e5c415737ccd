#include "connection_pool.hpp"
#include <core/log.hpp>
#include <platform/platform.hpp>
#include <fmt/format.h>
#include <algorithm>

// Waiters re-check the global cap at this period; releases on other targets
// do not signal this target's condvar.
static constexpr int GLOBAL_CAP_RECHECK_MS = 50;

// ── PooledConnection ───────────────────────────────────────────

PooledConnection::PooledConnection(ConnectionPool* pool, std::shared_ptr<TargetPool> entry,
                                   const Target& target, std::unique_ptr<RemoteConnection> conn,
                                   Clock::time_point created_at)
    : pool_(pool), entry_(std::move(entry)), target_(target),
      conn_(std::move(conn)), created_at_(created_at) {}

PooledConnection::~PooledConnection() {
    release(true);
}

PooledConnection::PooledConnection(PooledConnection&& other) noexcept
    : pool_(other.pool_), entry_(std::move(other.entry_)), target_(std::move(other.target_)),
      conn_(std::move(other.conn_)), created_at_(other.created_at_) {
    other.pool_ = nullptr;
}

PooledConnection& PooledConnection::operator=(PooledConnection&& other) noexcept {
    if (this != &other) {
        release(true);
        pool_ = other.pool_;
        entry_ = std::move(other.entry_);
        target_ = std::move(other.target_);
        conn_ = std::move(other.conn_);
        created_at_ = other.created_at_;
        other.pool_ = nullptr;
    }
    return *this;
}

void PooledConnection::release(bool healthy) {
    if (!conn_ || !pool_) return;
    pool_->return_connection(*this, healthy);
}

// ── Lifecycle ──────────────────────────────────────────────────

ConnectionPool::ConnectionPool(ConnectionFactory& factory, const PoolConfig& config,
                               CircuitBreakerRegistry& breakers)
    : factory_(factory), config_(config), breakers_(breakers) {}

ConnectionPool::~ConnectionPool() {
    stop();
}

void ConnectionPool::stop() {
    bool was_stopped = stopped_.exchange(true);

    {
        // Orders the stop flag against the sweeper's predicate check
        std::lock_guard<std::mutex> lock(sweeper_mutex_);
    }
    sweeper_cv_.notify_all();
    if (sweeper_.joinable()) sweeper_.join();
    if (was_stopped) return;

    std::vector<std::shared_ptr<TargetPool>> entries;
    {
        std::shared_lock<std::shared_mutex> lock(registry_mutex_);
        for (auto& [target, entry] : pools_) entries.push_back(entry);
    }

    int closed = 0;
    for (auto& entry : entries) {
        std::deque<TargetPool::IdleEntry> doomed;
        {
            std::lock_guard<std::mutex> lock(entry->mutex);
            doomed.swap(entry->idle);
        }
        entry->cv.notify_all();
        total_ -= static_cast<int>(doomed.size());
        closed += static_cast<int>(doomed.size());
    }
    log_info(fmt::format("pool: stopped, closed {} idle connection(s)", closed));
}

std::shared_ptr<TargetPool> ConnectionPool::entry_for(const Target& target) {
    {
        std::shared_lock<std::shared_mutex> lock(registry_mutex_);
        auto it = pools_.find(target);
        if (it != pools_.end()) return it->second;
    }

    std::unique_lock<std::shared_mutex> lock(registry_mutex_);
    auto it = pools_.find(target);
    if (it != pools_.end()) return it->second;

    auto entry = std::make_shared<TargetPool>();
    entry->breaker = breakers_.get(target);
    pools_.emplace(target, entry);
    return entry;
}

bool ConnectionPool::reserve_global() {
    int current = total_.load();
    while (current < config_.max_total) {
        if (total_.compare_exchange_weak(current, current + 1)) return true;
    }
    return false;
}

bool ConnectionPool::evict_idle_elsewhere(const TargetPool* except) {
    std::vector<std::shared_ptr<TargetPool>> entries;
    {
        std::shared_lock<std::shared_mutex> lock(registry_mutex_);
        for (auto& [target, entry] : pools_) {
            if (entry.get() != except) entries.push_back(entry);
        }
    }
    for (auto& entry : entries) {
        std::unique_ptr<RemoteConnection> doomed;
        {
            std::lock_guard<std::mutex> lock(entry->mutex);
            if (entry->idle.empty()) continue;
            // Least recently used
            doomed = std::move(entry->idle.front().conn);
            entry->idle.pop_front();
        }
        total_--;
        return true;
    }
    return false;
}

void ConnectionPool::settle(CircuitBreaker& breaker, const CircuitBreaker::Permit& permit,
                            const Error& error) {
    switch (error.kind) {
        case ErrorKind::ConnectTimeout:
        case ErrorKind::AuthenticationFailed:
        case ErrorKind::IOError:
            breaker.record_failure(permit);
            break;
        default:
            // Local capacity problems say nothing about the target
            breaker.abandon(permit);
            break;
    }
}

// ── Acquire / release ──────────────────────────────────────────

Result<PooledConnection> ConnectionPool::acquire(const Target& target) {
    auto entry = entry_for(target);
    auto permit = entry->breaker->try_acquire();
    if (!permit) {
        return Result<PooledConnection>::Err(ErrorKind::CircuitOpen,
                                             "Circuit open for " + target.to_string());
    }

    auto result = acquire_admitted(target, entry);
    if (result.is_ok()) {
        entry->breaker->record_success(permit);
    } else {
        settle(*entry->breaker, permit, result.error);
    }
    return result;
}

Result<PooledConnection> ConnectionPool::acquire_admitted(const Target& target,
                                                          const std::shared_ptr<TargetPool>& entry) {
    using R = Result<PooledConnection>;
    auto deadline = Clock::now() + std::chrono::milliseconds(config_.acquire_timeout_ms);
    auto idle_timeout = std::chrono::milliseconds(config_.idle_timeout_ms);

    // Declared before the lock so expired connections are closed after it is
    // released.
    std::vector<std::unique_ptr<RemoteConnection>> doomed;
    std::unique_lock<std::mutex> lock(entry->mutex);

    while (true) {
        if (stopped_) {
            return R::Err(ErrorKind::IOError, "Connection pool stopped");
        }

        // Reuse an idle connection (most recently used first)
        while (!entry->idle.empty()) {
            TargetPool::IdleEntry idle = std::move(entry->idle.back());
            entry->idle.pop_back();

            if (Clock::now() - idle.last_used >= idle_timeout) {
                doomed.push_back(std::move(idle.conn));
                total_--;
                continue;
            }

            entry->in_use++;
            lock.unlock();
            if (idle.conn->is_alive()) {
                log_debug(fmt::format("pool: reusing connection to {}", target.to_string()));
                return R::Ok(PooledConnection(this, entry, target, std::move(idle.conn),
                                              idle.created_at));
            }
            log_info(fmt::format("pool: discarding dead idle connection to {}", target.to_string()));
            idle.conn.reset();
            total_--;
            lock.lock();
            entry->in_use--;
        }

        // Establish a new one if both caps allow
        if (entry->live() < config_.max_per_target) {
            bool reserved = reserve_global();
            if (!reserved) {
                lock.unlock();
                reserved = evict_idle_elsewhere(entry.get()) && reserve_global();
                lock.lock();
            }
            if (reserved && entry->live() < config_.max_per_target) {
                entry->connecting++;
                lock.unlock();

                auto conn = establish(target);

                lock.lock();
                entry->connecting--;
                if (conn.is_err()) {
                    total_--;
                    lock.unlock();
                    entry->cv.notify_one();
                    return R::Err(conn.error);
                }
                entry->in_use++;
                lock.unlock();
                return R::Ok(PooledConnection(this, entry, target, std::move(conn.value),
                                              Clock::now()));
            }
            if (reserved) total_--;
        }

        // At capacity
        if (config_.exhausted_policy == ExhaustedPolicy::Fail) {
            return R::Err(ErrorKind::PoolExhausted,
                          fmt::format("Pool exhausted for {} ({} live, {} total)",
                                      target.to_string(), entry->live(), total_.load()));
        }
        auto now = Clock::now();
        if (now >= deadline) {
            return R::Err(ErrorKind::PoolExhausted,
                          fmt::format("Pool exhausted for {}: no connection within {}ms",
                                      target.to_string(), config_.acquire_timeout_ms));
        }
        auto slice = now + std::chrono::milliseconds(GLOBAL_CAP_RECHECK_MS);
        entry->cv.wait_until(lock, std::min(deadline, slice));
    }
}

Result<std::unique_ptr<RemoteConnection>> ConnectionPool::establish(const Target& target) {
    int attempts = 1 + std::max(0, config_.connect_retries);
    int backoff_ms = config_.retry_backoff_ms;
    Error last_error{ErrorKind::IOError, "no attempt made"};

    for (int attempt = 1; attempt <= attempts; attempt++) {
        auto conn = factory_.connect(target, config_.connect_timeout_ms);
        if (conn.is_ok()) {
            log_info(fmt::format("pool: new connection to {} (attempt {})",
                                 target.to_string(), attempt));
            return conn;
        }

        last_error = conn.error;
        log_warn(fmt::format("pool: connect to {} failed (attempt {}/{}): {}: {}",
                             target.to_string(), attempt, attempts,
                             error_kind_name(conn.error.kind), conn.error.message));

        if (conn.error.kind == ErrorKind::AuthenticationFailed) break;
        if (stopped_ || attempt == attempts) break;
        platform::sleep_ms(backoff_ms);
        backoff_ms *= 2;
    }
    return Result<std::unique_ptr<RemoteConnection>>::Err(last_error);
}

void ConnectionPool::release(PooledConnection& lease, bool healthy) {
    lease.release(healthy);
}

void ConnectionPool::return_connection(PooledConnection& lease, bool healthy) {
    std::unique_ptr<RemoteConnection> conn = std::move(lease.conn_);
    auto entry = std::move(lease.entry_);
    lease.pool_ = nullptr;

    bool keep = healthy && !stopped_;
    {
        std::lock_guard<std::mutex> lock(entry->mutex);
        entry->in_use--;
        if (keep) {
            entry->idle.push_back({std::move(conn), lease.created_at_, Clock::now()});
        }
    }
    if (!keep) {
        total_--;
        log_debug(fmt::format("pool: discarded connection to {}", lease.target_.to_string()));
    }
    entry->cv.notify_one();
}

// ── execute ────────────────────────────────────────────────────

Result<ExecResult> ConnectionPool::execute(const Target& target, const std::string& command,
                                           int timeout_ms) {
    auto entry = entry_for(target);
    auto& breaker = *entry->breaker;

    auto permit = breaker.try_acquire();
    if (!permit) {
        return Result<ExecResult>::Err(ErrorKind::CircuitOpen,
                                       "Circuit open for " + target.to_string());
    }

    auto lease = acquire_admitted(target, entry);
    if (lease.is_err()) {
        settle(breaker, permit, lease.error);
        return Result<ExecResult>::Err(lease.error);
    }

    int effective_timeout = timeout_ms > 0 ? timeout_ms : config_.exec_timeout_ms;
    auto result = lease.value->exec(command, effective_timeout);
    if (result.is_err()) {
        log_warn(fmt::format("pool: exec on {} failed: {}", target.to_string(), result.error.message));
        lease.value.release(false);
        breaker.record_failure(permit);
        return result;
    }

    lease.value.release(true);
    breaker.record_success(permit);
    return result;
}

// ── Warm-up and sweep ──────────────────────────────────────────

Result<int> ConnectionPool::warm_up(const Target& target, int n) {
    auto entry = entry_for(target);
    int opened = 0;

    while (!stopped_) {
        {
            std::lock_guard<std::mutex> lock(entry->mutex);
            if (static_cast<int>(entry->idle.size()) >= n) break;
            if (entry->live() >= config_.max_per_target) break;
            if (!reserve_global()) break;
            entry->connecting++;
        }

        auto permit = entry->breaker->try_acquire();
        if (!permit) {
            std::lock_guard<std::mutex> lock(entry->mutex);
            entry->connecting--;
            total_--;
            if (opened > 0) break;
            return Result<int>::Err(ErrorKind::CircuitOpen, "Circuit open for " + target.to_string());
        }

        auto conn = establish(target);
        {
            std::lock_guard<std::mutex> lock(entry->mutex);
            entry->connecting--;
            if (conn.is_ok()) {
                auto now = Clock::now();
                entry->idle.push_back({std::move(conn.value), now, now});
            }
        }
        entry->cv.notify_one();

        if (conn.is_err()) {
            total_--;
            settle(*entry->breaker, permit, conn.error);
            if (opened > 0) break;
            return Result<int>::Err(conn.error);
        }
        entry->breaker->record_success(permit);
        opened++;
    }

    if (opened > 0) {
        log_info(fmt::format("pool: warmed {} connection(s) to {}", opened, target.to_string()));
    }
    return Result<int>::Ok(opened);
}

void ConnectionPool::keep_warm(const std::vector<Target>& targets) {
    std::lock_guard<std::mutex> lock(sweeper_mutex_);
    warm_targets_ = targets;
}

int ConnectionPool::sweep() {
    auto idle_timeout = std::chrono::milliseconds(config_.idle_timeout_ms);
    std::vector<std::pair<Target, std::shared_ptr<TargetPool>>> entries;
    {
        std::shared_lock<std::shared_mutex> lock(registry_mutex_);
        entries.assign(pools_.begin(), pools_.end());
    }

    int evicted = 0;
    for (auto& [target, entry] : entries) {
        std::vector<std::unique_ptr<RemoteConnection>> doomed;
        {
            std::lock_guard<std::mutex> lock(entry->mutex);
            auto now = Clock::now();
            // Oldest at the front
            while (!entry->idle.empty() && now - entry->idle.front().last_used >= idle_timeout) {
                doomed.push_back(std::move(entry->idle.front().conn));
                entry->idle.pop_front();
            }
        }
        if (doomed.empty()) continue;
        total_ -= static_cast<int>(doomed.size());
        evicted += static_cast<int>(doomed.size());
        log_info(fmt::format("pool: evicted {} idle connection(s) to {}",
                             doomed.size(), target.to_string()));
        entry->cv.notify_all();
    }
    return evicted;
}

void ConnectionPool::start_sweeper() {
    if (sweeper_.joinable() || stopped_) return;
    sweeper_ = std::thread([this] { sweeper_loop(); });
}

void ConnectionPool::sweeper_loop() {
    auto interval = std::chrono::milliseconds(std::max(1, config_.sweep_interval_ms));
    while (true) {
        std::vector<Target> warm;
        {
            std::unique_lock<std::mutex> lock(sweeper_mutex_);
            sweeper_cv_.wait_for(lock, interval, [this] { return stopped_.load(); });
            if (stopped_) return;
            warm = warm_targets_;
        }

        sweep();

        if (config_.min_idle <= 0) continue;
        for (const auto& target : warm) {
            auto warmed = warm_up(target, config_.min_idle);
            if (warmed.is_err()) {
                log_debug(fmt::format("pool: warm-up of {} skipped: {}",
                                      target.to_string(), warmed.error.message));
            }
        }
    }
}

std::vector<TargetStats> ConnectionPool::stats() const {
    std::vector<std::pair<Target, std::shared_ptr<TargetPool>>> entries;
    {
        std::shared_lock<std::shared_mutex> lock(registry_mutex_);
        entries.assign(pools_.begin(), pools_.end());
    }

    std::vector<TargetStats> out;
    out.reserve(entries.size());
    for (auto& [target, entry] : entries) {
        TargetStats s;
        s.target = target;
        {
            std::lock_guard<std::mutex> lock(entry->mutex);
            s.idle = static_cast<int>(entry->idle.size());
            s.in_use = entry->in_use;
        }
        auto snap = entry->breaker->snapshot();
        s.circuit = snap.state;
        s.failures = snap.consecutive_failures;
        out.push_back(s);
    }
    std::sort(out.begin(), out.end(), [](const TargetStats& a, const TargetStats& b) {
        return a.target.to_string() < b.target.to_string();
    });
    return out;
}
