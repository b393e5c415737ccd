#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>
#include <core/types.hpp>

// CircuitBreaker: fault-tolerance state for one target.
//
//   closed    — calls pass; consecutive failures are counted
//   open      — calls are rejected with CircuitOpen without running
//   half-open — exactly one probe runs; success closes, failure re-opens
//
// open → half-open happens lazily inside try_acquire() once open_duration has
// elapsed. All state lives under one mutex per breaker.
class CircuitBreaker {
public:
    using Clock = std::chrono::steady_clock;

    enum class State { Closed, Open, HalfOpen };

    // Ticket handed out by try_acquire(). Outcomes recorded against a ticket
    // from an older generation (issued before the last transition) do not move
    // the state machine.
    struct Permit {
        bool allowed = false;
        bool probe = false;
        std::uint64_t generation = 0;

        explicit operator bool() const { return allowed; }
    };

    struct Snapshot {
        State state = State::Closed;
        int consecutive_failures = 0;
        Clock::time_point last_transition;
    };

    explicit CircuitBreaker(const BreakerConfig& config);

    Permit try_acquire();
    void record(const Permit& permit, bool success);
    void record_success(const Permit& permit) { record(permit, true); }
    void record_failure(const Permit& permit) { record(permit, false); }

    // Give back a probe permit whose operation never ran.
    void abandon(const Permit& permit);

    // Run op() under the breaker. op returns a Result<...>; an error result
    // counts as a failure.
    template <typename Op>
    auto call(Op&& op) -> decltype(op()) {
        using R = decltype(op());
        Permit permit = try_acquire();
        if (!permit) {
            return R::Err(ErrorKind::CircuitOpen, "Circuit open for " + name_);
        }
        R result = op();
        record(permit, result.is_ok());
        return result;
    }

    State state() const;
    Snapshot snapshot() const;
    const BreakerConfig& config() const { return config_; }

    void set_name(const std::string& name) { name_ = name; }
    const std::string& name() const { return name_; }

private:
    const BreakerConfig config_;
    std::string name_ = "target";

    mutable std::mutex mutex_;
    State state_ = State::Closed;
    int failures_ = 0;
    bool probe_in_flight_ = false;
    std::uint64_t generation_ = 0;
    Clock::time_point last_transition_;

    // Caller holds mutex_.
    void transition(State next);
};

const char* circuit_state_name(CircuitBreaker::State state);

// Per-target breakers, created on first use and kept for the process lifetime.
// The registry lock covers lookup/insert only; each breaker has its own lock.
class CircuitBreakerRegistry {
public:
    explicit CircuitBreakerRegistry(const BreakerConfig& config);

    std::shared_ptr<CircuitBreaker> get(const Target& target);

    // Existing breaker or nullptr; never creates.
    std::shared_ptr<CircuitBreaker> find(const Target& target) const;

    std::vector<std::pair<Target, CircuitBreaker::Snapshot>> snapshot() const;

    const BreakerConfig& config() const { return config_; }

private:
    const BreakerConfig config_;
    mutable std::shared_mutex mutex_;
    std::unordered_map<Target, std::shared_ptr<CircuitBreaker>, TargetHash> breakers_;
};
