#include "circuit_breaker.hpp"
#include <core/log.hpp>
#include <fmt/format.h>

const char* circuit_state_name(CircuitBreaker::State state) {
    switch (state) {
        case CircuitBreaker::State::Closed:   return "closed";
        case CircuitBreaker::State::Open:     return "open";
        case CircuitBreaker::State::HalfOpen: return "half-open";
    }
    return "closed";
}

// ── CircuitBreaker ─────────────────────────────────────────────

CircuitBreaker::CircuitBreaker(const BreakerConfig& config)
    : config_(config), last_transition_(Clock::now()) {}

void CircuitBreaker::transition(State next) {
    if (next != state_) {
        log_info(fmt::format("breaker {}: {} -> {}", name_,
                             circuit_state_name(state_), circuit_state_name(next)));
    }
    state_ = next;
    last_transition_ = Clock::now();
    generation_++;
    probe_in_flight_ = false;
    if (next != State::Open) failures_ = 0;
}

CircuitBreaker::Permit CircuitBreaker::try_acquire() {
    std::lock_guard<std::mutex> lock(mutex_);
    Permit permit;

    switch (state_) {
        case State::Closed:
            permit.allowed = true;
            permit.generation = generation_;
            return permit;

        case State::Open: {
            auto open_for = std::chrono::milliseconds(config_.open_duration_ms);
            if (Clock::now() - last_transition_ < open_for) {
                return permit;
            }
            transition(State::HalfOpen);
            probe_in_flight_ = true;
            permit.allowed = true;
            permit.probe = true;
            permit.generation = generation_;
            return permit;
        }

        case State::HalfOpen:
            if (probe_in_flight_) return permit;
            probe_in_flight_ = true;
            permit.allowed = true;
            permit.probe = true;
            permit.generation = generation_;
            return permit;
    }
    return permit;
}

void CircuitBreaker::record(const Permit& permit, bool success) {
    if (!permit.allowed) return;
    std::lock_guard<std::mutex> lock(mutex_);
    if (permit.generation != generation_) return;

    switch (state_) {
        case State::Closed:
            if (success) {
                failures_ = 0;
            } else if (++failures_ >= config_.failure_threshold) {
                log_warn(fmt::format("breaker {}: {} consecutive failures", name_, failures_));
                int failures = failures_;
                transition(State::Open);
                failures_ = failures;
            }
            break;

        case State::HalfOpen:
            if (!permit.probe) break;
            if (success) {
                transition(State::Closed);
            } else {
                transition(State::Open);
                failures_ = config_.failure_threshold;
            }
            break;

        case State::Open:
            break;
    }
}

void CircuitBreaker::abandon(const Permit& permit) {
    if (!permit.allowed || !permit.probe) return;
    std::lock_guard<std::mutex> lock(mutex_);
    if (permit.generation == generation_ && state_ == State::HalfOpen) {
        probe_in_flight_ = false;
    }
}

CircuitBreaker::State CircuitBreaker::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

CircuitBreaker::Snapshot CircuitBreaker::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return Snapshot{state_, failures_, last_transition_};
}

// ── CircuitBreakerRegistry ─────────────────────────────────────

CircuitBreakerRegistry::CircuitBreakerRegistry(const BreakerConfig& config)
    : config_(config) {}

std::shared_ptr<CircuitBreaker> CircuitBreakerRegistry::get(const Target& target) {
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        auto it = breakers_.find(target);
        if (it != breakers_.end()) return it->second;
    }

    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = breakers_.find(target);
    if (it != breakers_.end()) return it->second;

    auto breaker = std::make_shared<CircuitBreaker>(config_);
    breaker->set_name(target.to_string());
    breakers_.emplace(target, breaker);
    return breaker;
}

std::shared_ptr<CircuitBreaker> CircuitBreakerRegistry::find(const Target& target) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = breakers_.find(target);
    return it == breakers_.end() ? nullptr : it->second;
}

std::vector<std::pair<Target, CircuitBreaker::Snapshot>> CircuitBreakerRegistry::snapshot() const {
    std::vector<std::pair<Target, std::shared_ptr<CircuitBreaker>>> entries;
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        entries.assign(breakers_.begin(), breakers_.end());
    }
    std::vector<std::pair<Target, CircuitBreaker::Snapshot>> out;
    out.reserve(entries.size());
    for (auto& [target, breaker] : entries) {
        out.emplace_back(target, breaker->snapshot());
    }
    return out;
}
