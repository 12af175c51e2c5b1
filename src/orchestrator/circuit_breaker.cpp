/**
 * @file circuit_breaker.cpp
 * @brief CircuitBreaker implementation.
 */

#include "orchestrator/circuit_breaker.hpp"

namespace sandbox_gate {

CircuitBreaker::CircuitBreaker(uint32_t failure_threshold, Millis open_duration, ClockFn clock)
    : failure_threshold_(failure_threshold == 0 ? 1 : failure_threshold)
    , open_duration_(open_duration)
    , clock_(std::move(clock)) {}

bool CircuitBreaker::allow() {
    std::lock_guard lock(mutex_);
    switch (state_) {
        case BreakerState::Closed:
            return true;
        case BreakerState::Open:
            if (clock_() - opened_at_ < open_duration_) return false;
            state_ = BreakerState::HalfOpen;
            probe_in_flight_ = true;
            return true;
        case BreakerState::HalfOpen:
            if (probe_in_flight_) return false;
            probe_in_flight_ = true;
            return true;
    }
    return false;
}

void CircuitBreaker::record_success() {
    std::lock_guard lock(mutex_);
    state_ = BreakerState::Closed;
    failures_ = 0;
    probe_in_flight_ = false;
}

void CircuitBreaker::record_failure() {
    std::lock_guard lock(mutex_);
    ++failures_;
    if (state_ == BreakerState::HalfOpen || failures_ >= failure_threshold_) {
        state_ = BreakerState::Open;
        opened_at_ = clock_();
    }
    probe_in_flight_ = false;
}

void CircuitBreaker::release_probe() {
    std::lock_guard lock(mutex_);
    probe_in_flight_ = false;
}

void CircuitBreaker::reset() {
    std::lock_guard lock(mutex_);
    state_ = BreakerState::Closed;
    failures_ = 0;
    probe_in_flight_ = false;
}

BreakerState CircuitBreaker::state() const {
    std::lock_guard lock(mutex_);
    return state_;
}

uint32_t CircuitBreaker::consecutive_failures() const {
    std::lock_guard lock(mutex_);
    return failures_;
}

}  // namespace sandbox_gate
