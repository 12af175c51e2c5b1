/**
 * @file circuit_breaker.hpp
 * @brief Consecutive-failure circuit breaker for one runtime client.
 *
 * Owned by the orchestrator that talks to a runtime and passed by
 * reference; there is no process-wide instance.
 *
 *   Closed   --threshold consecutive failures-->  Open
 *   Open     --open_duration elapsed--------->  HalfOpen (one probe allowed)
 *   HalfOpen --probe succeeds-->  Closed,  --probe fails-->  Open
 */

#pragma once

#include "core/types.hpp"

#include <functional>
#include <mutex>
#include <string_view>

namespace sandbox_gate {

enum class BreakerState : uint8_t {
    Closed,
    Open,
    HalfOpen
};

[[nodiscard]] constexpr std::string_view to_string(BreakerState state) noexcept {
    switch (state) {
        case BreakerState::Closed:   return "closed";
        case BreakerState::Open:     return "open";
        case BreakerState::HalfOpen: return "half_open";
    }
    return "unknown";
}

class CircuitBreaker {
public:
    using ClockFn = std::function<SteadyTime()>;

    CircuitBreaker(uint32_t failure_threshold, Millis open_duration,
                   ClockFn clock = [] { return std::chrono::steady_clock::now(); });

    /// Whether a call may proceed now. In HalfOpen only the first caller gets through.
    [[nodiscard]] bool allow();

    void record_success();
    void record_failure();

    /// Give back a HalfOpen probe that ended without a verdict (e.g. cancelled).
    void release_probe();

    void reset();

    [[nodiscard]] BreakerState state() const;
    [[nodiscard]] uint32_t consecutive_failures() const;

private:
    uint32_t failure_threshold_;
    Millis open_duration_;
    ClockFn clock_;

    mutable std::mutex mutex_;
    BreakerState state_{BreakerState::Closed};
    uint32_t failures_{0};
    SteadyTime opened_at_{};
    bool probe_in_flight_{false};
};

}  // namespace sandbox_gate
