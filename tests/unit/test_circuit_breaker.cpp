/**
 * @file test_circuit_breaker.cpp
 * @brief Unit tests for CircuitBreaker state transitions.
 */

#include "orchestrator/circuit_breaker.hpp"

#include <gtest/gtest.h>

using namespace sandbox_gate;

class CircuitBreakerTest : public ::testing::Test {
protected:
    SteadyTime now_{std::chrono::steady_clock::now()};

    CircuitBreaker make(uint32_t threshold, Millis open_for) {
        return CircuitBreaker(threshold, open_for, [this] { return now_; });
    }
};

TEST_F(CircuitBreakerTest, StartsClosed) {
    auto breaker = make(3, Millis{1000});
    EXPECT_EQ(breaker.state(), BreakerState::Closed);
    EXPECT_TRUE(breaker.allow());
}

TEST_F(CircuitBreakerTest, OpensAfterThresholdConsecutiveFailures) {
    auto breaker = make(3, Millis{1000});
    breaker.record_failure();
    breaker.record_failure();
    EXPECT_EQ(breaker.state(), BreakerState::Closed);
    breaker.record_failure();
    EXPECT_EQ(breaker.state(), BreakerState::Open);
    EXPECT_FALSE(breaker.allow());
}

TEST_F(CircuitBreakerTest, SuccessResetsFailureCount) {
    auto breaker = make(3, Millis{1000});
    breaker.record_failure();
    breaker.record_failure();
    breaker.record_success();
    EXPECT_EQ(breaker.consecutive_failures(), 0u);
    breaker.record_failure();
    EXPECT_EQ(breaker.state(), BreakerState::Closed);
}

TEST_F(CircuitBreakerTest, HalfOpenAllowsSingleProbe) {
    auto breaker = make(1, Millis{500});
    breaker.record_failure();
    ASSERT_EQ(breaker.state(), BreakerState::Open);

    now_ += Millis{499};
    EXPECT_FALSE(breaker.allow());

    now_ += Millis{1};
    EXPECT_TRUE(breaker.allow());
    EXPECT_EQ(breaker.state(), BreakerState::HalfOpen);
    EXPECT_FALSE(breaker.allow());
}

TEST_F(CircuitBreakerTest, ProbeSuccessCloses) {
    auto breaker = make(1, Millis{100});
    breaker.record_failure();
    now_ += Millis{100};
    ASSERT_TRUE(breaker.allow());
    breaker.record_success();
    EXPECT_EQ(breaker.state(), BreakerState::Closed);
    EXPECT_TRUE(breaker.allow());
}

TEST_F(CircuitBreakerTest, ProbeFailureReopens) {
    auto breaker = make(5, Millis{100});
    for (int i = 0; i < 5; ++i) breaker.record_failure();
    now_ += Millis{100};
    ASSERT_TRUE(breaker.allow());
    breaker.record_failure();
    EXPECT_EQ(breaker.state(), BreakerState::Open);
    EXPECT_FALSE(breaker.allow());

    now_ += Millis{100};
    EXPECT_TRUE(breaker.allow());
}

TEST_F(CircuitBreakerTest, ReleasedProbeCanBeRetaken) {
    auto breaker = make(1, Millis{100});
    breaker.record_failure();
    now_ += Millis{100};
    ASSERT_TRUE(breaker.allow());
    breaker.release_probe();
    EXPECT_EQ(breaker.state(), BreakerState::HalfOpen);
    EXPECT_TRUE(breaker.allow());
}

TEST_F(CircuitBreakerTest, Reset) {
    auto breaker = make(1, Millis{100000});
    breaker.record_failure();
    breaker.reset();
    EXPECT_EQ(breaker.state(), BreakerState::Closed);
    EXPECT_TRUE(breaker.allow());
}
