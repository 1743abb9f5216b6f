/// @file test_throttle.cpp
/// Unit tests for throttle.hpp — politeness delay and 429 cooldown.
/// NOTE: these tests really sleep, for tens of milliseconds at most.

#include "interrupt.hpp"
#include "throttle.hpp"

#include <gtest/gtest.h>
#include <chrono>
#include <stdexcept>
#include <thread>

using namespace issue_harvest;

namespace {

class ThrottleTest : public ::testing::Test {
protected:
    void SetUp() override    { clearInterrupt(); }
    void TearDown() override { clearInterrupt(); }
};

int64_t elapsedMs(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start).count();
}

} // namespace

TEST_F(ThrottleTest, FreshControllerHasZeroStats) {
    ThrottleController tc(10, 50);
    EXPECT_DOUBLE_EQ(tc.totalSleepSeconds(), 0.0);
    EXPECT_EQ(tc.rateLimitHits(), 0);
    EXPECT_EQ(tc.politenessDelayMs(), 10);
    EXPECT_EQ(tc.rateLimitCooldownMs(), 50);
}

TEST_F(ThrottleTest, PauseBetweenPagesSleepsPolitenessDelay) {
    ThrottleController tc(/*politenessDelayMs=*/40, /*rateLimitCooldownMs=*/200);

    auto start = std::chrono::steady_clock::now();
    EXPECT_TRUE(tc.pauseBetweenPages());
    auto ms = elapsedMs(start);

    EXPECT_GE(ms, 35);
    EXPECT_LT(ms, 190);  // clearly not the cooldown
    EXPECT_EQ(tc.rateLimitHits(), 0);
    EXPECT_GT(tc.totalSleepSeconds(), 0.0);
}

TEST_F(ThrottleTest, CooldownSleepsLongerAndCountsHit) {
    ThrottleController tc(/*politenessDelayMs=*/5, /*rateLimitCooldownMs=*/80);

    auto start = std::chrono::steady_clock::now();
    EXPECT_TRUE(tc.coolDownAfterRateLimit());
    auto ms = elapsedMs(start);

    EXPECT_GE(ms, 75);
    EXPECT_EQ(tc.rateLimitHits(), 1);
}

TEST_F(ThrottleTest, SleepAndHitsAccumulateUntilReset) {
    ThrottleController tc(5, 20);
    tc.coolDownAfterRateLimit();
    tc.coolDownAfterRateLimit();
    tc.pauseBetweenPages();

    EXPECT_EQ(tc.rateLimitHits(), 2);
    EXPECT_GE(tc.totalSleepSeconds(), 0.040);

    tc.resetStats();
    EXPECT_EQ(tc.rateLimitHits(), 0);
    EXPECT_DOUBLE_EQ(tc.totalSleepSeconds(), 0.0);
}

TEST_F(ThrottleTest, ZeroDelayReturnsImmediately) {
    ThrottleController tc(0, 1);
    auto start = std::chrono::steady_clock::now();
    EXPECT_TRUE(tc.pauseBetweenPages());
    EXPECT_LT(elapsedMs(start), 50);
}

TEST_F(ThrottleTest, InterruptCutsCooldownShort) {
    ThrottleController tc(/*politenessDelayMs=*/1, /*rateLimitCooldownMs=*/60000);

    std::thread interrupter([] {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        requestInterrupt();
    });

    auto start = std::chrono::steady_clock::now();
    const bool completed = tc.coolDownAfterRateLimit();
    auto ms = elapsedMs(start);
    interrupter.join();

    EXPECT_FALSE(completed);
    EXPECT_LT(ms, 2000);
    EXPECT_EQ(tc.rateLimitHits(), 1);
}

TEST_F(ThrottleTest, PendingInterruptSkipsPause) {
    ThrottleController tc(1000, 2000);
    requestInterrupt();
    EXPECT_FALSE(tc.pauseBetweenPages());
}

TEST_F(ThrottleTest, NegativeDelayThrows) {
    EXPECT_THROW(ThrottleController(-1, 10), std::invalid_argument);
    EXPECT_THROW(ThrottleController(1, -10), std::invalid_argument);
}
