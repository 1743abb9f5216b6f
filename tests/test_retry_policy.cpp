/// @file test_retry_policy.cpp
/// Unit tests for retry_policy.hpp — bounded exponential backoff.

#include "errors.hpp"
#include "interrupt.hpp"
#include "retry_policy.hpp"

#include <gtest/gtest.h>
#include <stdexcept>
#include <string>

using namespace issue_harvest;

namespace {

/// Millisecond waits so the tests stay fast.
RetryOptions fastOptions(int maxAttempts) {
    RetryOptions opts;
    opts.maxAttempts = maxAttempts;
    opts.baseMs      = 1;
    opts.minWaitMs   = 1;
    opts.maxWaitMs   = 4;
    return opts;
}

class RetryPolicyTest : public ::testing::Test {
protected:
    void SetUp() override    { clearInterrupt(); }
    void TearDown() override { clearInterrupt(); }
};

} // namespace

TEST_F(RetryPolicyTest, ReturnsFirstSuccessWithoutRetrying) {
    RetryPolicy policy(fastOptions(5));
    int calls = 0;

    int result = policy.run([&] { ++calls; return 42; });

    EXPECT_EQ(result, 42);
    EXPECT_EQ(calls, 1);
    EXPECT_EQ(policy.totalRetries(), 0);
}

TEST_F(RetryPolicyTest, RetriesTransientErrorsUntilSuccess) {
    RetryPolicy policy(fastOptions(5));
    int calls = 0;

    std::string result = policy.run([&]() -> std::string {
        if (++calls < 3) {
            throw FetchError(ErrorCategory::Transport, "timeout");
        }
        return "ok";
    });

    EXPECT_EQ(result, "ok");
    EXPECT_EQ(calls, 3);
    EXPECT_EQ(policy.totalRetries(), 2);
    EXPECT_GT(policy.totalSleepSeconds(), 0.0);
}

TEST_F(RetryPolicyTest, ExhaustionAfterMaxAttempts) {
    RetryPolicy policy(fastOptions(4));
    int calls = 0;

    try {
        policy.run([&]() -> int {
            ++calls;
            throw FetchError(ErrorCategory::Transport, "connection reset");
        });
        FAIL() << "expected FetchError";
    } catch (const FetchError& e) {
        EXPECT_EQ(e.category(), ErrorCategory::RetriesExhausted);
        EXPECT_NE(std::string(e.what()).find("connection reset"), std::string::npos);
    }

    EXPECT_EQ(calls, 4);
    EXPECT_EQ(policy.totalRetries(), 3);
}

TEST_F(RetryPolicyTest, NonRetryableCategoryPropagatesImmediately) {
    RetryPolicy policy(fastOptions(5));
    int calls = 0;

    try {
        policy.run([&]() -> int {
            ++calls;
            throw FetchError(ErrorCategory::HttpStatus, "HTTP 404");
        });
        FAIL() << "expected FetchError";
    } catch (const FetchError& e) {
        EXPECT_EQ(e.category(), ErrorCategory::HttpStatus);
    }
    EXPECT_EQ(calls, 1);
}

TEST_F(RetryPolicyTest, OtherExceptionsAreNotCaught) {
    RetryPolicy policy(fastOptions(5));
    int calls = 0;

    EXPECT_THROW(policy.run([&]() -> int {
        ++calls;
        throw std::logic_error("bug");
    }), std::logic_error);
    EXPECT_EQ(calls, 1);
}

TEST_F(RetryPolicyTest, CustomPredicateWidensRetries) {
    RetryPolicy policy(fastOptions(3), [](ErrorCategory c) {
        return c == ErrorCategory::Transport || c == ErrorCategory::HttpStatus;
    });
    int calls = 0;

    int result = policy.run([&]() -> int {
        if (++calls == 1) {
            throw FetchError(ErrorCategory::HttpStatus, "HTTP 503");
        }
        return 7;
    });
    EXPECT_EQ(result, 7);
    EXPECT_EQ(calls, 2);
}

TEST_F(RetryPolicyTest, SingleAttemptNeverSleeps) {
    RetryPolicy policy(fastOptions(1));
    EXPECT_THROW(policy.run([]() -> int {
        throw FetchError(ErrorCategory::Transport, "down");
    }), FetchError);
    EXPECT_EQ(policy.totalRetries(), 0);
    EXPECT_DOUBLE_EQ(policy.totalSleepSeconds(), 0.0);
}

TEST_F(RetryPolicyTest, DelayFollowsConfiguredBounds) {
    RetryOptions opts;
    opts.maxAttempts = 5;
    opts.baseMs      = 1000;
    opts.minWaitMs   = 2000;
    opts.maxWaitMs   = 60000;
    RetryPolicy policy(opts);

    EXPECT_EQ(policy.delayBefore(2).count(), 2000);
    EXPECT_EQ(policy.delayBefore(3).count(), 4000);
    EXPECT_EQ(policy.delayBefore(4).count(), 8000);
    EXPECT_EQ(policy.delayBefore(8).count(), 60000);
}

TEST_F(RetryPolicyTest, InterruptDuringBackoffThrowsInterrupted) {
    RetryOptions opts = fastOptions(5);
    opts.minWaitMs = 10000;
    opts.maxWaitMs = 10000;
    RetryPolicy policy(opts);
    requestInterrupt();

    EXPECT_THROW(policy.run([]() -> int {
        throw FetchError(ErrorCategory::Transport, "timeout");
    }), Interrupted);
}

TEST_F(RetryPolicyTest, InvalidOptionsThrow) {
    RetryOptions zero = fastOptions(0);
    EXPECT_THROW(RetryPolicy{zero}, std::invalid_argument);

    RetryOptions inverted = fastOptions(3);
    inverted.minWaitMs = 10;
    inverted.maxWaitMs = 5;
    EXPECT_THROW(RetryPolicy{inverted}, std::invalid_argument);
}

TEST(ErrorCategories, OnlyTransportIsTransient) {
    EXPECT_TRUE(isTransient(ErrorCategory::Transport));
    EXPECT_FALSE(isTransient(ErrorCategory::HttpStatus));
    EXPECT_FALSE(isTransient(ErrorCategory::MalformedResponse));
    EXPECT_FALSE(isTransient(ErrorCategory::RetriesExhausted));
    EXPECT_FALSE(isTransient(ErrorCategory::Storage));
    EXPECT_STREQ(toString(ErrorCategory::RetriesExhausted), "retries-exhausted");
}
