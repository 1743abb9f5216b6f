#pragma once

#include "errors.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>
#include <utility>

namespace issue_harvest {

struct RetryOptions {
    int     maxAttempts = 5;
    int64_t baseMs      = 1000;
    int64_t minWaitMs   = 2000;
    int64_t maxWaitMs   = 60000;
    int64_t jitterMs    = 0;
};

/// Wraps a callable with bounded exponential-backoff retries.
///
/// A FetchError whose category satisfies the predicate is retried; any other
/// exception propagates on the spot.  Once maxAttempts calls have failed the
/// policy throws FetchError(RetriesExhausted) carrying the last message.
class RetryPolicy {
public:
    using Predicate = std::function<bool(ErrorCategory)>;

    explicit RetryPolicy(RetryOptions options = {},
                         Predicate retryable = isTransient,
                         bool verbose = false);

    template <typename Fn>
    auto run(Fn&& fn) -> decltype(fn());

    /// Wait that precedes attempt @p attempt (attempt >= 2).
    std::chrono::milliseconds delayBefore(int attempt) const;

    const RetryOptions& options() const { return mOptions; }

    // ---- accessors for summary report ----
    int    totalRetries()      const { return mTotalRetries; }
    double totalSleepSeconds() const { return mTotalSleep; }
    void   resetStats();

private:
    RetryOptions mOptions;
    Predicate    mRetryable;
    bool         mVerbose;

    int    mTotalRetries = 0;
    double mTotalSleep   = 0.0;

    /// Log, then sleep before attempt @p nextAttempt.
    /// Throws Interrupted if the sleep is cut short.
    void backOff(int nextAttempt, const FetchError& cause);
};

template <typename Fn>
auto RetryPolicy::run(Fn&& fn) -> decltype(fn())
{
    std::string lastError;

    for (int attempt = 1; attempt <= mOptions.maxAttempts; ++attempt) {
        try {
            return fn();
        } catch (const FetchError& e) {
            if (!mRetryable(e.category())) {
                throw;
            }
            lastError = e.what();
            if (attempt == mOptions.maxAttempts) {
                break;
            }
            backOff(attempt + 1, e);
        }
    }

    throw FetchError(ErrorCategory::RetriesExhausted,
                     "Max retries exceeded after " +
                     std::to_string(mOptions.maxAttempts) +
                     " attempts.  Last error: " + lastError);
}

} // namespace issue_harvest
