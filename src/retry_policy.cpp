#include "retry_policy.hpp"
#include "interrupt.hpp"
#include "util.hpp"

#include <iostream>
#include <stdexcept>

namespace issue_harvest {

RetryPolicy::RetryPolicy(RetryOptions options, Predicate retryable, bool verbose)
    : mOptions(options)
    , mRetryable(std::move(retryable))
    , mVerbose(verbose)
{
    if (mOptions.maxAttempts < 1) {
        throw std::invalid_argument("RetryPolicy: maxAttempts must be >= 1");
    }
    if (mOptions.minWaitMs > mOptions.maxWaitMs) {
        throw std::invalid_argument("RetryPolicy: minWaitMs exceeds maxWaitMs");
    }
    if (!mRetryable) {
        mRetryable = isTransient;
    }
}

std::chrono::milliseconds RetryPolicy::delayBefore(int attempt) const {
    return computeBackoffMs(attempt,
                            mOptions.baseMs,
                            mOptions.minWaitMs,
                            mOptions.maxWaitMs,
                            mOptions.jitterMs);
}

void RetryPolicy::resetStats() {
    mTotalRetries = 0;
    mTotalSleep   = 0.0;
}

void RetryPolicy::backOff(int nextAttempt, const FetchError& cause) {
    ++mTotalRetries;
    const auto delay = delayBefore(nextAttempt);

    std::cerr << "[Retry] " << toString(cause.category()) << " error: "
              << cause.what() << " (attempt " << (nextAttempt - 1) << "/"
              << mOptions.maxAttempts << "), backing off "
              << delay.count() << " ms\n";

    mTotalSleep += delay.count() / 1000.0;
    if (!sleepInterruptibly(delay)) {
        if (mVerbose) {
            std::cerr << "[Retry] Interrupted during backoff\n";
        }
        throw Interrupted();
    }
}

} // namespace issue_harvest
