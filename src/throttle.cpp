#include "throttle.hpp"
#include "interrupt.hpp"

#include <chrono>
#include <iostream>
#include <stdexcept>

namespace issue_harvest {

ThrottleController::ThrottleController(int64_t politenessDelayMs,
                                       int64_t rateLimitCooldownMs)
    : mPolitenessDelayMs(politenessDelayMs)
    , mRateLimitCooldownMs(rateLimitCooldownMs)
{
    if (politenessDelayMs < 0 || rateLimitCooldownMs < 0) {
        throw std::invalid_argument("ThrottleController: negative delay");
    }
}

bool ThrottleController::pauseBetweenPages() {
    return sleep(mPolitenessDelayMs);
}

bool ThrottleController::coolDownAfterRateLimit() {
    ++mRateLimitHits;
    std::cerr << "[Throttle] Rate limited (HTTP 429): cooling down "
              << mRateLimitCooldownMs << " ms before re-issuing the request\n";
    return sleep(mRateLimitCooldownMs);
}

void ThrottleController::resetStats() {
    mTotalSleep    = 0.0;
    mRateLimitHits = 0;
}

bool ThrottleController::sleep(int64_t ms) {
    const auto start = std::chrono::steady_clock::now();
    const bool completed = sleepInterruptibly(std::chrono::milliseconds(ms));
    const std::chrono::duration<double> slept =
        std::chrono::steady_clock::now() - start;
    mTotalSleep += slept.count();
    return completed;
}

} // namespace issue_harvest
