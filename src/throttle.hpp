#pragma once

#include <chrono>
#include <cstdint>

namespace issue_harvest {

/// Owns the two deliberate pauses of a fetch run: the short politeness delay
/// between pages and the longer fixed cooldown after an HTTP 429.
/// Both sleeps wake early on interrupt and then return false.
class ThrottleController {
public:
    ThrottleController(int64_t politenessDelayMs = 1000,
                       int64_t rateLimitCooldownMs = 60000);

    bool pauseBetweenPages();

    /// Called once per 429 response; the caller re-issues the same request.
    bool coolDownAfterRateLimit();

    // ---- accessors for summary report ----
    double totalSleepSeconds() const { return mTotalSleep; }
    int    rateLimitHits()     const { return mRateLimitHits; }
    int64_t politenessDelayMs() const { return mPolitenessDelayMs; }
    int64_t rateLimitCooldownMs() const { return mRateLimitCooldownMs; }
    void   resetStats();

private:
    int64_t mPolitenessDelayMs;
    int64_t mRateLimitCooldownMs;

    double mTotalSleep    = 0.0;
    int    mRateLimitHits = 0;

    bool sleep(int64_t ms);
};

} // namespace issue_harvest
