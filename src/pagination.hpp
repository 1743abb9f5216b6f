#pragma once

#include "batch_store.hpp"
#include "checkpoint_store.hpp"
#include "http_client.hpp"
#include "models.hpp"
#include "retry_policy.hpp"
#include "throttle.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace issue_harvest {

struct FetcherOptions {
    int                      pageSize = 100;
    std::vector<std::string> fields;          // empty = queries::kDefaultFields
    RetryOptions             retry;
    bool                     verbose  = false;
};

/// Drives offset-based pagination over one source key's collection.
///
/// Every page is persisted as a batch file before the checkpoint is advanced,
/// so the stored checkpoint always points just past a flushed batch.  Network
/// failures go through the retry policy; HTTP 429 goes through the throttle
/// cooldown and does not consume retry budget.
class PaginatedFetcher {
public:
    struct Stats {
        int64_t totalFetched      = 0;   // cumulative, includes resumed offset
        int64_t newlyFetched      = 0;   // fetched by this run
        int64_t startOffset       = 0;
        int64_t totalKnown        = 0;
        int     pagesWritten      = 0;
        int     totalRequests     = 0;
        int     totalRetries      = 0;
        int     rateLimitHits     = 0;
        int     checkpointFailures = 0;
        double  totalSleepSeconds = 0.0;
        bool    interrupted       = false;
    };

    PaginatedFetcher(HttpClient& client,
                     CheckpointStore& checkpoints,
                     BatchStore& batches,
                     ThrottleController& throttle,
                     FetcherOptions options = {});

    /// Fetch every remaining record of @p sourceKey, resuming from its
    /// checkpoint.  Returns the cumulative number of records fetched.
    /// Throws FetchError for non-retryable responses, exhausted retries and
    /// batch persistence failures; an interrupt returns the count so far.
    int64_t fetchAll(const std::string& sourceKey);

    Stats getStats() const { return mStats; }

private:
    HttpClient&         mClient;
    CheckpointStore&    mCheckpoints;
    BatchStore&         mBatches;
    ThrottleController& mThrottle;
    FetcherOptions      mOptions;
    RetryPolicy         mRetry;
    Stats               mStats{};

    /// One page at @p startAt: retries transport errors, waits out 429s,
    /// rejects any other non-2xx status.
    PageResult fetchPage(const std::string& sourceKey, int64_t startAt);

    void finishStats();

    static bool isSuccessStatus(unsigned int status);
};

} // namespace issue_harvest
