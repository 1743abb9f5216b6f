#include "pagination.hpp"
#include "errors.hpp"
#include "interrupt.hpp"
#include "mapping.hpp"
#include "queries.hpp"
#include "util.hpp"

#include <algorithm>
#include <iostream>
#include <optional>
#include <stdexcept>

namespace issue_harvest {

namespace {

constexpr unsigned int kTooManyRequests = 429;

} // namespace

PaginatedFetcher::PaginatedFetcher(HttpClient& client,
                                   CheckpointStore& checkpoints,
                                   BatchStore& batches,
                                   ThrottleController& throttle,
                                   FetcherOptions options)
    : mClient(client)
    , mCheckpoints(checkpoints)
    , mBatches(batches)
    , mThrottle(throttle)
    , mOptions(std::move(options))
    , mRetry(mOptions.retry, isTransient, mOptions.verbose)
{
    if (mOptions.pageSize < 1) {
        throw std::invalid_argument("PaginatedFetcher: pageSize must be >= 1");
    }
    if (mOptions.fields.empty()) {
        mOptions.fields = queries::kDefaultFields;
    }
}

// ---------------------------------------------------------------------------
// Public: paginated fetch
// ---------------------------------------------------------------------------

int64_t PaginatedFetcher::fetchAll(const std::string& sourceKey)
{
    if (!isValidSourceKey(sourceKey)) {
        throw std::invalid_argument("Invalid source key: '" + sourceKey + "'");
    }

    mStats = Stats{};
    mRetry.resetStats();
    mThrottle.resetStats();

    const std::optional<Checkpoint> resumed = mCheckpoints.load(sourceKey);
    const int64_t startOffset = resumed ? resumed->lastOffset : 0;
    int64_t currentOffset = startOffset;
    int64_t totalFetched  = startOffset;
    mStats.startOffset  = startOffset;
    mStats.totalFetched = totalFetched;

    if (startOffset > 0) {
        std::cerr << "[Fetcher] Resuming " << sourceKey << " from position "
                  << startOffset << "\n";
    }

    try {
        // --- discover the collection size ---
        const PageResult first = fetchPage(sourceKey, startOffset);
        int64_t totalKnown = first.total;
        mStats.totalKnown = totalKnown;

        std::cout << "Source " << sourceKey << ": " << totalKnown
                  << " records, starting at " << startOffset << ", "
                  << std::max<int64_t>(0, totalKnown - startOffset)
                  << " remaining\n";

        // Short pages make offsets drift from page boundaries, so batch
        // numbers are counted rather than derived from each offset.
        int64_t batchNumber = (resumed && resumed->nextBatch > 0)
                                  ? resumed->nextBatch
                                  : startOffset / mOptions.pageSize;

        while (currentOffset < totalKnown) {

            if (mOptions.verbose) {
                std::cerr << "[Fetcher] Batch " << batchNumber << ": records "
                          << currentOffset << " to "
                          << (currentOffset + mOptions.pageSize) << "\n";
            }

            const PageResult page = fetchPage(sourceKey, currentOffset);
            totalKnown = page.total;
            mStats.totalKnown = totalKnown;

            // A stale total must not spin the loop forever.
            if (page.issues.empty()) {
                std::cerr << "[Fetcher] Empty page at offset " << currentOffset
                          << " (reported total " << totalKnown
                          << "); stopping\n";
                break;
            }

            mBatches.write(sourceKey, batchNumber, page.issues);
            ++batchNumber;
            ++mStats.pagesWritten;

            const auto fetchedCount = static_cast<int64_t>(page.issues.size());
            currentOffset += fetchedCount;
            totalFetched  += fetchedCount;
            mStats.totalFetched = totalFetched;
            mStats.newlyFetched = totalFetched - startOffset;

            Checkpoint checkpoint;
            checkpoint.sourceKey    = sourceKey;
            checkpoint.lastOffset   = currentOffset;
            checkpoint.totalFetched = totalFetched;
            checkpoint.totalKnown   = totalKnown;
            checkpoint.nextBatch    = batchNumber;
            checkpoint.updatedAt    = currentIsoTimestamp();
            if (!mCheckpoints.save(sourceKey, checkpoint)) {
                // Only durability is lost; a restart re-fetches from the last
                // checkpoint that did make it to disk.
                ++mStats.checkpointFailures;
            }

            if (totalKnown > 0) {
                std::cout << "Progress " << sourceKey << ": " << totalFetched
                          << "/" << totalKnown << " ("
                          << (100 * totalFetched / totalKnown) << "%)\n";
            }

            if (currentOffset < totalKnown && !mThrottle.pauseBetweenPages()) {
                throw Interrupted();
            }
        }

    } catch (const Interrupted&) {
        std::cerr << "[Fetcher] Interrupted; " << sourceKey
                  << " checkpoint stays at " << currentOffset << "\n";
        mStats.interrupted = true;
    } catch (const FetchError& e) {
        std::cerr << "[Fetcher] Fatal " << toString(e.category())
                  << " error for " << sourceKey << ": " << e.what()
                  << "\n[Fetcher] Progress saved at position "
                  << currentOffset << "\n";
        finishStats();
        throw;
    }

    finishStats();
    return totalFetched;
}

// ---------------------------------------------------------------------------
// Private: one page, with retry and rate-limit handling
// ---------------------------------------------------------------------------

PageResult PaginatedFetcher::fetchPage(const std::string& sourceKey,
                                       int64_t startAt)
{
    const QueryParams params = queries::searchParams(
        sourceKey, mOptions.fields, startAt, mOptions.pageSize);

    for (;;) {
        if (interruptRequested()) {
            throw Interrupted();
        }

        const HttpClient::Response resp = mRetry.run([&] {
            ++mStats.totalRequests;
            return mClient.get(queries::kSearchPath, params);
        });

        if (resp.httpStatus == kTooManyRequests) {
            if (!mThrottle.coolDownAfterRateLimit()) {
                throw Interrupted();
            }
            continue;
        }

        if (!isSuccessStatus(resp.httpStatus)) {
            std::string message = "HTTP " + std::to_string(resp.httpStatus) +
                                  " for " + sourceKey + " at startAt=" +
                                  std::to_string(startAt);
            for (const auto& err : extractErrorMessages(resp.body)) {
                message += "; " + err;
            }
            throw FetchError(ErrorCategory::HttpStatus, message);
        }

        if (mOptions.verbose) {
            std::cerr << "[Fetcher] HTTP " << resp.httpStatus
                      << " for startAt=" << startAt << "\n";
        }
        return parseSearchPage(resp.body);
    }
}

void PaginatedFetcher::finishStats() {
    mStats.totalRetries      = mRetry.totalRetries();
    mStats.rateLimitHits     = mThrottle.rateLimitHits();
    mStats.totalSleepSeconds = mRetry.totalSleepSeconds() +
                               mThrottle.totalSleepSeconds();
}

bool PaginatedFetcher::isSuccessStatus(unsigned int status) {
    return status >= 200 && status < 300;
}

} // namespace issue_harvest
