#include "pipeline.hpp"
#include "batch_store.hpp"
#include "checkpoint_store.hpp"
#include "errors.hpp"
#include "interrupt.hpp"
#include "pagination.hpp"
#include "throttle.hpp"
#include "transformer.hpp"
#include "util.hpp"

#include <chrono>
#include <iomanip>
#include <iostream>
#include <stdexcept>

namespace issue_harvest {

namespace {

void printBanner(const std::string& title, const Config& cfg) {
    std::cout << "\n" << std::string(70, '=') << "\n"
              << title << "\n"
              << "Sources: ";
    for (std::size_t i = 0; i < cfg.sourceKeys.size(); ++i) {
        std::cout << (i ? ", " : "") << cfg.sourceKeys[i];
    }
    std::cout << "\nStart time: " << currentIsoTimestamp() << "\n"
              << std::string(70, '=') << "\n";
}

void printFetchStats(const PaginatedFetcher::Stats& stats) {
    std::cout
        << "  Total fetched:     " << stats.totalFetched  << "\n"
        << "  New this run:      " << stats.newlyFetched  << "\n"
        << "  Pages written:     " << stats.pagesWritten  << "\n"
        << "  Requests:          " << stats.totalRequests << "\n"
        << "  Retries:           " << stats.totalRetries  << "\n"
        << "  Rate-limit hits:   " << stats.rateLimitHits << "\n"
        << "  Sleep (s):         " << std::fixed << std::setprecision(2)
                                   << stats.totalSleepSeconds << "\n";
    if (stats.checkpointFailures > 0) {
        std::cout << "  Checkpoint writes failed: " << stats.checkpointFailures
                  << "\n";
    }
}

} // namespace

// ---------------------------------------------------------------------------
// Scrape
// ---------------------------------------------------------------------------

RunSummary scrapeAll(const Config& cfg, HttpClient& client, bool reset)
{
    RunSummary summary;
    printBanner("SCRAPING PIPELINE", cfg);

    CheckpointStore    checkpoints(cfg.checkpointDir(), cfg.verbose);
    BatchStore         batches(cfg.rawDir(), cfg.verbose);
    ThrottleController throttle(cfg.politenessDelayMs, cfg.rateLimitCooldownMs);
    PaginatedFetcher   fetcher(client, checkpoints, batches, throttle,
                               cfg.fetcherOptions());

    const std::size_t count = cfg.sourceKeys.size();
    for (std::size_t i = 0; i < count; ++i) {
        const std::string& key = cfg.sourceKeys[i];
        std::cout << "\n[" << (i + 1) << "/" << count << "] Scraping "
                  << key << "\n";

        if (reset) {
            checkpoints.remove(key);
        }

        try {
            const int64_t total = fetcher.fetchAll(key);
            const auto stats = fetcher.getStats();
            printFetchStats(stats);

            if (stats.interrupted) {
                std::cout << "Scraping interrupted for " << key
                          << " at " << total << " records. "
                          << "Progress has been saved; run again to resume.\n";
                summary.interrupted = true;
                break;
            }
            std::cout << "Scraped " << total << " records from " << key << "\n";
            summary.succeeded.push_back(key);

        } catch (const FetchError& e) {
            std::cerr << "[Pipeline] Error scraping " << key << ": "
                      << e.what() << "\n";
            summary.failed.push_back(key);
        } catch (const std::invalid_argument& e) {
            std::cerr << "[Pipeline] Skipping " << key << ": " << e.what() << "\n";
            summary.failed.push_back(key);
        }

        if (i + 1 < count && cfg.interSourceDelayMs > 0) {
            std::cout << "Waiting " << cfg.interSourceDelayMs
                      << " ms before next source...\n";
            if (!sleepInterruptibly(std::chrono::milliseconds(cfg.interSourceDelayMs))) {
                summary.interrupted = true;
                break;
            }
        }
    }

    printSummary("SCRAPING SUMMARY", summary);
    return summary;
}

// ---------------------------------------------------------------------------
// Transform
// ---------------------------------------------------------------------------

RunSummary transformAll(const Config& cfg)
{
    RunSummary summary;
    printBanner("TRANSFORMATION PIPELINE", cfg);

    BatchStore  batches(cfg.rawDir(), cfg.verbose);
    Transformer transformer(batches, cfg.processedDir(), cfg.verbose);

    const std::size_t count = cfg.sourceKeys.size();
    for (std::size_t i = 0; i < count; ++i) {
        if (interruptRequested()) {
            summary.interrupted = true;
            break;
        }

        const std::string& key = cfg.sourceKeys[i];
        std::cout << "\n[" << (i + 1) << "/" << count << "] Transforming "
                  << key << "\n";

        try {
            const std::size_t written = transformer.transformAll(key);
            if (written == 0) {
                std::cout << "No data to transform for " << key << "\n";
                summary.failed.push_back(key);
                continue;
            }
            std::cout << "Created " << written << " training examples from "
                      << key << "\n";
            summary.succeeded.push_back(key);
        } catch (const std::runtime_error& e) {
            std::cerr << "[Pipeline] Error transforming " << key << ": "
                      << e.what() << "\n";
            summary.failed.push_back(key);
        }
    }

    printSummary("TRANSFORMATION SUMMARY", summary);
    return summary;
}

void printSummary(const std::string& title, const RunSummary& summary) {
    std::cout << "\n" << std::string(70, '=') << "\n" << title << "\n"
              << std::string(70, '=') << "\n"
              << "Successful: " << summary.succeeded.size() << "\n";
    for (const auto& key : summary.succeeded) {
        std::cout << "  - " << key << "\n";
    }
    if (!summary.failed.empty()) {
        std::cout << "Failed: " << summary.failed.size() << "\n";
        for (const auto& key : summary.failed) {
            std::cout << "  - " << key << "\n";
        }
    }
    if (summary.interrupted) {
        std::cout << "Interrupted before all sources were processed\n";
    }
    std::cout << "End time: " << currentIsoTimestamp() << "\n"
              << std::string(70, '=') << "\n";
}

} // namespace issue_harvest
