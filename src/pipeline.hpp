#pragma once

#include "config.hpp"
#include "http_client.hpp"

#include <string>
#include <vector>

namespace issue_harvest {

/// Outcome of running one stage over every configured source key.
struct RunSummary {
    std::vector<std::string> succeeded;
    std::vector<std::string> failed;
    bool                     interrupted = false;

    bool ok() const { return failed.empty() && !interrupted; }
};

/// Scrape every key in cfg.sourceKeys, one after the other.  A fatal error
/// for one key is reported and the next key is still attempted; an
/// interrupt stops the remaining keys.  With @p reset, each key's
/// checkpoint is deleted before its run.
RunSummary scrapeAll(const Config& cfg, HttpClient& client, bool reset = false);

/// Transform the raw batches of every key in cfg.sourceKeys.
RunSummary transformAll(const Config& cfg);

void printSummary(const std::string& title, const RunSummary& summary);

} // namespace issue_harvest
