#pragma once

#include <cstdint>
#include <string>

#include <nlohmann/json.hpp>

namespace issue_harvest {

/// Durable progress marker for one source key.
/// Invariant when written: lastOffset == totalFetched.
struct Checkpoint {
    std::string sourceKey;
    int64_t     lastOffset   = 0;   // index of the next unfetched record
    int64_t     totalFetched = 0;   // records persisted so far
    int64_t     totalKnown   = 0;   // last observed remote total
    int64_t     nextBatch    = 0;   // number of the next batch file; 0 = derive from lastOffset
    std::string updatedAt;          // ISO-8601

    bool operator==(const Checkpoint& other) const {
        return sourceKey == other.sourceKey &&
               lastOffset == other.lastOffset &&
               totalFetched == other.totalFetched &&
               totalKnown == other.totalKnown &&
               nextBatch == other.nextBatch &&
               updatedAt == other.updatedAt;
    }
    bool operator!=(const Checkpoint& other) const { return !(*this == other); }
};

void to_json(nlohmann::json& j, const Checkpoint& cp);

/// Throws nlohmann::json::exception on missing or mistyped fields.
/// "next_batch" is optional; files written without it load with nextBatch 0.
void from_json(const nlohmann::json& j, Checkpoint& cp);

/// One page of the remote search collection.
struct PageResult {
    int64_t        total = 0;                       // remote collection size
    nlohmann::json issues = nlohmann::json::array();
};

} // namespace issue_harvest
