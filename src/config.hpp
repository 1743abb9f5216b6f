#pragma once

#include "pagination.hpp"
#include "retry_policy.hpp"

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace issue_harvest {

/// Upper bound for every configured delay (one day).
inline constexpr int64_t kMaxDelayMs = 24LL * 60 * 60 * 1000;

/// Everything a run needs, with the defaults used when neither a config
/// file nor a flag overrides a value.  Times are in milliseconds.
struct Config {
    std::string              baseUrl    = "https://issues.apache.org/jira/rest/api/2";
    std::vector<std::string> sourceKeys = {"KAFKA", "SPARK", "HADOOP"};
    std::vector<std::string> fields;        // empty = queries::kDefaultFields

    int     pageSize            = 100;
    int     maxAttempts         = 5;
    int64_t retryBaseMs         = 1000;
    int64_t retryMinWaitMs      = 2000;
    int64_t retryMaxWaitMs      = 60000;
    int64_t retryJitterMs       = 0;
    int     requestTimeoutMs    = 30000;
    int64_t politenessDelayMs   = 1000;
    int64_t rateLimitCooldownMs = 60000;
    int64_t interSourceDelayMs  = 5000;

    std::string dataDir = "data";
    bool        verbose = false;

    std::filesystem::path rawDir()        const { return std::filesystem::path(dataDir) / "raw"; }
    std::filesystem::path processedDir()  const { return std::filesystem::path(dataDir) / "processed"; }
    std::filesystem::path checkpointDir() const { return std::filesystem::path(dataDir) / "checkpoints"; }

    RetryOptions   retryOptions() const;
    FetcherOptions fetcherOptions() const;
};

/// Overlay the keys present in @p doc onto @p base.
/// Throws std::invalid_argument on unknown keys or mistyped values.
Config applyConfigJson(const nlohmann::json& doc, Config base = {});

/// Read a JSON config file and overlay it onto @p base.
/// Throws std::invalid_argument if the file cannot be read or parsed.
Config loadConfigFile(const std::filesystem::path& path, Config base = {});

/// Throws std::invalid_argument describing the first invalid setting.
void validateConfig(const Config& cfg);

} // namespace issue_harvest
