#include "config.hpp"
#include "util.hpp"

#include <fstream>
#include <initializer_list>
#include <string>
#include <stdexcept>

namespace issue_harvest {

RetryOptions Config::retryOptions() const {
    RetryOptions opts;
    opts.maxAttempts = maxAttempts;
    opts.baseMs      = retryBaseMs;
    opts.minWaitMs   = retryMinWaitMs;
    opts.maxWaitMs   = retryMaxWaitMs;
    opts.jitterMs    = retryJitterMs;
    return opts;
}

FetcherOptions Config::fetcherOptions() const {
    FetcherOptions opts;
    opts.pageSize = pageSize;
    opts.fields   = fields;
    opts.retry    = retryOptions();
    opts.verbose  = verbose;
    return opts;
}

// ---------------------------------------------------------------------------
// JSON overlay
// ---------------------------------------------------------------------------

namespace {

template <typename T>
void readInto(const nlohmann::json& value, const std::string& key, T& out) {
    try {
        value.get_to(out);
    } catch (const nlohmann::json::exception& e) {
        throw std::invalid_argument("Config key '" + key + "': " + e.what());
    }
}

} // namespace

Config applyConfigJson(const nlohmann::json& doc, Config base) {
    if (!doc.is_object()) {
        throw std::invalid_argument("Config document must be a JSON object");
    }

    for (const auto& [key, value] : doc.items()) {
        if      (key == "base_url")               readInto(value, key, base.baseUrl);
        else if (key == "source_keys")            readInto(value, key, base.sourceKeys);
        else if (key == "fields")                 readInto(value, key, base.fields);
        else if (key == "page_size")              readInto(value, key, base.pageSize);
        else if (key == "max_attempts")           readInto(value, key, base.maxAttempts);
        else if (key == "retry_base_ms")          readInto(value, key, base.retryBaseMs);
        else if (key == "retry_min_wait_ms")      readInto(value, key, base.retryMinWaitMs);
        else if (key == "retry_max_wait_ms")      readInto(value, key, base.retryMaxWaitMs);
        else if (key == "retry_jitter_ms")        readInto(value, key, base.retryJitterMs);
        else if (key == "request_timeout_ms")     readInto(value, key, base.requestTimeoutMs);
        else if (key == "politeness_delay_ms")    readInto(value, key, base.politenessDelayMs);
        else if (key == "rate_limit_cooldown_ms") readInto(value, key, base.rateLimitCooldownMs);
        else if (key == "inter_source_delay_ms")  readInto(value, key, base.interSourceDelayMs);
        else if (key == "data_dir")               readInto(value, key, base.dataDir);
        else if (key == "verbose")                readInto(value, key, base.verbose);
        else {
            throw std::invalid_argument("Unknown config key: '" + key + "'");
        }
    }
    return base;
}

Config loadConfigFile(const std::filesystem::path& path, Config base) {
    std::ifstream is(path);
    if (!is) {
        throw std::invalid_argument("Cannot open config file: " + path.string());
    }

    nlohmann::json doc;
    try {
        doc = nlohmann::json::parse(is);
    } catch (const nlohmann::json::parse_error& e) {
        throw std::invalid_argument("Config file " + path.string() +
                                    " is not valid JSON: " + e.what());
    }
    return applyConfigJson(doc, std::move(base));
}

// ---------------------------------------------------------------------------
// Validation
// ---------------------------------------------------------------------------

void validateConfig(const Config& cfg) {
    parseUrl(cfg.baseUrl);  // throws std::invalid_argument

    if (cfg.sourceKeys.empty()) {
        throw std::invalid_argument("At least one source key is required");
    }
    for (const auto& key : cfg.sourceKeys) {
        if (!isValidSourceKey(key)) {
            throw std::invalid_argument("Invalid source key: '" + key +
                                        "' (allowed: A-Z a-z 0-9 _ . -)");
        }
    }
    if (cfg.pageSize < 1) {
        throw std::invalid_argument("page_size must be >= 1");
    }
    if (cfg.maxAttempts < 1) {
        throw std::invalid_argument("max_attempts must be >= 1");
    }
    if (cfg.retryBaseMs < 0 || cfg.retryMinWaitMs < 0 || cfg.retryJitterMs < 0) {
        throw std::invalid_argument("retry timings must be non-negative");
    }
    for (const int64_t ms : {cfg.retryBaseMs, cfg.retryMinWaitMs, cfg.retryMaxWaitMs,
                             cfg.retryJitterMs, cfg.politenessDelayMs,
                             cfg.rateLimitCooldownMs, cfg.interSourceDelayMs}) {
        if (ms > kMaxDelayMs) {
            throw std::invalid_argument("delays and retry timings must not exceed " +
                                        std::to_string(kMaxDelayMs) + " ms");
        }
    }
    if (cfg.retryMinWaitMs > cfg.retryMaxWaitMs) {
        throw std::invalid_argument("retry_min_wait_ms exceeds retry_max_wait_ms");
    }
    if (cfg.requestTimeoutMs < 1) {
        throw std::invalid_argument("request_timeout_ms must be >= 1");
    }
    if (cfg.politenessDelayMs < 0 || cfg.interSourceDelayMs < 0) {
        throw std::invalid_argument("delays must be non-negative");
    }
    if (cfg.rateLimitCooldownMs <= cfg.politenessDelayMs) {
        throw std::invalid_argument(
            "rate_limit_cooldown_ms must be longer than politeness_delay_ms");
    }
    if (cfg.dataDir.empty()) {
        throw std::invalid_argument("data_dir must not be empty");
    }
}

} // namespace issue_harvest
