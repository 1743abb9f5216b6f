#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace issue_harvest {

/// Decomposed URL components.
struct UrlParts {
    std::string scheme;   // "http" or "https"
    std::string host;
    std::string port;     // "80", "443", "8080", etc.
    std::string target;   // path component (e.g. "/jira/rest/api/2")
};

/// Ordered query parameters; order is preserved on the wire.
using QueryParams = std::vector<std::pair<std::string, std::string>>;

/// Parse an HTTP(S) URL into its components.
/// Throws std::invalid_argument on malformed input.
UrlParts parseUrl(const std::string& url);

/// Percent-encode everything outside the RFC 3986 unreserved set.
std::string urlEncode(const std::string& value);

/// Render params as "k1=v1&k2=v2" with both sides percent-encoded.
std::string buildQueryString(const QueryParams& params);

/// Join a base path and a relative path with exactly one '/' between them.
std::string joinPath(const std::string& base, const std::string& path);

/// Compute the wait before attempt @p attempt (1-based; attempt 1 never
/// waits, so callers pass n >= 2):
///   min(maxMs, max(minMs, baseMs * 2^(attempt-1))) + uniform[0, jitterMs]
std::chrono::milliseconds computeBackoffMs(int attempt,
                                           int64_t baseMs,
                                           int64_t minMs,
                                           int64_t maxMs,
                                           int64_t jitterMs = 0);

/// Local wall-clock time as ISO-8601 ("2025-11-02T04:45:00").
std::string currentIsoTimestamp();

/// Source keys become file-name prefixes: [A-Za-z0-9_.-]+ only.
bool isValidSourceKey(const std::string& key);

} // namespace issue_harvest
