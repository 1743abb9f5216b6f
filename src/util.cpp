#include "util.hpp"

#include <algorithm>
#include <cctype>
#include <ctime>
#include <limits>
#include <random>
#include <stdexcept>

namespace issue_harvest {

UrlParts parseUrl(const std::string& url) {
    UrlParts parts;

    // --- scheme ---
    auto schemeEnd = url.find("://");
    if (schemeEnd == std::string::npos) {
        throw std::invalid_argument("Invalid URL (missing scheme): " + url);
    }
    parts.scheme = url.substr(0, schemeEnd);
    if (parts.scheme != "http" && parts.scheme != "https") {
        throw std::invalid_argument("Invalid URL (unsupported scheme): " + url);
    }

    // --- authority (host[:port]) ---
    auto hostStart = schemeEnd + 3;
    auto pathStart = url.find('/', hostStart);

    std::string authority;
    if (pathStart == std::string::npos) {
        authority    = url.substr(hostStart);
        parts.target = "/";
    } else {
        authority    = url.substr(hostStart, pathStart - hostStart);
        parts.target = url.substr(pathStart);
    }

    // --- host / port ---
    auto colon = authority.find(':');
    if (colon == std::string::npos) {
        parts.host = authority;
        parts.port = (parts.scheme == "https") ? "443" : "80";
    } else {
        parts.host = authority.substr(0, colon);
        parts.port = authority.substr(colon + 1);
    }

    if (parts.host.empty()) {
        throw std::invalid_argument("Invalid URL (empty host): " + url);
    }
    return parts;
}

std::string urlEncode(const std::string& value) {
    static const char* kHex = "0123456789ABCDEF";

    std::string out;
    out.reserve(value.size() * 3);
    for (unsigned char c : value) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            out.push_back(static_cast<char>(c));
        } else {
            out.push_back('%');
            out.push_back(kHex[c >> 4]);
            out.push_back(kHex[c & 0x0F]);
        }
    }
    return out;
}

std::string buildQueryString(const QueryParams& params) {
    std::string query;
    for (const auto& [key, value] : params) {
        if (!query.empty()) query += '&';
        query += urlEncode(key);
        query += '=';
        query += urlEncode(value);
    }
    return query;
}

std::string joinPath(const std::string& base, const std::string& path) {
    if (base.empty()) return path.empty() ? "/" : path;
    if (path.empty()) return base;

    const bool baseSlash = base.back() == '/';
    const bool pathSlash = path.front() == '/';
    if (baseSlash && pathSlash) return base + path.substr(1);
    if (!baseSlash && !pathSlash) return base + "/" + path;
    return base + path;
}

std::chrono::milliseconds computeBackoffMs(int attempt,
                                           int64_t baseMs,
                                           int64_t minMs,
                                           int64_t maxMs,
                                           int64_t jitterMs)
{
    // Exponential: base * 2^(attempt-1), saturating instead of overflowing.
    const int exponent = std::clamp(attempt - 1, 0, 30);
    const int64_t base = std::max<int64_t>(0, baseMs);
    constexpr int64_t kLargest = std::numeric_limits<int64_t>::max();
    int64_t backoff = base > (kLargest >> exponent)
                          ? kLargest
                          : base * (int64_t{1} << exponent);
    backoff = std::min(maxMs, std::max(minMs, backoff));

    if (jitterMs > 0 && backoff <= kLargest - jitterMs) {
        static thread_local std::mt19937 rng{std::random_device{}()};
        std::uniform_int_distribution<int64_t> jitter(0, jitterMs);
        backoff += jitter(rng);
    }

    return std::chrono::milliseconds(backoff);
}

std::string currentIsoTimestamp() {
    const std::time_t now = std::time(nullptr);
    std::tm local{};
    localtime_r(&now, &local);

    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &local);
    return buf;
}

bool isValidSourceKey(const std::string& key) {
    if (key.empty()) return false;
    return std::all_of(key.begin(), key.end(), [](unsigned char c) {
        return std::isalnum(c) || c == '_' || c == '-' || c == '.';
    });
}

} // namespace issue_harvest
