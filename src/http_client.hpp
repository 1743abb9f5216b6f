#pragma once

#include "util.hpp"

#include <string>

namespace issue_harvest {

/// Transport seam used by the fetcher.  Implementations throw
/// FetchError(Transport) for network-level failures and return every
/// HTTP response, whatever its status, as a Response.
class HttpClient {
public:
    struct Response {
        unsigned int httpStatus = 0;
        std::string  body;
    };

    virtual ~HttpClient() = default;

    /// GET @p path (relative to the endpoint's base path) with @p params.
    virtual Response get(const std::string& path, const QueryParams& params) = 0;
};

/// Blocking HTTP(S) client built on Boost.Beast.
///
/// Connect, TLS handshake, write and read each run under timeoutMs.  Host
/// name resolution does not: it is a blocking getaddrinfo() call and is
/// bounded only by the system resolver's own timeout and retry settings
/// (resolv.conf "timeout"/"attempts").
class BeastHttpClient : public HttpClient {
public:
    /// @param endpoint   Base URL, e.g. "https://issues.apache.org/jira/rest/api/2"
    /// @param timeoutMs  Per-operation timeout in milliseconds (not applied to DNS)
    explicit BeastHttpClient(const std::string& endpoint, int timeoutMs = 30000);

    Response get(const std::string& path, const QueryParams& params) override;

    void setVerbose(bool v) { mVerbose = v; }

    /// Full request target for @p path and @p params ("/base/path?k=v").
    std::string targetFor(const std::string& path, const QueryParams& params) const;

private:
    std::string mHost;
    std::string mPort;
    std::string mBasePath;
    int         mTimeoutMs;
    bool        mVerbose = false;
    bool        mUseSsl  = false;

    Response doHttpRequest(const std::string& target);
    Response doHttpsRequest(const std::string& target);
};

} // namespace issue_harvest
