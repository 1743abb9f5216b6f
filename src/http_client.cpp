#include "http_client.hpp"
#include "errors.hpp"

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>
#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>

#ifdef ISSUE_HARVEST_HAS_SSL
#include <boost/beast/ssl.hpp>
#include <boost/asio/ssl.hpp>
#endif

#include <chrono>
#include <iostream>
#include <stdexcept>

namespace beast = boost::beast;
namespace http  = beast::http;
namespace net   = boost::asio;
using tcp       = net::ip::tcp;

namespace issue_harvest {

namespace {

constexpr const char* kUserAgent = "issue_harvest/1.0";

http::request<http::empty_body> makeRequest(const std::string& host,
                                            const std::string& target)
{
    http::request<http::empty_body> req{http::verb::get, target, 11};
    req.set(http::field::host, host);
    req.set(http::field::accept, "application/json");
    req.set(http::field::user_agent, kUserAgent);
    return req;
}

/// Send one GET on a connected stream and read the whole response.
/// Each of write and read gets its own deadline on the TCP layer.
template <typename Stream>
HttpClient::Response exchange(Stream& stream,
                              const std::string& host,
                              const std::string& target,
                              std::chrono::milliseconds timeout)
{
    auto& tcpLayer = beast::get_lowest_layer(stream);

    auto req = makeRequest(host, target);
    tcpLayer.expires_after(timeout);
    http::write(stream, req);

    beast::flat_buffer buffer;
    http::response_parser<http::string_body> parser;
    parser.body_limit(boost::none);
    tcpLayer.expires_after(timeout);
    http::read(stream, buffer, parser);

    HttpClient::Response response;
    response.httpStatus = parser.get().result_int();
    response.body       = std::move(parser.get().body());
    return response;
}

} // namespace

// ---------------------------------------------------------------------------
// Construction
// ---------------------------------------------------------------------------

BeastHttpClient::BeastHttpClient(const std::string& endpoint, int timeoutMs)
    : mTimeoutMs(timeoutMs)
{
    auto parts = parseUrl(endpoint);
    mHost     = parts.host;
    mPort     = parts.port;
    mBasePath = parts.target;
    mUseSsl   = (parts.scheme == "https");

    if (mUseSsl) {
#ifndef ISSUE_HARVEST_HAS_SSL
        throw std::runtime_error(
            "HTTPS endpoint requested but SSL support was not compiled in. "
            "Rebuild with OpenSSL to enable HTTPS.");
#endif
    }
}

// ---------------------------------------------------------------------------
// Public API
// ---------------------------------------------------------------------------

std::string BeastHttpClient::targetFor(const std::string& path,
                                       const QueryParams& params) const
{
    std::string target = joinPath(mBasePath, path);
    if (!params.empty()) {
        target += '?';
        target += buildQueryString(params);
    }
    return target;
}

HttpClient::Response
BeastHttpClient::get(const std::string& path, const QueryParams& params)
{
    const std::string target = targetFor(path, params);

    if (mVerbose) {
        std::cerr << "[HttpClient] GET " << mHost << ":" << mPort
                  << target << "\n";
    }

    try {
        return mUseSsl ? doHttpsRequest(target) : doHttpRequest(target);
    } catch (const boost::system::system_error& e) {
        // Resolve / connect / handshake / read failures, timeouts included.
        throw FetchError(ErrorCategory::Transport,
                         "GET " + mHost + target + " failed: " + e.what());
    }
}

// ---------------------------------------------------------------------------
// Plain HTTP
// ---------------------------------------------------------------------------

HttpClient::Response
BeastHttpClient::doHttpRequest(const std::string& target)
{
    const std::chrono::milliseconds timeout(mTimeoutMs);

    net::io_context ioc;
    tcp::resolver   resolver(ioc);
    beast::tcp_stream stream(ioc);

    // resolve() blocks in getaddrinfo(); the stream deadline starts after it.

    stream.expires_after(timeout);
    stream.connect(resolver.resolve(mHost, mPort));

    Response response = exchange(stream, mHost, target, timeout);
    if (mVerbose) {
        std::cerr << "[HttpClient] HTTP " << response.httpStatus << " ("
                  << response.body.size() << " bytes)\n";
    }

    beast::error_code ec;
    stream.socket().shutdown(tcp::socket::shutdown_both, ec);
    return response;
}

// ---------------------------------------------------------------------------
// HTTPS (compiled only when OpenSSL is available)
// ---------------------------------------------------------------------------

HttpClient::Response
BeastHttpClient::doHttpsRequest(const std::string& target)
{
#ifdef ISSUE_HARVEST_HAS_SSL
    namespace ssl = net::ssl;

    net::io_context ioc;
    ssl::context    ctx(ssl::context::tlsv12_client);
    ctx.set_default_verify_paths();
    ctx.set_verify_mode(ssl::verify_peer);

    tcp::resolver resolver(ioc);
    beast::ssl_stream<beast::tcp_stream> stream(ioc, ctx);

    // SNI hostname.
    if (!SSL_set_tlsext_host_name(stream.native_handle(), mHost.c_str())) {
        beast::error_code ec{static_cast<int>(::ERR_get_error()),
                             net::error::get_ssl_category()};
        throw beast::system_error{ec, "Failed to set SNI hostname"};
    }
    stream.set_verify_callback(ssl::host_name_verification(mHost));

    const std::chrono::milliseconds timeout(mTimeoutMs);
    beast::get_lowest_layer(stream).expires_after(timeout);
    beast::get_lowest_layer(stream).connect(resolver.resolve(mHost, mPort));

    stream.handshake(ssl::stream_base::client);

    Response response = exchange(stream, mHost, target, timeout);
    if (mVerbose) {
        std::cerr << "[HttpClient] HTTPS " << response.httpStatus << " ("
                  << response.body.size() << " bytes)\n";
    }

    // Servers commonly drop the connection without close_notify.
    beast::error_code ec;
    stream.shutdown(ec);

    return response;
#else
    (void)target;
    throw std::runtime_error("HTTPS not supported: built without OpenSSL");
#endif
}

} // namespace issue_harvest
