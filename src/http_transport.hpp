#pragma once

#include <map>
#include <string>

#include <boost/asio/ssl/context.hpp>

namespace msgraph_sync {

struct UrlParts;

enum class HttpVerb { Get, Post };

struct HttpRequest {
    HttpVerb                           verb = HttpVerb::Get;
    std::string                        url;
    std::map<std::string, std::string> headers;
    std::string                        body;
};

struct HttpResponse {
    unsigned int                       status = 0;
    std::map<std::string, std::string> headers;
    std::string                        body;
};

/// Sends one HTTP exchange.  Implementations must tolerate concurrent
/// send() calls from the refresh-timer thread and the caller's thread.
class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    /// @throws ConnectionError on resolve / connect / TLS / IO / timeout failure.
    /// @throws FatalError if the request URL cannot be parsed.
    virtual HttpResponse send(const HttpRequest& request) = 0;
};

/// Blocking HTTP(S) transport built on Boost.Beast.  Each send() drives its
/// own io_context so connect, handshake, write and read are all bounded by
/// the timeout; the TLS context is shared.
class BeastTransport : public HttpTransport {
public:
    /// @param timeoutMs  Per-operation timeout in milliseconds
    explicit BeastTransport(int timeoutMs = 30000);

    HttpResponse send(const HttpRequest& request) override;

    void setVerbose(bool v) { mVerbose = v; }

private:
    boost::asio::ssl::context mSslCtx;
    int                       mTimeoutMs;
    bool                      mVerbose = false;

    HttpResponse doHttpRequest(const HttpRequest& request, const UrlParts& parts);
    HttpResponse doHttpsRequest(const HttpRequest& request, const UrlParts& parts);
};

} // namespace msgraph_sync
