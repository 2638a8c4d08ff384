#include "http_transport.hpp"
#include "errors.hpp"
#include "util.hpp"

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/version.hpp>
#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>

#include <chrono>
#include <iostream>
#include <stdexcept>
#include <string>
#include <utility>

namespace beast = boost::beast;
namespace http  = beast::http;
namespace net   = boost::asio;
namespace ssl   = net::ssl;
using tcp       = net::ip::tcp;

namespace msgraph_sync {

namespace {

http::request<http::string_body>
makeBeastRequest(const HttpRequest& request, const UrlParts& parts) {
    const auto verb = request.verb == HttpVerb::Post ? http::verb::post
                                                     : http::verb::get;
    http::request<http::string_body> req{verb, parts.target, 11};
    // Host carries the port whenever the URL spelled one out.
    req.set(http::field::host, parts.authority);
    for (const auto& [name, value] : request.headers) {
        req.set(name, value);
    }
    if (request.verb == HttpVerb::Post) {
        req.body() = request.body;
    }
    req.prepare_payload();
    return req;
}

HttpResponse toResponse(http::response<http::string_body>& res) {
    HttpResponse response;
    response.status = res.result_int();
    for (const auto& field : res) {
        const auto name  = field.name_string();
        const auto value = field.value();
        response.headers[std::string(name.data(), name.size())] =
            std::string(value.data(), value.size());
    }
    response.body = std::move(res.body());
    return response;
}

/// Start one async operation via @p initiate and drive @p ioc until it
/// completes.  The stream's expiry turns a stall into beast::error::timeout.
/// @throws boost::system::system_error if the operation failed.
template <typename Initiate>
void runOperation(net::io_context& ioc, Initiate&& initiate) {
    beast::error_code result;
    initiate([&result](const beast::error_code& ec, auto&&...) { result = ec; });
    ioc.restart();
    ioc.run();
    if (result) {
        throw boost::system::system_error(result);
    }
}

} // namespace

// ---------------------------------------------------------------------------
// Construction
// ---------------------------------------------------------------------------

BeastTransport::BeastTransport(int timeoutMs)
    : mSslCtx(ssl::context::tlsv12_client)
    , mTimeoutMs(timeoutMs)
{
    mSslCtx.set_default_verify_paths();
    mSslCtx.set_verify_mode(ssl::verify_peer);
}

// ---------------------------------------------------------------------------
// Public API
// ---------------------------------------------------------------------------

HttpResponse BeastTransport::send(const HttpRequest& request)
{
    UrlParts parts;
    try {
        parts = parseUrl(request.url);
    } catch (const std::invalid_argument& e) {
        throw FatalError(std::string("Invalid request URL: ") + e.what());
    }

    if (mVerbose) {
        std::cerr << "[BeastTransport] "
                  << (request.verb == HttpVerb::Post ? "POST " : "GET ")
                  << parts.host << ":" << parts.port << "\n";
    }

    try {
        return parts.scheme == "https"
            ? doHttpsRequest(request, parts)
            : doHttpRequest(request, parts);
    } catch (const boost::system::system_error& e) {
        throw ConnectionError("Connection to " + parts.host + ":" + parts.port +
                              " failed: " + e.what());
    }
}

// ---------------------------------------------------------------------------
// Plain HTTP
// ---------------------------------------------------------------------------

HttpResponse BeastTransport::doHttpRequest(const HttpRequest& request,
                                           const UrlParts& parts)
{
    net::io_context   ioc;
    tcp::resolver     resolver(ioc);
    beast::tcp_stream stream(ioc);

    auto const results = resolver.resolve(parts.host, parts.port);

    // Connect, write and read each get their own deadline.
    stream.expires_after(std::chrono::milliseconds(mTimeoutMs));
    runOperation(ioc, [&](auto handler) {
        stream.async_connect(results, std::move(handler));
    });

    auto req = makeBeastRequest(request, parts);
    stream.expires_after(std::chrono::milliseconds(mTimeoutMs));
    runOperation(ioc, [&](auto handler) {
        http::async_write(stream, req, std::move(handler));
    });

    beast::flat_buffer buffer;
    http::response<http::string_body> res;
    stream.expires_after(std::chrono::milliseconds(mTimeoutMs));
    runOperation(ioc, [&](auto handler) {
        http::async_read(stream, buffer, res, std::move(handler));
    });

    if (mVerbose) {
        std::cerr << "[BeastTransport] HTTP " << res.result_int() << "\n";
    }

    // Graceful shutdown (non-critical errors are ignored).
    beast::error_code ec;
    stream.socket().shutdown(tcp::socket::shutdown_both, ec);

    return toResponse(res);
}

// ---------------------------------------------------------------------------
// HTTPS
// ---------------------------------------------------------------------------

HttpResponse BeastTransport::doHttpsRequest(const HttpRequest& request,
                                            const UrlParts& parts)
{
    net::io_context ioc;
    tcp::resolver   resolver(ioc);
    beast::ssl_stream<beast::tcp_stream> stream(ioc, mSslCtx);

    // SNI hostname.
    if (!SSL_set_tlsext_host_name(stream.native_handle(), parts.host.c_str())) {
        beast::error_code ec{static_cast<int>(::ERR_get_error()),
                             net::error::get_ssl_category()};
        throw boost::system::system_error(ec, "Failed to set SNI hostname");
    }

    auto const results = resolver.resolve(parts.host, parts.port);
    auto& lowest = beast::get_lowest_layer(stream);

    lowest.expires_after(std::chrono::milliseconds(mTimeoutMs));
    runOperation(ioc, [&](auto handler) {
        lowest.async_connect(results, std::move(handler));
    });

    lowest.expires_after(std::chrono::milliseconds(mTimeoutMs));
    runOperation(ioc, [&](auto handler) {
        stream.async_handshake(ssl::stream_base::client, std::move(handler));
    });

    auto req = makeBeastRequest(request, parts);
    lowest.expires_after(std::chrono::milliseconds(mTimeoutMs));
    runOperation(ioc, [&](auto handler) {
        http::async_write(stream, req, std::move(handler));
    });

    beast::flat_buffer buffer;
    http::response<http::string_body> res;
    lowest.expires_after(std::chrono::milliseconds(mTimeoutMs));
    runOperation(ioc, [&](auto handler) {
        http::async_read(stream, buffer, res, std::move(handler));
    });

    if (mVerbose) {
        std::cerr << "[BeastTransport] HTTPS " << res.result_int() << "\n";
    }

    // Servers commonly close without close_notify; the outcome is ignored,
    // but the exchange is still bounded by the deadline.
    lowest.expires_after(std::chrono::milliseconds(mTimeoutMs));
    stream.async_shutdown([](const beast::error_code&) {});
    ioc.restart();
    ioc.run();

    return toResponse(res);
}

} // namespace msgraph_sync
