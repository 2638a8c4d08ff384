#pragma once

#include "access_token.hpp"
#include "http_transport.hpp"
#include "util.hpp"

#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <nlohmann/json.hpp>

namespace msgraph_sync {

/// Process-wide collaborators shared by the executor and the controller.
/// Owns the transport; destroying the context releases it.
struct ClientContext {
    std::unique_ptr<HttpTransport> transport;
    bool                           verbose = false;
};

/// Sends one authenticated request and classifies the response status.
/// Query parameters are never taken here: callers pass a complete URL.
class RequestExecutor {
public:
    /// Invoked synchronously on HTTP 401; expected to refresh @p token.
    using UnauthorizedHandler = std::function<void()>;

    RequestExecutor(ClientContext& context, const AccessToken& token);

    /// Execute @p method ("GET" or "POST") against @p url.
    /// @p form is sent form-encoded for POST and ignored for GET.
    /// @returns the decoded JSON body (null for an empty body).
    /// @throws UnsupportedMethodError  before any network I/O for other methods.
    /// @throws TransientError          on 401 (after re-login), 429, >= 500,
    ///                                 or connection failure.
    /// @throws UnexpectedStatusError   on any other non-2xx-accepted status.
    /// @throws FatalError              if a success body is not JSON.
    nlohmann::json execute(const std::string& method,
                           const std::string& url,
                           const QueryParams& form = {});

    void setUnauthorizedHandler(UnauthorizedHandler handler) {
        mOnUnauthorized = std::move(handler);
    }

    /// Overrides the default User-Agent; std::nullopt restores it.
    void setUserAgent(std::optional<std::string> userAgent);

private:
    ClientContext&             mContext;
    const AccessToken&         mToken;
    UnauthorizedHandler        mOnUnauthorized;
    mutable std::mutex         mUserAgentMutex;
    std::optional<std::string> mUserAgent;

    HttpRequest buildRequest(HttpVerb verb, const std::string& url,
                             const QueryParams& form) const;

    nlohmann::json classify(const HttpResponse& response,
                            const std::string& method,
                            const std::string& url);
};

} // namespace msgraph_sync
