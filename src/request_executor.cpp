#include "request_executor.hpp"
#include "errors.hpp"

#include <boost/algorithm/string/predicate.hpp>

#include <iostream>
#include <utility>

namespace msgraph_sync {

namespace {

const char* const kDefaultUserAgent = "msgraph_sync/1.0";

bool isAcceptedStatus(unsigned int status) {
    return status == 200 || status == 201 || status == 202;
}

/// Form body for logs, with credentials blanked out.
std::string maskedForm(const QueryParams& form) {
    QueryParams copy = form;
    for (auto& [key, value] : copy) {
        if (key == "client_secret") value = "***";
    }
    return encodeQuery(copy);
}

} // namespace

RequestExecutor::RequestExecutor(ClientContext& context, const AccessToken& token)
    : mContext(context)
    , mToken(token) {}

// ---------------------------------------------------------------------------
// Public API
// ---------------------------------------------------------------------------

nlohmann::json RequestExecutor::execute(const std::string& method,
                                        const std::string& url,
                                        const QueryParams& form)
{
    HttpVerb verb;
    if (method == "GET") {
        verb = HttpVerb::Get;
    } else if (method == "POST") {
        verb = HttpVerb::Post;
    } else {
        throw UnsupportedMethodError(method);
    }

    if (!mContext.transport) {
        throw FatalError("RequestExecutor has no HTTP transport");
    }

    if (mContext.verbose) {
        std::cerr << "[RequestExecutor] " << method << " " << url;
        if (verb == HttpVerb::Post) {
            std::cerr << " body: " << maskedForm(form);
        }
        std::cerr << "\n";
    }

    const auto response = mContext.transport->send(buildRequest(verb, url, form));

    if (mContext.verbose) {
        std::cerr << "[RequestExecutor] Received code: " << response.status << "\n";
    }

    return classify(response, method, url);
}

void RequestExecutor::setUserAgent(std::optional<std::string> userAgent)
{
    std::lock_guard<std::mutex> lock(mUserAgentMutex);
    mUserAgent = std::move(userAgent);
}

// ---------------------------------------------------------------------------
// Private helpers
// ---------------------------------------------------------------------------

HttpRequest RequestExecutor::buildRequest(HttpVerb verb,
                                          const std::string& url,
                                          const QueryParams& form) const
{
    HttpRequest req;
    req.verb = verb;
    req.url  = url;
    req.headers["Accept"]     = "application/json";
    {
        std::lock_guard<std::mutex> lock(mUserAgentMutex);
        req.headers["User-Agent"] = mUserAgent ? *mUserAgent : kDefaultUserAgent;
    }

    // POST is only used for the token request; no bearer token on it.
    if (verb == HttpVerb::Get) {
        const auto token = mToken.get();
        if (!token.empty()) {
            req.headers["Authorization"] = "Bearer " + token;
        }
    } else {
        req.headers["Content-Type"] = "application/x-www-form-urlencoded";
        req.body = encodeQuery(form);
    }
    return req;
}

nlohmann::json RequestExecutor::classify(const HttpResponse& response,
                                         const std::string& method,
                                         const std::string& url)
{
    const auto status = response.status;

    if (status == 401) {
        std::cerr << "[RequestExecutor] Received unauthorized error code, "
                     "refreshing token: " << response.body << "\n";
        if (mOnUnauthorized) {
            mOnUnauthorized();
        }
        throw TransientError(TransientKind::Unauthorized,
                             "HTTP 401 from " + method + " " + url);
    }

    if (status == 429) {
        std::cerr << "[RequestExecutor] Received rate limit response";
        for (const auto& [name, value] : response.headers) {
            if (boost::algorithm::iequals(name, "Retry-After")) {
                std::cerr << " (Retry-After: " << value << ")";
            }
        }
        std::cerr << "\n";
        throw TransientError(TransientKind::RateLimited,
                             "HTTP 429 from " + method + " " + url);
    }

    if (status >= 500) {
        throw TransientError(TransientKind::ServerError,
                             "HTTP " + std::to_string(status) + " from " +
                             method + " " + url);
    }

    if (!isAcceptedStatus(status)) {
        throw UnexpectedStatusError(status, response.body);
    }

    if (response.body.empty()) {
        return nullptr;
    }

    try {
        return nlohmann::json::parse(response.body);
    } catch (const nlohmann::json::parse_error& e) {
        throw FatalError(std::string("Failed to parse JSON response: ") + e.what());
    }
}

} // namespace msgraph_sync
