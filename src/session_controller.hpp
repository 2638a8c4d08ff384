#pragma once

#include "access_token.hpp"
#include "config.hpp"
#include "endpoints.hpp"
#include "refresh_timer.hpp"
#include "request_executor.hpp"
#include "retry.hpp"

#include <atomic>
#include <chrono>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace msgraph_sync {

struct SessionOptions {
    std::string               baseUrl          = endpoints::kBaseGraphUrl;
    std::string               tokenUrlTemplate = endpoints::kTokenUrlTemplate;
    std::string               scope            = endpoints::kScope;
    std::chrono::milliseconds refreshPeriod =
        std::chrono::seconds(endpoints::kTokenExpirationPeriod);
    RetryPolicy               retry;
};

/// Optional OData query hints for the first page.
struct FetchOptions {
    std::optional<int>         top;
    std::optional<std::string> orderBy;
    std::optional<std::string> filter;
};

/// Owns the token lifecycle and follows @odata.nextLink pagination.
class SessionController {
public:
    struct Stats {
        int totalFetched  = 0;
        int totalRequests = 0;
        int totalRetries  = 0;
        int totalPages    = 0;
        int totalLogins   = 0;
        int failedLogins  = 0;
    };

    SessionController(ClientConfig config,
                      ClientContext context,
                      SessionOptions options = {});
    ~SessionController() = default;

    SessionController(const SessionController&) = delete;
    SessionController& operator=(const SessionController&) = delete;

    /// Request a token with the client-credentials grant and store it.
    /// Whatever the outcome, the next login is scheduled one refresh
    /// period from now.
    /// @throws AuthError if no usable token is returned; retry / HTTP
    ///         errors from the token request propagate as well.
    void login();

    /// Fetch every record of @p endpoint, following @odata.nextLink.
    /// Stops early (returning what was gathered) on an empty page payload.
    /// @throws FatalError (and subclasses) on any non-retryable failure.
    std::vector<nlohmann::json> fetchAll(GraphVersion version,
                                         const std::string& endpoint,
                                         const FetchOptions& options = {});

    /// Replace the credentials; used from the next login onwards.
    void updateConfig(ClientConfig config);

    std::string currentToken() const { return mToken.get(); }

    Stats getStats() const;

private:
    // Declaration order matters: the timer is destroyed first so its
    // thread is joined before anything it touches goes away.
    ClientContext   mContext;
    AccessToken     mToken;
    RequestExecutor mExecutor;
    SessionOptions  mOptions;

    mutable std::mutex mConfigMutex;
    ClientConfig       mConfig;

    std::atomic<int> mTotalFetched{0};
    std::atomic<int> mTotalRequests{0};
    std::atomic<int> mTotalRetries{0};
    std::atomic<int> mTotalPages{0};
    std::atomic<int> mTotalLogins{0};
    std::atomic<int> mFailedLogins{0};

    RefreshTimer mTimer;

    void requestToken();
    void scheduleRefresh();
    void handleUnauthorized();
    RetryObserver retryCounter();
};

} // namespace msgraph_sync
