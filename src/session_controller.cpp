#include "session_controller.hpp"
#include "errors.hpp"
#include "page.hpp"
#include "util.hpp"

#include <chrono>
#include <iostream>
#include <iterator>
#include <utility>

namespace msgraph_sync {

namespace {

// Set while this thread is inside login(), so a 401 from the token
// endpoint is reported instead of recursing into another login.
thread_local bool tInLogin = false;

struct LoginScope {
    bool previous;
    LoginScope() : previous(tInLogin) { tInLogin = true; }
    ~LoginScope() { tInLogin = previous; }
};

std::string formatTokenUrl(std::string tmpl, const std::string& tenantId) {
    static const std::string kPlaceholder = "{tenant_id}";
    auto pos = tmpl.find(kPlaceholder);
    if (pos != std::string::npos) {
        tmpl.replace(pos, kPlaceholder.size(), tenantId);
    }
    return tmpl;
}

} // namespace

SessionController::SessionController(ClientConfig config,
                                     ClientContext context,
                                     SessionOptions options)
    : mContext(std::move(context))
    , mExecutor(mContext, mToken)
    , mOptions(std::move(options))
    , mConfig(std::move(config))
{
    mExecutor.setUserAgent(mConfig.userAgent);
    mExecutor.setUnauthorizedHandler([this] { handleUnauthorized(); });
}

// ---------------------------------------------------------------------------
// Token lifecycle
// ---------------------------------------------------------------------------

void SessionController::login()
{
    std::cerr << "[SessionController] Refreshing token\n";
    try {
        requestToken();
    } catch (const std::exception& e) {
        ++mFailedLogins;
        std::cerr << "[SessionController] Login failed: " << e.what() << "\n";
        scheduleRefresh();
        throw;
    }
    ++mTotalLogins;
    scheduleRefresh();
}

void SessionController::requestToken()
{
    LoginScope scope;

    QueryParams body;
    std::string tokenUrl;
    {
        std::lock_guard<std::mutex> lock(mConfigMutex);
        body = {
            {"grant_type",    "client_credentials"},
            {"client_id",     mConfig.clientId},
            {"client_secret", mConfig.clientSecret},
            {"scope",         mOptions.scope},
        };
        tokenUrl = formatTokenUrl(mOptions.tokenUrlTemplate, mConfig.tenantId);
    }

    const auto started = std::chrono::steady_clock::now();
    const auto result = withRetry(
        [&] { return mExecutor.execute("POST", tokenUrl, body); },
        mOptions.retry, "POST get access token", retryCounter());

    if (mContext.verbose) {
        const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started);
        std::cerr << "[SessionController] Token request took "
                  << elapsed.count() << " ms\n";
    }

    if (!result.is_object() || !result.contains("access_token") ||
        !result["access_token"].is_string() ||
        result["access_token"].get_ref<const std::string&>().empty()) {
        throw AuthError("Token endpoint response has no usable access_token");
    }

    mToken.set(result["access_token"].get<std::string>());
}

void SessionController::scheduleRefresh()
{
    mTimer.arm(mOptions.refreshPeriod, [this] { login(); });
}

void SessionController::handleUnauthorized()
{
    if (tInLogin) {
        throw AuthError("Token endpoint rejected the client credentials (HTTP 401)");
    }
    login();
}

void SessionController::updateConfig(ClientConfig config)
{
    std::optional<std::string> userAgent = config.userAgent;
    {
        std::lock_guard<std::mutex> lock(mConfigMutex);
        mConfig = std::move(config);
    }
    mExecutor.setUserAgent(std::move(userAgent));
}

// ---------------------------------------------------------------------------
// Pagination
// ---------------------------------------------------------------------------

std::vector<nlohmann::json>
SessionController::fetchAll(GraphVersion version,
                            const std::string& endpoint,
                            const FetchOptions& options)
{
    QueryParams params;
    if (options.top && *options.top > 0) {
        params.emplace_back("$top", std::to_string(*options.top));
    }
    if (options.orderBy && !options.orderBy->empty()) {
        params.emplace_back("$orderby", *options.orderBy);
    }
    if (options.filter && !options.filter->empty()) {
        params.emplace_back("$filter", *options.filter);
    }

    std::optional<std::string> nextUrl =
        buildUrl(mOptions.baseUrl, toString(version), endpoint, params);

    std::vector<nlohmann::json> records;

    while (nextUrl) {
        const std::string url = std::move(*nextUrl);
        nextUrl.reset();

        if (mContext.verbose) {
            std::cerr << "[SessionController] Making request GET " << url << "\n";
        }

        const auto body = withRetry(
            [&] { return mExecutor.execute("GET", url); },
            mOptions.retry, "GET " + url, retryCounter());
        ++mTotalRequests;

        if (isEmptyPayload(body)) {
            if (mContext.verbose) {
                std::cerr << "[SessionController] Empty page received; stopping.\n";
            }
            break;
        }

        auto page = parsePage(body);
        ++mTotalPages;

        records.insert(records.end(),
                       std::make_move_iterator(page.records.begin()),
                       std::make_move_iterator(page.records.end()));

        if (mContext.verbose) {
            std::cerr << "[SessionController] Got " << page.records.size()
                      << " records (total so far: " << records.size() << ")\n";
        }

        nextUrl = std::move(page.nextLink);
    }

    mTotalFetched += static_cast<int>(records.size());
    return records;
}

// ---------------------------------------------------------------------------
// Stats
// ---------------------------------------------------------------------------

SessionController::Stats SessionController::getStats() const
{
    Stats stats;
    stats.totalFetched  = mTotalFetched.load();
    stats.totalRequests = mTotalRequests.load();
    stats.totalRetries  = mTotalRetries.load();
    stats.totalPages    = mTotalPages.load();
    stats.totalLogins   = mTotalLogins.load();
    stats.failedLogins  = mFailedLogins.load();
    return stats;
}

RetryObserver SessionController::retryCounter()
{
    return [this](int, const TransientError&, std::chrono::milliseconds) {
        ++mTotalRetries;
    };
}

} // namespace msgraph_sync
