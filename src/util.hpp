#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace msgraph_sync {

/// Ordered key/value pairs; encoding preserves insertion order.
using QueryParams = std::vector<std::pair<std::string, std::string>>;

/// Decomposed URL components.
struct UrlParts {
    std::string scheme;     // "http" or "https"
    std::string host;
    std::string port;       // explicit port, or the scheme default
    std::string authority;  // host[:port] exactly as written
    std::string target;     // path + query (e.g. "/v1.0/users?$top=5")
};

/// Parse an HTTP(S) URL into its components.
/// Throws std::invalid_argument on malformed input.
UrlParts parseUrl(const std::string& url);

/// application/x-www-form-urlencoded escaping of a single value.
std::string urlEncode(const std::string& value);

/// Encode pairs as "k1=v1&k2=v2" (used for both query strings and form bodies).
std::string encodeQuery(const QueryParams& params);

/// Build "<scheme>://<authority>/<version>/<path>?<encoded params>".
/// Any path or query on @p base is replaced.
std::string buildUrl(const std::string& base,
                     const std::string& version,
                     const std::string& path,
                     const QueryParams& params);

/// Compute exponential-backoff delay with random jitter.
/// attempt is 0-based.  Clamped to [baseMs .. maxMs] before jitter.
std::chrono::milliseconds computeBackoffMs(int attempt,
                                           int64_t baseMs   = 2000,
                                           int64_t maxMs    = 60000,
                                           int64_t jitterMs = 100);

} // namespace msgraph_sync
