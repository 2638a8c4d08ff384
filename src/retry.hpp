#pragma once

#include "errors.hpp"
#include "util.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <iostream>
#include <string>
#include <thread>

namespace msgraph_sync {

struct RetryPolicy {
    int     maxAttempts = 5;       // total attempts, including the first
    int64_t baseDelayMs = 2000;    // doubled on every retry
    int64_t maxDelayMs  = 60000;
    int64_t jitterMs    = 100;
};

/// Called before sleeping: (attempt just failed [1-based], error, delay).
using RetryObserver = std::function<void(int, const TransientError&,
                                         std::chrono::milliseconds)>;

/// Invoke @p fn, re-attempting on TransientError with exponential backoff.
/// Any other exception escapes on the first throw.
/// @throws RetryExhaustedError once policy.maxAttempts attempts have failed.
template <typename Fn>
auto withRetry(Fn&& fn,
               const RetryPolicy& policy,
               const std::string& label,
               const RetryObserver& onRetry = {}) -> decltype(fn())
{
    const int attempts = policy.maxAttempts < 1 ? 1 : policy.maxAttempts;

    for (int attempt = 0;; ++attempt) {
        try {
            return fn();
        } catch (const TransientError& e) {
            if (attempt + 1 >= attempts) {
                std::cerr << "[Retry] " << label << ": giving up after "
                          << attempts << " attempts (" << toString(e.kind())
                          << ")\n";
                throw RetryExhaustedError(
                    e.kind(),
                    "Max retries exceeded for " + label +
                    ".  Last error: " + e.what());
            }

            const auto backoff = computeBackoffMs(attempt,
                                                  policy.baseDelayMs,
                                                  policy.maxDelayMs,
                                                  policy.jitterMs);

            std::cerr << "[Retry] " << label << ": " << toString(e.kind())
                      << " - attempt " << (attempt + 1) << "/" << attempts
                      << ", backoff " << backoff.count() << " ms\n";

            if (onRetry) {
                onRetry(attempt + 1, e, backoff);
            }

            std::this_thread::sleep_for(backoff);
        }
    }
}

} // namespace msgraph_sync
