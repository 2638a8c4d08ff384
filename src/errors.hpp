#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace msgraph_sync {

/// Root of every error raised by the client.
class GraphError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// ---------------------------------------------------------------------------
// Retryable
// ---------------------------------------------------------------------------

enum class TransientKind {
    RateLimited,   // HTTP 429
    ServerError,   // HTTP >= 500
    Connection,    // resolve / connect / TLS / read / timeout
    Unauthorized,  // HTTP 401, after a re-login
};

inline const char* toString(TransientKind kind) {
    switch (kind) {
        case TransientKind::RateLimited:  return "rate-limited";
        case TransientKind::ServerError:  return "server-error";
        case TransientKind::Connection:   return "connection";
        case TransientKind::Unauthorized: return "unauthorized";
    }
    return "unknown";
}

/// A failure that withRetry() will re-attempt.
class TransientError : public GraphError {
public:
    TransientError(TransientKind kind, const std::string& what)
        : GraphError(what), mKind(kind) {}

    TransientKind kind() const { return mKind; }

private:
    TransientKind mKind;
};

class ConnectionError : public TransientError {
public:
    explicit ConnectionError(const std::string& what)
        : TransientError(TransientKind::Connection, what) {}
};

// ---------------------------------------------------------------------------
// Fatal (never retried)
// ---------------------------------------------------------------------------

class FatalError : public GraphError {
public:
    using GraphError::GraphError;
};

class UnsupportedMethodError : public FatalError {
public:
    explicit UnsupportedMethodError(const std::string& method)
        : FatalError("Unsupported HTTP method: " + method) {}
};

/// Any status outside {200, 201, 202} not otherwise classified.
class UnexpectedStatusError : public FatalError {
public:
    UnexpectedStatusError(unsigned int status, std::string body)
        : FatalError("HTTP " + std::to_string(status) + ": " + body)
        , mStatus(status)
        , mBody(std::move(body)) {}

    unsigned int status() const { return mStatus; }
    const std::string& body() const { return mBody; }

private:
    unsigned int mStatus;
    std::string  mBody;
};

/// The token endpoint did not yield a usable access token.
class AuthError : public FatalError {
public:
    using FatalError::FatalError;
};

class RetryExhaustedError : public FatalError {
public:
    RetryExhaustedError(TransientKind lastKind, const std::string& what)
        : FatalError(what), mLastKind(lastKind) {}

    TransientKind lastKind() const { return mLastKind; }

private:
    TransientKind mLastKind;
};

} // namespace msgraph_sync
