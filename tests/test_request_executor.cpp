/// @file test_request_executor.cpp
/// Unit tests for request_executor.hpp — header construction and HTTP status
/// classification, against a scripted transport.

#include "access_token.hpp"
#include "errors.hpp"
#include "fake_transport.hpp"
#include "request_executor.hpp"
#include "retry.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <memory>
#include <string>

using namespace msgraph_sync;
using namespace msgraph_sync::test_support;
using json = nlohmann::json;

static const std::string kUsersUrl = "https://graph.microsoft.com/v1.0/users";

class RequestExecutorTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto fake = std::make_unique<FakeTransport>();
        transport = fake.get();
        context.transport = std::move(fake);
        executor = std::make_unique<RequestExecutor>(context, token);
    }

    RetryPolicy fastPolicy() const {
        RetryPolicy p;
        p.baseDelayMs = 1;
        p.maxDelayMs  = 4;
        p.jitterMs    = 0;
        return p;
    }

    ClientContext                    context;
    AccessToken                      token;
    FakeTransport*                   transport = nullptr;
    std::unique_ptr<RequestExecutor> executor;
};

// ============================================================================
// Method handling
// ============================================================================

TEST_F(RequestExecutorTest, UnsupportedMethodFailsWithoutNetworkCall) {
    EXPECT_THROW(executor->execute("DELETE", kUsersUrl), UnsupportedMethodError);
    EXPECT_TRUE(transport->requests().empty());
}

TEST_F(RequestExecutorTest, UnsupportedMethodIsNotRetried) {
    int calls = 0;
    EXPECT_THROW(withRetry([&] {
        ++calls;
        return executor->execute("PATCH", kUsersUrl);
    }, fastPolicy(), "PATCH"), UnsupportedMethodError);
    EXPECT_EQ(calls, 1);
    EXPECT_TRUE(transport->requests().empty());
}

TEST_F(RequestExecutorTest, GetSendsNoBody) {
    transport->queueJson(HttpVerb::Get, 200, {{"value", json::array()}});

    executor->execute("GET", kUsersUrl, {{"ignored", "yes"}});

    auto reqs = transport->requests();
    ASSERT_EQ(reqs.size(), 1u);
    EXPECT_EQ(reqs[0].verb, HttpVerb::Get);
    EXPECT_EQ(reqs[0].url, kUsersUrl);
    EXPECT_TRUE(reqs[0].body.empty());
    EXPECT_EQ(headerOf(reqs[0], "Content-Type"), "");
}

TEST_F(RequestExecutorTest, PostSendsFormEncodedBody) {
    token.set("stale-token");
    transport->queueJson(HttpVerb::Post, 200, {{"access_token", "t"}});

    executor->execute("POST", "https://login.microsoftonline.com/x/oauth2/v2.0/token",
                      {{"grant_type", "client_credentials"}, {"client_id", "abc def"}});

    auto reqs = transport->requests();
    ASSERT_EQ(reqs.size(), 1u);
    EXPECT_EQ(reqs[0].verb, HttpVerb::Post);
    EXPECT_EQ(reqs[0].body, "grant_type=client_credentials&client_id=abc+def");
    EXPECT_EQ(headerOf(reqs[0], "Content-Type"),
              "application/x-www-form-urlencoded");
    EXPECT_EQ(reqs[0].headers.count("Authorization"), 0u);
}

// ============================================================================
// Headers
// ============================================================================

TEST_F(RequestExecutorTest, BearerTokenAttachedWhenPresent) {
    token.set("eyJ0eXAi.token");
    transport->queueJson(HttpVerb::Get, 200, json::object());

    executor->execute("GET", kUsersUrl);

    EXPECT_EQ(headerOf(transport->requests()[0], "Authorization"),
              "Bearer eyJ0eXAi.token");
}

TEST_F(RequestExecutorTest, NoAuthorizationHeaderWithoutToken) {
    transport->queueJson(HttpVerb::Get, 200, json::object());

    executor->execute("GET", kUsersUrl);

    auto req = transport->requests()[0];
    EXPECT_EQ(req.headers.count("Authorization"), 0u);
}

TEST_F(RequestExecutorTest, UserAgentDefaultsAndCanBeConfigured) {
    transport->setFallback(HttpVerb::Get, 200, "{}");

    executor->execute("GET", kUsersUrl);
    executor->setUserAgent(std::string("tap-ms-teams <ops@example.com>"));
    executor->execute("GET", kUsersUrl);
    executor->setUserAgent(std::nullopt);
    executor->execute("GET", kUsersUrl);

    auto reqs = transport->requests();
    ASSERT_EQ(reqs.size(), 3u);
    EXPECT_EQ(headerOf(reqs[0], "User-Agent"), "msgraph_sync/1.0");
    EXPECT_EQ(headerOf(reqs[1], "User-Agent"), "tap-ms-teams <ops@example.com>");
    EXPECT_EQ(headerOf(reqs[2], "User-Agent"), "msgraph_sync/1.0");
    EXPECT_EQ(headerOf(reqs[0], "Accept"), "application/json");
}

// ============================================================================
// Status classification
// ============================================================================

TEST_F(RequestExecutorTest, AcceptedStatusesReturnParsedBody) {
    for (unsigned int status : {200u, 201u, 202u}) {
        transport->queueJson(HttpVerb::Get, status, {{"status", status}});
        auto body = executor->execute("GET", kUsersUrl);
        EXPECT_EQ(body["status"], status);
    }
}

TEST_F(RequestExecutorTest, EmptyBodyDecodesToNull) {
    transport->queueResponse(HttpVerb::Get, 202, "");
    EXPECT_TRUE(executor->execute("GET", kUsersUrl).is_null());
}

TEST_F(RequestExecutorTest, NonJsonSuccessBodyIsFatal) {
    transport->queueResponse(HttpVerb::Get, 200, "<html>oops</html>");
    EXPECT_THROW(executor->execute("GET", kUsersUrl), FatalError);
}

TEST_F(RequestExecutorTest, UnauthorizedCallsHandlerThenRaisesRetryable) {
    int handlerCalls = 0;
    executor->setUnauthorizedHandler([&] {
        ++handlerCalls;
        token.set("fresh");
    });
    transport->queueResponse(HttpVerb::Get, 401, R"({"error":{"code":"InvalidAuthenticationToken"}})");

    try {
        executor->execute("GET", kUsersUrl);
        FAIL() << "expected TransientError";
    } catch (const TransientError& e) {
        EXPECT_EQ(e.kind(), TransientKind::Unauthorized);
    }
    EXPECT_EQ(handlerCalls, 1);
    EXPECT_EQ(token.get(), "fresh");
}

TEST_F(RequestExecutorTest, RateLimitIsRetryable) {
    transport->queueResponse(HttpVerb::Get, 429, "", {{"Retry-After", "3"}});
    try {
        executor->execute("GET", kUsersUrl);
        FAIL() << "expected TransientError";
    } catch (const TransientError& e) {
        EXPECT_EQ(e.kind(), TransientKind::RateLimited);
    }
}

TEST_F(RequestExecutorTest, ServerErrorsAreRetryable) {
    for (unsigned int status : {500u, 502u, 503u, 504u, 599u}) {
        transport->queueResponse(HttpVerb::Get, status, "busy");
        try {
            executor->execute("GET", kUsersUrl);
            FAIL() << "expected TransientError for " << status;
        } catch (const TransientError& e) {
            EXPECT_EQ(e.kind(), TransientKind::ServerError);
        }
    }
}

TEST_F(RequestExecutorTest, UnlistedStatusIsFatalWithRawBody) {
    transport->queueResponse(HttpVerb::Get, 418, "I'm a teapot");
    try {
        executor->execute("GET", kUsersUrl);
        FAIL() << "expected UnexpectedStatusError";
    } catch (const UnexpectedStatusError& e) {
        EXPECT_EQ(e.status(), 418u);
        EXPECT_EQ(e.body(), "I'm a teapot");
        EXPECT_NE(std::string(e.what()).find("I'm a teapot"), std::string::npos);
    }
}

TEST_F(RequestExecutorTest, UnlistedStatusIsNeverRetried) {
    transport->setFallback(HttpVerb::Get, 418, "I'm a teapot");
    EXPECT_THROW(withRetry([&] { return executor->execute("GET", kUsersUrl); },
                           fastPolicy(), "GET"),
                 UnexpectedStatusError);
    EXPECT_EQ(transport->count(HttpVerb::Get), 1u);
}

TEST_F(RequestExecutorTest, ClientErrorsOtherThan401And429AreFatal) {
    for (unsigned int status : {204u, 400u, 403u, 404u}) {
        transport->queueResponse(HttpVerb::Get, status, "nope");
        EXPECT_THROW(executor->execute("GET", kUsersUrl), UnexpectedStatusError)
            << "status " << status;
    }
}

TEST_F(RequestExecutorTest, ConnectionFailureIsRetryable) {
    transport->queueConnectionFailure(HttpVerb::Get, "connection refused");
    try {
        executor->execute("GET", kUsersUrl);
        FAIL() << "expected ConnectionError";
    } catch (const TransientError& e) {
        EXPECT_EQ(e.kind(), TransientKind::Connection);
    }
}

TEST_F(RequestExecutorTest, ServerErrorRetriedFiveTimesInTotal) {
    transport->setFallback(HttpVerb::Get, 503, "unavailable");
    EXPECT_THROW(withRetry([&] { return executor->execute("GET", kUsersUrl); },
                           fastPolicy(), "GET"),
                 RetryExhaustedError);
    EXPECT_EQ(transport->count(HttpVerb::Get), 5u);
}
