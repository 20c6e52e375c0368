//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_token_manager.cpp
// Purpose: GoogleTests for the OAuth authorization code + PKCE flow and token refresh
//==========================================================================================================

#include <gtest/gtest.h>

#include "mcpm/adapters/BrowserAdapter.h"
#include "mcpm/adapters/InMemoryStorageAdapter.hpp"
#include "mcpm/auth/Pkce.hpp"
#include "mcpm/auth/TokenManager.hpp"
#include "support/FakeTokenEndpoint.h"

using namespace mcpm;
using namespace mcpm::auth;
using errors::ErrorCode;
using errors::ManagerError;
using mcpm::testing::FakeTokenEndpoint;

namespace {

ServerConfig notion() {
    ServerConfig c;
    c.id = "notion";
    c.name = "Notion";
    c.command = "npx";
    c.requiresAuth = true;
    c.authType = AuthType::OAuth;
    OAuthConfig o;
    o.clientId = "client 1";
    o.authUrl = "https://auth.example.com/authorize";
    o.tokenUrl = "https://auth.example.com/token";
    o.scopes = {"read", "write"};
    c.oauthConfig = o;
    return c;
}

class TokenManagerTest : public ::testing::Test {
protected:
    adapters::InMemoryStorageAdapter storage;
    adapters::InMemoryBrowserAdapter browser;
    std::shared_ptr<FakeTokenEndpoint> endpoint = std::make_shared<FakeTokenEndpoint>();
    int64_t clockMs = 1'000'000;
    std::unique_ptr<TokenManager> tokens;

    std::vector<std::pair<std::string, OAuthTokens>> sunk;
    std::vector<AuthOutcome> outcomes;

    void SetUp() override {
        TokenManagerOptions opts;
        opts.sessionTtlMs = 60000;
        opts.refreshSkewMs = 5000;
        opts.clock = [this]() { return clockMs; };
        tokens = std::make_unique<TokenManager>(storage, browser, endpoint, opts);
        tokens->SetTokenSink([this](const std::string& id, const OAuthTokens& t) { sunk.emplace_back(id, t); });
    }

    AuthorizationRequest begin(const ServerConfig& c) {
        return tokens->BeginAuthorization(c, [this](const AuthOutcome& o) { outcomes.push_back(o); });
    }
};

} // namespace

TEST_F(TokenManagerTest, BeginAuthorizationBuildsPkceUrl) {
    AuthorizationRequest req = begin(notion());
    ASSERT_EQ(browser.OpenedUrls().size(), 1u);
    EXPECT_EQ(browser.OpenedUrls()[0], req.url);
    EXPECT_EQ(req.url.rfind("https://auth.example.com/authorize?", 0), 0u);

    auto params = ParseQueryParams(req.url);
    EXPECT_EQ(params["client_id"], "client 1");
    EXPECT_EQ(params["redirect_uri"], "mcp-app://oauth/callback");
    EXPECT_EQ(params["response_type"], "code");
    EXPECT_EQ(params["state"], req.state);
    EXPECT_EQ(params["code_challenge_method"], "S256");
    EXPECT_EQ(params["scope"], "read write");

    auto session = storage.Read(SessionKey(req.state));
    ASSERT_TRUE(session.has_value());
    JSONValue s = ParseJSON(*session);
    EXPECT_EQ(GetStringMember(s, "serverId"), "notion");
    EXPECT_EQ(GetIntMember(s, "expiresAt"), clockMs + 60000);
    auto verifier = GetStringMember(s, "codeVerifier");
    ASSERT_TRUE(verifier.has_value());
    EXPECT_EQ(params["code_challenge"], ComputeCodeChallenge(*verifier));

    EXPECT_TRUE(browser.HasHandler("mcp-app"));
    EXPECT_TRUE(tokens->HasPendingAuthorization("notion"));
}

TEST_F(TokenManagerTest, RedirectExchangesCode) {
    ServerConfig c = notion();
    c.oauthConfig->clientSecret = "s3cret";
    AuthorizationRequest req = begin(c);
    std::string verifier = *GetStringMember(ParseJSON(*storage.Read(SessionKey(req.state))), "codeVerifier");

    endpoint->Respond(200, R"({"access_token":"at-1","refresh_token":"rt-1","expires_in":3600,"token_type":"Bearer"})");
    EXPECT_TRUE(browser.DispatchUrl("mcp-app://oauth/callback?code=abc&state=" + req.state));

    auto calls = endpoint->Calls();
    ASSERT_EQ(calls.size(), 1u);
    EXPECT_EQ(calls[0].url, "https://auth.example.com/token");
    auto form = ParseQueryParams("?" + calls[0].body);
    EXPECT_EQ(form["grant_type"], "authorization_code");
    EXPECT_EQ(form["code"], "abc");
    EXPECT_EQ(form["redirect_uri"], "mcp-app://oauth/callback");
    EXPECT_EQ(form["code_verifier"], verifier);
    EXPECT_EQ(form["client_id"], "client 1");
    ASSERT_EQ(calls[0].headers.size(), 1u);
    EXPECT_EQ(calls[0].headers[0].second, BasicAuthorization("client 1", "s3cret"));

    ASSERT_EQ(outcomes.size(), 1u);
    ASSERT_TRUE(outcomes[0].tokens.has_value());
    EXPECT_EQ(outcomes[0].tokens->accessToken, "at-1");
    EXPECT_EQ(outcomes[0].tokens->expiresAt, clockMs + 3600 * 1000);
    ASSERT_EQ(sunk.size(), 1u);
    EXPECT_EQ(sunk[0].first, "notion");
    EXPECT_EQ(sunk[0].second.refreshToken, "rt-1");

    EXPECT_FALSE(storage.Read(SessionKey(req.state)).has_value());
    EXPECT_FALSE(tokens->HasPendingAuthorization("notion"));
    EXPECT_FALSE(browser.HasHandler("mcp-app"));
}

TEST_F(TokenManagerTest, ForeignStateIsRejected) {
    AuthorizationRequest req = begin(notion());
    try {
        tokens->HandleCallback("other-server", "mcp-app://oauth/callback?code=abc&state=" + req.state);
        FAIL() << "expected AuthStateMismatch";
    } catch (const ManagerError& e) {
        EXPECT_EQ(e.code(), ErrorCode::AuthStateMismatch);
    }
    EXPECT_TRUE(tokens->HasPendingAuthorization("notion"));

    try {
        tokens->HandleCallback("notion", "mcp-app://oauth/callback?code=abc&state=forged");
        FAIL() << "expected AuthStateMismatch";
    } catch (const ManagerError& e) {
        EXPECT_EQ(e.code(), ErrorCode::AuthStateMismatch);
    }
    ASSERT_EQ(outcomes.size(), 1u);
    ASSERT_TRUE(outcomes[0].error.has_value());
    EXPECT_EQ(outcomes[0].error->code(), ErrorCode::AuthStateMismatch);
    EXPECT_TRUE(endpoint->Calls().empty());
}

TEST_F(TokenManagerTest, ExpiredSessionIsRejected) {
    AuthorizationRequest req = begin(notion());
    clockMs += 60001;
    EXPECT_THROW(tokens->HandleCallback("notion", "mcp-app://oauth/callback?code=abc&state=" + req.state),
                 ManagerError);
    EXPECT_FALSE(storage.Read(SessionKey(req.state)).has_value());
    ASSERT_EQ(outcomes.size(), 1u);
    EXPECT_EQ(outcomes[0].error->code(), ErrorCode::AuthStateMismatch);
    EXPECT_TRUE(endpoint->Calls().empty());
}

TEST_F(TokenManagerTest, ProviderErrorFailsAuthorization) {
    AuthorizationRequest req = begin(notion());
    try {
        tokens->HandleCallback("notion", "mcp-app://oauth/callback?error=access_denied&error_description=User+said+no"
                                         "&state=" + req.state);
        FAIL() << "expected AuthFailed";
    } catch (const ManagerError& e) {
        EXPECT_EQ(e.code(), ErrorCode::AuthFailed);
        EXPECT_STREQ(e.what(), "OAuth error: User said no");
    }
    ASSERT_EQ(outcomes.size(), 1u);
    EXPECT_EQ(outcomes[0].error->code(), ErrorCode::AuthFailed);
}

TEST_F(TokenManagerTest, RejectedExchangeFailsAuthorization) {
    AuthorizationRequest req = begin(notion());
    endpoint->Respond(400, R"({"error":"invalid_grant"})");
    EXPECT_THROW(tokens->HandleCallback("notion", "mcp-app://oauth/callback?code=abc&state=" + req.state),
                 ManagerError);
    ASSERT_EQ(outcomes.size(), 1u);
    EXPECT_EQ(outcomes[0].error->code(), ErrorCode::AuthFailed);
    EXPECT_TRUE(sunk.empty());
}

TEST_F(TokenManagerTest, IncompleteConfigAndBrowserFailure) {
    ServerConfig c = notion();
    c.oauthConfig->tokenUrl.clear();
    try {
        begin(c);
        FAIL() << "expected ConfigError";
    } catch (const ManagerError& e) {
        EXPECT_EQ(e.code(), ErrorCode::ConfigError);
    }

    browser.FailNextOpen();
    EXPECT_THROW(begin(notion()), ManagerError);
    EXPECT_FALSE(tokens->HasPendingAuthorization("notion"));
    EXPECT_FALSE(browser.HasHandler("mcp-app"));
    EXPECT_EQ(storage.KeyCount(), 0u);
}

TEST_F(TokenManagerTest, CancelReleasesHandlerAndSession) {
    AuthorizationRequest first = begin(notion());
    AuthorizationRequest second = begin(notion());
    EXPECT_NE(first.state, second.state);
    EXPECT_FALSE(storage.Read(SessionKey(first.state)).has_value());
    EXPECT_EQ(storage.KeyCount(), 1u);

    tokens->CancelAuthorization("notion");
    EXPECT_FALSE(tokens->HasPendingAuthorization("notion"));
    EXPECT_FALSE(browser.HasHandler("mcp-app"));
    EXPECT_EQ(storage.KeyCount(), 0u);
    EXPECT_TRUE(outcomes.empty());
    EXPECT_NO_THROW(tokens->CancelAuthorization("notion"));
}

TEST_F(TokenManagerTest, InspectUsesSkew) {
    ServerConfig c = notion();
    EXPECT_EQ(tokens->Inspect(c), TokenStatus::Missing);
    c.oauthConfig->accessToken = "at";
    EXPECT_EQ(tokens->Inspect(c), TokenStatus::Valid);
    c.oauthConfig->tokenExpiresAt = clockMs + 10000;
    EXPECT_EQ(tokens->Inspect(c), TokenStatus::Valid);
    c.oauthConfig->tokenExpiresAt = clockMs + 5000;
    EXPECT_EQ(tokens->Inspect(c), TokenStatus::NeedsRefresh);

    c.oauthConfig->tokenExpiresAt = clockMs + 10000;
    EXPECT_EQ(tokens->EnsureValidToken(c).accessToken, "at");
    ServerConfig missing = notion();
    try {
        tokens->EnsureValidToken(missing);
        FAIL() << "expected AuthRequired";
    } catch (const ManagerError& e) {
        EXPECT_EQ(e.code(), ErrorCode::AuthRequired);
    }
}

TEST_F(TokenManagerTest, RefreshKeepsUnrotatedRefreshToken) {
    ServerConfig c = notion();
    c.oauthConfig->accessToken = "old";
    c.oauthConfig->refreshToken = "rt-keep";
    endpoint->Respond(200, R"({"access_token":"new","expires_in":60})");
    OAuthTokens t = tokens->Refresh(c);
    EXPECT_EQ(t.accessToken, "new");
    EXPECT_EQ(t.refreshToken, "rt-keep");
    EXPECT_EQ(t.expiresAt, clockMs + 60000);

    auto form = ParseQueryParams("?" + endpoint->Calls()[0].body);
    EXPECT_EQ(form["grant_type"], "refresh_token");
    EXPECT_EQ(form["refresh_token"], "rt-keep");
    ASSERT_EQ(sunk.size(), 1u);
    EXPECT_EQ(sunk[0].second.accessToken, "new");
}

TEST_F(TokenManagerTest, RefreshRetriesOnceOnNetworkError) {
    ServerConfig c = notion();
    c.oauthConfig->refreshToken = "rt";
    endpoint->NetworkFailure();
    endpoint->Respond(200, R"({"access_token":"after-retry","refresh_token":"rt-2"})");
    OAuthTokens t = tokens->Refresh(c);
    EXPECT_EQ(t.accessToken, "after-retry");
    EXPECT_EQ(t.refreshToken, "rt-2");
    EXPECT_FALSE(t.expiresAt.has_value());
    EXPECT_EQ(endpoint->Calls().size(), 2u);

    endpoint->NetworkFailure();
    endpoint->NetworkFailure();
    try {
        tokens->Refresh(c);
        FAIL() << "expected AuthFailed";
    } catch (const ManagerError& e) {
        EXPECT_EQ(e.code(), ErrorCode::AuthFailed);
    }
    EXPECT_EQ(endpoint->Calls().size(), 4u);
}

TEST_F(TokenManagerTest, RefreshWithoutRefreshTokenFails) {
    ServerConfig c = notion();
    c.oauthConfig->accessToken = "at";
    c.oauthConfig->tokenExpiresAt = clockMs;
    try {
        tokens->Refresh(c);
        FAIL() << "expected AuthFailed";
    } catch (const ManagerError& e) {
        EXPECT_EQ(e.code(), ErrorCode::AuthFailed);
    }
    try {
        tokens->EnsureValidToken(c);
        FAIL() << "expected AuthRequired";
    } catch (const ManagerError& e) {
        EXPECT_EQ(e.code(), ErrorCode::AuthRequired);
    }
    EXPECT_TRUE(endpoint->Calls().empty());
}

TEST_F(TokenManagerTest, CodeExchangeRetriesOnceOnNetworkError) {
    AuthorizationRequest req = begin(notion());
    endpoint->NetworkFailure();
    endpoint->Respond(200, R"({"access_token":"at-2","expires_in":60})");
    OAuthTokens t = tokens->HandleCallback("notion", "mcp-app://oauth/callback?code=abc&state=" + req.state);
    EXPECT_EQ(t.accessToken, "at-2");
    EXPECT_EQ(endpoint->Calls().size(), 2u);
    ASSERT_EQ(outcomes.size(), 1u);
    EXPECT_TRUE(outcomes[0].tokens.has_value());
}

TEST_F(TokenManagerTest, ReplacedFlowRejectsItsOldState) {
    AuthorizationRequest first = begin(notion());
    AuthorizationRequest second = begin(notion());
    ASSERT_NE(first.state, second.state);
    EXPECT_TRUE(tokens->HasPendingAuthorization("notion"));

    EXPECT_TRUE(browser.DispatchUrl("mcp-app://oauth/callback?code=abc&state=" + first.state));
    ASSERT_EQ(outcomes.size(), 1u);
    ASSERT_TRUE(outcomes[0].error.has_value());
    EXPECT_EQ(outcomes[0].error->code(), ErrorCode::AuthStateMismatch);
    EXPECT_FALSE(tokens->HasPendingAuthorization("notion"));
    EXPECT_FALSE(storage.Read(SessionKey(second.state)).has_value());
    EXPECT_TRUE(endpoint->Calls().empty());
}

TEST_F(TokenManagerTest, UnroutableRedirectFailsEveryFlowOnItsScheme) {
    ServerConfig github = notion();
    github.id = "github";
    ServerConfig other = notion();
    other.id = "other";
    other.oauthConfig->redirectUri = "other-app://oauth/callback";
    begin(notion());
    begin(github);
    begin(other);

    EXPECT_TRUE(browser.DispatchUrl("mcp-app://oauth/callback?code=abc&state=forged"));
    ASSERT_EQ(outcomes.size(), 2u);
    for (const auto& o : outcomes) {
        ASSERT_TRUE(o.error.has_value());
        EXPECT_EQ(o.error->code(), ErrorCode::AuthStateMismatch);
        EXPECT_TRUE(o.serverId == "notion" || o.serverId == "github");
    }
    EXPECT_FALSE(tokens->HasPendingAuthorization("notion"));
    EXPECT_FALSE(tokens->HasPendingAuthorization("github"));
    EXPECT_TRUE(tokens->HasPendingAuthorization("other"));
    EXPECT_EQ(storage.KeyCount(), 1u);
    EXPECT_TRUE(endpoint->Calls().empty());
}
