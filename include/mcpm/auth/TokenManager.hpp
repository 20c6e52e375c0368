//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: TokenManager.hpp
// Purpose: OAuth 2.0 authorization code + PKCE flow, token expiry detection and refresh
//==========================================================================================================

#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "mcpm/ServerConfig.h"
#include "mcpm/adapters/BrowserAdapter.h"
#include "mcpm/adapters/StorageAdapter.h"
#include "mcpm/auth/OAuthClient.hpp"
#include "mcpm/errors/Errors.h"

namespace mcpm::auth {

struct OAuthTokens {
    std::string accessToken;
    std::optional<std::string> refreshToken;
    std::string tokenType{"Bearer"};
    std::optional<int64_t> expiresAt;  // epoch ms; nullopt when the provider sent no expires_in
    int64_t issuedAt{0};
    std::optional<std::string> scope;
};

enum class TokenStatus { Valid, NeedsRefresh, Missing };

struct AuthorizationRequest {
    std::string url;
    std::string state;
};

// Outcome of an authorization started by BeginAuthorization; exactly one of tokens/error is set.
struct AuthOutcome {
    std::string serverId;
    std::optional<OAuthTokens> tokens;
    std::optional<errors::ManagerError> error;
};

using AuthCompletion = std::function<void(const AuthOutcome& outcome)>;
// Receives every token set obtained (code exchange or refresh) so it can be persisted.
using TokenSink = std::function<void(const std::string& serverId, const OAuthTokens& tokens)>;

struct TokenManagerOptions {
    std::string redirectScheme{"mcp-app"};
    int64_t sessionTtlMs{600000};
    int64_t refreshSkewMs{60000};
    std::function<int64_t()> clock;  // epoch ms; system clock when empty
};

// Storage key of the pending session for a state nonce.
std::string SessionKey(const std::string& state);

//==========================================================================================================
// TokenManager
// Purpose: Owns pending authorizations and talks to provider token endpoints.
// Notes:
//   - Sessions are persisted through the storage adapter under "oauth_state_<state>" and removed on
//     callback receipt, replacement or cancellation.
//   - One protocol handler for the redirect scheme is registered while any authorization is pending.
//   - Thread safe; network calls run on the calling thread without holding internal locks.
//==========================================================================================================
class TokenManager {
public:
    TokenManager(adapters::IStorageAdapter& storage, adapters::IBrowserAdapter& browser,
                 std::shared_ptr<ITokenEndpoint> endpoint, TokenManagerOptions options = TokenManagerOptions());
    ~TokenManager();

    TokenManager(const TokenManager&) = delete;
    TokenManager& operator=(const TokenManager&) = delete;

    void SetTokenSink(TokenSink sink);

    TokenStatus Inspect(const ServerConfig& config) const;

    //==========================================================================================================
    // EnsureValidToken
    // Purpose: Returns a usable access token, refreshing it when it expires within the skew window.
    // Returns:
    //   Tokens. Throws ManagerError(AuthRequired) when there is no token or the refresh failed.
    //==========================================================================================================
    OAuthTokens EnsureValidToken(const ServerConfig& config);

    //==========================================================================================================
    // Refresh
    // Purpose: grant_type=refresh_token; one retry on network failure. The old refresh token is kept when
    // the provider does not rotate it. Tokens go to the sink before returning.
    // Returns:
    //   Tokens. Throws ManagerError(AuthFailed) when no refresh token exists or the refresh fails.
    //==========================================================================================================
    OAuthTokens Refresh(const ServerConfig& config);

    //==========================================================================================================
    // BeginAuthorization
    // Purpose: Starts the browser flow for a server and replaces any older pending flow for it.
    // Args:
    //   onComplete: Called once with the result of the callback, unless the flow is cancelled or replaced.
    // Returns:
    //   URL and state. The redirect handler is registered before the browser is opened. Throws
    //   ManagerError(ConfigError) on incomplete OAuth config and ProcessError when the browser fails.
    //==========================================================================================================
    AuthorizationRequest BeginAuthorization(const ServerConfig& config, AuthCompletion onComplete);

    //==========================================================================================================
    // HandleCallback
    // Purpose: Validates the redirect for a server and exchanges the code for tokens.
    // Returns:
    //   Tokens. Throws ManagerError(AuthStateMismatch) for a missing, unknown, expired or foreign state,
    //   and AuthFailed for provider errors or a failed exchange. The pending completion is notified either way.
    //==========================================================================================================
    OAuthTokens HandleCallback(const std::string& serverId, const std::string& url);

    // Drops the pending flow of a server without notifying its completion. No-op when none exists.
    void CancelAuthorization(const std::string& serverId);
    bool HasPendingAuthorization(const std::string& serverId) const;

    std::string BuildAuthorizationUrl(const OAuthConfig& config, const std::string& codeChallenge,
                                      const std::string& state, const std::string& redirectUri) const;
    std::string RedirectUriFor(const OAuthConfig& config) const;

private:
    class Impl;
    std::shared_ptr<Impl> pImpl;
};

} // namespace mcpm::auth
