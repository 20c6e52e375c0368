//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Discovery.hpp
// Purpose: Authorization server metadata discovery (RFC 8414) and dynamic client registration (RFC 7591)
//==========================================================================================================

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "mcpm/ServerConfig.h"
#include "mcpm/auth/OAuthClient.hpp"

namespace mcpm::auth {

struct AuthServerMetadata {
    std::string issuer;
    std::string authorizationEndpoint;
    std::string tokenEndpoint;
    std::optional<std::string> registrationEndpoint;
    std::vector<std::string> scopesSupported;
    std::vector<std::string> codeChallengeMethodsSupported;
};

// Client metadata sent with a registration request.
struct ClientMetadata {
    std::string clientName{"mcpm"};
    std::vector<std::string> redirectUris;
    std::string tokenEndpointAuthMethod{"client_secret_basic"};
};

struct ClientRegistration {
    std::string clientId;
    std::optional<std::string> clientSecret;
    std::optional<std::string> registrationAccessToken;
    std::optional<int64_t> clientSecretExpiresAt;  // epoch seconds; 0 means never
};

// Candidate metadata documents for an issuer, in the order they are tried: the RFC 8414 well-known URI
// (path inserted after the well-known prefix), then the OpenID Connect discovery document.
std::vector<std::string> MetadataUrls(const std::string& issuer);

//==========================================================================================================
// DiscoverAuthorizationServer
// Purpose: Fetches the first usable metadata document of an issuer.
// Notes:
//   - A document whose "issuer" differs from the requested issuer is rejected.
//   - authorization_endpoint and token_endpoint are required.
// Returns:
//   The metadata. Throws errors::ManagerError(AuthFailed) when no candidate yields usable metadata.
//==========================================================================================================
AuthServerMetadata DiscoverAuthorizationServer(ITokenEndpoint& endpoint, const std::string& issuer);

//==========================================================================================================
// RegisterClient
// Purpose: Registers a client for the authorization_code and refresh_token grants.
// Returns:
//   The issued client credentials. Throws errors::ManagerError(AuthFailed) on a non 2xx answer or a
//   response without client_id, and NetworkError when the endpoint is unreachable.
//==========================================================================================================
ClientRegistration RegisterClient(ITokenEndpoint& endpoint, const std::string& registrationEndpoint,
                                  const ClientMetadata& client);

//==========================================================================================================
// DiscoverOAuthConfig
// Purpose: Fills authUrl, tokenUrl and scopes of `base` from the issuer metadata. When `base` has no
//          clientId and the server offers registration, a client is registered first; a failed
//          registration leaves the clientId empty for manual setup.
//==========================================================================================================
OAuthConfig DiscoverOAuthConfig(ITokenEndpoint& endpoint, const std::string& issuer, OAuthConfig base,
                                const ClientMetadata& client);

} // namespace mcpm::auth
