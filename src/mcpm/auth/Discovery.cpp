//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Discovery.cpp
// Purpose: Authorization server metadata discovery (RFC 8414) and dynamic client registration (RFC 7591)
//==========================================================================================================

#include "mcpm/auth/Discovery.hpp"

#include <stdexcept>
#include <utility>

#include "logging/Logger.h"
#include "mcpm/errors/Errors.h"

namespace mcpm::auth {

using errors::ErrorCode;
using errors::ManagerError;

namespace {

std::string stripTrailingSlash(std::string s) {
    while (!s.empty() && s.back() == '/') {
        s.pop_back();
    }
    return s;
}

// Splits "https://host:port/path?q" into origin and path (no query, no trailing slash).
std::pair<std::string, std::string> splitIssuer(const std::string& issuer) {
    std::string url = issuer.substr(0, issuer.find_first_of("?#"));
    std::size_t schemeEnd = url.find("://");
    std::size_t pathStart = url.find('/', schemeEnd == std::string::npos ? 0 : schemeEnd + 3);
    if (pathStart == std::string::npos) {
        return {url, ""};
    }
    return {url.substr(0, pathStart), stripTrailingSlash(url.substr(pathStart))};
}

std::vector<std::string> stringArray(const JSONValue& obj, const std::string& key) {
    std::vector<std::string> out;
    const JSONValue* v = FindMember(obj, key);
    if (!v || !v->isArray()) {
        return out;
    }
    for (const auto& item : std::get<JSONValue::Array>(v->value)) {
        if (item && item->isString()) {
            out.push_back(std::get<std::string>(item->value));
        }
    }
    return out;
}

std::string truncated(const std::string& body) {
    return body.size() > 200 ? body.substr(0, 200) + "..." : body;
}

std::optional<AuthServerMetadata> parseMetadata(const HttpResponse& res, const std::string& issuer,
                                                std::string& reason) {
    if (res.status < 200 || res.status >= 300) {
        reason = "HTTP " + std::to_string(res.status);
        return std::nullopt;
    }
    JSONValue doc;
    try {
        doc = ParseJSON(res.body);
    } catch (const std::runtime_error& e) {
        reason = std::string("malformed JSON: ") + e.what();
        return std::nullopt;
    }
    AuthServerMetadata md;
    md.issuer = GetStringMember(doc, "issuer").value_or("");
    if (!md.issuer.empty() && stripTrailingSlash(md.issuer) != stripTrailingSlash(issuer)) {
        reason = "issuer mismatch (" + md.issuer + ")";
        return std::nullopt;
    }
    md.authorizationEndpoint = GetStringMember(doc, "authorization_endpoint").value_or("");
    md.tokenEndpoint = GetStringMember(doc, "token_endpoint").value_or("");
    if (md.authorizationEndpoint.empty() || md.tokenEndpoint.empty()) {
        reason = "authorization_endpoint or token_endpoint missing";
        return std::nullopt;
    }
    md.registrationEndpoint = GetStringMember(doc, "registration_endpoint");
    md.scopesSupported = stringArray(doc, "scopes_supported");
    md.codeChallengeMethodsSupported = stringArray(doc, "code_challenge_methods_supported");
    return md;
}

} // namespace

std::vector<std::string> MetadataUrls(const std::string& issuer) {
    auto [origin, path] = splitIssuer(issuer);
    return {
        origin + "/.well-known/oauth-authorization-server" + path,
        origin + path + "/.well-known/openid-configuration",
    };
}

AuthServerMetadata DiscoverAuthorizationServer(ITokenEndpoint& endpoint, const std::string& issuer) {
    FUNC_SCOPE();
    std::string lastReason = "no candidate URL";
    for (const auto& url : MetadataUrls(issuer)) {
        try {
            HttpResponse res = endpoint.Get(url, {});
            if (auto md = parseMetadata(res, issuer, lastReason)) {
                LOG_INFO("Authorization server metadata for {} loaded from {}", issuer, url);
                return *md;
            }
            LOG_DEBUG("No usable metadata at {}: {}", url, lastReason);
        } catch (const ManagerError& e) {
            if (e.code() != ErrorCode::NetworkError) {
                throw;
            }
            lastReason = e.what();
            LOG_DEBUG("Metadata fetch from {} failed: {}", url, lastReason);
        }
    }
    throw ManagerError(ErrorCode::AuthFailed,
                       "No authorization server metadata for " + issuer + ": " + lastReason);
}

ClientRegistration RegisterClient(ITokenEndpoint& endpoint, const std::string& registrationEndpoint,
                                  const ClientMetadata& client) {
    FUNC_SCOPE();
    JSONValue body = MakeObject({
        {"client_name", JSONValue(client.clientName)},
        {"grant_types", MakeStringArray({"authorization_code", "refresh_token"})},
        {"response_types", MakeStringArray({"code"})},
        {"token_endpoint_auth_method", JSONValue(client.tokenEndpointAuthMethod)},
    });
    if (!client.redirectUris.empty()) {
        SetMember(body, "redirect_uris", MakeStringArray(client.redirectUris));
    }
    HttpResponse res = endpoint.PostJson(registrationEndpoint, SerializeJSON(body), {});
    if (res.status < 200 || res.status >= 300) {
        throw ManagerError(ErrorCode::AuthFailed, "Client registration failed: HTTP " + std::to_string(res.status) +
                                                      " " + truncated(res.body));
    }
    JSONValue doc;
    try {
        doc = ParseJSON(res.body);
    } catch (const std::runtime_error& e) {
        throw ManagerError(ErrorCode::AuthFailed, std::string("Client registration returned malformed JSON: ") + e.what());
    }
    ClientRegistration reg;
    reg.clientId = GetStringMember(doc, "client_id").value_or("");
    if (reg.clientId.empty()) {
        throw ManagerError(ErrorCode::AuthFailed, "Client registration response has no client_id");
    }
    reg.clientSecret = GetStringMember(doc, "client_secret");
    reg.registrationAccessToken = GetStringMember(doc, "registration_access_token");
    reg.clientSecretExpiresAt = GetIntMember(doc, "client_secret_expires_at");
    LOG_INFO("Registered OAuth client {} at {}", reg.clientId, registrationEndpoint);
    return reg;
}

OAuthConfig DiscoverOAuthConfig(ITokenEndpoint& endpoint, const std::string& issuer, OAuthConfig base,
                                const ClientMetadata& client) {
    AuthServerMetadata md = DiscoverAuthorizationServer(endpoint, issuer);
    base.authUrl = md.authorizationEndpoint;
    base.tokenUrl = md.tokenEndpoint;
    if (base.scopes.empty()) {
        base.scopes = md.scopesSupported;
    }
    if (base.clientId.empty() && md.registrationEndpoint.has_value()) {
        try {
            ClientRegistration reg = RegisterClient(endpoint, *md.registrationEndpoint, client);
            base.clientId = reg.clientId;
            base.clientSecret = reg.clientSecret.value_or("");
            base.registrationAccessToken = reg.registrationAccessToken;
        } catch (const ManagerError& e) {
            LOG_WARN("Dynamic client registration at {} failed, client id must be configured manually: {}",
                     *md.registrationEndpoint, e.what());
        }
    }
    return base;
}

} // namespace mcpm::auth
