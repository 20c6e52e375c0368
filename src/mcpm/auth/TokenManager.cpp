//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: TokenManager.cpp
// Purpose: OAuth 2.0 authorization code + PKCE flow, token expiry detection and refresh
//==========================================================================================================

#include <chrono>
#include <map>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <vector>

#include "logging/Logger.h"
#include "mcpm/auth/Pkce.hpp"
#include "mcpm/auth/TokenManager.hpp"

namespace mcpm::auth {

using errors::ErrorCode;
using errors::ManagerError;

std::string SessionKey(const std::string& state) {
    return "oauth_state_" + state;
}

namespace {

struct Session {
    std::string serverId;
    std::string codeVerifier;
    std::string redirectUri;
    int64_t expiresAt{0};
};

std::string sessionToText(const Session& s) {
    return SerializeJSON(MakeObject({
        {"serverId", JSONValue(s.serverId)},
        {"codeVerifier", JSONValue(s.codeVerifier)},
        {"redirectUri", JSONValue(s.redirectUri)},
        {"expiresAt", JSONValue(s.expiresAt)},
    }));
}

std::optional<Session> sessionFromText(const std::string& text) {
    JSONValue v;
    try {
        v = ParseJSON(text);
    } catch (const std::runtime_error& e) {
        LOG_WARN("Discarding unreadable OAuth session: {}", e.what());
        return std::nullopt;
    }
    Session s;
    s.serverId = GetStringMember(v, "serverId").value_or("");
    s.codeVerifier = GetStringMember(v, "codeVerifier").value_or("");
    s.redirectUri = GetStringMember(v, "redirectUri").value_or("");
    s.expiresAt = GetIntMember(v, "expiresAt").value_or(0);
    if (s.serverId.empty() || s.codeVerifier.empty()) {
        return std::nullopt;
    }
    return s;
}

std::string truncated(const std::string& s, std::size_t max = 200) {
    return s.size() <= max ? s : s.substr(0, max) + "...";
}

} // namespace

//==========================================================================================================
// TokenManager::Impl
// Purpose: Pending flows, redirect handler registrations and token endpoint calls.
//==========================================================================================================
class TokenManager::Impl : public std::enable_shared_from_this<TokenManager::Impl> {
public:
    struct Pending {
        std::string state;
        OAuthConfig config;
        std::string redirectUri;
        AuthCompletion onComplete;
    };

    adapters::IStorageAdapter& storage;
    adapters::IBrowserAdapter& browser;
    std::shared_ptr<ITokenEndpoint> endpoint;
    TokenManagerOptions options;

    mutable std::mutex mutex;
    std::map<std::string, Pending> pending;  // by server id
    TokenSink sink;

    std::mutex handlerMutex;
    std::map<std::string, events::Unsubscribe> handlers;  // by scheme

    Impl(adapters::IStorageAdapter& s, adapters::IBrowserAdapter& b, std::shared_ptr<ITokenEndpoint> e,
         TokenManagerOptions o)
        : storage(s), browser(b), endpoint(std::move(e)), options(std::move(o)) {}

    int64_t now() const {
        if (options.clock) {
            return options.clock();
        }
        return std::chrono::duration_cast<std::chrono::milliseconds>(
                   std::chrono::system_clock::now().time_since_epoch()).count();
    }

    std::string redirectUriFor(const OAuthConfig& config) const {
        if (!config.redirectUri.empty()) {
            return config.redirectUri;
        }
        return options.redirectScheme + "://oauth/callback";
    }

    void ensureHandler(const std::string& scheme) {
        std::lock_guard<std::mutex> lk(handlerMutex);
        if (handlers.count(scheme)) {
            return;
        }
        std::weak_ptr<Impl> weak = shared_from_this();
        handlers[scheme] = browser.RegisterProtocolHandler(scheme, [weak](const std::string& url) {
            if (auto self = weak.lock()) {
                self->onRedirect(url);
            }
        });
        LOG_DEBUG("OAuth redirect handler registered for scheme {}", scheme);
    }

    void releaseHandlersIfIdle() {
        std::map<std::string, events::Unsubscribe> released;
        {
            std::lock_guard<std::mutex> hk(handlerMutex);
            {
                std::lock_guard<std::mutex> lk(mutex);
                if (!pending.empty()) {
                    return;
                }
            }
            released.swap(handlers);
        }
        for (auto& [scheme, off] : released) {
            LOG_DEBUG("OAuth redirect handler released for scheme {}", scheme);
            off();
        }
    }

    std::optional<Pending> takePending(const std::string& serverId) {
        std::optional<Pending> out;
        {
            std::lock_guard<std::mutex> lk(mutex);
            auto it = pending.find(serverId);
            if (it != pending.end()) {
                out = std::move(it->second);
                pending.erase(it);
            }
        }
        return out;
    }

    std::optional<Session> readSession(const std::string& state) {
        auto text = storage.Read(SessionKey(state));
        if (!text.has_value()) {
            return std::nullopt;
        }
        return sessionFromText(*text);
    }

    void deleteSession(const std::string& state) {
        try {
            storage.Delete(SessionKey(state));
        } catch (const ManagerError& e) {
            LOG_WARN("Could not delete OAuth session {}: {}", state, e.what());
        }
    }

    void complete(const std::optional<Pending>& p, AuthOutcome outcome) {
        if (p.has_value() && p->onComplete) {
            p->onComplete(outcome);
        }
    }

    // Redirect delivered through the browser adapter.
    void onRedirect(const std::string& url) {
        auto params = ParseQueryParams(url);
        std::string serverId;
        auto st = params.find("state");
        if (st != params.end()) {
            if (auto session = readSession(st->second)) {
                serverId = session->serverId;
            }
        }
        if (serverId.empty()) {
            std::lock_guard<std::mutex> lk(mutex);
            if (pending.size() == 1) {
                serverId = pending.begin()->first;
            }
        }
        if (serverId.empty()) {
            failUnmatched(url);
            return;
        }
        try {
            handleCallback(serverId, url);
        } catch (const ManagerError& e) {
            LOG_WARN("OAuth callback for {} failed: {} ({})", serverId, e.what(), e.codeString());
        }
    }

    // A redirect that no session claims cannot be routed, so every flow waiting on its scheme fails.
    void failUnmatched(const std::string& url) {
        const std::string scheme = adapters::UrlScheme(url);
        std::vector<std::pair<std::string, Pending>> dropped;
        {
            std::lock_guard<std::mutex> lk(mutex);
            for (auto it = pending.begin(); it != pending.end();) {
                if (adapters::UrlScheme(it->second.redirectUri) == scheme) {
                    dropped.emplace_back(it->first, std::move(it->second));
                    it = pending.erase(it);
                } else {
                    ++it;
                }
            }
        }
        if (dropped.empty()) {
            LOG_WARN("OAuth redirect with unknown state ignored");
            return;
        }
        LOG_WARN("OAuth redirect with unknown state; failing {} pending authorization(s)", dropped.size());
        releaseHandlersIfIdle();
        for (auto& [serverId, p] : dropped) {
            deleteSession(p.state);
            ManagerError err(ErrorCode::AuthStateMismatch, "OAuth redirect carried an unknown state", serverId);
            complete(p, AuthOutcome{serverId, std::nullopt, err});
        }
    }

    HttpResponse postWithRetry(const std::string& url, const std::string& body, const std::vector<HeaderKV>& headers,
                               const std::string& what, const std::string& serverId) {
        for (int attempt = 1;; ++attempt) {
            try {
                return endpoint->PostForm(url, body, headers);
            } catch (const ManagerError& e) {
                if (e.code() != ErrorCode::NetworkError) {
                    throw;
                }
                if (attempt >= 2) {
                    throw ManagerError(ErrorCode::AuthFailed, what + " failed: " + e.what(), serverId);
                }
                LOG_WARN("{} for {} hit a network error, retrying: {}", what, serverId, e.what());
            }
        }
    }

    std::vector<HeaderKV> clientAuth(const OAuthConfig& config, std::ostringstream& form) const {
        std::vector<HeaderKV> headers;
        if (!config.clientId.empty()) {
            form << "&client_id=" << UrlEncodeForm(config.clientId);
        }
        if (!config.clientSecret.empty()) {
            headers.emplace_back("Authorization", BasicAuthorization(config.clientId, config.clientSecret));
        }
        return headers;
    }

    OAuthTokens parseTokens(const HttpResponse& res, const std::optional<std::string>& previousRefresh,
                            const std::string& what, const std::string& serverId) const {
        if (res.status < 200 || res.status >= 300) {
            throw ManagerError(ErrorCode::AuthFailed,
                               what + " failed: HTTP " + std::to_string(res.status) + " " + truncated(res.body), serverId);
        }
        JSONValue v;
        try {
            v = ParseJSON(res.body);
        } catch (const std::runtime_error& e) {
            throw ManagerError(ErrorCode::AuthFailed, what + " returned malformed JSON: " + e.what(), serverId);
        }
        auto access = GetStringMember(v, "access_token");
        if (!access.has_value() || access->empty()) {
            throw ManagerError(ErrorCode::AuthFailed, what + " response has no access_token", serverId);
        }
        OAuthTokens t;
        t.accessToken = *access;
        t.refreshToken = GetStringMember(v, "refresh_token");
        if (!t.refreshToken.has_value()) {
            t.refreshToken = previousRefresh;
        }
        t.tokenType = GetStringMember(v, "token_type").value_or("Bearer");
        t.scope = GetStringMember(v, "scope");
        t.issuedAt = now();
        if (const JSONValue* exp = FindMember(v, "expires_in")) {
            if (std::holds_alternative<int64_t>(exp->value)) {
                t.expiresAt = t.issuedAt + std::get<int64_t>(exp->value) * 1000;
            } else if (std::holds_alternative<double>(exp->value)) {
                t.expiresAt = t.issuedAt + static_cast<int64_t>(std::get<double>(exp->value) * 1000.0);
            }
        }
        return t;
    }

    void deliver(const std::string& serverId, const OAuthTokens& tokens) {
        TokenSink s;
        {
            std::lock_guard<std::mutex> lk(mutex);
            s = sink;
        }
        if (s) {
            s(serverId, tokens);
        }
    }

    OAuthTokens exchangeCode(const std::string& serverId, const Pending& p, const Session& session,
                             const std::string& code) {
        std::ostringstream form;
        form << "grant_type=authorization_code";
        form << "&code=" << UrlEncodeForm(code);
        form << "&redirect_uri=" << UrlEncodeForm(session.redirectUri);
        form << "&code_verifier=" << UrlEncodeForm(session.codeVerifier);
        auto headers = clientAuth(p.config, form);
        LOG_INFO("Exchanging authorization code for {}", serverId);
        auto res = postWithRetry(p.config.tokenUrl, form.str(), headers, "Token exchange", serverId);
        return parseTokens(res, std::nullopt, "Token exchange", serverId);
    }

    OAuthTokens handleCallback(const std::string& serverId, const std::string& url) {
        FUNC_SCOPE();
        auto params = ParseQueryParams(url);
        auto param = [&](const char* name) -> std::optional<std::string> {
            auto it = params.find(name);
            if (it == params.end() || it->second.empty()) {
                return std::nullopt;
            }
            return it->second;
        };

        auto mismatch = [&](const std::string& message) {
            ManagerError err(ErrorCode::AuthStateMismatch, message, serverId);
            auto p = takePending(serverId);
            if (p.has_value()) {
                deleteSession(p->state);
            }
            releaseHandlersIfIdle();
            complete(p, AuthOutcome{serverId, std::nullopt, err});
            return err;
        };

        auto state = param("state");
        if (!state.has_value()) {
            throw mismatch("OAuth callback is missing the state parameter");
        }
        auto session = readSession(*state);
        if (!session.has_value()) {
            throw mismatch("Unknown or expired OAuth state");
        }
        if (session->serverId != serverId) {
            throw mismatch("OAuth state belongs to another server");
        }
        if (session->expiresAt < now()) {
            deleteSession(*state);
            throw mismatch("OAuth state expired");
        }

        deleteSession(*state);
        auto p = takePending(serverId);
        releaseHandlersIfIdle();

        auto fail = [&](ErrorCode code, const std::string& message) {
            ManagerError err(code, message, serverId);
            complete(p, AuthOutcome{serverId, std::nullopt, err});
            return err;
        };

        if (auto error = param("error")) {
            throw fail(ErrorCode::AuthFailed, "OAuth error: " + param("error_description").value_or(*error));
        }
        if (!p.has_value()) {
            throw fail(ErrorCode::AuthFailed, "No authorization in progress for " + serverId);
        }
        auto code = param("code");
        if (!code.has_value()) {
            throw fail(ErrorCode::AuthFailed, "OAuth callback is missing the authorization code");
        }

        OAuthTokens tokens;
        try {
            tokens = exchangeCode(serverId, *p, *session, *code);
        } catch (const ManagerError& e) {
            throw fail(ErrorCode::AuthFailed, e.what());
        }
        deliver(serverId, tokens);
        LOG_INFO("Authorization complete for {}", serverId);
        complete(p, AuthOutcome{serverId, tokens, std::nullopt});
        return tokens;
    }
};

TokenManager::TokenManager(adapters::IStorageAdapter& storage, adapters::IBrowserAdapter& browser,
                           std::shared_ptr<ITokenEndpoint> endpoint, TokenManagerOptions options)
    : pImpl(std::make_shared<Impl>(storage, browser, std::move(endpoint), std::move(options))) {}

TokenManager::~TokenManager() {
    std::map<std::string, events::Unsubscribe> released;
    {
        std::lock_guard<std::mutex> hk(pImpl->handlerMutex);
        released.swap(pImpl->handlers);
    }
    for (auto& [scheme, off] : released) {
        off();
    }
}

void TokenManager::SetTokenSink(TokenSink sink) {
    std::lock_guard<std::mutex> lk(pImpl->mutex);
    pImpl->sink = std::move(sink);
}

TokenStatus TokenManager::Inspect(const ServerConfig& config) const {
    if (!config.oauthConfig.has_value() || !config.oauthConfig->accessToken.has_value() ||
        config.oauthConfig->accessToken->empty()) {
        return TokenStatus::Missing;
    }
    const auto& expiresAt = config.oauthConfig->tokenExpiresAt;
    if (expiresAt.has_value() && pImpl->now() + pImpl->options.refreshSkewMs >= *expiresAt) {
        return TokenStatus::NeedsRefresh;
    }
    return TokenStatus::Valid;
}

OAuthTokens TokenManager::EnsureValidToken(const ServerConfig& config) {
    FUNC_SCOPE();
    switch (Inspect(config)) {
        case TokenStatus::Missing:
            throw ManagerError(ErrorCode::AuthRequired, "Server " + config.id + " requires authentication", config.id);
        case TokenStatus::NeedsRefresh:
            try {
                return Refresh(config);
            } catch (const ManagerError& e) {
                throw ManagerError(ErrorCode::AuthRequired, std::string("Token refresh failed: ") + e.what(), config.id);
            }
        case TokenStatus::Valid:
            break;
    }
    const OAuthConfig& oauth = *config.oauthConfig;
    OAuthTokens t;
    t.accessToken = *oauth.accessToken;
    t.refreshToken = oauth.refreshToken;
    t.expiresAt = oauth.tokenExpiresAt;
    t.issuedAt = oauth.tokenIssuedAt.value_or(0);
    return t;
}

OAuthTokens TokenManager::Refresh(const ServerConfig& config) {
    FUNC_SCOPE();
    if (!config.oauthConfig.has_value() || !config.oauthConfig->refreshToken.has_value() ||
        config.oauthConfig->refreshToken->empty()) {
        throw ManagerError(ErrorCode::AuthFailed, "No refresh token available", config.id);
    }
    const OAuthConfig& oauth = *config.oauthConfig;
    if (oauth.tokenUrl.empty()) {
        throw ManagerError(ErrorCode::AuthFailed, "OAuth configuration has no tokenUrl", config.id);
    }
    std::ostringstream form;
    form << "grant_type=refresh_token";
    form << "&refresh_token=" << UrlEncodeForm(*oauth.refreshToken);
    auto headers = pImpl->clientAuth(oauth, form);
    LOG_INFO("Refreshing access token for {}", config.id);
    auto res = pImpl->postWithRetry(oauth.tokenUrl, form.str(), headers, "Token refresh", config.id);
    OAuthTokens tokens = pImpl->parseTokens(res, oauth.refreshToken, "Token refresh", config.id);
    pImpl->deliver(config.id, tokens);
    return tokens;
}

AuthorizationRequest TokenManager::BeginAuthorization(const ServerConfig& config, AuthCompletion onComplete) {
    FUNC_SCOPE();
    if (!config.oauthConfig.has_value() || config.oauthConfig->authUrl.empty() ||
        config.oauthConfig->tokenUrl.empty()) {
        throw ManagerError(ErrorCode::ConfigError, "OAuth configuration needs authUrl and tokenUrl", config.id);
    }
    CancelAuthorization(config.id);

    const OAuthConfig& oauth = *config.oauthConfig;
    PkcePair pkce = GeneratePkcePair();
    std::string state = GenerateStateNonce();
    std::string redirectUri = pImpl->redirectUriFor(oauth);

    Session session{config.id, pkce.verifier, redirectUri, pImpl->now() + pImpl->options.sessionTtlMs};
    pImpl->storage.Write(SessionKey(state), sessionToText(session));
    {
        std::lock_guard<std::mutex> lk(pImpl->mutex);
        pImpl->pending[config.id] = Impl::Pending{state, oauth, redirectUri, std::move(onComplete)};
    }
    pImpl->ensureHandler(adapters::UrlScheme(redirectUri));

    AuthorizationRequest request{BuildAuthorizationUrl(oauth, pkce.challenge, state, redirectUri), state};
    try {
        pImpl->browser.Open(request.url);
    } catch (const ManagerError& e) {
        LOG_ERROR("Could not open the browser for {}: {}", config.id, e.what());
        CancelAuthorization(config.id);
        throw;
    }
    LOG_INFO("Authorization started for {}", config.id);
    return request;
}

OAuthTokens TokenManager::HandleCallback(const std::string& serverId, const std::string& url) {
    return pImpl->handleCallback(serverId, url);
}

void TokenManager::CancelAuthorization(const std::string& serverId) {
    auto p = pImpl->takePending(serverId);
    if (!p.has_value()) {
        return;
    }
    LOG_DEBUG("Dropping pending authorization for {}", serverId);
    pImpl->deleteSession(p->state);
    pImpl->releaseHandlersIfIdle();
}

bool TokenManager::HasPendingAuthorization(const std::string& serverId) const {
    std::lock_guard<std::mutex> lk(pImpl->mutex);
    return pImpl->pending.count(serverId) > 0;
}

std::string TokenManager::BuildAuthorizationUrl(const OAuthConfig& config, const std::string& codeChallenge,
                                                const std::string& state, const std::string& redirectUri) const {
    std::ostringstream url;
    url << config.authUrl << (config.authUrl.find('?') == std::string::npos ? '?' : '&');
    url << "client_id=" << UrlEncodeForm(config.clientId);
    url << "&redirect_uri=" << UrlEncodeForm(redirectUri);
    url << "&response_type=code";
    url << "&state=" << UrlEncodeForm(state);
    url << "&code_challenge=" << UrlEncodeForm(codeChallenge);
    url << "&code_challenge_method=S256";
    if (!config.scopes.empty()) {
        std::string scope;
        for (const auto& s : config.scopes) {
            if (!scope.empty()) scope += ' ';
            scope += s;
        }
        url << "&scope=" << UrlEncodeForm(scope);
    }
    return url.str();
}

std::string TokenManager::RedirectUriFor(const OAuthConfig& config) const {
    return pImpl->redirectUriFor(config);
}

} // namespace mcpm::auth
