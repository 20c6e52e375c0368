//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: OAuthClient.hpp
// Purpose: Authorization server HTTP client (Boost.Beast over TCP/TLS) and form/URL helpers
//==========================================================================================================

#pragma once

#include <map>
#include <string>
#include <utility>
#include <vector>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/ssl.hpp>

namespace mcpm::auth {

using HeaderKV = std::pair<std::string, std::string>;

struct HttpResponse {
    int status{0};
    std::string body;
};

struct TokenFetchParams {
    std::string url;
    std::string serverName;  // SNI override; host of the URL when empty
    std::string caFile;
    std::string caPath;
    unsigned int connectTimeoutMs{10000};
    unsigned int readTimeoutMs{30000};
};

// One HTTP exchange against an authorization server.
struct HttpRequest {
    std::string method{"POST"};  // GET or POST
    std::string contentType;     // omitted when empty
    std::string body;
    std::vector<HeaderKV> headers;
};

//==========================================================================================================
// ITokenEndpoint
// Purpose: HTTP access to an authorization server: form posts to the token URL, metadata GETs and JSON
//          posts for client registration.
// Returns:
//   The HTTP status and body, whatever the status. Throws errors::ManagerError(NetworkError) when no
//   response was received (resolve, connect, TLS or read failure).
//==========================================================================================================
class ITokenEndpoint {
public:
    virtual ~ITokenEndpoint() = default;
    virtual HttpResponse PostForm(const std::string& url, const std::string& body,
                                  const std::vector<HeaderKV>& headers) = 0;
    virtual HttpResponse Get(const std::string& url, const std::vector<HeaderKV>& headers) = 0;
    virtual HttpResponse PostJson(const std::string& url, const std::string& body,
                                  const std::vector<HeaderKV>& headers) = 0;
};

//==========================================================================================================
// coHttpRequest
// Purpose: Coroutine that performs one request over http or https (TLS 1.2+, peer verification, SNI).
// Args:
//   params: URL, timeouts and CA overrides.
//   request: Method, content type, body and extra headers (for example Authorization).
//   sslCtxOpt: Optional TLS context; a verifying client context is created when null.
// Returns:
//   HttpResponse. Transport failures propagate as exceptions.
//==========================================================================================================
boost::asio::awaitable<HttpResponse> coHttpRequest(
    const TokenFetchParams& params,
    const HttpRequest& request,
    boost::asio::ssl::context* sslCtxOpt);

// Runs coHttpRequest on a private io_context per call.
class HttpTokenEndpoint : public ITokenEndpoint {
public:
    explicit HttpTokenEndpoint(unsigned int connectTimeoutMs = 10000, unsigned int readTimeoutMs = 30000);
    HttpResponse PostForm(const std::string& url, const std::string& body,
                          const std::vector<HeaderKV>& headers) override;
    HttpResponse Get(const std::string& url, const std::vector<HeaderKV>& headers) override;
    HttpResponse PostJson(const std::string& url, const std::string& body,
                          const std::vector<HeaderKV>& headers) override;

private:
    HttpResponse send(const std::string& url, const HttpRequest& request);

    unsigned int connectTimeoutMs;
    unsigned int readTimeoutMs;
};

// RFC 6749 form encoding: unreserved characters kept, space as '+', everything else %XX.
std::string UrlEncodeForm(const std::string& s);
// Decodes %XX and '+'.
std::string UrlDecode(const std::string& s);
// Query parameters of a URL (the part between '?' and '#'); later duplicates win.
std::map<std::string, std::string> ParseQueryParams(const std::string& url);
// "Basic base64(urlencode(id):urlencode(secret))".
std::string BasicAuthorization(const std::string& clientId, const std::string& clientSecret);

} // namespace mcpm::auth
