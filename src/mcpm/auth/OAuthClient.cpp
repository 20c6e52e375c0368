//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: OAuthClient.cpp
// Purpose: Authorization server HTTP client (Boost.Beast over TCP/TLS) and form/URL helpers
//==========================================================================================================

#include <chrono>
#include <memory>
#include <sstream>
#include <string>
#include <utility>

#include <boost/asio.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/use_future.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <openssl/ssl.h>

#include "logging/Logger.h"
#include "mcpm/auth/OAuthClient.hpp"
#include "mcpm/auth/Pkce.hpp"
#include "mcpm/errors/Errors.h"

namespace mcpm::auth {
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
namespace http = boost::beast::http;
using tcp = net::ip::tcp;

using errors::ErrorCode;
using errors::ManagerError;

struct UrlParts { std::string scheme, host, port, path, serverName; };

static UrlParts parseUrl(const std::string& url) {
    UrlParts parts;
    std::size_t pos = 0;
    std::size_t schemeEnd = url.find("://");
    if (schemeEnd != std::string::npos) {
        parts.scheme = url.substr(0, schemeEnd);
        pos = schemeEnd + 3;
    } else {
        parts.scheme = std::string("http");
        pos = 0;
    }
    std::size_t slash = url.find_first_of("/?", pos);
    std::string hostPort;
    if (slash == std::string::npos) {
        hostPort = url.substr(pos);
        parts.path = std::string("/");
    } else {
        hostPort = url.substr(pos, slash - pos);
        parts.path = url.substr(slash);
        if (parts.path[0] == '?') {
            parts.path.insert(0, "/");
        }
    }
    std::size_t colon = hostPort.find(':');
    if (colon == std::string::npos) {
        parts.host = hostPort;
        parts.port = (parts.scheme == std::string("https")) ? std::string("443") : std::string("80");
    } else {
        parts.host = hostPort.substr(0, colon);
        parts.port = hostPort.substr(colon + 1);
    }
    parts.serverName = parts.host;
    return parts;
}

template <typename Stream>
static net::awaitable<HttpResponse> exchange(Stream& stream, const std::string& host, const std::string& target,
                                             const HttpRequest& request) {
    const http::verb verb = request.method == "GET" ? http::verb::get : http::verb::post;
    http::request<http::string_body> req{verb, target, 11};
    req.set(http::field::host, host);
    if (!request.contentType.empty()) {
        req.set(http::field::content_type, request.contentType);
    }
    req.set(http::field::accept, "application/json");
    req.set(http::field::connection, "close");
    for (const auto& [name, value] : request.headers) {
        req.set(name, value);
    }
    if (verb != http::verb::get) {
        req.body() = request.body;
        req.prepare_payload();
    }

    co_await http::async_write(stream, req, net::use_awaitable);
    boost::beast::flat_buffer buffer;
    http::response<http::string_body> res;
    co_await http::async_read(stream, buffer, res, net::use_awaitable);
    co_return HttpResponse{static_cast<int>(res.result_int()), std::move(res.body())};
}

net::awaitable<HttpResponse> coHttpRequest(
    const TokenFetchParams& params,
    const HttpRequest& request,
    ssl::context* sslCtxOpt) {
    UrlParts u = parseUrl(params.url);
    tcp::resolver resolver(co_await net::this_coro::executor);
    auto results = co_await resolver.async_resolve(u.host, u.port, net::use_awaitable);
    LOG_DEBUG("Authorization server resolved {}:{} {} {}", u.host, u.port, request.method, u.path);

    if (u.scheme == std::string("https")) {
        ssl::context* ctxPtr = sslCtxOpt;
        std::unique_ptr<ssl::context> localCtx;
        if (!ctxPtr) {
            localCtx = std::make_unique<ssl::context>(ssl::context::tls_client);
            ::SSL_CTX_set_min_proto_version(localCtx->native_handle(), TLS1_2_VERSION);
            if (!params.caFile.empty()) {
                localCtx->load_verify_file(params.caFile);
            }
            if (!params.caPath.empty()) {
                localCtx->add_verify_path(params.caPath);
            }
            if (params.caFile.empty() && params.caPath.empty()) {
                localCtx->set_default_verify_paths();
            }
            localCtx->set_verify_mode(ssl::verify_peer);
            ctxPtr = localCtx.get();
        }
        boost::beast::ssl_stream<boost::beast::tcp_stream> stream(co_await net::this_coro::executor, *ctxPtr);
        std::string sni = params.serverName.empty() ? u.serverName : params.serverName;
        if (!sni.empty()) {
            if (!::SSL_set_tlsext_host_name(stream.native_handle(), sni.c_str())) {
                LOG_WARN("Token endpoint: setting SNI for {} failed", sni);
            }
            if (::SSL_set1_host(stream.native_handle(), sni.c_str()) != 1) {
                LOG_WARN("Token endpoint: host name verification for {} not enabled", sni);
            }
        }
        stream.next_layer().expires_after(std::chrono::milliseconds(params.connectTimeoutMs));
        co_await stream.next_layer().async_connect(results, net::use_awaitable);
        co_await stream.async_handshake(ssl::stream_base::client, net::use_awaitable);
        stream.next_layer().expires_after(std::chrono::milliseconds(params.readTimeoutMs));
        HttpResponse res = co_await exchange(stream, sni, u.path, request);
        boost::system::error_code ec;
        stream.shutdown(ec);
        co_return res;
    }

    boost::beast::tcp_stream stream(co_await net::this_coro::executor);
    stream.expires_after(std::chrono::milliseconds(params.connectTimeoutMs));
    co_await stream.async_connect(results, net::use_awaitable);
    stream.expires_after(std::chrono::milliseconds(params.readTimeoutMs));
    std::string hostHeader = u.host;
    if (u.port != "80") {
        hostHeader += ":" + u.port;
    }
    HttpResponse res = co_await exchange(stream, hostHeader, u.path, request);
    boost::system::error_code ec;
    stream.socket().shutdown(tcp::socket::shutdown_both, ec);
    co_return res;
}

HttpTokenEndpoint::HttpTokenEndpoint(unsigned int connectTimeoutMs, unsigned int readTimeoutMs)
    : connectTimeoutMs(connectTimeoutMs), readTimeoutMs(readTimeoutMs) {}

HttpResponse HttpTokenEndpoint::PostForm(const std::string& url, const std::string& body,
                                         const std::vector<HeaderKV>& headers) {
    return send(url, HttpRequest{"POST", "application/x-www-form-urlencoded", body, headers});
}

HttpResponse HttpTokenEndpoint::Get(const std::string& url, const std::vector<HeaderKV>& headers) {
    return send(url, HttpRequest{"GET", "", "", headers});
}

HttpResponse HttpTokenEndpoint::PostJson(const std::string& url, const std::string& body,
                                         const std::vector<HeaderKV>& headers) {
    return send(url, HttpRequest{"POST", "application/json", body, headers});
}

HttpResponse HttpTokenEndpoint::send(const std::string& url, const HttpRequest& request) {
    FUNC_SCOPE();
    TokenFetchParams params;
    params.url = url;
    params.connectTimeoutMs = connectTimeoutMs;
    params.readTimeoutMs = readTimeoutMs;

    net::io_context ioc;
    auto fut = net::co_spawn(ioc, coHttpRequest(params, request, nullptr), net::use_future);
    ioc.run();
    try {
        HttpResponse res = fut.get();
        LOG_DEBUG("Authorization server {} {} answered HTTP {} ({} bytes)", request.method, url, res.status,
                  res.body.size());
        return res;
    } catch (const boost::system::system_error& e) {
        LOG_WARN("Authorization server {} unreachable: {}", url, e.what());
        throw ManagerError(ErrorCode::NetworkError, std::string("HTTP request failed: ") + e.what());
    } catch (const std::exception& e) {
        LOG_WARN("Authorization server {} request failed: {}", url, e.what());
        throw ManagerError(ErrorCode::NetworkError, std::string("HTTP request failed: ") + e.what());
    }
}

//////////////////////////////////////////// Form and URL helpers ////////////////////////////////////////////

std::string UrlEncodeForm(const std::string& s) {
    std::ostringstream oss;
    for (std::size_t i = 0; i < s.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(s[i]);
        if ((c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '-' || c == '_' || c == '.' || c == '~') {
            oss << static_cast<char>(c);
        } else if (c == ' ') {
            oss << '+';
        } else {
            oss << '%';
            const char* hex = "0123456789ABCDEF";
            oss << hex[(c >> 4) & 0xFu] << hex[c & 0xFu];
        }
    }
    return oss.str();
}

static int hexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

std::string UrlDecode(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (std::size_t i = 0; i < s.size(); ++i) {
        if (s[i] == '+') {
            out.push_back(' ');
        } else if (s[i] == '%' && i + 2 < s.size() && hexValue(s[i + 1]) >= 0 && hexValue(s[i + 2]) >= 0) {
            out.push_back(static_cast<char>(hexValue(s[i + 1]) * 16 + hexValue(s[i + 2])));
            i += 2;
        } else {
            out.push_back(s[i]);
        }
    }
    return out;
}

std::map<std::string, std::string> ParseQueryParams(const std::string& url) {
    std::map<std::string, std::string> out;
    std::size_t q = url.find('?');
    if (q == std::string::npos) {
        return out;
    }
    std::size_t end = url.find('#', q);
    std::string query = url.substr(q + 1, end == std::string::npos ? std::string::npos : end - q - 1);
    std::size_t pos = 0;
    while (pos <= query.size()) {
        std::size_t amp = query.find('&', pos);
        std::string pair = query.substr(pos, amp == std::string::npos ? std::string::npos : amp - pos);
        if (!pair.empty()) {
            std::size_t eq = pair.find('=');
            if (eq == std::string::npos) {
                out[UrlDecode(pair)] = std::string();
            } else {
                out[UrlDecode(pair.substr(0, eq))] = UrlDecode(pair.substr(eq + 1));
            }
        }
        if (amp == std::string::npos) {
            break;
        }
        pos = amp + 1;
    }
    return out;
}

std::string BasicAuthorization(const std::string& clientId, const std::string& clientSecret) {
    return "Basic " + Base64Encode(UrlEncodeForm(clientId) + ":" + UrlEncodeForm(clientSecret));
}

} // namespace mcpm::auth
