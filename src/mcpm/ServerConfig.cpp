//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ServerConfig.cpp
// Purpose: Persisted server configuration model, its JSON codec and the import/export formats
//==========================================================================================================

#include <algorithm>
#include <cctype>
#include <set>
#include <stdexcept>

#include "logging/Logger.h"
#include "mcpm/ServerConfig.h"
#include "mcpm/errors/Errors.h"

namespace mcpm {

using errors::ErrorCode;
using errors::ManagerError;

namespace {

const std::set<std::string> kServerFields = {
    "id", "name", "command", "args", "env", "enabled", "requiresAuth", "authType", "authToken",
    "oauthConfig", "description", "icon", "category", "isBuiltIn"};

const std::set<std::string> kOAuthFields = {
    "clientId", "clientSecret", "authUrl", "tokenUrl", "redirectUri", "scopes", "accessToken",
    "refreshToken", "tokenExpiresAt", "tokenIssuedAt", "registrationAccessToken"};

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
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

std::map<std::string, std::string> stringMap(const JSONValue& obj, const std::string& key) {
    std::map<std::string, std::string> out;
    const JSONValue* v = FindMember(obj, key);
    if (!v || !v->isObject()) {
        return out;
    }
    for (const auto& [k, item] : std::get<JSONValue::Object>(v->value)) {
        if (item && item->isString()) {
            out.emplace(k, std::get<std::string>(item->value));
        }
    }
    return out;
}

JSONValue mapToJSON(const std::map<std::string, std::string>& m) {
    JSONValue::Object obj;
    for (const auto& [k, v] : m) {
        obj[k] = std::make_shared<JSONValue>(v);
    }
    return JSONValue(std::move(obj));
}

// Timestamps may have been written as doubles by other tools.
std::optional<int64_t> numberMember(const JSONValue& obj, const std::string& key) {
    const JSONValue* v = FindMember(obj, key);
    if (!v) {
        return std::nullopt;
    }
    if (std::holds_alternative<int64_t>(v->value)) {
        return std::get<int64_t>(v->value);
    }
    if (std::holds_alternative<double>(v->value)) {
        return static_cast<int64_t>(std::get<double>(v->value));
    }
    return std::nullopt;
}

JSONValue extraMembers(const JSONValue& obj, const std::set<std::string>& known) {
    JSONValue::Object extra;
    if (obj.isObject()) {
        for (const auto& [k, v] : std::get<JSONValue::Object>(obj.value)) {
            if (!known.count(k) && v) {
                extra[k] = std::make_shared<JSONValue>(*v);
            }
        }
    }
    return JSONValue(std::move(extra));
}

void setOptional(JSONValue& obj, const std::string& key, const std::optional<std::string>& v) {
    if (v.has_value()) {
        SetMember(obj, key, JSONValue(*v));
    }
}

} // namespace

const char* ToString(AuthType type) {
    switch (type) {
        case AuthType::Token: return "token";
        case AuthType::OAuth: return "oauth";
        case AuthType::None: break;
    }
    return "none";
}

const char* ToString(ServerCategory category) {
    switch (category) {
        case ServerCategory::Productivity: return "productivity";
        case ServerCategory::Database: return "database";
        case ServerCategory::Api: return "api";
        case ServerCategory::Filesystem: return "filesystem";
        case ServerCategory::Other: break;
    }
    return "other";
}

std::optional<AuthType> AuthTypeFromString(const std::string& text) {
    const std::string t = lower(text);
    if (t == "none") return AuthType::None;
    if (t == "token") return AuthType::Token;
    if (t == "oauth") return AuthType::OAuth;
    return std::nullopt;
}

std::optional<ServerCategory> CategoryFromString(const std::string& text) {
    const std::string t = lower(text);
    if (t == "productivity") return ServerCategory::Productivity;
    if (t == "database") return ServerCategory::Database;
    if (t == "api") return ServerCategory::Api;
    if (t == "filesystem") return ServerCategory::Filesystem;
    if (t == "other") return ServerCategory::Other;
    return std::nullopt;
}

JSONValue OAuthConfigToJSON(const OAuthConfig& config) {
    JSONValue obj = config.extra.isObject() ? config.extra : JSONValue(JSONValue::Object{});
    SetMember(obj, "clientId", JSONValue(config.clientId));
    if (!config.clientSecret.empty()) {
        SetMember(obj, "clientSecret", JSONValue(config.clientSecret));
    }
    SetMember(obj, "authUrl", JSONValue(config.authUrl));
    SetMember(obj, "tokenUrl", JSONValue(config.tokenUrl));
    SetMember(obj, "redirectUri", JSONValue(config.redirectUri));
    SetMember(obj, "scopes", MakeStringArray(config.scopes));
    setOptional(obj, "accessToken", config.accessToken);
    setOptional(obj, "refreshToken", config.refreshToken);
    if (config.tokenExpiresAt.has_value()) {
        SetMember(obj, "tokenExpiresAt", JSONValue(*config.tokenExpiresAt));
    }
    if (config.tokenIssuedAt.has_value()) {
        SetMember(obj, "tokenIssuedAt", JSONValue(*config.tokenIssuedAt));
    }
    setOptional(obj, "registrationAccessToken", config.registrationAccessToken);
    return obj;
}

OAuthConfig OAuthConfigFromJSON(const JSONValue& value) {
    OAuthConfig c;
    c.clientId = GetStringMember(value, "clientId").value_or("");
    c.clientSecret = GetStringMember(value, "clientSecret").value_or("");
    c.authUrl = GetStringMember(value, "authUrl").value_or("");
    c.tokenUrl = GetStringMember(value, "tokenUrl").value_or("");
    c.redirectUri = GetStringMember(value, "redirectUri").value_or("");
    c.scopes = stringArray(value, "scopes");
    c.accessToken = GetStringMember(value, "accessToken");
    c.refreshToken = GetStringMember(value, "refreshToken");
    c.tokenExpiresAt = numberMember(value, "tokenExpiresAt");
    c.tokenIssuedAt = numberMember(value, "tokenIssuedAt");
    c.registrationAccessToken = GetStringMember(value, "registrationAccessToken");
    c.extra = extraMembers(value, kOAuthFields);
    return c;
}

JSONValue ServerConfigToJSON(const ServerConfig& config) {
    JSONValue obj = config.extra.isObject() ? config.extra : JSONValue(JSONValue::Object{});
    SetMember(obj, "id", JSONValue(config.id));
    SetMember(obj, "name", JSONValue(config.name));
    SetMember(obj, "command", JSONValue(config.command));
    SetMember(obj, "args", MakeStringArray(config.args));
    SetMember(obj, "env", mapToJSON(config.env));
    SetMember(obj, "enabled", JSONValue(config.enabled));
    SetMember(obj, "requiresAuth", JSONValue(config.requiresAuth));
    SetMember(obj, "authType", JSONValue(ToString(config.authType)));
    setOptional(obj, "authToken", config.authToken);
    if (config.oauthConfig.has_value()) {
        SetMember(obj, "oauthConfig", OAuthConfigToJSON(*config.oauthConfig));
    }
    setOptional(obj, "description", config.description);
    setOptional(obj, "icon", config.icon);
    SetMember(obj, "category", JSONValue(ToString(config.category)));
    SetMember(obj, "isBuiltIn", JSONValue(config.isBuiltIn));
    return obj;
}

ServerConfig ServerConfigFromJSON(const JSONValue& value) {
    if (!value.isObject()) {
        throw ManagerError(ErrorCode::ConfigError, "Server entry is not a JSON object");
    }
    ServerConfig c;
    c.id = GetStringMember(value, "id").value_or("");
    if (c.id.empty()) {
        throw ManagerError(ErrorCode::ConfigError, "Server entry has no id");
    }
    c.name = GetStringMember(value, "name").value_or(c.id);
    c.command = GetStringMember(value, "command").value_or("");
    c.args = stringArray(value, "args");
    c.env = stringMap(value, "env");
    c.enabled = GetBoolMember(value, "enabled").value_or(true);
    c.requiresAuth = GetBoolMember(value, "requiresAuth").value_or(false);
    if (auto t = GetStringMember(value, "authType")) {
        auto parsed = AuthTypeFromString(*t);
        if (!parsed.has_value()) {
            LOG_WARN("Server {}: unknown authType '{}', using none", c.id, *t);
        }
        c.authType = parsed.value_or(AuthType::None);
    }
    c.authToken = GetStringMember(value, "authToken");
    if (const JSONValue* oauth = FindMember(value, "oauthConfig"); oauth && oauth->isObject()) {
        c.oauthConfig = OAuthConfigFromJSON(*oauth);
    }
    c.description = GetStringMember(value, "description");
    c.icon = GetStringMember(value, "icon");
    if (auto cat = GetStringMember(value, "category")) {
        c.category = CategoryFromString(*cat).value_or(ServerCategory::Other);
    }
    c.isBuiltIn = GetBoolMember(value, "isBuiltIn").value_or(false);
    c.extra = extraMembers(value, kServerFields);
    return c;
}

JSONValue ServerListToJSON(const std::vector<ServerConfig>& servers) {
    JSONValue::Array arr;
    arr.reserve(servers.size());
    for (const auto& s : servers) {
        arr.push_back(std::make_shared<JSONValue>(ServerConfigToJSON(s)));
    }
    return JSONValue(std::move(arr));
}

std::vector<ServerConfig> ServerListFromJSON(const JSONValue& document) {
    std::vector<ServerConfig> out;
    if (!document.isArray()) {
        LOG_WARN("Server list document is not an array; ignoring it");
        return out;
    }
    for (const auto& item : std::get<JSONValue::Array>(document.value)) {
        if (!item) {
            continue;
        }
        try {
            out.push_back(ServerConfigFromJSON(*item));
        } catch (const ManagerError& e) {
            LOG_WARN("Skipping server entry: {}", e.what());
        }
    }
    return out;
}

std::optional<std::string> ValidateForStart(const ServerConfig& config) {
    if (config.id.empty()) {
        return std::string("Server id is empty");
    }
    if (config.command.empty()) {
        return "No command configured for server " + config.id;
    }
    if (config.requiresAuth && config.authType == AuthType::OAuth) {
        if (!config.oauthConfig.has_value()) {
            return "Server " + config.id + " requires OAuth but has no oauthConfig";
        }
        if (config.oauthConfig->clientId.empty() || config.oauthConfig->authUrl.empty() ||
            config.oauthConfig->tokenUrl.empty()) {
            return "OAuth configuration of " + config.id + " needs clientId, authUrl and tokenUrl";
        }
    }
    if (config.requiresAuth && config.authType == AuthType::Token &&
        (!config.authToken.has_value() || config.authToken->empty())) {
        return "Server " + config.id + " requires a token but none is configured";
    }
    return std::nullopt;
}

bool LaunchFieldsDiffer(const ServerConfig& a, const ServerConfig& b) {
    return a.command != b.command || a.args != b.args || a.env != b.env || a.requiresAuth != b.requiresAuth ||
           a.authType != b.authType || a.authToken != b.authToken;
}

//////////////////////////////////////////// Import / export ////////////////////////////////////////////

ServerCategory InferCategory(const std::vector<std::string>& args) {
    auto it = std::find_if(args.begin(), args.end(), [](const std::string& a) { return !a.empty() && a[0] == '@'; });
    if (it == args.end()) {
        return ServerCategory::Other;
    }
    const std::string pkg = lower(*it);
    auto has = [&](const char* needle) { return pkg.find(needle) != std::string::npos; };
    if (has("postgres") || has("database") || has("sqlite")) return ServerCategory::Database;
    if (has("filesystem") || has("files")) return ServerCategory::Filesystem;
    if (has("github") || has("gitlab")) return ServerCategory::Productivity;
    if (has("api") || has("stripe") || has("supabase")) return ServerCategory::Api;
    return ServerCategory::Other;
}

std::string SlugifyId(const std::string& name) {
    std::string out;
    for (unsigned char c : name) {
        if (std::isalnum(c)) {
            out.push_back(static_cast<char>(std::tolower(c)));
        } else if (!out.empty() && out.back() != '-') {
            out.push_back('-');
        }
    }
    while (!out.empty() && out.back() == '-') {
        out.pop_back();
    }
    return out.empty() ? std::string("server") : out;
}

namespace {

bool looksLikeDesktopEntry(const JSONValue& v) {
    return v.isObject() && (FindMember(v, "command") || FindMember(v, "url"));
}

std::optional<ServerConfig> fromDesktopEntry(const std::string& name, const JSONValue& entry) {
    if (!entry.isObject()) {
        LOG_WARN("Import: entry '{}' is not an object, skipped", name);
        return std::nullopt;
    }
    auto command = GetStringMember(entry, "command");
    if (!command.has_value() || command->empty()) {
        if (FindMember(entry, "url")) {
            LOG_WARN("Import: '{}' is a URL server, which is not supported; skipped", name);
        } else {
            LOG_WARN("Import: '{}' has no command; skipped", name);
        }
        return std::nullopt;
    }
    ServerConfig c;
    c.id = SlugifyId(name);
    c.name = name;
    c.command = *command;
    c.args = stringArray(entry, "args");
    c.env = stringMap(entry, "env");
    c.enabled = false;
    c.description = "Imported from Claude Desktop";
    c.category = InferCategory(c.args);
    return c;
}

} // namespace

std::vector<ServerConfig> ParseImport(const std::string& text) {
    JSONValue doc;
    try {
        doc = ParseJSON(text);
    } catch (const std::runtime_error& e) {
        throw ManagerError(ErrorCode::ConfigError, std::string("Import is not valid JSON: ") + e.what());
    }

    std::vector<ServerConfig> out;
    if (doc.isArray()) {
        for (const auto& item : std::get<JSONValue::Array>(doc.value)) {
            if (!item) {
                continue;
            }
            try {
                out.push_back(ServerConfigFromJSON(*item));
            } catch (const ManagerError& e) {
                LOG_WARN("Import: skipping entry: {}", e.what());
            }
        }
    } else if (doc.isObject()) {
        const JSONValue* servers = FindMember(doc, "mcpServers");
        const JSONValue& table = (servers && servers->isObject()) ? *servers : doc;
        // Sorted for a stable import order.
        std::map<std::string, const JSONValue*> entries;
        for (const auto& [name, entry] : std::get<JSONValue::Object>(table.value)) {
            if (entry && (servers || looksLikeDesktopEntry(*entry))) {
                entries.emplace(name, entry.get());
            }
        }
        for (const auto& [name, entry] : entries) {
            if (auto c = fromDesktopEntry(name, *entry)) {
                out.push_back(std::move(*c));
            }
        }
    } else {
        throw ManagerError(ErrorCode::ConfigError, "Import must be a JSON object or array");
    }

    if (out.empty()) {
        throw ManagerError(ErrorCode::ConfigError, "No importable servers found");
    }
    return out;
}

JSONValue ExportServers(const std::vector<ServerConfig>& servers) {
    JSONValue table(JSONValue::Object{});
    for (const auto& s : servers) {
        if (s.UsesOAuth()) {
            LOG_DEBUG("Export: {} uses OAuth, omitted", s.id);
            continue;
        }
        auto env = s.env;
        if (s.authType == AuthType::Token && s.authToken.has_value()) {
            env["AUTH_TOKEN"] = *s.authToken;
        }
        JSONValue entry = MakeObject({{"command", JSONValue(s.command)}, {"args", MakeStringArray(s.args)}});
        if (!env.empty()) {
            SetMember(entry, "env", mapToJSON(env));
        }
        SetMember(table, s.name.empty() ? s.id : s.name, std::move(entry));
    }
    return MakeObject({{"mcpServers", std::move(table)}});
}

} // namespace mcpm
