//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ServerConfig.h
// Purpose: Persisted server configuration model, its JSON codec and the import/export formats
//==========================================================================================================

#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "mcpm/JSONRPCTypes.h"

namespace mcpm {

enum class AuthType { None, Token, OAuth };
enum class ServerCategory { Productivity, Database, Api, Filesystem, Other };

const char* ToString(AuthType type);
const char* ToString(ServerCategory category);
std::optional<AuthType> AuthTypeFromString(const std::string& text);
std::optional<ServerCategory> CategoryFromString(const std::string& text);

//==========================================================================================================
// OAuthConfig
// Purpose: Provider endpoints, client registration and the current token set for one server.
// Notes:
//   Timestamps are epoch milliseconds. Members not modelled here are kept in `extra` and written back.
//==========================================================================================================
struct OAuthConfig {
    std::string clientId;
    std::string clientSecret;
    std::string authUrl;
    std::string tokenUrl;
    std::string redirectUri;
    std::vector<std::string> scopes;
    std::optional<std::string> accessToken;
    std::optional<std::string> refreshToken;
    std::optional<int64_t> tokenExpiresAt;
    std::optional<int64_t> tokenIssuedAt;
    std::optional<std::string> registrationAccessToken;
    JSONValue extra{JSONValue::Object{}};
};

//==========================================================================================================
// ServerConfig
// Purpose: User-authored description of one MCP server.
// Notes:
//   - env values of the form "$NAME" are resolved from the host environment at launch.
//   - `enabled` is advisory; nothing in the manager starts a server on its own.
//   - Unknown members are preserved in `extra`.
//==========================================================================================================
struct ServerConfig {
    std::string id;
    std::string name;
    std::string command;
    std::vector<std::string> args;
    std::map<std::string, std::string> env;
    bool enabled{true};
    bool requiresAuth{false};
    AuthType authType{AuthType::None};
    std::optional<std::string> authToken;
    std::optional<OAuthConfig> oauthConfig;
    std::optional<std::string> description;
    std::optional<std::string> icon;
    ServerCategory category{ServerCategory::Other};
    bool isBuiltIn{false};
    JSONValue extra{JSONValue::Object{}};

    bool UsesOAuth() const { return requiresAuth && authType == AuthType::OAuth; }
};

JSONValue OAuthConfigToJSON(const OAuthConfig& config);
OAuthConfig OAuthConfigFromJSON(const JSONValue& value);

JSONValue ServerConfigToJSON(const ServerConfig& config);

//==========================================================================================================
// ServerConfigFromJSON
// Purpose: Decodes one persisted server entry.
// Returns:
//   The config. Throws errors::ManagerError(ConfigError) when the value is not an object or has no id.
//==========================================================================================================
ServerConfig ServerConfigFromJSON(const JSONValue& value);

// The persisted document is a JSON array of server entries.
JSONValue ServerListToJSON(const std::vector<ServerConfig>& servers);
// Entries that fail to decode are logged and skipped.
std::vector<ServerConfig> ServerListFromJSON(const JSONValue& document);

//==========================================================================================================
// ValidateForStart
// Purpose: Checks the fields a launch needs.
// Returns:
//   An error message, or std::nullopt when the config can be started.
//==========================================================================================================
std::optional<std::string> ValidateForStart(const ServerConfig& config);

// True when two configs differ in a field that affects how the process is launched.
bool LaunchFieldsDiffer(const ServerConfig& a, const ServerConfig& b);

//////////////////////////////////////////// Import / export ////////////////////////////////////////////

//==========================================================================================================
// ParseImport
// Purpose: Reads server definitions pasted or loaded by the user.
// Accepted shapes:
//   [ {<server entry>}, ... ]                                 native entries, ids kept
//   { "mcpServers": { "<name>": {command, args, env} } }      desktop-client style
//   { "<name>": {command, args, env} }                        single entry
// Notes:
//   Desktop-style entries get an id derived from their name, start disabled and have their category
//   inferred from the package argument. URL-only (HTTP) entries are skipped with a warning.
// Returns:
//   The servers. Throws errors::ManagerError(ConfigError) on malformed JSON or when nothing usable is found.
//==========================================================================================================
std::vector<ServerConfig> ParseImport(const std::string& text);

// Desktop-client style export: { "mcpServers": { name: {command, args, env} } }. OAuth servers are
// omitted; a static token is exported as AUTH_TOKEN.
JSONValue ExportServers(const std::vector<ServerConfig>& servers);

ServerCategory InferCategory(const std::vector<std::string>& args);
// Lower-case slug: [a-z0-9-], never empty.
std::string SlugifyId(const std::string& name);

} // namespace mcpm
