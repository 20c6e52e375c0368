//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Protocol.h
// Purpose: MCP protocol data structures and constants used by the client side of the manager
//==========================================================================================================

#pragma once

#include "mcpm/JSONRPCTypes.h"
#include <optional>
#include <string>
#include <vector>

namespace mcpm {

///////////////////////////////////////// Protocol constants ///////////////////////////////////////////
// MCP Protocol version
constexpr const char* PROTOCOL_VERSION = "2025-11-25";

///////////////////////////////////////// Implementation ///////////////////////////////////////////
// Implementation information
struct Implementation {
    std::string name;
    std::string version;

    Implementation() = default;
    Implementation(std::string name, std::string version)
        : name(std::move(name)), version(std::move(version)) {}
};

///////////////////////////////////////// Capabilities ///////////////////////////////////////////
struct ToolsCapability {
    bool listChanged = false;
};

struct ResourcesCapability {
    bool subscribe = false;
    bool listChanged = false;
};

struct PromptsCapability {
    bool listChanged = false;
};

struct ServerCapabilities {
    std::optional<ToolsCapability> tools;
    std::optional<ResourcesCapability> resources;
    std::optional<PromptsCapability> prompts;
    bool logging = false;
};

//==========================================================================================================
// InitializeResult
// Purpose: Server answer to "initialize".
//==========================================================================================================
struct InitializeResult {
    std::string protocolVersion;
    Implementation serverInfo;
    ServerCapabilities capabilities;
    std::optional<std::string> instructions;
};

///////////////////////////////////////// Tools ///////////////////////////////////////////
struct Tool {
    std::string name;
    std::string description;
    JSONValue inputSchema;  // JSON Schema for tool parameters

    Tool() = default;
    Tool(std::string name, std::string description, JSONValue inputSchema = JSONValue{})
        : name(std::move(name)), description(std::move(description)), inputSchema(std::move(inputSchema)) {}
};

///////////////////////////////////////// Resources ///////////////////////////////////////////
struct Resource {
    std::string uri;
    std::string name;
    std::optional<std::string> description;
    std::optional<std::string> mimeType;
};

///////////////////////////////////////// Prompts ///////////////////////////////////////////
struct Prompt {
    std::string name;
    std::string description;
    std::optional<JSONValue> arguments;  // argument descriptors as sent by the server
};

//==========================================================================================================
// CapabilitiesSnapshot
// Purpose: What a running server offers; cached per server and refreshed on every start.
//==========================================================================================================
struct CapabilitiesSnapshot {
    Implementation serverInfo;
    std::string protocolVersion;
    ServerCapabilities capabilities;
    std::vector<Tool> tools;
    std::vector<Resource> resources;
    std::vector<Prompt> prompts;
    int64_t fetchedAt{0};   // epoch ms
};

/////////////////////////////////////// JSON conversion /////////////////////////////////////////
// Parsers accept the wire shapes and skip malformed entries; they never throw.
InitializeResult ParseInitializeResult(const JSONValue& result);
std::vector<Tool> ParseTools(const JSONValue& listResult);
std::vector<Resource> ParseResources(const JSONValue& listResult);
std::vector<Prompt> ParsePrompts(const JSONValue& listResult);
std::optional<std::string> ParseNextCursor(const JSONValue& listResult);

JSONValue ToolToJSON(const Tool& tool);
JSONValue ResourceToJSON(const Resource& resource);
JSONValue PromptToJSON(const Prompt& prompt);
JSONValue CapabilitiesSnapshotToJSON(const CapabilitiesSnapshot& snapshot);

///////////////////////////////////////// Method names ///////////////////////////////////////////
// MCP method names
namespace Methods {
    // Client to server
    constexpr const char* Initialize = "initialize";
    constexpr const char* Ping = "ping";
    constexpr const char* ListTools = "tools/list";
    constexpr const char* CallTool = "tools/call";
    constexpr const char* ListResources = "resources/list";
    constexpr const char* ReadResource = "resources/read";
    constexpr const char* ListPrompts = "prompts/list";
    constexpr const char* GetPrompt = "prompts/get";

    // Notifications
    constexpr const char* Initialized = "notifications/initialized";
    constexpr const char* Log = "notifications/message";
    constexpr const char* ResourceListChanged = "notifications/resources/list_changed";
    constexpr const char* ToolListChanged = "notifications/tools/list_changed";
    constexpr const char* PromptListChanged = "notifications/prompts/list_changed";
}

} // namespace mcpm
