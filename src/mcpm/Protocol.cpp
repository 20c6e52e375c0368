//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Protocol.cpp
// Purpose: JSON conversion of MCP protocol structures
//==========================================================================================================

#include "mcpm/Protocol.h"

namespace mcpm {

namespace {
const JSONValue::Array* arrayMember(const JSONValue& obj, const std::string& key) {
    const JSONValue* v = FindMember(obj, key);
    if (!v || !v->isArray()) {
        return nullptr;
    }
    return &std::get<JSONValue::Array>(v->value);
}

void setOptionalString(JSONValue& obj, const std::string& key, const std::optional<std::string>& v) {
    if (v.has_value()) {
        SetMember(obj, key, JSONValue(*v));
    }
}
} // namespace

InitializeResult ParseInitializeResult(const JSONValue& result) {
    InitializeResult out;
    out.protocolVersion = GetStringMember(result, "protocolVersion").value_or("");
    if (const JSONValue* info = FindMember(result, "serverInfo")) {
        out.serverInfo.name = GetStringMember(*info, "name").value_or("");
        out.serverInfo.version = GetStringMember(*info, "version").value_or("");
    }
    out.instructions = GetStringMember(result, "instructions");
    if (const JSONValue* caps = FindMember(result, "capabilities")) {
        if (const JSONValue* tools = FindMember(*caps, "tools")) {
            out.capabilities.tools = ToolsCapability{GetBoolMember(*tools, "listChanged").value_or(false)};
        }
        if (const JSONValue* res = FindMember(*caps, "resources")) {
            out.capabilities.resources = ResourcesCapability{GetBoolMember(*res, "subscribe").value_or(false),
                                                             GetBoolMember(*res, "listChanged").value_or(false)};
        }
        if (const JSONValue* prompts = FindMember(*caps, "prompts")) {
            out.capabilities.prompts = PromptsCapability{GetBoolMember(*prompts, "listChanged").value_or(false)};
        }
        out.capabilities.logging = FindMember(*caps, "logging") != nullptr;
    }
    return out;
}

std::vector<Tool> ParseTools(const JSONValue& listResult) {
    std::vector<Tool> tools;
    const auto* arr = arrayMember(listResult, "tools");
    if (!arr) {
        return tools;
    }
    for (const auto& item : *arr) {
        auto name = GetStringMember(*item, "name");
        if (!name.has_value()) {
            continue;
        }
        Tool t;
        t.name = *name;
        t.description = GetStringMember(*item, "description").value_or("");
        if (const JSONValue* schema = FindMember(*item, "inputSchema")) {
            t.inputSchema = *schema;
        }
        tools.push_back(std::move(t));
    }
    return tools;
}

std::vector<Resource> ParseResources(const JSONValue& listResult) {
    std::vector<Resource> out;
    const auto* arr = arrayMember(listResult, "resources");
    if (!arr) {
        return out;
    }
    for (const auto& item : *arr) {
        auto uri = GetStringMember(*item, "uri");
        if (!uri.has_value()) {
            continue;
        }
        Resource r;
        r.uri = *uri;
        r.name = GetStringMember(*item, "name").value_or(*uri);
        r.description = GetStringMember(*item, "description");
        r.mimeType = GetStringMember(*item, "mimeType");
        out.push_back(std::move(r));
    }
    return out;
}

std::vector<Prompt> ParsePrompts(const JSONValue& listResult) {
    std::vector<Prompt> out;
    const auto* arr = arrayMember(listResult, "prompts");
    if (!arr) {
        return out;
    }
    for (const auto& item : *arr) {
        auto name = GetStringMember(*item, "name");
        if (!name.has_value()) {
            continue;
        }
        Prompt p;
        p.name = *name;
        p.description = GetStringMember(*item, "description").value_or("");
        if (const JSONValue* args = FindMember(*item, "arguments")) {
            p.arguments = *args;
        }
        out.push_back(std::move(p));
    }
    return out;
}

std::optional<std::string> ParseNextCursor(const JSONValue& listResult) {
    auto cursor = GetStringMember(listResult, "nextCursor");
    if (cursor.has_value() && cursor->empty()) {
        return std::nullopt;
    }
    return cursor;
}

JSONValue ToolToJSON(const Tool& tool) {
    return MakeObject({{"name", JSONValue(tool.name)},
                       {"description", JSONValue(tool.description)},
                       {"inputSchema", tool.inputSchema}});
}

JSONValue ResourceToJSON(const Resource& resource) {
    JSONValue obj = MakeObject({{"uri", JSONValue(resource.uri)}, {"name", JSONValue(resource.name)}});
    setOptionalString(obj, "description", resource.description);
    setOptionalString(obj, "mimeType", resource.mimeType);
    return obj;
}

JSONValue PromptToJSON(const Prompt& prompt) {
    JSONValue obj = MakeObject({{"name", JSONValue(prompt.name)}, {"description", JSONValue(prompt.description)}});
    if (prompt.arguments.has_value()) {
        SetMember(obj, "arguments", *prompt.arguments);
    }
    return obj;
}

JSONValue CapabilitiesSnapshotToJSON(const CapabilitiesSnapshot& snapshot) {
    JSONValue::Array tools, resources, prompts;
    for (const auto& t : snapshot.tools) tools.push_back(std::make_shared<JSONValue>(ToolToJSON(t)));
    for (const auto& r : snapshot.resources) resources.push_back(std::make_shared<JSONValue>(ResourceToJSON(r)));
    for (const auto& p : snapshot.prompts) prompts.push_back(std::make_shared<JSONValue>(PromptToJSON(p)));
    return MakeObject({
        {"serverInfo", MakeObject({{"name", JSONValue(snapshot.serverInfo.name)},
                                   {"version", JSONValue(snapshot.serverInfo.version)}})},
        {"protocolVersion", JSONValue(snapshot.protocolVersion)},
        {"tools", JSONValue(std::move(tools))},
        {"resources", JSONValue(std::move(resources))},
        {"prompts", JSONValue(std::move(prompts))},
        {"fetchedAt", JSONValue(snapshot.fetchedAt)},
    });
}

} // namespace mcpm
