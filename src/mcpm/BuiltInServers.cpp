//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: BuiltInServers.cpp
// Purpose: Catalogue of servers shipped with the application and the merge into the user's list
//==========================================================================================================

#include <algorithm>

#include "logging/Logger.h"
#include "mcpm/BuiltInServers.h"

namespace mcpm {

const std::vector<BuiltInServerDefinition>& BuiltInServerDefinitions() {
    static const std::vector<BuiltInServerDefinition> defs = {
        BuiltInServerDefinition{
            "builtin-obsidian-memory",
            "Obsidian Memory",
            "Persistent memory system compatible with Obsidian vault format. Store and retrieve conversation "
            "context, notes, and knowledge across sessions.",
            "memory",
            ServerCategory::Productivity,
            "node",
            "mcp-servers/built-in/obsidian-memory/dist/index.js",
            {},
            false,
            AuthType::None,
        },
    };
    return defs;
}

bool IsBuiltInServerId(const std::string& id) {
    return FindBuiltInServerDefinition(id).has_value();
}

std::optional<BuiltInServerDefinition> FindBuiltInServerDefinition(const std::string& id) {
    const auto& defs = BuiltInServerDefinitions();
    auto it = std::find_if(defs.begin(), defs.end(), [&](const BuiltInServerDefinition& d) { return d.id == id; });
    if (it == defs.end()) {
        return std::nullopt;
    }
    return *it;
}

namespace {
ServerConfig fromDefinition(const BuiltInServerDefinition& def, const std::string& root) {
    ServerConfig c;
    c.id = def.id;
    c.name = def.name;
    c.description = def.description;
    c.icon = def.icon;
    c.category = def.category;
    c.command = def.command;
    std::string base = root;
    if (!base.empty() && base.back() == '/') {
        base.pop_back();
    }
    c.args = {base + "/" + def.relativeServerPath};
    c.env = def.env;
    c.enabled = true;
    c.requiresAuth = def.requiresAuth;
    c.authType = def.authType;
    c.isBuiltIn = true;
    return c;
}
} // namespace

bool MergeBuiltInServers(std::vector<ServerConfig>& servers, const std::string& builtinRoot) {
    if (builtinRoot.empty()) {
        LOG_DEBUG("No built-in root configured; built-in servers not merged");
        return false;
    }
    bool changed = false;
    for (const auto& def : BuiltInServerDefinitions()) {
        ServerConfig fresh = fromDefinition(def, builtinRoot);
        auto it = std::find_if(servers.begin(), servers.end(), [&](const ServerConfig& s) { return s.id == def.id; });
        if (it == servers.end()) {
            LOG_INFO("Adding built-in server {}", def.id);
            servers.push_back(std::move(fresh));
            changed = true;
            continue;
        }
        fresh.enabled = it->enabled;
        for (const auto& [k, v] : it->env) {
            fresh.env[k] = v;
        }
        fresh.extra = it->extra;
        if (ServerConfigToJSON(fresh) != ServerConfigToJSON(*it)) {
            LOG_DEBUG("Refreshing built-in server {}", def.id);
            *it = std::move(fresh);
            changed = true;
        }
    }
    return changed;
}

} // namespace mcpm
