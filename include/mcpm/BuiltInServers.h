//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: BuiltInServers.h
// Purpose: Catalogue of servers shipped with the application and the merge into the user's list
//==========================================================================================================

#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "mcpm/ServerConfig.h"

namespace mcpm {

struct BuiltInServerDefinition {
    std::string id;
    std::string name;
    std::string description;
    std::string icon;
    ServerCategory category{ServerCategory::Other};
    std::string command;
    // Entry point, relative to the built-in resources root.
    std::string relativeServerPath;
    std::map<std::string, std::string> env;
    bool requiresAuth{false};
    AuthType authType{AuthType::None};
};

const std::vector<BuiltInServerDefinition>& BuiltInServerDefinitions();
bool IsBuiltInServerId(const std::string& id);
std::optional<BuiltInServerDefinition> FindBuiltInServerDefinition(const std::string& id);

//==========================================================================================================
// MergeBuiltInServers
// Purpose: Adds missing built-ins and refreshes existing ones from the catalogue.
// Args:
//   servers: The user's list; updated in place. New built-ins are appended enabled.
//   builtinRoot: Directory the relative entry points resolve against. Empty disables the merge.
// Notes:
//   For an existing entry the user's `enabled` flag, env overrides and unknown members survive;
//   everything else comes from the catalogue and isBuiltIn is forced true.
// Returns:
//   true when the list changed and should be persisted.
//==========================================================================================================
bool MergeBuiltInServers(std::vector<ServerConfig>& servers, const std::string& builtinRoot);

} // namespace mcpm
