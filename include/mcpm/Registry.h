//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Registry.h
// Purpose: Owner of all server managers; persists the server list and aggregates their events
//==========================================================================================================

#pragma once

#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "mcpm/ServerConfig.h"
#include "mcpm/ServerManager.h"
#include "mcpm/Settings.h"
#include "mcpm/adapters/BrowserAdapter.h"
#include "mcpm/adapters/EnvAdapter.h"
#include "mcpm/adapters/ProcessAdapter.h"
#include "mcpm/adapters/StorageAdapter.h"
#include "mcpm/auth/TokenManager.hpp"
#include "mcpm/events/EventHub.h"

namespace mcpm {

struct RegistryEvent {
    enum class Kind { ServerAdded, ServerUpdated, ServerRemoved, StateChanged, CapabilitiesUpdated };

    Kind kind{Kind::StateChanged};
    std::string serverId;
    std::optional<ServerEvent> event;  // the forwarded manager event for StateChanged/CapabilitiesUpdated
    ServerState state{ServerState::Uninitialized};
    StateMetadata metadata;
};

const char* ToString(RegistryEvent::Kind kind);

struct RegistryOptions {
    std::string configName{"mcpServers.json"};
    std::string builtinRoot;  // empty: no built-in servers
    ServerManagerOptions manager;

    static RegistryOptions FromSettings(const Settings& settings);
};

//==========================================================================================================
// Registry
// Purpose: Keeps one ServerManager per configured server and the persisted list in sync.
// Notes:
//   - Synchronous methods throw errors::ManagerError; lifecycle and MCP futures fail with it.
//   - An unknown id is ServerNotFound everywhere.
//   - The persisted document is watched after Initialize(); external edits are reconciled into the
//     running set (added, updated and removed servers) and reported as Server* events.
//   - The map and list are guarded by one mutex; writes to storage are serialized by another. No lock is
//     held while waiting on a manager.
//==========================================================================================================
class Registry {
public:
    using Listener = std::function<void(const RegistryEvent&)>;

    Registry(adapters::IProcessAdapter& processes,
             adapters::IStorageAdapter& storage,
             adapters::IEnvAdapter& env,
             adapters::IBrowserAdapter& browser,
             auth::TokenManager* tokens,
             RegistryOptions options = RegistryOptions(),
             ClientFactory clientFactory = nullptr);
    ~Registry();

    Registry(const Registry&) = delete;
    Registry& operator=(const Registry&) = delete;

    //==========================================================================================================
    // Initialize
    // Purpose: Reads the server list, merges built-ins (writing back when that changed the list), creates
    //          managers for new entries and starts watching the document. Servers are not started.
    // Notes:
    //   Calling it again re-reads the document and reconciles; an unchanged document changes nothing.
    //   Throws ManagerError(StorageError) when the document cannot be read or parsed.
    //==========================================================================================================
    void Initialize();

    ///////////////////////////////////////// Configuration /////////////////////////////////////////
    void AddServer(const ServerConfig& config);
    // The id selects the server. A running server is stopped when its launch fields change.
    void UpdateServer(const ServerConfig& config);
    // Stops the server first. Built-in servers throw BuiltInServerProtected.
    void RemoveServer(const std::string& serverId);

    //==========================================================================================================
    // ImportServers
    // Purpose: Adds every server found in an import document (see ParseImport).
    // Returns:
    //   Ids of the added servers, suffixed "-2", "-3", ... when an id is already taken.
    //==========================================================================================================
    std::vector<std::string> ImportServers(const std::string& text);
    JSONValue ExportServers() const;

    std::vector<ServerSnapshot> ListServers() const;
    ServerSnapshot GetServer(const std::string& serverId) const;

    ///////////////////////////////////////// Lifecycle /////////////////////////////////////////
    std::future<void> Start(const std::string& serverId);
    std::future<void> Stop(const std::string& serverId);
    std::future<void> Restart(const std::string& serverId);
    std::future<void> Authenticate(const std::string& serverId);
    std::future<void> Retry(const std::string& serverId);
    std::future<void> Reset(const std::string& serverId);
    // Stops every server and waits for each to settle.
    void StopAll();

    ///////////////////////////////////////// MCP calls /////////////////////////////////////////
    std::future<JSONValue> CallTool(const std::string& serverId, const std::string& name, const JSONValue& arguments);
    std::future<std::vector<Tool>> ListTools(const std::string& serverId);
    std::future<std::vector<Resource>> ListResources(const std::string& serverId);
    std::future<JSONValue> ReadResource(const std::string& serverId, const std::string& uri);
    std::future<std::vector<Prompt>> ListPrompts(const std::string& serverId);
    std::future<JSONValue> GetPrompt(const std::string& serverId, const std::string& name, const JSONValue& arguments);
    CapabilitiesSnapshot GetCapabilities(const std::string& serverId) const;

    // Routes an OAuth redirect URL to the pending authorization. False when no handler listens.
    bool HandleOAuthCallback(const std::string& url);

    events::Unsubscribe Subscribe(Listener listener);

    // Stops all servers, drops the document watcher and the managers. Idempotent.
    void Dispose();

private:
    class Impl;
    std::shared_ptr<Impl> pImpl;
};

} // namespace mcpm
