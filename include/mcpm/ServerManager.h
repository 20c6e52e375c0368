//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ServerManager.h
// Purpose: Per-server lifecycle actor driving the state machine, the process and the MCP session
//==========================================================================================================

#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "mcpm/Client.h"
#include "mcpm/Protocol.h"
#include "mcpm/ServerConfig.h"
#include "mcpm/Settings.h"
#include "mcpm/StateMachine.h"
#include "mcpm/adapters/EnvAdapter.h"
#include "mcpm/adapters/ProcessAdapter.h"
#include "mcpm/auth/TokenManager.hpp"
#include "mcpm/events/EventHub.h"

namespace mcpm {

//==========================================================================================================
// ServerEvent
// Purpose: Notification emitted by a ServerManager after every transition and capability refresh.
//==========================================================================================================
struct ServerEvent {
    enum class Kind { StateChanged, CapabilitiesUpdated };

    Kind kind{Kind::StateChanged};
    std::string serverId;
    std::optional<TransitionRecord> transition;  // set for StateChanged
    ServerState state{ServerState::Uninitialized};
    StateMetadata metadata;
};

struct ServerSnapshot {
    ServerConfig config;
    ServerState state{ServerState::Uninitialized};
    std::optional<ServerState> previousState;
    StateMetadata metadata;
    std::vector<TransitionRecord> history;
    std::optional<CapabilitiesSnapshot> capabilities;
};

JSONValue ServerSnapshotToJSON(const ServerSnapshot& snapshot);

struct ServerManagerOptions {
    std::chrono::milliseconds probeTimeout{30000};
    std::chrono::milliseconds shutdownGrace{5000};
    std::chrono::milliseconds requestTimeout{30000};
    std::chrono::milliseconds authTimeout{600000};
    std::size_t historyLimit{StateMachine::DefaultHistoryLimit};
    int64_t tokenRefreshSkewMs{60000};
    // Lower bound between two refreshes of a running server's token.
    std::chrono::milliseconds tokenRefreshMinInterval{30000};
    Implementation clientInfo{"mcpm", "0.0.0"};

    static ServerManagerOptions FromSettings(const Settings& settings);
};

// Creates the MCP client for a new process session; Client when unset.
using ClientFactory = std::function<std::shared_ptr<IClient>(const std::string& serverId)>;

//==========================================================================================================
// ServerManager
// Purpose: Single writer of one server's runtime state.
// Notes:
//   - Lifecycle commands run in FIFO order on a private worker thread; their futures complete when the
//     command reaches a stable outcome. Futures fail with errors::ManagerError.
//   - Process exits, probe results, OAuth callbacks and deadlines are posted to the same worker.
//   - MCP calls (CallTool, ListTools, ...) bypass the queue and require RUNNING.
//   - Every transition is recorded in the state machine history and emitted to subscribers on the
//     worker thread.
//==========================================================================================================
class ServerManager {
public:
    using EventListener = std::function<void(const ServerEvent&)>;

    ServerManager(ServerConfig config,
                  adapters::IProcessAdapter& processes,
                  adapters::IEnvAdapter& env,
                  auth::TokenManager* tokens,
                  ServerManagerOptions options = ServerManagerOptions(),
                  ClientFactory clientFactory = nullptr);
    ~ServerManager();

    ServerManager(const ServerManager&) = delete;
    ServerManager& operator=(const ServerManager&) = delete;

    const std::string& Id() const;

    ///////////////////////////////////////// Lifecycle /////////////////////////////////////////

    //==========================================================================================================
    // Start
    // Purpose: Validates, authenticates or refreshes as needed, spawns the process and probes capabilities.
    // Returns:
    //   Future resolving on RUNNING. Fails with InvalidTransition when the state is not startable, with the
    //   terminal error (ConfigError, AuthRequired, ProcessStartFailed, ...) otherwise, or StartCancelled
    //   when a Stop interrupts it.
    //==========================================================================================================
    std::future<void> Start();

    //==========================================================================================================
    // Stop
    // Purpose: Kills a starting or running process and waits for its exit; dismisses auth and error states.
    // Returns:
    //   Future resolving once the state is stable. Never fails for IDLE or STOPPED.
    //==========================================================================================================
    std::future<void> Stop();
    std::future<void> Restart();

    // Starts the browser flow; resolves once the redirect handler is registered.
    std::future<void> Authenticate();
    // Error states replay the start path; AUTH_FAILED restarts authorization. Increments restartCount.
    std::future<void> Retry();
    std::future<void> Reset();

    // Replaces the stored configuration (the id must not change). Takes effect on the next start.
    std::future<void> UpdateConfig(ServerConfig config);

    ///////////////////////////////////////// MCP calls /////////////////////////////////////////
    std::future<JSONValue> CallTool(const std::string& name, const JSONValue& arguments);
    std::future<std::vector<Tool>> ListTools();
    std::future<std::vector<Resource>> ListResources();
    std::future<JSONValue> ReadResource(const std::string& uri);
    std::future<std::vector<Prompt>> ListPrompts();
    std::future<JSONValue> GetPrompt(const std::string& name, const JSONValue& arguments);
    // Cached snapshot of the last probe. Throws ManagerError(ServerNotRunning) unless RUNNING.
    CapabilitiesSnapshot GetCapabilities() const;

    ///////////////////////////////////////// Observation /////////////////////////////////////////
    ServerConfig Config() const;
    ServerState State() const;
    ServerSnapshot Snapshot() const;
    events::Unsubscribe Subscribe(EventListener listener);

    // Stops the worker and kills the process without further transitions. Called by the destructor.
    void Shutdown();

private:
    class Impl;
    std::shared_ptr<Impl> pImpl;
};

} // namespace mcpm
