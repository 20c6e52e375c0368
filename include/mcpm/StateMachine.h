//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: StateMachine.h
// Purpose: Server lifecycle states, events, the declared transition table and the per-server machine
//==========================================================================================================

#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "mcpm/JSONRPCTypes.h"
#include "mcpm/events/EventHub.h"

namespace mcpm {

enum class ServerState {
    Uninitialized,
    Idle,
    Stopped,
    Running,
    Validating,
    Starting,
    Stopping,
    TokenRefreshing,
    AuthRequired,
    Authenticating,
    AuthFailed,
    ConfigError,
    RuntimeError
};

enum class StateEvent {
    Start,
    Stop,
    Started,
    Stopped,
    StartFailed,
    Crashed,
    Authenticate,
    AuthSuccess,
    AuthFailure,
    TokenExpired,
    RefreshSuccess,
    RefreshFailure,
    Retry,
    Reset
};

// Wire names: "RUNNING", "TOKEN_REFRESHING", "START_FAILED", ...
const char* ToString(ServerState state);
const char* ToString(StateEvent event);
std::optional<ServerState> StateFromString(const std::string& name);
std::optional<StateEvent> EventFromString(const std::string& name);

//==========================================================================================================
// Transition
// Purpose: Pure lookup in the declared transition table.
// Returns:
//   The target state, or std::nullopt when (state, event) is not declared. Never throws.
//==========================================================================================================
std::optional<ServerState> Transition(ServerState state, StateEvent event) noexcept;

// Every event with a declared transition out of `state`, in enum order.
std::vector<StateEvent> AvailableEvents(ServerState state);

bool IsStartable(ServerState state) noexcept;
bool IsStoppable(ServerState state) noexcept;
bool IsAttentionRequired(ServerState state) noexcept;
bool IsActive(ServerState state) noexcept;
bool IsErrorState(ServerState state) noexcept;
bool IsAuthState(ServerState state) noexcept;

//==========================================================================================================
// StateMetadata
// Purpose: Payload attached to the current state and copied into each history record.
//==========================================================================================================
struct StateMetadata {
    int64_t timestamp{0};                       // epoch ms of the last change
    std::optional<std::string> errorMessage;
    std::optional<std::string> errorCode;       // MCP_xxx
    std::optional<int> exitCode;
    std::optional<int> exitSignal;
    std::optional<std::string> authUrl;
    std::optional<int64_t> tokenExpiresAt;      // epoch ms
    std::optional<int> processId;
    int restartCount{0};
    std::optional<std::string> userMessage;
    std::vector<std::string> suggestedActions;
};

// Fields present in a patch overwrite the current metadata; absent fields are kept.
struct MetadataPatch {
    std::optional<std::string> errorMessage;
    std::optional<std::string> errorCode;
    std::optional<int> exitCode;
    std::optional<int> exitSignal;
    std::optional<std::string> authUrl;
    std::optional<int64_t> tokenExpiresAt;
    std::optional<int> processId;
    std::optional<int> restartCount;
    std::optional<std::string> userMessage;
    std::optional<std::vector<std::string>> suggestedActions;
};

JSONValue MetadataToJSON(const StateMetadata& metadata);

struct TransitionRecord {
    ServerState from{ServerState::Uninitialized};
    ServerState to{ServerState::Uninitialized};
    std::string event;      // StateEvent name, or "FORCE" for ForceState
    int64_t timestamp{0};
    StateMetadata metadata;
};

JSONValue TransitionRecordToJSON(const TransitionRecord& record);

// Current time as epoch milliseconds.
int64_t NowEpochMs();

//==========================================================================================================
// StateMachine
// Purpose: Lifecycle state of one server: current/previous state, bounded history and metadata.
// Notes:
//   - All methods are thread-safe; the owning ServerManager is the only writer in practice.
//   - Listeners run after the internal lock is released, on the thread that caused the change.
//==========================================================================================================
class StateMachine {
public:
    using TransitionListener = std::function<void(const TransitionRecord&)>;

    static constexpr std::size_t DefaultHistoryLimit = 100;

    explicit StateMachine(std::string serverId,
                          std::size_t historyLimit = DefaultHistoryLimit,
                          ServerState initial = ServerState::Uninitialized);

    const std::string& ServerId() const { return serverId; }
    ServerState State() const;
    std::optional<ServerState> PreviousState() const;
    StateMetadata Metadata() const;
    std::vector<TransitionRecord> History() const;

    //==========================================================================================================
    // Apply
    // Purpose: Performs the declared transition for `event` from the current state.
    // Args:
    //   event: Triggering event.
    //   patch: Metadata merged into the current metadata when the transition happens.
    // Returns:
    //   true when the state moved (one history record appended, listeners notified); false when the
    //   pair is undeclared, in which case nothing changes and a warning is logged.
    //==========================================================================================================
    bool Apply(StateEvent event, const MetadataPatch& patch = {});
    bool CanApply(StateEvent event) const;

    // Recovery-only jump that bypasses the table; recorded in history as event "FORCE".
    void ForceState(ServerState state, const MetadataPatch& patch = {});

    // Back to IDLE with history and metadata cleared. Listeners see a "RESET" record.
    void Reset();
    // Clears history only; state and metadata are kept.
    void ClearHistory();

    void UpdateMetadata(const MetadataPatch& patch);
    void SetError(const std::string& message, const std::string& code);
    void ClearError();

    bool CanStart() const { return IsStartable(State()); }
    bool CanStop() const { return IsStoppable(State()); }
    bool NeedsAttention() const { return IsAttentionRequired(State()); }
    bool IsActiveState() const { return IsActive(State()); }
    bool IsError() const { return IsErrorState(State()); }
    bool NeedsAuth() const;

    // Diagnostic snapshot: serverId, currentState, previousState, metadata, last 10 history records.
    JSONValue ToJSON() const;

    events::Unsubscribe OnTransition(TransitionListener listener);

private:
    void appendHistoryLocked(TransitionRecord record);
    static void mergeLocked(StateMetadata& into, const MetadataPatch& patch);

    const std::string serverId;
    const std::size_t historyLimit;

    mutable std::mutex mutex;
    ServerState current;
    std::optional<ServerState> previous;
    StateMetadata metadata;
    std::vector<TransitionRecord> history;

    events::EventHub<TransitionRecord> listeners;
};

} // namespace mcpm
