//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: StateMachine.cpp
// Purpose: Transition table and per-server state machine implementation
//==========================================================================================================

#include "mcpm/StateMachine.h"

#include <array>
#include <chrono>
#include <cstddef>
#include <utility>

#include "logging/Logger.h"

namespace mcpm {

namespace {
using S = ServerState;
using E = StateEvent;

struct Edge {
    S from;
    E event;
    S to;
};

// Declared transitions. Anything not listed is rejected.
constexpr Edge kEdges[] = {
    {S::Uninitialized, E::Start, S::Validating},
    {S::Uninitialized, E::Reset, S::Idle},

    {S::Idle, E::Start, S::Validating},
    {S::Idle, E::Stop, S::Idle},

    {S::Validating, E::Started, S::Starting},
    {S::Validating, E::AuthSuccess, S::Starting},
    {S::Validating, E::RefreshSuccess, S::Starting},
    {S::Validating, E::TokenExpired, S::TokenRefreshing},
    {S::Validating, E::AuthFailure, S::AuthRequired},
    {S::Validating, E::StartFailed, S::ConfigError},
    {S::Validating, E::Stop, S::Idle},
    {S::Validating, E::Reset, S::Idle},

    {S::AuthRequired, E::Start, S::Validating},
    {S::AuthRequired, E::Authenticate, S::Authenticating},
    {S::AuthRequired, E::Stop, S::Idle},
    {S::AuthRequired, E::Reset, S::Idle},

    {S::Authenticating, E::AuthSuccess, S::Validating},
    {S::Authenticating, E::AuthFailure, S::AuthFailed},
    {S::Authenticating, E::Stop, S::AuthRequired},
    {S::Authenticating, E::Reset, S::Idle},

    {S::AuthFailed, E::Authenticate, S::Authenticating},
    {S::AuthFailed, E::Retry, S::Authenticating},
    {S::AuthFailed, E::AuthSuccess, S::Validating},
    {S::AuthFailed, E::Start, S::Validating},
    {S::AuthFailed, E::TokenExpired, S::TokenRefreshing},
    {S::AuthFailed, E::Stop, S::Idle},
    {S::AuthFailed, E::Reset, S::AuthRequired},

    {S::TokenRefreshing, E::RefreshSuccess, S::Starting},
    {S::TokenRefreshing, E::RefreshFailure, S::AuthFailed},
    {S::TokenRefreshing, E::Stop, S::Idle},
    {S::TokenRefreshing, E::Reset, S::Idle},

    {S::Starting, E::Started, S::Running},
    {S::Starting, E::StartFailed, S::RuntimeError},
    {S::Starting, E::Stop, S::Stopping},
    {S::Starting, E::Crashed, S::RuntimeError},

    {S::Running, E::Stop, S::Stopping},
    {S::Running, E::TokenExpired, S::TokenRefreshing},
    {S::Running, E::Crashed, S::RuntimeError},

    {S::Stopping, E::Stopped, S::Stopped},
    {S::Stopping, E::Crashed, S::RuntimeError},

    {S::Stopped, E::Start, S::Validating},
    {S::Stopped, E::Stop, S::Stopped},

    {S::ConfigError, E::Start, S::Validating},
    {S::ConfigError, E::Retry, S::Validating},
    {S::ConfigError, E::Stop, S::Idle},
    {S::ConfigError, E::Reset, S::Idle},

    {S::RuntimeError, E::Start, S::Validating},
    {S::RuntimeError, E::Retry, S::Validating},
    {S::RuntimeError, E::Stop, S::Idle},
    {S::RuntimeError, E::Reset, S::Idle},
};

constexpr std::array<std::pair<S, const char*>, 13> kStateNames{{
    {S::Uninitialized, "UNINITIALIZED"},
    {S::Idle, "IDLE"},
    {S::Stopped, "STOPPED"},
    {S::Running, "RUNNING"},
    {S::Validating, "VALIDATING"},
    {S::Starting, "STARTING"},
    {S::Stopping, "STOPPING"},
    {S::TokenRefreshing, "TOKEN_REFRESHING"},
    {S::AuthRequired, "AUTH_REQUIRED"},
    {S::Authenticating, "AUTHENTICATING"},
    {S::AuthFailed, "AUTH_FAILED"},
    {S::ConfigError, "CONFIG_ERROR"},
    {S::RuntimeError, "RUNTIME_ERROR"},
}};

constexpr std::array<std::pair<E, const char*>, 14> kEventNames{{
    {E::Start, "START"},
    {E::Stop, "STOP"},
    {E::Started, "STARTED"},
    {E::Stopped, "STOPPED"},
    {E::StartFailed, "START_FAILED"},
    {E::Crashed, "CRASHED"},
    {E::Authenticate, "AUTHENTICATE"},
    {E::AuthSuccess, "AUTH_SUCCESS"},
    {E::AuthFailure, "AUTH_FAILURE"},
    {E::TokenExpired, "TOKEN_EXPIRED"},
    {E::RefreshSuccess, "REFRESH_SUCCESS"},
    {E::RefreshFailure, "REFRESH_FAILURE"},
    {E::Retry, "RETRY"},
    {E::Reset, "RESET"},
}};

constexpr std::size_t kSerializedHistory = 10;
} // namespace

const char* ToString(ServerState state) {
    for (const auto& [s, name] : kStateNames) {
        if (s == state) return name;
    }
    return "UNKNOWN";
}

const char* ToString(StateEvent event) {
    for (const auto& [e, name] : kEventNames) {
        if (e == event) return name;
    }
    return "UNKNOWN";
}

std::optional<ServerState> StateFromString(const std::string& name) {
    for (const auto& [s, n] : kStateNames) {
        if (name == n) return s;
    }
    return std::nullopt;
}

std::optional<StateEvent> EventFromString(const std::string& name) {
    for (const auto& [e, n] : kEventNames) {
        if (name == n) return e;
    }
    return std::nullopt;
}

std::optional<ServerState> Transition(ServerState state, StateEvent event) noexcept {
    for (const auto& edge : kEdges) {
        if (edge.from == state && edge.event == event) {
            return edge.to;
        }
    }
    return std::nullopt;
}

std::vector<StateEvent> AvailableEvents(ServerState state) {
    std::vector<StateEvent> out;
    for (const auto& [e, name] : kEventNames) {
        if (Transition(state, e).has_value()) {
            out.push_back(e);
        }
    }
    return out;
}

bool IsStartable(ServerState state) noexcept {
    switch (state) {
        case S::Uninitialized:
        case S::Idle:
        case S::Stopped:
        case S::AuthRequired:
        case S::ConfigError:
        case S::RuntimeError:
            return true;
        default:
            return false;
    }
}

bool IsStoppable(ServerState state) noexcept {
    return state == S::Starting || state == S::Running;
}

bool IsAttentionRequired(ServerState state) noexcept {
    return state == S::AuthRequired || state == S::AuthFailed ||
           state == S::ConfigError || state == S::RuntimeError;
}

bool IsActive(ServerState state) noexcept {
    switch (state) {
        case S::Validating:
        case S::Starting:
        case S::Stopping:
        case S::TokenRefreshing:
        case S::Authenticating:
            return true;
        default:
            return false;
    }
}

bool IsErrorState(ServerState state) noexcept {
    return state == S::ConfigError || state == S::RuntimeError || state == S::AuthFailed;
}

bool IsAuthState(ServerState state) noexcept {
    return state == S::AuthRequired || state == S::Authenticating || state == S::AuthFailed;
}

int64_t NowEpochMs() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

JSONValue MetadataToJSON(const StateMetadata& m) {
    JSONValue out{JSONValue::Object{}};
    SetMember(out, "timestamp", JSONValue(m.timestamp));
    SetMember(out, "restartCount", JSONValue(static_cast<int64_t>(m.restartCount)));
    if (m.errorMessage) SetMember(out, "errorMessage", JSONValue(*m.errorMessage));
    if (m.errorCode) SetMember(out, "errorCode", JSONValue(*m.errorCode));
    if (m.exitCode) SetMember(out, "exitCode", JSONValue(static_cast<int64_t>(*m.exitCode)));
    if (m.exitSignal) SetMember(out, "exitSignal", JSONValue(static_cast<int64_t>(*m.exitSignal)));
    if (m.authUrl) SetMember(out, "authUrl", JSONValue(*m.authUrl));
    if (m.tokenExpiresAt) SetMember(out, "tokenExpiresAt", JSONValue(*m.tokenExpiresAt));
    if (m.processId) SetMember(out, "processId", JSONValue(static_cast<int64_t>(*m.processId)));
    if (m.userMessage) SetMember(out, "userMessage", JSONValue(*m.userMessage));
    if (!m.suggestedActions.empty()) SetMember(out, "suggestedActions", MakeStringArray(m.suggestedActions));
    return out;
}

JSONValue TransitionRecordToJSON(const TransitionRecord& r) {
    return MakeObject({
        {"from", JSONValue(ToString(r.from))},
        {"to", JSONValue(ToString(r.to))},
        {"event", JSONValue(r.event)},
        {"timestamp", JSONValue(r.timestamp)},
        {"metadata", MetadataToJSON(r.metadata)},
    });
}

////////////////////////////////////////////// StateMachine //////////////////////////////////////////////

StateMachine::StateMachine(std::string serverId, std::size_t historyLimit, ServerState initial)
    : serverId(std::move(serverId)),
      historyLimit(historyLimit == 0 ? DefaultHistoryLimit : historyLimit),
      current(initial) {
    metadata.timestamp = NowEpochMs();
}

ServerState StateMachine::State() const {
    std::lock_guard<std::mutex> lk(mutex);
    return current;
}

std::optional<ServerState> StateMachine::PreviousState() const {
    std::lock_guard<std::mutex> lk(mutex);
    return previous;
}

StateMetadata StateMachine::Metadata() const {
    std::lock_guard<std::mutex> lk(mutex);
    return metadata;
}

std::vector<TransitionRecord> StateMachine::History() const {
    std::lock_guard<std::mutex> lk(mutex);
    return history;
}

bool StateMachine::NeedsAuth() const {
    const ServerState s = State();
    return s == S::AuthRequired || s == S::AuthFailed;
}

void StateMachine::mergeLocked(StateMetadata& into, const MetadataPatch& p) {
    if (p.errorMessage) into.errorMessage = p.errorMessage;
    if (p.errorCode) into.errorCode = p.errorCode;
    if (p.exitCode) into.exitCode = p.exitCode;
    if (p.exitSignal) into.exitSignal = p.exitSignal;
    if (p.authUrl) into.authUrl = p.authUrl;
    if (p.tokenExpiresAt) into.tokenExpiresAt = p.tokenExpiresAt;
    if (p.processId) into.processId = p.processId;
    if (p.restartCount) into.restartCount = *p.restartCount;
    if (p.userMessage) into.userMessage = p.userMessage;
    if (p.suggestedActions) into.suggestedActions = *p.suggestedActions;
}

void StateMachine::appendHistoryLocked(TransitionRecord record) {
    history.push_back(std::move(record));
    if (history.size() > historyLimit) {
        history.erase(history.begin(), history.begin() + static_cast<std::ptrdiff_t>(history.size() - historyLimit));
    }
}

bool StateMachine::Apply(StateEvent event, const MetadataPatch& patch) {
    FUNC_SCOPE();
    TransitionRecord record;
    {
        std::lock_guard<std::mutex> lk(mutex);
        auto next = Transition(current, event);
        if (!next.has_value()) {
            LOG_WARN("[{}] Rejected transition: {} + {}", serverId, ToString(current), ToString(event));
            return false;
        }
        record.from = current;
        record.to = *next;
        record.event = ToString(event);
        record.timestamp = NowEpochMs();

        previous = current;
        current = *next;
        mergeLocked(metadata, patch);
        metadata.timestamp = record.timestamp;
        record.metadata = metadata;
        appendHistoryLocked(record);
    }
    LOG_DEBUG("[{}] {} --{}--> {}", serverId, ToString(record.from), record.event, ToString(record.to));
    listeners.Emit(record);
    return true;
}

bool StateMachine::CanApply(StateEvent event) const {
    return Transition(State(), event).has_value();
}

void StateMachine::ForceState(ServerState state, const MetadataPatch& patch) {
    FUNC_SCOPE();
    TransitionRecord record;
    {
        std::lock_guard<std::mutex> lk(mutex);
        record.from = current;
        record.to = state;
        record.event = "FORCE";
        record.timestamp = NowEpochMs();
        previous = current;
        current = state;
        mergeLocked(metadata, patch);
        metadata.timestamp = record.timestamp;
        record.metadata = metadata;
        appendHistoryLocked(record);
    }
    LOG_WARN("[{}] Forced state {} -> {}", serverId, ToString(record.from), ToString(record.to));
    listeners.Emit(record);
}

void StateMachine::Reset() {
    FUNC_SCOPE();
    TransitionRecord record;
    {
        std::lock_guard<std::mutex> lk(mutex);
        record.from = current;
        record.to = S::Idle;
        record.event = ToString(E::Reset);
        record.timestamp = NowEpochMs();
        previous = current;
        current = S::Idle;
        metadata = StateMetadata{};
        metadata.timestamp = record.timestamp;
        history.clear();
        record.metadata = metadata;
    }
    listeners.Emit(record);
}

void StateMachine::ClearHistory() {
    std::lock_guard<std::mutex> lk(mutex);
    history.clear();
}

void StateMachine::UpdateMetadata(const MetadataPatch& patch) {
    std::lock_guard<std::mutex> lk(mutex);
    mergeLocked(metadata, patch);
}

void StateMachine::SetError(const std::string& message, const std::string& code) {
    std::lock_guard<std::mutex> lk(mutex);
    metadata.errorMessage = message;
    metadata.errorCode = code;
}

void StateMachine::ClearError() {
    std::lock_guard<std::mutex> lk(mutex);
    metadata.errorMessage.reset();
    metadata.errorCode.reset();
    metadata.exitCode.reset();
    metadata.exitSignal.reset();
    metadata.userMessage.reset();
    metadata.suggestedActions.clear();
}

JSONValue StateMachine::ToJSON() const {
    std::lock_guard<std::mutex> lk(mutex);
    JSONValue::Array hist;
    const std::size_t start = history.size() > kSerializedHistory ? history.size() - kSerializedHistory : 0;
    for (std::size_t i = start; i < history.size(); ++i) {
        hist.push_back(std::make_shared<JSONValue>(TransitionRecordToJSON(history[i])));
    }
    return MakeObject({
        {"serverId", JSONValue(serverId)},
        {"currentState", JSONValue(ToString(current))},
        {"previousState", previous ? JSONValue(ToString(*previous)) : JSONValue(nullptr)},
        {"metadata", MetadataToJSON(metadata)},
        {"history", JSONValue(std::move(hist))},
    });
}

events::Unsubscribe StateMachine::OnTransition(TransitionListener listener) {
    return listeners.Subscribe(std::move(listener));
}

} // namespace mcpm
