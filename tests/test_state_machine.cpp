//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_state_machine.cpp
// Purpose: GoogleTests for the lifecycle transition table and the per-server state machine
//==========================================================================================================

#include <gtest/gtest.h>

#include "mcpm/StateMachine.h"

using namespace mcpm;
using S = ServerState;
using E = StateEvent;

TEST(TransitionTable, HappyPath) {
    EXPECT_EQ(Transition(S::Idle, E::Start), S::Validating);
    EXPECT_EQ(Transition(S::Validating, E::Started), S::Starting);
    EXPECT_EQ(Transition(S::Starting, E::Started), S::Running);
    EXPECT_EQ(Transition(S::Running, E::Stop), S::Stopping);
    EXPECT_EQ(Transition(S::Stopping, E::Stopped), S::Stopped);
    EXPECT_EQ(Transition(S::Stopped, E::Start), S::Validating);
}

TEST(TransitionTable, AuthAndRefreshEdges) {
    EXPECT_EQ(Transition(S::Validating, E::AuthFailure), S::AuthRequired);
    EXPECT_EQ(Transition(S::AuthRequired, E::Authenticate), S::Authenticating);
    EXPECT_EQ(Transition(S::Authenticating, E::AuthSuccess), S::Validating);
    EXPECT_EQ(Transition(S::Authenticating, E::AuthFailure), S::AuthFailed);
    EXPECT_EQ(Transition(S::Authenticating, E::Stop), S::AuthRequired);
    EXPECT_EQ(Transition(S::AuthFailed, E::Retry), S::Authenticating);
    EXPECT_EQ(Transition(S::AuthFailed, E::Reset), S::AuthRequired);
    EXPECT_EQ(Transition(S::Validating, E::TokenExpired), S::TokenRefreshing);
    EXPECT_EQ(Transition(S::Running, E::TokenExpired), S::TokenRefreshing);
    EXPECT_EQ(Transition(S::TokenRefreshing, E::RefreshSuccess), S::Starting);
    EXPECT_EQ(Transition(S::TokenRefreshing, E::RefreshFailure), S::AuthFailed);
}

TEST(TransitionTable, ErrorEdges) {
    EXPECT_EQ(Transition(S::Validating, E::StartFailed), S::ConfigError);
    EXPECT_EQ(Transition(S::Starting, E::StartFailed), S::RuntimeError);
    EXPECT_EQ(Transition(S::Starting, E::Crashed), S::RuntimeError);
    EXPECT_EQ(Transition(S::Running, E::Crashed), S::RuntimeError);
    EXPECT_EQ(Transition(S::ConfigError, E::Retry), S::Validating);
    EXPECT_EQ(Transition(S::RuntimeError, E::Reset), S::Idle);
}

TEST(TransitionTable, UndeclaredPairsAreRejected) {
    EXPECT_FALSE(Transition(S::Idle, E::Started).has_value());
    EXPECT_FALSE(Transition(S::Running, E::Start).has_value());
    EXPECT_FALSE(Transition(S::Stopping, E::Start).has_value());
    EXPECT_FALSE(Transition(S::Running, E::Reset).has_value());
    EXPECT_FALSE(Transition(S::Idle, E::Retry).has_value());
}

TEST(TransitionTable, NamesRoundTrip) {
    for (S s : {S::Uninitialized, S::Idle, S::Running, S::TokenRefreshing, S::AuthFailed, S::RuntimeError}) {
        auto parsed = StateFromString(ToString(s));
        ASSERT_TRUE(parsed.has_value());
        EXPECT_EQ(*parsed, s);
    }
    EXPECT_STREQ(ToString(S::TokenRefreshing), "TOKEN_REFRESHING");
    EXPECT_STREQ(ToString(E::StartFailed), "START_FAILED");
    EXPECT_EQ(EventFromString("AUTH_SUCCESS"), E::AuthSuccess);
    EXPECT_FALSE(StateFromString("BOGUS").has_value());
}

TEST(TransitionTable, Predicates) {
    EXPECT_TRUE(IsStartable(S::Uninitialized));
    EXPECT_TRUE(IsStartable(S::AuthRequired));
    EXPECT_TRUE(IsStartable(S::RuntimeError));
    EXPECT_FALSE(IsStartable(S::Running));
    EXPECT_FALSE(IsStartable(S::Authenticating));
    EXPECT_TRUE(IsStoppable(S::Running));
    EXPECT_FALSE(IsStoppable(S::Idle));
    EXPECT_TRUE(IsActive(S::Stopping));
    EXPECT_FALSE(IsActive(S::Running));
    EXPECT_TRUE(IsErrorState(S::AuthFailed));
    EXPECT_TRUE(IsAttentionRequired(S::AuthRequired));
    EXPECT_TRUE(IsAuthState(S::Authenticating));
}

TEST(TransitionTable, AvailableEventsMatchTable) {
    auto events = AvailableEvents(S::Running);
    ASSERT_EQ(events.size(), 3u);
    for (E e : events) {
        EXPECT_TRUE(Transition(S::Running, e).has_value());
    }
}

TEST(StateMachine, ApplyRecordsHistoryAndMetadata) {
    StateMachine m("srv");
    EXPECT_EQ(m.State(), S::Uninitialized);
    EXPECT_FALSE(m.PreviousState().has_value());

    MetadataPatch p;
    p.processId = 1234;
    ASSERT_TRUE(m.Apply(E::Start));
    ASSERT_TRUE(m.Apply(E::Started, p));
    EXPECT_EQ(m.State(), S::Starting);
    EXPECT_EQ(m.PreviousState(), S::Validating);
    EXPECT_EQ(m.Metadata().processId, 1234);

    auto history = m.History();
    ASSERT_EQ(history.size(), 2u);
    EXPECT_EQ(history[0].from, S::Uninitialized);
    EXPECT_EQ(history[0].event, "START");
    EXPECT_EQ(history[1].to, S::Starting);
    EXPECT_EQ(history[1].metadata.processId, 1234);
}

TEST(StateMachine, RejectedEventLeavesStateUntouched) {
    StateMachine m("srv", 10, S::Idle);
    std::size_t seen = 0;
    auto off = m.OnTransition([&](const TransitionRecord&) { ++seen; });
    EXPECT_FALSE(m.Apply(E::Started));
    EXPECT_FALSE(m.CanApply(E::Crashed));
    EXPECT_EQ(m.State(), S::Idle);
    EXPECT_TRUE(m.History().empty());
    EXPECT_EQ(seen, 0u);
    off();
}

TEST(StateMachine, HistoryIsBounded) {
    StateMachine m("srv", 4, S::Idle);
    for (int i = 0; i < 10; ++i) {
        ASSERT_TRUE(m.Apply(E::Stop));  // IDLE -> IDLE
    }
    auto history = m.History();
    ASSERT_EQ(history.size(), 4u);
    EXPECT_LE(history.front().timestamp, history.back().timestamp);
}

TEST(StateMachine, ListenersSeeEveryTransitionInOrder) {
    StateMachine m("srv");
    std::vector<std::string> events;
    auto off = m.OnTransition([&](const TransitionRecord& r) { events.push_back(r.event); });
    m.Apply(E::Start);
    m.Apply(E::StartFailed);
    m.Apply(E::Retry);
    off();
    m.Apply(E::Stop);
    EXPECT_EQ(events, (std::vector<std::string>{"START", "START_FAILED", "RETRY"}));
}

TEST(StateMachine, ForceStateBypassesTable) {
    StateMachine m("srv", 10, S::Stopping);
    MetadataPatch p;
    p.userMessage = std::string("forced");
    m.ForceState(S::Stopped, p);
    EXPECT_EQ(m.State(), S::Stopped);
    auto history = m.History();
    ASSERT_EQ(history.size(), 1u);
    EXPECT_EQ(history[0].event, "FORCE");
    EXPECT_EQ(m.Metadata().userMessage, "forced");
}

TEST(StateMachine, ResetClearsHistoryAndMetadata) {
    StateMachine m("srv");
    MetadataPatch p;
    p.errorMessage = std::string("boom");
    p.restartCount = 3;
    m.Apply(E::Start);
    m.Apply(E::StartFailed, p);
    m.Reset();
    EXPECT_EQ(m.State(), S::Idle);
    EXPECT_TRUE(m.History().empty());
    EXPECT_FALSE(m.Metadata().errorMessage.has_value());
    EXPECT_EQ(m.Metadata().restartCount, 0);
}

TEST(StateMachine, ClearErrorKeepsNonErrorFields) {
    StateMachine m("srv");
    MetadataPatch p;
    p.errorMessage = std::string("boom");
    p.errorCode = std::string("MCP_201");
    p.exitCode = 3;
    p.processId = 77;
    p.suggestedActions = std::vector<std::string>{"Retry"};
    m.UpdateMetadata(p);
    m.ClearError();
    auto md = m.Metadata();
    EXPECT_FALSE(md.errorMessage.has_value());
    EXPECT_FALSE(md.errorCode.has_value());
    EXPECT_FALSE(md.exitCode.has_value());
    EXPECT_TRUE(md.suggestedActions.empty());
    EXPECT_EQ(md.processId, 77);
}

TEST(StateMachine, ToJSONCarriesCurrentAndPrevious) {
    StateMachine m("srv");
    m.Apply(E::Start);
    JSONValue j = m.ToJSON();
    EXPECT_EQ(GetStringMember(j, "serverId"), "srv");
    EXPECT_EQ(GetStringMember(j, "currentState"), "VALIDATING");
    EXPECT_EQ(GetStringMember(j, "previousState"), "UNINITIALIZED");
    const JSONValue* hist = FindMember(j, "history");
    ASSERT_NE(hist, nullptr);
    ASSERT_TRUE(hist->isArray());
    EXPECT_EQ(std::get<JSONValue::Array>(hist->value).size(), 1u);
}
