//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_event_hub.cpp
// Purpose: GoogleTests for EventHub fan-out and re-entrant unsubscribe
//==========================================================================================================

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <vector>

#include "mcpm/events/EventHub.h"

using mcpm::events::EventHub;
using mcpm::events::Unsubscribe;

TEST(EventHub, DeliversInSubscriptionOrder) {
    EventHub<int> hub;
    std::vector<std::string> seen;
    auto a = hub.Subscribe([&](const int& v) { seen.push_back("a" + std::to_string(v)); });
    auto b = hub.Subscribe([&](const int& v) { seen.push_back("b" + std::to_string(v)); });
    hub.Emit(1);
    a();
    hub.Emit(2);
    EXPECT_EQ(seen, (std::vector<std::string>{"a1", "b1", "b2"}));
    EXPECT_EQ(hub.Size(), 1u);
    b();
    EXPECT_EQ(hub.Size(), 0u);
}

TEST(EventHub, UnsubscribeIsIdempotentAndOutlivesHub) {
    Unsubscribe off;
    {
        EventHub<std::string> hub;
        off = hub.Subscribe([](const std::string&) {});
        off();
        off();
        EXPECT_EQ(hub.Size(), 0u);
        off = hub.Subscribe([](const std::string&) {});
    }
    off();
}

TEST(EventHub, SubscriberRemovedDuringEmitIsNotCalled) {
    EventHub<int> hub;
    int secondCalls = 0;
    Unsubscribe second;
    auto first = hub.Subscribe([&](const int&) { second(); });
    second = hub.Subscribe([&](const int&) { ++secondCalls; });
    hub.Emit(0);
    EXPECT_EQ(secondCalls, 0);
    first();
}

TEST(EventHub, SubscribeDuringEmitTakesEffectNextTime) {
    EventHub<int> hub;
    int lateCalls = 0;
    std::vector<Unsubscribe> subs;
    subs.push_back(hub.Subscribe([&](const int&) {
        if (subs.size() == 1) {
            subs.push_back(hub.Subscribe([&](const int&) { ++lateCalls; }));
        }
    }));
    hub.Emit(0);
    EXPECT_EQ(lateCalls, 0);
    hub.Emit(0);
    EXPECT_EQ(lateCalls, 1);
    for (auto& off : subs) {
        off();
    }
}

TEST(EventHub, ThrowingSubscriberDoesNotStopDelivery) {
    EventHub<int> hub;
    int delivered = 0;
    auto a = hub.Subscribe([](const int&) { throw std::runtime_error("boom"); });
    auto b = hub.Subscribe([&](const int&) { ++delivered; });
    EXPECT_NO_THROW(hub.Emit(3));
    EXPECT_EQ(delivered, 1);
    hub.Clear();
    hub.Emit(4);
    EXPECT_EQ(delivered, 1);
}
