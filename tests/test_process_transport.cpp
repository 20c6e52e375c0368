//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_process_transport.cpp
// Purpose: GoogleTests for line-delimited JSON-RPC over a process handle
//==========================================================================================================

#include <gtest/gtest.h>

#include <atomic>
#include <future>
#include <mutex>

#include "mcpm/JSONRPCTypes.h"
#include "mcpm/ProcessTransport.hpp"
#include "mcpm/adapters/InMemoryProcessAdapter.hpp"
#include "mcpm/errors/Errors.h"
#include "support/ScriptedMcpPeer.h"

using namespace mcpm;
using adapters::InMemoryProcess;
using adapters::InMemoryProcessAdapter;
using mcpm::testing::WaitFor;

namespace {
adapters::ProcessSpec anySpec() {
    adapters::ProcessSpec spec;
    spec.command = "fake";
    return spec;
}

// Answers every request with {"echo": <method>}; never answers "hang".
InMemoryProcess::Peer echoPeer() {
    return [](const std::string& line, InMemoryProcess& p) {
        JSONValue msg = ParseJSON(line);
        auto method = GetStringMember(msg, "method");
        if (!method.has_value() || *method == "hang" || FindMember(msg, "id") == nullptr) {
            return;
        }
        JSONRPCRequest req;
        req.FromValue(msg);
        p.EmitStdout(JSONRPCResponse(req.id, MakeObject({{"echo", JSONValue(*method)}})).Serialize());
    };
}

std::unique_ptr<JSONRPCRequest> request(const std::string& method) {
    auto r = std::make_unique<JSONRPCRequest>();
    r->method = method;
    return r;
}

template <typename F>
errors::ErrorCode failureCode(F& fut) {
    try {
        fut.get();
    } catch (const errors::ManagerError& e) {
        return e.code();
    }
    ADD_FAILURE() << "future did not fail";
    return errors::ErrorCode::ProcessError;
}
} // namespace

TEST(ProcessTransport, RequestsCorrelateByGeneratedId) {
    InMemoryProcessAdapter adapter;
    adapter.SetPeer(echoPeer());
    auto proc = adapter.Spawn("srv", anySpec());
    ProcessTransport t(proc);
    t.Start().get();
    EXPECT_TRUE(t.IsConnected());
    EXPECT_EQ(t.GetSessionId(), "proc-srv-40000");

    auto a = t.SendRequest(request("alpha"));
    auto b = t.SendRequest(request("beta"));
    ASSERT_EQ(a.wait_for(std::chrono::seconds(2)), std::future_status::ready);
    ASSERT_EQ(b.wait_for(std::chrono::seconds(2)), std::future_status::ready);
    auto ra = a.get();
    auto rb = b.get();
    EXPECT_EQ(GetStringMember(*ra->result, "echo"), "alpha");
    EXPECT_EQ(GetStringMember(*rb->result, "echo"), "beta");
    EXPECT_EQ(JSONRPCIdToString(ra->id), "req-1");
    EXPECT_EQ(JSONRPCIdToString(rb->id), "req-2");
    EXPECT_EQ(t.PendingRequestCount(), 0u);

    auto sent = adapter.Last("srv")->Received();
    ASSERT_EQ(sent.size(), 2u);
    EXPECT_EQ(GetStringMember(ParseJSON(sent[0]), "jsonrpc"), "2.0");
}

TEST(ProcessTransport, CallerIdIsKept) {
    InMemoryProcessAdapter adapter;
    adapter.SetPeer(echoPeer());
    ProcessTransport t(adapter.Spawn("srv", anySpec()));
    t.Start().get();
    auto r = std::make_unique<JSONRPCRequest>(JSONRPCId(int64_t{42}), "gamma");
    auto fut = t.SendRequest(std::move(r));
    ASSERT_EQ(fut.wait_for(std::chrono::seconds(2)), std::future_status::ready);
    EXPECT_EQ(JSONRPCIdToString(fut.get()->id), "42");
}

TEST(ProcessTransport, TimeoutFailsOnlyTheSlowRequest) {
    InMemoryProcessAdapter adapter;
    adapter.SetPeer(echoPeer());
    ProcessTransport t(adapter.Spawn("srv", anySpec()));
    t.SetRequestTimeoutMs(150);
    t.Start().get();
    auto slow = t.SendRequest(request("hang"));
    auto fast = t.SendRequest(request("fast"));
    ASSERT_EQ(fast.wait_for(std::chrono::seconds(2)), std::future_status::ready);
    EXPECT_NO_THROW(fast.get());
    ASSERT_EQ(slow.wait_for(std::chrono::seconds(2)), std::future_status::ready);
    EXPECT_EQ(failureCode(slow), errors::ErrorCode::RequestTimeout);
    EXPECT_EQ(t.PendingRequestCount(), 0u);
}

TEST(ProcessTransport, ExitFailsPendingRequests) {
    InMemoryProcessAdapter adapter;
    adapter.SetPeer(echoPeer());
    auto proc = adapter.Spawn("srv", anySpec());
    ProcessTransport t(proc);
    std::atomic<int> errorsSeen{0};
    t.SetErrorHandler([&](const std::string&) { errorsSeen++; });
    t.Start().get();
    auto pending = t.SendRequest(request("hang"));
    adapter.Last("srv")->SimulateExit(1);
    ASSERT_EQ(pending.wait_for(std::chrono::seconds(2)), std::future_status::ready);
    EXPECT_EQ(failureCode(pending), errors::ErrorCode::ServerNotRunning);
    EXPECT_FALSE(t.IsConnected());
    EXPECT_GE(errorsSeen.load(), 1);

    auto after = t.SendRequest(request("alpha"));
    EXPECT_EQ(failureCode(after), errors::ErrorCode::ServerNotRunning);
}

TEST(ProcessTransport, CloseFailsPendingAndLeavesProcessAlive) {
    InMemoryProcessAdapter adapter;
    adapter.SetPeer(echoPeer());
    auto proc = adapter.Spawn("srv", anySpec());
    ProcessTransport t(proc);
    t.Start().get();
    auto pending = t.SendRequest(request("hang"));
    t.Close().get();
    EXPECT_EQ(failureCode(pending), errors::ErrorCode::ServerNotRunning);
    EXPECT_TRUE(proc->IsRunning());
    EXPECT_FALSE(adapter.Last("srv")->KillRequested());
}

TEST(ProcessTransport, StartFailsForDeadProcess) {
    InMemoryProcessAdapter adapter;
    auto proc = adapter.Spawn("srv", anySpec());
    adapter.Last("srv")->SimulateExit(0);
    ASSERT_TRUE(WaitFor([&]() { return !proc->IsRunning(); }));
    ProcessTransport t(proc);
    auto fut = t.Start();
    EXPECT_EQ(failureCode(fut), errors::ErrorCode::ServerNotRunning);
}

TEST(ProcessTransport, NotificationsAndServerRequests) {
    InMemoryProcessAdapter adapter;
    auto proc = adapter.Spawn("srv", anySpec());
    auto fake = adapter.Last("srv");
    ProcessTransport t(proc);

    std::mutex m;
    std::vector<std::string> notifications;
    std::vector<std::string> errorsSeen;
    t.SetNotificationHandler([&](std::unique_ptr<JSONRPCNotification> n) {
        std::lock_guard<std::mutex> lk(m);
        notifications.push_back(n->method);
    });
    t.SetErrorHandler([&](const std::string& e) {
        std::lock_guard<std::mutex> lk(m);
        errorsSeen.push_back(e);
    });
    t.Start().get();

    fake->EmitStdout(JSONRPCNotification("notifications/tools/list_changed").Serialize());
    fake->EmitStdout("this is not json");
    fake->EmitStdout(JSONRPCRequest(JSONRPCId(std::string("s1")), "ping").Serialize());
    fake->EmitStdout(JSONRPCRequest(JSONRPCId(std::string("s2")), "sampling/createMessage").Serialize());

    ASSERT_TRUE(WaitFor([&]() { return fake->Received().size() == 2; }));
    auto replies = fake->Received();
    JSONValue pong = ParseJSON(replies[0]);
    EXPECT_EQ(GetStringMember(pong, "id"), "s1");
    EXPECT_NE(FindMember(pong, "result"), nullptr);
    JSONValue refused = ParseJSON(replies[1]);
    const JSONValue* err = FindMember(refused, "error");
    ASSERT_NE(err, nullptr);
    EXPECT_EQ(GetIntMember(*err, "code"), JSONRPCErrorCodes::MethodNotFound);

    std::lock_guard<std::mutex> lk(m);
    EXPECT_EQ(notifications, (std::vector<std::string>{"notifications/tools/list_changed"}));
    EXPECT_EQ(errorsSeen.size(), 1u);
}

TEST(ProcessTransport, NotificationWriteFailsAfterExit) {
    InMemoryProcessAdapter adapter;
    auto proc = adapter.Spawn("srv", anySpec());
    ProcessTransport t(proc);
    t.Start().get();
    EXPECT_NO_THROW(t.SendNotification(std::make_unique<JSONRPCNotification>("notifications/initialized")).get());
    adapter.Last("srv")->SimulateExit(0);
    ASSERT_TRUE(WaitFor([&]() { return !t.IsConnected(); }));
    auto fut = t.SendNotification(std::make_unique<JSONRPCNotification>("notifications/initialized"));
    EXPECT_EQ(failureCode(fut), errors::ErrorCode::ServerNotRunning);
}
