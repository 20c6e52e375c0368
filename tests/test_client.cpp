//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_client.cpp
// Purpose: GoogleTests for the MCP client over a process transport (handshake, paging, error mapping)
//==========================================================================================================

#include <gtest/gtest.h>

#include <mutex>

#include "mcpm/Client.h"
#include "mcpm/ProcessTransport.hpp"
#include "mcpm/adapters/InMemoryProcessAdapter.hpp"
#include "mcpm/errors/Errors.h"
#include "support/ScriptedMcpPeer.h"

using namespace mcpm;
using adapters::InMemoryProcess;
using adapters::InMemoryProcessAdapter;
using mcpm::testing::WaitFor;

namespace {
constexpr auto Wait = std::chrono::seconds(3);

// Pages tools/list in two pages and serves resources/read and prompts/get.
InMemoryProcess::Peer pagingPeer() {
    return [](const std::string& line, InMemoryProcess& p) {
        JSONValue msg = ParseJSON(line);
        auto method = GetStringMember(msg, "method");
        if (!method.has_value() || FindMember(msg, "id") == nullptr) {
            return;
        }
        JSONRPCRequest req;
        req.FromValue(msg);
        const JSONValue params = req.params.value_or(JSONValue(JSONValue::Object{}));
        if (*method == "initialize") {
            p.EmitStdout(JSONRPCResponse(req.id, MakeObject({
                {"protocolVersion", JSONValue("2025-11-25")},
                {"capabilities", MakeObject({{"tools", MakeObject({{"listChanged", JSONValue(true)}})},
                                             {"prompts", JSONValue(JSONValue::Object{})}})},
                {"serverInfo", MakeObject({{"name", JSONValue("pager")}, {"version", JSONValue("2.0")}})},
                {"instructions", JSONValue("be nice")},
            })).Serialize());
        } else if (*method == "tools/list") {
            auto cursor = GetStringMember(params, "cursor");
            JSONValue page = cursor.has_value() ? mcpm::testing::toolsListResult({"third"})
                                                : mcpm::testing::toolsListResult({"first", "second"});
            if (!cursor.has_value()) {
                SetMember(page, "nextCursor", JSONValue("page-2"));
            }
            p.EmitStdout(JSONRPCResponse(req.id, page).Serialize());
        } else if (*method == "tools/call") {
            if (GetStringMember(params, "name") == std::string("soft")) {
                JSONValue::Array content;
                content.push_back(std::make_shared<JSONValue>(
                    MakeObject({{"type", JSONValue("text")}, {"text", JSONValue("soft failure")}})));
                p.EmitStdout(JSONRPCResponse(req.id, MakeObject({{"content", JSONValue(std::move(content))},
                                                                 {"isError", JSONValue(true)}})).Serialize());
                return;
            }
            p.EmitStdout(CreateErrorResponse(req.id, JSONRPCErrorCodes::ToolNotFound, "unknown tool")->Serialize());
        } else if (*method == "resources/read") {
            p.EmitStdout(CreateErrorResponse(req.id, JSONRPCErrorCodes::ResourceNotFound, "no resource")->Serialize());
        } else if (*method == "prompts/list") {
            JSONValue::Array prompts;
            prompts.push_back(std::make_shared<JSONValue>(
                MakeObject({{"name", JSONValue("greet")}, {"description", JSONValue("Say hi")}})));
            p.EmitStdout(JSONRPCResponse(req.id, MakeObject({{"prompts", JSONValue(std::move(prompts))}})).Serialize());
        } else if (*method == "prompts/get") {
            p.EmitStdout(CreateErrorResponse(req.id, JSONRPCErrorCodes::PromptNotFound, "no prompt")->Serialize());
        } else {
            p.EmitStdout(CreateErrorResponse(req.id, JSONRPCErrorCodes::MethodNotFound, "nope")->Serialize());
        }
    };
}

struct Session {
    InMemoryProcessAdapter adapter;
    std::shared_ptr<adapters::IProcess> process;
    Client client{"srv"};

    explicit Session(InMemoryProcess::Peer peer) {
        adapter.SetPeer(std::move(peer));
        adapters::ProcessSpec spec;
        spec.command = "fake";
        process = adapter.Spawn("srv", spec);
        auto transport = std::make_unique<ProcessTransport>(process);
        transport->SetRequestTimeoutMs(2000);
        client.Connect(std::move(transport)).get();
    }
};

template <typename F>
errors::ManagerError failure(F& fut) {
    try {
        fut.get();
    } catch (const errors::ManagerError& e) {
        return e;
    }
    ADD_FAILURE() << "future did not fail";
    return errors::ManagerError(errors::ErrorCode::ProcessError, "no failure");
}
} // namespace

TEST(Client, InitializeParsesServerAnswer) {
    Session s(pagingPeer());
    EXPECT_TRUE(s.client.IsConnected());
    auto fut = s.client.Initialize(Implementation("mcpm", "test"));
    ASSERT_EQ(fut.wait_for(Wait), std::future_status::ready);
    InitializeResult init = fut.get();
    EXPECT_EQ(init.protocolVersion, "2025-11-25");
    EXPECT_EQ(init.serverInfo.name, "pager");
    ASSERT_TRUE(init.capabilities.tools.has_value());
    EXPECT_TRUE(init.capabilities.tools->listChanged);
    EXPECT_TRUE(init.capabilities.prompts.has_value());
    EXPECT_FALSE(init.capabilities.resources.has_value());
    EXPECT_EQ(init.instructions, "be nice");

    EXPECT_NO_THROW(s.client.SendInitialized().get());
    auto sent = s.adapter.Last("srv")->Received();
    ASSERT_EQ(sent.size(), 2u);
    JSONValue initReq = ParseJSON(sent[0]);
    const JSONValue* params = FindMember(initReq, "params");
    ASSERT_NE(params, nullptr);
    EXPECT_EQ(GetStringMember(*params, "protocolVersion"), "2025-11-25");
    EXPECT_EQ(GetStringMember(ParseJSON(sent[1]), "method"), "notifications/initialized");
}

TEST(Client, ListToolsFollowsCursor) {
    Session s(pagingPeer());
    auto fut = s.client.ListTools();
    ASSERT_EQ(fut.wait_for(Wait), std::future_status::ready);
    auto tools = fut.get();
    ASSERT_EQ(tools.size(), 3u);
    EXPECT_EQ(tools[0].name, "first");
    EXPECT_EQ(tools[2].name, "third");
    EXPECT_EQ(tools[1].description, "scripted second");
}

TEST(Client, ListPrompts) {
    Session s(pagingPeer());
    auto prompts = s.client.ListPrompts().get();
    ASSERT_EQ(prompts.size(), 1u);
    EXPECT_EQ(prompts[0].name, "greet");
    EXPECT_EQ(prompts[0].description, "Say hi");
}

TEST(Client, ServerErrorsMapPerOperation) {
    Session s(pagingPeer());

    auto call = s.client.CallTool("missing", JSONValue(JSONValue::Object{}));
    ASSERT_EQ(call.wait_for(Wait), std::future_status::ready);
    auto e1 = failure(call);
    EXPECT_EQ(e1.code(), errors::ErrorCode::ToolCallFailed);
    ASSERT_TRUE(e1.upstream().has_value());
    EXPECT_EQ(e1.upstream()->code, JSONRPCErrorCodes::ToolNotFound);
    EXPECT_EQ(e1.serverId(), "srv");

    auto read = s.client.ReadResource("mem://nothing");
    ASSERT_EQ(read.wait_for(Wait), std::future_status::ready);
    EXPECT_EQ(failure(read).code(), errors::ErrorCode::ResourceReadFailed);

    auto prompt = s.client.GetPrompt("nothing", JSONValue());
    ASSERT_EQ(prompt.wait_for(Wait), std::future_status::ready);
    EXPECT_EQ(failure(prompt).code(), errors::ErrorCode::PromptGetFailed);

    auto resources = s.client.ListResources();
    ASSERT_EQ(resources.wait_for(Wait), std::future_status::ready);
    auto e4 = failure(resources);
    EXPECT_EQ(e4.code(), errors::ErrorCode::ProcessError);
    EXPECT_EQ(e4.upstream()->code, JSONRPCErrorCodes::MethodNotFound);
}

TEST(Client, ToolLevelErrorIsAResult) {
    Session s(pagingPeer());
    auto call = s.client.CallTool("soft", JSONValue());
    ASSERT_EQ(call.wait_for(Wait), std::future_status::ready);
    JSONValue result = call.get();
    EXPECT_EQ(GetBoolMember(result, "isError"), true);
}

TEST(Client, NotificationsReachHandler) {
    Session s([](const std::string&, InMemoryProcess&) {});
    std::mutex m;
    std::vector<std::string> methods;
    s.client.SetNotificationHandler([&](const std::string& method, const JSONValue&) {
        std::lock_guard<std::mutex> lk(m);
        methods.push_back(method);
    });
    s.adapter.Last("srv")->EmitStdout(JSONRPCNotification("notifications/tools/list_changed").Serialize());
    ASSERT_TRUE(WaitFor([&]() {
        std::lock_guard<std::mutex> lk(m);
        return methods.size() == 1;
    }));
}

TEST(Client, ProcessExitFailsInFlightCall) {
    Session s([](const std::string&, InMemoryProcess& p) { p.SimulateExit(9); });
    auto call = s.client.CallTool("echo", JSONValue());
    ASSERT_EQ(call.wait_for(Wait), std::future_status::ready);
    EXPECT_EQ(failure(call).code(), errors::ErrorCode::ServerNotRunning);
}

TEST(Client, CallsFailWhenDisconnected) {
    Client c("lonely");
    EXPECT_FALSE(c.IsConnected());
    auto call = c.CallTool("echo", JSONValue());
    EXPECT_EQ(failure(call).code(), errors::ErrorCode::ServerNotRunning);
    EXPECT_NO_THROW(c.Disconnect().get());
}
