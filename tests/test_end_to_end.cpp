//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_end_to_end.cpp
// Purpose: GoogleTests driving a real child process (mcpm_fake_server) through the lifecycle manager
//==========================================================================================================

#include <gtest/gtest.h>

#include <cstdlib>

#include "mcpm/ServerManager.h"
#include "mcpm/adapters/HostProcessAdapter.hpp"
#include "mcpm/errors/Errors.h"
#include "support/ScriptedMcpPeer.h"

using namespace mcpm;
using errors::ErrorCode;
using errors::ManagerError;
using mcpm::testing::WaitFor;

namespace {

constexpr auto Wait = std::chrono::seconds(10);

ServerConfig fakeServer(std::vector<std::string> args = {}) {
    ServerConfig c;
    c.id = "fake";
    c.name = "Fake";
    c.command = MCPM_TEST_SERVER_PATH;
    c.args = std::move(args);
    return c;
}

ServerManagerOptions e2eOptions() {
    ServerManagerOptions o;
    o.probeTimeout = std::chrono::milliseconds(3000);
    o.shutdownGrace = std::chrono::milliseconds(500);
    o.requestTimeout = std::chrono::milliseconds(3000);
    return o;
}

std::string firstText(const JSONValue& result) {
    const JSONValue* content = FindMember(result, "content");
    if (content == nullptr || !content->isArray()) {
        return "";
    }
    const auto& items = std::get<JSONValue::Array>(content->value);
    if (items.empty()) {
        return "";
    }
    return GetStringMember(*items[0], "text").value_or("");
}

template <typename F>
ManagerError failure(F& fut) {
    if (fut.wait_for(Wait) != std::future_status::ready) {
        ADD_FAILURE() << "future not ready";
        return ManagerError(ErrorCode::ProcessError, "timeout");
    }
    try {
        fut.get();
    } catch (const ManagerError& e) {
        return e;
    }
    ADD_FAILURE() << "future did not fail";
    return ManagerError(ErrorCode::ProcessError, "no failure");
}

class EndToEnd : public ::testing::Test {
protected:
    adapters::HostProcessAdapter processes{std::chrono::milliseconds(500)};
    adapters::HostEnvAdapter env;
};

} // namespace

TEST_F(EndToEnd, StartCallAndStop) {
    ::setenv("MCPM_E2E_SECRET", "from-parent", 1);
    ServerConfig c = fakeServer({"--noise"});
    c.env["SECRET"] = "$MCPM_E2E_SECRET";
    ServerManager m(c, processes, env, nullptr, e2eOptions());

    auto start = m.Start();
    ASSERT_EQ(start.wait_for(Wait), std::future_status::ready);
    ASSERT_NO_THROW(start.get());
    EXPECT_EQ(m.State(), ServerState::Running);

    CapabilitiesSnapshot caps = m.GetCapabilities();
    EXPECT_GE(caps.tools.size(), 5u);
    EXPECT_TRUE(caps.capabilities.resources.has_value());
    EXPECT_GT(m.Snapshot().metadata.processId.value_or(0), 0);

    auto echo = m.CallTool("echo", MakeObject({{"text", JSONValue("round trip")}}));
    ASSERT_EQ(echo.wait_for(Wait), std::future_status::ready);
    EXPECT_EQ(firstText(echo.get()), "round trip");

    auto secret = m.CallTool("env", MakeObject({{"name", JSONValue("SECRET")}}));
    ASSERT_EQ(secret.wait_for(Wait), std::future_status::ready);
    EXPECT_EQ(firstText(secret.get()), "from-parent");

    auto soft = m.CallTool("soft_fail", JSONValue(JSONValue::Object{}));
    ASSERT_EQ(soft.wait_for(Wait), std::future_status::ready);
    EXPECT_EQ(GetBoolMember(soft.get(), "isError"), true);

    auto bad = m.CallTool("fail", JSONValue(JSONValue::Object{}));
    ManagerError e = failure(bad);
    EXPECT_EQ(e.code(), ErrorCode::ToolCallFailed);
    ASSERT_TRUE(e.upstream().has_value());
    EXPECT_EQ(e.upstream()->code, JSONRPCErrorCodes::InternalError);

    auto stop = m.Stop();
    ASSERT_EQ(stop.wait_for(Wait), std::future_status::ready);
    EXPECT_NO_THROW(stop.get());
    EXPECT_EQ(m.State(), ServerState::Stopped);
    EXPECT_EQ(processes.Get("fake"), nullptr);
    ::unsetenv("MCPM_E2E_SECRET");
}

TEST_F(EndToEnd, CrashIsRuntimeError) {
    ServerManager m(fakeServer(), processes, env, nullptr, e2eOptions());
    ASSERT_NO_THROW(m.Start().get());
    auto call = m.CallTool("crash", JSONValue(JSONValue::Object{}));
    EXPECT_EQ(failure(call).code(), ErrorCode::ServerNotRunning);
    ASSERT_TRUE(WaitFor([&]() { return m.State() == ServerState::RuntimeError; }, std::chrono::milliseconds(5000)));
    StateMetadata md = m.Snapshot().metadata;
    EXPECT_EQ(md.errorCode, "MCP_201");
    EXPECT_EQ(md.exitCode, 7);

    auto retry = m.Retry();
    ASSERT_EQ(retry.wait_for(Wait), std::future_status::ready);
    EXPECT_NO_THROW(retry.get());
    EXPECT_EQ(m.State(), ServerState::Running);
    EXPECT_EQ(m.Snapshot().metadata.restartCount, 1);
}

TEST_F(EndToEnd, SilentServerTimesOut) {
    ServerManagerOptions o = e2eOptions();
    o.probeTimeout = std::chrono::milliseconds(400);
    ServerManager m(fakeServer({"--silent"}), processes, env, nullptr, o);
    auto start = m.Start();
    EXPECT_EQ(failure(start).code(), ErrorCode::ProcessTimeout);
    EXPECT_EQ(m.State(), ServerState::RuntimeError);
    EXPECT_TRUE(WaitFor([&]() { return processes.Get("fake") == nullptr; }, std::chrono::milliseconds(5000)));
}

TEST_F(EndToEnd, EarlyExitFailsStart) {
    ServerManager m(fakeServer({"--exit=3"}), processes, env, nullptr, e2eOptions());
    auto start = m.Start();
    ErrorCode code = failure(start).code();
    EXPECT_TRUE(code == ErrorCode::ProcessCrashed || code == ErrorCode::ServerNotRunning);
    EXPECT_EQ(m.State(), ServerState::RuntimeError);
}

TEST_F(EndToEnd, MissingExecutableIsConfigError) {
    ServerConfig c = fakeServer();
    c.command = "/nonexistent/mcpm-fake-server";
    ServerManager m(c, processes, env, nullptr, e2eOptions());
    auto start = m.Start();
    EXPECT_EQ(failure(start).code(), ErrorCode::ProcessStartFailed);
    EXPECT_EQ(m.State(), ServerState::ConfigError);
}
