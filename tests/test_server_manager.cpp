//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_server_manager.cpp
// Purpose: GoogleTests for the per-server lifecycle actor over in-memory adapters
//==========================================================================================================

#include <gtest/gtest.h>

#include <algorithm>
#include <csignal>
#include <mutex>
#include <thread>

#include "mcpm/ServerManager.h"
#include "mcpm/adapters/BrowserAdapter.h"
#include "mcpm/adapters/InMemoryProcessAdapter.hpp"
#include "mcpm/adapters/InMemoryStorageAdapter.hpp"
#include "mcpm/errors/Errors.h"
#include "support/FakeTokenEndpoint.h"
#include "support/ScriptedMcpPeer.h"

using namespace mcpm;
using errors::ErrorCode;
using errors::ManagerError;
using mcpm::testing::PeerScript;
using mcpm::testing::WaitFor;

namespace {

constexpr auto Wait = std::chrono::seconds(5);

ServerConfig basicServer(const std::string& id = "echo") {
    ServerConfig c;
    c.id = id;
    c.name = "Echo";
    c.command = "echo-server";
    c.args = {"--stdio"};
    return c;
}

ServerManagerOptions fastOptions() {
    ServerManagerOptions o;
    o.probeTimeout = std::chrono::milliseconds(300);
    o.shutdownGrace = std::chrono::milliseconds(100);
    o.requestTimeout = std::chrono::milliseconds(1000);
    o.authTimeout = std::chrono::milliseconds(5000);
    return o;
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

class ServerManagerTest : public ::testing::Test {
protected:
    adapters::InMemoryProcessAdapter processes;
    adapters::InMemoryEnvAdapter env;
    std::shared_ptr<PeerScript> script = std::make_shared<PeerScript>();

    std::mutex eventsMutex;
    std::vector<ServerEvent> seen;
    std::vector<events::Unsubscribe> subs;

    void SetUp() override { processes.SetPeer(mcpm::testing::MakeScriptedPeer(script)); }
    void TearDown() override {
        for (auto& off : subs) off();
    }

    std::unique_ptr<ServerManager> make(ServerConfig config, auth::TokenManager* tokens = nullptr) {
        auto m = std::make_unique<ServerManager>(std::move(config), processes, env, tokens, fastOptions());
        subs.push_back(m->Subscribe([this](const ServerEvent& ev) {
            std::lock_guard<std::mutex> lk(eventsMutex);
            seen.push_back(ev);
        }));
        return m;
    }

    void startOk(ServerManager& m) {
        auto fut = m.Start();
        ASSERT_EQ(fut.wait_for(Wait), std::future_status::ready);
        ASSERT_NO_THROW(fut.get());
        ASSERT_EQ(m.State(), ServerState::Running);
    }

    std::vector<ServerState> statesSeen() {
        std::lock_guard<std::mutex> lk(eventsMutex);
        std::vector<ServerState> out;
        for (const auto& ev : seen) {
            if (ev.kind == ServerEvent::Kind::StateChanged) out.push_back(ev.state);
        }
        return out;
    }

    std::size_t capabilityEvents() {
        std::lock_guard<std::mutex> lk(eventsMutex);
        std::size_t n = 0;
        for (const auto& ev : seen) {
            if (ev.kind == ServerEvent::Kind::CapabilitiesUpdated) n++;
        }
        return n;
    }
};

} // namespace

TEST_F(ServerManagerTest, StartProbesCapabilities) {
    auto m = make(basicServer());
    EXPECT_EQ(m->State(), ServerState::Uninitialized);
    startOk(*m);

    CapabilitiesSnapshot caps = m->GetCapabilities();
    EXPECT_EQ(caps.serverInfo.name, "scripted");
    ASSERT_EQ(caps.tools.size(), 2u);
    EXPECT_EQ(caps.tools[0].name, "echo");
    EXPECT_TRUE(caps.resources.empty());

    EXPECT_EQ(statesSeen(), (std::vector<ServerState>{ServerState::Validating, ServerState::Starting,
                                                       ServerState::Running}));
    EXPECT_EQ(capabilityEvents(), 1u);
    ServerSnapshot snap = m->Snapshot();
    EXPECT_EQ(snap.metadata.processId, 40000);
    EXPECT_EQ(snap.history.size(), 3u);
    EXPECT_EQ(processes.Last("echo")->Spec().args, (std::vector<std::string>{"--stdio"}));
}

TEST_F(ServerManagerTest, ToolCallsWhileRunning) {
    auto m = make(basicServer());
    auto early = m->CallTool("echo", JSONValue());
    EXPECT_EQ(failure(early).code(), ErrorCode::ServerNotRunning);
    EXPECT_THROW(m->GetCapabilities(), ManagerError);

    startOk(*m);
    auto ok = m->CallTool("echo", MakeObject({{"text", JSONValue("hello")}}));
    ASSERT_EQ(ok.wait_for(Wait), std::future_status::ready);
    JSONValue result = ok.get();
    const JSONValue* content = FindMember(result, "content");
    ASSERT_NE(content, nullptr);
    ASSERT_TRUE(content->isArray());
    const auto& items = std::get<JSONValue::Array>(content->value);
    ASSERT_EQ(items.size(), 1u);
    EXPECT_EQ(GetStringMember(*items[0], "text"), "hello");

    auto bad = m->CallTool("fail", JSONValue());
    ManagerError e = failure(bad);
    EXPECT_EQ(e.code(), ErrorCode::ToolCallFailed);
    ASSERT_TRUE(e.upstream().has_value());
    EXPECT_EQ(e.upstream()->code, JSONRPCErrorCodes::InvalidParams);
    EXPECT_EQ(m->State(), ServerState::Running);
}

TEST_F(ServerManagerTest, StopReachesStopped) {
    auto m = make(basicServer());
    startOk(*m);
    auto proc = processes.Last("echo");
    auto fut = m->Stop();
    ASSERT_EQ(fut.wait_for(Wait), std::future_status::ready);
    EXPECT_NO_THROW(fut.get());
    EXPECT_EQ(m->State(), ServerState::Stopped);
    EXPECT_TRUE(proc->KillRequested());
    EXPECT_FALSE(proc->IsRunning());
    EXPECT_NO_THROW(m->Stop().get());
    EXPECT_EQ(m->State(), ServerState::Stopped);

    startOk(*m);
    EXPECT_EQ(processes.SpawnCount("echo"), 2u);
}

TEST_F(ServerManagerTest, RestartRelaunches) {
    auto m = make(basicServer());
    startOk(*m);
    auto fut = m->Restart();
    ASSERT_EQ(fut.wait_for(Wait), std::future_status::ready);
    EXPECT_NO_THROW(fut.get());
    EXPECT_EQ(m->State(), ServerState::Running);
    EXPECT_EQ(processes.SpawnCount("echo"), 2u);
    EXPECT_EQ(script->initializeCount.load(), 2);
}

TEST_F(ServerManagerTest, CrashWhileRunning) {
    auto m = make(basicServer());
    startOk(*m);
    processes.Last("echo")->SimulateExit(7);
    ASSERT_TRUE(WaitFor([&]() { return m->State() == ServerState::RuntimeError; }));
    StateMetadata md = m->Snapshot().metadata;
    EXPECT_EQ(md.errorCode, "MCP_201");
    EXPECT_EQ(md.exitCode, 7);
    EXPECT_EQ(md.userMessage, "Server crashed unexpectedly");
    EXPECT_FALSE(md.suggestedActions.empty());

    auto call = m->CallTool("echo", JSONValue());
    EXPECT_EQ(failure(call).code(), ErrorCode::ServerNotRunning);
}

TEST_F(ServerManagerTest, ProbeTimeoutIsRuntimeError) {
    script->answerInitialize = false;
    auto m = make(basicServer());
    auto fut = m->Start();
    ManagerError e = failure(fut);
    EXPECT_EQ(e.code(), ErrorCode::ProcessTimeout);
    EXPECT_EQ(e.serverId(), "echo");
    EXPECT_EQ(m->State(), ServerState::RuntimeError);
    EXPECT_TRUE(processes.Last("echo")->KillRequested());
}

TEST_F(ServerManagerTest, ExitDuringStartup) {
    script->exitOnInitialize = true;
    auto m = make(basicServer());
    auto fut = m->Start();
    // Either the exit or the failed initialize request is observed first.
    ErrorCode code = failure(fut).code();
    EXPECT_TRUE(code == ErrorCode::ProcessCrashed || code == ErrorCode::ServerNotRunning);
    EXPECT_EQ(m->State(), ServerState::RuntimeError);
}

TEST_F(ServerManagerTest, FailedToolListFailsStart) {
    script->failToolsList = true;
    auto m = make(basicServer());
    auto fut = m->Start();
    EXPECT_EQ(failure(fut).code(), ErrorCode::ProcessError);
    EXPECT_EQ(m->State(), ServerState::RuntimeError);
}

TEST_F(ServerManagerTest, MissingCommandIsConfigError) {
    ServerConfig c = basicServer();
    c.command.clear();
    auto m = make(c);
    auto fut = m->Start();
    EXPECT_EQ(failure(fut).code(), ErrorCode::ConfigError);
    EXPECT_EQ(m->State(), ServerState::ConfigError);
    EXPECT_EQ(m->Snapshot().metadata.errorCode, "MCP_100");
    EXPECT_EQ(processes.SpawnCount("echo"), 0u);
}

TEST_F(ServerManagerTest, UnresolvedEnvironmentIsConfigError) {
    ServerConfig c = basicServer();
    c.env["API_KEY"] = "$ECHO_API_KEY";
    auto m = make(c);
    auto fut = m->Start();
    EXPECT_EQ(failure(fut).code(), ErrorCode::EnvVarNotFound);
    EXPECT_EQ(m->State(), ServerState::ConfigError);

    env.Set("ECHO_API_KEY", "k-123");
    env.ClearCache();
    auto retry = m->Retry();
    ASSERT_EQ(retry.wait_for(Wait), std::future_status::ready);
    EXPECT_NO_THROW(retry.get());
    EXPECT_EQ(m->State(), ServerState::Running);
    EXPECT_EQ(m->Snapshot().metadata.restartCount, 1);
    EXPECT_EQ(processes.Last("echo")->Spec().env.at("API_KEY"), "k-123");
}

TEST_F(ServerManagerTest, SpawnFailureIsConfigError) {
    processes.FailNextSpawn("no such file");
    auto m = make(basicServer());
    auto fut = m->Start();
    EXPECT_EQ(failure(fut).code(), ErrorCode::ProcessStartFailed);
    EXPECT_EQ(m->State(), ServerState::ConfigError);
}

TEST_F(ServerManagerTest, RetryAfterRuntimeErrorCountsRestarts) {
    script->answerInitialize = false;
    auto m = make(basicServer());
    auto first = m->Start();
    failure(first);
    ASSERT_EQ(m->State(), ServerState::RuntimeError);

    script->answerInitialize = true;
    auto retry = m->Retry();
    ASSERT_EQ(retry.wait_for(Wait), std::future_status::ready);
    EXPECT_NO_THROW(retry.get());
    EXPECT_EQ(m->State(), ServerState::Running);
    EXPECT_EQ(m->Snapshot().metadata.restartCount, 1);
    EXPECT_FALSE(m->Snapshot().metadata.errorCode.has_value());

    auto again = m->Retry();
    EXPECT_EQ(failure(again).code(), ErrorCode::InvalidTransition);
}

TEST_F(ServerManagerTest, ResetClearsErrorAndHistory) {
    ServerConfig c = basicServer();
    c.command.clear();
    auto m = make(c);
    auto fut = m->Start();
    failure(fut);
    ASSERT_EQ(m->State(), ServerState::ConfigError);
    EXPECT_NO_THROW(m->Reset().get());
    EXPECT_EQ(m->State(), ServerState::Idle);
    ServerSnapshot snap = m->Snapshot();
    EXPECT_TRUE(snap.history.empty());
    EXPECT_FALSE(snap.metadata.errorMessage.has_value());
}

TEST_F(ServerManagerTest, StopDuringStartCancelsStart) {
    script->answerInitialize = false;
    auto m = make(basicServer());
    auto start = m->Start();
    ASSERT_TRUE(WaitFor([&]() { return m->State() == ServerState::Starting; }));
    auto stop = m->Stop();
    EXPECT_EQ(failure(start).code(), ErrorCode::StartCancelled);
    ASSERT_EQ(stop.wait_for(Wait), std::future_status::ready);
    EXPECT_NO_THROW(stop.get());
    EXPECT_EQ(m->State(), ServerState::Stopped);
}

TEST_F(ServerManagerTest, StopRecoversWhenProcessIgnoresTerm) {
    auto m = make(basicServer());
    startOk(*m);
    processes.Last("echo")->SetIgnoreTerm(true);
    auto stop = m->Stop();
    ASSERT_EQ(stop.wait_for(Wait), std::future_status::ready);
    EXPECT_NO_THROW(stop.get());
    EXPECT_EQ(m->State(), ServerState::Stopped);
    EXPECT_EQ(m->Snapshot().metadata.userMessage, "Server stopped (timeout recovery)");
    processes.Last("echo")->SimulateSignal(SIGKILL);
}

TEST_F(ServerManagerTest, StartWhileRunningIsInvalid) {
    auto m = make(basicServer());
    startOk(*m);
    auto again = m->Start();
    EXPECT_EQ(failure(again).code(), ErrorCode::InvalidTransition);
    EXPECT_EQ(m->State(), ServerState::Running);
    auto auth = m->Authenticate();
    EXPECT_EQ(failure(auth).code(), ErrorCode::InvalidTransition);
}

TEST_F(ServerManagerTest, ListChangedTriggersRelist) {
    auto m = make(basicServer());
    startOk(*m);
    script->tools = {"echo", "fail", "added"};
    processes.Last("echo")->EmitStdout(JSONRPCNotification("notifications/tools/list_changed").Serialize());
    ASSERT_TRUE(WaitFor([&]() { return capabilityEvents() == 2; }));
    EXPECT_EQ(m->GetCapabilities().tools.size(), 3u);
}

TEST_F(ServerManagerTest, UpdateConfigKeepsId) {
    auto m = make(basicServer());
    ServerConfig renamed = basicServer("other");
    auto bad = m->UpdateConfig(renamed);
    EXPECT_EQ(failure(bad).code(), ErrorCode::ConfigError);

    ServerConfig changed = basicServer();
    changed.args = {"--stdio", "--verbose"};
    EXPECT_NO_THROW(m->UpdateConfig(changed).get());
    EXPECT_EQ(m->Config().args.size(), 2u);
    startOk(*m);
    EXPECT_EQ(processes.Last("echo")->Spec().args.size(), 2u);
}

TEST_F(ServerManagerTest, TokenAuthIsInjected) {
    ServerConfig c = basicServer();
    c.requiresAuth = true;
    c.authType = AuthType::Token;
    c.authToken = "$ECHO_TOKEN";
    env.Set("ECHO_TOKEN", "tok-1");
    auto m = make(c);
    startOk(*m);
    EXPECT_EQ(processes.Last("echo")->Spec().env.at("MCP_AUTH_TOKEN"), "tok-1");
}

//////////////////////////////////////////// OAuth ////////////////////////////////////////////

namespace {

ServerConfig oauthServer() {
    ServerConfig c = basicServer("notion");
    c.requiresAuth = true;
    c.authType = AuthType::OAuth;
    OAuthConfig o;
    o.clientId = "cid";
    o.authUrl = "https://auth.example.com/authorize";
    o.tokenUrl = "https://auth.example.com/token";
    c.oauthConfig = o;
    return c;
}

class ServerManagerOAuthTest : public ServerManagerTest {
protected:
    adapters::InMemoryStorageAdapter storage;
    adapters::InMemoryBrowserAdapter browser;
    std::shared_ptr<mcpm::testing::FakeTokenEndpoint> endpoint =
        std::make_shared<mcpm::testing::FakeTokenEndpoint>();
    std::unique_ptr<auth::TokenManager> tokens;

    void SetUp() override {
        ServerManagerTest::SetUp();
        tokens = std::make_unique<auth::TokenManager>(storage, browser, endpoint);
    }

    std::string pendingState() {
        auto urls = browser.OpenedUrls();
        if (urls.empty()) {
            return "";
        }
        return auth::ParseQueryParams(urls.back())["state"];
    }
};

} // namespace

TEST_F(ServerManagerOAuthTest, MissingTokenRequiresAuthentication) {
    auto m = make(oauthServer(), tokens.get());
    auto start = m->Start();
    ManagerError e = failure(start);
    EXPECT_EQ(e.code(), ErrorCode::AuthRequired);
    EXPECT_EQ(m->State(), ServerState::AuthRequired);
    EXPECT_EQ(m->Snapshot().metadata.userMessage, "Click the Authenticate button to authorize access.");
    EXPECT_EQ(processes.SpawnCount("notion"), 0u);
}

TEST_F(ServerManagerOAuthTest, BrowserFlowStartsServer) {
    auto m = make(oauthServer(), tokens.get());
    auto start = m->Start();
    failure(start);

    auto auth = m->Authenticate();
    ASSERT_EQ(auth.wait_for(Wait), std::future_status::ready);
    ASSERT_NO_THROW(auth.get());
    EXPECT_EQ(m->State(), ServerState::Authenticating);
    auto authUrl = m->Snapshot().metadata.authUrl;
    ASSERT_TRUE(authUrl.has_value());
    EXPECT_EQ(authUrl->rfind("https://auth.example.com/authorize?", 0), 0u);

    endpoint->Respond(200, R"({"access_token":"at-1","refresh_token":"rt-1","expires_in":3600})");
    EXPECT_TRUE(browser.DispatchUrl("mcp-app://oauth/callback?code=c0de&state=" + pendingState()));

    ASSERT_TRUE(WaitFor([&]() { return m->State() == ServerState::Running; }));
    EXPECT_EQ(processes.Last("notion")->Spec().env.at("OAUTH_ACCESS_TOKEN"), "at-1");
    ServerConfig cfg = m->Config();
    EXPECT_EQ(cfg.oauthConfig->accessToken, "at-1");
    EXPECT_EQ(cfg.oauthConfig->refreshToken, "rt-1");
    EXPECT_TRUE(cfg.oauthConfig->tokenExpiresAt.has_value());

    auto states = statesSeen();
    EXPECT_NE(std::find(states.begin(), states.end(), ServerState::Authenticating), states.end());
    EXPECT_EQ(states.back(), ServerState::Running);
}

TEST_F(ServerManagerOAuthTest, RejectedCallbackIsAuthFailed) {
    auto m = make(oauthServer(), tokens.get());
    auto start = m->Start();
    failure(start);
    ASSERT_NO_THROW(m->Authenticate().get());

    browser.DispatchUrl("mcp-app://oauth/callback?error=access_denied&state=" + pendingState());
    ASSERT_TRUE(WaitFor([&]() { return m->State() == ServerState::AuthFailed; }));
    EXPECT_EQ(m->Snapshot().metadata.errorCode, "MCP_309");

    EXPECT_NO_THROW(m->Reset().get());
    EXPECT_EQ(m->State(), ServerState::AuthRequired);
}

TEST_F(ServerManagerOAuthTest, ExpiredTokenIsRefreshedBeforeLaunch) {
    ServerConfig c = oauthServer();
    c.oauthConfig->accessToken = "stale";
    c.oauthConfig->refreshToken = "rt";
    c.oauthConfig->tokenExpiresAt = NowEpochMs() - 1000;
    endpoint->Respond(200, R"({"access_token":"fresh","expires_in":3600})");
    auto m = make(c, tokens.get());
    startOk(*m);
    EXPECT_EQ(processes.Last("notion")->Spec().env.at("OAUTH_ACCESS_TOKEN"), "fresh");
    auto states = statesSeen();
    EXPECT_NE(std::find(states.begin(), states.end(), ServerState::TokenRefreshing), states.end());
    EXPECT_EQ(m->Config().oauthConfig->refreshToken, "rt");
}

TEST_F(ServerManagerOAuthTest, FailedRefreshIsAuthFailed) {
    ServerConfig c = oauthServer();
    c.oauthConfig->accessToken = "stale";
    c.oauthConfig->refreshToken = "rt";
    c.oauthConfig->tokenExpiresAt = NowEpochMs() - 1000;
    endpoint->Respond(401, R"({"error":"invalid_grant"})");
    auto m = make(c, tokens.get());
    auto start = m->Start();
    EXPECT_EQ(failure(start).code(), ErrorCode::TokenRefreshFailed);
    EXPECT_EQ(m->State(), ServerState::AuthFailed);
    EXPECT_EQ(processes.SpawnCount("notion"), 0u);
}

TEST_F(ServerManagerOAuthTest, StopWhileAuthenticatingDropsFlow) {
    auto m = make(oauthServer(), tokens.get());
    auto start = m->Start();
    failure(start);
    ASSERT_NO_THROW(m->Authenticate().get());
    EXPECT_TRUE(tokens->HasPendingAuthorization("notion"));
    EXPECT_NO_THROW(m->Stop().get());
    EXPECT_EQ(m->State(), ServerState::AuthRequired);
    EXPECT_FALSE(tokens->HasPendingAuthorization("notion"));
    EXPECT_FALSE(browser.HasHandler("mcp-app"));
}

TEST_F(ServerManagerTest, ConcurrentStopsShareOneShutdown) {
    auto m = make(basicServer());
    startOk(*m);
    std::future<void> first;
    std::future<void> second;
    std::thread a([&]() { first = m->Stop(); });
    std::thread b([&]() { second = m->Stop(); });
    a.join();
    b.join();
    ASSERT_EQ(first.wait_for(Wait), std::future_status::ready);
    ASSERT_EQ(second.wait_for(Wait), std::future_status::ready);
    EXPECT_NO_THROW(first.get());
    EXPECT_NO_THROW(second.get());
    EXPECT_EQ(m->State(), ServerState::Stopped);
    auto states = statesSeen();
    EXPECT_EQ(std::count(states.begin(), states.end(), ServerState::Stopping), 1);
    EXPECT_EQ(std::count(states.begin(), states.end(), ServerState::Stopped), 1);
}

namespace {

ServerConfig oauthServerExpiringIn(int64_t ms) {
    ServerConfig c = oauthServer();
    c.oauthConfig->accessToken = "at-0";
    c.oauthConfig->refreshToken = "rt-0";
    c.oauthConfig->tokenExpiresAt = NowEpochMs() + ms;
    return c;
}

auth::TokenManagerOptions narrowSkew() {
    auth::TokenManagerOptions o;
    o.refreshSkewMs = 1000;
    return o;
}

} // namespace

TEST_F(ServerManagerOAuthTest, TokenRefreshWhileRunningKeepsProcess) {
    auth::TokenManager local(storage, browser, endpoint, narrowSkew());
    endpoint->Respond(200, R"({"access_token":"at-1","refresh_token":"rt-1","expires_in":3600})");
    auto m = make(oauthServerExpiringIn(30000), &local);
    auto start = m->Start();
    ASSERT_EQ(start.wait_for(Wait), std::future_status::ready);
    ASSERT_NO_THROW(start.get());

    ASSERT_TRUE(WaitFor([&]() {
        auto states = statesSeen();
        return m->State() == ServerState::Running && script->toolsListCount.load() >= 2 &&
               std::find(states.begin(), states.end(), ServerState::TokenRefreshing) != states.end();
    }));
    auto proc = processes.Last("notion");
    EXPECT_EQ(processes.SpawnCount("notion"), 1u);
    EXPECT_TRUE(proc->IsRunning());
    EXPECT_FALSE(proc->KillRequested());
    EXPECT_EQ(proc->Spec().env.at("OAUTH_ACCESS_TOKEN"), "at-0");
    EXPECT_EQ(script->initializeCount.load(), 1);
    EXPECT_EQ(endpoint->Calls().size(), 1u);
    EXPECT_EQ(m->Config().oauthConfig->accessToken, "at-1");
    EXPECT_EQ(m->Config().oauthConfig->refreshToken, "rt-1");

    auto echo = m->CallTool("echo", MakeObject({{"text", JSONValue("still here")}}));
    ASSERT_EQ(echo.wait_for(Wait), std::future_status::ready);
    EXPECT_NO_THROW(echo.get());
}

TEST_F(ServerManagerOAuthTest, ShortLivedRefreshedTokenIsNotRefreshedAgain) {
    auth::TokenManager local(storage, browser, endpoint, narrowSkew());
    endpoint->Respond(200, R"({"access_token":"at-1","refresh_token":"rt-1","expires_in":30})");
    endpoint->Respond(200, R"({"access_token":"at-2","refresh_token":"rt-2","expires_in":30})");
    auto m = make(oauthServerExpiringIn(30000), &local);
    auto start = m->Start();
    ASSERT_EQ(start.wait_for(Wait), std::future_status::ready);
    ASSERT_NO_THROW(start.get());

    ASSERT_TRUE(WaitFor([&]() { return endpoint->Calls().size() == 1u && m->State() == ServerState::Running; }));
    std::this_thread::sleep_for(std::chrono::milliseconds(300));
    EXPECT_EQ(endpoint->Calls().size(), 1u);
    EXPECT_EQ(processes.SpawnCount("notion"), 1u);
    EXPECT_EQ(m->State(), ServerState::Running);
    auto states = statesSeen();
    EXPECT_EQ(std::count(states.begin(), states.end(), ServerState::TokenRefreshing), 1);
}

TEST_F(ServerManagerOAuthTest, FailedRefreshWhileRunningIsAuthFailed) {
    auth::TokenManager local(storage, browser, endpoint, narrowSkew());
    endpoint->Respond(400, R"({"error":"invalid_grant"})");
    auto m = make(oauthServerExpiringIn(30000), &local);
    auto start = m->Start();
    ASSERT_EQ(start.wait_for(Wait), std::future_status::ready);
    ASSERT_NO_THROW(start.get());

    ASSERT_TRUE(WaitFor([&]() { return m->State() == ServerState::AuthFailed; }));
    EXPECT_EQ(m->Snapshot().metadata.errorCode, "MCP_302");
    EXPECT_TRUE(processes.Last("notion")->KillRequested());
    EXPECT_EQ(processes.SpawnCount("notion"), 1u);
}
