//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_process_adapter.cpp
// Purpose: GoogleTests for the in-memory and POSIX process adapters
//==========================================================================================================

#include <gtest/gtest.h>

#include <atomic>
#include <csignal>
#include <future>
#include <mutex>
#include <thread>

#include "mcpm/adapters/HostProcessAdapter.hpp"
#include "mcpm/adapters/InMemoryProcessAdapter.hpp"
#include "mcpm/errors/Errors.h"
#include "support/ScriptedMcpPeer.h"

using namespace mcpm;
using adapters::HostProcessAdapter;
using adapters::InMemoryProcessAdapter;
using adapters::ProcessExit;
using adapters::ProcessSpec;
using mcpm::testing::WaitFor;

namespace {
ProcessSpec shell(const std::string& script) {
    ProcessSpec spec;
    spec.command = "/bin/sh";
    spec.args = {"-c", script};
    return spec;
}

// Collects stdout lines and the exit of one process.
struct Observed {
    std::mutex m;
    std::vector<std::string> lines;
    std::vector<std::string> errLines;
    std::promise<ProcessExit> exited;
    std::vector<events::Unsubscribe> subs;

    explicit Observed(adapters::IProcess& p) {
        subs.push_back(p.OnMessage([this](const std::string& l) {
            std::lock_guard<std::mutex> lk(m);
            lines.push_back(l);
        }));
        subs.push_back(p.OnStderr([this](const std::string& l) {
            std::lock_guard<std::mutex> lk(m);
            errLines.push_back(l);
        }));
        subs.push_back(p.OnExit([this](const ProcessExit& e) { exited.set_value(e); }));
    }
    ~Observed() {
        for (auto& off : subs) off();
    }
    std::size_t lineCount() {
        std::lock_guard<std::mutex> lk(m);
        return lines.size();
    }
};
} // namespace

TEST(InMemoryProcessAdapter, PeerAnswersInOrder) {
    InMemoryProcessAdapter adapter;
    adapter.SetPeer([](const std::string& line, adapters::InMemoryProcess& p) { p.EmitStdout("echo:" + line); });
    auto proc = adapter.Spawn("srv", shell("ignored"));
    EXPECT_EQ(proc->Pid(), 40000);
    Observed obs(*proc);
    EXPECT_TRUE(proc->Send("a"));
    EXPECT_TRUE(proc->Send("b"));
    ASSERT_TRUE(WaitFor([&]() { return obs.lineCount() == 2; }));
    {
        std::lock_guard<std::mutex> lk(obs.m);
        EXPECT_EQ(obs.lines, (std::vector<std::string>{"echo:a", "echo:b"}));
    }
    EXPECT_EQ(adapter.Last("srv")->Received(), (std::vector<std::string>{"a", "b"}));
}

TEST(InMemoryProcessAdapter, DuplicateIdAndScriptedFailures) {
    InMemoryProcessAdapter adapter;
    auto proc = adapter.Spawn("srv", shell("x"));
    try {
        adapter.Spawn("srv", shell("x"));
        FAIL() << "expected ProcessStartFailed";
    } catch (const errors::ManagerError& e) {
        EXPECT_EQ(e.code(), errors::ErrorCode::ProcessStartFailed);
    }
    adapter.FailNextSpawn("boom");
    EXPECT_THROW(adapter.Spawn("other", shell("x")), errors::ManagerError);
    EXPECT_NO_THROW(adapter.Spawn("other", shell("x")));

    adapter.FailCommand("node", "node missing");
    ProcessSpec node;
    node.command = "node";
    EXPECT_THROW(adapter.Spawn("third", node), errors::ManagerError);
    adapter.FailCommand("node", "");
    EXPECT_NO_THROW(adapter.Spawn("third", node));
    EXPECT_EQ(adapter.SpawnCount("srv"), 1u);
}

TEST(InMemoryProcessAdapter, KillReportsSignalAndReleasesId) {
    InMemoryProcessAdapter adapter;
    auto proc = adapter.Spawn("srv", shell("x"));
    Observed obs(*proc);
    EXPECT_TRUE(adapter.Kill("srv"));
    auto fut = obs.exited.get_future();
    ASSERT_EQ(fut.wait_for(std::chrono::seconds(2)), std::future_status::ready);
    ProcessExit exit = fut.get();
    EXPECT_EQ(exit.signal, SIGTERM);
    EXPECT_TRUE(exit.killed);
    EXPECT_FALSE(proc->IsRunning());
    EXPECT_FALSE(proc->Send("late"));
    ASSERT_TRUE(WaitFor([&]() { return adapter.Get("srv") == nullptr; }));
    EXPECT_NO_THROW(adapter.Spawn("srv", shell("x")));
    EXPECT_FALSE(adapter.Kill("nobody"));
}

TEST(InMemoryProcessAdapter, LateExitSubscriberIsReplayed) {
    InMemoryProcessAdapter adapter;
    auto proc = adapter.Spawn("srv", shell("x"));
    adapter.Last("srv")->SimulateExit(3);
    ASSERT_TRUE(WaitFor([&]() { return !proc->IsRunning(); }));
    std::optional<ProcessExit> seen;
    auto off = proc->OnExit([&](const ProcessExit& e) { seen = e; });
    ASSERT_TRUE(seen.has_value());
    EXPECT_EQ(seen->exitCode, 3);
    EXPECT_FALSE(seen->killed);
    off();
}

TEST(InMemoryProcessAdapter, IgnoredTermKeepsRunning) {
    InMemoryProcessAdapter adapter;
    auto proc = adapter.Spawn("srv", shell("x"));
    auto fake = adapter.Last("srv");
    fake->SetIgnoreTerm(true);
    proc->Kill();
    EXPECT_TRUE(fake->KillRequested());
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    EXPECT_TRUE(proc->IsRunning());
    fake->SimulateSignal(SIGKILL);
    ASSERT_TRUE(WaitFor([&]() { return !proc->IsRunning(); }));
}

TEST(HostProcessAdapter, LinesFromStdoutAndStderr) {
    HostProcessAdapter adapter(std::chrono::milliseconds(500));
    auto proc = adapter.Spawn("sh", shell("echo one; echo two; echo oops 1>&2; exit 4"));
    Observed obs(*proc);
    auto fut = obs.exited.get_future();
    ASSERT_EQ(fut.wait_for(std::chrono::seconds(5)), std::future_status::ready);
    ProcessExit exit = fut.get();
    EXPECT_EQ(exit.exitCode, 4);
    EXPECT_FALSE(exit.signal.has_value());
    std::lock_guard<std::mutex> lk(obs.m);
    EXPECT_EQ(obs.lines, (std::vector<std::string>{"one", "two"}));
    EXPECT_EQ(obs.errLines, (std::vector<std::string>{"oops"}));
}

TEST(HostProcessAdapter, StdinRoundTripAndEnvironment) {
    HostProcessAdapter adapter(std::chrono::milliseconds(500));
    ProcessSpec spec = shell("echo \"$MCPM_PROC_TEST\"; while read line; do echo \"got:$line\"; done");
    spec.env["MCPM_PROC_TEST"] = "injected";
    auto proc = adapter.Spawn("cat", spec);
    Observed obs(*proc);
    EXPECT_TRUE(proc->Send("{\"jsonrpc\":\"2.0\"}"));
    ASSERT_TRUE(WaitFor([&]() { return obs.lineCount() >= 2; }, std::chrono::milliseconds(5000)));
    {
        std::lock_guard<std::mutex> lk(obs.m);
        EXPECT_EQ(obs.lines[0], "injected");
        EXPECT_EQ(obs.lines[1], "got:{\"jsonrpc\":\"2.0\"}");
    }
    proc->Kill();
    auto fut = obs.exited.get_future();
    ASSERT_EQ(fut.wait_for(std::chrono::seconds(5)), std::future_status::ready);
    EXPECT_TRUE(fut.get().killed);
}

TEST(HostProcessAdapter, KillEscalatesWhenTermIsIgnored) {
    HostProcessAdapter adapter(std::chrono::milliseconds(200));
    auto proc = adapter.Spawn("stubborn", shell("trap '' TERM; echo ready; while :; do sleep 1; done"));
    Observed obs(*proc);
    ASSERT_TRUE(WaitFor([&]() { return obs.lineCount() >= 1; }, std::chrono::milliseconds(5000)));
    proc->Kill();
    auto fut = obs.exited.get_future();
    ASSERT_EQ(fut.wait_for(std::chrono::seconds(5)), std::future_status::ready);
    ProcessExit exit = fut.get();
    EXPECT_EQ(exit.signal, SIGKILL);
    EXPECT_TRUE(exit.killed);
}

TEST(HostProcessAdapter, MissingExecutableFailsSynchronously) {
    HostProcessAdapter adapter(std::chrono::milliseconds(200));
    ProcessSpec spec;
    spec.command = "/nonexistent/mcpm-server";
    try {
        adapter.Spawn("missing", spec);
        FAIL() << "expected ProcessStartFailed";
    } catch (const errors::ManagerError& e) {
        EXPECT_EQ(e.code(), errors::ErrorCode::ProcessStartFailed);
        EXPECT_EQ(e.serverId(), "missing");
    }
    EXPECT_EQ(adapter.Get("missing"), nullptr);
}

TEST(InMemoryProcessAdapter, SecondKillReportsNoSecondExit) {
    InMemoryProcessAdapter adapter;
    auto proc = adapter.Spawn("srv", shell("x"));
    std::atomic<int> exits{0};
    auto off = proc->OnExit([&](const ProcessExit&) { exits++; });
    proc->Kill();
    proc->Kill();
    ASSERT_TRUE(WaitFor([&]() { return exits.load() >= 1; }));
    proc->Kill();
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    EXPECT_EQ(exits.load(), 1);
    off();
}

TEST(InMemoryProcessAdapter, ConcurrentSpawnsOfOneIdStartOnce) {
    InMemoryProcessAdapter adapter;
    std::atomic<int> started{0};
    std::atomic<int> refused{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < 8; i++) {
        threads.emplace_back([&]() {
            try {
                adapter.Spawn("srv", shell("x"));
                started++;
            } catch (const errors::ManagerError& e) {
                EXPECT_EQ(e.code(), errors::ErrorCode::ProcessStartFailed);
                refused++;
            }
        });
    }
    for (auto& t : threads) t.join();
    EXPECT_EQ(started.load(), 1);
    EXPECT_EQ(refused.load(), 7);
    EXPECT_EQ(adapter.SpawnCount("srv"), 1u);
}

TEST(HostProcessAdapter, SecondKillReportsNoSecondExit) {
    HostProcessAdapter adapter(std::chrono::milliseconds(500));
    auto proc = adapter.Spawn("sleeper", shell("echo ready; while :; do sleep 1; done"));
    Observed obs(*proc);
    std::atomic<int> exits{0};
    auto off = proc->OnExit([&](const ProcessExit&) { exits++; });
    ASSERT_TRUE(WaitFor([&]() { return obs.lineCount() >= 1; }, std::chrono::milliseconds(5000)));
    proc->Kill();
    proc->Kill();
    auto fut = obs.exited.get_future();
    ASSERT_EQ(fut.wait_for(std::chrono::seconds(5)), std::future_status::ready);
    EXPECT_TRUE(fut.get().killed);
    proc->Kill();
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    EXPECT_EQ(exits.load(), 1);
    off();
}
