//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: InMemoryProcessAdapter.hpp
// Purpose: Scripted in-process stand-in for child processes
//==========================================================================================================
#pragma once

#include <condition_variable>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

#include "mcpm/adapters/ProcessAdapter.h"

namespace mcpm {
namespace adapters {

//==========================================================================================================
// InMemoryProcess
// Purpose: Fake child. Lines written with Send() are handed to a scripted peer on a worker thread;
//          the peer answers through EmitStdout()/EmitStderr()/SimulateExit(). All deliveries are ordered.
//==========================================================================================================
class InMemoryProcess : public ProcessEventSource {
public:
    using Peer = std::function<void(const std::string& line, InMemoryProcess& process)>;

    InMemoryProcess(std::string id, int pid, ProcessSpec spec, Peer peer);
    ~InMemoryProcess() override;

    const std::string& Id() const override { return id; }
    int Pid() const override { return pid; }
    bool IsRunning() const override;
    bool Send(const std::string& line) override;
    // Exits with SIGTERM unless SetIgnoreTerm(true); then only SimulateExit ends it.
    void Kill() override;

    /////////////////////////////////////////// Test helpers ///////////////////////////////////////////
    void EmitStdout(const std::string& line);
    void EmitStderr(const std::string& line);
    void SimulateExit(int exitCode);
    void SimulateSignal(int signal);
    void SetIgnoreTerm(bool ignore);

    const ProcessSpec& Spec() const { return spec; }
    // Lines received from the manager, in order.
    std::vector<std::string> Received() const;
    bool KillRequested() const;

private:
    void post(std::function<void()> task);
    void finish(ProcessExit exit);

    const std::string id;
    const int pid;
    const ProcessSpec spec;
    Peer peer;

    mutable std::mutex mutex;
    std::condition_variable cv;
    std::deque<std::function<void()>> tasks;
    std::vector<std::string> received;
    bool running{true};
    bool exitQueued{false};
    bool ignoreTerm{false};
    bool killRequested{false};
    std::jthread worker;
};

//==========================================================================================================
// InMemoryProcessAdapter
// Purpose: ProcessAdapter double. Every spawned process stays reachable through Spawned()/Last().
//==========================================================================================================
class InMemoryProcessAdapter : public ProcessAdapterBase {
public:
    InMemoryProcessAdapter() = default;
    ~InMemoryProcessAdapter() override;

    // Default peer for every id, and per-id overrides.
    void SetPeer(InMemoryProcess::Peer peer);
    void SetPeerFor(const std::string& id, InMemoryProcess::Peer peer);

    // The next Spawn() throws ProcessStartFailed with `message`.
    void FailNextSpawn(const std::string& message);
    // Every Spawn() of `command` fails until cleared with an empty message.
    void FailCommand(const std::string& command, const std::string& message);

    std::vector<std::shared_ptr<InMemoryProcess>> Spawned() const;
    std::shared_ptr<InMemoryProcess> Last(const std::string& id) const;
    std::size_t SpawnCount(const std::string& id) const;

protected:
    std::shared_ptr<IProcess> doSpawn(const std::string& id, const ProcessSpec& spec) override;

private:
    mutable std::mutex mutex;
    InMemoryProcess::Peer defaultPeer;
    std::unordered_map<std::string, InMemoryProcess::Peer> peers;
    std::optional<std::string> nextFailure;
    std::unordered_map<std::string, std::string> failingCommands;
    std::vector<std::shared_ptr<InMemoryProcess>> spawned;
    int nextPid{40000};
};

} // namespace adapters
} // namespace mcpm
