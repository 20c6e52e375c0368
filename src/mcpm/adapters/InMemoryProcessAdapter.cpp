//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: InMemoryProcessAdapter.cpp
// Purpose: Scripted in-process stand-in for child processes
//==========================================================================================================

#include <csignal>

#include "logging/Logger.h"
#include "mcpm/adapters/InMemoryProcessAdapter.hpp"
#include "mcpm/errors/Errors.h"

namespace mcpm {
namespace adapters {

InMemoryProcess::InMemoryProcess(std::string id, int pid, ProcessSpec spec, Peer peer)
    : id(std::move(id)), pid(pid), spec(std::move(spec)), peer(std::move(peer)) {
    worker = std::jthread([this](std::stop_token st) {
        for (;;) {
            std::function<void()> task;
            {
                std::unique_lock<std::mutex> lk(mutex);
                cv.wait(lk, [this, &st]() { return !tasks.empty() || st.stop_requested(); });
                if (tasks.empty()) {
                    return;
                }
                task = std::move(tasks.front());
                tasks.pop_front();
            }
            try {
                task();
            } catch (const std::exception& e) {
                LOG_ERROR("InMemoryProcess[{}]: scripted task threw: {}", this->id, e.what());
            }
        }
    });
}

InMemoryProcess::~InMemoryProcess() {
    worker.request_stop();
    cv.notify_all();
}

bool InMemoryProcess::IsRunning() const {
    std::lock_guard<std::mutex> lk(mutex);
    return running;
}

void InMemoryProcess::post(std::function<void()> task) {
    {
        std::lock_guard<std::mutex> lk(mutex);
        tasks.push_back(std::move(task));
    }
    cv.notify_one();
}

bool InMemoryProcess::Send(const std::string& line) {
    {
        std::lock_guard<std::mutex> lk(mutex);
        if (!running || exitQueued) {
            return false;
        }
        received.push_back(line);
    }
    if (peer) {
        post([this, line]() { peer(line, *this); });
    }
    return true;
}

void InMemoryProcess::finish(ProcessExit exit) {
    {
        std::lock_guard<std::mutex> lk(mutex);
        if (exitQueued) {
            return;
        }
        exitQueued = true;
        exit.killed = killRequested;
    }
    post([this, exit]() {
        {
            std::lock_guard<std::mutex> lk(mutex);
            running = false;
        }
        emitExit(exit);
    });
}

void InMemoryProcess::Kill() {
    bool ignore = false;
    {
        std::lock_guard<std::mutex> lk(mutex);
        if (exitQueued) {
            return;
        }
        killRequested = true;
        ignore = ignoreTerm;
    }
    if (ignore) {
        LOG_DEBUG("InMemoryProcess[{}]: ignoring termination request", id);
        return;
    }
    ProcessExit exit;
    exit.signal = SIGTERM;
    finish(exit);
}

void InMemoryProcess::EmitStdout(const std::string& line) {
    post([this, line]() {
        if (IsRunning()) emitMessage(line);
    });
}

void InMemoryProcess::EmitStderr(const std::string& line) {
    post([this, line]() {
        if (IsRunning()) emitStderr(line);
    });
}

void InMemoryProcess::SimulateExit(int exitCode) {
    ProcessExit exit;
    exit.exitCode = exitCode;
    finish(exit);
}

void InMemoryProcess::SimulateSignal(int signal) {
    ProcessExit exit;
    exit.signal = signal;
    finish(exit);
}

void InMemoryProcess::SetIgnoreTerm(bool ignore) {
    std::lock_guard<std::mutex> lk(mutex);
    ignoreTerm = ignore;
}

std::vector<std::string> InMemoryProcess::Received() const {
    std::lock_guard<std::mutex> lk(mutex);
    return received;
}

bool InMemoryProcess::KillRequested() const {
    std::lock_guard<std::mutex> lk(mutex);
    return killRequested;
}

////////////////////////////////////////// InMemoryProcessAdapter //////////////////////////////////////////

InMemoryProcessAdapter::~InMemoryProcessAdapter() {
    detachAll();
}

void InMemoryProcessAdapter::SetPeer(InMemoryProcess::Peer peer) {
    std::lock_guard<std::mutex> lk(mutex);
    defaultPeer = std::move(peer);
}

void InMemoryProcessAdapter::SetPeerFor(const std::string& id, InMemoryProcess::Peer peer) {
    std::lock_guard<std::mutex> lk(mutex);
    peers[id] = std::move(peer);
}

void InMemoryProcessAdapter::FailNextSpawn(const std::string& message) {
    std::lock_guard<std::mutex> lk(mutex);
    nextFailure = message;
}

void InMemoryProcessAdapter::FailCommand(const std::string& command, const std::string& message) {
    std::lock_guard<std::mutex> lk(mutex);
    if (message.empty()) {
        failingCommands.erase(command);
    } else {
        failingCommands[command] = message;
    }
}

std::vector<std::shared_ptr<InMemoryProcess>> InMemoryProcessAdapter::Spawned() const {
    std::lock_guard<std::mutex> lk(mutex);
    return spawned;
}

std::shared_ptr<InMemoryProcess> InMemoryProcessAdapter::Last(const std::string& id) const {
    std::lock_guard<std::mutex> lk(mutex);
    for (auto it = spawned.rbegin(); it != spawned.rend(); ++it) {
        if ((*it)->Id() == id) {
            return *it;
        }
    }
    return nullptr;
}

std::size_t InMemoryProcessAdapter::SpawnCount(const std::string& id) const {
    std::lock_guard<std::mutex> lk(mutex);
    std::size_t n = 0;
    for (const auto& p : spawned) {
        if (p->Id() == id) ++n;
    }
    return n;
}

std::shared_ptr<IProcess> InMemoryProcessAdapter::doSpawn(const std::string& id, const ProcessSpec& spec) {
    std::lock_guard<std::mutex> lk(mutex);
    if (nextFailure.has_value()) {
        std::string message = *nextFailure;
        nextFailure.reset();
        throw errors::ManagerError(errors::ErrorCode::ProcessStartFailed, message, id);
    }
    auto failing = failingCommands.find(spec.command);
    if (failing != failingCommands.end()) {
        throw errors::ManagerError(errors::ErrorCode::ProcessStartFailed, failing->second, id);
    }
    if (spec.command.empty()) {
        throw errors::ManagerError(errors::ErrorCode::ProcessStartFailed, "No command configured", id);
    }
    InMemoryProcess::Peer peer = defaultPeer;
    auto it = peers.find(id);
    if (it != peers.end()) {
        peer = it->second;
    }
    auto proc = std::make_shared<InMemoryProcess>(id, nextPid++, spec, std::move(peer));
    spawned.push_back(proc);
    return proc;
}

} // namespace adapters
} // namespace mcpm
