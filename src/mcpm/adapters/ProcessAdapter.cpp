//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ProcessAdapter.cpp
// Purpose: Shared process event plumbing and id bookkeeping
//==========================================================================================================

#include "mcpm/adapters/ProcessAdapter.h"

#include "logging/Logger.h"
#include "mcpm/errors/Errors.h"

namespace mcpm {
namespace adapters {

////////////////////////////////////////// ProcessEventSource //////////////////////////////////////////

events::Unsubscribe ProcessEventSource::OnMessage(LineHandler handler) {
    return messages.Subscribe(std::move(handler));
}

events::Unsubscribe ProcessEventSource::OnStderr(LineHandler handler) {
    return stderrLines.Subscribe(std::move(handler));
}

events::Unsubscribe ProcessEventSource::OnExit(ExitHandler handler) {
    std::optional<ProcessExit> already;
    events::Unsubscribe unsubscribe;
    {
        std::lock_guard<std::mutex> lk(exitMutex);
        if (exitInfo.has_value()) {
            already = exitInfo;
        } else {
            unsubscribe = exits.Subscribe(handler);
        }
    }
    if (already.has_value()) {
        handler(*already);
        return []() {};
    }
    return unsubscribe;
}

bool ProcessEventSource::emitExit(const ProcessExit& exit) {
    {
        std::lock_guard<std::mutex> lk(exitMutex);
        if (exitInfo.has_value()) {
            return false;
        }
        exitInfo = exit;
    }
    exits.Emit(exit);
    return true;
}

bool ProcessEventSource::exitObserved() const {
    std::lock_guard<std::mutex> lk(exitMutex);
    return exitInfo.has_value();
}

////////////////////////////////////////// ProcessAdapterBase //////////////////////////////////////////

ProcessAdapterBase::~ProcessAdapterBase() {
    detachAll();
}

std::shared_ptr<IProcess> ProcessAdapterBase::Spawn(const std::string& id, const ProcessSpec& spec) {
    FUNC_SCOPE();
    std::shared_ptr<IProcess> proc;
    std::weak_ptr<IProcess> weak;
    events::Unsubscribe previous;
    {
        // Held from the liveness check through the insertion: at most one live process per id.
        std::lock_guard<std::mutex> lk(mutex);
        auto it = processes.find(id);
        if (it != processes.end() && it->second.process->IsRunning()) {
            throw errors::ManagerError(errors::ErrorCode::ProcessStartFailed,
                                       "A process is already running for server " + id, id);
        }
        proc = doSpawn(id, spec);
        weak = proc;
        if (it != processes.end()) {
            previous = std::move(it->second.unsubscribeExit);
        }
        processes[id] = Entry{proc, nullptr};
    }
    if (previous) {
        previous();
    }
    // Subscribed outside the lock: an already exited child calls back synchronously.
    auto unsubscribe = proc->OnExit([this, id, weak](const ProcessExit&) {
        std::lock_guard<std::mutex> lk(mutex);
        auto it = processes.find(id);
        if (it != processes.end() && it->second.process == weak.lock()) {
            processes.erase(it);
        }
    });
    {
        std::lock_guard<std::mutex> lk(mutex);
        auto it = processes.find(id);
        if (it != processes.end() && it->second.process == proc) {
            it->second.unsubscribeExit = std::move(unsubscribe);
        }
    }
    LOG_INFO("Spawned process for {} (pid={})", id, proc->Pid());
    return proc;
}

std::shared_ptr<IProcess> ProcessAdapterBase::Get(const std::string& id) {
    std::lock_guard<std::mutex> lk(mutex);
    auto it = processes.find(id);
    if (it == processes.end() || !it->second.process->IsRunning()) {
        return nullptr;
    }
    return it->second.process;
}

bool ProcessAdapterBase::Kill(const std::string& id) {
    FUNC_SCOPE();
    std::shared_ptr<IProcess> proc;
    {
        std::lock_guard<std::mutex> lk(mutex);
        auto it = processes.find(id);
        if (it == processes.end()) {
            return false;
        }
        proc = it->second.process;
    }
    proc->Kill();
    return true;
}

void ProcessAdapterBase::KillAll() {
    FUNC_SCOPE();
    for (const auto& proc : trackedProcesses()) {
        proc->Kill();
    }
}

std::vector<std::shared_ptr<IProcess>> ProcessAdapterBase::trackedProcesses() {
    std::lock_guard<std::mutex> lk(mutex);
    std::vector<std::shared_ptr<IProcess>> out;
    out.reserve(processes.size());
    for (const auto& [id, entry] : processes) {
        out.push_back(entry.process);
    }
    return out;
}

void ProcessAdapterBase::detachAll() {
    std::unordered_map<std::string, Entry> drained;
    {
        std::lock_guard<std::mutex> lk(mutex);
        drained.swap(processes);
    }
    for (auto& [id, entry] : drained) {
        if (entry.unsubscribeExit) {
            entry.unsubscribeExit();
        }
    }
}

} // namespace adapters
} // namespace mcpm
