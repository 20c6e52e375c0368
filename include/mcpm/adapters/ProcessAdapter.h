//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ProcessAdapter.h
// Purpose: Child process abstraction used by the lifecycle manager (spawn/kill plus line-oriented I/O)
//==========================================================================================================

#pragma once

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "mcpm/events/EventHub.h"

namespace mcpm {
namespace adapters {

//==========================================================================================================
// ProcessSpec
// Purpose: Launch description of one child process.
// Fields:
//   command: Executable name (PATH lookup) or path.
//   args: Ordered argument vector (argv[1..]).
//   env: Variables merged over the host environment.
//   cwd: Working directory; empty keeps the host's.
//==========================================================================================================
struct ProcessSpec {
    std::string command;
    std::vector<std::string> args;
    std::map<std::string, std::string> env;
    std::string cwd;
};

//==========================================================================================================
// ProcessExit
// Purpose: How a child ended. Exactly one of exitCode/signal is set for a real process.
//==========================================================================================================
struct ProcessExit {
    std::optional<int> exitCode;
    std::optional<int> signal;
    bool killed{false};     // true when the exit followed a Kill() request
};

//==========================================================================================================
// IProcess
// Purpose: One live child bound to a server id.
// Notes:
//   - OnMessage receives each stdout line (without the newline); OnStderr each stderr line.
//   - OnExit fires exactly once. Subscribing after the exit invokes the callback immediately.
//   - Kill() is idempotent.
//==========================================================================================================
class IProcess {
public:
    using LineHandler = std::function<void(const std::string&)>;
    using ExitHandler = std::function<void(const ProcessExit&)>;

    virtual ~IProcess() = default;

    virtual const std::string& Id() const = 0;
    virtual int Pid() const = 0;
    virtual bool IsRunning() const = 0;

    //==========================================================================================================
    // Send
    // Purpose: Queues one line for the child's stdin (a trailing newline is appended).
    // Returns:
    //   false when the process is not running or the write queue is full.
    //==========================================================================================================
    virtual bool Send(const std::string& line) = 0;

    virtual events::Unsubscribe OnMessage(LineHandler handler) = 0;
    virtual events::Unsubscribe OnStderr(LineHandler handler) = 0;
    virtual events::Unsubscribe OnExit(ExitHandler handler) = 0;

    virtual void Kill() = 0;
};

//==========================================================================================================
// IProcessAdapter
// Purpose: Spawns and tracks children by server id.
//==========================================================================================================
class IProcessAdapter {
public:
    virtual ~IProcessAdapter() = default;

    //==========================================================================================================
    // Spawn
    // Purpose: Starts a child for `id`.
    // Returns:
    //   The running process. Throws errors::ManagerError(ProcessStartFailed) when `id` is already bound
    //   to a live process or the launch fails.
    //==========================================================================================================
    virtual std::shared_ptr<IProcess> Spawn(const std::string& id, const ProcessSpec& spec) = 0;

    // Live process for `id`, or nullptr.
    virtual std::shared_ptr<IProcess> Get(const std::string& id) = 0;
    // Kills the process bound to `id`; false when there is none.
    virtual bool Kill(const std::string& id) = 0;
    virtual void KillAll() = 0;
};

//==========================================================================================================
// ProcessEventSource
// Purpose: Event plumbing shared by IProcess implementations (message/stderr/exit fan-out, exit latch).
//==========================================================================================================
class ProcessEventSource : public IProcess {
public:
    events::Unsubscribe OnMessage(LineHandler handler) override;
    events::Unsubscribe OnStderr(LineHandler handler) override;
    events::Unsubscribe OnExit(ExitHandler handler) override;

protected:
    void emitMessage(const std::string& line) { messages.Emit(line); }
    void emitStderr(const std::string& line) { stderrLines.Emit(line); }
    // Delivers the exit once; later calls return false and do nothing.
    bool emitExit(const ProcessExit& exit);
    bool exitObserved() const;

private:
    events::EventHub<std::string> messages;
    events::EventHub<std::string> stderrLines;
    events::EventHub<ProcessExit> exits;
    mutable std::mutex exitMutex;
    std::optional<ProcessExit> exitInfo;
};

//==========================================================================================================
// ProcessAdapterBase
// Purpose: Id -> process bookkeeping shared by the host and in-memory adapters. Entries are dropped
//          when their process exits.
//==========================================================================================================
class ProcessAdapterBase : public IProcessAdapter {
public:
    ~ProcessAdapterBase() override;

    std::shared_ptr<IProcess> Spawn(const std::string& id, const ProcessSpec& spec) final;
    std::shared_ptr<IProcess> Get(const std::string& id) override;
    bool Kill(const std::string& id) override;
    void KillAll() override;

protected:
    virtual std::shared_ptr<IProcess> doSpawn(const std::string& id, const ProcessSpec& spec) = 0;
    // Processes currently tracked (live or not yet reaped).
    std::vector<std::shared_ptr<IProcess>> trackedProcesses();
    // Stops exit bookkeeping; derived destructors call this before tearing down their own state.
    void detachAll();

private:
    struct Entry {
        std::shared_ptr<IProcess> process;
        events::Unsubscribe unsubscribeExit;
    };
    std::mutex mutex;
    std::unordered_map<std::string, Entry> processes;
};

} // namespace adapters
} // namespace mcpm
