//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Supervisor.h
// Purpose: Crash recovery with exponential backoff and periodic health checks over a Registry
//==========================================================================================================

#pragma once

#include <chrono>
#include <functional>
#include <future>
#include <memory>
#include <string>
#include <vector>

#include "mcpm/Registry.h"
#include "mcpm/Settings.h"
#include "mcpm/events/EventHub.h"

namespace mcpm {

struct SupervisorOptions {
    bool autoRestart{true};
    int maxRestartAttempts{3};
    std::chrono::milliseconds restartDelay{5000};
    double backoffMultiplier{2.0};
    std::chrono::milliseconds maxRestartDelay{60000};
    // A crash after at least this long in RUNNING starts a fresh attempt budget.
    std::chrono::milliseconds stableAfter{60000};
    bool healthCheckEnabled{true};
    std::chrono::milliseconds healthCheckInterval{30000};
    std::chrono::milliseconds healthCheckTimeout{10000};

    static SupervisorOptions FromSettings(const Settings& settings);
};

struct SupervisorEvent {
    enum class Kind {
        RestartScheduled,
        RestartAttempted,
        RestartSucceeded,
        RestartFailed,
        RestartAbandoned,
        HealthCheckPassed,
        HealthCheckFailed
    };

    Kind kind{Kind::RestartScheduled};
    std::string serverId;
    int attempt{0};                       // 1-based attempt within the current budget
    std::chrono::milliseconds delay{0};   // RestartScheduled
    int restartCount{0};                  // server metadata after a successful restart
    bool willRetry{false};                // RestartFailed
    std::string message;                  // failure or abandon reason
};

const char* ToString(SupervisorEvent::Kind kind);

// Delay before restart attempt `attempt` (1-based): restartDelay * multiplier^(attempt-1), capped.
std::chrono::milliseconds RestartBackoff(const SupervisorOptions& options, int attempt);

//==========================================================================================================
// Supervisor
// Purpose: Watches registry events for supervised servers. A crash out of RUNNING schedules Retry() with
//          exponential backoff until maxRestartAttempts is used up; running servers get a tools/list
//          health check every healthCheckInterval.
// Notes:
//   - A user Stop() cancels a pending restart and resets the attempt budget.
//   - A restart that fails in RUNTIME_ERROR counts as the next attempt; CONFIG_ERROR abandons.
//   - Removing a server from the registry unsupervises it.
//   - All bookkeeping runs on one worker thread; listeners are called from it.
//==========================================================================================================
class Supervisor {
public:
    using Listener = std::function<void(const SupervisorEvent&)>;
    // Resolves when the server answered; fails with the reason otherwise.
    using HealthCheck = std::function<std::future<void>(const std::string& serverId)>;

    explicit Supervisor(Registry& registry, SupervisorOptions options = SupervisorOptions());
    ~Supervisor();

    Supervisor(const Supervisor&) = delete;
    Supervisor& operator=(const Supervisor&) = delete;

    void Supervise(const std::string& serverId);
    // Supervises every server currently in the registry.
    void SuperviseAll();
    void Unsupervise(const std::string& serverId);

    bool IsSupervised(const std::string& serverId) const;
    std::vector<std::string> SupervisedServers() const;
    // False until a health check passed or a start succeeded, and after a crash or failed check.
    bool IsHealthy(const std::string& serverId) const;
    // Attempts used from the current budget.
    int RestartAttempts(const std::string& serverId) const;

    // Replaces the default check (tools/list through the registry).
    void SetHealthCheck(HealthCheck check);
    // Runs one health check now; resolves with the outcome.
    std::future<bool> CheckHealth(const std::string& serverId);

    events::Unsubscribe Subscribe(Listener listener);

    // Cancels timers, stops watching the registry and joins the worker. Idempotent.
    void Dispose();

private:
    class Impl;
    std::shared_ptr<Impl> pImpl;
};

} // namespace mcpm
