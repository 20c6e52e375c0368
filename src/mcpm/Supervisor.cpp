//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Supervisor.cpp
// Purpose: Crash recovery with exponential backoff and periodic health checks over a Registry
//==========================================================================================================

#include "mcpm/Supervisor.h"

#include <algorithm>
#include <condition_variable>
#include <deque>
#include <map>
#include <mutex>
#include <optional>
#include <thread>
#include <utility>

#include "logging/Logger.h"
#include "mcpm/async/FutureAwaitable.h"
#include "mcpm/async/Task.h"
#include "mcpm/errors/Errors.h"

namespace mcpm {

using errors::ErrorCode;
using errors::ManagerError;
using S = ServerState;

namespace {

using Outcome = std::optional<ManagerError>;

// Waits for a registry future off the worker and reports how it ended.
async::Task<void> awaitOutcome(std::future<void> fut, std::string serverId, std::function<void(Outcome)> done) {
    Outcome out;
    try {
        co_await async::makeFutureAwaitable(std::move(fut));
    } catch (const ManagerError& e) {
        out = e;
    } catch (const std::exception& e) {
        out = ManagerError(ErrorCode::ProcessError, e.what(), serverId);
    }
    done(std::move(out));
}

async::Task<void> listToolsCheck(std::future<std::vector<Tool>> tools) {
    co_await async::makeFutureAwaitable(std::move(tools));
}

} // namespace

SupervisorOptions SupervisorOptions::FromSettings(const Settings& settings) {
    SupervisorOptions o;
    o.autoRestart = settings.restartMaxAttempts > 0;
    o.maxRestartAttempts = static_cast<int>(settings.restartMaxAttempts);
    o.restartDelay = std::chrono::milliseconds(settings.restartDelayMs);
    o.healthCheckEnabled = settings.healthCheckIntervalMs > 0;
    o.healthCheckInterval = std::chrono::milliseconds(settings.healthCheckIntervalMs);
    return o;
}

const char* ToString(SupervisorEvent::Kind kind) {
    switch (kind) {
        case SupervisorEvent::Kind::RestartScheduled: return "RESTART_SCHEDULED";
        case SupervisorEvent::Kind::RestartAttempted: return "RESTART_ATTEMPTED";
        case SupervisorEvent::Kind::RestartSucceeded: return "RESTART_SUCCEEDED";
        case SupervisorEvent::Kind::RestartFailed: return "RESTART_FAILED";
        case SupervisorEvent::Kind::RestartAbandoned: return "RESTART_ABANDONED";
        case SupervisorEvent::Kind::HealthCheckPassed: return "HEALTH_CHECK_PASSED";
        case SupervisorEvent::Kind::HealthCheckFailed: return "HEALTH_CHECK_FAILED";
    }
    return "UNKNOWN";
}

std::chrono::milliseconds RestartBackoff(const SupervisorOptions& options, int attempt) {
    double delay = static_cast<double>(options.restartDelay.count());
    const double cap = static_cast<double>(options.maxRestartDelay.count());
    for (int i = 1; i < attempt && delay < cap; ++i) {
        delay *= options.backoffMultiplier;
    }
    return std::chrono::milliseconds(static_cast<int64_t>(std::min(delay, cap)));
}

//==========================================================================================================
// Supervisor::Impl
// Purpose: Worker thread with a command queue and keyed deadlines. `servers` is guarded by stateMutex;
//          registry calls and listener emission happen with no lock held.
//==========================================================================================================
class Supervisor::Impl : public std::enable_shared_from_this<Supervisor::Impl> {
public:
    enum class Timer { Restart, HealthTimeout, HealthSweep };
    using TimerKey = std::pair<Timer, std::string>;
    struct Deadline {
        std::chrono::steady_clock::time_point due;
        uint64_t generation{0};
    };
    using Waiter = std::shared_ptr<std::promise<bool>>;

    struct Supervised {
        int attempts{0};
        bool healthy{false};
        bool restartPending{false};
        bool restarting{false};
        bool checking{false};
        std::optional<std::chrono::steady_clock::time_point> runningSince;
        uint64_t restartGen{0};
        uint64_t checkGen{0};
        std::vector<Waiter> checkWaiters;
    };

    Registry& registry;
    const SupervisorOptions options;
    events::EventHub<SupervisorEvent> listeners;
    events::Unsubscribe registrySubscription;

    mutable std::mutex stateMutex;
    std::map<std::string, Supervised> servers;
    HealthCheck healthCheck;

    std::mutex queueMutex;
    std::condition_variable_any cv;
    std::deque<std::function<void()>> queue;
    std::map<TimerKey, Deadline> timers;
    bool closed{false};
    std::jthread worker;

    Impl(Registry& r, SupervisorOptions o) : registry(r), options(std::move(o)) {}

    void start() {
        std::weak_ptr<Impl> weak = shared_from_this();
        registrySubscription = registry.Subscribe([weak](const RegistryEvent& ev) {
            postWeak(weak, [ev](Impl& self) { self.onRegistryEvent(ev); });
        });
        if (options.healthCheckEnabled && options.healthCheckInterval.count() > 0) {
            scheduleTimer(Timer::HealthSweep, "", options.healthCheckInterval, 0);
        }
        worker = std::jthread([this](std::stop_token st) { run(st); });
    }

    void dispose() {
        if (registrySubscription) {
            registrySubscription();
            registrySubscription = nullptr;
        }
        {
            std::lock_guard<std::mutex> lk(queueMutex);
            if (closed) {
                return;
            }
            closed = true;
            queue.clear();
            timers.clear();
        }
        worker.request_stop();
        cv.notify_all();
        if (worker.joinable() && worker.get_id() != std::this_thread::get_id()) {
            worker.join();
        }
        std::vector<Waiter> waiters;
        {
            std::lock_guard<std::mutex> lk(stateMutex);
            for (auto& [id, s] : servers) {
                waiters.insert(waiters.end(), s.checkWaiters.begin(), s.checkWaiters.end());
            }
            servers.clear();
        }
        for (auto& w : waiters) {
            w->set_value(false);
        }
        LOG_DEBUG("Supervisor disposed");
    }

    ////////////////////////////////////////// Queue and timers //////////////////////////////////////////

    bool post(std::function<void()> command) {
        {
            std::lock_guard<std::mutex> lk(queueMutex);
            if (closed) {
                return false;
            }
            queue.push_back(std::move(command));
        }
        cv.notify_all();
        return true;
    }

    template <typename Fn>
    static void postWeak(const std::weak_ptr<Impl>& weak, Fn fn) {
        if (auto self = weak.lock()) {
            Impl* raw = self.get();
            raw->post([raw, fn = std::move(fn)]() mutable { fn(*raw); });
        }
    }

    void scheduleTimer(Timer kind, const std::string& id, std::chrono::milliseconds delay, uint64_t generation) {
        {
            std::lock_guard<std::mutex> lk(queueMutex);
            timers[TimerKey{kind, id}] = Deadline{std::chrono::steady_clock::now() + delay, generation};
        }
        cv.notify_all();
    }

    void cancelTimer(Timer kind, const std::string& id) {
        std::lock_guard<std::mutex> lk(queueMutex);
        timers.erase(TimerKey{kind, id});
    }

    std::optional<std::chrono::steady_clock::time_point> nextDueLocked() const {
        std::optional<std::chrono::steady_clock::time_point> next;
        for (const auto& [key, d] : timers) {
            if (!next.has_value() || d.due < *next) {
                next = d.due;
            }
        }
        return next;
    }

    void run(std::stop_token st) {
        LOG_DEBUG("Supervisor: worker started");
        while (!st.stop_requested()) {
            std::function<void()> command;
            {
                std::unique_lock<std::mutex> lk(queueMutex);
                auto next = nextDueLocked();
                if (next.has_value()) {
                    cv.wait_until(lk, st, *next, [this]() { return !queue.empty(); });
                } else {
                    cv.wait(lk, st, [this]() { return !queue.empty(); });
                }
                if (st.stop_requested()) {
                    break;
                }
                if (!queue.empty()) {
                    command = std::move(queue.front());
                    queue.pop_front();
                }
            }
            if (command) {
                execute(command);
            }
            fireDueTimers();
        }
        LOG_DEBUG("Supervisor: worker stopped");
    }

    void execute(const std::function<void()>& command) {
        try {
            command();
        } catch (const std::exception& e) {
            LOG_ERROR("Supervisor: command failed: {}", e.what());
        }
    }

    void fireDueTimers() {
        std::vector<std::pair<TimerKey, uint64_t>> due;
        {
            std::lock_guard<std::mutex> lk(queueMutex);
            auto now = std::chrono::steady_clock::now();
            for (auto it = timers.begin(); it != timers.end();) {
                if (it->second.due <= now) {
                    due.emplace_back(it->first, it->second.generation);
                    it = timers.erase(it);
                } else {
                    ++it;
                }
            }
        }
        for (const auto& [key, generation] : due) {
            execute([this, key = key, generation = generation]() { onTimer(key.first, key.second, generation); });
        }
    }

    void onTimer(Timer kind, const std::string& id, uint64_t generation) {
        switch (kind) {
            case Timer::Restart:
                performRestart(id, generation);
                break;
            case Timer::HealthTimeout:
                finishCheck(id, generation,
                            ManagerError(ErrorCode::RequestTimeout, "Health check timed out", id));
                break;
            case Timer::HealthSweep:
                sweep();
                scheduleTimer(Timer::HealthSweep, "", options.healthCheckInterval, 0);
                break;
        }
    }

    void emit(const SupervisorEvent& ev) { listeners.Emit(ev); }

    // Registry state of a server; nullopt when it is gone, which also unsupervises it.
    std::optional<ServerSnapshot> snapshotOf(const std::string& id) {
        try {
            return registry.GetServer(id);
        } catch (const ManagerError& e) {
            if (e.code() != ErrorCode::ServerNotFound) {
                throw;
            }
            unsupervise(id);
            return std::nullopt;
        }
    }

    ////////////////////////////////////////// Supervision set //////////////////////////////////////////

    void supervise(const std::string& id) {
        ServerSnapshot snap = registry.GetServer(id);
        std::lock_guard<std::mutex> lk(stateMutex);
        if (servers.count(id)) {
            return;
        }
        Supervised s;
        if (snap.state == S::Running) {
            s.healthy = true;
            s.runningSince = std::chrono::steady_clock::now();
        }
        servers.emplace(id, std::move(s));
        LOG_DEBUG("Supervisor: supervising {}", id);
    }

    void unsupervise(const std::string& id) {
        std::vector<Waiter> waiters;
        {
            std::lock_guard<std::mutex> lk(stateMutex);
            auto it = servers.find(id);
            if (it == servers.end()) {
                return;
            }
            waiters = std::move(it->second.checkWaiters);
            servers.erase(it);
        }
        cancelTimer(Timer::Restart, id);
        cancelTimer(Timer::HealthTimeout, id);
        for (auto& w : waiters) {
            w->set_value(false);
        }
        LOG_DEBUG("Supervisor: stopped supervising {}", id);
    }

    ////////////////////////////////////////// Registry events //////////////////////////////////////////

    void onRegistryEvent(const RegistryEvent& ev) {
        if (ev.kind == RegistryEvent::Kind::ServerRemoved) {
            unsupervise(ev.serverId);
            return;
        }
        if (ev.kind != RegistryEvent::Kind::StateChanged || !ev.event.has_value() ||
            !ev.event->transition.has_value()) {
            return;
        }
        const TransitionRecord& t = *ev.event->transition;
        // Stop() from an error state goes straight to IDLE.
        const bool stopped = t.to == S::Stopping || t.to == S::Idle;
        bool crashed = false;
        {
            std::lock_guard<std::mutex> lk(stateMutex);
            auto it = servers.find(ev.serverId);
            if (it == servers.end()) {
                return;
            }
            Supervised& s = it->second;
            if (t.to == S::Running) {
                s.healthy = true;
                s.runningSince = std::chrono::steady_clock::now();
            } else if (stopped) {
                // Stopped on request: nothing to recover, and an in-flight restart result is stale.
                s.healthy = false;
                s.attempts = 0;
                s.restartPending = false;
                s.restarting = false;
                ++s.restartGen;
                s.runningSince.reset();
            } else if (t.to == S::RuntimeError && t.from == S::Running && !s.restarting) {
                crashed = true;
            }
        }
        if (stopped) {
            cancelTimer(Timer::Restart, ev.serverId);
        }
        if (crashed) {
            onCrashed(ev.serverId, ev.metadata);
        }
    }

    void onCrashed(const std::string& id, const StateMetadata& md) {
        LOG_WARN("Supervisor: {} crashed (exit code {})", id, md.exitCode.has_value() ? std::to_string(*md.exitCode) : "none");
        std::optional<SupervisorEvent> abandoned;
        {
            std::lock_guard<std::mutex> lk(stateMutex);
            auto it = servers.find(id);
            if (it == servers.end()) {
                return;
            }
            Supervised& s = it->second;
            s.healthy = false;
            const auto now = std::chrono::steady_clock::now();
            if (s.runningSince.has_value() && now - *s.runningSince >= options.stableAfter) {
                s.attempts = 0;
            }
            s.runningSince.reset();
            if (!options.autoRestart) {
                abandoned = SupervisorEvent{SupervisorEvent::Kind::RestartAbandoned, id, s.attempts};
                abandoned->message = "Auto-restart disabled";
            } else if (s.attempts >= options.maxRestartAttempts) {
                abandoned = SupervisorEvent{SupervisorEvent::Kind::RestartAbandoned, id, s.attempts};
                abandoned->message =
                    "Max restart attempts (" + std::to_string(options.maxRestartAttempts) + ") reached";
            }
        }
        if (abandoned.has_value()) {
            LOG_WARN("Supervisor: not restarting {}: {}", id, abandoned->message);
            emit(*abandoned);
            return;
        }
        scheduleRestart(id);
    }

    ////////////////////////////////////////// Restarts //////////////////////////////////////////

    void scheduleRestart(const std::string& id) {
        SupervisorEvent ev{SupervisorEvent::Kind::RestartScheduled, id};
        uint64_t gen = 0;
        {
            std::lock_guard<std::mutex> lk(stateMutex);
            auto it = servers.find(id);
            if (it == servers.end()) {
                return;
            }
            Supervised& s = it->second;
            ev.attempt = ++s.attempts;
            ev.delay = RestartBackoff(options, s.attempts);
            gen = ++s.restartGen;
            s.restartPending = true;
        }
        scheduleTimer(Timer::Restart, id, ev.delay, gen);
        LOG_INFO("Supervisor: restarting {} in {} ms (attempt {}/{})", id, ev.delay.count(), ev.attempt,
                 options.maxRestartAttempts);
        emit(ev);
    }

    void performRestart(const std::string& id, uint64_t gen) {
        int attempt = 0;
        {
            std::lock_guard<std::mutex> lk(stateMutex);
            auto it = servers.find(id);
            if (it == servers.end() || it->second.restartGen != gen || !it->second.restartPending) {
                return;
            }
            it->second.restartPending = false;
            attempt = it->second.attempts;
        }
        auto snap = snapshotOf(id);
        if (!snap.has_value()) {
            return;
        }
        if (snap->state != S::RuntimeError) {
            LOG_DEBUG("Supervisor: {} is {}; scheduled restart dropped", id, ToString(snap->state));
            return;
        }
        {
            std::lock_guard<std::mutex> lk(stateMutex);
            auto it = servers.find(id);
            if (it == servers.end()) {
                return;
            }
            it->second.restarting = true;
        }
        emit(SupervisorEvent{SupervisorEvent::Kind::RestartAttempted, id, attempt});
        std::future<void> fut;
        try {
            fut = registry.Retry(id);
        } catch (const ManagerError& e) {
            onRestartResult(id, gen, e);
            return;
        }
        std::weak_ptr<Impl> weak = shared_from_this();
        awaitOutcome(std::move(fut), id, [weak, id, gen](Outcome out) {
            postWeak(weak, [id, gen, out = std::move(out)](Impl& self) { self.onRestartResult(id, gen, out); });
        });
    }

    void onRestartResult(const std::string& id, uint64_t gen, const Outcome& out) {
        int attempt = 0;
        {
            std::lock_guard<std::mutex> lk(stateMutex);
            auto it = servers.find(id);
            if (it == servers.end() || it->second.restartGen != gen) {
                return;
            }
            it->second.restarting = false;
            if (!out.has_value()) {
                it->second.healthy = true;
            }
            attempt = it->second.attempts;
        }
        auto snap = snapshotOf(id);
        if (!snap.has_value()) {
            return;
        }
        if (!out.has_value()) {
            SupervisorEvent ev{SupervisorEvent::Kind::RestartSucceeded, id, attempt};
            ev.restartCount = snap->metadata.restartCount;
            LOG_INFO("Supervisor: {} restarted (restart count {})", id, ev.restartCount);
            emit(ev);
            return;
        }
        const bool willRetry = snap->state == S::RuntimeError && attempt < options.maxRestartAttempts;
        SupervisorEvent failed{SupervisorEvent::Kind::RestartFailed, id, attempt};
        failed.willRetry = willRetry;
        failed.message = out->what();
        LOG_ERROR("Supervisor: restart of {} failed: {}", id, failed.message);
        emit(failed);
        if (willRetry) {
            scheduleRestart(id);
            return;
        }
        if (snap->state == S::RuntimeError || snap->state == S::ConfigError) {
            SupervisorEvent abandoned{SupervisorEvent::Kind::RestartAbandoned, id, attempt};
            abandoned.message = snap->state == S::ConfigError ? "Configuration error" : "All restart attempts failed";
            emit(abandoned);
        }
    }

    ////////////////////////////////////////// Health checks //////////////////////////////////////////

    void sweep() {
        std::vector<std::string> due;
        {
            std::lock_guard<std::mutex> lk(stateMutex);
            for (const auto& [id, s] : servers) {
                if (!s.restartPending && !s.restarting && !s.checking) {
                    due.push_back(id);
                }
            }
        }
        for (const auto& id : due) {
            auto snap = snapshotOf(id);
            if (snap.has_value() && snap->state == S::Running) {
                startCheck(id, nullptr);
            }
        }
    }

    void startCheck(const std::string& id, Waiter waiter) {
        uint64_t gen = 0;
        HealthCheck check;
        {
            std::lock_guard<std::mutex> lk(stateMutex);
            auto it = servers.find(id);
            if (it == servers.end()) {
                if (waiter) {
                    waiter->set_value(false);
                }
                return;
            }
            Supervised& s = it->second;
            if (waiter) {
                s.checkWaiters.push_back(waiter);
            }
            if (s.checking) {
                return;
            }
            s.checking = true;
            gen = ++s.checkGen;
            check = healthCheck;
        }
        scheduleTimer(Timer::HealthTimeout, id, options.healthCheckTimeout, gen);
        std::future<void> fut;
        try {
            fut = check ? check(id) : listToolsCheck(registry.ListTools(id)).toFuture();
        } catch (const ManagerError& e) {
            finishCheck(id, gen, e);
            return;
        }
        std::weak_ptr<Impl> weak = shared_from_this();
        awaitOutcome(std::move(fut), id, [weak, id, gen](Outcome out) {
            postWeak(weak, [id, gen, out = std::move(out)](Impl& self) { self.finishCheck(id, gen, out); });
        });
    }

    void finishCheck(const std::string& id, uint64_t gen, const Outcome& out) {
        std::vector<Waiter> waiters;
        {
            std::lock_guard<std::mutex> lk(stateMutex);
            auto it = servers.find(id);
            if (it == servers.end() || !it->second.checking || it->second.checkGen != gen) {
                return;
            }
            Supervised& s = it->second;
            s.checking = false;
            s.healthy = !out.has_value();
            waiters = std::move(s.checkWaiters);
            s.checkWaiters.clear();
        }
        cancelTimer(Timer::HealthTimeout, id);
        SupervisorEvent ev{out.has_value() ? SupervisorEvent::Kind::HealthCheckFailed
                                           : SupervisorEvent::Kind::HealthCheckPassed,
                           id};
        if (out.has_value()) {
            ev.message = out->what();
            LOG_WARN("Supervisor: health check of {} failed: {}", id, ev.message);
        }
        emit(ev);
        for (auto& w : waiters) {
            w->set_value(!out.has_value());
        }
    }
};

////////////////////////////////////////// Supervisor //////////////////////////////////////////

Supervisor::Supervisor(Registry& registry, SupervisorOptions options)
    : pImpl(std::make_shared<Impl>(registry, std::move(options))) {
    pImpl->start();
}

Supervisor::~Supervisor() {
    Dispose();
}

void Supervisor::Supervise(const std::string& serverId) {
    pImpl->supervise(serverId);
}

void Supervisor::SuperviseAll() {
    for (const auto& snap : pImpl->registry.ListServers()) {
        pImpl->supervise(snap.config.id);
    }
}

void Supervisor::Unsupervise(const std::string& serverId) {
    pImpl->unsupervise(serverId);
}

bool Supervisor::IsSupervised(const std::string& serverId) const {
    std::lock_guard<std::mutex> lk(pImpl->stateMutex);
    return pImpl->servers.count(serverId) > 0;
}

std::vector<std::string> Supervisor::SupervisedServers() const {
    std::lock_guard<std::mutex> lk(pImpl->stateMutex);
    std::vector<std::string> out;
    out.reserve(pImpl->servers.size());
    for (const auto& [id, s] : pImpl->servers) {
        out.push_back(id);
    }
    return out;
}

bool Supervisor::IsHealthy(const std::string& serverId) const {
    std::lock_guard<std::mutex> lk(pImpl->stateMutex);
    auto it = pImpl->servers.find(serverId);
    return it != pImpl->servers.end() && it->second.healthy;
}

int Supervisor::RestartAttempts(const std::string& serverId) const {
    std::lock_guard<std::mutex> lk(pImpl->stateMutex);
    auto it = pImpl->servers.find(serverId);
    return it == pImpl->servers.end() ? 0 : it->second.attempts;
}

void Supervisor::SetHealthCheck(HealthCheck check) {
    std::lock_guard<std::mutex> lk(pImpl->stateMutex);
    pImpl->healthCheck = std::move(check);
}

std::future<bool> Supervisor::CheckHealth(const std::string& serverId) {
    auto waiter = std::make_shared<std::promise<bool>>();
    auto fut = waiter->get_future();
    Impl* impl = pImpl.get();
    if (!impl->post([impl, serverId, waiter]() { impl->startCheck(serverId, waiter); })) {
        waiter->set_value(false);
    }
    return fut;
}

events::Unsubscribe Supervisor::Subscribe(Listener listener) {
    return pImpl->listeners.Subscribe(std::move(listener));
}

void Supervisor::Dispose() {
    pImpl->dispose();
}

} // namespace mcpm
