//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ServerManager.cpp
// Purpose: Per-server lifecycle actor driving the state machine, the process and the MCP session
//==========================================================================================================

#include <algorithm>
#include <condition_variable>
#include <deque>
#include <map>
#include <mutex>
#include <stop_token>
#include <thread>

#include "logging/Logger.h"
#include "mcpm/ProcessTransport.hpp"
#include "mcpm/ServerManager.h"
#include "mcpm/async/FutureAwaitable.h"
#include "mcpm/async/Task.h"
#include "mcpm/errors/Errors.h"
#include "mcpm/version.h"

namespace mcpm {

using errors::ErrorCode;
using errors::ManagerError;
using S = ServerState;
using E = StateEvent;

namespace {

constexpr const char* MsgStartFailed = "Server failed to start. Check configuration and try again.";
constexpr const char* MsgCrashed = "Server crashed unexpectedly";
constexpr const char* MsgAuthRequired = "Click the Authenticate button to authorize access.";
constexpr const char* MsgAuthInBrowser = "Complete authentication in your browser";
constexpr const char* MsgAuthFailed = "Authentication failed. Please try again.";
constexpr const char* MsgAuthSucceeded = "Authentication successful!";
constexpr const char* MsgRefreshing = "Refreshing authentication token...";
constexpr const char* MsgRefreshed = "Token refreshed successfully";
constexpr const char* MsgRefreshFailed = "Failed to refresh authentication. Please re-authenticate.";

// Extra wait after the kill grace period before a stop is forced.
constexpr std::chrono::milliseconds StopSlack{2000};

using Promise = std::shared_ptr<std::promise<void>>;

MetadataPatch errorPatch(const ManagerError& e, const char* userMessage, std::vector<std::string> actions) {
    MetadataPatch p;
    p.errorMessage = std::string(e.what());
    p.errorCode = e.codeString();
    p.userMessage = std::string(userMessage);
    p.suggestedActions = std::move(actions);
    return p;
}

std::string describeExit(const adapters::ProcessExit& exit) {
    if (exit.exitCode.has_value()) {
        return "code " + std::to_string(*exit.exitCode);
    }
    if (exit.signal.has_value()) {
        return "signal " + std::to_string(*exit.signal);
    }
    return "unknown status";
}

template <typename T>
std::future<T> failedFuture(const ManagerError& error) {
    std::promise<T> p;
    p.set_exception(std::make_exception_ptr(error));
    return p.get_future();
}

struct CapabilityLists {
    std::vector<Tool> tools;
    std::vector<Resource> resources;
    std::vector<Prompt> prompts;
};

//==========================================================================================================
// listCapabilitiesTask
// Purpose: tools/list (required), then resources/list and prompts/list when advertised (best effort).
//==========================================================================================================
async::Task<CapabilityLists> listCapabilitiesTask(std::shared_ptr<IClient> client, ServerCapabilities caps,
                                                  std::string serverId) {
    CapabilityLists lists;
    lists.tools = co_await async::makeFutureAwaitable(client->ListTools());
    if (caps.resources.has_value()) {
        try {
            lists.resources = co_await async::makeFutureAwaitable(client->ListResources());
        } catch (const ManagerError& e) {
            LOG_DEBUG("[{}] resources/list failed: {}", serverId, e.what());
        }
    }
    if (caps.prompts.has_value()) {
        try {
            lists.prompts = co_await async::makeFutureAwaitable(client->ListPrompts());
        } catch (const ManagerError& e) {
            LOG_DEBUG("[{}] prompts/list failed: {}", serverId, e.what());
        }
    }
    co_return lists;
}

struct ProbeOutcome {
    std::optional<CapabilitiesSnapshot> snapshot;
    std::optional<ManagerError> error;
};

async::Task<void> probeTask(std::shared_ptr<IClient> client, Implementation clientInfo, std::string serverId,
                            std::function<void(ProbeOutcome)> done) {
    ProbeOutcome out;
    try {
        InitializeResult init = co_await async::makeFutureAwaitable(client->Initialize(clientInfo));
        co_await async::makeFutureAwaitable(client->SendInitialized());
        CapabilityLists lists = co_await async::makeFutureAwaitable(
            listCapabilitiesTask(client, init.capabilities, serverId).toFuture());
        CapabilitiesSnapshot snap;
        snap.serverInfo = init.serverInfo;
        snap.protocolVersion = init.protocolVersion;
        snap.capabilities = init.capabilities;
        snap.tools = std::move(lists.tools);
        snap.resources = std::move(lists.resources);
        snap.prompts = std::move(lists.prompts);
        snap.fetchedAt = NowEpochMs();
        out.snapshot = std::move(snap);
    } catch (const ManagerError& e) {
        out.error = e;
    } catch (const std::exception& e) {
        out.error = ManagerError(ErrorCode::ProcessError, std::string("Capability probe failed: ") + e.what(), serverId);
    }
    done(std::move(out));
}

// Re-lists capabilities over an initialized session, keeping its serverInfo and capabilities.
async::Task<void> reprobeTask(std::shared_ptr<IClient> client, CapabilitiesSnapshot previous, std::string serverId,
                              std::function<void(ProbeOutcome)> done) {
    ProbeOutcome out;
    try {
        CapabilityLists lists = co_await async::makeFutureAwaitable(
            listCapabilitiesTask(client, previous.capabilities, serverId).toFuture());
        previous.tools = std::move(lists.tools);
        previous.resources = std::move(lists.resources);
        previous.prompts = std::move(lists.prompts);
        previous.fetchedAt = NowEpochMs();
        out.snapshot = std::move(previous);
    } catch (const ManagerError& e) {
        out.error = e;
    } catch (const std::exception& e) {
        out.error = ManagerError(ErrorCode::ProcessError, std::string("Capability probe failed: ") + e.what(), serverId);
    }
    done(std::move(out));
}

async::Task<void> relistTask(std::shared_ptr<IClient> client, ServerCapabilities caps, std::string serverId,
                             std::function<void(CapabilityLists)> done) {
    try {
        CapabilityLists lists = co_await async::makeFutureAwaitable(
            listCapabilitiesTask(client, caps, serverId).toFuture());
        done(std::move(lists));
    } catch (const ManagerError& e) {
        LOG_WARN("[{}] capability refresh failed: {}", serverId, e.what());
    }
}

} // namespace

ServerManagerOptions ServerManagerOptions::FromSettings(const Settings& settings) {
    ServerManagerOptions o;
    o.probeTimeout = std::chrono::milliseconds(settings.probeTimeoutMs);
    o.shutdownGrace = std::chrono::milliseconds(settings.shutdownGraceMs);
    o.requestTimeout = std::chrono::milliseconds(settings.requestTimeoutMs);
    o.authTimeout = std::chrono::milliseconds(settings.oauthSessionTtlMs);
    o.historyLimit = static_cast<std::size_t>(settings.historyLimit);
    o.clientInfo = Implementation("mcpm", getVersionString());
    return o;
}

JSONValue ServerSnapshotToJSON(const ServerSnapshot& snapshot) {
    JSONValue::Array hist;
    for (const auto& r : snapshot.history) {
        hist.push_back(std::make_shared<JSONValue>(TransitionRecordToJSON(r)));
    }
    JSONValue obj = MakeObject({
        {"config", ServerConfigToJSON(snapshot.config)},
        {"state", JSONValue(ToString(snapshot.state))},
        {"metadata", MetadataToJSON(snapshot.metadata)},
        {"history", JSONValue(std::move(hist))},
    });
    if (snapshot.previousState.has_value()) {
        SetMember(obj, "previousState", JSONValue(ToString(*snapshot.previousState)));
    }
    if (snapshot.capabilities.has_value()) {
        SetMember(obj, "capabilities", CapabilitiesSnapshotToJSON(*snapshot.capabilities));
    }
    return obj;
}

//==========================================================================================================
// ServerManager::Impl
// Purpose: Actor state. Members marked "worker" are only touched on the worker thread.
//==========================================================================================================
class ServerManager::Impl : public std::enable_shared_from_this<ServerManager::Impl> {
public:
    enum class Timer { Probe, Stop, Auth, TokenRefresh };
    struct Deadline {
        std::chrono::steady_clock::time_point due;
        uint64_t generation{0};
    };

    const std::string id;
    adapters::IProcessAdapter& processes;
    adapters::IEnvAdapter& env;
    auth::TokenManager* tokens;
    const ServerManagerOptions options;
    ClientFactory clientFactory;

    StateMachine machine;
    events::EventHub<ServerEvent> listeners;
    events::Unsubscribe machineSubscription;

    mutable std::mutex configMutex;
    ServerConfig config;

    mutable std::mutex sessionMutex;
    std::shared_ptr<adapters::IProcess> process;
    std::shared_ptr<IClient> client;
    std::optional<CapabilitiesSnapshot> capabilities;

    std::mutex queueMutex;
    std::condition_variable_any cv;
    std::deque<std::function<void()>> queue;
    std::map<Timer, Deadline> timers;
    bool closed{false};
    std::jthread worker;

    // worker
    Promise startPromise;
    std::vector<std::function<void(std::exception_ptr)>> stopWaiters;
    std::vector<events::Unsubscribe> processSubscriptions;
    uint64_t processGen{0};
    uint64_t probeGen{0};
    uint64_t authGen{0};
    bool tokenRefreshedThisStart{false};

    Impl(ServerConfig cfg, adapters::IProcessAdapter& p, adapters::IEnvAdapter& e, auth::TokenManager* t,
         ServerManagerOptions o, ClientFactory f)
        : id(cfg.id), processes(p), env(e), tokens(t), options(std::move(o)), clientFactory(std::move(f)),
          machine(cfg.id, options.historyLimit), config(std::move(cfg)) {
        machineSubscription = machine.OnTransition([this](const TransitionRecord& r) {
            ServerEvent ev;
            ev.kind = ServerEvent::Kind::StateChanged;
            ev.serverId = id;
            ev.transition = r;
            ev.state = r.to;
            ev.metadata = r.metadata;
            listeners.Emit(ev);
        });
    }

    ~Impl() { machineSubscription(); }

    void startWorker() {
        worker = std::jthread([this](std::stop_token st) { run(st); });
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

    // Posts a command completing `promise`, or fails it when the manager has shut down.
    std::future<void> submit(std::function<void(Promise)> body) {
        auto promise = std::make_shared<std::promise<void>>();
        auto fut = promise->get_future();
        if (!post([promise, body = std::move(body)]() { body(promise); })) {
            promise->set_exception(std::make_exception_ptr(
                ManagerError(ErrorCode::StartCancelled, "Server manager has shut down", id)));
        }
        return fut;
    }

    // Posts from event-source threads; holding `weak` keeps the call safe after teardown.
    template <typename Fn>
    static void postWeak(const std::weak_ptr<Impl>& weak, Fn fn) {
        if (auto self = weak.lock()) {
            Impl* raw = self.get();
            raw->post([raw, fn = std::move(fn)]() mutable { fn(*raw); });
        }
    }

    void scheduleTimer(Timer kind, std::chrono::milliseconds delay, uint64_t generation) {
        std::lock_guard<std::mutex> lk(queueMutex);
        timers[kind] = Deadline{std::chrono::steady_clock::now() + delay, generation};
    }

    void cancelTimer(Timer kind) {
        std::lock_guard<std::mutex> lk(queueMutex);
        timers.erase(kind);
    }

    std::optional<std::chrono::steady_clock::time_point> nextDueLocked() const {
        std::optional<std::chrono::steady_clock::time_point> next;
        for (const auto& [kind, d] : timers) {
            if (!next.has_value() || d.due < *next) {
                next = d.due;
            }
        }
        return next;
    }

    void run(std::stop_token st) {
        LOG_DEBUG("ServerManager[{}]: worker started", id);
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
        LOG_DEBUG("ServerManager[{}]: worker stopped", id);
    }

    void execute(const std::function<void()>& command) {
        try {
            command();
        } catch (const std::exception& e) {
            LOG_ERROR("ServerManager[{}]: command failed: {}", id, e.what());
            ManagerError err(ErrorCode::ProcessError, e.what(), id);
            killAndAbandon();
            machine.ForceState(S::RuntimeError, errorPatch(err, MsgStartFailed, {"Retry", "Reset"}));
            failStart(err);
        }
    }

    void fireDueTimers() {
        std::vector<std::pair<Timer, uint64_t>> due;
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
        for (const auto& [kind, generation] : due) {
            execute([this, kind = kind, generation = generation]() { onTimer(kind, generation); });
        }
    }

    void onTimer(Timer kind, uint64_t generation) {
        const S state = machine.State();
        switch (kind) {
            case Timer::Probe:
                if (state == S::Starting && generation == probeGen) {
                    ++probeGen;
                    probeFailed(ManagerError(ErrorCode::ProcessTimeout,
                                             "Server did not complete initialization within " +
                                                 std::to_string(options.probeTimeout.count()) + " ms",
                                             id));
                }
                break;
            case Timer::Stop:
                if (state == S::Stopping && generation == processGen) {
                    LOG_WARN("ServerManager[{}]: no exit observed after stop; forcing STOPPED", id);
                    teardownSession();
                    MetadataPatch p;
                    p.errorMessage = std::string("Server may not have stopped properly");
                    p.userMessage = std::string("Server stopped (timeout recovery)");
                    machine.ForceState(S::Stopped, p);
                    resolveStops(nullptr);
                }
                break;
            case Timer::Auth:
                if (state == S::Authenticating && generation == authGen) {
                    if (tokens) {
                        tokens->CancelAuthorization(id);
                    }
                    ManagerError err(ErrorCode::AuthFailed, "Authorization timed out", id);
                    machine.Apply(E::AuthFailure, errorPatch(err, MsgAuthFailed, {"Retry authentication"}));
                }
                break;
            case Timer::TokenRefresh:
                if (state == S::Running && generation == processGen) {
                    refreshWhileRunning();
                }
                break;
        }
    }

    ////////////////////////////////////////// Promises //////////////////////////////////////////

    ManagerError tagged(const ManagerError& e) const {
        if (!e.serverId().empty()) {
            return e;
        }
        return ManagerError(e.code(), e.what(), id, e.upstream());
    }

    void failStart(const ManagerError& e) {
        if (startPromise) {
            startPromise->set_exception(std::make_exception_ptr(tagged(e)));
            startPromise.reset();
        }
    }

    void resolveStart() {
        if (startPromise) {
            startPromise->set_value();
            startPromise.reset();
        }
    }

    void resolveStops(std::exception_ptr error) {
        auto waiters = std::move(stopWaiters);
        stopWaiters.clear();
        for (auto& w : waiters) {
            w(error);
        }
    }

    static std::function<void(std::exception_ptr)> completing(Promise p) {
        return [p](std::exception_ptr ep) {
            if (ep) {
                p->set_exception(ep);
            } else {
                p->set_value();
            }
        };
    }

    ManagerError invalid(const char* what) const {
        return ManagerError(ErrorCode::InvalidTransition,
                            std::string("Cannot ") + what + " server " + id + " while " + ToString(machine.State()), id);
    }

    ////////////////////////////////////////// Session //////////////////////////////////////////

    ServerConfig configCopy() const {
        std::lock_guard<std::mutex> lk(configMutex);
        return config;
    }

    void applyTokens(const auth::OAuthTokens& t) {
        std::lock_guard<std::mutex> lk(configMutex);
        if (!config.oauthConfig.has_value()) {
            config.oauthConfig = OAuthConfig{};
        }
        config.oauthConfig->accessToken = t.accessToken;
        if (t.refreshToken.has_value()) {
            config.oauthConfig->refreshToken = t.refreshToken;
        }
        config.oauthConfig->tokenExpiresAt = t.expiresAt;
        config.oauthConfig->tokenIssuedAt = t.issuedAt;
    }

    void teardownSession() {
        for (auto& off : processSubscriptions) {
            off();
        }
        processSubscriptions.clear();
        std::shared_ptr<IClient> c;
        std::shared_ptr<adapters::IProcess> p;
        {
            std::lock_guard<std::mutex> lk(sessionMutex);
            c.swap(client);
            p.swap(process);
        }
        if (c) {
            try {
                c->Disconnect().get();
            } catch (const ManagerError& e) {
                LOG_WARN("ServerManager[{}]: disconnect failed: {}", id, e.what());
            }
        }
    }

    // Kills the current process and stops listening to it; the exit is no longer reported.
    void killAndAbandon() {
        std::shared_ptr<adapters::IProcess> p;
        {
            std::lock_guard<std::mutex> lk(sessionMutex);
            p = process;
        }
        cancelTimer(Timer::TokenRefresh);
        ++processGen;
        teardownSession();
        if (p) {
            p->Kill();
        }
    }

    // A previous process for this id may still be exiting; wait for it before spawning again.
    void reapLeftover() {
        auto old = processes.Get(id);
        if (!old) {
            return;
        }
        LOG_WARN("ServerManager[{}]: previous process {} still alive; terminating it", id, old->Pid());
        auto exited = std::make_shared<std::promise<void>>();
        auto fut = exited->get_future();
        auto off = old->OnExit([exited](const adapters::ProcessExit&) { exited->set_value(); });
        old->Kill();
        if (fut.wait_for(options.shutdownGrace + StopSlack) != std::future_status::ready) {
            LOG_WARN("ServerManager[{}]: previous process did not exit in time", id);
        }
        off();
    }

    void attachProcess(const std::shared_ptr<adapters::IProcess>& p) {
        const uint64_t gen = ++processGen;
        std::weak_ptr<Impl> weak = shared_from_this();
        processSubscriptions.push_back(p->OnExit([weak, gen](const adapters::ProcessExit& exit) {
            postWeak(weak, [gen, exit](Impl& self) { self.onProcessExit(gen, exit); });
        }));
        processSubscriptions.push_back(p->OnStderr([sid = id](const std::string& line) {
            LOG_DEBUG("[{}] stderr: {}", sid, line);
        }));
        std::lock_guard<std::mutex> lk(sessionMutex);
        process = p;
        capabilities.reset();
    }

    ////////////////////////////////////////// Start path //////////////////////////////////////////

    void doStart(Promise promise) {
        if (!IsStartable(machine.State())) {
            promise->set_exception(std::make_exception_ptr(invalid("start")));
            return;
        }
        failStart(ManagerError(ErrorCode::StartCancelled, "Superseded by a newer start", id));
        startPromise = std::move(promise);
        machine.ClearError();
        machine.Apply(E::Start);
        runValidation();
    }

    void failValidation(const ManagerError& e) {
        machine.Apply(E::StartFailed, errorPatch(e, MsgStartFailed, {"Edit configuration", "Retry"}));
        failStart(e);
    }

    // Runs in VALIDATING: config checks, token handling, then launch.
    void runValidation() {
        tokenRefreshedThisStart = false;
        const ServerConfig cfg = configCopy();
        if (auto problem = ValidateForStart(cfg)) {
            failValidation(ManagerError(ErrorCode::ConfigError, *problem, id));
            return;
        }
        if (cfg.UsesOAuth()) {
            if (!tokens) {
                failValidation(ManagerError(ErrorCode::ConfigError, "OAuth is not available for " + id, id));
                return;
            }
            switch (tokens->Inspect(cfg)) {
                case auth::TokenStatus::Missing: {
                    ManagerError err(ErrorCode::AuthRequired, "Server " + id + " requires authentication", id);
                    machine.Apply(E::AuthFailure, errorPatch(err, MsgAuthRequired, {"Authenticate"}));
                    failStart(err);
                    return;
                }
                case auth::TokenStatus::NeedsRefresh: {
                    MetadataPatch p;
                    p.userMessage = std::string(MsgRefreshing);
                    machine.Apply(E::TokenExpired, p);
                    if (!refreshTokens()) {
                        return;
                    }
                    launch(false);
                    return;
                }
                case auth::TokenStatus::Valid:
                    break;
            }
        }
        launch(true);
    }

    // TOKEN_REFRESHING -> STARTING on success, AUTH_FAILED on failure.
    bool refreshTokens() {
        try {
            auth::OAuthTokens t = tokens->Refresh(configCopy());
            applyTokens(t);
            tokenRefreshedThisStart = true;
            MetadataPatch p;
            p.userMessage = std::string(MsgRefreshed);
            p.tokenExpiresAt = t.expiresAt;
            machine.Apply(E::RefreshSuccess, p);
            return true;
        } catch (const ManagerError& e) {
            ManagerError err(ErrorCode::TokenRefreshFailed, std::string("Token refresh failed: ") + e.what(), id);
            machine.Apply(E::RefreshFailure, errorPatch(err, MsgRefreshFailed, {"Authenticate"}));
            failStart(err);
            return false;
        }
    }

    adapters::ProcessSpec buildSpec(const ServerConfig& cfg) {
        adapters::ProcessSpec spec;
        spec.command = env.Resolve(cfg.command);
        spec.args = env.ResolveArgs(cfg.args);
        spec.env = env.ResolveAll(cfg.env);
        if (cfg.UsesOAuth() && cfg.oauthConfig.has_value() && cfg.oauthConfig->accessToken.has_value()) {
            spec.env["OAUTH_ACCESS_TOKEN"] = *cfg.oauthConfig->accessToken;
        }
        if (cfg.authType == AuthType::Token && cfg.authToken.has_value()) {
            spec.env["MCP_AUTH_TOKEN"] = env.Resolve(*cfg.authToken);
        }
        return spec;
    }

    // `fromValidating`: STARTED moves VALIDATING -> STARTING; on the refresh path the state already is STARTING.
    void launch(bool fromValidating) {
        const ServerConfig cfg = configCopy();
        std::shared_ptr<adapters::IProcess> p;
        try {
            adapters::ProcessSpec spec = buildSpec(cfg);
            reapLeftover();
            LOG_INFO("ServerManager[{}]: spawning {}", id, spec.command);
            p = processes.Spawn(id, spec);
        } catch (const ManagerError& e) {
            LOG_WARN("ServerManager[{}]: launch failed: {}", id, e.what());
            failValidation(tagged(e));
            return;
        }
        attachProcess(p);
        MetadataPatch patch;
        patch.processId = p->Pid();
        if (fromValidating) {
            machine.Apply(E::Started, patch);
        } else {
            machine.UpdateMetadata(patch);
        }
        beginProbe();
    }

    void beginProbe() {
        const uint64_t gen = ++probeGen;
        std::weak_ptr<Impl> weak = shared_from_this();
        std::shared_ptr<IClient> c;
        {
            std::shared_ptr<adapters::IProcess> p;
            {
                std::lock_guard<std::mutex> lk(sessionMutex);
                p = process;
            }
            auto transport = std::make_unique<ProcessTransport>(p);
            transport->SetRequestTimeoutMs(static_cast<uint64_t>(options.requestTimeout.count()));
            c = clientFactory ? clientFactory(id) : std::make_shared<Client>(id);
            const uint64_t sessionGen = processGen;
            c->SetNotificationHandler([weak, sessionGen](const std::string& method, const JSONValue&) {
                if (method == Methods::ToolListChanged || method == Methods::ResourceListChanged ||
                    method == Methods::PromptListChanged) {
                    postWeak(weak, [sessionGen](Impl& self) { self.relist(sessionGen); });
                }
            });
            c->SetErrorHandler([sid = id](const std::string& err) { LOG_DEBUG("[{}] transport: {}", sid, err); });
            try {
                c->Connect(std::move(transport)).get();
            } catch (const ManagerError& e) {
                probeFailed(e);
                return;
            }
            std::lock_guard<std::mutex> lk(sessionMutex);
            client = c;
        }
        scheduleTimer(Timer::Probe, options.probeTimeout, gen);
        probeTask(c, options.clientInfo, id, [weak, gen](ProbeOutcome outcome) {
            postWeak(weak, [gen, outcome = std::move(outcome)](Impl& self) { self.onProbeResult(gen, outcome); });
        });
    }

    void onProbeResult(uint64_t gen, const ProbeOutcome& outcome) {
        if (gen != probeGen || machine.State() != S::Starting) {
            LOG_DEBUG("ServerManager[{}]: stale probe result ignored", id);
            return;
        }
        cancelTimer(Timer::Probe);
        if (!outcome.snapshot.has_value()) {
            probeFailed(outcome.error.value_or(ManagerError(ErrorCode::ProcessError, "Capability probe failed", id)));
            return;
        }
        {
            std::lock_guard<std::mutex> lk(sessionMutex);
            capabilities = outcome.snapshot;
        }
        LOG_INFO("ServerManager[{}]: running ({} tools, {} resources, {} prompts)", id, outcome.snapshot->tools.size(),
                 outcome.snapshot->resources.size(), outcome.snapshot->prompts.size());
        machine.ClearError();
        machine.Apply(E::Started);
        emitCapabilities();
        resolveStart();
        scheduleTokenRefresh();
    }

    void probeFailed(const ManagerError& e) {
        LOG_WARN("ServerManager[{}]: startup failed: {}", id, e.what());
        machine.Apply(E::StartFailed, errorPatch(tagged(e), MsgStartFailed, {"Retry", "View server logs"}));
        killAndAbandon();
        failStart(e);
    }

    void emitCapabilities() {
        ServerEvent ev;
        ev.kind = ServerEvent::Kind::CapabilitiesUpdated;
        ev.serverId = id;
        ev.state = machine.State();
        ev.metadata = machine.Metadata();
        listeners.Emit(ev);
    }

    void relist(uint64_t sessionGen) {
        if (sessionGen != processGen || machine.State() != S::Running) {
            return;
        }
        std::shared_ptr<IClient> c;
        ServerCapabilities caps;
        {
            std::lock_guard<std::mutex> lk(sessionMutex);
            c = client;
            if (capabilities.has_value()) {
                caps = capabilities->capabilities;
            }
        }
        if (!c) {
            return;
        }
        std::weak_ptr<Impl> weak = shared_from_this();
        relistTask(c, caps, id, [weak, sessionGen](CapabilityLists lists) {
            postWeak(weak, [sessionGen, lists = std::move(lists)](Impl& self) mutable {
                if (sessionGen != self.processGen || self.machine.State() != S::Running) {
                    return;
                }
                {
                    std::lock_guard<std::mutex> lk(self.sessionMutex);
                    if (!self.capabilities.has_value()) {
                        return;
                    }
                    self.capabilities->tools = std::move(lists.tools);
                    self.capabilities->resources = std::move(lists.resources);
                    self.capabilities->prompts = std::move(lists.prompts);
                    self.capabilities->fetchedAt = NowEpochMs();
                }
                self.emitCapabilities();
            });
        });
    }

    // Arms the refresh deadline tokenRefreshSkewMs before expiry. A token that came from a refresh is never
    // refreshed again before tokenRefreshMinInterval, and not at all when it already expires inside the skew.
    void scheduleTokenRefresh() {
        const ServerConfig cfg = configCopy();
        if (!cfg.UsesOAuth() || !cfg.oauthConfig.has_value() || !cfg.oauthConfig->tokenExpiresAt.has_value()) {
            return;
        }
        if (!cfg.oauthConfig->refreshToken.has_value() || cfg.oauthConfig->refreshToken->empty()) {
            LOG_DEBUG("ServerManager[{}]: no refresh token; the token is renewed on the next start", id);
            return;
        }
        int64_t delayMs = *cfg.oauthConfig->tokenExpiresAt - options.tokenRefreshSkewMs - NowEpochMs();
        if (tokenRefreshedThisStart) {
            if (delayMs <= 0) {
                LOG_WARN("ServerManager[{}]: refreshed token already expires within {} ms; not refreshing again until "
                         "the next start", id, options.tokenRefreshSkewMs);
                return;
            }
            delayMs = std::max<int64_t>(delayMs, options.tokenRefreshMinInterval.count());
        }
        delayMs = std::max<int64_t>(delayMs, 0);
        LOG_DEBUG("ServerManager[{}]: token refresh due in {} ms", id, delayMs);
        scheduleTimer(Timer::TokenRefresh, std::chrono::milliseconds(delayMs), processGen);
    }

    // RUNNING -> TOKEN_REFRESHING -> STARTING -> RUNNING on the same process and session. The child keeps the
    // token it was launched with; the refreshed one is stored for the next launch. A failed refresh ends in
    // AUTH_FAILED with the process killed.
    void refreshWhileRunning() {
        if (!tokens) {
            return;
        }
        MetadataPatch p;
        p.userMessage = std::string(MsgRefreshing);
        machine.Apply(E::TokenExpired, p);
        if (!refreshTokens()) {
            killAndAbandon();
            return;
        }
        reprobeSession();
    }

    void reprobeSession() {
        const uint64_t gen = ++probeGen;
        std::shared_ptr<IClient> c;
        std::optional<CapabilitiesSnapshot> previous;
        {
            std::lock_guard<std::mutex> lk(sessionMutex);
            c = client;
            previous = capabilities;
        }
        if (!c || !previous.has_value()) {
            probeFailed(ManagerError(ErrorCode::ServerNotRunning, "Session lost during token refresh", id));
            return;
        }
        scheduleTimer(Timer::Probe, options.probeTimeout, gen);
        std::weak_ptr<Impl> weak = shared_from_this();
        reprobeTask(c, std::move(*previous), id, [weak, gen](ProbeOutcome outcome) {
            postWeak(weak, [gen, outcome = std::move(outcome)](Impl& self) { self.onProbeResult(gen, outcome); });
        });
    }

    ////////////////////////////////////////// Process exit //////////////////////////////////////////

    void onProcessExit(uint64_t gen, const adapters::ProcessExit& exit) {
        if (gen != processGen) {
            return;
        }
        const S state = machine.State();
        LOG_INFO("ServerManager[{}]: process exited ({}) in state {}", id, describeExit(exit), ToString(state));
        cancelTimer(Timer::Probe);
        cancelTimer(Timer::TokenRefresh);
        teardownSession();

        MetadataPatch exitPatch;
        exitPatch.exitCode = exit.exitCode;
        exitPatch.exitSignal = exit.signal;
        switch (state) {
            case S::Stopping:
                cancelTimer(Timer::Stop);
                machine.Apply(E::Stopped, exitPatch);
                resolveStops(nullptr);
                break;
            case S::Starting: {
                ++probeGen;
                ManagerError err(ErrorCode::ProcessCrashed,
                                 "Server process exited during startup (" + describeExit(exit) + ")", id);
                MetadataPatch p = errorPatch(err, MsgStartFailed, {"Retry", "View server logs"});
                p.exitCode = exit.exitCode;
                p.exitSignal = exit.signal;
                machine.Apply(E::StartFailed, p);
                failStart(err);
                break;
            }
            case S::Running: {
                ManagerError err(ErrorCode::ProcessCrashed,
                                 "Server process exited unexpectedly (" + describeExit(exit) + ")", id);
                MetadataPatch p = errorPatch(err, MsgCrashed, {"Retry", "View server logs"});
                p.exitCode = exit.exitCode;
                p.exitSignal = exit.signal;
                machine.Apply(E::Crashed, p);
                break;
            }
            default:
                machine.UpdateMetadata(exitPatch);
                break;
        }
    }

    ////////////////////////////////////////// Stop, auth, retry, reset //////////////////////////////////////////

    void doStop(std::function<void(std::exception_ptr)> waiter) {
        const S state = machine.State();
        switch (state) {
            case S::Starting:
                ++probeGen;
                cancelTimer(Timer::Probe);
                failStart(ManagerError(ErrorCode::StartCancelled, "Start of " + id + " cancelled by stop", id));
                [[fallthrough]];
            case S::Running: {
                cancelTimer(Timer::TokenRefresh);
                machine.Apply(E::Stop);
                stopWaiters.push_back(std::move(waiter));
                std::shared_ptr<adapters::IProcess> p;
                {
                    std::lock_guard<std::mutex> lk(sessionMutex);
                    p = process;
                }
                if (!p) {
                    machine.Apply(E::Stopped);
                    resolveStops(nullptr);
                    return;
                }
                scheduleTimer(Timer::Stop, options.shutdownGrace + StopSlack, processGen);
                LOG_INFO("ServerManager[{}]: stopping process {}", id, p->Pid());
                p->Kill();
                return;
            }
            case S::Stopping:
                stopWaiters.push_back(std::move(waiter));
                return;
            case S::Authenticating:
                ++authGen;
                cancelTimer(Timer::Auth);
                if (tokens) {
                    tokens->CancelAuthorization(id);
                }
                machine.Apply(E::Stop);
                break;
            default:
                if (machine.CanApply(E::Stop) && Transition(state, E::Stop) != state) {
                    machine.Apply(E::Stop);
                }
                break;
        }
        waiter(nullptr);
    }

    void doAuthenticate(Promise promise) {
        const S state = machine.State();
        if (state != S::AuthRequired && state != S::AuthFailed) {
            promise->set_exception(std::make_exception_ptr(invalid("authenticate")));
            return;
        }
        if (!configCopy().UsesOAuth() || !tokens) {
            promise->set_exception(std::make_exception_ptr(
                ManagerError(ErrorCode::ConfigError, "Server " + id + " is not configured for OAuth", id)));
            return;
        }
        MetadataPatch p;
        p.userMessage = std::string(MsgAuthInBrowser);
        machine.Apply(E::Authenticate, p);
        beginAuthorization(std::move(promise));
    }

    // In AUTHENTICATING: opens the browser flow and waits for the callback.
    void beginAuthorization(Promise promise) {
        const uint64_t gen = ++authGen;
        std::weak_ptr<Impl> weak = shared_from_this();
        try {
            auto request = tokens->BeginAuthorization(configCopy(), [weak, gen](const auth::AuthOutcome& outcome) {
                postWeak(weak, [gen, outcome](Impl& self) { self.onAuthOutcome(gen, outcome); });
            });
            MetadataPatch p;
            p.authUrl = request.url;
            machine.UpdateMetadata(p);
            scheduleTimer(Timer::Auth, options.authTimeout, gen);
            promise->set_value();
        } catch (const ManagerError& e) {
            machine.Apply(E::AuthFailure, errorPatch(e, MsgAuthFailed, {"Check OAuth configuration", "Retry"}));
            promise->set_exception(std::make_exception_ptr(tagged(e)));
        }
    }

    void onAuthOutcome(uint64_t gen, const auth::AuthOutcome& outcome) {
        if (gen != authGen || machine.State() != S::Authenticating) {
            LOG_DEBUG("ServerManager[{}]: stale authorization result ignored", id);
            return;
        }
        cancelTimer(Timer::Auth);
        if (!outcome.tokens.has_value()) {
            ManagerError err = outcome.error.value_or(ManagerError(ErrorCode::AuthFailed, "Authorization failed", id));
            machine.Apply(E::AuthFailure, errorPatch(err, MsgAuthFailed, {"Retry authentication", "Check OAuth configuration"}));
            return;
        }
        applyTokens(*outcome.tokens);
        machine.ClearError();
        MetadataPatch p;
        p.userMessage = std::string(MsgAuthSucceeded);
        p.tokenExpiresAt = outcome.tokens->expiresAt;
        machine.Apply(E::AuthSuccess, p);
        runValidation();
    }

    void doRetry(Promise promise) {
        const S state = machine.State();
        MetadataPatch p;
        p.restartCount = machine.Metadata().restartCount + 1;
        if (state == S::ConfigError || state == S::RuntimeError) {
            failStart(ManagerError(ErrorCode::StartCancelled, "Superseded by retry", id));
            startPromise = std::move(promise);
            machine.ClearError();
            machine.Apply(E::Retry, p);
            runValidation();
            return;
        }
        if (state == S::AuthFailed) {
            if (!tokens) {
                promise->set_exception(std::make_exception_ptr(
                    ManagerError(ErrorCode::ConfigError, "OAuth is not available for " + id, id)));
                return;
            }
            machine.Apply(E::Retry, p);
            beginAuthorization(std::move(promise));
            return;
        }
        promise->set_exception(std::make_exception_ptr(invalid("retry")));
    }

    void doReset(Promise promise) {
        const S state = machine.State();
        if (state == S::Idle) {
            machine.ClearHistory();
            promise->set_value();
            return;
        }
        auto target = Transition(state, E::Reset);
        if (!target.has_value()) {
            promise->set_exception(std::make_exception_ptr(invalid("reset")));
            return;
        }
        if (state == S::Authenticating) {
            ++authGen;
            cancelTimer(Timer::Auth);
            if (tokens) {
                tokens->CancelAuthorization(id);
            }
        }
        failStart(ManagerError(ErrorCode::StartCancelled, "Start of " + id + " cancelled by reset", id));
        if (*target == S::Idle) {
            machine.Reset();
        } else {
            machine.Apply(E::Reset);
            machine.ClearHistory();
        }
        promise->set_value();
    }

    ////////////////////////////////////////// Calls //////////////////////////////////////////

    std::shared_ptr<IClient> runningClient() const {
        if (machine.State() != S::Running) {
            return nullptr;
        }
        std::lock_guard<std::mutex> lk(sessionMutex);
        return client;
    }

    ManagerError notRunning() const {
        return ManagerError(ErrorCode::ServerNotRunning,
                            "Server " + id + " is not running (" + ToString(machine.State()) + ")", id);
    }

    void shutdown() {
        {
            std::lock_guard<std::mutex> lk(queueMutex);
            if (closed) {
                return;
            }
            closed = true;
            timers.clear();
        }
        worker.request_stop();
        cv.notify_all();
        if (worker.joinable() && worker.get_id() != std::this_thread::get_id()) {
            worker.join();
        }
        if (tokens) {
            tokens->CancelAuthorization(id);
        }
        killAndAbandon();
        failStart(ManagerError(ErrorCode::StartCancelled, "Server manager has shut down", id));
        resolveStops(nullptr);
        std::deque<std::function<void()>> dropped;
        {
            std::lock_guard<std::mutex> lk(queueMutex);
            dropped.swap(queue);
        }
        if (!dropped.empty()) {
            LOG_DEBUG("ServerManager[{}]: {} queued commands dropped at shutdown", id, dropped.size());
        }
    }
};

ServerManager::ServerManager(ServerConfig config, adapters::IProcessAdapter& processes, adapters::IEnvAdapter& env,
                             auth::TokenManager* tokens, ServerManagerOptions options, ClientFactory clientFactory)
    : pImpl(std::make_shared<Impl>(std::move(config), processes, env, tokens, std::move(options),
                                   std::move(clientFactory))) {
    FUNC_SCOPE();
    pImpl->startWorker();
}

ServerManager::~ServerManager() {
    FUNC_SCOPE();
    Shutdown();
}

const std::string& ServerManager::Id() const {
    return pImpl->id;
}

std::future<void> ServerManager::Start() {
    return pImpl->submit([impl = pImpl.get()](Promise p) { impl->doStart(std::move(p)); });
}

std::future<void> ServerManager::Stop() {
    return pImpl->submit([impl = pImpl.get()](Promise p) { impl->doStop(Impl::completing(std::move(p))); });
}

std::future<void> ServerManager::Restart() {
    return pImpl->submit([impl = pImpl.get()](Promise p) {
        impl->doStop([impl, p](std::exception_ptr ep) {
            if (ep) {
                p->set_exception(ep);
                return;
            }
            impl->doStart(p);
        });
    });
}

std::future<void> ServerManager::Authenticate() {
    return pImpl->submit([impl = pImpl.get()](Promise p) { impl->doAuthenticate(std::move(p)); });
}

std::future<void> ServerManager::Retry() {
    return pImpl->submit([impl = pImpl.get()](Promise p) { impl->doRetry(std::move(p)); });
}

std::future<void> ServerManager::Reset() {
    return pImpl->submit([impl = pImpl.get()](Promise p) { impl->doReset(std::move(p)); });
}

std::future<void> ServerManager::UpdateConfig(ServerConfig config) {
    return pImpl->submit([impl = pImpl.get(), config = std::move(config)](Promise p) {
        if (config.id != impl->id) {
            p->set_exception(std::make_exception_ptr(
                ManagerError(ErrorCode::ConfigError, "Server id cannot change (" + impl->id + ")", impl->id)));
            return;
        }
        {
            std::lock_guard<std::mutex> lk(impl->configMutex);
            impl->config = config;
        }
        p->set_value();
    });
}

std::future<JSONValue> ServerManager::CallTool(const std::string& name, const JSONValue& arguments) {
    auto c = pImpl->runningClient();
    if (!c) {
        return failedFuture<JSONValue>(pImpl->notRunning());
    }
    return c->CallTool(name, arguments);
}

std::future<std::vector<Tool>> ServerManager::ListTools() {
    auto c = pImpl->runningClient();
    if (!c) {
        return failedFuture<std::vector<Tool>>(pImpl->notRunning());
    }
    return c->ListTools();
}

std::future<std::vector<Resource>> ServerManager::ListResources() {
    auto c = pImpl->runningClient();
    if (!c) {
        return failedFuture<std::vector<Resource>>(pImpl->notRunning());
    }
    return c->ListResources();
}

std::future<JSONValue> ServerManager::ReadResource(const std::string& uri) {
    auto c = pImpl->runningClient();
    if (!c) {
        return failedFuture<JSONValue>(pImpl->notRunning());
    }
    return c->ReadResource(uri);
}

std::future<std::vector<Prompt>> ServerManager::ListPrompts() {
    auto c = pImpl->runningClient();
    if (!c) {
        return failedFuture<std::vector<Prompt>>(pImpl->notRunning());
    }
    return c->ListPrompts();
}

std::future<JSONValue> ServerManager::GetPrompt(const std::string& name, const JSONValue& arguments) {
    auto c = pImpl->runningClient();
    if (!c) {
        return failedFuture<JSONValue>(pImpl->notRunning());
    }
    return c->GetPrompt(name, arguments);
}

CapabilitiesSnapshot ServerManager::GetCapabilities() const {
    if (pImpl->machine.State() != S::Running) {
        throw pImpl->notRunning();
    }
    std::lock_guard<std::mutex> lk(pImpl->sessionMutex);
    if (!pImpl->capabilities.has_value()) {
        throw pImpl->notRunning();
    }
    return *pImpl->capabilities;
}

ServerConfig ServerManager::Config() const {
    return pImpl->configCopy();
}

ServerState ServerManager::State() const {
    return pImpl->machine.State();
}

ServerSnapshot ServerManager::Snapshot() const {
    ServerSnapshot s;
    s.config = pImpl->configCopy();
    s.state = pImpl->machine.State();
    s.previousState = pImpl->machine.PreviousState();
    s.metadata = pImpl->machine.Metadata();
    s.history = pImpl->machine.History();
    std::lock_guard<std::mutex> lk(pImpl->sessionMutex);
    s.capabilities = pImpl->capabilities;
    return s;
}

events::Unsubscribe ServerManager::Subscribe(EventListener listener) {
    return pImpl->listeners.Subscribe(std::move(listener));
}

void ServerManager::Shutdown() {
    pImpl->shutdown();
}

} // namespace mcpm
