//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Registry.cpp
// Purpose: Owner of all server managers; persists the server list and aggregates their events
//==========================================================================================================

#include <algorithm>
#include <map>
#include <mutex>
#include <set>

#include "logging/Logger.h"
#include "mcpm/BuiltInServers.h"
#include "mcpm/Registry.h"
#include "mcpm/errors/Errors.h"

namespace mcpm {

using errors::ErrorCode;
using errors::ManagerError;

namespace {

template <typename T>
std::future<T> failedFuture(const ManagerError& error) {
    std::promise<T> p;
    p.set_exception(std::make_exception_ptr(error));
    return p.get_future();
}

ManagerError notFound(const std::string& id) {
    return ManagerError(ErrorCode::ServerNotFound, "Server not found: " + id, id);
}

// Waits for a lifecycle future, logging instead of throwing; used where the caller only needs settlement.
void settle(std::future<void> fut, const std::string& id, const char* what) {
    try {
        fut.get();
    } catch (const ManagerError& e) {
        LOG_WARN("Registry: {} of {} failed: {}", what, id, e.what());
    }
}

std::future<void> lifecycle(const std::shared_ptr<ServerManager>& manager, const std::string& id,
                            std::future<void> (ServerManager::*command)()) {
    if (!manager) {
        return failedFuture<void>(notFound(id));
    }
    return ((*manager).*command)();
}

} // namespace

const char* ToString(RegistryEvent::Kind kind) {
    switch (kind) {
        case RegistryEvent::Kind::ServerAdded: return "ServerAdded";
        case RegistryEvent::Kind::ServerUpdated: return "ServerUpdated";
        case RegistryEvent::Kind::ServerRemoved: return "ServerRemoved";
        case RegistryEvent::Kind::StateChanged: return "StateChanged";
        case RegistryEvent::Kind::CapabilitiesUpdated: return "CapabilitiesUpdated";
    }
    return "Unknown";
}

RegistryOptions RegistryOptions::FromSettings(const Settings& settings) {
    RegistryOptions o;
    o.configName = settings.ConfigName();
    o.builtinRoot = settings.builtinRoot;
    o.manager = ServerManagerOptions::FromSettings(settings);
    return o;
}

class Registry::Impl : public std::enable_shared_from_this<Registry::Impl> {
public:
    struct Entry {
        std::shared_ptr<ServerManager> manager;
        events::Unsubscribe subscription;
    };

    adapters::IProcessAdapter& processes;
    adapters::IStorageAdapter& storage;
    adapters::IEnvAdapter& env;
    adapters::IBrowserAdapter& browser;
    auth::TokenManager* tokens;
    const RegistryOptions options;
    ClientFactory clientFactory;

    mutable std::mutex mutex;
    std::vector<ServerConfig> configs;  // document order
    std::map<std::string, Entry> entries;
    events::Unsubscribe watchSubscription;
    bool disposed{false};

    std::mutex persistMutex;
    events::EventHub<RegistryEvent> hub;

    Impl(adapters::IProcessAdapter& p, adapters::IStorageAdapter& s, adapters::IEnvAdapter& e,
         adapters::IBrowserAdapter& b, auth::TokenManager* t, RegistryOptions o, ClientFactory f)
        : processes(p), storage(s), env(e), browser(b), tokens(t), options(std::move(o)), clientFactory(std::move(f)) {}

    ////////////////////////////////////////// Events //////////////////////////////////////////

    void emit(RegistryEvent::Kind kind, const std::string& id, ServerState state, const StateMetadata& metadata) {
        RegistryEvent ev;
        ev.kind = kind;
        ev.serverId = id;
        ev.state = state;
        ev.metadata = metadata;
        hub.Emit(ev);
    }

    void emitFor(RegistryEvent::Kind kind, const std::shared_ptr<ServerManager>& manager) {
        ServerSnapshot snap = manager->Snapshot();
        emit(kind, manager->Id(), snap.state, snap.metadata);
    }

    void forward(const ServerEvent& ev) {
        RegistryEvent out;
        out.kind = ev.kind == ServerEvent::Kind::StateChanged ? RegistryEvent::Kind::StateChanged
                                                               : RegistryEvent::Kind::CapabilitiesUpdated;
        out.serverId = ev.serverId;
        out.event = ev;
        out.state = ev.state;
        out.metadata = ev.metadata;
        hub.Emit(out);
    }

    ////////////////////////////////////////// Managers //////////////////////////////////////////

    // Caller holds `mutex`.
    Entry makeEntry(const ServerConfig& config) {
        Entry entry;
        entry.manager = std::make_shared<ServerManager>(config, processes, env, tokens, options.manager, clientFactory);
        std::weak_ptr<Impl> weak = shared_from_this();
        entry.subscription = entry.manager->Subscribe([weak](const ServerEvent& ev) {
            if (auto self = weak.lock()) {
                self->forward(ev);
            }
        });
        return entry;
    }

    static void retire(Entry& entry) {
        settle(entry.manager->Stop(), entry.manager->Id(), "stop");
        entry.subscription();
        entry.manager->Shutdown();
    }

    std::shared_ptr<ServerManager> find(const std::string& id) const {
        std::lock_guard<std::mutex> lk(mutex);
        auto it = entries.find(id);
        return it == entries.end() ? nullptr : it->second.manager;
    }

    std::shared_ptr<ServerManager> require(const std::string& id) const {
        auto m = find(id);
        if (!m) {
            throw notFound(id);
        }
        return m;
    }

    ////////////////////////////////////////// Persistence //////////////////////////////////////////

    void persist() {
        std::lock_guard<std::mutex> plk(persistMutex);
        std::vector<ServerConfig> list;
        {
            std::lock_guard<std::mutex> lk(mutex);
            list = configs;
        }
        storage.WriteConfig(options.configName, ServerListToJSON(list));
        LOG_DEBUG("Registry: persisted {} servers to {}", list.size(), options.configName);
    }

    std::vector<ServerConfig> loadDocument() {
        std::vector<ServerConfig> list;
        if (auto doc = storage.ReadConfig(options.configName)) {
            list = ServerListFromJSON(*doc);
        } else {
            LOG_INFO("Registry: {} does not exist yet", options.configName);
        }
        return list;
    }

    //==========================================================================================================
    // reconcile
    // Purpose: Makes the managed set match `list`: new ids get managers, removed ids are stopped and
    //          dropped, changed configs are pushed to their manager (stopping it when launch fields changed).
    //==========================================================================================================
    void reconcile(std::vector<ServerConfig> list) {
        std::vector<Entry> removed;
        std::vector<std::shared_ptr<ServerManager>> added;
        std::vector<std::pair<std::shared_ptr<ServerManager>, std::pair<ServerConfig, bool>>> updated;
        {
            std::lock_guard<std::mutex> lk(mutex);
            if (disposed) {
                return;
            }
            std::set<std::string> seen;
            std::vector<ServerConfig> unique;
            for (auto& cfg : list) {
                if (!seen.insert(cfg.id).second) {
                    LOG_WARN("Registry: duplicate server id {} in document; keeping the first", cfg.id);
                    continue;
                }
                unique.push_back(std::move(cfg));
            }
            for (auto it = entries.begin(); it != entries.end();) {
                if (seen.count(it->first) == 0) {
                    removed.push_back(std::move(it->second));
                    it = entries.erase(it);
                } else {
                    ++it;
                }
            }
            for (const auto& cfg : unique) {
                auto it = entries.find(cfg.id);
                if (it == entries.end()) {
                    auto entry = makeEntry(cfg);
                    added.push_back(entry.manager);
                    entries.emplace(cfg.id, std::move(entry));
                    continue;
                }
                auto old = std::find_if(configs.begin(), configs.end(),
                                        [&](const ServerConfig& c) { return c.id == cfg.id; });
                if (old != configs.end() && ServerConfigToJSON(*old) != ServerConfigToJSON(cfg)) {
                    updated.push_back({it->second.manager, {cfg, LaunchFieldsDiffer(*old, cfg)}});
                }
            }
            configs = std::move(unique);
        }

        for (auto& entry : removed) {
            const std::string id = entry.manager->Id();
            LOG_INFO("Registry: removing {}", id);
            retire(entry);
            emit(RegistryEvent::Kind::ServerRemoved, id, ServerState::Stopped, StateMetadata{});
        }
        for (auto& [manager, change] : updated) {
            applyUpdate(manager, change.first, change.second);
        }
        for (const auto& manager : added) {
            LOG_INFO("Registry: added {}", manager->Id());
            emitFor(RegistryEvent::Kind::ServerAdded, manager);
        }
    }

    void applyUpdate(const std::shared_ptr<ServerManager>& manager, const ServerConfig& config, bool launchChanged) {
        manager->UpdateConfig(config).get();
        if (launchChanged) {
            const ServerState s = manager->State();
            if (s == ServerState::Running || s == ServerState::Starting || s == ServerState::Validating) {
                LOG_INFO("Registry: launch settings of {} changed; stopping it", manager->Id());
                settle(manager->Stop(), manager->Id(), "stop");
            }
        }
        emitFor(RegistryEvent::Kind::ServerUpdated, manager);
    }

    void onDocumentChanged(const std::optional<JSONValue>& doc) {
        if (!doc.has_value()) {
            LOG_WARN("Registry: {} was deleted; keeping the current servers", options.configName);
            return;
        }
        LOG_INFO("Registry: {} changed outside the manager; reloading", options.configName);
        std::vector<ServerConfig> list = ServerListFromJSON(*doc);
        bool merged = MergeBuiltInServers(list, options.builtinRoot);
        reconcile(std::move(list));
        if (merged) {
            try {
                persist();
            } catch (const ManagerError& e) {
                LOG_ERROR("Registry: failed to write back built-in servers: {}", e.what());
            }
        }
    }

    void onTokens(const std::string& id, const auth::OAuthTokens& t) {
        {
            std::lock_guard<std::mutex> lk(mutex);
            auto it = std::find_if(configs.begin(), configs.end(), [&](const ServerConfig& c) { return c.id == id; });
            if (it == configs.end()) {
                LOG_WARN("Registry: tokens received for unknown server {}", id);
                return;
            }
            if (!it->oauthConfig.has_value()) {
                it->oauthConfig = OAuthConfig{};
            }
            it->oauthConfig->accessToken = t.accessToken;
            if (t.refreshToken.has_value()) {
                it->oauthConfig->refreshToken = t.refreshToken;
            }
            it->oauthConfig->tokenExpiresAt = t.expiresAt;
            it->oauthConfig->tokenIssuedAt = t.issuedAt;
        }
        try {
            persist();
        } catch (const ManagerError& e) {
            LOG_ERROR("Registry: failed to persist tokens of {}: {}", id, e.what());
        }
    }

    void initialize() {
        std::vector<ServerConfig> list = loadDocument();
        const bool merged = MergeBuiltInServers(list, options.builtinRoot);
        reconcile(std::move(list));
        if (merged) {
            persist();
        }

        std::lock_guard<std::mutex> lk(mutex);
        if (!watchSubscription) {
            std::weak_ptr<Impl> weak = shared_from_this();
            watchSubscription = storage.WatchConfig(options.configName, [weak](const std::optional<JSONValue>& doc) {
                if (auto self = weak.lock()) {
                    self->onDocumentChanged(doc);
                }
            });
            if (tokens) {
                tokens->SetTokenSink([weak](const std::string& id, const auth::OAuthTokens& t) {
                    if (auto self = weak.lock()) {
                        self->onTokens(id, t);
                    }
                });
            }
        }
        LOG_INFO("Registry: {} servers loaded", entries.size());
    }

    void dispose() {
        events::Unsubscribe watch;
        {
            std::lock_guard<std::mutex> lk(mutex);
            if (disposed) {
                return;
            }
            disposed = true;
            watch = std::move(watchSubscription);
            watchSubscription = nullptr;
        }
        if (watch) {
            watch();
        }
        if (tokens) {
            tokens->SetTokenSink(nullptr);
        }
        std::map<std::string, Entry> taken;
        {
            std::lock_guard<std::mutex> lk(mutex);
            taken.swap(entries);
        }
        std::vector<std::future<void>> stops;
        for (auto& [id, entry] : taken) {
            stops.push_back(entry.manager->Stop());
        }
        std::size_t i = 0;
        for (auto& [id, entry] : taken) {
            settle(std::move(stops[i++]), id, "stop");
            entry.subscription();
            entry.manager->Shutdown();
        }
        LOG_DEBUG("Registry: disposed");
    }
};

Registry::Registry(adapters::IProcessAdapter& processes, adapters::IStorageAdapter& storage, adapters::IEnvAdapter& env,
                   adapters::IBrowserAdapter& browser, auth::TokenManager* tokens, RegistryOptions options,
                   ClientFactory clientFactory)
    : pImpl(std::make_shared<Impl>(processes, storage, env, browser, tokens, std::move(options),
                                   std::move(clientFactory))) {}

Registry::~Registry() {
    Dispose();
}

void Registry::Initialize() {
    FUNC_SCOPE();
    pImpl->initialize();
}

void Registry::AddServer(const ServerConfig& config) {
    if (config.id.empty()) {
        throw ManagerError(ErrorCode::ConfigError, "Server id must not be empty");
    }
    std::shared_ptr<ServerManager> manager;
    {
        std::lock_guard<std::mutex> lk(pImpl->mutex);
        if (pImpl->entries.count(config.id) != 0) {
            throw ManagerError(ErrorCode::DuplicateServer, "Server already exists: " + config.id, config.id);
        }
        auto entry = pImpl->makeEntry(config);
        manager = entry.manager;
        pImpl->entries.emplace(config.id, std::move(entry));
        pImpl->configs.push_back(config);
    }
    try {
        pImpl->persist();
    } catch (const ManagerError&) {
        Impl::Entry entry;
        {
            std::lock_guard<std::mutex> lk(pImpl->mutex);
            auto it = pImpl->entries.find(config.id);
            if (it != pImpl->entries.end()) {
                entry = std::move(it->second);
                pImpl->entries.erase(it);
            }
            pImpl->configs.erase(std::remove_if(pImpl->configs.begin(), pImpl->configs.end(),
                                                [&](const ServerConfig& c) { return c.id == config.id; }),
                                 pImpl->configs.end());
        }
        if (entry.manager) {
            entry.subscription();
            entry.manager->Shutdown();
        }
        throw;
    }
    LOG_INFO("Registry: added {}", config.id);
    pImpl->emitFor(RegistryEvent::Kind::ServerAdded, manager);
}

void Registry::UpdateServer(const ServerConfig& config) {
    std::shared_ptr<ServerManager> manager;
    ServerConfig stored = config;
    bool launchChanged = false;
    {
        std::lock_guard<std::mutex> lk(pImpl->mutex);
        auto it = std::find_if(pImpl->configs.begin(), pImpl->configs.end(),
                               [&](const ServerConfig& c) { return c.id == config.id; });
        if (it == pImpl->configs.end()) {
            throw notFound(config.id);
        }
        stored.isBuiltIn = it->isBuiltIn;
        launchChanged = LaunchFieldsDiffer(*it, stored);
        *it = stored;
        manager = pImpl->entries.at(config.id).manager;
    }
    pImpl->persist();
    pImpl->applyUpdate(manager, stored, launchChanged);
}

void Registry::RemoveServer(const std::string& serverId) {
    Impl::Entry entry;
    {
        std::lock_guard<std::mutex> lk(pImpl->mutex);
        auto cfg = std::find_if(pImpl->configs.begin(), pImpl->configs.end(),
                                [&](const ServerConfig& c) { return c.id == serverId; });
        if (cfg == pImpl->configs.end()) {
            throw notFound(serverId);
        }
        if (cfg->isBuiltIn || IsBuiltInServerId(serverId)) {
            throw ManagerError(ErrorCode::BuiltInServerProtected, "Built-in server cannot be removed: " + serverId,
                               serverId);
        }
        pImpl->configs.erase(cfg);
        auto it = pImpl->entries.find(serverId);
        entry = std::move(it->second);
        pImpl->entries.erase(it);
    }
    Impl::retire(entry);
    pImpl->persist();
    LOG_INFO("Registry: removed {}", serverId);
    pImpl->emit(RegistryEvent::Kind::ServerRemoved, serverId, ServerState::Stopped, StateMetadata{});
}

std::vector<std::string> Registry::ImportServers(const std::string& text) {
    std::vector<ServerConfig> parsed = ParseImport(text);
    std::vector<std::shared_ptr<ServerManager>> added;
    std::vector<std::string> ids;
    {
        std::lock_guard<std::mutex> lk(pImpl->mutex);
        for (auto& cfg : parsed) {
            const std::string base = cfg.id;
            for (int n = 2; pImpl->entries.count(cfg.id) != 0; ++n) {
                cfg.id = base + "-" + std::to_string(n);
            }
            cfg.isBuiltIn = false;
            auto entry = pImpl->makeEntry(cfg);
            added.push_back(entry.manager);
            ids.push_back(cfg.id);
            pImpl->entries.emplace(cfg.id, std::move(entry));
            pImpl->configs.push_back(cfg);
        }
    }
    pImpl->persist();
    LOG_INFO("Registry: imported {} servers", ids.size());
    for (const auto& m : added) {
        pImpl->emitFor(RegistryEvent::Kind::ServerAdded, m);
    }
    return ids;
}

JSONValue Registry::ExportServers() const {
    std::vector<ServerConfig> list;
    {
        std::lock_guard<std::mutex> lk(pImpl->mutex);
        list = pImpl->configs;
    }
    return ::mcpm::ExportServers(list);
}

std::vector<ServerSnapshot> Registry::ListServers() const {
    std::vector<std::shared_ptr<ServerManager>> managers;
    {
        std::lock_guard<std::mutex> lk(pImpl->mutex);
        for (const auto& cfg : pImpl->configs) {
            auto it = pImpl->entries.find(cfg.id);
            if (it != pImpl->entries.end()) {
                managers.push_back(it->second.manager);
            }
        }
    }
    std::vector<ServerSnapshot> out;
    out.reserve(managers.size());
    for (const auto& m : managers) {
        out.push_back(m->Snapshot());
    }
    return out;
}

ServerSnapshot Registry::GetServer(const std::string& serverId) const {
    return pImpl->require(serverId)->Snapshot();
}

std::future<void> Registry::Start(const std::string& serverId) {
    return lifecycle(pImpl->find(serverId), serverId, &ServerManager::Start);
}

std::future<void> Registry::Stop(const std::string& serverId) {
    return lifecycle(pImpl->find(serverId), serverId, &ServerManager::Stop);
}

std::future<void> Registry::Restart(const std::string& serverId) {
    return lifecycle(pImpl->find(serverId), serverId, &ServerManager::Restart);
}

std::future<void> Registry::Authenticate(const std::string& serverId) {
    return lifecycle(pImpl->find(serverId), serverId, &ServerManager::Authenticate);
}

std::future<void> Registry::Retry(const std::string& serverId) {
    return lifecycle(pImpl->find(serverId), serverId, &ServerManager::Retry);
}

std::future<void> Registry::Reset(const std::string& serverId) {
    return lifecycle(pImpl->find(serverId), serverId, &ServerManager::Reset);
}

void Registry::StopAll() {
    std::vector<std::shared_ptr<ServerManager>> managers;
    {
        std::lock_guard<std::mutex> lk(pImpl->mutex);
        for (const auto& [id, entry] : pImpl->entries) {
            managers.push_back(entry.manager);
        }
    }
    std::vector<std::future<void>> stops;
    for (const auto& m : managers) {
        stops.push_back(m->Stop());
    }
    for (std::size_t i = 0; i < stops.size(); ++i) {
        settle(std::move(stops[i]), managers[i]->Id(), "stop");
    }
}

std::future<JSONValue> Registry::CallTool(const std::string& serverId, const std::string& name,
                                          const JSONValue& arguments) {
    auto m = pImpl->find(serverId);
    if (!m) {
        return failedFuture<JSONValue>(notFound(serverId));
    }
    return m->CallTool(name, arguments);
}

std::future<std::vector<Tool>> Registry::ListTools(const std::string& serverId) {
    auto m = pImpl->find(serverId);
    if (!m) {
        return failedFuture<std::vector<Tool>>(notFound(serverId));
    }
    return m->ListTools();
}

std::future<std::vector<Resource>> Registry::ListResources(const std::string& serverId) {
    auto m = pImpl->find(serverId);
    if (!m) {
        return failedFuture<std::vector<Resource>>(notFound(serverId));
    }
    return m->ListResources();
}

std::future<JSONValue> Registry::ReadResource(const std::string& serverId, const std::string& uri) {
    auto m = pImpl->find(serverId);
    if (!m) {
        return failedFuture<JSONValue>(notFound(serverId));
    }
    return m->ReadResource(uri);
}

std::future<std::vector<Prompt>> Registry::ListPrompts(const std::string& serverId) {
    auto m = pImpl->find(serverId);
    if (!m) {
        return failedFuture<std::vector<Prompt>>(notFound(serverId));
    }
    return m->ListPrompts();
}

std::future<JSONValue> Registry::GetPrompt(const std::string& serverId, const std::string& name,
                                           const JSONValue& arguments) {
    auto m = pImpl->find(serverId);
    if (!m) {
        return failedFuture<JSONValue>(notFound(serverId));
    }
    return m->GetPrompt(name, arguments);
}

CapabilitiesSnapshot Registry::GetCapabilities(const std::string& serverId) const {
    return pImpl->require(serverId)->GetCapabilities();
}

bool Registry::HandleOAuthCallback(const std::string& url) {
    const bool handled = pImpl->browser.DispatchUrl(url);
    if (!handled) {
        LOG_WARN("Registry: no handler for redirect scheme '{}'", adapters::UrlScheme(url));
    }
    return handled;
}

events::Unsubscribe Registry::Subscribe(Listener listener) {
    return pImpl->hub.Subscribe(std::move(listener));
}

void Registry::Dispose() {
    pImpl->dispose();
}

} // namespace mcpm
