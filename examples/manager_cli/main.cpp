//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: main.cpp
// Purpose: mcpm_cli host program: list, start, call and authorize configured MCP servers
//==========================================================================================================

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

#include <chrono>
#include <csignal>
#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <thread>

#include "logging/Logger.h"
#include "mcpm/Registry.h"
#include "mcpm/Settings.h"
#include "mcpm/Supervisor.h"
#include "mcpm/adapters/HostProcessAdapter.hpp"
#include "mcpm/adapters/HostStorageAdapter.hpp"
#include "mcpm/auth/Discovery.hpp"
#include "mcpm/auth/OAuthClient.hpp"
#include "mcpm/auth/TokenManager.hpp"
#include "mcpm/version.h"

using namespace mcpm;

namespace {

void printUsage() {
    std::cerr << "mcpm_cli " << getVersionString() << "\n"
              << "usage:\n"
              << "  mcpm_cli list\n"
              << "  mcpm_cli start <id>               run until Ctrl-C, restarting on crash\n"
              << "  mcpm_cli tools <id>\n"
              << "  mcpm_cli call <id> <tool> [json]\n"
              << "  mcpm_cli import <file>\n"
              << "  mcpm_cli export\n"
              << "  mcpm_cli remove <id>\n"
              << "  mcpm_cli auth <id>                then paste the redirect URL\n"
              << "  mcpm_cli discover <id> <issuer>   fill OAuth endpoints from issuer metadata\n";
}

void printEvent(const RegistryEvent& ev) {
    std::cout << "[" << ev.serverId << "] " << ToString(ev.kind) << " " << ToString(ev.state);
    if (ev.event.has_value() && ev.event->transition.has_value()) {
        std::cout << " (" << ev.event->transition->event << " from " << ToString(ev.event->transition->from) << ")";
    }
    if (ev.metadata.userMessage.has_value()) {
        std::cout << ": " << *ev.metadata.userMessage;
    }
    if (ev.metadata.errorMessage.has_value()) {
        std::cout << " [" << ev.metadata.errorCode.value_or("") << " " << *ev.metadata.errorMessage << "]";
    }
    std::cout << std::endl;
}

// Blocks until SIGINT or SIGTERM.
void waitForSignal() {
    boost::asio::io_context io;
    boost::asio::signal_set signals(io, SIGINT, SIGTERM);
    signals.async_wait([](const boost::system::error_code&, int signo) {
        LOG_INFO("mcpm_cli: received signal {}", signo);
    });
    io.run();
}

// Waits for a server to leave the transient start and auth states.
ServerState waitUntilSettled(Registry& registry, const std::string& id, std::chrono::milliseconds limit) {
    auto deadline = std::chrono::steady_clock::now() + limit;
    for (;;) {
        ServerState s = registry.GetServer(id).state;
        if (!IsActive(s) || s == ServerState::Running || std::chrono::steady_clock::now() >= deadline) {
            return s;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
}

int cmdList(Registry& registry) {
    auto servers = registry.ListServers();
    if (servers.empty()) {
        std::cout << "No servers configured." << std::endl;
        return 0;
    }
    for (const auto& s : servers) {
        std::cout << s.config.id << "\t" << (s.config.enabled ? "enabled " : "disabled") << "\t"
                  << ToString(s.config.category) << "\t" << s.config.command;
        for (const auto& a : s.config.args) {
            std::cout << " " << a;
        }
        if (s.config.isBuiltIn) {
            std::cout << "\t(built-in)";
        }
        std::cout << std::endl;
    }
    return 0;
}

void printSupervisorEvent(const SupervisorEvent& ev) {
    std::cout << "[" << ev.serverId << "] " << ToString(ev.kind);
    if (ev.kind == SupervisorEvent::Kind::RestartScheduled) {
        std::cout << " attempt " << ev.attempt << " in " << ev.delay.count() << " ms";
    } else if (ev.kind == SupervisorEvent::Kind::RestartSucceeded) {
        std::cout << " (restart count " << ev.restartCount << ")";
    }
    if (!ev.message.empty()) {
        std::cout << ": " << ev.message;
    }
    std::cout << std::endl;
}

int cmdStart(Registry& registry, const Settings& settings, const std::string& id) {
    auto off = registry.Subscribe(printEvent);
    registry.Start(id).get();
    auto caps = registry.GetCapabilities(id);
    std::cout << id << " is running: " << caps.serverInfo.name << " " << caps.serverInfo.version << ", "
              << caps.tools.size() << " tools. Press Ctrl-C to stop." << std::endl;
    Supervisor supervisor(registry, SupervisorOptions::FromSettings(settings));
    auto offSupervisor = supervisor.Subscribe(printSupervisorEvent);
    supervisor.Supervise(id);
    waitForSignal();
    offSupervisor();
    supervisor.Dispose();
    registry.Stop(id).get();
    off();
    return 0;
}

int cmdTools(Registry& registry, const std::string& id) {
    registry.Start(id).get();
    auto tools = registry.ListTools(id).get();
    for (const auto& t : tools) {
        std::cout << t.name << "\t" << t.description << std::endl;
    }
    registry.Stop(id).get();
    return 0;
}

int cmdCall(Registry& registry, const std::string& id, const std::string& tool, const std::string& argsJson) {
    JSONValue args = argsJson.empty() ? JSONValue(JSONValue::Object{}) : ParseJSON(argsJson);
    registry.Start(id).get();
    JSONValue result = registry.CallTool(id, tool, args).get();
    std::cout << SerializeJSON(result) << std::endl;
    registry.Stop(id).get();
    return 0;
}

int cmdImport(Registry& registry, const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        std::cerr << "Cannot read " << path << std::endl;
        return 1;
    }
    std::stringstream ss;
    ss << in.rdbuf();
    auto ids = registry.ImportServers(ss.str());
    for (const auto& id : ids) {
        std::cout << "imported " << id << std::endl;
    }
    return 0;
}

int cmdAuth(Registry& registry, const std::string& id) {
    auto off = registry.Subscribe(printEvent);
    registry.Authenticate(id).get();
    auto snap = registry.GetServer(id);
    if (snap.metadata.authUrl.has_value()) {
        std::cout << "If no browser opened, visit:\n  " << *snap.metadata.authUrl << std::endl;
    }
    std::cout << "Paste the redirect URL: " << std::flush;
    std::string url;
    if (!std::getline(std::cin, url) || url.empty()) {
        std::cerr << "No redirect URL given" << std::endl;
        off();
        return 1;
    }
    if (!registry.HandleOAuthCallback(url)) {
        std::cerr << "The URL does not match a pending authorization" << std::endl;
        off();
        return 1;
    }
    ServerState s = waitUntilSettled(registry, id, std::chrono::minutes(2));
    off();
    registry.Stop(id).get();
    return s == ServerState::Running ? 0 : 1;
}

int cmdDiscover(Registry& registry, auth::ITokenEndpoint& endpoint, const std::string& id, const std::string& issuer,
                const std::string& redirectUri) {
    ServerConfig cfg = registry.GetServer(id).config;
    auth::ClientMetadata client;
    client.clientName = "mcpm " + getVersionString();
    client.redirectUris = {redirectUri};
    cfg.oauthConfig = auth::DiscoverOAuthConfig(endpoint, issuer, cfg.oauthConfig.value_or(OAuthConfig()), client);
    cfg.requiresAuth = true;
    cfg.authType = AuthType::OAuth;
    registry.UpdateServer(cfg);
    std::cout << SerializeJSON(OAuthConfigToJSON(*cfg.oauthConfig)) << std::endl;
    if (cfg.oauthConfig->clientId.empty()) {
        std::cerr << "No client id: register a client with the provider and set oauthConfig.clientId" << std::endl;
        return 1;
    }
    return 0;
}

} // namespace

int main(int argc, char** argv) {
    FUNC_SCOPE();
    Logger::setLogLevel(LogLevel::LOG_WARN_LEVEL);
    Logger::configureFromEnvironment();
    std::signal(SIGPIPE, SIG_IGN);

    if (argc < 2) {
        printUsage();
        return 2;
    }
    const std::string command = argv[1];
    auto arg = [&](int i) -> std::optional<std::string> {
        return i < argc ? std::optional<std::string>(argv[i]) : std::nullopt;
    };

    const Settings settings = Settings::FromEnvironment();
    LOG_INFO("mcpm_cli: config directory {}", settings.configDir);

    adapters::HostProcessAdapter processes(std::chrono::milliseconds(settings.shutdownGraceMs));
    adapters::HostStorageAdapter storage(settings.configDir);
    adapters::HostEnvAdapter env;
    adapters::HostBrowserAdapter browser;
    auth::TokenManagerOptions tokenOptions;
    tokenOptions.redirectScheme = settings.oauthScheme;
    tokenOptions.sessionTtlMs = static_cast<int64_t>(settings.oauthSessionTtlMs);
    auto endpoint = std::make_shared<auth::HttpTokenEndpoint>();
    auth::TokenManager tokens(storage, browser, endpoint, tokenOptions);
    Registry registry(processes, storage, env, browser, &tokens, RegistryOptions::FromSettings(settings));

    try {
        registry.Initialize();
        if (command == "list") {
            return cmdList(registry);
        }
        if (command == "export") {
            std::cout << SerializeJSON(registry.ExportServers()) << std::endl;
            return 0;
        }
        if (command == "import" && arg(2)) {
            return cmdImport(registry, *arg(2));
        }
        if (command == "remove" && arg(2)) {
            registry.RemoveServer(*arg(2));
            std::cout << "removed " << *arg(2) << std::endl;
            return 0;
        }
        if (command == "start" && arg(2)) {
            return cmdStart(registry, settings, *arg(2));
        }
        if (command == "tools" && arg(2)) {
            return cmdTools(registry, *arg(2));
        }
        if (command == "call" && arg(2) && arg(3)) {
            return cmdCall(registry, *arg(2), *arg(3), arg(4).value_or(""));
        }
        if (command == "auth" && arg(2)) {
            return cmdAuth(registry, *arg(2));
        }
        if (command == "discover" && arg(2) && arg(3)) {
            return cmdDiscover(registry, *endpoint, *arg(2), *arg(3), settings.oauthScheme + "://oauth/callback");
        }
    } catch (const errors::ManagerError& e) {
        std::cerr << "error " << e.codeString() << ": " << e.what() << std::endl;
        if (!e.serverId().empty()) {
            try {
                auto snap = registry.GetServer(e.serverId());
                if (snap.metadata.userMessage.has_value()) {
                    std::cerr << *snap.metadata.userMessage << std::endl;
                }
            } catch (const errors::ManagerError&) {
                // server was removed or never existed
            }
        }
        registry.Dispose();
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "error: " << e.what() << std::endl;
        registry.Dispose();
        return 1;
    }
    printUsage();
    return 2;
}
