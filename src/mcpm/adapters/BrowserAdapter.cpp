//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: BrowserAdapter.cpp
// Purpose: External browser launch and custom-scheme redirect delivery for OAuth flows
//==========================================================================================================

#include <spawn.h>
#include <sys/wait.h>

#include <cctype>
#include <cerrno>
#include <cstring>
#include <thread>

#include "env/EnvVars.h"
#include "logging/Logger.h"
#include "mcpm/adapters/BrowserAdapter.h"
#include "mcpm/errors/Errors.h"

extern char** environ;

namespace mcpm {
namespace adapters {

namespace {
std::string lower(std::string s) {
    for (auto& c : s) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return s;
}
} // namespace

std::string UrlScheme(const std::string& url) {
    auto colon = url.find(':');
    if (colon == std::string::npos || colon == 0) {
        return std::string();
    }
    for (std::size_t i = 0; i < colon; ++i) {
        unsigned char c = static_cast<unsigned char>(url[i]);
        if (!(std::isalnum(c) || c == '+' || c == '-' || c == '.')) {
            return std::string();
        }
    }
    return lower(url.substr(0, colon));
}

////////////////////////////////////////// ProtocolHandlerRegistry //////////////////////////////////////////

ProtocolHandlerRegistry::ProtocolHandlerRegistry() : slots(std::make_shared<Slots>()) {}

events::Unsubscribe ProtocolHandlerRegistry::RegisterProtocolHandler(const std::string& scheme, UrlHandler handler) {
    const std::string key = lower(scheme);
    std::shared_ptr<Hub> hub;
    {
        std::lock_guard<std::mutex> lk(slots->mutex);
        auto& slot = slots->byScheme[key];
        if (!slot) {
            slot = std::make_shared<Hub>();
            LOG_DEBUG("Protocol handler slot opened for scheme {}", key);
        }
        hub = slot;
    }
    auto inner = hub->Subscribe(std::move(handler));
    std::weak_ptr<Slots> weakSlots = slots;
    std::weak_ptr<Hub> weakHub = hub;
    return [inner, weakSlots, weakHub, key]() {
        inner();
        auto s = weakSlots.lock();
        auto h = weakHub.lock();
        if (!s || !h) {
            return;
        }
        std::lock_guard<std::mutex> lk(s->mutex);
        auto it = s->byScheme.find(key);
        if (it != s->byScheme.end() && it->second == h && h->Size() == 0) {
            s->byScheme.erase(it);
            LOG_DEBUG("Protocol handler slot released for scheme {}", key);
        }
    };
}

bool ProtocolHandlerRegistry::DispatchUrl(const std::string& url) {
    const std::string scheme = UrlScheme(url);
    std::shared_ptr<Hub> hub;
    {
        std::lock_guard<std::mutex> lk(slots->mutex);
        auto it = slots->byScheme.find(scheme);
        if (it == slots->byScheme.end() || it->second->Size() == 0) {
            LOG_WARN("No protocol handler for scheme '{}'", scheme);
            return false;
        }
        hub = it->second;
    }
    hub->Emit(url);
    return true;
}

bool ProtocolHandlerRegistry::HasHandler(const std::string& scheme) const {
    std::lock_guard<std::mutex> lk(slots->mutex);
    auto it = slots->byScheme.find(lower(scheme));
    return it != slots->byScheme.end() && it->second->Size() > 0;
}

////////////////////////////////////////// HostBrowserAdapter //////////////////////////////////////////

HostBrowserAdapter::HostBrowserAdapter() : opener(GetEnvOrDefault("MCPM_BROWSER", "xdg-open")) {}

HostBrowserAdapter::HostBrowserAdapter(std::string o) : opener(std::move(o)) {}

void HostBrowserAdapter::Open(const std::string& url) {
    FUNC_SCOPE();
    std::vector<char*> argv;
    argv.push_back(const_cast<char*>(opener.c_str()));
    argv.push_back(const_cast<char*>(url.c_str()));
    argv.push_back(nullptr);

    pid_t pid = -1;
    int rc = ::posix_spawnp(&pid, opener.c_str(), nullptr, nullptr, argv.data(), environ);
    if (rc != 0) {
        LOG_ERROR("Failed to launch browser opener {}: {}", opener, ::strerror(rc));
        throw errors::ManagerError(errors::ErrorCode::ProcessError,
                                   "Cannot launch " + opener + ": " + ::strerror(rc));
    }
    LOG_INFO("Opened browser via {} (pid={})", opener, pid);
    // Reap the opener so it does not linger as a zombie.
    std::thread([pid]() {
        int status = 0;
        while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
        }
    }).detach();
}

////////////////////////////////////////// InMemoryBrowserAdapter //////////////////////////////////////////

void InMemoryBrowserAdapter::Open(const std::string& url) {
    UrlHandler hook;
    {
        std::lock_guard<std::mutex> lk(mutex);
        if (failNext) {
            failNext = false;
            throw errors::ManagerError(errors::ErrorCode::ProcessError, "Browser unavailable");
        }
        opened.push_back(url);
        hook = onOpen;
    }
    if (hook) {
        hook(url);
    }
}

void InMemoryBrowserAdapter::SetOnOpen(UrlHandler hook) {
    std::lock_guard<std::mutex> lk(mutex);
    onOpen = std::move(hook);
}

std::vector<std::string> InMemoryBrowserAdapter::OpenedUrls() const {
    std::lock_guard<std::mutex> lk(mutex);
    return opened;
}

void InMemoryBrowserAdapter::FailNextOpen() {
    std::lock_guard<std::mutex> lk(mutex);
    failNext = true;
}

} // namespace adapters
} // namespace mcpm
