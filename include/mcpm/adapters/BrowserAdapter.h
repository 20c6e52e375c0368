//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: BrowserAdapter.h
// Purpose: External browser launch and custom-scheme redirect delivery for OAuth flows
//==========================================================================================================

#pragma once

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "mcpm/events/EventHub.h"

namespace mcpm {
namespace adapters {

//==========================================================================================================
// IBrowserAdapter
// Purpose: Opens URLs for the user and routes redirect URLs (e.g. mcp-app://oauth/callback?...) back to
//          whoever registered for their scheme.
//==========================================================================================================
class IBrowserAdapter {
public:
    using UrlHandler = std::function<void(const std::string& url)>;

    virtual ~IBrowserAdapter() = default;

    // Throws errors::ManagerError(ProcessError) when the opener cannot be launched.
    virtual void Open(const std::string& url) = 0;

    //==========================================================================================================
    // RegisterProtocolHandler
    // Purpose: Adds a handler for URLs of `scheme` (case-insensitive). Every handler of a scheme receives
    //          each dispatched URL. The scheme slot is released when its last handler unsubscribes.
    //==========================================================================================================
    virtual events::Unsubscribe RegisterProtocolHandler(const std::string& scheme, UrlHandler handler) = 0;

    // Delivers an incoming URL to its scheme's handlers; false when nobody listens.
    virtual bool DispatchUrl(const std::string& url) = 0;

    virtual bool HasHandler(const std::string& scheme) const = 0;
};

// Lower-cased scheme of `url` ("" when there is none).
std::string UrlScheme(const std::string& url);

//==========================================================================================================
// ProtocolHandlerRegistry
// Purpose: Scheme -> handlers fan-out shared by the host and in-memory browser adapters.
//==========================================================================================================
class ProtocolHandlerRegistry : public IBrowserAdapter {
public:
    ProtocolHandlerRegistry();

    events::Unsubscribe RegisterProtocolHandler(const std::string& scheme, UrlHandler handler) override;
    bool DispatchUrl(const std::string& url) override;
    bool HasHandler(const std::string& scheme) const override;

private:
    using Hub = events::EventHub<std::string>;
    struct Slots {
        mutable std::mutex mutex;
        std::map<std::string, std::shared_ptr<Hub>> byScheme;
    };
    std::shared_ptr<Slots> slots;
};

//==========================================================================================================
// HostBrowserAdapter
// Purpose: Launches the opener (MCPM_BROWSER, default xdg-open) as a detached child.
//==========================================================================================================
class HostBrowserAdapter : public ProtocolHandlerRegistry {
public:
    HostBrowserAdapter();
    explicit HostBrowserAdapter(std::string opener);

    void Open(const std::string& url) override;

private:
    std::string opener;
};

//==========================================================================================================
// InMemoryBrowserAdapter
// Purpose: Records opened URLs; an optional hook plays the part of the user and the provider.
//==========================================================================================================
class InMemoryBrowserAdapter : public ProtocolHandlerRegistry {
public:
    void Open(const std::string& url) override;

    // Called on the opening thread with each URL passed to Open().
    void SetOnOpen(UrlHandler hook);
    std::vector<std::string> OpenedUrls() const;
    // Next Open() throws ProcessError.
    void FailNextOpen();

private:
    mutable std::mutex mutex;
    std::vector<std::string> opened;
    UrlHandler onOpen;
    bool failNext{false};
};

} // namespace adapters
} // namespace mcpm
