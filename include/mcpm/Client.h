//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Client.h
// Purpose: MCP client used by a ServerManager to talk to its server process
//==========================================================================================================

#pragma once

#include <functional>
#include <future>
#include <memory>
#include <string>
#include <vector>

#include "mcpm/JSONRPCTypes.h"
#include "mcpm/Protocol.h"
#include "mcpm/Transport.h"

namespace mcpm {

//==========================================================================================================
// IClient
// Purpose: Typed MCP calls over an ITransport.
// Notes:
//   - Futures fail with errors::ManagerError. A JSON-RPC error from the server is attached as
//     upstream(); tools/call maps to ToolCallFailed, resources/read to ResourceReadFailed,
//     prompts/get to PromptGetFailed and everything else to ProcessError.
//   - Transport failures (RequestTimeout, ServerNotRunning) pass through unchanged.
//==========================================================================================================
class IClient {
public:
    using NotificationHandler = std::function<void(const std::string& method, const JSONValue& params)>;
    using ErrorHandler = std::function<void(const std::string& error)>;

    virtual ~IClient() = default;

    //==========================================================================================================
    // Connect
    // Purpose: Takes ownership of the transport, installs handlers and starts it.
    //==========================================================================================================
    virtual std::future<void> Connect(std::unique_ptr<ITransport> transport) = 0;
    virtual std::future<void> Disconnect() = 0;
    virtual bool IsConnected() const = 0;

    //==========================================================================================================
    // Initialize
    // Purpose: Sends "initialize" with the client info and protocol version 2025-11-25.
    //==========================================================================================================
    virtual std::future<InitializeResult> Initialize(const Implementation& clientInfo) = 0;
    // Sends "notifications/initialized".
    virtual std::future<void> SendInitialized() = 0;

    // Follows nextCursor until the listing is complete.
    virtual std::future<std::vector<Tool>> ListTools() = 0;
    // Returns the raw tools/call result object ({content, isError?, ...}).
    virtual std::future<JSONValue> CallTool(const std::string& name, const JSONValue& arguments) = 0;

    virtual std::future<std::vector<Resource>> ListResources() = 0;
    virtual std::future<JSONValue> ReadResource(const std::string& uri) = 0;

    virtual std::future<std::vector<Prompt>> ListPrompts() = 0;
    virtual std::future<JSONValue> GetPrompt(const std::string& name, const JSONValue& arguments) = 0;

    virtual void SetNotificationHandler(NotificationHandler handler) = 0;
    virtual void SetErrorHandler(ErrorHandler handler) = 0;
};

class Client : public IClient {
public:
    // `serverId` tags errors raised by this client.
    explicit Client(std::string serverId = std::string());
    ~Client() override;

    std::future<void> Connect(std::unique_ptr<ITransport> transport) override;
    std::future<void> Disconnect() override;
    bool IsConnected() const override;

    std::future<InitializeResult> Initialize(const Implementation& clientInfo) override;
    std::future<void> SendInitialized() override;

    std::future<std::vector<Tool>> ListTools() override;
    std::future<JSONValue> CallTool(const std::string& name, const JSONValue& arguments) override;
    std::future<std::vector<Resource>> ListResources() override;
    std::future<JSONValue> ReadResource(const std::string& uri) override;
    std::future<std::vector<Prompt>> ListPrompts() override;
    std::future<JSONValue> GetPrompt(const std::string& name, const JSONValue& arguments) override;

    void SetNotificationHandler(NotificationHandler handler) override;
    void SetErrorHandler(ErrorHandler handler) override;

private:
    class Impl;
    std::shared_ptr<Impl> pImpl;
};

} // namespace mcpm
