//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Transport.h
// Purpose: JSON-RPC transport interface used by the MCP client
//==========================================================================================================

#pragma once

#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <string>

namespace mcpm {

// Forward declarations
class JSONRPCRequest;
class JSONRPCResponse;
class JSONRPCNotification;

//==========================================================================================================
// ITransport
// Purpose: One JSON-RPC session with a server.
// Notes:
//   - Request futures fail with errors::ManagerError: RequestTimeout when no response arrives in time,
//     ServerNotRunning when the transport closes or the peer goes away first.
//==========================================================================================================
class ITransport {
public:
    virtual ~ITransport() = default;

    /////////////////////////////////////////// Connection lifecycle ///////////////////////////////////////////
    //==========================================================================================================
    // Starts the transport.
    // Returns:
    //   A future that completes when the transport is ready to send.
    //==========================================================================================================
    virtual std::future<void> Start() = 0;

    //==========================================================================================================
    // Closes the transport; every pending request fails with ServerNotRunning.
    // Returns:
    //   A future that completes when the transport has closed.
    //==========================================================================================================
    virtual std::future<void> Close() = 0;

    virtual bool IsConnected() const = 0;

    // Session identifier for diagnostics.
    virtual std::string GetSessionId() const = 0;

    /////////////////////////////////////////// Message sending ///////////////////////////////////////////
    //==========================================================================================================
    // Sends a JSON-RPC request and returns a future for the response.
    // Args:
    //   request: Request to send. A null or empty string id is replaced by a generated "req-N" id.
    // Returns:
    //   Future resolving to the response (which may carry a JSON-RPC error object).
    //==========================================================================================================
    virtual std::future<std::unique_ptr<JSONRPCResponse>> SendRequest(
        std::unique_ptr<JSONRPCRequest> request) = 0;

    //==========================================================================================================
    // Sends a JSON-RPC notification (no response expected).
    // Returns:
    //   Future completing when the notification has been queued for writing.
    //==========================================================================================================
    virtual std::future<void> SendNotification(
        std::unique_ptr<JSONRPCNotification> notification) = 0;

    /////////////////////////////////////////// Handlers ///////////////////////////////////////////
    using NotificationHandler = std::function<void(std::unique_ptr<JSONRPCNotification>)>;
    virtual void SetNotificationHandler(NotificationHandler handler) = 0;

    // Server-initiated requests. The transport sends back whatever response the handler returns.
    using RequestHandler = std::function<std::unique_ptr<JSONRPCResponse>(const JSONRPCRequest&)>;
    virtual void SetRequestHandler(RequestHandler handler) = 0;

    using ErrorHandler = std::function<void(const std::string& error)>;
    virtual void SetErrorHandler(ErrorHandler handler) = 0;
};

} // namespace mcpm
