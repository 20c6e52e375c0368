//========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: JsonRpcMessageRouter.h
// Purpose: Routes line-delimited JSON-RPC messages read from a child process's stdout
//========================================================================================================

#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "mcpm/JSONRPCTypes.h"
#include "mcpm/Transport.h"

namespace mcpm {

// Callbacks for traffic the server initiates. Any member may be empty.
struct RouterHandlers {
    ITransport::RequestHandler requestHandler;
    ITransport::NotificationHandler notificationHandler;
    ITransport::ErrorHandler errorHandler;
};

// Completes the pending request whose id matches the response.
using ResponseResolver = std::function<void(JSONRPCResponse&&)>;

class IJsonRpcMessageRouter {
public:
    virtual ~IJsonRpcMessageRouter() = default;

    // Routes one line. Requests return the serialized response to write back; responses go to
    // `resolve`; notifications to the notification handler. Anything else is reported to the error
    // handler and yields std::nullopt.
    virtual std::optional<std::string> route(
        const std::string& json,
        RouterHandlers& handlers,
        const ResponseResolver& resolve) = 0;
};

std::unique_ptr<IJsonRpcMessageRouter> MakeDefaultJsonRpcMessageRouter();

} // namespace mcpm
