//========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: JsonRpcMessageRouter.cpp
// Purpose: Line router used by ProcessTransport
//========================================================================================================

#include <exception>
#include <optional>
#include <string>

#include "logging/Logger.h"
#include "mcpm/JSONRPCTypes.h"
#include "mcpm/JsonRpcMessageRouter.h"

namespace mcpm {

namespace {

enum class MessageKind { Request, Response, Notification, Unknown };

MessageKind kindOf(const JSONValue& message) {
    if (!message.isObject()) {
        return MessageKind::Unknown;
    }
    const bool hasMethod = GetStringMember(message, "method").has_value();
    const bool hasId = FindMember(message, "id") != nullptr;
    if (hasMethod) {
        return hasId ? MessageKind::Request : MessageKind::Notification;
    }
    if (hasId && (FindMember(message, "result") || FindMember(message, "error"))) {
        return MessageKind::Response;
    }
    return MessageKind::Unknown;
}

class JsonRpcMessageRouter : public IJsonRpcMessageRouter {
public:
    std::optional<std::string> route(
        const std::string& json,
        RouterHandlers& handlers,
        const ResponseResolver& resolve) override {
        JSONValue message;
        try {
            message = ParseJSON(json);
        } catch (const std::exception& e) {
            LOG_WARN("Router: unparseable line ({}): {}", e.what(), json);
            if (handlers.errorHandler) {
                handlers.errorHandler(std::string("Router: unparseable message: ") + e.what());
            }
            return std::nullopt;
        }

        switch (kindOf(message)) {
            case MessageKind::Response: {
                JSONRPCResponse response;
                if (response.FromValue(message)) {
                    resolve(std::move(response));
                    return std::nullopt;
                }
                break;
            }
            case MessageKind::Request: {
                JSONRPCRequest request;
                if (!request.FromValue(message)) {
                    break;
                }
                std::unique_ptr<JSONRPCResponse> resp;
                if (handlers.requestHandler) {
                    try {
                        resp = handlers.requestHandler(request);
                        if (!resp) {
                            resp = CreateErrorResponse(request.id, JSONRPCErrorCodes::InternalError, "Null response from handler");
                        }
                    } catch (const std::exception& e) {
                        LOG_ERROR("Request handler exception: {}", e.what());
                        resp = CreateErrorResponse(request.id, JSONRPCErrorCodes::InternalError, e.what());
                    }
                } else {
                    resp = CreateErrorResponse(request.id, JSONRPCErrorCodes::MethodNotFound, "Method not found: " + request.method);
                }
                resp->id = request.id;
                return resp->Serialize();
            }
            case MessageKind::Notification: {
                JSONRPCNotification notification;
                if (notification.FromValue(message)) {
                    if (handlers.notificationHandler) {
                        handlers.notificationHandler(std::make_unique<JSONRPCNotification>(std::move(notification)));
                    }
                    return std::nullopt;
                }
                break;
            }
            case MessageKind::Unknown:
                break;
        }

        LOG_WARN("Router: unrecognized JSON-RPC message: {}", json);
        if (handlers.errorHandler) {
            handlers.errorHandler("Router: unrecognized JSON-RPC message");
        }
        return std::nullopt;
    }
};
} // namespace

std::unique_ptr<IJsonRpcMessageRouter> MakeDefaultJsonRpcMessageRouter() {
    return std::make_unique<JsonRpcMessageRouter>();
}

} // namespace mcpm
