//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Client.cpp
// Purpose: MCP client used by a ServerManager to talk to its server process
//==========================================================================================================

#include <atomic>
#include <mutex>

#include "logging/Logger.h"
#include "mcpm/Client.h"
#include "mcpm/async/FutureAwaitable.h"
#include "mcpm/async/Task.h"
#include "mcpm/errors/Errors.h"

namespace mcpm {

using errors::ErrorCode;
using errors::ManagerError;

namespace {

using ResponseFuture = std::future<std::unique_ptr<JSONRPCResponse>>;

// Upper bound on pages followed for one listing.
constexpr int MaxListPages = 100;

std::unique_ptr<JSONRPCRequest> makeRequest(const std::string& method, std::optional<JSONValue> params = std::nullopt) {
    auto request = std::make_unique<JSONRPCRequest>();
    request->method = method;
    request->params = std::move(params);
    return request;
}

template <typename T>
std::future<T> failedFuture(const ManagerError& error) {
    std::promise<T> p;
    p.set_exception(std::make_exception_ptr(error));
    return p.get_future();
}

//==========================================================================================================
// awaitResult
// Purpose: Waits for a response and returns its result member.
// Args:
//   onError: Code used when the server answers with a JSON-RPC error.
// Notes:
//   Parameters are taken by value; the coroutine frame must not reference caller storage.
//==========================================================================================================
async::Task<JSONValue> awaitResult(ResponseFuture fut, std::string method, ErrorCode onError, std::string serverId) {
    auto response = co_await async::makeFutureAwaitable(std::move(fut));
    if (!response) {
        throw ManagerError(ErrorCode::ProcessError, "Empty response to " + method, serverId);
    }
    if (response->IsError()) {
        auto upstream = errors::mcpErrorFromResponse(*response);
        if (upstream.has_value()) {
            LOG_DEBUG("{} returned error {}: {}", method, upstream->code, upstream->message);
            throw ManagerError(onError, method + " failed: " + upstream->message, serverId, upstream);
        }
        throw ManagerError(onError, method + " failed with a malformed error object", serverId);
    }
    if (!response->result.has_value()) {
        throw ManagerError(ErrorCode::ProcessError, "Response to " + method + " has no result", serverId);
    }
    co_return std::move(*response->result);
}

template <typename Item>
async::Task<std::vector<Item>> listAll(std::shared_ptr<ITransport> transport, std::string method,
                                       std::vector<Item> (*parse)(const JSONValue&), std::string serverId) {
    std::vector<Item> items;
    std::optional<std::string> cursor;
    for (int page = 0; page < MaxListPages; ++page) {
        std::optional<JSONValue> params;
        if (cursor.has_value()) {
            params = MakeObject({{"cursor", JSONValue(*cursor)}});
        }
        auto fut = transport->SendRequest(makeRequest(method, std::move(params)));
        JSONValue result = co_await async::makeFutureAwaitable(
            awaitResult(std::move(fut), method, ErrorCode::ProcessError, serverId).toFuture());
        auto pageItems = parse(result);
        items.insert(items.end(), std::make_move_iterator(pageItems.begin()), std::make_move_iterator(pageItems.end()));
        cursor = ParseNextCursor(result);
        if (!cursor.has_value()) {
            co_return items;
        }
    }
    LOG_WARN("{}: stopped after {} pages", method, MaxListPages);
    co_return items;
}

async::Task<InitializeResult> initializeTask(std::shared_ptr<ITransport> transport, Implementation clientInfo,
                                             std::string serverId) {
    JSONValue params = MakeObject({
        {"protocolVersion", JSONValue(PROTOCOL_VERSION)},
        {"capabilities", JSONValue(JSONValue::Object{})},
        {"clientInfo", MakeObject({{"name", JSONValue(clientInfo.name)}, {"version", JSONValue(clientInfo.version)}})},
    });
    LOG_INFO("Initializing MCP session with {}", serverId);
    auto fut = transport->SendRequest(makeRequest(Methods::Initialize, std::move(params)));
    JSONValue result = co_await async::makeFutureAwaitable(
        awaitResult(std::move(fut), Methods::Initialize, ErrorCode::ProcessError, serverId).toFuture());
    if (!result.isObject()) {
        throw ManagerError(ErrorCode::ProcessError, "initialize result is not an object", serverId);
    }
    InitializeResult init = ParseInitializeResult(result);
    if (init.protocolVersion != PROTOCOL_VERSION) {
        LOG_WARN("{} negotiated protocol version '{}' (requested {})", serverId, init.protocolVersion, PROTOCOL_VERSION);
    }
    co_return init;
}

async::Task<void> connectTask(std::shared_ptr<ITransport> transport) {
    co_await async::makeFutureAwaitable(transport->Start());
}

} // namespace

class Client::Impl {
public:
    std::string serverId;
    mutable std::mutex mutex;
    std::shared_ptr<ITransport> transport;
    NotificationHandler notificationHandler;
    ErrorHandler errorHandler;

    std::shared_ptr<ITransport> current() const {
        std::lock_guard<std::mutex> lk(mutex);
        return transport;
    }

    ManagerError notConnected() const {
        return ManagerError(ErrorCode::ServerNotRunning, "Client is not connected", serverId);
    }

    void onNotification(std::unique_ptr<JSONRPCNotification> n) {
        NotificationHandler handler;
        {
            std::lock_guard<std::mutex> lk(mutex);
            handler = notificationHandler;
        }
        if (n->method == Methods::Log && n->params.has_value()) {
            LOG_DEBUG("[{}] server log: {}", serverId, SerializeJSON(*n->params));
        }
        if (handler) {
            handler(n->method, n->params.value_or(JSONValue{}));
        }
    }

    void onError(const std::string& err) {
        ErrorHandler handler;
        {
            std::lock_guard<std::mutex> lk(mutex);
            handler = errorHandler;
        }
        if (handler) {
            handler(err);
        }
    }
};

Client::Client(std::string serverId) : pImpl(std::make_shared<Impl>()) {
    FUNC_SCOPE();
    pImpl->serverId = std::move(serverId);
}

Client::~Client() {
    FUNC_SCOPE();
    auto t = pImpl->current();
    if (t) {
        t->Close().get();
    }
}

std::future<void> Client::Connect(std::unique_ptr<ITransport> transport) {
    FUNC_SCOPE();
    std::shared_ptr<ITransport> shared(std::move(transport));
    std::weak_ptr<Impl> weak = pImpl;
    shared->SetNotificationHandler([weak](std::unique_ptr<JSONRPCNotification> n) {
        if (auto self = weak.lock()) {
            self->onNotification(std::move(n));
        }
    });
    shared->SetErrorHandler([weak](const std::string& err) {
        if (auto self = weak.lock()) {
            self->onError(err);
        }
    });
    {
        std::lock_guard<std::mutex> lk(pImpl->mutex);
        pImpl->transport = shared;
    }
    return connectTask(shared).toFuture();
}

std::future<void> Client::Disconnect() {
    FUNC_SCOPE();
    std::shared_ptr<ITransport> t;
    {
        std::lock_guard<std::mutex> lk(pImpl->mutex);
        t.swap(pImpl->transport);
    }
    if (!t) {
        std::promise<void> p;
        p.set_value();
        return p.get_future();
    }
    return t->Close();
}

bool Client::IsConnected() const {
    auto t = pImpl->current();
    return t && t->IsConnected();
}

std::future<InitializeResult> Client::Initialize(const Implementation& clientInfo) {
    FUNC_SCOPE();
    auto t = pImpl->current();
    if (!t) {
        return failedFuture<InitializeResult>(pImpl->notConnected());
    }
    return initializeTask(t, clientInfo, pImpl->serverId).toFuture();
}

std::future<void> Client::SendInitialized() {
    FUNC_SCOPE();
    auto t = pImpl->current();
    if (!t) {
        return failedFuture<void>(pImpl->notConnected());
    }
    return t->SendNotification(std::make_unique<JSONRPCNotification>(Methods::Initialized));
}

std::future<std::vector<Tool>> Client::ListTools() {
    FUNC_SCOPE();
    auto t = pImpl->current();
    if (!t) {
        return failedFuture<std::vector<Tool>>(pImpl->notConnected());
    }
    return listAll<Tool>(t, Methods::ListTools, &ParseTools, pImpl->serverId).toFuture();
}

std::future<JSONValue> Client::CallTool(const std::string& name, const JSONValue& arguments) {
    FUNC_SCOPE();
    auto t = pImpl->current();
    if (!t) {
        return failedFuture<JSONValue>(pImpl->notConnected());
    }
    JSONValue args = arguments.isNull() ? JSONValue(JSONValue::Object{}) : arguments;
    LOG_DEBUG("Calling tool {} on {}", name, pImpl->serverId);
    auto fut = t->SendRequest(makeRequest(Methods::CallTool, MakeObject({{"name", JSONValue(name)}, {"arguments", args}})));
    return awaitResult(std::move(fut), Methods::CallTool, ErrorCode::ToolCallFailed, pImpl->serverId).toFuture();
}

std::future<std::vector<Resource>> Client::ListResources() {
    FUNC_SCOPE();
    auto t = pImpl->current();
    if (!t) {
        return failedFuture<std::vector<Resource>>(pImpl->notConnected());
    }
    return listAll<Resource>(t, Methods::ListResources, &ParseResources, pImpl->serverId).toFuture();
}

std::future<JSONValue> Client::ReadResource(const std::string& uri) {
    FUNC_SCOPE();
    auto t = pImpl->current();
    if (!t) {
        return failedFuture<JSONValue>(pImpl->notConnected());
    }
    auto fut = t->SendRequest(makeRequest(Methods::ReadResource, MakeObject({{"uri", JSONValue(uri)}})));
    return awaitResult(std::move(fut), Methods::ReadResource, ErrorCode::ResourceReadFailed, pImpl->serverId).toFuture();
}

std::future<std::vector<Prompt>> Client::ListPrompts() {
    FUNC_SCOPE();
    auto t = pImpl->current();
    if (!t) {
        return failedFuture<std::vector<Prompt>>(pImpl->notConnected());
    }
    return listAll<Prompt>(t, Methods::ListPrompts, &ParsePrompts, pImpl->serverId).toFuture();
}

std::future<JSONValue> Client::GetPrompt(const std::string& name, const JSONValue& arguments) {
    FUNC_SCOPE();
    auto t = pImpl->current();
    if (!t) {
        return failedFuture<JSONValue>(pImpl->notConnected());
    }
    JSONValue params = MakeObject({{"name", JSONValue(name)}});
    if (!arguments.isNull()) {
        SetMember(params, "arguments", arguments);
    }
    auto fut = t->SendRequest(makeRequest(Methods::GetPrompt, std::move(params)));
    return awaitResult(std::move(fut), Methods::GetPrompt, ErrorCode::PromptGetFailed, pImpl->serverId).toFuture();
}

void Client::SetNotificationHandler(NotificationHandler handler) {
    std::lock_guard<std::mutex> lk(pImpl->mutex);
    pImpl->notificationHandler = std::move(handler);
}

void Client::SetErrorHandler(ErrorHandler handler) {
    std::lock_guard<std::mutex> lk(pImpl->mutex);
    pImpl->errorHandler = std::move(handler);
}

} // namespace mcpm
