//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ProcessTransport.cpp
// Purpose: Line-delimited JSON-RPC transport over a child process handle
//==========================================================================================================

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <future>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

#include "env/EnvVars.h"
#include "logging/Logger.h"
#include "mcpm/JSONRPCTypes.h"
#include "mcpm/JsonRpcMessageRouter.h"
#include "mcpm/ProcessTransport.hpp"
#include "mcpm/errors/Errors.h"

namespace mcpm {

using errors::ErrorCode;
using errors::ManagerError;

class ProcessTransport::Impl : public std::enable_shared_from_this<ProcessTransport::Impl> {
public:
    using ResponsePromise = std::promise<std::unique_ptr<JSONRPCResponse>>;

    std::shared_ptr<adapters::IProcess> process;
    std::string serverId;
    std::string sessionId;
    std::atomic<bool> connected{false};
    std::unique_ptr<IJsonRpcMessageRouter> router;

    std::mutex handlersMutex;
    ITransport::NotificationHandler notificationHandler;
    ITransport::RequestHandler requestHandler;
    ITransport::ErrorHandler errorHandler;

    mutable std::mutex requestMutex;
    std::unordered_map<std::string, ResponsePromise> pendingRequests;
    std::unordered_map<std::string, std::chrono::steady_clock::time_point> requestDeadlines;
    std::atomic<unsigned int> requestCounter{0u};
    std::chrono::milliseconds requestTimeout{30000};

    std::mutex timeoutMutex;
    std::condition_variable timeoutCv;
    bool timeoutRunning{false};
    std::thread timeoutThread;

    events::Unsubscribe unsubscribeMessages;
    events::Unsubscribe unsubscribeExit;

    explicit Impl(std::shared_ptr<adapters::IProcess> p)
        : process(std::move(p)), router(MakeDefaultJsonRpcMessageRouter()) {
        serverId = process->Id();
        sessionId = "proc-" + serverId + "-" + std::to_string(process->Pid());
        bool malformed = false;
        uint64_t ms = GetEnvUInt64OrDefault("MCPM_REQUEST_TIMEOUT_MS", 30000, &malformed);
        if (malformed) {
            LOG_WARN("ProcessTransport: ignoring malformed MCPM_REQUEST_TIMEOUT_MS");
        }
        setTimeout(ms);
    }

    void setTimeout(uint64_t ms) {
        std::lock_guard<std::mutex> lk(requestMutex);
        requestTimeout = (ms == 0) ? std::chrono::milliseconds::max() : std::chrono::milliseconds(ms);
    }

    std::string generateRequestId() { return "req-" + std::to_string(++requestCounter); }

    void reportError(const std::string& message) {
        ITransport::ErrorHandler handler;
        {
            std::lock_guard<std::mutex> lk(handlersMutex);
            handler = errorHandler;
        }
        if (handler) {
            handler(message);
        }
    }

    void failAll(ErrorCode code, const std::string& message) {
        std::unordered_map<std::string, ResponsePromise> drained;
        {
            std::lock_guard<std::mutex> lk(requestMutex);
            drained.swap(pendingRequests);
            requestDeadlines.clear();
        }
        for (auto& [id, prom] : drained) {
            prom.set_exception(std::make_exception_ptr(ManagerError(code, message, serverId)));
        }
        if (!drained.empty()) {
            LOG_DEBUG("ProcessTransport[{}]: failed {} pending request(s): {}", serverId, drained.size(), message);
        }
    }

    static std::unique_ptr<JSONRPCResponse> defaultRequestHandler(const JSONRPCRequest& request) {
        if (request.method == "ping") {
            return std::make_unique<JSONRPCResponse>(request.id, JSONValue(JSONValue::Object{}));
        }
        return CreateErrorResponse(request.id, JSONRPCErrorCodes::MethodNotFound, "Method not found: " + request.method);
    }

    void handleResponse(JSONRPCResponse&& response) {
        const std::string idStr = JSONRPCIdToString(response.id);
        ResponsePromise prom;
        {
            std::lock_guard<std::mutex> lock(requestMutex);
            requestDeadlines.erase(idStr);
            auto it = pendingRequests.find(idStr);
            if (it == pendingRequests.end()) {
                LOG_WARN("ProcessTransport[{}]: response for unknown request id '{}'", serverId, idStr);
                return;
            }
            prom = std::move(it->second);
            pendingRequests.erase(it);
        }
        prom.set_value(std::make_unique<JSONRPCResponse>(std::move(response)));
    }

    void onLine(const std::string& line) {
        if (line.empty()) {
            return;
        }
        LOG_DEBUG("ProcessTransport[{}] <- {}", serverId, line);
        RouterHandlers handlers;
        {
            std::lock_guard<std::mutex> lk(handlersMutex);
            handlers.requestHandler = requestHandler ? requestHandler : ITransport::RequestHandler(&Impl::defaultRequestHandler);
            handlers.notificationHandler = notificationHandler;
            handlers.errorHandler = errorHandler;
        }
        auto reply = router->route(line, handlers, [this](JSONRPCResponse&& r) { handleResponse(std::move(r)); });
        if (reply.has_value() && !process->Send(*reply)) {
            LOG_WARN("ProcessTransport[{}]: could not write reply to server request", serverId);
        }
    }

    void onExit(const adapters::ProcessExit& exit) {
        connected = false;
        std::string detail = exit.exitCode ? ("code " + std::to_string(*exit.exitCode))
                           : exit.signal ? ("signal " + std::to_string(*exit.signal))
                           : std::string("unknown status");
        failAll(ErrorCode::ServerNotRunning, "Server process exited (" + detail + ")");
        reportError("ProcessTransport: server process exited (" + detail + ")");
        stopTimeouts(false);
    }

    void startTimeouts() {
        {
            std::lock_guard<std::mutex> lk(timeoutMutex);
            timeoutRunning = true;
        }
        timeoutThread = std::thread([this]() {
            using clock = std::chrono::steady_clock;
            std::unique_lock<std::mutex> lk(timeoutMutex);
            while (timeoutRunning) {
                timeoutCv.wait_for(lk, std::chrono::milliseconds(50));
                if (!timeoutRunning) {
                    break;
                }
                lk.unlock();
                expire(clock::now());
                lk.lock();
            }
        });
    }

    void expire(std::chrono::steady_clock::time_point now) {
        std::vector<std::pair<std::string, ResponsePromise>> expired;
        {
            std::lock_guard<std::mutex> lock(requestMutex);
            for (auto it = requestDeadlines.begin(); it != requestDeadlines.end();) {
                if (it->second <= now) {
                    auto p = pendingRequests.find(it->first);
                    if (p != pendingRequests.end()) {
                        expired.emplace_back(it->first, std::move(p->second));
                        pendingRequests.erase(p);
                    }
                    it = requestDeadlines.erase(it);
                } else {
                    ++it;
                }
            }
        }
        for (auto& [id, prom] : expired) {
            LOG_WARN("ProcessTransport[{}]: request {} timed out", serverId, id);
            prom.set_exception(std::make_exception_ptr(
                ManagerError(ErrorCode::RequestTimeout, "Request " + id + " timed out", serverId)));
        }
    }

    void stopTimeouts(bool join) {
        {
            std::lock_guard<std::mutex> lk(timeoutMutex);
            timeoutRunning = false;
        }
        timeoutCv.notify_all();
        if (join && timeoutThread.joinable() && timeoutThread.get_id() != std::this_thread::get_id()) {
            timeoutThread.join();
        }
    }
};

ProcessTransport::ProcessTransport(std::shared_ptr<adapters::IProcess> process)
    : pImpl(std::make_shared<Impl>(std::move(process))) {
    FUNC_SCOPE();
}

ProcessTransport::~ProcessTransport() {
    FUNC_SCOPE();
    Close();
}

std::future<void> ProcessTransport::Start() {
    FUNC_SCOPE();
    std::promise<void> promise;
    auto fut = promise.get_future();
    if (pImpl->connected.load() || pImpl->timeoutThread.joinable()) {
        promise.set_value();
        return fut;
    }
    if (!pImpl->process->IsRunning()) {
        promise.set_exception(std::make_exception_ptr(
            ManagerError(ErrorCode::ServerNotRunning, "Server process is not running", pImpl->serverId)));
        return fut;
    }
    LOG_INFO("Starting ProcessTransport for {}", pImpl->serverId);
    std::weak_ptr<Impl> weak = pImpl;
    pImpl->connected = true;
    pImpl->startTimeouts();
    pImpl->unsubscribeMessages = pImpl->process->OnMessage([weak](const std::string& line) {
        if (auto self = weak.lock()) {
            self->onLine(line);
        }
    });
    pImpl->unsubscribeExit = pImpl->process->OnExit([weak](const adapters::ProcessExit& exit) {
        if (auto self = weak.lock()) {
            self->onExit(exit);
        }
    });
    promise.set_value();
    return fut;
}

std::future<void> ProcessTransport::Close() {
    FUNC_SCOPE();
    const bool wasConnected = pImpl->connected.exchange(false);
    if (pImpl->unsubscribeMessages) {
        pImpl->unsubscribeMessages();
        pImpl->unsubscribeMessages = nullptr;
    }
    if (pImpl->unsubscribeExit) {
        pImpl->unsubscribeExit();
        pImpl->unsubscribeExit = nullptr;
    }
    pImpl->stopTimeouts(true);
    pImpl->failAll(ErrorCode::ServerNotRunning, "Transport closed");
    if (wasConnected) {
        LOG_INFO("Closed ProcessTransport for {}", pImpl->serverId);
    }
    std::promise<void> promise;
    promise.set_value();
    return promise.get_future();
}

bool ProcessTransport::IsConnected() const { return pImpl->connected.load(); }
std::string ProcessTransport::GetSessionId() const { return pImpl->sessionId; }

std::future<std::unique_ptr<JSONRPCResponse>> ProcessTransport::SendRequest(
    std::unique_ptr<JSONRPCRequest> request) {
    FUNC_SCOPE();
    Impl::ResponsePromise promise;
    auto future = promise.get_future();
    if (!pImpl->connected.load()) {
        promise.set_exception(std::make_exception_ptr(
            ManagerError(ErrorCode::ServerNotRunning, "Transport not connected", pImpl->serverId)));
        return future;
    }
    // Preserve a caller-provided id; otherwise generate one.
    std::string requestId = JSONRPCIdToString(request->id);
    if (requestId.empty()) {
        requestId = pImpl->generateRequestId();
        request->id = requestId;
    }
    {
        std::lock_guard<std::mutex> lock(pImpl->requestMutex);
        pImpl->pendingRequests[requestId] = std::move(promise);
        if (pImpl->requestTimeout != std::chrono::milliseconds::max()) {
            pImpl->requestDeadlines[requestId] = std::chrono::steady_clock::now() + pImpl->requestTimeout;
        }
    }

    const std::string serialized = request->Serialize();
    LOG_DEBUG("ProcessTransport[{}] -> {}", pImpl->serverId, serialized);
    if (!pImpl->process->Send(serialized)) {
        Impl::ResponsePromise failed;
        bool owned = false;
        {
            std::lock_guard<std::mutex> lock(pImpl->requestMutex);
            auto it = pImpl->pendingRequests.find(requestId);
            if (it != pImpl->pendingRequests.end()) {
                failed = std::move(it->second);
                pImpl->pendingRequests.erase(it);
                owned = true;
            }
            pImpl->requestDeadlines.erase(requestId);
        }
        if (owned) {
            const bool running = pImpl->process->IsRunning();
            failed.set_exception(std::make_exception_ptr(ManagerError(
                running ? ErrorCode::ProcessError : ErrorCode::ServerNotRunning,
                running ? "Write queue full" : "Server process is not running", pImpl->serverId)));
        }
    }
    return future;
}

std::future<void> ProcessTransport::SendNotification(
    std::unique_ptr<JSONRPCNotification> notification) {
    FUNC_SCOPE();
    std::promise<void> promise;
    auto fut = promise.get_future();
    if (!pImpl->connected.load()) {
        promise.set_exception(std::make_exception_ptr(
            ManagerError(ErrorCode::ServerNotRunning, "Transport not connected", pImpl->serverId)));
        return fut;
    }
    const std::string serialized = notification->Serialize();
    LOG_DEBUG("ProcessTransport[{}] -> {}", pImpl->serverId, serialized);
    if (!pImpl->process->Send(serialized)) {
        promise.set_exception(std::make_exception_ptr(
            ManagerError(ErrorCode::ProcessError, "Could not write notification", pImpl->serverId)));
        return fut;
    }
    promise.set_value();
    return fut;
}

void ProcessTransport::SetNotificationHandler(NotificationHandler handler) {
    std::lock_guard<std::mutex> lk(pImpl->handlersMutex);
    pImpl->notificationHandler = std::move(handler);
}

void ProcessTransport::SetRequestHandler(RequestHandler handler) {
    std::lock_guard<std::mutex> lk(pImpl->handlersMutex);
    pImpl->requestHandler = std::move(handler);
}

void ProcessTransport::SetErrorHandler(ErrorHandler handler) {
    std::lock_guard<std::mutex> lk(pImpl->handlersMutex);
    pImpl->errorHandler = std::move(handler);
}

void ProcessTransport::SetRequestTimeoutMs(uint64_t timeoutMs) {
    pImpl->setTimeout(timeoutMs);
}

std::size_t ProcessTransport::PendingRequestCount() const {
    std::lock_guard<std::mutex> lk(pImpl->requestMutex);
    return pImpl->pendingRequests.size();
}

} // namespace mcpm
