//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ProcessTransport.hpp
// Purpose: Line-delimited JSON-RPC transport over a child process handle
//==========================================================================================================
#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>

#include "mcpm/Transport.h"
#include "mcpm/adapters/ProcessAdapter.h"

namespace mcpm {

//==========================================================================================================
// ProcessTransport
// Purpose: Speaks JSON-RPC 2.0 with one server process, one message per line.
// Notes:
//   - Generated request ids are "req-N". Each request has a deadline (default 30 s, overridable with
//     MCPM_REQUEST_TIMEOUT_MS or SetRequestTimeoutMs); expiry fails its future with RequestTimeout.
//   - Close() and the process exit fail every pending request with ServerNotRunning.
//   - Without a request handler, "ping" is answered with {} and other server requests with
//     MethodNotFound.
//   - Lines that are not JSON-RPC are logged and reported to the error handler.
//   - Close() does not kill the process.
//==========================================================================================================
class ProcessTransport : public ITransport {
public:
    explicit ProcessTransport(std::shared_ptr<adapters::IProcess> process);
    ~ProcessTransport() override;

    ////////////////////////////////////////// ITransport //////////////////////////////////////////
    std::future<void> Start() override;
    std::future<void> Close() override;
    bool IsConnected() const override;
    std::string GetSessionId() const override;

    std::future<std::unique_ptr<JSONRPCResponse>> SendRequest(
        std::unique_ptr<JSONRPCRequest> request) override;
    std::future<void> SendNotification(
        std::unique_ptr<JSONRPCNotification> notification) override;

    void SetNotificationHandler(NotificationHandler handler) override;
    void SetRequestHandler(RequestHandler handler) override;
    void SetErrorHandler(ErrorHandler handler) override;

    //==========================================================================================================
    // SetRequestTimeoutMs
    // Purpose: Configure maximum time to wait for a single request/response pair.
    // Args:
    //   timeoutMs: Timeout in milliseconds; 0 disables the deadline.
    //==========================================================================================================
    void SetRequestTimeoutMs(uint64_t timeoutMs);

    std::size_t PendingRequestCount() const;

private:
    class Impl;
    std::shared_ptr<Impl> pImpl;
};

} // namespace mcpm
