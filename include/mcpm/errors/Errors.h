//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Errors.h
// Purpose: Typed protocol errors, JSON-RPC error mapping helpers and the manager error taxonomy
//==========================================================================================================

#pragma once

#include <optional>
#include <stdexcept>
#include <string>

#include "mcpm/JSONRPCTypes.h"

namespace mcpm {
namespace errors {

// Categorization of common JSON-RPC and MCP error codes.
enum class ErrorCategory {
    JsonRpcParse,
    JsonRpcInvalidRequest,
    JsonRpcMethodNotFound,
    JsonRpcInvalidParams,
    JsonRpcInternal,
    McpInvalidRequestId,
    McpMethodNotAllowed,
    McpResourceNotFound,
    McpToolNotFound,
    McpPromptNotFound,
    Unknown
};

// Typed error representation of a JSON-RPC error object returned by a server.
struct McpError {
    int code{0};
    std::string message;
    std::optional<JSONValue> data;
    ErrorCategory category{ErrorCategory::Unknown};
};

// Map a JSON-RPC/MCP numeric error code to an ErrorCategory.
//
// Args:
//   code: The integer error code (JSON-RPC standard or MCP-specific).
//
// Returns:
//   ErrorCategory corresponding to the code, or Unknown when unmapped.
inline ErrorCategory errorCategoryFromCode(int code) {
    switch (code) {
        case JSONRPCErrorCodes::ParseError: return ErrorCategory::JsonRpcParse;
        case JSONRPCErrorCodes::InvalidRequest: return ErrorCategory::JsonRpcInvalidRequest;
        case JSONRPCErrorCodes::MethodNotFound: return ErrorCategory::JsonRpcMethodNotFound;
        case JSONRPCErrorCodes::InvalidParams: return ErrorCategory::JsonRpcInvalidParams;
        case JSONRPCErrorCodes::InternalError: return ErrorCategory::JsonRpcInternal;
        case JSONRPCErrorCodes::InvalidRequestId: return ErrorCategory::McpInvalidRequestId;
        case JSONRPCErrorCodes::MethodNotAllowed: return ErrorCategory::McpMethodNotAllowed;
        case JSONRPCErrorCodes::ResourceNotFound: return ErrorCategory::McpResourceNotFound;
        case JSONRPCErrorCodes::ToolNotFound: return ErrorCategory::McpToolNotFound;
        case JSONRPCErrorCodes::PromptNotFound: return ErrorCategory::McpPromptNotFound;
        default: return ErrorCategory::Unknown;
    }
}

// Convert a JSON-RPC error object (shape: { code, message, data? }) to McpError.
// Returns std::nullopt when the input is not a valid error object.
inline std::optional<McpError> mcpErrorFromErrorValue(const JSONValue& errVal) {
    auto code = GetIntMember(errVal, "code");
    auto message = GetStringMember(errVal, "message");
    if (!code.has_value() || !message.has_value()) {
        return std::nullopt;
    }
    McpError e;
    e.code = static_cast<int>(*code);
    e.message = std::move(*message);
    if (const JSONValue* data = FindMember(errVal, "data")) {
        e.data = *data;
    }
    e.category = errorCategoryFromCode(e.code);
    return e;
}

// Extract McpError from a JSONRPCResponse if it carries an error.
inline std::optional<McpError> mcpErrorFromResponse(const JSONRPCResponse& response) {
    if (!response.error.has_value()) {
        return std::nullopt;
    }
    return mcpErrorFromErrorValue(response.error.value());
}

// Create a JSONValue error object from a typed McpError.
inline JSONValue makeErrorValue(const McpError& err) {
    return CreateErrorObject(err.code, err.message, err.data);
}

//==========================================================================================================
// ErrorCode
// Purpose: Stable manager error taxonomy. The numeric value is the suffix of the MCP_xxx string form.
//==========================================================================================================
enum class ErrorCode {
    ConfigError = 100,
    ServerNotFound = 104,
    DuplicateServer = 105,
    ProcessStartFailed = 200,
    ProcessCrashed = 201,
    ProcessTimeout = 202,
    ServerNotRunning = 203,
    ProcessError = 204,
    AuthRequired = 300,
    TokenRefreshFailed = 302,
    AuthStateMismatch = 305,
    AuthFailed = 309,
    NetworkError = 405,
    RequestTimeout = 409,
    InvalidTransition = 500,
    StartCancelled = 501,
    ToolCallFailed = 601,
    ResourceReadFailed = 701,
    PromptGetFailed = 801,
    StorageError = 900,
    EnvVarNotFound = 910,
    BuiltInServerProtected = 920
};

// "MCP_201" style string form.
std::string ErrorCodeToString(ErrorCode code);
// Symbolic name ("ProcessCrashed").
const char* ErrorCodeName(ErrorCode code);
// Parses the MCP_xxx form; nullopt when unknown.
std::optional<ErrorCode> ErrorCodeFromString(const std::string& text);

//==========================================================================================================
// ManagerError
// Purpose: Exception type thrown through futures and synchronous APIs of the lifecycle manager.
// Fields:
//   code: Manager error code.
//   serverId: Server the failure relates to ("" when not server scoped).
//   upstream: Protocol error returned by the server, when the failure originated there.
//==========================================================================================================
class ManagerError : public std::runtime_error {
public:
    ManagerError(ErrorCode code, const std::string& message, std::string serverId = std::string(),
                 std::optional<McpError> upstream = std::nullopt);

    ErrorCode code() const noexcept { return code_; }
    const std::string& serverId() const noexcept { return serverId_; }
    const std::optional<McpError>& upstream() const noexcept { return upstream_; }
    std::string codeString() const { return ErrorCodeToString(code_); }

private:
    ErrorCode code_;
    std::string serverId_;
    std::optional<McpError> upstream_;
};

} // namespace errors
} // namespace mcpm
