//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Errors.cpp
// Purpose: ManagerError and ErrorCode string conversions
//==========================================================================================================

#include "mcpm/errors/Errors.h"

#include <array>
#include <format>
#include <utility>

namespace mcpm {
namespace errors {

namespace {
constexpr std::array<std::pair<ErrorCode, const char*>, 22> kCodeNames{{
    {ErrorCode::ConfigError, "ConfigError"},
    {ErrorCode::ServerNotFound, "ServerNotFound"},
    {ErrorCode::DuplicateServer, "DuplicateServer"},
    {ErrorCode::ProcessStartFailed, "ProcessStartFailed"},
    {ErrorCode::ProcessCrashed, "ProcessCrashed"},
    {ErrorCode::ProcessTimeout, "ProcessTimeout"},
    {ErrorCode::ServerNotRunning, "ServerNotRunning"},
    {ErrorCode::ProcessError, "ProcessError"},
    {ErrorCode::AuthRequired, "AuthRequired"},
    {ErrorCode::TokenRefreshFailed, "TokenRefreshFailed"},
    {ErrorCode::AuthStateMismatch, "AuthStateMismatch"},
    {ErrorCode::AuthFailed, "AuthFailed"},
    {ErrorCode::NetworkError, "NetworkError"},
    {ErrorCode::RequestTimeout, "RequestTimeout"},
    {ErrorCode::InvalidTransition, "InvalidTransition"},
    {ErrorCode::StartCancelled, "StartCancelled"},
    {ErrorCode::ToolCallFailed, "ToolCallFailed"},
    {ErrorCode::ResourceReadFailed, "ResourceReadFailed"},
    {ErrorCode::PromptGetFailed, "PromptGetFailed"},
    {ErrorCode::StorageError, "StorageError"},
    {ErrorCode::EnvVarNotFound, "EnvVarNotFound"},
    {ErrorCode::BuiltInServerProtected, "BuiltInServerProtected"},
}};
} // namespace

std::string ErrorCodeToString(ErrorCode code) {
    return std::format("MCP_{:03}", static_cast<int>(code));
}

const char* ErrorCodeName(ErrorCode code) {
    for (const auto& [c, name] : kCodeNames) {
        if (c == code) {
            return name;
        }
    }
    return "Unknown";
}

std::optional<ErrorCode> ErrorCodeFromString(const std::string& text) {
    for (const auto& entry : kCodeNames) {
        if (ErrorCodeToString(entry.first) == text) {
            return entry.first;
        }
    }
    return std::nullopt;
}

ManagerError::ManagerError(ErrorCode code, const std::string& message, std::string serverId,
                           std::optional<McpError> upstream)
    : std::runtime_error(message),
      code_(code),
      serverId_(std::move(serverId)),
      upstream_(std::move(upstream)) {}

} // namespace errors
} // namespace mcpm
